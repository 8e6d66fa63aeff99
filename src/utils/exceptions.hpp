#pragma once

#include <stdexcept>
#include <string>

namespace batchwire {
// =============================================================================
// Base class for all batching-protocol exceptions
// =============================================================================

class BatchProtocolException : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// =============================================================================
// Parameter container failures
// =============================================================================

/// Thrown when sampling or comparing a container without any slot
class EmptyParamsException : public BatchProtocolException {
 public:
  using BatchProtocolException::BatchProtocolException;
};

/// Thrown when the calls merged into one batch disagree on their layout
class ArgumentMismatchException : public BatchProtocolException {
 public:
  using BatchProtocolException::BatchProtocolException;
};

/// Thrown when aggregated containers do not share the same slots
class SlotAddressingMismatchException : public ArgumentMismatchException {
 public:
  using ArgumentMismatchException::ArgumentMismatchException;
};

/// Thrown when a batch dimension is negative or beyond the payload rank
class InvalidBatchDimensionException : public BatchProtocolException {
 public:
  using BatchProtocolException::BatchProtocolException;
};

// =============================================================================
// Wire codec failures
// =============================================================================

/// Thrown when a positional index is absent from a decoded message
class MissingSlotException : public BatchProtocolException {
 public:
  using BatchProtocolException::BatchProtocolException;
};

/// Thrown when the metadata or content-type header of a part is unusable
class MalformedMetadataException : public BatchProtocolException {
 public:
  using BatchProtocolException::BatchProtocolException;
};

/// Thrown when the multipart framing cannot be parsed
class MalformedMultipartException : public BatchProtocolException {
 public:
  using BatchProtocolException::BatchProtocolException;
};

/// Thrown when a message exceeds the configured decode limits
class MessageSizeOverflowException : public BatchProtocolException {
 public:
  using BatchProtocolException::BatchProtocolException;
};

// =============================================================================
// Payload container failures
// =============================================================================

/// Thrown when no batching capability is registered for a container tag
class UnsupportedContainerException : public BatchProtocolException {
 public:
  using BatchProtocolException::BatchProtocolException;
};

/// Thrown when payload bytes do not match what their container expects
class PayloadDecodeException : public BatchProtocolException {
 public:
  using BatchProtocolException::BatchProtocolException;
};

/// Thrown when an unsupported tensor data type is used
class UnsupportedDtypeException : public BatchProtocolException {
 public:
  using BatchProtocolException::BatchProtocolException;
};

}  // namespace batchwire
