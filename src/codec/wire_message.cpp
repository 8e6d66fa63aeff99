#include "wire_message.hpp"

#include <filesystem>
#include <fstream>
#include <istream>
#include <iterator>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "multipart.hpp"
#include "utils/exceptions.hpp"

namespace batchwire {
namespace {
constexpr std::string_view kEnvelopeSeparator = "\r\n\r\n";
constexpr std::string_view kContentTypeHeader = "Content-Type";
}  // namespace

void
write_wire_message(std::ostream& output, const WireMessage& message)
{
  output << kContentTypeHeader << ": " << message.content_type << "\r\n\r\n";
  output.write(
      message.body.data(), static_cast<std::streamsize>(message.body.size()));
  if (!output) {
    throw std::runtime_error("Failed to write wire message");
  }
}

auto
read_wire_message(std::istream& input) -> WireMessage
{
  const std::string raw{
      std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
  const auto separator = raw.find(kEnvelopeSeparator);
  if (separator == std::string::npos) {
    throw MalformedMultipartException(
        "Wire message envelope lacks a header block");
  }

  WireMessage message;
  std::string_view headers(raw.data(), separator);
  while (!headers.empty()) {
    const auto line_end = headers.find("\r\n");
    const auto line = headers.substr(0, line_end);
    const auto colon = line.find(':');
    if (colon != std::string_view::npos &&
        iequals(line.substr(0, colon), kContentTypeHeader)) {
      auto value = line.substr(colon + 1);
      const auto first = value.find_first_not_of(" \t");
      message.content_type = first == std::string_view::npos
                                 ? std::string{}
                                 : std::string(value.substr(first));
    }
    headers = line_end == std::string_view::npos
                  ? std::string_view{}
                  : headers.substr(line_end + 2);
  }
  if (message.content_type.empty()) {
    throw MalformedMultipartException(
        "Wire message envelope lacks a Content-Type header");
  }
  message.body = raw.substr(separator + kEnvelopeSeparator.size());
  return message;
}

void
save_wire_message(const std::filesystem::path& path, const WireMessage& message)
{
  std::ofstream output(path, std::ios::binary | std::ios::trunc);
  if (!output.is_open()) {
    throw std::runtime_error("Cannot open " + path.string() + " for writing");
  }
  write_wire_message(output, message);
}

auto
load_wire_message(const std::filesystem::path& path) -> WireMessage
{
  std::ifstream input(path, std::ios::binary);
  if (!input.is_open()) {
    throw std::runtime_error("Cannot open " + path.string() + " for reading");
  }
  return read_wire_message(input);
}

}  // namespace batchwire
