#include "multipart.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "utils/exceptions.hpp"
#include "utils/transparent_hash.hpp"

namespace batchwire {
namespace {

constexpr std::size_t kMaxBoundaryLength = 70;
constexpr int kMaxBoundaryAttempts = 8;
constexpr std::string_view kCrlf = "\r\n";
constexpr std::string_view kHeaderTerminator = "\r\n\r\n";
constexpr std::string_view kWhitespace = " \t";

auto
trim(std::string_view text) -> std::string_view
{
  const auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

auto
to_lower(std::string_view text) -> std::string
{
  std::string lower(text);
  std::ranges::transform(lower, lower.begin(), [](unsigned char c) noexcept {
    return static_cast<char>(std::tolower(c));
  });
  return lower;
}

auto
has_at(std::string_view text, std::size_t pos, std::string_view token) -> bool
{
  return pos <= text.size() && text.substr(pos).starts_with(token);
}

auto
is_token(std::string_view text) -> bool
{
  return !text.empty() &&
         std::ranges::all_of(text, [](unsigned char c) noexcept {
           return std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' ||
                  c == '+';
         });
}

auto
contains_line_break(std::string_view text) -> bool
{
  return text.find_first_of("\r\n") != std::string_view::npos;
}

// Reads a quoted-string starting at text[pos] == '"'; returns the unescaped
// value and leaves pos after the closing quote.
auto
read_quoted(std::string_view text, std::size_t& pos) -> std::string
{
  std::string value;
  ++pos;
  while (pos < text.size()) {
    const char current = text[pos++];
    if (current == '"') {
      return value;
    }
    if (current == '\\' && pos < text.size()) {
      value.push_back(text[pos++]);
    } else {
      value.push_back(current);
    }
  }
  throw MalformedMultipartException(
      "Unterminated quoted string in header value: " + std::string(text));
}

auto
parse_header_lines(std::string_view block) -> MultipartHeaders
{
  MultipartHeaders headers;
  std::size_t cursor = 0;
  while (cursor < block.size()) {
    auto line_end = block.find(kCrlf, cursor);
    if (line_end == std::string_view::npos) {
      line_end = block.size();
    }
    const std::string_view line = block.substr(cursor, line_end - cursor);
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      throw MalformedMultipartException(
          "Malformed part header line: " + std::string(line));
    }
    const auto name = trim(line.substr(0, colon));
    if (name.empty()) {
      throw MalformedMultipartException(
          "Empty part header name: " + std::string(line));
    }
    headers.push_back(MultipartHeader{
        std::string(name), std::string(trim(line.substr(colon + 1)))});
    cursor = line_end + kCrlf.size();
  }
  return headers;
}

auto
part_name_from_headers(const MultipartPart& part) -> std::string
{
  const auto* disposition = part.header("Content-Disposition");
  if (disposition == nullptr) {
    throw MalformedMultipartException(
        "Multipart part lacks a Content-Disposition header");
  }
  const HeaderValue parsed = parse_header_value(*disposition);
  if (!iequals(parsed.token, "form-data")) {
    throw MalformedMultipartException(
        "Unsupported Content-Disposition: " + *disposition);
  }
  const auto name = parsed.params.find("name");
  if (name == parsed.params.end() || name->second.empty()) {
    throw MalformedMultipartException(
        "Content-Disposition lacks a part name: " + *disposition);
  }
  return name->second;
}

}  // namespace

// =============================================================================
// Header helpers
// =============================================================================

auto
iequals(std::string_view lhs, std::string_view rhs) -> bool
{
  return lhs.size() == rhs.size() &&
         std::equal(
             lhs.begin(), lhs.end(), rhs.begin(),
             [](unsigned char left, unsigned char right) noexcept {
               return std::tolower(left) == std::tolower(right);
             });
}

auto
MultipartPart::header(std::string_view key) const -> const std::string*
{
  const auto iter = std::ranges::find_if(
      headers,
      [key](const MultipartHeader& entry) { return iequals(entry.name, key); });
  return iter == headers.end() ? nullptr : &iter->value;
}

auto
parse_header_value(std::string_view value) -> HeaderValue
{
  HeaderValue parsed;
  std::size_t pos = value.find(';');
  parsed.token = std::string(trim(value.substr(0, pos)));

  while (pos != std::string_view::npos && pos < value.size()) {
    ++pos;  // skip ';'
    while (pos < value.size() && kWhitespace.find(value[pos]) !=
                                     std::string_view::npos) {
      ++pos;
    }
    const auto name_end = value.find_first_of("=;", pos);
    const auto name =
        to_lower(trim(value.substr(pos, name_end == std::string_view::npos
                                            ? std::string_view::npos
                                            : name_end - pos)));
    if (name_end == std::string_view::npos || value[name_end] == ';') {
      if (!name.empty()) {
        parsed.params.insert_or_assign(name, std::string{});
      }
      pos = name_end;
      continue;
    }

    pos = name_end + 1;
    while (pos < value.size() && kWhitespace.find(value[pos]) !=
                                     std::string_view::npos) {
      ++pos;
    }
    std::string param_value;
    if (pos < value.size() && value[pos] == '"') {
      param_value = read_quoted(value, pos);
      pos = value.find(';', pos);
    } else {
      const auto value_end = value.find(';', pos);
      param_value = std::string(trim(value.substr(
          pos, value_end == std::string_view::npos ? std::string_view::npos
                                                   : value_end - pos)));
      pos = value_end;
    }
    if (!name.empty()) {
      parsed.params.insert_or_assign(name, std::move(param_value));
    }
  }
  return parsed;
}

auto
quote_header_param(std::string_view value) -> std::string
{
  std::string quoted = "\"";
  for (const char current : value) {
    if (current == '"' || current == '\\') {
      quoted.push_back('\\');
    }
    quoted.push_back(current);
  }
  quoted.push_back('"');
  return quoted;
}

// =============================================================================
// Writer
// =============================================================================

MultipartWriter::MultipartWriter() = default;

MultipartWriter::MultipartWriter(std::string boundary)
{
  if (boundary.empty() || boundary.size() > kMaxBoundaryLength ||
      contains_line_break(boundary)) {
    throw MalformedMultipartException(
        "Multipart boundary must be 1-70 characters on a single line");
  }
  boundary_ = std::move(boundary);
}

void
MultipartWriter::append(std::string body, MultipartHeaders headers)
{
  for (const auto& header : headers) {
    if (header.name.empty() || contains_line_break(header.name) ||
        contains_line_break(header.value)) {
      throw MalformedMultipartException(
          "Part headers must be non-empty single lines: " + header.name);
    }
  }
  parts_.push_back(PendingPart{std::move(headers), std::move(body)});
}

auto
MultipartWriter::collides(std::string_view boundary) const -> bool
{
  return std::ranges::any_of(parts_, [boundary](const PendingPart& part) {
    return part.body.find(boundary) != std::string::npos;
  });
}

auto
MultipartWriter::finish() const -> WireMessage
{
  std::string boundary;
  if (boundary_.has_value()) {
    boundary = *boundary_;
    if (collides(boundary)) {
      throw MalformedMultipartException(
          "Multipart boundary occurs inside a part body: " + boundary);
    }
  } else {
    bool found = false;
    for (int attempt = 0; attempt < kMaxBoundaryAttempts && !found;
         ++attempt) {
      boundary = generate_boundary();
      found = !collides(boundary);
    }
    if (!found) {
      throw MalformedMultipartException(
          "Could not find a multipart boundary absent from the part bodies");
    }
  }

  const std::string delimiter = "--" + boundary;
  std::string body;
  for (const auto& part : parts_) {
    body += delimiter;
    body += kCrlf;
    for (const auto& header : part.headers) {
      body += header.name;
      body += ": ";
      body += header.value;
      body += kCrlf;
    }
    body += kCrlf;
    body += part.body;
    body += kCrlf;
  }
  body += delimiter;
  body += "--";
  body += kCrlf;

  const std::string boundary_param =
      is_token(boundary) ? boundary : quote_header_param(boundary);
  return WireMessage{
      "multipart/form-data; boundary=" + boundary_param, std::move(body)};
}

auto
generate_boundary() -> std::string
{
  static constexpr std::string_view kHexDigits = "0123456789abcdef";
  constexpr int kRandomDigits = 32;

  std::random_device device;
  std::mt19937_64 engine{
      (static_cast<std::uint64_t>(device()) << 32U) | device()};
  std::uniform_int_distribution<std::size_t> digit(0, kHexDigits.size() - 1);

  std::string boundary = "batchwire-";
  for (int idx = 0; idx < kRandomDigits; ++idx) {
    boundary.push_back(kHexDigits[digit(engine)]);
  }
  return boundary;
}

// =============================================================================
// Parser
// =============================================================================

auto
extract_boundary(std::string_view content_type) -> std::string
{
  const HeaderValue parsed = parse_header_value(content_type);
  if (!to_lower(parsed.token).starts_with("multipart/")) {
    throw MalformedMultipartException(
        "Content-Type is not multipart: " + std::string(content_type));
  }
  const auto boundary = parsed.params.find("boundary");
  if (boundary == parsed.params.end() || boundary->second.empty() ||
      boundary->second.size() > kMaxBoundaryLength) {
    throw MalformedMultipartException(
        "Content-Type lacks a valid boundary: " + std::string(content_type));
  }
  return boundary->second;
}

auto
parse_multipart(std::string_view body, std::string_view content_type)
    -> std::vector<MultipartPart>
{
  const std::string delimiter = "--" + extract_boundary(content_type);
  const std::string part_separator = std::string(kCrlf) + delimiter;

  std::size_t cursor = 0;
  if (!body.starts_with(delimiter)) {
    const auto first = body.find(part_separator);
    if (first == std::string_view::npos) {
      throw MalformedMultipartException("Multipart body has no boundary");
    }
    cursor = first + kCrlf.size();  // preamble is ignored
  }

  std::vector<MultipartPart> parts;
  std::unordered_set<std::string, TransparentHash, std::equal_to<>> names;
  while (true) {
    cursor += delimiter.size();
    if (has_at(body, cursor, "--")) {
      break;  // closing delimiter, epilogue is ignored
    }
    while (cursor < body.size() &&
           kWhitespace.find(body[cursor]) != std::string_view::npos) {
      ++cursor;
    }
    if (!has_at(body, cursor, kCrlf)) {
      throw MalformedMultipartException(
          "Expected a line break after a multipart boundary");
    }
    cursor += kCrlf.size();

    MultipartPart part;
    if (has_at(body, cursor, kCrlf)) {
      cursor += kCrlf.size();
    } else {
      const auto headers_end = body.find(kHeaderTerminator, cursor);
      if (headers_end == std::string_view::npos) {
        throw MalformedMultipartException("Unterminated part header block");
      }
      part.headers =
          parse_header_lines(body.substr(cursor, headers_end - cursor));
      cursor = headers_end + kHeaderTerminator.size();
    }

    const auto next = body.find(part_separator, cursor);
    if (next == std::string_view::npos) {
      throw MalformedMultipartException("Unterminated multipart part");
    }
    part.body = std::string(body.substr(cursor, next - cursor));
    cursor = next + kCrlf.size();

    part.name = part_name_from_headers(part);
    if (!names.insert(part.name).second) {
      throw MalformedMultipartException(
          "Duplicate multipart part name: " + part.name);
    }
    parts.push_back(std::move(part));
  }
  return parts;
}

}  // namespace batchwire
