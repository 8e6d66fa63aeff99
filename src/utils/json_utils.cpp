#include "json_utils.hpp"

#include <json/json.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace batchwire {

auto
to_compact_json(const Json::Value& value) -> std::string
{
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  builder["commentStyle"] = "None";
  return Json::writeString(builder, value);
}

auto
parse_json(std::string_view text, std::string* errors)
    -> std::optional<Json::Value>
{
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["failIfExtra"] = true;
  builder["rejectDupKeys"] = true;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string parse_errors;
  if (!reader->parse(
          text.data(), text.data() + text.size(), &root, &parse_errors)) {
    if (errors != nullptr) {
      *errors = parse_errors;
    }
    return std::nullopt;
  }
  return root;
}

namespace {

auto
is_number(const Json::Value& value) -> bool
{
  const auto type = value.type();
  return type == Json::intValue || type == Json::uintValue ||
         type == Json::realValue;
}

auto
numbers_equal(const Json::Value& lhs, const Json::Value& rhs) -> bool
{
  if (lhs.type() == Json::realValue || rhs.type() == Json::realValue) {
    return lhs.asDouble() == rhs.asDouble();
  }
  if (lhs.isInt64() && rhs.isInt64()) {
    return lhs.asInt64() == rhs.asInt64();
  }
  if (lhs.isUInt64() && rhs.isUInt64()) {
    return lhs.asUInt64() == rhs.asUInt64();
  }
  return false;
}

}  // namespace

auto
json_equivalent(const Json::Value& lhs, const Json::Value& rhs) -> bool
{
  if (is_number(lhs) && is_number(rhs)) {
    return numbers_equal(lhs, rhs);
  }
  if (lhs.type() != rhs.type()) {
    return false;
  }
  if (lhs.isArray()) {
    if (lhs.size() != rhs.size()) {
      return false;
    }
    for (Json::ArrayIndex idx = 0; idx < lhs.size(); ++idx) {
      if (!json_equivalent(lhs[idx], rhs[idx])) {
        return false;
      }
    }
    return true;
  }
  if (lhs.isObject()) {
    if (lhs.size() != rhs.size()) {
      return false;
    }
    for (const auto& key : lhs.getMemberNames()) {
      if (!rhs.isMember(key) || !json_equivalent(lhs[key], rhs[key])) {
        return false;
      }
    }
    return true;
  }
  return lhs == rhs;
}

}  // namespace batchwire
