#include <gtin/cli/report.hpp>

#include <stdexcept>

namespace gtin::cli {

namespace {

const char* KindName(const CodeInput& code) {
  return code.is_integer() ? "integer" : "text";
}

const char* JsonTypeName(Json::ValueType type) {
  switch (type) {
    case Json::nullValue:
      return "null";
    case Json::intValue:
    case Json::uintValue:
      return "integer";
    case Json::realValue:
      return "float";
    case Json::stringValue:
      return "string";
    case Json::booleanValue:
      return "boolean";
    case Json::arrayValue:
      return "array";
    case Json::objectValue:
      return "object";
  }
  return "unknown";
}

}  // namespace

CodeInput CodeFromJson(const Json::Value& value) {
  switch (value.type()) {
    case Json::stringValue:
      return CodeInput::Text(value.asString());
    case Json::uintValue:
      return CodeInput::Integer(value.asUInt64());
    case Json::intValue:
      if (value.asInt64() < 0) {
        throw TypeKindError("negative integer " + value.asString());
      }
      return CodeInput::Integer(value.asUInt64());
    default:
      throw TypeKindError(std::string("got ") + JsonTypeName(value.type()));
  }
}

Json::Value ReadCodeArray(std::istream& in) {
  Json::Value parsed;
  Json::CharReaderBuilder builder;
  std::string errors;
  if (!Json::parseFromStream(builder, in, &parsed, &errors)) {
    throw std::runtime_error("Invalid JSON: " + errors);
  }
  if (!parsed.isArray()) {
    throw std::runtime_error("Expected a JSON array of codes");
  }
  return parsed;
}

std::vector<CodeInput> ReadCodes(std::istream& in) {
  Json::Value parsed = ReadCodeArray(in);
  std::vector<CodeInput> codes;
  codes.reserve(parsed.size());
  for (const auto& item : parsed) {
    codes.push_back(CodeFromJson(item));
  }
  return codes;
}

CodeInput CodeFromArg(const std::string& arg, bool as_integer) {
  if (as_integer) {
    return CodeInput::ParseInteger(arg);
  }
  return CodeInput::Text(arg);
}

Json::Value ValidationToJson(const CodeInput& code,
                             const ValidationResult& result) {
  Json::Value json;
  json["input"] = code.raw();
  json["kind"] = KindName(code);
  json["valid"] = result.ok();
  json["status"] = StatusName(result.status);
  if (!result.canonical.empty()) {
    json["canonical"] = result.canonical;
  }
  return json;
}

Json::Value CheckDigitToJson(const CodeInput& code, const std::string& completed) {
  Json::Value json;
  json["input"] = code.raw();
  json["kind"] = KindName(code);
  json["code"] = completed;
  json["check_digit"] = static_cast<Json::UInt>(completed.back() - '0');
  return json;
}

std::string ValidationToText(const CodeInput& code,
                             const ValidationResult& result) {
  std::string line = code.raw();
  line += result.ok() ? "\tvalid\t" : "\tinvalid\t";
  line += StatusName(result.status);
  return line;
}

std::string WriteJson(const Json::Value& json) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, json);
}

}  // namespace gtin::cli
