#include "refpool/json/i_json.hpp"

#include <fstream>
#include <sstream>

namespace refpool {
namespace json {

api::Result<Json> JsonCodec::Parse(const std::string& text) {
  try {
    return api::Result<Json>(Json::parse(text));
  } catch (const Json::parse_error& ex) {
    return api::Result<Json>(api::Status(api::StatusCode::kInvalidArgument,
                                         std::string("json parse failed: ") + ex.what(),
                                         api::ErrorModule::kJson, 0x0001));
  }
}

api::Result<Json> JsonCodec::LoadFile(const std::string& path) {
  std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return api::Result<Json>(api::Status::FromModule(
        api::StatusCode::kNotFound, "json file not found: " + path, api::ErrorModule::kJson));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return Parse(buffer.str());
}

api::Status JsonCodec::SaveFile(const std::string& path, const Json& value, int indent) {
  std::ofstream out(path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return api::Status::FromModule(api::StatusCode::kIoError, "open json file for write failed",
                                   api::ErrorModule::kJson);
  }
  try {
    out << value.dump(indent);
    out << "\n";
  } catch (const Json::type_error& ex) {
    return api::Status::FromModule(api::StatusCode::kIoError,
                                   std::string("json write failed: ") + ex.what(),
                                   api::ErrorModule::kJson);
  }
  if (!out.good()) {
    return api::Status::FromModule(api::StatusCode::kIoError, "json write failed",
                                   api::ErrorModule::kJson);
  }
  return api::Status::Ok();
}

std::string JsonCodec::Dump(const Json& value, int indent) {
  // Replace invalid UTF-8 instead of throwing; this is only used for diagnostics.
  return value.dump(indent, ' ', false, Json::error_handler_t::replace);
}

}  // namespace json
}  // namespace refpool
