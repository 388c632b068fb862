#include "rpc_protocol.h"

namespace flakeid::server {

std::optional<JsonRpcRequest> parse_request(const std::string& json_str) {
  auto json = nlohmann::json::parse(json_str, nullptr, /*allow_exceptions=*/false);
  if (json.is_discarded() || !json.is_object()) {
    return std::nullopt;
  }

  JsonRpcRequest request;
  if (json.contains("jsonrpc")) {
    request.jsonrpc = json["jsonrpc"].is_string() ? json["jsonrpc"].get<std::string>() : "";
  }

  if (json.contains("id")) {
    if (json["id"].is_string()) {
      request.id = json["id"].get<std::string>();
    } else if (json["id"].is_number_integer()) {
      request.id = json["id"].dump();
    }
  }

  if (json.contains("method") && json["method"].is_string()) {
    request.method = json["method"].get<std::string>();
  }
  if (json.contains("params") && json["params"].is_object()) {
    request.params = json["params"];
  } else {
    request.params = nlohmann::json::object();
  }

  return request;
}

std::string make_response(const std::optional<std::string>& id, const nlohmann::json& result) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  if (id.has_value()) {
    response["id"] = id.value();
  } else {
    response["id"] = nullptr;
  }
  response["result"] = result;
  return response.dump();
}

std::string make_error_response(const std::optional<std::string>& id, int code,
                                const std::string& message, const nlohmann::json& data) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  if (id.has_value()) {
    response["id"] = id.value();
  } else {
    response["id"] = nullptr;
  }
  response["error"] = {
      {"code", code},
      {"message", message},
      {"data", data},
  };
  return response.dump();
}

}  // namespace flakeid::server
