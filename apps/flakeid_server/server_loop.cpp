#include "server_loop.h"

#include <nlohmann/json.hpp>

#include "method_handlers.h"
#include "rpc_protocol.h"
#include <iostream>
#include <string>

namespace flakeid::server {

using json = nlohmann::json;

void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out) {
  const auto method_registry = build_method_registry();

  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    auto request_opt = parse_request(line);
    if (!request_opt.has_value()) {
      out << make_error_response(std::nullopt, kParseError, "Invalid JSON") << "\n" << std::flush;
      continue;
    }

    const JsonRpcRequest& request = request_opt.value();
    std::cerr << "Received: " << request.method << "\n";

    if (request.jsonrpc != "2.0") {
      out << make_error_response(request.id, kInvalidRequest,
                                 "Unsupported jsonrpc version: " + request.jsonrpc)
          << "\n"
          << std::flush;
      continue;
    }
    if (request.method.empty()) {
      out << make_error_response(request.id, kInvalidRequest, "Missing method") << "\n"
          << std::flush;
      continue;
    }

    auto it = method_registry.find(request.method);
    if (it == method_registry.end()) {
      out << make_error_response(request.id, kMethodNotFound, "Unknown method: " + request.method)
          << "\n"
          << std::flush;
      continue;
    }

    // Handlers read params with nlohmann accessors, which throw on type mismatches.
    try {
      const json result = it->second(request, ctx);
      out << make_response(request.id, result) << "\n" << std::flush;
    } catch (const json::exception& e) {
      std::cerr << "Invalid params for " << request.method << ": " << e.what() << "\n";
      out << make_error_response(request.id, kInvalidParams, "Invalid params",
                                 json{{"detail", e.what()}})
          << "\n"
          << std::flush;
    }
  }

  std::cerr << "flakeid server shutting down\n";
}

}  // namespace flakeid::server
