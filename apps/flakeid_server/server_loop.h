#pragma once

#include "server_context.h"
#include <istream>
#include <ostream>

namespace flakeid::server {

// run_server_loop reads one JSON-RPC request per line from `in` and writes one response per line
// to `out` until `in` is exhausted. Diagnostics go to std::cerr.
void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out);

}  // namespace flakeid::server
