#pragma once

#include "server_context.h"
#include <istream>

namespace cintel::server {

// Reads one JSON-RPC request per line from in until EOF and writes each response to ctx.out.
void run_server_loop(std::istream& in, ServerContext& ctx);

}  // namespace cintel::server
