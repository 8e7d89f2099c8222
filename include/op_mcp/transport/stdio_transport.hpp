#pragma once

#include <op_mcp/mcp/protocol_engine.hpp>

#include <iostream>

namespace op_mcp {

// ---------------------------------------------------------------------------
// StdioTransport: newline-delimited JSON-RPC over a pair of streams.
//
// One line in, at most one compact line out. Diagnostics and the ready
// banner go to `side`; `out` only ever sees complete JSON documents.
// End of input shuts the engine down.
// ---------------------------------------------------------------------------
class StdioTransport {
public:
    StdioTransport(ProtocolEngine& engine,
                   std::istream& in = std::cin,
                   std::ostream& out = std::cout,
                   std::ostream& side = std::cerr);

    // Blocks until EOF. Returns the number of responses written.
    size_t Run();

private:
    ProtocolEngine& engine_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& side_;
};

} // namespace op_mcp
