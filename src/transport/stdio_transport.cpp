#include <op_mcp/transport/stdio_transport.hpp>

#include <op_mcp/core/log.hpp>

#include <string>

namespace op_mcp {

StdioTransport::StdioTransport(ProtocolEngine& engine,
                               std::istream& in,
                               std::ostream& out,
                               std::ostream& side)
    : engine_(engine), in_(in), out_(out), side_(side) {}

size_t StdioTransport::Run() {
    side_ << "MCP OpenProject Server (stdio mode) - Ready" << std::endl;
    LogInfo("stdio", "listening on stdin");

    RequestContext ctx;
    ctx.transport = "stdio";

    size_t written = 0;
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        auto response = engine_.HandleRaw(line, ctx);
        if (response.has_value()) {
            out_ << *response << '\n';
            out_.flush();
            ++written;
        }
    }

    LogInfo("stdio", "input closed after " + std::to_string(written) + " responses");
    engine_.Shutdown();
    return written;
}

} // namespace op_mcp
