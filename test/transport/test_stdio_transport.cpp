#include <catch2/catch_test_macros.hpp>

#include <op_mcp/mcp/tool_handlers.hpp>
#include <op_mcp/transport/stdio_transport.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace op_mcp;
using json = nlohmann::json;

namespace {

std::shared_ptr<const ToolRegistry> EchoRegistry() {
    ToolRegistryBuilder builder;
    builder.Add({"echo", "Echo", {{"type", "object"}}, std::nullopt},
                [](const json& params, const CallContext&) {
                    return Result<ToolResult, Error>::Ok(MakeOkResult(params));
                });
    return std::make_shared<const ToolRegistry>(builder.Build());
}

std::vector<json> Lines(const std::string& text) {
    std::vector<json> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        out.push_back(json::parse(line));
    }
    return out;
}

struct StdioRun {
    std::string output;
    std::string side;
    size_t written = 0;
    EngineState final_state = EngineState::Uninitialized;
};

StdioRun RunWith(const std::string& input) {
    ProtocolEngine engine(EchoRegistry(), nullptr, nullptr);
    std::istringstream in(input);
    std::ostringstream out;
    std::ostringstream side;
    StdioTransport transport(engine, in, out, side);
    StdioRun run;
    run.written = transport.Run();
    run.output = out.str();
    run.side = side.str();
    run.final_state = engine.State();
    return run;
}

} // anonymous namespace

TEST_CASE("StdioTransport: one response line per request", "[transport][stdio]") {
    auto run = RunWith(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"echo","arguments":{"a":1}}})" "\n");

    CHECK(run.written == 2);
    auto lines = Lines(run.output);
    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["id"] == 1);
    CHECK(lines[0]["result"].contains("serverInfo"));
    CHECK(lines[1]["id"] == 2);
    CHECK(lines[1]["result"]["content"][0]["type"] == "text");
}

TEST_CASE("StdioTransport: malformed line yields one parse error and the loop continues",
          "[transport][stdio]") {
    auto run = RunWith(
        "{not json\n"
        R"({"jsonrpc":"2.0","id":7,"method":"ping"})" "\n");

    auto lines = Lines(run.output);
    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["error"]["code"] == -32700);
    CHECK(lines[0]["id"].is_null());
    CHECK(lines[1]["id"] == 7);
    CHECK(lines[1].contains("result"));
}

TEST_CASE("StdioTransport: blank lines and CRLF are tolerated", "[transport][stdio]") {
    auto run = RunWith(
        "\n"
        "   \t\n"
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\r\n"
        "\n");

    auto lines = Lines(run.output);
    REQUIRE(lines.size() == 1);
    CHECK(lines[0]["id"] == 1);
}

TEST_CASE("StdioTransport: banner goes to the side stream, never to stdout",
          "[transport][stdio]") {
    auto run = RunWith(R"({"jsonrpc":"2.0","id":1,"method":"ping"})" "\n");
    CHECK(run.side.find("Ready") != std::string::npos);
    CHECK(run.output.find("Ready") == std::string::npos);
    REQUIRE_FALSE(run.output.empty());
    CHECK(run.output.find('\n') == run.output.size() - 1);
}

TEST_CASE("StdioTransport: end of input shuts the engine down", "[transport][stdio]") {
    auto run = RunWith("");
    CHECK(run.written == 0);
    CHECK(run.output.empty());
    CHECK(run.final_state == EngineState::Closed);
}
