#include <catch2/catch_test_macros.hpp>

#include "fixtures/logistics_fixture.hpp"

#include <cashlog/mcp/mcp_server.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace cashlog;
using namespace cashlog::testing;
using nlohmann::json;

namespace {

std::unique_ptr<QueryExecutor> SeedStore() {
    auto executor = OpenMemoryStore();
    AddCarrier(*executor, "C1", "Brinks");
    AddLocation(*executor, "LOC-1", "Main Street", 38000.0);
    AddDailySchedule(*executor, "LOC-1", "C1", "08:00");
    AddOutcome(*executor, "LOC-1", "2024-03-04", "completed");
    return executor;
}

json Request(int id, const std::string& method, const json& params = json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

std::vector<json> ResponseLines(const std::ostringstream& out) {
    std::vector<json> lines;
    std::istringstream in(out.str());
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(json::parse(line));
    }
    return lines;
}

} // anonymous namespace

// ===========================================================================
// HandleMessage
// ===========================================================================

TEST_CASE("McpServer: initialize returns capabilities", "[mcp][server]") {
    auto executor = SeedStore();
    std::istringstream in;
    std::ostringstream out;
    McpServer server(ToolDispatcher(*executor), RuleConfig{}, in, out);

    auto response = server.HandleMessage(
        Request(1, "initialize", {{"protocolVersion", "2024-11-05"}}));
    REQUIRE(response.has_value());

    auto& r = *response;
    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"] == 1);
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
    CHECK(r["result"]["serverInfo"]["name"] == "cashlog-mcp");
    CHECK(r["result"]["capabilities"].contains("tools"));
}

TEST_CASE("McpServer: ping", "[mcp][server]") {
    auto executor = SeedStore();
    std::istringstream in;
    std::ostringstream out;
    McpServer server(ToolDispatcher(*executor), RuleConfig{}, in, out);

    auto response = server.HandleMessage(Request(7, "ping"));
    REQUIRE(response.has_value());
    CHECK((*response)["result"] == json::object());
}

TEST_CASE("McpServer: tools/list advertises every tool", "[mcp][server]") {
    auto executor = SeedStore();
    std::istringstream in;
    std::ostringstream out;
    McpServer server(ToolDispatcher(*executor), RuleConfig{}, in, out);

    auto response = server.HandleMessage(Request(2, "tools/list"));
    REQUIRE(response.has_value());

    auto& tools = (*response)["result"]["tools"];
    REQUIRE(tools.size() == ToolDescriptors().size());
    CHECK(tools[0]["name"] == "list_tables");
    CHECK(tools[0]["inputSchema"]["type"] == "object");
    for (auto& tool : tools) {
        CHECK_FALSE(tool["description"].get<std::string>().empty());
    }
}

TEST_CASE("McpServer: tools/call wraps the payload", "[mcp][server]") {
    auto executor = SeedStore();
    std::istringstream in;
    std::ostringstream out;
    McpServer server(ToolDispatcher(*executor), RuleConfig{}, in, out);

    auto response = server.HandleMessage(Request(3, "tools/call",
        {{"name", "detect_missed_pickups"},
         {"arguments", {{"start_date", "2024-03-04"}, {"end_date", "2024-03-06"}}}}));
    REQUIRE(response.has_value());

    auto& result = (*response)["result"];
    CHECK(result["structuredContent"]["count"] == 2);
    REQUIRE(result["content"].size() == 1);
    CHECK(result["content"][0]["type"] == "text");
    auto text = json::parse(result["content"][0]["text"].get<std::string>());
    CHECK(text == result["structuredContent"]);
}

TEST_CASE("McpServer: tool name as method returns the bare payload", "[mcp][server]") {
    auto executor = SeedStore();
    std::istringstream in;
    std::ostringstream out;
    McpServer server(ToolDispatcher(*executor), RuleConfig{}, in, out);

    auto response = server.HandleMessage(Request(4, "list_tables"));
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["tables"].size() == 6);
    CHECK_FALSE((*response)["result"].contains("content"));
}

TEST_CASE("McpServer: server thresholds are the rule defaults", "[mcp][server]") {
    auto executor = SeedStore();
    std::istringstream in;
    std::ostringstream out;
    RuleConfig rules;
    rules.high_volume_threshold = 50000.0;
    McpServer server(ToolDispatcher(*executor), rules, in, out);

    auto response = server.HandleMessage(Request(5, "score_risk", {{"as_of_date", "2024-03-06"}}));
    REQUIRE(response.has_value());
    auto& result = (*response)["result"];
    CHECK(result["high_volume_threshold"] == 50000.0);
    CHECK(result["high_risk_count"] == 0);
}

TEST_CASE("McpServer: tool errors carry kind and code", "[mcp][server]") {
    auto executor = SeedStore();
    std::istringstream in;
    std::ostringstream out;
    McpServer server(ToolDispatcher(*executor), RuleConfig{}, in, out);

    auto unknown = server.HandleMessage(Request(8, "tools/call", {{"name", "format_disk"}}));
    REQUIRE(unknown.has_value());
    CHECK((*unknown)["error"]["code"] == -32601);
    CHECK((*unknown)["error"]["kind"] == "UnknownTool");

    auto forbidden = server.HandleMessage(Request(9, "tools/call",
        {{"name", "read_query"}, {"arguments", {{"query", "DROP TABLE deposits"}}}}));
    REQUIRE(forbidden.has_value());
    CHECK((*forbidden)["error"]["code"] == -32003);
    CHECK((*forbidden)["id"] == 9);

    auto missing = server.HandleMessage(Request(10, "tools/call", {{"arguments", json::object()}}));
    REQUIRE(missing.has_value());
    CHECK((*missing)["error"]["code"] == -32602);
    CHECK((*missing)["error"]["message"] == "Missing 'name' parameter");
}

TEST_CASE("McpServer: unknown method returns error", "[mcp][server]") {
    auto executor = SeedStore();
    std::istringstream in;
    std::ostringstream out;
    McpServer server(ToolDispatcher(*executor), RuleConfig{}, in, out);

    auto response = server.HandleMessage(Request(11, "resources/list"));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32601);
    CHECK((*response)["error"]["message"] == "Method not found: resources/list");
}

TEST_CASE("McpServer: notification returns no response", "[mcp][server]") {
    auto executor = SeedStore();
    std::istringstream in;
    std::ostringstream out;
    McpServer server(ToolDispatcher(*executor), RuleConfig{}, in, out);

    CHECK_FALSE(server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).has_value());

    // A tool named in a notification is not executed.
    CHECK_FALSE(server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"method", "write_query"},
         {"params", {{"query", "DELETE FROM locations"}}}}).has_value());
    auto count = executor->Execute("SELECT count(*) FROM locations", ExecutionMode::ReadOnly);
    REQUIRE(count.IsOk());
    CHECK(*AsInt(count.Value().rows[0][0]) == 1);
}

// ===========================================================================
// RecoverId
// ===========================================================================

TEST_CASE("McpServer: RecoverId from a parsed frame", "[mcp][server]") {
    auto id = McpServer::RecoverId(json{{"id", 5}, {"method", 3}}, "");
    REQUIRE(id.has_value());
    CHECK(*id == 5);

    // Only a top-level id counts.
    CHECK_FALSE(McpServer::RecoverId(json{{"method", "x"}, {"params", {{"id", 9}}}}, "")
                    .has_value());
    CHECK_FALSE(McpServer::RecoverId(json{{"id", json::array()}}, "").has_value());
}

TEST_CASE("McpServer: RecoverId from raw text", "[mcp][server]") {
    auto number = McpServer::RecoverId(json(), R"({"jsonrpc":"2.0","id": 12,"method":)");
    REQUIRE(number.has_value());
    CHECK(*number == 12);

    auto text = McpServer::RecoverId(json(), R"({"id":"req-\"7\"", "method": broken)");
    REQUIRE(text.has_value());
    CHECK(*text == "req-\"7\"");

    CHECK_FALSE(McpServer::RecoverId(json(), "not json at all").has_value());
}

// ===========================================================================
// Run
// ===========================================================================

TEST_CASE("McpServer: Run processes multiple messages", "[mcp][server]") {
    auto executor = SeedStore();
    std::istringstream in(
        Request(1, "initialize").dump() + "\n" +
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n" +
        "\n" +
        Request(2, "tools/list").dump() + "\n" +
        Request(3, "read_query", {{"query", "SELECT name FROM locations"}}).dump() + "\n");
    std::ostringstream out;
    McpServer server(ToolDispatcher(*executor), RuleConfig{}, in, out);

    CHECK(server.Run() == ExitReason::EndOfInput);
    CHECK(server.State() == ServerState::Stopped);

    auto lines = ResponseLines(out);
    REQUIRE(lines.size() == 3);
    CHECK(lines[0]["id"] == 1);
    CHECK(lines[1]["id"] == 2);
    CHECK(lines[2]["result"]["rows"][0][0] == "Main Street");
}

TEST_CASE("McpServer: Run answers malformed frames with an id", "[mcp][server]") {
    auto executor = SeedStore();
    std::istringstream in(
        std::string(R"({"jsonrpc":"2.0","id":4,"method":"ping")") + "\n" +
        R"({"jsonrpc":"1.0","id":5,"method":"ping"})" "\n" +
        Request(6, "ping").dump() + "\n");
    std::ostringstream out;
    McpServer server(ToolDispatcher(*executor), RuleConfig{}, in, out);

    CHECK(server.Run() == ExitReason::EndOfInput);

    auto lines = ResponseLines(out);
    REQUIRE(lines.size() == 3);
    CHECK(lines[0]["id"] == 4);
    CHECK(lines[0]["error"]["code"] == -32700);
    CHECK(lines[0]["error"]["kind"] == "ProtocolDecodeError");
    CHECK(lines[1]["id"] == 5);
    CHECK(lines[1]["error"]["code"] == -32700);
    CHECK(lines[2]["id"] == 6);
    CHECK(lines[2]["result"] == json::object());
}

TEST_CASE("McpServer: Run answers an overflowing number with ProtocolDecodeError", "[mcp][server]") {
    auto executor = SeedStore();
    std::istringstream in(
        Request(1, "ping").dump() + "\n" +
        R"({"jsonrpc":"2.0","id":2,"method":"ping","params":{"x":1e999}})" "\n" +
        Request(3, "ping").dump() + "\n");
    std::ostringstream out;
    McpServer server(ToolDispatcher(*executor), RuleConfig{}, in, out);

    CHECK(server.Run() == ExitReason::EndOfInput);

    auto lines = ResponseLines(out);
    REQUIRE(lines.size() == 3);
    CHECK(lines[0]["id"] == 1);
    CHECK(lines[1]["id"] == 2);
    CHECK(lines[1]["error"]["code"] == -32700);
    CHECK(lines[1]["error"]["kind"] == "ProtocolDecodeError");
    CHECK(lines[2]["id"] == 3);
    CHECK(lines[2]["result"] == json::object());
}

TEST_CASE("McpServer: Run stops on a malformed frame without an id", "[mcp][server]") {
    auto executor = SeedStore();
    std::istringstream in(
        Request(1, "ping").dump() + "\n" +
        "{this is not json\n" +
        Request(2, "ping").dump() + "\n");
    std::ostringstream out;
    McpServer server(ToolDispatcher(*executor), RuleConfig{}, in, out);

    CHECK(server.Run() == ExitReason::DecodeFailure);
    CHECK(server.State() == ServerState::Stopped);

    auto lines = ResponseLines(out);
    REQUIRE(lines.size() == 1);
    CHECK(lines[0]["id"] == 1);
}

TEST_CASE("McpServer: Run reports a broken output stream", "[mcp][server]") {
    auto executor = SeedStore();
    std::istringstream in(Request(1, "ping").dump() + "\n");
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    McpServer server(ToolDispatcher(*executor), RuleConfig{}, in, out);

    CHECK(server.Run() == ExitReason::IoError);
    CHECK(server.State() == ServerState::Stopped);
}

TEST_CASE("ServerStateName: lowercase names", "[mcp][server]") {
    CHECK(std::string(ServerStateName(ServerState::Idle)) == "idle");
    CHECK(std::string(ServerStateName(ServerState::Dispatching)) == "dispatching");
    CHECK(std::string(ServerStateName(ServerState::Stopped)) == "stopped");
}
