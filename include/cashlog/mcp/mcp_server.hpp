#pragma once

#include <cashlog/core/result.hpp>
#include <cashlog/mcp/tool_dispatcher.hpp>
#include <cashlog/rules/rule_config.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace cashlog {

enum class ServerState {
    Idle,
    Reading,
    Dispatching,
    Writing,
    Stopped,
};

const char* ServerStateName(ServerState state);

enum class ExitReason {
    EndOfInput,
    DecodeFailure,  // malformed frame without a recoverable id
    IoError,        // response could not be written
};

// ---------------------------------------------------------------------------
// McpServer — MCP 2024-11-05 server over newline-delimited JSON-RPC 2.0.
//
// Methods:
//   - initialize
//   - ping
//   - tools/list
//   - tools/call           (MCP content envelope plus structuredContent)
//   - <tool name>          (bare result payload)
//   - notifications        (no id, no response)
//
// One request at a time: the next line is read only after the previous
// response has been written and flushed.
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(ToolDispatcher dispatcher,
              RuleConfig rules,
              std::istream& in = std::cin,
              std::ostream& out = std::cout);

    // Run the server loop until end of input or an unrecoverable failure.
    ExitReason Run();

    // Process a single decoded JSON-RPC message and return the response (if
    // any). Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] ServerState State() const noexcept { return state_; }

    // Find the request id of a malformed frame, from the parsed value when
    // there is one, else by scanning the raw text for an "id" member.
    [[nodiscard]] static std::optional<nlohmann::json> RecoverId(
        const nlohmann::json& parsed, const std::string& raw);

private:
    nlohmann::json HandleInitialize(const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    nlohmann::json HandleDirectToolCall(const std::string& tool_name,
                                        const nlohmann::json& params,
                                        const nlohmann::json& id);
    Result<nlohmann::json, Error> CallTool(const std::string& tool_name,
                                           const nlohmann::json& arguments);

    nlohmann::json MakeError(const nlohmann::json& id, const Error& error);
    nlohmann::json MakeResult(const nlohmann::json& id,
                              const nlohmann::json& result);

    bool WriteResponse(const nlohmann::json& response);

    ToolDispatcher dispatcher_;
    RuleConfig rules_;
    std::istream& in_;
    std::ostream& out_;
    ServerState state_ = ServerState::Idle;
};

} // namespace cashlog
