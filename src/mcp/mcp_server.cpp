#include <cashlog/mcp/mcp_server.hpp>

#include <cashlog/core/log.hpp>
#include <cashlog/core/version.hpp>

#include <cctype>
#include <exception>
#include <optional>
#include <string>

namespace cashlog {

namespace {

constexpr const char* kProtocolVersion = "2024-11-05";

bool IsBlank(const std::string& line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool IsUsableId(const nlohmann::json& id) {
    return id.is_string() || id.is_number();
}

Error DecodeError(const std::string& message) {
    return Error::Make(ErrorKind::ProtocolDecodeError, "McpServer", message);
}

// A frame must be an object with a string method; jsonrpc, when present,
// must be "2.0".
std::optional<Error> CheckEnvelope(const nlohmann::json& message) {
    if (!message.is_object()) {
        return DecodeError("Request must be a JSON object");
    }
    if (message.contains("jsonrpc") && message["jsonrpc"] != "2.0") {
        return DecodeError("Invalid JSON-RPC version");
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        return DecodeError("Request has no string 'method'");
    }
    return std::nullopt;
}

std::string Dump(const nlohmann::json& j) {
    // Store text is not guaranteed to be valid UTF-8.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

const char* ServerStateName(ServerState state) {
    switch (state) {
        case ServerState::Idle: return "idle";
        case ServerState::Reading: return "reading";
        case ServerState::Dispatching: return "dispatching";
        case ServerState::Writing: return "writing";
        case ServerState::Stopped: return "stopped";
    }
    return "unknown";
}

McpServer::McpServer(ToolDispatcher dispatcher,
                     RuleConfig rules,
                     std::istream& in,
                     std::ostream& out)
    : dispatcher_(dispatcher), rules_(rules), in_(in), out_(out) {}

ExitReason McpServer::Run() {
    std::string line;
    while (true) {
        state_ = ServerState::Reading;
        if (!std::getline(in_, line)) {
            state_ = ServerState::Stopped;
            LogInfo("mcp", "End of input, stopping");
            return ExitReason::EndOfInput;
        }
        if (IsBlank(line)) {
            state_ = ServerState::Idle;
            continue;
        }

        state_ = ServerState::Dispatching;
        nlohmann::json message;
        std::optional<Error> decode_error;
        try {
            message = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            decode_error = DecodeError(std::string("Invalid JSON: ") + e.what());
        }
        if (!decode_error) {
            decode_error = CheckEnvelope(message);
        }

        std::optional<nlohmann::json> response;
        if (decode_error) {
            auto id = RecoverId(message, line);
            if (!id) {
                LogError("mcp", decode_error->ToString() + "; no request id, stopping");
                state_ = ServerState::Stopped;
                return ExitReason::DecodeFailure;
            }
            LogWarn("mcp", decode_error->ToString());
            response = MakeError(*id, *decode_error);
        } else {
            response = HandleMessage(message);
        }

        if (response) {
            state_ = ServerState::Writing;
            if (!WriteResponse(*response)) {
                LogError("mcp", "Failed to write response, stopping");
                state_ = ServerState::Stopped;
                return ExitReason::IoError;
            }
        }
        state_ = ServerState::Idle;
    }
}

bool McpServer::WriteResponse(const nlohmann::json& response) {
    out_ << Dump(response) << "\n";
    out_.flush();
    return static_cast<bool>(out_);
}

std::optional<nlohmann::json> McpServer::RecoverId(const nlohmann::json& parsed,
                                                   const std::string& raw) {
    if (parsed.is_object()) {
        if (parsed.contains("id") && IsUsableId(parsed["id"])) return parsed["id"];
        return std::nullopt;
    }

    // Scan the raw text: "id" <ws> : <ws> (number | "string").
    size_t pos = 0;
    while ((pos = raw.find("\"id\"", pos)) != std::string::npos) {
        size_t i = pos + 4;
        pos = i;
        while (i < raw.size() && std::isspace(static_cast<unsigned char>(raw[i]))) ++i;
        if (i >= raw.size() || raw[i] != ':') continue;
        ++i;
        while (i < raw.size() && std::isspace(static_cast<unsigned char>(raw[i]))) ++i;
        if (i >= raw.size()) break;

        if (raw[i] == '"') {
            size_t end = i + 1;
            while (end < raw.size() && raw[end] != '"') {
                if (raw[end] == '\\') ++end;
                ++end;
            }
            if (end >= raw.size()) continue;
            auto candidate = nlohmann::json::parse(raw.substr(i, end - i + 1), nullptr, false);
            if (candidate.is_string()) return candidate;
            continue;
        }

        size_t end = i;
        while (end < raw.size() &&
               (std::isdigit(static_cast<unsigned char>(raw[end])) ||
                raw[end] == '-' || raw[end] == '+' || raw[end] == '.' ||
                raw[end] == 'e' || raw[end] == 'E')) {
            ++end;
        }
        if (end == i) continue;
        auto candidate = nlohmann::json::parse(raw.substr(i, end - i), nullptr, false);
        if (candidate.is_number()) return candidate;
    }
    return std::nullopt;
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (auto error = CheckEnvelope(message)) {
        auto id = RecoverId(message, "");
        if (!id) return std::nullopt;
        return MakeError(*id, *error);
    }

    const auto method = message["method"].get<std::string>();
    const auto params = message.contains("params") ? message["params"]
                                                   : nlohmann::json::object();

    // Notifications have no "id" and never get a response.
    if (!message.contains("id")) {
        LogDebug("mcp", "Notification: " + method);
        return std::nullopt;
    }

    const auto id = message["id"];
    LogDebug("mcp", "Request " + Dump(id) + ": " + method);

    try {
        if (method == "initialize") {
            return HandleInitialize(id);
        }
        if (method == "ping") {
            return MakeResult(id, nlohmann::json::object());
        }
        if (method == "tools/list") {
            return HandleToolsList(id);
        }
        if (method == "tools/call") {
            return HandleToolsCall(params, id);
        }
        if (IsToolName(method)) {
            return HandleDirectToolCall(method, params, id);
        }
    } catch (const std::exception& e) {
        auto error = Error::Make(ErrorKind::QueryError, method,
                                 std::string("Internal error: ") + e.what());
        LogError("mcp", error.ToString());
        return MakeError(id, error);
    }

    return MakeError(id, Error::Make(ErrorKind::UnknownTool, "McpServer",
                                     "Method not found: " + method));
}

nlohmann::json McpServer::HandleInitialize(const nlohmann::json& id) {
    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", "cashlog-mcp"},
        {"version", kVersion}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& tool : ToolDescriptors()) {
        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, Error::Make(ErrorKind::InvalidArguments, "tools/call",
                                         "Missing 'name' parameter"));
    }

    const auto tool_name = params["name"].get<std::string>();
    const auto arguments = params.contains("arguments") ? params["arguments"]
                                                        : nlohmann::json::object();

    auto result = CallTool(tool_name, arguments);
    if (result.IsErr()) {
        return MakeError(id, result.Error());
    }

    nlohmann::json envelope;
    envelope["content"] = nlohmann::json::array({
        {{"type", "text"}, {"text", Dump(result.Value())}}
    });
    envelope["structuredContent"] = result.Value();
    return MakeResult(id, envelope);
}

nlohmann::json McpServer::HandleDirectToolCall(const std::string& tool_name,
                                               const nlohmann::json& params,
                                               const nlohmann::json& id) {
    auto result = CallTool(tool_name, params);
    if (result.IsErr()) {
        return MakeError(id, result.Error());
    }
    return MakeResult(id, result.Value());
}

Result<nlohmann::json, Error> McpServer::CallTool(const std::string& tool_name,
                                                  const nlohmann::json& arguments) {
    auto call = ParseToolCall(tool_name, arguments, rules_);
    if (call.IsErr()) {
        LogWarn("mcp", call.Error().ToString());
        return Result<nlohmann::json, Error>::Err(call.Error());
    }
    return dispatcher_.Dispatch(call.Value());
}

nlohmann::json McpServer::MakeError(const nlohmann::json& id, const Error& error) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", error.JsonRpcCode()},
            {"kind", error.KindName()},
            {"message", error.message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace cashlog
