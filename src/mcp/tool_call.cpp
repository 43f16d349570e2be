#include <cashlog/mcp/tool_call.hpp>

#include <algorithm>
#include <limits>
#include <string>

namespace cashlog {

namespace {

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

Error InvalidArgument(const std::string& tool, const std::string& message) {
    return Error::Make(ErrorKind::InvalidArguments, tool, message);
}

Result<std::string, Error> RequireString(const std::string& tool,
                                         const nlohmann::json& args,
                                         const std::string& key) {
    if (!args.contains(key)) {
        return Result<std::string, Error>::Err(
            InvalidArgument(tool, "Missing required parameter: " + key));
    }
    const auto& value = args[key];
    if (!value.is_string()) {
        return Result<std::string, Error>::Err(
            InvalidArgument(tool, "Parameter '" + key + "' must be a string"));
    }
    auto text = value.get<std::string>();
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Result<std::string, Error>::Err(
            InvalidArgument(tool, "Parameter '" + key + "' must not be empty"));
    }
    return Result<std::string, Error>::Ok(std::move(text));
}

Result<CivilDate, Error> RequireDate(const std::string& tool,
                                     const nlohmann::json& args,
                                     const std::string& key) {
    auto text = RequireString(tool, args, key);
    if (text.IsErr()) return Result<CivilDate, Error>::Err(text.Error());
    auto date = CivilDate::Create(text.Value());
    if (date.IsErr()) {
        return Result<CivilDate, Error>::Err(
            InvalidArgument(tool, "Parameter '" + key + "': " + date.Error()));
    }
    return Result<CivilDate, Error>::Ok(date.Value());
}

Result<DateRange, Error> RequireRange(const std::string& tool,
                                      const nlohmann::json& args,
                                      const RuleConfig& config) {
    auto start = RequireDate(tool, args, "start_date");
    if (start.IsErr()) return Result<DateRange, Error>::Err(start.Error());
    auto end = RequireDate(tool, args, "end_date");
    if (end.IsErr()) return Result<DateRange, Error>::Err(end.Error());

    auto range = DateRange::Create(start.Value(), end.Value());
    if (range.IsErr()) {
        return Result<DateRange, Error>::Err(InvalidArgument(tool, range.Error()));
    }
    if (range.Value().Days() > config.max_range_days) {
        return Result<DateRange, Error>::Err(InvalidArgument(tool,
            "Date range spans " + std::to_string(range.Value().Days()) +
            " days; the maximum is " + std::to_string(config.max_range_days)));
    }
    return Result<DateRange, Error>::Ok(range.Value());
}

// Optional non-negative number; absent or null keeps `target` unchanged.
Result<void, Error> OptNumber(const std::string& tool,
                              const nlohmann::json& args,
                              const std::string& key,
                              double& target,
                              bool strictly_positive = false) {
    if (!args.contains(key) || args[key].is_null()) return Result<void, Error>::Ok();
    const auto& value = args[key];
    if (!value.is_number()) {
        return Result<void, Error>::Err(
            InvalidArgument(tool, "Parameter '" + key + "' must be a number"));
    }
    const double number = value.get<double>();
    if (number < 0.0 || (strictly_positive && number == 0.0)) {
        return Result<void, Error>::Err(InvalidArgument(tool,
            "Parameter '" + key + "' must be " +
            (strictly_positive ? "positive" : "non-negative")));
    }
    target = number;
    return Result<void, Error>::Ok();
}

Result<void, Error> OptInt(const std::string& tool,
                           const nlohmann::json& args,
                           const std::string& key,
                           int& target, int min, int max) {
    if (!args.contains(key) || args[key].is_null()) return Result<void, Error>::Ok();
    const auto& value = args[key];
    if (!value.is_number_integer()) {
        return Result<void, Error>::Err(
            InvalidArgument(tool, "Parameter '" + key + "' must be an integer"));
    }
    const auto number = value.get<int64_t>();
    if (number < min || number > max) {
        return Result<void, Error>::Err(InvalidArgument(tool,
            "Parameter '" + key + "' must be between " + std::to_string(min) +
            " and " + std::to_string(max)));
    }
    target = static_cast<int>(number);
    return Result<void, Error>::Ok();
}

Result<void, Error> OptBool(const std::string& tool,
                            const nlohmann::json& args,
                            const std::string& key,
                            bool& target) {
    if (!args.contains(key) || args[key].is_null()) return Result<void, Error>::Ok();
    if (!args[key].is_boolean()) {
        return Result<void, Error>::Err(
            InvalidArgument(tool, "Parameter '" + key + "' must be a boolean"));
    }
    target = args[key].get<bool>();
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json DateProp(const std::string& desc) {
    return {{"type", "string"}, {"format", "date"}, {"description", desc}};
}

nlohmann::json NumberProp(const std::string& desc) {
    return {{"type", "number"}, {"description", desc}};
}

nlohmann::json IntProp(const std::string& desc) {
    return {{"type", "integer"}, {"description", desc}};
}

nlohmann::json BoolProp(const std::string& desc) {
    return {{"type", "boolean"}, {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

std::vector<ToolDescriptor> BuildDescriptors() {
    using nlohmann::json;
    const auto range_props = json{
        {"start_date", DateProp("First day of the range (YYYY-MM-DD)")},
        {"end_date", DateProp("Last day of the range, inclusive (YYYY-MM-DD)")}};

    return {
        {"list_tables",
         "List the tables in the cash logistics database.",
         MakeSchema(json::object(), json::array())},
        {"describe_table",
         "Show the columns of a table: name, declared type, nullability, "
         "primary key position and default value.",
         MakeSchema({{"table_name", StringProp("Table to describe")}},
                    json::array({"table_name"}))},
        {"read_query",
         "Run a single read-only SQL statement (SELECT, WITH or VALUES) and "
         "return columns and rows.",
         MakeSchema({{"query", StringProp("SQL SELECT statement")}},
                    json::array({"query"}))},
        {"write_query",
         "Run a single INSERT, UPDATE, DELETE or DDL statement and return the "
         "number of affected rows.",
         MakeSchema({{"query", StringProp("SQL statement")}},
                    json::array({"query"}))},
        {"detect_missed_pickups",
         "List scheduled pickups with no completed outcome in a date range, "
         "with days elapsed and cash at risk.",
         MakeSchema(range_props, json::array({"start_date", "end_date"}))},
        {"score_risk",
         "Score every location's cash exposure as of a date.",
         MakeSchema({{"as_of_date", DateProp("Evaluation date (YYYY-MM-DD)")},
                     {"high_volume_threshold",
                      NumberProp("Daily volume at which a location counts as high volume")},
                     {"cash_sitting_hours",
                      NumberProp("Hours cash may sit before a location is high risk")},
                     {"only_high_risk", BoolProp("Return high-risk locations only")}},
                    json::array({"as_of_date"}))},
        {"detect_schedule_mismatches",
         "Find locations whose pickup days or frequency do not match their "
         "deposit pattern.",
         MakeSchema({{"as_of_date", DateProp("Evaluation date (YYYY-MM-DD)")},
                     {"peak_day_tolerance_days",
                      IntProp("Allowed distance in days between peak deposit and pickup day")}},
                    json::array({"as_of_date"}))},
        {"find_consolidation_opportunities",
         "Find carriers serving several nearby locations on the same weekday "
         "at different times.",
         MakeSchema({{"max_distance_km",
                      NumberProp("Largest distance between linked stops, in km")}},
                    json::array())},
        {"reconcile_carrier_invoices",
         "Compare carrier invoices with the stops actually serviced.",
         MakeSchema({{"month", StringProp("Billing month (YYYY-MM); all months when omitted")}},
                    json::array())},
        {"collect_findings",
         "Run every rule over a date range and return alert records ordered "
         "by severity.",
         MakeSchema(range_props, json::array({"start_date", "end_date"}))},
    };
}

// ---------------------------------------------------------------------------
// Per-tool parsers
// ---------------------------------------------------------------------------

template <typename T>
Result<ToolCall, Error> Lift(Result<T, Error> result) {
    if (result.IsErr()) return Result<ToolCall, Error>::Err(std::move(result).Error());
    return Result<ToolCall, Error>::Ok(ToolCall{std::move(result).Value()});
}

Result<ToolCall, Error> ParseDescribeTable(const std::string& tool,
                                           const nlohmann::json& args) {
    auto name = RequireString(tool, args, "table_name");
    if (name.IsErr()) return Result<ToolCall, Error>::Err(name.Error());
    auto table = TableName::Create(name.Value());
    if (table.IsErr()) {
        return Result<ToolCall, Error>::Err(InvalidArgument(tool, table.Error()));
    }
    return Result<ToolCall, Error>::Ok(ToolCall{DescribeTableCall{table.Value()}});
}

Result<ToolCall, Error> ParseScoreRisk(const std::string& tool,
                                       const nlohmann::json& args,
                                       const RuleConfig& defaults) {
    auto as_of = RequireDate(tool, args, "as_of_date");
    if (as_of.IsErr()) return Result<ToolCall, Error>::Err(as_of.Error());
    ScoreRiskCall call{as_of.Value(), false, defaults};
    if (auto status = OptNumber(tool, args, "high_volume_threshold",
                          call.config.high_volume_threshold); status.IsErr()) {
        return Result<ToolCall, Error>::Err(status.Error());
    }
    if (auto status = OptNumber(tool, args, "cash_sitting_hours",
                          call.config.cash_sitting_hours); status.IsErr()) {
        return Result<ToolCall, Error>::Err(status.Error());
    }
    if (auto status = OptBool(tool, args, "only_high_risk", call.only_high_risk); status.IsErr()) {
        return Result<ToolCall, Error>::Err(status.Error());
    }
    return Result<ToolCall, Error>::Ok(ToolCall{std::move(call)});
}

Result<ToolCall, Error> ParseScheduleMismatches(const std::string& tool,
                                                const nlohmann::json& args,
                                                const RuleConfig& defaults) {
    auto as_of = RequireDate(tool, args, "as_of_date");
    if (as_of.IsErr()) return Result<ToolCall, Error>::Err(as_of.Error());
    DetectScheduleMismatchesCall call{as_of.Value(), defaults};
    if (auto status = OptInt(tool, args, "peak_day_tolerance_days",
                       call.config.peak_day_tolerance_days, 0, 3); status.IsErr()) {
        return Result<ToolCall, Error>::Err(status.Error());
    }
    return Result<ToolCall, Error>::Ok(ToolCall{std::move(call)});
}

Result<ToolCall, Error> ParseConsolidation(const std::string& tool,
                                           const nlohmann::json& args,
                                           const RuleConfig& defaults) {
    FindConsolidationCall call{defaults};
    if (auto status = OptNumber(tool, args, "max_distance_km",
                          call.config.consolidation_max_distance_km, true); status.IsErr()) {
        return Result<ToolCall, Error>::Err(status.Error());
    }
    return Result<ToolCall, Error>::Ok(ToolCall{std::move(call)});
}

Result<ToolCall, Error> ParseReconcileInvoices(const std::string& tool,
                                               const nlohmann::json& args) {
    ReconcileInvoicesCall call;
    if (args.contains("month") && !args["month"].is_null()) {
        auto text = RequireString(tool, args, "month");
        if (text.IsErr()) return Result<ToolCall, Error>::Err(text.Error());
        auto month = YearMonth::Create(text.Value());
        if (month.IsErr()) {
            return Result<ToolCall, Error>::Err(
                InvalidArgument(tool, "Parameter 'month': " + month.Error()));
        }
        call.month = month.Value();
    }
    return Result<ToolCall, Error>::Ok(ToolCall{std::move(call)});
}

} // anonymous namespace

const char* ToolName(const ToolCall& call) {
    static const char* const kNames[] = {
        "list_tables",
        "describe_table",
        "read_query",
        "write_query",
        "detect_missed_pickups",
        "score_risk",
        "detect_schedule_mismatches",
        "find_consolidation_opportunities",
        "reconcile_carrier_invoices",
        "collect_findings",
    };
    static_assert(sizeof(kNames) / sizeof(kNames[0]) == std::variant_size_v<ToolCall>,
                  "every ToolCall alternative needs a name");
    return kNames[call.index()];
}

const std::vector<ToolDescriptor>& ToolDescriptors() {
    static const std::vector<ToolDescriptor> kDescriptors = BuildDescriptors();
    return kDescriptors;
}

bool IsToolName(const std::string& name) {
    const auto& tools = ToolDescriptors();
    return std::any_of(tools.begin(), tools.end(),
                       [&](const ToolDescriptor& d) { return d.name == name; });
}

Result<ToolCall, Error> ParseToolCall(const std::string& name,
                                      const nlohmann::json& arguments,
                                      const RuleConfig& defaults) {
    if (!IsToolName(name)) {
        return Result<ToolCall, Error>::Err(Error::Make(
            ErrorKind::UnknownTool, "ParseToolCall", "Unknown tool: " + name));
    }

    const nlohmann::json empty = nlohmann::json::object();
    if (!arguments.is_null() && !arguments.is_object()) {
        return Result<ToolCall, Error>::Err(
            InvalidArgument(name, "Arguments must be a JSON object"));
    }
    const nlohmann::json& args = arguments.is_null() ? empty : arguments;

    if (name == "list_tables") {
        return Result<ToolCall, Error>::Ok(ToolCall{ListTablesCall{}});
    }
    if (name == "describe_table") {
        return ParseDescribeTable(name, args);
    }
    if (name == "read_query") {
        return Lift(RequireString(name, args, "query").Map(
            [](const std::string& q) { return ReadQueryCall{q}; }));
    }
    if (name == "write_query") {
        return Lift(RequireString(name, args, "query").Map(
            [](const std::string& q) { return WriteQueryCall{q}; }));
    }
    if (name == "detect_missed_pickups") {
        return Lift(RequireRange(name, args, defaults).Map(
            [&](const DateRange& r) { return DetectMissedPickupsCall{r, defaults}; }));
    }
    if (name == "score_risk") {
        return ParseScoreRisk(name, args, defaults);
    }
    if (name == "detect_schedule_mismatches") {
        return ParseScheduleMismatches(name, args, defaults);
    }
    if (name == "find_consolidation_opportunities") {
        return ParseConsolidation(name, args, defaults);
    }
    if (name == "reconcile_carrier_invoices") {
        return ParseReconcileInvoices(name, args);
    }
    if (name == "collect_findings") {
        return Lift(RequireRange(name, args, defaults).Map(
            [&](const DateRange& r) { return CollectFindingsCall{r, defaults}; }));
    }
    return Result<ToolCall, Error>::Err(Error::Make(
        ErrorKind::UnknownTool, "ParseToolCall", "No parser for tool: " + name));
}

} // namespace cashlog
