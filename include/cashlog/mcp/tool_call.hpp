#pragma once

#include <cashlog/core/result.hpp>
#include <cashlog/core/types.hpp>
#include <cashlog/rules/rule_config.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace cashlog {

// ---------------------------------------------------------------------------
// Typed tool calls. One struct per tool; every argument already validated.
// Rule calls carry the effective RuleConfig (defaults plus per-call
// overrides).
// ---------------------------------------------------------------------------
struct ListTablesCall {};

struct DescribeTableCall {
    TableName table;
};

struct ReadQueryCall {
    std::string query;
};

struct WriteQueryCall {
    std::string query;
};

struct DetectMissedPickupsCall {
    DateRange range;
    RuleConfig config;
};

struct ScoreRiskCall {
    CivilDate as_of;
    bool only_high_risk = false;
    RuleConfig config;
};

struct DetectScheduleMismatchesCall {
    CivilDate as_of;
    RuleConfig config;
};

struct FindConsolidationCall {
    RuleConfig config;
};

struct ReconcileInvoicesCall {
    std::optional<YearMonth> month;
};

struct CollectFindingsCall {
    DateRange range;
    RuleConfig config;
};

using ToolCall = std::variant<
    ListTablesCall,
    DescribeTableCall,
    ReadQueryCall,
    WriteQueryCall,
    DetectMissedPickupsCall,
    ScoreRiskCall,
    DetectScheduleMismatchesCall,
    FindConsolidationCall,
    ReconcileInvoicesCall,
    CollectFindingsCall>;

/// Wire name of the tool a call belongs to, e.g. "read_query".
[[nodiscard]] const char* ToolName(const ToolCall& call);

// ---------------------------------------------------------------------------
// ToolDescriptor — what tools/list advertises for one tool.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

[[nodiscard]] const std::vector<ToolDescriptor>& ToolDescriptors();

[[nodiscard]] bool IsToolName(const std::string& name);

// ---------------------------------------------------------------------------
// ParseToolCall — validate a tool name and its JSON arguments.
//
// Pure: never touches the store. UnknownTool for an unknown name;
// InvalidArguments for non-object arguments, missing or mistyped fields,
// malformed dates, inverted ranges and ranges longer than
// `defaults.max_range_days`. Null arguments count as an empty object.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<ToolCall, Error> ParseToolCall(const std::string& name,
                                                    const nlohmann::json& arguments,
                                                    const RuleConfig& defaults);

} // namespace cashlog
