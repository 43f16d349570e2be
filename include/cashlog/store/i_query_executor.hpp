#pragma once

#include <cashlog/core/result.hpp>
#include <cashlog/store/value.hpp>

#include <string_view>
#include <vector>

namespace cashlog {

enum class ExecutionMode {
    ReadOnly,
    ReadWrite,
};

// ---------------------------------------------------------------------------
// IQueryExecutor — runs exactly one SQL statement per call.
//
// ReadOnly executions reject anything that could mutate the store with
// ForbiddenOperation. Every execution is its own transaction; failures roll
// back completely.
// ---------------------------------------------------------------------------
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    virtual Result<QueryResult, Error> Execute(std::string_view sql,
                                               ExecutionMode mode,
                                               const std::vector<Value>& params) = 0;

    Result<QueryResult, Error> Execute(std::string_view sql, ExecutionMode mode) {
        return Execute(sql, mode, {});
    }
};

} // namespace cashlog
