#pragma once

#include <cashlog/core/result.hpp>
#include <cashlog/store/i_query_executor.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace cashlog {

// A bare word outside literals, quoted identifiers and comments.
struct SqlWord {
    std::string upper;       // upper-cased text
    bool followed_by_paren;  // next significant char is '(' (function call)
};

struct StatementScan {
    std::vector<SqlWord> words;
    int statement_count = 0;  // non-empty ';'-separated segments
};

/// Tokenize just enough SQL to see keywords and statement boundaries.
StatementScan ScanStatement(std::string_view sql);

/// First-line check of the read/write boundary.
///
/// ReadOnly: one statement starting with SELECT, WITH or VALUES and no
/// mutation/session keyword anywhere. ReadWrite: one statement that is not
/// transaction control, ATTACH/DETACH, PRAGMA or VACUUM.
///
/// Keyword scanning is best effort; QueryExecutor additionally rejects
/// compiled statements SQLite does not report as read-only.
Result<void, Error> CheckStatement(std::string_view sql, ExecutionMode mode);

} // namespace cashlog
