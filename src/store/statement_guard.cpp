#include <cashlog/store/statement_guard.hpp>

#include <cctype>
#include <set>

namespace cashlog {

namespace {

const std::set<std::string>& ReadForbiddenWords() {
    static const std::set<std::string> kWords = {
        "INSERT", "UPDATE", "DELETE", "DROP", "CREATE", "ALTER", "REPLACE",
        "TRUNCATE", "ATTACH", "DETACH", "PRAGMA", "VACUUM", "REINDEX",
        "ANALYZE",
    };
    return kWords;
}

const std::set<std::string>& WriteForbiddenLeaders() {
    static const std::set<std::string> kWords = {
        "BEGIN", "COMMIT", "END", "ROLLBACK", "SAVEPOINT", "RELEASE",
        "ATTACH", "DETACH", "PRAGMA", "VACUUM",
    };
    return kWords;
}

bool IsWordStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool IsWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

// Skip a quoted run starting at s[i] (the opening quote). Doubled closing
// quotes are escapes. Returns the index just past the closing quote.
size_t SkipQuoted(std::string_view s, size_t i, char close) {
    ++i;
    while (i < s.size()) {
        if (s[i] == close) {
            if (close != ']' && i + 1 < s.size() && s[i + 1] == close) {
                i += 2;
                continue;
            }
            return i + 1;
        }
        ++i;
    }
    return i;
}

size_t SkipWhitespaceAndComments(std::string_view s, size_t i) {
    while (i < s.size()) {
        if (std::isspace(static_cast<unsigned char>(s[i]))) {
            ++i;
        } else if (s.compare(i, 2, "--") == 0) {
            auto nl = s.find('\n', i);
            i = (nl == std::string_view::npos) ? s.size() : nl + 1;
        } else if (s.compare(i, 2, "/*") == 0) {
            auto end = s.find("*/", i + 2);
            i = (end == std::string_view::npos) ? s.size() : end + 2;
        } else {
            break;
        }
    }
    return i;
}

Error Forbidden(const std::string& message) {
    return Error::Make(ErrorKind::ForbiddenOperation, "CheckStatement", message);
}

Error Invalid(const std::string& message) {
    return Error::Make(ErrorKind::InvalidArguments, "CheckStatement", message);
}

} // anonymous namespace

StatementScan ScanStatement(std::string_view sql) {
    StatementScan scan;
    bool segment_has_content = false;

    size_t i = 0;
    while (true) {
        i = SkipWhitespaceAndComments(sql, i);
        if (i >= sql.size()) break;

        const char c = sql[i];
        if (c == ';') {
            if (segment_has_content) ++scan.statement_count;
            segment_has_content = false;
            ++i;
            continue;
        }

        segment_has_content = true;
        if (c == '\'' || c == '"' || c == '`') {
            i = SkipQuoted(sql, i, c);
        } else if (c == '[') {
            i = SkipQuoted(sql, i, ']');
        } else if (IsWordStart(c)) {
            size_t start = i;
            while (i < sql.size() && IsWordChar(sql[i])) ++i;
            SqlWord word;
            word.upper.reserve(i - start);
            for (size_t k = start; k < i; ++k) {
                word.upper.push_back(static_cast<char>(
                    std::toupper(static_cast<unsigned char>(sql[k]))));
            }
            size_t next = SkipWhitespaceAndComments(sql, i);
            word.followed_by_paren = next < sql.size() && sql[next] == '(';
            scan.words.push_back(std::move(word));
        } else {
            ++i;
        }
    }
    if (segment_has_content) ++scan.statement_count;

    return scan;
}

Result<void, Error> CheckStatement(std::string_view sql, ExecutionMode mode) {
    const auto scan = ScanStatement(sql);

    if (scan.statement_count == 0 || scan.words.empty()) {
        return Result<void, Error>::Err(Invalid("Statement is empty"));
    }

    const std::string& leader = scan.words.front().upper;

    if (mode == ExecutionMode::ReadOnly) {
        if (scan.statement_count > 1) {
            return Result<void, Error>::Err(Forbidden(
                "Read queries must contain exactly one statement"));
        }
        if (leader != "SELECT" && leader != "WITH" && leader != "VALUES") {
            return Result<void, Error>::Err(Forbidden(
                "Read queries must be SELECT statements; '" + leader +
                "' requires write_query"));
        }
        const auto& forbidden = ReadForbiddenWords();
        for (const auto& word : scan.words) {
            // replace(x, y, z) is a scalar function, not REPLACE INTO.
            if (word.upper == "REPLACE" && word.followed_by_paren) continue;
            if (forbidden.count(word.upper) > 0) {
                return Result<void, Error>::Err(Forbidden(
                    "Read queries must not contain '" + word.upper + "'"));
            }
        }
        return Result<void, Error>::Ok();
    }

    if (scan.statement_count > 1) {
        return Result<void, Error>::Err(Invalid(
            "Write queries must contain exactly one statement"));
    }
    if (WriteForbiddenLeaders().count(leader) > 0) {
        return Result<void, Error>::Err(Forbidden(
            "'" + leader + "' is not permitted; transactions and "
            "connection settings are managed by the server"));
    }
    return Result<void, Error>::Ok();
}

} // namespace cashlog
