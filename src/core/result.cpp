#include <cashlog/core/result.hpp>

#include <sstream>

namespace cashlog {

std::string Error::KindName() const {
    switch (kind) {
        case ErrorKind::UnknownTool:         return "UnknownTool";
        case ErrorKind::InvalidArguments:    return "InvalidArguments";
        case ErrorKind::NotFound:            return "NotFound";
        case ErrorKind::ForbiddenOperation:  return "ForbiddenOperation";
        case ErrorKind::QueryError:          return "QueryError";
        case ErrorKind::ResultTooLarge:      return "ResultTooLarge";
        case ErrorKind::QueryTimeout:        return "QueryTimeout";
        case ErrorKind::ProtocolDecodeError: return "ProtocolDecodeError";
        case ErrorKind::FatalStartup:        return "FatalStartup";
    }
    return "QueryError";
}

int Error::JsonRpcCode() const {
    switch (kind) {
        case ErrorKind::UnknownTool:         return -32601;
        case ErrorKind::InvalidArguments:    return -32602;
        case ErrorKind::NotFound:            return -32004;
        case ErrorKind::ForbiddenOperation:  return -32003;
        case ErrorKind::QueryError:          return -32000;
        case ErrorKind::ResultTooLarge:      return -32001;
        case ErrorKind::QueryTimeout:        return -32002;
        case ErrorKind::ProtocolDecodeError: return -32700;
        case ErrorKind::FatalStartup:        return -32000;
    }
    return -32000;
}

int Error::ExitCode() const {
    switch (kind) {
        case ErrorKind::FatalStartup:        return 2;
        case ErrorKind::ProtocolDecodeError: return 3;
        case ErrorKind::InvalidArguments:    return 1;
        default:                             return 99;
    }
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation << " [" << KindName() << "]: " << message;
    if (sqlite_code.has_value()) {
        oss << " (sqlite " << *sqlite_code << ")";
    }
    return oss.str();
}

} // namespace cashlog
