#pragma once
#include <string>
#include <utility>

namespace imagine {

enum class ErrorKind : int {
    None = 0,
    OpenError,
    ReadError,
    WriteError,
    NotFound,
    UnsupportedFormat,
    Aborted,
    ConfigError,
    VerifyError,
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "ok";
        case ErrorKind::OpenError:         return "open error";
        case ErrorKind::ReadError:         return "read error";
        case ErrorKind::WriteError:        return "write error";
        case ErrorKind::NotFound:          return "not found";
        case ErrorKind::UnsupportedFormat: return "unsupported format";
        case ErrorKind::Aborted:           return "aborted";
        case ErrorKind::ConfigError:       return "config error";
        case ErrorKind::VerifyError:       return "verify error";
    }
    return "unknown";
}

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    bool aborted() const { return kind == ErrorKind::Aborted; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, int e, std::string m) {
        return {.ok = false, .kind = k, .err = e, .msg = std::move(m)};
    }
};

} // namespace imagine
