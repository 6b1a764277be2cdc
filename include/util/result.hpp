#pragma once
#include <string>
#include <utility>

namespace cloner {

enum class ErrorKind : int {
    None = 0,
    ConfigError,
    ShortHeaderError,
    MalformedHeaderError,
    ChannelOpenError,
    ReadError,
    WriteError,
    Cancelled,
};

inline const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                 return "None";
        case ErrorKind::ConfigError:          return "ConfigError";
        case ErrorKind::ShortHeaderError:     return "ShortHeaderError";
        case ErrorKind::MalformedHeaderError: return "MalformedHeaderError";
        case ErrorKind::ChannelOpenError:     return "ChannelOpenError";
        case ErrorKind::ReadError:            return "ReadError";
        case ErrorKind::WriteError:           return "WriteError";
        case ErrorKind::Cancelled:            return "Cancelled";
    }
    return "UnknownError";
}

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, int e, std::string m) {
        return {.ok = false, .kind = k, .err = e, .msg = std::move(m)};
    }
};

} // namespace cloner
