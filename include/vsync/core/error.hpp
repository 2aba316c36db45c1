#pragma once

#include <string>

namespace vsync {

enum class ErrorKind {
    Parse,              ///< Version pattern absent or malformed in an existing snapshot
    NotFound,           ///< File absent at the requested revision
    MalformedConflict,  ///< Unbalanced or missing conflict markers
    IO,                 ///< Version-control or filesystem access failure
    Config              ///< Unusable configuration (bad regex, missing current_version)
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Parse: return "ParseError";
        case ErrorKind::NotFound: return "NotFoundError";
        case ErrorKind::MalformedConflict: return "MalformedConflictError";
        case ErrorKind::IO: return "IOError";
        case ErrorKind::Config: return "ConfigError";
    }
    return "Error";
}

struct Error {
    ErrorKind kind = ErrorKind::IO;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    static Error parse(std::string msg) { return {ErrorKind::Parse, std::move(msg)}; }
    static Error not_found(std::string msg) { return {ErrorKind::NotFound, std::move(msg)}; }
    static Error malformed_conflict(std::string msg) { return {ErrorKind::MalformedConflict, std::move(msg)}; }
    static Error io(std::string msg) { return {ErrorKind::IO, std::move(msg)}; }
    static Error config(std::string msg) { return {ErrorKind::Config, std::move(msg)}; }

    [[nodiscard]] bool is(ErrorKind k) const noexcept { return kind == k; }

    [[nodiscard]] std::string describe() const {
        return std::string(error_kind_name(kind)) + ": " + message;
    }
};

} // namespace vsync
