#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace strata {

enum class ErrorCode : uint8_t {
    UnreadableInput,
    CycleDetected,
    UnknownParent,
    DuplicateStage,
    InvalidSpec,
    CacheMiss,
    CacheCorruption,
    CacheBusy,
    BackendFailure,
    RunnerFailure,
    Cancelled,
    DigestFailure,
};

constexpr std::string_view error_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::UnreadableInput:
        return "UnreadableInput";
    case ErrorCode::CycleDetected:
        return "CycleDetected";
    case ErrorCode::UnknownParent:
        return "UnknownParent";
    case ErrorCode::DuplicateStage:
        return "DuplicateStage";
    case ErrorCode::InvalidSpec:
        return "InvalidSpec";
    case ErrorCode::CacheMiss:
        return "CacheMiss";
    case ErrorCode::CacheCorruption:
        return "CacheCorruption";
    case ErrorCode::CacheBusy:
        return "CacheBusy";
    case ErrorCode::BackendFailure:
        return "BackendFailure";
    case ErrorCode::RunnerFailure:
        return "RunnerFailure";
    case ErrorCode::Cancelled:
        return "Cancelled";
    case ErrorCode::DigestFailure:
        return "DigestFailure";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code;
    std::string message;

    std::string describe() const {
        return std::format("{}: {}", error_name(code), message);
    }
};

template <typename T>
using Result = std::expected<T, Error>;

template <typename... Args>
std::unexpected<Error> make_error(ErrorCode code, std::format_string<Args...> fmt, Args &&...args) {
    return std::unexpected(Error{code, std::format(fmt, std::forward<Args>(args)...)});
}

} // namespace strata
