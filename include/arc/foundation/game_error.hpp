#pragma once

/// @file game_error.hpp
/// @brief Error type used with Result<T, GameError>.

#include <string>
#include <string_view>
#include <utility>

#include "arc/foundation/error_code.hpp"

namespace arc::foundation {

/// Error carrying a categorized code, a human-readable message and,
/// optionally, the config key or entity the error refers to.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::string subject)
        : code_(code), message_(std::move(message)), subject_(std::move(subject)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Config key, weapon id or similar the error is about (may be empty).
    [[nodiscard]] std::string_view subject() const noexcept { return subject_; }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::string subject_;
};

} // namespace arc::foundation
