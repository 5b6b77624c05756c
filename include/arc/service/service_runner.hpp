#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for executable entry points.
///
/// Provides signal handling, configuration loading and CLI argument
/// parsing for the arcstaff executables.

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

#include "arc/foundation/config_manager.hpp"
#include "arc/foundation/game_result.hpp"

namespace arc::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic).
///
/// The destructor restores the default handlers so that a second signal
/// terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Load a YAML configuration file into the provided ConfigManager.
///
/// The config file path is resolved in order:
///   1. ARC_CONFIG_PATH environment variable (if set)
///   2. @p defaultPath parameter
///
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] arc::foundation::GameResult<void>
loadConfig(arc::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

/// Parse `<flag> <unsigned integer>` from command-line arguments.
///
/// @return The value, or nullopt when the flag is absent or malformed.
[[nodiscard]] std::optional<uint64_t>
parseUintArg(int argc, char* argv[], std::string_view flag);

/// True when @p flag appears anywhere in the arguments.
[[nodiscard]] bool hasFlag(int argc, char* argv[], std::string_view flag);

} // namespace arc::service
