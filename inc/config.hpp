#pragma once
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

#include "retry.hpp"

namespace NWorkspace {

    struct TAppConfig {
        std::filesystem::path DataDir = "workspace-data";
        std::filesystem::path RemoteDir = "workspace-remote";
        std::string LogLevel = "info";
        std::optional<std::filesystem::path> LogFile;
        // Name the workspace list is published under on the remote; empty keeps it local.
        std::string Account;
        TRetryPolicy Retry;
    };

    // Reads the command line and, when --config names one, a key=value file.
    // Command-line values win. Returns nullopt after printing help to `out`.
    std::optional<TAppConfig> ParseConfig(int argc, const char* const argv[], std::ostream& out);

    // Console sink on stderr plus an optional file sink, installed as the default logger.
    void SetupLogging(const TAppConfig& config);

} // namespace NWorkspace
