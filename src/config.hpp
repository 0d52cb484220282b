#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "common.hpp"
#include "shortcuts.hpp"

struct GatewayConfig {
    std::string kind = "sqlite"; // sqlite | http
    std::string dbPath;          // empty: $XDG_DATA_HOME/flowlock/data.sqlite
    std::string baseUrl;
    std::string token; // empty: looked up in the keyring
    int timeoutSeconds = 10;
};

struct Config {
    unsigned port = 7078;
    LogLevel logLevel = LOG_INFO;
    std::string userId = "local";
    std::string tasksFile;
    Platform platform = ShortcutDispatcher::DetectPlatform();

    GatewayConfig gateway;

    int transitionSeconds = 3;
    int snoozeHours = 2;
    int autoExitSeconds = 3; // 0 disables the countdown
    bool confirmExit = false;
    std::optional<std::string> background;

    int pomodoroFocusMinutes = 25;
    int pomodoroBreakMinutes = 5;
    bool pomodoroAutoStartBreaks = true;

    int recorderMaxAttempts = 3;
    int recorderBackoffMs = 1000;

    bool notifications = true;
};

// Missing or malformed files yield the defaults; bad fields keep their default.
Config LoadConfig(const std::filesystem::path &path);
LogLevel LogLevelFromString(const std::string &name, LogLevel fallback);

std::filesystem::path GetConfigPath();
std::filesystem::path GetDataPath();
