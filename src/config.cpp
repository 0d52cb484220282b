#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "json.hpp"

namespace {
std::filesystem::path XdgDir(const char *var, const std::filesystem::path &homeFallback) {
    const char *xdg = std::getenv(var);
    if (xdg && *xdg) {
        return xdg;
    }
    const char *home = std::getenv("HOME");
    if (!home || !*home) {
        throw std::runtime_error("HOME environment variable not set");
    }
    return std::filesystem::path(home) / homeFallback;
}
} // namespace

// ─────────────────────────────────────
LogLevel LogLevelFromString(const std::string &name, LogLevel fallback) {
    if (name == "debug") {
        return LOG_DEBUG;
    }
    if (name == "info") {
        return LOG_INFO;
    }
    if (name == "off") {
        return LOG_OFF;
    }
    spdlog::warn("Config: unknown log level '{}'", name);
    return fallback;
}

// ─────────────────────────────────────
Config LoadConfig(const std::filesystem::path &path) {
    Config config;

    std::ifstream file(path);
    if (!file) {
        spdlog::info("Config: {} not found, using defaults", path.string());
        return config;
    }

    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("Config: {} is not a JSON object, using defaults", path.string());
        return config;
    }

    JsonParse parse;
    const int port = parse.GetInt(j, "port", static_cast<int>(config.port));
    if (port >= 0 && port <= 65535) {
        config.port = static_cast<unsigned>(port);
    } else {
        spdlog::warn("Config: port {} out of range, using {}", port, config.port);
    }
    config.logLevel = LogLevelFromString(parse.GetString(j, "log_level", "info"), config.logLevel);
    config.userId = parse.GetString(j, "user_id", config.userId);
    config.tasksFile = parse.GetString(j, "tasks_file", config.tasksFile);
    config.notifications = parse.GetBool(j, "notifications", config.notifications);

    const std::string platform = parse.GetString(j, "platform", "auto");
    if (platform == "mac") {
        config.platform = PLATFORM_MAC;
    } else if (platform == "other") {
        config.platform = PLATFORM_OTHER;
    }

    if (j.contains("gateway")) {
        const auto &g = j["gateway"];
        config.gateway.kind = parse.GetString(g, "kind", config.gateway.kind);
        config.gateway.dbPath = parse.GetString(g, "db_path", config.gateway.dbPath);
        config.gateway.baseUrl = parse.GetString(g, "base_url", config.gateway.baseUrl);
        config.gateway.token = parse.GetString(g, "token", config.gateway.token);
        config.gateway.timeoutSeconds =
            parse.GetInt(g, "timeout_seconds", config.gateway.timeoutSeconds);
        if (config.gateway.kind != "sqlite" && config.gateway.kind != "http") {
            spdlog::warn("Config: unknown gateway kind '{}', using sqlite", config.gateway.kind);
            config.gateway.kind = "sqlite";
        }
    }

    if (j.contains("session")) {
        const auto &s = j["session"];
        config.transitionSeconds = parse.GetInt(s, "transition_seconds", config.transitionSeconds);
        config.snoozeHours = parse.GetInt(s, "snooze_hours", config.snoozeHours);
        config.autoExitSeconds = parse.GetInt(s, "auto_exit_seconds", config.autoExitSeconds);
        config.confirmExit = parse.GetBool(s, "confirm_exit", config.confirmExit);
        const std::string background = parse.GetString(s, "background", "");
        if (!background.empty()) {
            config.background = background;
        }
    }

    if (j.contains("pomodoro")) {
        const auto &p = j["pomodoro"];
        config.pomodoroFocusMinutes = parse.GetInt(p, "focus_minutes", config.pomodoroFocusMinutes);
        config.pomodoroBreakMinutes = parse.GetInt(p, "break_minutes", config.pomodoroBreakMinutes);
        config.pomodoroAutoStartBreaks =
            parse.GetBool(p, "auto_start_breaks", config.pomodoroAutoStartBreaks);
    }

    if (j.contains("recorder")) {
        const auto &r = j["recorder"];
        config.recorderMaxAttempts = parse.GetInt(r, "max_attempts", config.recorderMaxAttempts);
        config.recorderBackoffMs = parse.GetInt(r, "retry_backoff_ms", config.recorderBackoffMs);
    }

    // Negative durations make no sense anywhere below.
    if (config.transitionSeconds < 0) config.transitionSeconds = 3;
    if (config.snoozeHours < 0) config.snoozeHours = 2;
    if (config.autoExitSeconds < 0) config.autoExitSeconds = 0;
    if (config.pomodoroFocusMinutes < 1) config.pomodoroFocusMinutes = 25;
    if (config.pomodoroBreakMinutes < 1) config.pomodoroBreakMinutes = 5;
    if (config.recorderMaxAttempts < 1) config.recorderMaxAttempts = 1;
    if (config.recorderBackoffMs < 0) config.recorderBackoffMs = 0;

    spdlog::debug("Config: loaded {}", path.string());
    return config;
}

// ─────────────────────────────────────
std::filesystem::path GetConfigPath() {
    return XdgDir("XDG_CONFIG_HOME", ".config") / "flowlock" / "config.json";
}

// ─────────────────────────────────────
std::filesystem::path GetDataPath() {
    std::filesystem::path dbPath =
        XdgDir("XDG_DATA_HOME", std::filesystem::path(".local") / "share") / "flowlock" /
        "data.sqlite";
    std::error_code ec;
    std::filesystem::create_directories(dbPath.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("cannot create " + dbPath.parent_path().string() + ": " +
                                 ec.message());
    }
    return dbPath;
}
