#include "json.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
int JsonParse::GetInt(const nlohmann::json &j, const std::string &key, int fallback) {
    if (!j.is_object() || !j.contains(key)) {
        return fallback;
    }
    if (j.at(key).is_number_integer()) {
        return j.at(key).get<int>();
    }
    if (j.at(key).is_number()) {
        return static_cast<int>(j.at(key).get<double>());
    }
    spdlog::warn("JsonParse: Key '{}' is not a number, using fallback {}", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
bool JsonParse::GetBool(const nlohmann::json &j, const std::string &key, bool fallback) {
    if (!j.is_object() || !j.contains(key)) {
        return fallback;
    }
    if (j.at(key).is_boolean()) {
        return j.at(key).get<bool>();
    }
    spdlog::warn("JsonParse: Key '{}' is not a boolean, using fallback {}", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
std::string JsonParse::GetString(const nlohmann::json &j, const std::string &key,
                                 const std::string &fallback) {
    if (!j.is_object() || !j.contains(key)) {
        return fallback;
    }
    if (j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    spdlog::warn("JsonParse: Key '{}' is not a string, using fallback '{}'", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
std::optional<TimePoint> JsonParse::GetTime(const nlohmann::json &j, const std::string &key) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    if (!j.at(key).is_number()) {
        spdlog::warn("JsonParse: Key '{}' is not a unix timestamp, ignoring", key);
        return std::nullopt;
    }
    return FromUnixTime(j.at(key).get<double>());
}

// ─────────────────────────────────────
std::vector<std::string> JsonParse::JsonArray2String(const nlohmann::json &arr) {
    std::vector<std::string> out;
    if (!arr.is_array()) {
        spdlog::warn("JsonParse: Expected array, got {}", arr.type_name());
        return out;
    }
    for (const auto &v : arr) {
        if (v.is_string()) {
            out.push_back(v.get<std::string>());
        } else {
            spdlog::warn("JsonParse: Array element is not string, skipping");
        }
    }
    return out;
}

// ─────────────────────────────────────
std::optional<Task> JsonParse::ParseTask(const nlohmann::json &j) {
    if (!j.is_object()) {
        spdlog::warn("JsonParse: Task entry is not an object, skipping");
        return std::nullopt;
    }

    Task task;
    task.id = GetString(j, "id", "");
    if (task.id.empty()) {
        spdlog::warn("JsonParse: Task without id, skipping");
        return std::nullopt;
    }
    task.title = GetString(j, "title", "");
    task.priority = PriorityFromString(GetString(j, "priority", "medium"));
    task.dueDate = GetTime(j, "due");
    task.completed = GetBool(j, "completed", false);
    task.snoozedUntil = GetTime(j, "snoozed_until");
    task.createdAt = GetTime(j, "created_at").value_or(TimePoint{});
    task.hidden = GetBool(j, "hidden", false);
    return task;
}

// ─────────────────────────────────────
std::vector<Task> JsonParse::ParseTasks(const nlohmann::json &arr) {
    std::vector<Task> tasks;
    if (!arr.is_array()) {
        spdlog::warn("JsonParse: Expected task array, got {}", arr.type_name());
        return tasks;
    }
    tasks.reserve(arr.size());
    for (const auto &entry : arr) {
        if (auto task = ParseTask(entry)) {
            tasks.push_back(std::move(*task));
        }
    }
    spdlog::debug("JsonParse: Parsed {} tasks", tasks.size());
    return tasks;
}

// ─────────────────────────────────────
nlohmann::json JsonParse::TaskToJson(const Task &task) {
    nlohmann::json j = {
        {"id", task.id},
        {"title", task.title},
        {"priority", PriorityName(task.priority)},
        {"completed", task.completed},
        {"created_at", ToUnixTime(task.createdAt)},
        {"hidden", task.hidden},
    };
    j["due"] = task.dueDate ? nlohmann::json(ToUnixTime(*task.dueDate)) : nlohmann::json();
    j["snoozed_until"] =
        task.snoozedUntil ? nlohmann::json(ToUnixTime(*task.snoozedUntil)) : nlohmann::json();
    return j;
}

// ─────────────────────────────────────
std::optional<FocusSessionRecord> JsonParse::ParseRecord(const nlohmann::json &j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    FocusSessionRecord record;
    record.id = GetString(j, "id", "");
    if (record.id.empty()) {
        spdlog::warn("JsonParse: Session record without id");
        return std::nullopt;
    }
    auto optionalString = [&](const char *key) -> std::optional<std::string> {
        if (!j.contains(key) || !j.at(key).is_string()) {
            return std::nullopt;
        }
        return j.at(key).get<std::string>();
    };
    record.userId = GetString(j, "user_id", "");
    record.taskId = optionalString("task_id");
    record.startTime = GetTime(j, "start_time").value_or(TimePoint{});
    record.endTime = GetTime(j, "end_time");
    record.durationMinutes = GetInt(j, "duration", 0);
    record.intention = optionalString("intention");
    if (j.contains("notes")) {
        record.notes = JsonArray2String(j.at("notes"));
    }
    record.pomodoroCount = GetInt(j, "pomodoro_count", 0);
    record.background = optionalString("background");
    return record;
}

// ─────────────────────────────────────
nlohmann::json JsonParse::RecordToJson(const FocusSessionRecord &record) {
    auto orNull = [](const std::optional<std::string> &v) {
        return v ? nlohmann::json(*v) : nlohmann::json();
    };
    return {
        {"id", record.id},
        {"user_id", record.userId},
        {"task_id", orNull(record.taskId)},
        {"start_time", ToUnixTime(record.startTime)},
        {"end_time", record.endTime ? nlohmann::json(ToUnixTime(*record.endTime))
                                    : nlohmann::json()},
        {"duration", record.durationMinutes},
        {"intention", orNull(record.intention)},
        {"notes", record.notes},
        {"pomodoro_count", record.pomodoroCount},
        {"background", orNull(record.background)},
    };
}
