#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common.hpp"
#include "gateway.hpp"

class JsonParse {
  public:
    int GetInt(const nlohmann::json &j, const std::string &key, int fallback);
    bool GetBool(const nlohmann::json &j, const std::string &key, bool fallback);
    std::string GetString(const nlohmann::json &j, const std::string &key,
                          const std::string &fallback);
    std::optional<TimePoint> GetTime(const nlohmann::json &j, const std::string &key);
    std::vector<std::string> JsonArray2String(const nlohmann::json &arr);

    // Tasks as exchanged with the host: times are unix seconds, priority is a name.
    std::optional<Task> ParseTask(const nlohmann::json &j);
    std::vector<Task> ParseTasks(const nlohmann::json &arr);
    nlohmann::json TaskToJson(const Task &task);

    std::optional<FocusSessionRecord> ParseRecord(const nlohmann::json &j);
    nlohmann::json RecordToJson(const FocusSessionRecord &record);
};
