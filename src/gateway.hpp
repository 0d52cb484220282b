#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common.hpp"

struct SessionOpenRequest {
    std::string userId;
    std::optional<std::string> taskId;
    std::optional<std::string> intention;
    std::optional<std::string> background;
    TimePoint startTime{};
};

struct SessionCloseRequest {
    std::string sessionId;
    TimePoint endTime{};
    int durationMinutes = 0;
    std::vector<std::string> notes;
    int pomodoroCount = 0;
};

struct FocusSessionRecord {
    std::string id;
    std::string userId;
    std::optional<std::string> taskId;
    TimePoint startTime{};
    std::optional<TimePoint> endTime;
    int durationMinutes = 0;
    std::optional<std::string> intention;
    std::vector<std::string> notes;
    int pomodoroCount = 0;
    std::optional<std::string> background;
};

class GatewayError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Store for focus session records. Calls block; the SessionRecorder keeps them off the
// engine thread. Failures are reported by throwing GatewayError.
class PersistenceGateway {
  public:
    virtual ~PersistenceGateway() = default;

    virtual std::string CreateSession(const SessionOpenRequest &request) = 0;
    virtual void EndSession(const SessionCloseRequest &request) = 0;
    // Read-back used to verify writes; nullopt when the record does not exist.
    virtual std::optional<FocusSessionRecord> FetchSession(const std::string &sessionId) = 0;
    virtual std::vector<FocusSessionRecord> ListSessions(const std::string &userId, int limit) = 0;
};
