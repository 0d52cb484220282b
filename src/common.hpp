#pragma once

#include <chrono>
#include <optional>
#include <string>

using TimePoint = std::chrono::system_clock::time_point;

enum TaskPriority { HIGH = 0, MEDIUM = 1, LOW = 2 };

enum ScreenState {
    WELCOME = 1,
    ACTIVE = 2,
    TRANSITION = 3,
    SINGLE_TASK_DONE = 4,
    ALL_DONE_WAS_LOCKED = 5,
    ALL_DONE_NOT_LOCKED = 6,
    EMPTY_AT_ENTRY = 7,
    SESSION_SUMMARY = 8
};

enum NoticeLevel { NOTICE_INFO, NOTICE_SUCCESS, NOTICE_WARNING, NOTICE_ERROR };

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

struct Task {
    std::string id;
    std::string title;
    TaskPriority priority = MEDIUM;
    std::optional<TimePoint> dueDate;
    bool completed = false;
    std::optional<TimePoint> snoozedUntil;
    TimePoint createdAt{};
    bool hidden = false;
};

// Partial update requested through onTaskMutate; unset fields stay untouched.
struct TaskPatch {
    std::optional<bool> completed;
    std::optional<TimePoint> dueDate;
    std::optional<TimePoint> snoozedUntil;
};

const char *ScreenName(ScreenState screen);
const char *PriorityName(TaskPriority priority);
TaskPriority PriorityFromString(const std::string &name);
void ApplyTaskPatch(Task &task, const TaskPatch &patch);
double ToUnixTime(TimePoint tp);
TimePoint FromUnixTime(double seconds);
