#include "common.hpp"

#include <strings.h>

// ─────────────────────────────────────
const char *ScreenName(ScreenState screen) {
    switch (screen) {
    case WELCOME:
        return "welcome";
    case ACTIVE:
        return "active";
    case TRANSITION:
        return "transition";
    case SINGLE_TASK_DONE:
        return "single_task_done";
    case ALL_DONE_WAS_LOCKED:
        return "all_done_was_locked";
    case ALL_DONE_NOT_LOCKED:
        return "all_done_not_locked";
    case EMPTY_AT_ENTRY:
        return "empty_at_entry";
    case SESSION_SUMMARY:
        return "session_summary";
    }
    return "unknown";
}

// ─────────────────────────────────────
const char *PriorityName(TaskPriority priority) {
    switch (priority) {
    case HIGH:
        return "high";
    case MEDIUM:
        return "medium";
    case LOW:
        return "low";
    }
    return "medium";
}

// ─────────────────────────────────────
TaskPriority PriorityFromString(const std::string &name) {
    if (strcasecmp(name.c_str(), "high") == 0) return HIGH;
    if (strcasecmp(name.c_str(), "low") == 0) return LOW;
    return MEDIUM;
}

// ─────────────────────────────────────
void ApplyTaskPatch(Task &task, const TaskPatch &patch) {
    if (patch.completed) task.completed = *patch.completed;
    if (patch.dueDate) task.dueDate = *patch.dueDate;
    if (patch.snoozedUntil) task.snoozedUntil = *patch.snoozedUntil;
}

// ─────────────────────────────────────
double ToUnixTime(TimePoint tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

// ─────────────────────────────────────
TimePoint FromUnixTime(double seconds) {
    auto d = std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::duration<double>(seconds));
    return TimePoint(d);
}
