#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common.hpp"

enum NavResult { NAV_MOVED, NAV_AT_START, NAV_AT_END, NAV_EMPTY };

// Filtered, sorted view over the host's live task list plus a cursor into it.
class TaskNavigator {
  public:
    using MoveCallback = std::function<void(const Task &task)>;
    using EmptyCallback = std::function<void()>;

    void SetTasks(const std::vector<Task> &tasks, TimePoint now);

    NavResult Advance();
    NavResult Retreat();
    bool Select(const std::string &taskId);

    const Task *CurrentTask() const;
    std::optional<std::size_t> Cursor() const;
    const std::vector<Task> &Queue() const;
    std::size_t Size() const;
    bool Empty() const;

    void SetOnMoved(MoveCallback callback);
    void SetOnEmpty(EmptyCallback callback);

    static bool IsEligible(const Task &task, TimePoint now);
    static bool Before(const Task &a, const Task &b);

  private:
    std::vector<Task> m_Queue;
    std::optional<std::size_t> m_Cursor;
    std::string m_SelectedId;

    MoveCallback m_OnMoved;
    EmptyCallback m_OnEmpty;
};
