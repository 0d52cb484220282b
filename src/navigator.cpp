#include "navigator.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
bool TaskNavigator::IsEligible(const Task &task, TimePoint now) {
    if (task.completed || task.hidden) {
        return false;
    }
    if (task.snoozedUntil && *task.snoozedUntil > now) {
        return false;
    }
    return true;
}

// ─────────────────────────────────────
bool TaskNavigator::Before(const Task &a, const Task &b) {
    if (a.priority != b.priority) {
        return a.priority < b.priority;
    }
    // Undated tasks sort after every dated one
    if (a.dueDate.has_value() != b.dueDate.has_value()) {
        return a.dueDate.has_value();
    }
    if (a.dueDate && *a.dueDate != *b.dueDate) {
        return *a.dueDate < *b.dueDate;
    }
    if (a.createdAt != b.createdAt) {
        return a.createdAt < b.createdAt;
    }
    return a.id < b.id;
}

// ─────────────────────────────────────
void TaskNavigator::SetTasks(const std::vector<Task> &tasks, TimePoint now) {
    const bool wasEmpty = m_Queue.empty();
    const std::optional<std::size_t> oldCursor = m_Cursor;

    m_Queue.clear();
    for (const auto &task : tasks) {
        if (IsEligible(task, now)) {
            m_Queue.push_back(task);
        }
    }
    std::sort(m_Queue.begin(), m_Queue.end(), Before);

    if (m_Queue.empty()) {
        m_Cursor.reset();
        m_SelectedId.clear();
        spdlog::debug("Navigator: queue is empty");
        if (!wasEmpty && m_OnEmpty) {
            m_OnEmpty();
        }
        return;
    }

    auto it = std::find_if(m_Queue.begin(), m_Queue.end(),
                           [&](const Task &t) { return t.id == m_SelectedId; });
    if (!m_SelectedId.empty() && it != m_Queue.end()) {
        m_Cursor = static_cast<std::size_t>(it - m_Queue.begin());
    } else if (oldCursor) {
        m_Cursor = std::min(*oldCursor, m_Queue.size() - 1);
        spdlog::debug("Navigator: task '{}' left the queue, cursor clamped to {}", m_SelectedId,
                      *m_Cursor);
    } else {
        m_Cursor = 0;
    }
    m_SelectedId = m_Queue[*m_Cursor].id;
    spdlog::debug("Navigator: {} tasks queued, cursor at {}", m_Queue.size(), *m_Cursor);
}

// ─────────────────────────────────────
NavResult TaskNavigator::Advance() {
    if (!m_Cursor) {
        return NAV_EMPTY;
    }
    if (*m_Cursor + 1 >= m_Queue.size()) {
        return NAV_AT_END;
    }
    m_Cursor = *m_Cursor + 1;
    m_SelectedId = m_Queue[*m_Cursor].id;
    if (m_OnMoved) {
        m_OnMoved(m_Queue[*m_Cursor]);
    }
    return NAV_MOVED;
}

// ─────────────────────────────────────
NavResult TaskNavigator::Retreat() {
    if (!m_Cursor) {
        return NAV_EMPTY;
    }
    if (*m_Cursor == 0) {
        return NAV_AT_START;
    }
    m_Cursor = *m_Cursor - 1;
    m_SelectedId = m_Queue[*m_Cursor].id;
    if (m_OnMoved) {
        m_OnMoved(m_Queue[*m_Cursor]);
    }
    return NAV_MOVED;
}

// ─────────────────────────────────────
bool TaskNavigator::Select(const std::string &taskId) {
    auto it = std::find_if(m_Queue.begin(), m_Queue.end(),
                           [&](const Task &t) { return t.id == taskId; });
    if (it == m_Queue.end()) {
        spdlog::warn("Navigator: cannot select unknown task '{}'", taskId);
        return false;
    }
    m_Cursor = static_cast<std::size_t>(it - m_Queue.begin());
    m_SelectedId = taskId;
    return true;
}

// ─────────────────────────────────────
const Task *TaskNavigator::CurrentTask() const {
    if (!m_Cursor) {
        return nullptr;
    }
    return &m_Queue[*m_Cursor];
}

// ─────────────────────────────────────
std::optional<std::size_t> TaskNavigator::Cursor() const {
    return m_Cursor;
}

// ─────────────────────────────────────
const std::vector<Task> &TaskNavigator::Queue() const {
    return m_Queue;
}

// ─────────────────────────────────────
std::size_t TaskNavigator::Size() const {
    return m_Queue.size();
}

// ─────────────────────────────────────
bool TaskNavigator::Empty() const {
    return m_Queue.empty();
}

// ─────────────────────────────────────
void TaskNavigator::SetOnMoved(MoveCallback callback) {
    m_OnMoved = std::move(callback);
}

// ─────────────────────────────────────
void TaskNavigator::SetOnEmpty(EmptyCallback callback) {
    m_OnEmpty = std::move(callback);
}
