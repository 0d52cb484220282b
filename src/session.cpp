#include "session.hpp"

#include <algorithm>
#include <iterator>

#include <spdlog/spdlog.h>

namespace {
ShortcutBinding Bind(std::string id, std::string description, ShortcutCategory category,
                     std::vector<std::string> macKeys, std::vector<std::string> otherKeys,
                     int priority, bool allowInModal, std::function<void()> action) {
    ShortcutBinding binding;
    binding.id = std::move(id);
    binding.description = std::move(description);
    binding.category = category;
    binding.macKeys = std::move(macKeys);
    binding.otherKeys = std::move(otherKeys);
    binding.priority = priority;
    binding.allowInModal = allowInModal;
    binding.action = std::move(action);
    return binding;
}

std::string Trim(const std::string &s) {
    const char *ws = " \t\r\n";
    const auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}
} // namespace

// ─────────────────────────────────────
SessionController::SessionController(EventLoop &loop, SessionRecorder &recorder,
                                     SessionOptions options, SessionHooks hooks)
    : m_Loop(loop), m_Recorder(recorder), m_Options(std::move(options)),
      m_Hooks(std::move(hooks)), m_Dispatcher(m_Options.platform),
      m_Pomodoro(loop, m_Options.pomodoroFocus, m_Options.pomodoroBreak,
                 m_Options.autoStartBreaks),
      m_Alive(std::make_shared<bool>(true)) {

    m_Lock.SetOnChanged([this](bool locked, LockReason reason) {
        if (reason == LOCK_AUTO) {
            Notice(NOTICE_INFO, "Focus Lock auto-unlocked", "Nothing left to focus on");
        } else {
            Notice(NOTICE_INFO, locked ? "Focus Lock on" : "Focus Lock off");
        }
        if (m_Hooks.onLockChanged) {
            m_Hooks.onLockChanged(locked);
        }
    });

    m_Navigator.SetOnMoved([this](const Task &task) {
        if (m_Screen == ACTIVE && m_Hooks.onTransition) {
            m_Hooks.onTransition(task);
        }
    });
    m_Navigator.SetOnEmpty([this] { OnQueueEmptied(); });

    m_Dispatcher.SetOnError([this](const ShortcutBinding &binding, const std::string &what) {
        Notice(NOTICE_ERROR, "Shortcut failed", binding.id + ": " + what);
    });

    m_Pomodoro.SetOnFocusDone([this](int count) {
        m_PomodoroCount = count;
        Notice(NOTICE_SUCCESS, "Pomodoro complete", "Time for a short break");
    });

    RebuildBindings();
    spdlog::debug("Session: controller ready for user '{}'", m_Options.userId);
}

// ─────────────────────────────────────
SessionController::~SessionController() {
    CancelTimer(m_TransitionTimer);
    CancelTimer(m_AutoExitTimer);
    CancelTimer(m_ExitIntentTimer);
    *m_Alive = false;
}

// ─────────────────────────────────────
TimePoint SessionController::Now() const {
    return m_Options.wallClock ? m_Options.wallClock() : std::chrono::system_clock::now();
}

// ─────────────────────────────────────
void SessionController::Notice(NoticeLevel level, const std::string &title,
                               const std::string &detail) {
    switch (level) {
    case NOTICE_ERROR:
        spdlog::error("Session: {} {}", title, detail);
        break;
    case NOTICE_WARNING:
        spdlog::warn("Session: {} {}", title, detail);
        break;
    default:
        spdlog::info("Session: {} {}", title, detail);
        break;
    }
    if (m_Hooks.onNotice) {
        m_Hooks.onNotice(level, title, detail);
    }
}

// ─────────────────────────────────────
void SessionController::CancelTimer(EventLoop::TimerId &id) {
    if (id != 0) {
        m_Loop.Cancel(id);
        id = 0;
    }
}

// ─────────────────────────────────────
bool SessionController::InSnapshot(const std::string &taskId) const {
    return std::find(m_SnapshotIds.begin(), m_SnapshotIds.end(), taskId) != m_SnapshotIds.end();
}

// ─────────────────────────────────────
bool SessionController::FinishedHere(const std::string &taskId) const {
    return std::find(m_FinishedIds.begin(), m_FinishedIds.end(), taskId) != m_FinishedIds.end();
}

// ─────────────────────────────────────
bool SessionController::IsSessionScreen() const {
    return m_Screen != WELCOME && m_Screen != SESSION_SUMMARY && !m_Retired;
}

// ─────────────────────────────────────
void SessionController::MutateTask(const std::string &taskId, const TaskPatch &patch) {
    if (m_Hooks.onTaskMutate) {
        m_Hooks.onTaskMutate(taskId, patch);
    } else {
        spdlog::warn("Session: no task store attached, change to '{}' is lost", taskId);
    }
}

// ─────────────────────────────────────
void SessionController::EnterScreen(ScreenState screen) {
    const ScreenState previous = m_Screen;
    if (previous == TRANSITION && screen != TRANSITION) {
        CancelTimer(m_TransitionTimer);
    }
    if (previous == ALL_DONE_NOT_LOCKED && screen != ALL_DONE_NOT_LOCKED) {
        CancelTimer(m_AutoExitTimer);
    }
    ResetExitIntent();

    m_Screen = screen;
    spdlog::info("Session: {} -> {}", ScreenName(previous), ScreenName(screen));

    if (screen == TRANSITION) {
        CancelTimer(m_TransitionTimer);
        m_TransitionTimer = m_Loop.Schedule(m_Options.transitionDelay, [this] {
            m_TransitionTimer = 0;
            if (m_Screen != TRANSITION) {
                return;
            }
            if (m_Navigator.Empty()) {
                EnterAllDone();
            } else {
                EnterScreen(ACTIVE);
            }
        });
    }

    if (screen == ALL_DONE_NOT_LOCKED && m_Options.autoExitDelay.count() > 0) {
        CancelTimer(m_AutoExitTimer);
        m_AutoExitTimer = m_Loop.Schedule(m_Options.autoExitDelay, [this] {
            m_AutoExitTimer = 0;
            if (m_Screen == ALL_DONE_NOT_LOCKED) {
                spdlog::info("Session: auto-exit countdown elapsed");
                End();
            }
        });
    }

    RebuildBindings();
    if (m_Hooks.onScreenChanged) {
        m_Hooks.onScreenChanged(screen);
    }
}

// ─────────────────────────────────────
void SessionController::EnterAllDone() {
    const bool wasLocked = m_Lock.IsLocked();
    if (wasLocked) {
        // The lock must read false before the all-done screen is observable.
        m_Lock.Disable(LOCK_AUTO);
    }
    EnterScreen(wasLocked ? ALL_DONE_WAS_LOCKED : ALL_DONE_NOT_LOCKED);
}

// ─────────────────────────────────────
void SessionController::OnQueueEmptied() {
    if (m_Screen != ACTIVE && m_Screen != TRANSITION) {
        return;
    }
    spdlog::info("Session: queue ran out while {}", ScreenName(m_Screen));
    EnterAllDone();
}

// ─────────────────────────────────────
void SessionController::SetLiveTasks(const std::vector<Task> &tasks) {
    if (m_Retired) {
        return;
    }
    m_Navigator.SetTasks(tasks, Now());
}

// ─────────────────────────────────────
bool SessionController::SelectTask(const std::string &taskId) {
    if (m_Screen != WELCOME) {
        spdlog::debug("Session: task selection ignored on {}", ScreenName(m_Screen));
        return false;
    }
    return m_Navigator.Select(taskId);
}

// ─────────────────────────────────────
void SessionController::Start(std::optional<std::string> intention,
                              std::optional<std::string> background) {
    if (m_Screen != WELCOME || m_Retired) {
        spdlog::debug("Session: start ignored on {}", ScreenName(m_Screen));
        return;
    }

    if (m_Navigator.Empty()) {
        // Nothing to focus on: no record is created, and a lock must not trap the user.
        if (m_Lock.IsLocked()) {
            m_Lock.Disable(LOCK_AUTO);
        }
        EnterScreen(EMPTY_AT_ENTRY);
        return;
    }

    m_SnapshotIds.clear();
    for (const auto &task : m_Navigator.Queue()) {
        m_SnapshotIds.push_back(task.id);
    }
    m_CompletedIds.clear();
    m_FinishedIds.clear();
    m_StartTime = Now();
    m_Intention = intention;

    SessionOpenRequest request;
    request.userId = m_Options.userId;
    if (const Task *task = m_Navigator.CurrentTask()) {
        request.taskId = task->id;
    }
    request.intention = std::move(intention);
    request.background = background ? std::move(background) : m_Options.background;
    request.startTime = *m_StartTime;

    m_RecordOpened = true;
    m_OpenState = PERSIST_PENDING;
    std::weak_ptr<bool> alive = m_Alive;
    m_Recorder.Open(std::move(request), [this, alive](const RecorderOutcome &outcome) {
        if (alive.expired()) {
            return;
        }
        if (outcome.ok) {
            m_OpenState = PERSIST_SAVED;
            m_SessionId = outcome.sessionId;
        } else {
            m_OpenState = PERSIST_FAILED;
            Notice(NOTICE_WARNING, "Focus session not saved", outcome.error);
        }
    });

    spdlog::info("Session: started with {} tasks", m_SnapshotIds.size());
    EnterScreen(ACTIVE);
}

// ─────────────────────────────────────
void SessionController::Complete() {
    if (m_Screen != ACTIVE) {
        return;
    }
    const Task *task = m_Navigator.CurrentTask();
    if (!task) {
        Notice(NOTICE_INFO, "No task to complete");
        return;
    }
    const std::string taskId = task->id;
    const std::string title = task->title;

    if (!FinishedHere(taskId)) {
        m_FinishedIds.push_back(taskId);
    }
    if (InSnapshot(taskId) &&
        std::find(m_CompletedIds.begin(), m_CompletedIds.end(), taskId) == m_CompletedIds.end()) {
        m_CompletedIds.push_back(taskId);
    } else if (!InSnapshot(taskId)) {
        spdlog::debug("Session: '{}' joined after start, not counted", taskId);
    }

    Notice(NOTICE_SUCCESS, "Task completed", title);
    if (m_CompletedIds.size() == m_SnapshotIds.size()) {
        EnterAllDone();
    } else {
        EnterScreen(SINGLE_TASK_DONE);
    }

    TaskPatch patch;
    patch.completed = true;
    MutateTask(taskId, patch);
}

// ─────────────────────────────────────
void SessionController::ShowTransition(bool moved) {
    if (!moved && m_Hooks.onTransition) {
        if (const Task *task = m_Navigator.CurrentTask()) {
            m_Hooks.onTransition(*task);
        }
    }
    EnterScreen(TRANSITION);
}

// ─────────────────────────────────────
void SessionController::Next() {
    if (m_Screen != ACTIVE) {
        return;
    }
    switch (m_Navigator.Advance()) {
    case NAV_MOVED:
        ShowTransition(true);
        break;
    case NAV_AT_END:
        Notice(NOTICE_INFO, "Already at the last task");
        break;
    case NAV_AT_START:
    case NAV_EMPTY:
        Notice(NOTICE_INFO, "No tasks in the queue");
        break;
    }
}

// ─────────────────────────────────────
void SessionController::Previous() {
    if (m_Screen != ACTIVE) {
        return;
    }
    switch (m_Navigator.Retreat()) {
    case NAV_MOVED:
        ShowTransition(true);
        break;
    case NAV_AT_START:
        Notice(NOTICE_INFO, "Already at the first task");
        break;
    case NAV_AT_END:
    case NAV_EMPTY:
        Notice(NOTICE_INFO, "No tasks in the queue");
        break;
    }
}

// ─────────────────────────────────────
void SessionController::Snooze() {
    if (m_Screen != ACTIVE) {
        return;
    }
    const Task *task = m_Navigator.CurrentTask();
    if (!task) {
        Notice(NOTICE_INFO, "No task to snooze");
        return;
    }
    const std::string taskId = task->id;
    const std::string title = task->title;

    TaskPatch patch;
    patch.snoozedUntil = Now() + m_Options.snoozeFor;

    // Move first so a synchronous list refresh does not shift the cursor twice.
    const bool moved = m_Navigator.Advance() == NAV_MOVED;
    Notice(NOTICE_INFO, "Task snoozed", title);
    ShowTransition(moved);
    MutateTask(taskId, patch);
}

// ─────────────────────────────────────
void SessionController::Postpone() {
    if (m_Screen != ACTIVE) {
        return;
    }
    const Task *task = m_Navigator.CurrentTask();
    if (!task) {
        Notice(NOTICE_INFO, "No task to postpone");
        return;
    }
    const std::string taskId = task->id;
    const std::string title = task->title;

    TaskPatch patch;
    patch.dueDate = task->dueDate.value_or(Now()) + std::chrono::hours(24);

    const bool moved = m_Navigator.Advance() == NAV_MOVED;
    Notice(NOTICE_INFO, "Task postponed to tomorrow", title);
    ShowTransition(moved);
    MutateTask(taskId, patch);
}

// ─────────────────────────────────────
void SessionController::Continue() {
    if (m_Screen != SINGLE_TASK_DONE) {
        return;
    }
    const Task *current = m_Navigator.CurrentTask();
    if (current && FinishedHere(current->id)) {
        // The list has not caught up with the completion yet; step off the finished task.
        if (m_Navigator.Advance() != NAV_MOVED) {
            m_Navigator.Retreat();
        }
        current = m_Navigator.CurrentTask();
    }
    if (!current || FinishedHere(current->id)) {
        EnterAllDone();
        return;
    }
    EnterScreen(ACTIVE);
}

// ─────────────────────────────────────
bool SessionController::End() {
    if (m_Screen == SESSION_SUMMARY || m_Retired) {
        spdlog::debug("Session: end ignored, session already ended");
        return false;
    }
    if (!m_Lock.IsExitAllowed()) {
        if (m_Screen != SINGLE_TASK_DONE) {
            Notice(NOTICE_ERROR, "Focus Lock is on", "Turn the lock off to leave the session");
            return false;
        }
        // Ending after a finished task is always allowed; the lock is released on the way out.
        m_Lock.Disable(LOCK_AUTO);
    }
    if (m_Options.confirmExit && m_Screen == ACTIVE && !m_ExitArmed) {
        ArmExitIntent();
        return false;
    }

    const TimePoint now = Now();
    m_Pomodoro.Stop();
    CancelTimer(m_TransitionTimer);
    CancelTimer(m_AutoExitTimer);

    int minutes = 0;
    if (m_StartTime) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::minutes>(now - *m_StartTime);
        minutes = std::max(0, static_cast<int>(elapsed.count()));
    }

    m_Summary = SessionSummary{};
    m_Summary.completed = static_cast<int>(m_CompletedIds.size());
    m_Summary.total = static_cast<int>(m_SnapshotIds.size());
    m_Summary.durationMinutes = minutes;
    m_Summary.pomodoroCount = m_PomodoroCount;
    m_Summary.notes = m_Notes;
    m_Summary.persist = PERSIST_NONE;
    m_Summary.durationEstimated = true;

    if (m_RecordOpened && !m_EndIssued) {
        m_EndIssued = true;
        m_Summary.persist = PERSIST_PENDING;

        SessionCloseRequest request;
        request.sessionId = m_SessionId;
        request.endTime = now;
        request.durationMinutes = minutes;
        request.notes = m_Notes;
        request.pomodoroCount = m_PomodoroCount;

        std::weak_ptr<bool> alive = m_Alive;
        m_Recorder.Close(std::move(request), [this, alive](const RecorderOutcome &outcome) {
            if (alive.expired()) {
                return;
            }
            m_Summary.persist = outcome.ok ? PERSIST_SAVED : PERSIST_FAILED;
            m_Summary.durationEstimated = !outcome.ok;
            if (outcome.ok) {
                Notice(NOTICE_SUCCESS, "Focus session saved");
            } else {
                Notice(NOTICE_WARNING, "Focus session end not saved",
                       "Duration is an estimate: " + outcome.error);
            }
        });
    }

    spdlog::info("Session: ended after {} min, {}/{} tasks", minutes, m_Summary.completed,
                 m_Summary.total);
    if (m_Dialog != DIALOG_NONE) {
        CloseDialog();
    }
    m_NotesPanel = false;
    EnterScreen(SESSION_SUMMARY);
    return true;
}

// ─────────────────────────────────────
void SessionController::CloseSummary() {
    if (m_Screen != SESSION_SUMMARY || m_Retired) {
        return;
    }
    m_Retired = true;
    m_Dispatcher.Register({});
    spdlog::info("Session: summary dismissed, handing control back");
    if (m_Hooks.onExitRequested) {
        m_Hooks.onExitRequested();
    }
}

// ─────────────────────────────────────
void SessionController::ArmExitIntent() {
    m_ExitArmed = true;
    CancelTimer(m_ExitIntentTimer);
    m_ExitIntentTimer = m_Loop.Schedule(m_Options.exitIntentWindow, [this] {
        m_ExitIntentTimer = 0;
        m_ExitArmed = false;
        spdlog::debug("Session: exit intent expired");
    });
    Notice(NOTICE_INFO, "Press again to exit");
}

// ─────────────────────────────────────
void SessionController::ResetExitIntent() {
    m_ExitArmed = false;
    CancelTimer(m_ExitIntentTimer);
}

// ─────────────────────────────────────
void SessionController::ToggleLock() {
    if (m_Retired) {
        return;
    }
    m_Lock.Toggle(Now());
    ResetExitIntent();
}

// ─────────────────────────────────────
void SessionController::OpenDialog(DialogKind kind) {
    if (m_Dialog != DIALOG_NONE) {
        m_Dispatcher.PopModal();
    }
    m_Dialog = kind;
    m_Dispatcher.PushModal();
    RebuildBindings();
}

// ─────────────────────────────────────
bool SessionController::CloseDialog() {
    if (m_Dialog == DIALOG_NONE) {
        return false;
    }
    m_Dialog = DIALOG_NONE;
    m_Dispatcher.PopModal();
    RebuildBindings();
    return true;
}

// ─────────────────────────────────────
void SessionController::ToggleShortcutsPanel() {
    if (m_Retired) {
        return;
    }
    if (m_Dialog == DIALOG_SHORTCUTS) {
        CloseDialog();
    } else {
        OpenDialog(DIALOG_SHORTCUTS);
    }
}

// ─────────────────────────────────────
void SessionController::OpenQuickNote() {
    if (m_Retired || m_Screen == SESSION_SUMMARY) {
        return;
    }
    OpenDialog(DIALOG_QUICK_NOTE);
}

// ─────────────────────────────────────
void SessionController::ToggleNotesPanel() {
    if (m_Retired || m_Screen == SESSION_SUMMARY) {
        return;
    }
    m_NotesPanel = !m_NotesPanel;
    RebuildBindings();
}

// ─────────────────────────────────────
bool SessionController::AddNote(const std::string &text) {
    if (m_Retired || m_Screen == SESSION_SUMMARY) {
        return false;
    }
    std::string note = Trim(text);
    if (note.empty()) {
        return false;
    }
    m_Notes.push_back(std::move(note));
    if (m_Dialog == DIALOG_QUICK_NOTE) {
        CloseDialog();
    }
    Notice(NOTICE_SUCCESS, "Note saved");
    return true;
}

// ─────────────────────────────────────
void SessionController::TogglePomodoro() {
    if (!IsSessionScreen() || !m_StartTime) {
        Notice(NOTICE_INFO, "Start a session to use the pomodoro timer");
        return;
    }
    m_Pomodoro.Toggle();
}

// ─────────────────────────────────────
void SessionController::SetExternalModal(bool open) {
    if (open == m_ExternalModal) {
        return;
    }
    m_ExternalModal = open;
    if (open) {
        m_Dispatcher.PushModal();
    } else {
        m_Dispatcher.PopModal();
    }
}

// ─────────────────────────────────────
DispatchResult SessionController::HandleKey(const KeyEvent &event) {
    if (m_Retired) {
        return {};
    }
    return m_Dispatcher.Dispatch(event);
}

// ─────────────────────────────────────
std::vector<ShortcutBinding> SessionController::GlobalBindings(bool withEscape) {
    std::vector<ShortcutBinding> out;
    out.push_back(Bind("show-shortcuts", "Show keyboard shortcuts", CATEGORY_GENERAL,
                       {"meta", "/"}, {"ctrl", "/"}, 95, true,
                       [this] { ToggleShortcutsPanel(); }));
    out.push_back(Bind("toggle-focus-lock", "Toggle Focus Lock", CATEGORY_GENERAL, {"meta", "l"},
                       {"ctrl", "l"}, 90, true, [this] { ToggleLock(); }));
    if (withEscape) {
        // Live behind a modal only while one of our own dialogs is on top; a host modal
        // keeps Escape for itself.
        out.push_back(Bind("escape", "Close dialog or leave the session", CATEGORY_GENERAL,
                           {"escape"}, {"escape"}, 85, m_Dialog != DIALOG_NONE, [this] {
                               if (CloseDialog()) {
                                   return;
                               }
                               if (m_NotesPanel) {
                                   ToggleNotesPanel();
                                   return;
                               }
                               if (m_Dispatcher.IsModalOpen()) {
                                   return;
                               }
                               End();
                           }));
    }
    out.push_back(Bind("quick-note", "Quick note", CATEGORY_GENERAL, {"meta", "ctrl", "n"},
                       {"ctrl", "alt", "n"}, 75, true, [this] { OpenQuickNote(); }));
    return out;
}

// ─────────────────────────────────────
std::vector<ShortcutBinding> SessionController::ScreenBindings() {
    std::vector<ShortcutBinding> out;
    // Single keys would swallow typing while the notes panel has focus.
    const bool plainKeys = !m_NotesPanel;

    switch (m_Screen) {
    case WELCOME:
        if (plainKeys) {
            out.push_back(Bind("select-next", "Select next task", CATEGORY_NAVIGATION,
                               {"arrowdown"}, {"arrowdown"}, 80, false,
                               [this] { m_Navigator.Advance(); }));
            out.push_back(Bind("select-previous", "Select previous task", CATEGORY_NAVIGATION,
                               {"arrowup"}, {"arrowup"}, 80, false,
                               [this] { m_Navigator.Retreat(); }));
        }
        out.push_back(Bind("start-session", "Start focus session", CATEGORY_GENERAL, {"enter"},
                           {"enter"}, 85, false, [this] { Start(); }));
        break;

    case ACTIVE:
        out.push_back(Bind("complete-task", "Complete task", CATEGORY_TASKS, {"meta", "enter"},
                           {"ctrl", "enter"}, 85, false, [this] { Complete(); }));
        out.push_back(Bind("snooze-task", "Snooze task", CATEGORY_TASKS, {"meta", "s"},
                           {"ctrl", "s"}, 80, false, [this] { Snooze(); }));
        out.push_back(Bind("postpone-task", "Postpone task to tomorrow", CATEGORY_TASKS,
                           {"meta", "shift", "arrowright"}, {"ctrl", "shift", "arrowright"}, 80,
                           false, [this] { Postpone(); }));
        out.push_back(Bind("exit-focus", "Exit focus mode", CATEGORY_GENERAL, {"meta", "escape"},
                           {"ctrl", "escape"}, 70, false, [this] { End(); }));
        if (plainKeys) {
            out.push_back(Bind("next-task", "Next task", CATEGORY_NAVIGATION, {"arrowright"},
                               {"arrowright"}, 80, false, [this] { Next(); }));
            out.push_back(Bind("previous-task", "Previous task", CATEGORY_NAVIGATION,
                               {"arrowleft"}, {"arrowleft"}, 80, false, [this] { Previous(); }));
            out.push_back(Bind("toggle-pomodoro", "Start or pause pomodoro", CATEGORY_GENERAL,
                               {"p"}, {"p"}, 75, false, [this] { TogglePomodoro(); }));
            out.push_back(Bind("notes", "Toggle notes panel", CATEGORY_GENERAL, {"n"}, {"n"}, 65,
                               false, [this] { ToggleNotesPanel(); }));
        }
        break;

    case SINGLE_TASK_DONE:
        out.push_back(Bind("continue", "Continue with the next task", CATEGORY_NAVIGATION,
                           {"enter"}, {"enter"}, 85, false, [this] { Continue(); }));
        out.push_back(Bind("exit-focus", "End session", CATEGORY_GENERAL, {"meta", "escape"},
                           {"ctrl", "escape"}, 70, false, [this] { End(); }));
        break;

    case ALL_DONE_WAS_LOCKED:
    case ALL_DONE_NOT_LOCKED:
    case EMPTY_AT_ENTRY:
        out.push_back(Bind("end-session", "End session", CATEGORY_GENERAL, {"enter"}, {"enter"},
                           85, false, [this] { End(); }));
        break;

    case TRANSITION:
    case SESSION_SUMMARY:
        break;
    }
    return out;
}

// ─────────────────────────────────────
void SessionController::RebuildBindings() {
    if (m_Retired) {
        m_Dispatcher.Register({});
        return;
    }

    std::vector<ShortcutBinding> bindings;
    if (m_Screen == SESSION_SUMMARY) {
        bindings.push_back(Bind("close-summary", "Close summary", CATEGORY_GENERAL, {"enter"},
                                {"enter"}, 85, true, [this] { CloseSummary(); }));
        bindings.push_back(Bind("dismiss-summary", "Close summary", CATEGORY_GENERAL, {"escape"},
                                {"escape"}, 85, true, [this] { CloseSummary(); }));
    } else {
        bindings = GlobalBindings(m_Screen != TRANSITION);
        auto screen = ScreenBindings();
        bindings.insert(bindings.end(), std::make_move_iterator(screen.begin()),
                        std::make_move_iterator(screen.end()));
    }
    m_Dispatcher.Register(std::move(bindings));
}

// ─────────────────────────────────────
ScreenState SessionController::Screen() const {
    return m_Screen;
}

// ─────────────────────────────────────
bool SessionController::IsLocked() const {
    return m_Lock.IsLocked();
}

// ─────────────────────────────────────
bool SessionController::IsRetired() const {
    return m_Retired;
}

// ─────────────────────────────────────
bool SessionController::IsExitArmed() const {
    return m_ExitArmed;
}

// ─────────────────────────────────────
const Task *SessionController::CurrentTask() const {
    return m_Navigator.CurrentTask();
}

// ─────────────────────────────────────
int SessionController::CompletedCount() const {
    return static_cast<int>(m_CompletedIds.size());
}

// ─────────────────────────────────────
int SessionController::TotalCount() const {
    return static_cast<int>(m_SnapshotIds.size());
}

// ─────────────────────────────────────
const std::vector<std::string> &SessionController::SnapshotIds() const {
    return m_SnapshotIds;
}

// ─────────────────────────────────────
const std::vector<std::string> &SessionController::CompletedIds() const {
    return m_CompletedIds;
}

// ─────────────────────────────────────
const std::vector<std::string> &SessionController::Notes() const {
    return m_Notes;
}

// ─────────────────────────────────────
const SessionSummary &SessionController::Summary() const {
    return m_Summary;
}

// ─────────────────────────────────────
DialogKind SessionController::Dialog() const {
    return m_Dialog;
}

// ─────────────────────────────────────
bool SessionController::IsNotesPanelOpen() const {
    return m_NotesPanel;
}

// ─────────────────────────────────────
int SessionController::PomodoroCount() const {
    return m_PomodoroCount;
}

// ─────────────────────────────────────
const Pomodoro &SessionController::GetPomodoro() const {
    return m_Pomodoro;
}

// ─────────────────────────────────────
PersistState SessionController::OpenState() const {
    return m_OpenState;
}

// ─────────────────────────────────────
const std::string &SessionController::SessionId() const {
    return m_SessionId;
}

// ─────────────────────────────────────
std::optional<TimePoint> SessionController::StartTime() const {
    return m_StartTime;
}

// ─────────────────────────────────────
const ShortcutDispatcher &SessionController::Dispatcher() const {
    return m_Dispatcher;
}

// ─────────────────────────────────────
const TaskNavigator &SessionController::Navigator() const {
    return m_Navigator;
}
