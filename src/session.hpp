#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common.hpp"
#include "event_loop.hpp"
#include "focuslock.hpp"
#include "navigator.hpp"
#include "pomodoro.hpp"
#include "recorder.hpp"
#include "shortcuts.hpp"

enum DialogKind { DIALOG_NONE, DIALOG_SHORTCUTS, DIALOG_QUICK_NOTE };

enum PersistState { PERSIST_NONE, PERSIST_PENDING, PERSIST_SAVED, PERSIST_FAILED };

struct SessionSummary {
    int completed = 0;
    int total = 0;
    int durationMinutes = 0;
    int pomodoroCount = 0;
    std::vector<std::string> notes;
    PersistState persist = PERSIST_NONE;
    // True until the store confirmed the end write.
    bool durationEstimated = true;
};

struct SessionOptions {
    std::string userId = "local";
    std::chrono::milliseconds transitionDelay{3000};
    std::chrono::hours snoozeFor{2};
    std::chrono::milliseconds autoExitDelay{3000};
    std::chrono::milliseconds exitIntentWindow{5000};
    bool confirmExit = false;
    std::optional<std::string> background;
    Platform platform = ShortcutDispatcher::DetectPlatform();
    std::chrono::milliseconds pomodoroFocus{25 * 60 * 1000};
    std::chrono::milliseconds pomodoroBreak{5 * 60 * 1000};
    bool autoStartBreaks = true;
    std::function<TimePoint()> wallClock;
};

struct SessionHooks {
    std::function<void()> onExitRequested;
    std::function<void(bool locked)> onLockChanged;
    std::function<void(ScreenState screen)> onScreenChanged;
    std::function<void(NoticeLevel level, const std::string &title, const std::string &detail)>
        onNotice;
    std::function<void(const std::string &taskId, const TaskPatch &patch)> onTaskMutate;
    std::function<void(const Task &task)> onTransition;
};

// Focus session state machine. Every method must be called on the EventLoop thread.
class SessionController {
  public:
    SessionController(EventLoop &loop, SessionRecorder &recorder, SessionOptions options,
                      SessionHooks hooks);
    ~SessionController();

    SessionController(const SessionController &) = delete;
    SessionController &operator=(const SessionController &) = delete;

    void SetLiveTasks(const std::vector<Task> &tasks);
    bool SelectTask(const std::string &taskId);

    // Session flow
    void Start(std::optional<std::string> intention = std::nullopt,
               std::optional<std::string> background = std::nullopt);
    void Complete();
    void Next();
    void Previous();
    void Snooze();
    void Postpone();
    void Continue();
    bool End();
    void CloseSummary();

    // Chrome
    void ToggleLock();
    void ToggleShortcutsPanel();
    void OpenQuickNote();
    bool CloseDialog();
    void ToggleNotesPanel();
    bool AddNote(const std::string &text);
    void TogglePomodoro();
    void SetExternalModal(bool open);

    DispatchResult HandleKey(const KeyEvent &event);

    ScreenState Screen() const;
    bool IsLocked() const;
    bool IsRetired() const;
    bool IsExitArmed() const;
    const Task *CurrentTask() const;
    int CompletedCount() const;
    int TotalCount() const;
    const std::vector<std::string> &SnapshotIds() const;
    const std::vector<std::string> &CompletedIds() const;
    const std::vector<std::string> &Notes() const;
    const SessionSummary &Summary() const;
    DialogKind Dialog() const;
    bool IsNotesPanelOpen() const;
    int PomodoroCount() const;
    const Pomodoro &GetPomodoro() const;
    PersistState OpenState() const;
    const std::string &SessionId() const;
    std::optional<TimePoint> StartTime() const;

    const ShortcutDispatcher &Dispatcher() const;
    const TaskNavigator &Navigator() const;

  private:
    TimePoint Now() const;
    void EnterScreen(ScreenState screen);
    void EnterAllDone();
    void OnQueueEmptied();
    void ShowTransition(bool moved);
    void OpenDialog(DialogKind kind);
    void ArmExitIntent();
    void ResetExitIntent();
    void CancelTimer(EventLoop::TimerId &id);
    void RebuildBindings();
    void Notice(NoticeLevel level, const std::string &title, const std::string &detail = "");
    void MutateTask(const std::string &taskId, const TaskPatch &patch);
    bool InSnapshot(const std::string &taskId) const;
    bool FinishedHere(const std::string &taskId) const;
    bool IsSessionScreen() const;

    std::vector<ShortcutBinding> GlobalBindings(bool withEscape);
    std::vector<ShortcutBinding> ScreenBindings();

  private:
    EventLoop &m_Loop;
    SessionRecorder &m_Recorder;
    SessionOptions m_Options;
    SessionHooks m_Hooks;

    ShortcutDispatcher m_Dispatcher;
    TaskNavigator m_Navigator;
    FocusLock m_Lock;
    Pomodoro m_Pomodoro;

    ScreenState m_Screen = WELCOME;
    bool m_Retired = false;

    std::vector<std::string> m_SnapshotIds;
    std::vector<std::string> m_CompletedIds;
    // Every task completed during the session, snapshot member or not.
    std::vector<std::string> m_FinishedIds;
    std::vector<std::string> m_Notes;
    std::optional<TimePoint> m_StartTime;
    std::optional<std::string> m_Intention;
    int m_PomodoroCount = 0;

    bool m_RecordOpened = false;
    bool m_EndIssued = false;
    PersistState m_OpenState = PERSIST_NONE;
    std::string m_SessionId;
    SessionSummary m_Summary;

    DialogKind m_Dialog = DIALOG_NONE;
    bool m_ExternalModal = false;
    bool m_NotesPanel = false;
    bool m_ExitArmed = false;

    EventLoop::TimerId m_TransitionTimer = 0;
    EventLoop::TimerId m_AutoExitTimer = 0;
    EventLoop::TimerId m_ExitIntentTimer = 0;

    // Recorder outcomes may land after this controller is gone.
    std::shared_ptr<bool> m_Alive;
};
