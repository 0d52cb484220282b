#include "flowlock.hpp"

#include <algorithm>
#include <fstream>
#include <functional>
#include <utility>

#include "http_gateway.hpp"
#include "secrets.hpp"
#include "sqlite.hpp"

namespace {
void SetJson(httplib::Response &res, const nlohmann::json &j, int status = 200) {
    res.status = status;
    res.set_content(j.dump(), "application/json");
}

void SetError(httplib::Response &res, int status, const std::string &message) {
    SetJson(res, nlohmann::json{{"error", message}}, status);
}

const char *DialogName(DialogKind dialog) {
    switch (dialog) {
    case DIALOG_SHORTCUTS:
        return "shortcuts";
    case DIALOG_QUICK_NOTE:
        return "quick_note";
    case DIALOG_NONE:
        break;
    }
    return "none";
}

const char *PersistName(PersistState state) {
    switch (state) {
    case PERSIST_PENDING:
        return "pending";
    case PERSIST_SAVED:
        return "saved";
    case PERSIST_FAILED:
        return "failed";
    case PERSIST_NONE:
        break;
    }
    return "none";
}

const char *PhaseName(PomodoroPhase phase) {
    switch (phase) {
    case POMODORO_FOCUS:
        return "focus";
    case POMODORO_BREAK:
        return "break";
    case POMODORO_IDLE:
        break;
    }
    return "idle";
}

const char *LevelName(NoticeLevel level) {
    switch (level) {
    case NOTICE_SUCCESS:
        return "success";
    case NOTICE_WARNING:
        return "warning";
    case NOTICE_ERROR:
        return "error";
    case NOTICE_INFO:
        break;
    }
    return "info";
}

const char *CategoryName(ShortcutCategory category) {
    switch (category) {
    case CATEGORY_NAVIGATION:
        return "navigation";
    case CATEGORY_TASKS:
        return "tasks";
    case CATEGORY_GENERAL:
        break;
    }
    return "general";
}
} // namespace

// ─────────────────────────────────────
Flowlock::Flowlock(Config config, std::vector<Task> tasks)
    : m_Config(std::move(config)), m_Tasks(std::move(tasks)) {

    if (m_Config.logLevel == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (m_Config.logLevel == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (m_Config.logLevel == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }

    // Session store
    m_Gateway = MakeGateway();
    spdlog::info("Session store initialized ({})", m_Config.gateway.kind);

    // Recorder
    RecorderOptions options;
    options.maxAttempts = m_Config.recorderMaxAttempts;
    options.retryBackoff = std::chrono::milliseconds(m_Config.recorderBackoffMs);
    m_Recorder = std::make_unique<SessionRecorder>(*m_Gateway, m_Loop, options);

    // Notifications
    if (m_Config.notifications) {
        m_Notification = std::make_unique<Notification>();
        if (m_Notification->IsConnected()) {
            spdlog::info("Notification system initialized");
        } else {
            spdlog::warn("No session bus, notices are only logged");
        }
    }

    NewController();
    RefreshTasks();
    spdlog::info("Focus engine ready with {} tasks", m_Tasks.size());
}

// ─────────────────────────────────────
Flowlock::~Flowlock() {
    m_Server.stop();
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
    if (m_RefreshTimer != 0) {
        m_Loop.Cancel(m_RefreshTimer);
    }
    m_Controller.reset();
    // Drains pending writes before the store goes away.
    m_Recorder.reset();
}

// ─────────────────────────────────────
std::unique_ptr<PersistenceGateway> Flowlock::MakeGateway() {
    const GatewayConfig &g = m_Config.gateway;
    if (g.kind == "http") {
        if (g.baseUrl.empty()) {
            throw std::runtime_error("gateway.base_url is required for the http store");
        }
        std::string token = g.token;
        if (token.empty()) {
            TokenStore store;
            token = store.LoadToken(g.baseUrl);
        }
        spdlog::info("Remote session store: {}", g.baseUrl);
        return std::make_unique<HttpGateway>(g.baseUrl, token, g.timeoutSeconds);
    }

    const std::string path = g.dbPath.empty() ? GetDataPath().string() : g.dbPath;
    spdlog::info("DataBase path: {}", path);
    return std::make_unique<SQLiteGateway>(path);
}

// ─────────────────────────────────────
void Flowlock::NewController() {
    SessionOptions options;
    options.userId = m_Config.userId;
    options.transitionDelay = std::chrono::seconds(m_Config.transitionSeconds);
    options.snoozeFor = std::chrono::hours(m_Config.snoozeHours);
    options.autoExitDelay = std::chrono::seconds(m_Config.autoExitSeconds);
    options.confirmExit = m_Config.confirmExit;
    options.background = m_Config.background;
    options.platform = m_Config.platform;
    options.pomodoroFocus = std::chrono::minutes(m_Config.pomodoroFocusMinutes);
    options.pomodoroBreak = std::chrono::minutes(m_Config.pomodoroBreakMinutes);
    options.autoStartBreaks = m_Config.pomodoroAutoStartBreaks;

    SessionHooks hooks;
    hooks.onExitRequested = [this] {
        // The retiring controller is still on the stack.
        m_Loop.Post([this] { NewController(); });
    };
    hooks.onLockChanged = [](bool locked) {
        spdlog::debug("Lock state published: {}", locked ? "locked" : "unlocked");
    };
    hooks.onScreenChanged = [](ScreenState screen) {
        spdlog::debug("Screen published: {}", ScreenName(screen));
    };
    hooks.onNotice = [this](NoticeLevel level, const std::string &title,
                            const std::string &detail) { OnNotice(level, title, detail); };
    hooks.onTaskMutate = [this](const std::string &taskId, const TaskPatch &patch) {
        OnTaskMutate(taskId, patch);
    };
    hooks.onTransition = [](const Task &task) {
        spdlog::debug("Transition to '{}'", task.title);
    };

    m_Controller = std::make_unique<SessionController>(m_Loop, *m_Recorder, std::move(options),
                                                       std::move(hooks));
    m_Controller->SetLiveTasks(m_Tasks);
    spdlog::info("New focus session prepared");
}

// ─────────────────────────────────────
void Flowlock::OnTaskMutate(const std::string &taskId, const TaskPatch &patch) {
    auto it = std::find_if(m_Tasks.begin(), m_Tasks.end(),
                           [&](const Task &t) { return t.id == taskId; });
    if (it == m_Tasks.end()) {
        spdlog::warn("Task '{}' is not in the task list anymore", taskId);
        return;
    }
    ApplyTaskPatch(*it, patch);
    if (!m_Config.tasksFile.empty()) {
        SaveTasks(m_Config.tasksFile, m_Tasks);
    }
    // The controller is mid-action; feed the new list afterwards.
    m_Loop.Post([this] {
        if (m_Controller) {
            m_Controller->SetLiveTasks(m_Tasks);
        }
    });
}

// ─────────────────────────────────────
void Flowlock::OnNotice(NoticeLevel level, const std::string &title, const std::string &detail) {
    nlohmann::json notice = {{"level", LevelName(level)},
                             {"title", title},
                             {"detail", detail},
                             {"time", ToUnixTime(std::chrono::system_clock::now())}};
    m_Notices.push_back(std::move(notice));
    while (m_Notices.size() > kMaxNotices) {
        m_Notices.pop_front();
    }
    if (m_Notification) {
        m_Notification->Show(level, title, detail);
    }
}

// ─────────────────────────────────────
void Flowlock::RefreshTasks() {
    // Snoozes expire with time, not with list edits.
    if (m_Controller) {
        m_Controller->SetLiveTasks(m_Tasks);
    }
    m_RefreshTimer = m_Loop.Schedule(std::chrono::duration_cast<std::chrono::milliseconds>(
                                         kRefreshEvery),
                                     [this] { RefreshTasks(); });
}

// ─────────────────────────────────────
void Flowlock::Run() {
    m_Loop.Run();
}

// ─────────────────────────────────────
void Flowlock::Stop() {
    m_Loop.Stop();
}

// ─────────────────────────────────────
int Flowlock::Port() const {
    return m_BoundPort;
}

// ─────────────────────────────────────
EventLoop &Flowlock::Loop() {
    return m_Loop;
}

// ─────────────────────────────────────
std::vector<Task> Flowlock::LoadTasks(const std::filesystem::path &path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::warn("Tasks file {} not found", path.string());
        return {};
    }
    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        spdlog::warn("Tasks file {} is not valid JSON", path.string());
        return {};
    }
    JsonParse parse;
    return parse.ParseTasks(j);
}

// ─────────────────────────────────────
bool Flowlock::SaveTasks(const std::filesystem::path &path, const std::vector<Task> &tasks) {
    JsonParse parse;
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &task : tasks) {
        arr.push_back(parse.TaskToJson(task));
    }
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        spdlog::error("Cannot write tasks file {}", path.string());
        return false;
    }
    file << arr.dump(2);
    return static_cast<bool>(file);
}

// ─────────────────────────────────────
nlohmann::json Flowlock::StateJson() {
    const SessionController &c = *m_Controller;
    const Pomodoro &pomodoro = c.GetPomodoro();

    nlohmann::json j;
    j["screen"] = ScreenName(c.Screen());
    j["locked"] = c.IsLocked();
    j["retired"] = c.IsRetired();
    j["exit_armed"] = c.IsExitArmed();
    j["dialog"] = DialogName(c.Dialog());
    j["notes_panel"] = c.IsNotesPanelOpen();
    j["modal"] = c.Dispatcher().IsModalOpen();

    const Task *task = c.CurrentTask();
    j["current_task"] = task ? m_JsonParse.TaskToJson(*task) : nlohmann::json();
    j["queue_size"] = c.Navigator().Size();
    auto cursor = c.Navigator().Cursor();
    j["cursor"] = cursor ? nlohmann::json(*cursor) : nlohmann::json();

    j["completed"] = c.CompletedCount();
    j["total"] = c.TotalCount();
    j["snapshot"] = c.SnapshotIds();
    j["completed_ids"] = c.CompletedIds();
    j["notes"] = c.Notes();
    j["session_id"] = c.SessionId();
    j["open_state"] = PersistName(c.OpenState());
    auto started = c.StartTime();
    j["start_time"] = started ? nlohmann::json(ToUnixTime(*started)) : nlohmann::json();

    j["pomodoro"] = {
        {"phase", PhaseName(pomodoro.Phase())},
        {"running", pomodoro.IsRunning()},
        {"paused", pomodoro.IsPaused()},
        {"remaining_seconds", pomodoro.Remaining().count() / 1000},
        {"count", c.PomodoroCount()},
    };

    if (c.Screen() == SESSION_SUMMARY) {
        const SessionSummary &s = c.Summary();
        j["summary"] = {
            {"completed", s.completed},
            {"total", s.total},
            {"duration_minutes", s.durationMinutes},
            {"duration_estimated", s.durationEstimated},
            {"pomodoro_count", s.pomodoroCount},
            {"notes", s.notes},
            {"persist", PersistName(s.persist)},
        };
    } else {
        j["summary"] = nullptr;
    }

    j["notices"] = nlohmann::json::array();
    for (const auto &notice : m_Notices) {
        j["notices"].push_back(notice);
    }
    return j;
}

// ─────────────────────────────────────
nlohmann::json Flowlock::ShortcutsJson() {
    const ShortcutDispatcher &d = m_Controller->Dispatcher();
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &binding : d.Bindings()) {
        const auto &keys = d.KeysFor(binding);
        arr.push_back({
            {"id", binding.id},
            {"description", binding.description},
            {"category", CategoryName(binding.category)},
            {"keys", keys},
            {"label", ShortcutDispatcher::FormatKeys(keys, d.GetPlatform())},
            {"priority", binding.priority},
            {"allow_in_modal", binding.allowInModal},
        });
    }
    return arr;
}

// ─────────────────────────────────────
bool Flowlock::InitServer() {
    m_Server.set_keep_alive_max_count(1);
    m_Server.set_keep_alive_timeout(1);
    m_Server.set_payload_max_length(256 * 1024); // 256 KB
    m_Server.set_read_timeout(5, 0);
    m_Server.set_write_timeout(5, 0);

    // Engine state
    {
        m_Server.Get("/api/v1/state", [this](const httplib::Request &, httplib::Response &res) {
            try {
                SetJson(res, OnLoop([this] { return StateJson(); }));
            } catch (const std::exception &e) {
                SetError(res, 503, e.what());
            }
        });

        m_Server.Get("/api/v1/shortcuts", [this](const httplib::Request &,
                                                 httplib::Response &res) {
            try {
                SetJson(res, OnLoop([this] { return ShortcutsJson(); }));
            } catch (const std::exception &e) {
                SetError(res, 503, e.what());
            }
        });
    }

    // Session records
    {
        m_Server.Get("/api/v1/sessions", [this](const httplib::Request &req,
                                                httplib::Response &res) {
            try {
                int limit = 20;
                if (req.has_param("limit")) {
                    limit = std::stoi(req.get_param_value("limit"));
                    if (limit < 1) {
                        limit = 1;
                    }
                }
                nlohmann::json arr = nlohmann::json::array();
                for (const auto &record : m_Gateway->ListSessions(m_Config.userId, limit)) {
                    arr.push_back(m_JsonParse.RecordToJson(record));
                }
                SetJson(res, arr);
            } catch (const GatewayError &e) {
                spdlog::error("sessions endpoint failed: {}", e.what());
                SetError(res, 502, e.what());
            } catch (const std::exception &e) {
                SetError(res, 400, e.what());
            }
        });
    }

    // Tasks
    {
        m_Server.Get("/api/v1/tasks", [this](const httplib::Request &, httplib::Response &res) {
            try {
                SetJson(res, OnLoop([this] {
                            nlohmann::json arr = nlohmann::json::array();
                            for (const auto &task : m_Tasks) {
                                arr.push_back(m_JsonParse.TaskToJson(task));
                            }
                            return arr;
                        }));
            } catch (const std::exception &e) {
                SetError(res, 503, e.what());
            }
        });

        m_Server.Post("/api/v1/tasks", [this](const httplib::Request &req,
                                              httplib::Response &res) {
            auto body = nlohmann::json::parse(req.body, nullptr, false);
            if (body.is_discarded() || !body.is_array()) {
                SetError(res, 400, "expected a JSON array of tasks");
                return;
            }
            std::vector<Task> tasks = m_JsonParse.ParseTasks(body);
            try {
                SetJson(res, OnLoop([this, tasks] {
                            m_Tasks = tasks;
                            if (!m_Config.tasksFile.empty()) {
                                SaveTasks(m_Config.tasksFile, m_Tasks);
                            }
                            m_Controller->SetLiveTasks(m_Tasks);
                            return StateJson();
                        }));
            } catch (const std::exception &e) {
                SetError(res, 503, e.what());
            }
        });
    }

    // Keyboard
    {
        m_Server.Post("/api/v1/key", [this](const httplib::Request &req, httplib::Response &res) {
            auto body = nlohmann::json::parse(req.body, nullptr, false);
            if (body.is_discarded() || !body.is_object()) {
                SetError(res, 400, "invalid JSON");
                return;
            }
            KeyEvent event;
            event.key = m_JsonParse.GetString(body, "key", "");
            event.ctrl = m_JsonParse.GetBool(body, "ctrl", false);
            event.meta = m_JsonParse.GetBool(body, "meta", false);
            event.shift = m_JsonParse.GetBool(body, "shift", false);
            event.alt = m_JsonParse.GetBool(body, "alt", false);
            if (event.key.empty()) {
                SetError(res, 400, "'key' missing or not a string");
                return;
            }
            try {
                DispatchResult result = OnLoop([this, event] {
                    return m_Controller->HandleKey(event);
                });
                SetJson(res, {{"handled", result.handled},
                              {"binding", result.bindingId},
                              {"prevent_default", result.preventDefault}});
            } catch (const std::exception &e) {
                SetError(res, 503, e.what());
            }
        });
    }

    // Session flow
    {
        m_Server.Post("/api/v1/session/select", [this](const httplib::Request &req,
                                                       httplib::Response &res) {
            auto body = nlohmann::json::parse(req.body, nullptr, false);
            const std::string taskId = m_JsonParse.GetString(body, "task_id", "");
            if (taskId.empty()) {
                SetError(res, 400, "'task_id' missing or not a string");
                return;
            }
            try {
                bool selected = OnLoop([this, taskId] {
                    return m_Controller->SelectTask(taskId);
                });
                if (!selected) {
                    SetError(res, 409, "task cannot be selected");
                    return;
                }
                SetJson(res, OnLoop([this] { return StateJson(); }));
            } catch (const std::exception &e) {
                SetError(res, 503, e.what());
            }
        });

        m_Server.Post("/api/v1/session/start", [this](const httplib::Request &req,
                                                      httplib::Response &res) {
            std::optional<std::string> intention;
            std::optional<std::string> background;
            if (!req.body.empty()) {
                auto body = nlohmann::json::parse(req.body, nullptr, false);
                if (body.is_discarded()) {
                    SetError(res, 400, "invalid JSON");
                    return;
                }
                const std::string i = m_JsonParse.GetString(body, "intention", "");
                const std::string b = m_JsonParse.GetString(body, "background", "");
                if (!i.empty()) intention = i;
                if (!b.empty()) background = b;
            }
            try {
                SetJson(res, OnLoop([this, intention, background] {
                            m_Controller->Start(intention, background);
                            return StateJson();
                        }));
            } catch (const std::exception &e) {
                SetError(res, 503, e.what());
            }
        });

        const std::vector<std::pair<std::string, std::function<void(SessionController &)>>>
            actions = {
                {"complete", [](SessionController &c) { c.Complete(); }},
                {"next", [](SessionController &c) { c.Next(); }},
                {"previous", [](SessionController &c) { c.Previous(); }},
                {"snooze", [](SessionController &c) { c.Snooze(); }},
                {"postpone", [](SessionController &c) { c.Postpone(); }},
                {"continue", [](SessionController &c) { c.Continue(); }},
                {"end", [](SessionController &c) { c.End(); }},
                {"close", [](SessionController &c) { c.CloseSummary(); }},
            };
        for (const auto &entry : actions) {
            auto action = entry.second;
            m_Server.Post("/api/v1/session/" + entry.first, [this, action](const httplib::Request &,
                                                                    httplib::Response &res) {
                try {
                    SetJson(res, OnLoop([this, action] {
                                action(*m_Controller);
                                return StateJson();
                            }));
                } catch (const std::exception &e) {
                    SetError(res, 503, e.what());
                }
            });
        }
    }

    // Chrome
    {
        m_Server.Post("/api/v1/lock", [this](const httplib::Request &, httplib::Response &res) {
            try {
                SetJson(res, OnLoop([this] {
                            m_Controller->ToggleLock();
                            return StateJson();
                        }));
            } catch (const std::exception &e) {
                SetError(res, 503, e.what());
            }
        });

        m_Server.Post("/api/v1/notes", [this](const httplib::Request &req,
                                              httplib::Response &res) {
            auto body = nlohmann::json::parse(req.body, nullptr, false);
            const std::string text = m_JsonParse.GetString(body, "text", "");
            try {
                bool added = OnLoop([this, text] { return m_Controller->AddNote(text); });
                if (!added) {
                    SetError(res, 400, "note is empty or the session is over");
                    return;
                }
                SetJson(res, OnLoop([this] { return StateJson(); }));
            } catch (const std::exception &e) {
                SetError(res, 503, e.what());
            }
        });

        m_Server.Post("/api/v1/notes/panel", [this](const httplib::Request &,
                                                    httplib::Response &res) {
            try {
                SetJson(res, OnLoop([this] {
                            m_Controller->ToggleNotesPanel();
                            return StateJson();
                        }));
            } catch (const std::exception &e) {
                SetError(res, 503, e.what());
            }
        });

        m_Server.Post("/api/v1/pomodoro", [this](const httplib::Request &,
                                                 httplib::Response &res) {
            try {
                SetJson(res, OnLoop([this] {
                            m_Controller->TogglePomodoro();
                            return StateJson();
                        }));
            } catch (const std::exception &e) {
                SetError(res, 503, e.what());
            }
        });

        m_Server.Post("/api/v1/dialog", [this](const httplib::Request &req,
                                               httplib::Response &res) {
            auto body = nlohmann::json::parse(req.body, nullptr, false);
            const std::string kind = m_JsonParse.GetString(body, "kind", "");
            if (kind != "shortcuts" && kind != "quick_note" && kind != "none") {
                SetError(res, 400, "'kind' must be shortcuts, quick_note or none");
                return;
            }
            try {
                SetJson(res, OnLoop([this, kind] {
                            if (kind == "none") {
                                m_Controller->CloseDialog();
                            } else if (kind == "quick_note") {
                                m_Controller->OpenQuickNote();
                            } else if (m_Controller->Dialog() != DIALOG_SHORTCUTS) {
                                m_Controller->ToggleShortcutsPanel();
                            }
                            return StateJson();
                        }));
            } catch (const std::exception &e) {
                SetError(res, 503, e.what());
            }
        });

        m_Server.Post("/api/v1/modal", [this](const httplib::Request &req,
                                              httplib::Response &res) {
            auto body = nlohmann::json::parse(req.body, nullptr, false);
            if (body.is_discarded() || !body.contains("open") || !body["open"].is_boolean()) {
                SetError(res, 400, "'open' missing or not a boolean");
                return;
            }
            const bool open = body["open"].get<bool>();
            try {
                SetJson(res, OnLoop([this, open] {
                            m_Controller->SetExternalModal(open);
                            return StateJson();
                        }));
            } catch (const std::exception &e) {
                SetError(res, 503, e.what());
            }
        });
    }

    m_Server.set_error_handler([](const httplib::Request &, httplib::Response &res) {
        if (res.body.empty()) {
            SetError(res, res.status, "not found");
        }
    });

    const std::string host = "127.0.0.1";
    int port = static_cast<int>(m_Config.port);
    if (port == 0) {
        m_BoundPort = m_Server.bind_to_any_port(host);
    } else if (m_Server.bind_to_port(host, port)) {
        m_BoundPort = port;
    } else {
        m_BoundPort = -1;
    }
    if (m_BoundPort <= 0) {
        spdlog::error("Cannot bind {}:{}", host, port);
        return false;
    }

    spdlog::info("Serving on: http://{}:{}", host, m_BoundPort);
    m_Thread = std::thread([this] { m_Server.listen_after_bind(); });
    return true;
}
