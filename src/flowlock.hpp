#pragma once

#include <chrono>
#include <deque>
#include <filesystem>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common.hpp"
#include "config.hpp"
#include "event_loop.hpp"
#include "gateway.hpp"
#include "json.hpp"
#include "notification.hpp"
#include "recorder.hpp"
#include "session.hpp"

// Daemon host: owns the engine thread, the session store and the local control API.
class Flowlock {
  public:
    Flowlock(Config config, std::vector<Task> tasks);
    ~Flowlock();

    Flowlock(const Flowlock &) = delete;
    Flowlock &operator=(const Flowlock &) = delete;

    // Binds 127.0.0.1:<port> (0 picks a free port) and starts serving.
    bool InitServer();
    void Run();
    void Stop();

    int Port() const;
    EventLoop &Loop();

    static std::vector<Task> LoadTasks(const std::filesystem::path &path);
    static bool SaveTasks(const std::filesystem::path &path, const std::vector<Task> &tasks);

  private:
    std::unique_ptr<PersistenceGateway> MakeGateway();
    void NewController();
    void OnTaskMutate(const std::string &taskId, const TaskPatch &patch);
    void OnNotice(NoticeLevel level, const std::string &title, const std::string &detail);
    void RefreshTasks();

    nlohmann::json StateJson();
    nlohmann::json ShortcutsJson();

    // Runs fn on the engine thread and waits for its result.
    template <typename Fn> auto OnLoop(Fn fn) -> decltype(fn()) {
        using Result = decltype(fn());
        auto job = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        auto future = job->get_future();
        m_Loop.Post([job] { (*job)(); });
        if (future.wait_for(kEngineTimeout) != std::future_status::ready) {
            throw std::runtime_error("engine did not respond");
        }
        return future.get();
    }

  private:
    Config m_Config;
    EventLoop m_Loop;
    std::unique_ptr<PersistenceGateway> m_Gateway;
    std::unique_ptr<SessionRecorder> m_Recorder;
    std::unique_ptr<Notification> m_Notification;
    std::unique_ptr<SessionController> m_Controller;
    JsonParse m_JsonParse;

    // Engine thread only
    std::vector<Task> m_Tasks;
    std::deque<nlohmann::json> m_Notices;
    EventLoop::TimerId m_RefreshTimer = 0;

    httplib::Server m_Server;
    std::thread m_Thread;
    int m_BoundPort = 0;

    static constexpr std::chrono::seconds kEngineTimeout{5};
    static constexpr std::chrono::seconds kRefreshEvery{60};
    static constexpr std::size_t kMaxNotices = 20;
};
