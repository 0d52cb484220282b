#include <csignal>
#include <cstdlib>
#include <iostream>
#include <pthread.h>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "config.hpp"
#include "flowlock.hpp"
#include "secrets.hpp"

namespace {
void PrintUsage(const char *argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --port N             listen on 127.0.0.1:N (0 picks a free port)\n"
              << "  --config PATH        configuration file\n"
              << "  --tasks PATH         JSON task list\n"
              << "  --log-level LEVEL    debug, info or off\n"
              << "  --store-token URL    read a token from stdin and save it for URL\n"
              << "  --clear-token URL    remove the saved token for URL\n";
}

bool NextArg(int argc, char **argv, int &i, std::string &out) {
    if (i + 1 >= argc) {
        spdlog::error("{} expects a value", argv[i]);
        return false;
    }
    out = argv[++i];
    return true;
}
} // namespace

// ─────────────────────────────────────
int main(int argc, char **argv) {
    std::string configPath;
    std::string tasksPath;
    std::string logLevel;
    std::string port;
    std::string storeTokenUrl;
    std::string clearTokenUrl;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        bool ok = true;
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            ok = NextArg(argc, argv, i, configPath);
        } else if (arg == "--tasks") {
            ok = NextArg(argc, argv, i, tasksPath);
        } else if (arg == "--log-level") {
            ok = NextArg(argc, argv, i, logLevel);
        } else if (arg == "--port") {
            ok = NextArg(argc, argv, i, port);
        } else if (arg == "--store-token") {
            ok = NextArg(argc, argv, i, storeTokenUrl);
        } else if (arg == "--clear-token") {
            ok = NextArg(argc, argv, i, clearTokenUrl);
        } else {
            spdlog::error("Unknown option {}", arg);
            ok = false;
        }
        if (!ok) {
            PrintUsage(argv[0]);
            return 2;
        }
    }

    // Keyring maintenance
    if (!storeTokenUrl.empty()) {
        std::string token;
        std::getline(std::cin, token);
        TokenStore store;
        return store.SaveToken(storeTokenUrl, token) ? 0 : 1;
    }
    if (!clearTokenUrl.empty()) {
        TokenStore store;
        return store.ClearToken(clearTokenUrl) ? 0 : 1;
    }

    // Every thread started below inherits the mask; only the waiter sees the signals.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    try {
        Config config = LoadConfig(configPath.empty() ? GetConfigPath() : configPath);
        if (!logLevel.empty()) {
            config.logLevel = LogLevelFromString(logLevel, config.logLevel);
        }
        if (!port.empty()) {
            config.port = static_cast<unsigned>(std::stoul(port));
        }
        if (!tasksPath.empty()) {
            config.tasksFile = tasksPath;
        }

        std::vector<Task> tasks;
        if (!config.tasksFile.empty()) {
            tasks = Flowlock::LoadTasks(config.tasksFile);
        }

        Flowlock app(config, std::move(tasks));
        if (!app.InitServer()) {
            return 1;
        }

        std::thread waiter([&app, signals] {
            int sig = 0;
            sigwait(&signals, &sig);
            spdlog::info("Received signal {}, shutting down", sig);
            app.Stop();
        });

        app.Run();
        waiter.join();
    } catch (const std::exception &e) {
        spdlog::error("Startup failed: {}", e.what());
        return 1;
    }

    spdlog::info("flowlockd stopped");
    return 0;
}
