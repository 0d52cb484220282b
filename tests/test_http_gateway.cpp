#include <gtest/gtest.h>

#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "http_gateway.hpp"
#include "json.hpp"

// Minimal in-process session service.
class FakeSessionService {
  public:
    FakeSessionService() {
        m_Server.Post("/v1/sessions", [this](const httplib::Request &req, httplib::Response &res) {
            std::lock_guard<std::mutex> lock(m_Mutex);
            lastAuth = req.get_header_value("Authorization");
            auto body = nlohmann::json::parse(req.body);
            const std::string id = "remote-" + std::to_string(++m_Seq);
            body["id"] = id;
            m_Records[id] = body;
            nlohmann::json reply = {{"data", {{"id", id}}}};
            res.set_content(reply.dump(), "application/json");
        });

        m_Server.Patch(R"(/v1/sessions/([^/]+))",
                       [this](const httplib::Request &req, httplib::Response &res) {
                           std::lock_guard<std::mutex> lock(m_Mutex);
                           auto it = m_Records.find(req.matches[1].str());
                           if (it == m_Records.end()) {
                               res.status = 404;
                               return;
                           }
                           it->second.update(nlohmann::json::parse(req.body));
                           res.set_content("{}", "application/json");
                       });

        m_Server.Get(R"(/v1/sessions/([^/]+))",
                     [this](const httplib::Request &req, httplib::Response &res) {
                         std::lock_guard<std::mutex> lock(m_Mutex);
                         if (req.matches[1].str() == "garbled") {
                             res.set_content("not json", "application/json");
                             return;
                         }
                         auto it = m_Records.find(req.matches[1].str());
                         if (it == m_Records.end()) {
                             res.status = 404;
                             return;
                         }
                         res.set_content(it->second.dump(), "application/json");
                     });

        m_Server.Get("/v1/sessions", [this](const httplib::Request &req, httplib::Response &res) {
            std::lock_guard<std::mutex> lock(m_Mutex);
            lastQueryUser = req.get_param_value("user_id");
            nlohmann::json out = nlohmann::json::array();
            for (const auto &entry : m_Records) {
                out.push_back(entry.second);
            }
            res.set_content(out.dump(), "application/json");
        });

        port = m_Server.bind_to_any_port("127.0.0.1");
        m_Thread = std::thread([this] { m_Server.listen_after_bind(); });
        m_Server.wait_until_ready();
    }

    ~FakeSessionService() {
        m_Server.stop();
        if (m_Thread.joinable()) {
            m_Thread.join();
        }
    }

    std::string Url() const {
        return "http://127.0.0.1:" + std::to_string(port);
    }

    int port = 0;
    std::string lastAuth;
    std::string lastQueryUser;

  private:
    httplib::Server m_Server;
    std::thread m_Thread;
    std::mutex m_Mutex;
    std::map<std::string, nlohmann::json> m_Records;
    int m_Seq = 0;
};

class HttpGatewayTest : public ::testing::Test {
  protected:
    FakeSessionService service;
    HttpGateway gateway{service.Url(), "secret-token", 2};

    SessionOpenRequest OpenRequest() {
        SessionOpenRequest request;
        request.userId = "user-1";
        request.taskId = "task-9";
        request.startTime = FromUnixTime(1700000000.0);
        return request;
    }
};

TEST_F(HttpGatewayTest, CreateSendsTokenAndReturnsId) {
    const std::string id = gateway.CreateSession(OpenRequest());
    EXPECT_EQ(id, "remote-1");
    EXPECT_EQ(service.lastAuth, "Bearer secret-token");

    auto record = gateway.FetchSession(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->userId, "user-1");
    EXPECT_EQ(record->taskId, std::optional<std::string>("task-9"));
    EXPECT_FALSE(record->endTime.has_value());
}

TEST_F(HttpGatewayTest, EndIsVisibleInReadBack) {
    const std::string id = gateway.CreateSession(OpenRequest());

    SessionCloseRequest close;
    close.sessionId = id;
    close.endTime = FromUnixTime(1700003000.0);
    close.durationMinutes = 50;
    close.notes = {"n1"};
    close.pomodoroCount = 2;
    gateway.EndSession(close);

    auto record = gateway.FetchSession(id);
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(record->endTime.has_value());
    EXPECT_EQ(record->durationMinutes, 50);
    EXPECT_EQ(record->notes, std::vector<std::string>{"n1"});
    EXPECT_EQ(record->pomodoroCount, 2);
}

TEST_F(HttpGatewayTest, UnknownSessionIsEmptyOnFetchAndErrorOnEnd) {
    EXPECT_FALSE(gateway.FetchSession("missing").has_value());

    SessionCloseRequest close;
    close.sessionId = "missing";
    EXPECT_THROW(gateway.EndSession(close), GatewayError);
}

TEST_F(HttpGatewayTest, ListPassesUser) {
    gateway.CreateSession(OpenRequest());
    gateway.CreateSession(OpenRequest());
    auto records = gateway.ListSessions("user-1", 5);
    EXPECT_EQ(records.size(), 2u);
    EXPECT_EQ(service.lastQueryUser, "user-1");
}

TEST_F(HttpGatewayTest, InvalidJsonIsAnError) {
    EXPECT_THROW(gateway.FetchSession("garbled"), GatewayError);
}

TEST(HttpGatewayOfflineTest, UnreachableServerThrows) {
    httplib::Server portFinder;
    const int port = portFinder.bind_to_any_port("127.0.0.1");
    portFinder.stop();

    HttpGateway gateway("http://127.0.0.1:" + std::to_string(port), "t", 1);
    SessionOpenRequest request;
    request.userId = "user-1";
    EXPECT_THROW(gateway.CreateSession(request), GatewayError);
}
