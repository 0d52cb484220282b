#pragma once

#include <mutex>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "gateway.hpp"
#include "json.hpp"

// Remote session store speaking a small JSON REST dialect:
//   POST  /v1/sessions         -> {"id": "..."}
//   PATCH /v1/sessions/{id}
//   GET   /v1/sessions/{id}    -> record, 404 when unknown
//   GET   /v1/sessions?user_id=&limit=
class HttpGateway : public PersistenceGateway {
  public:
    HttpGateway(const std::string &baseUrl, const std::string &token, int timeoutSeconds = 10);

    std::string CreateSession(const SessionOpenRequest &request) override;
    void EndSession(const SessionCloseRequest &request) override;
    std::optional<FocusSessionRecord> FetchSession(const std::string &sessionId) override;
    std::vector<FocusSessionRecord> ListSessions(const std::string &userId, int limit) override;

  private:
    nlohmann::json ParseBody(const httplib::Result &res, const char *what);
    void CheckStatus(const httplib::Result &res, const char *what);

  private:
    std::string m_BaseUrl;
    std::mutex m_Mutex;
    httplib::Client m_Client;
    JsonParse m_JsonParse;
};
