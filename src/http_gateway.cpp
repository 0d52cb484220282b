#include "http_gateway.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
HttpGateway::HttpGateway(const std::string &baseUrl, const std::string &token, int timeoutSeconds)
    : m_BaseUrl(baseUrl), m_Client(baseUrl) {
    httplib::Headers headers = {{"Accept", "application/json"}};
    if (!token.empty()) {
        headers.emplace("Authorization", "Bearer " + token);
    } else {
        spdlog::warn("HttpGateway: no API token for {}, requests are unauthenticated", baseUrl);
    }
    m_Client.set_default_headers(headers);
    m_Client.set_connection_timeout(3, 0);
    m_Client.set_read_timeout(timeoutSeconds, 0);
    m_Client.set_write_timeout(timeoutSeconds, 0);
    spdlog::debug("HttpGateway: using {}", m_BaseUrl);
}

// ─────────────────────────────────────
void HttpGateway::CheckStatus(const httplib::Result &res, const char *what) {
    if (!res) {
        throw GatewayError(std::string(what) + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw GatewayError(std::string(what) + " failed: HTTP " + std::to_string(res->status));
    }
}

// ─────────────────────────────────────
nlohmann::json HttpGateway::ParseBody(const httplib::Result &res, const char *what) {
    CheckStatus(res, what);
    auto payload = nlohmann::json::parse(res->body, nullptr, false);
    if (payload.is_discarded()) {
        throw GatewayError(std::string(what) + " returned invalid JSON");
    }
    // Accept both bare payloads and {"data": ...} envelopes.
    if (payload.is_object() && payload.contains("data")) {
        return payload["data"];
    }
    return payload;
}

// ─────────────────────────────────────
std::string HttpGateway::CreateSession(const SessionOpenRequest &request) {
    if (request.userId.empty()) {
        throw GatewayError("user id is required to create a focus session");
    }

    auto orNull = [](const std::optional<std::string> &v) {
        return v ? nlohmann::json(*v) : nlohmann::json();
    };
    nlohmann::json body = {
        {"user_id", request.userId},
        {"task_id", orNull(request.taskId)},
        {"start_time", ToUnixTime(request.startTime)},
        {"end_time", nullptr},
        {"duration", 0},
        {"intention", orNull(request.intention)},
        {"notes", nlohmann::json::array()},
        {"pomodoro_count", 0},
        {"background", orNull(request.background)},
    };

    std::lock_guard<std::mutex> lock(m_Mutex);
    auto res = m_Client.Post("/v1/sessions", body.dump(), "application/json");
    nlohmann::json payload = ParseBody(res, "create session");

    std::string id = m_JsonParse.GetString(payload, "id", "");
    if (id.empty()) {
        throw GatewayError("create session response has no id");
    }
    spdlog::debug("HttpGateway: created session {}", id);
    return id;
}

// ─────────────────────────────────────
void HttpGateway::EndSession(const SessionCloseRequest &request) {
    if (request.sessionId.empty()) {
        throw GatewayError("session id is required to end a focus session");
    }

    nlohmann::json body = {
        {"end_time", ToUnixTime(request.endTime)},
        {"duration", request.durationMinutes},
        {"notes", request.notes},
        {"pomodoro_count", request.pomodoroCount},
    };

    const std::string path = "/v1/sessions/" + request.sessionId;
    std::lock_guard<std::mutex> lock(m_Mutex);
    auto res = m_Client.Patch(path, body.dump(), "application/json");
    CheckStatus(res, "end session");
    spdlog::debug("HttpGateway: ended session {}", request.sessionId);
}

// ─────────────────────────────────────
std::optional<FocusSessionRecord> HttpGateway::FetchSession(const std::string &sessionId) {
    const std::string path = "/v1/sessions/" + sessionId;
    std::lock_guard<std::mutex> lock(m_Mutex);
    auto res = m_Client.Get(path);
    if (res && res->status == 404) {
        return std::nullopt;
    }
    nlohmann::json payload = ParseBody(res, "fetch session");
    auto record = m_JsonParse.ParseRecord(payload);
    if (!record) {
        throw GatewayError("fetch session returned a malformed record");
    }
    return record;
}

// ─────────────────────────────────────
std::vector<FocusSessionRecord> HttpGateway::ListSessions(const std::string &userId, int limit) {
    httplib::Params params = {{"user_id", userId}, {"limit", std::to_string(limit)}};

    std::lock_guard<std::mutex> lock(m_Mutex);
    auto res = m_Client.Get("/v1/sessions", params, httplib::Headers{});
    nlohmann::json payload = ParseBody(res, "list sessions");

    std::vector<FocusSessionRecord> records;
    if (!payload.is_array()) {
        spdlog::warn("HttpGateway: list sessions returned {}", payload.type_name());
        return records;
    }
    for (const auto &entry : payload) {
        if (auto record = m_JsonParse.ParseRecord(entry)) {
            records.push_back(std::move(*record));
        }
    }
    return records;
}
