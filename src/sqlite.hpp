#pragma once

#include <sqlite3.h>

#include <array>
#include <mutex>
#include <string>

#include "gateway.hpp"
#include "json.hpp"

// Local session store. Used directly when no remote store is configured.
class SQLiteGateway : public PersistenceGateway {
  public:
    SQLiteGateway(const std::string &db_path);
    ~SQLiteGateway() override;

    SQLiteGateway(const SQLiteGateway &) = delete;
    SQLiteGateway &operator=(const SQLiteGateway &) = delete;

    std::string CreateSession(const SessionOpenRequest &request) override;
    void EndSession(const SessionCloseRequest &request) override;
    std::optional<FocusSessionRecord> FetchSession(const std::string &sessionId) override;
    std::vector<FocusSessionRecord> ListSessions(const std::string &userId, int limit) override;

  private:
    void Init();
    void PrepareStatements();
    void ExecIgnoringErrors(const std::string &sql);
    FocusSessionRecord ReadRecord(sqlite3_stmt *stmt);
    std::string NewSessionId();

  private:
    sqlite3 *m_Db;
    std::string m_DbPath;
    JsonParse m_JsonParse;
    std::mutex m_Mutex;

    sqlite3_stmt *m_InsertSessionStmt = nullptr;
    sqlite3_stmt *m_EndSessionStmt = nullptr;
    sqlite3_stmt *m_FetchSessionStmt = nullptr;
    sqlite3_stmt *m_ListSessionsStmt = nullptr;

    // Small deterministic lookaside buffer to reduce heap churn.
    static constexpr int kLookasideSlotSize = 128;
    static constexpr int kLookasideSlotCount = 64; // 8 KiB
    std::array<unsigned char, kLookasideSlotSize * kLookasideSlotCount> m_Lookaside{};
};
