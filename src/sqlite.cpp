#include "sqlite.hpp"

#include <random>

#include <spdlog/spdlog.h>

namespace {
void BindOptionalText(sqlite3_stmt *stmt, int idx, const std::optional<std::string> &value) {
    if (value) {
        sqlite3_bind_text(stmt, idx, value->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

std::optional<std::string> ColumnOptionalText(sqlite3_stmt *stmt, int idx) {
    if (sqlite3_column_type(stmt, idx) == SQLITE_NULL) {
        return std::nullopt;
    }
    const unsigned char *txt = sqlite3_column_text(stmt, idx);
    return std::string(txt ? reinterpret_cast<const char *>(txt) : "");
}
} // namespace

// ─────────────────────────────────────
SQLiteGateway::SQLiteGateway(const std::string &db_path) : m_Db(nullptr), m_DbPath(db_path) {
    if (sqlite3_open(m_DbPath.c_str(), &m_Db) != SQLITE_OK) {
        spdlog::error("unable to open database: {}", m_DbPath);
        if (m_Db) {
            sqlite3_close(m_Db);
            m_Db = nullptr;
        }
        throw GatewayError("unable to open database");
    }

    spdlog::debug("SQLite database opened: {}", m_DbPath);

    sqlite3_db_config(m_Db, SQLITE_DBCONFIG_LOOKASIDE, m_Lookaside.data(), kLookasideSlotSize,
                      kLookasideSlotCount);

    sqlite3_busy_timeout(m_Db, 2000);
    ExecIgnoringErrors("PRAGMA journal_mode=WAL");
    ExecIgnoringErrors("PRAGMA synchronous=NORMAL");
    ExecIgnoringErrors("PRAGMA temp_store=FILE");
    ExecIgnoringErrors("PRAGMA cache_size = -1000;");

    Init();
    PrepareStatements();
}

// ─────────────────────────────────────
SQLiteGateway::~SQLiteGateway() {
    for (sqlite3_stmt **stmt : {&m_InsertSessionStmt, &m_EndSessionStmt, &m_FetchSessionStmt,
                                &m_ListSessionsStmt}) {
        if (*stmt) {
            sqlite3_finalize(*stmt);
            *stmt = nullptr;
        }
    }
    if (m_Db) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
    }
}

// ─────────────────────────────────────
void SQLiteGateway::Init() {
    spdlog::debug("Initializing SQLite database tables");

    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS focus_sessions ("
                       "id TEXT PRIMARY KEY,"
                       "user_id TEXT NOT NULL,"
                       "task_id TEXT,"
                       "start_time REAL NOT NULL,"
                       "end_time REAL,"
                       "duration INTEGER NOT NULL DEFAULT 0,"
                       "intention TEXT,"
                       "notes TEXT NOT NULL DEFAULT '[]',"
                       "pomodoro_count INTEGER NOT NULL DEFAULT 0,"
                       "background TEXT,"
                       "created_at REAL NOT NULL"
                       ")");

    ExecIgnoringErrors("CREATE INDEX IF NOT EXISTS idx_focus_sessions_user "
                       "ON focus_sessions(user_id, start_time)");

    spdlog::debug("SQLite database tables initialized");
}

// ─────────────────────────────────────
void SQLiteGateway::PrepareStatements() {
    const std::pair<const char *, sqlite3_stmt **> statements[] = {
        {R"(
            INSERT INTO focus_sessions
            (id, user_id, task_id, start_time, end_time, duration, intention, notes,
             pomodoro_count, background, created_at)
            VALUES (?, ?, ?, ?, NULL, 0, ?, '[]', 0, ?, ?)
        )",
         &m_InsertSessionStmt},
        {R"(
            UPDATE focus_sessions SET
                end_time = ?,
                duration = ?,
                notes = ?,
                pomodoro_count = ?
            WHERE id = ?
        )",
         &m_EndSessionStmt},
        {R"(
            SELECT id, user_id, task_id, start_time, end_time, duration, intention, notes,
                   pomodoro_count, background
            FROM focus_sessions WHERE id = ?
        )",
         &m_FetchSessionStmt},
        {R"(
            SELECT id, user_id, task_id, start_time, end_time, duration, intention, notes,
                   pomodoro_count, background
            FROM focus_sessions WHERE user_id = ?
            ORDER BY start_time DESC LIMIT ?
        )",
         &m_ListSessionsStmt},
    };

    for (const auto &entry : statements) {
        if (sqlite3_prepare_v2(m_Db, entry.first, -1, entry.second, nullptr) != SQLITE_OK) {
            spdlog::error("db prepare failed: {}", sqlite3_errmsg(m_Db));
            *entry.second = nullptr;
        }
    }
}

// ─────────────────────────────────────
void SQLiteGateway::ExecIgnoringErrors(const std::string &sql) {
    char *err = nullptr;
    if (sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        spdlog::warn("db exec failed ({}): {}", sql, err ? err : "unknown");
        sqlite3_free(err);
    }
}

// ─────────────────────────────────────
std::string SQLiteGateway::NewSessionId() {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(alphabet) - 2);

    std::string id(20, '0');
    for (char &c : id) {
        c = alphabet[pick(rng)];
    }
    return id;
}

// ─────────────────────────────────────
std::string SQLiteGateway::CreateSession(const SessionOpenRequest &request) {
    if (request.userId.empty()) {
        throw GatewayError("user id is required to create a focus session");
    }

    std::lock_guard<std::mutex> lock(m_Mutex);
    if (!m_InsertSessionStmt) {
        throw GatewayError("insert statement not prepared");
    }

    const std::string id = NewSessionId();
    sqlite3_stmt *stmt = m_InsertSessionStmt;
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, request.userId.c_str(), -1, SQLITE_TRANSIENT);
    BindOptionalText(stmt, 3, request.taskId);
    sqlite3_bind_double(stmt, 4, ToUnixTime(request.startTime));
    BindOptionalText(stmt, 5, request.intention);
    BindOptionalText(stmt, 6, request.background);
    sqlite3_bind_double(stmt, 7, ToUnixTime(std::chrono::system_clock::now()));

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        const std::string err = sqlite3_errmsg(m_Db);
        sqlite3_reset(stmt);
        spdlog::error("db insert failed for focus session: {}", err);
        throw GatewayError("db insert failed: " + err);
    }
    sqlite3_reset(stmt);

    spdlog::debug("Focus session {} stored for user '{}'", id, request.userId);
    return id;
}

// ─────────────────────────────────────
void SQLiteGateway::EndSession(const SessionCloseRequest &request) {
    if (request.sessionId.empty()) {
        throw GatewayError("session id is required to end a focus session");
    }

    std::lock_guard<std::mutex> lock(m_Mutex);
    if (!m_EndSessionStmt) {
        throw GatewayError("update statement not prepared");
    }

    const std::string notes = nlohmann::json(request.notes).dump();
    sqlite3_stmt *stmt = m_EndSessionStmt;
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    sqlite3_bind_double(stmt, 1, ToUnixTime(request.endTime));
    sqlite3_bind_int(stmt, 2, request.durationMinutes);
    sqlite3_bind_text(stmt, 3, notes.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 4, request.pomodoroCount);
    sqlite3_bind_text(stmt, 5, request.sessionId.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        const std::string err = sqlite3_errmsg(m_Db);
        sqlite3_reset(stmt);
        spdlog::error("db update failed for focus session {}: {}", request.sessionId, err);
        throw GatewayError("db update failed: " + err);
    }
    sqlite3_reset(stmt);

    if (sqlite3_changes(m_Db) == 0) {
        throw GatewayError("focus session not found: " + request.sessionId);
    }
}

// ─────────────────────────────────────
FocusSessionRecord SQLiteGateway::ReadRecord(sqlite3_stmt *stmt) {
    FocusSessionRecord record;
    record.id = ColumnOptionalText(stmt, 0).value_or("");
    record.userId = ColumnOptionalText(stmt, 1).value_or("");
    record.taskId = ColumnOptionalText(stmt, 2);
    record.startTime = FromUnixTime(sqlite3_column_double(stmt, 3));
    if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
        record.endTime = FromUnixTime(sqlite3_column_double(stmt, 4));
    }
    record.durationMinutes = sqlite3_column_int(stmt, 5);
    record.intention = ColumnOptionalText(stmt, 6);

    const std::string notes = ColumnOptionalText(stmt, 7).value_or("[]");
    auto parsed = nlohmann::json::parse(notes, nullptr, false);
    if (!parsed.is_discarded()) {
        record.notes = m_JsonParse.JsonArray2String(parsed);
    } else {
        spdlog::warn("Focus session {} has malformed notes", record.id);
    }

    record.pomodoroCount = sqlite3_column_int(stmt, 8);
    record.background = ColumnOptionalText(stmt, 9);
    return record;
}

// ─────────────────────────────────────
std::optional<FocusSessionRecord> SQLiteGateway::FetchSession(const std::string &sessionId) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (!m_FetchSessionStmt) {
        throw GatewayError("select statement not prepared");
    }

    sqlite3_stmt *stmt = m_FetchSessionStmt;
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    sqlite3_bind_text(stmt, 1, sessionId.c_str(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_reset(stmt);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        const std::string err = sqlite3_errmsg(m_Db);
        sqlite3_reset(stmt);
        throw GatewayError("db select failed: " + err);
    }

    FocusSessionRecord record = ReadRecord(stmt);
    sqlite3_reset(stmt);
    return record;
}

// ─────────────────────────────────────
std::vector<FocusSessionRecord> SQLiteGateway::ListSessions(const std::string &userId,
                                                            int limit) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (!m_ListSessionsStmt) {
        throw GatewayError("list statement not prepared");
    }

    sqlite3_stmt *stmt = m_ListSessionsStmt;
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    sqlite3_bind_text(stmt, 1, userId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, limit > 0 ? limit : 50);

    std::vector<FocusSessionRecord> records;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        records.push_back(ReadRecord(stmt));
    }
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        throw GatewayError(std::string("db select failed: ") + sqlite3_errmsg(m_Db));
    }
    return records;
}
