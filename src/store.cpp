#include "store.hpp"

#include "schema.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
StateStore::StateStore(const std::string &db_path, StoreRole role)
    : m_Db(nullptr), m_DbPath(db_path), m_Role(role) {
    if (sqlite3_open(m_DbPath.c_str(), &m_Db) != SQLITE_OK) {
        spdlog::error("unable to open database: {}", m_DbPath);
        if (m_Db) {
            sqlite3_close(m_Db);
            m_Db = nullptr;
        }
        throw StoreError("unable to open database: " + m_DbPath);
    }

    spdlog::debug("State store opened: {} (role {})", m_DbPath, RoleToString(m_Role));

    sqlite3_db_config(m_Db, SQLITE_DBCONFIG_LOOKASIDE, m_Lookaside.data(), kLookasideSlotSize,
                      kLookasideSlotCount);

    // Both processes open the same file; the agent must never wait long on the daemon.
    sqlite3_busy_timeout(m_Db, 2000);
    ExecIgnoringErrors("PRAGMA journal_mode=WAL");
    ExecIgnoringErrors("PRAGMA synchronous=NORMAL");
    ExecIgnoringErrors("PRAGMA temp_store=FILE");
    ExecIgnoringErrors("PRAGMA cache_size = -1000;");

    try {
        Init();
        PrepareStatements();
    } catch (...) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
        throw;
    }
}

// ─────────────────────────────────────
StateStore::~StateStore() {
    for (sqlite3_stmt **stmt : {&m_ReadStmt, &m_WriteStmt, &m_EraseStmt}) {
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
void StateStore::Init() {
    ExecOrThrow("CREATE TABLE IF NOT EXISTS meta ("
                "name TEXT PRIMARY KEY,"
                "value TEXT NOT NULL"
                ")");

    ExecOrThrow("CREATE TABLE IF NOT EXISTS kv ("
                "key TEXT PRIMARY KEY,"
                "value TEXT NOT NULL,"
                "owner TEXT NOT NULL,"
                "updated_at INTEGER NOT NULL"
                ")");

    sqlite3_stmt *stmt = nullptr;
    const char *sql = "SELECT value FROM meta WHERE name = 'schema_version'";
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("db prepare failed: ") + sqlite3_errmsg(m_Db));
    }

    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char *txt = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
        version = txt ? std::atoi(txt) : 0;
    }
    sqlite3_finalize(stmt);

    if (version > kSchemaVersion) {
        spdlog::error("State store schema v{} is newer than supported v{}", version,
                      kSchemaVersion);
        throw StoreError("unsupported store schema version " + std::to_string(version));
    }

    if (version < kSchemaVersion) {
        ExecOrThrow("INSERT INTO meta (name, value) VALUES ('schema_version', '" +
                    std::to_string(kSchemaVersion) +
                    "') ON CONFLICT(name) DO UPDATE SET value = excluded.value");
        spdlog::info("State store schema initialized at v{}", kSchemaVersion);
    }
}

// ─────────────────────────────────────
void StateStore::PrepareStatements() {
    {
        const char *sql = "SELECT value FROM kv WHERE key = ?";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_ReadStmt, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("db prepare failed for Read stmt: ") +
                             sqlite3_errmsg(m_Db));
        }
    }

    {
        const char *sql = R"(
            INSERT INTO kv (key, value, owner, updated_at)
            VALUES (?, ?, ?, strftime('%s','now'))
            ON CONFLICT(key) DO UPDATE SET
                value = excluded.value,
                owner = excluded.owner,
                updated_at = excluded.updated_at
        )";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_WriteStmt, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("db prepare failed for Write stmt: ") +
                             sqlite3_errmsg(m_Db));
        }
    }

    {
        const char *sql = "DELETE FROM kv WHERE key = ?";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_EraseStmt, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("db prepare failed for Erase stmt: ") +
                             sqlite3_errmsg(m_Db));
        }
    }
}

// ─────────────────────────────────────
void StateStore::CheckOwnership(const std::string &key) const {
    const StoreRole owner = OwnerOfKey(key);
    if (owner != m_Role) {
        spdlog::error("Rejected write of '{}' by {} (owned by {})", key, RoleToString(m_Role),
                      RoleToString(owner));
        throw OwnershipError("key '" + key + "' is owned by " + RoleToString(owner));
    }
}

// ─────────────────────────────────────
std::optional<nlohmann::json> StateStore::Read(const std::string &key) {
    sqlite3_reset(m_ReadStmt);
    sqlite3_clear_bindings(m_ReadStmt);
    sqlite3_bind_text(m_ReadStmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(m_ReadStmt);
    if (rc == SQLITE_DONE) {
        sqlite3_reset(m_ReadStmt);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        const std::string err = sqlite3_errmsg(m_Db);
        sqlite3_reset(m_ReadStmt);
        throw StoreError("db read failed for '" + key + "': " + err);
    }

    const char *txt = reinterpret_cast<const char *>(sqlite3_column_text(m_ReadStmt, 0));
    std::string raw = txt ? txt : "";
    sqlite3_reset(m_ReadStmt);

    try {
        return nlohmann::json::parse(raw);
    } catch (const std::exception &e) {
        spdlog::warn("Ignoring corrupt value for '{}': {}", key, e.what());
        return std::nullopt;
    }
}

// ─────────────────────────────────────
void StateStore::Write(const std::string &key, const nlohmann::json &value) {
    CheckOwnership(key);

    const std::string raw = value.dump();
    const char *owner = RoleToString(m_Role);

    sqlite3_reset(m_WriteStmt);
    sqlite3_clear_bindings(m_WriteStmt);
    sqlite3_bind_text(m_WriteStmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(m_WriteStmt, 2, raw.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(m_WriteStmt, 3, owner, -1, SQLITE_STATIC);

    const int rc = sqlite3_step(m_WriteStmt);
    sqlite3_reset(m_WriteStmt);
    if (rc != SQLITE_DONE) {
        spdlog::error("Write of '{}' failed: {}", key, sqlite3_errmsg(m_Db));
        throw StoreError("db write failed for '" + key + "': " + sqlite3_errmsg(m_Db));
    }

    spdlog::debug("store[{}] {} = {}", RoleToString(m_Role), key, raw);
}

// ─────────────────────────────────────
void StateStore::Erase(const std::string &key) {
    CheckOwnership(key);

    sqlite3_reset(m_EraseStmt);
    sqlite3_clear_bindings(m_EraseStmt);
    sqlite3_bind_text(m_EraseStmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(m_EraseStmt);
    sqlite3_reset(m_EraseStmt);
    if (rc != SQLITE_DONE) {
        throw StoreError("db erase failed for '" + key + "': " + sqlite3_errmsg(m_Db));
    }
}

// ─────────────────────────────────────
std::vector<std::string> StateStore::Keys(const std::string &prefix) {
    std::vector<std::string> out;
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "SELECT key FROM kv WHERE substr(key, 1, ?) = ? ORDER BY key";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("db prepare failed in Keys: ") + sqlite3_errmsg(m_Db));
    }

    sqlite3_bind_int(stmt, 1, static_cast<int>(prefix.size()));
    sqlite3_bind_text(stmt, 2, prefix.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char *txt = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
        if (txt) {
            out.emplace_back(txt);
        }
    }

    sqlite3_finalize(stmt);
    return out;
}

// ─────────────────────────────────────
int64_t StateStore::DataVersion() {
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, "PRAGMA data_version", -1, &stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("db prepare failed in DataVersion: ") +
                         sqlite3_errmsg(m_Db));
    }

    int64_t version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return version;
}

// ─────────────────────────────────────
void StateStore::ExecIgnoringErrors(const std::string &sql) {
    char *errmsg = nullptr;
    sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (errmsg) {
        spdlog::error("sqlite exec error: {}", errmsg);
        sqlite3_free(errmsg);
    }
}

// ─────────────────────────────────────
void StateStore::ExecOrThrow(const std::string &sql) {
    char *errmsg = nullptr;
    if (sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string err = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        throw StoreError("sqlite exec error: " + err);
    }
}

// ─────────────────────────────────────
StateStore::Transaction::Transaction(StateStore &store, bool write) : m_Store(store) {
    m_Store.ExecOrThrow(write ? "BEGIN IMMEDIATE" : "BEGIN");
}

// ─────────────────────────────────────
StateStore::Transaction::~Transaction() {
    if (!m_Done) {
        m_Store.ExecIgnoringErrors("ROLLBACK");
    }
}

// ─────────────────────────────────────
void StateStore::Transaction::Commit() {
    m_Store.ExecOrThrow("COMMIT");
    m_Done = true;
}
