#include "components/sink/audit_log.h"
#include "logger.h"
#include <filesystem>

namespace facegate {

nlohmann::json AuditRecord::toJson() const {
    return {
        {"sequence", sequence},
        {"timestamp", timestamp},
        {"identity", identity},
        {"confidence", confidence},
        {"status", status},
        {"actuator_state", actuatorState}
    };
}

SqliteAuditLog::SqliteAuditLog(const std::string& id, const std::string& dbPath)
    : AuditLog(id),
      dbPath_(dbPath),
      db_(nullptr),
      isInitialized_(false) {
    config_["db_path"] = dbPath_;
}

SqliteAuditLog::~SqliteAuditLog() {
    stop();
    closeDatabase();
}

bool SqliteAuditLog::initialize() {
    if (isInitialized_) {
        return true;
    }

    LOG_INFO("SqliteAuditLog", "Opening audit log: " + dbPath_);

    std::filesystem::path dbDir = std::filesystem::path(dbPath_).parent_path();
    if (!dbDir.empty() && !std::filesystem::exists(dbDir)) {
        try {
            std::filesystem::create_directories(dbDir);
            LOG_INFO("SqliteAuditLog", "Created data directory: " + dbDir.string());
        } catch (const std::exception& e) {
            LOG_ERROR("SqliteAuditLog", "Failed to create data directory: " + std::string(e.what()));
            return false;
        }
    }

    std::lock_guard<std::mutex> lock(dbMutex_);

    int rc = sqlite3_open(dbPath_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LOG_ERROR("SqliteAuditLog", "Failed to open database: " + std::string(sqlite3_errmsg(db_)));
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA encoding='UTF-8';", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA busy_timeout=5000;", nullptr, nullptr, nullptr);

    if (!createTables()) {
        LOG_ERROR("SqliteAuditLog", "Failed to create audit tables");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    isInitialized_ = true;
    return true;
}

bool SqliteAuditLog::createTables() {
    const char* createTable = R"(
        CREATE TABLE IF NOT EXISTS recognition_log (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            sequence INTEGER NOT NULL,
            timestamp TEXT NOT NULL,
            identity TEXT NOT NULL,
            confidence REAL NOT NULL,
            status TEXT NOT NULL,
            actuator_state TEXT NOT NULL
        );
    )";

    const char* createIndex =
        "CREATE INDEX IF NOT EXISTS idx_recognition_log_identity ON recognition_log(identity, timestamp);";

    for (const char* sql : {createTable, createIndex}) {
        char* errMsg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            LOG_ERROR("SqliteAuditLog", "SQL error: " + std::string(errMsg ? errMsg : "unknown"));
            sqlite3_free(errMsg);
            return false;
        }
    }
    return true;
}

bool SqliteAuditLog::start() {
    if (!isInitialized_ && !initialize()) {
        LOG_ERROR("SqliteAuditLog", "Failed to initialize audit log");
        return false;
    }
    running_ = true;
    return true;
}

bool SqliteAuditLog::stop() {
    running_ = false;
    return true;
}

void SqliteAuditLog::closeDatabase() {
    std::lock_guard<std::mutex> lock(dbMutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    isInitialized_ = false;
}

nlohmann::json SqliteAuditLog::getStatus() const {
    nlohmann::json status = Component::getStatus();
    status["initialized"] = isInitialized_.load();
    status["appended"] = appendedCount_.load();
    status["failed"] = failedCount_.load();
    return status;
}

Result<void> SqliteAuditLog::append(const AuditRecord& record) {
    std::lock_guard<std::mutex> lock(dbMutex_);
    if (!db_) {
        failedCount_++;
        return Result<void>::error(ErrorKind::IoError, "Audit log not initialized");
    }

    const char* sql =
        "INSERT INTO recognition_log (sequence, timestamp, identity, confidence, status, actuator_state) "
        "VALUES (?, ?, ?, ?, ?, ?);";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        failedCount_++;
        return Result<void>::error(ErrorKind::IoError,
                                   "Failed to prepare insert: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(record.sequence));
    sqlite3_bind_text(stmt, 2, record.timestamp.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, record.identity.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 4, record.confidence);
    sqlite3_bind_text(stmt, 5, record.status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, record.actuatorState.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        failedCount_++;
        return Result<void>::error(ErrorKind::IoError,
                                   "Failed to insert audit record: " + std::string(sqlite3_errmsg(db_)));
    }

    appendedCount_++;
    return Result<void>::success();
}

Result<int64_t> SqliteAuditLog::countRecords() {
    std::lock_guard<std::mutex> lock(dbMutex_);
    if (!db_) {
        return Result<int64_t>::error(ErrorKind::IoError, "Audit log not initialized");
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM recognition_log;", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<int64_t>::error(ErrorKind::IoError,
                                      "Failed to prepare count: " + std::string(sqlite3_errmsg(db_)));
    }

    int64_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return Result<int64_t>::success(count);
}

Result<std::vector<AuditRecord>> SqliteAuditLog::recentRecords(int limit) {
    std::lock_guard<std::mutex> lock(dbMutex_);
    if (!db_) {
        return Result<std::vector<AuditRecord>>::error(ErrorKind::IoError, "Audit log not initialized");
    }

    const char* sql =
        "SELECT sequence, timestamp, identity, confidence, status, actuator_state "
        "FROM recognition_log ORDER BY id DESC LIMIT ?;";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<std::vector<AuditRecord>>::error(ErrorKind::IoError,
            "Failed to prepare query: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_int(stmt, 1, limit);

    auto columnText = [stmt](int column) {
        const unsigned char* text = sqlite3_column_text(stmt, column);
        return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
    };

    std::vector<AuditRecord> records;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        AuditRecord record;
        record.sequence = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        record.timestamp = columnText(1);
        record.identity = columnText(2);
        record.confidence = sqlite3_column_double(stmt, 3);
        record.status = columnText(4);
        record.actuatorState = columnText(5);
        records.push_back(std::move(record));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Result<std::vector<AuditRecord>>::error(ErrorKind::IoError,
            "Failed to read audit records: " + std::string(sqlite3_errmsg(db_)));
    }
    return Result<std::vector<AuditRecord>>::success(std::move(records));
}

} // namespace facegate
