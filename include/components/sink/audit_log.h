#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "component.h"
#include "result.h"

namespace facegate {

/**
 * @brief One recognition event as stored in the audit log
 */
struct AuditRecord {
    uint64_t sequence = 0;          ///< Sequence id of the frame that produced the event
    std::string timestamp;          ///< Local wall clock, YYYY-MM-DD HH:MM:SS
    std::string identity;
    double confidence = 0.0;
    std::string status;             ///< "Recognized" or "Unknown"
    std::string actuatorState;      ///< "ON" or "OFF" after the evaluation

    nlohmann::json toJson() const;
};

/**
 * @brief Append-only store for recognition events
 */
class AuditLog : public SinkComponent {
public:
    explicit AuditLog(const std::string& id) : SinkComponent(id) {}

    /**
     * @brief Persist one record; safe to call from several threads
     */
    virtual Result<void> append(const AuditRecord& record) = 0;
};

/**
 * @brief AuditLog backed by a single SQLite table
 */
class SqliteAuditLog : public AuditLog {
public:
    /**
     * @brief Construct a new SQLite audit log
     *
     * @param id Component ID
     * @param dbPath Database file, created along with its directory if missing
     */
    SqliteAuditLog(const std::string& id, const std::string& dbPath);

    ~SqliteAuditLog() override;

    bool initialize() override;
    bool start() override;
    bool stop() override;
    nlohmann::json getStatus() const override;

    Result<void> append(const AuditRecord& record) override;

    /**
     * @brief Number of stored records
     */
    Result<int64_t> countRecords();

    /**
     * @brief Most recent records, newest first
     *
     * @param limit Maximum number of records
     */
    Result<std::vector<AuditRecord>> recentRecords(int limit);

private:
    bool createTables();
    void closeDatabase();

    std::string dbPath_;
    sqlite3* db_;
    std::mutex dbMutex_;
    std::atomic<bool> isInitialized_;

    std::atomic<uint64_t> appendedCount_{0};
    std::atomic<uint64_t> failedCount_{0};
};

} // namespace facegate
