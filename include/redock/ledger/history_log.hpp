/**
 * @file history_log.hpp
 * @brief Append-only ledger of every reconciliation decision
 *
 * One record per line:
 * @code
 * 2025-03-01T10:15:02+0100|web|nginx:1.27|sha256:4f2a...|UPDATE
 * @endcode
 * '|' never occurs in container names, service names, image references,
 * identities or timestamps; fields are still backslash-escaped so a malformed
 * value can never shift columns.
 *
 * **Concurrency**: single writer. Concurrent invocations are not coordinated
 * and may interleave lines.
 *
 * @date 2025
 */

#pragma once

#include "redock/core/types.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace redock {
namespace ledger {

/**
 * @class HistoryLog
 * @brief Ledger file access (append + full-scan query)
 *
 * **Usage Example**:
 * @code
 * HistoryLog log("/var/log/redock/history.log");
 * log.Append(HistoryLog::MakeRecord("web", "nginx:1.27", "sha256:...", ActionKind::UPDATE));
 *
 * auto recent = log.Query({"web"}, {ActionKind::UPDATE}, 5);  // newest first
 * @endcode
 */
class HistoryLog {
public:
    explicit HistoryLog(std::filesystem::path path);

    /**
     * @brief Append exactly one record
     * @throws std::runtime_error if the ledger cannot be opened or written
     */
    void Append(const core::LogRecord& record) const;

    /**
     * @brief Most recent matching records, most-recent-first
     *
     * @param logical_names Accepted logical names (empty = any)
     * @param kinds Accepted action kinds (empty = any)
     * @param limit Maximum number of records returned
     */
    std::vector<core::LogRecord> Query(const std::set<std::string>& logical_names,
                                       const std::set<core::ActionKind>& kinds,
                                       std::size_t limit) const;

    /// Every parsable record in append order
    std::vector<core::LogRecord> ReadAll() const;

    bool Exists() const;

    const std::filesystem::path& path() const { return path_; }

    /// Record stamped with the current local time
    static core::LogRecord MakeRecord(const std::string& logical_name,
                                      const std::string& image_reference,
                                      const std::string& identity,
                                      core::ActionKind kind);

    static std::string FormatLine(const core::LogRecord& record);

    /// std::nullopt for lines without five fields or with an unknown kind
    static std::optional<core::LogRecord> ParseLine(const std::string& line);

    /// %Y-%m-%dT%H:%M:%S%z in local time
    static std::string CurrentTimestamp();

private:
    std::filesystem::path path_;
};

} // namespace ledger
} // namespace redock
