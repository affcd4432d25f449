/**
 * @file history_log.cpp
 * @brief Ledger formatting, parsing, append and query
 *
 * The ledger is opened in append mode for every write and never rewritten.
 * Queries scan the whole file: the tool runs a handful of times a day and
 * keeps no index.
 *
 * @date 2025
 */

#include "redock/ledger/history_log.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace redock {
namespace ledger {

namespace {

constexpr char kSeparator = '|';
constexpr std::size_t kFieldCount = 5;

std::string EscapeField(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case kSeparator: out += "\\|"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::vector<std::string> SplitFields(const std::string& line) {
    std::vector<std::string> fields(1);
    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\\' && i + 1 < line.size()) {
            char next = line[++i];
            switch (next) {
                case 'n': fields.back() += '\n'; break;
                case 'r': fields.back() += '\r'; break;
                default: fields.back() += next; break;
            }
        } else if (c == kSeparator) {
            fields.emplace_back();
        } else {
            fields.back() += c;
        }
    }
    return fields;
}

} // anonymous namespace

HistoryLog::HistoryLog(std::filesystem::path path)
    : path_(std::move(path)) {
}

void HistoryLog::Append(const core::LogRecord& record) const {
    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw std::runtime_error("Cannot open ledger '" + path_.string() + "' for append");
    }

    out << FormatLine(record) << '\n';
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write ledger '" + path_.string() + "'");
    }

    spdlog::debug("[LEDGER] {} {} {}", record.logical_name,
                  core::ActionKindToString(record.kind), record.image_reference);
}

std::vector<core::LogRecord> HistoryLog::Query(const std::set<std::string>& logical_names,
                                               const std::set<core::ActionKind>& kinds,
                                               std::size_t limit) const {
    std::vector<core::LogRecord> matches;
    for (auto& record : ReadAll()) {
        if (!logical_names.empty() && logical_names.count(record.logical_name) == 0) continue;
        if (!kinds.empty() && kinds.count(record.kind) == 0) continue;
        matches.push_back(std::move(record));
    }

    std::reverse(matches.begin(), matches.end());
    if (matches.size() > limit) {
        matches.resize(limit);
    }
    return matches;
}

std::vector<core::LogRecord> HistoryLog::ReadAll() const {
    std::vector<core::LogRecord> records;

    std::ifstream in(path_);
    if (!in) {
        return records;
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (line.empty()) continue;

        auto record = ParseLine(line);
        if (!record) {
            spdlog::warn("Skipping malformed ledger line {} in {}", line_number, path_.string());
            continue;
        }
        records.push_back(std::move(*record));
    }
    return records;
}

bool HistoryLog::Exists() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path_, ec);
}

core::LogRecord HistoryLog::MakeRecord(const std::string& logical_name,
                                       const std::string& image_reference,
                                       const std::string& identity,
                                       core::ActionKind kind) {
    core::LogRecord record;
    record.timestamp = CurrentTimestamp();
    record.logical_name = logical_name;
    record.image_reference = image_reference;
    record.identity = identity;
    record.kind = kind;
    return record;
}

std::string HistoryLog::FormatLine(const core::LogRecord& record) {
    std::ostringstream line;
    line << EscapeField(record.timestamp) << kSeparator
         << EscapeField(record.logical_name) << kSeparator
         << EscapeField(record.image_reference) << kSeparator
         << EscapeField(record.identity) << kSeparator
         << core::ActionKindToString(record.kind);
    return line.str();
}

std::optional<core::LogRecord> HistoryLog::ParseLine(const std::string& line) {
    auto fields = SplitFields(line);
    if (fields.size() != kFieldCount) {
        return std::nullopt;
    }

    auto kind = core::ParseActionKind(fields[4]);
    if (!kind) {
        return std::nullopt;
    }

    core::LogRecord record;
    record.timestamp = fields[0];
    record.logical_name = fields[1];
    record.image_reference = fields[2];
    record.identity = fields[3];
    record.kind = *kind;
    return record;
}

std::string HistoryLog::CurrentTimestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S%z");
    return oss.str();
}

} // namespace ledger
} // namespace redock
