/**
 * @file rollback_selector.hpp
 * @brief Ledger driven rollback of a container or compose service
 *
 * The ledger is searched under the given name and, for compose managed
 * targets, under the service name. Every identity the target ran or was
 * recreated from is offered once, newest first; the chosen identity is
 * re-run through the recreate protocol as a digest override.
 *
 * @date 2025
 */

#pragma once

#include "redock/core/recreate_protocol.hpp"
#include "redock/core/types.hpp"
#include "redock/ledger/history_log.hpp"
#include "redock/runtime/container_runtime.hpp"

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace redock {
namespace core {

/**
 * @class RollbackSelector
 * @brief Interactive version selection for rollback
 *
 * **Usage Example**:
 * @code
 * RollbackSelector selector(docker, ledger, protocol, std::cin, std::cout);
 * auto result = selector.Rollback("web");  // prompts for a menu entry
 * @endcode
 */
class RollbackSelector {
public:
    struct Config {
        std::size_t history_limit{5};  ///< Menu entries offered
    };

    RollbackSelector(runtime::ContainerRuntime& runtime,
                     const ledger::HistoryLog& ledger,
                     RecreateProtocol& protocol,
                     std::istream& input,
                     std::ostream& output);
    RollbackSelector(runtime::ContainerRuntime& runtime,
                     const ledger::HistoryLog& ledger,
                     RecreateProtocol& protocol,
                     std::istream& input,
                     std::ostream& output,
                     const Config& config);

    /**
     * @brief Prompt for a previous version of `name` and recreate it
     *
     * @return Result whose outcome is ROLLBACK_SUCCESS or ROLLBACK_FAIL
     * @throws NotFound when the ledger holds no candidate for the name
     * @throws ContainerNotFound when no live container or service matches the name
     * @throws InputError on a non-numeric or out of range selection
     */
    TargetResult Rollback(const std::string& name);

    /**
     * @brief Rollback candidates, newest first
     *
     * UPDATE, SKIP_PINNED, ROLLBACK_SUCCESS and RECREATE_FAIL records under any
     * of the names, with a pullable content digest identity, one entry per
     * identity.
     */
    std::vector<LogRecord> Candidates(const std::set<std::string>& logical_names) const;

    /// Parse a 1-based menu selection; throws InputError
    static std::size_t ParseSelection(const std::string& text, std::size_t count);

private:
    runtime::ContainerRuntime& runtime_;
    const ledger::HistoryLog& ledger_;
    RecreateProtocol& protocol_;
    std::istream& input_;
    std::ostream& output_;
    Config config_;

    /// Live context of the target and the names its history is filed under
    std::optional<TargetContext> Locate(const std::string& name, std::set<std::string>& logical_names) const;

    /**
     * @brief Whether the record's identity can be pulled as repo@identity
     *
     * Image IDs logged for locally known images are replaced by the image's
     * registry digest; IDs of images without one are rejected.
     */
    bool PullableIdentity(LogRecord& record) const;

    void PrintMenu(const std::string& name, const std::vector<LogRecord>& candidates) const;
};

} // namespace core
} // namespace redock
