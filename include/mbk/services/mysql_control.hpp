#pragma once

#include "mbk/backup/types.hpp"
#include "mbk/core/cancellation.hpp"
#include "mbk/core/error.hpp"
#include "mbk/network/retry_service.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace mbk::services {

/**
 * @brief Lifecycle control of the local MySQL instance
 *
 * Failures are reported as MySqlService (Validation for a bad service
 * name, Timeout for a command that overran its deadline) so the
 * orchestrator can tell them apart from transfer errors.
 */
class MySqlController {
public:
    virtual ~MySqlController() = default;

    virtual Outcome<void> stop_instance(const std::string& service_name) = 0;
    virtual Outcome<void> start_instance(const std::string& service_name) = 0;

    /// Succeeds once the server accepts connections, or fails after @p timeout.
    virtual Outcome<void> verify_instance_availability(const backup::MySqlConnectionInfo& connection,
                                                       std::chrono::seconds timeout,
                                                       const core::CancellationToken& cancel = {}) = 0;
};

/// Runs a shell command and returns its exit status, or Timeout once @p timeout passes.
using CommandRunner = std::function<Outcome<int>(const std::string& command, std::chrono::milliseconds timeout)>;

struct ServiceCommandOptions {
    std::string stop_command = "systemctl stop {service}";
    std::string start_command = "systemctl start {service}";
    std::chrono::milliseconds command_timeout{60000};
    std::chrono::milliseconds probe_interval{1000};
};

/**
 * @brief Controls MySQL through service manager commands
 *
 * "{service}" in the command templates is replaced with the service name,
 * which must match [A-Za-z0-9_-]+. Availability is a TCP connect to the
 * configured host and port.
 */
class ServiceCommandMySqlController : public MySqlController {
public:
    ServiceCommandMySqlController(ServiceCommandOptions options,
                                  const network::NetworkRetryService& network,
                                  CommandRunner runner = {});

    Outcome<void> stop_instance(const std::string& service_name) override;
    Outcome<void> start_instance(const std::string& service_name) override;
    Outcome<void> verify_instance_availability(const backup::MySqlConnectionInfo& connection,
                                               std::chrono::seconds timeout,
                                               const core::CancellationToken& cancel = {}) override;

    [[nodiscard]] static bool is_valid_service_name(const std::string& service_name);

private:
    Outcome<void> run_template(const std::string& command_template, const std::string& service_name, const char* action);

    ServiceCommandOptions options_;
    const network::NetworkRetryService& network_;
    CommandRunner runner_;
};

} // namespace mbk::services
