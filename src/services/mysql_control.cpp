#include "mbk/services/mysql_control.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <system_error>

namespace mbk::services {

namespace bp = boost::process;

namespace {

/// Runs @p command under /bin/sh in its own process group; the group is killed at the deadline.
Outcome<int> run_with_shell(const std::string& command, std::chrono::milliseconds timeout) {
    boost::asio::io_context io;
    bp::group group;
    bool exited = false;
    int exit_code = -1;

    std::error_code launch_error;
    bp::child child("/bin/sh", "-c", command, group, io,
                    bp::on_exit([&exited, &exit_code](int code, const std::error_code& ec) {
                        exited = !ec;
                        exit_code = code;
                    }),
                    launch_error);
    if (launch_error) {
        return Fail<int>(ErrorCode::MySqlService, "Cannot run '" + command + "': " + launch_error.message());
    }

    io.run_for(timeout);
    if (!exited) {
        std::error_code ignored;
        group.terminate(ignored);
        child.wait(ignored);
        return Fail<int>(ErrorCode::Timeout,
                         "'" + command + "' did not finish within " + std::to_string(timeout.count()) + "ms");
    }
    return Ok(exit_code);
}

std::string substitute(std::string text, const std::string& placeholder, const std::string& value) {
    for (auto pos = text.find(placeholder); pos != std::string::npos; pos = text.find(placeholder, pos + value.size())) {
        text.replace(pos, placeholder.size(), value);
    }
    return text;
}

} // anonymous namespace

ServiceCommandMySqlController::ServiceCommandMySqlController(ServiceCommandOptions options,
                                                             const network::NetworkRetryService& network,
                                                             CommandRunner runner)
    : options_(std::move(options))
    , network_(network)
    , runner_(runner ? std::move(runner) : CommandRunner(run_with_shell)) {
}

bool ServiceCommandMySqlController::is_valid_service_name(const std::string& service_name) {
    return !service_name.empty() &&
           std::all_of(service_name.begin(), service_name.end(), [](unsigned char c) {
               return std::isalnum(c) || c == '_' || c == '-';
           });
}

Outcome<void> ServiceCommandMySqlController::stop_instance(const std::string& service_name) {
    return run_template(options_.stop_command, service_name, "stop");
}

Outcome<void> ServiceCommandMySqlController::start_instance(const std::string& service_name) {
    return run_template(options_.start_command, service_name, "start");
}

Outcome<void> ServiceCommandMySqlController::run_template(const std::string& command_template,
                                                          const std::string& service_name,
                                                          const char* action) {
    if (!is_valid_service_name(service_name)) {
        return Fail<void>(ErrorCode::Validation, "Invalid MySQL service name '" + service_name + "'");
    }

    const auto command = substitute(command_template, "{service}", service_name);
    spdlog::info("MySQL {}: {}", action, command);

    auto exited = runner_(command, options_.command_timeout);
    if (exited.is_error()) {
        spdlog::error("MySQL {} of '{}' failed: {}", action, service_name, exited.error().message);
        return Err<void>(exited.error());
    }
    const int exit_code = exited.value();
    if (exit_code != 0) {
        return Fail<void>(ErrorCode::MySqlService,
                          std::string("Failed to ") + action + " MySQL service '" + service_name +
                          "' (exit code " + std::to_string(exit_code) + ")");
    }
    return Ok();
}

Outcome<void> ServiceCommandMySqlController::verify_instance_availability(const backup::MySqlConnectionInfo& connection,
                                                                          std::chrono::seconds timeout,
                                                                          const core::CancellationToken& cancel) {
    const auto max_wait = std::chrono::duration_cast<std::chrono::milliseconds>(timeout);
    if (network_.wait_for_connectivity(connection.host, connection.port, max_wait, cancel, options_.probe_interval)) {
        spdlog::info("MySQL at {}:{} is accepting connections", connection.host, connection.port);
        return Ok();
    }
    if (cancel.is_cancelled()) {
        return Fail<void>(ErrorCode::Cancelled, "MySQL availability check cancelled");
    }
    return Fail<void>(ErrorCode::MySqlService,
                      "MySQL at " + connection.host + ":" + std::to_string(connection.port) +
                      " not available within " + std::to_string(timeout.count()) + "s");
}

} // namespace mbk::services
