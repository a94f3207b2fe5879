#include "mbk/backup/validation.hpp"

#include "mbk/services/mysql_control.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace mbk::backup {
namespace fs = std::filesystem;

namespace {

bool is_valid_port(std::uint32_t port) {
    return port >= 1 && port <= 65535;
}

bool is_valid_host(const std::string& host) {
    if (host.empty() || host.find("..") != std::string::npos) {
        return false;
    }
    return std::none_of(host.begin(), host.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace

ValidationReport validate_configuration(const BackupConfiguration& config, const ValidationOptions& options) {
    ValidationReport report;
    auto& errors = report.errors;

    if (!config.active) {
        errors.emplace_back("Configuration '" + config.name + "' is inactive");
    }

    // MySQL source
    const auto& mysql = config.mysql;
    if (mysql.username.empty()) {
        errors.emplace_back("MySQL username is required");
    }
    if (mysql.service_name.empty()) {
        errors.emplace_back("MySQL service name is required");
    } else if (!services::ServiceCommandMySqlController::is_valid_service_name(mysql.service_name)) {
        errors.emplace_back("MySQL service name '" + mysql.service_name + "' contains invalid characters");
    }
    if (!is_valid_host(mysql.host)) {
        errors.emplace_back("MySQL host '" + mysql.host + "' is not a valid host name");
    }
    if (!is_valid_port(mysql.port)) {
        errors.emplace_back("MySQL port " + std::to_string(mysql.port) + " is out of range");
    }
    if (mysql.data_directory.empty()) {
        errors.emplace_back("MySQL data directory is required");
    } else {
        std::error_code ec;
        if (!fs::is_directory(mysql.data_directory, ec)) {
            errors.emplace_back("MySQL data directory '" + mysql.data_directory + "' does not exist");
        }
    }

    // Target
    const auto& target = config.target;
    if (target.host.empty() || target.host == "0.0.0.0") {
        errors.emplace_back("Target host '" + target.host + "' is not a valid destination");
    }
    if (!is_valid_port(target.port)) {
        errors.emplace_back("Target port " + std::to_string(target.port) + " is out of range");
    }
    if (config.target_directory.empty()) {
        errors.emplace_back("Target directory is required");
    }

    if (config.encryption.enabled && config.encryption.password.empty()) {
        errors.emplace_back("Encryption is enabled but no password is set");
    }

    // Warnings
    if (config.naming && config.naming->pattern.empty()) {
        report.warnings.emplace_back("Naming pattern is empty, the default pattern will be used");
    }
    if (!options.work_directory.empty()) {
        std::error_code ec;
        const auto space = fs::space(options.work_directory, ec);
        if (!ec && space.available < options.min_free_bytes) {
            report.warnings.emplace_back("Only " + std::to_string(space.available / (1024 * 1024)) +
                                         " MiB free in work directory " + options.work_directory.string());
        }
    }

    return report;
}

} // namespace mbk::backup
