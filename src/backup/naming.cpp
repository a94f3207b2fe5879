#include "mbk/backup/naming.hpp"

#include <array>
#include <cctype>
#include <ctime>

namespace mbk::backup {
namespace {

constexpr std::string_view kTimestamp = "{timestamp}";
constexpr std::string_view kDatabase = "{database}";
constexpr std::string_view kServer = "{server}";

bool is_separator(char c) {
    return c == '_' || c == '-';
}

std::string format_time(const std::string& format, std::chrono::system_clock::time_point time) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::array<char, 128> buffer{};
    const auto written = std::strftime(buffer.data(), buffer.size(), format.c_str(), &utc);
    return std::string(buffer.data(), written);
}

void replace_placeholder(std::string& name, std::string_view placeholder, const std::string& value) {
    for (auto pos = name.find(placeholder); pos != std::string::npos; pos = name.find(placeholder, pos)) {
        name.erase(pos, placeholder.size());
        if (!value.empty()) {
            name.insert(pos, value);
            pos += value.size();
            continue;
        }
        if (pos < name.size() && is_separator(name[pos])) {
            name.erase(pos, 1);
        } else if (pos > 0 && is_separator(name[pos - 1])) {
            name.erase(pos - 1, 1);
            --pos;
        }
    }
}

void collapse_separators(std::string& name) {
    for (const std::string_view doubled : {std::string_view("__"), std::string_view("--")}) {
        for (auto pos = name.find(doubled); pos != std::string::npos; pos = name.find(doubled, pos)) {
            name.erase(pos, 1);
        }
    }
}

void trim(std::string& name) {
    const auto is_trimmed = [](char c) { return c == '_' || c == '-' || c == '.' || c == ' '; };
    while (!name.empty() && is_trimmed(name.front())) {
        name.erase(name.begin());
    }
    while (!name.empty() && is_trimmed(name.back())) {
        name.pop_back();
    }
}

} // namespace

std::string sanitize_file_component(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        const auto uc = static_cast<unsigned char>(c);
        out.push_back(std::isalnum(uc) || c == '.' || c == '_' || c == '-' ? c : '_');
    }
    return out;
}

std::string generate_file_name(const FileNamingStrategy& strategy,
                               std::string_view server_name,
                               std::string_view database_name,
                               std::chrono::system_clock::time_point time) {
    const FileNamingStrategy defaults;
    const std::string& format = strategy.date_format.empty() ? defaults.date_format : strategy.date_format;
    const std::string timestamp = sanitize_file_component(format_time(format, time));

    std::string name = strategy.pattern.empty() ? defaults.pattern : strategy.pattern;
    replace_placeholder(name, kTimestamp, timestamp);
    replace_placeholder(name, kDatabase,
                        strategy.include_database_name ? sanitize_file_component(database_name) : std::string());
    replace_placeholder(name, kServer,
                        strategy.include_server_name ? sanitize_file_component(server_name) : std::string());

    collapse_separators(name);
    trim(name);

    if (name.empty()) {
        return "backup_" + timestamp + ".tar.gz";
    }
    return name;
}

} // namespace mbk::backup
