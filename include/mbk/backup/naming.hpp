#pragma once

#include "mbk/backup/types.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace mbk::backup {

/**
 * @brief Expand a naming pattern into a backup file name
 *
 * {timestamp} is rendered in UTC with strategy.date_format. A placeholder
 * that is disabled (or whose value is empty) is dropped along with one
 * neighbouring '_' or '-'. Substituted values are restricted to
 * [A-Za-z0-9._-]; everything else becomes '_'.
 *
 * EXAMPLE:
 * generate_file_name({}, "db01", "shop", t) -> "20240102_030405_shop_db01.tar.gz"
 */
[[nodiscard]] std::string generate_file_name(const FileNamingStrategy& strategy,
                                             std::string_view server_name,
                                             std::string_view database_name,
                                             std::chrono::system_clock::time_point time);

[[nodiscard]] std::string sanitize_file_component(std::string_view value);

} // namespace mbk::backup
