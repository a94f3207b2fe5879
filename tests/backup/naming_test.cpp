#include "mbk/backup/naming.hpp"

#include <gtest/gtest.h>

using mbk::backup::FileNamingStrategy;
using mbk::backup::generate_file_name;
using mbk::backup::sanitize_file_component;

namespace {

// 2024-01-02 03:04:05 UTC
const auto kTime = std::chrono::system_clock::from_time_t(1704164645);

} // namespace

TEST(NamingTest, DefaultPattern) {
    EXPECT_EQ(generate_file_name({}, "db01", "shop", kTime), "20240102_030405_shop_db01.tar.gz");
}

TEST(NamingTest, DisabledServerDropsSeparator) {
    FileNamingStrategy strategy;
    strategy.include_server_name = false;
    EXPECT_EQ(generate_file_name(strategy, "db01", "shop", kTime), "20240102_030405_shop.tar.gz");
}

TEST(NamingTest, DisabledDatabaseDropsSeparator) {
    FileNamingStrategy strategy;
    strategy.include_database_name = false;
    EXPECT_EQ(generate_file_name(strategy, "db01", "shop", kTime), "20240102_030405_db01.tar.gz");
}

TEST(NamingTest, EmptyValuesBehaveLikeDisabled) {
    EXPECT_EQ(generate_file_name({}, "", "", kTime), "20240102_030405.tar.gz");
}

TEST(NamingTest, CustomPatternAndDateFormat) {
    FileNamingStrategy strategy;
    strategy.pattern = "{server}-{database}-{timestamp}.sql.gz";
    strategy.date_format = "%Y-%m-%d";
    EXPECT_EQ(generate_file_name(strategy, "db01", "shop", kTime), "db01-shop-2024-01-02.sql.gz");
}

TEST(NamingTest, EmptyPatternFallsBackToDefault) {
    FileNamingStrategy strategy;
    strategy.pattern.clear();
    strategy.date_format.clear();
    EXPECT_EQ(generate_file_name(strategy, "db01", "shop", kTime), "20240102_030405_shop_db01.tar.gz");
}

TEST(NamingTest, NothingLeftUsesBackupPrefix) {
    FileNamingStrategy strategy;
    strategy.pattern = "{server}";
    strategy.include_server_name = false;
    EXPECT_EQ(generate_file_name(strategy, "db01", "shop", kTime), "backup_20240102_030405.tar.gz");
}

TEST(NamingTest, UnsafeCharactersAreReplaced) {
    EXPECT_EQ(sanitize_file_component("db 01/../x"), "db_01_.._x");
    EXPECT_EQ(generate_file_name({}, "web/1", "my shop", kTime), "20240102_030405_my_shop_web_1.tar.gz");
}
