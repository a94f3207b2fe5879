#include "mbk/services/mysql_control.hpp"

#include <gtest/gtest.h>

#include <boost/asio.hpp>

#include <chrono>
#include <string>
#include <vector>

using mbk::ErrorCode;
using mbk::backup::MySqlConnectionInfo;
using mbk::network::NetworkRetryService;
using mbk::services::ServiceCommandMySqlController;
using mbk::services::ServiceCommandOptions;

namespace asio = boost::asio;

namespace {

struct RecordingRunner {
    std::vector<std::string> commands;
    std::vector<std::chrono::milliseconds> timeouts;
    int exit_code = 0;
    bool hang = false;

    mbk::services::CommandRunner runner() {
        return [this](const std::string& command, std::chrono::milliseconds timeout) -> mbk::Outcome<int> {
            commands.push_back(command);
            timeouts.push_back(timeout);
            if (hang) {
                return mbk::Fail<int>(ErrorCode::Timeout, "'" + command + "' did not finish");
            }
            return mbk::Ok(exit_code);
        };
    }
};

ServiceCommandOptions fast_options() {
    ServiceCommandOptions options;
    options.probe_interval = std::chrono::milliseconds(50);
    return options;
}

} // namespace

TEST(MySqlControlTest, SubstitutesServiceName) {
    NetworkRetryService network;
    RecordingRunner recorder;
    ServiceCommandMySqlController mysql(fast_options(), network, recorder.runner());

    ASSERT_TRUE(mysql.stop_instance("mysql-8_0").is_ok());
    ASSERT_TRUE(mysql.start_instance("mysql-8_0").is_ok());

    ASSERT_EQ(recorder.commands.size(), 2u);
    EXPECT_EQ(recorder.commands[0], "systemctl stop mysql-8_0");
    EXPECT_EQ(recorder.commands[1], "systemctl start mysql-8_0");
    EXPECT_EQ(recorder.timeouts[0], std::chrono::milliseconds(60000));
}

TEST(MySqlControlTest, HungCommandIsTimeout) {
    NetworkRetryService network;
    RecordingRunner recorder;
    recorder.hang = true;
    ServiceCommandMySqlController mysql(fast_options(), network, recorder.runner());

    auto stopped = mysql.stop_instance("mysql");
    ASSERT_TRUE(stopped.is_error());
    EXPECT_EQ(stopped.error().code, ErrorCode::Timeout);
}

TEST(MySqlControlTest, ShellCommandsReportExitCodes) {
    NetworkRetryService network;
    auto options = fast_options();
    options.stop_command = "true {service}";
    options.start_command = "sh -c 'exit 3' {service}";
    ServiceCommandMySqlController mysql(options, network);

    EXPECT_TRUE(mysql.stop_instance("mysql").is_ok());
    auto started = mysql.start_instance("mysql");
    ASSERT_TRUE(started.is_error());
    EXPECT_EQ(started.error().code, ErrorCode::MySqlService);
    EXPECT_NE(started.error().message.find("exit code 3"), std::string::npos);
}

TEST(MySqlControlTest, BlockingShellCommandIsKilledAtDeadline) {
    NetworkRetryService network;
    auto options = fast_options();
    options.stop_command = "sleep 30; echo {service}";
    options.command_timeout = std::chrono::milliseconds(300);
    ServiceCommandMySqlController mysql(options, network);

    const auto started = std::chrono::steady_clock::now();
    auto stopped = mysql.stop_instance("mysql");
    const auto took = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(stopped.is_error());
    EXPECT_EQ(stopped.error().code, ErrorCode::Timeout);
    EXPECT_LT(took, std::chrono::seconds(10));
}

TEST(MySqlControlTest, CustomTemplates) {
    NetworkRetryService network;
    RecordingRunner recorder;
    auto options = fast_options();
    options.stop_command = "service {service} stop && echo {service}";
    ServiceCommandMySqlController mysql(options, network, recorder.runner());

    ASSERT_TRUE(mysql.stop_instance("mysqld").is_ok());
    EXPECT_EQ(recorder.commands.at(0), "service mysqld stop && echo mysqld");
}

TEST(MySqlControlTest, NonZeroExitIsServiceError) {
    NetworkRetryService network;
    RecordingRunner recorder;
    recorder.exit_code = 5;
    ServiceCommandMySqlController mysql(fast_options(), network, recorder.runner());

    auto stopped = mysql.stop_instance("mysql");
    ASSERT_TRUE(stopped.is_error());
    EXPECT_EQ(stopped.error().code, ErrorCode::MySqlService);
    EXPECT_NE(stopped.error().message.find("exit code 5"), std::string::npos);
}

TEST(MySqlControlTest, RejectsShellMetacharactersInServiceName) {
    NetworkRetryService network;
    RecordingRunner recorder;
    ServiceCommandMySqlController mysql(fast_options(), network, recorder.runner());

    auto stopped = mysql.stop_instance("mysql; rm -rf /");
    ASSERT_TRUE(stopped.is_error());
    EXPECT_EQ(stopped.error().code, ErrorCode::Validation);
    EXPECT_TRUE(recorder.commands.empty());
}

TEST(MySqlControlTest, AvailabilityUsesTcpConnect) {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));

    NetworkRetryService network;
    ServiceCommandMySqlController mysql(fast_options(), network);

    MySqlConnectionInfo connection;
    connection.host = "127.0.0.1";
    connection.port = acceptor.local_endpoint().port();

    EXPECT_TRUE(mysql.verify_instance_availability(connection, std::chrono::seconds(2)).is_ok());
}

TEST(MySqlControlTest, UnreachableInstanceFailsAfterTimeout) {
    std::uint16_t port = 0;
    {
        asio::io_context io;
        asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }

    NetworkRetryService network;
    ServiceCommandMySqlController mysql(fast_options(), network);

    MySqlConnectionInfo connection;
    connection.host = "127.0.0.1";
    connection.port = port;

    auto available = mysql.verify_instance_availability(connection, std::chrono::seconds(1));
    ASSERT_TRUE(available.is_error());
    EXPECT_EQ(available.error().code, ErrorCode::MySqlService);
}
