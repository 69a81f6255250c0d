#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "seatbook/Config.h"

using namespace seatbook;

namespace {

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("seatbook_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string write(const std::string& name, const std::string& body) {
        auto path = dir_ / name;
        std::ofstream(path) << body;
        return path.string();
    }

    std::filesystem::path dir_;
};

} // namespace

TEST_F(ConfigFileTest, MissingYamlKeepsDefaults) {
    ServiceConfig c = ServiceConfig::fromYaml((dir_ / "absent.yml").string());
    ServiceConfig defaults;
    EXPECT_EQ(c.db_path, defaults.db_path);
    EXPECT_EQ(c.max_transaction_retries, 3);
    EXPECT_EQ(c.seat_price, 200);
    EXPECT_EQ(c.ws_port, 12345);
    EXPECT_TRUE(c.forbid_same_day);
}

TEST_F(ConfigFileTest, YamlOverridesSections) {
    std::string path = write("seatbook.yml",
        "database:\n"
        "  path: /var/lib/seatbook/seats.db\n"
        "  busy_timeout_ms: 1000\n"
        "booking:\n"
        "  max_transaction_retries: 5\n"
        "  forbid_same_day: false\n"
        "  admin_override_after_close: false\n"
        "seats:\n"
        "  price: 350\n"
        "notify:\n"
        "  jsonl_path: out/mail.jsonl\n"
        "  roster_recipient: owner@example.com\n"
        "ws:\n"
        "  port: 9000\n");

    ServiceConfig c = ServiceConfig::fromYaml(path);
    EXPECT_EQ(c.db_path, "/var/lib/seatbook/seats.db");
    EXPECT_EQ(c.busy_timeout_ms, 1000);
    EXPECT_EQ(c.max_transaction_retries, 5);
    EXPECT_FALSE(c.forbid_same_day);
    EXPECT_FALSE(c.admin_override_after_close);
    EXPECT_EQ(c.seat_price, 350);
    EXPECT_EQ(c.notifications_jsonl, "out/mail.jsonl");
    EXPECT_EQ(c.roster_recipient, "owner@example.com");
    EXPECT_EQ(c.ws_port, 9000);
    EXPECT_EQ(c.ws_host, "127.0.0.1");
    EXPECT_EQ(c.recent_window_days, 7);
}

TEST_F(ConfigFileTest, MalformedYamlThrows) {
    std::string path = write("broken.yml", "database: [unclosed\n");
    EXPECT_THROW(ServiceConfig::fromYaml(path), std::runtime_error);
}

TEST_F(ConfigFileTest, OutOfRangeValueFailsValidation) {
    std::string path = write("bad.yml", "seats:\n  price: -1\n");
    EXPECT_THROW(ServiceConfig::fromYaml(path), std::invalid_argument);
}

TEST_F(ConfigFileTest, JsonUsesSameLayout) {
    std::string path = write("seatbook.json", R"({
        "database": {"path": "seats.db"},
        "booking": {"retry_backoff_ms": 10},
        "events": {"recent_window_days": 14},
        "ws": {"host": "0.0.0.0", "port": 8080}
    })");

    ServiceConfig c = ServiceConfig::fromJson(path);
    EXPECT_EQ(c.db_path, "seats.db");
    EXPECT_EQ(c.retry_backoff_ms, 10);
    EXPECT_EQ(c.recent_window_days, 14);
    EXPECT_EQ(c.ws_host, "0.0.0.0");
    EXPECT_EQ(c.ws_port, 8080);
}

TEST_F(ConfigFileTest, MalformedJsonThrows) {
    std::string path = write("broken.json", "{\"database\": ");
    EXPECT_THROW(ServiceConfig::fromJson(path), std::runtime_error);
}

TEST(ServiceConfigTest, ValidateRejectsBadPort) {
    ServiceConfig c;
    c.ws_port = 70000;
    EXPECT_THROW(c.validate(), std::invalid_argument);
    c.ws_port = 8080;
    EXPECT_NO_THROW(c.validate());
}

TEST(ServiceConfigTest, AdminRolePinnedToLoopbackByDefault) {
    ServiceConfig c;
    EXPECT_TRUE(c.adminRoleAllowed(true));
    EXPECT_FALSE(c.adminRoleAllowed(false));

    c.ws_admin_loopback_only = false;
    EXPECT_TRUE(c.adminRoleAllowed(false));
}

TEST_F(ConfigFileTest, YamlCanOpenAdminRoleToRemoteClients) {
    std::string path = write("remote.yml", "ws:\n  admin_loopback_only: false\n");
    ServiceConfig c = ServiceConfig::fromYaml(path);
    EXPECT_FALSE(c.ws_admin_loopback_only);
    EXPECT_TRUE(c.adminRoleAllowed(false));
}

TEST(ServiceConfigTest, ValidateBoundsTotalRetrySleep) {
    ServiceConfig c;
    EXPECT_NO_THROW(c.validate());   // 25 * (1 + 2 + 3) = 150 ms

    c.max_transaction_retries = 10;
    c.retry_backoff_ms = 100;        // 5500 ms
    EXPECT_THROW(c.validate(), std::invalid_argument);

    c.retry_backoff_ms = 0;
    EXPECT_NO_THROW(c.validate());
}
