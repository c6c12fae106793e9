#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

#include "wilab/core/config.hpp"

using namespace testing;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

namespace wilab::core::tests {

class WilabConfigTest : public Test {
protected:
    nlohmann::json MinimalConfig() const
    {
        return nlohmann::json {
            {"auth_token", "secret-token"},
            {"dhcp_base_network", "192.168.120.0/24"},
            {"networks", {{{"net_id", "ap-1"}, {"interface", "wlan1"}}, {{"net_id", "ap-2"}, {"interface", "wlan2"}}}},
        };
    }

    std::string LoadError(const nlohmann::json& j) const
    {
        try {
            WilabConfig::from_json(j);
        } catch (const std::invalid_argument& e) {
            return e.what();
        }

        return "";
    }
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(WilabConfigTest, AppliesDefaults)
{
    auto config = WilabConfig::from_json(MinimalConfig());

    EXPECT_EQ(config->api_host, "0.0.0.0");
    EXPECT_EQ(config->api_port, 8080);
    EXPECT_EQ(config->default_timeout, 3600);
    EXPECT_EQ(config->min_timeout, 60);
    EXPECT_EQ(config->max_timeout, 86400);
    EXPECT_EQ(config->upstream_interface, "auto");
    EXPECT_EQ(config->dns_server, "8.8.8.8");
    EXPECT_TRUE(config->internet_enabled_by_default);
    EXPECT_EQ(config->country_code, "IT");
    EXPECT_EQ(config->expiry_check_interval, 5);
    EXPECT_EQ(config->runtime_dir, "/tmp/wilab");
    EXPECT_EQ(config->daemon.ready_attempts, 10);
    EXPECT_EQ(config->daemon.command_timeout_ms, 15000);
    ASSERT_EQ(config->networks.size(), 2u);
    EXPECT_EQ(config->networks[1].interface, "wlan2");
}

TEST_F(WilabConfigTest, ReadsOverrides)
{
    auto j                           = MinimalConfig();
    j["api_port"]                    = 9090;
    j["upstream_interface"]          = "eth0";
    j["internet_enabled_by_default"] = false;
    j["logging"]                     = {{"log_level", "DEBUG"}, {"log_file", "/var/log/wilab.log"}};
    j["daemon"]                      = {{"ready_attempts", 3}, {"stop_grace_ms", 100}};

    auto config = WilabConfig::from_json(j);

    EXPECT_EQ(config->api_port, 9090);
    EXPECT_EQ(config->upstream_interface, "eth0");
    EXPECT_FALSE(config->internet_enabled_by_default);
    EXPECT_EQ(config->logging.log_level, "DEBUG");
    EXPECT_EQ(config->logging.log_file, "/var/log/wilab.log");
    EXPECT_EQ(config->daemon.ready_attempts, 3);
    EXPECT_EQ(config->daemon.stop_grace_ms, 100);
    EXPECT_EQ(config->daemon.ready_interval_ms, 500);
}

TEST_F(WilabConfigTest, RequiresMandatoryFields)
{
    auto j = MinimalConfig();
    j.erase("auth_token");
    EXPECT_THAT(LoadError(j), HasSubstr("auth_token"));

    j = MinimalConfig();
    j.erase("networks");
    EXPECT_THAT(LoadError(j), HasSubstr("networks"));

    j             = MinimalConfig();
    j["networks"] = nlohmann::json::array();
    EXPECT_THAT(LoadError(j), HasSubstr("at least one"));

    j                            = MinimalConfig();
    j["networks"][1].erase("interface");
    EXPECT_THAT(LoadError(j), HasSubstr("networks[1].interface"));
}

TEST_F(WilabConfigTest, RejectsShortToken)
{
    auto j          = MinimalConfig();
    j["auth_token"] = "short";

    EXPECT_THAT(LoadError(j), HasSubstr("auth_token"));
}

TEST_F(WilabConfigTest, RejectsUnorderedTimeouts)
{
    auto j               = MinimalConfig();
    j["default_timeout"] = 30;

    EXPECT_THAT(LoadError(j), HasSubstr("min_timeout <= default_timeout <= max_timeout"));
}

TEST_F(WilabConfigTest, RejectsBadNetIdAndDuplicates)
{
    auto j                      = MinimalConfig();
    j["networks"][0]["net_id"]  = "AP_1";
    EXPECT_THAT(LoadError(j), HasSubstr("networks[0].net_id"));

    j                           = MinimalConfig();
    j["networks"][1]["net_id"]  = "ap-1";
    EXPECT_THAT(LoadError(j), HasSubstr("duplicates"));

    j                              = MinimalConfig();
    j["networks"][1]["interface"]  = "wlan1";
    EXPECT_THAT(LoadError(j), HasSubstr("networks[1].interface duplicates"));
}

TEST_F(WilabConfigTest, RejectsBadBaseNetwork)
{
    auto j                 = MinimalConfig();
    j["dhcp_base_network"] = "192.168.120.0/16";
    EXPECT_THAT(LoadError(j), HasSubstr("dhcp_base_network"));

    j                      = MinimalConfig();
    j["dhcp_base_network"] = "192.168.255.0/24";
    EXPECT_THAT(LoadError(j), HasSubstr("Too many networks"));
}

TEST_F(WilabConfigTest, RejectsWrongFieldType)
{
    auto j        = MinimalConfig();
    j["api_port"] = "8080";

    EXPECT_THAT(LoadError(j), HasSubstr("Invalid field type"));
}

TEST_F(WilabConfigTest, LoadsFromFile)
{
    auto path = std::filesystem::temp_directory_path() / "wilab_config_test.json";
    {
        std::ofstream file(path);
        file << MinimalConfig().dump(2);
    }

    auto config = WilabConfig::from_file(path.string());
    EXPECT_EQ(config->find_network("ap-2")->interface, "wlan2");
    EXPECT_EQ(config->find_network("ap-3"), nullptr);

    std::filesystem::remove(path);
}

TEST_F(WilabConfigTest, ReportsMissingFileAndBadJson)
{
    EXPECT_THROW(WilabConfig::from_file("/nonexistent/wilab.json"), std::runtime_error);

    auto path = std::filesystem::temp_directory_path() / "wilab_config_bad.json";
    {
        std::ofstream file(path);
        file << "{ not json";
    }

    EXPECT_THROW(WilabConfig::from_file(path.string()), std::runtime_error);
    std::filesystem::remove(path);
}

TEST_F(WilabConfigTest, SerializesBack)
{
    auto config = WilabConfig::from_json(MinimalConfig());
    auto j      = config->to_json();

    EXPECT_EQ(j["networks"].size(), 2u);
    EXPECT_EQ(j["daemon"]["txpower_settle_ms"], 3000);
    EXPECT_FALSE(j["logging"].contains("log_file"));
}

} // namespace wilab::core::tests
