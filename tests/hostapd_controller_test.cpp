#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "wilab/core/config.hpp"
#include "wilab/infrastructure/hostapd_controller.hpp"

#include "mocks/command_runner_mock.hpp"
#include "mocks/fake_process.hpp"

using namespace testing;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

namespace wilab::infrastructure::tests {

using wilab::tests::FakeProcessLauncher;
using wilab::tests::MockCommandRunner;

class HostapdControllerTest : public Test {
public:
    void SetUp() override
    {
        mRuntimeDir = std::filesystem::temp_directory_path() / "wilab-hostapd-test";
        std::filesystem::remove_all(mRuntimeDir);

        mConfig.runtime_dir              = mRuntimeDir.string();
        mConfig.country_code             = "IT";
        mConfig.daemon.ready_attempts    = 3;
        mConfig.daemon.ready_interval_ms = 0;
        mConfig.daemon.stop_grace_ms     = 0;
        mConfig.daemon.txpower_settle_ms = 0;

        mRunner   = std::make_shared<NiceMock<MockCommandRunner>>();
        mLauncher = std::make_shared<FakeProcessLauncher>();

        mRunner->Script("iw dev wlan1 info", 0, "Interface wlan1\n\ttype AP\n\twiphy 0\n\ttxpower 20.00 dBm\n");
        mRunner->Script("iw wlan1 info", 0, "Interface wlan1\n\twiphy 0\n");
        mRunner->Script("iw phy0 info", 0,
            "\tSupported interface modes:\n\t\t * managed\n\t\t * AP\n\t\t * AP/VLAN\n\t\t * monitor\n"
            "\t\t* 2412.0 MHz [1] (20.0 dBm)\n\t\t* 2437.0 MHz [6] (20.0 dBm)\n\t\t* 5180.0 MHz [36] (23.0 dBm)\n");

        mController = std::make_unique<HostapdController>(mRunner, mLauncher, mConfig);

        mSettings.ssid       = "lab-net";
        mSettings.channel    = 6;
        mSettings.encryption = network::Encryption::Wpa2;
        mSettings.password   = "password123";
    }

    void TearDown() override { std::filesystem::remove_all(mRuntimeDir); }

protected:
    std::filesystem::path ConfigFile() const { return mRuntimeDir / "hostapd" / "ap-1.conf"; }

    std::filesystem::path                         mRuntimeDir;
    core::WilabConfig                             mConfig;
    std::shared_ptr<NiceMock<MockCommandRunner>>  mRunner;
    std::shared_ptr<FakeProcessLauncher>          mLauncher;
    std::unique_ptr<HostapdController>            mController;
    network::RadioSettings                        mSettings;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(HostapdControllerTest, RendersWpa2Config)
{
    auto conf = HostapdController::render_config("wlan1", mSettings, "IT");

    EXPECT_THAT(conf, HasSubstr("interface=wlan1\n"));
    EXPECT_THAT(conf, HasSubstr("ssid=lab-net\n"));
    EXPECT_THAT(conf, HasSubstr("channel=6\n"));
    EXPECT_THAT(conf, HasSubstr("hw_mode=g\n"));
    EXPECT_THAT(conf, HasSubstr("wpa=2\n"));
    EXPECT_THAT(conf, HasSubstr("wpa_passphrase=password123\n"));
    EXPECT_THAT(conf, HasSubstr("wpa_key_mgmt=WPA-PSK\n"));
    EXPECT_THAT(conf, HasSubstr("rsn_pairwise=CCMP\n"));
    EXPECT_THAT(conf, HasSubstr("country_code=IT\n"));
    EXPECT_THAT(conf, Not(HasSubstr("ieee80211w")));
    EXPECT_THAT(conf, Not(HasSubstr("ignore_broadcast_ssid")));
}

TEST_F(HostapdControllerTest, RendersOpenConfigWithoutSecurity)
{
    mSettings.encryption = network::Encryption::Open;
    mSettings.password.reset();
    mSettings.hidden = true;

    auto conf = HostapdController::render_config("wlan1", mSettings, "IT");

    EXPECT_THAT(conf, Not(HasSubstr("wpa")));
    EXPECT_THAT(conf, HasSubstr("ignore_broadcast_ssid=1\n"));
}

TEST_F(HostapdControllerTest, RendersWpa3And5GhzConfig)
{
    mSettings.encryption = network::Encryption::Wpa3;
    mSettings.band       = network::Band::Ghz5;
    mSettings.channel    = 36;

    auto conf = HostapdController::render_config("wlan1", mSettings, "DE");

    EXPECT_THAT(conf, HasSubstr("hw_mode=a\n"));
    EXPECT_THAT(conf, HasSubstr("wpa_key_mgmt=SAE\n"));
    EXPECT_THAT(conf, HasSubstr("ieee80211w=2\n"));

    mSettings.band = network::Band::Dual;
    EXPECT_THAT(HostapdController::render_config("wlan1", mSettings, "DE"), HasSubstr("hw_mode=a\n"));

    mSettings.channel = 11;
    EXPECT_THAT(HostapdController::render_config("wlan1", mSettings, "DE"), HasSubstr("hw_mode=g\n"));
}

TEST_F(HostapdControllerTest, StartLaunchesDaemonAfterPreparingInterface)
{
    auto process = mController->start("ap-1", "wlan1", mSettings);

    ASSERT_NE(process, nullptr);
    EXPECT_TRUE(process->is_running());

    ASSERT_EQ(mLauncher->launches.size(), 1u);
    EXPECT_EQ(mLauncher->launches[0], (std::vector<std::string> {"hostapd", ConfigFile().string()}));
    EXPECT_EQ(mLauncher->log_paths[0], mRuntimeDir / "hostapd" / "ap-1.log");

    EXPECT_TRUE(mRunner->Ran("ip link set wlan1 down"));
    EXPECT_TRUE(mRunner->Ran("iw dev wlan1 set type managed"));
    EXPECT_TRUE(mRunner->Ran("ip addr flush dev wlan1"));
    EXPECT_TRUE(mRunner->Ran("iw dev wlan1 info"));

    std::ifstream     file(ConfigFile());
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_THAT(content.str(), HasSubstr("ssid=lab-net"));
}

TEST_F(HostapdControllerTest, StartFailsWhenDaemonExits)
{
    mLauncher->start_running = false;
    mLauncher->output        = "nl80211: Could not configure driver mode";

    try {
        mController->start("ap-1", "wlan1", mSettings);
        FAIL() << "start should fail";
    } catch (const core::WilabError& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::DaemonStartFailed);
        EXPECT_THAT(e.detail(), HasSubstr("Could not configure driver mode"));
    }

    ASSERT_EQ(mLauncher->states.size(), 1u);
    EXPECT_EQ(mLauncher->states[0]->terminate_calls, 1);
    EXPECT_FALSE(std::filesystem::exists(ConfigFile()));
    EXPECT_TRUE(mRunner->Ran("ip link set wlan1 up"));
}

TEST_F(HostapdControllerTest, StartFailsWhenApModeNeverReached)
{
    mRunner->Script("iw dev wlan1 info", 0, "Interface wlan1\n\ttype managed\n");

    EXPECT_THROW(
        {
            try {
                mController->start("ap-1", "wlan1", mSettings);
            } catch (const core::WilabError& e) {
                EXPECT_EQ(e.code(), core::ErrorCode::DaemonStartFailed);
                throw;
            }
        },
        core::WilabError);

    EXPECT_EQ(mRunner->Count("iw dev wlan1 info"), 3u);
    EXPECT_EQ(mLauncher->states[0]->terminate_calls, 1);
}

TEST_F(HostapdControllerTest, StartFailsBeforeLaunchWhenInterfaceCannotBePrepared)
{
    mRunner->Script("iw dev wlan1 set type managed", 237, "", "Device or resource busy");

    try {
        mController->start("ap-1", "wlan1", mSettings);
        FAIL() << "start should fail";
    } catch (const core::WilabError& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::DaemonStartFailed);
        EXPECT_THAT(e.detail(), HasSubstr("Device or resource busy"));
    }

    EXPECT_TRUE(mLauncher->launches.empty());
}

TEST_F(HostapdControllerTest, StartRejectsInjectedConfigLines)
{
    mSettings.ssid       = "lab\nwpa_passphrase=xx";
    mSettings.encryption = network::Encryption::Open;
    mSettings.password.reset();

    try {
        mController->start("ap-1", "wlan1", mSettings);
        FAIL() << "start should reject the ssid";
    } catch (const core::WilabError& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::ValidationFailed);
    }

    EXPECT_TRUE(mRunner->commands.empty());
    EXPECT_TRUE(mLauncher->launches.empty());
    EXPECT_FALSE(std::filesystem::exists(ConfigFile()));
}

TEST_F(HostapdControllerTest, StartChecksInterfaceBeforeTouchingIt)
{
    mController->start("ap-1", "wlan1", mSettings);

    ASSERT_GE(mRunner->commands.size(), 4u);
    EXPECT_EQ(mRunner->commands[0], "ip link show wlan1");
    EXPECT_EQ(mRunner->commands[1], "iw wlan1 info");
    EXPECT_EQ(mRunner->commands[2], "iw phy0 info");
    EXPECT_EQ(mRunner->commands[3], "ip link set wlan1 down");
}

TEST_F(HostapdControllerTest, StartRejectsMissingInterface)
{
    mRunner->Script("ip link show wlan1", 1, "", "Device \"wlan1\" does not exist.");

    try {
        mController->start("ap-1", "wlan1", mSettings);
        FAIL() << "start should fail";
    } catch (const core::WilabError& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::ValidationFailed);
        EXPECT_EQ(e.detail(), "Interface wlan1 does not exist");
    }

    EXPECT_FALSE(mRunner->Ran("ip link set wlan1 down"));
    EXPECT_TRUE(mLauncher->launches.empty());
}

TEST_F(HostapdControllerTest, StartRejectsWiredInterface)
{
    mRunner->Script("iw wlan1 info", 237, "", "command failed: No such device (-19)");

    try {
        mController->start("ap-1", "wlan1", mSettings);
        FAIL() << "start should fail";
    } catch (const core::WilabError& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::ValidationFailed);
        EXPECT_EQ(e.detail(), "Interface wlan1 is not wireless-capable");
    }

    EXPECT_FALSE(mRunner->Ran("ip link set wlan1 down"));
}

TEST_F(HostapdControllerTest, StartRejectsRadioWithoutApMode)
{
    mRunner->Script("iw phy0 info", 0,
        "\tSupported interface modes:\n\t\t * managed\n\t\t * AP/VLAN\n\t\t * monitor\n"
        "\t\t* 2437.0 MHz [6] (20.0 dBm)\n");

    try {
        mController->start("ap-1", "wlan1", mSettings);
        FAIL() << "start should fail";
    } catch (const core::WilabError& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::ValidationFailed);
        EXPECT_EQ(e.detail(), "Interface wlan1 does not support AP mode");
    }

    EXPECT_FALSE(mRunner->Ran("ip link set wlan1 down"));
    EXPECT_TRUE(mLauncher->launches.empty());
}

TEST_F(HostapdControllerTest, StopTerminatesDaemonAndRestoresInterface)
{
    auto process = mController->start("ap-1", "wlan1", mSettings);
    mRunner->commands.clear();

    mController->stop("ap-1", "wlan1", process.get());

    EXPECT_EQ(mLauncher->states[0]->terminate_calls, 1);
    EXPECT_FALSE(std::filesystem::exists(ConfigFile()));
    EXPECT_EQ(mRunner->commands,
        (std::vector<std::string> {"ip link set wlan1 down", "iw dev wlan1 set type managed", "ip addr flush dev wlan1",
            "ip link set wlan1 up"}));
}

TEST_F(HostapdControllerTest, ListsStations)
{
    mRunner->Script("iw dev wlan1 station dump", 0, "Station AA:BB:CC:00:00:01 (on wlan1)\n\tsignal: -40 dBm\n");

    EXPECT_EQ(mController->list_stations("wlan1"), (std::vector<std::string> {"aa:bb:cc:00:00:01"}));
}

TEST_F(HostapdControllerTest, SetTxPowerAppliesLevelInMbm)
{
    mRunner->Script("iw dev wlan1 info", 0, "\ttype AP\n\ttxpower 10.00 dBm\n");

    auto report = mController->set_tx_power("wlan1", 6, 2, true);

    EXPECT_TRUE(mRunner->Ran("iw dev wlan1 set txpower fixed 1000"));
    EXPECT_EQ(report.frequency_mhz, 2437);
    EXPECT_DOUBLE_EQ(report.max_dbm, 20.0);
    EXPECT_EQ(report.current_level, 2);
    EXPECT_DOUBLE_EQ(report.current_dbm, 10.0);
    ASSERT_TRUE(report.reported_dbm.has_value());
    EXPECT_DOUBLE_EQ(*report.reported_dbm, 10.0);
    EXPECT_FALSE(report.warning.has_value());
}

TEST_F(HostapdControllerTest, SetTxPowerWarnsWhenDriverIgnoresChange)
{
    auto report = mController->set_tx_power("wlan1", 6, 1, true);

    EXPECT_TRUE(mRunner->Ran("iw dev wlan1 set txpower fixed 500"));
    ASSERT_TRUE(report.warning.has_value());
    EXPECT_EQ(*report.warning, network::TX_POWER_UNSUPPORTED_WARNING);
}

TEST_F(HostapdControllerTest, SetTxPowerWithoutVerifySkipsReadback)
{
    auto report = mController->set_tx_power("wlan1", 36, 4, false);

    EXPECT_TRUE(mRunner->Ran("iw dev wlan1 set txpower fixed 2300"));
    EXPECT_FALSE(report.reported_dbm.has_value());
    EXPECT_FALSE(mRunner->Ran("iw dev wlan1 info"));
}

TEST_F(HostapdControllerTest, TxPowerRejectsUnsupportedChannel)
{
    try {
        mController->tx_power_info("wlan1", 11, 4);
        FAIL() << "channel 11 is not listed by the phy";
    } catch (const core::WilabError& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::ValidationFailed);
        EXPECT_EQ(e.detail(), "Channel 11 not supported on interface wlan1");
    }
}

TEST_F(HostapdControllerTest, TxPowerInfoReportsLevels)
{
    auto report = mController->tx_power_info("wlan1", 6, 4);

    EXPECT_DOUBLE_EQ(report.levels_dbm[0], 5.0);
    EXPECT_DOUBLE_EQ(report.levels_dbm[3], 20.0);
    EXPECT_FALSE(report.warning.has_value());
}

} // namespace wilab::infrastructure::tests
