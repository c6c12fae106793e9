#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "wilab/infrastructure/iptables_forwarding.hpp"

#include "mocks/command_runner_mock.hpp"

using namespace testing;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

namespace wilab::infrastructure::tests {

using wilab::tests::MockCommandRunner;

class IptablesForwardingTest : public Test {
public:
    void SetUp() override
    {
        mRunner     = std::make_shared<NiceMock<MockCommandRunner>>();
        mForwarding = std::make_unique<IptablesForwarding>(mRunner, "eth0");

        mRunner->Script("sysctl -n net.ipv4.ip_forward", 0, "0\n");
        mRunner->Script("iptables -S FORWARD", 0, "-P FORWARD ACCEPT\n");
    }

protected:
    void AllRulesMissing()
    {
        mRunner->ScriptPrefix("iptables -C", 1);
        mRunner->ScriptPrefix("iptables -t nat -C", 1);
    }

    std::shared_ptr<NiceMock<MockCommandRunner>> mRunner;
    std::unique_ptr<IptablesForwarding>          mForwarding;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(IptablesForwardingTest, Tags)
{
    EXPECT_EQ(nat_tag("ap-1"), "wilab-nat-ap-1");
    EXPECT_EQ(forward_tag("ap-1"), "wilab-fwd-ap-1");
    EXPECT_EQ(isolation_tag("ap-1", "ap-2"), "wilab-iso-ap-1:ap-2");
}

TEST_F(IptablesForwardingTest, SplitsRuleWithQuotedComment)
{
    auto args = split_rule("-A FORWARD -i wlan1 -m comment --comment \"wilab-fwd-ap-1\" -j ACCEPT\n");

    EXPECT_EQ(args, (std::vector<std::string> {"-A", "FORWARD", "-i", "wlan1", "-m", "comment", "--comment",
                        "wilab-fwd-ap-1", "-j", "ACCEPT"}));
}

TEST_F(IptablesForwardingTest, EnableNatAddsTaggedRules)
{
    AllRulesMissing();

    mForwarding->enable_nat("ap-1", "wlan1", "192.168.120.0/24");

    EXPECT_TRUE(mRunner->Ran("sysctl -w net.ipv4.ip_forward=1"));
    EXPECT_TRUE(mRunner->Ran("iptables -t nat -A POSTROUTING -s 192.168.120.0/24 -o eth0 -j MASQUERADE "
                             "-m comment --comment wilab-nat-ap-1"));
    EXPECT_TRUE(mRunner->Ran("iptables -A FORWARD -i wlan1 -o eth0 -j ACCEPT -m comment --comment wilab-fwd-ap-1"));
    EXPECT_TRUE(mRunner->Ran("iptables -A FORWARD -i eth0 -o wlan1 -m state --state RELATED,ESTABLISHED -j ACCEPT "
                             "-m comment --comment wilab-fwd-ap-1"));
    EXPECT_EQ(mRunner->CountPrefix("iptables -I"), 0u);
}

TEST_F(IptablesForwardingTest, EnableNatIsIdempotent)
{
    mForwarding->enable_nat("ap-1", "wlan1", "192.168.120.0/24");

    EXPECT_EQ(mRunner->CountPrefix("iptables -C"), 2u);
    EXPECT_EQ(mRunner->CountPrefix("iptables -t nat -C"), 1u);
    EXPECT_EQ(mRunner->CountPrefix("iptables -A"), 0u);
    EXPECT_EQ(mRunner->CountPrefix("iptables -t nat -A"), 0u);
}

TEST_F(IptablesForwardingTest, EnableNatProtectsEstablishedUnderDropPolicy)
{
    AllRulesMissing();
    mRunner->Script("iptables -S FORWARD", 0, "-P FORWARD DROP\n");

    mForwarding->enable_nat("ap-1", "wlan1", "192.168.120.0/24");

    EXPECT_TRUE(mRunner->Ran("iptables -I FORWARD 1 -m conntrack --ctstate ESTABLISHED,RELATED -j ACCEPT "
                             "-m comment --comment wilab-protect-existing"));
}

TEST_F(IptablesForwardingTest, EnableNatFailureIsRuleApplyFailed)
{
    AllRulesMissing();
    mRunner->ScriptPrefix("iptables -t nat -A", 4);

    try {
        mForwarding->enable_nat("ap-1", "wlan1", "192.168.120.0/24");
        FAIL() << "enable_nat should fail";
    } catch (const core::WilabError& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::RuleApplyFailed);
    }
}

TEST_F(IptablesForwardingTest, DisableNatDeletesOnlyOwnRules)
{
    mRunner->Script("iptables -t nat -S POSTROUTING", 0,
        "-P POSTROUTING ACCEPT\n"
        "-A POSTROUTING -s 192.168.120.0/24 -o eth0 -m comment --comment wilab-nat-ap-1 -j MASQUERADE\n"
        "-A POSTROUTING -s 192.168.121.0/24 -o eth0 -m comment --comment wilab-nat-ap-2 -j MASQUERADE\n");
    mRunner->Script("iptables -S FORWARD", 0,
        "-P FORWARD ACCEPT\n"
        "-A FORWARD -i wlan1 -o eth0 -m comment --comment \"wilab-fwd-ap-1\" -j ACCEPT\n"
        "-A FORWARD -i docker0 -j ACCEPT\n");

    mForwarding->disable_nat("ap-1");

    EXPECT_TRUE(mRunner->Ran(
        "iptables -t nat -D POSTROUTING -s 192.168.120.0/24 -o eth0 -m comment --comment wilab-nat-ap-1 -j MASQUERADE"));
    EXPECT_TRUE(mRunner->Ran("iptables -D FORWARD -i wlan1 -o eth0 -m comment --comment wilab-fwd-ap-1 -j ACCEPT"));
    EXPECT_EQ(mRunner->CountPrefix("iptables -t nat -D"), 1u);
    EXPECT_EQ(mRunner->CountPrefix("iptables -D"), 1u);
}

TEST_F(IptablesForwardingTest, IpForwardingRestoredAfterLastNat)
{
    mForwarding->enable_nat("ap-1", "wlan1", "192.168.120.0/24");
    mForwarding->enable_nat("ap-2", "wlan2", "192.168.121.0/24");

    EXPECT_EQ(mRunner->Count("sysctl -n net.ipv4.ip_forward"), 1u);
    EXPECT_EQ(mRunner->Count("sysctl -w net.ipv4.ip_forward=1"), 1u);

    mForwarding->disable_nat("ap-1");
    EXPECT_FALSE(mRunner->Ran("sysctl -w net.ipv4.ip_forward=0"));

    mForwarding->disable_nat("ap-2");
    EXPECT_TRUE(mRunner->Ran("sysctl -w net.ipv4.ip_forward=0"));
}

TEST_F(IptablesForwardingTest, IpForwardingLeftOnWhenAlreadyEnabled)
{
    mRunner->Script("sysctl -n net.ipv4.ip_forward", 0, "1\n");

    mForwarding->enable_nat("ap-1", "wlan1", "192.168.120.0/24");
    mForwarding->disable_nat("ap-1");

    EXPECT_EQ(mRunner->CountPrefix("sysctl -w"), 0u);
}

TEST_F(IptablesForwardingTest, IsolationBlocksPeersBothWays)
{
    AllRulesMissing();

    mForwarding->apply_isolation("ap-1", "192.168.120.0/24",
        {{"ap-1", "192.168.120.0/24"}, {"ap-2", "192.168.121.0/24"}});

    EXPECT_TRUE(mRunner->Ran("iptables -I FORWARD 1 -s 192.168.120.0/24 -d 192.168.121.0/24 -j DROP "
                             "-m comment --comment wilab-iso-ap-1:ap-2"));
    EXPECT_TRUE(mRunner->Ran("iptables -I FORWARD 1 -s 192.168.121.0/24 -d 192.168.120.0/24 -j DROP "
                             "-m comment --comment wilab-iso-ap-1:ap-2"));
    EXPECT_EQ(mRunner->CountPrefix("iptables -I FORWARD"), 2u);
}

TEST_F(IptablesForwardingTest, RemoveIsolationMatchesOwnerExactly)
{
    mRunner->Script("iptables -S FORWARD", 0,
        "-A FORWARD -s 192.168.120.0/24 -d 192.168.121.0/24 -m comment --comment wilab-iso-ap-1:ap-2 -j DROP\n"
        "-A FORWARD -s 192.168.129.0/24 -d 192.168.120.0/24 -m comment --comment wilab-iso-ap-10:ap-1 -j DROP\n");

    mForwarding->remove_isolation("ap-1");

    EXPECT_EQ(mRunner->CountPrefix("iptables -D FORWARD"), 1u);
    EXPECT_TRUE(mRunner->Ran(
        "iptables -D FORWARD -s 192.168.120.0/24 -d 192.168.121.0/24 -m comment --comment wilab-iso-ap-1:ap-2 -j DROP"));
}

TEST_F(IptablesForwardingTest, CountsAndListsTaggedRules)
{
    mRunner->Script("iptables -t nat -S POSTROUTING", 0,
        "-A POSTROUTING -s 192.168.120.0/24 -o eth0 -m comment --comment wilab-nat-ap-1 -j MASQUERADE\n");
    mRunner->Script("iptables -S FORWARD", 0,
        "-A FORWARD -i wlan1 -o eth0 -m comment --comment wilab-fwd-ap-1 -j ACCEPT\n"
        "-A FORWARD -s 192.168.120.0/24 -d 192.168.121.0/24 -m comment --comment wilab-iso-ap-1:ap-2 -j DROP\n"
        "-A FORWARD -s 192.168.121.0/24 -d 192.168.120.0/24 -m comment --comment wilab-iso-ap-2:ap-1 -j DROP\n"
        "-A FORWARD -i docker0 -j ACCEPT\n");

    EXPECT_EQ(mForwarding->count_rules("ap-1"), 3u);
    EXPECT_EQ(mForwarding->count_rules("ap-3"), 0u);
    EXPECT_EQ(mForwarding->list_tagged_rules().size(), 4u);
}

TEST_F(IptablesForwardingTest, DetectsUpstreamFromDefaultRoute)
{
    IptablesForwarding forwarding(mRunner, "auto");
    mRunner->Script("ip route show default", 0, "default via 10.0.0.1 dev enp3s0 proto dhcp metric 100\n");

    EXPECT_EQ(forwarding.upstream_interface(), "enp3s0");
    EXPECT_EQ(forwarding.upstream_interface(), "enp3s0");
    EXPECT_EQ(mRunner->Count("ip route show default"), 1u);
}

TEST_F(IptablesForwardingTest, MissingDefaultRouteFailsNat)
{
    IptablesForwarding forwarding(mRunner, "auto");

    try {
        forwarding.enable_nat("ap-1", "wlan1", "192.168.120.0/24");
        FAIL() << "enable_nat should fail";
    } catch (const core::WilabError& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::RuleApplyFailed);
    }
}

TEST_F(IptablesForwardingTest, StatusReportsUpstreamAndNat)
{
    mRunner->Script("ip addr show eth0", 0,
        "2: eth0: <BROADCAST,MULTICAST,UP,LOWER_UP> mtu 1500 state UP\n    inet 10.0.0.5/24 brd 10.0.0.255\n");
    mRunner->Script("iptables -t nat -S POSTROUTING", 0,
        "-A POSTROUTING -s 192.168.120.0/24 -o eth0 -m comment --comment wilab-nat-ap-1 -j MASQUERADE\n");

    auto status = mForwarding->status();

    EXPECT_EQ(status.upstream_interface, "eth0");
    EXPECT_TRUE(status.upstream_up);
    EXPECT_TRUE(status.upstream_has_ip);
    EXPECT_TRUE(status.upstream_reachable());
    EXPECT_TRUE(status.nat_configured);
    EXPECT_TRUE(status.error.empty());
}

TEST_F(IptablesForwardingTest, StatusReportsDownUpstream)
{
    mRunner->Script("ip addr show eth0", 1, "", "Device \"eth0\" does not exist.");

    auto status = mForwarding->status();

    EXPECT_FALSE(status.upstream_up);
    EXPECT_FALSE(status.upstream_reachable());
    EXPECT_FALSE(status.nat_configured);
}

} // namespace wilab::infrastructure::tests
