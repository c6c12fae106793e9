#ifndef WILAB_TESTS_MOCKS_CONTROLLER_MOCKS_HPP
#define WILAB_TESTS_MOCKS_CONTROLLER_MOCKS_HPP

#include <gmock/gmock.h>

#include "wilab/infrastructure/access_point_controller.hpp"
#include "wilab/infrastructure/dhcp_controller.hpp"
#include "wilab/infrastructure/forwarding_controller.hpp"

namespace wilab
{
    namespace tests
    {

        class MockAccessPointController : public infrastructure::AccessPointController
        {
        public:
            MOCK_METHOD(std::unique_ptr<infrastructure::ProcessHandle>, start,
                        (const std::string &net_id, const std::string &interface,
                         const network::RadioSettings &settings),
                        (override));
            MOCK_METHOD(void, stop,
                        (const std::string &net_id, const std::string &interface,
                         infrastructure::ProcessHandle *process),
                        (override));
            MOCK_METHOD(std::vector<std::string>, list_stations, (const std::string &interface), (override));
            MOCK_METHOD(network::TxPowerReport, set_tx_power,
                        (const std::string &interface, int channel, int level, bool verify), (override));
            MOCK_METHOD(network::TxPowerReport, tx_power_info, (const std::string &interface, int channel, int level),
                        (override));
        };

        class MockDhcpController : public infrastructure::DhcpController
        {
        public:
            MOCK_METHOD(std::unique_ptr<infrastructure::ProcessHandle>, start,
                        (const std::string &net_id, const std::string &interface,
                         const network::SubnetInfo &subnet),
                        (override));
            MOCK_METHOD(void, stop,
                        (const std::string &net_id, const std::string &interface,
                         const network::SubnetInfo &subnet, infrastructure::ProcessHandle *process),
                        (override));
            MOCK_METHOD(std::vector<network::DhcpLease>, read_leases, (const std::string &net_id), (override));
        };

        class MockForwardingController : public infrastructure::ForwardingController
        {
        public:
            MOCK_METHOD(void, apply_isolation,
                        (const std::string &net_id, const std::string &subnet_cidr,
                         const std::vector<infrastructure::PeerSubnet> &peers),
                        (override));
            MOCK_METHOD(void, remove_isolation, (const std::string &net_id), (override));
            MOCK_METHOD(void, enable_nat,
                        (const std::string &net_id, const std::string &interface, const std::string &subnet_cidr),
                        (override));
            MOCK_METHOD(void, disable_nat, (const std::string &net_id), (override));
            MOCK_METHOD(std::size_t, count_rules, (const std::string &net_id), (override));
            MOCK_METHOD(std::vector<std::string>, list_tagged_rules, (), (override));
            MOCK_METHOD(infrastructure::ForwardingStatus, status, (), (override));
        };

    } // namespace tests
} // namespace wilab

#endif // WILAB_TESTS_MOCKS_CONTROLLER_MOCKS_HPP
