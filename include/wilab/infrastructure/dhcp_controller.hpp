#ifndef WILAB_INFRASTRUCTURE_DHCP_CONTROLLER_HPP
#define WILAB_INFRASTRUCTURE_DHCP_CONTROLLER_HPP

#include "wilab/infrastructure/process.hpp"
#include "wilab/network/address_allocator.hpp"
#include "wilab/network/lease.hpp"

#include <memory>
#include <string>
#include <vector>

namespace wilab
{
    namespace infrastructure
    {

        /**
         * Drives the DHCP daemon scoped to one interface and subnet
         */
        class DhcpController
        {
        public:
            virtual ~DhcpController() = default;

            virtual std::unique_ptr<ProcessHandle> start(const std::string &net_id,
                                                         const std::string &interface,
                                                         const network::SubnetInfo &subnet) = 0;

            virtual void stop(const std::string &net_id,
                              const std::string &interface,
                              const network::SubnetInfo &subnet,
                              ProcessHandle *process) = 0;

            virtual std::vector<network::DhcpLease> read_leases(const std::string &net_id) = 0;
        };

    } // namespace infrastructure
} // namespace wilab

#endif // WILAB_INFRASTRUCTURE_DHCP_CONTROLLER_HPP
