#ifndef WILAB_INFRASTRUCTURE_FORWARDING_CONTROLLER_HPP
#define WILAB_INFRASTRUCTURE_FORWARDING_CONTROLLER_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace wilab
{
    namespace infrastructure
    {

        /**
         * Subnet of another managed network, blocked by isolation rules
         */
        struct PeerSubnet
        {
            std::string net_id;
            std::string cidr;
        };

        /**
         * Upstream and rule-table health, reported by the health check
         */
        struct ForwardingStatus
        {
            std::string upstream_interface;
            bool upstream_up = false;
            bool upstream_has_ip = false;
            bool nat_configured = false;
            std::string error;

            bool upstream_reachable() const { return upstream_up && upstream_has_ip; }
        };

        /**
         * Tagged NAT and isolation rules plus the kernel forwarding toggle.
         * Every rule carries a comment derived from its owning net_id.
         */
        class ForwardingController
        {
        public:
            virtual ~ForwardingController() = default;

            virtual void apply_isolation(const std::string &net_id,
                                         const std::string &subnet_cidr,
                                         const std::vector<PeerSubnet> &peers) = 0;
            virtual void remove_isolation(const std::string &net_id) = 0;

            virtual void enable_nat(const std::string &net_id,
                                    const std::string &interface,
                                    const std::string &subnet_cidr) = 0;
            virtual void disable_nat(const std::string &net_id) = 0;

            /** Rules currently tagged with net_id, NAT and isolation combined */
            virtual std::size_t count_rules(const std::string &net_id) = 0;

            /** All rules tagged by this service, as printed by `iptables -S` */
            virtual std::vector<std::string> list_tagged_rules() = 0;

            virtual ForwardingStatus status() = 0;
        };

    } // namespace infrastructure
} // namespace wilab

#endif // WILAB_INFRASTRUCTURE_FORWARDING_CONTROLLER_HPP
