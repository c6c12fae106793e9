#ifndef WILAB_NETWORK_LEASE_HPP
#define WILAB_NETWORK_LEASE_HPP

#include <ctime>
#include <string>
#include <vector>

namespace wilab
{
    namespace network
    {

        /**
         * One line of a dnsmasq lease file: `<expiry> <mac> <ip> <hostname> <client-id>`.
         * An expiry of 0 denotes an infinite lease.
         */
        struct DhcpLease
        {
            std::time_t expiry = 0;
            std::string mac;
            std::string ip;
            std::string hostname;
        };

        /**
         * Associated station that also holds a live lease
         */
        struct ClientInfo
        {
            std::string mac;
            std::string ip;
            std::string hostname;
        };

        std::vector<DhcpLease> parse_leases(const std::string &content);

        /** MAC addresses from `iw dev <if> station dump`, lowercased */
        std::vector<std::string> parse_station_dump(const std::string &output);

        std::vector<ClientInfo> match_clients(const std::vector<std::string> &stations,
                                              const std::vector<DhcpLease> &leases,
                                              std::time_t now);

    } // namespace network
} // namespace wilab

#endif // WILAB_NETWORK_LEASE_HPP
