#include "wilab/network/lease.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace wilab
{
    namespace network
    {

        namespace
        {
            std::string to_lower(std::string value)
            {
                std::transform(value.begin(), value.end(), value.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return value;
            }
        }

        std::vector<DhcpLease> parse_leases(const std::string &content)
        {
            std::vector<DhcpLease> leases;
            std::istringstream stream(content);
            std::string line;

            while (std::getline(stream, line))
            {
                std::istringstream fields(line);
                std::string expiry;
                DhcpLease lease;
                if (!(fields >> expiry >> lease.mac >> lease.ip))
                {
                    continue;
                }
                if (expiry.empty() || expiry.size() > 18 ||
                    !std::all_of(expiry.begin(), expiry.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
                {
                    continue;
                }

                fields >> lease.hostname;
                if (lease.hostname == "*")
                {
                    lease.hostname.clear();
                }

                lease.expiry = static_cast<std::time_t>(std::stoll(expiry));
                lease.mac = to_lower(lease.mac);
                leases.push_back(std::move(lease));
            }
            return leases;
        }

        std::vector<std::string> parse_station_dump(const std::string &output)
        {
            std::vector<std::string> stations;
            std::istringstream stream(output);
            std::string line;

            while (std::getline(stream, line))
            {
                std::istringstream words(line);
                std::string keyword;
                std::string mac;
                if (words >> keyword >> mac && keyword == "Station")
                {
                    stations.push_back(to_lower(mac));
                }
            }
            return stations;
        }

        std::vector<ClientInfo> match_clients(const std::vector<std::string> &stations,
                                              const std::vector<DhcpLease> &leases,
                                              std::time_t now)
        {
            std::vector<ClientInfo> clients;
            for (const auto &station : stations)
            {
                const std::string mac = to_lower(station);
                auto it = std::find_if(leases.begin(), leases.end(), [&](const DhcpLease &lease) {
                    return lease.mac == mac && (lease.expiry == 0 || lease.expiry > now);
                });
                if (it != leases.end())
                {
                    clients.push_back({mac, it->ip, it->hostname});
                }
            }
            return clients;
        }

    } // namespace network
} // namespace wilab
