#include "wilab/network/address_allocator.hpp"

#include <arpa/inet.h>
#include <regex>
#include <stdexcept>

namespace wilab
{
    namespace network
    {

        namespace
        {
            std::string format_address(uint8_t a, uint8_t b, uint8_t c, unsigned d)
            {
                return std::to_string(a) + "." + std::to_string(b) + "." + std::to_string(c) + "." +
                       std::to_string(d);
            }
        }

        AddressAllocator::AddressAllocator(const std::string &base_cidr)
            : base_cidr_(base_cidr)
        {
            auto slash = base_cidr.find('/');
            if (slash == std::string::npos)
            {
                throw std::invalid_argument("'" + base_cidr + "' is not in CIDR notation");
            }

            const std::string address = base_cidr.substr(0, slash);
            const std::string prefix = base_cidr.substr(slash + 1);

            in_addr parsed{};
            if (inet_pton(AF_INET, address.c_str(), &parsed) != 1)
            {
                throw std::invalid_argument("'" + address + "' is not a valid IPv4 address");
            }
            if (prefix != "24")
            {
                throw std::invalid_argument("must be a /24 network");
            }

            const auto *bytes = reinterpret_cast<const uint8_t *>(&parsed.s_addr);
            base_ = {bytes[0], bytes[1], bytes[2], 0};
        }

        SubnetInfo AddressAllocator::allocate(std::size_t index) const
        {
            if (index >= capacity())
            {
                throw std::out_of_range("subnet index " + std::to_string(index) + " overflows the third octet of " +
                                        base_cidr_);
            }

            const auto third = static_cast<uint8_t>(base_[2] + index);

            SubnetInfo info;
            info.network = format_address(base_[0], base_[1], third, 0);
            info.cidr = info.network + "/24";
            info.gateway = format_address(base_[0], base_[1], third, 1);
            info.dhcp_start = format_address(base_[0], base_[1], third, 10);
            info.dhcp_end = format_address(base_[0], base_[1], third, 250);
            return info;
        }

        bool is_valid_net_id(const std::string &net_id)
        {
            static const std::regex pattern("^[a-z0-9-]{1,16}$");
            return std::regex_match(net_id, pattern);
        }

    } // namespace network
} // namespace wilab
