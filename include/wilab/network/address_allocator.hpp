#ifndef WILAB_NETWORK_ADDRESS_ALLOCATOR_HPP
#define WILAB_NETWORK_ADDRESS_ALLOCATOR_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace wilab
{
    namespace network
    {

        /**
         * Addressing facts for one /24 slot subnet
         */
        struct SubnetInfo
        {
            std::string cidr;       // 192.168.120.0/24
            std::string network;    // 192.168.120.0
            std::string gateway;    // .1
            std::string dhcp_start; // .10
            std::string dhcp_end;   // .250
            std::string netmask = "255.255.255.0";
            int prefix_length = 24;
        };

        /**
         * Derives non-overlapping /24 subnets from a base /24 network.
         * Slot i gets the base third octet plus i.
         */
        class AddressAllocator
        {
        public:
            /**
             * Throws std::invalid_argument when base_cidr is not an IPv4 /24
             */
            explicit AddressAllocator(const std::string &base_cidr);

            /**
             * Throws std::out_of_range when index would pass the third-octet limit
             */
            SubnetInfo allocate(std::size_t index) const;

            /** Number of slots available before the third octet overflows */
            std::size_t capacity() const { return 256 - base_[2]; }

            const std::string &base_cidr() const { return base_cidr_; }

        private:
            std::string base_cidr_;
            std::array<uint8_t, 4> base_{};
        };

        bool is_valid_net_id(const std::string &net_id);

    } // namespace network
} // namespace wilab

#endif // WILAB_NETWORK_ADDRESS_ALLOCATOR_HPP
