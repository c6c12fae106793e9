#ifndef WILAB_NETWORK_TX_POWER_HPP
#define WILAB_NETWORK_TX_POWER_HPP

#include <array>
#include <optional>
#include <string>

namespace wilab
{
    namespace network
    {

        extern const char *const TX_POWER_UNSUPPORTED_WARNING;

        /**
         * Frequency and regulatory power limit of one channel as reported by `iw phy<N> info`
         */
        struct ChannelCapabilities
        {
            int frequency_mhz = 0;
            double max_dbm = 0.0;
        };

        /**
         * TX power state of a radio, returned by set and query operations
         */
        struct TxPowerReport
        {
            std::string interface;
            int channel = 0;
            int frequency_mhz = 0;
            double max_dbm = 0.0;
            std::array<double, 4> levels_dbm{};
            int current_level = 0;
            double current_dbm = 0.0;
            std::optional<double> reported_dbm;
            std::optional<std::string> warning;
        };

        /**
         * Splits max power into four steps at 25/50/75/100 percent, rounded to 0.1 dBm.
         * Level 1 never drops below 1 dBm and the steps never decrease.
         */
        std::array<double, 4> compute_level_dbm(double max_dbm);

        /** Extracts the wiphy index from `iw <if> info` output */
        std::optional<std::string> parse_wiphy(const std::string &iw_info);

        /** Finds a channel line of the form `* 2437.0 MHz [6] (20.0 dBm)` */
        std::optional<ChannelCapabilities> parse_channel_capabilities(const std::string &phy_info, int channel);

        /** Extracts `txpower 20.00 dBm` from `iw dev <if> info` output */
        std::optional<double> parse_reported_txpower(const std::string &iw_dev_info);

        int dbm_to_mbm(double dbm);

    } // namespace network
} // namespace wilab

#endif // WILAB_NETWORK_TX_POWER_HPP
