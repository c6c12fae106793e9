#ifndef WILAB_NETWORK_RADIO_HPP
#define WILAB_NETWORK_RADIO_HPP

#include <optional>
#include <string>

namespace wilab
{
    namespace network
    {

        enum class Band
        {
            Ghz24,
            Ghz5,
            Dual
        };

        enum class Encryption
        {
            Open,
            Wpa,
            Wpa2,
            Wpa3,
            Wpa2Wpa3
        };

        std::optional<Band> parse_band(const std::string &value);
        const char *to_string(Band band);

        std::optional<Encryption> parse_encryption(const std::string &value);
        const char *to_string(Encryption encryption);

        /**
         * Channel tables: 2.4 GHz uses 1-14, 5 GHz uses 36-64, 100-144 and 149-165 in steps of 4.
         * Dual accepts a channel from either table.
         */
        bool is_valid_channel(Band band, int channel);
        bool is_5ghz_channel(int channel);

        bool requires_password(Encryption encryption);

        /** hostapd wpa_key_mgmt value, empty for open networks */
        const char *key_management(Encryption encryption);

        /** hostapd ieee80211w value: 0 disabled, 1 optional, 2 required */
        int management_frame_protection(Encryption encryption);

        /**
         * Parameters of a Start request
         */
        struct RadioSettings
        {
            std::string ssid;
            int channel = 6;
            Band band = Band::Ghz24;
            Encryption encryption = Encryption::Wpa2;
            std::optional<std::string> password;
            bool hidden = false;
            int tx_power_level = 4;
            std::optional<int> timeout;
            std::optional<bool> internet_enabled;

            /**
             * Throws core::WilabError(ValidationFailed) describing the first bad field
             */
            void validate() const;
        };

        bool is_valid_tx_power_level(int level);

    } // namespace network
} // namespace wilab

#endif // WILAB_NETWORK_RADIO_HPP
