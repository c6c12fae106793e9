#include "wilab/network/radio.hpp"
#include "wilab/core/errors.hpp"

#include <algorithm>
#include <cctype>

namespace wilab
{
    namespace network
    {

        namespace
        {
            // Values end up on a single hostapd.conf line
            bool has_control_characters(const std::string &value)
            {
                return std::any_of(value.begin(), value.end(),
                                   [](unsigned char c) { return std::iscntrl(c) != 0; });
            }
        }

        std::optional<Band> parse_band(const std::string &value)
        {
            if (value == "2.4ghz")
                return Band::Ghz24;
            if (value == "5ghz")
                return Band::Ghz5;
            if (value == "dual")
                return Band::Dual;
            return std::nullopt;
        }

        const char *to_string(Band band)
        {
            switch (band)
            {
            case Band::Ghz24:
                return "2.4ghz";
            case Band::Ghz5:
                return "5ghz";
            case Band::Dual:
                return "dual";
            }
            return "unknown";
        }

        std::optional<Encryption> parse_encryption(const std::string &value)
        {
            if (value == "open")
                return Encryption::Open;
            if (value == "wpa")
                return Encryption::Wpa;
            if (value == "wpa2")
                return Encryption::Wpa2;
            if (value == "wpa3")
                return Encryption::Wpa3;
            if (value == "wpa2-wpa3")
                return Encryption::Wpa2Wpa3;
            return std::nullopt;
        }

        const char *to_string(Encryption encryption)
        {
            switch (encryption)
            {
            case Encryption::Open:
                return "open";
            case Encryption::Wpa:
                return "wpa";
            case Encryption::Wpa2:
                return "wpa2";
            case Encryption::Wpa3:
                return "wpa3";
            case Encryption::Wpa2Wpa3:
                return "wpa2-wpa3";
            }
            return "unknown";
        }

        bool is_5ghz_channel(int channel)
        {
            auto in_block = [channel](int first, int last) {
                return channel >= first && channel <= last && (channel - first) % 4 == 0;
            };
            return in_block(36, 64) || in_block(100, 144) || in_block(149, 165);
        }

        bool is_valid_channel(Band band, int channel)
        {
            const bool low = channel >= 1 && channel <= 14;
            switch (band)
            {
            case Band::Ghz24:
                return low;
            case Band::Ghz5:
                return is_5ghz_channel(channel);
            case Band::Dual:
                return low || is_5ghz_channel(channel);
            }
            return false;
        }

        bool requires_password(Encryption encryption)
        {
            return encryption != Encryption::Open;
        }

        const char *key_management(Encryption encryption)
        {
            switch (encryption)
            {
            case Encryption::Open:
                return "";
            case Encryption::Wpa:
            case Encryption::Wpa2:
                return "WPA-PSK";
            case Encryption::Wpa3:
                return "SAE";
            case Encryption::Wpa2Wpa3:
                return "WPA-PSK SAE";
            }
            return "";
        }

        int management_frame_protection(Encryption encryption)
        {
            switch (encryption)
            {
            case Encryption::Wpa3:
                return 2;
            case Encryption::Wpa2Wpa3:
                return 1;
            default:
                return 0;
            }
        }

        bool is_valid_tx_power_level(int level)
        {
            return level >= 1 && level <= 4;
        }

        void RadioSettings::validate() const
        {
            using core::ErrorCode;
            using core::WilabError;

            if (ssid.empty() || ssid.size() > 32)
            {
                throw WilabError(ErrorCode::ValidationFailed, "ssid must be 1-32 characters");
            }
            if (has_control_characters(ssid))
            {
                throw WilabError(ErrorCode::ValidationFailed, "ssid must not contain control characters");
            }

            if (!is_valid_channel(band, channel))
            {
                throw WilabError(ErrorCode::ValidationFailed,
                                 "Channel " + std::to_string(channel) + " invalid for " + to_string(band) + " band");
            }

            if (requires_password(encryption))
            {
                if (!password)
                {
                    throw WilabError(ErrorCode::ValidationFailed,
                                     std::string("Password required for ") + to_string(encryption) + " encryption");
                }
                if (password->size() < 8 || password->size() > 63)
                {
                    throw WilabError(ErrorCode::ValidationFailed, "password must be 8-63 characters");
                }
            }

            if (password && has_control_characters(*password))
            {
                throw WilabError(ErrorCode::ValidationFailed, "password must not contain control characters");
            }

            if (!is_valid_tx_power_level(tx_power_level))
            {
                throw WilabError(ErrorCode::ValidationFailed, "tx_power_level must be 1-4");
            }

            if (timeout && *timeout <= 0)
            {
                throw WilabError(ErrorCode::ValidationFailed, "timeout must be positive");
            }
        }

    } // namespace network
} // namespace wilab
