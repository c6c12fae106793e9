#include "wilab/network/tx_power.hpp"

#include <algorithm>
#include <cmath>
#include <regex>
#include <sstream>

namespace wilab
{
    namespace network
    {

        const char *const TX_POWER_UNSUPPORTED_WARNING =
            "Interface does not support dynamic power change. Please recreate the network with desired power level.";

        namespace
        {
            double round_tenth(double value)
            {
                return std::round(value * 10.0) / 10.0;
            }
        }

        std::array<double, 4> compute_level_dbm(double max_dbm)
        {
            std::array<double, 4> levels = {
                round_tenth(max_dbm * 0.25),
                round_tenth(max_dbm * 0.50),
                round_tenth(max_dbm * 0.75),
                round_tenth(max_dbm)};

            levels[0] = std::max(1.0, levels[0]);
            for (size_t i = 1; i < levels.size(); ++i)
            {
                levels[i] = std::max(levels[i - 1], levels[i]);
            }
            return levels;
        }

        std::optional<std::string> parse_wiphy(const std::string &iw_info)
        {
            std::istringstream stream(iw_info);
            std::string line;
            while (std::getline(stream, line))
            {
                std::istringstream words(line);
                std::string key;
                std::string value;
                if (words >> key >> value && key == "wiphy")
                {
                    return value;
                }
            }
            return std::nullopt;
        }

        std::optional<ChannelCapabilities> parse_channel_capabilities(const std::string &phy_info, int channel)
        {
            static const std::regex pattern(R"(\*\s+([\d.]+)\s+MHz\s+\[(\d+)\].*\(([-0-9.]+) dBm\))");

            std::istringstream stream(phy_info);
            std::string line;
            while (std::getline(stream, line))
            {
                std::smatch match;
                if (!std::regex_search(line, match, pattern))
                {
                    continue;
                }
                if (std::stoi(match[2].str()) != channel)
                {
                    continue;
                }

                ChannelCapabilities caps;
                caps.frequency_mhz = static_cast<int>(std::stod(match[1].str()));
                caps.max_dbm = std::stod(match[3].str());
                return caps;
            }
            return std::nullopt;
        }

        std::optional<double> parse_reported_txpower(const std::string &iw_dev_info)
        {
            static const std::regex pattern(R"(txpower\s+([\d.]+)\s+dBm)");

            std::smatch match;
            if (std::regex_search(iw_dev_info, match, pattern))
            {
                return std::stod(match[1].str());
            }
            return std::nullopt;
        }

        int dbm_to_mbm(double dbm)
        {
            return static_cast<int>(std::lround(dbm * 100.0));
        }

    } // namespace network
} // namespace wilab
