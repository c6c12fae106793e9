#ifndef WILAB_INFRASTRUCTURE_ACCESS_POINT_CONTROLLER_HPP
#define WILAB_INFRASTRUCTURE_ACCESS_POINT_CONTROLLER_HPP

#include "wilab/infrastructure/process.hpp"
#include "wilab/network/radio.hpp"
#include "wilab/network/tx_power.hpp"

#include <memory>
#include <string>
#include <vector>

namespace wilab
{
    namespace infrastructure
    {

        /**
         * Drives the access-point daemon of one radio
         */
        class AccessPointController
        {
        public:
            virtual ~AccessPointController() = default;

            /**
             * Prepares the interface, launches the daemon and waits for AP mode.
             * Cleans up after itself and throws DaemonStartFailed on failure.
             */
            virtual std::unique_ptr<ProcessHandle> start(const std::string &net_id,
                                                         const std::string &interface,
                                                         const network::RadioSettings &settings) = 0;

            /**
             * Terminates the daemon (if any) and returns the interface to managed mode
             */
            virtual void stop(const std::string &net_id, const std::string &interface, ProcessHandle *process) = 0;

            virtual std::vector<std::string> list_stations(const std::string &interface) = 0;

            virtual network::TxPowerReport set_tx_power(const std::string &interface, int channel, int level,
                                                        bool verify) = 0;
            virtual network::TxPowerReport tx_power_info(const std::string &interface, int channel, int level) = 0;
        };

    } // namespace infrastructure
} // namespace wilab

#endif // WILAB_INFRASTRUCTURE_ACCESS_POINT_CONTROLLER_HPP
