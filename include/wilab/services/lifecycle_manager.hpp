#ifndef WILAB_SERVICES_LIFECYCLE_MANAGER_HPP
#define WILAB_SERVICES_LIFECYCLE_MANAGER_HPP

#include "wilab/core/errors.hpp"
#include "wilab/infrastructure/access_point_controller.hpp"
#include "wilab/infrastructure/dhcp_controller.hpp"
#include "wilab/infrastructure/forwarding_controller.hpp"
#include "wilab/network/address_allocator.hpp"
#include "wilab/network/lease.hpp"
#include "wilab/network/radio.hpp"
#include "wilab/network/tx_power.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace wilab
{
    namespace core
    {
        class WilabConfig;
        class Logger;
    }
}

namespace wilab
{
    namespace services
    {

        using Clock = std::chrono::system_clock;

        enum class NetworkState
        {
            Inactive,
            Starting,
            Active,
            Stopping
        };

        const char *to_string(NetworkState state);

        /**
         * Live network on a slot. Owns both daemon handles.
         */
        struct NetworkInstance
        {
            network::RadioSettings settings;
            bool internet_enabled = false;
            Clock::time_point created_at;
            Clock::time_point expires_at;
            std::unique_ptr<infrastructure::ProcessHandle> ap_process;
            std::unique_ptr<infrastructure::ProcessHandle> dhcp_process;
            std::vector<std::string> warnings;

            // Rule layers that may hold tagged rules, including partially applied ones
            bool isolation_applied = false;
            bool nat_applied = false;
        };

        /**
         * One configured radio. Slots live for the whole process.
         */
        struct NetworkSlot
        {
            std::string net_id;
            std::string interface;
            network::SubnetInfo subnet;
            std::size_t index = 0;

            std::mutex mutex;
            NetworkState state = NetworkState::Inactive;
            bool busy = false; // in-place operation in flight on an ACTIVE slot
            std::optional<NetworkInstance> instance;
        };

        /**
         * Copy of an instance without its process handles
         */
        struct NetworkDetails
        {
            network::RadioSettings settings;
            bool internet_enabled = false;
            Clock::time_point created_at;
            Clock::time_point expires_at;
            std::vector<std::string> warnings;
        };

        struct NetworkSnapshot
        {
            std::string net_id;
            std::string interface;
            network::SubnetInfo subnet;
            NetworkState state = NetworkState::Inactive;
            std::optional<NetworkDetails> details;
            std::vector<network::ClientInfo> clients;
            std::vector<network::DhcpLease> leases;

            bool active() const { return state == NetworkState::Active; }
        };

        struct HealthReport
        {
            std::string status; // standby, ok or degraded
            std::size_t active_networks = 0;
            bool daemons_running = true;
            bool nat_expected = false;
            infrastructure::ForwardingStatus forwarding;
        };

        /**
         * Network Lifecycle Manager
         * Owns every slot, serializes operations per slot and expires networks in the background
         */
        class LifecycleManager
        {
        public:
            LifecycleManager(const core::WilabConfig &config,
                             std::shared_ptr<infrastructure::AccessPointController> access_point,
                             std::shared_ptr<infrastructure::DhcpController> dhcp,
                             std::shared_ptr<infrastructure::ForwardingController> forwarding);
            ~LifecycleManager();

            LifecycleManager(const LifecycleManager &) = delete;
            LifecycleManager &operator=(const LifecycleManager &) = delete;

            NetworkSnapshot start_network(const std::string &net_id, const network::RadioSettings &params);
            void stop_network(const std::string &net_id);
            NetworkSnapshot get_status(const std::string &net_id);

            NetworkSnapshot set_internet_enabled(const std::string &net_id, bool enabled);
            network::TxPowerReport set_tx_power(const std::string &net_id, int level);
            network::TxPowerReport get_tx_power(const std::string &net_id);

            std::vector<NetworkSnapshot> list_networks();
            HealthReport health();

            /**
             * Stops every active network, used on service termination.
             * Starts still in flight roll themselves back and later starts fail with Busy.
             */
            void shutdown_all();

            /** Stops networks whose deadline passed; returns how many were stopped */
            std::size_t expire_networks(Clock::time_point now);

            void start_expiry_loop();
            void stop_expiry_loop();

            std::chrono::seconds effective_timeout(const std::optional<int> &requested) const;

        private:
            NetworkSlot &slot_for(const std::string &net_id);
            std::vector<infrastructure::PeerSubnet> peers_of(const NetworkSlot &slot) const;

            /**
             * Marks an ACTIVE slot busy for an in-place operation.
             * Throws NotActive or Busy and returns the settings needed outside the lock.
             */
            NetworkDetails claim_active(NetworkSlot &slot);

            std::vector<core::TeardownStep> teardown(NetworkSlot &slot, NetworkInstance &instance);
            static NetworkSnapshot snapshot_locked(const NetworkSlot &slot);
            static NetworkDetails details_of(const NetworkInstance &instance);

            void run_expiry_loop();

            std::shared_ptr<infrastructure::AccessPointController> access_point_;
            std::shared_ptr<infrastructure::DhcpController> dhcp_;
            std::shared_ptr<infrastructure::ForwardingController> forwarding_;
            std::shared_ptr<core::Logger> logger_;

            std::vector<std::unique_ptr<NetworkSlot>> slots_;
            std::map<std::string, NetworkSlot *> slot_index_;

            int default_timeout_;
            int min_timeout_;
            int max_timeout_;
            bool internet_enabled_by_default_;
            std::chrono::seconds expiry_interval_;

            std::atomic<bool> shutting_down_{false};
            std::atomic<bool> running_{false};
            std::thread expiry_thread_;
            std::mutex expiry_mutex_;
            std::condition_variable expiry_cv_;
        };

    } // namespace services
} // namespace wilab

#endif // WILAB_SERVICES_LIFECYCLE_MANAGER_HPP
