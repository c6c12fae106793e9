/**
 * Network Lifecycle Manager Implementation
 * Per-slot state machine driving AP, DHCP and forwarding controllers in order
 */

#include "wilab/services/lifecycle_manager.hpp"
#include "wilab/core/config.hpp"
#include "wilab/core/logger.hpp"

#include <algorithm>

namespace wilab
{
    namespace services
    {

        using core::ErrorCode;
        using core::WilabError;

        namespace
        {
            /**
             * Clears the busy flag of a slot when an in-place operation ends
             */
            class SlotClaim
            {
            public:
                explicit SlotClaim(NetworkSlot &slot) : slot_(slot) {}
                ~SlotClaim()
                {
                    std::lock_guard<std::mutex> lock(slot_.mutex);
                    slot_.busy = false;
                }

                SlotClaim(const SlotClaim &) = delete;
                SlotClaim &operator=(const SlotClaim &) = delete;

            private:
                NetworkSlot &slot_;
            };
        }

        const char *to_string(NetworkState state)
        {
            switch (state)
            {
            case NetworkState::Inactive:
                return "inactive";
            case NetworkState::Starting:
                return "starting";
            case NetworkState::Active:
                return "active";
            case NetworkState::Stopping:
                return "stopping";
            }
            return "unknown";
        }

        LifecycleManager::LifecycleManager(const core::WilabConfig &config,
                                           std::shared_ptr<infrastructure::AccessPointController> access_point,
                                           std::shared_ptr<infrastructure::DhcpController> dhcp,
                                           std::shared_ptr<infrastructure::ForwardingController> forwarding)
            : access_point_(std::move(access_point)),
              dhcp_(std::move(dhcp)),
              forwarding_(std::move(forwarding)),
              logger_(core::get_logger("LifecycleManager")),
              default_timeout_(config.default_timeout),
              min_timeout_(config.min_timeout),
              max_timeout_(config.max_timeout),
              internet_enabled_by_default_(config.internet_enabled_by_default),
              expiry_interval_(config.expiry_check_interval)
        {
            network::AddressAllocator allocator(config.dhcp_base_network);

            for (std::size_t i = 0; i < config.networks.size(); ++i)
            {
                const auto &entry = config.networks[i];

                auto slot = std::make_unique<NetworkSlot>();
                slot->net_id = entry.net_id;
                slot->interface = entry.interface;
                slot->subnet = allocator.allocate(i);
                slot->index = i;

                logger_->info("Network slot configured",
                              core::LogContext()
                                  .add("net_id", slot->net_id)
                                  .add("interface", slot->interface)
                                  .add("subnet", slot->subnet.cidr));

                slot_index_[slot->net_id] = slot.get();
                slots_.push_back(std::move(slot));
            }
        }

        LifecycleManager::~LifecycleManager()
        {
            stop_expiry_loop();
        }

        NetworkSlot &LifecycleManager::slot_for(const std::string &net_id)
        {
            auto it = slot_index_.find(net_id);
            if (it == slot_index_.end())
            {
                throw WilabError(ErrorCode::UnknownNetwork, "Unknown net_id: " + net_id);
            }
            return *it->second;
        }

        std::vector<infrastructure::PeerSubnet> LifecycleManager::peers_of(const NetworkSlot &slot) const
        {
            std::vector<infrastructure::PeerSubnet> peers;
            for (const auto &other : slots_)
            {
                if (other.get() != &slot)
                {
                    peers.push_back({other->net_id, other->subnet.cidr});
                }
            }
            return peers;
        }

        std::chrono::seconds LifecycleManager::effective_timeout(const std::optional<int> &requested) const
        {
            if (!requested)
            {
                return std::chrono::seconds(default_timeout_);
            }
            return std::chrono::seconds(std::clamp(*requested, min_timeout_, max_timeout_));
        }

        NetworkDetails LifecycleManager::details_of(const NetworkInstance &instance)
        {
            NetworkDetails details;
            details.settings = instance.settings;
            details.internet_enabled = instance.internet_enabled;
            details.created_at = instance.created_at;
            details.expires_at = instance.expires_at;
            details.warnings = instance.warnings;
            return details;
        }

        NetworkSnapshot LifecycleManager::snapshot_locked(const NetworkSlot &slot)
        {
            NetworkSnapshot snapshot;
            snapshot.net_id = slot.net_id;
            snapshot.interface = slot.interface;
            snapshot.subnet = slot.subnet;
            snapshot.state = slot.state;
            if (slot.instance)
            {
                snapshot.details = details_of(*slot.instance);
            }
            return snapshot;
        }

        NetworkSnapshot LifecycleManager::start_network(const std::string &net_id, const network::RadioSettings &params)
        {
            auto &slot = slot_for(net_id);

            {
                std::lock_guard<std::mutex> lock(slot.mutex);
                if (slot.state == NetworkState::Active)
                {
                    throw WilabError(ErrorCode::AlreadyActive, "Network " + net_id + " is already active");
                }
                if (slot.state != NetworkState::Inactive)
                {
                    throw WilabError(ErrorCode::Busy, "Network " + net_id + " is " + to_string(slot.state));
                }
                if (shutting_down_)
                {
                    throw WilabError(ErrorCode::Busy, "Service is shutting down");
                }

                params.validate();
                slot.state = NetworkState::Starting;
            }

            NetworkInstance instance;
            instance.settings = params;
            if (params.encryption == network::Encryption::Open)
            {
                instance.settings.password.reset();
            }

            const auto timeout = effective_timeout(params.timeout);
            instance.settings.timeout = static_cast<int>(timeout.count());
            instance.internet_enabled = params.internet_enabled.value_or(internet_enabled_by_default_);
            instance.created_at = Clock::now();
            instance.expires_at = instance.created_at + timeout;

            logger_->info("Starting network",
                          core::LogContext()
                              .add("net_id", net_id)
                              .add("interface", slot.interface)
                              .add("ssid", params.ssid)
                              .add("timeout_s", timeout.count())
                              .add("internet", instance.internet_enabled));

            try
            {
                instance.ap_process = access_point_->start(net_id, slot.interface, instance.settings);
                instance.dhcp_process = dhcp_->start(net_id, slot.interface, slot.subnet);

                try
                {
                    access_point_->set_tx_power(slot.interface, instance.settings.channel,
                                                instance.settings.tx_power_level, false);
                }
                catch (const std::exception &e)
                {
                    logger_->warning("TX power level not applied",
                                     core::LogContext().add("net_id", net_id).add("error", e.what()));
                    instance.warnings.push_back(std::string("TX power level not applied: ") + e.what());
                }

                instance.isolation_applied = true;
                forwarding_->apply_isolation(net_id, slot.subnet.cidr, peers_of(slot));

                if (instance.internet_enabled)
                {
                    instance.nat_applied = true;
                    forwarding_->enable_nat(net_id, slot.interface, slot.subnet.cidr);
                }
            }
            catch (const std::exception &e)
            {
                logger_->error("Network start failed, rolling back",
                               core::LogContext().add("net_id", net_id).add("error", e.what()));

                teardown(slot, instance);
                {
                    std::lock_guard<std::mutex> lock(slot.mutex);
                    slot.state = NetworkState::Inactive;
                }
                throw;
            }

            {
                // Under the slot lock shutdown_all either finds ACTIVE or this start rolls back
                std::lock_guard<std::mutex> lock(slot.mutex);
                if (!shutting_down_)
                {
                    slot.instance = std::move(instance);
                    slot.state = NetworkState::Active;

                    logger_->info("Network started",
                                  core::LogContext()
                                      .add("net_id", net_id)
                                      .add("subnet", slot.subnet.cidr)
                                      .add("expires_at", Clock::to_time_t(slot.instance->expires_at)));
                    return snapshot_locked(slot);
                }
            }

            logger_->warning("Shutdown during start, rolling back", core::LogContext().add("net_id", net_id));
            teardown(slot, instance);
            {
                std::lock_guard<std::mutex> lock(slot.mutex);
                slot.state = NetworkState::Inactive;
            }
            throw WilabError(ErrorCode::Busy, "Service is shutting down");
        }

        std::vector<core::TeardownStep> LifecycleManager::teardown(NetworkSlot &slot, NetworkInstance &instance)
        {
            std::vector<core::TeardownStep> steps;

            auto run_step = [&](const char *name, auto &&action) {
                core::TeardownStep step;
                step.name = name;
                try
                {
                    action();
                }
                catch (const std::exception &e)
                {
                    step.ok = false;
                    step.error = e.what();
                    logger_->error("Teardown step failed",
                                   core::LogContext()
                                       .add("net_id", slot.net_id)
                                       .add("step", name)
                                       .add("error", e.what()));
                }
                steps.push_back(std::move(step));
            };

            if (instance.nat_applied)
            {
                run_step("nat", [&] {
                    forwarding_->disable_nat(slot.net_id);
                    instance.nat_applied = false;
                });
            }

            if (instance.isolation_applied)
            {
                run_step("isolation", [&] {
                    forwarding_->remove_isolation(slot.net_id);
                    instance.isolation_applied = false;
                });
            }

            if (instance.dhcp_process)
            {
                run_step("dhcp", [&] {
                    dhcp_->stop(slot.net_id, slot.interface, slot.subnet, instance.dhcp_process.get());
                });
                instance.dhcp_process.reset();
            }

            if (instance.ap_process)
            {
                run_step("ap", [&] {
                    access_point_->stop(slot.net_id, slot.interface, instance.ap_process.get());
                });
                instance.ap_process.reset();
            }

            return steps;
        }

        void LifecycleManager::stop_network(const std::string &net_id)
        {
            auto &slot = slot_for(net_id);
            NetworkInstance instance;

            {
                std::lock_guard<std::mutex> lock(slot.mutex);
                if (slot.state == NetworkState::Inactive)
                {
                    logger_->debug("Stop on inactive network", core::LogContext().add("net_id", net_id));
                    return;
                }
                if (slot.state != NetworkState::Active || slot.busy)
                {
                    throw WilabError(ErrorCode::Busy, "Network " + net_id + " has an operation in progress");
                }

                slot.state = NetworkState::Stopping;
                instance = std::move(*slot.instance);
                slot.instance.reset();
            }

            logger_->info("Stopping network", core::LogContext().add("net_id", net_id).add("interface", slot.interface));

            auto steps = teardown(slot, instance);

            {
                std::lock_guard<std::mutex> lock(slot.mutex);
                slot.state = NetworkState::Inactive;
            }

            std::string failed;
            for (const auto &step : steps)
            {
                if (!step.ok)
                {
                    failed += (failed.empty() ? "" : ", ") + step.name;
                }
            }

            if (!failed.empty())
            {
                throw WilabError("Teardown of " + net_id + " incomplete (failed: " + failed + ")", std::move(steps));
            }

            logger_->info("Network stopped", core::LogContext().add("net_id", net_id));
        }

        NetworkSnapshot LifecycleManager::get_status(const std::string &net_id)
        {
            auto &slot = slot_for(net_id);

            NetworkSnapshot snapshot;
            {
                std::lock_guard<std::mutex> lock(slot.mutex);
                snapshot = snapshot_locked(slot);
            }

            if (!snapshot.active())
            {
                return snapshot;
            }

            std::vector<std::string> stations;
            try
            {
                snapshot.leases = dhcp_->read_leases(net_id);
                stations = access_point_->list_stations(slot.interface);
            }
            catch (const std::exception &e)
            {
                logger_->warning("Could not read clients", core::LogContext().add("net_id", net_id).add("error", e.what()));
            }

            snapshot.clients = network::match_clients(stations, snapshot.leases, Clock::to_time_t(Clock::now()));
            return snapshot;
        }

        NetworkDetails LifecycleManager::claim_active(NetworkSlot &slot)
        {
            std::lock_guard<std::mutex> lock(slot.mutex);
            if (slot.state == NetworkState::Inactive)
            {
                throw WilabError(ErrorCode::NotActive, "Network " + slot.net_id + " is not active");
            }
            if (slot.state != NetworkState::Active || slot.busy)
            {
                throw WilabError(ErrorCode::Busy, "Network " + slot.net_id + " has an operation in progress");
            }

            slot.busy = true;
            return details_of(*slot.instance);
        }

        NetworkSnapshot LifecycleManager::set_internet_enabled(const std::string &net_id, bool enabled)
        {
            auto &slot = slot_for(net_id);

            {
                auto details = claim_active(slot);
                SlotClaim claim(slot);

                if (details.internet_enabled == enabled)
                {
                    logger_->debug("Internet access unchanged",
                                   core::LogContext().add("net_id", net_id).add("enabled", enabled));
                }
                else if (enabled)
                {
                    {
                        std::lock_guard<std::mutex> lock(slot.mutex);
                        slot.instance->nat_applied = true;
                    }

                    try
                    {
                        forwarding_->enable_nat(net_id, slot.interface, slot.subnet.cidr);
                    }
                    catch (const WilabError &e)
                    {
                        logger_->error("Enabling internet failed, removing partial rules",
                                       core::LogContext().add("net_id", net_id).add("error", e.what()));
                        try
                        {
                            forwarding_->disable_nat(net_id);
                            std::lock_guard<std::mutex> lock(slot.mutex);
                            slot.instance->nat_applied = false;
                        }
                        catch (const WilabError &cleanup_error)
                        {
                            logger_->error("Partial NAT rules left in place",
                                           core::LogContext().add("net_id", net_id).add("error", cleanup_error.what()));
                        }
                        throw;
                    }

                    std::lock_guard<std::mutex> lock(slot.mutex);
                    slot.instance->internet_enabled = true;
                }
                else
                {
                    forwarding_->disable_nat(net_id);

                    std::lock_guard<std::mutex> lock(slot.mutex);
                    slot.instance->internet_enabled = false;
                    slot.instance->nat_applied = false;
                }
            }

            logger_->info("Internet access updated", core::LogContext().add("net_id", net_id).add("enabled", enabled));

            std::lock_guard<std::mutex> lock(slot.mutex);
            return snapshot_locked(slot);
        }

        network::TxPowerReport LifecycleManager::set_tx_power(const std::string &net_id, int level)
        {
            auto &slot = slot_for(net_id);
            if (!network::is_valid_tx_power_level(level))
            {
                throw WilabError(ErrorCode::ValidationFailed, "tx_power_level must be 1-4");
            }

            auto details = claim_active(slot);
            SlotClaim claim(slot);

            auto report = access_point_->set_tx_power(slot.interface, details.settings.channel, level, true);

            std::lock_guard<std::mutex> lock(slot.mutex);
            slot.instance->settings.tx_power_level = level;
            return report;
        }

        network::TxPowerReport LifecycleManager::get_tx_power(const std::string &net_id)
        {
            auto &slot = slot_for(net_id);

            network::RadioSettings settings;
            {
                std::lock_guard<std::mutex> lock(slot.mutex);
                if (slot.state == NetworkState::Inactive)
                {
                    throw WilabError(ErrorCode::NotActive, "Network " + net_id + " is not active");
                }
                if (slot.state != NetworkState::Active)
                {
                    throw WilabError(ErrorCode::Busy, "Network " + net_id + " is " + to_string(slot.state));
                }
                settings = slot.instance->settings;
            }

            return access_point_->tx_power_info(slot.interface, settings.channel, settings.tx_power_level);
        }

        std::vector<NetworkSnapshot> LifecycleManager::list_networks()
        {
            std::vector<NetworkSnapshot> result;
            for (const auto &slot : slots_)
            {
                std::lock_guard<std::mutex> lock(slot->mutex);
                result.push_back(snapshot_locked(*slot));
            }
            return result;
        }

        HealthReport LifecycleManager::health()
        {
            HealthReport report;

            for (const auto &slot : slots_)
            {
                std::lock_guard<std::mutex> lock(slot->mutex);
                if (slot->state != NetworkState::Active || !slot->instance)
                {
                    continue;
                }

                ++report.active_networks;
                auto &instance = *slot->instance;
                if (instance.internet_enabled)
                {
                    report.nat_expected = true;
                }
                if (!instance.ap_process || !instance.ap_process->is_running() ||
                    !instance.dhcp_process || !instance.dhcp_process->is_running())
                {
                    report.daemons_running = false;
                }
            }

            report.forwarding = forwarding_->status();

            if (report.active_networks == 0)
            {
                report.status = "standby";
            }
            else
            {
                bool nat_ok = !report.nat_expected ||
                              (report.forwarding.nat_configured && report.forwarding.upstream_reachable());
                report.status = report.daemons_running && nat_ok ? "ok" : "degraded";
            }
            return report;
        }

        void LifecycleManager::shutdown_all()
        {
            shutting_down_ = true;
            stop_expiry_loop();

            logger_->info("Shutting down all networks");
            for (const auto &slot : slots_)
            {
                try
                {
                    stop_network(slot->net_id);
                }
                catch (const WilabError &e)
                {
                    logger_->error("Shutdown of network failed",
                                   core::LogContext().add("net_id", slot->net_id).add("error", e.what()));
                }
            }
        }

        std::size_t LifecycleManager::expire_networks(Clock::time_point now)
        {
            std::vector<std::string> expired;
            for (const auto &slot : slots_)
            {
                std::lock_guard<std::mutex> lock(slot->mutex);
                if (slot->state == NetworkState::Active && slot->instance && slot->instance->expires_at <= now)
                {
                    expired.push_back(slot->net_id);
                }
            }

            std::size_t stopped = 0;
            for (const auto &net_id : expired)
            {
                logger_->info("Network expired, stopping", core::LogContext().add("net_id", net_id));
                try
                {
                    stop_network(net_id);
                    ++stopped;
                }
                catch (const WilabError &e)
                {
                    if (e.code() == ErrorCode::Busy)
                    {
                        logger_->debug("Expired network busy, retrying next tick", core::LogContext().add("net_id", net_id));
                        continue;
                    }
                    if (e.code() == ErrorCode::PartialTeardown)
                    {
                        ++stopped;
                    }
                    logger_->error("Failed stopping expired network",
                                   core::LogContext().add("net_id", net_id).add("error", e.what()));
                }
            }
            return stopped;
        }

        void LifecycleManager::start_expiry_loop()
        {
            if (running_.exchange(true))
            {
                return;
            }

            expiry_thread_ = std::thread(&LifecycleManager::run_expiry_loop, this);
            logger_->info("Expiry loop started", core::LogContext().add("interval_s", expiry_interval_.count()));
        }

        void LifecycleManager::stop_expiry_loop()
        {
            if (!running_.exchange(false))
            {
                return;
            }

            expiry_cv_.notify_all();
            if (expiry_thread_.joinable())
            {
                expiry_thread_.join();
            }
        }

        void LifecycleManager::run_expiry_loop()
        {
            while (running_)
            {
                {
                    std::unique_lock<std::mutex> lock(expiry_mutex_);
                    expiry_cv_.wait_for(lock, expiry_interval_, [this] { return !running_; });
                }

                if (!running_)
                {
                    break;
                }

                try
                {
                    expire_networks(Clock::now());
                }
                catch (const std::exception &e)
                {
                    logger_->error("Expiry loop error", core::LogContext().add("error", e.what()));
                }
            }
        }

    } // namespace services
} // namespace wilab
