#ifndef WILAB_INFRASTRUCTURE_IPTABLES_FORWARDING_HPP
#define WILAB_INFRASTRUCTURE_IPTABLES_FORWARDING_HPP

#include "wilab/infrastructure/command_runner.hpp"
#include "wilab/infrastructure/forwarding_controller.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>

namespace wilab
{
    namespace core
    {
        class Logger;
    }
}

namespace wilab
{
    namespace infrastructure
    {

        std::string nat_tag(const std::string &net_id);
        std::string forward_tag(const std::string &net_id);
        std::string isolation_tag(const std::string &owner, const std::string &peer);

        /**
         * Splits one `iptables -S` line into arguments, dropping quotes around comments
         */
        std::vector<std::string> split_rule(const std::string &line);

        /**
         * iptables/sysctl implementation.
         * One rule-table lock serializes every mutation and guards the forwarding refcount.
         */
        class IptablesForwarding : public ForwardingController
        {
        public:
            IptablesForwarding(std::shared_ptr<CommandRunner> runner, const std::string &upstream_interface);

            void apply_isolation(const std::string &net_id,
                                 const std::string &subnet_cidr,
                                 const std::vector<PeerSubnet> &peers) override;
            void remove_isolation(const std::string &net_id) override;

            void enable_nat(const std::string &net_id,
                            const std::string &interface,
                            const std::string &subnet_cidr) override;
            void disable_nat(const std::string &net_id) override;

            std::size_t count_rules(const std::string &net_id) override;
            std::vector<std::string> list_tagged_rules() override;

            ForwardingStatus status() override;

            /** Configured upstream, or the device of the default route when set to auto */
            std::string upstream_interface();

        private:
            using CommentFilter = std::function<bool(const std::string &)>;

            struct RuleSpec
            {
                std::string table;
                std::string chain;
                std::vector<std::string> match;
                std::string comment;
            };

            void ensure_rule(const RuleSpec &rule, bool insert_first = false);
            std::size_t delete_rules(const std::string &table, const std::string &chain, const CommentFilter &filter);
            std::vector<std::vector<std::string>> list_rules(const std::string &table, const std::string &chain,
                                                             const CommentFilter &filter);
            void protect_established_if_drop_policy();
            void acquire_ip_forwarding(const std::string &net_id);
            void release_ip_forwarding(const std::string &net_id);
            std::string resolve_upstream_locked();

            static std::vector<std::string> base_args(const std::string &table);

            std::shared_ptr<CommandRunner> runner_;
            std::shared_ptr<core::Logger> logger_;

            std::string configured_upstream_;
            std::optional<std::string> upstream_cache_;

            std::mutex rules_mutex_;
            std::set<std::string> nat_slots_;
            std::optional<std::string> prior_ip_forward_;
        };

    } // namespace infrastructure
} // namespace wilab

#endif // WILAB_INFRASTRUCTURE_IPTABLES_FORWARDING_HPP
