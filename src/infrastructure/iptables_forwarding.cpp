/**
 * NAT and isolation rules
 * Every rule carries a wilab-* comment so it can be found again by listing the chain
 */

#include "wilab/infrastructure/iptables_forwarding.hpp"
#include "wilab/core/errors.hpp"
#include "wilab/core/logger.hpp"

#include <sstream>

namespace wilab
{
    namespace infrastructure
    {

        namespace
        {
            const std::string TAG_PREFIX = "wilab-";
            const std::string PROTECT_TAG = "wilab-protect-existing";

            std::string comment_of(const std::vector<std::string> &args)
            {
                for (size_t i = 0; i + 1 < args.size(); ++i)
                {
                    if (args[i] == "--comment")
                    {
                        return args[i + 1];
                    }
                }
                return "";
            }

            bool starts_with(const std::string &value, const std::string &prefix)
            {
                return value.compare(0, prefix.size(), prefix) == 0;
            }

            std::string trim(const std::string &value)
            {
                auto first = value.find_first_not_of(" \t\r\n");
                if (first == std::string::npos)
                {
                    return "";
                }
                auto last = value.find_last_not_of(" \t\r\n");
                return value.substr(first, last - first + 1);
            }
        }

        std::string nat_tag(const std::string &net_id)
        {
            return TAG_PREFIX + "nat-" + net_id;
        }

        std::string forward_tag(const std::string &net_id)
        {
            return TAG_PREFIX + "fwd-" + net_id;
        }

        // net_ids never contain ':', so the owner prefix is unambiguous
        std::string isolation_tag(const std::string &owner, const std::string &peer)
        {
            return TAG_PREFIX + "iso-" + owner + ":" + peer;
        }

        std::vector<std::string> split_rule(const std::string &line)
        {
            std::vector<std::string> args;
            std::string current;
            bool quoted = false;
            bool has_token = false;

            for (char c : line)
            {
                if (c == '"')
                {
                    quoted = !quoted;
                    has_token = true;
                }
                else if ((c == ' ' || c == '\t') && !quoted)
                {
                    if (has_token)
                    {
                        args.push_back(current);
                        current.clear();
                        has_token = false;
                    }
                }
                else if (c != '\r' && c != '\n')
                {
                    current += c;
                    has_token = true;
                }
            }
            if (has_token)
            {
                args.push_back(current);
            }
            return args;
        }

        IptablesForwarding::IptablesForwarding(std::shared_ptr<CommandRunner> runner,
                                               const std::string &upstream_interface)
            : runner_(std::move(runner)),
              logger_(core::get_logger("IptablesForwarding")),
              configured_upstream_(upstream_interface)
        {
        }

        std::vector<std::string> IptablesForwarding::base_args(const std::string &table)
        {
            if (table == "filter")
            {
                return {"iptables"};
            }
            return {"iptables", "-t", table};
        }

        void IptablesForwarding::ensure_rule(const RuleSpec &rule, bool insert_first)
        {
            std::vector<std::string> spec = rule.match;
            spec.insert(spec.end(), {"-m", "comment", "--comment", rule.comment});

            auto check = base_args(rule.table);
            check.insert(check.end(), {"-C", rule.chain});
            check.insert(check.end(), spec.begin(), spec.end());

            if (runner_->run(check, false).ok())
            {
                logger_->debug("Rule already present", core::LogContext().add("tag", rule.comment));
                return;
            }

            auto add = base_args(rule.table);
            if (insert_first)
            {
                add.insert(add.end(), {"-I", rule.chain, "1"});
            }
            else
            {
                add.insert(add.end(), {"-A", rule.chain});
            }
            add.insert(add.end(), spec.begin(), spec.end());

            runner_->run(add);
            logger_->debug("Rule added", core::LogContext().add("rule", core::join_argv(add)));
        }

        std::vector<std::vector<std::string>> IptablesForwarding::list_rules(const std::string &table,
                                                                             const std::string &chain,
                                                                             const CommentFilter &filter)
        {
            auto cmd = base_args(table);
            cmd.insert(cmd.end(), {"-S", chain});
            auto listing = runner_->run(cmd);

            std::vector<std::vector<std::string>> matches;
            std::istringstream stream(listing.stdout_output);
            std::string line;
            while (std::getline(stream, line))
            {
                auto args = split_rule(line);
                if (args.size() < 2 || args[0] != "-A")
                {
                    continue;
                }
                if (filter(comment_of(args)))
                {
                    matches.push_back(std::move(args));
                }
            }
            return matches;
        }

        std::size_t IptablesForwarding::delete_rules(const std::string &table,
                                                     const std::string &chain,
                                                     const CommentFilter &filter)
        {
            auto rules = list_rules(table, chain, filter);
            for (auto &args : rules)
            {
                args[0] = "-D";
                auto cmd = base_args(table);
                cmd.insert(cmd.end(), args.begin(), args.end());
                runner_->run(cmd);
            }
            return rules.size();
        }

        void IptablesForwarding::protect_established_if_drop_policy()
        {
            try
            {
                auto policy = runner_->run({"iptables", "-S", "FORWARD"});
                if (policy.stdout_output.find("-P FORWARD DROP") == std::string::npos)
                {
                    return;
                }

                logger_->warning("FORWARD policy is DROP, protecting established connections first");
                ensure_rule({"filter", "FORWARD",
                             {"-m", "conntrack", "--ctstate", "ESTABLISHED,RELATED", "-j", "ACCEPT"},
                             PROTECT_TAG},
                            true);
            }
            catch (const core::CommandError &e)
            {
                logger_->warning("Could not check FORWARD policy", core::LogContext().add("error", e.what()));
            }
        }

        void IptablesForwarding::acquire_ip_forwarding(const std::string &net_id)
        {
            if (nat_slots_.empty() && !prior_ip_forward_)
            {
                auto current = runner_->run({"sysctl", "-n", "net.ipv4.ip_forward"});
                prior_ip_forward_ = trim(current.stdout_output);

                if (*prior_ip_forward_ != "1")
                {
                    runner_->run({"sysctl", "-w", "net.ipv4.ip_forward=1"});
                    logger_->info("IP forwarding enabled", core::LogContext().add("previous", *prior_ip_forward_));
                }
            }
            nat_slots_.insert(net_id);
        }

        void IptablesForwarding::release_ip_forwarding(const std::string &net_id)
        {
            if (nat_slots_.erase(net_id) == 0 || !nat_slots_.empty() || !prior_ip_forward_)
            {
                return;
            }

            std::string prior = *prior_ip_forward_;
            prior_ip_forward_.reset();
            if (prior != "1")
            {
                runner_->run({"sysctl", "-w", "net.ipv4.ip_forward=" + prior});
                logger_->info("IP forwarding restored", core::LogContext().add("value", prior));
            }
        }

        void IptablesForwarding::enable_nat(const std::string &net_id,
                                            const std::string &interface,
                                            const std::string &subnet_cidr)
        {
            std::lock_guard<std::mutex> lock(rules_mutex_);

            try
            {
                const std::string upstream = resolve_upstream_locked();
                logger_->info("Enabling NAT",
                              core::LogContext()
                                  .add("net_id", net_id)
                                  .add("interface", interface)
                                  .add("upstream", upstream));

                protect_established_if_drop_policy();
                acquire_ip_forwarding(net_id);

                ensure_rule({"nat", "POSTROUTING",
                             {"-s", subnet_cidr, "-o", upstream, "-j", "MASQUERADE"},
                             nat_tag(net_id)});
                ensure_rule({"filter", "FORWARD",
                             {"-i", interface, "-o", upstream, "-j", "ACCEPT"},
                             forward_tag(net_id)});
                ensure_rule({"filter", "FORWARD",
                             {"-i", upstream, "-o", interface, "-m", "state", "--state", "RELATED,ESTABLISHED",
                              "-j", "ACCEPT"},
                             forward_tag(net_id)});
            }
            catch (const core::CommandError &e)
            {
                logger_->error("Failed to enable NAT", core::LogContext().add("net_id", net_id).add("error", e.what()));
                throw core::WilabError(core::ErrorCode::RuleApplyFailed, "Cannot enable NAT: " + e.detail());
            }
        }

        void IptablesForwarding::disable_nat(const std::string &net_id)
        {
            std::lock_guard<std::mutex> lock(rules_mutex_);

            std::string failure;
            try
            {
                const auto nat = nat_tag(net_id);
                const auto fwd = forward_tag(net_id);
                std::size_t removed = delete_rules("nat", "POSTROUTING", [&](const std::string &c) { return c == nat; });
                removed += delete_rules("filter", "FORWARD", [&](const std::string &c) { return c == fwd; });

                logger_->info("NAT disabled", core::LogContext().add("net_id", net_id).add("rules_removed", removed));
            }
            catch (const core::CommandError &e)
            {
                failure = e.detail();
            }

            try
            {
                release_ip_forwarding(net_id);
            }
            catch (const core::CommandError &e)
            {
                failure += (failure.empty() ? "" : "; ") + e.detail();
            }

            if (!failure.empty())
            {
                logger_->error("Failed to disable NAT", core::LogContext().add("net_id", net_id).add("error", failure));
                throw core::WilabError(core::ErrorCode::RuleApplyFailed, "Cannot disable NAT: " + failure);
            }
        }

        void IptablesForwarding::apply_isolation(const std::string &net_id,
                                                 const std::string &subnet_cidr,
                                                 const std::vector<PeerSubnet> &peers)
        {
            std::lock_guard<std::mutex> lock(rules_mutex_);

            try
            {
                for (const auto &peer : peers)
                {
                    if (peer.net_id == net_id)
                    {
                        continue;
                    }

                    const auto tag = isolation_tag(net_id, peer.net_id);
                    ensure_rule({"filter", "FORWARD", {"-s", subnet_cidr, "-d", peer.cidr, "-j", "DROP"}, tag}, true);
                    ensure_rule({"filter", "FORWARD", {"-s", peer.cidr, "-d", subnet_cidr, "-j", "DROP"}, tag}, true);
                }
            }
            catch (const core::CommandError &e)
            {
                logger_->error("Failed to apply isolation",
                               core::LogContext().add("net_id", net_id).add("error", e.what()));
                throw core::WilabError(core::ErrorCode::RuleApplyFailed, "Cannot apply isolation: " + e.detail());
            }

            logger_->info("Isolation applied", core::LogContext().add("net_id", net_id).add("peers", peers.size()));
        }

        void IptablesForwarding::remove_isolation(const std::string &net_id)
        {
            std::lock_guard<std::mutex> lock(rules_mutex_);

            const std::string prefix = TAG_PREFIX + "iso-" + net_id + ":";
            try
            {
                auto removed = delete_rules("filter", "FORWARD",
                                            [&](const std::string &c) { return starts_with(c, prefix); });
                logger_->info("Isolation removed", core::LogContext().add("net_id", net_id).add("rules_removed", removed));
            }
            catch (const core::CommandError &e)
            {
                throw core::WilabError(core::ErrorCode::RuleApplyFailed, "Cannot remove isolation: " + e.detail());
            }
        }

        std::size_t IptablesForwarding::count_rules(const std::string &net_id)
        {
            std::lock_guard<std::mutex> lock(rules_mutex_);

            const auto nat = nat_tag(net_id);
            const auto fwd = forward_tag(net_id);
            const std::string iso_prefix = TAG_PREFIX + "iso-" + net_id + ":";

            auto nat_rules = list_rules("nat", "POSTROUTING", [&](const std::string &c) { return c == nat; });
            auto fwd_rules = list_rules("filter", "FORWARD", [&](const std::string &c) {
                return c == fwd || starts_with(c, iso_prefix);
            });
            return nat_rules.size() + fwd_rules.size();
        }

        std::vector<std::string> IptablesForwarding::list_tagged_rules()
        {
            std::lock_guard<std::mutex> lock(rules_mutex_);

            auto ours = [](const std::string &c) { return starts_with(c, TAG_PREFIX); };
            std::vector<std::string> lines;
            for (const auto &[table, chain] : {std::make_pair("nat", "POSTROUTING"), std::make_pair("filter", "FORWARD")})
            {
                for (const auto &args : list_rules(table, chain, ours))
                {
                    lines.push_back(core::join_argv(args));
                }
            }
            return lines;
        }

        std::string IptablesForwarding::upstream_interface()
        {
            std::lock_guard<std::mutex> lock(rules_mutex_);
            return resolve_upstream_locked();
        }

        std::string IptablesForwarding::resolve_upstream_locked()
        {
            if (upstream_cache_)
            {
                return *upstream_cache_;
            }

            if (configured_upstream_ != "auto")
            {
                upstream_cache_ = configured_upstream_;
                return *upstream_cache_;
            }

            auto routes = runner_->run({"ip", "route", "show", "default"}, false);
            std::istringstream words(routes.stdout_output);
            std::string word;
            while (words >> word)
            {
                if (word == "dev" && words >> word)
                {
                    logger_->info("Detected upstream interface", core::LogContext().add("interface", word));
                    upstream_cache_ = word;
                    return word;
                }
            }

            throw core::WilabError(core::ErrorCode::RuleApplyFailed,
                                   "cannot determine upstream interface: no default route");
        }

        ForwardingStatus IptablesForwarding::status()
        {
            ForwardingStatus result;

            try
            {
                result.upstream_interface = upstream_interface();

                auto addr = runner_->run({"ip", "addr", "show", result.upstream_interface}, false);
                const auto &out = addr.stdout_output;
                result.upstream_has_ip = addr.ok() && out.find("inet ") != std::string::npos;
                result.upstream_up = addr.ok() && (out.find("state UP") != std::string::npos ||
                                                   out.find(",UP") != std::string::npos ||
                                                   out.find("<UP") != std::string::npos);

                std::lock_guard<std::mutex> lock(rules_mutex_);
                auto masquerade = list_rules("nat", "POSTROUTING",
                                             [](const std::string &c) { return starts_with(c, TAG_PREFIX + "nat-"); });
                result.nat_configured = !masquerade.empty();
            }
            catch (const core::WilabError &e)
            {
                result.error = e.what();
            }

            if (result.upstream_interface.empty())
            {
                result.upstream_interface = configured_upstream_;
            }
            return result;
        }

    } // namespace infrastructure
} // namespace wilab
