/**
 * @file
 *
 * Interface to iptables_effector, which programs the redirection rules of
 * an iptables_config into a network namespace.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "iptables_config.h"

#include <memory>
#include <string>
#include <vector>

namespace meshbridge
{

const std::string CHAIN_PROXY_INBOUND = "CONSUL_PROXY_INBOUND";
const std::string CHAIN_PROXY_IN_REDIRECT = "CONSUL_PROXY_IN_REDIRECT";
const std::string CHAIN_PROXY_OUTPUT = "CONSUL_PROXY_OUTPUT";
const std::string CHAIN_PROXY_REDIRECT = "CONSUL_PROXY_REDIRECT";
const std::string CHAIN_DNS_REDIRECT = "CONSUL_DNS_REDIRECT";

class iptables_effector
{
public:
	using ptr = std::shared_ptr<iptables_effector>;

	virtual ~iptables_effector() = default;

	/**
	 * Replace the nat rules of config.netns with the rules derived from
	 * config. Applying the same config twice yields the same rule set.
	 *
	 * @param[in] dual_stack also program the IPv6 table.
	 *
	 * @throws meshbridge_exception if the rules could not be applied.
	 */
	virtual void apply(const iptables_config& config, bool dual_stack) = 0;
};

/**
 * Feeds a complete nat table to iptables-restore (and ip6tables-restore)
 * run inside the target namespace through nsenter.
 */
class iptables_restore_effector : public iptables_effector
{
public:
	explicit iptables_restore_effector(const std::string& nsenter = "nsenter");

	void apply(const iptables_config& config, bool dual_stack) override;

	/**
	 * Render the iptables-restore document for one address family.
	 *
	 * @throws meshbridge_exception if config has no proxy user ID.
	 */
	static std::string render(const iptables_config& config, bool ipv6);

private:
	void restore(const std::string& tool,
	             const std::string& netns,
	             const std::string& document) const;

	const std::string m_nsenter;
};

} // namespace meshbridge
