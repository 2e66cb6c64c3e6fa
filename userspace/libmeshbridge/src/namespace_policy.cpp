/**
 * @file
 *
 * Implementation of namespace_policy.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "namespace_policy.h"

namespace
{

const std::set<std::string> SYSTEM_NAMESPACES = {
	"kube-system",
	"kube-public",
	"local-path-storage",
};

} // end namespace

namespace meshbridge
{

namespace_policy::namespace_policy(const namespace_settings& settings):
	m_settings(settings)
{
}

bool namespace_policy::should_ignore(const std::string& k8s_namespace) const
{
	if(SYSTEM_NAMESPACES.count(k8s_namespace) > 0)
	{
		return true;
	}

	if(m_settings.deny_k8s_namespaces.count(k8s_namespace) > 0)
	{
		return true;
	}

	return m_settings.allow_k8s_namespaces.count("*") == 0 &&
	       m_settings.allow_k8s_namespaces.count(k8s_namespace) == 0;
}

std::string namespace_policy::consul_namespace(const std::string& k8s_namespace) const
{
	if(!m_settings.enable_consul_namespaces)
	{
		return "";
	}

	if(m_settings.enable_ns_mirroring)
	{
		return m_settings.ns_mirroring_prefix + k8s_namespace;
	}

	return m_settings.consul_destination_namespace;
}

query_options namespace_policy::query_for(const std::string& k8s_namespace) const
{
	query_options opts;

	opts.ns = consul_namespace(k8s_namespace);
	if(m_settings.enable_consul_partitions)
	{
		opts.partition = m_settings.consul_partition;
	}

	return opts;
}

bool namespace_policy::qualified_upstreams() const
{
	return m_settings.enable_consul_namespaces || m_settings.enable_consul_partitions;
}

} // namespace meshbridge
