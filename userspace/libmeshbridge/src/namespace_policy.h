/**
 * @file
 *
 * Interface to namespace_policy, which decides which Kubernetes namespaces
 * are reconciled and which Consul namespace and partition they map to.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "consul_types.h"

#include <set>
#include <string>

namespace meshbridge
{

struct namespace_settings
{
	std::set<std::string> allow_k8s_namespaces = {"*"};
	std::set<std::string> deny_k8s_namespaces;

	bool enable_consul_namespaces = false;
	std::string consul_destination_namespace = "default";
	bool enable_ns_mirroring = false;
	std::string ns_mirroring_prefix;

	bool enable_consul_partitions = false;
	std::string consul_partition;
};

class namespace_policy
{
public:
	namespace_policy() = default;
	explicit namespace_policy(const namespace_settings& settings);

	/**
	 * True for system namespaces, denied namespaces and namespaces that
	 * the allow list does not cover.
	 */
	bool should_ignore(const std::string& k8s_namespace) const;

	/**
	 * @returns the Consul namespace for a Kubernetes namespace, empty when
	 *          Consul namespaces are disabled.
	 */
	std::string consul_namespace(const std::string& k8s_namespace) const;

	/**
	 * @returns the namespace and partition requests for objects of the
	 *          given Kubernetes namespace are scoped to.
	 */
	query_options query_for(const std::string& k8s_namespace) const;

	/**
	 * True if upstream annotations may carry namespace and partition
	 * qualifiers.
	 */
	bool qualified_upstreams() const;

	const namespace_settings& settings() const { return m_settings; }

private:
	namespace_settings m_settings;
};

} // namespace meshbridge
