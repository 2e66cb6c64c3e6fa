/**
 * @file
 *
 * Interface to agent_directory, which hands out the Consul clients the
 * endpoints reconciler talks to.
 *
 * With the shared topology every call goes to one Consul address. With
 * the per-node topology services are registered with the client agent on
 * the pod's node, and since each agent only knows its own services,
 * cleanup has to visit every agent.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "consul_client.h"
#include "k8s_client.h"
#include "k8s_types.h"

#include <functional>
#include <string>
#include <vector>

namespace meshbridge
{

enum class agent_topology
{
	shared,
	per_node,
};

/**
 * @throws meshbridge_exception for anything but "shared" or "per_node".
 */
agent_topology parse_agent_topology(const std::string& value);

/**
 * A Consul agent and the client that reaches it.
 */
struct agent_handle
{
	std::string name;
	std::string address;
	consul_client::ptr client;
};

class agent_directory
{
public:
	/** Builds a client for the agent listening on the given IP. */
	using client_factory = std::function<consul_client::ptr(const std::string& ip)>;

	/**
	 * Shared topology: every call goes through the given client.
	 */
	explicit agent_directory(const consul_client::ptr& shared);

	/**
	 * Per-node topology: agents are the pods in release_namespace labeled
	 * app=consul, component=client, release=<release_name>.
	 */
	agent_directory(const k8s_client::ptr& k8s,
	                const std::string& release_name,
	                const std::string& release_namespace,
	                const client_factory& factory);

	agent_topology topology() const { return m_topology; }

	/**
	 * @returns the client that registrations for the pod go to.
	 */
	consul_client::ptr client_for_pod(const pod& p) const;

	/**
	 * @returns every agent that can currently serve requests. Agents that
	 *          are not ready are skipped; they resync when they become
	 *          ready.
	 *
	 * @throws api_exception if the agent pods cannot be listed.
	 */
	std::vector<agent_handle> reachable_agents() const;

	/**
	 * True if the pod is a client agent of this release.
	 */
	bool is_agent_pod(const pod& p) const;

	std::string agent_label_selector() const;

private:
	const agent_topology m_topology;
	const consul_client::ptr m_shared;
	const k8s_client::ptr m_k8s;
	const std::string m_release_name;
	const std::string m_release_namespace;
	const client_factory m_factory;
};

} // namespace meshbridge
