/**
 * @file
 *
 * Implementation of agent_directory.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "agent_directory.h"
#include "common_logger.h"
#include "meshbridge_exception.h"

COMMON_LOGGER();

namespace
{

const std::string LABEL_APP = "app";
const std::string LABEL_COMPONENT = "component";
const std::string LABEL_RELEASE = "release";
const std::string APP_CONSUL = "consul";
const std::string COMPONENT_CLIENT = "client";

} // end namespace

namespace meshbridge
{

agent_topology parse_agent_topology(const std::string& value)
{
	if(value == "shared")
	{
		return agent_topology::shared;
	}
	if(value == "per_node")
	{
		return agent_topology::per_node;
	}

	throw meshbridge_exception("unknown agent topology \"" + value +
	                           "\", expected \"shared\" or \"per_node\"");
}

agent_directory::agent_directory(const consul_client::ptr& shared):
	m_topology(agent_topology::shared),
	m_shared(shared)
{
}

agent_directory::agent_directory(const k8s_client::ptr& k8s,
                                 const std::string& release_name,
                                 const std::string& release_namespace,
                                 const client_factory& factory):
	m_topology(agent_topology::per_node),
	m_k8s(k8s),
	m_release_name(release_name),
	m_release_namespace(release_namespace),
	m_factory(factory)
{
}

consul_client::ptr agent_directory::client_for_pod(const pod& p) const
{
	if(m_topology == agent_topology::shared)
	{
		return m_shared;
	}

	if(p.host_ip.empty())
	{
		throw meshbridge_exception("pod " + p.metadata.key().to_string() +
		                           " has no host IP to reach its agent");
	}

	return m_factory(p.host_ip);
}

std::vector<agent_handle> agent_directory::reachable_agents() const
{
	std::vector<agent_handle> agents;

	if(m_topology == agent_topology::shared)
	{
		agents.push_back({"shared", "", m_shared});
		return agents;
	}

	for(const auto& agent : m_k8s->list_pods(m_release_namespace, agent_label_selector()))
	{
		if(!agent.is_ready())
		{
			LOG_INFO("Consul client agent %s is not ready, skipping",
			         agent.metadata.name.c_str());
			continue;
		}

		agents.push_back({agent.metadata.name, agent.pod_ip, m_factory(agent.pod_ip)});
	}

	return agents;
}

bool agent_directory::is_agent_pod(const pod& p) const
{
	std::string app;
	std::string component;
	std::string release;

	return p.metadata.get_label(LABEL_APP, app) && app == APP_CONSUL &&
	       p.metadata.get_label(LABEL_COMPONENT, component) && component == COMPONENT_CLIENT &&
	       p.metadata.get_label(LABEL_RELEASE, release) && release == m_release_name;
}

std::string agent_directory::agent_label_selector() const
{
	return LABEL_COMPONENT + "=" + COMPONENT_CLIENT + "," + LABEL_APP + "=" + APP_CONSUL + "," +
	       LABEL_RELEASE + "=" + m_release_name;
}

} // namespace meshbridge
