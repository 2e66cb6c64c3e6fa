/**
 * @file
 *
 * Unit tests for agent_directory.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "agent_directory.h"
#include "fake_consul_client.h"
#include "fake_k8s_client.h"
#include "k8s_fixtures.h"
#include "meshbridge_exception.h"

#include <gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace meshbridge;
using namespace test_helpers;

namespace
{

class agent_directory_test : public testing::Test
{
protected:
	agent_directory_test():
		m_k8s(std::make_shared<fake_k8s_client>()),
		m_directory(m_k8s, "consul", "consul", [this](const std::string& ip) {
			m_requested_ips.push_back(ip);
			return std::make_shared<fake_consul_client>();
		})
	{
	}

	std::shared_ptr<fake_k8s_client> m_k8s;
	std::vector<std::string> m_requested_ips;
	agent_directory m_directory;
};

} // end namespace

TEST(agent_topology_test, parse)
{
	ASSERT_EQ(agent_topology::shared, parse_agent_topology("shared"));
	ASSERT_EQ(agent_topology::per_node, parse_agent_topology("per_node"));
	ASSERT_THROW(parse_agent_topology("per-node"), meshbridge_exception);
}

TEST(agent_directory_shared_test, single_client)
{
	const consul_client::ptr shared = std::make_shared<fake_consul_client>();
	const agent_directory directory(shared);

	ASSERT_EQ(agent_topology::shared, directory.topology());
	ASSERT_EQ(shared, directory.client_for_pod(make_injected_pod("ns1", "web", "10.0.0.1")));

	const std::vector<agent_handle> agents = directory.reachable_agents();
	ASSERT_EQ(1u, agents.size());
	ASSERT_EQ(shared, agents[0].client);
}

TEST_F(agent_directory_test, selector)
{
	ASSERT_EQ("component=client,app=consul,release=consul", m_directory.agent_label_selector());
}

TEST_F(agent_directory_test, pod_client_uses_host_ip)
{
	m_directory.client_for_pod(make_injected_pod("ns1", "web", "10.0.0.1", "node-1", "10.1.0.7"));

	ASSERT_EQ(std::vector<std::string>({"10.1.0.7"}), m_requested_ips);
}

TEST_F(agent_directory_test, pod_without_host_ip)
{
	ASSERT_THROW(m_directory.client_for_pod(make_injected_pod("ns1", "web", "10.0.0.1", "", "")),
	             meshbridge_exception);
}

TEST_F(agent_directory_test, only_ready_agents_are_reachable)
{
	m_k8s->add_pod(make_agent_pod("consul", "consul-a", "consul", "node-1", "10.1.0.1"));
	pod unready = make_agent_pod("consul", "consul-b", "consul", "node-2", "10.1.0.2");
	unready.conditions[0].status = "False";
	m_k8s->add_pod(unready);
	m_k8s->add_pod(make_agent_pod("consul", "other-a", "other", "node-1", "10.1.0.3"));
	m_k8s->add_pod(make_agent_pod("elsewhere", "consul-c", "consul", "node-3", "10.1.0.4"));

	const std::vector<agent_handle> agents = m_directory.reachable_agents();

	ASSERT_EQ(1u, agents.size());
	ASSERT_EQ("consul-a", agents[0].name);
	ASSERT_EQ("10.1.0.1", agents[0].address);
	ASSERT_EQ(std::vector<std::string>({"10.1.0.1"}), m_requested_ips);
}

TEST_F(agent_directory_test, listing_failure_propagates)
{
	m_k8s->fail("list_pods", 500);

	ASSERT_THROW(m_directory.reachable_agents(), api_exception);
}

TEST_F(agent_directory_test, agent_pod_recognition)
{
	ASSERT_TRUE(m_directory.is_agent_pod(
	    make_agent_pod("consul", "consul-a", "consul", "node-1", "10.1.0.1")));
	ASSERT_FALSE(m_directory.is_agent_pod(
	    make_agent_pod("consul", "other-a", "other", "node-1", "10.1.0.1")));
	ASSERT_FALSE(m_directory.is_agent_pod(make_injected_pod("ns1", "web", "10.0.0.1")));
}
