/**
 * @file
 *
 * Unit tests for cni_plugin.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "annotations.h"
#include "cni_error.h"
#include "cni_plugin.h"
#include "fake_k8s_client.h"
#include "k8s_fixtures.h"
#include "k8s_json.h"

#include <gtest.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

using namespace meshbridge;
using namespace test_helpers;

namespace
{

const std::string PREV_RESULT_CONF = R"({
	"cniVersion": "0.4.0",
	"name": "k8s-pod-network",
	"type": "meshbridge-cni",
	"kubeconfig": "kubeconfig",
	"prevResult": {"cniVersion": "0.4.0", "ips": [{"version": "4", "address": "10.0.0.1/24"}]}
})";

const std::string NO_IPS_CONF = R"({
	"cniVersion": "0.4.0",
	"prevResult": {"cniVersion": "0.4.0", "ips": []}
})";

const std::string UNCHAINED_CONF = R"({"name": "k8s-pod-network", "type": "meshbridge-cni"})";

const std::string POD_ARGS = "IgnoreUnknown=1;K8S_POD_NAMESPACE=ns1;K8S_POD_NAME=web-abc";

class recording_effector : public iptables_effector
{
public:
	void apply(const iptables_config& config, const bool dual_stack) override
	{
		if(!m_failure.empty())
		{
			throw meshbridge_exception(m_failure);
		}
		m_applied.push_back(config);
		m_dual_stack = dual_stack;
	}

	std::vector<iptables_config> m_applied;
	bool m_dual_stack = false;
	std::string m_failure;
};

class cni_plugin_test : public testing::Test
{
protected:
	cni_plugin_test():
		m_k8s(std::make_shared<fake_k8s_client>()),
		m_effector(std::make_shared<recording_effector>()),
		m_factory_calls(0),
		m_plugin([this](const plugin_conf&) -> k8s_client::ptr
		         {
			         ++m_factory_calls;
			         return m_k8s;
		         },
		         m_effector,
		         false)
	{
	}

	cni_invocation add(const std::string& conf = PREV_RESULT_CONF,
	                   const std::string& args = POD_ARGS) const
	{
		cni_invocation invocation;

		invocation.command = "ADD";
		invocation.container_id = "abc123";
		invocation.netns = "/var/run/netns/cni-1";
		invocation.ifname = "eth0";
		invocation.args = args;
		invocation.path = "/opt/cni/bin";
		invocation.stdin_data = conf;

		return invocation;
	}

	iptables_config redirect_config() const
	{
		iptables_config config;

		config.proxy_user_id = "5995";
		config.proxy_inbound_port = 20000;
		config.proxy_outbound_port = 15001;
		config.exclude_uids = {"5996"};
		return config;
	}

	void add_tproxy_pod()
	{
		pod p = make_injected_pod("ns1", "web-abc", "10.0.0.1");
		p.metadata.annotations[annotations::KEY_TRANSPARENT_PROXY_STATUS] = annotations::ENABLED;
		p.metadata.annotations[annotations::REDIRECT_TRAFFIC_CONFIG] =
		    redirect_config().serialize();
		m_k8s->add_pod(p);
	}

	std::string status_annotation() const
	{
		return m_k8s->stored_pod(object_key("ns1", "web-abc"))
		    .metadata.annotations.at(annotations::KEY_TRANSPARENT_PROXY_STATUS);
	}

	std::shared_ptr<fake_k8s_client> m_k8s;
	std::shared_ptr<recording_effector> m_effector;
	int m_factory_calls;
	cni_plugin m_plugin;
};

void expect_cni_error(const std::function<void()>& fn, const std::string& message)
{
	try
	{
		fn();
		FAIL() << "expected \"" << message << "\"";
	}
	catch(const cni_error& ex)
	{
		EXPECT_EQ(message, ex.what());
	}
}

} // end namespace

TEST_F(cni_plugin_test, applies_annotation_config)
{
	add_tproxy_pod();

	const std::string output = m_plugin.run(add());

	ASSERT_EQ(1u, m_effector->m_applied.size());
	iptables_config expected = redirect_config();
	expected.netns = "/var/run/netns/cni-1";
	EXPECT_EQ(expected, m_effector->m_applied[0]);
	EXPECT_EQ(annotations::TPROXY_STATUS_COMPLETE, status_annotation());
	EXPECT_EQ(1, m_factory_calls);

	const Json::Value result = k8s_json::parse(output);
	EXPECT_EQ("0.4.0", result["cniVersion"].asString());
	EXPECT_EQ("10.0.0.1/24", result["ips"][0]["address"].asString());
}

TEST_F(cni_plugin_test, status_goes_through_waiting)
{
	add_tproxy_pod();

	m_plugin.run(add());

	const std::vector<std::string> writes = m_k8s->writes();
	ASSERT_EQ(2u, writes.size());
	EXPECT_EQ("patch_pod_annotations ns1/web-abc", writes[0]);
	EXPECT_EQ("patch_pod_annotations ns1/web-abc", writes[1]);
}

TEST_F(cni_plugin_test, retry_applies_same_rules)
{
	add_tproxy_pod();

	m_plugin.run(add());
	m_plugin.run(add());

	ASSERT_EQ(2u, m_effector->m_applied.size());
	EXPECT_EQ(m_effector->m_applied[0], m_effector->m_applied[1]);
	EXPECT_EQ(1, m_factory_calls);
}

TEST_F(cni_plugin_test, uninjected_pod_is_passed_through)
{
	pod p = make_injected_pod("ns1", "web-abc", "10.0.0.1");
	p.metadata.annotations.clear();
	m_k8s->add_pod(p);

	const std::string output = m_plugin.run(add());

	EXPECT_TRUE(m_effector->m_applied.empty());
	EXPECT_TRUE(m_k8s->writes().empty());
	EXPECT_EQ("10.0.0.1/24", k8s_json::parse(output)["ips"][0]["address"].asString());
}

TEST_F(cni_plugin_test, skip_rules)
{
	pod p = make_injected_pod("ns1", "web-abc", "10.0.0.1");
	EXPECT_TRUE(cni_plugin::skip_traffic_redirection(p));

	p.metadata.annotations[annotations::KEY_TRANSPARENT_PROXY_STATUS] = annotations::ENABLED;
	EXPECT_FALSE(cni_plugin::skip_traffic_redirection(p));

	p.metadata.annotations.erase(annotations::KEY_INJECT_STATUS);
	EXPECT_TRUE(cni_plugin::skip_traffic_redirection(p));

	p.metadata.annotations[annotations::KEY_MESH_INJECT_STATUS] = annotations::INJECTED;
	EXPECT_FALSE(cni_plugin::skip_traffic_redirection(p));

	p.metadata.annotations[annotations::KEY_TRANSPARENT_PROXY_STATUS] = "";
	EXPECT_TRUE(cni_plugin::skip_traffic_redirection(p));
}

TEST_F(cni_plugin_test, unchained_invocation_gets_placeholder)
{
	add_tproxy_pod();

	const std::string output = m_plugin.run(add(UNCHAINED_CONF));

	EXPECT_EQ(R"({"cniVersion":"0.3.1"})", output);
	EXPECT_EQ(1u, m_effector->m_applied.size());
}

TEST_F(cni_plugin_test, chained_without_ips)
{
	add_tproxy_pod();

	expect_cni_error([this] { m_plugin.run(add(NO_IPS_CONF)); }, "got no container IPs");
	EXPECT_TRUE(m_effector->m_applied.empty());
}

TEST_F(cni_plugin_test, missing_pod_identity)
{
	expect_cni_error([this] { m_plugin.run(add(PREV_RESULT_CONF, "K8S_POD_NAMESPACE=ns1")); },
	                 "not running in a pod, namespace and pod should have values");
	EXPECT_EQ(0, m_factory_calls);
}

TEST_F(cni_plugin_test, pod_lookup_failure)
{
	expect_cni_error([this] { m_plugin.run(add()); },
	                 "error retrieving pod: pods \"web-abc\" not found");

	m_k8s->fail("get_pod", 500);
	expect_cni_error([this] { m_plugin.run(add()); }, "error retrieving pod: get_pod failed");
}

TEST_F(cni_plugin_test, missing_annotation)
{
	pod p = make_injected_pod("ns1", "web-abc", "10.0.0.1");
	p.metadata.annotations[annotations::KEY_TRANSPARENT_PROXY_STATUS] = annotations::ENABLED;
	m_k8s->add_pod(p);

	expect_cni_error([this] { m_plugin.run(add()); },
	                 "could not find " + annotations::REDIRECT_TRAFFIC_CONFIG +
	                     " annotation for web-abc pod");
	EXPECT_EQ(annotations::TPROXY_STATUS_WAITING, status_annotation());
}

TEST_F(cni_plugin_test, malformed_annotation)
{
	pod p = make_injected_pod("ns1", "web-abc", "10.0.0.1");
	p.metadata.annotations[annotations::KEY_TRANSPARENT_PROXY_STATUS] = annotations::ENABLED;
	p.metadata.annotations[annotations::REDIRECT_TRAFFIC_CONFIG] = "{foo}";
	m_k8s->add_pod(p);

	expect_cni_error([this] { m_plugin.run(add()); },
	                 "could not unmarshal " + annotations::REDIRECT_TRAFFIC_CONFIG +
	                     " annotation for web-abc pod");
}

TEST_F(cni_plugin_test, status_write_failure_is_not_fatal)
{
	add_tproxy_pod();
	m_k8s->fail("patch_pod_annotations", 409);

	EXPECT_NO_THROW(m_plugin.run(add()));
	EXPECT_EQ(1u, m_effector->m_applied.size());
}

TEST_F(cni_plugin_test, effector_failure)
{
	add_tproxy_pod();
	m_effector->m_failure = "iptables-restore exited with 1: bad rule";

	expect_cni_error([this] { m_plugin.run(add()); },
	                 "could not apply iptables setup: iptables-restore exited with 1: bad rule");
	EXPECT_EQ(annotations::TPROXY_STATUS_WAITING, status_annotation());
}

TEST_F(cni_plugin_test, prebuilt_config_skips_kubernetes)
{
	const iptables_config config = redirect_config();

	m_plugin.run(add(PREV_RESULT_CONF,
	                 annotations::CNI_ARG_IPTABLES_CONFIG + "=" + config.serialize()));

	ASSERT_EQ(1u, m_effector->m_applied.size());
	EXPECT_EQ(20000, m_effector->m_applied[0].proxy_inbound_port);
	EXPECT_EQ("/var/run/netns/cni-1", m_effector->m_applied[0].netns);
	EXPECT_EQ(0, m_factory_calls);
}

TEST_F(cni_plugin_test, malformed_prebuilt_config)
{
	try
	{
		m_plugin.run(add(PREV_RESULT_CONF, annotations::CNI_ARG_IPTABLES_CONFIG + "={foo}"));
		FAIL() << "expected the prebuilt config to be rejected";
	}
	catch(const cni_error& ex)
	{
		EXPECT_EQ(0u, std::string(ex.what()).find("could not unmarshal CNI args: "));
	}
}

TEST_F(cni_plugin_test, dual_stack_is_forwarded)
{
	cni_plugin plugin([this](const plugin_conf&) -> k8s_client::ptr { return m_k8s; },
	                  m_effector,
	                  true);
	add_tproxy_pod();

	plugin.run(add());

	EXPECT_TRUE(m_effector->m_dual_stack);
}

TEST_F(cni_plugin_test, client_creation_failure)
{
	cni_plugin plugin([](const plugin_conf&) -> k8s_client::ptr
	                  {
		                  throw meshbridge_exception("kubeconfig has no current-context");
	                  },
	                  m_effector,
	                  false);

	expect_cni_error([&plugin, this] { plugin.run(add()); },
	                 "could not get rest config from kubernetes api: "
	                 "kubeconfig has no current-context");
}

TEST_F(cni_plugin_test, del_and_check_do_nothing)
{
	add_tproxy_pod();
	cni_invocation invocation = add();

	invocation.command = "DEL";
	invocation.netns = "";
	EXPECT_EQ("", m_plugin.run(invocation));

	invocation.command = "CHECK";
	invocation.netns = "/var/run/netns/cni-1";
	EXPECT_EQ("", m_plugin.run(invocation));

	EXPECT_TRUE(m_effector->m_applied.empty());
	EXPECT_TRUE(m_k8s->writes().empty());
}

TEST_F(cni_plugin_test, version)
{
	cni_invocation invocation;
	invocation.command = "VERSION";

	const Json::Value info = k8s_json::parse(m_plugin.run(invocation));

	EXPECT_EQ("1.0.0", info["cniVersion"].asString());
	ASSERT_EQ(4u, info["supportedVersions"].size());
	EXPECT_EQ("0.3.0", info["supportedVersions"][0].asString());
	EXPECT_EQ("1.0.0", info["supportedVersions"][3].asString());
}

TEST_F(cni_plugin_test, environment_is_validated)
{
	cni_invocation invocation = add();
	invocation.netns = "";
	invocation.ifname = "";

	try
	{
		m_plugin.run(invocation);
		FAIL() << "expected the missing variables to be reported";
	}
	catch(const cni_error& ex)
	{
		EXPECT_EQ(cni_error::ERR_INVALID_ENVIRONMENT, ex.get_code());
		EXPECT_EQ(std::string("required env variables [CNI_NETNS,CNI_IFNAME] missing"),
		          ex.what());
	}

	invocation.command = "";
	EXPECT_THROW(m_plugin.run(invocation), cni_error);
	invocation.command = "GC";
	EXPECT_THROW(m_plugin.run(invocation), cni_error);
}

TEST_F(cni_plugin_test, incompatible_version)
{
	try
	{
		m_plugin.run(add(R"({"cniVersion": "0.1.0"})"));
		FAIL() << "expected the version to be rejected";
	}
	catch(const cni_error& ex)
	{
		EXPECT_EQ(cni_error::ERR_INCOMPATIBLE_VERSION, ex.get_code());
	}
}

TEST(cni_error_test, document)
{
	const Json::Value doc = cni_error("got no container IPs").to_json("1.0.0");

	EXPECT_EQ("1.0.0", doc["cniVersion"].asString());
	EXPECT_EQ(cni_error::ERR_INTERNAL, doc["code"].asInt());
	EXPECT_EQ("got no container IPs", doc["msg"].asString());
}
