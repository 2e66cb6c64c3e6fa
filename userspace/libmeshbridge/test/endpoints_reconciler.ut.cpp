/**
 * @file
 *
 * Unit tests for endpoints_reconciler.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "annotations.h"
#include "endpoints_reconciler.h"
#include "fake_consul_client.h"
#include "fake_k8s_client.h"
#include "k8s_fixtures.h"
#include "meshbridge_exception.h"

#include <gtest.h>

#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace meshbridge;
using namespace test_helpers;

namespace
{

const std::string AUTH_METHOD = "consul-k8s-auth-method";
const std::string RELEASE = "consul";

class endpoints_reconciler_test : public testing::Test
{
protected:
	endpoints_reconciler_test():
		m_k8s(std::make_shared<fake_k8s_client>()),
		m_consul(std::make_shared<fake_consul_client>())
	{
		m_k8s->add_namespace(make_namespace("ns1"));
	}

	std::unique_ptr<endpoints_reconciler> make_reconciler(const std::string& auth_method = "")
	{
		return make_reconciler(std::make_shared<agent_directory>(m_consul), auth_method);
	}

	std::unique_ptr<endpoints_reconciler> make_reconciler(
	    const std::shared_ptr<agent_directory>& agents,
	    const std::string& auth_method = "")
	{
		registration_builder builder(registration_defaults(),
		                             namespace_policy(),
		                             metrics_config(),
		                             m_k8s,
		                             m_consul);

		return std::unique_ptr<endpoints_reconciler>(
		    new endpoints_reconciler(m_k8s, agents, builder, namespace_policy(), auth_method));
	}

	pod add_web_pod(const std::string& name, const std::string& ip)
	{
		pod p = make_injected_pod("ns1", name, ip);
		p.metadata.annotations[annotations::PORT] = "8080";
		m_k8s->add_pod(p);
		return p;
	}

	std::shared_ptr<fake_k8s_client> m_k8s;
	std::shared_ptr<fake_consul_client> m_consul;
};

acl_token make_token(const std::string& id,
                     const std::string& service,
                     const std::string& description)
{
	acl_token token;
	token.accessor_id = id;
	token.auth_method = AUTH_METHOD;
	token.service_identities.push_back(service);
	token.description = description;
	return token;
}

bool has_token(const std::vector<acl_token>& tokens, const std::string& id)
{
	return std::any_of(tokens.begin(), tokens.end(), [&id](const acl_token& t) {
		return t.accessor_id == id;
	});
}

} // end namespace

TEST_F(endpoints_reconciler_test, registers_new_pod)
{
	const pod p = add_web_pod("web-abc", "10.0.0.5");
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {p}));

	make_reconciler()->reconcile(object_key("ns1", "web"));

	const auto services = m_consul->services();
	ASSERT_EQ(2u, services.size());

	const agent_service& svc = services.at("web-abc-web");
	EXPECT_EQ("web", svc.service);
	EXPECT_EQ("10.0.0.5", svc.address);
	EXPECT_EQ(8080, svc.port);
	EXPECT_EQ("web-abc", svc.meta.at(META_KEY_POD_NAME));
	EXPECT_EQ("web", svc.meta.at(META_KEY_KUBE_SERVICE_NAME));
	EXPECT_EQ("ns1", svc.meta.at(META_KEY_KUBE_NS));

	const agent_service& proxy = services.at("web-abc-web-sidecar-proxy");
	EXPECT_EQ(SERVICE_KIND_CONNECT_PROXY, proxy.kind);
	EXPECT_EQ("web-sidecar-proxy", proxy.service);
	EXPECT_EQ(20000, proxy.port);
	EXPECT_EQ("web-abc-web", proxy.proxy.destination_service_id);
	EXPECT_EQ("127.0.0.1", proxy.proxy.local_service_address);
	EXPECT_EQ(8080, proxy.proxy.local_service_port);

	const auto checks = m_consul->checks();
	ASSERT_EQ(1u, checks.size());
	const agent_check& check = checks.at("ns1/web-abc-web/kubernetes-health-check");
	EXPECT_EQ(HEALTH_PASSING, check.status);
	EXPECT_EQ(KUBERNETES_SUCCESS_REASON, check.output);
	EXPECT_EQ("Kubernetes Health Check", check.name);
}

TEST_F(endpoints_reconciler_test, registers_service_before_proxy_and_check)
{
	const pod p = add_web_pod("web-abc", "10.0.0.5");
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {p}));

	make_reconciler()->reconcile(object_key("ns1", "web"));

	const std::vector<std::string> expected = {
		"register_service web-abc-web",
		"register_service web-abc-web-sidecar-proxy",
		"register_check ns1/web-abc-web/kubernetes-health-check",
		"update_ttl ns1/web-abc-web/kubernetes-health-check",
	};
	EXPECT_EQ(expected, m_consul->calls());
}

TEST_F(endpoints_reconciler_test, second_pass_changes_nothing)
{
	const pod p = add_web_pod("web-abc", "10.0.0.5");
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {p}));
	auto reconciler = make_reconciler();

	reconciler->reconcile(object_key("ns1", "web"));
	const auto services = m_consul->services();
	const auto checks = m_consul->checks();
	m_consul->clear_calls();

	reconciler->reconcile(object_key("ns1", "web"));

	EXPECT_EQ(0u, m_consul->count("register_check"));
	EXPECT_EQ(0u, m_consul->count("update_ttl"));
	EXPECT_EQ(0u, m_consul->count("deregister_service"));
	EXPECT_EQ(services.size(), m_consul->services().size());
	EXPECT_EQ(checks.at("ns1/web-abc-web/kubernetes-health-check").status,
	          m_consul->checks().at("ns1/web-abc-web/kubernetes-health-check").status);
}

TEST_F(endpoints_reconciler_test, not_ready_address_is_critical)
{
	const pod p = add_web_pod("web-abc", "10.0.0.5");
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {}, {p}));
	auto reconciler = make_reconciler();

	reconciler->reconcile(object_key("ns1", "web"));

	const agent_check check = m_consul->checks().at("ns1/web-abc-web/kubernetes-health-check");
	EXPECT_EQ(HEALTH_CRITICAL, check.status);
	EXPECT_EQ("Pod \"ns1/web-abc\" is not ready", check.output);

	// Becoming ready flips the existing check rather than registering it again.
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {p}));
	m_consul->clear_calls();

	reconciler->reconcile(object_key("ns1", "web"));

	EXPECT_EQ(0u, m_consul->count("register_check"));
	EXPECT_EQ(1u, m_consul->count("update_ttl"));
	EXPECT_EQ(HEALTH_PASSING,
	          m_consul->checks().at("ns1/web-abc-web/kubernetes-health-check").status);
}

TEST_F(endpoints_reconciler_test, deregisters_only_removed_addresses)
{
	const pod a = add_web_pod("web-a", "10.0.0.5");
	const pod b = add_web_pod("web-b", "10.0.0.6");
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {a, b}));
	auto reconciler = make_reconciler();

	reconciler->reconcile(object_key("ns1", "web"));
	ASSERT_EQ(4u, m_consul->services().size());

	m_k8s->add_endpoints(make_endpoints("ns1", "web", {a}));
	m_consul->clear_calls();
	reconciler->reconcile(object_key("ns1", "web"));

	const auto services = m_consul->services();
	EXPECT_EQ(2u, services.size());
	EXPECT_EQ(1u, services.count("web-a-web"));
	EXPECT_EQ(1u, services.count("web-a-web-sidecar-proxy"));
	EXPECT_EQ(2u, m_consul->count("deregister_service"));
}

TEST_F(endpoints_reconciler_test, deleted_endpoints_deregister_everything)
{
	const pod p = add_web_pod("web-abc", "10.0.0.5");
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {p}));
	auto reconciler = make_reconciler();
	reconciler->reconcile(object_key("ns1", "web"));

	m_k8s->remove_endpoints(object_key("ns1", "web"));
	reconciler->reconcile(object_key("ns1", "web"));

	EXPECT_TRUE(m_consul->services().empty());
	EXPECT_TRUE(m_consul->checks().empty());
}

TEST_F(endpoints_reconciler_test, ignore_label_deregisters_everything)
{
	const pod p = add_web_pod("web-abc", "10.0.0.5");
	endpoints ep = make_endpoints("ns1", "web", {p});
	m_k8s->add_endpoints(ep);
	auto reconciler = make_reconciler();
	reconciler->reconcile(object_key("ns1", "web"));

	ep.metadata.labels[annotations::LABEL_SERVICE_IGNORE] = "true";
	m_k8s->add_endpoints(ep);
	reconciler->reconcile(object_key("ns1", "web"));

	EXPECT_TRUE(m_consul->services().empty());
}

TEST_F(endpoints_reconciler_test, ignored_namespace_is_untouched)
{
	pod p = make_injected_pod("kube-system", "dns-abc", "10.0.0.9");
	m_k8s->add_pod(p);
	m_k8s->add_endpoints(make_endpoints("kube-system", "dns", {p}));

	make_reconciler()->reconcile(object_key("kube-system", "dns"));

	EXPECT_TRUE(m_consul->calls().empty());
	EXPECT_EQ(0u, m_consul->count("services_for_k8s_service"));
}

TEST_F(endpoints_reconciler_test, skips_pods_not_injected)
{
	pod p = add_web_pod("web-abc", "10.0.0.5");
	p.metadata.annotations.erase(annotations::KEY_INJECT_STATUS);
	m_k8s->add_pod(p);
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {p}));

	make_reconciler()->reconcile(object_key("ns1", "web"));

	EXPECT_TRUE(m_consul->services().empty());
}

TEST_F(endpoints_reconciler_test, skips_pods_of_another_service)
{
	pod p = add_web_pod("web-abc", "10.0.0.5");
	p.metadata.annotations[annotations::KUBERNETES_SERVICE] = "web-other";
	m_k8s->add_pod(p);
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {p}));

	make_reconciler()->reconcile(object_key("ns1", "web"));

	EXPECT_TRUE(m_consul->services().empty());
}

TEST_F(endpoints_reconciler_test, missing_pod_does_not_stop_others)
{
	const pod a = add_web_pod("web-a", "10.0.0.5");
	const pod ghost = make_injected_pod("ns1", "web-ghost", "10.0.0.7");
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {ghost, a}));

	EXPECT_THROW(make_reconciler()->reconcile(object_key("ns1", "web")), multi_error);
	EXPECT_EQ(1u, m_consul->services().count("web-a-web"));
}

TEST_F(endpoints_reconciler_test, failed_pod_lookup_keeps_registration)
{
	const pod p = add_web_pod("web-abc", "10.0.0.5");
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {p}));
	auto reconciler = make_reconciler();
	reconciler->reconcile(object_key("ns1", "web"));
	ASSERT_EQ(2u, m_consul->services().size());

	m_k8s->fail("get_pod", 503);

	EXPECT_THROW(reconciler->reconcile(object_key("ns1", "web")), multi_error);
	EXPECT_EQ(1u, m_consul->services().count("web-abc-web"));
	EXPECT_EQ(1u, m_consul->services().count("web-abc-web-sidecar-proxy"));
}

TEST_F(endpoints_reconciler_test, check_for_unregistered_service_fails)
{
	pod p = add_web_pod("web-abc", "10.0.0.5");
	p.metadata.labels.erase(annotations::KEY_MANAGED_BY);
	m_k8s->add_pod(p);
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {p}));

	try
	{
		make_reconciler()->reconcile(object_key("ns1", "web"));
		FAIL() << "expected the health check registration to fail";
	}
	catch(const multi_error& ex)
	{
		ASSERT_EQ(1u, ex.errors().size());
		EXPECT_EQ("service \"web-abc-web\" not found in Consul: unable to register health check",
		          ex.errors()[0]);
	}
}

TEST_F(endpoints_reconciler_test, multi_port_pod_gets_upstreams_once)
{
	pod p = make_injected_pod("ns1", "web-abc", "10.0.0.5");
	p.metadata.annotations[annotations::SERVICE] = "web,web-admin";
	p.metadata.annotations[annotations::PORT] = "8080,9090";
	p.metadata.annotations[annotations::UPSTREAMS] = "db:1234";
	m_k8s->add_pod(p);
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {p}));
	m_k8s->add_endpoints(make_endpoints("ns1", "web-admin", {p}));
	auto reconciler = make_reconciler();

	reconciler->reconcile(object_key("ns1", "web"));
	reconciler->reconcile(object_key("ns1", "web-admin"));

	const auto services = m_consul->services();
	ASSERT_EQ(4u, services.size());

	const agent_service& web_proxy = services.at("web-abc-web-sidecar-proxy");
	ASSERT_EQ(1u, web_proxy.proxy.upstreams.size());
	EXPECT_EQ("db", web_proxy.proxy.upstreams[0].destination_name);
	EXPECT_EQ(1234, web_proxy.proxy.upstreams[0].local_bind_port);
	EXPECT_EQ(20000, web_proxy.port);

	const agent_service& admin_proxy = services.at("web-abc-web-admin-sidecar-proxy");
	EXPECT_TRUE(admin_proxy.proxy.upstreams.empty());
	EXPECT_EQ(20001, admin_proxy.port);
	EXPECT_EQ(9090, services.at("web-abc-web-admin").port);
}

TEST_F(endpoints_reconciler_test, deletes_tokens_of_removed_pods)
{
	const pod a = add_web_pod("web-a", "10.0.0.5");
	const pod b = add_web_pod("web-b", "10.0.0.6");
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {a, b}));
	m_consul->add_token(make_token("token-a", "web", "token created via login: {\"pod\":\"ns1/web-a\"}"));
	m_consul->add_token(make_token("token-b", "web", "token created via login: {\"pod\":\"ns1/web-b\"}"));
	m_consul->add_token(make_token("token-garbled", "web", "token created via login: {\"pod\":"));
	auto reconciler = make_reconciler(AUTH_METHOD);
	reconciler->reconcile(object_key("ns1", "web"));

	m_k8s->add_endpoints(make_endpoints("ns1", "web", {a}));
	reconciler->reconcile(object_key("ns1", "web"));

	const auto tokens = m_consul->tokens();
	EXPECT_TRUE(has_token(tokens, "token-a"));
	EXPECT_FALSE(has_token(tokens, "token-b"));
	EXPECT_TRUE(has_token(tokens, "token-garbled"));
}

TEST_F(endpoints_reconciler_test, keeps_tokens_without_auth_method)
{
	const pod b = add_web_pod("web-b", "10.0.0.6");
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {b}));
	m_consul->add_token(make_token("token-b", "web", "token created via login: {\"pod\":\"ns1/web-b\"}"));
	auto reconciler = make_reconciler();
	reconciler->reconcile(object_key("ns1", "web"));

	m_k8s->remove_endpoints(object_key("ns1", "web"));
	reconciler->reconcile(object_key("ns1", "web"));

	EXPECT_TRUE(has_token(m_consul->tokens(), "token-b"));
	EXPECT_EQ(0u, m_consul->count("list_tokens"));
}

TEST_F(endpoints_reconciler_test, per_node_deregistration_isolates_agent_failures)
{
	auto healthy = std::make_shared<fake_consul_client>();
	auto broken = std::make_shared<fake_consul_client>();
	std::map<std::string, std::shared_ptr<fake_consul_client>> by_ip = {
		{"10.1.0.1", healthy},
		{"10.1.0.2", broken},
	};

	m_k8s->add_pod(make_agent_pod("consul", "consul-client-1", RELEASE, "node-1", "10.1.0.1"));
	m_k8s->add_pod(make_agent_pod("consul", "consul-client-2", RELEASE, "node-2", "10.1.0.2"));

	auto agents = std::make_shared<agent_directory>(
	    m_k8s, RELEASE, "consul", [&by_ip](const std::string& ip) -> consul_client::ptr {
		    return by_ip.at(ip);
	    });

	const pod p = add_web_pod("web-abc", "10.0.0.5");
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {p}));
	auto reconciler = make_reconciler(agents);
	reconciler->reconcile(object_key("ns1", "web"));
	ASSERT_EQ(2u, healthy->services().size());

	broken->fail("services_for_k8s_service", 500);
	m_k8s->remove_endpoints(object_key("ns1", "web"));

	EXPECT_THROW(reconciler->reconcile(object_key("ns1", "web")), multi_error);
	EXPECT_TRUE(healthy->services().empty());
}

TEST_F(endpoints_reconciler_test, agent_pod_maps_to_endpoints_on_its_node)
{
	const pod agent = make_agent_pod("consul", "consul-client-1", RELEASE, "node-1", "10.1.0.1");
	m_k8s->add_pod(agent);

	const pod local = add_web_pod("web-abc", "10.0.0.5");
	pod remote = make_injected_pod("ns1", "api-abc", "10.0.1.5", "node-2", "10.1.0.2");
	m_k8s->add_pod(remote);
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {local}));
	m_k8s->add_endpoints(make_endpoints("ns1", "api", {remote}));

	auto agents = std::make_shared<agent_directory>(
	    m_k8s, RELEASE, "consul", [this](const std::string&) -> consul_client::ptr {
		    return m_consul;
	    });

	const std::vector<object_key> keys =
	    make_reconciler(agents)->requests_for_agent_pod(agent.metadata.key());

	ASSERT_EQ(1u, keys.size());
	EXPECT_EQ(object_key("ns1", "web"), keys[0]);
}

TEST_F(endpoints_reconciler_test, unready_agent_pod_maps_to_nothing)
{
	pod agent = make_agent_pod("consul", "consul-client-1", RELEASE, "node-1", "10.1.0.1");
	agent.conditions[0].status = "False";
	m_k8s->add_pod(agent);
	const pod local = add_web_pod("web-abc", "10.0.0.5");
	m_k8s->add_endpoints(make_endpoints("ns1", "web", {local}));

	auto agents = std::make_shared<agent_directory>(
	    m_k8s, RELEASE, "consul", [this](const std::string&) -> consul_client::ptr {
		    return m_consul;
	    });

	EXPECT_TRUE(make_reconciler(agents)->requests_for_agent_pod(agent.metadata.key()).empty());
}
