/**
 * @file
 *
 * Unit tests for consul_rest_client against a loopback HTTP server.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "consul_json.h"
#include "consul_rest_client.h"
#include "http_server.h"
#include "k8s_json.h"
#include "meshbridge_exception.h"

#include <gtest.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace meshbridge;
using namespace test_helpers;

namespace
{

class consul_rest_client_test : public testing::Test
{
protected:
	consul_rest_client_test():
		m_server([this](const recorded_request& request) { return respond(request); }),
		m_client(std::make_shared<rest_client>(
		    consul_rest_client::make_options(m_server.base_uri(), "acl-token", "", 2000)))
	{
	}

	canned_response respond(const recorded_request& request)
	{
		const auto itr = m_responses.find(request.method + " " + request.uri);

		if(itr == m_responses.end())
		{
			return canned_response(404, "");
		}

		return itr->second;
	}

	std::map<std::string, canned_response> m_responses;
	scoped_http_server m_server;
	consul_rest_client m_client;
};

} // end namespace

TEST(consul_rest_client_query, parameters)
{
	query_options opts;

	EXPECT_EQ("", consul_rest_client::query(opts));

	opts.ns = "k8s-ns1";
	EXPECT_EQ("?ns=k8s-ns1", consul_rest_client::query(opts));

	opts.partition = "ap1";
	EXPECT_EQ("?ns=k8s-ns1&partition=ap1&filter=a%20%3D%3D%20b",
	          consul_rest_client::query(opts, "a == b"));
}

TEST(consul_rest_client_query, k8s_service_filter)
{
	EXPECT_EQ("Meta[\"k8s-service-name\"] == \"web\" and Meta[\"k8s-namespace\"] == \"ns1\" "
	          "and Meta[\"managed-by\"] == \"consul-k8s-endpoints-controller\"",
	          consul_rest_client::k8s_service_filter("web", "ns1"));
}

TEST_F(consul_rest_client_test, register_service)
{
	m_responses["PUT /v1/agent/service/register?ns=k8s-ns1"] = canned_response(200, "");
	agent_service service;
	service.id = "web-abc-web";
	service.service = "web";
	service.port = 8080;
	service.ns = "k8s-ns1";

	m_client.register_service(service);

	const recorded_request request = m_server.requests().at(0);
	EXPECT_EQ("acl-token", request.header("X-Consul-Token"));
	const Json::Value body = k8s_json::parse(request.body);
	EXPECT_EQ("web-abc-web", body["ID"].asString());
	EXPECT_EQ("web", body["Name"].asString());
	EXPECT_EQ(8080, body["Port"].asInt());
}

TEST_F(consul_rest_client_test, deregister_service)
{
	m_responses["PUT /v1/agent/service/deregister/web-abc-web"] = canned_response(200, "");

	m_client.deregister_service("web-abc-web", query_options());

	EXPECT_EQ(1u, m_server.requests().size());
}

TEST_F(consul_rest_client_test, services_for_k8s_service)
{
	const std::string uri =
	    "/v1/agent/services" +
	    consul_rest_client::query(query_options(),
	                              consul_rest_client::k8s_service_filter("web", "ns1"));
	m_responses["GET " + uri] = canned_response(
	    200,
	    R"({"web-abc-web":{"ID":"web-abc-web","Service":"web","Port":8080,)"
	    R"("Meta":{"k8s-namespace":"ns1"}}})");

	const std::map<std::string, agent_service> services =
	    m_client.services_for_k8s_service("web", "ns1", query_options());

	ASSERT_EQ(1u, services.size());
	const agent_service& service = services.at("web-abc-web");
	EXPECT_EQ("web", service.service);
	EXPECT_EQ(8080, service.port);
	EXPECT_EQ("ns1", service.meta.at("k8s-namespace"));
}

TEST_F(consul_rest_client_test, get_check)
{
	const std::string uri =
	    "/v1/agent/checks" + consul_rest_client::query(query_options(), "CheckID == `c1`");
	m_responses["GET " + uri] = canned_response(200, R"({"c1":{"CheckID":"c1","Status":"passing"}})");

	agent_check check;
	EXPECT_TRUE(m_client.get_check("c1", check, query_options()));

	m_responses["GET " + uri] = canned_response(200, "{}");
	EXPECT_FALSE(m_client.get_check("c1", check, query_options()));
}

TEST_F(consul_rest_client_test, catalog_service_instances)
{
	m_responses["GET /v1/catalog/service/example-https"] = canned_response(
	    200,
	    R"([{"Node":"legacy_node","Address":"example.com","ServiceID":"example-https",)"
	    R"("ServiceName":"example-https","ServicePort":443}])");

	const std::vector<catalog_service> instances =
	    m_client.catalog_service_instances("example-https");

	ASSERT_EQ(1u, instances.size());
	EXPECT_EQ("legacy_node", instances[0].node);
	EXPECT_EQ("example-https", instances[0].service_id);
}

TEST_F(consul_rest_client_test, read_peering)
{
	m_responses["GET /v1/peering/dc2"] = canned_response(
	    200,
	    R"({"ID":"p1","Name":"dc2","State":"ACTIVE"})");
	peering out;

	ASSERT_TRUE(m_client.read_peering("dc2", out));
	EXPECT_EQ("p1", out.id);
	EXPECT_EQ("ACTIVE", out.state);

	EXPECT_FALSE(m_client.read_peering("dc3", out));
}

TEST_F(consul_rest_client_test, generate_peering_token)
{
	m_responses["POST /v1/peering/token"] = canned_response(200, R"({"PeeringToken":"abc123"})");

	EXPECT_EQ("abc123", m_client.generate_peering_token("dc2"));
	EXPECT_EQ("dc2", k8s_json::parse(m_server.requests().at(0).body)["PeerName"].asString());
}

TEST_F(consul_rest_client_test, empty_peering_token_is_an_error)
{
	m_responses["POST /v1/peering/token"] = canned_response(200, "{}");

	EXPECT_THROW(m_client.generate_peering_token("dc2"), api_exception);
}

TEST_F(consul_rest_client_test, establish_peering)
{
	m_responses["POST /v1/peering/establish"] = canned_response(200, "{}");

	m_client.establish_peering("dc2", "abc123");

	const Json::Value body = k8s_json::parse(m_server.requests().at(0).body);
	EXPECT_EQ("dc2", body["PeerName"].asString());
	EXPECT_EQ("abc123", body["PeeringToken"].asString());
}

TEST_F(consul_rest_client_test, server_error)
{
	m_responses["DELETE /v1/peering/dc2"] = canned_response(500, "boom");

	try
	{
		m_client.delete_peering("dc2");
		FAIL() << "expected the server error to be raised";
	}
	catch(const api_exception& ex)
	{
		EXPECT_EQ(500, ex.get_code());
	}
}

TEST_F(consul_rest_client_test, proxy_defaults_mesh_gateway_mode)
{
	std::string mode;

	EXPECT_FALSE(m_client.read_proxy_defaults_mesh_gateway_mode(mode));

	m_responses["GET /v1/config/proxy-defaults/global"] =
	    canned_response(200, R"({"Kind":"proxy-defaults","MeshGateway":{"Mode":"local"}})");

	EXPECT_TRUE(m_client.read_proxy_defaults_mesh_gateway_mode(mode));
	EXPECT_EQ("local", mode);
}

TEST_F(consul_rest_client_test, policies_and_roles)
{
	m_responses["GET /v1/acl/policies"] =
	    canned_response(200, R"([{"ID":"p1","Name":"example-https-write-policy"}])");
	m_responses["GET /v1/acl/roles"] = canned_response(
	    200,
	    R"([{"ID":"r1","Name":"consul-terminating-gateway-acl-role",)"
	    R"("Policies":[{"ID":"p1","Name":"example-https-write-policy"}]}])");
	m_responses["PUT /v1/acl/role/r1"] = canned_response(200, "{}");

	const std::vector<acl_policy> policies = m_client.list_policies();
	ASSERT_EQ(1u, policies.size());
	EXPECT_EQ("example-https-write-policy", policies[0].name);

	std::vector<acl_role> roles = m_client.list_roles();
	ASSERT_EQ(1u, roles.size());
	ASSERT_EQ(1u, roles[0].policies.size());
	EXPECT_EQ("p1", roles[0].policies[0].id);

	roles[0].policies.clear();
	m_client.update_role(roles[0]);
	EXPECT_EQ("PUT", m_server.requests().back().method);
}
