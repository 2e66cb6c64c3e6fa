/**
 * @file
 *
 * Unit tests for k8s_rest_client and kubeconfig.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "crd_types.h"
#include "http_server.h"
#include "k8s_json.h"
#include "k8s_rest_client.h"
#include "kubeconfig.h"
#include "meshbridge_exception.h"
#include "scoped_temp_file.h"

#include <gtest.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace meshbridge;
using namespace test_helpers;

namespace
{

const std::string CRD_PREFIX = "/apis/consul.hashicorp.com/v1alpha1";

class k8s_rest_client_test : public testing::Test
{
protected:
	k8s_rest_client_test():
		m_server([this](const recorded_request& request) { return respond(request); }),
		m_client(std::make_shared<rest_client>(options()))
	{
	}

	rest_client::options options() const
	{
		rest_client::options opts;

		opts.base_uri = m_server.base_uri();
		opts.timeout_ms = 2000;
		return opts;
	}

	canned_response respond(const recorded_request& request)
	{
		const auto itr = m_responses.find(request.method + " " + request.uri);

		if(itr == m_responses.end())
		{
			return canned_response(404, R"({"kind":"Status","code":404})");
		}

		return itr->second;
	}

	std::map<std::string, canned_response> m_responses;
	scoped_http_server m_server;
	k8s_rest_client m_client;
};

} // end namespace

TEST_F(k8s_rest_client_test, get_endpoints)
{
	m_responses["GET /api/v1/namespaces/ns1/endpoints/web"] = canned_response(
	    200,
	    R"({"metadata":{"name":"web","namespace":"ns1","resourceVersion":"7"},)"
	    R"("subsets":[{"addresses":[{"ip":"10.0.0.1","nodeName":"node-1",)"
	    R"("targetRef":{"kind":"Pod","name":"web-abc","namespace":"ns1"}}]}]})");
	endpoints out;

	ASSERT_TRUE(m_client.get_endpoints(object_key("ns1", "web"), out));
	EXPECT_EQ("web", out.metadata.name);
	EXPECT_EQ("7", out.metadata.resource_version);
	ASSERT_EQ(1u, out.subsets.size());
	ASSERT_EQ(1u, out.subsets[0].addresses.size());
	EXPECT_EQ("10.0.0.1", out.subsets[0].addresses[0].ip);

	EXPECT_FALSE(m_client.get_endpoints(object_key("ns1", "absent"), out));
}

TEST_F(k8s_rest_client_test, list_pods_with_selector)
{
	m_responses["GET /api/v1/pods?labelSelector=component%3Dclient"] = canned_response(
	    200,
	    R"({"items":[{"metadata":{"name":"consul-client-1","namespace":"consul"},)"
	    R"("status":{"podIP":"10.0.0.9"}}]})");

	const std::vector<pod> pods = m_client.list_pods("", "component=client");

	ASSERT_EQ(1u, pods.size());
	EXPECT_EQ("consul-client-1", pods[0].metadata.name);
	EXPECT_EQ("10.0.0.9", pods[0].pod_ip);
}

TEST_F(k8s_rest_client_test, patch_pod_annotations)
{
	m_responses["PATCH /api/v1/namespaces/ns1/pods/web-abc"] = canned_response(200, "{}");

	m_client.patch_pod_annotations(object_key("ns1", "web-abc"), "12", {{"a", "b"}});

	const recorded_request request = m_server.requests().at(0);
	EXPECT_EQ("application/merge-patch+json", request.content_type);
	const Json::Value patch = k8s_json::parse(request.body);
	EXPECT_EQ("12", patch["metadata"]["resourceVersion"].asString());
	EXPECT_EQ("b", patch["metadata"]["annotations"]["a"].asString());
}

TEST_F(k8s_rest_client_test, create_secret)
{
	m_responses["POST /api/v1/namespaces/ns1/secrets"] = canned_response(
	    201,
	    R"({"metadata":{"name":"token","namespace":"ns1","resourceVersion":"3"},)"
	    R"("data":{"data":"YWJjMTIz"}})");
	secret s;
	s.metadata.ns = "ns1";
	s.metadata.name = "token";
	s.data["data"] = "abc123";

	const secret created = m_client.create_secret(s);

	EXPECT_EQ("3", created.metadata.resource_version);
	EXPECT_EQ("abc123", created.data.at("data"));
	const Json::Value body = k8s_json::parse(m_server.requests().at(0).body);
	EXPECT_EQ("YWJjMTIz", body["data"]["data"].asString());
	EXPECT_EQ("Secret", body["kind"].asString());
}

TEST_F(k8s_rest_client_test, update_conflict)
{
	m_responses["PUT /api/v1/namespaces/ns1/secrets/token"] = canned_response(409, "{}");
	secret s;
	s.metadata.ns = "ns1";
	s.metadata.name = "token";

	try
	{
		m_client.update_secret(s);
		FAIL() << "expected a conflict";
	}
	catch(const api_exception& ex)
	{
		EXPECT_TRUE(ex.is_conflict());
	}
}

TEST_F(k8s_rest_client_test, peering_status_is_patched)
{
	const std::string path = CRD_PREFIX + "/namespaces/ns1/peeringacceptors/dc1/status";
	m_responses["PATCH " + path] =
	    canned_response(200, R"({"metadata":{"resourceVersion":"21"}})");
	peering_resource acceptor;
	acceptor.kind = KIND_PEERING_ACCEPTOR;
	acceptor.metadata.ns = "ns1";
	acceptor.metadata.name = "dc1";
	acceptor.metadata.resource_version = "20";
	acceptor.has_status_secret = true;
	acceptor.status_secret.name = "dc1-token";
	acceptor.status_secret.key = "data";
	acceptor.status_secret.backend = SECRET_BACKEND_KUBERNETES;
	acceptor.has_latest_peering_version = true;
	acceptor.latest_peering_version = 3;

	m_client.update_peering_status(acceptor);

	EXPECT_EQ("21", acceptor.metadata.resource_version);
	const Json::Value patch = k8s_json::parse(m_server.requests().at(0).body);
	EXPECT_EQ("20", patch["metadata"]["resourceVersion"].asString());
	EXPECT_EQ("dc1-token", patch["status"]["secretRef"]["name"].asString());
	EXPECT_EQ(3u, patch["status"]["latestPeeringVersion"].asUInt64());
}

TEST_F(k8s_rest_client_test, list_peering_resources_sets_kind)
{
	m_responses["GET " + CRD_PREFIX + "/peeringdialers"] = canned_response(
	    200,
	    R"({"items":[{"metadata":{"name":"dc2","namespace":"ns1"},)"
	    R"("spec":{"peer":{"secret":{"name":"t","key":"data","backend":"kubernetes"}}},)"
	    R"("status":{"latestPeeringVersion":4}}]})");

	const std::vector<peering_resource> dialers =
	    m_client.list_peering_resources(KIND_PEERING_DIALER);

	ASSERT_EQ(1u, dialers.size());
	EXPECT_EQ(KIND_PEERING_DIALER, dialers[0].kind);
	EXPECT_TRUE(dialers[0].has_spec_secret);
	EXPECT_EQ("t", dialers[0].spec_secret.name);
	EXPECT_TRUE(dialers[0].has_latest_peering_version);
	EXPECT_EQ(4u, dialers[0].latest_peering_version);
}

TEST_F(k8s_rest_client_test, finalizers_are_patched)
{
	const std::string path = CRD_PREFIX + "/namespaces/ns1/terminatinggatewayservices/example";
	m_responses["PATCH " + path] =
	    canned_response(200, R"({"metadata":{"resourceVersion":"5"}})");
	terminating_gateway_service tgs;
	tgs.metadata.ns = "ns1";
	tgs.metadata.name = "example";
	tgs.metadata.resource_version = "4";
	tgs.metadata.add_finalizer(FINALIZER_NAME);

	m_client.update_finalizers(tgs);

	EXPECT_EQ("5", tgs.metadata.resource_version);
	const Json::Value patch = k8s_json::parse(m_server.requests().at(0).body);
	ASSERT_EQ(1u, patch["metadata"]["finalizers"].size());
	EXPECT_EQ(FINALIZER_NAME, patch["metadata"]["finalizers"][0].asString());
}

TEST_F(k8s_rest_client_test, unknown_kind)
{
	peering_resource out;

	EXPECT_THROW(m_client.get_peering_resource("Unknown", object_key("ns1", "x"), out),
	             meshbridge_exception);
}

TEST(in_cluster_options_test, reads_token_file)
{
	const scoped_temp_file token("abc.def\n");

	const rest_client::options opts =
	    k8s_rest_client::in_cluster_options("https://10.96.0.1:443", token.path(), "/ca.crt");

	EXPECT_EQ("https://10.96.0.1:443", opts.base_uri);
	EXPECT_EQ("/ca.crt", opts.ca_file);
	EXPECT_EQ("Authorization", opts.auth_header);
	EXPECT_EQ("Bearer abc.def", opts.auth_value);
}

TEST(in_cluster_options_test, missing_token_file)
{
	EXPECT_THROW(k8s_rest_client::in_cluster_options("https://10.96.0.1:443",
	                                                 "/nonexistent/token",
	                                                 ""),
	             meshbridge_exception);
}

TEST(kubeconfig_test, current_context)
{
	const std::string yaml = R"(
apiVersion: v1
kind: Config
current-context: dev
clusters:
- name: prod
  cluster:
    server: https://prod.example.com
- name: dev
  cluster:
    server: https://127.0.0.1:6443
    certificate-authority-data: LS0tLS1CRUdJTg==
contexts:
- name: dev
  context:
    cluster: dev
    user: admin
users:
- name: admin
  user:
    token: s3cr3t
)";

	const rest_client::options opts = kubeconfig::load(yaml);

	EXPECT_EQ("https://127.0.0.1:6443", opts.base_uri);
	EXPECT_EQ("-----BEGIN", opts.ca_data);
	EXPECT_EQ("Bearer s3cr3t", opts.auth_value);
	EXPECT_FALSE(opts.insecure_skip_verify);
}

TEST(kubeconfig_test, token_file_and_insecure)
{
	const scoped_temp_file token("from-file\n");
	const std::string yaml = "current-context: c\n"
	                         "clusters:\n"
	                         "- name: k\n"
	                         "  cluster:\n"
	                         "    server: https://k:6443\n"
	                         "    insecure-skip-tls-verify: true\n"
	                         "contexts:\n"
	                         "- name: c\n"
	                         "  context:\n"
	                         "    cluster: k\n"
	                         "    user: u\n"
	                         "users:\n"
	                         "- name: u\n"
	                         "  user:\n"
	                         "    tokenFile: " + token.path() + "\n";
	const scoped_temp_file config(yaml, "yaml");

	const rest_client::options opts = kubeconfig::load_file(config.path());

	EXPECT_TRUE(opts.insecure_skip_verify);
	EXPECT_EQ("Bearer from-file", opts.auth_value);
}

TEST(kubeconfig_test, unusable_documents)
{
	EXPECT_THROW(kubeconfig::load("clusters: []\n"), meshbridge_exception);
	EXPECT_THROW(kubeconfig::load("current-context: missing\ncontexts: []\n"),
	             meshbridge_exception);
	EXPECT_THROW(kubeconfig::load("current-context: c\n"
	                              "contexts:\n- name: c\n  context:\n    cluster: k\n"
	                              "clusters:\n- name: k\n  cluster: {}\n"),
	             meshbridge_exception);
	EXPECT_THROW(kubeconfig::load_file("/nonexistent/kubeconfig"), meshbridge_exception);
}
