/**
 * @file
 *
 * Unit tests for controller_config.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "configuration_manager.h"
#include "controller_config.h"
#include "meshbridge_app.h"
#include "meshbridge_exception.h"
#include "scoped_config.h"
#include "scoped_temp_file.h"

#include <gtest.h>

#include <set>
#include <string>
#include <vector>

using namespace meshbridge;
using namespace test_helpers;

TEST(controller_config_test, defaults)
{
	const controller_settings settings = controller_config::controller();

	EXPECT_EQ("consul", settings.release_name);
	EXPECT_EQ("default", settings.release_namespace);
	EXPECT_EQ(agent_topology::shared, settings.topology);
	EXPECT_EQ(std::set<std::string>({"*"}), settings.namespaces.allow_k8s_namespaces);
	EXPECT_TRUE(settings.namespaces.deny_k8s_namespaces.empty());
	EXPECT_EQ("default", settings.namespaces.consul_destination_namespace);
	EXPECT_EQ("20100", settings.metrics.merged_metrics_port);
	EXPECT_EQ("/metrics", settings.metrics.prometheus_scrape_path);
	EXPECT_EQ(4, settings.worker_threads);
	EXPECT_EQ(2000u, settings.poll_interval_ms);
	EXPECT_EQ(300u, settings.resync_interval_s);
	EXPECT_EQ(5u, settings.base_requeue_delay_ms);
	EXPECT_EQ(60000u, settings.max_requeue_delay_ms);
	EXPECT_FALSE(settings.enable_peering);
	EXPECT_FALSE(settings.enable_terminating_gateway);
	EXPECT_FALSE(settings.acls_enabled);
}

TEST(controller_config_test, overrides)
{
	scoped_config<std::string> topology("connect_inject.agent_topology", "per_node");
	scoped_config<std::vector<std::string>> deny("connect_inject.deny_k8s_namespaces",
	                                             {"ns2", "ns3"});
	scoped_config<bool> mirroring("connect_inject.enable_ns_mirroring", true);
	scoped_config<std::string> prefix("connect_inject.ns_mirroring_prefix", "k8s-");
	scoped_config<bool> peering("controller.enable_peering", true);

	const controller_settings settings = controller_config::controller();

	EXPECT_EQ(agent_topology::per_node, settings.topology);
	EXPECT_EQ(std::set<std::string>({"ns2", "ns3"}), settings.namespaces.deny_k8s_namespaces);
	EXPECT_TRUE(settings.namespaces.enable_ns_mirroring);
	EXPECT_EQ("k8s-", settings.namespaces.ns_mirroring_prefix);
	EXPECT_TRUE(settings.enable_peering);
}

TEST(controller_config_test, unknown_topology)
{
	scoped_config<std::string> topology("connect_inject.agent_topology", "everywhere");

	EXPECT_THROW(controller_config::controller(), meshbridge_exception);
}

TEST(controller_config_test, yaml_is_applied)
{
	const type_config<uint64_t>* poll =
	    configuration_manager::instance().get_config<uint64_t>("controller.poll_interval_ms");
	ASSERT_NE(nullptr, poll);

	scoped_config<uint64_t> restore("controller.poll_interval_ms", poll->get_value());

	yaml_configuration yaml("controller:\n  poll_interval_ms: 10\n");
	ASSERT_TRUE(yaml.errors().empty());
	configuration_manager::instance().init_config(yaml);

	// Clamped to the configured minimum.
	EXPECT_EQ(100u, controller_config::controller().poll_interval_ms);
}

TEST(controller_config_test, consul_options)
{
	scoped_config<std::string> address("consul.address", "https://consul-server:8501");
	scoped_config<std::string> token("consul.token", "acl-token");

	const rest_client::options opts = controller_config::consul();

	EXPECT_EQ("https://consul-server:8501", opts.base_uri);
	EXPECT_EQ("X-Consul-Token", opts.auth_header);
	EXPECT_EQ("acl-token", opts.auth_value);
	EXPECT_EQ(5000u, opts.timeout_ms);
}

TEST(controller_config_test, consul_agent_options)
{
	scoped_config<std::string> scheme("consul.agent_scheme", "https");
	scoped_config<uint16_t> port("consul.agent_port", 8501);

	EXPECT_EQ("https://10.1.0.1:8501", controller_config::consul_agent("10.1.0.1").base_uri);
}

TEST(controller_config_test, kubernetes_in_cluster)
{
	const scoped_temp_file token_file("s3cr3t\n");
	scoped_config<std::string> token("kubernetes.token_file", token_file.path());
	scoped_config<std::string> ca("kubernetes.ca_file", "/etc/ca.crt");

	const rest_client::options opts = controller_config::kubernetes();

	EXPECT_EQ("https://kubernetes.default.svc", opts.base_uri);
	EXPECT_EQ("Bearer s3cr3t", opts.auth_value);
	EXPECT_EQ("/etc/ca.crt", opts.ca_file);
}

TEST(controller_config_test, kubernetes_kubeconfig_wins)
{
	const scoped_temp_file kubeconfig(R"(
apiVersion: v1
kind: Config
current-context: dev
contexts:
- name: dev
  context:
    cluster: dev-cluster
    user: dev-user
clusters:
- name: dev-cluster
  cluster:
    server: https://10.0.0.1:6443
    insecure-skip-tls-verify: true
users:
- name: dev-user
  user:
    token: abc
)",
	                                  "yaml");
	scoped_config<std::string> path("kubernetes.kubeconfig", kubeconfig.path());

	const rest_client::options opts = controller_config::kubernetes();

	EXPECT_EQ("https://10.0.0.1:6443", opts.base_uri);
	EXPECT_EQ("Bearer abc", opts.auth_value);
	EXPECT_TRUE(opts.insecure_skip_verify);
}

TEST(controller_config_test, logging_defaults)
{
	const log_settings settings = controller_config::logging();

	EXPECT_EQ("/var/log/meshbridge", settings.location);
	EXPECT_EQ("info", settings.file_priority);
	EXPECT_EQ(10u, settings.rotate);
	EXPECT_EQ(10u, settings.max_size_mb);
	EXPECT_TRUE(settings.file_priority_by_component.empty());
}

TEST(controller_config_test, priority_names)
{
	EXPECT_EQ(Poco::Message::PRIO_DEBUG,
	          meshbridge_app::priority_or("debug", Poco::Message::PRIO_INFORMATION));
	EXPECT_EQ(Poco::Message::PRIO_INFORMATION,
	          meshbridge_app::priority_or("", Poco::Message::PRIO_INFORMATION));
	EXPECT_EQ(Poco::Message::PRIO_NOTICE,
	          meshbridge_app::priority_or("loud", Poco::Message::PRIO_NOTICE));
}
