/**
 * @file
 *
 * Implementation of namespace controller_config.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "controller_config.h"
#include "consul_rest_client.h"
#include "k8s_rest_client.h"
#include "kubeconfig.h"
#include "type_config.h"

#include <set>
#include <string>
#include <vector>

namespace
{

type_config<std::string> c_log_location(
    "/var/log/meshbridge",
    "Directory holding the controller log",
    "log",
    "location");

type_config<std::string> c_log_file_priority(
    "info",
    "Minimum priority of messages written to the log file",
    "log",
    "file_priority");

type_config<std::string> c_log_console_priority(
    "info",
    "Minimum priority of messages written to the console",
    "log",
    "console_priority");

type_config<uint32_t> c_log_rotate(
    10,
    "Number of rotated log files to keep",
    "log",
    "rotate");

type_config<uint32_t>::ptr c_log_max_size_mb =
    type_config_builder<uint32_t>(10,
                                  "Size in MB at which the log file is rotated",
                                  "log",
                                  "max_size_mb")
        .min(1)
        .build();

type_config<std::vector<std::string>> c_log_file_priority_by_component(
    {},
    "Per-component file priorities, each formatted \"<component>: <level>\"",
    "log",
    "file_priority_by_component");

type_config<std::vector<std::string>> c_log_console_priority_by_component(
    {},
    "Per-component console priorities, each formatted \"<component>: <level>\"",
    "log",
    "console_priority_by_component");

type_config<std::string> c_k8s_api_server(
    "https://kubernetes.default.svc",
    "Address of the Kubernetes API server",
    "kubernetes",
    "api_server");

type_config<std::string> c_k8s_token_file(
    "/var/run/secrets/kubernetes.io/serviceaccount/token",
    "Service account token presented to the API server",
    "kubernetes",
    "token_file");

type_config<std::string> c_k8s_ca_file(
    "/var/run/secrets/kubernetes.io/serviceaccount/ca.crt",
    "CA bundle used to verify the API server",
    "kubernetes",
    "ca_file");

type_config<std::string> c_k8s_kubeconfig(
    "",
    "Kubeconfig used instead of the in-cluster service account when set",
    "kubernetes",
    "kubeconfig");

type_config<std::string> c_consul_address(
    "http://127.0.0.1:8500",
    "Address of the Consul server",
    "consul",
    "address");

type_config<std::string> c_consul_token(
    "",
    "ACL token sent with every Consul request",
    "consul",
    "token");

type_config<std::string> c_consul_ca_file(
    "",
    "CA bundle used to verify Consul over HTTPS",
    "consul",
    "ca_file");

type_config<std::string> c_consul_agent_scheme(
    "http",
    "Scheme used to reach the per-node Consul agents",
    "consul",
    "agent_scheme");

type_config<uint16_t> c_consul_agent_port(
    8500,
    "Port of the per-node Consul agents",
    "consul",
    "agent_port");

type_config<uint32_t>::ptr c_consul_api_timeout_ms =
    type_config_builder<uint32_t>(5000,
                                  "Timeout of a single Consul request",
                                  "consul",
                                  "api_timeout_ms")
        .min(100)
        .build();

type_config<std::string> c_release_name(
    "consul",
    "Name of the Consul release",
    "release",
    "name");

type_config<std::string> c_release_namespace(
    "default",
    "Namespace the Consul release is installed in",
    "release",
    "namespace");

type_config<std::string> c_agent_topology(
    "shared",
    "Where services register: \"shared\" for one agent, \"per_node\" for the "
    "agent on each pod's node",
    "connect_inject",
    "agent_topology");

type_config<std::vector<std::string>> c_allow_k8s_namespaces(
    {"*"},
    "Kubernetes namespaces whose services are synced",
    "connect_inject",
    "allow_k8s_namespaces");

type_config<std::vector<std::string>> c_deny_k8s_namespaces(
    {},
    "Kubernetes namespaces whose services are never synced",
    "connect_inject",
    "deny_k8s_namespaces");

type_config<bool> c_enable_transparent_proxy(
    false,
    "Default transparent proxy setting for pods without an annotation",
    "connect_inject",
    "enable_transparent_proxy");

type_config<bool> c_tproxy_overwrite_probes(
    false,
    "Default probe overwrite setting for transparent proxy pods",
    "connect_inject",
    "tproxy_overwrite_probes");

type_config<std::string> c_auth_method(
    "",
    "Kubernetes auth method whose tokens are deleted with their pod",
    "connect_inject",
    "auth_method");

type_config<bool> c_enable_consul_namespaces(
    false,
    "Register services in Consul namespaces",
    "connect_inject",
    "enable_consul_namespaces");

type_config<std::string> c_consul_destination_namespace(
    "default",
    "Consul namespace used when mirroring is off",
    "connect_inject",
    "consul_destination_namespace");

type_config<bool> c_enable_ns_mirroring(
    false,
    "Mirror each Kubernetes namespace into a Consul namespace",
    "connect_inject",
    "enable_ns_mirroring");

type_config<std::string> c_ns_mirroring_prefix(
    "",
    "Prefix of mirrored Consul namespaces",
    "connect_inject",
    "ns_mirroring_prefix");

type_config<bool> c_enable_consul_partitions(
    false,
    "Register services in a Consul admin partition",
    "connect_inject",
    "enable_consul_partitions");

type_config<std::string> c_consul_partition(
    "",
    "Consul admin partition",
    "connect_inject",
    "consul_partition");

type_config<bool> c_default_enable_metrics(
    false,
    "Default metrics setting for pods without an annotation",
    "metrics",
    "default_enable_metrics");

type_config<bool> c_default_enable_metrics_merging(
    false,
    "Default metrics merging setting for pods without an annotation",
    "metrics",
    "default_enable_metrics_merging");

type_config<std::string> c_default_merged_metrics_port(
    "20100",
    "Default port serving merged metrics",
    "metrics",
    "default_merged_metrics_port");

type_config<std::string> c_default_prometheus_scrape_port(
    "20200",
    "Default port Prometheus scrapes",
    "metrics",
    "default_prometheus_scrape_port");

type_config<std::string> c_default_prometheus_scrape_path(
    "/metrics",
    "Default path Prometheus scrapes",
    "metrics",
    "default_prometheus_scrape_path");

type_config<uint16_t>::ptr c_worker_threads =
    type_config_builder<uint16_t>(4,
                                  "Worker threads per reconciler",
                                  "controller",
                                  "worker_threads")
        .min(1)
        .max(64)
        .build();

type_config<uint64_t>::ptr c_poll_interval_ms =
    type_config_builder<uint64_t>(2000,
                                  "How often resources are listed",
                                  "controller",
                                  "poll_interval_ms")
        .min(100)
        .build();

type_config<uint64_t> c_resync_interval_s(
    300,
    "How often every known resource is reconciled again, 0 to disable",
    "controller",
    "resync_interval_s");

type_config<uint64_t> c_base_requeue_delay_ms(
    5,
    "First delay of a failed reconcile",
    "controller",
    "base_requeue_delay_ms");

type_config<uint64_t> c_max_requeue_delay_ms(
    60000,
    "Longest delay of a failed reconcile",
    "controller",
    "max_requeue_delay_ms");

type_config<bool> c_enable_peering(
    false,
    "Run the peering acceptor and dialer controllers",
    "controller",
    "enable_peering");

type_config<bool> c_enable_terminating_gateway(
    false,
    "Run the terminating gateway service controller",
    "controller",
    "enable_terminating_gateway");

type_config<bool> c_acls_enabled(
    false,
    "Consul ACLs are enabled, so terminating gateway policies are managed",
    "controller",
    "acls_enabled");

std::set<std::string> to_set(const std::vector<std::string>& values)
{
	return std::set<std::string>(values.begin(), values.end());
}

} // end namespace

namespace meshbridge
{
namespace controller_config
{

const std::string LOG_FILE_NAME = "meshbridge.log";

log_settings logging()
{
	log_settings settings;

	settings.location = c_log_location.get_value();
	settings.file_priority = c_log_file_priority.get_value();
	settings.console_priority = c_log_console_priority.get_value();
	settings.rotate = c_log_rotate.get_value();
	settings.max_size_mb = c_log_max_size_mb->get_value();
	settings.file_priority_by_component = c_log_file_priority_by_component.get_value();
	settings.console_priority_by_component = c_log_console_priority_by_component.get_value();

	return settings;
}

controller_settings controller()
{
	controller_settings settings;

	settings.release_name = c_release_name.get_value();
	settings.release_namespace = c_release_namespace.get_value();
	settings.topology = parse_agent_topology(c_agent_topology.get_value());
	settings.agent_scheme = c_consul_agent_scheme.get_value();
	settings.agent_port = c_consul_agent_port.get_value();
	settings.auth_method = c_auth_method.get_value();

	settings.namespaces.allow_k8s_namespaces = to_set(c_allow_k8s_namespaces.get_value());
	settings.namespaces.deny_k8s_namespaces = to_set(c_deny_k8s_namespaces.get_value());
	settings.namespaces.enable_consul_namespaces = c_enable_consul_namespaces.get_value();
	settings.namespaces.consul_destination_namespace = c_consul_destination_namespace.get_value();
	settings.namespaces.enable_ns_mirroring = c_enable_ns_mirroring.get_value();
	settings.namespaces.ns_mirroring_prefix = c_ns_mirroring_prefix.get_value();
	settings.namespaces.enable_consul_partitions = c_enable_consul_partitions.get_value();
	settings.namespaces.consul_partition = c_consul_partition.get_value();

	settings.registration.enable_transparent_proxy = c_enable_transparent_proxy.get_value();
	settings.registration.tproxy_overwrite_probes = c_tproxy_overwrite_probes.get_value();

	settings.metrics.enable_metrics = c_default_enable_metrics.get_value();
	settings.metrics.enable_metrics_merging = c_default_enable_metrics_merging.get_value();
	settings.metrics.merged_metrics_port = c_default_merged_metrics_port.get_value();
	settings.metrics.prometheus_scrape_port = c_default_prometheus_scrape_port.get_value();
	settings.metrics.prometheus_scrape_path = c_default_prometheus_scrape_path.get_value();

	settings.worker_threads = c_worker_threads->get_value();
	settings.poll_interval_ms = c_poll_interval_ms->get_value();
	settings.resync_interval_s = c_resync_interval_s.get_value();
	settings.base_requeue_delay_ms = c_base_requeue_delay_ms.get_value();
	settings.max_requeue_delay_ms = c_max_requeue_delay_ms.get_value();

	settings.enable_peering = c_enable_peering.get_value();
	settings.enable_terminating_gateway = c_enable_terminating_gateway.get_value();
	settings.acls_enabled = c_acls_enabled.get_value();

	return settings;
}

rest_client::options kubernetes()
{
	if(!c_k8s_kubeconfig.get_value().empty())
	{
		return kubeconfig::load_file(c_k8s_kubeconfig.get_value());
	}

	return k8s_rest_client::in_cluster_options(c_k8s_api_server.get_value(),
	                                           c_k8s_token_file.get_value(),
	                                           c_k8s_ca_file.get_value());
}

rest_client::options consul()
{
	return consul_rest_client::make_options(c_consul_address.get_value(),
	                                        c_consul_token.get_value(),
	                                        c_consul_ca_file.get_value(),
	                                        c_consul_api_timeout_ms->get_value());
}

rest_client::options consul_agent(const std::string& host_ip)
{
	const std::string address = c_consul_agent_scheme.get_value() + "://" + host_ip + ":" +
	                            std::to_string(c_consul_agent_port.get_value());

	return consul_rest_client::make_options(address,
	                                        c_consul_token.get_value(),
	                                        c_consul_ca_file.get_value(),
	                                        c_consul_api_timeout_ms->get_value());
}

} // namespace controller_config
} // namespace meshbridge
