/**
 * @file
 *
 * Interface to iptables_config_builder, which derives the traffic
 * redirection settings of a pod.
 *
 * The settings are derived in two places: from the pod when it is
 * admitted, and from the proxy registration when the sidecar is set up.
 * Both sides reduce their source to an iptables_inputs and share build(),
 * so equal inputs always produce equal configurations.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "consul_types.h"
#include "iptables_config.h"
#include "k8s_types.h"
#include "metrics_config.h"

#include <string>
#include <vector>

namespace meshbridge
{

/**
 * Everything that contributes to a redirection config.
 */
struct iptables_inputs
{
	/** Proxy listener port registered for the service. */
	int service_port = PROXY_DEFAULT_INBOUND_PORT;

	/** bind_port of the opaque proxy config, 0 when unset. */
	int bind_port = 0;

	/** Transparent proxy outbound listener port, 0 when unset. */
	int outbound_listener_port = 0;

	/** Prometheus scrape port, 0 unless metrics are on. */
	int metrics_scrape_port = 0;

	/** Envoy stats listener port, 0 when unset. */
	int stats_bind_port = 0;

	std::vector<int> proxy_health_ports;
	std::vector<int> expose_path_ports;
	std::vector<int> exposed_check_ports;

	std::vector<std::string> exclude_inbound_ports;
	std::vector<std::string> exclude_outbound_ports;
	std::vector<std::string> exclude_outbound_cidrs;
	std::vector<std::string> exclude_uids;

	std::string consul_dns_ip;
};

/**
 * Controller defaults that pods may override.
 */
struct redirect_defaults
{
	bool enable_transparent_proxy = false;
	bool tproxy_overwrite_probes = false;
	bool enable_consul_dns = false;

	/** Prefix of the release's Kubernetes resources, e.g. consul-consul. */
	std::string resource_prefix;
};

class iptables_config_builder
{
public:
	iptables_config_builder(const redirect_defaults& defaults,
	                        const metrics_config& metrics);

	/**
	 * Inbound exclusions are listed in this order: metrics scrape port,
	 * Envoy stats port, proxy health ports, exposed path ports, exposed
	 * check ports, then the annotation list. The init container's UID is
	 * always appended to the excluded UIDs.
	 */
	static iptables_config build(const iptables_inputs& inputs);

	/**
	 * Admission time: derive the inputs from the pod being injected.
	 *
	 * @throws meshbridge_exception for invalid annotations, or if Consul
	 *         DNS is on but its service address is not in the environment.
	 */
	iptables_inputs inputs_for_pod(const k8s_namespace& ns, const pod& p) const;

	/**
	 * Sidecar setup time: derive the inputs from the proxy registration
	 * and the checks Consul exposed for it.
	 *
	 * @throws meshbridge_exception for invalid annotations or a malformed
	 *         Envoy stats address.
	 */
	iptables_inputs inputs_for_proxy(const k8s_namespace& ns,
	                                 const pod& p,
	                                 const agent_service& proxy,
	                                 const std::vector<agent_check>& checks) const;

	/**
	 * @returns the environment variable holding the Consul DNS address,
	 *          e.g. CONSUL_CONSUL_DNS_SERVICE_HOST.
	 */
	std::string dns_env_name() const;

private:
	void add_annotation_inputs(const pod& p, iptables_inputs& inputs) const;
	std::string consul_dns_ip(const k8s_namespace& ns, const pod& p) const;

	const redirect_defaults m_defaults;
	const metrics_config m_metrics;
};

} // namespace meshbridge
