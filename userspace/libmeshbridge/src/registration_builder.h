/**
 * @file
 *
 * Interface to registration_builder, which turns an injected pod backing
 * an Endpoints object into its service and sidecar proxy registrations.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "consul_client.h"
#include "consul_types.h"
#include "k8s_client.h"
#include "k8s_types.h"
#include "metrics_config.h"
#include "namespace_policy.h"
#include "upstream_parser.h"

#include <map>
#include <string>
#include <vector>

namespace meshbridge
{

/** First listener port of each probe kind, offset by container index. */
const int EXPOSED_PATHS_LIVENESS_PORTS_START = 20300;
const int EXPOSED_PATHS_READINESS_PORTS_START = 20400;
const int EXPOSED_PATHS_STARTUP_PORTS_START = 20500;

const std::string CLUSTER_IP_TAGGED_ADDRESS_NAME = "virtual";
const std::string KUBERNETES_SUCCESS_REASON = "Kubernetes health checks passing";
const std::string PROMETHEUS_BIND_ADDR = "envoy_prometheus_bind_addr";

/**
 * A service registration and the sidecar proxy registration that must
 * follow it.
 */
struct service_registrations
{
	agent_service service;
	agent_service proxy;
};

struct registration_defaults
{
	bool enable_transparent_proxy = false;
	bool tproxy_overwrite_probes = false;
};

namespace registration
{

/**
 * The Endpoints name, unless the pod names a single service in its
 * connect-service annotation.
 */
std::string service_name(const pod& p, const endpoints& ep);

/** "<pod>-<service>" */
std::string service_id(const pod& p, const endpoints& ep);

/** "<service>-sidecar-proxy" */
std::string proxy_service_name(const pod& p, const endpoints& ep);

/** "<pod>-<service>-sidecar-proxy" */
std::string proxy_service_id(const pod& p, const endpoints& ep);

/**
 * @returns the position of the service in the pod's connect-service
 *          annotation, or -1 if it is not listed.
 */
int multi_port_index(const pod& p, const endpoints& ep);

/** "<k8s namespace>/<service id>/kubernetes-health-check" */
std::string health_check_id(const pod& p, const std::string& service_id);

std::string health_check_reason(const std::string& status, const pod& p);

/**
 * service-tags followed by connect-service-tags, with $POD_NAME
 * replaced by the pod name.
 */
std::vector<std::string> tags(const pod& p);

/**
 * The bookkeeping keys plus every service-meta- annotation.
 */
std::map<std::string, std::string> meta(const pod& p, const endpoints& ep);

} // namespace registration

class registration_builder
{
public:
	/**
	 * @param[in] k8s     used to look up the pod's namespace and the
	 *                    Kubernetes service.
	 * @param[in] server  used to validate datacenter-qualified upstreams.
	 */
	registration_builder(const registration_defaults& defaults,
	                     const namespace_policy& policy,
	                     const metrics_config& metrics,
	                     const k8s_client::ptr& k8s,
	                     const consul_client::ptr& server);

	/**
	 * @throws meshbridge_exception for invalid annotations, and
	 *         api_exception if a Kubernetes lookup fails.
	 */
	service_registrations build(const pod& p, const endpoints& ep) const;

private:
	int service_port(const pod& p, const endpoints& ep) const;

	void add_transparent_proxy(const pod& p,
	                           const endpoints& ep,
	                           service_registrations& regs) const;

	void add_expose_paths(const pod& p, proxy_config& proxy) const;

	const registration_defaults m_defaults;
	const namespace_policy m_policy;
	const metrics_config m_metrics;
	const upstream_parser m_upstreams;
	const k8s_client::ptr m_k8s;
};

} // namespace meshbridge
