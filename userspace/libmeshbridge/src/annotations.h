/**
 * @file
 *
 * Well-known pod annotations, labels and values shared by the injector,
 * the reconcilers and the CNI plugin.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <string>

namespace meshbridge
{
namespace annotations
{

// Status markers written by the injector.
const std::string KEY_INJECT_STATUS = "consul.hashicorp.com/connect-inject-status";
const std::string KEY_MESH_INJECT_STATUS = "consul.hashicorp.com/mesh-inject-status";
const std::string KEY_TRANSPARENT_PROXY_STATUS = "consul.hashicorp.com/transparent-proxy-status";
const std::string KEY_MANAGED_BY = "consul.hashicorp.com/connect-inject-managed-by";

// Service registration.
const std::string SERVICE = "consul.hashicorp.com/connect-service";
const std::string KUBERNETES_SERVICE = "consul.hashicorp.com/kubernetes-service";
const std::string PORT = "consul.hashicorp.com/connect-service-port";
const std::string UPSTREAMS = "consul.hashicorp.com/connect-service-upstreams";
const std::string TAGS = "consul.hashicorp.com/service-tags";
const std::string CONNECT_TAGS = "consul.hashicorp.com/connect-service-tags";
const std::string META_PREFIX = "consul.hashicorp.com/service-meta-";

// Metrics.
const std::string ENABLE_METRICS = "consul.hashicorp.com/enable-metrics";
const std::string ENABLE_METRICS_MERGING = "consul.hashicorp.com/enable-metrics-merging";
const std::string MERGED_METRICS_PORT = "consul.hashicorp.com/merged-metrics-port";
const std::string PROMETHEUS_SCRAPE_PORT = "consul.hashicorp.com/prometheus-scrape-port";
const std::string PROMETHEUS_SCRAPE_PATH = "consul.hashicorp.com/prometheus-scrape-path";
const std::string SERVICE_METRICS_PORT = "consul.hashicorp.com/service-metrics-port";
const std::string SERVICE_METRICS_PATH = "consul.hashicorp.com/service-metrics-path";

// Transparent proxy and traffic redirection. KEY_ entries are read from
// both pod annotations and namespace labels.
const std::string KEY_TRANSPARENT_PROXY = "consul.hashicorp.com/transparent-proxy";
const std::string KEY_CONSUL_DNS = "consul.hashicorp.com/consul-dns";
const std::string TPROXY_EXCLUDE_INBOUND_PORTS = "consul.hashicorp.com/transparent-proxy-exclude-inbound-ports";
const std::string TPROXY_EXCLUDE_OUTBOUND_PORTS = "consul.hashicorp.com/transparent-proxy-exclude-outbound-ports";
const std::string TPROXY_EXCLUDE_OUTBOUND_CIDRS = "consul.hashicorp.com/transparent-proxy-exclude-outbound-cidrs";
const std::string TPROXY_EXCLUDE_UIDS = "consul.hashicorp.com/transparent-proxy-exclude-uids";
const std::string TPROXY_OVERWRITE_PROBES = "consul.hashicorp.com/transparent-proxy-overwrite-probes";
const std::string USE_PROXY_HEALTH_CHECK = "consul.hashicorp.com/use-proxy-health-check";
const std::string REDIRECT_TRAFFIC_CONFIG = "consul.hashicorp.com/redirect-traffic-config";
const std::string ORIGINAL_POD = "consul.hashicorp.com/original-pod";

// Labels.
const std::string LABEL_SERVICE_IGNORE = "consul.hashicorp.com/service-ignore";
const std::string LABEL_PEERING_TOKEN = "consul.hashicorp.com/peering-token";

// Raising it on a peering resource forces a new token or a new dial.
const std::string PEERING_VERSION = "consul.hashicorp.com/peering-version";

// Values.
const std::string INJECTED = "injected";
const std::string ENABLED = "enabled";
const std::string MANAGED_BY_VALUE = "consul-k8s-endpoints-controller";
const std::string TPROXY_STATUS_WAITING = "waiting";
const std::string TPROXY_STATUS_COMPLETE = "complete";

// CNI_ARGS key carrying a prebuilt redirection config.
const std::string CNI_ARG_IPTABLES_CONFIG = "CONSUL_IPTABLES_CONFIG";

} // namespace annotations
} // namespace meshbridge
