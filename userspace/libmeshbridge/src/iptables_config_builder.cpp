/**
 * @file
 *
 * Implementation of iptables_config_builder.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "iptables_config_builder.h"
#include "annotations.h"
#include "common_logger.h"
#include "meshbridge_exception.h"
#include "pod_settings.h"
#include "string_utils.h"

#include <Poco/Environment.h>

#include <algorithm>
#include <set>

COMMON_LOGGER();

namespace
{

const std::string DNS_ENV_SUFFIX = "_DNS_SERVICE_HOST";
const std::string PROMETHEUS_BIND_ADDR_KEY = "envoy_prometheus_bind_addr";
const std::string STATS_BIND_ADDR_KEY = "envoy_stats_bind_addr";
const std::string BIND_PORT_KEY = "bind_port";

const std::set<std::string> SIDECAR_CONTAINERS = {
	"envoy-sidecar",
	"consul-dataplane",
};

/**
 * Port of a "host:port" address.
 */
int address_port(const std::string& key, const std::string& address)
{
	const size_t colon = address.rfind(':');
	int64_t port = 0;

	if(colon == std::string::npos ||
	   !string_utils::parse_int(address.substr(colon + 1), port) ||
	   port <= 0 || port > 65535)
	{
		throw meshbridge::meshbridge_exception("failed parsing host and port from " + key +
		                                       ": " + address);
	}

	return static_cast<int>(port);
}

/**
 * The opaque proxy config is loosely typed; ports may be numbers or
 * numeric strings.
 */
int config_port(const Json::Value& config, const std::string& key)
{
	const Json::Value& value = config[key];
	int64_t port = 0;

	if(value.isIntegral())
	{
		return value.asInt();
	}

	if(value.isString() && string_utils::parse_int(value.asString(), port))
	{
		return static_cast<int>(port);
	}

	if(!value.isNull())
	{
		throw meshbridge::meshbridge_exception("failed parsing proxy config " + key);
	}

	return 0;
}

/**
 * Every service of a pod gets its own proxy, and with it a health port.
 */
std::vector<int> proxy_health_ports(const meshbridge::pod& p)
{
	std::vector<int> ports;

	if(!meshbridge::pod_settings::use_proxy_health_check(p))
	{
		return ports;
	}

	const size_t services =
	    std::max<size_t>(1, meshbridge::pod_settings::split_annotation(
	                            p, meshbridge::annotations::SERVICE).size());

	for(size_t i = 0; i < services; ++i)
	{
		ports.push_back(meshbridge::PROXY_DEFAULT_HEALTH_PORT + static_cast<int>(i));
	}

	return ports;
}

void append_port(std::vector<std::string>& list, const int port)
{
	if(port > 0)
	{
		list.push_back(std::to_string(port));
	}
}

} // end namespace

namespace meshbridge
{

iptables_config_builder::iptables_config_builder(const redirect_defaults& defaults,
                                                 const metrics_config& metrics):
	m_defaults(defaults),
	m_metrics(metrics)
{
}

iptables_config iptables_config_builder::build(const iptables_inputs& inputs)
{
	iptables_config config;

	config.proxy_user_id = std::to_string(PROXY_USER_ID);
	config.proxy_inbound_port = inputs.bind_port > 0 ? inputs.bind_port : inputs.service_port;
	config.proxy_outbound_port = inputs.outbound_listener_port > 0 ?
	                                 inputs.outbound_listener_port :
	                                 DEFAULT_TPROXY_OUTBOUND_PORT;

	append_port(config.exclude_inbound_ports, inputs.metrics_scrape_port);
	append_port(config.exclude_inbound_ports, inputs.stats_bind_port);
	for(const int port : inputs.proxy_health_ports)
	{
		append_port(config.exclude_inbound_ports, port);
	}
	for(const int port : inputs.expose_path_ports)
	{
		append_port(config.exclude_inbound_ports, port);
	}
	for(const int port : inputs.exposed_check_ports)
	{
		append_port(config.exclude_inbound_ports, port);
	}
	config.exclude_inbound_ports.insert(config.exclude_inbound_ports.end(),
	                                    inputs.exclude_inbound_ports.begin(),
	                                    inputs.exclude_inbound_ports.end());

	config.exclude_outbound_ports = inputs.exclude_outbound_ports;
	config.exclude_outbound_cidrs = inputs.exclude_outbound_cidrs;
	config.exclude_uids = inputs.exclude_uids;
	config.exclude_uids.push_back(std::to_string(INIT_CONTAINER_USER_ID));

	config.consul_dns_ip = inputs.consul_dns_ip;

	return config;
}

iptables_inputs iptables_config_builder::inputs_for_pod(const k8s_namespace& ns,
                                                        const pod& p) const
{
	iptables_inputs inputs;

	if(m_metrics.enable_metrics(p))
	{
		inputs.metrics_scrape_port = m_metrics.prometheus_scrape_port(p);
	}

	inputs.proxy_health_ports = proxy_health_ports(p);

	if(pod_settings::overwrite_probes(p, m_defaults.tproxy_overwrite_probes) &&
	   pod_settings::transparent_proxy_enabled(ns, p, m_defaults.enable_transparent_proxy))
	{
		for(const auto& c : p.containers)
		{
			if(SIDECAR_CONTAINERS.count(c.name) > 0)
			{
				continue;
			}

			for(const probe* pr : {&c.liveness_probe, &c.readiness_probe, &c.startup_probe})
			{
				if(pr->has_http_get)
				{
					inputs.expose_path_ports.push_back(
					    pod_settings::port_value(p, pr->http_get.port));
				}
			}
		}
	}

	add_annotation_inputs(p, inputs);
	inputs.consul_dns_ip = consul_dns_ip(ns, p);

	return inputs;
}

iptables_inputs iptables_config_builder::inputs_for_proxy(
    const k8s_namespace& ns,
    const pod& p,
    const agent_service& proxy,
    const std::vector<agent_check>& checks) const
{
	iptables_inputs inputs;
	const Json::Value& config = proxy.proxy.config;

	inputs.service_port = proxy.port;
	inputs.bind_port = config_port(config, BIND_PORT_KEY);
	inputs.outbound_listener_port = proxy.proxy.outbound_listener_port;

	if(config.isMember(PROMETHEUS_BIND_ADDR_KEY))
	{
		inputs.metrics_scrape_port =
		    address_port(PROMETHEUS_BIND_ADDR_KEY,
		                 config[PROMETHEUS_BIND_ADDR_KEY].asString());
	}

	if(config.isMember(STATS_BIND_ADDR_KEY))
	{
		inputs.stats_bind_port =
		    address_port(STATS_BIND_ADDR_KEY, config[STATS_BIND_ADDR_KEY].asString());
	}

	inputs.proxy_health_ports = proxy_health_ports(p);

	for(const auto& path : proxy.proxy.expose_paths)
	{
		inputs.expose_path_ports.push_back(path.listener_port);
	}

	for(const auto& check : checks)
	{
		if(check.exposed_port > 0)
		{
			inputs.exposed_check_ports.push_back(check.exposed_port);
		}
	}

	add_annotation_inputs(p, inputs);
	inputs.consul_dns_ip = consul_dns_ip(ns, p);

	return inputs;
}

std::string iptables_config_builder::dns_env_name() const
{
	return string_utils::to_env_name(m_defaults.resource_prefix) + DNS_ENV_SUFFIX;
}

void iptables_config_builder::add_annotation_inputs(const pod& p,
                                                    iptables_inputs& inputs) const
{
	inputs.exclude_inbound_ports =
	    pod_settings::split_annotation(p, annotations::TPROXY_EXCLUDE_INBOUND_PORTS);
	inputs.exclude_outbound_ports =
	    pod_settings::split_annotation(p, annotations::TPROXY_EXCLUDE_OUTBOUND_PORTS);
	inputs.exclude_outbound_cidrs =
	    pod_settings::split_annotation(p, annotations::TPROXY_EXCLUDE_OUTBOUND_CIDRS);
	inputs.exclude_uids = pod_settings::split_annotation(p, annotations::TPROXY_EXCLUDE_UIDS);
}

std::string iptables_config_builder::consul_dns_ip(const k8s_namespace& ns, const pod& p) const
{
	if(!pod_settings::consul_dns_enabled(ns, p, m_defaults.enable_consul_dns))
	{
		return "";
	}

	const std::string name = dns_env_name();
	const std::string ip = Poco::Environment::get(name, "");

	if(ip.empty())
	{
		LOGGED_THROW(meshbridge_exception, "environment variable %s not found", name.c_str());
	}

	return ip;
}

} // namespace meshbridge
