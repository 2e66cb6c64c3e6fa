/**
 * @file
 *
 * Implementation of registration_builder.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "registration_builder.h"
#include "annotations.h"
#include "common_logger.h"
#include "iptables_config.h"
#include "meshbridge_exception.h"
#include "pod_settings.h"
#include "string_utils.h"

#include <Poco/Net/IPAddress.h>

COMMON_LOGGER();

namespace
{

const std::string POD_NAME_VARIABLE = "$POD_NAME";
const std::string LOCAL_SERVICE_ADDRESS = "127.0.0.1";

std::string interpolate(const std::string& value, const meshbridge::pod& p)
{
	return value == POD_NAME_VARIABLE ? p.metadata.name : value;
}

/**
 * Raw comma split, keeping empty entries so positions line up with the
 * port annotation.
 */
std::vector<std::string> annotation_list(const meshbridge::pod& p, const std::string& key)
{
	const std::string raw = p.metadata.annotation(key);

	if(raw.empty())
	{
		return {};
	}

	return string_utils::split(raw, ',');
}

void add_probe_path(const meshbridge::pod& original,
                    const meshbridge::probe& mutated_probe,
                    const meshbridge::probe& original_probe,
                    meshbridge::proxy_config& proxy)
{
	if(!mutated_probe.has_http_get)
	{
		return;
	}

	meshbridge::expose_path path;

	path.listener_port = mutated_probe.http_get.port.is_int ?
	                         mutated_probe.http_get.port.int_value :
	                         0;
	path.local_path_port =
	    original_probe.has_http_get ?
	        meshbridge::pod_settings::port_value(original, original_probe.http_get.port) :
	        0;
	path.path = mutated_probe.http_get.path;
	proxy.expose_paths.push_back(path);
}

} // end namespace

namespace meshbridge
{
namespace registration
{

std::string service_name(const pod& p, const endpoints& ep)
{
	const std::string annotated = p.metadata.annotation(annotations::SERVICE);

	// Multi-port pods always use the Endpoints name.
	if(!annotated.empty() && annotated.find(',') == std::string::npos)
	{
		return annotated;
	}

	return ep.metadata.name;
}

std::string service_id(const pod& p, const endpoints& ep)
{
	return p.metadata.name + "-" + service_name(p, ep);
}

std::string proxy_service_name(const pod& p, const endpoints& ep)
{
	return service_name(p, ep) + "-sidecar-proxy";
}

std::string proxy_service_id(const pod& p, const endpoints& ep)
{
	return p.metadata.name + "-" + proxy_service_name(p, ep);
}

int multi_port_index(const pod& p, const endpoints& ep)
{
	const std::string name = service_name(p, ep);
	const std::vector<std::string> names =
	    string_utils::split(p.metadata.annotation(annotations::SERVICE), ',');

	for(size_t i = 0; i < names.size(); ++i)
	{
		if(names[i] == name)
		{
			return static_cast<int>(i);
		}
	}

	return -1;
}

std::string health_check_id(const pod& p, const std::string& service_id)
{
	return p.metadata.ns + "/" + service_id + "/kubernetes-health-check";
}

std::string health_check_reason(const std::string& status, const pod& p)
{
	if(status == HEALTH_PASSING)
	{
		return KUBERNETES_SUCCESS_REASON;
	}

	return "Pod \"" + p.metadata.ns + "/" + p.metadata.name + "\" is not ready";
}

std::vector<std::string> tags(const pod& p)
{
	std::vector<std::string> result;

	for(const auto& key : {annotations::TAGS, annotations::CONNECT_TAGS})
	{
		for(const auto& tag : annotation_list(p, key))
		{
			result.push_back(interpolate(string_utils::trimmed(tag), p));
		}
	}

	return result;
}

std::map<std::string, std::string> meta(const pod& p, const endpoints& ep)
{
	std::map<std::string, std::string> result = {
		{META_KEY_POD_NAME, p.metadata.name},
		{META_KEY_KUBE_SERVICE_NAME, ep.metadata.name},
		{META_KEY_KUBE_NS, ep.metadata.ns},
		{META_KEY_MANAGED_BY, annotations::MANAGED_BY_VALUE},
	};

	for(const auto& annotation : p.metadata.annotations)
	{
		if(!string_utils::starts_with(annotation.first, annotations::META_PREFIX))
		{
			continue;
		}

		const std::string key = annotation.first.substr(annotations::META_PREFIX.size());
		if(!key.empty())
		{
			result[key] = interpolate(annotation.second, p);
		}
	}

	return result;
}

} // namespace registration

registration_builder::registration_builder(const registration_defaults& defaults,
                                           const namespace_policy& policy,
                                           const metrics_config& metrics,
                                           const k8s_client::ptr& k8s,
                                           const consul_client::ptr& server):
	m_defaults(defaults),
	m_policy(policy),
	m_metrics(metrics),
	m_upstreams(policy, server),
	m_k8s(k8s)
{
}

int registration_builder::service_port(const pod& p, const endpoints& ep) const
{
	std::vector<std::string> ports = annotation_list(p, annotations::PORT);

	if(ports.empty())
	{
		return 0;
	}

	std::string raw = ports[0];
	if(ports.size() > 1)
	{
		const int index = registration::multi_port_index(p, ep);

		if(index < 0 || static_cast<size_t>(index) >= ports.size())
		{
			throw meshbridge_exception("no port listed for service " +
			                           registration::service_name(p, ep) + " on pod " +
			                           p.metadata.name);
		}
		raw = ports[index];
	}

	return pod_settings::port_value(p, string_utils::trimmed(raw));
}

service_registrations registration_builder::build(const pod& p, const endpoints& ep) const
{
	service_registrations regs;
	const int port = service_port(p, ep);
	const int index = registration::multi_port_index(p, ep);
	const std::string name = registration::service_name(p, ep);
	const std::string id = registration::service_id(p, ep);
	const query_options scope = m_policy.query_for(p.metadata.ns);

	agent_service& svc = regs.service;
	svc.id = id;
	svc.service = name;
	svc.port = port;
	svc.address = p.pod_ip;
	svc.meta = registration::meta(p, ep);
	svc.ns = scope.ns;
	svc.partition = scope.partition;
	svc.tags = registration::tags(p);

	const int proxy_port = PROXY_DEFAULT_INBOUND_PORT + (index >= 0 ? index : 0);

	agent_service& proxy = regs.proxy;
	proxy.kind = SERVICE_KIND_CONNECT_PROXY;
	proxy.id = registration::proxy_service_id(p, ep);
	proxy.service = registration::proxy_service_name(p, ep);
	proxy.port = proxy_port;
	proxy.address = p.pod_ip;
	proxy.meta = svc.meta;
	proxy.ns = svc.ns;
	proxy.partition = svc.partition;
	proxy.tags = svc.tags;
	proxy.has_proxy = true;
	proxy.proxy.destination_service_name = name;
	proxy.proxy.destination_service_id = id;

	if(m_metrics.enable_metrics(p))
	{
		proxy.proxy.config[PROMETHEUS_BIND_ADDR] =
		    "0.0.0.0:" + std::to_string(m_metrics.prometheus_scrape_port(p));
	}

	if(port > 0)
	{
		proxy.proxy.local_service_address = LOCAL_SERVICE_ADDRESS;
		proxy.proxy.local_service_port = port;
	}

	// Only the first service of a multi-port pod gets upstreams.
	if(index <= 0)
	{
		proxy.proxy.upstreams = m_upstreams.parse(p);
	}

	service_check listener;
	listener.name = "Proxy Public Listener";
	listener.tcp = p.pod_ip + ":" + std::to_string(proxy_port);
	listener.interval = "10s";
	listener.deregister_critical_service_after = "10m";
	proxy.checks.push_back(listener);

	service_check alias;
	alias.name = "Destination Alias";
	alias.alias_service = id;
	proxy.checks.push_back(alias);

	add_transparent_proxy(p, ep, regs);

	return regs;
}

void registration_builder::add_transparent_proxy(const pod& p,
                                                 const endpoints& ep,
                                                 service_registrations& regs) const
{
	k8s_namespace ns;

	if(!m_k8s->get_namespace(p.metadata.ns, ns))
	{
		throw api_exception("namespace " + p.metadata.ns + " not found", 404);
	}

	if(!pod_settings::transparent_proxy_enabled(ns, p, m_defaults.enable_transparent_proxy))
	{
		return;
	}

	service k8s_service;
	if(!m_k8s->get_service(ep.metadata.key(), k8s_service))
	{
		throw api_exception("service " + ep.metadata.key().to_string() + " not found", 404);
	}

	Poco::Net::IPAddress cluster_ip;
	if(Poco::Net::IPAddress::tryParse(k8s_service.cluster_ip, cluster_ip))
	{
		// Consul supports one port per service, so only the port that
		// targets the registered port is tagged.
		int k8s_service_port = 0;

		for(const auto& sp : k8s_service.ports)
		{
			const int target = sp.has_target_port ?
			                       pod_settings::port_value(p, sp.target_port) :
			                       0;

			if((target != 0 && target == regs.service.port) ||
			   (target == 0 && sp.port == regs.service.port))
			{
				k8s_service_port = sp.port;
				break;
			}
		}

		tagged_address virtual_address;
		virtual_address.address = k8s_service.cluster_ip;
		virtual_address.port = k8s_service_port;

		regs.service.tagged_addresses[CLUSTER_IP_TAGGED_ADDRESS_NAME] = virtual_address;
		regs.proxy.tagged_addresses[CLUSTER_IP_TAGGED_ADDRESS_NAME] = virtual_address;
		regs.proxy.proxy.mode = PROXY_MODE_TRANSPARENT;
	}
	else
	{
		LOG_INFO("Skipping cluster IP %s of service %s",
		         k8s_service.cluster_ip.c_str(),
		         ep.metadata.key().to_string().c_str());
	}

	if(pod_settings::overwrite_probes(p, m_defaults.tproxy_overwrite_probes))
	{
		add_expose_paths(p, regs.proxy.proxy);
	}
}

void registration_builder::add_expose_paths(const pod& p, proxy_config& proxy) const
{
	const pod original = pod_settings::original_pod(p);

	for(const auto& mutated : p.containers)
	{
		for(const auto& orig : original.containers)
		{
			if(orig.name != mutated.name)
			{
				continue;
			}

			add_probe_path(original, mutated.liveness_probe, orig.liveness_probe, proxy);
			add_probe_path(original, mutated.readiness_probe, orig.readiness_probe, proxy);
			add_probe_path(original, mutated.startup_probe, orig.startup_probe, proxy);
		}
	}
}

} // namespace meshbridge
