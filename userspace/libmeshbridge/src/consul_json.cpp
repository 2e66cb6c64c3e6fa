/**
 * @file
 *
 * Implementation of the Consul wire format conversion.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "consul_json.h"

namespace
{

using namespace meshbridge;

std::map<std::string, std::string> parse_string_map(const Json::Value& value)
{
	std::map<std::string, std::string> result;

	if(value.isObject())
	{
		for(const auto& name : value.getMemberNames())
		{
			result[name] = value[name].asString();
		}
	}

	return result;
}

Json::Value string_map_to_json(const std::map<std::string, std::string>& map)
{
	Json::Value result(Json::objectValue);

	for(const auto& entry : map)
	{
		result[entry.first] = entry.second;
	}

	return result;
}

std::vector<std::string> parse_string_list(const Json::Value& value)
{
	std::vector<std::string> result;

	for(const auto& item : value)
	{
		result.push_back(item.asString());
	}

	return result;
}

Json::Value string_list_to_json(const std::vector<std::string>& list)
{
	Json::Value result(Json::arrayValue);

	for(const auto& item : list)
	{
		result.append(item);
	}

	return result;
}

tagged_address_map parse_tagged_addresses(const Json::Value& value)
{
	tagged_address_map result;

	if(value.isObject())
	{
		for(const auto& name : value.getMemberNames())
		{
			tagged_address address;

			address.address = value[name].get("Address", "").asString();
			address.port = value[name].get("Port", 0).asInt();
			result[name] = address;
		}
	}

	return result;
}

Json::Value tagged_addresses_to_json(const tagged_address_map& addresses)
{
	Json::Value result(Json::objectValue);

	for(const auto& entry : addresses)
	{
		result[entry.first]["Address"] = entry.second.address;
		result[entry.first]["Port"] = entry.second.port;
	}

	return result;
}

Json::Value proxy_to_json(const proxy_config& proxy)
{
	Json::Value result;

	result["DestinationServiceName"] = proxy.destination_service_name;
	result["DestinationServiceID"] = proxy.destination_service_id;

	if(!proxy.local_service_address.empty())
	{
		result["LocalServiceAddress"] = proxy.local_service_address;
	}

	if(proxy.local_service_port > 0)
	{
		result["LocalServicePort"] = proxy.local_service_port;
	}

	if(!proxy.mode.empty())
	{
		result["Mode"] = proxy.mode;
	}

	if(proxy.outbound_listener_port > 0)
	{
		result["TransparentProxy"]["OutboundListenerPort"] = proxy.outbound_listener_port;
	}

	if(!proxy.config.empty())
	{
		result["Config"] = proxy.config;
	}

	Json::Value upstreams(Json::arrayValue);
	for(const auto& up : proxy.upstreams)
	{
		Json::Value u;

		u["DestinationType"] = up.destination_type;
		u["DestinationName"] = up.destination_name;
		if(!up.destination_namespace.empty())
		{
			u["DestinationNamespace"] = up.destination_namespace;
		}
		if(!up.destination_partition.empty())
		{
			u["DestinationPartition"] = up.destination_partition;
		}
		if(!up.destination_peer.empty())
		{
			u["DestinationPeer"] = up.destination_peer;
		}
		if(!up.datacenter.empty())
		{
			u["Datacenter"] = up.datacenter;
		}
		u["LocalBindPort"] = up.local_bind_port;
		upstreams.append(u);
	}
	result["Upstreams"] = upstreams;

	if(!proxy.expose_paths.empty())
	{
		Json::Value paths(Json::arrayValue);

		for(const auto& path : proxy.expose_paths)
		{
			Json::Value p;

			p["ListenerPort"] = path.listener_port;
			p["LocalPathPort"] = path.local_path_port;
			p["Path"] = path.path;
			paths.append(p);
		}
		result["Expose"]["Paths"] = paths;
	}

	return result;
}

proxy_config parse_proxy(const Json::Value& value)
{
	proxy_config proxy;

	proxy.destination_service_name = value.get("DestinationServiceName", "").asString();
	proxy.destination_service_id = value.get("DestinationServiceID", "").asString();
	proxy.local_service_address = value.get("LocalServiceAddress", "").asString();
	proxy.local_service_port = value.get("LocalServicePort", 0).asInt();
	proxy.mode = value.get("Mode", "").asString();
	proxy.outbound_listener_port =
	    value["TransparentProxy"].get("OutboundListenerPort", 0).asInt();

	if(value["Config"].isObject())
	{
		proxy.config = value["Config"];
	}

	for(const auto& u : value["Upstreams"])
	{
		upstream up;

		up.destination_type = u.get("DestinationType", "").asString();
		up.destination_name = u.get("DestinationName", "").asString();
		up.destination_namespace = u.get("DestinationNamespace", "").asString();
		up.destination_partition = u.get("DestinationPartition", "").asString();
		up.destination_peer = u.get("DestinationPeer", "").asString();
		up.datacenter = u.get("Datacenter", "").asString();
		up.local_bind_port = u.get("LocalBindPort", 0).asInt();
		proxy.upstreams.push_back(up);
	}

	for(const auto& p : value["Expose"]["Paths"])
	{
		expose_path path;

		path.listener_port = p.get("ListenerPort", 0).asInt();
		path.local_path_port = p.get("LocalPathPort", 0).asInt();
		path.path = p.get("Path", "").asString();
		proxy.expose_paths.push_back(path);
	}

	return proxy;
}

} // end namespace

namespace meshbridge
{
namespace consul_json
{

Json::Value to_json(const agent_service& service)
{
	Json::Value value;

	if(!service.kind.empty())
	{
		value["Kind"] = service.kind;
	}

	value["ID"] = service.id;
	value["Name"] = service.service;
	value["Address"] = service.address;
	value["Port"] = service.port;

	if(!service.ns.empty())
	{
		value["Namespace"] = service.ns;
	}

	if(!service.partition.empty())
	{
		value["Partition"] = service.partition;
	}

	value["Meta"] = string_map_to_json(service.meta);
	value["Tags"] = string_list_to_json(service.tags);

	if(!service.tagged_addresses.empty())
	{
		value["TaggedAddresses"] = tagged_addresses_to_json(service.tagged_addresses);
	}

	if(service.has_proxy)
	{
		value["Proxy"] = proxy_to_json(service.proxy);
	}

	if(!service.checks.empty())
	{
		Json::Value checks(Json::arrayValue);

		for(const auto& check : service.checks)
		{
			Json::Value c;

			c["Name"] = check.name;
			if(!check.tcp.empty())
			{
				c["TCP"] = check.tcp;
			}
			if(!check.interval.empty())
			{
				c["Interval"] = check.interval;
			}
			if(!check.deregister_critical_service_after.empty())
			{
				c["DeregisterCriticalServiceAfter"] = check.deregister_critical_service_after;
			}
			if(!check.alias_service.empty())
			{
				c["AliasService"] = check.alias_service;
			}
			checks.append(c);
		}
		value["Checks"] = checks;
	}

	return value;
}

agent_service parse_agent_service(const Json::Value& value)
{
	agent_service service;

	service.kind = value.get("Kind", "").asString();
	service.id = value.get("ID", "").asString();
	// The agent lists the name as "Service", registrations carry "Name".
	service.service = value.get("Service", value.get("Name", "")).asString();
	service.address = value.get("Address", "").asString();
	service.port = value.get("Port", 0).asInt();
	service.ns = value.get("Namespace", "").asString();
	service.partition = value.get("Partition", "").asString();
	service.meta = parse_string_map(value["Meta"]);
	service.tags = parse_string_list(value["Tags"]);
	service.tagged_addresses = parse_tagged_addresses(value["TaggedAddresses"]);

	if(value["Proxy"].isObject())
	{
		service.has_proxy = true;
		service.proxy = parse_proxy(value["Proxy"]);
	}

	return service;
}

std::map<std::string, agent_service> parse_agent_services(const Json::Value& value)
{
	std::map<std::string, agent_service> services;

	if(value.isObject())
	{
		for(const auto& id : value.getMemberNames())
		{
			services[id] = parse_agent_service(value[id]);
		}
	}

	return services;
}

agent_check parse_agent_check(const Json::Value& value)
{
	agent_check check;

	check.check_id = value.get("CheckID", "").asString();
	check.name = value.get("Name", "").asString();
	check.status = value.get("Status", "").asString();
	check.output = value.get("Output", "").asString();
	check.service_id = value.get("ServiceID", "").asString();
	check.service_name = value.get("ServiceName", "").asString();
	check.type = value.get("Type", "").asString();
	check.exposed_port = value.get("ExposedPort", 0).asInt();

	return check;
}

Json::Value to_json(const check_registration& check)
{
	Json::Value value;

	value["ID"] = check.id;
	value["Name"] = check.name;
	value["ServiceID"] = check.service_id;
	if(!check.ns.empty())
	{
		value["Namespace"] = check.ns;
	}
	value["TTL"] = check.ttl;
	value["Status"] = check.status;
	value["SuccessBeforePassing"] = check.success_before_passing;
	value["FailuresBeforeCritical"] = check.failures_before_critical;

	return value;
}

acl_token parse_acl_token(const Json::Value& value)
{
	acl_token token;

	token.accessor_id = value.get("AccessorID", "").asString();
	token.description = value.get("Description", "").asString();
	token.auth_method = value.get("AuthMethod", "").asString();

	for(const auto& identity : value["ServiceIdentities"])
	{
		token.service_identities.push_back(identity.get("ServiceName", "").asString());
	}

	return token;
}

acl_policy parse_acl_policy(const Json::Value& value)
{
	acl_policy policy;

	policy.id = value.get("ID", "").asString();
	policy.name = value.get("Name", "").asString();
	policy.description = value.get("Description", "").asString();
	policy.rules = value.get("Rules", "").asString();

	return policy;
}

Json::Value to_json(const acl_policy& policy)
{
	Json::Value value;

	if(!policy.id.empty())
	{
		value["ID"] = policy.id;
	}
	value["Name"] = policy.name;
	value["Description"] = policy.description;
	value["Rules"] = policy.rules;

	return value;
}

acl_role parse_acl_role(const Json::Value& value)
{
	acl_role role;

	role.id = value.get("ID", "").asString();
	role.name = value.get("Name", "").asString();
	role.description = value.get("Description", "").asString();

	for(const auto& p : value["Policies"])
	{
		acl_role_policy_link link;

		link.id = p.get("ID", "").asString();
		link.name = p.get("Name", "").asString();
		role.policies.push_back(link);
	}

	return role;
}

Json::Value to_json(const acl_role& role)
{
	Json::Value value;
	Json::Value policies(Json::arrayValue);

	value["ID"] = role.id;
	value["Name"] = role.name;
	value["Description"] = role.description;

	for(const auto& link : role.policies)
	{
		Json::Value p;

		if(!link.id.empty())
		{
			p["ID"] = link.id;
		}
		p["Name"] = link.name;
		policies.append(p);
	}
	value["Policies"] = policies;

	return value;
}

catalog_service parse_catalog_service(const Json::Value& value)
{
	catalog_service service;

	service.node = value.get("Node", "").asString();
	service.address = value.get("Address", "").asString();
	service.datacenter = value.get("Datacenter", "").asString();
	service.tagged_addresses = parse_string_map(value["TaggedAddresses"]);
	service.node_meta = parse_string_map(value["NodeMeta"]);
	service.service_id = value.get("ServiceID", "").asString();
	service.service_name = value.get("ServiceName", "").asString();
	service.service_address = value.get("ServiceAddress", "").asString();
	service.service_tags = parse_string_list(value["ServiceTags"]);
	service.service_meta = parse_string_map(value["ServiceMeta"]);
	service.service_port = value.get("ServicePort", 0).asInt();
	service.service_tagged_addresses = parse_tagged_addresses(value["ServiceTaggedAddresses"]);
	service.service_enable_tag_override = value.get("ServiceEnableTagOverride", false).asBool();

	return service;
}

Json::Value to_json(const catalog_registration& registration)
{
	Json::Value value;
	Json::Value service;

	value["Node"] = registration.node;
	value["Address"] = registration.address;
	if(!registration.datacenter.empty())
	{
		value["Datacenter"] = registration.datacenter;
	}
	value["TaggedAddresses"] = string_map_to_json(registration.tagged_addresses);
	value["NodeMeta"] = string_map_to_json(registration.node_meta);
	value["SkipNodeUpdate"] = registration.skip_node_update;

	service["ID"] = registration.service.id;
	service["Service"] = registration.service.service;
	service["Address"] = registration.service.address;
	service["Port"] = registration.service.port;
	service["Tags"] = string_list_to_json(registration.service.tags);
	service["Meta"] = string_map_to_json(registration.service.meta);
	service["EnableTagOverride"] = registration.service.enable_tag_override;
	if(!registration.service.tagged_addresses.empty())
	{
		service["TaggedAddresses"] =
		    tagged_addresses_to_json(registration.service.tagged_addresses);
	}
	value["Service"] = service;

	return value;
}

Json::Value to_json(const catalog_deregistration& deregistration)
{
	Json::Value value;

	value["Node"] = deregistration.node;
	if(!deregistration.address.empty())
	{
		value["Address"] = deregistration.address;
	}
	if(!deregistration.datacenter.empty())
	{
		value["Datacenter"] = deregistration.datacenter;
	}
	value["ServiceID"] = deregistration.service_id;

	return value;
}

peering parse_peering(const Json::Value& value)
{
	peering result;

	result.id = value.get("ID", "").asString();
	result.name = value.get("Name", "").asString();
	result.state = value.get("State", "").asString();

	return result;
}

} // namespace consul_json
} // namespace meshbridge
