/**
 * @file
 *
 * Implementation of iptables_config.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "iptables_config.h"
#include "meshbridge_exception.h"

namespace
{

Json::Value string_list(const std::vector<std::string>& values)
{
	Json::Value list(Json::arrayValue);

	for(const auto& value : values)
	{
		list.append(value);
	}

	return list;
}

std::vector<std::string> read_string_list(const Json::Value& root, const std::string& key)
{
	std::vector<std::string> values;
	const Json::Value& list = root[key];

	if(list.isNull())
	{
		return values;
	}

	if(!list.isArray())
	{
		throw meshbridge::meshbridge_exception(key + " is not a list");
	}

	for(const auto& item : list)
	{
		if(!item.isString())
		{
			throw meshbridge::meshbridge_exception(key + " holds a non-string entry");
		}
		values.push_back(item.asString());
	}

	return values;
}

std::string read_string(const Json::Value& root, const std::string& key)
{
	const Json::Value& value = root[key];

	if(value.isNull())
	{
		return "";
	}
	if(!value.isString())
	{
		throw meshbridge::meshbridge_exception(key + " is not a string");
	}

	return value.asString();
}

int read_int(const Json::Value& root, const std::string& key)
{
	const Json::Value& value = root[key];

	if(value.isNull())
	{
		return 0;
	}
	if(!value.isInt())
	{
		throw meshbridge::meshbridge_exception(key + " is not an integer");
	}

	return value.asInt();
}

} // end namespace

namespace meshbridge
{

bool iptables_config::operator==(const iptables_config& rhs) const
{
	return proxy_user_id == rhs.proxy_user_id &&
	       proxy_inbound_port == rhs.proxy_inbound_port &&
	       proxy_outbound_port == rhs.proxy_outbound_port &&
	       exclude_inbound_ports == rhs.exclude_inbound_ports &&
	       exclude_outbound_ports == rhs.exclude_outbound_ports &&
	       exclude_outbound_cidrs == rhs.exclude_outbound_cidrs &&
	       exclude_uids == rhs.exclude_uids &&
	       consul_dns_ip == rhs.consul_dns_ip &&
	       netns == rhs.netns;
}

bool iptables_config::operator!=(const iptables_config& rhs) const
{
	return !(*this == rhs);
}

Json::Value iptables_config::to_json() const
{
	Json::Value root(Json::objectValue);

	root["proxy_uid"] = proxy_user_id;
	root["proxy_inbound_port"] = proxy_inbound_port;
	root["proxy_outbound_port"] = proxy_outbound_port;
	root["exclude_inbound_ports"] = string_list(exclude_inbound_ports);
	root["exclude_outbound_ports"] = string_list(exclude_outbound_ports);
	root["exclude_outbound_cidrs"] = string_list(exclude_outbound_cidrs);
	root["exclude_uids"] = string_list(exclude_uids);
	if(!consul_dns_ip.empty())
	{
		root["consul_dns_ip"] = consul_dns_ip;
	}
	root["netns"] = netns;

	return root;
}

std::string iptables_config::serialize() const
{
	// Object members are emitted in key order, so equal configs always
	// produce identical documents.
	Json::FastWriter writer;

	writer.omitEndingLineFeed();
	return writer.write(to_json());
}

iptables_config iptables_config::deserialize(const std::string& document)
{
	Json::Reader reader;
	Json::Value root;

	if(!reader.parse(document, root))
	{
		throw meshbridge_exception("unable to parse iptables config: " +
		                           reader.getFormattedErrorMessages());
	}

	if(!root.isObject())
	{
		throw meshbridge_exception("iptables config is not a JSON object");
	}

	iptables_config config;

	config.proxy_user_id = read_string(root, "proxy_uid");
	config.proxy_inbound_port = read_int(root, "proxy_inbound_port");
	config.proxy_outbound_port = read_int(root, "proxy_outbound_port");
	config.exclude_inbound_ports = read_string_list(root, "exclude_inbound_ports");
	config.exclude_outbound_ports = read_string_list(root, "exclude_outbound_ports");
	config.exclude_outbound_cidrs = read_string_list(root, "exclude_outbound_cidrs");
	config.exclude_uids = read_string_list(root, "exclude_uids");
	config.consul_dns_ip = read_string(root, "consul_dns_ip");
	config.netns = read_string(root, "netns");

	return config;
}

} // namespace meshbridge
