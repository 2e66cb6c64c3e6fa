/**
 * @file
 *
 * Implementation of the pod setting accessors.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "pod_settings.h"
#include "annotations.h"
#include "k8s_json.h"
#include "meshbridge_exception.h"
#include "string_utils.h"

#include <limits>

namespace
{

using namespace meshbridge;

bool parse_bool_or_throw(const std::string& key, const std::string& raw)
{
	bool value = false;

	if(!string_utils::parse_bool(raw, value))
	{
		throw meshbridge_exception(key + " value \"" + raw + "\" is not a boolean");
	}

	return value;
}

/**
 * Pod annotation, then namespace label, then the default.
 */
bool resolve_three_level(const std::string& key,
                         const k8s_namespace& ns,
                         const pod& p,
                         const bool global_default)
{
	std::string raw;

	if(p.metadata.get_annotation(key, raw))
	{
		return parse_bool_or_throw(key, raw);
	}

	if(ns.metadata.get_label(key, raw))
	{
		return parse_bool_or_throw(key, raw);
	}

	return global_default;
}

} // end namespace

namespace meshbridge
{
namespace pod_settings
{

bool transparent_proxy_enabled(const k8s_namespace& ns,
                               const pod& p,
                               const bool global_default)
{
	return resolve_three_level(annotations::KEY_TRANSPARENT_PROXY, ns, p, global_default);
}

bool consul_dns_enabled(const k8s_namespace& ns, const pod& p, const bool global_default)
{
	return resolve_three_level(annotations::KEY_CONSUL_DNS, ns, p, global_default);
}

bool overwrite_probes(const pod& p, const bool global_default)
{
	std::string raw;

	if(p.metadata.get_annotation(annotations::TPROXY_OVERWRITE_PROBES, raw))
	{
		return parse_bool_or_throw(annotations::TPROXY_OVERWRITE_PROBES, raw);
	}

	return global_default;
}

bool use_proxy_health_check(const pod& p)
{
	std::string raw;

	if(p.metadata.get_annotation(annotations::USE_PROXY_HEALTH_CHECK, raw))
	{
		return parse_bool_or_throw(annotations::USE_PROXY_HEALTH_CHECK, raw);
	}

	return false;
}

bool has_been_injected(const pod& p)
{
	return p.metadata.annotation(annotations::KEY_INJECT_STATUS) == annotations::INJECTED;
}

bool managed_by_endpoints_controller(const pod& p)
{
	std::string raw;

	return p.metadata.get_label(annotations::KEY_MANAGED_BY, raw) &&
	       raw == annotations::MANAGED_BY_VALUE;
}

bool is_labeled_ignore(const std::map<std::string, std::string>& labels)
{
	const auto it = labels.find(annotations::LABEL_SERVICE_IGNORE);
	bool ignore = false;

	return it != labels.end() && string_utils::parse_bool(it->second, ignore) && ignore;
}

std::vector<std::string> split_annotation(const pod& p, const std::string& annotation)
{
	std::vector<std::string> items;
	std::string raw;

	if(!p.metadata.get_annotation(annotation, raw))
	{
		return items;
	}

	for(const auto& item : string_utils::split(raw, ','))
	{
		const std::string trimmed = string_utils::trimmed(item);

		if(!trimmed.empty())
		{
			items.push_back(trimmed);
		}
	}

	return items;
}

int port_value(const pod& p, const std::string& value)
{
	for(const auto& c : p.containers)
	{
		for(const auto& port : c.ports)
		{
			if(port.name == value)
			{
				return port.container_port;
			}
		}
	}

	int64_t parsed = 0;
	if(!string_utils::parse_int(value, parsed) ||
	   parsed > std::numeric_limits<int32_t>::max() ||
	   parsed < std::numeric_limits<int32_t>::min())
	{
		throw meshbridge_exception("\"" + value + "\" is neither a named port nor an integer");
	}

	return static_cast<int>(parsed);
}

int port_value(const pod& p, const int_or_string& value)
{
	if(value.is_int)
	{
		return value.int_value;
	}

	return port_value(p, value.str_value);
}

pod original_pod(const pod& p)
{
	std::string raw;

	if(!p.metadata.get_annotation(annotations::ORIGINAL_POD, raw))
	{
		throw meshbridge_exception("pod " + p.metadata.key().to_string() + " has no " +
		                           annotations::ORIGINAL_POD + " annotation");
	}

	return k8s_json::parse_pod(k8s_json::parse(raw));
}

} // namespace pod_settings
} // namespace meshbridge
