/**
 * @file
 *
 * Implementation of cni_plugin.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "cni_plugin.h"
#include "annotations.h"
#include "cni_args.h"
#include "cni_error.h"
#include "common_logger.h"
#include "k8s_json.h"
#include "string_utils.h"

#include <Poco/Environment.h>

#include <algorithm>
#include <map>
#include <utility>
#include <vector>

COMMON_LOGGER();

namespace
{

const std::string CMD_ADD = "ADD";
const std::string CMD_DEL = "DEL";
const std::string CMD_CHECK = "CHECK";
const std::string CMD_VERSION = "VERSION";

const std::string LATEST_CNI_VERSION = "1.0.0";

void require_env(const std::vector<std::pair<std::string, std::string>>& values)
{
	std::vector<std::string> missing;

	for(const auto& value : values)
	{
		if(value.second.empty())
		{
			missing.push_back(value.first);
		}
	}

	if(!missing.empty())
	{
		throw meshbridge::cni_error("required env variables [" +
		                                string_utils::join(missing, ",") + "] missing",
		                            meshbridge::cni_error::ERR_INVALID_ENVIRONMENT);
	}
}

void check_version(const meshbridge::plugin_conf& conf)
{
	using meshbridge::SUPPORTED_CNI_VERSIONS;

	if(conf.cni_version.empty() ||
	   std::find(SUPPORTED_CNI_VERSIONS.begin(),
	             SUPPORTED_CNI_VERSIONS.end(),
	             conf.cni_version) != SUPPORTED_CNI_VERSIONS.end())
	{
		return;
	}

	throw meshbridge::cni_error("incompatible CNI versions; config is \"" + conf.cni_version +
	                                "\", plugin supports [" +
	                                string_utils::join(SUPPORTED_CNI_VERSIONS, " ") + "]",
	                            meshbridge::cni_error::ERR_INCOMPATIBLE_VERSION);
}

bool annotation_set(const meshbridge::pod& p, const std::string& key)
{
	const auto itr = p.metadata.annotations.find(key);

	return itr != p.metadata.annotations.end() && !itr->second.empty();
}

} // end namespace

namespace meshbridge
{

cni_invocation cni_invocation::from_environment(const std::string& stdin_data)
{
	cni_invocation invocation;

	invocation.command = Poco::Environment::get("CNI_COMMAND", "");
	invocation.container_id = Poco::Environment::get("CNI_CONTAINERID", "");
	invocation.netns = Poco::Environment::get("CNI_NETNS", "");
	invocation.ifname = Poco::Environment::get("CNI_IFNAME", "");
	invocation.args = Poco::Environment::get("CNI_ARGS", "");
	invocation.path = Poco::Environment::get("CNI_PATH", "");
	invocation.stdin_data = stdin_data;

	return invocation;
}

cni_plugin::cni_plugin(const k8s_client_factory& factory,
                       const iptables_effector::ptr& effector,
                       const bool dual_stack):
	m_factory(factory),
	m_effector(effector),
	m_dual_stack(dual_stack)
{
}

std::string cni_plugin::run(const cni_invocation& invocation)
{
	if(invocation.command == CMD_VERSION)
	{
		std::string version;

		if(!string_utils::trimmed(invocation.stdin_data).empty())
		{
			version = plugin_conf::parse(invocation.stdin_data).cni_version;
		}

		return version_info(version);
	}

	if(invocation.command == CMD_ADD)
	{
		require_env({{"CNI_CONTAINERID", invocation.container_id},
		             {"CNI_NETNS", invocation.netns},
		             {"CNI_IFNAME", invocation.ifname},
		             {"CNI_PATH", invocation.path}});
		return cmd_add(invocation);
	}

	if(invocation.command == CMD_CHECK)
	{
		require_env({{"CNI_CONTAINERID", invocation.container_id},
		             {"CNI_NETNS", invocation.netns},
		             {"CNI_IFNAME", invocation.ifname},
		             {"CNI_PATH", invocation.path}});
		return cmd_check(invocation);
	}

	if(invocation.command == CMD_DEL)
	{
		require_env({{"CNI_CONTAINERID", invocation.container_id},
		             {"CNI_IFNAME", invocation.ifname},
		             {"CNI_PATH", invocation.path}});
		return cmd_del(invocation);
	}

	if(invocation.command.empty())
	{
		require_env({{"CNI_COMMAND", invocation.command}});
	}

	throw cni_error("unknown CNI_COMMAND: " + invocation.command,
	                cni_error::ERR_INVALID_ENVIRONMENT);
}

std::string cni_plugin::cmd_add(const cni_invocation& invocation)
{
	const plugin_conf conf = plugin_conf::parse(invocation.stdin_data);
	check_version(conf);

	const cni_args args = cni_args::parse(invocation.args);

	if((args.pod_namespace.empty() || args.pod_name.empty()) && args.iptables_config.empty())
	{
		throw cni_error("not running in a pod, namespace and pod should have values");
	}

	const object_key key(args.pod_namespace, args.pod_name);
	Json::Value result;

	if(!conf.has_prev_result)
	{
		// Not chained, e.g. under a meta plugin.
		result["cniVersion"] = PLACEHOLDER_RESULT_VERSION;
	}
	else
	{
		const Json::Value& ips = conf.prev_result["ips"];

		if(!ips.isArray() || ips.empty())
		{
			throw cni_error("got no container IPs");
		}
		result = conf.prev_result;
	}

	iptables_config config;

	if(!args.iptables_config.empty())
	{
		try
		{
			config = iptables_config::deserialize(args.iptables_config);
		}
		catch(const meshbridge_exception& ex)
		{
			throw cni_error(std::string("could not unmarshal CNI args: ") + ex.what(),
			                cni_error::ERR_DECODING_FAILURE);
		}
	}
	else
	{
		if(!m_client)
		{
			try
			{
				m_client = m_factory(conf);
			}
			catch(const meshbridge_exception& ex)
			{
				throw cni_error(std::string("could not get rest config from kubernetes api: ") +
				                ex.what());
			}
		}

		pod p;
		try
		{
			if(!m_client->get_pod(key, p))
			{
				throw api_exception("pods \"" + key.name + "\" not found", 404);
			}
		}
		catch(const meshbridge_exception& ex)
		{
			throw cni_error(std::string("error retrieving pod: ") + ex.what());
		}

		if(skip_traffic_redirection(p))
		{
			LOG_DEBUG("%s: skipping traffic redirection because the pod is either not "
			          "injected or transparent proxy is disabled",
			          key.to_string().c_str());
			return print_result(conf, result);
		}

		update_status_annotation(key, annotations::TPROXY_STATUS_WAITING);
		config = parse_annotation(p, annotations::REDIRECT_TRAFFIC_CONFIG);
	}

	config.netns = invocation.netns;

	try
	{
		m_effector->apply(config, m_dual_stack);
	}
	catch(const meshbridge_exception& ex)
	{
		throw cni_error(std::string("could not apply iptables setup: ") + ex.what());
	}

	if(args.iptables_config.empty())
	{
		update_status_annotation(key, annotations::TPROXY_STATUS_COMPLETE);
	}

	LOG_DEBUG("traffic redirect rules applied to %s", invocation.container_id.c_str());

	return print_result(conf, result);
}

std::string cni_plugin::cmd_del(const cni_invocation& invocation)
{
	check_version(plugin_conf::parse(invocation.stdin_data));
	return "";
}

std::string cni_plugin::cmd_check(const cni_invocation& invocation)
{
	check_version(plugin_conf::parse(invocation.stdin_data));
	return "";
}

std::string cni_plugin::version_info(const std::string& cni_version)
{
	Json::Value info;
	Json::Value versions(Json::arrayValue);

	for(const auto& version : SUPPORTED_CNI_VERSIONS)
	{
		versions.append(version);
	}

	info["cniVersion"] = cni_version.empty() ? LATEST_CNI_VERSION : cni_version;
	info["supportedVersions"] = versions;

	return k8s_json::write(info);
}

bool cni_plugin::skip_traffic_redirection(const pod& p)
{
	if(!annotation_set(p, annotations::KEY_INJECT_STATUS) &&
	   !annotation_set(p, annotations::KEY_MESH_INJECT_STATUS))
	{
		return true;
	}

	return !annotation_set(p, annotations::KEY_TRANSPARENT_PROXY_STATUS);
}

iptables_config cni_plugin::parse_annotation(const pod& p, const std::string& annotation)
{
	const auto itr = p.metadata.annotations.find(annotation);

	if(itr == p.metadata.annotations.end())
	{
		throw cni_error("could not find " + annotation + " annotation for " +
		                p.metadata.name + " pod");
	}

	try
	{
		return iptables_config::deserialize(itr->second);
	}
	catch(const meshbridge_exception& ex)
	{
		LOG_DEBUG("%s: %s", p.metadata.name.c_str(), ex.what());
		throw cni_error("could not unmarshal " + annotation + " annotation for " +
		                p.metadata.name + " pod");
	}
}

void cni_plugin::update_status_annotation(const object_key& key, const std::string& status)
{
	try
	{
		pod current;

		if(!m_client->get_pod(key, current))
		{
			LOG_INFO("unable to update %s pod annotation to %s: pod %s is gone",
			         annotations::KEY_TRANSPARENT_PROXY_STATUS.c_str(),
			         status.c_str(),
			         key.to_string().c_str());
			return;
		}

		m_client->patch_pod_annotations(key,
		                                current.metadata.resource_version,
		                                {{annotations::KEY_TRANSPARENT_PROXY_STATUS, status}});
	}
	catch(const std::exception& ex)
	{
		// The control plane converges the annotation on its own.
		LOG_INFO("unable to update %s pod annotation to %s: %s",
		         annotations::KEY_TRANSPARENT_PROXY_STATUS.c_str(),
		         status.c_str(),
		         ex.what());
	}
}

std::string cni_plugin::print_result(const plugin_conf& conf, const Json::Value& result) const
{
	Json::Value printed = result;

	if(!conf.cni_version.empty())
	{
		printed["cniVersion"] = conf.cni_version;
	}

	return k8s_json::write(printed);
}

} // namespace meshbridge
