/**
 * @file
 *
 * Implementation of plugin_conf.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "plugin_conf.h"
#include "cni_error.h"

namespace
{

std::string string_field(const Json::Value& root, const char* key, const std::string& fallback)
{
	const Json::Value& value = root[key];

	if(value.isNull())
	{
		return fallback;
	}

	if(!value.isString())
	{
		throw meshbridge::cni_error(std::string("failed to parse network configuration: ") +
		                                key + " is not a string",
		                            meshbridge::cni_error::ERR_DECODING_FAILURE);
	}

	return value.asString();
}

} // end namespace

namespace meshbridge
{

std::string plugin_conf::kubeconfig_path() const
{
	if(cni_net_dir.empty())
	{
		return kubeconfig;
	}

	std::string dir = cni_net_dir;
	while(dir.size() > 1 && dir.back() == '/')
	{
		dir.pop_back();
	}

	std::string file = kubeconfig;
	while(!file.empty() && file.front() == '/')
	{
		file.erase(0, 1);
	}

	return dir == "/" ? dir + file : dir + "/" + file;
}

plugin_conf plugin_conf::parse(const std::string& document)
{
	Json::Reader reader;
	Json::Value root;

	if(!reader.parse(document, root, false) || !root.isObject())
	{
		throw cni_error("failed to parse network configuration: " +
		                    reader.getFormattedErrorMessages(),
		                cni_error::ERR_DECODING_FAILURE);
	}

	plugin_conf conf;

	conf.name = string_field(root, "name", "");
	conf.type = string_field(root, "type", "");
	conf.cni_version = string_field(root, "cniVersion", "");
	conf.cni_bin_dir = string_field(root, "cni_bin_dir", "");
	conf.cni_net_dir = string_field(root, "cni_net_dir", "");
	conf.kubeconfig = string_field(root, "kubeconfig", "");
	conf.log_level = string_field(root, "log_level", conf.log_level);
	conf.log_file = string_field(root, "log_file", conf.log_file);

	if(root.isMember("multus"))
	{
		if(!root["multus"].isBool())
		{
			throw cni_error("failed to parse network configuration: multus is not a boolean",
			                cni_error::ERR_DECODING_FAILURE);
		}
		conf.multus = root["multus"].asBool();
	}

	const Json::Value& prev = root["prevResult"];
	if(!prev.isNull())
	{
		if(!prev.isObject())
		{
			throw cni_error("could not parse prevResult: not an object",
			                cni_error::ERR_DECODING_FAILURE);
		}
		conf.has_prev_result = true;
		conf.prev_result = prev;
	}

	return conf;
}

} // namespace meshbridge
