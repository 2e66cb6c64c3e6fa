/**
 * @file
 *
 * Implementation of cni_args.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "cni_args.h"
#include "annotations.h"
#include "cni_error.h"
#include "string_utils.h"

#include <vector>

namespace meshbridge
{

cni_args cni_args::parse(const std::string& value)
{
	cni_args result;
	std::vector<std::string> unknown;

	if(value.empty())
	{
		return result;
	}

	for(const auto& pair : string_utils::split(value, ';'))
	{
		const std::vector<std::string> kv = string_utils::split(pair, '=', 2);

		if(kv.size() != 2 || kv[0].empty())
		{
			throw cni_error("invalid CNI_ARGS pair \"" + pair + "\"",
			                cni_error::ERR_INVALID_ENVIRONMENT);
		}

		const std::string& key = kv[0];
		const std::string& val = kv[1];

		if(key == "IgnoreUnknown")
		{
			if(!string_utils::parse_bool(val, result.ignore_unknown))
			{
				throw cni_error("invalid IgnoreUnknown value \"" + val + "\"",
				                cni_error::ERR_INVALID_ENVIRONMENT);
			}
		}
		else if(key == "IP")
		{
			result.ip = val;
		}
		else if(key == "K8S_POD_NAME")
		{
			result.pod_name = val;
		}
		else if(key == "K8S_POD_NAMESPACE")
		{
			result.pod_namespace = val;
		}
		else if(key == "K8S_POD_INFRA_CONTAINER_ID")
		{
			result.pod_infra_container_id = val;
		}
		else if(key == "K8S_POD_UID")
		{
			result.pod_uid = val;
		}
		else if(key == annotations::CNI_ARG_IPTABLES_CONFIG)
		{
			result.iptables_config = val;
		}
		else
		{
			unknown.push_back(key);
		}
	}

	// IgnoreUnknown may appear anywhere in the list.
	if(!unknown.empty() && !result.ignore_unknown)
	{
		throw cni_error("unknown CNI_ARGS key \"" + unknown.front() + "\"",
		                cni_error::ERR_INVALID_ENVIRONMENT);
	}

	return result;
}

} // namespace meshbridge
