/**
 * @file
 *
 * Implementation of token_metadata.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "token_metadata.h"
#include "common_logger.h"

#include <Poco/RegularExpression.h>
#include <json/json.h>

COMMON_LOGGER();

namespace
{

const Poco::RegularExpression s_meta_re(".*(\\{.+\\})", 0);

} // end namespace

namespace meshbridge
{
namespace token_metadata
{

bool parse(const std::string& description, std::map<std::string, std::string>& meta)
{
	Poco::RegularExpression::MatchVec matches;

	if(s_meta_re.match(description, 0, matches, 0) != 2)
	{
		return false;
	}

	const std::string fragment = description.substr(matches[1].offset, matches[1].length);
	Json::Reader reader;
	Json::Value root;

	if(!reader.parse(fragment, root) || !root.isObject())
	{
		LOG_DEBUG("Token metadata %s is not a JSON object", fragment.c_str());
		return false;
	}

	std::map<std::string, std::string> result;
	for(const auto& name : root.getMemberNames())
	{
		if(!root[name].isString())
		{
			LOG_DEBUG("Token metadata entry %s is not a string", name.c_str());
			return false;
		}
		result[name] = root[name].asString();
	}

	meta.swap(result);
	return true;
}

bool owned_by_pod(const std::map<std::string, std::string>& meta,
                  const std::string& k8s_namespace,
                  const std::string& pod_name)
{
	const auto it = meta.find(POD_NAME_KEY);

	if(it == meta.end() || pod_name.empty())
	{
		return false;
	}

	return it->second == k8s_namespace + "/" + pod_name;
}

} // namespace token_metadata
} // namespace meshbridge
