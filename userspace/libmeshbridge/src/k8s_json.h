/**
 * @file
 *
 * Conversion between the Kubernetes wire format and the meshbridge
 * object model.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "crd_types.h"
#include "k8s_types.h"

#include <json/json.h>

#include <string>
#include <vector>

namespace meshbridge
{
namespace k8s_json
{

/**
 * Parse a JSON document.
 *
 * @throws meshbridge_exception if the text is not valid JSON.
 */
Json::Value parse(const std::string& text);

/**
 * Render a value on a single line.
 */
std::string write(const Json::Value& value);

object_meta parse_object_meta(const Json::Value& value);
Json::Value to_json(const object_meta& meta);

pod parse_pod(const Json::Value& value);
endpoints parse_endpoints(const Json::Value& value);
service parse_service(const Json::Value& value);
k8s_namespace parse_namespace(const Json::Value& value);

secret parse_secret(const Json::Value& value);
Json::Value to_json(const secret& value);

peering_resource parse_peering_resource(const Json::Value& value);
Json::Value status_to_json(const peering_resource& value);

terminating_gateway_service parse_terminating_gateway_service(const Json::Value& value);
Json::Value status_to_json(const terminating_gateway_service& value);

/**
 * Parse every element of the "items" member of a list response.
 */
template<typename T>
std::vector<T> parse_list(const Json::Value& value,
                          T (*parse_item)(const Json::Value&))
{
	std::vector<T> items;

	for(const auto& item : value["items"])
	{
		items.push_back(parse_item(item));
	}

	return items;
}

} // namespace k8s_json
} // namespace meshbridge
