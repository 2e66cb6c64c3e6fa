/**
 * @file
 *
 * Conversion between the Consul HTTP API wire format and the meshbridge
 * object model.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "consul_types.h"

#include <json/json.h>

#include <map>
#include <string>
#include <vector>

namespace meshbridge
{
namespace consul_json
{

Json::Value to_json(const agent_service& service);
agent_service parse_agent_service(const Json::Value& value);

/**
 * Parse the id-keyed map returned by /v1/agent/services.
 */
std::map<std::string, agent_service> parse_agent_services(const Json::Value& value);

agent_check parse_agent_check(const Json::Value& value);
Json::Value to_json(const check_registration& check);

acl_token parse_acl_token(const Json::Value& value);
acl_policy parse_acl_policy(const Json::Value& value);
Json::Value to_json(const acl_policy& policy);
acl_role parse_acl_role(const Json::Value& value);
Json::Value to_json(const acl_role& role);

catalog_service parse_catalog_service(const Json::Value& value);
Json::Value to_json(const catalog_registration& registration);
Json::Value to_json(const catalog_deregistration& deregistration);

peering parse_peering(const Json::Value& value);

} // namespace consul_json
} // namespace meshbridge
