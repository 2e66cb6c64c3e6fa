/**
 * @file
 *
 * Implementation of consul_rest_client.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "consul_rest_client.h"
#include "annotations.h"
#include "common_logger.h"
#include "consul_json.h"
#include "meshbridge_exception.h"

#include <Poco/Net/HTTPRequest.h>

#include <vector>

using Poco::Net::HTTPRequest;

COMMON_LOGGER();

namespace meshbridge
{

consul_rest_client::consul_rest_client(const rest_client::ptr& client):
	m_client(client)
{
}

rest_client::options consul_rest_client::make_options(const std::string& address,
                                                      const std::string& token,
                                                      const std::string& ca_file,
                                                      const uint32_t timeout_ms)
{
	rest_client::options opts;

	opts.base_uri = address;
	opts.ca_file = ca_file;
	opts.timeout_ms = timeout_ms;

	if(!token.empty())
	{
		opts.auth_header = "X-Consul-Token";
		opts.auth_value = token;
	}

	return opts;
}

std::string consul_rest_client::query(const query_options& opts, const std::string& filter)
{
	std::vector<std::string> params;

	if(!opts.ns.empty())
	{
		params.push_back("ns=" + rest_client::encode(opts.ns));
	}

	if(!opts.partition.empty())
	{
		params.push_back("partition=" + rest_client::encode(opts.partition));
	}

	if(!filter.empty())
	{
		params.push_back("filter=" + rest_client::encode(filter));
	}

	std::string result;
	for(const auto& param : params)
	{
		result += (result.empty() ? "?" : "&") + param;
	}

	return result;
}

std::string consul_rest_client::k8s_service_filter(const std::string& k8s_service_name,
                                                   const std::string& k8s_namespace)
{
	return "Meta[\"" + META_KEY_KUBE_SERVICE_NAME + "\"] == \"" + k8s_service_name +
	       "\" and Meta[\"" + META_KEY_KUBE_NS + "\"] == \"" + k8s_namespace +
	       "\" and Meta[\"" + META_KEY_MANAGED_BY + "\"] == \"" +
	       annotations::MANAGED_BY_VALUE + "\"";
}

void consul_rest_client::register_service(const agent_service& service)
{
	query_options opts;

	opts.ns = service.ns;
	opts.partition = service.partition;

	m_client->send_json(HTTPRequest::HTTP_PUT,
	                    "/v1/agent/service/register" + query(opts),
	                    consul_json::to_json(service));
}

void consul_rest_client::deregister_service(const std::string& service_id,
                                            const query_options& opts)
{
	m_client->send(HTTPRequest::HTTP_PUT,
	               "/v1/agent/service/deregister/" + rest_client::encode(service_id) +
	                   query(opts));
}

std::map<std::string, agent_service> consul_rest_client::services_for_k8s_service(
    const std::string& k8s_service_name,
    const std::string& k8s_namespace,
    const query_options& opts)
{
	const Json::Value services =
	    m_client->send_json(HTTPRequest::HTTP_GET,
	                        "/v1/agent/services" +
	                            query(opts, k8s_service_filter(k8s_service_name, k8s_namespace)));

	return consul_json::parse_agent_services(services);
}

bool consul_rest_client::get_check(const std::string& check_id,
                                   agent_check& out,
                                   const query_options& opts)
{
	const Json::Value checks =
	    m_client->send_json(HTTPRequest::HTTP_GET,
	                        "/v1/agent/checks" + query(opts, "CheckID == `" + check_id + "`"));

	if(!checks.isObject() || !checks.isMember(check_id))
	{
		return false;
	}

	out = consul_json::parse_agent_check(checks[check_id]);
	return true;
}

void consul_rest_client::register_check(const check_registration& check)
{
	query_options opts;

	opts.ns = check.ns;

	m_client->send_json(HTTPRequest::HTTP_PUT,
	                    "/v1/agent/check/register" + query(opts),
	                    consul_json::to_json(check));
}

void consul_rest_client::update_ttl(const std::string& check_id,
                                    const std::string& output,
                                    const std::string& status,
                                    const query_options& opts)
{
	Json::Value body;

	body["Status"] = status;
	body["Output"] = output;

	m_client->send_json(HTTPRequest::HTTP_PUT,
	                    "/v1/agent/check/update/" + rest_client::encode(check_id) + query(opts),
	                    body);
}

std::vector<acl_token> consul_rest_client::list_tokens(const query_options& opts)
{
	const Json::Value tokens = m_client->send_json(HTTPRequest::HTTP_GET,
	                                               "/v1/acl/tokens" + query(opts));
	std::vector<acl_token> result;

	for(const auto& token : tokens)
	{
		result.push_back(consul_json::parse_acl_token(token));
	}

	return result;
}

void consul_rest_client::delete_token(const std::string& accessor_id,
                                      const query_options& opts)
{
	m_client->send(HTTPRequest::HTTP_DELETE,
	               "/v1/acl/token/" + rest_client::encode(accessor_id) + query(opts));
}

std::vector<acl_policy> consul_rest_client::list_policies()
{
	const Json::Value policies = m_client->send_json(HTTPRequest::HTTP_GET, "/v1/acl/policies");
	std::vector<acl_policy> result;

	for(const auto& policy : policies)
	{
		result.push_back(consul_json::parse_acl_policy(policy));
	}

	return result;
}

acl_policy consul_rest_client::create_policy(const acl_policy& policy)
{
	const Json::Value created = m_client->send_json(HTTPRequest::HTTP_PUT,
	                                                "/v1/acl/policy",
	                                                consul_json::to_json(policy));

	return consul_json::parse_acl_policy(created);
}

void consul_rest_client::delete_policy(const std::string& id)
{
	m_client->send(HTTPRequest::HTTP_DELETE, "/v1/acl/policy/" + rest_client::encode(id));
}

std::vector<acl_role> consul_rest_client::list_roles()
{
	const Json::Value roles = m_client->send_json(HTTPRequest::HTTP_GET, "/v1/acl/roles");
	std::vector<acl_role> result;

	for(const auto& role : roles)
	{
		result.push_back(consul_json::parse_acl_role(role));
	}

	return result;
}

void consul_rest_client::update_role(const acl_role& role)
{
	m_client->send_json(HTTPRequest::HTTP_PUT,
	                    "/v1/acl/role/" + rest_client::encode(role.id),
	                    consul_json::to_json(role));
}

std::vector<catalog_service> consul_rest_client::catalog_service_instances(const std::string& name)
{
	const Json::Value services =
	    m_client->send_json(HTTPRequest::HTTP_GET,
	                        "/v1/catalog/service/" + rest_client::encode(name));
	std::vector<catalog_service> result;

	for(const auto& svc : services)
	{
		result.push_back(consul_json::parse_catalog_service(svc));
	}

	return result;
}

void consul_rest_client::catalog_register(const catalog_registration& registration)
{
	m_client->send_json(HTTPRequest::HTTP_PUT,
	                    "/v1/catalog/register",
	                    consul_json::to_json(registration));
}

void consul_rest_client::catalog_deregister(const catalog_deregistration& deregistration)
{
	m_client->send_json(HTTPRequest::HTTP_PUT,
	                    "/v1/catalog/deregister",
	                    consul_json::to_json(deregistration));
}

bool consul_rest_client::read_peering(const std::string& name, peering& out)
{
	Json::Value value;

	if(!m_client->try_get_json("/v1/peering/" + rest_client::encode(name), value) ||
	   value.isNull())
	{
		return false;
	}

	out = consul_json::parse_peering(value);
	return true;
}

std::string consul_rest_client::generate_peering_token(const std::string& peer_name)
{
	Json::Value body;

	body["PeerName"] = peer_name;

	const Json::Value response = m_client->send_json(HTTPRequest::HTTP_POST,
	                                                 "/v1/peering/token",
	                                                 body);
	const std::string token = response.get("PeeringToken", "").asString();

	if(token.empty())
	{
		THROW_API_ERROR(api_exception::NO_RESPONSE,
		                "no peering token returned for %s",
		                peer_name.c_str());
	}

	return token;
}

void consul_rest_client::establish_peering(const std::string& peer_name,
                                           const std::string& token)
{
	Json::Value body;

	body["PeerName"] = peer_name;
	body["PeeringToken"] = token;

	m_client->send_json(HTTPRequest::HTTP_POST, "/v1/peering/establish", body);
}

void consul_rest_client::delete_peering(const std::string& name)
{
	m_client->send(HTTPRequest::HTTP_DELETE, "/v1/peering/" + rest_client::encode(name));
}

bool consul_rest_client::read_proxy_defaults_mesh_gateway_mode(std::string& mode)
{
	Json::Value value;

	if(!m_client->try_get_json("/v1/config/proxy-defaults/global", value))
	{
		return false;
	}

	mode = value["MeshGateway"].get("Mode", "").asString();
	return true;
}

} // namespace meshbridge
