/**
 * @file
 *
 * Implementation of k8s_rest_client.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "k8s_rest_client.h"
#include "common_logger.h"
#include "k8s_json.h"
#include "meshbridge_exception.h"
#include "string_utils.h"

#include <Poco/FileStream.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/StreamCopier.h>

using Poco::Net::HTTPRequest;

COMMON_LOGGER();

namespace
{

const std::string MERGE_PATCH = "application/merge-patch+json";
const std::string CRD_PREFIX = "/apis/consul.hashicorp.com/v1alpha1";

} // end namespace

namespace meshbridge
{

k8s_rest_client::k8s_rest_client(const rest_client::ptr& client):
	m_client(client)
{
}

rest_client::options k8s_rest_client::in_cluster_options(const std::string& api_server,
                                                         const std::string& token_file,
                                                         const std::string& ca_file)
{
	rest_client::options opts;

	opts.base_uri = api_server;
	opts.ca_file = ca_file;

	if(!token_file.empty())
	{
		std::string token;

		try
		{
			Poco::FileInputStream in(token_file);
			Poco::StreamCopier::copyToString(in, token);
		}
		catch(const Poco::Exception& ex)
		{
			LOGGED_THROW(meshbridge_exception,
			             "unable to read service account token %s: %s",
			             token_file.c_str(),
			             ex.displayText().c_str());
		}

		opts.auth_header = "Authorization";
		opts.auth_value = "Bearer " + string_utils::trimmed(token);
	}

	return opts;
}

std::string k8s_rest_client::core_path(const std::string& ns,
                                       const std::string& plural,
                                       const std::string& name)
{
	std::string path = "/api/v1";

	if(!ns.empty())
	{
		path += "/namespaces/" + rest_client::encode(ns);
	}

	path += "/" + plural;

	if(!name.empty())
	{
		path += "/" + rest_client::encode(name);
	}

	return path;
}

std::string k8s_rest_client::crd_path(const std::string& ns,
                                      const std::string& plural,
                                      const std::string& name)
{
	std::string path = CRD_PREFIX;

	if(!ns.empty())
	{
		path += "/namespaces/" + rest_client::encode(ns);
	}

	path += "/" + plural;

	if(!name.empty())
	{
		path += "/" + rest_client::encode(name);
	}

	return path;
}

std::string k8s_rest_client::plural_for(const std::string& kind)
{
	if(kind == KIND_PEERING_ACCEPTOR)
	{
		return "peeringacceptors";
	}
	if(kind == KIND_PEERING_DIALER)
	{
		return "peeringdialers";
	}
	if(kind == KIND_TERMINATING_GATEWAY_SERVICE)
	{
		return "terminatinggatewayservices";
	}

	throw meshbridge_exception("unknown resource kind " + kind);
}

Json::Value k8s_rest_client::merge_patch(const std::string& path, const Json::Value& patch)
{
	return m_client->send_json(HTTPRequest::HTTP_PATCH, path, patch, MERGE_PATCH);
}

bool k8s_rest_client::get_endpoints(const object_key& key, endpoints& out)
{
	Json::Value value;

	if(!m_client->try_get_json(core_path(key.ns, "endpoints", key.name), value))
	{
		return false;
	}

	out = k8s_json::parse_endpoints(value);
	return true;
}

std::vector<endpoints> k8s_rest_client::list_endpoints()
{
	const Json::Value list = m_client->send_json(HTTPRequest::HTTP_GET,
	                                             core_path("", "endpoints"));

	return k8s_json::parse_list<endpoints>(list, &k8s_json::parse_endpoints);
}

bool k8s_rest_client::get_pod(const object_key& key, pod& out)
{
	Json::Value value;

	if(!m_client->try_get_json(core_path(key.ns, "pods", key.name), value))
	{
		return false;
	}

	out = k8s_json::parse_pod(value);
	return true;
}

std::vector<pod> k8s_rest_client::list_pods(const std::string& ns,
                                            const std::string& label_selector)
{
	std::string path = core_path(ns, "pods");

	if(!label_selector.empty())
	{
		path += "?labelSelector=" + rest_client::encode(label_selector);
	}

	const Json::Value list = m_client->send_json(HTTPRequest::HTTP_GET, path);
	return k8s_json::parse_list<pod>(list, &k8s_json::parse_pod);
}

void k8s_rest_client::patch_pod_annotations(const object_key& key,
                                            const std::string& resource_version,
                                            const std::map<std::string, std::string>& annotations)
{
	Json::Value patch;

	patch["metadata"]["resourceVersion"] = resource_version;
	for(const auto& entry : annotations)
	{
		patch["metadata"]["annotations"][entry.first] = entry.second;
	}

	merge_patch(core_path(key.ns, "pods", key.name), patch);
}

bool k8s_rest_client::get_namespace(const std::string& name, k8s_namespace& out)
{
	Json::Value value;

	if(!m_client->try_get_json(core_path("", "namespaces", name), value))
	{
		return false;
	}

	out = k8s_json::parse_namespace(value);
	return true;
}

bool k8s_rest_client::get_service(const object_key& key, service& out)
{
	Json::Value value;

	if(!m_client->try_get_json(core_path(key.ns, "services", key.name), value))
	{
		return false;
	}

	out = k8s_json::parse_service(value);
	return true;
}

bool k8s_rest_client::get_secret(const object_key& key, secret& out)
{
	Json::Value value;

	if(!m_client->try_get_json(core_path(key.ns, "secrets", key.name), value))
	{
		return false;
	}

	out = k8s_json::parse_secret(value);
	return true;
}

std::vector<secret> k8s_rest_client::list_secrets(const std::string& label_selector)
{
	std::string path = core_path("", "secrets");

	if(!label_selector.empty())
	{
		path += "?labelSelector=" + rest_client::encode(label_selector);
	}

	const Json::Value list = m_client->send_json(HTTPRequest::HTTP_GET, path);
	return k8s_json::parse_list<secret>(list, &k8s_json::parse_secret);
}

secret k8s_rest_client::create_secret(const secret& value)
{
	const Json::Value created = m_client->send_json(HTTPRequest::HTTP_POST,
	                                                core_path(value.metadata.ns, "secrets"),
	                                                k8s_json::to_json(value));

	return k8s_json::parse_secret(created);
}

secret k8s_rest_client::update_secret(const secret& value)
{
	const Json::Value updated =
	    m_client->send_json(HTTPRequest::HTTP_PUT,
	                        core_path(value.metadata.ns, "secrets", value.metadata.name),
	                        k8s_json::to_json(value));

	return k8s_json::parse_secret(updated);
}

void k8s_rest_client::delete_secret(const object_key& key)
{
	m_client->send(HTTPRequest::HTTP_DELETE, core_path(key.ns, "secrets", key.name));
}

bool k8s_rest_client::get_peering_resource(const std::string& kind,
                                           const object_key& key,
                                           peering_resource& out)
{
	Json::Value value;

	if(!m_client->try_get_json(crd_path(key.ns, plural_for(kind), key.name), value))
	{
		return false;
	}

	out = k8s_json::parse_peering_resource(value);
	out.kind = kind;
	return true;
}

std::vector<peering_resource> k8s_rest_client::list_peering_resources(const std::string& kind)
{
	const Json::Value list = m_client->send_json(HTTPRequest::HTTP_GET,
	                                             crd_path("", plural_for(kind)));
	std::vector<peering_resource> items =
	    k8s_json::parse_list<peering_resource>(list, &k8s_json::parse_peering_resource);

	for(auto& item : items)
	{
		item.kind = kind;
	}

	return items;
}

void k8s_rest_client::update_peering_status(peering_resource& value)
{
	Json::Value patch;

	patch["metadata"]["resourceVersion"] = value.metadata.resource_version;
	patch["status"] = k8s_json::status_to_json(value);

	const Json::Value updated =
	    merge_patch(crd_path(value.metadata.ns, plural_for(value.kind), value.metadata.name) +
	                    "/status",
	                patch);

	value.metadata.resource_version =
	    updated["metadata"].get("resourceVersion", value.metadata.resource_version).asString();
}

bool k8s_rest_client::get_terminating_gateway_service(const object_key& key,
                                                      terminating_gateway_service& out)
{
	Json::Value value;

	if(!m_client->try_get_json(crd_path(key.ns, "terminatinggatewayservices", key.name),
	                           value))
	{
		return false;
	}

	out = k8s_json::parse_terminating_gateway_service(value);
	return true;
}

std::vector<terminating_gateway_service> k8s_rest_client::list_terminating_gateway_services()
{
	const Json::Value list = m_client->send_json(HTTPRequest::HTTP_GET,
	                                             crd_path("", "terminatinggatewayservices"));

	return k8s_json::parse_list<terminating_gateway_service>(
	    list,
	    &k8s_json::parse_terminating_gateway_service);
}

void k8s_rest_client::update_finalizers(terminating_gateway_service& value)
{
	Json::Value patch;
	Json::Value finalizers(Json::arrayValue);

	for(const auto& finalizer : value.metadata.finalizers)
	{
		finalizers.append(finalizer);
	}

	patch["metadata"]["resourceVersion"] = value.metadata.resource_version;
	patch["metadata"]["finalizers"] = finalizers;

	const Json::Value updated =
	    merge_patch(crd_path(value.metadata.ns,
	                         "terminatinggatewayservices",
	                         value.metadata.name),
	                patch);

	value.metadata.resource_version =
	    updated["metadata"].get("resourceVersion", value.metadata.resource_version).asString();
}

void k8s_rest_client::update_terminating_gateway_status(terminating_gateway_service& value)
{
	Json::Value patch;

	patch["metadata"]["resourceVersion"] = value.metadata.resource_version;
	patch["status"] = k8s_json::status_to_json(value);

	const Json::Value updated =
	    merge_patch(crd_path(value.metadata.ns,
	                         "terminatinggatewayservices",
	                         value.metadata.name) +
	                    "/status",
	                patch);

	value.metadata.resource_version =
	    updated["metadata"].get("resourceVersion", value.metadata.resource_version).asString();
}

} // namespace meshbridge
