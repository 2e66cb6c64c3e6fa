/**
 * @file
 *
 * Consul API objects used by the reconcilers.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <json/json.h>

#include <map>
#include <string>
#include <vector>

namespace meshbridge
{

const std::string HEALTH_PASSING = "passing";
const std::string HEALTH_CRITICAL = "critical";

const std::string SERVICE_KIND_CONNECT_PROXY = "connect-proxy";
const std::string PROXY_MODE_TRANSPARENT = "transparent";
const std::string UPSTREAM_TYPE_SERVICE = "service";
const std::string UPSTREAM_TYPE_PREPARED_QUERY = "prepared_query";

// Service metadata keys written on every registration.
const std::string META_KEY_POD_NAME = "pod-name";
const std::string META_KEY_KUBE_SERVICE_NAME = "k8s-service-name";
const std::string META_KEY_KUBE_NS = "k8s-namespace";
const std::string META_KEY_MANAGED_BY = "managed-by";

/**
 * Namespace and partition a request is scoped to. Empty means the
 * server default.
 */
struct query_options
{
	std::string ns;
	std::string partition;
};

struct tagged_address
{
	std::string address;
	int port = 0;

	bool operator==(const tagged_address& rhs) const;
	bool operator!=(const tagged_address& rhs) const;
};

using tagged_address_map = std::map<std::string, tagged_address>;

struct upstream
{
	std::string destination_type;
	std::string destination_name;
	std::string destination_namespace;
	std::string destination_partition;
	std::string destination_peer;
	std::string datacenter;
	int local_bind_port = 0;

	bool operator==(const upstream& rhs) const;
};

struct expose_path
{
	int listener_port = 0;
	int local_path_port = 0;
	std::string path;

	bool operator==(const expose_path& rhs) const;
};

/**
 * A check embedded in a service registration.
 */
struct service_check
{
	std::string name;
	std::string tcp;
	std::string interval;
	std::string deregister_critical_service_after;
	std::string alias_service;
};

struct proxy_config
{
	std::string destination_service_name;
	std::string destination_service_id;
	std::string local_service_address;
	int local_service_port = 0;
	std::string mode;
	int outbound_listener_port = 0;

	/** Opaque proxy configuration, e.g. envoy_prometheus_bind_addr. */
	Json::Value config = Json::Value(Json::objectValue);

	std::vector<upstream> upstreams;
	std::vector<expose_path> expose_paths;
};

/**
 * A service instance as registered with, and listed by, a Consul agent.
 */
struct agent_service
{
	std::string kind;
	std::string id;
	std::string service;
	std::string address;
	int port = 0;
	std::string ns;
	std::string partition;
	std::map<std::string, std::string> meta;
	std::vector<std::string> tags;
	tagged_address_map tagged_addresses;
	bool enable_tag_override = false;
	bool has_proxy = false;
	proxy_config proxy;
	std::vector<service_check> checks;
};

/**
 * A check as listed by a Consul agent.
 */
struct agent_check
{
	std::string check_id;
	std::string name;
	std::string status;
	std::string output;
	std::string service_id;
	std::string service_name;
	std::string type;
	int exposed_port = 0;
};

/**
 * A standalone TTL check registration.
 */
struct check_registration
{
	std::string id;
	std::string name;
	std::string service_id;
	std::string ns;
	std::string ttl;
	std::string status;
	int success_before_passing = 0;
	int failures_before_critical = 0;
};

struct acl_token
{
	std::string accessor_id;
	std::string description;
	std::string auth_method;
	std::vector<std::string> service_identities;
};

struct acl_policy
{
	std::string id;
	std::string name;
	std::string description;
	std::string rules;
};

struct acl_role_policy_link
{
	std::string id;
	std::string name;
};

struct acl_role
{
	std::string id;
	std::string name;
	std::string description;
	std::vector<acl_role_policy_link> policies;
};

/**
 * A service instance as listed by the catalog.
 */
struct catalog_service
{
	std::string node;
	std::string address;
	std::string datacenter;
	std::map<std::string, std::string> tagged_addresses;
	std::map<std::string, std::string> node_meta;
	std::string service_id;
	std::string service_name;
	std::string service_address;
	std::vector<std::string> service_tags;
	std::map<std::string, std::string> service_meta;
	int service_port = 0;
	tagged_address_map service_tagged_addresses;
	bool service_enable_tag_override = false;
};

struct catalog_registration
{
	std::string node;
	std::string address;
	std::string datacenter;
	std::map<std::string, std::string> tagged_addresses;
	std::map<std::string, std::string> node_meta;
	agent_service service;
	bool skip_node_update = false;
};

struct catalog_deregistration
{
	std::string node;
	std::string address;
	std::string datacenter;
	std::string service_id;
};

struct peering
{
	std::string id;
	std::string name;
	std::string state;
};

} // namespace meshbridge
