/**
 * @file
 *
 * The subset of the Kubernetes core object model that meshbridge reads
 * and writes.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <map>
#include <string>
#include <vector>

namespace meshbridge
{

/**
 * Identifies a namespaced object. The string form is "<namespace>/<name>".
 */
struct object_key
{
	object_key() = default;
	object_key(const std::string& ns, const std::string& name);

	std::string ns;
	std::string name;

	std::string to_string() const;

	/**
	 * Parse "<namespace>/<name>". A string without a slash is taken as
	 * a name in the empty namespace.
	 */
	static object_key from_string(const std::string& key);

	bool operator==(const object_key& rhs) const;
	bool operator<(const object_key& rhs) const;
};

struct owner_reference
{
	std::string api_version;
	std::string kind;
	std::string name;
	std::string uid;
	bool controller = false;
	bool block_owner_deletion = false;
};

struct object_meta
{
	std::string name;
	std::string ns;
	std::string uid;
	std::string resource_version;
	std::string deletion_timestamp;
	std::map<std::string, std::string> labels;
	std::map<std::string, std::string> annotations;
	std::vector<std::string> finalizers;
	std::vector<owner_reference> owner_references;

	object_key key() const;

	bool being_deleted() const;

	/**
	 * @returns true if the annotation is present, with its value in
	 *          value.
	 */
	bool get_annotation(const std::string& name, std::string& value) const;

	/**
	 * @returns the annotation value, or the empty string when absent.
	 */
	std::string annotation(const std::string& name) const;

	bool get_label(const std::string& name, std::string& value) const;

	bool has_finalizer(const std::string& finalizer) const;
	void add_finalizer(const std::string& finalizer);
	void remove_finalizer(const std::string& finalizer);
};

/**
 * A port given either as a number or as the name of a container port.
 */
struct int_or_string
{
	int_or_string() = default;
	explicit int_or_string(int value);
	explicit int_or_string(const std::string& value);

	bool is_int = true;
	int int_value = 0;
	std::string str_value;
};

struct http_get_action
{
	int_or_string port;
	std::string path;
};

/**
 * A container probe. Only HTTP probes are of interest, so a probe without
 * an HTTP action is treated like an absent one.
 */
struct probe
{
	bool has_http_get = false;
	http_get_action http_get;
};

struct container_port
{
	std::string name;
	int container_port = 0;
};

struct container
{
	std::string name;
	std::vector<container_port> ports;
	probe liveness_probe;
	probe readiness_probe;
	probe startup_probe;
};

struct pod_condition
{
	std::string type;
	std::string status;
};

struct pod
{
	object_meta metadata;
	std::vector<container> containers;
	std::string node_name;
	std::string phase;
	std::string pod_ip;
	std::string host_ip;
	std::vector<pod_condition> conditions;

	bool is_running() const;

	/**
	 * @returns true if the pod reports Ready=True.
	 */
	bool is_ready() const;
};

struct object_reference
{
	std::string kind;
	std::string name;
	std::string ns;
};

struct endpoint_address
{
	std::string ip;
	std::string node_name;
	bool has_target_ref = false;
	object_reference target_ref;
};

struct endpoint_subset
{
	std::vector<endpoint_address> addresses;
	std::vector<endpoint_address> not_ready_addresses;
};

struct endpoints
{
	object_meta metadata;
	std::vector<endpoint_subset> subsets;
};

struct service_port
{
	std::string name;
	int port = 0;
	bool has_target_port = false;
	int_or_string target_port;
};

struct service
{
	object_meta metadata;
	std::string cluster_ip;
	std::vector<service_port> ports;
};

struct k8s_namespace
{
	object_meta metadata;
};

struct secret
{
	object_meta metadata;
	std::string type;

	/** Decoded secret contents. */
	std::map<std::string, std::string> data;
};

} // namespace meshbridge
