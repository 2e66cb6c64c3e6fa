/**
 * @file
 *
 * Custom resources in the consul.hashicorp.com/v1alpha1 group that the
 * reconcilers own.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "consul_types.h"
#include "k8s_types.h"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace meshbridge
{

const std::string CRD_GROUP_VERSION = "consul.hashicorp.com/v1alpha1";
const std::string FINALIZER_NAME = "finalizers.consul.hashicorp.com";
const std::string SECRET_BACKEND_KUBERNETES = "kubernetes";

/** Produces status timestamps. */
using time_source = std::function<std::string()>;

/**
 * @returns the current UTC time in the RFC 3339 form Kubernetes uses.
 */
std::string rfc3339_now();

/**
 * Where a peering token lives: spec.peer.secret.
 */
struct secret_ref
{
	std::string name;
	std::string key;
	std::string backend;
};

/**
 * The secret last written or consumed by the controller: status.secretRef.
 */
struct secret_ref_status
{
	std::string name;
	std::string key;
	std::string backend;
	std::string resource_version;
};

struct reconcile_error_status
{
	bool error = false;
	std::string message;
};

struct condition
{
	std::string type;
	std::string status;
	std::string reason;
	std::string message;
	std::string last_transition_time;
};

/**
 * PeeringAcceptor and PeeringDialer share one shape; the kind tells
 * them apart.
 */
struct peering_resource
{
	std::string kind;
	object_meta metadata;

	bool has_spec_secret = false;
	secret_ref spec_secret;

	bool has_status_secret = false;
	secret_ref_status status_secret;

	std::string last_reconcile_time;

	bool has_reconcile_error = false;
	reconcile_error_status reconcile_error;

	bool has_latest_peering_version = false;
	uint64_t latest_peering_version = 0;

	/**
	 * @returns true if the peering-version annotation is newer than
	 *          status.latestPeeringVersion.
	 *
	 * @throws meshbridge_exception if the annotation is not an unsigned
	 *         integer.
	 */
	bool peering_version_bumped() const;

	/**
	 * Raise status.latestPeeringVersion to the annotated version.
	 */
	void record_peering_version();
};

const std::string KIND_PEERING_ACCEPTOR = "PeeringAcceptor";
const std::string KIND_PEERING_DIALER = "PeeringDialer";
const std::string KIND_TERMINATING_GATEWAY_SERVICE = "TerminatingGatewayService";

/**
 * spec.service.service of a TerminatingGatewayService.
 */
struct external_service_spec
{
	std::string id;
	std::string service;
	std::string address;
	int port = 0;
	std::vector<std::string> tags;
	std::map<std::string, std::string> meta;
	tagged_address_map tagged_addresses;
	bool enable_tag_override = false;
};

/**
 * spec.service of a TerminatingGatewayService.
 */
struct external_registration_spec
{
	std::string node;
	std::string address;
	std::string datacenter;
	std::map<std::string, std::string> tagged_addresses;
	std::map<std::string, std::string> node_meta;
	external_service_spec service;
	bool skip_node_update = false;
};

struct service_info_ref
{
	std::string service_name;
	std::string policy_name;
};

struct terminating_gateway_service
{
	object_meta metadata;
	external_registration_spec spec;

	bool has_service_info_ref = false;
	service_info_ref status_ref;
	std::string last_synced_time;
	std::vector<condition> conditions;

	/**
	 * Set or replace the Synced condition.
	 */
	void set_synced_condition(const std::string& status,
	                          const std::string& reason,
	                          const std::string& message,
	                          const std::string& now);
};

} // namespace meshbridge
