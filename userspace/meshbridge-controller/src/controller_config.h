/**
 * @file
 *
 * Interface to namespace controller_config -- the settings of
 * meshbridge-controller as read from the configuration_manager.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "agent_directory.h"
#include "metrics_config.h"
#include "namespace_policy.h"
#include "registration_builder.h"
#include "rest_client.h"

#include <cstdint>
#include <string>
#include <vector>

namespace meshbridge
{

struct log_settings
{
	std::string location;
	std::string file_priority;
	std::string console_priority;
	uint32_t rotate = 0;
	uint32_t max_size_mb = 0;
	std::vector<std::string> file_priority_by_component;
	std::vector<std::string> console_priority_by_component;
};

struct controller_settings
{
	std::string release_name;
	std::string release_namespace;

	agent_topology topology = agent_topology::shared;

	/** Scheme and port of the per-node agents. */
	std::string agent_scheme;
	uint16_t agent_port = 0;

	std::string auth_method;

	namespace_settings namespaces;
	registration_defaults registration;
	metrics_defaults metrics;

	uint16_t worker_threads = 0;
	uint64_t poll_interval_ms = 0;
	uint64_t resync_interval_s = 0;
	uint64_t base_requeue_delay_ms = 0;
	uint64_t max_requeue_delay_ms = 0;

	bool enable_peering = false;
	bool enable_terminating_gateway = false;
	bool acls_enabled = false;
};

namespace controller_config
{

/** File name of the controller log inside log.location. */
extern const std::string LOG_FILE_NAME;

log_settings logging();

/**
 * @throws meshbridge_exception if connect_inject.agent_topology is not
 *         one of the known topologies.
 */
controller_settings controller();

/**
 * Options for the Kubernetes API. A configured kubeconfig wins over the
 * in-cluster service account.
 *
 * @throws meshbridge_exception if the credentials cannot be read.
 */
rest_client::options kubernetes();

/**
 * Options for the Consul server (or the shared agent).
 */
rest_client::options consul();

/**
 * Options for the agent running on the node with the given host IP.
 */
rest_client::options consul_agent(const std::string& host_ip);

} // namespace controller_config
} // namespace meshbridge
