/**
 * @file
 *
 * Interface to cni_args, the decoded CNI_ARGS environment variable.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <string>

namespace meshbridge
{

/**
 * The runtime passes CNI_ARGS as "KEY=VALUE;KEY=VALUE". Kubernetes runtimes
 * fill in the pod identity; other orchestrators pass a prebuilt redirection
 * config instead.
 */
struct cni_args
{
	bool ignore_unknown = false;
	std::string ip;
	std::string pod_name;
	std::string pod_namespace;
	std::string pod_infra_container_id;
	std::string pod_uid;

	/** Serialized iptables_config; empty when running under Kubernetes. */
	std::string iptables_config;

	/**
	 * @throws cni_error if a pair is malformed, or a key is unknown and
	 *         IgnoreUnknown is not set.
	 */
	static cni_args parse(const std::string& value);
};

} // namespace meshbridge
