/**
 * @file
 *
 * Interface to cni_plugin, the chained CNI plugin that applies traffic
 * redirection rules to injected pods.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "iptables_effector.h"
#include "k8s_client.h"
#include "plugin_conf.h"

#include <functional>
#include <string>
#include <vector>

namespace meshbridge
{

const std::vector<std::string> SUPPORTED_CNI_VERSIONS = {"0.3.0", "0.3.1", "0.4.0", "1.0.0"};

/** Result version used when there is no previous result to forward. */
const std::string PLACEHOLDER_RESULT_VERSION = "0.3.1";

/**
 * The environment and stdin of one plugin invocation.
 */
struct cni_invocation
{
	std::string command;
	std::string container_id;
	std::string netns;
	std::string ifname;
	std::string args;
	std::string path;
	std::string stdin_data;

	/**
	 * Read the CNI_* variables of the process environment.
	 */
	static cni_invocation from_environment(const std::string& stdin_data);
};

class cni_plugin
{
public:
	/** Builds the API client once the plugin conf is known. */
	using k8s_client_factory = std::function<k8s_client::ptr(const plugin_conf&)>;

	cni_plugin(const k8s_client_factory& factory,
	           const iptables_effector::ptr& effector,
	           bool dual_stack);

	/**
	 * Run the command named by the invocation.
	 *
	 * @returns the text to print on stdout.
	 *
	 * @throws cni_error on failure.
	 */
	std::string run(const cni_invocation& invocation);

	/**
	 * Handle ADD. The previous result, or a placeholder when the plugin is
	 * not chained, is always returned for the next plugin.
	 */
	std::string cmd_add(const cni_invocation& invocation);

	/** Redirection state lives in the pod network namespace. */
	std::string cmd_del(const cni_invocation& invocation);
	std::string cmd_check(const cni_invocation& invocation);

	static std::string version_info(const std::string& cni_version);

	/**
	 * True if the pod was not injected or transparent proxy is not in use.
	 */
	static bool skip_traffic_redirection(const pod& p);

	/**
	 * Parse the redirection config annotation of the pod.
	 *
	 * @throws cni_error if the annotation is missing or malformed.
	 */
	static iptables_config parse_annotation(const pod& p, const std::string& annotation);

private:
	/**
	 * Set the transparent proxy status annotation. Failures are logged and
	 * otherwise ignored.
	 */
	void update_status_annotation(const object_key& key, const std::string& status);

	std::string print_result(const plugin_conf& conf, const Json::Value& result) const;

	k8s_client_factory m_factory;
	k8s_client::ptr m_client;
	iptables_effector::ptr m_effector;
	const bool m_dual_stack;
};

} // namespace meshbridge
