/**
 * @file
 *
 * Interface to plugin_conf, the network configuration the runtime passes
 * to the plugin on stdin.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <json/json.h>

#include <string>

namespace meshbridge
{

const std::string DEFAULT_CNI_LOG_FILE = "/var/log/meshbridge-cni.log";

struct plugin_conf
{
	std::string name;
	std::string type;
	std::string cni_version;

	/** Result of the previous plugin of the chain, if any. */
	bool has_prev_result = false;
	Json::Value prev_result;

	std::string cni_bin_dir;
	std::string cni_net_dir;

	/** Kubeconfig file name, relative to cni_net_dir. */
	std::string kubeconfig;

	std::string log_level = "info";
	std::string log_file = DEFAULT_CNI_LOG_FILE;
	bool multus = false;

	/**
	 * @returns the kubeconfig location under cni_net_dir.
	 */
	std::string kubeconfig_path() const;

	/**
	 * @throws cni_error if the document is not a JSON object or the
	 *         previous result is not an object.
	 */
	static plugin_conf parse(const std::string& document);
};

} // namespace meshbridge
