/**
 * @file
 *
 * Interface to iptables_config, the traffic redirection settings of one
 * pod. The JSON form is exchanged between the injector, which stores it
 * in the redirect-traffic-config annotation, and the CNI plugin.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <json/json.h>

#include <string>
#include <vector>

namespace meshbridge
{

/** UID the sidecar proxy runs as. */
const int PROXY_USER_ID = 5995;

/** UID of the init container; its traffic is never redirected. */
const int INIT_CONTAINER_USER_ID = 5996;

const int DEFAULT_TPROXY_OUTBOUND_PORT = 15001;

/** Public listener port of the first sidecar proxy of a pod. */
const int PROXY_DEFAULT_INBOUND_PORT = 20000;

/** Readiness port of the first sidecar proxy of a pod. */
const int PROXY_DEFAULT_HEALTH_PORT = 21000;

struct iptables_config
{
	std::string proxy_user_id;
	int proxy_inbound_port = 0;
	int proxy_outbound_port = 0;
	std::vector<std::string> exclude_inbound_ports;
	std::vector<std::string> exclude_outbound_ports;
	std::vector<std::string> exclude_outbound_cidrs;
	std::vector<std::string> exclude_uids;

	/** Empty unless DNS queries are redirected to Consul DNS. */
	std::string consul_dns_ip;

	/** Path of the pod's network namespace, filled in by the CNI plugin. */
	std::string netns;

	bool operator==(const iptables_config& rhs) const;
	bool operator!=(const iptables_config& rhs) const;

	Json::Value to_json() const;

	/**
	 * @returns the compact JSON document, keys in a fixed order.
	 */
	std::string serialize() const;

	/**
	 * @throws meshbridge_exception if the document is not a JSON object or
	 *         a field has the wrong type.
	 */
	static iptables_config deserialize(const std::string& document);
};

} // namespace meshbridge
