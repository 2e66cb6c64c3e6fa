/**
 * @file
 *
 * Interface to upstream_parser, which turns the upstreams annotation of a
 * pod into proxy upstream definitions.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "consul_client.h"
#include "k8s_types.h"
#include "namespace_policy.h"

#include <string>
#include <vector>

namespace meshbridge
{

/**
 * Accepted forms, comma separated:
 *
 *   name[.namespace[.partition]]:port[:datacenter]
 *   name.svc[.namespace.ns[.<peer|partition|dc>.<peer|ap|dc>]]:port
 *   prepared_query:query-name:port
 *
 * Namespace and partition qualifiers of the unlabeled form are only
 * recognized when Consul namespaces or partitions are enabled. Entries
 * whose port does not resolve to a positive value are dropped.
 */
class upstream_parser
{
public:
	/**
	 * @param[in] policy  namespace and partition topology.
	 * @param[in] server  used to look up the mesh gateway mode of
	 *                    datacenter-qualified upstreams.
	 */
	upstream_parser(const namespace_policy& policy, const consul_client::ptr& server);

	/**
	 * Parse the upstreams annotation of the pod.
	 *
	 * @throws meshbridge_exception if an entry is malformed or a
	 *         datacenter-qualified upstream cannot be routed.
	 */
	std::vector<upstream> parse(const pod& p) const;

	/**
	 * Parse one entry.
	 *
	 * @returns false if the entry's port is not positive.
	 */
	bool parse_one(const pod& p, const std::string& raw, upstream& out) const;

private:
	bool parse_prepared_query(const pod& p, const std::string& raw, upstream& out) const;
	bool parse_unlabeled(const pod& p, const std::string& raw, upstream& out) const;
	bool parse_labeled(const pod& p, const std::string& raw, upstream& out) const;

	/**
	 * @throws meshbridge_exception if the global proxy-defaults is missing
	 *         or its mesh gateway mode is neither local nor remote.
	 */
	void check_mesh_gateway_mode(const std::string& raw) const;

	static int upstream_port(const pod& p, const std::string& value);

	const namespace_policy m_policy;
	const consul_client::ptr m_server;
};

} // namespace meshbridge
