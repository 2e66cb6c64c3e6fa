/**
 * @file
 *
 * Interface to the Consul agent and server API.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "consul_types.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace meshbridge
{

/**
 * The subset of the Consul HTTP API that the reconcilers call.
 *
 * Lookups return false when the object does not exist. Every other failure
 * raises an api_exception. All writes are keyed by a deterministic ID and
 * replace the previous value, so repeating any call is safe.
 */
class consul_client
{
public:
	using ptr = std::shared_ptr<consul_client>;

	virtual ~consul_client() = default;

	// Agent
	virtual void register_service(const agent_service& service) = 0;
	virtual void deregister_service(const std::string& service_id,
	                                const query_options& opts) = 0;

	/**
	 * @returns every service instance on the agent that was registered for
	 *          the given Kubernetes service.
	 */
	virtual std::map<std::string, agent_service> services_for_k8s_service(
	    const std::string& k8s_service_name,
	    const std::string& k8s_namespace,
	    const query_options& opts) = 0;

	virtual bool get_check(const std::string& check_id,
	                       agent_check& out,
	                       const query_options& opts) = 0;
	virtual void register_check(const check_registration& check) = 0;
	virtual void update_ttl(const std::string& check_id,
	                        const std::string& output,
	                        const std::string& status,
	                        const query_options& opts) = 0;

	// ACL
	virtual std::vector<acl_token> list_tokens(const query_options& opts) = 0;
	virtual void delete_token(const std::string& accessor_id,
	                          const query_options& opts) = 0;
	virtual std::vector<acl_policy> list_policies() = 0;
	virtual acl_policy create_policy(const acl_policy& policy) = 0;
	virtual void delete_policy(const std::string& id) = 0;
	virtual std::vector<acl_role> list_roles() = 0;
	virtual void update_role(const acl_role& role) = 0;

	// Catalog
	virtual std::vector<catalog_service> catalog_service_instances(const std::string& name) = 0;
	virtual void catalog_register(const catalog_registration& registration) = 0;
	virtual void catalog_deregister(const catalog_deregistration& deregistration) = 0;

	// Peering
	virtual bool read_peering(const std::string& name, peering& out) = 0;

	/**
	 * @returns the opaque peering token.
	 */
	virtual std::string generate_peering_token(const std::string& peer_name) = 0;
	virtual void establish_peering(const std::string& peer_name,
	                               const std::string& token) = 0;
	virtual void delete_peering(const std::string& name) = 0;

	// Config entries

	/**
	 * Read the mesh gateway mode of the global proxy-defaults entry.
	 *
	 * @returns false if there is no proxy-defaults entry.
	 */
	virtual bool read_proxy_defaults_mesh_gateway_mode(std::string& mode) = 0;
};

} // namespace meshbridge
