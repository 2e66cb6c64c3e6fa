/**
 * @file
 *
 * Interface to consul_rest_client, the consul_client backed by the Consul
 * HTTP API.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "consul_client.h"
#include "rest_client.h"

namespace meshbridge
{

class consul_rest_client : public consul_client
{
public:
	explicit consul_rest_client(const rest_client::ptr& client);

	/**
	 * Build the options for an agent or server address, carrying the ACL
	 * token in the X-Consul-Token header when one is given.
	 */
	static rest_client::options make_options(const std::string& address,
	                                         const std::string& token,
	                                         const std::string& ca_file,
	                                         uint32_t timeout_ms);

	void register_service(const agent_service& service) override;
	void deregister_service(const std::string& service_id,
	                        const query_options& opts) override;
	std::map<std::string, agent_service> services_for_k8s_service(
	    const std::string& k8s_service_name,
	    const std::string& k8s_namespace,
	    const query_options& opts) override;
	bool get_check(const std::string& check_id,
	               agent_check& out,
	               const query_options& opts) override;
	void register_check(const check_registration& check) override;
	void update_ttl(const std::string& check_id,
	                const std::string& output,
	                const std::string& status,
	                const query_options& opts) override;

	std::vector<acl_token> list_tokens(const query_options& opts) override;
	void delete_token(const std::string& accessor_id, const query_options& opts) override;
	std::vector<acl_policy> list_policies() override;
	acl_policy create_policy(const acl_policy& policy) override;
	void delete_policy(const std::string& id) override;
	std::vector<acl_role> list_roles() override;
	void update_role(const acl_role& role) override;

	std::vector<catalog_service> catalog_service_instances(const std::string& name) override;
	void catalog_register(const catalog_registration& registration) override;
	void catalog_deregister(const catalog_deregistration& deregistration) override;

	bool read_peering(const std::string& name, peering& out) override;
	std::string generate_peering_token(const std::string& peer_name) override;
	void establish_peering(const std::string& peer_name, const std::string& token) override;
	void delete_peering(const std::string& name) override;

	bool read_proxy_defaults_mesh_gateway_mode(std::string& mode) override;

	/**
	 * Build the "?ns=..&partition=..&filter=.." suffix for a request.
	 */
	static std::string query(const query_options& opts, const std::string& filter = "");

	/**
	 * Filter selecting the service instances registered for a Kubernetes
	 * service.
	 */
	static std::string k8s_service_filter(const std::string& k8s_service_name,
	                                      const std::string& k8s_namespace);

private:
	rest_client::ptr m_client;
};

} // namespace meshbridge
