/**
 * @file
 *
 * Interface to fake_consul_client, an in-memory Consul agent and server
 * for unit tests.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "consul_client.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace test_helpers
{

/**
 * Every call that changes state is appended to calls() as
 * "<operation> <id>", in the order made.
 */
class fake_consul_client : public meshbridge::consul_client
{
public:
	fake_consul_client();

	// Test setup
	void add_token(const meshbridge::acl_token& token);
	void add_policy(const meshbridge::acl_policy& policy);
	void add_role(const meshbridge::acl_role& role);
	void add_catalog_service(const meshbridge::catalog_service& entry);
	void add_peering(const std::string& name);
	void set_proxy_defaults_mesh_gateway_mode(const std::string& mode);

	/**
	 * Make every call of the named operation fail with an api_exception
	 * of the given code.
	 */
	void fail(const std::string& operation, int code);
	void clear_failures();

	std::vector<std::string> calls() const;
	void clear_calls();

	/** Number of calls of the named operation, reads included. */
	size_t count(const std::string& operation) const;

	std::map<std::string, meshbridge::agent_service> services() const;
	std::map<std::string, meshbridge::agent_check> checks() const;
	std::vector<meshbridge::acl_token> tokens() const;
	std::vector<meshbridge::acl_policy> policies() const;
	std::vector<meshbridge::acl_role> roles() const;
	std::vector<meshbridge::catalog_service> catalog() const;
	bool has_peering(const std::string& name) const;

	/** The token passed to the last establish_peering of the peer. */
	std::string established_token(const std::string& peer_name) const;

	// consul_client
	void register_service(const meshbridge::agent_service& service) override;
	void deregister_service(const std::string& service_id,
	                        const meshbridge::query_options& opts) override;
	std::map<std::string, meshbridge::agent_service> services_for_k8s_service(
	    const std::string& k8s_service_name,
	    const std::string& k8s_namespace,
	    const meshbridge::query_options& opts) override;
	bool get_check(const std::string& check_id,
	               meshbridge::agent_check& out,
	               const meshbridge::query_options& opts) override;
	void register_check(const meshbridge::check_registration& check) override;
	void update_ttl(const std::string& check_id,
	                const std::string& output,
	                const std::string& status,
	                const meshbridge::query_options& opts) override;
	std::vector<meshbridge::acl_token> list_tokens(const meshbridge::query_options& opts) override;
	void delete_token(const std::string& accessor_id, const meshbridge::query_options& opts) override;
	std::vector<meshbridge::acl_policy> list_policies() override;
	meshbridge::acl_policy create_policy(const meshbridge::acl_policy& policy) override;
	void delete_policy(const std::string& id) override;
	std::vector<meshbridge::acl_role> list_roles() override;
	void update_role(const meshbridge::acl_role& role) override;
	std::vector<meshbridge::catalog_service> catalog_service_instances(
	    const std::string& name) override;
	void catalog_register(const meshbridge::catalog_registration& registration) override;
	void catalog_deregister(const meshbridge::catalog_deregistration& deregistration) override;
	bool read_peering(const std::string& name, meshbridge::peering& out) override;
	std::string generate_peering_token(const std::string& peer_name) override;
	void establish_peering(const std::string& peer_name, const std::string& token) override;
	void delete_peering(const std::string& name) override;
	bool read_proxy_defaults_mesh_gateway_mode(std::string& mode) override;

private:
	void enter(const std::string& operation);
	void record(const std::string& operation, const std::string& id);

	mutable std::mutex m_lock;
	uint64_t m_next_id;
	std::map<std::string, int> m_failures;
	std::map<std::string, size_t> m_counts;
	std::vector<std::string> m_calls;

	std::map<std::string, meshbridge::agent_service> m_services;
	std::map<std::string, meshbridge::agent_check> m_checks;
	std::vector<meshbridge::acl_token> m_tokens;
	std::vector<meshbridge::acl_policy> m_policies;
	std::vector<meshbridge::acl_role> m_roles;
	std::vector<meshbridge::catalog_service> m_catalog;
	std::map<std::string, meshbridge::peering> m_peerings;
	std::map<std::string, std::string> m_established_tokens;
	bool m_has_proxy_defaults;
	std::string m_mesh_gateway_mode;
};

} // namespace test_helpers
