/**
 * @file
 *
 * Implementation of fake_consul_client.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "fake_consul_client.h"
#include "annotations.h"
#include "meshbridge_exception.h"

#include <algorithm>

using namespace meshbridge;

namespace test_helpers
{

fake_consul_client::fake_consul_client():
	m_next_id(1),
	m_has_proxy_defaults(false)
{
}

void fake_consul_client::add_token(const acl_token& token)
{
	std::lock_guard<std::mutex> l(m_lock);
	m_tokens.push_back(token);
}

void fake_consul_client::add_policy(const acl_policy& policy)
{
	std::lock_guard<std::mutex> l(m_lock);
	m_policies.push_back(policy);
}

void fake_consul_client::add_role(const acl_role& role)
{
	std::lock_guard<std::mutex> l(m_lock);
	m_roles.push_back(role);
}

void fake_consul_client::add_catalog_service(const catalog_service& entry)
{
	std::lock_guard<std::mutex> l(m_lock);
	m_catalog.push_back(entry);
}

void fake_consul_client::add_peering(const std::string& name)
{
	std::lock_guard<std::mutex> l(m_lock);
	peering p;
	p.id = "peering-" + std::to_string(m_next_id++);
	p.name = name;
	p.state = "ACTIVE";
	m_peerings[name] = p;
}

void fake_consul_client::set_proxy_defaults_mesh_gateway_mode(const std::string& mode)
{
	std::lock_guard<std::mutex> l(m_lock);
	m_has_proxy_defaults = true;
	m_mesh_gateway_mode = mode;
}

void fake_consul_client::fail(const std::string& operation, const int code)
{
	std::lock_guard<std::mutex> l(m_lock);
	m_failures[operation] = code;
}

void fake_consul_client::clear_failures()
{
	std::lock_guard<std::mutex> l(m_lock);
	m_failures.clear();
}

std::vector<std::string> fake_consul_client::calls() const
{
	std::lock_guard<std::mutex> l(m_lock);
	return m_calls;
}

void fake_consul_client::clear_calls()
{
	std::lock_guard<std::mutex> l(m_lock);
	m_calls.clear();
	m_counts.clear();
}

size_t fake_consul_client::count(const std::string& operation) const
{
	std::lock_guard<std::mutex> l(m_lock);
	const auto it = m_counts.find(operation);
	return it == m_counts.end() ? 0 : it->second;
}

std::map<std::string, agent_service> fake_consul_client::services() const
{
	std::lock_guard<std::mutex> l(m_lock);
	return m_services;
}

std::map<std::string, agent_check> fake_consul_client::checks() const
{
	std::lock_guard<std::mutex> l(m_lock);
	return m_checks;
}

std::vector<acl_token> fake_consul_client::tokens() const
{
	std::lock_guard<std::mutex> l(m_lock);
	return m_tokens;
}

std::vector<acl_policy> fake_consul_client::policies() const
{
	std::lock_guard<std::mutex> l(m_lock);
	return m_policies;
}

std::vector<acl_role> fake_consul_client::roles() const
{
	std::lock_guard<std::mutex> l(m_lock);
	return m_roles;
}

std::vector<catalog_service> fake_consul_client::catalog() const
{
	std::lock_guard<std::mutex> l(m_lock);
	return m_catalog;
}

bool fake_consul_client::has_peering(const std::string& name) const
{
	std::lock_guard<std::mutex> l(m_lock);
	return m_peerings.count(name) > 0;
}

std::string fake_consul_client::established_token(const std::string& peer_name) const
{
	std::lock_guard<std::mutex> l(m_lock);
	const auto it = m_established_tokens.find(peer_name);
	return it == m_established_tokens.end() ? "" : it->second;
}

void fake_consul_client::register_service(const agent_service& service)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("register_service");
	m_services[service.id] = service;
	record("register_service", service.id);
}

void fake_consul_client::deregister_service(const std::string& service_id, const query_options&)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("deregister_service");

	if(m_services.erase(service_id) == 0)
	{
		throw api_exception("Unknown service ID \"" + service_id + "\"", 404);
	}

	// The agent drops a service's checks along with it.
	for(auto it = m_checks.begin(); it != m_checks.end();)
	{
		it = it->second.service_id == service_id ? m_checks.erase(it) : std::next(it);
	}
	record("deregister_service", service_id);
}

std::map<std::string, agent_service> fake_consul_client::services_for_k8s_service(
    const std::string& k8s_service_name,
    const std::string& k8s_namespace,
    const query_options&)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("services_for_k8s_service");

	std::map<std::string, agent_service> result;
	for(const auto& entry : m_services)
	{
		const auto& meta = entry.second.meta;
		const auto name = meta.find(META_KEY_KUBE_SERVICE_NAME);
		const auto ns = meta.find(META_KEY_KUBE_NS);
		const auto managed = meta.find(META_KEY_MANAGED_BY);

		if(name != meta.end() && name->second == k8s_service_name && ns != meta.end() &&
		   ns->second == k8s_namespace && managed != meta.end() &&
		   managed->second == annotations::MANAGED_BY_VALUE)
		{
			result.insert(entry);
		}
	}
	return result;
}

bool fake_consul_client::get_check(const std::string& check_id,
                                   agent_check& out,
                                   const query_options&)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("get_check");

	const auto it = m_checks.find(check_id);
	if(it == m_checks.end())
	{
		return false;
	}
	out = it->second;
	return true;
}

void fake_consul_client::register_check(const check_registration& check)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("register_check");

	const auto svc = m_services.find(check.service_id);
	if(svc == m_services.end())
	{
		throw api_exception("ServiceID \"" + check.service_id + "\" does not exist", 500);
	}

	agent_check registered;
	registered.check_id = check.id;
	registered.name = check.name;
	registered.status = check.status;
	registered.service_id = check.service_id;
	registered.service_name = svc->second.service;
	registered.type = "ttl";
	m_checks[check.id] = registered;
	record("register_check", check.id);
}

void fake_consul_client::update_ttl(const std::string& check_id,
                                    const std::string& output,
                                    const std::string& status,
                                    const query_options&)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("update_ttl");

	const auto it = m_checks.find(check_id);
	if(it == m_checks.end())
	{
		throw api_exception("CheckID \"" + check_id + "\" does not have associated TTL", 500);
	}
	it->second.status = status;
	it->second.output = output;
	record("update_ttl", check_id);
}

std::vector<acl_token> fake_consul_client::list_tokens(const query_options&)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("list_tokens");
	return m_tokens;
}

void fake_consul_client::delete_token(const std::string& accessor_id, const query_options&)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("delete_token");

	m_tokens.erase(std::remove_if(m_tokens.begin(),
	                              m_tokens.end(),
	                              [&accessor_id](const acl_token& t) {
		                              return t.accessor_id == accessor_id;
	                              }),
	               m_tokens.end());
	record("delete_token", accessor_id);
}

std::vector<acl_policy> fake_consul_client::list_policies()
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("list_policies");
	return m_policies;
}

acl_policy fake_consul_client::create_policy(const acl_policy& policy)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("create_policy");

	for(const auto& existing : m_policies)
	{
		if(existing.name == policy.name)
		{
			throw api_exception("Invalid Policy: A Policy with Name \"" + policy.name +
			                        "\" already exists",
			                    500);
		}
	}

	acl_policy created = policy;
	created.id = "policy-" + std::to_string(m_next_id++);
	m_policies.push_back(created);
	record("create_policy", created.name);
	return created;
}

void fake_consul_client::delete_policy(const std::string& id)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("delete_policy");

	m_policies.erase(std::remove_if(m_policies.begin(),
	                                m_policies.end(),
	                                [&id](const acl_policy& p) { return p.id == id; }),
	                 m_policies.end());
	record("delete_policy", id);
}

std::vector<acl_role> fake_consul_client::list_roles()
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("list_roles");
	return m_roles;
}

void fake_consul_client::update_role(const acl_role& role)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("update_role");

	for(auto& existing : m_roles)
	{
		if(existing.id == role.id)
		{
			existing = role;
			record("update_role", role.name);
			return;
		}
	}
	throw api_exception("Cannot find role " + role.id, 404);
}

std::vector<catalog_service> fake_consul_client::catalog_service_instances(const std::string& name)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("catalog_service_instances");

	std::vector<catalog_service> result;
	for(const auto& entry : m_catalog)
	{
		if(entry.service_name == name)
		{
			result.push_back(entry);
		}
	}
	return result;
}

void fake_consul_client::catalog_register(const catalog_registration& registration)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("catalog_register");

	catalog_service entry;
	entry.node = registration.node;
	entry.address = registration.address;
	entry.datacenter = registration.datacenter.empty() ? "dc1" : registration.datacenter;
	entry.tagged_addresses = registration.tagged_addresses;
	entry.node_meta = registration.node_meta;
	entry.service_id = registration.service.id;
	entry.service_name = registration.service.service;
	entry.service_address = registration.service.address;
	entry.service_tags = registration.service.tags;
	entry.service_meta = registration.service.meta;
	entry.service_port = registration.service.port;
	entry.service_tagged_addresses = registration.service.tagged_addresses;
	entry.service_enable_tag_override = registration.service.enable_tag_override;

	m_catalog.erase(std::remove_if(m_catalog.begin(),
	                               m_catalog.end(),
	                               [&entry](const catalog_service& c) {
		                               return c.node == entry.node &&
		                                      c.service_id == entry.service_id;
	                               }),
	                m_catalog.end());
	m_catalog.push_back(entry);
	record("catalog_register", entry.service_id);
}

void fake_consul_client::catalog_deregister(const catalog_deregistration& deregistration)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("catalog_deregister");

	m_catalog.erase(std::remove_if(m_catalog.begin(),
	                               m_catalog.end(),
	                               [&deregistration](const catalog_service& c) {
		                               return c.node == deregistration.node &&
		                                      c.service_id == deregistration.service_id;
	                               }),
	                m_catalog.end());
	record("catalog_deregister", deregistration.service_id);
}

bool fake_consul_client::read_peering(const std::string& name, peering& out)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("read_peering");

	const auto it = m_peerings.find(name);
	if(it == m_peerings.end())
	{
		return false;
	}
	out = it->second;
	return true;
}

std::string fake_consul_client::generate_peering_token(const std::string& peer_name)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("generate_peering_token");

	peering p;
	p.id = "peering-" + std::to_string(m_next_id);
	p.name = peer_name;
	p.state = "PENDING";
	m_peerings[peer_name] = p;
	record("generate_peering_token", peer_name);
	return "token-" + peer_name + "-" + std::to_string(m_next_id++);
}

void fake_consul_client::establish_peering(const std::string& peer_name,
                                           const std::string& token)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("establish_peering");

	peering p;
	p.id = "peering-" + std::to_string(m_next_id++);
	p.name = peer_name;
	p.state = "ESTABLISHING";
	m_peerings[peer_name] = p;
	m_established_tokens[peer_name] = token;
	record("establish_peering", peer_name);
}

void fake_consul_client::delete_peering(const std::string& name)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("delete_peering");
	m_peerings.erase(name);
	record("delete_peering", name);
}

bool fake_consul_client::read_proxy_defaults_mesh_gateway_mode(std::string& mode)
{
	std::lock_guard<std::mutex> l(m_lock);
	enter("read_proxy_defaults_mesh_gateway_mode");

	if(!m_has_proxy_defaults)
	{
		return false;
	}
	mode = m_mesh_gateway_mode;
	return true;
}

void fake_consul_client::enter(const std::string& operation)
{
	++m_counts[operation];

	const auto it = m_failures.find(operation);
	if(it != m_failures.end())
	{
		throw api_exception(operation + " failed", it->second);
	}
}

void fake_consul_client::record(const std::string& operation, const std::string& id)
{
	m_calls.push_back(operation + " " + id);
}

} // namespace test_helpers
