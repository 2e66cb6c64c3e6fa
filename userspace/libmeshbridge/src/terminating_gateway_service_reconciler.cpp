/**
 * @file
 *
 * Implementation of terminating_gateway_service_reconciler.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "terminating_gateway_service_reconciler.h"
#include "common_logger.h"
#include "meshbridge_exception.h"

#include <algorithm>

COMMON_LOGGER();

namespace
{

const std::string TERMINATING_GATEWAY_ROLE_MARKER = "terminating-gateway";
const std::string CONDITION_TRUE = "True";
const std::string CONDITION_FALSE = "False";
const std::string REASON_ERROR_UPDATING_STATUS = "ErrorUpdatingStatus";

std::string registration_id(const meshbridge::external_service_spec& svc)
{
	return svc.id.empty() ? svc.service : svc.id;
}

/**
 * Policies and role links are matched by name substring, as Consul lists
 * them without an exact-name query.
 */
bool contains_policy_name(const std::string& name, const std::string& policy_name)
{
	return name.find(policy_name) != std::string::npos;
}

} // end namespace

namespace meshbridge
{

const char* to_string(const gateway_service_state state)
{
	switch(state)
	{
	case gateway_service_state::gone:
		return "gone";
	case gateway_service_state::deleting:
		return "deleting";
	case gateway_service_state::unregistered:
		return "unregistered";
	case gateway_service_state::in_sync:
		return "in_sync";
	case gateway_service_state::drift:
		return "drift";
	}
	return "unknown";
}

bool catalog_entry_differs(const catalog_service& registered,
                           const external_registration_spec& spec)
{
	const external_service_spec& svc = spec.service;

	// An unset datacenter means the agent's own.
	if(!spec.datacenter.empty() && registered.datacenter != spec.datacenter)
	{
		return true;
	}

	return registered.node != spec.node || registered.address != spec.address ||
	       registered.tagged_addresses != spec.tagged_addresses ||
	       registered.node_meta != spec.node_meta ||
	       registered.service_id != registration_id(svc) ||
	       registered.service_address != svc.address || registered.service_port != svc.port ||
	       registered.service_tags != svc.tags || registered.service_meta != svc.meta ||
	       registered.service_tagged_addresses != svc.tagged_addresses ||
	       registered.service_enable_tag_override != svc.enable_tag_override;
}

gateway_service_state classify_gateway_service(const bool resource_exists,
                                               const terminating_gateway_service& resource,
                                               const catalog_service* registered)
{
	if(!resource_exists)
	{
		return gateway_service_state::gone;
	}

	if(resource.metadata.being_deleted())
	{
		return resource.metadata.has_finalizer(FINALIZER_NAME) ? gateway_service_state::deleting :
		                                                         gateway_service_state::gone;
	}

	if(registered == nullptr)
	{
		return gateway_service_state::unregistered;
	}

	return catalog_entry_differs(*registered, resource.spec) ? gateway_service_state::drift :
	                                                           gateway_service_state::in_sync;
}

catalog_registration registration_for(const external_registration_spec& spec)
{
	catalog_registration reg;

	reg.node = spec.node;
	reg.address = spec.address;
	reg.datacenter = spec.datacenter;
	reg.tagged_addresses = spec.tagged_addresses;
	reg.node_meta = spec.node_meta;
	reg.skip_node_update = spec.skip_node_update;

	reg.service.id = registration_id(spec.service);
	reg.service.service = spec.service.service;
	reg.service.address = spec.service.address;
	reg.service.port = spec.service.port;
	reg.service.tags = spec.service.tags;
	reg.service.meta = spec.service.meta;
	reg.service.tagged_addresses = spec.service.tagged_addresses;
	reg.service.enable_tag_override = spec.service.enable_tag_override;

	return reg;
}

std::string write_policy_name(const std::string& service_name)
{
	return service_name + "-write-policy";
}

std::string write_policy_rules(const std::string& service_name)
{
	return "service \"" + service_name + "\" {policy = \"write\"}";
}

terminating_gateway_service_reconciler::terminating_gateway_service_reconciler(
    const k8s_client::ptr& k8s,
    const consul_client::ptr& consul,
    const bool acls_enabled,
    const time_source& now):
	m_k8s(k8s),
	m_consul(consul),
	m_acls_enabled(acls_enabled),
	m_now(now)
{
}

std::string terminating_gateway_service_reconciler::name() const
{
	return "terminatinggatewayservice";
}

reconcile_result terminating_gateway_service_reconciler::reconcile(const object_key& key)
{
	terminating_gateway_service resource;

	if(!m_k8s->get_terminating_gateway_service(key, resource))
	{
		// Deletion goes through the finalizer, so there is nothing left.
		LOG_DEBUG("TerminatingGatewayService %s not found", key.to_string().c_str());
		return reconcile_result();
	}

	const std::string& service_name = resource.spec.service.service;

	if(!resource.metadata.being_deleted() && !resource.metadata.has_finalizer(FINALIZER_NAME))
	{
		resource.metadata.add_finalizer(FINALIZER_NAME);
		m_k8s->update_finalizers(resource);
	}

	try
	{
		catalog_service registered;
		const bool is_registered = find_registration(service_name, registered);

		const gateway_service_state state =
		    classify_gateway_service(true, resource, is_registered ? &registered : nullptr);

		LOG_DEBUG("TerminatingGatewayService %s: %s",
		          key.to_string().c_str(),
		          to_string(state));

		switch(state)
		{
		case gateway_service_state::gone:
			return reconcile_result();

		case gateway_service_state::deleting:
			LOG_INFO("TerminatingGatewayService %s was deleted, deregistering %s",
			         key.to_string().c_str(),
			         service_name.c_str());
			if(is_registered)
			{
				deregister(registered);
			}
			if(m_acls_enabled)
			{
				detach_write_policy(service_name);
			}
			resource.metadata.remove_finalizer(FINALIZER_NAME);
			m_k8s->update_finalizers(resource);
			return reconcile_result();

		case gateway_service_state::unregistered:
			LOG_INFO("Registering external service %s", service_name.c_str());
			m_consul->catalog_register(registration_for(resource.spec));
			break;

		case gateway_service_state::drift:
			// The catalog has no partial update.
			LOG_INFO("External service %s changed, registering it again", service_name.c_str());
			deregister(registered);
			m_consul->catalog_register(registration_for(resource.spec));
			break;

		case gateway_service_state::in_sync:
			if(status_current(resource))
			{
				return reconcile_result();
			}
			break;
		}

		if(m_acls_enabled)
		{
			attach_write_policy(service_name);
		}

		update_status(resource);
	}
	catch(const std::exception& ex)
	{
		LOG_ERROR("Unable to sync TerminatingGatewayService %s: %s",
		          key.to_string().c_str(),
		          ex.what());
		update_status_error(resource, ex.what());
		throw;
	}

	return reconcile_result();
}

bool terminating_gateway_service_reconciler::find_registration(const std::string& service_name,
                                                               catalog_service& out)
{
	const std::vector<catalog_service> entries = m_consul->catalog_service_instances(service_name);

	if(entries.size() > 1)
	{
		throw meshbridge_exception("multiple catalog entries found for service " + service_name);
	}

	if(entries.empty())
	{
		return false;
	}

	out = entries.front();
	return true;
}

void terminating_gateway_service_reconciler::deregister(const catalog_service& registered)
{
	catalog_deregistration dereg;

	dereg.node = registered.node;
	dereg.address = registered.address;
	dereg.datacenter = registered.datacenter;
	dereg.service_id = registered.service_id;

	m_consul->catalog_deregister(dereg);
}

acl_role terminating_gateway_service_reconciler::terminating_gateway_role()
{
	for(const auto& role : m_consul->list_roles())
	{
		if(role.name.find(TERMINATING_GATEWAY_ROLE_MARKER) != std::string::npos)
		{
			return role;
		}
	}

	throw meshbridge_exception("terminating gateway ACL role not found");
}

void terminating_gateway_service_reconciler::attach_write_policy(const std::string& service_name)
{
	const std::string policy_name = write_policy_name(service_name);
	acl_role role = terminating_gateway_role();

	acl_policy policy;
	bool found = false;
	for(const auto& existing : m_consul->list_policies())
	{
		if(contains_policy_name(existing.name, policy_name))
		{
			policy = existing;
			found = true;
			break;
		}
	}

	if(!found)
	{
		acl_policy desired;
		desired.name = policy_name;
		desired.rules = write_policy_rules(service_name);

		LOG_INFO("Creating ACL policy %s", policy_name.c_str());
		policy = m_consul->create_policy(desired);
	}

	const bool linked = std::any_of(role.policies.begin(),
	                                role.policies.end(),
	                                [&policy_name](const acl_role_policy_link& link) {
		                                return contains_policy_name(link.name, policy_name);
	                                });
	if(linked)
	{
		return;
	}

	acl_role_policy_link link;
	link.id = policy.id;
	link.name = policy.name;
	role.policies.push_back(link);

	LOG_INFO("Linking ACL policy %s to role %s", policy_name.c_str(), role.name.c_str());
	m_consul->update_role(role);
}

void terminating_gateway_service_reconciler::detach_write_policy(const std::string& service_name)
{
	const std::string policy_name = write_policy_name(service_name);
	acl_role role = terminating_gateway_role();

	const auto link = std::find_if(role.policies.begin(),
	                               role.policies.end(),
	                               [&policy_name](const acl_role_policy_link& l) {
		                               return contains_policy_name(l.name, policy_name);
	                               });
	if(link != role.policies.end())
	{
		role.policies.erase(link);
		LOG_INFO("Unlinking ACL policy %s from role %s", policy_name.c_str(), role.name.c_str());
		m_consul->update_role(role);
	}

	for(const auto& policy : m_consul->list_policies())
	{
		if(contains_policy_name(policy.name, policy_name))
		{
			LOG_INFO("Deleting ACL policy %s", policy_name.c_str());
			m_consul->delete_policy(policy.id);
			return;
		}
	}

	LOG_DEBUG("ACL policy %s is already gone", policy_name.c_str());
}

bool terminating_gateway_service_reconciler::status_current(
    const terminating_gateway_service& resource) const
{
	const std::string policy_name =
	    m_acls_enabled ? write_policy_name(resource.spec.service.service) : "";

	if(!resource.has_service_info_ref ||
	   resource.status_ref.service_name != resource.spec.service.service ||
	   resource.status_ref.policy_name != policy_name)
	{
		return false;
	}

	for(const auto& cond : resource.conditions)
	{
		if(cond.type == "Synced")
		{
			return cond.status == CONDITION_TRUE;
		}
	}
	return false;
}

void terminating_gateway_service_reconciler::update_status(terminating_gateway_service& resource)
{
	const std::string now = m_now();

	resource.has_service_info_ref = true;
	resource.status_ref.service_name = resource.spec.service.service;
	resource.status_ref.policy_name =
	    m_acls_enabled ? write_policy_name(resource.spec.service.service) : "";
	resource.last_synced_time = now;
	resource.set_synced_condition(CONDITION_TRUE, "", "", now);

	m_k8s->update_terminating_gateway_status(resource);
}

void terminating_gateway_service_reconciler::update_status_error(
    terminating_gateway_service& resource,
    const std::string& message)
{
	resource.set_synced_condition(CONDITION_FALSE, REASON_ERROR_UPDATING_STATUS, message, m_now());

	try
	{
		m_k8s->update_terminating_gateway_status(resource);
	}
	catch(const std::exception& ex)
	{
		LOG_ERROR("Unable to record error on TerminatingGatewayService %s: %s",
		          resource.metadata.key().to_string().c_str(),
		          ex.what());
	}
}

} // namespace meshbridge
