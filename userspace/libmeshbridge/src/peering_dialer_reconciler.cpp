/**
 * @file
 *
 * Implementation of peering_dialer_reconciler.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "peering_dialer_reconciler.h"
#include "common_logger.h"
#include "meshbridge_exception.h"

COMMON_LOGGER();

namespace meshbridge
{

peering_dialer_reconciler::peering_dialer_reconciler(const k8s_client::ptr& k8s,
                                                     const consul_client::ptr& consul,
                                                     const time_source& now):
	m_k8s(k8s),
	m_consul(consul),
	m_now(now)
{
}

std::string peering_dialer_reconciler::name() const
{
	return "peeringdialer";
}

bool peering_dialer_reconciler::status_differs(const peering_resource& dialer,
                                               const secret& spec_secret)
{
	const secret_ref_status& current = dialer.status_secret;
	const secret_ref& wanted = dialer.spec_secret;

	return current.name != wanted.name || current.key != wanted.key ||
	       current.backend != wanted.backend ||
	       current.resource_version != spec_secret.metadata.resource_version ||
	       dialer.peering_version_bumped();
}

reconcile_result peering_dialer_reconciler::reconcile(const object_key& key)
{
	peering_resource dialer;

	if(!m_k8s->get_peering_resource(KIND_PEERING_DIALER, key, dialer))
	{
		LOG_INFO("PeeringDialer %s was deleted, deleting peering %s",
		         key.to_string().c_str(),
		         key.name.c_str());
		m_consul->delete_peering(key.name);
		return reconcile_result();
	}

	try
	{
		secret spec_secret;
		if(!dialer.has_spec_secret ||
		   !m_k8s->get_secret(object_key(dialer.metadata.ns, dialer.spec_secret.name),
		                      spec_secret))
		{
			throw meshbridge_exception("PeeringDialer spec.peer.secret does not exist");
		}

		bool have_status_secret = false;
		if(dialer.has_status_secret)
		{
			secret status_secret;
			have_status_secret = m_k8s->get_secret(
			    object_key(dialer.metadata.ns, dialer.status_secret.name),
			    status_secret);
		}

		if(!have_status_secret)
		{
			LOG_INFO("PeeringDialer %s has no usable status secret, establishing peering",
			         key.to_string().c_str());
			establish(dialer, spec_secret);
			return reconcile_result();
		}

		peering existing;
		if(!m_consul->read_peering(dialer.metadata.name, existing))
		{
			LOG_INFO("Peering %s does not exist, establishing it",
			         dialer.metadata.name.c_str());
			establish(dialer, spec_secret);
			return reconcile_result();
		}

		if(status_differs(dialer, spec_secret))
		{
			LOG_INFO("PeeringDialer %s secret or peering version changed, re-establishing peering",
			         key.to_string().c_str());
			establish(dialer, spec_secret);
		}
	}
	catch(const std::exception& ex)
	{
		update_status_error(dialer, ex.what());
		throw;
	}

	return reconcile_result();
}

void peering_dialer_reconciler::establish(peering_resource& dialer, const secret& spec_secret)
{
	const auto token = spec_secret.data.find(dialer.spec_secret.key);

	if(token == spec_secret.data.end())
	{
		throw meshbridge_exception("secret " + spec_secret.metadata.key().to_string() +
		                           " has no key " + dialer.spec_secret.key);
	}

	m_consul->establish_peering(dialer.metadata.name, token->second);

	dialer.has_status_secret = true;
	dialer.status_secret.name = dialer.spec_secret.name;
	dialer.status_secret.key = dialer.spec_secret.key;
	dialer.status_secret.backend = dialer.spec_secret.backend;
	dialer.status_secret.resource_version = spec_secret.metadata.resource_version;
	dialer.has_reconcile_error = false;
	dialer.reconcile_error = reconcile_error_status();
	dialer.last_reconcile_time = m_now();
	dialer.record_peering_version();

	m_k8s->update_peering_status(dialer);
}

void peering_dialer_reconciler::update_status_error(peering_resource& dialer,
                                                    const std::string& message)
{
	dialer.has_reconcile_error = true;
	dialer.reconcile_error.error = true;
	dialer.reconcile_error.message = message;
	dialer.last_reconcile_time = m_now();

	try
	{
		m_k8s->update_peering_status(dialer);
	}
	catch(const std::exception& ex)
	{
		LOG_ERROR("Unable to record error on PeeringDialer %s: %s",
		          dialer.metadata.key().to_string().c_str(),
		          ex.what());
	}
}

std::vector<object_key> peering_dialer_reconciler::requests_for_peering_token_secret(
    const object_key& secret_key) const
{
	std::vector<object_key> requests;

	for(const auto& dialer : m_k8s->list_peering_resources(KIND_PEERING_DIALER))
	{
		if(dialer.metadata.ns == secret_key.ns && dialer.has_spec_secret &&
		   dialer.spec_secret.name == secret_key.name)
		{
			requests.push_back(dialer.metadata.key());
		}
	}

	return requests;
}

} // namespace meshbridge
