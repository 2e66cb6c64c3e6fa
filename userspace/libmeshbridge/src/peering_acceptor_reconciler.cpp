/**
 * @file
 *
 * Implementation of peering_acceptor_reconciler.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "peering_acceptor_reconciler.h"
#include "annotations.h"
#include "common_logger.h"
#include "meshbridge_exception.h"

COMMON_LOGGER();

namespace
{

const std::string SECRET_TYPE_OPAQUE = "Opaque";

} // end namespace

namespace meshbridge
{

const char* to_string(const acceptor_state state)
{
	switch(state)
	{
	case acceptor_state::deleting:
		return "deleting";
	case acceptor_state::no_peering:
		return "no_peering";
	case acceptor_state::in_sync:
		return "in_sync";
	case acceptor_state::drift:
		return "drift";
	case acceptor_state::backend_changed:
		return "backend_changed";
	}
	return "unknown";
}

const char* to_string(const drift_reason reason)
{
	switch(reason)
	{
	case drift_reason::none:
		return "none";
	case drift_reason::no_status:
		return "no_status";
	case drift_reason::name_changed:
		return "name_changed";
	case drift_reason::key_changed:
		return "key_changed";
	case drift_reason::secret_changed:
		return "secret_changed";
	case drift_reason::version_bumped:
		return "version_bumped";
	}
	return "unknown";
}

acceptor_decision classify_acceptor(const bool resource_exists,
                                    const bool peering_exists,
                                    const peering_resource& acceptor,
                                    const secret* status_secret)
{
	acceptor_decision decision;

	if(!resource_exists)
	{
		decision.state = acceptor_state::deleting;
		return decision;
	}

	if(!peering_exists)
	{
		decision.state = acceptor_state::no_peering;
		return decision;
	}

	decision.state = acceptor_state::drift;

	if(!acceptor.has_status_secret)
	{
		decision.reason = drift_reason::no_status;
		return decision;
	}

	const secret_ref_status& current = acceptor.status_secret;
	const secret_ref& wanted = acceptor.spec_secret;

	if(current.name != wanted.name)
	{
		decision.reason = drift_reason::name_changed;
		return decision;
	}

	if(current.key != wanted.key)
	{
		decision.reason = drift_reason::key_changed;
		return decision;
	}

	if(current.backend != wanted.backend)
	{
		decision.state = acceptor_state::backend_changed;
		return decision;
	}

	if(acceptor.peering_version_bumped())
	{
		decision.reason = drift_reason::version_bumped;
		return decision;
	}

	if(status_secret == nullptr ||
	   status_secret->metadata.resource_version != current.resource_version)
	{
		decision.reason = drift_reason::secret_changed;
		return decision;
	}

	decision.state = acceptor_state::in_sync;
	return decision;
}

peering_acceptor_reconciler::peering_acceptor_reconciler(const k8s_client::ptr& k8s,
                                                         const consul_client::ptr& consul,
                                                         const time_source& now):
	m_k8s(k8s),
	m_consul(consul),
	m_now(now)
{
}

std::string peering_acceptor_reconciler::name() const
{
	return "peeringacceptor";
}

reconcile_result peering_acceptor_reconciler::reconcile(const object_key& key)
{
	peering_resource acceptor;

	if(!m_k8s->get_peering_resource(KIND_PEERING_ACCEPTOR, key, acceptor))
	{
		acceptor.kind = KIND_PEERING_ACCEPTOR;
		acceptor.metadata.ns = key.ns;
		acceptor.metadata.name = key.name;
		apply(classify_acceptor(false, false, acceptor, nullptr), acceptor, nullptr);
		return reconcile_result();
	}

	try
	{
		if(!acceptor.has_spec_secret || acceptor.spec_secret.name.empty())
		{
			throw meshbridge_exception("PeeringAcceptor spec.peer.secret is not set");
		}

		peering existing;
		const bool peering_exists = m_consul->read_peering(acceptor.metadata.name, existing);

		secret status_secret;
		bool have_status_secret = false;
		if(acceptor.has_status_secret)
		{
			have_status_secret = m_k8s->get_secret(
			    object_key(acceptor.metadata.ns, acceptor.status_secret.name),
			    status_secret);
		}

		const secret* current = have_status_secret ? &status_secret : nullptr;
		const acceptor_decision decision =
		    classify_acceptor(true, peering_exists, acceptor, current);

		LOG_DEBUG("PeeringAcceptor %s: %s (%s)",
		          key.to_string().c_str(),
		          to_string(decision.state),
		          to_string(decision.reason));

		apply(decision, acceptor, current);
	}
	catch(const std::exception& ex)
	{
		update_status_error(acceptor, ex.what());
		throw;
	}

	return reconcile_result();
}

void peering_acceptor_reconciler::apply(const acceptor_decision& decision,
                                        peering_resource& acceptor,
                                        const secret* status_secret)
{
	switch(decision.state)
	{
	case acceptor_state::deleting:
		LOG_INFO("PeeringAcceptor %s was deleted, deleting peering %s",
		         acceptor.metadata.key().to_string().c_str(),
		         acceptor.metadata.name.c_str());
		m_consul->delete_peering(acceptor.metadata.name);
		break;

	case acceptor_state::in_sync:
		break;

	case acceptor_state::no_peering:
		// A stale token must not survive the peering it belonged to.
		if(status_secret != nullptr)
		{
			LOG_INFO("Peering %s does not exist, deleting secret %s",
			         acceptor.metadata.name.c_str(),
			         status_secret->metadata.name.c_str());
			m_k8s->delete_secret(status_secret->metadata.key());
		}
		regenerate(acceptor, false);
		break;

	case acceptor_state::drift:
		regenerate(acceptor,
		           decision.reason == drift_reason::name_changed && status_secret != nullptr);
		break;

	case acceptor_state::backend_changed:
		throw meshbridge_exception("PeeringAcceptor backend cannot be changed");
	}
}

void peering_acceptor_reconciler::regenerate(peering_resource& acceptor,
                                             const bool delete_old_secret)
{
	const std::string old_secret = acceptor.status_secret.name;

	LOG_INFO("Generating peering token for %s", acceptor.metadata.name.c_str());
	const std::string token = m_consul->generate_peering_token(acceptor.metadata.name);

	std::string resource_version;
	if(acceptor.spec_secret.backend == SECRET_BACKEND_KUBERNETES)
	{
		resource_version = store_token(acceptor, token);
	}

	// Only once the new secret exists may the old one go.
	if(delete_old_secret)
	{
		LOG_INFO("Deleting renamed peering token secret %s", old_secret.c_str());
		m_k8s->delete_secret(object_key(acceptor.metadata.ns, old_secret));
	}

	update_status(acceptor, resource_version);
}

std::string peering_acceptor_reconciler::store_token(const peering_resource& acceptor,
                                                     const std::string& token)
{
	const object_key secret_key(acceptor.metadata.ns, acceptor.spec_secret.name);
	secret desired;

	desired.metadata.name = secret_key.name;
	desired.metadata.ns = secret_key.ns;
	desired.metadata.labels[annotations::LABEL_PEERING_TOKEN] = "true";
	desired.type = SECRET_TYPE_OPAQUE;
	desired.data[acceptor.spec_secret.key] = token;

	owner_reference owner;
	owner.api_version = CRD_GROUP_VERSION;
	owner.kind = KIND_PEERING_ACCEPTOR;
	owner.name = acceptor.metadata.name;
	owner.uid = acceptor.metadata.uid;
	owner.controller = true;
	owner.block_owner_deletion = true;
	desired.metadata.owner_references.push_back(owner);

	secret existing;
	if(m_k8s->get_secret(secret_key, existing))
	{
		// Replace whatever the secret held, whoever created it.
		desired.metadata.resource_version = existing.metadata.resource_version;
		return m_k8s->update_secret(desired).metadata.resource_version;
	}

	return m_k8s->create_secret(desired).metadata.resource_version;
}

void peering_acceptor_reconciler::update_status(peering_resource& acceptor,
                                                const std::string& resource_version)
{
	acceptor.has_status_secret = true;
	acceptor.status_secret.name = acceptor.spec_secret.name;
	acceptor.status_secret.key = acceptor.spec_secret.key;
	acceptor.status_secret.backend = acceptor.spec_secret.backend;
	acceptor.status_secret.resource_version = resource_version;
	acceptor.has_reconcile_error = false;
	acceptor.reconcile_error = reconcile_error_status();
	acceptor.last_reconcile_time = m_now();
	acceptor.record_peering_version();

	m_k8s->update_peering_status(acceptor);
}

void peering_acceptor_reconciler::update_status_error(peering_resource& acceptor,
                                                      const std::string& message)
{
	acceptor.has_reconcile_error = true;
	acceptor.reconcile_error.error = true;
	acceptor.reconcile_error.message = message;
	acceptor.last_reconcile_time = m_now();

	try
	{
		m_k8s->update_peering_status(acceptor);
	}
	catch(const std::exception& ex)
	{
		LOG_ERROR("Unable to record error on PeeringAcceptor %s: %s",
		          acceptor.metadata.key().to_string().c_str(),
		          ex.what());
	}
}

std::vector<object_key> peering_acceptor_reconciler::requests_for_peering_token_secret(
    const object_key& secret_key) const
{
	std::vector<object_key> requests;

	for(const auto& acceptor : m_k8s->list_peering_resources(KIND_PEERING_ACCEPTOR))
	{
		if(acceptor.metadata.ns == secret_key.ns && acceptor.has_status_secret &&
		   acceptor.status_secret.name == secret_key.name)
		{
			requests.push_back(acceptor.metadata.key());
		}
	}

	return requests;
}

} // namespace meshbridge
