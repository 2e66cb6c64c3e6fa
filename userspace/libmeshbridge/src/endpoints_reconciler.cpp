/**
 * @file
 *
 * Implementation of endpoints_reconciler.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "endpoints_reconciler.h"
#include "annotations.h"
#include "common_logger.h"
#include "meshbridge_exception.h"
#include "pod_settings.h"
#include "token_metadata.h"

COMMON_LOGGER();

namespace
{

const std::string HEALTH_CHECK_NAME = "Kubernetes Health Check";
const std::string HEALTH_CHECK_TTL = "100000h";
const std::string TARGET_KIND_POD = "Pod";

} // end namespace

namespace meshbridge
{

endpoints_reconciler::endpoints_reconciler(const k8s_client::ptr& k8s,
                                           const std::shared_ptr<agent_directory>& agents,
                                           const registration_builder& builder,
                                           const namespace_policy& policy,
                                           const std::string& auth_method):
	m_k8s(k8s),
	m_agents(agents),
	m_builder(builder),
	m_policy(policy),
	m_auth_method(auth_method)
{
}

std::string endpoints_reconciler::name() const
{
	return "endpoints";
}

reconcile_result endpoints_reconciler::reconcile(const object_key& key)
{
	if(m_policy.should_ignore(key.ns))
	{
		return reconcile_result();
	}

	endpoints ep;
	if(!m_k8s->get_endpoints(key, ep))
	{
		LOG_INFO("Endpoints %s is gone, deregistering all instances",
		         key.to_string().c_str());
		deregister_service_on_all_agents(key.name, key.ns, nullptr);
		return reconcile_result();
	}

	if(pod_settings::is_labeled_ignore(ep.metadata.labels))
	{
		LOG_INFO("Endpoints %s is labeled %s, deregistering all instances",
		         key.to_string().c_str(),
		         annotations::LABEL_SERVICE_IGNORE.c_str());
		deregister_service_on_all_agents(key.name, key.ns, nullptr);
		return reconcile_result();
	}

	error_accumulator errors;
	std::set<std::string> addresses;

	for(const auto& subset : ep.subsets)
	{
		for(const std::string& status : {HEALTH_PASSING, HEALTH_CRITICAL})
		{
			const auto& list = status == HEALTH_PASSING ? subset.addresses :
			                                              subset.not_ready_addresses;

			for(const auto& address : list)
			{
				if(!address.has_target_ref || address.target_ref.kind != TARGET_KIND_POD)
				{
					continue;
				}

				const object_key pod_key(address.target_ref.ns, address.target_ref.name);

				try
				{
					pod p;
					bool found = false;

					try
					{
						found = m_k8s->get_pod(pod_key, p);
					}
					catch(const api_exception& ex)
					{
						// Only a pod known to be gone loses its registration.
						if(!ex.is_not_found())
						{
							addresses.insert(address.ip);
						}
						throw;
					}
					catch(const std::exception&)
					{
						addresses.insert(address.ip);
						throw;
					}

					if(!found)
					{
						throw meshbridge_exception("pod " + pod_key.to_string() +
						                           " not found");
					}

					std::string k8s_service;
					if(p.metadata.get_annotation(annotations::KUBERNETES_SERVICE, k8s_service) &&
					   k8s_service != ep.metadata.name)
					{
						LOG_DEBUG("Pod %s belongs to service %s, not %s",
						          pod_key.to_string().c_str(),
						          k8s_service.c_str(),
						          ep.metadata.name.c_str());
						continue;
					}

					if(pod_settings::has_been_injected(p))
					{
						register_services_and_health_check(p, ep, status, addresses);
					}
				}
				catch(const std::exception& ex)
				{
					LOG_ERROR("Unable to register pod %s of %s: %s",
					          pod_key.to_string().c_str(),
					          key.to_string().c_str(),
					          ex.what());
					errors.add(ex);
				}
			}
		}
	}

	try
	{
		deregister_service_on_all_agents(ep.metadata.name, ep.metadata.ns, &addresses);
	}
	catch(const std::exception& ex)
	{
		errors.add(ex);
	}

	errors.throw_if_any();
	return reconcile_result();
}

void endpoints_reconciler::register_services_and_health_check(const pod& p,
                                                              const endpoints& ep,
                                                              const std::string& health_status,
                                                              std::set<std::string>& addresses)
{
	addresses.insert(p.pod_ip);

	const consul_client::ptr client = m_agents->client_for_pod(p);

	if(pod_settings::managed_by_endpoints_controller(p))
	{
		const service_registrations regs = m_builder.build(p, ep);

		// The proxy's alias check needs the service to exist.
		LOG_INFO("Registering service %s (%s)", regs.service.id.c_str(), p.host_ip.c_str());
		client->register_service(regs.service);

		LOG_INFO("Registering proxy service %s", regs.proxy.id.c_str());
		client->register_service(regs.proxy);
	}

	const std::string service_id = registration::service_id(p, ep);
	upsert_health_check(*client,
	                    p,
	                    service_id,
	                    registration::health_check_id(p, service_id),
	                    health_status);
}

void endpoints_reconciler::upsert_health_check(consul_client& client,
                                               const pod& p,
                                               const std::string& service_id,
                                               const std::string& check_id,
                                               const std::string& status)
{
	const query_options scope = m_policy.query_for(p.metadata.ns);
	const std::string reason = registration::health_check_reason(status, p);
	agent_check existing;

	if(!client.get_check(check_id, existing, scope))
	{
		check_registration check;
		check.id = check_id;
		check.name = HEALTH_CHECK_NAME;
		check.service_id = service_id;
		check.ns = scope.ns;
		check.ttl = HEALTH_CHECK_TTL;
		check.status = status;
		check.success_before_passing = 1;
		check.failures_before_critical = 1;

		try
		{
			client.register_check(check);
		}
		catch(const api_exception& ex)
		{
			const std::string message = ex.what();

			if(message.find(service_id + "\" does not exist") != std::string::npos)
			{
				throw api_exception("service \"" + service_id +
				                        "\" not found in Consul: unable to register health check",
				                    ex.get_code());
			}
			throw api_exception("registering health check for service \"" + service_id +
			                        "\": " + message,
			                    ex.get_code());
		}

		// The output shown for a check can only be set by an update.
		LOG_INFO("Setting new health check %s to %s", check_id.c_str(), status.c_str());
		client.update_ttl(check_id, reason, status, scope);
	}
	else if(existing.status != status)
	{
		LOG_INFO("Updating health check %s from %s to %s",
		         check_id.c_str(),
		         existing.status.c_str(),
		         status.c_str());
		client.update_ttl(check_id, reason, status, scope);
	}
}

void endpoints_reconciler::deregister_service_on_all_agents(
    const std::string& k8s_service_name,
    const std::string& k8s_namespace,
    const std::set<std::string>* addresses)
{
	const query_options scope = m_policy.query_for(k8s_namespace);
	error_accumulator errors;

	for(const auto& agent : m_agents->reachable_agents())
	{
		try
		{
			const std::map<std::string, agent_service> instances =
			    agent.client->services_for_k8s_service(k8s_service_name, k8s_namespace, scope);

			for(const auto& instance : instances)
			{
				const agent_service& svc = instance.second;

				if(addresses != nullptr && addresses->count(svc.address) > 0)
				{
					continue;
				}

				LOG_INFO("Deregistering %s from agent %s",
				         instance.first.c_str(),
				         agent.name.c_str());
				agent.client->deregister_service(instance.first, scope);

				if(!m_auth_method.empty())
				{
					const auto pod_name = svc.meta.find(META_KEY_POD_NAME);

					delete_acl_tokens_for_service_instance(
					    *agent.client,
					    svc.service,
					    k8s_namespace,
					    pod_name == svc.meta.end() ? "" : pod_name->second);
				}
			}
		}
		catch(const std::exception& ex)
		{
			LOG_ERROR("Unable to deregister %s/%s on agent %s: %s",
			          k8s_namespace.c_str(),
			          k8s_service_name.c_str(),
			          agent.name.c_str(),
			          ex.what());
			errors.add(ex);
		}
	}

	errors.throw_if_any();
}

void endpoints_reconciler::delete_acl_tokens_for_service_instance(
    consul_client& client,
    const std::string& service_name,
    const std::string& k8s_namespace,
    const std::string& pod_name)
{
	if(pod_name.empty())
	{
		return;
	}

	const query_options scope = m_policy.query_for(k8s_namespace);

	for(const auto& token : client.list_tokens(scope))
	{
		if(token.auth_method != m_auth_method || token.service_identities.size() != 1 ||
		   token.service_identities[0] != service_name)
		{
			continue;
		}

		std::map<std::string, std::string> meta;
		if(!token_metadata::parse(token.description, meta))
		{
			LOG_DEBUG("Token %s carries no pod metadata, leaving it",
			          token.accessor_id.c_str());
			continue;
		}

		if(token_metadata::owned_by_pod(meta, k8s_namespace, pod_name))
		{
			LOG_INFO("Deleting ACL token %s of pod %s/%s",
			         token.accessor_id.c_str(),
			         k8s_namespace.c_str(),
			         pod_name.c_str());
			client.delete_token(token.accessor_id, scope);
		}
	}
}

std::vector<object_key> endpoints_reconciler::requests_for_agent_pod(
    const object_key& agent_key) const
{
	std::vector<object_key> requests;
	pod agent;

	try
	{
		if(!m_k8s->get_pod(agent_key, agent))
		{
			return requests;
		}
	}
	catch(const api_exception& ex)
	{
		LOG_ERROR("Unable to get Consul client pod %s: %s",
		          agent_key.to_string().c_str(),
		          ex.what());
		return requests;
	}

	if(!m_agents->is_agent_pod(agent))
	{
		return requests;
	}

	if(!agent.is_running() || !agent.is_ready())
	{
		LOG_INFO("Ignoring Consul client pod %s, it is not running and ready",
		         agent_key.to_string().c_str());
		return requests;
	}

	std::vector<endpoints> all;
	try
	{
		all = m_k8s->list_endpoints();
	}
	catch(const api_exception& ex)
	{
		LOG_ERROR("Unable to list endpoints: %s", ex.what());
		return requests;
	}

	std::set<object_key> keys;
	for(const auto& ep : all)
	{
		for(const auto& subset : ep.subsets)
		{
			for(const auto* list : {&subset.addresses, &subset.not_ready_addresses})
			{
				for(const auto& address : *list)
				{
					if(!address.node_name.empty() && address.node_name == agent.node_name)
					{
						keys.insert(ep.metadata.key());
					}
				}
			}
		}
	}

	requests.assign(keys.begin(), keys.end());
	return requests;
}

} // namespace meshbridge
