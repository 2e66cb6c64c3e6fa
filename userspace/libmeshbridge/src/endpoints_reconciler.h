/**
 * @file
 *
 * Interface to endpoints_reconciler, which keeps the Consul registrations
 * of injected pods in line with the Kubernetes Endpoints objects that
 * list them.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "agent_directory.h"
#include "consul_client.h"
#include "k8s_client.h"
#include "namespace_policy.h"
#include "reconciler.h"
#include "registration_builder.h"

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace meshbridge
{

/**
 * One pass over an Endpoints object:
 *
 * 1. A missing or service-ignore labeled object deregisters every
 *    instance of the service.
 * 2. Every ready and not-ready address backed by an injected pod is
 *    registered (service first, then its proxy) and its TTL health check
 *    is set to passing or critical.
 * 3. Instances whose address is no longer listed are deregistered, and
 *    with an auth method configured, their pods' ACL tokens deleted.
 *
 * A failing address does not stop the others; all failures are reported
 * together at the end of the pass.
 */
class endpoints_reconciler : public reconciler
{
public:
	/**
	 * @param[in] auth_method name of the Kubernetes auth method pods log
	 *                        in with, or empty if ACL tokens need no
	 *                        cleanup.
	 */
	endpoints_reconciler(const k8s_client::ptr& k8s,
	                     const std::shared_ptr<agent_directory>& agents,
	                     const registration_builder& builder,
	                     const namespace_policy& policy,
	                     const std::string& auth_method);

	reconcile_result reconcile(const object_key& key) override;

	std::string name() const override;

	/**
	 * @returns the Endpoints keys to reconcile after a client agent pod
	 *          changed: those with an address on the agent's node. Nothing
	 *          when the agent is missing, not running or not ready.
	 */
	std::vector<object_key> requests_for_agent_pod(const object_key& agent_key) const;

private:
	void register_services_and_health_check(const pod& p,
	                                        const endpoints& ep,
	                                        const std::string& health_status,
	                                        std::set<std::string>& addresses);

	void upsert_health_check(consul_client& client,
	                         const pod& p,
	                         const std::string& service_id,
	                         const std::string& check_id,
	                         const std::string& status);

	/**
	 * Deregister the service's instances on every reachable agent. With
	 * addresses null every instance goes, otherwise only those whose
	 * address is not in the set.
	 */
	void deregister_service_on_all_agents(const std::string& k8s_service_name,
	                                      const std::string& k8s_namespace,
	                                      const std::set<std::string>* addresses);

	void delete_acl_tokens_for_service_instance(consul_client& client,
	                                            const std::string& service_name,
	                                            const std::string& k8s_namespace,
	                                            const std::string& pod_name);

	const k8s_client::ptr m_k8s;
	const std::shared_ptr<agent_directory> m_agents;
	const registration_builder m_builder;
	const namespace_policy m_policy;
	const std::string m_auth_method;
};

} // namespace meshbridge
