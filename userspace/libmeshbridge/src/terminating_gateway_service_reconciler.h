/**
 * @file
 *
 * Interface to terminating_gateway_service_reconciler, which registers the
 * external services described by TerminatingGatewayService resources in
 * the Consul catalog and grants the terminating gateway write access to
 * them.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "consul_client.h"
#include "crd_types.h"
#include "k8s_client.h"
#include "reconciler.h"

#include <string>
#include <vector>

namespace meshbridge
{

enum class gateway_service_state
{
	/** Not in Kubernetes, nothing to do. */
	gone,

	/** Marked for deletion and still holding our finalizer. */
	deleting,

	/** Not yet in the catalog. */
	unregistered,

	/** In the catalog as described. */
	in_sync,

	/** In the catalog, but some field differs from the description. */
	drift,
};

const char* to_string(gateway_service_state state);

/**
 * Decide what a pass must do. This makes no calls.
 *
 * @param[in] resource_exists whether the resource exists.
 * @param[in] resource        the resource, if it exists.
 * @param[in] registered      the catalog entry, or null if there is none.
 */
gateway_service_state classify_gateway_service(bool resource_exists,
                                               const terminating_gateway_service& resource,
                                               const catalog_service* registered);

/**
 * @returns true if any field of the catalog entry differs from the spec.
 */
bool catalog_entry_differs(const catalog_service& registered,
                           const external_registration_spec& spec);

/**
 * @returns the catalog registration a spec describes.
 */
catalog_registration registration_for(const external_registration_spec& spec);

/**
 * @returns the name of the write policy of the given service.
 */
std::string write_policy_name(const std::string& service_name);

/**
 * @returns the rules of the write policy of the given service.
 */
std::string write_policy_rules(const std::string& service_name);

class terminating_gateway_service_reconciler : public reconciler
{
public:
	/**
	 * @param[in] acls_enabled whether to manage the write policy of each
	 *                         service.
	 */
	terminating_gateway_service_reconciler(const k8s_client::ptr& k8s,
	                                       const consul_client::ptr& consul,
	                                       bool acls_enabled,
	                                       const time_source& now = rfc3339_now);

	reconcile_result reconcile(const object_key& key) override;

	std::string name() const override;

private:
	/**
	 * @returns true with the single catalog entry of the service in out,
	 *          or false if there is none. Several entries are an error.
	 */
	bool find_registration(const std::string& service_name, catalog_service& out);

	void deregister(const catalog_service& registered);

	/**
	 * Create the service's write policy if needed and link it to the
	 * terminating gateway's role if it is not linked already.
	 */
	void attach_write_policy(const std::string& service_name);

	/**
	 * Unlink the service's write policy from the role and delete it.
	 * Either being gone already is fine.
	 */
	void detach_write_policy(const std::string& service_name);

	acl_role terminating_gateway_role();

	/**
	 * @returns true if the status already records a successful sync of
	 *          the current spec.
	 */
	bool status_current(const terminating_gateway_service& resource) const;

	void update_status(terminating_gateway_service& resource);
	void update_status_error(terminating_gateway_service& resource, const std::string& message);

	const k8s_client::ptr m_k8s;
	const consul_client::ptr m_consul;
	const bool m_acls_enabled;
	const time_source m_now;
};

} // namespace meshbridge
