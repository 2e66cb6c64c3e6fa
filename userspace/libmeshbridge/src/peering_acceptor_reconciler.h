/**
 * @file
 *
 * Interface to peering_acceptor_reconciler, which generates the peering
 * token of a PeeringAcceptor and keeps it stored in the secret the
 * resource names.
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

enum class acceptor_state
{
	/** The resource is gone; so must be the peering. */
	deleting,

	/** Consul has no peering of this name. */
	no_peering,

	/** The stored token is current. */
	in_sync,

	/** The stored token must be regenerated; see drift_reason. */
	drift,

	/** The status names another backend than the spec. */
	backend_changed,
};

enum class drift_reason
{
	none,
	no_status,
	name_changed,
	key_changed,
	secret_changed,
	version_bumped,
};

struct acceptor_decision
{
	acceptor_state state = acceptor_state::in_sync;
	drift_reason reason = drift_reason::none;
};

const char* to_string(acceptor_state state);
const char* to_string(drift_reason reason);

/**
 * Decide what a pass must do. This makes no calls.
 *
 * @param[in] resource_exists  whether the PeeringAcceptor exists.
 * @param[in] peering_exists   whether Consul has the peering.
 * @param[in] acceptor         the resource, if it exists.
 * @param[in] status_secret    the secret the status names, or null if
 *                             it is missing or the status names none.
 *
 * @throws meshbridge_exception if the peering-version annotation is not
 *         a number.
 */
acceptor_decision classify_acceptor(bool resource_exists,
                                    bool peering_exists,
                                    const peering_resource& acceptor,
                                    const secret* status_secret);

class peering_acceptor_reconciler : public reconciler
{
public:
	peering_acceptor_reconciler(const k8s_client::ptr& k8s,
	                            const consul_client::ptr& consul,
	                            const time_source& now = rfc3339_now);

	reconcile_result reconcile(const object_key& key) override;

	std::string name() const override;

	/**
	 * @returns the acceptors whose status names the given peering token
	 *          secret.
	 */
	std::vector<object_key> requests_for_peering_token_secret(const object_key& secret_key) const;

private:
	/**
	 * Carry out the decision for the acceptor. For deleting, only the
	 * acceptor's name is used.
	 */
	void apply(const acceptor_decision& decision,
	           peering_resource& acceptor,
	           const secret* status_secret);

	void regenerate(peering_resource& acceptor, bool delete_old_secret);

	/**
	 * Create the secret, or replace the contents of an existing one.
	 *
	 * @returns the resourceVersion of the stored secret.
	 */
	std::string store_token(const peering_resource& acceptor, const std::string& token);

	void update_status(peering_resource& acceptor, const std::string& resource_version);

	/**
	 * Record the error in the status. A failure to do so is logged; the
	 * caller still propagates the original error.
	 */
	void update_status_error(peering_resource& acceptor, const std::string& message);

	const k8s_client::ptr m_k8s;
	const consul_client::ptr m_consul;
	const time_source m_now;
};

} // namespace meshbridge
