/**
 * @file
 *
 * Interface to peering_dialer_reconciler, which establishes the peering
 * a PeeringDialer describes using the token stored in its secret.
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

class peering_dialer_reconciler : public reconciler
{
public:
	peering_dialer_reconciler(const k8s_client::ptr& k8s,
	                          const consul_client::ptr& consul,
	                          const time_source& now = rfc3339_now);

	reconcile_result reconcile(const object_key& key) override;

	std::string name() const override;

	/**
	 * @returns the dialers whose spec names the given secret.
	 */
	std::vector<object_key> requests_for_peering_token_secret(const object_key& secret_key) const;

	/**
	 * @returns true if the recorded secret no longer matches the spec or
	 *          the secret's current version, or if the peering-version
	 *          annotation was raised.
	 */
	static bool status_differs(const peering_resource& dialer, const secret& spec_secret);

private:
	void establish(peering_resource& dialer, const secret& spec_secret);

	void update_status_error(peering_resource& dialer, const std::string& message);

	const k8s_client::ptr m_k8s;
	const consul_client::ptr m_consul;
	const time_source m_now;
};

} // namespace meshbridge
