/**
 * @file
 *
 * Interface to controller -- the reconcilers of meshbridge-controller
 * together with the pollers and work queues that drive them.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "agent_directory.h"
#include "consul_client.h"
#include "controller_config.h"
#include "endpoints_reconciler.h"
#include "k8s_client.h"
#include "peering_acceptor_reconciler.h"
#include "peering_dialer_reconciler.h"
#include "resource_poller.h"
#include "terminating_gateway_service_reconciler.h"
#include "work_queue.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace meshbridge
{

/**
 * Owns one work queue per reconciler and the pollers feeding them:
 *
 *   endpoints               -> endpoints
 *   Consul client pods      -> endpoints on the same node (per_node only)
 *   PeeringAcceptors        -> peering acceptor      (enable_peering)
 *   PeeringDialers          -> peering dialer        (enable_peering)
 *   secrets                 -> acceptors and dialers referring to them
 *   TerminatingGatewayServices -> terminating gateway (enable_terminating_gateway)
 */
class controller
{
public:
	controller(const controller_settings& settings,
	           const k8s_client::ptr& k8s,
	           const consul_client::ptr& consul,
	           const agent_directory::client_factory& agent_factory,
	           const time_source& now = rfc3339_now);
	~controller();

	controller(const controller&) = delete;
	controller& operator=(const controller&) = delete;

	/**
	 * Start the work queues, then the pollers. Every poller lists its
	 * kind right away.
	 */
	void start();

	/**
	 * Stop polling, then stop the work queues.
	 */
	void stop();

	/**
	 * @returns true if every work queue became idle within timeout_ms.
	 */
	bool wait_until_idle(uint64_t timeout_ms) const;

	/**
	 * Names of the reconcilers that were enabled.
	 */
	std::vector<std::string> reconcilers() const;

private:
	struct loop
	{
		reconciler* target;
		std::unique_ptr<work_queue> queue;
	};

	work_queue& add_loop(reconciler& target);
	void add_poller(const std::string& name,
	                const resource_poller::lister& list,
	                const resource_poller::sink& on_change);
	void on_secret_change(const object_key& key);

	const controller_settings m_settings;
	const k8s_client::ptr m_k8s;
	const std::shared_ptr<agent_directory> m_agents;

	std::unique_ptr<endpoints_reconciler> m_endpoints;
	std::unique_ptr<peering_acceptor_reconciler> m_acceptor;
	std::unique_ptr<peering_dialer_reconciler> m_dialer;
	std::unique_ptr<terminating_gateway_service_reconciler> m_gateway;

	work_queue* m_endpoints_queue;
	work_queue* m_acceptor_queue;
	work_queue* m_dialer_queue;
	work_queue* m_gateway_queue;

	std::vector<loop> m_loops;
	std::vector<std::unique_ptr<resource_poller>> m_pollers;
	bool m_started;
};

} // namespace meshbridge
