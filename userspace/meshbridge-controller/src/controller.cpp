/**
 * @file
 *
 * Implementation of controller.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "controller.h"
#include "common_logger.h"
#include "meshbridge_exception.h"
#include "metrics_config.h"
#include "namespace_policy.h"
#include "registration_builder.h"

#include <map>

COMMON_LOGGER();

namespace
{

using namespace meshbridge;

template<typename object_type>
std::map<object_key, std::string> versions_of(const std::vector<object_type>& objects)
{
	std::map<object_key, std::string> versions;

	for(const auto& obj : objects)
	{
		versions[obj.metadata.key()] = obj.metadata.resource_version;
	}

	return versions;
}

std::shared_ptr<agent_directory> make_agent_directory(
    const controller_settings& settings,
    const k8s_client::ptr& k8s,
    const consul_client::ptr& consul,
    const agent_directory::client_factory& agent_factory)
{
	if(settings.topology == agent_topology::per_node)
	{
		return std::make_shared<agent_directory>(k8s,
		                                         settings.release_name,
		                                         settings.release_namespace,
		                                         agent_factory);
	}

	return std::make_shared<agent_directory>(consul);
}

} // end namespace

namespace meshbridge
{

controller::controller(const controller_settings& settings,
                       const k8s_client::ptr& k8s,
                       const consul_client::ptr& consul,
                       const agent_directory::client_factory& agent_factory,
                       const time_source& now):
	m_settings(settings),
	m_k8s(k8s),
	m_agents(make_agent_directory(settings, k8s, consul, agent_factory)),
	m_endpoints_queue(nullptr),
	m_acceptor_queue(nullptr),
	m_dialer_queue(nullptr),
	m_gateway_queue(nullptr),
	m_started(false)
{
	const namespace_policy policy(settings.namespaces);
	const registration_builder builder(settings.registration,
	                                   policy,
	                                   metrics_config(settings.metrics),
	                                   k8s,
	                                   consul);

	m_endpoints.reset(
	    new endpoints_reconciler(k8s, m_agents, builder, policy, settings.auth_method));
	m_endpoints_queue = &add_loop(*m_endpoints);

	add_poller("endpoints",
	           [this]() { return versions_of(m_k8s->list_endpoints()); },
	           [this](const object_key& key) { m_endpoints_queue->add(key); });

	if(settings.topology == agent_topology::per_node)
	{
		add_poller("consul client pods",
		           [this]() {
			           return versions_of(m_k8s->list_pods(m_settings.release_namespace,
			                                               m_agents->agent_label_selector()));
		           },
		           [this](const object_key& key) {
			           for(const auto& request : m_endpoints->requests_for_agent_pod(key))
			           {
				           m_endpoints_queue->add(request);
			           }
		           });
	}

	if(settings.enable_peering)
	{
		m_acceptor.reset(new peering_acceptor_reconciler(k8s, consul, now));
		m_acceptor_queue = &add_loop(*m_acceptor);
		m_dialer.reset(new peering_dialer_reconciler(k8s, consul, now));
		m_dialer_queue = &add_loop(*m_dialer);

		add_poller("peering acceptors",
		           [this]() {
			           return versions_of(m_k8s->list_peering_resources(KIND_PEERING_ACCEPTOR));
		           },
		           [this](const object_key& key) { m_acceptor_queue->add(key); });
		add_poller("peering dialers",
		           [this]() {
			           return versions_of(m_k8s->list_peering_resources(KIND_PEERING_DIALER));
		           },
		           [this](const object_key& key) { m_dialer_queue->add(key); });
		add_poller("secrets",
		           [this]() { return versions_of(m_k8s->list_secrets("")); },
		           [this](const object_key& key) { on_secret_change(key); });
	}

	if(settings.enable_terminating_gateway)
	{
		m_gateway.reset(
		    new terminating_gateway_service_reconciler(k8s, consul, settings.acls_enabled, now));
		m_gateway_queue = &add_loop(*m_gateway);

		add_poller("terminating gateway services",
		           [this]() { return versions_of(m_k8s->list_terminating_gateway_services()); },
		           [this](const object_key& key) { m_gateway_queue->add(key); });
	}
}

controller::~controller()
{
	stop();
}

work_queue& controller::add_loop(reconciler& target)
{
	loop l;

	l.target = &target;
	l.queue.reset(new work_queue(target,
	                             m_settings.worker_threads,
	                             m_settings.base_requeue_delay_ms,
	                             m_settings.max_requeue_delay_ms));
	m_loops.push_back(std::move(l));

	return *m_loops.back().queue;
}

void controller::add_poller(const std::string& name,
                            const resource_poller::lister& list,
                            const resource_poller::sink& on_change)
{
	m_pollers.emplace_back(new resource_poller(name,
	                                           list,
	                                           on_change,
	                                           m_settings.poll_interval_ms,
	                                           m_settings.resync_interval_s));
}

void controller::on_secret_change(const object_key& key)
{
	try
	{
		for(const auto& request : m_acceptor->requests_for_peering_token_secret(key))
		{
			m_acceptor_queue->add(request);
		}
		for(const auto& request : m_dialer->requests_for_peering_token_secret(key))
		{
			m_dialer_queue->add(request);
		}
	}
	catch(const meshbridge_exception& ex)
	{
		LOG_WARNING("Unable to map secret %s to peering resources: %s",
		            key.to_string().c_str(),
		            ex.what());
	}
}

void controller::start()
{
	if(m_started)
	{
		return;
	}

	for(auto& l : m_loops)
	{
		l.queue->start();
	}
	for(auto& poller : m_pollers)
	{
		poller->start();
	}

	m_started = true;
	LOG_INFO("Started %zu reconcilers with %zu pollers", m_loops.size(), m_pollers.size());
}

void controller::stop()
{
	if(!m_started)
	{
		return;
	}

	for(auto& poller : m_pollers)
	{
		poller->stop();
	}
	for(auto& l : m_loops)
	{
		l.queue->stop();
	}

	m_started = false;
	LOG_INFO("Stopped reconcilers");
}

bool controller::wait_until_idle(const uint64_t timeout_ms) const
{
	for(const auto& l : m_loops)
	{
		if(!l.queue->wait_until_idle(timeout_ms))
		{
			return false;
		}
	}

	return true;
}

std::vector<std::string> controller::reconcilers() const
{
	std::vector<std::string> names;

	for(const auto& l : m_loops)
	{
		names.push_back(l.target->name());
	}

	return names;
}

} // namespace meshbridge
