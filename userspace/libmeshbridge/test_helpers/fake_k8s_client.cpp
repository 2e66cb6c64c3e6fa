/**
 * @file
 *
 * Implementation of fake_k8s_client.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "fake_k8s_client.h"
#include "meshbridge_exception.h"
#include "string_utils.h"

using namespace meshbridge;

namespace test_helpers
{

fake_k8s_client::fake_k8s_client():
	m_version(100)
{
}

void fake_k8s_client::add_endpoints(const endpoints& value)
{
	std::lock_guard<std::mutex> l(m_lock);
	m_endpoints[value.metadata.key()] = value;
}

void fake_k8s_client::remove_endpoints(const object_key& key)
{
	std::lock_guard<std::mutex> l(m_lock);
	m_endpoints.erase(key);
}

void fake_k8s_client::add_pod(const pod& value)
{
	std::lock_guard<std::mutex> l(m_lock);
	m_pods[value.metadata.key()] = value;
}

void fake_k8s_client::add_namespace(const k8s_namespace& value)
{
	std::lock_guard<std::mutex> l(m_lock);
	m_namespaces[value.metadata.name] = value;
}

void fake_k8s_client::add_service(const service& value)
{
	std::lock_guard<std::mutex> l(m_lock);
	m_services[value.metadata.key()] = value;
}

void fake_k8s_client::add_secret(const secret& value)
{
	std::lock_guard<std::mutex> l(m_lock);
	secret stored = value;
	stored.metadata.resource_version = next_version();
	m_secrets[stored.metadata.key()] = stored;
}

void fake_k8s_client::add_peering_resource(const peering_resource& value)
{
	std::lock_guard<std::mutex> l(m_lock);
	m_peerings[value.kind][value.metadata.key()] = value;
}

void fake_k8s_client::add_terminating_gateway_service(const terminating_gateway_service& value)
{
	std::lock_guard<std::mutex> l(m_lock);
	m_gateway_services[value.metadata.key()] = value;
}

void fake_k8s_client::remove_terminating_gateway_service(const object_key& key)
{
	std::lock_guard<std::mutex> l(m_lock);
	m_gateway_services.erase(key);
}

void fake_k8s_client::fail(const std::string& operation, const int code)
{
	std::lock_guard<std::mutex> l(m_lock);
	m_failures[operation] = code;
}

void fake_k8s_client::clear_failures()
{
	std::lock_guard<std::mutex> l(m_lock);
	m_failures.clear();
}

std::vector<std::string> fake_k8s_client::writes() const
{
	std::lock_guard<std::mutex> l(m_lock);
	return m_writes;
}

void fake_k8s_client::clear_writes()
{
	std::lock_guard<std::mutex> l(m_lock);
	m_writes.clear();
}

bool fake_k8s_client::has_secret(const object_key& key) const
{
	std::lock_guard<std::mutex> l(m_lock);
	return m_secrets.count(key) > 0;
}

secret fake_k8s_client::stored_secret(const object_key& key) const
{
	std::lock_guard<std::mutex> l(m_lock);
	return m_secrets.at(key);
}

peering_resource fake_k8s_client::stored_peering_resource(const std::string& kind,
                                                          const object_key& key) const
{
	std::lock_guard<std::mutex> l(m_lock);
	return m_peerings.at(kind).at(key);
}

terminating_gateway_service fake_k8s_client::stored_terminating_gateway_service(
    const object_key& key) const
{
	std::lock_guard<std::mutex> l(m_lock);
	return m_gateway_services.at(key);
}

pod fake_k8s_client::stored_pod(const object_key& key) const
{
	std::lock_guard<std::mutex> l(m_lock);
	return m_pods.at(key);
}

bool fake_k8s_client::get_endpoints(const object_key& key, endpoints& out)
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("get_endpoints");

	const auto it = m_endpoints.find(key);
	if(it == m_endpoints.end())
	{
		return false;
	}
	out = it->second;
	return true;
}

std::vector<endpoints> fake_k8s_client::list_endpoints()
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("list_endpoints");

	std::vector<endpoints> result;
	for(const auto& entry : m_endpoints)
	{
		result.push_back(entry.second);
	}
	return result;
}

bool fake_k8s_client::get_pod(const object_key& key, pod& out)
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("get_pod");

	const auto it = m_pods.find(key);
	if(it == m_pods.end())
	{
		return false;
	}
	out = it->second;
	return true;
}

std::vector<pod> fake_k8s_client::list_pods(const std::string& ns,
                                            const std::string& label_selector)
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("list_pods");

	std::vector<pod> result;
	for(const auto& entry : m_pods)
	{
		if((ns.empty() || entry.first.ns == ns) &&
		   matches(entry.second.metadata.labels, label_selector))
		{
			result.push_back(entry.second);
		}
	}
	return result;
}

void fake_k8s_client::patch_pod_annotations(const object_key& key,
                                            const std::string& resource_version,
                                            const std::map<std::string, std::string>& annotations)
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("patch_pod_annotations");

	const auto it = m_pods.find(key);
	if(it == m_pods.end())
	{
		throw api_exception("pods \"" + key.name + "\" not found", 404);
	}
	if(!resource_version.empty() && resource_version != it->second.metadata.resource_version)
	{
		throw api_exception("the object has been modified", 409);
	}

	for(const auto& annotation : annotations)
	{
		it->second.metadata.annotations[annotation.first] = annotation.second;
	}
	it->second.metadata.resource_version = next_version();
	record("patch_pod_annotations", key);
}

bool fake_k8s_client::get_namespace(const std::string& name, k8s_namespace& out)
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("get_namespace");

	const auto it = m_namespaces.find(name);
	if(it == m_namespaces.end())
	{
		return false;
	}
	out = it->second;
	return true;
}

bool fake_k8s_client::get_service(const object_key& key, service& out)
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("get_service");

	const auto it = m_services.find(key);
	if(it == m_services.end())
	{
		return false;
	}
	out = it->second;
	return true;
}

bool fake_k8s_client::get_secret(const object_key& key, secret& out)
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("get_secret");

	const auto it = m_secrets.find(key);
	if(it == m_secrets.end())
	{
		return false;
	}
	out = it->second;
	return true;
}

std::vector<secret> fake_k8s_client::list_secrets(const std::string& label_selector)
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("list_secrets");

	std::vector<secret> result;
	for(const auto& entry : m_secrets)
	{
		if(matches(entry.second.metadata.labels, label_selector))
		{
			result.push_back(entry.second);
		}
	}
	return result;
}

secret fake_k8s_client::create_secret(const secret& value)
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("create_secret");

	const object_key key = value.metadata.key();
	if(m_secrets.count(key) > 0)
	{
		throw api_exception("secrets \"" + key.name + "\" already exists", 409);
	}

	secret stored = value;
	stored.metadata.resource_version = next_version();
	m_secrets[key] = stored;
	record("create_secret", key);
	return stored;
}

secret fake_k8s_client::update_secret(const secret& value)
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("update_secret");

	const object_key key = value.metadata.key();
	const auto it = m_secrets.find(key);
	if(it == m_secrets.end())
	{
		throw api_exception("secrets \"" + key.name + "\" not found", 404);
	}
	if(value.metadata.resource_version != it->second.metadata.resource_version)
	{
		throw api_exception("the object has been modified", 409);
	}

	secret stored = value;
	stored.metadata.resource_version = next_version();
	it->second = stored;
	record("update_secret", key);
	return stored;
}

void fake_k8s_client::delete_secret(const object_key& key)
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("delete_secret");

	if(m_secrets.erase(key) == 0)
	{
		throw api_exception("secrets \"" + key.name + "\" not found", 404);
	}
	record("delete_secret", key);
}

bool fake_k8s_client::get_peering_resource(const std::string& kind,
                                           const object_key& key,
                                           peering_resource& out)
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("get_peering_resource");

	const auto resources = m_peerings.find(kind);
	if(resources == m_peerings.end())
	{
		return false;
	}

	const auto it = resources->second.find(key);
	if(it == resources->second.end())
	{
		return false;
	}
	out = it->second;
	return true;
}

std::vector<peering_resource> fake_k8s_client::list_peering_resources(const std::string& kind)
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("list_peering_resources");

	std::vector<peering_resource> result;
	for(const auto& entry : m_peerings[kind])
	{
		result.push_back(entry.second);
	}
	return result;
}

void fake_k8s_client::update_peering_status(peering_resource& value)
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("update_peering_status");

	auto& resources = m_peerings[value.kind];
	const auto it = resources.find(value.metadata.key());
	if(it == resources.end())
	{
		throw api_exception(value.kind + " \"" + value.metadata.name + "\" not found", 404);
	}

	value.metadata.resource_version = next_version();
	it->second = value;
	record("update_peering_status", value.metadata.key());
}

bool fake_k8s_client::get_terminating_gateway_service(const object_key& key,
                                                      terminating_gateway_service& out)
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("get_terminating_gateway_service");

	const auto it = m_gateway_services.find(key);
	if(it == m_gateway_services.end())
	{
		return false;
	}
	out = it->second;
	return true;
}

std::vector<terminating_gateway_service> fake_k8s_client::list_terminating_gateway_services()
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("list_terminating_gateway_services");

	std::vector<terminating_gateway_service> result;
	for(const auto& entry : m_gateway_services)
	{
		result.push_back(entry.second);
	}
	return result;
}

void fake_k8s_client::update_finalizers(terminating_gateway_service& value)
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("update_finalizers");

	const object_key key = value.metadata.key();
	const auto it = m_gateway_services.find(key);
	if(it == m_gateway_services.end())
	{
		throw api_exception("terminatinggatewayservices \"" + key.name + "\" not found", 404);
	}

	record("update_finalizers", key);

	// Like the API server, drop a deleted object once nothing holds it.
	if(value.metadata.being_deleted() && value.metadata.finalizers.empty())
	{
		m_gateway_services.erase(it);
		return;
	}

	value.metadata.resource_version = next_version();
	it->second.metadata.finalizers = value.metadata.finalizers;
	it->second.metadata.resource_version = value.metadata.resource_version;
}

void fake_k8s_client::update_terminating_gateway_status(terminating_gateway_service& value)
{
	std::lock_guard<std::mutex> l(m_lock);
	check_failure("update_terminating_gateway_status");

	const object_key key = value.metadata.key();
	const auto it = m_gateway_services.find(key);
	if(it == m_gateway_services.end())
	{
		throw api_exception("terminatinggatewayservices \"" + key.name + "\" not found", 404);
	}

	value.metadata.resource_version = next_version();
	it->second = value;
	record("update_terminating_gateway_status", key);
}

void fake_k8s_client::check_failure(const std::string& operation) const
{
	const auto it = m_failures.find(operation);
	if(it != m_failures.end())
	{
		throw api_exception(operation + " failed", it->second);
	}
}

std::string fake_k8s_client::next_version()
{
	return std::to_string(++m_version);
}

void fake_k8s_client::record(const std::string& operation, const object_key& key)
{
	m_writes.push_back(operation + " " + key.to_string());
}

bool fake_k8s_client::matches(const std::map<std::string, std::string>& labels,
                              const std::string& selector)
{
	if(selector.empty())
	{
		return true;
	}

	for(const std::string& term : string_utils::split(selector, ','))
	{
		const std::vector<std::string> parts = string_utils::split(term, '=', 2);
		if(parts.size() != 2)
		{
			return false;
		}

		const auto label = labels.find(parts[0]);
		if(label == labels.end() || label->second != parts[1])
		{
			return false;
		}
	}
	return true;
}

} // namespace test_helpers
