/**
 * @file
 *
 * Interface to fake_k8s_client, an in-memory Kubernetes API for unit
 * tests.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "k8s_client.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace test_helpers
{

/**
 * Keeps every object in maps keyed by namespace and name. Every write
 * assigns the object a new resourceVersion and is appended to writes() as
 * "<operation> <ns>/<name>", so tests can check both effects and order.
 */
class fake_k8s_client : public meshbridge::k8s_client
{
public:
	fake_k8s_client();

	// Test setup; these neither log a write nor bump versions unless noted.
	void add_endpoints(const meshbridge::endpoints& value);
	void remove_endpoints(const meshbridge::object_key& key);
	void add_pod(const meshbridge::pod& value);
	void add_namespace(const meshbridge::k8s_namespace& value);
	void add_service(const meshbridge::service& value);

	/** Stores the secret with a fresh resourceVersion. */
	void add_secret(const meshbridge::secret& value);
	void add_peering_resource(const meshbridge::peering_resource& value);
	void add_terminating_gateway_service(const meshbridge::terminating_gateway_service& value);
	void remove_terminating_gateway_service(const meshbridge::object_key& key);

	/**
	 * Make every call of the named operation (e.g. "get_pod") fail with
	 * an api_exception of the given code.
	 */
	void fail(const std::string& operation, int code);
	void clear_failures();

	std::vector<std::string> writes() const;
	void clear_writes();

	bool has_secret(const meshbridge::object_key& key) const;
	meshbridge::secret stored_secret(const meshbridge::object_key& key) const;
	meshbridge::peering_resource stored_peering_resource(const std::string& kind,
	                                                     const meshbridge::object_key& key) const;
	meshbridge::terminating_gateway_service stored_terminating_gateway_service(
	    const meshbridge::object_key& key) const;
	meshbridge::pod stored_pod(const meshbridge::object_key& key) const;

	// k8s_client
	bool get_endpoints(const meshbridge::object_key& key, meshbridge::endpoints& out) override;
	std::vector<meshbridge::endpoints> list_endpoints() override;
	bool get_pod(const meshbridge::object_key& key, meshbridge::pod& out) override;
	std::vector<meshbridge::pod> list_pods(const std::string& ns,
	                                       const std::string& label_selector) override;
	void patch_pod_annotations(const meshbridge::object_key& key,
	                           const std::string& resource_version,
	                           const std::map<std::string, std::string>& annotations) override;
	bool get_namespace(const std::string& name, meshbridge::k8s_namespace& out) override;
	bool get_service(const meshbridge::object_key& key, meshbridge::service& out) override;
	bool get_secret(const meshbridge::object_key& key, meshbridge::secret& out) override;
	std::vector<meshbridge::secret> list_secrets(const std::string& label_selector) override;
	meshbridge::secret create_secret(const meshbridge::secret& value) override;
	meshbridge::secret update_secret(const meshbridge::secret& value) override;
	void delete_secret(const meshbridge::object_key& key) override;
	bool get_peering_resource(const std::string& kind,
	                          const meshbridge::object_key& key,
	                          meshbridge::peering_resource& out) override;
	std::vector<meshbridge::peering_resource> list_peering_resources(
	    const std::string& kind) override;
	void update_peering_status(meshbridge::peering_resource& value) override;
	bool get_terminating_gateway_service(const meshbridge::object_key& key,
	                                     meshbridge::terminating_gateway_service& out) override;
	std::vector<meshbridge::terminating_gateway_service> list_terminating_gateway_services()
	    override;
	void update_finalizers(meshbridge::terminating_gateway_service& value) override;
	void update_terminating_gateway_status(meshbridge::terminating_gateway_service& value) override;

private:
	void check_failure(const std::string& operation) const;
	std::string next_version();
	void record(const std::string& operation, const meshbridge::object_key& key);

	/**
	 * @returns true if every "k=v" term of the selector matches.
	 */
	static bool matches(const std::map<std::string, std::string>& labels,
	                    const std::string& selector);

	mutable std::mutex m_lock;
	uint64_t m_version;
	std::map<std::string, int> m_failures;
	std::vector<std::string> m_writes;

	std::map<meshbridge::object_key, meshbridge::endpoints> m_endpoints;
	std::map<meshbridge::object_key, meshbridge::pod> m_pods;
	std::map<std::string, meshbridge::k8s_namespace> m_namespaces;
	std::map<meshbridge::object_key, meshbridge::service> m_services;
	std::map<meshbridge::object_key, meshbridge::secret> m_secrets;
	std::map<std::string, std::map<meshbridge::object_key, meshbridge::peering_resource>> m_peerings;
	std::map<meshbridge::object_key, meshbridge::terminating_gateway_service> m_gateway_services;
};

} // namespace test_helpers
