/**
 * @file
 *
 * Interface to k8s_rest_client, the k8s_client backed by the Kubernetes
 * HTTP API.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "k8s_client.h"
#include "rest_client.h"

namespace meshbridge
{

class k8s_rest_client : public k8s_client
{
public:
	explicit k8s_rest_client(const rest_client::ptr& client);

	/**
	 * Build the options for talking to the API server from inside a pod,
	 * using the service account token and CA mounted into every pod.
	 */
	static rest_client::options in_cluster_options(const std::string& api_server,
	                                               const std::string& token_file,
	                                               const std::string& ca_file);

	bool get_endpoints(const object_key& key, endpoints& out) override;
	std::vector<endpoints> list_endpoints() override;

	bool get_pod(const object_key& key, pod& out) override;
	std::vector<pod> list_pods(const std::string& ns,
	                           const std::string& label_selector) override;
	void patch_pod_annotations(const object_key& key,
	                           const std::string& resource_version,
	                           const std::map<std::string, std::string>& annotations) override;

	bool get_namespace(const std::string& name, k8s_namespace& out) override;
	bool get_service(const object_key& key, service& out) override;

	bool get_secret(const object_key& key, secret& out) override;
	std::vector<secret> list_secrets(const std::string& label_selector) override;
	secret create_secret(const secret& value) override;
	secret update_secret(const secret& value) override;
	void delete_secret(const object_key& key) override;

	bool get_peering_resource(const std::string& kind,
	                          const object_key& key,
	                          peering_resource& out) override;
	std::vector<peering_resource> list_peering_resources(const std::string& kind) override;
	void update_peering_status(peering_resource& value) override;

	bool get_terminating_gateway_service(const object_key& key,
	                                     terminating_gateway_service& out) override;
	std::vector<terminating_gateway_service> list_terminating_gateway_services() override;
	void update_finalizers(terminating_gateway_service& value) override;
	void update_terminating_gateway_status(terminating_gateway_service& value) override;

private:
	static std::string core_path(const std::string& ns,
	                             const std::string& plural,
	                             const std::string& name = "");
	static std::string crd_path(const std::string& ns,
	                            const std::string& plural,
	                            const std::string& name = "");
	static std::string plural_for(const std::string& kind);

	/**
	 * Apply a JSON merge patch and return the patched object.
	 */
	Json::Value merge_patch(const std::string& path, const Json::Value& patch);

	rest_client::ptr m_client;
};

} // namespace meshbridge
