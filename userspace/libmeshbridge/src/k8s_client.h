/**
 * @file
 *
 * Interface to the Kubernetes API as used by the reconcilers and the CNI
 * plugin.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "crd_types.h"
#include "k8s_types.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace meshbridge
{

/**
 * CRUD access to the Kubernetes objects meshbridge reads and writes.
 *
 * Getters return false when the object does not exist. Every other failure
 * raises an api_exception. Writes carry the resourceVersion of the object
 * they were computed from, so a concurrent modification surfaces as a
 * conflict (see api_exception::is_conflict()).
 */
class k8s_client
{
public:
	using ptr = std::shared_ptr<k8s_client>;

	virtual ~k8s_client() = default;

	virtual bool get_endpoints(const object_key& key, endpoints& out) = 0;
	virtual std::vector<endpoints> list_endpoints() = 0;

	virtual bool get_pod(const object_key& key, pod& out) = 0;

	/**
	 * List pods in a namespace (every namespace when ns is empty)
	 * matching a label selector such as "app=consul,component=client".
	 */
	virtual std::vector<pod> list_pods(const std::string& ns,
	                                   const std::string& label_selector) = 0;

	/**
	 * Merge the given annotations into a pod's metadata.
	 *
	 * @param[in] resource_version the version the caller last observed.
	 */
	virtual void patch_pod_annotations(const object_key& key,
	                                   const std::string& resource_version,
	                                   const std::map<std::string, std::string>& annotations) = 0;

	virtual bool get_namespace(const std::string& name, k8s_namespace& out) = 0;
	virtual bool get_service(const object_key& key, service& out) = 0;

	virtual bool get_secret(const object_key& key, secret& out) = 0;
	virtual std::vector<secret> list_secrets(const std::string& label_selector) = 0;

	/**
	 * @returns the stored secret, carrying its new resourceVersion.
	 */
	virtual secret create_secret(const secret& value) = 0;

	/**
	 * Replace the contents of an existing secret.
	 *
	 * @returns the stored secret, carrying its new resourceVersion.
	 */
	virtual secret update_secret(const secret& value) = 0;

	virtual void delete_secret(const object_key& key) = 0;

	/**
	 * PeeringAcceptor and PeeringDialer resources, selected by kind.
	 */
	virtual bool get_peering_resource(const std::string& kind,
	                                  const object_key& key,
	                                  peering_resource& out) = 0;
	virtual std::vector<peering_resource> list_peering_resources(const std::string& kind) = 0;

	/**
	 * Write the status of the resource. The resourceVersion of value is
	 * refreshed from the server's answer.
	 */
	virtual void update_peering_status(peering_resource& value) = 0;

	virtual bool get_terminating_gateway_service(const object_key& key,
	                                             terminating_gateway_service& out) = 0;
	virtual std::vector<terminating_gateway_service> list_terminating_gateway_services() = 0;

	/**
	 * Write the finalizer list of the resource. The resourceVersion of
	 * value is refreshed from the server's answer.
	 */
	virtual void update_finalizers(terminating_gateway_service& value) = 0;
	virtual void update_terminating_gateway_status(terminating_gateway_service& value) = 0;
};

} // namespace meshbridge
