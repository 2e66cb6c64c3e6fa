/**
 * @file
 *
 * Implementation of the unit test object builders.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "k8s_fixtures.h"
#include "annotations.h"

using namespace meshbridge;

namespace test_helpers
{

pod make_injected_pod(const std::string& ns,
                      const std::string& name,
                      const std::string& pod_ip,
                      const std::string& node_name,
                      const std::string& host_ip)
{
	pod p;

	p.metadata.ns = ns;
	p.metadata.name = name;
	p.metadata.uid = "uid-" + name;
	p.metadata.resource_version = "1";
	p.metadata.annotations[annotations::KEY_INJECT_STATUS] = annotations::INJECTED;
	p.metadata.labels[annotations::KEY_MANAGED_BY] = annotations::MANAGED_BY_VALUE;
	p.node_name = node_name;
	p.phase = "Running";
	p.pod_ip = pod_ip;
	p.host_ip = host_ip;

	pod_condition ready;
	ready.type = "Ready";
	ready.status = "True";
	p.conditions.push_back(ready);

	return p;
}

endpoint_address make_pod_address(const pod& p)
{
	endpoint_address address;

	address.ip = p.pod_ip;
	address.node_name = p.node_name;
	address.has_target_ref = true;
	address.target_ref.kind = "Pod";
	address.target_ref.name = p.metadata.name;
	address.target_ref.ns = p.metadata.ns;

	return address;
}

endpoints make_endpoints(const std::string& ns,
                         const std::string& name,
                         const std::vector<pod>& ready,
                         const std::vector<pod>& not_ready)
{
	endpoints ep;
	endpoint_subset subset;

	ep.metadata.ns = ns;
	ep.metadata.name = name;

	for(const auto& p : ready)
	{
		subset.addresses.push_back(make_pod_address(p));
	}
	for(const auto& p : not_ready)
	{
		subset.not_ready_addresses.push_back(make_pod_address(p));
	}

	ep.subsets.push_back(subset);
	return ep;
}

k8s_namespace make_namespace(const std::string& name)
{
	k8s_namespace ns;
	ns.metadata.name = name;
	return ns;
}

pod make_agent_pod(const std::string& ns,
                   const std::string& name,
                   const std::string& release,
                   const std::string& node_name,
                   const std::string& host_ip)
{
	pod p = make_injected_pod(ns, name, host_ip, node_name, host_ip);

	p.metadata.annotations.clear();
	p.metadata.labels.clear();
	p.metadata.labels["component"] = "client";
	p.metadata.labels["app"] = "consul";
	p.metadata.labels["release"] = release;

	return p;
}

peering_resource make_peering_resource(const std::string& kind,
                                       const std::string& ns,
                                       const std::string& name,
                                       const std::string& secret_name,
                                       const std::string& secret_key,
                                       const std::string& backend)
{
	peering_resource resource;

	resource.kind = kind;
	resource.metadata.ns = ns;
	resource.metadata.name = name;
	resource.metadata.uid = "uid-" + name;
	resource.metadata.resource_version = "1";
	resource.has_spec_secret = true;
	resource.spec_secret.name = secret_name;
	resource.spec_secret.key = secret_key;
	resource.spec_secret.backend = backend;

	return resource;
}

time_source fixed_time(const std::string& now)
{
	return [now]() { return now; };
}

} // namespace test_helpers
