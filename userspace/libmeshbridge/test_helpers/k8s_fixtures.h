/**
 * @file
 *
 * Builders for the Kubernetes objects the unit tests feed to the
 * reconcilers.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "crd_types.h"
#include "k8s_types.h"

#include <string>
#include <vector>

namespace test_helpers
{

/**
 * A running, ready pod that the injector has processed and that the
 * endpoints reconciler manages.
 */
meshbridge::pod make_injected_pod(const std::string& ns,
                                  const std::string& name,
                                  const std::string& pod_ip,
                                  const std::string& node_name = "node-1",
                                  const std::string& host_ip = "10.1.0.1");

/**
 * An address pointing at the named pod.
 */
meshbridge::endpoint_address make_pod_address(const meshbridge::pod& p);

/**
 * Endpoints with one subset listing the given ready and not ready pods.
 */
meshbridge::endpoints make_endpoints(const std::string& ns,
                                     const std::string& name,
                                     const std::vector<meshbridge::pod>& ready,
                                     const std::vector<meshbridge::pod>& not_ready = {});

meshbridge::k8s_namespace make_namespace(const std::string& name);

/**
 * A Consul client agent pod of the given Helm release.
 */
meshbridge::pod make_agent_pod(const std::string& ns,
                               const std::string& name,
                               const std::string& release,
                               const std::string& node_name,
                               const std::string& host_ip);

meshbridge::peering_resource make_peering_resource(const std::string& kind,
                                                   const std::string& ns,
                                                   const std::string& name,
                                                   const std::string& secret_name,
                                                   const std::string& secret_key,
                                                   const std::string& backend = "kubernetes");

/**
 * @returns a time source that always reports the given instant.
 */
meshbridge::time_source fixed_time(const std::string& now = "2022-06-01T10:00:00Z");

} // namespace test_helpers
