/**
 * @file
 *
 * Typed accessors for the settings a pod carries in its annotations and
 * labels. Where a setting can also be given on the pod's namespace, the
 * precedence is pod annotation, then namespace label, then the controller
 * default.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "k8s_types.h"

#include <map>
#include <string>
#include <vector>

namespace meshbridge
{
namespace pod_settings
{

/**
 * @throws meshbridge_exception if the pod or namespace value is not a
 *         boolean.
 */
bool transparent_proxy_enabled(const k8s_namespace& ns,
                               const pod& p,
                               bool global_default);

/**
 * @throws meshbridge_exception if the pod or namespace value is not a
 *         boolean.
 */
bool consul_dns_enabled(const k8s_namespace& ns, const pod& p, bool global_default);

/**
 * @throws meshbridge_exception if the annotation is not a boolean.
 */
bool overwrite_probes(const pod& p, bool global_default);

/**
 * @throws meshbridge_exception if the annotation is not a boolean.
 */
bool use_proxy_health_check(const pod& p);

/**
 * True if the injector has mutated this pod.
 */
bool has_been_injected(const pod& p);

/**
 * True if the pod's service registrations belong to the endpoints
 * controller.
 */
bool managed_by_endpoints_controller(const pod& p);

/**
 * True if the labels carry a truthy service-ignore label.
 */
bool is_labeled_ignore(const std::map<std::string, std::string>& labels);

/**
 * Split a comma separated annotation into trimmed, non-empty items. A
 * missing annotation yields no items.
 */
std::vector<std::string> split_annotation(const pod& p, const std::string& annotation);

/**
 * Resolve a port given as the name of a container port or as an integer
 * (decimal, 0x hex, 0 or 0o octal, 0b binary).
 *
 * @throws meshbridge_exception if value is neither.
 */
int port_value(const pod& p, const std::string& value);

int port_value(const pod& p, const int_or_string& value);

/**
 * Parse the container spec of the original-pod annotation.
 *
 * @throws meshbridge_exception if the annotation is missing or malformed.
 */
pod original_pod(const pod& p);

} // namespace pod_settings
} // namespace meshbridge
