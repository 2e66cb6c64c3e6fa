/**
 * @file
 *
 * Recovers the pod that owns an ACL token from the token's description.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <map>
#include <string>

namespace meshbridge
{
namespace token_metadata
{

/** Key of the "<namespace>/<pod>" entry in the metadata. */
const std::string POD_NAME_KEY = "pod";

/**
 * Extract the trailing JSON object of a token description, e.g.
 * "token created via login: {"pod":"ns1/web-abc"}".
 *
 * @returns false if the description carries no JSON object of string
 *          values. Such tokens are treated as not owned by any pod.
 */
bool parse(const std::string& description, std::map<std::string, std::string>& meta);

/**
 * @returns true if the metadata names the given pod as <namespace>/<pod>.
 */
bool owned_by_pod(const std::map<std::string, std::string>& meta,
                  const std::string& k8s_namespace,
                  const std::string& pod_name);

} // namespace token_metadata
} // namespace meshbridge
