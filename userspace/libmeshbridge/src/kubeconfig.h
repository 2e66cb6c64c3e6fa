/**
 * @file
 *
 * Interface to kubeconfig, a reader for the API server access settings of
 * a kubeconfig file.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "rest_client.h"

#include <string>

namespace meshbridge
{
namespace kubeconfig
{

/**
 * Read the server, CA and bearer token of the current context.
 *
 * @throws meshbridge_exception if the file cannot be read or does not
 *         describe a usable context.
 */
rest_client::options load_file(const std::string& path);

/**
 * Same as load_file() but from in-memory YAML text.
 */
rest_client::options load(const std::string& yaml_text);

} // namespace kubeconfig
} // namespace meshbridge
