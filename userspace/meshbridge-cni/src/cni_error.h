/**
 * @file
 *
 * Interface to cni_error, a failure reported to the container runtime.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "meshbridge_exception.h"

#include <json/json.h>

#include <string>

namespace meshbridge
{

/**
 * A failure carrying one of the well-known CNI error codes. It is printed
 * on stdout as the CNI error result.
 */
class cni_error : public meshbridge_exception
{
public:
	const static int ERR_INCOMPATIBLE_VERSION;
	const static int ERR_INVALID_ENVIRONMENT;
	const static int ERR_DECODING_FAILURE;
	const static int ERR_INTERNAL;

	explicit cni_error(const std::string& message, int code = ERR_INTERNAL);

	int get_code() const;

	/**
	 * @returns the {"cniVersion", "code", "msg"} error document.
	 */
	Json::Value to_json(const std::string& cni_version) const;

private:
	const int m_code;
};

} // namespace meshbridge
