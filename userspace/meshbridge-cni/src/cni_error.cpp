/**
 * @file
 *
 * Implementation of cni_error.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "cni_error.h"

namespace meshbridge
{

const int cni_error::ERR_INCOMPATIBLE_VERSION = 1;
const int cni_error::ERR_INVALID_ENVIRONMENT = 4;
const int cni_error::ERR_DECODING_FAILURE = 6;
const int cni_error::ERR_INTERNAL = 999;

cni_error::cni_error(const std::string& message, const int code):
	meshbridge_exception(message),
	m_code(code)
{
}

int cni_error::get_code() const
{
	return m_code;
}

Json::Value cni_error::to_json(const std::string& cni_version) const
{
	Json::Value result;

	result["cniVersion"] = cni_version;
	result["code"] = m_code;
	result["msg"] = what();

	return result;
}

} // namespace meshbridge
