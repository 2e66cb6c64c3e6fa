/**
 * @file
 *
 * Implementation of the custom resource helpers.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "crd_types.h"
#include "annotations.h"
#include "meshbridge_exception.h"
#include "string_utils.h"

#include <Poco/DateTimeFormatter.h>
#include <Poco/Timestamp.h>

namespace
{

bool annotated_peering_version(const meshbridge::object_meta& metadata, uint64_t& version)
{
	std::string value;
	if(!metadata.get_annotation(meshbridge::annotations::PEERING_VERSION, value))
	{
		return false;
	}

	int64_t parsed = 0;
	if(!string_utils::parse_int(value, parsed) || parsed < 0)
	{
		throw meshbridge::meshbridge_exception("invalid " +
		                                       meshbridge::annotations::PEERING_VERSION +
		                                       " annotation \"" + value + "\"");
	}

	version = static_cast<uint64_t>(parsed);
	return true;
}

} // end namespace

namespace meshbridge
{

std::string rfc3339_now()
{
	return Poco::DateTimeFormatter::format(Poco::Timestamp(), "%Y-%m-%dT%H:%M:%SZ");
}

bool peering_resource::peering_version_bumped() const
{
	uint64_t version = 0;

	if(!annotated_peering_version(metadata, version))
	{
		return false;
	}

	return !has_latest_peering_version || latest_peering_version < version;
}

void peering_resource::record_peering_version()
{
	if(peering_version_bumped())
	{
		uint64_t version = 0;
		annotated_peering_version(metadata, version);
		has_latest_peering_version = true;
		latest_peering_version = version;
	}
}

void terminating_gateway_service::set_synced_condition(const std::string& status,
                                                       const std::string& reason,
                                                       const std::string& message,
                                                       const std::string& now)
{
	for(auto& cond : conditions)
	{
		if(cond.type == "Synced")
		{
			if(cond.status != status)
			{
				cond.last_transition_time = now;
			}
			cond.status = status;
			cond.reason = reason;
			cond.message = message;
			return;
		}
	}

	condition synced;
	synced.type = "Synced";
	synced.status = status;
	synced.reason = reason;
	synced.message = message;
	synced.last_transition_time = now;
	conditions.push_back(synced);
}

} // namespace meshbridge
