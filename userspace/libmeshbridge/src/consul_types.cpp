/**
 * @file
 *
 * Comparison operators for the Consul API objects.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "consul_types.h"

#include <tuple>

namespace meshbridge
{

bool tagged_address::operator==(const tagged_address& rhs) const
{
	return address == rhs.address && port == rhs.port;
}

bool tagged_address::operator!=(const tagged_address& rhs) const
{
	return !(*this == rhs);
}

bool upstream::operator==(const upstream& rhs) const
{
	return std::tie(destination_type,
	                destination_name,
	                destination_namespace,
	                destination_partition,
	                destination_peer,
	                datacenter,
	                local_bind_port) ==
	       std::tie(rhs.destination_type,
	                rhs.destination_name,
	                rhs.destination_namespace,
	                rhs.destination_partition,
	                rhs.destination_peer,
	                rhs.datacenter,
	                rhs.local_bind_port);
}

bool expose_path::operator==(const expose_path& rhs) const
{
	return listener_port == rhs.listener_port &&
	       local_path_port == rhs.local_path_port &&
	       path == rhs.path;
}

} // namespace meshbridge
