/**
 * @file
 *
 * Implementation of upstream_parser.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "upstream_parser.h"
#include "annotations.h"
#include "common_logger.h"
#include "meshbridge_exception.h"
#include "pod_settings.h"
#include "string_utils.h"

COMMON_LOGGER();

namespace
{

const std::string MESH_GATEWAY_MODE_LOCAL = "local";
const std::string MESH_GATEWAY_MODE_REMOTE = "remote";

meshbridge::meshbridge_exception structured_incorrectly(const std::string& raw)
{
	return meshbridge::meshbridge_exception("upstream structured incorrectly: " + raw);
}

} // end namespace

namespace meshbridge
{

upstream_parser::upstream_parser(const namespace_policy& policy,
                                 const consul_client::ptr& server):
	m_policy(policy),
	m_server(server)
{
}

std::vector<upstream> upstream_parser::parse(const pod& p) const
{
	std::vector<upstream> upstreams;

	for(const auto& raw : pod_settings::split_annotation(p, annotations::UPSTREAMS))
	{
		upstream up;

		if(parse_one(p, raw, up))
		{
			upstreams.push_back(up);
		}
	}

	return upstreams;
}

bool upstream_parser::parse_one(const pod& p, const std::string& raw, upstream& out) const
{
	const std::vector<std::string> parts = string_utils::split(raw, ':', 3);
	const std::vector<std::string> service_parts = string_utils::split(parts[0], '.');

	if(string_utils::trimmed(parts[0]) == "prepared_query")
	{
		return parse_prepared_query(p, raw, out);
	}

	if(service_parts.size() >= 2 && service_parts[1] == "svc")
	{
		return parse_labeled(p, raw, out);
	}

	return parse_unlabeled(p, raw, out);
}

int upstream_parser::upstream_port(const pod& p, const std::string& value)
{
	try
	{
		return pod_settings::port_value(p, string_utils::trimmed(value));
	}
	catch(const meshbridge_exception& ex)
	{
		LOG_DEBUG("Ignoring upstream with unusable port: %s", ex.what());
		return 0;
	}
}

bool upstream_parser::parse_prepared_query(const pod& p,
                                           const std::string& raw,
                                           upstream& out) const
{
	const std::vector<std::string> parts = string_utils::split(raw, ':', 3);

	if(parts.size() < 3)
	{
		throw structured_incorrectly(raw);
	}

	const int port = upstream_port(p, parts[2]);
	if(port <= 0)
	{
		return false;
	}

	out = upstream();
	out.destination_type = UPSTREAM_TYPE_PREPARED_QUERY;
	out.destination_name = string_utils::trimmed(parts[1]);
	out.local_bind_port = port;
	return true;
}

bool upstream_parser::parse_unlabeled(const pod& p,
                                      const std::string& raw,
                                      upstream& out) const
{
	const std::vector<std::string> parts = string_utils::split(raw, ':', 3);
	std::string service_name;
	std::string ns;
	std::string partition;
	std::string datacenter;

	if(parts.size() < 2)
	{
		throw structured_incorrectly(raw);
	}

	const int port = upstream_port(p, parts[1]);

	if(m_policy.qualified_upstreams())
	{
		const std::vector<std::string> pieces = string_utils::split(parts[0], '.', 3);

		if(pieces.size() == 3)
		{
			partition = string_utils::trimmed(pieces[2]);
		}
		if(pieces.size() >= 2)
		{
			ns = string_utils::trimmed(pieces[1]);
		}
		service_name = string_utils::trimmed(pieces[0]);
	}
	else
	{
		service_name = string_utils::trimmed(parts[0]);
	}

	if(parts.size() > 2)
	{
		datacenter = string_utils::trimmed(parts[2]);
		check_mesh_gateway_mode(raw);
	}

	if(port <= 0)
	{
		return false;
	}

	out = upstream();
	out.destination_type = UPSTREAM_TYPE_SERVICE;
	out.destination_name = service_name;
	out.destination_namespace = ns;
	out.destination_partition = partition;
	out.datacenter = datacenter;
	out.local_bind_port = port;
	return true;
}

bool upstream_parser::parse_labeled(const pod& p,
                                    const std::string& raw,
                                    upstream& out) const
{
	const std::vector<std::string> parts = string_utils::split(raw, ':', 3);
	std::vector<std::string> pieces;
	std::string service_name;
	std::string ns;
	std::string partition;
	std::string peer;
	std::string datacenter;

	if(parts.size() < 2)
	{
		throw structured_incorrectly(raw);
	}

	const int port = upstream_port(p, parts[1]);

	for(const auto& piece : string_utils::split(parts[0], '.'))
	{
		pieces.push_back(string_utils::trimmed(piece));
	}

	// The last label decides what the fifth piece names.
	const size_t qualified_size = m_policy.qualified_upstreams() ? 6 : 4;
	if(pieces.size() == qualified_size)
	{
		const std::string& end = pieces[qualified_size - 1];
		const std::string& value = pieces[qualified_size - 2];

		if(end == "peer")
		{
			peer = value;
		}
		else if(end == "ap" && m_policy.qualified_upstreams())
		{
			partition = value;
		}
		else if(end == "dc")
		{
			datacenter = value;
		}
		else
		{
			throw structured_incorrectly(raw);
		}
	}

	if(m_policy.qualified_upstreams())
	{
		if(pieces.size() != 2 && pieces.size() != 4 && pieces.size() != 6)
		{
			throw structured_incorrectly(raw);
		}

		if(pieces.size() >= 4)
		{
			if(pieces[3] != "ns")
			{
				throw structured_incorrectly(raw);
			}
			ns = pieces[2];
		}
	}
	else if(pieces.size() != 2 && pieces.size() != 4)
	{
		throw structured_incorrectly(raw);
	}

	service_name = pieces[0];

	if(port <= 0)
	{
		return false;
	}

	out = upstream();
	out.destination_type = UPSTREAM_TYPE_SERVICE;
	out.destination_name = service_name;
	out.destination_namespace = ns;
	out.destination_partition = partition;
	out.destination_peer = peer;
	out.datacenter = datacenter;
	out.local_bind_port = port;
	return true;
}

void upstream_parser::check_mesh_gateway_mode(const std::string& raw) const
{
	std::string mode;
	bool found = false;

	try
	{
		found = m_server->read_proxy_defaults_mesh_gateway_mode(mode);
	}
	catch(const api_exception& ex)
	{
		// An unreachable server must not block registration.
		LOG_WARNING("Unable to verify mesh gateway mode for upstream %s: %s",
		            raw.c_str(),
		            ex.what());
		return;
	}

	if(!found)
	{
		throw meshbridge_exception("upstream \"" + raw +
		                           "\" is invalid: there is no ProxyDefaults config to set "
		                           "mesh gateway mode");
	}

	if(mode != MESH_GATEWAY_MODE_LOCAL && mode != MESH_GATEWAY_MODE_REMOTE)
	{
		throw meshbridge_exception("upstream \"" + raw +
		                           "\" is invalid: ProxyDefaults mesh gateway mode is neither "
		                           "\"local\" nor \"remote\"");
	}
}

} // namespace meshbridge
