/**
 * @file
 *
 * Implementation of metrics_config.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "metrics_config.h"
#include "annotations.h"
#include "meshbridge_exception.h"
#include "pod_settings.h"
#include "string_utils.h"

namespace
{

const std::string DEFAULT_SERVICE_METRICS_PATH = "/metrics";

} // end namespace

namespace meshbridge
{

metrics_config::metrics_config(const metrics_defaults& defaults):
	m_defaults(defaults)
{
}

bool metrics_config::resolve_bool(const pod& p,
                                  const std::string& annotation,
                                  const bool default_value)
{
	const std::string raw = p.metadata.annotation(annotation);

	if(raw.empty())
	{
		return default_value;
	}

	bool value = false;
	if(!string_utils::parse_bool(raw, value))
	{
		throw meshbridge_exception(annotation + " annotation value of " + raw +
		                           " was invalid: not a boolean");
	}

	return value;
}

bool metrics_config::enable_metrics(const pod& p) const
{
	return resolve_bool(p, annotations::ENABLE_METRICS, m_defaults.enable_metrics);
}

bool metrics_config::enable_metrics_merging(const pod& p) const
{
	return resolve_bool(p,
	                    annotations::ENABLE_METRICS_MERGING,
	                    m_defaults.enable_metrics_merging);
}

int metrics_config::merged_metrics_port(const pod& p) const
{
	return determine_and_validate_port(p,
	                                   annotations::MERGED_METRICS_PORT,
	                                   m_defaults.merged_metrics_port,
	                                   false);
}

int metrics_config::prometheus_scrape_port(const pod& p) const
{
	return determine_and_validate_port(p,
	                                   annotations::PROMETHEUS_SCRAPE_PORT,
	                                   m_defaults.prometheus_scrape_port,
	                                   false);
}

std::string metrics_config::prometheus_scrape_path(const pod& p) const
{
	const std::string raw = p.metadata.annotation(annotations::PROMETHEUS_SCRAPE_PATH);

	return raw.empty() ? m_defaults.prometheus_scrape_path : raw;
}

int metrics_config::service_metrics_port(const pod& p) const
{
	const std::string service_port = p.metadata.annotation(annotations::PORT);

	// Services may legitimately expose metrics on a privileged port.
	return determine_and_validate_port(p,
	                                   annotations::SERVICE_METRICS_PORT,
	                                   service_port.empty() ? "0" : service_port,
	                                   true);
}

std::string metrics_config::service_metrics_path(const pod& p) const
{
	const std::string raw = p.metadata.annotation(annotations::SERVICE_METRICS_PATH);

	return raw.empty() ? DEFAULT_SERVICE_METRICS_PATH : raw;
}

bool metrics_config::should_run_merged_metrics_server(const pod& p) const
{
	const bool metrics = enable_metrics(p);
	const bool merging = enable_metrics_merging(p);
	const int service_port = service_metrics_port(p);

	return metrics && merging && service_port > 0;
}

int metrics_config::determine_and_validate_port(const pod& p,
                                                const std::string& annotation,
                                                const std::string& default_port,
                                                const bool privileged)
{
	const std::string raw = p.metadata.annotation(annotation);

	if(!raw.empty())
	{
		int port = 0;

		try
		{
			port = pod_settings::port_value(p, raw);
		}
		catch(const meshbridge_exception&)
		{
			throw meshbridge_exception(annotation + " annotation value of " + raw +
			                           " is not a valid integer");
		}

		if(privileged && (port < 1 || port > 65535))
		{
			throw meshbridge_exception(annotation + " annotation value of " +
			                           std::to_string(port) +
			                           " is not in the valid port range 1-65535");
		}
		else if(!privileged && (port < 1024 || port > 65535))
		{
			throw meshbridge_exception(annotation + " annotation value of " +
			                           std::to_string(port) +
			                           " is not in the unprivileged port range 1024-65535");
		}

		return port;
	}

	if(default_port.empty())
	{
		return 0;
	}

	try
	{
		return pod_settings::port_value(p, default_port);
	}
	catch(const meshbridge_exception&)
	{
		throw meshbridge_exception(default_port + " is not a valid port on the pod " +
		                           p.metadata.name);
	}
}

} // namespace meshbridge
