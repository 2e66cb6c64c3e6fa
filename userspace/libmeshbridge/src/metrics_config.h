/**
 * @file
 *
 * Interface to metrics_config, the per-pod resolution of the metrics
 * settings.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "k8s_types.h"

#include <string>

namespace meshbridge
{

/**
 * Controller-wide metrics defaults. Pod annotations override each value.
 */
struct metrics_defaults
{
	bool enable_metrics = false;
	bool enable_metrics_merging = false;
	std::string merged_metrics_port = "20100";
	std::string prometheus_scrape_port = "20200";
	std::string prometheus_scrape_path = "/metrics";
};

class metrics_config
{
public:
	metrics_config() = default;
	explicit metrics_config(const metrics_defaults& defaults);

	/**
	 * @throws meshbridge_exception if the annotation is not a boolean.
	 */
	bool enable_metrics(const pod& p) const;

	/**
	 * @throws meshbridge_exception if the annotation is not a boolean.
	 */
	bool enable_metrics_merging(const pod& p) const;

	/**
	 * Port of the merged metrics server, unprivileged range only.
	 *
	 * @throws meshbridge_exception if the port is invalid.
	 */
	int merged_metrics_port(const pod& p) const;

	/**
	 * Port Prometheus scrapes, unprivileged range only.
	 *
	 * @throws meshbridge_exception if the port is invalid.
	 */
	int prometheus_scrape_port(const pod& p) const;

	std::string prometheus_scrape_path(const pod& p) const;

	/**
	 * Port the service itself exposes metrics on. Defaults to the
	 * registered service port, or 0 when there is none.
	 *
	 * @throws meshbridge_exception if the port is invalid.
	 */
	int service_metrics_port(const pod& p) const;

	std::string service_metrics_path(const pod& p) const;

	/**
	 * True if metrics and merging are both enabled and the service has a
	 * metrics port.
	 */
	bool should_run_merged_metrics_server(const pod& p) const;

private:
	static int determine_and_validate_port(const pod& p,
	                                       const std::string& annotation,
	                                       const std::string& default_port,
	                                       bool privileged);

	static bool resolve_bool(const pod& p, const std::string& annotation, bool default_value);

	metrics_defaults m_defaults;
};

} // namespace meshbridge
