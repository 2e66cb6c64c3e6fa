/**
 * @file
 *
 * Entry point of meshbridge-cni, invoked by the container runtime with the
 * CNI_* environment and the network configuration on stdin.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "cni_error.h"
#include "cni_plugin.h"
#include "common_logger.h"
#include "iptables_effector.h"
#include "k8s_json.h"
#include "k8s_rest_client.h"
#include "kubeconfig.h"
#include "plugin_conf.h"
#include "rest_client.h"

#include <Poco/AutoPtr.h>
#include <Poco/Environment.h>
#include <Poco/File.h>
#include <Poco/FileChannel.h>
#include <Poco/FormattingChannel.h>
#include <Poco/Logger.h>
#include <Poco/NullChannel.h>
#include <Poco/Path.h>
#include <Poco/PatternFormatter.h>
#include <Poco/StreamCopier.h>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>

using namespace Poco;
using namespace meshbridge;

COMMON_LOGGER();

namespace
{

/**
 * Log to the file named by the plugin conf. stdout carries the CNI result
 * so nothing is ever logged there.
 */
void initialize_logging(const std::string& stdin_data)
{
	plugin_conf conf;

	try
	{
		conf = plugin_conf::parse(stdin_data);
	}
	catch(const cni_error& ex)
	{
		// The command reports the error again; log with the defaults.
		LOG_WARNING("%s", ex.what());
	}

	Message::Priority priority = Message::PRIO_INFORMATION;
	if(!common_logger::parse_priority(conf.log_level, priority))
	{
		LOG_NOTICE("unknown log_level %s", conf.log_level.c_str());
	}

	AutoPtr<Channel> file_channel;
	try
	{
		Path p(conf.log_file);
		File(p.parent()).createDirectories();
		file_channel = new FileChannel(p.toString());
		file_channel->setProperty("rotation", "10M");
		file_channel->setProperty("purgeCount", "5");
		file_channel->setProperty("archive", "timestamp");
	}
	catch(const Poco::Exception& ex)
	{
		std::cerr << "unable to log to " << conf.log_file << ": " << ex.displayText()
		          << std::endl;
		file_channel = new NullChannel();
	}

	AutoPtr<Formatter> formatter(new PatternFormatter("%Y-%m-%d %H:%M:%S.%i, %P.%I, %p, %t"));
	AutoPtr<Channel> formatting_channel_file(new FormattingChannel(formatter, file_channel));
	Logger& loggerf = Logger::create("MeshbridgeCniLogF", formatting_channel_file, priority);

	AutoPtr<Channel> null_channel(new NullChannel());
	Logger& loggerc = Logger::create("MeshbridgeCniLogC", null_channel, Message::PRIO_FATAL);

	g_log = std::unique_ptr<common_logger>(new common_logger(&loggerf, &loggerc));
	common_logger_cache::log_and_purge();
}

k8s_client::ptr make_k8s_client(const plugin_conf& conf)
{
	const rest_client::options opts = kubeconfig::load_file(conf.kubeconfig_path());

	return std::make_shared<k8s_rest_client>(std::make_shared<rest_client>(opts));
}

std::string version_of(const std::string& stdin_data)
{
	try
	{
		return plugin_conf::parse(stdin_data).cni_version;
	}
	catch(const cni_error&)
	{
		return "";
	}
}

} // end namespace

int main(int, char**)
{
	// A failed iptables-restore must not kill the plugin while its
	// input is being written.
	signal(SIGPIPE, SIG_IGN);

	std::string stdin_data;
	StreamCopier::copyToString(std::cin, stdin_data);

	initialize_logging(stdin_data);

	const cni_invocation invocation = cni_invocation::from_environment(stdin_data);
	const bool dual_stack = Environment::get("CNI_DUAL_STACK", "") == "true";

	cni_plugin plugin(&make_k8s_client,
	                  std::make_shared<iptables_restore_effector>(),
	                  dual_stack);

	try
	{
		const std::string output = plugin.run(invocation);

		if(!output.empty())
		{
			std::cout << output << std::endl;
		}
	}
	catch(const cni_error& ex)
	{
		LOG_ERROR("%s %s failed: %s",
		          invocation.command.c_str(),
		          invocation.container_id.c_str(),
		          ex.what());
		std::cout << k8s_json::write(ex.to_json(version_of(stdin_data))) << std::endl;
		return 1;
	}
	catch(const meshbridge_exception& ex)
	{
		LOG_ERROR("%s %s failed: %s",
		          invocation.command.c_str(),
		          invocation.container_id.c_str(),
		          ex.what());
		std::cout << k8s_json::write(cni_error(ex.what()).to_json(version_of(stdin_data)))
		          << std::endl;
		return 1;
	}

	return 0;
}
