/**
 * @file
 *
 * Implementation of meshbridge_app.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "meshbridge_app.h"
#include "common_logger.h"
#include "configuration_manager.h"
#include "consul_rest_client.h"
#include "controller.h"
#include "k8s_rest_client.h"
#include "meshbridge_exception.h"
#include "rest_client.h"
#include "yaml_configuration.h"

#include <Poco/AutoPtr.h>
#include <Poco/ConsoleChannel.h>
#include <Poco/File.h>
#include <Poco/FileChannel.h>
#include <Poco/FormattingChannel.h>
#include <Poco/Logger.h>
#include <Poco/Path.h>
#include <Poco/PatternFormatter.h>
#include <Poco/Util/HelpFormatter.h>
#include <Poco/Util/Option.h>

#include <iostream>
#include <memory>

#ifndef MESHBRIDGE_VERSION
#define MESHBRIDGE_VERSION "0.0.0"
#endif

using namespace Poco;
using namespace Poco::Util;
using namespace meshbridge;

COMMON_LOGGER();

namespace
{

const std::string DEFAULT_CONFIG_DIR = "/etc/meshbridge/";

} // end namespace

meshbridge_app::meshbridge_app():
	m_help_requested(false),
	m_version_requested(false),
	m_configtest(false),
	m_config_file(DEFAULT_CONFIG_DIR + "meshbridge.yaml"),
	m_default_config_file(DEFAULT_CONFIG_DIR + "meshbridge.default.yaml")
{
}

meshbridge_app::~meshbridge_app()
{
	g_log.reset();
}

Message::Priority meshbridge_app::priority_or(const std::string& name,
                                              const Message::Priority fallback)
{
	Message::Priority priority = fallback;

	if(!name.empty() && !common_logger::parse_priority(name, priority))
	{
		return fallback;
	}

	return priority;
}

void meshbridge_app::initialize(Application& self)
{
	ServerApplication::initialize(self);
}

void meshbridge_app::uninitialize()
{
	ServerApplication::uninitialize();
}

void meshbridge_app::defineOptions(OptionSet& options)
{
	ServerApplication::defineOptions(options);

	options.addOption(
		Option("help", "h", "display help information on command line arguments")
			.required(false)
			.repeatable(false));

	options.addOption(
		Option("config", "c", "configuration file, overriding " + m_config_file)
			.required(false)
			.repeatable(false)
			.argument("file"));

	options.addOption(
		Option("defaultconfig", "", "default configuration file, overriding " + m_default_config_file)
			.required(false)
			.repeatable(false)
			.argument("file"));

	options.addOption(
		Option("configtest", "t", "print the effective configuration and exit.")
			.required(false)
			.repeatable(false));

	options.addOption(
		Option("consolepriority", "", "min priority of the log messages that go on console. Can be 'error', 'warning', 'info' or 'debug'.")
			.required(false)
			.repeatable(false)
			.argument("priority"));

	options.addOption(
		Option("filepriority", "", "min priority of the log messages that go on file. Can be 'error', 'warning', 'info' or 'debug'.")
			.required(false)
			.repeatable(false)
			.argument("priority"));

	options.addOption(
		Option("version", "v", "display version")
			.required(false)
			.repeatable(false));
}

void meshbridge_app::handleOption(const std::string& name, const std::string& value)
{
	ServerApplication::handleOption(name, value);

	if(name == "help")
	{
		m_help_requested = true;
	}
	else if(name == "config")
	{
		m_config_file = value;
	}
	else if(name == "defaultconfig")
	{
		m_default_config_file = value;
	}
	else if(name == "configtest")
	{
		m_configtest = true;
	}
	else if(name == "consolepriority")
	{
		m_console_priority_override = value;
	}
	else if(name == "filepriority")
	{
		m_file_priority_override = value;
	}
	else if(name == "version")
	{
		m_version_requested = true;
	}
}

void meshbridge_app::displayHelp()
{
	HelpFormatter helpFormatter(options());
	helpFormatter.setCommand(commandName());
	helpFormatter.setUsage("OPTIONS");
	helpFormatter.setHeader("Syncs Kubernetes workloads into the Consul service mesh.");
	helpFormatter.format(std::cout);
}

int meshbridge_app::main(const std::vector<std::string>& args)
{
	if(m_help_requested)
	{
		displayHelp();
		return Application::EXIT_OK;
	}

	if(m_version_requested)
	{
		std::cout << MESHBRIDGE_VERSION << std::endl;
		return Application::EXIT_OK;
	}

	yaml_configuration yaml({m_config_file, m_default_config_file});

	if(!yaml.errors().empty())
	{
		for(const auto& error : yaml.errors())
		{
			std::cerr << error << std::endl;
		}
		return Application::EXIT_CONFIG;
	}

	configuration_manager::instance().init_config(yaml);

	if(m_configtest)
	{
		std::cout << configuration_manager::instance().to_yaml() << std::endl;
		return Application::EXIT_OK;
	}

	try
	{
		initialize_logging(controller_config::logging());
	}
	catch(const Poco::Exception& ex)
	{
		std::cerr << "Unable to set up logging: " << ex.displayText() << std::endl;
		return Application::EXIT_CANTCREAT;
	}

	LOG_INFO("meshbridge-controller " MESHBRIDGE_VERSION " starting");

	for(const auto& warning : yaml.warnings())
	{
		LOG_WARNING("%s", warning.c_str());
	}

	configuration_manager::instance().print_config([](const std::string& line) {
		LOG_INFO("%s", line.c_str());
	});

	return run_controller();
}

int meshbridge_app::run_controller()
{
	int exit_code = Application::EXIT_OK;

	try
	{
		const controller_settings settings = controller_config::controller();

		const k8s_client::ptr k8s = std::make_shared<k8s_rest_client>(
		    std::make_shared<rest_client>(controller_config::kubernetes()));
		const consul_client::ptr consul = std::make_shared<consul_rest_client>(
		    std::make_shared<rest_client>(controller_config::consul()));

		controller ctrl(settings, k8s, consul, [](const std::string& agent_ip) {
			return std::make_shared<consul_rest_client>(
			    std::make_shared<rest_client>(controller_config::consul_agent(agent_ip)));
		});

		ctrl.start();
		waitForTerminationRequest();

		LOG_INFO("Termination requested");
		ctrl.stop();
	}
	catch(const meshbridge_exception& ex)
	{
		LOG_FATAL("%s", ex.what());
		exit_code = Application::EXIT_SOFTWARE;
	}
	catch(const Poco::Exception& ex)
	{
		LOG_FATAL("%s", ex.displayText().c_str());
		exit_code = Application::EXIT_SOFTWARE;
	}

	LOG_INFO("Terminating");
	return exit_code;
}

void meshbridge_app::initialize_logging(const log_settings& settings)
{
	File d(settings.location);
	d.createDirectories();
	Path p;
	p.parseDirectory(settings.location);
	p.setFileName(controller_config::LOG_FILE_NAME);

	const Message::Priority file_priority =
	    priority_or(m_file_priority_override.empty() ? settings.file_priority
	                                                 : m_file_priority_override,
	                Message::PRIO_INFORMATION);
	const Message::Priority console_priority =
	    priority_or(m_console_priority_override.empty() ? settings.console_priority
	                                                    : m_console_priority_override,
	                Message::PRIO_INFORMATION);

	AutoPtr<FileChannel> file_channel(new FileChannel(p.toString()));

	file_channel->setProperty("rotation", std::to_string(settings.max_size_mb) + "M");
	file_channel->setProperty("purgeCount", std::to_string(settings.rotate));
	file_channel->setProperty("archive", "timestamp");

	AutoPtr<Formatter> formatter(new PatternFormatter("%Y-%m-%d %H:%M:%S.%i, %P.%I, %p, %t"));
	AutoPtr<Channel> formatting_channel_file(new FormattingChannel(formatter, file_channel));
	AutoPtr<Channel> console_channel(new ConsoleChannel());
	AutoPtr<Channel> formatting_channel_console(new FormattingChannel(formatter, console_channel));

	Logger& loggerf = Logger::create("MeshbridgeLogF", formatting_channel_file, file_priority);
	Logger& loggerc = Logger::create("MeshbridgeLogC", formatting_channel_console, console_priority);

	g_log = std::unique_ptr<common_logger>(new common_logger(&loggerf,
	                                                         &loggerc,
	                                                         file_priority,
	                                                         console_priority,
	                                                         settings.file_priority_by_component,
	                                                         settings.console_priority_by_component));
	common_logger_cache::log_and_purge();
}
