/**
 * @file
 *
 * Interface to meshbridge_app -- the meshbridge-controller process.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include "controller_config.h"

#include <Poco/Message.h>
#include <Poco/Util/OptionSet.h>
#include <Poco/Util/ServerApplication.h>

#include <string>
#include <vector>

class meshbridge_app : public Poco::Util::ServerApplication
{
public:
	meshbridge_app();
	~meshbridge_app();

	/**
	 * Turn a configured level name into a priority. Empty or unknown names
	 * yield the fallback.
	 */
	static Poco::Message::Priority priority_or(const std::string& name,
	                                           Poco::Message::Priority fallback);

protected:
	void initialize(Poco::Util::Application& self) override;
	void uninitialize() override;
	void defineOptions(Poco::Util::OptionSet& options) override;
	void handleOption(const std::string& name, const std::string& value) override;
	void displayHelp();
	int main(const std::vector<std::string>& args) override;

private:
	void initialize_logging(const meshbridge::log_settings& settings);
	int run_controller();

	bool m_help_requested;
	bool m_version_requested;
	bool m_configtest;
	std::string m_config_file;
	std::string m_default_config_file;
	std::string m_console_priority_override;
	std::string m_file_priority_override;
};
