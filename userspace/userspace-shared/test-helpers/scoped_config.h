/**
 * @file
 *
 * Interface to scoped_config -- overrides one configuration value for the
 * lifetime of the object.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <configuration_manager.h>

#include <stdexcept>
#include <string>

namespace test_helpers
{

/**
 * Manages lifetime of a single configuration value. The value
 * is set back when this object is destroyed
 *
 * Note that this only works for configs that use the
 * configuration_manager.
 */
template <typename config_type>
class scoped_config
{
public:
	scoped_config(const std::string& key, const config_type& value):
		m_config(lookup(key)),
		m_old(m_config->get_value())
	{
		m_config->get_value() = value;
	}

	~scoped_config()
	{
		m_config->get_value() = m_old;
	}

private:
	static type_config<config_type>* lookup(const std::string& key)
	{
		type_config<config_type>* const config =
			configuration_manager::instance().get_mutable_config<config_type>(key);

		if(config == nullptr)
		{
			throw std::invalid_argument("no config of the requested type named " + key);
		}

		return config;
	}

	type_config<config_type>* const m_config;
	const config_type m_old;
};

}
