/**
 * @file
 *
 * Interface to type_config.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <functional>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

class yaml_configuration;

/**
 * This configuration scheme provides an easy way of acquiring
 * config values from a central location without having to pass
 * them around, and without the central location needing to be
 * aware of how to parse individual types.
 *
 * Usage:
 *
 * (in some cpp file)
 *
 * type_config<uint64_t> c_poll_interval_ms(2000,
 *                                          "How often resources are listed",
 *                                          "controller",
 *                                          "poll_interval_ms");
 *
 * OR if using the optional fields (like min and max)
 *
 * type_config<uint64_t>::ptr c_poll_interval_ms =
 *      type_config_builder<uint64_t>(2000,
 *                                    "How often resources are listed",
 *                                    "controller",
 *                                    "poll_interval_ms")
 *          .min(100).build();
 *
 * The data is automatically populated from the yaml, and can then be freely
 * used:
 *
 * c_poll_interval_ms.get_value()
 *
 * If you have a not-yet-supported type, you'll most likely get a compile error
 * saying it can't find "get_value_string<your_type>". If your type is a scalar,
 * then you'll simply need to implement that function.
 *
 * NOTE: registering new keys is NOT thread safe, and thus should only be done
 * statically, which will guarantee us single-threadedness
 */
class configuration_unit
{
public:
	/**
	 * Exception thrown when a configuration_unit cannot be updated from
	 * an external representation.
	 */
	class exception : public std::runtime_error
	{
	public:
		exception(const std::string& msg);
	};

	/**
	 * One location of a value in the yaml. Unused levels are "".
	 */
	struct config_key
	{
		config_key(const std::string& key_value,
			   const std::string& subkey_value,
			   const std::string& subsubkey_value) :
			key(key_value),
			subkey(subkey_value),
			subsubkey(subsubkey_value)
		{}

		/** key | key.subkey | key.subkey.subsubkey */
		std::string to_string() const;

		std::string key;
		std::string subkey;
		std::string subsubkey;
	};

	/**
	 * Our yaml interface has three levels of keys possible. If a given
	 * value requires fewer values, set the other strings to "".
	 * This constructor registers this object with the
	 * configuration_manager class.
	 */
	configuration_unit(const std::string& key,
			   const std::string& subkey,
			   const std::string& subsubkey,
			   const std::string& description);
	virtual ~configuration_unit();

	/**
	 * Return a "key.subkey.subsubkey: value" representation of this
	 * config. Empty subkeys are skipped.
	 */
	std::string to_string() const;

	/**
	 * Returns a string representation of the value of this config.
	 */
	virtual std::string value_to_string() const = 0;

	/**
	 * Parse the given string (yaml scalar syntax) into the value of this
	 * config.
	 *
	 * @returns true on success, false if the string could not be parsed.
	 */
	virtual bool string_to_value(const std::string& value) = 0;

	/**
	 * Initializes the value stored in the raw config.
	 *
	 * @param raw_config the yaml_configuration containing the configuration
	 *                   data
	 */
	virtual void init(const yaml_configuration& raw_config) = 0;

	/** Called after all configuration params have been init'd */
	virtual void post_init() = 0;

	/**
	 * Return the canonical string for the config.
	 *
	 * key_string will be of the form:
	 * key | key.subkey | key.subkey.subsubkey
	 */
	const std::string& get_key_string() const;

	const std::string& get_key() const;
	const std::string& get_subkey() const;
	const std::string& get_subsubkey() const;
	const std::string& get_description() const;

	/**
	 * Add another location where this value may be found. The key given
	 * at construction stays the primary (canonical) key.
	 */
	void alternate_key(const config_key& key);

	/** All keys, primary first. */
	const std::vector<config_key>& keys() const;

	const config_key& primary_key() const;

	/** Stop this configuration value from showing up in logs */
	void hidden(bool value);

	/** Returns whether the value is hidden from logs */
	bool hidden() const;

	/**
	 * Returns a JSON-formatted representation of this configuration_unit.
	 */
	std::string to_json() const;

	/**
	 * Update the value from a JSON document of the form
	 * { "value": "<string>" }.
	 *
	 * @throws configuration_unit::exception on failure.
	 */
	void from_json(const std::string& json);

protected:
	/**
	 * Returns a string representation for anything that std::to_string() can
	 * handle.
	 */
	template<typename value_type>
	static std::string get_value_string(const value_type& value)
	{
		return std::to_string(value);
	}

	/**
	 * Override of get_value_string() for type std::vector<value_type>.
	 *
	 * @returns a string representation of the given value_vector in the form
	 *          "[value1, value2, value3]"
	 */
	template<typename value_type>
	static std::string get_value_string(const std::vector<value_type>& value_vector)
	{
		std::stringstream out;

		out << "[";

		typename std::vector<value_type>::const_iterator i = value_vector.begin();

		if (i != value_vector.end())
		{
			out << get_value_string<value_type>(*i);

			for (++i; i != value_vector.end(); ++i)
			{
				out << ", " << get_value_string<value_type>(*i);
			}
		}

		out << "]";

		return out.str();
	}

private:
	std::vector<config_key> m_keys;
	const std::string m_description;
	std::string m_keystring;
	bool m_hidden;
};

/**
 * Specialization of get_value_string() for type bool.
 *
 * @returns "true" if the given value is true and "false" otherwise.
 */
template<>
inline std::string configuration_unit::get_value_string<bool>(const bool& value)
{
	return value ? "true" : "false";
}

/**
 * Specialization of get_value_string() for type string.
 *
 * @returns the given value.
 */
template<>
inline std::string configuration_unit::get_value_string<std::string>(const std::string& value)
{
	return value;
}


/**
 * An implementation of configuration_unit which supports scalar types and
 * sequences of scalars.
 *
 * data_type can be an arbitrary type which yaml-cpp can convert.
 */
template<typename data_type>
class type_config : public configuration_unit
{
	static_assert(!std::is_same<data_type, uint8_t>::value,
	              "data_type = uint8_t is not supported");
	static_assert(!std::is_same<data_type, int8_t>::value,
	              "data_type = int8_t is not supported");
public:
	using ptr = std::shared_ptr<const type_config<data_type>>;
	using mutable_ptr = std::shared_ptr<type_config<data_type>>;

	/**
	 * Our yaml interface has three levels of keys possible. If a given
	 * value only requires fewer values, set the other strings to "". This
	 * constructor registers this object with the configuration_manager
	 * class.
	 *
	 * The value of this config is set to the default at construction, and
	 * so will be valid, even if the yaml file has not been parsed yet.
	 */
	type_config(const data_type& default_value,
		    const std::string& description,
		    const std::string& key,
		    const std::string& subkey = "",
		    const std::string& subsubkey = "");

public: // stuff for configuration_unit
	std::string value_to_string() const override;
	bool string_to_value(const std::string& value) override;
	void init(const yaml_configuration& raw_config) override;

	/**
	 *  Call the post_init delegate if it was provided
	 */
	void post_init() override;

public: // other stuff
	/**
	 * Returns a const reference to the current value of this type_config.
	 */
	const data_type& get_value() const;

	/**
	 * Returns a mutable reference to the current value. Only meant for
	 * post_init delegates and test helpers.
	 */
	data_type& get_value();

	/**
	 * sets the value of this config to input value
	 */
	void set(const data_type& value);

	/**
	 * Returns the value configured in the yaml (or the default).
	 * This is useful to get what the value was before the
	 * post_init() function changes the value.
	 */
	const data_type& configured() const;

	/**
	 * sets a new default value. Only for configs whose default is
	 * determined at runtime.
	 */
	void set_default(const data_type& value);

	void min(const data_type& value);
	void max(const data_type& value);

	/**
	 * Set the post_init delegate. This allows the configuration
	 * value to be changed after all init functions are called for
	 * all configuration parameters. This is useful if one value
	 * depends on another.
	 */
	using post_init_delegate = std::function<void(type_config<data_type>&)>;
	void post_init(const post_init_delegate& value);

private:
	data_type m_default;
	data_type m_data;
	data_type m_configured;

	// Using unique_ptr in lieu of std::optional
	std::unique_ptr<data_type> m_min;
	std::unique_ptr<data_type> m_max;
	post_init_delegate m_post_init;
};

/**
 * Helper to create a (usually static) instance of a
 * type_config by calling functions to set the appropriate
 * characteristics. This keeps us from having many different
 * constructors for the type_config
 */
template<typename data_type>
class type_config_builder
{
public:
	type_config_builder(const data_type& default_value,
			    const std::string& description,
			    const std::string& key,
			    const std::string& subkey = "",
			    const std::string& subsubkey = "") :
	   m_type_config(new type_config<data_type>(default_value, description, key, subkey, subsubkey))
	{}

	type_config_builder& max(const data_type& value)
	{
		m_type_config->max(value);
		return *this;
	}

	type_config_builder& min(const data_type& value)
	{
		m_type_config->min(value);
		return *this;
	}

	/**
	 * Keep the config from showing up in logs
	 */
	type_config_builder& hidden()
	{
		m_type_config->hidden(true);
		return *this;
	}

	/**
	 * Also look for the value under the given key.
	 */
	type_config_builder& alternate_key(const std::string& key,
					   const std::string& subkey = "",
					   const std::string& subsubkey = "")
	{
		m_type_config->alternate_key(configuration_unit::config_key(key, subkey, subsubkey));
		return *this;
	}

	/**
	 * Set a delegate that will be called after all of the
	 * configurables are init'd. This is useful if one config
	 * depends on another.
	 */
	type_config_builder& post_init(const typename type_config<data_type>::post_init_delegate& value)
	{
		m_type_config->post_init(value);
		return *this;
	}

	/**
	 * Return the generated instance
	 */
	typename type_config<data_type>::ptr build()
	{
		return m_type_config;
	}

	/**
	 * Return a mutable version of the generated instance. Since
	 * these configs are meant to only be changed during static
	 * init, make sure you know what you are doing if you use this.
	 */
	typename type_config<data_type>::mutable_ptr build_mutable()
	{
		return m_type_config;
	}

private:
	typename type_config<data_type>::mutable_ptr m_type_config;
};

#include "type_config.hpp"
