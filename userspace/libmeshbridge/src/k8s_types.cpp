/**
 * @file
 *
 * Implementation of the Kubernetes object helpers.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "k8s_types.h"

#include <algorithm>
#include <tuple>

namespace meshbridge
{

object_key::object_key(const std::string& key_ns, const std::string& key_name):
	ns(key_ns),
	name(key_name)
{ }

std::string object_key::to_string() const
{
	return ns + "/" + name;
}

object_key object_key::from_string(const std::string& key)
{
	const std::string::size_type pos = key.find('/');

	if(pos == std::string::npos)
	{
		return object_key("", key);
	}

	return object_key(key.substr(0, pos), key.substr(pos + 1));
}

bool object_key::operator==(const object_key& rhs) const
{
	return ns == rhs.ns && name == rhs.name;
}

bool object_key::operator<(const object_key& rhs) const
{
	return std::tie(ns, name) < std::tie(rhs.ns, rhs.name);
}

object_key object_meta::key() const
{
	return object_key(ns, name);
}

bool object_meta::being_deleted() const
{
	return !deletion_timestamp.empty();
}

bool object_meta::get_annotation(const std::string& annotation_name,
                                 std::string& value) const
{
	auto itr = annotations.find(annotation_name);

	if(itr == annotations.end())
	{
		return false;
	}

	value = itr->second;
	return true;
}

std::string object_meta::annotation(const std::string& annotation_name) const
{
	std::string value;

	get_annotation(annotation_name, value);
	return value;
}

bool object_meta::get_label(const std::string& label_name,
                            std::string& value) const
{
	auto itr = labels.find(label_name);

	if(itr == labels.end())
	{
		return false;
	}

	value = itr->second;
	return true;
}

bool object_meta::has_finalizer(const std::string& finalizer) const
{
	return std::find(finalizers.begin(), finalizers.end(), finalizer) !=
	       finalizers.end();
}

void object_meta::add_finalizer(const std::string& finalizer)
{
	if(!has_finalizer(finalizer))
	{
		finalizers.push_back(finalizer);
	}
}

void object_meta::remove_finalizer(const std::string& finalizer)
{
	finalizers.erase(std::remove(finalizers.begin(),
	                             finalizers.end(),
	                             finalizer),
	                 finalizers.end());
}

int_or_string::int_or_string(const int value):
	is_int(true),
	int_value(value)
{ }

int_or_string::int_or_string(const std::string& value):
	is_int(false),
	str_value(value)
{ }

bool pod::is_running() const
{
	return phase == "Running";
}

bool pod::is_ready() const
{
	for(const auto& condition : conditions)
	{
		if(condition.type == "Ready")
		{
			return condition.status == "True";
		}
	}

	return false;
}

} // namespace meshbridge
