/**
 * @file
 *
 * Implementation of the kubeconfig reader.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "kubeconfig.h"
#include "common_logger.h"
#include "meshbridge_exception.h"
#include "string_utils.h"

#include <Poco/Base64Decoder.h>
#include <Poco/FileStream.h>
#include <Poco/StreamCopier.h>

#include <yaml-cpp/yaml.h>

#include <sstream>

COMMON_LOGGER();

namespace
{

YAML::Node find_named(const YAML::Node& list, const std::string& name, const char* what)
{
	if(list.IsSequence())
	{
		for(const auto& entry : list)
		{
			if(entry["name"] && entry["name"].as<std::string>() == name)
			{
				return entry;
			}
		}
	}

	throw meshbridge::meshbridge_exception(std::string("kubeconfig has no ") + what +
	                                       " named " + name);
}

std::string scalar(const YAML::Node& node, const std::string& key)
{
	if(node && node[key] && node[key].IsScalar())
	{
		return node[key].as<std::string>();
	}

	return "";
}

std::string base64_decode(const std::string& encoded)
{
	std::istringstream in(encoded);
	Poco::Base64Decoder decoder(in);
	std::string decoded;

	Poco::StreamCopier::copyToString(decoder, decoded);
	return decoded;
}

std::string read_file(const std::string& path)
{
	std::string content;
	Poco::FileInputStream in(path);

	Poco::StreamCopier::copyToString(in, content);
	return content;
}

meshbridge::rest_client::options parse(const YAML::Node& root)
{
	meshbridge::rest_client::options opts;

	const std::string current = scalar(root, "current-context");
	if(current.empty())
	{
		throw meshbridge::meshbridge_exception("kubeconfig has no current-context");
	}

	const YAML::Node context = find_named(root["contexts"], current, "context")["context"];
	const YAML::Node cluster =
	    find_named(root["clusters"], scalar(context, "cluster"), "cluster")["cluster"];

	opts.base_uri = scalar(cluster, "server");
	if(opts.base_uri.empty())
	{
		throw meshbridge::meshbridge_exception("kubeconfig cluster has no server");
	}

	opts.ca_file = scalar(cluster, "certificate-authority");

	const std::string ca_data = scalar(cluster, "certificate-authority-data");
	if(!ca_data.empty())
	{
		opts.ca_data = base64_decode(ca_data);
	}

	bool insecure = false;
	if(string_utils::parse_bool(scalar(cluster, "insecure-skip-tls-verify"), insecure))
	{
		opts.insecure_skip_verify = insecure;
	}

	const std::string user_name = scalar(context, "user");
	if(!user_name.empty())
	{
		const YAML::Node user = find_named(root["users"], user_name, "user")["user"];
		std::string token = scalar(user, "token");

		if(token.empty() && !scalar(user, "tokenFile").empty())
		{
			token = string_utils::trimmed(read_file(scalar(user, "tokenFile")));
		}

		if(!token.empty())
		{
			opts.auth_header = "Authorization";
			opts.auth_value = "Bearer " + token;
		}
	}

	return opts;
}

} // end namespace

namespace meshbridge
{
namespace kubeconfig
{

rest_client::options load_file(const std::string& path)
{
	try
	{
		return parse(YAML::LoadFile(path));
	}
	catch(const YAML::Exception& ex)
	{
		LOGGED_THROW(meshbridge_exception,
		             "unable to read kubeconfig %s: %s",
		             path.c_str(),
		             ex.what());
	}
	catch(const Poco::Exception& ex)
	{
		LOGGED_THROW(meshbridge_exception,
		             "unable to read kubeconfig %s: %s",
		             path.c_str(),
		             ex.displayText().c_str());
	}
}

rest_client::options load(const std::string& yaml_text)
{
	try
	{
		return parse(YAML::Load(yaml_text));
	}
	catch(const YAML::Exception& ex)
	{
		LOGGED_THROW(meshbridge_exception, "unable to parse kubeconfig: %s", ex.what());
	}
}

} // namespace kubeconfig
} // namespace meshbridge
