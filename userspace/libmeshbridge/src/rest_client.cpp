/**
 * @file
 *
 * Implementation of rest_client.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "rest_client.h"
#include "common_logger.h"
#include "k8s_json.h"
#include "meshbridge_exception.h"

#include <Poco/Exception.h>
#include <Poco/FileStream.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/HTTPSClientSession.h>
#include <Poco/Net/SSLManager.h>
#include <Poco/StreamCopier.h>
#include <Poco/Timespan.h>

#include <sstream>

using Poco::Net::Context;
using Poco::Net::HTTPClientSession;
using Poco::Net::HTTPRequest;
using Poco::Net::HTTPResponse;
using Poco::Net::HTTPSClientSession;
using Poco::StreamCopier;

COMMON_LOGGER();

namespace
{

class SSLInitializer
{
public:
	SSLInitializer()
	{
		Poco::Net::initializeSSL();
	}

	~SSLInitializer()
	{
		Poco::Net::uninitializeSSL();
	}
};

void init_ssl_once()
{
	static SSLInitializer s_ssl_initializer;
}

const std::string CIPHER_LIST = "ALL:!ADH:!LOW:!EXP:!MD5:@STRENGTH";

} // end namespace

namespace meshbridge
{

rest_client::rest_client(const options& opts):
	m_base_uri(opts.base_uri),
	m_auth_header(opts.auth_header),
	m_auth_value(opts.auth_value),
	m_timeout_ms(opts.timeout_ms)
{
	if(m_base_uri.getScheme() != "https")
	{
		return;
	}

	init_ssl_once();

	std::string ca_location = opts.ca_file;

	if(ca_location.empty() && !opts.ca_data.empty())
	{
		m_ca_data_file.reset(new Poco::TemporaryFile());
		Poco::FileOutputStream out(m_ca_data_file->path());
		out << opts.ca_data;
		out.close();
		ca_location = m_ca_data_file->path();
	}

	const Context::VerificationMode mode = opts.insecure_skip_verify ?
	                                       Context::VERIFY_NONE :
	                                       Context::VERIFY_RELAXED;

	m_context = new Context(Context::CLIENT_USE,
	                        "",
	                        "",
	                        ca_location,
	                        mode,
	                        9,
	                        ca_location.empty(),
	                        CIPHER_LIST);
}

std::unique_ptr<HTTPClientSession> rest_client::get_http_session() const
{
	std::unique_ptr<HTTPClientSession> session;

	if(m_context)
	{
		session.reset(new HTTPSClientSession(m_base_uri.getHost(),
		                                     m_base_uri.getPort(),
		                                     m_context));
	}
	else
	{
		session.reset(new HTTPClientSession(m_base_uri.getHost(),
		                                    m_base_uri.getPort()));
	}

	session->setTimeout(Poco::Timespan(static_cast<Poco::Timespan::TimeDiff>(m_timeout_ms) * 1000));
	return session;
}

std::string rest_client::send(const std::string& method,
                              const std::string& path,
                              const std::string& body,
                              const std::string& content_type)
{
	const std::string full_path = m_base_uri.getPath() + path;
	HTTPResponse response;
	std::string response_body;

	LOG_DEBUG("%s %s", method.c_str(), full_path.c_str());

	try
	{
		std::unique_ptr<HTTPClientSession> session = get_http_session();
		HTTPRequest request(method, full_path, Poco::Net::HTTPMessage::HTTP_1_1);

		request.set("Accept", "application/json");
		if(!m_auth_header.empty() && !m_auth_value.empty())
		{
			request.set(m_auth_header, m_auth_value);
		}

		if(!body.empty())
		{
			request.setContentType(content_type);
			request.setContentLength(body.size());
			session->sendRequest(request) << body;
		}
		else
		{
			session->sendRequest(request);
		}

		std::istream& rs = session->receiveResponse(response);
		StreamCopier::copyToString(rs, response_body);
	}
	catch(const Poco::Exception& ex)
	{
		THROW_API_ERROR(api_exception::NO_RESPONSE,
		                "%s %s failed: %s",
		                method.c_str(),
		                full_path.c_str(),
		                ex.displayText().c_str());
	}

	const int status = static_cast<int>(response.getStatus());

	if(status < 200 || status >= 300)
	{
		// Misses are routine for callers that probe for existence.
		if(status == HTTPResponse::HTTP_NOT_FOUND)
		{
			throw api_exception(method + " " + full_path + ": not found", status);
		}

		THROW_API_ERROR(status,
		                "%s %s returned %d: %s",
		                method.c_str(),
		                full_path.c_str(),
		                status,
		                response_body.c_str());
	}

	return response_body;
}

Json::Value rest_client::send_json(const std::string& method,
                                   const std::string& path,
                                   const Json::Value& body,
                                   const std::string& content_type)
{
	const std::string request_body = body.isNull() ? "" : k8s_json::write(body);
	const std::string response_body = send(method, path, request_body, content_type);

	if(response_body.empty())
	{
		return Json::Value::null;
	}

	return k8s_json::parse(response_body);
}

bool rest_client::try_get_json(const std::string& path, Json::Value& out)
{
	try
	{
		out = send_json(HTTPRequest::HTTP_GET, path);
	}
	catch(const api_exception& ex)
	{
		if(ex.is_not_found())
		{
			return false;
		}
		throw;
	}

	return true;
}

std::string rest_client::encode(const std::string& value)
{
	std::string encoded;

	Poco::URI::encode(value, "/?#&=+ ,:;@$!*'()[]\"<>{}|\\^`", encoded);
	return encoded;
}

} // namespace meshbridge
