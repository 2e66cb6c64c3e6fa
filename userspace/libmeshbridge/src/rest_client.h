/**
 * @file
 *
 * Interface to rest_client, a small synchronous HTTP(S) JSON client.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <Poco/Net/Context.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/TemporaryFile.h>
#include <Poco/URI.h>

#include <json/json.h>

#include <cstdint>
#include <memory>
#include <string>

namespace meshbridge
{

/**
 * Issues one request per call against a base URI. A new session is opened
 * for every request, so a single instance may be shared by any number of
 * threads.
 */
class rest_client
{
public:
	using ptr = std::shared_ptr<rest_client>;

	struct options
	{
		std::string base_uri;

		/** Header carrying the credential, e.g. "Authorization". */
		std::string auth_header;
		std::string auth_value;

		/** PEM file used to verify the server. */
		std::string ca_file;

		/** PEM text used to verify the server when there is no file. */
		std::string ca_data;

		bool insecure_skip_verify = false;
		uint32_t timeout_ms = 5000;
	};

	explicit rest_client(const options& opts);

	/**
	 * Send a request and return the response body.
	 *
	 * @param[in] method       HTTP method, e.g. Poco::Net::HTTPRequest::HTTP_GET.
	 * @param[in] path         path and query relative to the base URI.
	 * @param[in] body         request body, sent when non-empty.
	 * @param[in] content_type content type of the body.
	 *
	 * @throws api_exception if the request failed or the response status
	 *         was not 2xx.
	 */
	std::string send(const std::string& method,
	                 const std::string& path,
	                 const std::string& body = "",
	                 const std::string& content_type = "application/json");

	/**
	 * Send a JSON body and parse the JSON response. An empty response body
	 * yields a null value.
	 */
	Json::Value send_json(const std::string& method,
	                      const std::string& path,
	                      const Json::Value& body = Json::Value::null,
	                      const std::string& content_type = "application/json");

	/**
	 * GET a JSON document.
	 *
	 * @returns false if the server answered 404.
	 */
	bool try_get_json(const std::string& path, Json::Value& out);

	const Poco::URI& base_uri() const { return m_base_uri; }

	/**
	 * Escape a string for use as a single path segment or query value.
	 */
	static std::string encode(const std::string& value);

private:
	std::unique_ptr<Poco::Net::HTTPClientSession> get_http_session() const;

	const Poco::URI m_base_uri;
	const std::string m_auth_header;
	const std::string m_auth_value;
	const uint32_t m_timeout_ms;
	std::unique_ptr<Poco::TemporaryFile> m_ca_data_file;
	Poco::Net::Context::Ptr m_context;
};

} // namespace meshbridge
