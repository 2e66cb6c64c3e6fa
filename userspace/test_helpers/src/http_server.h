/**
 * @file
 *
 * Interface to scoped_http_server, a loopback HTTP server that answers
 * requests from a test-supplied handler.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <Poco/Net/HTTPServer.h>
#include <Poco/Net/ServerSocket.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace test_helpers
{

struct recorded_request
{
	std::string method;
	std::string uri;
	std::string body;
	std::string content_type;
	std::map<std::string, std::string> headers;

	std::string header(const std::string& name) const;
};

struct canned_response
{
	canned_response(int s = 200, const std::string& b = ""):
		status(s),
		body(b)
	{
	}

	int status;
	std::string body;
};

///
/// Starts an HTTP server listening on an ephemeral loopback port upon
/// instantiation and stops it on destruction. Every request is recorded
/// and answered by the handler.
///
class scoped_http_server
{
public:
	using handler = std::function<canned_response(const recorded_request&)>;

	struct shared_state
	{
		std::mutex mtx;
		handler respond;
		std::vector<recorded_request> requests;
	};

	explicit scoped_http_server(const handler& respond);
	~scoped_http_server();

	uint16_t port() const;

	/// @return "http://127.0.0.1:<port>"
	std::string base_uri() const;

	std::vector<recorded_request> requests() const;

	/// Replace the handler for subsequent requests.
	void set_handler(const handler& respond);

private:
	std::shared_ptr<shared_state> m_state;
	Poco::Net::ServerSocket m_socket;
	Poco::Net::HTTPServer m_srv;
};

} // namespace test_helpers
