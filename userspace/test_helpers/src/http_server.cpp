/**
 * @file
 *
 * Implementation of scoped_http_server.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "http_server.h"

#include <Poco/Net/HTTPRequestHandler.h>
#include <Poco/Net/HTTPRequestHandlerFactory.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/HTTPServerParams.h>
#include <Poco/Net/HTTPServerRequest.h>
#include <Poco/Net/HTTPServerResponse.h>
#include <Poco/Net/SocketAddress.h>
#include <Poco/StreamCopier.h>
#include <Poco/String.h>

#include <ostream>

namespace
{

class recording_handler : public Poco::Net::HTTPRequestHandler
{
public:
	explicit recording_handler(const std::shared_ptr<test_helpers::scoped_http_server::shared_state>& state):
		m_state(state)
	{
	}

	void handleRequest(Poco::Net::HTTPServerRequest& request,
	                   Poco::Net::HTTPServerResponse& response) override
	{
		test_helpers::recorded_request recorded;

		recorded.method = request.getMethod();
		recorded.uri = request.getURI();
		recorded.content_type = request.getContentType();
		for(const auto& entry : request)
		{
			recorded.headers[Poco::toLower(entry.first)] = entry.second;
		}
		Poco::StreamCopier::copyToString(request.stream(), recorded.body);

		test_helpers::canned_response canned;
		{
			std::lock_guard<std::mutex> lock(m_state->mtx);
			m_state->requests.push_back(recorded);
			canned = m_state->respond(recorded);
		}

		response.setStatus(static_cast<Poco::Net::HTTPResponse::HTTPStatus>(canned.status));
		response.setContentType("application/json");
		response.setContentLength(canned.body.size());
		response.send() << canned.body;
	}

private:
	std::shared_ptr<test_helpers::scoped_http_server::shared_state> m_state;
};

class recording_handler_factory : public Poco::Net::HTTPRequestHandlerFactory
{
public:
	explicit recording_handler_factory(const std::shared_ptr<test_helpers::scoped_http_server::shared_state>& state):
		m_state(state)
	{
	}

	Poco::Net::HTTPRequestHandler* createRequestHandler(const Poco::Net::HTTPServerRequest&) override
	{
		return new recording_handler(m_state);
	}

private:
	std::shared_ptr<test_helpers::scoped_http_server::shared_state> m_state;
};

} // end namespace

namespace test_helpers
{

std::string recorded_request::header(const std::string& name) const
{
	const auto itr = headers.find(Poco::toLower(name));

	return itr == headers.end() ? "" : itr->second;
}

scoped_http_server::scoped_http_server(const handler& respond):
	m_state(std::make_shared<shared_state>()),
	m_socket(Poco::Net::SocketAddress("127.0.0.1", 0)),
	m_srv(new recording_handler_factory(m_state), m_socket, new Poco::Net::HTTPServerParams)
{
	m_state->respond = respond;
	m_srv.start();
}

scoped_http_server::~scoped_http_server()
{
	m_srv.stopAll(true);
}

uint16_t scoped_http_server::port() const
{
	return m_socket.address().port();
}

std::string scoped_http_server::base_uri() const
{
	return "http://127.0.0.1:" + std::to_string(port());
}

std::vector<recorded_request> scoped_http_server::requests() const
{
	std::lock_guard<std::mutex> lock(m_state->mtx);
	return m_state->requests;
}

void scoped_http_server::set_handler(const handler& respond)
{
	std::lock_guard<std::mutex> lock(m_state->mtx);
	m_state->respond = respond;
}

} // namespace test_helpers
