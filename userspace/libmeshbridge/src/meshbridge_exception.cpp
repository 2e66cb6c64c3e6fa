/**
 * @file
 *
 * Implementation of the meshbridge exception types.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "meshbridge_exception.h"

#include <Poco/Net/HTTPResponse.h>

namespace meshbridge
{

meshbridge_exception::meshbridge_exception(const std::string& message):
	std::runtime_error(message)
{ }

const int api_exception::NO_RESPONSE = 0;

api_exception::api_exception(const std::string& message, const int code):
	meshbridge_exception(message),
	m_code(code)
{ }

int api_exception::get_code() const
{
	return m_code;
}

bool api_exception::is_not_found() const
{
	return m_code == Poco::Net::HTTPResponse::HTTP_NOT_FOUND;
}

bool api_exception::is_conflict() const
{
	return m_code == Poco::Net::HTTPResponse::HTTP_CONFLICT;
}

multi_error::multi_error(const std::vector<std::string>& errors):
	meshbridge_exception(render(errors)),
	m_errors(errors)
{ }

const std::vector<std::string>& multi_error::errors() const
{
	return m_errors;
}

std::string multi_error::render(const std::vector<std::string>& errors)
{
	if(errors.size() == 1)
	{
		return "1 error occurred:\n\t* " + errors.front();
	}

	std::string message = std::to_string(errors.size()) + " errors occurred:";

	for(const auto& error : errors)
	{
		message += "\n\t* " + error;
	}

	return message;
}

void error_accumulator::add(const std::string& error)
{
	m_errors.push_back(error);
}

void error_accumulator::add(const std::exception& ex)
{
	add(std::string(ex.what()));
}

bool error_accumulator::empty() const
{
	return m_errors.empty();
}

size_t error_accumulator::size() const
{
	return m_errors.size();
}

void error_accumulator::throw_if_any() const
{
	if(!m_errors.empty())
	{
		throw multi_error(m_errors);
	}
}

} // namespace meshbridge
