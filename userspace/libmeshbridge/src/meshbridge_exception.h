/**
 * @file
 *
 * Interface to the meshbridge exception types.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// Shorthand macro to log and throw an api_exception with a particular
// status code. This is meant to be used with the common logger.
#define THROW_API_ERROR(__code, __fmt, ...)                                    \
do {                                                                           \
	std::string c_err_ = s_log_sink.build(__fmt,                           \
					      ##__VA_ARGS__);                  \
	s_log_sink.log(Poco::Message::Priority::PRIO_ERROR,                    \
		       __LINE__,                                               \
		       "Throwing: " + c_err_);                                 \
	throw meshbridge::api_exception(c_err_, __code);                       \
} while(false)

namespace meshbridge
{

/**
 * Base class of every error raised by meshbridge.
 */
class meshbridge_exception : public std::runtime_error
{
public:
	explicit meshbridge_exception(const std::string& message);
};

/**
 * A call to the Kubernetes or Consul API failed.
 */
class api_exception : public meshbridge_exception
{
public:
	/** Code used when the request never produced a response. */
	const static int NO_RESPONSE;

	/**
	 * @param[in] message description of the failure.
	 * @param[in] code    the HTTP status code, or NO_RESPONSE.
	 */
	api_exception(const std::string& message, int code = NO_RESPONSE);

	/**
	 * @returns the HTTP status code of the failed call.
	 */
	int get_code() const;

	bool is_not_found() const;

	/** True for optimistic concurrency failures, which are retryable. */
	bool is_conflict() const;

private:
	const int m_code;
};

/**
 * Several independent operations failed. what() lists every failure.
 */
class multi_error : public meshbridge_exception
{
public:
	explicit multi_error(const std::vector<std::string>& errors);

	const std::vector<std::string>& errors() const;

private:
	static std::string render(const std::vector<std::string>& errors);

	const std::vector<std::string> m_errors;
};

/**
 * Collects failures of sibling operations so that one failure does not
 * prevent the others from running.
 */
class error_accumulator
{
public:
	void add(const std::string& error);
	void add(const std::exception& ex);

	bool empty() const;
	size_t size() const;

	/**
	 * @throws multi_error if any error was added.
	 */
	void throw_if_any() const;

private:
	std::vector<std::string> m_errors;
};

} // namespace meshbridge
