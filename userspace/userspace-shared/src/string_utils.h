/**
 * @file
 *
 * Interface to string_utils -- helpers for std::string.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * Utilities for std::string
 */
namespace string_utils
{

/**
 * Trim spaces from the front and back of the given value.
 */
void trim(std::string &value);

/**
 * Returns a trimmed copy of the given value.
 */
std::string trimmed(const std::string& value);

/**
 * Split value on every occurrence of delim. An empty value yields a single
 * empty element, and adjacent delimiters yield empty elements.
 */
std::vector<std::string> split(const std::string& value, char delim);

/**
 * Split value on delim into at most max_parts elements; the last element
 * holds the unsplit remainder.
 */
std::vector<std::string> split(const std::string& value, char delim, size_t max_parts);

std::string join(const std::vector<std::string>& values, const std::string& separator);

bool starts_with(const std::string& value, const std::string& prefix);

/**
 * Replace every occurrence of from with to.
 */
std::string replace_all(const std::string& value,
                        const std::string& from,
                        const std::string& to);

/**
 * Parse a boolean the way annotations and labels spell them:
 * 1, t, T, TRUE, true, True, 0, f, F, FALSE, false, False.
 *
 * @returns true if value was recognized.
 */
bool parse_bool(const std::string& value, bool& result);

/**
 * Parse a signed integer. The base is taken from the prefix: 0x/0X is hex,
 * 0o/0O or a leading 0 is octal, 0b/0B is binary, anything else decimal.
 *
 * @returns true if the whole string was consumed and fits in int64_t.
 */
bool parse_int(const std::string& value, int64_t& result);

/**
 * Uppercase value and replace every character that is not a letter or a
 * digit with '_'.
 */
std::string to_env_name(const std::string& value);

}
