/**
 * @file
 *
 * Interface to scoped_temp_file -- a helper class that will create a temporary
 * file on construction and remove it on destruction.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#pragma once

#include <string>

namespace test_helpers
{

/**
 * Create a temp file that lasts for the lifetime of the object. The filename
 * will be in the form of "<tmp>/meshbridge-<uuid>[.extension]".
 */
class scoped_temp_file
{
public:
	explicit scoped_temp_file(const std::string& initial_content = "",
	                          const std::string& extension = "");
	~scoped_temp_file();

	scoped_temp_file(const scoped_temp_file&) = delete;
	scoped_temp_file& operator=(const scoped_temp_file&) = delete;

	const std::string& path() const;

	/** Replace the content of the file. */
	void write(const std::string& content) const;

	/** Read the current content of the file. */
	std::string read() const;

private:
	std::string m_path;
};

} // namespace test_helpers
