/**
 * @file
 *
 * Unit tests for scoped_temp_file.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "scoped_temp_file.h"

#include <Poco/File.h>

#include <gtest.h>

#include <string>

TEST(scoped_temp_file_test, removed_on_destruction)
{
	std::string path;

	{
		const test_helpers::scoped_temp_file temp_file;

		path = temp_file.path();
		ASSERT_FALSE(path.empty());
		ASSERT_TRUE(Poco::File(path).exists());
	}

	ASSERT_FALSE(Poco::File(path).exists());
}

TEST(scoped_temp_file_test, initial_content)
{
	const std::string expected = "current-context: dev\n";
	const test_helpers::scoped_temp_file temp_file(expected);

	ASSERT_EQ(expected, temp_file.read());
}

TEST(scoped_temp_file_test, write_replaces_content)
{
	const test_helpers::scoped_temp_file temp_file("a much longer first version");

	temp_file.write("short");

	ASSERT_EQ("short", temp_file.read());
}

TEST(scoped_temp_file_test, extension)
{
	const test_helpers::scoped_temp_file temp_file("{}", "json");
	const std::string& path = temp_file.path();

	ASSERT_EQ(".json", path.substr(path.length() - 5));
}

TEST(scoped_temp_file_test, distinct_paths)
{
	const test_helpers::scoped_temp_file first;
	const test_helpers::scoped_temp_file second;

	ASSERT_NE(first.path(), second.path());
}
