/**
 * @file
 *
 * Unit tests for string_utils.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "string_utils.h"

#include <gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using string_utils::split;

TEST(string_utils_test, trim)
{
	std::string value = " \t web,api \n";

	string_utils::trim(value);
	ASSERT_EQ("web,api", value);
	ASSERT_EQ("", string_utils::trimmed("   "));
}

TEST(string_utils_test, split_keeps_empty_fields)
{
	ASSERT_EQ(std::vector<std::string>({""}), split("", ','));
	ASSERT_EQ(std::vector<std::string>({"a", "", "b"}), split("a,,b", ','));
	ASSERT_EQ(std::vector<std::string>({"web", ""}), split("web,", ','));
}

TEST(string_utils_test, split_with_limit)
{
	ASSERT_EQ(std::vector<std::string>({"db", "1234", "dc1:extra"}),
	          split("db:1234:dc1:extra", ':', 3));
	ASSERT_EQ(std::vector<std::string>({"db"}), split("db", ':', 3));
}

TEST(string_utils_test, join)
{
	ASSERT_EQ("a, b, c", string_utils::join({"a", "b", "c"}, ", "));
	ASSERT_EQ("", string_utils::join({}, ","));
}

TEST(string_utils_test, replace_all)
{
	ASSERT_EQ("pod-web-abc-pod-web-abc",
	          string_utils::replace_all("pod-$POD_NAME-pod-$POD_NAME", "$POD_NAME", "web-abc"));
	ASSERT_EQ("unchanged", string_utils::replace_all("unchanged", "", "x"));
}

TEST(string_utils_test, parse_bool)
{
	bool value = false;

	ASSERT_TRUE(string_utils::parse_bool("True", value));
	ASSERT_TRUE(value);
	ASSERT_TRUE(string_utils::parse_bool("0", value));
	ASSERT_FALSE(value);
	ASSERT_FALSE(string_utils::parse_bool("yes", value));
	ASSERT_FALSE(string_utils::parse_bool("", value));
}

TEST(string_utils_test, parse_int)
{
	int64_t value = 0;

	ASSERT_TRUE(string_utils::parse_int("8080", value));
	ASSERT_EQ(8080, value);
	ASSERT_TRUE(string_utils::parse_int("0x1F", value));
	ASSERT_EQ(31, value);
	ASSERT_TRUE(string_utils::parse_int("010", value));
	ASSERT_EQ(8, value);
	ASSERT_TRUE(string_utils::parse_int("-0b101", value));
	ASSERT_EQ(-5, value);
	ASSERT_TRUE(string_utils::parse_int("0", value));
	ASSERT_EQ(0, value);

	ASSERT_FALSE(string_utils::parse_int("http", value));
	ASSERT_FALSE(string_utils::parse_int("", value));
	ASSERT_FALSE(string_utils::parse_int("0x", value));
	ASSERT_FALSE(string_utils::parse_int("09", value));
	ASSERT_FALSE(string_utils::parse_int("99999999999999999999", value));
}

TEST(string_utils_test, to_env_name)
{
	ASSERT_EQ("CONSUL_CONSUL", string_utils::to_env_name("consul-consul"));
	ASSERT_EQ("MY_RELEASE_1", string_utils::to_env_name("my.release-1"));
}
