/**
 * @file
 *
 * Unit tests for yaml_configuration.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "scoped_temp_file.h"
#include "yaml_configuration.h"

#include <gtest.h>

#include <set>
#include <string>
#include <vector>

namespace
{

const std::string OVERRIDE_YAML = R"(
release:
  name: "mesh"
connect_inject:
  deny_k8s_namespaces: [monitoring]
  metrics:
    default_prometheus_scrape_port: 20300
)";

const std::string DEFAULT_YAML = R"(
release:
  name: "consul"
  namespace: "consul-system"
connect_inject:
  deny_k8s_namespaces: [logging]
  allow_k8s_namespaces: "*"
controller:
  worker_threads: 4
)";

} // end namespace

class yaml_configuration_test : public testing::Test
{
protected:
	yaml_configuration_test() :
		m_override(OVERRIDE_YAML, "yaml"),
		m_default(DEFAULT_YAML, "yaml")
	{ }

	yaml_configuration load()
	{
		return yaml_configuration({m_override.path(), m_default.path()});
	}

	test_helpers::scoped_temp_file m_override;
	test_helpers::scoped_temp_file m_default;
};

TEST_F(yaml_configuration_test, get_scalar)
{
	const yaml_configuration conf = load();

	EXPECT_EQ("mesh", conf.get_scalar<std::string>("release", "name", ""));
	EXPECT_EQ("consul-system", conf.get_scalar<std::string>("release", "namespace", ""));
	EXPECT_EQ("fallback", conf.get_scalar<std::string>("release", "prefix", "fallback"));
	EXPECT_EQ(4, conf.get_scalar<int>("controller", "worker_threads", 0));
	EXPECT_EQ(20300,
	          conf.get_scalar<int>("connect_inject",
	                               "metrics",
	                               "default_prometheus_scrape_port",
	                               0));
	EXPECT_TRUE(conf.errors().empty());
}

TEST_F(yaml_configuration_test, get_scalar_depth)
{
	const yaml_configuration conf = load();
	std::string value;

	EXPECT_EQ(0, conf.get_scalar_depth<std::string>("release", "name", value));
	EXPECT_EQ(1, conf.get_scalar_depth<std::string>("release", "namespace", value));
	EXPECT_EQ(-1, conf.get_scalar_depth<std::string>("release", "missing", value));
}

TEST_F(yaml_configuration_test, get_scalar_throws_when_missing)
{
	const yaml_configuration conf = load();

	ASSERT_THROW(conf.get_scalar<std::string>("no_such_key"), yaml_configuration_exception);
}

TEST_F(yaml_configuration_test, get_first_deep_sequence)
{
	const yaml_configuration conf = load();

	const auto deny = conf.get_first_deep_sequence<std::vector<std::string>>(
		"connect_inject", "deny_k8s_namespaces");
	ASSERT_EQ(std::vector<std::string>({"monitoring"}), deny);

	// Scalars become a single element container
	const auto allow = conf.get_first_deep_sequence<std::set<std::string>>(
		"connect_inject", "allow_k8s_namespaces");
	ASSERT_EQ(1U, allow.size());
	ASSERT_EQ(1U, allow.count("*"));
}

TEST_F(yaml_configuration_test, bad_conversion_is_recorded)
{
	const yaml_configuration conf("controller:\n  worker_threads: many\n");
	int value = 0;

	ASSERT_EQ(-1, conf.get_scalar_depth<int>("controller", "worker_threads", value));
	ASSERT_EQ(1U, conf.errors().size());
}

TEST(yaml_configuration_string_test, invalid_document)
{
	const yaml_configuration conf("- just\n- a\n- list\n");

	ASSERT_EQ(1U, conf.errors().size());
}

TEST(yaml_configuration_string_test, missing_file_is_a_warning)
{
	const yaml_configuration conf({"/nonexistent/meshbridge.yaml"});

	ASSERT_TRUE(conf.errors().empty());
	ASSERT_EQ(1U, conf.warnings().size());
}

TEST(yaml_configuration_string_test, merged_sequence)
{
	yaml_configuration conf("deny:\n  - a\n  - b\n");

	ASSERT_EQ(std::vector<std::string>({"a", "b"}),
	          conf.get_merged_sequence<std::string>("deny"));
}
