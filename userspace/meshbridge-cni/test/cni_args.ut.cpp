/**
 * @file
 *
 * Unit tests for cni_args and plugin_conf.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "cni_args.h"
#include "cni_error.h"
#include "plugin_conf.h"

#include <gtest.h>

#include <string>

using namespace meshbridge;

TEST(cni_args_test, kubernetes_args)
{
	const cni_args args = cni_args::parse("IgnoreUnknown=1;K8S_POD_NAMESPACE=ns1;"
	                                      "K8S_POD_NAME=web-abc;"
	                                      "K8S_POD_INFRA_CONTAINER_ID=abc123;"
	                                      "K8S_POD_UID=u-1;FOO=bar");

	EXPECT_TRUE(args.ignore_unknown);
	EXPECT_EQ("ns1", args.pod_namespace);
	EXPECT_EQ("web-abc", args.pod_name);
	EXPECT_EQ("abc123", args.pod_infra_container_id);
	EXPECT_EQ("u-1", args.pod_uid);
	EXPECT_EQ("", args.iptables_config);
}

TEST(cni_args_test, prebuilt_config)
{
	const cni_args args =
	    cni_args::parse(R"(CONSUL_IPTABLES_CONFIG={"proxy_uid":"101","proxy_inbound_port":21000})");

	EXPECT_EQ(R"({"proxy_uid":"101","proxy_inbound_port":21000})", args.iptables_config);
	EXPECT_EQ("", args.pod_name);
}

TEST(cni_args_test, empty)
{
	const cni_args args = cni_args::parse("");

	EXPECT_EQ("", args.pod_name);
	EXPECT_FALSE(args.ignore_unknown);
}

TEST(cni_args_test, unknown_key_needs_ignore_unknown)
{
	try
	{
		cni_args::parse("K8S_POD_NAME=web-abc;FOO=bar");
		FAIL() << "expected the unknown key to be rejected";
	}
	catch(const cni_error& ex)
	{
		EXPECT_EQ(cni_error::ERR_INVALID_ENVIRONMENT, ex.get_code());
		EXPECT_EQ(std::string("unknown CNI_ARGS key \"FOO\""), ex.what());
	}

	EXPECT_NO_THROW(cni_args::parse("FOO=bar;IgnoreUnknown=true"));
}

TEST(cni_args_test, malformed_pairs)
{
	EXPECT_THROW(cni_args::parse("K8S_POD_NAME"), cni_error);
	EXPECT_THROW(cni_args::parse("=web"), cni_error);
	EXPECT_THROW(cni_args::parse("IgnoreUnknown=maybe"), cni_error);
}

TEST(plugin_conf_test, fields)
{
	const plugin_conf conf = plugin_conf::parse(R"({
		"cniVersion": "1.0.0",
		"name": "k8s-pod-network",
		"type": "meshbridge-cni",
		"cni_bin_dir": "/opt/cni/bin",
		"cni_net_dir": "/etc/cni/net.d/",
		"kubeconfig": "ZZZ-meshbridge-cni-kubeconfig",
		"log_level": "debug",
		"multus": true,
		"prevResult": {"cniVersion": "1.0.0", "ips": [{"address": "10.0.0.1/24"}]}
	})");

	EXPECT_EQ("1.0.0", conf.cni_version);
	EXPECT_EQ("k8s-pod-network", conf.name);
	EXPECT_EQ("meshbridge-cni", conf.type);
	EXPECT_EQ("/opt/cni/bin", conf.cni_bin_dir);
	EXPECT_EQ("debug", conf.log_level);
	EXPECT_EQ(DEFAULT_CNI_LOG_FILE, conf.log_file);
	EXPECT_TRUE(conf.multus);
	ASSERT_TRUE(conf.has_prev_result);
	EXPECT_EQ("10.0.0.1/24", conf.prev_result["ips"][0]["address"].asString());
	EXPECT_EQ("/etc/cni/net.d/ZZZ-meshbridge-cni-kubeconfig", conf.kubeconfig_path());
}

TEST(plugin_conf_test, defaults)
{
	const plugin_conf conf = plugin_conf::parse(R"({"cniVersion": "0.3.1"})");

	EXPECT_FALSE(conf.has_prev_result);
	EXPECT_EQ("info", conf.log_level);
	EXPECT_FALSE(conf.multus);
	EXPECT_EQ("", conf.kubeconfig_path());
}

TEST(plugin_conf_test, kubeconfig_path_joins)
{
	plugin_conf conf;
	conf.cni_net_dir = "/etc/cni/net.d";
	conf.kubeconfig = "/kubeconfig";

	EXPECT_EQ("/etc/cni/net.d/kubeconfig", conf.kubeconfig_path());
}

TEST(plugin_conf_test, malformed)
{
	try
	{
		plugin_conf::parse("{not json");
		FAIL() << "expected a decoding failure";
	}
	catch(const cni_error& ex)
	{
		EXPECT_EQ(cni_error::ERR_DECODING_FAILURE, ex.get_code());
	}

	EXPECT_THROW(plugin_conf::parse("[]"), cni_error);
	EXPECT_THROW(plugin_conf::parse(R"({"prevResult": "x"})"), cni_error);
	EXPECT_THROW(plugin_conf::parse(R"({"multus": "yes"})"), cni_error);
	EXPECT_THROW(plugin_conf::parse(R"({"log_level": 3})"), cni_error);
}
