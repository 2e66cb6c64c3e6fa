/**
 * @file
 *
 * Unit tests for iptables_restore_effector.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "iptables_effector.h"
#include "meshbridge_exception.h"
#include "scoped_temp_file.h"

#include <gtest.h>

#include <Poco/File.h>

#include <string>

using namespace meshbridge;
using namespace test_helpers;

namespace
{

iptables_config sample_config()
{
	iptables_config config;

	config.proxy_user_id = "5995";
	config.proxy_inbound_port = 20000;
	config.proxy_outbound_port = 15001;
	config.exclude_inbound_ports = {"21000"};
	config.exclude_outbound_ports = {"5432"};
	config.exclude_outbound_cidrs = {"10.0.0.0/8", "fd00::/8"};
	config.exclude_uids = {"5996"};
	config.netns = "/var/run/netns/cni-1";

	return config;
}

bool contains(const std::string& document, const std::string& line)
{
	return document.find(line + "\n") != std::string::npos;
}

/**
 * Write an executable stand-in for nsenter that records its arguments and
 * stdin next to itself.
 */
void make_executable(const scoped_temp_file& script, const std::string& body)
{
	script.write("#!/bin/sh\n" + body);
	Poco::File(script.path()).setExecutable(true);
}

} // end namespace

TEST(iptables_effector_test, ipv4_document)
{
	const std::string doc = iptables_restore_effector::render(sample_config(), false);

	EXPECT_EQ(0u, doc.find("*nat\n"));
	EXPECT_TRUE(contains(doc, ":CONSUL_PROXY_INBOUND - [0:0]"));
	EXPECT_TRUE(contains(doc, ":CONSUL_DNS_REDIRECT - [0:0]"));
	EXPECT_TRUE(contains(doc, "-A PREROUTING -p tcp -j CONSUL_PROXY_INBOUND"));
	EXPECT_TRUE(contains(doc, "-A CONSUL_PROXY_INBOUND -p tcp --dport 21000 -j RETURN"));
	EXPECT_TRUE(contains(doc, "-A CONSUL_PROXY_IN_REDIRECT -p tcp -j REDIRECT --to-ports 20000"));
	EXPECT_TRUE(contains(doc, "-A OUTPUT -p tcp -j CONSUL_PROXY_OUTPUT"));
	EXPECT_TRUE(contains(doc, "-A CONSUL_PROXY_OUTPUT -m owner --uid-owner 5996 -j RETURN"));
	EXPECT_TRUE(contains(doc, "-A CONSUL_PROXY_OUTPUT -m owner --uid-owner 5995 -j RETURN"));
	EXPECT_TRUE(contains(doc, "-A CONSUL_PROXY_OUTPUT -d 10.0.0.0/8 -j RETURN"));
	EXPECT_FALSE(contains(doc, "-A CONSUL_PROXY_OUTPUT -d fd00::/8 -j RETURN"));
	EXPECT_TRUE(contains(doc, "-A CONSUL_PROXY_OUTPUT -p tcp --dport 5432 -j RETURN"));
	EXPECT_TRUE(contains(doc, "-A CONSUL_PROXY_OUTPUT -d 127.0.0.1/32 -j RETURN"));
	EXPECT_TRUE(contains(doc, "-A CONSUL_PROXY_REDIRECT -p tcp -j REDIRECT --to-ports 15001"));
	EXPECT_EQ(doc.size() - 7, doc.rfind("COMMIT\n"));
	EXPECT_EQ(std::string::npos, doc.find("DNAT"));
}

TEST(iptables_effector_test, exclusions_precede_redirect)
{
	const std::string doc = iptables_restore_effector::render(sample_config(), false);

	EXPECT_LT(doc.find("--dport 21000 -j RETURN"),
	          doc.find("-A CONSUL_PROXY_INBOUND -p tcp -j CONSUL_PROXY_IN_REDIRECT"));
	EXPECT_LT(doc.find("--uid-owner 5996"),
	          doc.find("-A CONSUL_PROXY_OUTPUT -j CONSUL_PROXY_REDIRECT"));
}

TEST(iptables_effector_test, ipv6_document)
{
	const std::string doc = iptables_restore_effector::render(sample_config(), true);

	EXPECT_TRUE(contains(doc, "-A CONSUL_PROXY_OUTPUT -d ::1/128 -j RETURN"));
	EXPECT_TRUE(contains(doc, "-A CONSUL_PROXY_OUTPUT -d fd00::/8 -j RETURN"));
	EXPECT_FALSE(contains(doc, "-A CONSUL_PROXY_OUTPUT -d 10.0.0.0/8 -j RETURN"));
}

TEST(iptables_effector_test, rendering_is_deterministic)
{
	EXPECT_EQ(iptables_restore_effector::render(sample_config(), false),
	          iptables_restore_effector::render(sample_config(), false));
}

TEST(iptables_effector_test, no_inbound_port)
{
	iptables_config config = sample_config();
	config.proxy_inbound_port = 0;
	config.proxy_outbound_port = 0;

	const std::string doc = iptables_restore_effector::render(config, false);

	EXPECT_EQ(std::string::npos, doc.find("-A PREROUTING"));
	EXPECT_TRUE(contains(doc, "-A CONSUL_PROXY_REDIRECT -p tcp -j REDIRECT --to-ports 15001"));
}

TEST(iptables_effector_test, consul_dns)
{
	iptables_config config = sample_config();
	config.consul_dns_ip = "10.96.0.53";

	const std::string doc = iptables_restore_effector::render(config, false);

	EXPECT_TRUE(contains(doc, "-A CONSUL_DNS_REDIRECT -p udp -d 10.96.0.53 --dport 53 "
	                          "-j DNAT --to-destination 10.96.0.53:53"));
	EXPECT_TRUE(contains(doc, "-A OUTPUT -p tcp --dport 53 -j CONSUL_DNS_REDIRECT"));
	EXPECT_TRUE(contains(doc, "-A CONSUL_PROXY_OUTPUT -d 10.96.0.53 -j RETURN"));
	EXPECT_EQ(std::string::npos,
	          iptables_restore_effector::render(config, true).find("CONSUL_DNS_REDIRECT -p"));

	config.consul_dns_ip = "127.0.0.1";
	EXPECT_NE(std::string::npos,
	          iptables_restore_effector::render(config, false)
	              .find("--to-destination 127.0.0.1:8600"));
}

TEST(iptables_effector_test, proxy_user_is_required)
{
	iptables_config config = sample_config();
	config.proxy_user_id = "";

	EXPECT_THROW(iptables_restore_effector::render(config, false), meshbridge_exception);
}

TEST(iptables_effector_test, applies_through_nsenter)
{
	const scoped_temp_file args_out;
	const scoped_temp_file stdin_out;
	const scoped_temp_file nsenter;
	make_executable(nsenter,
	                "echo \"$@\" >> " + args_out.path() + "\n"
	                "cat >> " + stdin_out.path() + "\n");
	iptables_restore_effector effector(nsenter.path());

	effector.apply(sample_config(), true);

	EXPECT_EQ("--net=/var/run/netns/cni-1 iptables-restore\n"
	          "--net=/var/run/netns/cni-1 ip6tables-restore\n",
	          args_out.read());
	EXPECT_EQ(iptables_restore_effector::render(sample_config(), false) +
	              iptables_restore_effector::render(sample_config(), true),
	          stdin_out.read());
}

TEST(iptables_effector_test, failure_carries_output)
{
	const scoped_temp_file nsenter;
	make_executable(nsenter,
	                "cat > /dev/null\n"
	                "echo \"iptables-restore: line 3 failed\" >&2\n"
	                "exit 1\n");
	iptables_restore_effector effector(nsenter.path());

	try
	{
		effector.apply(sample_config(), false);
		FAIL() << "expected the failure to be reported";
	}
	catch(const meshbridge_exception& ex)
	{
		EXPECT_EQ(std::string("iptables-restore exited with 1: iptables-restore: line 3 failed"),
		          ex.what());
	}
}
