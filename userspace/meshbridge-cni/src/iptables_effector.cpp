/**
 * @file
 *
 * Implementation of iptables_restore_effector.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "iptables_effector.h"
#include "common_logger.h"
#include "meshbridge_exception.h"
#include "string_utils.h"

#include <Poco/Exception.h>
#include <Poco/Pipe.h>
#include <Poco/PipeStream.h>
#include <Poco/Process.h>
#include <Poco/StreamCopier.h>

#include <sstream>

using Poco::Pipe;
using Poco::PipeInputStream;
using Poco::PipeOutputStream;
using Poco::Process;
using Poco::ProcessHandle;

COMMON_LOGGER();

namespace
{

const std::string LOOPBACK_V4 = "127.0.0.1/32";
const std::string LOOPBACK_V6 = "::1/128";

// Port Consul DNS listens on when it is reached over the loopback interface.
const int CONSUL_DNS_LOOPBACK_PORT = 8600;
const int DNS_PORT = 53;

bool is_ipv6(const std::string& address)
{
	return address.find(':') != std::string::npos;
}

std::string dns_destination(const std::string& ip, const bool ipv6)
{
	const bool loopback = string_utils::starts_with(ip, "127.") || ip == "::1";
	const int port = loopback ? CONSUL_DNS_LOOPBACK_PORT : DNS_PORT;

	return ipv6 ? "[" + ip + "]:" + std::to_string(port) : ip + ":" + std::to_string(port);
}

} // end namespace

namespace meshbridge
{

iptables_restore_effector::iptables_restore_effector(const std::string& nsenter):
	m_nsenter(nsenter)
{
}

std::string iptables_restore_effector::render(const iptables_config& config, const bool ipv6)
{
	if(config.proxy_user_id.empty())
	{
		throw meshbridge_exception("proxy user ID is required to set up traffic redirection");
	}

	const int outbound_port = config.proxy_outbound_port > 0 ? config.proxy_outbound_port :
	                                                            DEFAULT_TPROXY_OUTBOUND_PORT;
	const bool redirect_dns = !config.consul_dns_ip.empty() &&
	                          is_ipv6(config.consul_dns_ip) == ipv6;
	std::ostringstream out;

	out << "*nat\n"
	    << ":PREROUTING ACCEPT [0:0]\n"
	    << ":INPUT ACCEPT [0:0]\n"
	    << ":OUTPUT ACCEPT [0:0]\n"
	    << ":POSTROUTING ACCEPT [0:0]\n";

	for(const auto& chain : {CHAIN_PROXY_INBOUND,
	                         CHAIN_PROXY_IN_REDIRECT,
	                         CHAIN_PROXY_OUTPUT,
	                         CHAIN_PROXY_REDIRECT,
	                         CHAIN_DNS_REDIRECT})
	{
		out << ":" << chain << " - [0:0]\n";
	}

	if(redirect_dns)
	{
		for(const char* proto : {"udp", "tcp"})
		{
			out << "-A " << CHAIN_DNS_REDIRECT << " -p " << proto << " -d "
			    << config.consul_dns_ip << " --dport " << DNS_PORT
			    << " -j DNAT --to-destination " << dns_destination(config.consul_dns_ip, ipv6)
			    << "\n";
			out << "-A OUTPUT -p " << proto << " --dport " << DNS_PORT << " -j "
			    << CHAIN_DNS_REDIRECT << "\n";
		}
	}

	if(config.proxy_inbound_port > 0)
	{
		out << "-A PREROUTING -p tcp -j " << CHAIN_PROXY_INBOUND << "\n";

		for(const auto& port : config.exclude_inbound_ports)
		{
			out << "-A " << CHAIN_PROXY_INBOUND << " -p tcp --dport " << port << " -j RETURN\n";
		}

		out << "-A " << CHAIN_PROXY_INBOUND << " -p tcp -j " << CHAIN_PROXY_IN_REDIRECT << "\n";
		out << "-A " << CHAIN_PROXY_IN_REDIRECT << " -p tcp -j REDIRECT --to-ports "
		    << config.proxy_inbound_port << "\n";
	}

	out << "-A OUTPUT -p tcp -j " << CHAIN_PROXY_OUTPUT << "\n";

	for(const auto& uid : config.exclude_uids)
	{
		out << "-A " << CHAIN_PROXY_OUTPUT << " -m owner --uid-owner " << uid << " -j RETURN\n";
	}

	for(const auto& cidr : config.exclude_outbound_cidrs)
	{
		if(is_ipv6(cidr) == ipv6)
		{
			out << "-A " << CHAIN_PROXY_OUTPUT << " -d " << cidr << " -j RETURN\n";
		}
	}

	for(const auto& port : config.exclude_outbound_ports)
	{
		out << "-A " << CHAIN_PROXY_OUTPUT << " -p tcp --dport " << port << " -j RETURN\n";
	}

	out << "-A " << CHAIN_PROXY_OUTPUT << " -m owner --uid-owner " << config.proxy_user_id
	    << " -j RETURN\n";

	if(redirect_dns)
	{
		out << "-A " << CHAIN_PROXY_OUTPUT << " -d " << config.consul_dns_ip << " -j RETURN\n";
	}

	out << "-A " << CHAIN_PROXY_OUTPUT << " -d " << (ipv6 ? LOOPBACK_V6 : LOOPBACK_V4)
	    << " -j RETURN\n";
	out << "-A " << CHAIN_PROXY_OUTPUT << " -j " << CHAIN_PROXY_REDIRECT << "\n";
	out << "-A " << CHAIN_PROXY_REDIRECT << " -p tcp -j REDIRECT --to-ports " << outbound_port
	    << "\n";
	out << "COMMIT\n";

	return out.str();
}

void iptables_restore_effector::apply(const iptables_config& config, const bool dual_stack)
{
	restore("iptables-restore", config.netns, render(config, false));

	if(dual_stack)
	{
		restore("ip6tables-restore", config.netns, render(config, true));
	}
}

void iptables_restore_effector::restore(const std::string& tool,
                                        const std::string& netns,
                                        const std::string& document) const
{
	std::string command = tool;
	std::vector<std::string> args;

	if(!netns.empty())
	{
		command = m_nsenter;
		args.push_back("--net=" + netns);
		args.push_back(tool);
	}

	LOG_DEBUG("running %s in %s", tool.c_str(), netns.empty() ? "the current namespace" :
	                                                            netns.c_str());

	int exit_code = 0;
	std::string output;

	try
	{
		Pipe in_pipe;
		Pipe out_pipe;
		ProcessHandle handle = Process::launch(command, args, &in_pipe, &out_pipe, &out_pipe);

		PipeOutputStream in(in_pipe);
		in << document;
		in.close();

		PipeInputStream out(out_pipe);
		Poco::StreamCopier::copyToString(out, output);

		exit_code = handle.wait();
	}
	catch(const Poco::Exception& ex)
	{
		LOGGED_THROW(meshbridge_exception,
		             "unable to run %s: %s",
		             tool.c_str(),
		             ex.displayText().c_str());
	}

	if(exit_code != 0)
	{
		LOGGED_THROW(meshbridge_exception,
		             "%s exited with %d: %s",
		             tool.c_str(),
		             exit_code,
		             string_utils::trimmed(output).c_str());
	}
}

} // namespace meshbridge
