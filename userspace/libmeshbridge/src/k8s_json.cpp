/**
 * @file
 *
 * Implementation of the Kubernetes wire format conversion.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "k8s_json.h"
#include "meshbridge_exception.h"

#include <Poco/Base64Decoder.h>
#include <Poco/Base64Encoder.h>
#include <Poco/StreamCopier.h>

#include <sstream>

namespace
{

using namespace meshbridge;

std::map<std::string, std::string> parse_string_map(const Json::Value& value)
{
	std::map<std::string, std::string> result;

	if(!value.isObject())
	{
		return result;
	}

	for(const auto& name : value.getMemberNames())
	{
		result[name] = value[name].asString();
	}

	return result;
}

Json::Value string_map_to_json(const std::map<std::string, std::string>& map)
{
	Json::Value result(Json::objectValue);

	for(const auto& entry : map)
	{
		result[entry.first] = entry.second;
	}

	return result;
}

std::string base64_decode(const std::string& encoded)
{
	std::istringstream in(encoded);
	Poco::Base64Decoder decoder(in);
	std::string decoded;

	Poco::StreamCopier::copyToString(decoder, decoded);
	return decoded;
}

std::string base64_encode(const std::string& plain)
{
	std::ostringstream out;
	Poco::Base64Encoder encoder(out);

	encoder.rdbuf()->setLineLength(0);
	encoder << plain;
	encoder.close();

	return out.str();
}

int_or_string parse_int_or_string(const Json::Value& value)
{
	if(value.isString())
	{
		return int_or_string(value.asString());
	}

	return int_or_string(value.asInt());
}

probe parse_probe(const Json::Value& value)
{
	probe result;

	if(value.isObject() && value.isMember("httpGet"))
	{
		const Json::Value& http_get = value["httpGet"];

		result.has_http_get = true;
		result.http_get.port = parse_int_or_string(http_get["port"]);
		result.http_get.path = http_get.get("path", "").asString();
	}

	return result;
}

container parse_container(const Json::Value& value)
{
	container result;

	result.name = value.get("name", "").asString();

	for(const auto& port : value["ports"])
	{
		container_port cport;

		cport.name = port.get("name", "").asString();
		cport.container_port = port.get("containerPort", 0).asInt();
		result.ports.push_back(cport);
	}

	result.liveness_probe = parse_probe(value["livenessProbe"]);
	result.readiness_probe = parse_probe(value["readinessProbe"]);
	result.startup_probe = parse_probe(value["startupProbe"]);

	return result;
}

endpoint_address parse_endpoint_address(const Json::Value& value)
{
	endpoint_address result;

	result.ip = value.get("ip", "").asString();
	result.node_name = value.get("nodeName", "").asString();

	if(value.isMember("targetRef"))
	{
		const Json::Value& ref = value["targetRef"];

		result.has_target_ref = true;
		result.target_ref.kind = ref.get("kind", "").asString();
		result.target_ref.name = ref.get("name", "").asString();
		result.target_ref.ns = ref.get("namespace", "").asString();
	}

	return result;
}

secret_ref parse_secret_ref(const Json::Value& value)
{
	secret_ref result;

	result.name = value.get("name", "").asString();
	result.key = value.get("key", "").asString();
	result.backend = value.get("backend", "").asString();

	return result;
}

} // end namespace

namespace meshbridge
{
namespace k8s_json
{

Json::Value parse(const std::string& text)
{
	Json::Reader reader;
	Json::Value root;

	if(!reader.parse(text, root, false))
	{
		throw meshbridge_exception("unable to parse JSON: " +
		                           reader.getFormattedErrorMessages());
	}

	return root;
}

std::string write(const Json::Value& value)
{
	Json::FastWriter writer;

	writer.omitEndingLineFeed();
	return writer.write(value);
}

object_meta parse_object_meta(const Json::Value& value)
{
	object_meta meta;

	meta.name = value.get("name", "").asString();
	meta.ns = value.get("namespace", "").asString();
	meta.uid = value.get("uid", "").asString();
	meta.resource_version = value.get("resourceVersion", "").asString();
	meta.deletion_timestamp = value.get("deletionTimestamp", "").asString();
	meta.labels = parse_string_map(value["labels"]);
	meta.annotations = parse_string_map(value["annotations"]);

	for(const auto& finalizer : value["finalizers"])
	{
		meta.finalizers.push_back(finalizer.asString());
	}

	for(const auto& ref : value["ownerReferences"])
	{
		owner_reference owner;

		owner.api_version = ref.get("apiVersion", "").asString();
		owner.kind = ref.get("kind", "").asString();
		owner.name = ref.get("name", "").asString();
		owner.uid = ref.get("uid", "").asString();
		owner.controller = ref.get("controller", false).asBool();
		owner.block_owner_deletion = ref.get("blockOwnerDeletion", false).asBool();
		meta.owner_references.push_back(owner);
	}

	return meta;
}

Json::Value to_json(const object_meta& meta)
{
	Json::Value value(Json::objectValue);

	value["name"] = meta.name;

	if(!meta.ns.empty())
	{
		value["namespace"] = meta.ns;
	}

	if(!meta.resource_version.empty())
	{
		value["resourceVersion"] = meta.resource_version;
	}

	if(!meta.labels.empty())
	{
		value["labels"] = string_map_to_json(meta.labels);
	}

	if(!meta.annotations.empty())
	{
		value["annotations"] = string_map_to_json(meta.annotations);
	}

	if(!meta.finalizers.empty())
	{
		Json::Value finalizers(Json::arrayValue);

		for(const auto& finalizer : meta.finalizers)
		{
			finalizers.append(finalizer);
		}
		value["finalizers"] = finalizers;
	}

	if(!meta.owner_references.empty())
	{
		Json::Value refs(Json::arrayValue);

		for(const auto& owner : meta.owner_references)
		{
			Json::Value ref;

			ref["apiVersion"] = owner.api_version;
			ref["kind"] = owner.kind;
			ref["name"] = owner.name;
			ref["uid"] = owner.uid;
			ref["controller"] = owner.controller;
			ref["blockOwnerDeletion"] = owner.block_owner_deletion;
			refs.append(ref);
		}
		value["ownerReferences"] = refs;
	}

	return value;
}

pod parse_pod(const Json::Value& value)
{
	pod result;
	const Json::Value& spec = value["spec"];
	const Json::Value& status = value["status"];

	result.metadata = parse_object_meta(value["metadata"]);

	for(const auto& c : spec["containers"])
	{
		result.containers.push_back(parse_container(c));
	}

	result.node_name = spec.get("nodeName", "").asString();
	result.phase = status.get("phase", "").asString();
	result.pod_ip = status.get("podIP", "").asString();
	result.host_ip = status.get("hostIP", "").asString();

	for(const auto& c : status["conditions"])
	{
		pod_condition cond;

		cond.type = c.get("type", "").asString();
		cond.status = c.get("status", "").asString();
		result.conditions.push_back(cond);
	}

	return result;
}

endpoints parse_endpoints(const Json::Value& value)
{
	endpoints result;

	result.metadata = parse_object_meta(value["metadata"]);

	for(const auto& s : value["subsets"])
	{
		endpoint_subset subset;

		for(const auto& address : s["addresses"])
		{
			subset.addresses.push_back(parse_endpoint_address(address));
		}

		for(const auto& address : s["notReadyAddresses"])
		{
			subset.not_ready_addresses.push_back(parse_endpoint_address(address));
		}

		result.subsets.push_back(subset);
	}

	return result;
}

service parse_service(const Json::Value& value)
{
	service result;
	const Json::Value& spec = value["spec"];

	result.metadata = parse_object_meta(value["metadata"]);
	result.cluster_ip = spec.get("clusterIP", "").asString();

	for(const auto& p : spec["ports"])
	{
		service_port port;

		port.name = p.get("name", "").asString();
		port.port = p.get("port", 0).asInt();

		if(p.isMember("targetPort"))
		{
			port.has_target_port = true;
			port.target_port = parse_int_or_string(p["targetPort"]);
		}

		result.ports.push_back(port);
	}

	return result;
}

k8s_namespace parse_namespace(const Json::Value& value)
{
	k8s_namespace result;

	result.metadata = parse_object_meta(value["metadata"]);
	return result;
}

secret parse_secret(const Json::Value& value)
{
	secret result;
	const Json::Value& data = value["data"];

	result.metadata = parse_object_meta(value["metadata"]);
	result.type = value.get("type", "").asString();

	if(data.isObject())
	{
		for(const auto& name : data.getMemberNames())
		{
			result.data[name] = base64_decode(data[name].asString());
		}
	}

	return result;
}

Json::Value to_json(const secret& value)
{
	Json::Value result;
	Json::Value data(Json::objectValue);

	result["apiVersion"] = "v1";
	result["kind"] = "Secret";
	result["metadata"] = to_json(value.metadata);

	if(!value.type.empty())
	{
		result["type"] = value.type;
	}

	for(const auto& entry : value.data)
	{
		data[entry.first] = base64_encode(entry.second);
	}
	result["data"] = data;

	return result;
}

peering_resource parse_peering_resource(const Json::Value& value)
{
	peering_resource result;
	const Json::Value& spec_secret = value["spec"]["peer"]["secret"];
	const Json::Value& status = value["status"];

	result.kind = value.get("kind", "").asString();
	result.metadata = parse_object_meta(value["metadata"]);

	if(spec_secret.isObject())
	{
		result.has_spec_secret = true;
		result.spec_secret = parse_secret_ref(spec_secret);
	}

	if(status["secretRef"].isObject())
	{
		const Json::Value& ref = status["secretRef"];

		result.has_status_secret = true;
		result.status_secret.name = ref.get("name", "").asString();
		result.status_secret.key = ref.get("key", "").asString();
		result.status_secret.backend = ref.get("backend", "").asString();
		result.status_secret.resource_version = ref.get("resourceVersion", "").asString();
	}

	result.last_reconcile_time = status.get("lastReconcileTime", "").asString();

	if(status["latestPeeringVersion"].isUInt64())
	{
		result.has_latest_peering_version = true;
		result.latest_peering_version = status["latestPeeringVersion"].asUInt64();
	}

	if(status["reconcileError"].isObject())
	{
		const Json::Value& err = status["reconcileError"];

		result.has_reconcile_error = true;
		result.reconcile_error.error = err.get("error", false).asBool();
		result.reconcile_error.message = err.get("message", "").asString();
	}

	return result;
}

Json::Value status_to_json(const peering_resource& value)
{
	Json::Value status(Json::objectValue);

	if(value.has_status_secret)
	{
		Json::Value ref;

		ref["name"] = value.status_secret.name;
		ref["key"] = value.status_secret.key;
		ref["backend"] = value.status_secret.backend;
		ref["resourceVersion"] = value.status_secret.resource_version;
		status["secretRef"] = ref;
	}
	else
	{
		status["secretRef"] = Json::Value::null;
	}

	if(!value.last_reconcile_time.empty())
	{
		status["lastReconcileTime"] = value.last_reconcile_time;
	}

	if(value.has_latest_peering_version)
	{
		status["latestPeeringVersion"] = Json::UInt64(value.latest_peering_version);
	}

	if(value.has_reconcile_error)
	{
		status["reconcileError"]["error"] = value.reconcile_error.error;
		status["reconcileError"]["message"] = value.reconcile_error.message;
	}
	else
	{
		status["reconcileError"] = Json::Value::null;
	}

	return status;
}

terminating_gateway_service parse_terminating_gateway_service(const Json::Value& value)
{
	terminating_gateway_service result;
	const Json::Value& reg = value["spec"]["service"];
	const Json::Value& svc = reg["service"];
	const Json::Value& status = value["status"];

	result.metadata = parse_object_meta(value["metadata"]);

	result.spec.node = reg.get("node", "").asString();
	result.spec.address = reg.get("address", "").asString();
	result.spec.datacenter = reg.get("datacenter", "").asString();
	result.spec.tagged_addresses = parse_string_map(reg["taggedAddresses"]);
	result.spec.node_meta = parse_string_map(reg["nodeMeta"]);
	result.spec.skip_node_update = reg.get("SkipNodeUpdate", false).asBool();

	result.spec.service.id = svc.get("ID", "").asString();
	result.spec.service.service = svc.get("service", "").asString();
	result.spec.service.address = svc.get("address", "").asString();
	result.spec.service.port = svc.get("port", 0).asInt();
	result.spec.service.meta = parse_string_map(svc["meta"]);
	result.spec.service.enable_tag_override = svc.get("enableTagOverride", false).asBool();

	for(const auto& tag : svc["tags"])
	{
		result.spec.service.tags.push_back(tag.asString());
	}

	const Json::Value& tagged = svc["taggedAddresses"];
	if(tagged.isObject())
	{
		for(const auto& name : tagged.getMemberNames())
		{
			tagged_address address;

			address.address = tagged[name].get("address", "").asString();
			address.port = tagged[name].get("port", 0).asInt();
			result.spec.service.tagged_addresses[name] = address;
		}
	}

	if(status["serviceInfoRef"].isObject())
	{
		result.has_service_info_ref = true;
		result.status_ref.service_name = status["serviceInfoRef"].get("serviceName", "").asString();
		result.status_ref.policy_name = status["serviceInfoRef"].get("policyName", "").asString();
	}

	result.last_synced_time = status.get("lastSyncedTime", "").asString();

	for(const auto& c : status["conditions"])
	{
		condition cond;

		cond.type = c.get("type", "").asString();
		cond.status = c.get("status", "").asString();
		cond.reason = c.get("reason", "").asString();
		cond.message = c.get("message", "").asString();
		cond.last_transition_time = c.get("lastTransitionTime", "").asString();
		result.conditions.push_back(cond);
	}

	return result;
}

Json::Value status_to_json(const terminating_gateway_service& value)
{
	Json::Value status(Json::objectValue);
	Json::Value conditions(Json::arrayValue);

	if(value.has_service_info_ref)
	{
		status["serviceInfoRef"]["serviceName"] = value.status_ref.service_name;
		status["serviceInfoRef"]["policyName"] = value.status_ref.policy_name;
	}

	if(!value.last_synced_time.empty())
	{
		status["lastSyncedTime"] = value.last_synced_time;
	}

	for(const auto& cond : value.conditions)
	{
		Json::Value c;

		c["type"] = cond.type;
		c["status"] = cond.status;
		c["reason"] = cond.reason;
		c["message"] = cond.message;
		c["lastTransitionTime"] = cond.last_transition_time;
		conditions.append(c);
	}
	status["conditions"] = conditions;

	return status;
}

} // namespace k8s_json
} // namespace meshbridge
