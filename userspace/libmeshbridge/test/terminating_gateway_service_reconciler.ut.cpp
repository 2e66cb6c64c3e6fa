/**
 * @file
 *
 * Unit tests for terminating_gateway_service_reconciler.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "fake_consul_client.h"
#include "fake_k8s_client.h"
#include "k8s_fixtures.h"
#include "meshbridge_exception.h"
#include "terminating_gateway_service_reconciler.h"

#include <gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace meshbridge;
using namespace test_helpers;

namespace
{

terminating_gateway_service make_gateway_service(const std::string& service_name)
{
	terminating_gateway_service resource;

	resource.metadata.ns = "default";
	resource.metadata.name = service_name;
	resource.metadata.uid = "uid-" + service_name;
	resource.spec.node = "legacy_node";
	resource.spec.address = "10.20.10.22";
	resource.spec.service.service = service_name;
	resource.spec.service.address = "example.com";
	resource.spec.service.port = 443;
	resource.spec.service.tags = {"external"};

	return resource;
}

const condition* synced_condition(const terminating_gateway_service& resource)
{
	for(const auto& cond : resource.conditions)
	{
		if(cond.type == "Synced")
		{
			return &cond;
		}
	}
	return nullptr;
}

class terminating_gateway_test : public testing::Test
{
protected:
	terminating_gateway_test():
		m_k8s(std::make_shared<fake_k8s_client>()),
		m_consul(std::make_shared<fake_consul_client>())
	{
		acl_role role;
		role.id = "role-1";
		role.name = "consul-terminating-gateway-acl-role";
		m_consul->add_role(role);
	}

	terminating_gateway_service_reconciler make_reconciler(const bool acls_enabled)
	{
		return terminating_gateway_service_reconciler(m_k8s, m_consul, acls_enabled, fixed_time());
	}

	terminating_gateway_service stored(const std::string& name = "example-https") const
	{
		return m_k8s->stored_terminating_gateway_service(object_key("default", name));
	}

	acl_role gateway_role() const
	{
		return m_consul->roles().front();
	}

	std::shared_ptr<fake_k8s_client> m_k8s;
	std::shared_ptr<fake_consul_client> m_consul;
};

} // end namespace

TEST(terminating_gateway_policy, names_and_rules)
{
	EXPECT_EQ("example-https-write-policy", write_policy_name("example-https"));
	EXPECT_EQ("service \"example-https\" {policy = \"write\"}", write_policy_rules("example-https"));
}

TEST(terminating_gateway_classify, states)
{
	terminating_gateway_service resource = make_gateway_service("svc");
	catalog_service registered;

	EXPECT_EQ(gateway_service_state::gone, classify_gateway_service(false, resource, nullptr));
	EXPECT_EQ(gateway_service_state::unregistered,
	          classify_gateway_service(true, resource, nullptr));

	resource.metadata.deletion_timestamp = "2022-06-01T10:00:00Z";
	EXPECT_EQ(gateway_service_state::gone, classify_gateway_service(true, resource, nullptr));

	resource.metadata.add_finalizer(FINALIZER_NAME);
	EXPECT_EQ(gateway_service_state::deleting,
	          classify_gateway_service(true, resource, &registered));
}

TEST(terminating_gateway_classify, empty_datacenter_is_not_compared)
{
	const terminating_gateway_service resource = make_gateway_service("svc");
	catalog_service registered;

	registered.node = "legacy_node";
	registered.address = "10.20.10.22";
	registered.datacenter = "dc1";
	registered.service_id = "svc";
	registered.service_name = "svc";
	registered.service_address = "example.com";
	registered.service_port = 443;
	registered.service_tags = {"external"};

	EXPECT_FALSE(catalog_entry_differs(registered, resource.spec));

	registered.service_port = 8443;
	EXPECT_TRUE(catalog_entry_differs(registered, resource.spec));

	registered.service_port = 443;
	external_registration_spec with_dc = resource.spec;
	with_dc.datacenter = "dc2";
	EXPECT_TRUE(catalog_entry_differs(registered, with_dc));
}

TEST(terminating_gateway_registration, service_id_defaults_to_name)
{
	terminating_gateway_service resource = make_gateway_service("svc");

	EXPECT_EQ("svc", registration_for(resource.spec).service.id);

	resource.spec.service.id = "svc-1";
	const catalog_registration reg = registration_for(resource.spec);
	EXPECT_EQ("svc-1", reg.service.id);
	EXPECT_EQ("svc", reg.service.service);
	EXPECT_EQ("legacy_node", reg.node);
	EXPECT_EQ(443, reg.service.port);
}

TEST_F(terminating_gateway_test, registers_service_and_links_policy)
{
	m_k8s->add_terminating_gateway_service(make_gateway_service("example-https"));
	terminating_gateway_service_reconciler reconciler = make_reconciler(true);

	reconciler.reconcile(object_key("default", "example-https"));

	const std::vector<catalog_service> catalog = m_consul->catalog();
	ASSERT_EQ(1u, catalog.size());
	EXPECT_EQ("example-https", catalog[0].service_name);
	EXPECT_EQ("legacy_node", catalog[0].node);
	EXPECT_EQ(443, catalog[0].service_port);

	const std::vector<acl_policy> policies = m_consul->policies();
	ASSERT_EQ(1u, policies.size());
	EXPECT_EQ("example-https-write-policy", policies[0].name);
	EXPECT_EQ("service \"example-https\" {policy = \"write\"}", policies[0].rules);

	const acl_role role = gateway_role();
	ASSERT_EQ(1u, role.policies.size());
	EXPECT_EQ(policies[0].id, role.policies[0].id);

	const terminating_gateway_service status = stored();
	EXPECT_TRUE(status.metadata.has_finalizer(FINALIZER_NAME));
	ASSERT_TRUE(status.has_service_info_ref);
	EXPECT_EQ("example-https", status.status_ref.service_name);
	EXPECT_EQ("example-https-write-policy", status.status_ref.policy_name);
	EXPECT_EQ("2022-06-01T10:00:00Z", status.last_synced_time);
	const condition* synced = synced_condition(status);
	ASSERT_NE(nullptr, synced);
	EXPECT_EQ("True", synced->status);
}

TEST_F(terminating_gateway_test, finalizer_is_added_before_registration)
{
	m_k8s->add_terminating_gateway_service(make_gateway_service("example-https"));
	terminating_gateway_service_reconciler reconciler = make_reconciler(false);

	reconciler.reconcile(object_key("default", "example-https"));

	const std::vector<std::string> writes = m_k8s->writes();
	ASSERT_EQ(2u, writes.size());
	EXPECT_EQ("update_finalizers default/example-https", writes[0]);
	EXPECT_EQ("update_terminating_gateway_status default/example-https", writes[1]);
}

TEST_F(terminating_gateway_test, without_acls_no_policy_is_touched)
{
	m_k8s->add_terminating_gateway_service(make_gateway_service("example-https"));
	terminating_gateway_service_reconciler reconciler = make_reconciler(false);

	reconciler.reconcile(object_key("default", "example-https"));

	EXPECT_EQ(1u, m_consul->catalog().size());
	EXPECT_TRUE(m_consul->policies().empty());
	EXPECT_EQ(0u, m_consul->count("list_roles"));
	EXPECT_EQ("", stored().status_ref.policy_name);
}

TEST_F(terminating_gateway_test, second_pass_changes_nothing)
{
	m_k8s->add_terminating_gateway_service(make_gateway_service("example-https"));
	terminating_gateway_service_reconciler reconciler = make_reconciler(true);
	reconciler.reconcile(object_key("default", "example-https"));
	m_k8s->clear_writes();
	m_consul->clear_calls();

	reconciler.reconcile(object_key("default", "example-https"));

	EXPECT_TRUE(m_k8s->writes().empty());
	EXPECT_TRUE(m_consul->calls().empty());
}

TEST_F(terminating_gateway_test, existing_policy_is_reused)
{
	acl_policy policy;
	policy.id = "existing-policy";
	policy.name = "example-https-write-policy";
	m_consul->add_policy(policy);
	m_k8s->add_terminating_gateway_service(make_gateway_service("example-https"));
	terminating_gateway_service_reconciler reconciler = make_reconciler(true);

	reconciler.reconcile(object_key("default", "example-https"));

	EXPECT_EQ(0u, m_consul->count("create_policy"));
	ASSERT_EQ(1u, gateway_role().policies.size());
	EXPECT_EQ("existing-policy", gateway_role().policies[0].id);
}

TEST_F(terminating_gateway_test, policy_is_matched_by_name_substring)
{
	acl_policy policy;
	policy.id = "prefixed-policy";
	policy.name = "dc1-example-https-write-policy";
	m_consul->add_policy(policy);
	m_k8s->add_terminating_gateway_service(make_gateway_service("example-https"));
	terminating_gateway_service_reconciler reconciler = make_reconciler(true);

	reconciler.reconcile(object_key("default", "example-https"));

	EXPECT_EQ(0u, m_consul->count("create_policy"));
	ASSERT_EQ(1u, gateway_role().policies.size());
	EXPECT_EQ("prefixed-policy", gateway_role().policies[0].id);
	EXPECT_EQ("dc1-example-https-write-policy", gateway_role().policies[0].name);

	terminating_gateway_service deleted = stored();
	deleted.metadata.deletion_timestamp = "2022-06-01T11:00:00Z";
	m_k8s->add_terminating_gateway_service(deleted);

	reconciler.reconcile(object_key("default", "example-https"));

	EXPECT_TRUE(gateway_role().policies.empty());
	EXPECT_TRUE(m_consul->policies().empty());
}

TEST_F(terminating_gateway_test, changed_spec_is_registered_again)
{
	m_k8s->add_terminating_gateway_service(make_gateway_service("example-https"));
	terminating_gateway_service_reconciler reconciler = make_reconciler(false);
	reconciler.reconcile(object_key("default", "example-https"));

	terminating_gateway_service changed = stored();
	changed.spec.service.port = 8443;
	m_k8s->add_terminating_gateway_service(changed);
	m_consul->clear_calls();

	reconciler.reconcile(object_key("default", "example-https"));

	const std::vector<std::string> calls = m_consul->calls();
	ASSERT_EQ(2u, calls.size());
	EXPECT_EQ("catalog_deregister example-https", calls[0]);
	EXPECT_EQ("catalog_register example-https", calls[1]);
	ASSERT_EQ(1u, m_consul->catalog().size());
	EXPECT_EQ(8443, m_consul->catalog()[0].service_port);
}

TEST_F(terminating_gateway_test, multiple_catalog_entries_are_an_error)
{
	catalog_service a;
	a.node = "node-a";
	a.service_id = "example-https";
	a.service_name = "example-https";
	catalog_service b = a;
	b.node = "node-b";
	m_consul->add_catalog_service(a);
	m_consul->add_catalog_service(b);
	m_k8s->add_terminating_gateway_service(make_gateway_service("example-https"));
	terminating_gateway_service_reconciler reconciler = make_reconciler(false);

	try
	{
		reconciler.reconcile(object_key("default", "example-https"));
		FAIL() << "expected duplicate catalog entries to be rejected";
	}
	catch(const meshbridge_exception& ex)
	{
		EXPECT_EQ(std::string("multiple catalog entries found for service example-https"),
		          ex.what());
	}

	const condition* synced = synced_condition(stored());
	ASSERT_NE(nullptr, synced);
	EXPECT_EQ("False", synced->status);
	EXPECT_EQ("ErrorUpdatingStatus", synced->reason);
	EXPECT_EQ("multiple catalog entries found for service example-https", synced->message);
}

TEST_F(terminating_gateway_test, missing_role_is_an_error)
{
	m_consul = std::make_shared<fake_consul_client>();
	m_k8s->add_terminating_gateway_service(make_gateway_service("example-https"));
	terminating_gateway_service_reconciler reconciler = make_reconciler(true);

	EXPECT_THROW(reconciler.reconcile(object_key("default", "example-https")),
	             meshbridge_exception);

	EXPECT_EQ("terminating gateway ACL role not found", synced_condition(stored())->message);
}

TEST_F(terminating_gateway_test, deletion_deregisters_and_releases_finalizer)
{
	m_k8s->add_terminating_gateway_service(make_gateway_service("example-https"));
	terminating_gateway_service_reconciler reconciler = make_reconciler(true);
	reconciler.reconcile(object_key("default", "example-https"));

	terminating_gateway_service deleted = stored();
	deleted.metadata.deletion_timestamp = "2022-06-01T11:00:00Z";
	m_k8s->add_terminating_gateway_service(deleted);

	reconciler.reconcile(object_key("default", "example-https"));

	EXPECT_TRUE(m_consul->catalog().empty());
	EXPECT_TRUE(m_consul->policies().empty());
	EXPECT_TRUE(gateway_role().policies.empty());

	terminating_gateway_service gone;
	EXPECT_FALSE(
	    m_k8s->get_terminating_gateway_service(object_key("default", "example-https"), gone));
}

TEST_F(terminating_gateway_test, deletion_tolerates_missing_policy)
{
	terminating_gateway_service deleted = make_gateway_service("example-https");
	deleted.metadata.add_finalizer(FINALIZER_NAME);
	deleted.metadata.deletion_timestamp = "2022-06-01T11:00:00Z";
	m_k8s->add_terminating_gateway_service(deleted);
	terminating_gateway_service_reconciler reconciler = make_reconciler(true);

	reconciler.reconcile(object_key("default", "example-https"));

	EXPECT_EQ(0u, m_consul->count("catalog_deregister"));
	EXPECT_EQ(0u, m_consul->count("update_role"));
	EXPECT_EQ(0u, m_consul->count("delete_policy"));
	terminating_gateway_service gone;
	EXPECT_FALSE(
	    m_k8s->get_terminating_gateway_service(object_key("default", "example-https"), gone));
}

TEST_F(terminating_gateway_test, missing_resource_is_a_no_op)
{
	terminating_gateway_service_reconciler reconciler = make_reconciler(true);

	reconciler.reconcile(object_key("default", "absent"));

	EXPECT_TRUE(m_consul->calls().empty());
	EXPECT_TRUE(m_k8s->writes().empty());
}
