#include <credo/factory/instance_factory.hpp>
#include <credo/instance/deployment.hpp>
#include <credo/instance/layout.hpp>
#include <credo/testing/credential_fixture.hpp>
#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

namespace {

using credo::schema::error_code;
using credo::schema::lifecycle_state;

credo::schema::bytes_t text(const std::string& value) {
  return credo::schema::make_bytes(value);
}

class instance_factory_test : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(credo::instance::deploy_template(fixture_.storage(),
                                                 template_address_)
                    .ok());
    ASSERT_TRUE(credo::factory::deploy_factory(fixture_.storage(),
                                               factory_address_,
                                               template_address_)
                    .ok());
  }

  credo::factory::instance_factory factory() {
    return credo::factory::instance_factory{
        fixture_.storage(), fixture_.registries(), factory_address_};
  }

  credo::testing::credential_fixture fixture_{"credo_factory"};
  credo::schema::address_t template_address_ = credo::testing::make_hash(0x10);
  credo::schema::address_t factory_address_ = credo::testing::make_hash(0x20);
  credo::schema::address_t alice_ = credo::testing::make_address(1);
  credo::schema::address_t bob_ = credo::testing::make_address(2);
};

}  // namespace

TEST(factory_addresses, derivation_is_deterministic) {
  auto factory = credo::testing::make_hash(1);
  auto code = credo::factory::make_code_identity(credo::testing::make_hash(2));
  auto salt = credo::testing::make_hash(3);

  EXPECT_EQ(credo::factory::make_deterministic_address(factory, salt, code),
            credo::factory::make_deterministic_address(factory, salt, code));
  EXPECT_NE(credo::factory::make_deterministic_address(factory, salt, code),
            credo::factory::make_deterministic_address(
                factory, credo::testing::make_hash(4), code));
  EXPECT_NE(credo::factory::make_create_address(factory, 0),
            credo::factory::make_create_address(factory, 1));
  EXPECT_NE(credo::factory::make_code_identity(credo::testing::make_hash(2)),
            credo::factory::make_code_identity(credo::testing::make_hash(5)));
}

TEST_F(instance_factory_test, factory_requires_a_template) {
  auto deployed = credo::factory::deploy_factory(
      fixture_.storage(), credo::testing::make_hash(0x21),
      credo::testing::make_hash(0x11));
  EXPECT_EQ(deployed.code, error_code::invalid_template);

  auto occupied = credo::factory::deploy_factory(
      fixture_.storage(), factory_address_, template_address_);
  EXPECT_EQ(occupied.code, error_code::address_occupied);
}

TEST_F(instance_factory_test, exposes_template_and_code_identity) {
  auto created = factory();
  EXPECT_TRUE(created.exists());
  EXPECT_EQ(created.template_address(), template_address_);
  EXPECT_EQ(created.code_identity(),
            credo::factory::make_code_identity(template_address_));
}

TEST_F(instance_factory_test, create_returns_an_initialized_clone) {
  auto result = factory().create(alice_, credo::schema::make_null_address(),
                                 "Widget");
  ASSERT_TRUE(result.ok()) << result.log;

  auto clone = factory().instance(result.address);
  EXPECT_EQ(clone.lifecycle(), lifecycle_state::initialized);
  EXPECT_EQ(clone.owner(), alice_);
  EXPECT_EQ(clone.registry(), credo::instance::default_registry_address());
  EXPECT_EQ(clone.implementation(), template_address_);
  EXPECT_EQ(clone.get_instance_metadata("name"), text("Widget"));

  ASSERT_FALSE(result.events.empty());
  const auto& created = result.events.back();
  EXPECT_EQ(created.type, "instance_created");
  EXPECT_EQ(created.find("instance"), credo::schema::to_hex(result.address));
  EXPECT_EQ(created.find("creator"), credo::schema::to_hex(alice_));
  EXPECT_EQ(created.find("name"), "Widget");
  EXPECT_EQ(created.find("registry"),
            credo::schema::to_hex(credo::instance::default_registry_address()));
}

TEST_F(instance_factory_test, empty_name_is_not_stored) {
  auto result =
      factory().create(alice_, credo::schema::make_null_address(), "");
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(
      factory().instance(result.address).get_instance_metadata("name").empty());
}

TEST_F(instance_factory_test, clone_cannot_be_initialized_again) {
  auto result = factory().create(alice_, credo::schema::make_null_address(),
                                 "Widget");
  ASSERT_TRUE(result.ok());

  auto clone = factory().instance(result.address);
  EXPECT_EQ(clone.initialize(bob_, credo::schema::make_null_address(), bob_,
                             "Stolen")
                .code,
            error_code::already_initialized);
  EXPECT_EQ(clone.owner(), alice_);
  EXPECT_EQ(clone.get_instance_metadata("name"), text("Widget"));
}

TEST_F(instance_factory_test, null_creator_is_rejected_without_side_effects) {
  auto result = factory().create(credo::schema::make_null_address(),
                                 credo::schema::make_null_address(), "x");
  EXPECT_EQ(result.code, error_code::invalid_owner);
  EXPECT_EQ(factory().instance_count(), 0u);

  auto retried = factory().create(alice_, credo::schema::make_null_address(),
                                  "x");
  ASSERT_TRUE(retried.ok());
  EXPECT_EQ(retried.address,
            credo::factory::make_create_address(factory_address_, 0));
}

TEST_F(instance_factory_test, clones_have_isolated_storage) {
  fixture_.registry().set_owner(1, alice_);
  auto first =
      factory().create(alice_, credo::schema::make_null_address(), "one");
  auto second =
      factory().create(alice_, credo::schema::make_null_address(), "two");
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_NE(first.address, second.address);

  auto one = factory().instance(first.address);
  auto two = factory().instance(second.address);
  ASSERT_TRUE(one.set_subject_metadata(alice_, 1, "k", text("v")).ok());
  EXPECT_EQ(one.get_subject_metadata(1, "k"), text("v"));
  EXPECT_TRUE(two.get_subject_metadata(1, "k").empty());
  EXPECT_EQ(two.get_instance_metadata("name"), text("two"));
}

TEST_F(instance_factory_test, template_storage_is_untouched_by_clones) {
  ASSERT_TRUE(
      factory().create(alice_, credo::schema::make_null_address(), "W").ok());
  auto body = factory().instance(template_address_);
  EXPECT_EQ(body.lifecycle(), lifecycle_state::template_body);
  EXPECT_TRUE(credo::schema::is_null(body.owner()));
  EXPECT_TRUE(body.get_instance_metadata("name").empty());
}

TEST_F(instance_factory_test, deterministic_creation_matches_prediction) {
  auto salt = credo::testing::make_hash(0x77);
  auto predicted = factory().predict_address(salt);

  auto result = factory().create_deterministic(
      alice_, credo::schema::make_null_address(), "Det", salt);
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(result.address, predicted);
  EXPECT_EQ(factory().predict_address(salt), predicted);

  auto reused = factory().create_deterministic(
      bob_, credo::schema::make_null_address(), "Again", salt);
  EXPECT_EQ(reused.code, error_code::address_occupied);
  EXPECT_EQ(factory().instance(predicted).owner(), alice_);
  EXPECT_EQ(factory().instance_count(), 1u);
}

TEST_F(instance_factory_test, deterministic_creation_leaves_nonce_alone) {
  ASSERT_TRUE(factory()
                  .create_deterministic(alice_,
                                        credo::schema::make_null_address(),
                                        "Det", credo::testing::make_hash(1))
                  .ok());
  auto plain =
      factory().create(alice_, credo::schema::make_null_address(), "Plain");
  ASSERT_TRUE(plain.ok());
  EXPECT_EQ(plain.address,
            credo::factory::make_create_address(factory_address_, 0));
}

TEST_F(instance_factory_test, tracks_instances_globally_and_per_creator) {
  auto a1 = factory().create(alice_, credo::schema::make_null_address(), "a1");
  auto b1 = factory().create(bob_, credo::schema::make_null_address(), "b1");
  auto a2 = factory().create_deterministic(
      alice_, credo::schema::make_null_address(), "a2",
      credo::testing::make_hash(9));
  ASSERT_TRUE(a1.ok());
  ASSERT_TRUE(b1.ok());
  ASSERT_TRUE(a2.ok());

  auto created = factory();
  EXPECT_EQ(created.instance_count(), 3u);
  EXPECT_EQ(created.all_instances(),
            (std::vector<credo::schema::address_t>{a1.address, b1.address,
                                                   a2.address}));
  EXPECT_EQ(created.instances_by_creator(alice_),
            (std::vector<credo::schema::address_t>{a1.address, a2.address}));
  EXPECT_EQ(created.instance_count_by_creator(bob_), 1u);
  EXPECT_TRUE(
      created.instances_by_creator(credo::testing::make_address(9)).empty());
  EXPECT_EQ(created.instance_at(1), b1.address);
  EXPECT_FALSE(created.instance_at(3).has_value());

  auto unique = std::set<credo::schema::address_t>{};
  for (const auto& address : created.all_instances()) {
    EXPECT_TRUE(unique.insert(address).second);
  }
}

TEST_F(instance_factory_test, missing_factory_rejects_creation) {
  auto absent = credo::factory::instance_factory{
      fixture_.storage(), fixture_.registries(),
      credo::testing::make_hash(0x22)};
  EXPECT_FALSE(absent.exists());
  EXPECT_EQ(
      absent.create(alice_, credo::schema::make_null_address(), "x").code,
      error_code::instance_missing);
  EXPECT_TRUE(absent.all_instances().empty());
}

TEST_F(instance_factory_test, creation_survives_reopen) {
  auto result =
      factory().create(alice_, credo::schema::make_null_address(), "Widget");
  ASSERT_TRUE(result.ok());

  fixture_.storage().database.reset();
  fixture_.storage() =
      credo::storage::make_storage<credo::storage::rocksdb_storage_tag>(
          fixture_.db_path());

  EXPECT_EQ(factory().instance_count(), 1u);
  EXPECT_EQ(factory().instance(result.address).owner(), alice_);
}

// Create "Widget" with the default registry, let the agent's owner write
// metadata, then move the instance to another registry where a different
// address owns the agent.
TEST_F(instance_factory_test, widget_lifecycle_with_registry_swap) {
  constexpr auto kAgent = credo::schema::subject_id_t{7};
  auto carol = credo::testing::make_address(3);
  fixture_.registry().set_owner(kAgent, bob_);
  fixture_.alternate().set_owner(kAgent, carol);

  auto created =
      factory().create(alice_, credo::schema::make_null_address(), "Widget");
  ASSERT_TRUE(created.ok()) << created.log;
  auto widget = factory().instance(created.address);

  ASSERT_TRUE(
      widget.set_subject_metadata(bob_, kAgent, "role", text("builder")).ok());
  EXPECT_EQ(widget.set_subject_metadata(carol, kAgent, "role", text("x")).code,
            error_code::not_authorized);

  auto alternate =
      credo::testing::credential_fixture::alternate_registry_address();
  ASSERT_TRUE(widget.set_registry(alice_, alternate).ok());

  EXPECT_EQ(widget.set_subject_metadata(bob_, kAgent, "role", text("y")).code,
            error_code::not_authorized);
  ASSERT_TRUE(
      widget.set_subject_metadata(carol, kAgent, "role", text("auditor")).ok());
  EXPECT_EQ(widget.get_subject_metadata(kAgent, "role"), text("auditor"));
  EXPECT_EQ(widget.get_instance_metadata("name"), text("Widget"));
}

TEST_F(instance_factory_test, explicit_registry_is_bound_on_creation) {
  auto alternate =
      credo::testing::credential_fixture::alternate_registry_address();
  auto result = factory().create(alice_, alternate, "Alt");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(factory().instance(result.address).registry(), alternate);
}

TEST_F(instance_factory_test, widget_metadata_and_reviews) {
  fixture_.registry().set_owner(1, bob_);
  fixture_.registry().set_owner(2, alice_);
  auto created =
      factory().create(alice_, credo::schema::make_null_address(), "Widget");
  ASSERT_TRUE(created.ok());
  auto widget = factory().instance(created.address);
  EXPECT_EQ(widget.get_instance_metadata("name"), text("Widget"));

  ASSERT_TRUE(widget.set_subject_metadata(bob_, 1, "k", text("v1")).ok());
  EXPECT_EQ(widget.set_subject_metadata(alice_, 1, "k", text("v2")).code,
            error_code::not_authorized);
  EXPECT_EQ(widget.get_subject_metadata(1, "k"), text("v1"));

  ASSERT_TRUE(widget.submit_review(bob_, 1, 2, text("great")).ok());
  EXPECT_EQ(widget.get_review(1, 2), text("great"));
  EXPECT_TRUE(widget.get_review(2, 1).empty());
}

TEST_F(instance_factory_test, swapping_to_a_registry_without_the_subject) {
  fixture_.registry().set_owner(1, bob_);
  auto created =
      factory().create(alice_, credo::schema::make_null_address(), "Widget");
  ASSERT_TRUE(created.ok());
  auto widget = factory().instance(created.address);
  ASSERT_TRUE(widget.set_subject_metadata(bob_, 1, "k", text("v1")).ok());

  ASSERT_TRUE(widget
                  .set_registry(alice_, credo::testing::credential_fixture::
                                            alternate_registry_address())
                  .ok());
  EXPECT_EQ(widget.set_subject_metadata(bob_, 1, "k", text("v2")).code,
            error_code::agent_not_found);
  EXPECT_EQ(widget.get_subject_metadata(1, "k"), text("v1"));
}

TEST_F(instance_factory_test, create_skips_addresses_deployed_elsewhere) {
  auto squatted = credo::factory::make_create_address(factory_address_, 0);
  ASSERT_TRUE(credo::instance::deploy_instance(
                  fixture_.storage(), squatted, bob_,
                  credo::schema::make_null_address())
                  .ok());

  auto first = factory().create(alice_, credo::schema::make_null_address(), "x");
  ASSERT_TRUE(first.ok()) << first.log;
  EXPECT_EQ(first.address,
            credo::factory::make_create_address(factory_address_, 1));
  EXPECT_EQ(factory().instance(squatted).owner(), bob_);

  auto second =
      factory().create(alice_, credo::schema::make_null_address(), "y");
  ASSERT_TRUE(second.ok()) << second.log;
  EXPECT_EQ(second.address,
            credo::factory::make_create_address(factory_address_, 2));
  EXPECT_EQ(factory().all_instances(),
            (std::vector<credo::schema::address_t>{first.address,
                                                   second.address}));
}
