#include <tessera/execution/registry.hpp>
#include <tessera/execution/state_journal.hpp>
#include <tessera/schema/key/engine_keys.hpp>
#include <tessera/storage/rocksdb/storage.hpp>
#include <tessera/testing/common.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <variant>

namespace {

using tessera::schema::registry_error_code;
using storage_t =
    tessera::storage::storage<tessera::storage::rocksdb_storage_tag>;

const auto kAdmin = tessera::testing::make_identity(1);
const auto kAlice = tessera::testing::make_identity(10);
const auto kBob = tessera::testing::make_identity(20);
const auto kCarol = tessera::testing::make_identity(30);
const auto kOperator = tessera::testing::make_identity(40);
constexpr auto kNone = tessera::schema::kNoneIdentity;

class registry_test : public ::testing::Test {
 protected:
  void SetUp() override {
    db_path_ = tessera::testing::make_db_path("tessera_registry");
    storage_ = tessera::storage::make_storage<
        tessera::storage::rocksdb_storage_tag>(db_path_);
    journal_ = std::make_unique<tessera::execution::state_journal>(storage_);
    registry_ = std::make_unique<tessera::execution::registry>(*journal_);
  }

  void TearDown() override {
    registry_.reset();
    journal_.reset();
    storage_.database.reset();
    tessera::testing::remove_path(db_path_);
  }

  tessera::execution::registry& registry() { return *registry_; }
  tessera::execution::state_journal& journal() { return *journal_; }

  void create(const tessera::schema::supply_t max_supply = 3) {
    auto result = registry().create_collection(
        kAdmin, tessera::schema::create_collection_t{.name = "Tiles",
                                                     .symbol = "TILE",
                                                     .base_uri = "ipfs://t/",
                                                     .max_supply = max_supply});
    ASSERT_TRUE(result.ok());
  }

  void mint(const tessera::schema::identity_t& to,
            const tessera::schema::token_id_t id) {
    ASSERT_TRUE(registry().mint(kAdmin, to, id).ok());
  }

  uint64_t balance(const tessera::schema::identity_t& owner) {
    auto result = registry().balance_of(owner);
    EXPECT_TRUE(result.ok());
    return result.value;
  }

  uint64_t total_supply() { return registry().total_supply().value; }

  std::string db_path_;
  storage_t storage_;
  std::unique_ptr<tessera::execution::state_journal> journal_;
  std::unique_ptr<tessera::execution::registry> registry_;
};

const tessera::schema::transfer_event_t& as_transfer(
    const tessera::schema::registry_event_t& event) {
  return std::get<tessera::schema::transfer_event_t>(event);
}

}  // namespace

TEST_F(registry_test, create_collection_records_configuration) {
  create(5);
  auto collection = registry().collection();
  ASSERT_TRUE(collection.ok());
  EXPECT_EQ(collection.value.admin, kAdmin);
  EXPECT_EQ(collection.value.total_supply, 0u);
  EXPECT_FALSE(collection.value.mint_paused);
  EXPECT_EQ(registry().name().value, "Tiles");
  EXPECT_EQ(registry().symbol().value, "TILE");
  EXPECT_EQ(registry().max_supply().value, 5u);
  EXPECT_EQ(total_supply(), 0u);
}

TEST_F(registry_test, create_collection_rejects_bad_configuration) {
  auto config = tessera::schema::create_collection_t{
      .name = "Tiles", .symbol = "TILE", .base_uri = "", .max_supply = 0};
  EXPECT_EQ(registry().create_collection(kAdmin, config).code,
            registry_error_code::invalid_configuration);
  config.max_supply = 1;
  EXPECT_EQ(registry().create_collection(kNone, config).code,
            registry_error_code::invalid_recipient);
  EXPECT_TRUE(journal().empty());

  EXPECT_TRUE(registry().create_collection(kAdmin, config).ok());
  EXPECT_EQ(registry().create_collection(kAlice, config).code,
            registry_error_code::collection_exists);
  EXPECT_EQ(registry().collection().value.admin, kAdmin);
}

TEST_F(registry_test, operations_before_creation_report_missing_collection) {
  EXPECT_EQ(registry().mint(kAdmin, kAlice, 1).code,
            registry_error_code::collection_missing);
  EXPECT_EQ(registry().burn(kAlice, 1).code,
            registry_error_code::collection_missing);
  EXPECT_EQ(registry().approve(kAlice, kBob, 1).code,
            registry_error_code::collection_missing);
  EXPECT_EQ(registry().set_approval_for_all(kAlice, kBob, true).code,
            registry_error_code::collection_missing);
  EXPECT_EQ(registry().transfer_from(kAlice, kAlice, kBob, 1).code,
            registry_error_code::collection_missing);
  EXPECT_EQ(registry().pause_minting(kAdmin).code,
            registry_error_code::collection_missing);
  EXPECT_EQ(registry().owner_of(1).code,
            registry_error_code::collection_missing);
  EXPECT_EQ(registry().token_uri(1).code,
            registry_error_code::collection_missing);
  EXPECT_EQ(registry().name().code, registry_error_code::collection_missing);
  EXPECT_EQ(registry().total_supply().code,
            registry_error_code::collection_missing);

  EXPECT_EQ(balance(kAlice), 0u);
  EXPECT_FALSE(registry().is_approved_for_all(kAlice, kBob));
  EXPECT_TRUE(journal().empty());
}

TEST_F(registry_test, mint_assigns_owner_and_counts) {
  create();
  auto result = registry().mint(kAdmin, kAlice, 1);
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.events.size(), 1u);
  const auto& event = as_transfer(result.events[0]);
  EXPECT_EQ(event.from, kNone);
  EXPECT_EQ(event.to, kAlice);
  EXPECT_EQ(event.token_id, 1u);

  EXPECT_EQ(registry().owner_of(1).value, kAlice);
  EXPECT_EQ(total_supply(), 1u);
  EXPECT_EQ(balance(kAlice), 1u);
  EXPECT_EQ(registry().get_approved(1).value, kNone);
}

TEST_F(registry_test, mint_checks_run_in_fixed_order) {
  create(2);
  ASSERT_TRUE(registry().pause_minting(kAdmin).ok());
  // Every check fails here; the first one in order wins.
  EXPECT_EQ(registry().mint(kAlice, kNone, 0).code,
            registry_error_code::unauthorized);
  EXPECT_EQ(registry().mint(kAdmin, kNone, 0).code,
            registry_error_code::mint_paused);
  ASSERT_TRUE(registry().unpause_minting(kAdmin).ok());
  EXPECT_EQ(registry().mint(kAdmin, kNone, 0).code,
            registry_error_code::invalid_recipient);
  EXPECT_EQ(registry().mint(kAdmin, kAlice, 0).code,
            registry_error_code::id_out_of_range);
  EXPECT_EQ(registry().mint(kAdmin, kAlice, 3).code,
            registry_error_code::id_out_of_range);
  mint(kAlice, 2);
  EXPECT_EQ(registry().mint(kAdmin, kBob, 2).code,
            registry_error_code::already_exists);
  EXPECT_EQ(total_supply(), 1u);
  EXPECT_EQ(balance(kBob), 0u);
}

TEST_F(registry_test, total_supply_tracks_successful_mints) {
  create(4);
  for (auto id = tessera::schema::token_id_t{1}; id <= 4; ++id) {
    mint(id % 2 == 0 ? kAlice : kBob, id);
    EXPECT_EQ(total_supply(), id);
  }
  EXPECT_EQ(registry().mint(kAdmin, kCarol, 5).code,
            registry_error_code::id_out_of_range);
  EXPECT_EQ(registry().mint(kAdmin, kCarol, 4).code,
            registry_error_code::already_exists);
  EXPECT_EQ(total_supply(), 4u);
}

TEST_F(registry_test, mint_refuses_when_supply_counter_is_at_ceiling) {
  create(3);
  auto collection = registry().collection().value;
  collection.total_supply = collection.max_supply;
  journal().put(tessera::schema::key::make_collection_key(), collection);

  EXPECT_EQ(registry().mint(kAdmin, kAlice, 1).code,
            registry_error_code::supply_exhausted);
  EXPECT_FALSE(registry().owner_of(1).ok());
}

TEST_F(registry_test, burn_retires_the_asset) {
  create();
  mint(kAlice, 1);
  mint(kAlice, 2);
  ASSERT_TRUE(registry().approve(kAlice, kBob, 1).ok());

  auto result = registry().burn(kAlice, 1);
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(as_transfer(result.events[0]).from, kAlice);
  EXPECT_EQ(as_transfer(result.events[0]).to, kNone);

  EXPECT_EQ(registry().owner_of(1).code,
            registry_error_code::nonexistent_asset);
  EXPECT_EQ(registry().get_approved(1).code,
            registry_error_code::nonexistent_asset);
  EXPECT_EQ(registry().token_uri(1).code,
            registry_error_code::nonexistent_asset);
  EXPECT_EQ(total_supply(), 1u);
  EXPECT_EQ(balance(kAlice), 1u);
  EXPECT_FALSE(registry().is_approved_or_owner(kAlice, 1));

  EXPECT_EQ(registry().mint(kAdmin, kAlice, 1).code,
            registry_error_code::already_exists);
  EXPECT_EQ(registry().burn(kAlice, 1).code,
            registry_error_code::nonexistent_asset);
}

TEST_F(registry_test, only_the_owner_may_burn) {
  create();
  mint(kAlice, 1);
  ASSERT_TRUE(registry().approve(kAlice, kBob, 1).ok());
  ASSERT_TRUE(registry().set_approval_for_all(kAlice, kOperator, true).ok());

  EXPECT_EQ(registry().burn(kBob, 1).code, registry_error_code::unauthorized);
  EXPECT_EQ(registry().burn(kOperator, 1).code,
            registry_error_code::unauthorized);
  EXPECT_EQ(registry().burn(kAdmin, 1).code, registry_error_code::unauthorized);
  EXPECT_EQ(registry().owner_of(1).value, kAlice);
}

TEST_F(registry_test, approved_spender_transfer_clears_approval) {
  create();
  mint(kAlice, 1);
  auto approval = registry().approve(kAlice, kBob, 1);
  ASSERT_TRUE(approval.ok());
  const auto& approval_event =
      std::get<tessera::schema::approval_event_t>(approval.events[0]);
  EXPECT_EQ(approval_event.owner, kAlice);
  EXPECT_EQ(approval_event.approved, kBob);
  EXPECT_EQ(registry().get_approved(1).value, kBob);

  auto transfer = registry().transfer_from(kBob, kAlice, kCarol, 1);
  ASSERT_TRUE(transfer.ok());
  EXPECT_EQ(as_transfer(transfer.events[0]).from, kAlice);
  EXPECT_EQ(as_transfer(transfer.events[0]).to, kCarol);

  EXPECT_EQ(registry().owner_of(1).value, kCarol);
  EXPECT_EQ(registry().get_approved(1).value, kNone);
  EXPECT_EQ(balance(kAlice), 0u);
  EXPECT_EQ(balance(kCarol), 1u);
  EXPECT_EQ(total_supply(), 1u);

  EXPECT_EQ(registry().transfer_from(kBob, kCarol, kBob, 1).code,
            registry_error_code::unauthorized);
}

TEST_F(registry_test, transfer_checks_run_in_fixed_order) {
  create();
  mint(kAlice, 1);
  EXPECT_EQ(registry().transfer_from(kBob, kBob, kNone, 2).code,
            registry_error_code::nonexistent_asset);
  EXPECT_EQ(registry().transfer_from(kBob, kBob, kNone, 1).code,
            registry_error_code::owner_mismatch);
  EXPECT_EQ(registry().transfer_from(kBob, kAlice, kNone, 1).code,
            registry_error_code::unauthorized);
  EXPECT_EQ(registry().transfer_from(kAlice, kAlice, kNone, 1).code,
            registry_error_code::invalid_recipient);
  EXPECT_EQ(registry().owner_of(1).value, kAlice);
}

TEST_F(registry_test, operator_may_approve_and_transfer) {
  create();
  mint(kAlice, 1);
  auto grant = registry().set_approval_for_all(kAlice, kOperator, true);
  ASSERT_TRUE(grant.ok());
  const auto& event =
      std::get<tessera::schema::approval_for_all_event_t>(grant.events[0]);
  EXPECT_EQ(event.owner, kAlice);
  EXPECT_EQ(event.operator_id, kOperator);
  EXPECT_TRUE(event.approved);
  EXPECT_TRUE(registry().is_approved_for_all(kAlice, kOperator));
  EXPECT_FALSE(registry().is_approved_for_all(kOperator, kAlice));

  ASSERT_TRUE(registry().approve(kOperator, kBob, 1).ok());
  EXPECT_EQ(registry().get_approved(1).value, kBob);
  ASSERT_TRUE(registry().transfer_from(kOperator, kAlice, kCarol, 1).ok());
  EXPECT_EQ(registry().owner_of(1).value, kCarol);

  // Operator authority belongs to the old owner, not the new one.
  EXPECT_EQ(registry().transfer_from(kOperator, kCarol, kAlice, 1).code,
            registry_error_code::unauthorized);
}

TEST_F(registry_test, approved_spender_cannot_reapprove) {
  create();
  mint(kAlice, 1);
  ASSERT_TRUE(registry().approve(kAlice, kBob, 1).ok());
  EXPECT_EQ(registry().approve(kBob, kCarol, 1).code,
            registry_error_code::unauthorized);
  EXPECT_EQ(registry().approve(kBob, kCarol, 7).code,
            registry_error_code::nonexistent_asset);

  ASSERT_TRUE(registry().approve(kAlice, kNone, 1).ok());
  EXPECT_EQ(registry().get_approved(1).value, kNone);
  EXPECT_FALSE(registry().is_approved_or_owner(kBob, 1));
}

TEST_F(registry_test, operator_grant_is_overwritten_and_revocable) {
  create();
  EXPECT_EQ(registry().set_approval_for_all(kAlice, kAlice, true).code,
            registry_error_code::self_operator);
  EXPECT_EQ(registry().set_approval_for_all(kAlice, kAlice, false).code,
            registry_error_code::self_operator);

  EXPECT_TRUE(registry().set_approval_for_all(kAlice, kOperator, true).ok());
  auto repeat = registry().set_approval_for_all(kAlice, kOperator, true);
  ASSERT_TRUE(repeat.ok());
  EXPECT_EQ(repeat.events.size(), 1u);

  auto revoke = registry().set_approval_for_all(kAlice, kOperator, false);
  ASSERT_TRUE(revoke.ok());
  EXPECT_FALSE(
      std::get<tessera::schema::approval_for_all_event_t>(revoke.events[0])
          .approved);
  EXPECT_FALSE(registry().is_approved_for_all(kAlice, kOperator));
}

TEST_F(registry_test, self_transfer_keeps_balance_and_clears_approval) {
  create();
  mint(kAlice, 1);
  ASSERT_TRUE(registry().approve(kAlice, kBob, 1).ok());
  ASSERT_TRUE(registry().transfer_from(kAlice, kAlice, kAlice, 1).ok());
  EXPECT_EQ(balance(kAlice), 1u);
  EXPECT_EQ(registry().owner_of(1).value, kAlice);
  EXPECT_EQ(registry().get_approved(1).value, kNone);
}

TEST_F(registry_test, balances_follow_interleaved_activity) {
  create(5);
  mint(kAlice, 1);
  mint(kAlice, 2);
  mint(kBob, 3);
  ASSERT_TRUE(registry().transfer_from(kAlice, kAlice, kBob, 2).ok());
  ASSERT_TRUE(registry().burn(kBob, 3).ok());
  mint(kCarol, 4);
  ASSERT_TRUE(registry().transfer_from(kBob, kBob, kCarol, 2).ok());

  EXPECT_EQ(balance(kAlice), 1u);
  EXPECT_EQ(balance(kBob), 0u);
  EXPECT_EQ(balance(kCarol), 2u);
  EXPECT_EQ(total_supply(), 3u);
  EXPECT_EQ(registry().balance_of(kNone).code,
            registry_error_code::invalid_recipient);
}

TEST_F(registry_test, pause_is_admin_only_and_idempotent) {
  create();
  EXPECT_EQ(registry().pause_minting(kAlice).code,
            registry_error_code::unauthorized);
  auto pause = registry().pause_minting(kAdmin);
  ASSERT_TRUE(pause.ok());
  EXPECT_TRUE(pause.events.empty());
  EXPECT_TRUE(registry().pause_minting(kAdmin).ok());
  EXPECT_EQ(registry().mint(kAdmin, kAlice, 1).code,
            registry_error_code::mint_paused);

  EXPECT_EQ(registry().unpause_minting(kAlice).code,
            registry_error_code::unauthorized);
  ASSERT_TRUE(registry().unpause_minting(kAdmin).ok());
  ASSERT_TRUE(registry().unpause_minting(kAdmin).ok());
  EXPECT_TRUE(registry().mint(kAdmin, kAlice, 1).ok());
}

TEST_F(registry_test, token_uri_appends_decimal_id) {
  create(12);
  mint(kAlice, 1);
  mint(kAlice, 10);
  EXPECT_EQ(registry().token_uri(1).value, "ipfs://t/1");
  EXPECT_EQ(registry().token_uri(10).value, "ipfs://t/10");
  EXPECT_EQ(registry().token_uri(11).code,
            registry_error_code::nonexistent_asset);
}

TEST_F(registry_test, refused_operations_stage_nothing) {
  create();
  mint(kAlice, 1);
  const auto before = journal().write_set();

  EXPECT_FALSE(registry().mint(kBob, kBob, 2).ok());
  EXPECT_FALSE(registry().burn(kBob, 1).ok());
  EXPECT_FALSE(registry().approve(kBob, kBob, 1).ok());
  EXPECT_FALSE(registry().set_approval_for_all(kBob, kBob, true).ok());
  EXPECT_FALSE(registry().transfer_from(kBob, kAlice, kBob, 1).ok());
  EXPECT_FALSE(registry().pause_minting(kBob).ok());

  EXPECT_EQ(journal().write_set(), before);
}

TEST_F(registry_test, authorization_predicate_covers_all_roles) {
  create();
  mint(kAlice, 1);
  ASSERT_TRUE(registry().approve(kAlice, kBob, 1).ok());
  ASSERT_TRUE(registry().set_approval_for_all(kAlice, kOperator, true).ok());

  EXPECT_TRUE(registry().is_approved_or_owner(kAlice, 1));
  EXPECT_TRUE(registry().is_approved_or_owner(kBob, 1));
  EXPECT_TRUE(registry().is_approved_or_owner(kOperator, 1));
  EXPECT_FALSE(registry().is_approved_or_owner(kCarol, 1));
  EXPECT_FALSE(registry().is_approved_or_owner(kAlice, 2));
  EXPECT_FALSE(registry().is_approved_or_owner(kNone, 1));
}
