#pragma once

#include <tessera/execution/state_journal.hpp>
#include <tessera/schema/collection_state.hpp>
#include <tessera/schema/create_collection.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/registry_error_code.hpp>
#include <tessera/schema/registry_event.hpp>
#include <tessera/schema/token_state.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tessera::execution {

/// Outcome of a mutating registry operation.
///
/// On failure `events` is empty and nothing was staged.
struct operation_result final {
  tessera::schema::registry_error_code code{
      tessera::schema::registry_error_code::ok};
  std::vector<tessera::schema::registry_event_t> events;

  bool ok() const { return code == tessera::schema::registry_error_code::ok; }
};

/// Outcome of a registry read that can be refused.
template <typename T>
struct lookup_result final {
  tessera::schema::registry_error_code code{
      tessera::schema::registry_error_code::ok};
  T value{};

  bool ok() const { return code == tessera::schema::registry_error_code::ok; }
};

/// Asset registry state machine.
///
/// Holds no state of its own: every read and write goes through the bound
/// journal, so the caller decides whether staged writes are kept or dropped.
/// Each mutating operation runs all of its checks before its first write,
/// which leaves the journal untouched whenever an operation is refused.
/// The caller identity is an explicit argument, never ambient context.
class registry final {
 public:
  explicit registry(state_journal& state);

  /// Create the collection singleton; `caller` becomes the admin.
  operation_result create_collection(
      const tessera::schema::identity_t& caller,
      const tessera::schema::create_collection_t& config);

  /// Issue `token_id` to `to`. Admin only. Retired ids are never reissued.
  operation_result mint(const tessera::schema::identity_t& caller,
                        const tessera::schema::identity_t& to,
                        tessera::schema::token_id_t token_id);

  /// Retire `token_id`. Only the owner may burn; approvals do not apply.
  operation_result burn(const tessera::schema::identity_t& caller,
                        tessera::schema::token_id_t token_id);

  /// Set (or, with kNoneIdentity, revoke) the per-asset approved spender.
  operation_result approve(const tessera::schema::identity_t& caller,
                           const tessera::schema::identity_t& spender,
                           tessera::schema::token_id_t token_id);

  /// Grant or revoke blanket authority over all of the caller's assets.
  operation_result set_approval_for_all(
      const tessera::schema::identity_t& caller,
      const tessera::schema::identity_t& operator_id,
      bool approved);

  /// Move `token_id` from `from` to `to`.
  ///
  /// Checks run in a fixed order: existence, asserted owner, caller
  /// authority, recipient.
  operation_result transfer_from(const tessera::schema::identity_t& caller,
                                 const tessera::schema::identity_t& from,
                                 const tessera::schema::identity_t& to,
                                 tessera::schema::token_id_t token_id);

  operation_result pause_minting(const tessera::schema::identity_t& caller);
  operation_result unpause_minting(const tessera::schema::identity_t& caller);

  lookup_result<tessera::schema::identity_t> owner_of(
      tessera::schema::token_id_t token_id) const;
  lookup_result<uint64_t> balance_of(
      const tessera::schema::identity_t& owner) const;
  lookup_result<tessera::schema::identity_t> get_approved(
      tessera::schema::token_id_t token_id) const;
  bool is_approved_for_all(
      const tessera::schema::identity_t& owner,
      const tessera::schema::identity_t& operator_id) const;

  /// True when `spender` owns `token_id`, is its approved spender, or is an
  /// operator of its owner. False for a nonexistent asset.
  bool is_approved_or_owner(const tessera::schema::identity_t& spender,
                            tessera::schema::token_id_t token_id) const;

  lookup_result<std::string> token_uri(
      tessera::schema::token_id_t token_id) const;
  lookup_result<std::string> name() const;
  lookup_result<std::string> symbol() const;
  lookup_result<tessera::schema::supply_t> max_supply() const;
  lookup_result<tessera::schema::supply_t> total_supply() const;
  lookup_result<tessera::schema::collection_state_t> collection() const;

 private:
  std::optional<tessera::schema::collection_state_t> load_collection() const;
  std::optional<tessera::schema::token_state_t> load_token(
      tessera::schema::token_id_t token_id) const;
  bool is_retired(tessera::schema::token_id_t token_id) const;
  uint64_t load_balance(const tessera::schema::identity_t& owner) const;
  void store_balance(const tessera::schema::identity_t& owner,
                     uint64_t balance);
  void debit_balance(const tessera::schema::identity_t& owner);
  operation_result set_mint_paused(const tessera::schema::identity_t& caller,
                                   bool paused);

  state_journal& state_;
};

}  // namespace tessera::execution
