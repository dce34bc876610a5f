#include <spdlog/spdlog.h>
#include <tessera/common/critical.hpp>
#include <tessera/execution/registry.hpp>
#include <tessera/schema/key/engine_keys.hpp>
#include <utility>

using namespace tessera::schema;

namespace {

tessera::execution::operation_result reject(const registry_error_code code) {
  spdlog::debug("Registry operation rejected: {}", to_string(code));
  return tessera::execution::operation_result{.code = code, .events = {}};
}

template <typename T>
tessera::execution::lookup_result<T> refuse(const registry_error_code code) {
  return tessera::execution::lookup_result<T>{.code = code, .value = T{}};
}

template <typename T>
tessera::execution::lookup_result<T> found(T value) {
  return tessera::execution::lookup_result<T>{.code = registry_error_code::ok,
                                              .value = std::move(value)};
}

std::string short_id(const identity_t& identity) {
  return to_hex(bytes_view_t{identity.data(), 4});
}

}  // namespace

namespace tessera::execution {

registry::registry(state_journal& state) : state_{state} {}

operation_result registry::create_collection(
    const identity_t& caller,
    const create_collection_t& config) {
  if (load_collection()) {
    return reject(registry_error_code::collection_exists);
  }
  if (is_none(caller)) {
    return reject(registry_error_code::invalid_recipient);
  }
  if (config.max_supply == 0) {
    return reject(registry_error_code::invalid_configuration);
  }

  state_.put(key::make_collection_key(),
             collection_state_t{.name = config.name,
                                .symbol = config.symbol,
                                .base_uri = config.base_uri,
                                .max_supply = config.max_supply,
                                .total_supply = 0,
                                .admin = caller,
                                .mint_paused = false});
  spdlog::info("Collection '{}' ({}) created with max supply {} by {}",
               config.name, config.symbol, config.max_supply,
               short_id(caller));
  return operation_result{};
}

operation_result registry::mint(const identity_t& caller,
                                const identity_t& to,
                                const token_id_t token_id) {
  auto collection = load_collection();
  if (!collection) {
    return reject(registry_error_code::collection_missing);
  }
  if (caller != collection->admin) {
    return reject(registry_error_code::unauthorized);
  }
  if (collection->mint_paused) {
    return reject(registry_error_code::mint_paused);
  }
  if (is_none(to)) {
    return reject(registry_error_code::invalid_recipient);
  }
  if (token_id < 1 || token_id > collection->max_supply) {
    return reject(registry_error_code::id_out_of_range);
  }
  if (load_token(token_id) || is_retired(token_id)) {
    return reject(registry_error_code::already_exists);
  }
  if (collection->total_supply >= collection->max_supply) {
    return reject(registry_error_code::supply_exhausted);
  }

  state_.put(key::make_token_key(token_id),
             token_state_t{.token_id = token_id,
                           .owner = to,
                           .approved = kNoneIdentity});
  store_balance(to, load_balance(to) + 1);
  ++collection->total_supply;
  state_.put(key::make_collection_key(), *collection);

  spdlog::debug("Minted token {} to {} (supply {}/{})", token_id, short_id(to),
                collection->total_supply, collection->max_supply);
  auto result = operation_result{};
  result.events.emplace_back(transfer_event_t{
      .from = kNoneIdentity, .to = to, .token_id = token_id});
  return result;
}

operation_result registry::burn(const identity_t& caller,
                                const token_id_t token_id) {
  auto collection = load_collection();
  if (!collection) {
    return reject(registry_error_code::collection_missing);
  }
  auto token = load_token(token_id);
  if (!token) {
    return reject(registry_error_code::nonexistent_asset);
  }
  if (caller != token->owner) {
    return reject(registry_error_code::unauthorized);
  }
  if (collection->total_supply == 0) {
    tessera::common::critical("registry supply counter is out of sync");
  }

  const auto owner = token->owner;
  state_.erase(key::make_token_key(token_id));
  state_.put(key::make_retired_key(token_id), true);
  debit_balance(owner);
  --collection->total_supply;
  state_.put(key::make_collection_key(), *collection);

  spdlog::debug("Burned token {} held by {} (supply {}/{})", token_id,
                short_id(owner), collection->total_supply,
                collection->max_supply);
  auto result = operation_result{};
  result.events.emplace_back(transfer_event_t{
      .from = owner, .to = kNoneIdentity, .token_id = token_id});
  return result;
}

operation_result registry::approve(const identity_t& caller,
                                   const identity_t& spender,
                                   const token_id_t token_id) {
  if (!load_collection()) {
    return reject(registry_error_code::collection_missing);
  }
  auto token = load_token(token_id);
  if (!token) {
    return reject(registry_error_code::nonexistent_asset);
  }
  if (caller != token->owner && !is_approved_for_all(token->owner, caller)) {
    return reject(registry_error_code::unauthorized);
  }

  token->approved = spender;
  state_.put(key::make_token_key(token_id), *token);

  spdlog::debug("Token {} approved spender set to {}", token_id,
                is_none(spender) ? std::string{"none"} : short_id(spender));
  auto result = operation_result{};
  result.events.emplace_back(approval_event_t{
      .owner = token->owner, .approved = spender, .token_id = token_id});
  return result;
}

operation_result registry::set_approval_for_all(const identity_t& caller,
                                                const identity_t& operator_id,
                                                const bool approved) {
  if (!load_collection()) {
    return reject(registry_error_code::collection_missing);
  }
  if (operator_id == caller) {
    return reject(registry_error_code::self_operator);
  }

  const auto operator_key = key::make_operator_key(caller, operator_id);
  if (approved) {
    state_.put(operator_key, true);
  } else {
    state_.erase(operator_key);
  }

  spdlog::debug("Operator {} {} for owner {}", short_id(operator_id),
                approved ? "granted" : "revoked", short_id(caller));
  auto result = operation_result{};
  result.events.emplace_back(approval_for_all_event_t{
      .owner = caller, .operator_id = operator_id, .approved = approved});
  return result;
}

operation_result registry::transfer_from(const identity_t& caller,
                                         const identity_t& from,
                                         const identity_t& to,
                                         const token_id_t token_id) {
  if (!load_collection()) {
    return reject(registry_error_code::collection_missing);
  }
  auto token = load_token(token_id);
  if (!token) {
    return reject(registry_error_code::nonexistent_asset);
  }
  if (token->owner != from) {
    return reject(registry_error_code::owner_mismatch);
  }
  if (!is_approved_or_owner(caller, token_id)) {
    return reject(registry_error_code::unauthorized);
  }
  if (is_none(to)) {
    return reject(registry_error_code::invalid_recipient);
  }

  // Debit before credit: with from == to the credit must observe the debit.
  debit_balance(from);
  store_balance(to, load_balance(to) + 1);
  token->owner = to;
  token->approved = kNoneIdentity;
  state_.put(key::make_token_key(token_id), *token);

  spdlog::debug("Transferred token {} from {} to {}", token_id,
                short_id(from), short_id(to));
  auto result = operation_result{};
  result.events.emplace_back(
      transfer_event_t{.from = from, .to = to, .token_id = token_id});
  return result;
}

operation_result registry::pause_minting(const identity_t& caller) {
  return set_mint_paused(caller, true);
}

operation_result registry::unpause_minting(const identity_t& caller) {
  return set_mint_paused(caller, false);
}

lookup_result<identity_t> registry::owner_of(const token_id_t token_id) const {
  if (!load_collection()) {
    return refuse<identity_t>(registry_error_code::collection_missing);
  }
  auto token = load_token(token_id);
  if (!token) {
    return refuse<identity_t>(registry_error_code::nonexistent_asset);
  }
  return found(token->owner);
}

lookup_result<uint64_t> registry::balance_of(const identity_t& owner) const {
  if (is_none(owner)) {
    return refuse<uint64_t>(registry_error_code::invalid_recipient);
  }
  return found(load_balance(owner));
}

lookup_result<identity_t> registry::get_approved(
    const token_id_t token_id) const {
  if (!load_collection()) {
    return refuse<identity_t>(registry_error_code::collection_missing);
  }
  auto token = load_token(token_id);
  if (!token) {
    return refuse<identity_t>(registry_error_code::nonexistent_asset);
  }
  return found(token->approved);
}

bool registry::is_approved_for_all(const identity_t& owner,
                                   const identity_t& operator_id) const {
  return state_.get<bool>(key::make_operator_key(owner, operator_id))
      .value_or(false);
}

bool registry::is_approved_or_owner(const identity_t& spender,
                                    const token_id_t token_id) const {
  auto token = load_token(token_id);
  if (!token) {
    return false;
  }
  return spender == token->owner ||
         (!is_none(token->approved) && spender == token->approved) ||
         is_approved_for_all(token->owner, spender);
}

lookup_result<std::string> registry::token_uri(
    const token_id_t token_id) const {
  auto collection = load_collection();
  if (!collection) {
    return refuse<std::string>(registry_error_code::collection_missing);
  }
  if (!load_token(token_id)) {
    return refuse<std::string>(registry_error_code::nonexistent_asset);
  }
  return found(collection->base_uri + to_decimal(token_id));
}

lookup_result<std::string> registry::name() const {
  auto collection = load_collection();
  if (!collection) {
    return refuse<std::string>(registry_error_code::collection_missing);
  }
  return found(collection->name);
}

lookup_result<std::string> registry::symbol() const {
  auto collection = load_collection();
  if (!collection) {
    return refuse<std::string>(registry_error_code::collection_missing);
  }
  return found(collection->symbol);
}

lookup_result<supply_t> registry::max_supply() const {
  auto collection = load_collection();
  if (!collection) {
    return refuse<supply_t>(registry_error_code::collection_missing);
  }
  return found(collection->max_supply);
}

lookup_result<supply_t> registry::total_supply() const {
  auto collection = load_collection();
  if (!collection) {
    return refuse<supply_t>(registry_error_code::collection_missing);
  }
  return found(collection->total_supply);
}

lookup_result<collection_state_t> registry::collection() const {
  auto collection = load_collection();
  if (!collection) {
    return refuse<collection_state_t>(registry_error_code::collection_missing);
  }
  return found(std::move(*collection));
}

std::optional<collection_state_t> registry::load_collection() const {
  return state_.get<collection_state_t>(key::make_collection_key());
}

std::optional<token_state_t> registry::load_token(
    const token_id_t token_id) const {
  return state_.get<token_state_t>(key::make_token_key(token_id));
}

bool registry::is_retired(const token_id_t token_id) const {
  return state_.get<bool>(key::make_retired_key(token_id)).value_or(false);
}

uint64_t registry::load_balance(const identity_t& owner) const {
  return state_.get<uint64_t>(key::make_balance_key(owner)).value_or(0);
}

void registry::debit_balance(const identity_t& owner) {
  const auto balance = load_balance(owner);
  if (balance == 0) {
    tessera::common::critical("registry balance counter is out of sync");
  }
  store_balance(owner, balance - 1);
}

void registry::store_balance(const identity_t& owner, const uint64_t balance) {
  const auto balance_key = key::make_balance_key(owner);
  if (balance == 0) {
    state_.erase(balance_key);
  } else {
    state_.put(balance_key, balance);
  }
}

operation_result registry::set_mint_paused(const identity_t& caller,
                                           const bool paused) {
  auto collection = load_collection();
  if (!collection) {
    return reject(registry_error_code::collection_missing);
  }
  if (caller != collection->admin) {
    return reject(registry_error_code::unauthorized);
  }

  collection->mint_paused = paused;
  state_.put(key::make_collection_key(), *collection);
  spdlog::info("Minting {}", paused ? "paused" : "resumed");
  return operation_result{};
}

}  // namespace tessera::execution
