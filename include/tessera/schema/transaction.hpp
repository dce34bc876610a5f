#pragma once
#include <tessera/schema/approve.hpp>
#include <tessera/schema/burn.hpp>
#include <tessera/schema/create_collection.hpp>
#include <tessera/schema/mint.hpp>
#include <tessera/schema/pause_minting.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/set_approval_for_all.hpp>
#include <tessera/schema/transfer_from.hpp>
#include <tessera/schema/unpause_minting.hpp>
#include <variant>

namespace tessera::schema {

using transaction_payload_t = std::variant<create_collection_t,
                                           mint_t,
                                           burn_t,
                                           approve_t,
                                           set_approval_for_all_t,
                                           transfer_from_t,
                                           pause_minting_t,
                                           unpause_minting_t>;

template <uint16_t Version>
struct transaction;

// `signer` is the caller identity, authenticated by the environment before
// the transaction reaches the engine.
template <>
struct transaction<1> final {
  uint16_t version{1};
  identity_t signer{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace tessera::schema
