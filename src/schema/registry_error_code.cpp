#include <tessera/schema/registry_error_code.hpp>

namespace tessera::schema {

std::string_view error_message(const registry_error_code code) {
  switch (code) {
    case registry_error_code::ok:
      return "ok";
    case registry_error_code::unauthorized:
      return "caller is not authorized";
    case registry_error_code::mint_paused:
      return "minting is paused";
    case registry_error_code::invalid_recipient:
      return "invalid recipient";
    case registry_error_code::id_out_of_range:
      return "token id out of range";
    case registry_error_code::already_exists:
      return "token already exists";
    case registry_error_code::supply_exhausted:
      return "max supply reached";
    case registry_error_code::nonexistent_asset:
      return "token does not exist";
    case registry_error_code::owner_mismatch:
      return "from is not the token owner";
    case registry_error_code::self_operator:
      return "cannot approve self as operator";
    case registry_error_code::collection_missing:
      return "collection has not been created";
    case registry_error_code::collection_exists:
      return "collection already created";
    case registry_error_code::invalid_configuration:
      return "max supply must be positive";
    case registry_error_code::invalid_transaction:
      return "invalid transaction";
    case registry_error_code::unsupported_transaction_version:
      return "unsupported transaction version";
  }
  return "unknown error";
}

}  // namespace tessera::schema
