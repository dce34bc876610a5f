#include <boost/program_options.hpp>
#include <tessera/blake3/hash.hpp>
#include <tessera/common/critical.hpp>
#include <tessera/schema/encoding/scale/encoder.hpp>
#include <tessera/schema/transaction.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = tessera::schema::encoding::encoder<
    tessera::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

tessera::schema::identity_t get_identity(const po::variables_map& vm,
                                         const std::string& name) {
  if (!vm.contains(name)) {
    tessera::common::critical("missing required identity argument");
  }
  auto value = vm[name].as<std::string>();
  if (value == "none") {
    return tessera::schema::kNoneIdentity;
  }
  return tessera::schema::make_hash32(value);
}

tessera::schema::token_id_t get_token_id(const po::variables_map& vm) {
  if (!vm.contains("token-id")) {
    tessera::common::critical("missing required --token-id");
  }
  return vm["token-id"].as<uint64_t>();
}

tessera::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "create_collection") {
    return tessera::schema::create_collection_t{
        .name = vm["name"].as<std::string>(),
        .symbol = vm["symbol"].as<std::string>(),
        .base_uri = vm["base-uri"].as<std::string>(),
        .max_supply = vm["max-supply"].as<uint64_t>()};
  }
  if (payload == "mint") {
    return tessera::schema::mint_t{.to = get_identity(vm, "to"),
                                   .token_id = get_token_id(vm)};
  }
  if (payload == "burn") {
    return tessera::schema::burn_t{.token_id = get_token_id(vm)};
  }
  if (payload == "approve") {
    return tessera::schema::approve_t{.spender = get_identity(vm, "spender"),
                                      .token_id = get_token_id(vm)};
  }
  if (payload == "set_approval_for_all") {
    return tessera::schema::set_approval_for_all_t{
        .operator_id = get_identity(vm, "operator"),
        .approved = vm["approved"].as<bool>()};
  }
  if (payload == "transfer_from") {
    return tessera::schema::transfer_from_t{.from = get_identity(vm, "from"),
                                            .to = get_identity(vm, "to"),
                                            .token_id = get_token_id(vm)};
  }
  if (payload == "pause_minting") {
    return tessera::schema::pause_minting_t{};
  }
  if (payload == "unpause_minting") {
    return tessera::schema::unpause_minting_t{};
  }
  tessera::common::critical("unsupported payload type");
}

tessera::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/registry/collection" ||
      path == "/registry/name" || path == "/registry/symbol" ||
      path == "/registry/max_supply" || path == "/registry/total_supply") {
    return {};
  }
  if (path == "/registry/owner_of" || path == "/registry/get_approved" ||
      path == "/registry/token_uri") {
    return encoder.encode(get_token_id(vm));
  }
  if (path == "/registry/balance_of") {
    return encoder.encode(get_identity(vm, "owner"));
  }
  if (path == "/registry/is_approved_for_all") {
    return encoder.encode(
        std::tuple{get_identity(vm, "owner"), get_identity(vm, "operator")});
  }
  if (path == "/history/range" || path == "/events/range") {
    return encoder.encode(
        std::tuple{vm["from-id"].as<uint64_t>(), vm["to-id"].as<uint64_t>()});
  }
  tessera::common::critical("unsupported query path");
}

std::string format_output(const po::variables_map& vm,
                          const tessera::schema::bytes_t& bytes) {
  auto view = tessera::schema::bytes_view_t{bytes.data(), bytes.size()};
  auto format = vm["format"].as<std::string>();
  if (format == "hex") {
    return tessera::schema::to_hex(view);
  }
  if (format == "base64") {
    return tessera::schema::to_base64(view);
  }
  tessera::common::critical("format must be hex|base64");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  tessera_transaction_builder transaction [options]\n"
            << "  tessera_transaction_builder query-key [options]\n"
            << "  tessera_transaction_builder identity --label <text>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"tessera_transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|identity")(
      "payload", po::value<std::string>(),
      "create_collection|mint|burn|approve|set_approval_for_all|"
      "transfer_from|pause_minting|unpause_minting")(
      "path", po::value<std::string>(), "query path")(
      "format", po::value<std::string>()->default_value("base64"),
      "hex|base64")("signer", po::value<std::string>(),
                    "caller identity hash32 hex")(
      "name", po::value<std::string>()->default_value(""), "collection name")(
      "symbol", po::value<std::string>()->default_value(""),
      "collection symbol")("base-uri",
                           po::value<std::string>()->default_value(""),
                           "metadata base uri")(
      "max-supply", po::value<uint64_t>()->default_value(0),
      "collection supply ceiling")("token-id", po::value<uint64_t>(),
                                   "token id")(
      "to", po::value<std::string>(), "recipient identity hash32 hex or none")(
      "from", po::value<std::string>(), "current owner identity hash32 hex")(
      "spender", po::value<std::string>(),
      "approved spender hash32 hex or none")(
      "operator", po::value<std::string>(), "operator identity hash32 hex")(
      "owner", po::value<std::string>(), "owner identity hash32 hex")(
      "approved", po::value<bool>()->default_value(true),
      "grant (true) or revoke (false) operator")(
      "from-id", po::value<uint64_t>()->default_value(1),
      "range start (height or event id)")(
      "to-id", po::value<uint64_t>()->default_value(1),
      "range end (height or event id)")(
      "label", po::value<std::string>(), "text to derive an identity from");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      tessera::common::critical("transaction mode requires --payload");
    }
    auto transaction =
        tessera::schema::transaction_t{.version = 1,
                                       .signer = get_identity(vm, "signer"),
                                       .payload = build_payload(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << format_output(vm, encoded) << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      tessera::common::critical("query-key mode requires --path");
    }
    std::cout << format_output(vm, build_query_key(vm)) << '\n';
    return 0;
  }

  if (command == "identity") {
    if (!vm.contains("label")) {
      tessera::common::critical("identity mode requires --label");
    }
    auto identity = tessera::blake3::hash(
        std::string_view{vm["label"].as<std::string>()});
    std::cout << tessera::schema::to_hex(
                     tessera::schema::bytes_view_t{identity.data(),
                                                   identity.size()})
              << '\n';
    return 0;
  }

  tessera::common::critical("command must be transaction|query-key|identity");
}
