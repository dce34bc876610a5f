#include <tessera/schema/key/engine_keys.hpp>

#include <boost/endian/buffers.hpp>

#include <iterator>

namespace tessera::schema::key {

namespace {

template <typename Buffer>
void append_buffer(tessera::schema::bytes_t& key, const Buffer& buffer) {
  auto data = reinterpret_cast<const uint8_t*>(buffer.data());
  key.insert(std::end(key), data, data + sizeof(Buffer));
}

void append_u64(tessera::schema::bytes_t& key, const uint64_t value) {
  append_buffer(key, boost::endian::big_uint64_buf_t{value});
}

void append_u32(tessera::schema::bytes_t& key, const uint32_t value) {
  append_buffer(key, boost::endian::big_uint32_buf_t{value});
}

void append_identity(tessera::schema::bytes_t& key,
                     const tessera::schema::identity_t& identity) {
  key.insert(std::end(key), std::begin(identity), std::end(identity));
}

}  // namespace

tessera::schema::bytes_t make_collection_key() {
  return tessera::schema::make_bytes(kCollectionKey);
}

tessera::schema::bytes_t make_token_key(
    const tessera::schema::token_id_t token_id) {
  auto key = tessera::schema::make_bytes(kTokenKeyPrefix);
  append_u64(key, token_id);
  return key;
}

tessera::schema::bytes_t make_retired_key(
    const tessera::schema::token_id_t token_id) {
  auto key = tessera::schema::make_bytes(kRetiredKeyPrefix);
  append_u64(key, token_id);
  return key;
}

tessera::schema::bytes_t make_balance_key(
    const tessera::schema::identity_t& owner) {
  auto key = tessera::schema::make_bytes(kBalanceKeyPrefix);
  append_identity(key, owner);
  return key;
}

tessera::schema::bytes_t make_operator_key(
    const tessera::schema::identity_t& owner,
    const tessera::schema::identity_t& operator_id) {
  auto key = tessera::schema::make_bytes(kOperatorKeyPrefix);
  append_identity(key, owner);
  append_identity(key, operator_id);
  return key;
}

tessera::schema::bytes_t make_event_seq_key() {
  return tessera::schema::make_bytes(kEventSeqKey);
}

tessera::schema::bytes_t make_event_key(const uint64_t event_id) {
  auto key = tessera::schema::make_bytes(kEventPrefix);
  append_u64(key, event_id);
  return key;
}

tessera::schema::bytes_t make_history_key(const uint64_t height,
                                          const uint32_t index) {
  auto key = make_history_height_prefix(height);
  append_u32(key, index);
  return key;
}

tessera::schema::bytes_t make_history_height_prefix(const uint64_t height) {
  auto key = tessera::schema::make_bytes(kHistoryPrefix);
  append_u64(key, height);
  return key;
}

}  // namespace tessera::schema::key
