#include <tessera/execution/state_journal.hpp>

#include <iterator>
#include <utility>

namespace tessera::execution {

state_journal::state_journal(const storage_t& storage) : storage_{&storage} {}

state_journal::state_journal(state_journal& parent)
    : storage_{parent.storage_}, parent_{&parent} {}

std::optional<tessera::schema::bytes_t> state_journal::get_raw(
    const tessera::schema::bytes_t& key) const {
  if (auto staged = writes_.find(key); staged != std::end(writes_)) {
    return staged->second;
  }
  if (parent_ != nullptr) {
    return parent_->get_raw(key);
  }
  return storage_->get_raw(
      tessera::schema::bytes_view_t{key.data(), key.size()});
}

void state_journal::put_raw(const tessera::schema::bytes_t& key,
                            tessera::schema::bytes_t value) {
  writes_.insert_or_assign(key, std::move(value));
}

void state_journal::erase(const tessera::schema::bytes_t& key) {
  writes_.insert_or_assign(key, std::nullopt);
}

void state_journal::commit() {
  if (parent_ != nullptr) {
    for (auto& [key, value] : writes_) {
      parent_->writes_.insert_or_assign(key, std::move(value));
    }
  } else {
    storage_->apply(write_set());
  }
  writes_.clear();
}

void state_journal::discard() {
  writes_.clear();
}

bool state_journal::empty() const {
  return writes_.empty();
}

std::size_t state_journal::size() const {
  return writes_.size();
}

tessera::storage::write_set_t state_journal::write_set() const {
  auto writes = tessera::storage::write_set_t{};
  writes.reserve(writes_.size());
  for (const auto& [key, value] : writes_) {
    writes.emplace_back(key, value);
  }
  return writes;
}

}  // namespace tessera::execution
