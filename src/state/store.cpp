#include <portage/state/store.hpp>

#include <algorithm>
#include <iterator>
#include <ranges>

namespace portage::state {

namespace {

bool has_prefix(const portage::schema::bytes_t& key,
                const portage::schema::bytes_view_t& prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
}

}  // namespace

store::store(
    portage::storage::storage<portage::storage::rocksdb_storage_tag>& storage)
    : storage_{storage}, scopes_(1) {}

std::optional<portage::schema::bytes_t> store::load(
    const portage::schema::bytes_view_t& key) const {
  auto lookup = portage::schema::make_bytes(key);
  for (const auto& scope : std::views::reverse(scopes_)) {
    if (auto it = scope.find(lookup); it != std::end(scope)) {
      return it->second;
    }
  }
  return storage_.load(key);
}

void store::save(const portage::schema::bytes_view_t& key,
                 portage::schema::bytes_t value) {
  scopes_.back().insert_or_assign(portage::schema::make_bytes(key),
                                  std::move(value));
}

std::vector<portage::storage::key_value_entry_t> store::list_by_prefix(
    const portage::schema::bytes_view_t& prefix) const {
  auto merged = write_set_t{};
  for (auto& [key, value] : storage_.list_by_prefix(prefix)) {
    merged.insert_or_assign(std::move(key), std::move(value));
  }
  for (const auto& scope : scopes_) {
    for (auto it = scope.lower_bound(portage::schema::make_bytes(prefix));
         it != std::end(scope) && has_prefix(it->first, prefix); ++it) {
      merged.insert_or_assign(it->first, it->second);
    }
  }
  auto entries = std::vector<portage::storage::key_value_entry_t>{};
  entries.reserve(merged.size());
  for (auto& [key, value] : merged) {
    entries.emplace_back(key, std::move(value));
  }
  return entries;
}

void store::begin_scope() {
  scopes_.emplace_back();
}

void store::merge_scope() {
  if (scopes_.size() < 2) {
    portage::common::critical("merge of block scope requested");
  }
  auto top = std::move(scopes_.back());
  scopes_.pop_back();
  for (auto& [key, value] : top) {
    scopes_.back().insert_or_assign(key, std::move(value));
  }
}

void store::discard_scope() {
  if (scopes_.size() < 2) {
    portage::common::critical("discard of block scope requested");
  }
  scopes_.pop_back();
}

std::size_t store::depth() const {
  return scopes_.size() - 1;
}

const write_set_t& store::block_writes() const {
  return scopes_.front();
}

write_set_t store::take_block_writes() {
  if (scopes_.size() != 1) {
    portage::common::critical("block writes taken with open write scopes");
  }
  auto writes = std::move(scopes_.front());
  scopes_.front().clear();
  return writes;
}

void store::discard_block() {
  scopes_.clear();
  scopes_.emplace_back();
}

portage::storage::storage<portage::storage::rocksdb_storage_tag>&
store::backing() {
  return storage_;
}

scope::scope(store& store) : store_{store} {
  store_.begin_scope();
}

scope::~scope() {
  if (open_) {
    store_.discard_scope();
  }
}

void scope::commit() {
  if (open_) {
    store_.merge_scope();
    open_ = false;
  }
}

}  // namespace portage::state
