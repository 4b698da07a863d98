#pragma once

#include <portage/common/critical.hpp>
#include <portage/schema/primitives.hpp>
#include <portage/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace portage::state {

using write_set_t = std::map<portage::schema::bytes_t, portage::schema::bytes_t>;

/// Uncommitted view of application state.
///
/// Reads fall through a stack of write scopes to committed storage. The
/// bottom scope collects the writes of the current block and is flushed to
/// RocksDB at Commit; each transaction or block hook pushes a nested scope
/// that is either merged into its parent or discarded.
class store final {
 public:
  explicit store(
      portage::storage::storage<portage::storage::rocksdb_storage_tag>&
          storage);

  std::optional<portage::schema::bytes_t> load(
      const portage::schema::bytes_view_t& key) const;
  void save(const portage::schema::bytes_view_t& key,
            portage::schema::bytes_t value);

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const portage::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const portage::schema::bytes_view_t& key,
           const T& value);

  /// Merged committed and pending entries under prefix, in key order.
  std::vector<portage::storage::key_value_entry_t> list_by_prefix(
      const portage::schema::bytes_view_t& prefix) const;

  void begin_scope();
  void merge_scope();
  void discard_scope();
  std::size_t depth() const;

  /// Writes staged for the current block (sorted by key).
  const write_set_t& block_writes() const;
  /// Move the block's writes out and start an empty block scope.
  write_set_t take_block_writes();
  void discard_block();

  portage::storage::storage<portage::storage::rocksdb_storage_tag>& backing();

 private:
  portage::storage::storage<portage::storage::rocksdb_storage_tag>& storage_;
  std::vector<write_set_t> scopes_;
};

/// RAII write scope: discarded on destruction unless committed.
class scope final {
 public:
  explicit scope(store& store);
  ~scope();

  scope(const scope&) = delete;
  scope& operator=(const scope&) = delete;

  void commit();

 private:
  store& store_;
  bool open_{true};
};

template <typename T, typename Encoder>
std::optional<T> store::get(Encoder& encoder,
                            const portage::schema::bytes_view_t& key) const {
  auto raw = load(key);
  if (!raw) {
    return std::nullopt;
  }
  auto decoded = encoder.template try_decode<T>(
      portage::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded) {
    portage::common::critical("failed to decode staged state value");
  }
  return decoded;
}

template <typename T, typename Encoder>
void store::put(Encoder& encoder,
                const portage::schema::bytes_view_t& key,
                const T& value) {
  save(key, encoder.encode(value));
}

}  // namespace portage::state
