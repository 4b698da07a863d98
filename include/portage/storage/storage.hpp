#pragma once
#include <portage/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace portage::storage {

using key_value_entry_t =
    std::pair<portage::schema::bytes_t, portage::schema::bytes_t>;

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  portage::schema::hash32_t app_hash{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const portage::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const portage::schema::bytes_view_t& key,
           const T& value) const;

  /// Raw value at key, or std::nullopt when missing.
  std::optional<portage::schema::bytes_t> load(
      const portage::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint (height + app_hash).
  std::optional<committed_state> load_committed_state() const;

  /// Atomically persist a block write set together with its checkpoint.
  void commit(const std::vector<key_value_entry_t>& writes,
              const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const portage::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace portage::storage
