#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <portage/common/critical.hpp>
#include <portage/schema/encoding/scale/encoder.hpp>
#include <portage/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace portage::storage {

namespace detail {

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

inline portage::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const portage::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline portage::schema::bytes_t encode_committed_state(
    const committed_state& state) {
  auto encoder = portage::schema::encoding::scale_encoder_t{};
  return encoder.encode(std::tuple{state.height, state.app_hash});
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const portage::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const portage::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<portage::schema::bytes_t> load(
      const portage::schema::bytes_view_t& key) const;
  std::optional<committed_state> load_committed_state() const;
  void commit(const std::vector<key_value_entry_t>& writes,
              const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const portage::schema::bytes_view_t& prefix) const;

 private:
  void require_open() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline void storage<rocksdb_storage_tag>::require_open() const {
  if (!database) {
    portage::common::critical("RocksDB database is not initialized");
  }
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const portage::schema::bytes_view_t& key) const {
  auto raw = load(key);
  if (!raw) {
    return std::nullopt;
  }
  auto decoded = encoder.template try_decode<T>(
      portage::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded) {
    portage::common::critical("failed to decode value stored in RocksDB");
  }
  return decoded;
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const portage::schema::bytes_view_t& key,
                                       const T& value) const {
  require_open();
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(portage::schema::bytes_view_t{encoded_value.data(),
                                                     encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    portage::common::critical("Failed to put value into RocksDB");
  }
}

inline std::optional<portage::schema::bytes_t>
storage<rocksdb_storage_tag>::load(
    const portage::schema::bytes_view_t& key) const {
  require_open();
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    portage::common::critical("Failed to get value from RocksDB");
  }
  return portage::schema::bytes_t(std::begin(value), std::end(value));
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = load(portage::schema::make_bytes_view(detail::kCommittedHeightKey));
  if (!raw) {
    return std::nullopt;
  }

  auto encoder = portage::schema::encoding::scale_encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, portage::schema::hash32_t>>(
          portage::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    portage::common::critical("failed to decode committed state");
  }
  auto state = committed_state{};
  state.height = std::get<0>(decoded.value());
  state.app_hash = std::get<1>(decoded.value());
  return state;
}

inline void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& writes,
    const committed_state& state) const {
  require_open();
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto put_status = batch.Put(
        detail::to_slice(portage::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            portage::schema::bytes_view_t{value.data(), value.size()}));
    if (!put_status.ok()) {
      portage::common::critical("failed staging block write");
    }
  }

  auto encoded_state = detail::encode_committed_state(state);
  auto state_status = batch.Put(
      std::string{detail::kCommittedHeightKey},
      detail::to_slice(portage::schema::bytes_view_t{encoded_state.data(),
                                                     encoded_state.size()}));
  if (!state_status.ok()) {
    portage::common::critical("failed staging committed height");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit block to RocksDB: {}",
                  write_status.ToString());
    portage::common::critical("failed to commit block");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const portage::schema::bytes_view_t& prefix) const {
  require_open();

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    portage::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace portage::storage
