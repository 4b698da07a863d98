#pragma once

#include <portage/bridge/params.hpp>
#include <portage/execution/engine.hpp>
#include <portage/schema/primitives.hpp>
#include <portage/storage/rocksdb/storage.hpp>
#include <portage/testing/common.hpp>
#include <portage/testing/execution_harness.hpp>

#include <optional>
#include <utility>
#include <string>
#include <string_view>

namespace portage::testing {

class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix,
                             portage::bridge::params params = {},
                             const bool strict_crypto = false,
                             const bool install_allow_all_verifier = true)
      : db_path_{db_prefix},
        encoder_{},
        storage_{portage::storage::make_storage<
            portage::storage::rocksdb_storage_tag>(db_path_.path())},
        engine_{encoder_, storage_, std::move(params), strict_crypto} {
    if (install_allow_all_verifier) {
      engine_.set_signature_verifier(allow_all_verifier());
    }
  }

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  const std::string& db_path() const { return db_path_.path(); }

  scale_encoder_t& encoder() { return encoder_; }

  portage::storage::storage<portage::storage::rocksdb_storage_tag>& storage() {
    return storage_;
  }

  portage::execution::engine& engine() { return engine_; }

  portage::schema::hash32_t chain_id() {
    if (!chain_id_.has_value()) {
      chain_id_ = chain_id_from_engine(engine_);
    }
    return *chain_id_;
  }

  static portage::execution::signature_verifier_t allow_all_verifier() {
    return [](const portage::schema::bytes_view_t&,
              const portage::schema::signer_id_t&,
              const portage::schema::signature_t&) { return true; };
  }

 private:
  scoped_db_path db_path_;
  scale_encoder_t encoder_;
  portage::storage::storage<portage::storage::rocksdb_storage_tag> storage_;
  portage::execution::engine engine_;
  std::optional<portage::schema::hash32_t> chain_id_{std::nullopt};
};

}  // namespace portage::testing
