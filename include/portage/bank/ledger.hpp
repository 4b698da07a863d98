#pragma once

#include <portage/schema/encoding/scale/encoder.hpp>
#include <portage/schema/primitives.hpp>
#include <portage/state/store.hpp>
#include <string>
#include <string_view>

namespace portage::bank {

inline constexpr auto kNativeDenom = std::string_view{"usdc"};

/// Native balances keyed by (account, denom). The bridge is the only minter
/// and burner.
class ledger final {
 public:
  ledger(portage::schema::encoding::scale_encoder_t& encoder,
         portage::state::store& store);

  portage::schema::amount_t balance(const std::string& account) const;

  /// Mint amount to account. Returns false, leaving state untouched, if the
  /// resulting balance would not fit in 256 bits.
  bool credit(const std::string& account,
              const portage::schema::amount_t& amount);

  /// Destroy amount from account. Returns false, leaving state untouched,
  /// when the spendable balance is smaller than amount.
  bool burn(const std::string& account,
            const portage::schema::amount_t& amount);

  void set_balance(const std::string& account,
                   const portage::schema::amount_t& amount);

 private:
  portage::schema::encoding::scale_encoder_t& encoder_;
  portage::state::store& store_;
};

}  // namespace portage::bank
