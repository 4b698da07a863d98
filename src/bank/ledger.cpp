#include <portage/bank/ledger.hpp>
#include <portage/schema/key/engine_keys.hpp>

namespace portage::bank {

ledger::ledger(portage::schema::encoding::scale_encoder_t& encoder,
               portage::state::store& store)
    : encoder_{encoder}, store_{store} {}

portage::schema::amount_t ledger::balance(const std::string& account) const {
  auto key = portage::schema::key::make_balance_key(encoder_, account,
                                                    std::string{kNativeDenom});
  return store_
      .get<portage::schema::amount_t>(
          encoder_, portage::schema::make_bytes_view(key))
      .value_or(portage::schema::amount_t{0});
}

bool ledger::credit(const std::string& account,
                    const portage::schema::amount_t& amount) {
  auto current = balance(account);
  auto next = current + amount;
  if (next < current) {
    return false;
  }
  set_balance(account, next);
  return true;
}

bool ledger::burn(const std::string& account,
                  const portage::schema::amount_t& amount) {
  auto current = balance(account);
  if (current < amount) {
    return false;
  }
  set_balance(account, current - amount);
  return true;
}

void ledger::set_balance(const std::string& account,
                         const portage::schema::amount_t& amount) {
  auto key = portage::schema::key::make_balance_key(encoder_, account,
                                                    std::string{kNativeDenom});
  store_.put(encoder_, portage::schema::make_bytes_view(key), amount);
}

}  // namespace portage::bank
