#ifndef CROSSNAV_LEDGER_HPP
#define CROSSNAV_LEDGER_HPP

#include <unordered_map>

#include "types.hpp"

namespace crossnav {

// =============================================================================
// SignedLedger - Virtual Balances and Virtual Supply
// =============================================================================
//
// Virtual balances are kept in base-token units for every key. A positive
// balance is value that left this chain and still counts toward NAV until
// the matching inbound transfer cancels it. Virtual supply counts shares
// whose claims were created on another chain.

class SignedLedger {
public:
    SignedLedger() = default;

    I128 get_virtual_balance(const Currency& token) const;

    // Adds delta. Returns ARITHMETIC_OVERFLOW and leaves the entry untouched
    // if the sum does not fit.
    int32_t update_virtual_balance(const Currency& token, I128 delta);

    I128 get_virtual_supply() const { return virtual_supply_; }
    int32_t update_virtual_supply(I128 delta);

    // Sum of all virtual balances (all entries share the base-token unit)
    int32_t total_virtual_balance(I128& out) const;

    const std::unordered_map<Currency, I128, CurrencyHash>& virtual_balances() const {
        return virtual_balances_;
    }

    bool empty() const { return virtual_balances_.empty() && virtual_supply_ == 0; }

private:
    // token -> signed balance; zero entries are erased
    std::unordered_map<Currency, I128, CurrencyHash> virtual_balances_;
    I128 virtual_supply_{0};
};

} // namespace crossnav

#endif // CROSSNAV_LEDGER_HPP
