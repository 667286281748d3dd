// =============================================================================
// ledger.cpp - SignedLedger
// =============================================================================

#include "crossnav/ledger.hpp"

namespace crossnav {

I128 SignedLedger::get_virtual_balance(const Currency& token) const {
    auto it = virtual_balances_.find(token);
    return (it != virtual_balances_.end()) ? it->second : 0;
}

int32_t SignedLedger::update_virtual_balance(const Currency& token, I128 delta) {
    if (delta == 0) return errors::OK;

    I128 updated;
    if (!fp::checked_add(get_virtual_balance(token), delta, updated)) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    if (updated == 0) {
        virtual_balances_.erase(token);
    } else {
        virtual_balances_[token] = updated;
    }
    return errors::OK;
}

int32_t SignedLedger::update_virtual_supply(I128 delta) {
    I128 updated;
    if (!fp::checked_add(virtual_supply_, delta, updated)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    virtual_supply_ = updated;
    return errors::OK;
}

int32_t SignedLedger::total_virtual_balance(I128& out) const {
    I128 total = 0;
    for (const auto& [token, balance] : virtual_balances_) {
        if (!fp::checked_add(total, balance, total)) {
            return errors::ARITHMETIC_OVERFLOW;
        }
    }
    out = total;
    return errors::OK;
}

} // namespace crossnav
