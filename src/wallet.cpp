// =============================================================================
// wallet.cpp - MemoryWallet
// =============================================================================

#include "crossnav/wallet.hpp"
#include <mutex>

namespace crossnav {

MemoryWallet::MemoryWallet(const Currency& wrapped_native)
    : wrapped_native_(wrapped_native) {}

I128 MemoryWallet::balance_of(const Currency& token, const Address& holder) const {
    std::shared_lock lock(mutex_);
    auto it = balances_.find(BalanceKey{token, holder});
    return (it != balances_.end()) ? it->second : 0;
}

int32_t MemoryWallet::unwrap_native(const Address& holder, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    return move_locked(wrapped_native_, holder, NATIVE, holder, amount);
}

int32_t MemoryWallet::wrap_native(const Address& holder, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    return move_locked(NATIVE, holder, wrapped_native_, holder, amount);
}

int32_t MemoryWallet::mint(const Currency& token, const Address& to, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    I128& balance = balances_[BalanceKey{token, to}];
    if (!fp::checked_add(balance, amount, balance)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    return errors::OK;
}

int32_t MemoryWallet::burn(const Currency& token, const Address& from, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    auto it = balances_.find(BalanceKey{token, from});
    if (it == balances_.end() || it->second < amount) {
        return errors::BALANCE_UNDERFLOW;
    }
    it->second -= amount;
    return errors::OK;
}

int32_t MemoryWallet::transfer(const Currency& token, const Address& from,
                               const Address& to, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    return move_locked(token, from, token, to, amount);
}

int32_t MemoryWallet::move_locked(const Currency& token, const Address& from,
                                  const Currency& to_token, const Address& to, I128 amount) {
    auto it = balances_.find(BalanceKey{token, from});
    if (it == balances_.end() || it->second < amount) {
        return errors::BALANCE_UNDERFLOW;
    }
    if (token == to_token && from == to) {
        return errors::OK;
    }

    I128& source = it->second;
    I128& destination = balances_[BalanceKey{to_token, to}];
    I128 credited;
    if (!fp::checked_add(destination, amount, credited)) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    source -= amount;
    destination = credited;
    return errors::OK;
}

} // namespace crossnav
