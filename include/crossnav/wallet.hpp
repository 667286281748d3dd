#ifndef CROSSNAV_WALLET_HPP
#define CROSSNAV_WALLET_HPP

#include <unordered_map>
#include <shared_mutex>

#include "types.hpp"

namespace crossnav {

// =============================================================================
// Wallet Interface (token I/O collaborator)
// =============================================================================

class IWallet {
public:
    virtual ~IWallet() = default;

    virtual I128 balance_of(const Currency& token, const Address& holder) const = 0;

    // Swap `amount` of the wrapped-native token held by `holder` for the
    // native coin, and back.
    virtual int32_t unwrap_native(const Address& holder, I128 amount) = 0;
    virtual int32_t wrap_native(const Address& holder, I128 amount) = 0;

    virtual int32_t transfer(const Currency& token, const Address& from, const Address& to,
                             I128 amount) = 0;
};

// =============================================================================
// MemoryWallet - In-Process Token Balances
// =============================================================================

class MemoryWallet : public IWallet {
public:
    explicit MemoryWallet(const Currency& wrapped_native);
    ~MemoryWallet() override = default;

    // Non-copyable
    MemoryWallet(const MemoryWallet&) = delete;
    MemoryWallet& operator=(const MemoryWallet&) = delete;

    I128 balance_of(const Currency& token, const Address& holder) const override;
    int32_t unwrap_native(const Address& holder, I128 amount) override;
    int32_t wrap_native(const Address& holder, I128 amount) override;

    // Credit tokens out of thin air (bridge fill, test seeding)
    int32_t mint(const Currency& token, const Address& to, I128 amount);
    int32_t burn(const Currency& token, const Address& from, I128 amount);
    int32_t transfer(const Currency& token, const Address& from, const Address& to,
                     I128 amount) override;

    const Currency& wrapped_native() const { return wrapped_native_; }

private:
    struct BalanceKey {
        Currency token;
        Address holder;

        bool operator==(const BalanceKey& other) const {
            return token == other.token && holder == other.holder;
        }
    };

    struct BalanceKeyHash {
        size_t operator()(const BalanceKey& key) const {
            uint64_t h = key.token.hash();
            for (auto b : key.holder) h = h * 31 + b;
            return static_cast<size_t>(h);
        }
    };

    Currency wrapped_native_;
    std::unordered_map<BalanceKey, I128, BalanceKeyHash> balances_;
    mutable std::shared_mutex mutex_;

    // Requires mutex_ held (unique)
    int32_t move_locked(const Currency& token, const Address& from,
                        const Currency& to_token, const Address& to, I128 amount);
};

} // namespace crossnav

#endif // CROSSNAV_WALLET_HPP
