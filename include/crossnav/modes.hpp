#ifndef CROSSNAV_MODES_HPP
#define CROSSNAV_MODES_HPP

#include "types.hpp"
#include "ledger.hpp"
#include "nav.hpp"

namespace crossnav {

// =============================================================================
// Mode Context / Outcome
// =============================================================================

struct ModeContext {
    SignedLedger& ledger;
    Currency base_token;
    uint8_t decimals;
    I128 stored_unitary_value;
    I128 stored_net_value;
    I128 stored_effective_supply;
    I128 amount_in_base;            // Nominal amount the caller declared
    I128 delta_in_base;             // Value actually received, surplus included
    uint32_t sync_multiplier_bps;
};

struct ModeOutcome {
    int32_t status;
    I128 virtual_balance_cleared;   // Removed from virtualBalance(base)
    I128 virtual_supply_minted;     // Added to virtualSupply
};

// =============================================================================
// Mode Handler Interface
// =============================================================================

class IModeHandler {
public:
    virtual ~IModeHandler() = default;

    virtual const char* name() const = 0;

    // Apply the virtual ledger changes for one received delivery
    virtual ModeOutcome apply(const ModeContext& ctx) const = 0;

    // Check the recomputed NAV against what apply() promised
    virtual int32_t verify(const ModeContext& ctx, const ModeOutcome& outcome,
                           const NavResult& nav) const = 0;
};

// =============================================================================
// TransferModeHandler - NAV-Neutral Relocation
// =============================================================================
//
// The nominal amount first cancels a positive virtual balance of the base
// token; whatever is left is issued as virtual supply at the stored NAV.
// Solver surplus is never neutralized and raises NAV.

class TransferModeHandler : public IModeHandler {
public:
    const char* name() const override { return "Transfer"; }
    ModeOutcome apply(const ModeContext& ctx) const override;
    int32_t verify(const ModeContext& ctx, const ModeOutcome& outcome,
                   const NavResult& nav) const override;
};

// =============================================================================
// SyncModeHandler - Bounded NAV Change (also serves Rebalance)
// =============================================================================
//
// syncMultiplier/10000 of the nominal amount clears positive virtual
// balance; the rest raises NAV. Virtual supply is never touched.

class SyncModeHandler : public IModeHandler {
public:
    const char* name() const override { return "Sync"; }
    ModeOutcome apply(const ModeContext& ctx) const override;
    int32_t verify(const ModeContext& ctx, const ModeOutcome& outcome,
                   const NavResult& nav) const override;
};

} // namespace crossnav

#endif // CROSSNAV_MODES_HPP
