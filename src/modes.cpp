// =============================================================================
// modes.cpp - Transfer and Sync mode handlers
// =============================================================================

#include "crossnav/modes.hpp"
#include "crossnav/log.hpp"
#include <algorithm>

namespace crossnav {

namespace {

// Clear up to `amount` of positive virtual balance on the base token
int32_t clear_virtual_balance(const ModeContext& ctx, I128 amount, I128& cleared) {
    cleared = 0;
    I128 vb = ctx.ledger.get_virtual_balance(ctx.base_token);
    if (vb <= 0 || amount <= 0) return errors::OK;

    cleared = std::min(vb, amount);
    return ctx.ledger.update_virtual_balance(ctx.base_token, -cleared);
}

} // namespace

// =============================================================================
// TransferModeHandler
// =============================================================================

ModeOutcome TransferModeHandler::apply(const ModeContext& ctx) const {
    ModeOutcome outcome{errors::OK, 0, 0};

    outcome.status = clear_virtual_balance(ctx, ctx.amount_in_base, outcome.virtual_balance_cleared);
    if (outcome.status != errors::OK) return outcome;

    I128 remainder = ctx.amount_in_base - outcome.virtual_balance_cleared;
    if (remainder <= 0) return outcome;

    // Claims that arrived without local issuance, priced at the stored NAV
    I128 shares;
    if (!fp::mul_div(remainder, fp::pow10(ctx.decimals), ctx.stored_unitary_value, shares)) {
        outcome.status = errors::ARITHMETIC_OVERFLOW;
        return outcome;
    }

    outcome.status = ctx.ledger.update_virtual_supply(shares);
    if (outcome.status == errors::OK) {
        outcome.virtual_supply_minted = shares;
        log::debug("transfer", "virtual supply +" + fp::to_string(shares));
    }
    return outcome;
}

int32_t TransferModeHandler::verify(const ModeContext& ctx, const ModeOutcome& outcome,
                                    const NavResult& nav) const {
    // Baseline plus surplus: the nominal amount is fully offset
    I128 expected_net = ctx.stored_net_value + ctx.delta_in_base - outcome.virtual_balance_cleared;
    I128 expected_supply = ctx.stored_effective_supply + outcome.virtual_supply_minted;

    I128 expected_unitary;
    int32_t status = compute_unitary_value(expected_net, expected_supply, ctx.decimals,
                                           ctx.stored_unitary_value, expected_unitary);
    if (status != errors::OK) return status;

    if (nav.effective_supply != expected_supply || nav.unitary_value != expected_unitary) {
        return errors::NAV_MANIPULATION_DETECTED;
    }
    return errors::OK;
}

// =============================================================================
// SyncModeHandler
// =============================================================================

ModeOutcome SyncModeHandler::apply(const ModeContext& ctx) const {
    ModeOutcome outcome{errors::OK, 0, 0};

    if (ctx.sync_multiplier_bps > BPS_DENOMINATOR) {
        outcome.status = errors::INVALID_SYNC_MULTIPLIER;
        return outcome;
    }

    // Legacy path: everything received is organic NAV growth
    if (ctx.sync_multiplier_bps == 0) return outcome;

    I128 neutralized;
    if (!fp::mul_div(ctx.amount_in_base, ctx.sync_multiplier_bps, BPS_DENOMINATOR, neutralized)) {
        outcome.status = errors::ARITHMETIC_OVERFLOW;
        return outcome;
    }

    outcome.status = clear_virtual_balance(ctx, neutralized, outcome.virtual_balance_cleared);
    if (outcome.status == errors::OK && outcome.virtual_balance_cleared > 0) {
        log::debug("sync", "virtual balance -" + fp::to_string(outcome.virtual_balance_cleared));
    }
    return outcome;
}

int32_t SyncModeHandler::verify(const ModeContext& ctx, const ModeOutcome& outcome,
                                const NavResult& nav) const {
    I128 expected_net = ctx.stored_net_value + ctx.delta_in_base - outcome.virtual_balance_cleared;

    if (nav.net_total_value != expected_net || nav.effective_supply != ctx.stored_effective_supply) {
        return errors::NAV_MANIPULATION_DETECTED;
    }
    return errors::OK;
}

} // namespace crossnav
