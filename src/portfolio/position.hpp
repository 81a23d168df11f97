// SPDX-License-Identifier: MIT
/**
 * @file position.hpp
 * @brief Signed option positions and portfolio aggregation
 */

#pragma once

#include "optrisk/option/greek_types.hpp"
#include "optrisk/option/option_spec.hpp"
#include "optrisk/support/calendar_date.hpp"
#include "optrisk/support/error_types.hpp"
#include <expected>
#include <span>

namespace optrisk {

/// A holding in one option contract
///
/// quantity > 0 is long, quantity < 0 is short. The position scale is
/// quantity × contract.quantity; both factors multiply every output.
struct Position {
    OptionContract contract;
    double quantity = 1.0;

    /// Combined multiplier applied to unit price and Greeks
    double scale() const { return quantity * contract.quantity; }
};

/// Value of one position
double position_price(const Position& position, const MarketSnapshot& market,
                      const CalendarDate& valuation_date);

/// Greeks of one position, each field scaled by the position size
Greeks position_greeks(const Position& position, const MarketSnapshot& market,
                       const CalendarDate& valuation_date);

/// Sum of position values (0 for an empty portfolio)
double portfolio_price(std::span<const Position> positions, const MarketSnapshot& market,
                       const CalendarDate& valuation_date);

/// Sum of position Greeks
Greeks portfolio_greeks(std::span<const Position> positions, const MarketSnapshot& market,
                        const CalendarDate& valuation_date);

/// Shares of the underlying that zero the portfolio delta (-portfolio delta)
double delta_hedge_shares(std::span<const Position> positions, const MarketSnapshot& market,
                          const CalendarDate& valuation_date);

/// Check every contract, every position quantity and the market snapshot
///
/// On failure the error index is the offending position.
std::expected<void, ValidationError> validate_portfolio(std::span<const Position> positions,
                                                        const MarketSnapshot& market);

}  // namespace optrisk
