// SPDX-License-Identifier: MIT
#include "optrisk/portfolio/position.hpp"
#include "optrisk/option/european_option.hpp"
#include "optrisk/support/optrisk_trace.h"
#include <cmath>

namespace optrisk {

double position_price(const Position& position, const MarketSnapshot& market,
                      const CalendarDate& valuation_date) {
    return position.scale() * price(position.contract, market, valuation_date);
}

Greeks position_greeks(const Position& position, const MarketSnapshot& market,
                       const CalendarDate& valuation_date) {
    return position.scale() * greeks(position.contract, market, valuation_date);
}

double portfolio_price(std::span<const Position> positions, const MarketSnapshot& market,
                       const CalendarDate& valuation_date) {
    double total = 0.0;
    for (const auto& p : positions) {
        total += position_price(p, market, valuation_date);
    }
    return total;
}

Greeks portfolio_greeks(std::span<const Position> positions, const MarketSnapshot& market,
                        const CalendarDate& valuation_date) {
    Greeks total;
    for (const auto& p : positions) {
        total += position_greeks(p, market, valuation_date);
    }
    return total;
}

double delta_hedge_shares(std::span<const Position> positions, const MarketSnapshot& market,
                          const CalendarDate& valuation_date) {
    return -portfolio_greeks(positions, market, valuation_date).delta;
}

std::expected<void, ValidationError> validate_portfolio(std::span<const Position> positions,
                                                        const MarketSnapshot& market) {
    auto market_ok = validate_market(market);
    if (!market_ok) {
        return market_ok;
    }

    for (size_t i = 0; i < positions.size(); ++i) {
        auto contract_ok = validate_contract(positions[i].contract);
        if (!contract_ok) {
            ValidationError err = contract_ok.error();
            err.index = i;
            return std::unexpected(err);
        }
        if (!std::isfinite(positions[i].quantity)) {
            OPTRISK_TRACE_VALIDATION_ERROR(OPTRISK_MODULE_PORTFOLIO,
                static_cast<int>(ValidationErrorCode::InvalidQuantity), positions[i].quantity, i);
            return std::unexpected(ValidationError(ValidationErrorCode::InvalidQuantity,
                                                   positions[i].quantity, i));
        }
    }

    return {};
}

}  // namespace optrisk
