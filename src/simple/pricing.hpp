// SPDX-License-Identifier: MIT
/**
 * @file pricing.hpp
 * @brief String-typed convenience layer for callers holding JSON-shaped data
 *
 * Every helper validates its input and reports failures as a readable
 * message rather than a typed error.
 */

#pragma once

#include "optrisk/option/option_spec.hpp"
#include "optrisk/portfolio/position.hpp"
#include "optrisk/support/calendar_date.hpp"
#include <expected>
#include <string>
#include <string_view>

namespace optrisk::simple {

/// "call" or "put", case-insensitive
std::expected<OptionType, std::string> parse_option_type(std::string_view text);

/// "european" or "american", case-insensitive; empty selects european
std::expected<ExerciseStyle, std::string> parse_exercise_style(std::string_view text);

/// Build and validate a contract from wire-format fields
///
/// @param symbol Underlying symbol (metadata)
/// @param type "call" or "put"
/// @param strike Strike price (> 0)
/// @param expiry ISO date, e.g. "2026-06-19"
/// @param style "european" (default) or "american"
/// @param multiplier Contract multiplier (default 1)
std::expected<OptionContract, std::string> make_contract(
    std::string_view symbol, std::string_view type, double strike,
    std::string_view expiry, std::string_view style = "european",
    double multiplier = 1.0);

/// Contract plus a signed holding quantity (default 1 = one long contract)
std::expected<Position, std::string> make_position(
    std::string_view symbol, std::string_view type, double strike,
    std::string_view expiry, double quantity = 1.0,
    std::string_view style = "european");

/// Unit price of a contract on an ISO valuation date
std::expected<double, std::string> price(const OptionContract& contract,
                                         const MarketSnapshot& market,
                                         std::string_view valuation_date);

/// Implied volatility from an observed premium on an ISO valuation date
std::expected<double, std::string> implied_vol(double market_price,
                                               const OptionContract& contract,
                                               const MarketSnapshot& market,
                                               std::string_view valuation_date);

}  // namespace optrisk::simple
