// SPDX-License-Identifier: MIT
#include "optrisk/simple/pricing.hpp"
#include "optrisk/option/european_option.hpp"
#include "optrisk/option/iv_solver.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <utility>

namespace optrisk::simple {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template <typename E>
std::string describe(const E& err) {
    std::ostringstream oss;
    oss << err;
    return oss.str();
}

}  // namespace

std::expected<OptionType, std::string> parse_option_type(std::string_view text) {
    const std::string t = lowercase(text);
    if (t == "call") return OptionType::CALL;
    if (t == "put") return OptionType::PUT;
    return std::unexpected("unknown option type '" + std::string(text) +
                           "' (expected call or put)");
}

std::expected<ExerciseStyle, std::string> parse_exercise_style(std::string_view text) {
    const std::string s = lowercase(text);
    if (s.empty() || s == "european") return ExerciseStyle::EUROPEAN;
    if (s == "american") return ExerciseStyle::AMERICAN;
    return std::unexpected("unknown exercise style '" + std::string(text) +
                           "' (expected european or american)");
}

std::expected<OptionContract, std::string> make_contract(
    std::string_view symbol, std::string_view type, double strike,
    std::string_view expiry, std::string_view style, double multiplier)
{
    auto option_type = parse_option_type(type);
    if (!option_type) {
        return std::unexpected(option_type.error());
    }
    auto exercise = parse_exercise_style(style);
    if (!exercise) {
        return std::unexpected(exercise.error());
    }
    auto expiry_date = CalendarDate::parse(expiry);
    if (!expiry_date) {
        return std::unexpected("invalid expiry: " + expiry_date.error());
    }

    OptionContract contract{
        .symbol = std::string(symbol),
        .type = *option_type,
        .style = *exercise,
        .strike = strike,
        .expiry = *expiry_date,
        .quantity = multiplier,
    };

    auto ok = validate_contract(contract);
    if (!ok) {
        return std::unexpected(describe(ok.error()));
    }
    return contract;
}

std::expected<Position, std::string> make_position(
    std::string_view symbol, std::string_view type, double strike,
    std::string_view expiry, double quantity, std::string_view style)
{
    auto contract = make_contract(symbol, type, strike, expiry, style);
    if (!contract) {
        return std::unexpected(contract.error());
    }
    if (!std::isfinite(quantity)) {
        return std::unexpected(describe(ValidationError(ValidationErrorCode::InvalidQuantity,
                                                        quantity)));
    }
    return Position{.contract = std::move(*contract), .quantity = quantity};
}

std::expected<double, std::string> price(const OptionContract& contract,
                                         const MarketSnapshot& market,
                                         std::string_view valuation_date)
{
    auto date = CalendarDate::parse(valuation_date);
    if (!date) {
        return std::unexpected("invalid valuation date: " + date.error());
    }
    if (auto ok = validate_contract(contract); !ok) {
        return std::unexpected(describe(ok.error()));
    }
    if (auto ok = validate_market(market); !ok) {
        return std::unexpected(describe(ok.error()));
    }
    return optrisk::price(contract, market, *date);
}

std::expected<double, std::string> implied_vol(double market_price,
                                               const OptionContract& contract,
                                               const MarketSnapshot& market,
                                               std::string_view valuation_date)
{
    auto date = CalendarDate::parse(valuation_date);
    if (!date) {
        return std::unexpected("invalid valuation date: " + date.error());
    }
    if (auto ok = validate_contract(contract); !ok) {
        return std::unexpected(describe(ok.error()));
    }

    auto result = optrisk::implied_vol(market_price, contract, market, *date);
    if (!result) {
        return std::unexpected(describe(result.error()));
    }
    return result->implied_vol;
}

}  // namespace optrisk::simple
