// SPDX-License-Identifier: MIT
/**
 * @file optrisk_bindings.cpp
 * @brief Python bindings for the optrisk pricing and risk engine using pybind11
 *
 * Validation failures surface as ValueError. An implied volatility solve that
 * runs and fails to converge raises optrisk.ConvergenceError, a RuntimeError
 * subclass. Dates are CalendarDate objects and convert implicitly from ISO
 * strings.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "optrisk/option/european_option.hpp"
#include "optrisk/option/iv_solver.hpp"
#include "optrisk/portfolio/position.hpp"
#include "optrisk/scenario/monte_carlo.hpp"
#include "optrisk/scenario/payoff.hpp"
#include "optrisk/scenario/scenarios.hpp"
#include "optrisk/scenario/surfaces.hpp"

namespace py = pybind11;

namespace {

// Translated to optrisk.ConvergenceError
class ConvergenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

template <typename E>
[[noreturn]] void throw_value_error(const E& err) {
    std::ostringstream oss;
    oss << err;
    throw py::value_error(oss.str());
}

// Unwrap a ValidationError-carrying result or raise ValueError
template <typename T>
T unwrap(std::expected<T, optrisk::ValidationError>&& result) {
    if (!result.has_value()) {
        throw_value_error(result.error());
    }
    return std::move(*result);
}

optrisk::CalendarDate date_from_string(const std::string& text) {
    auto parsed = optrisk::CalendarDate::parse(text);
    if (!parsed.has_value()) {
        throw py::value_error(parsed.error());
    }
    return *parsed;
}

// Grids as nested Python lists, rows = spots
py::list grid_to_list(const optrisk::Grid2D& grid) {
    py::list rows;
    for (size_t i = 0; i < grid.rows(); ++i) {
        auto r = grid.row(i);
        rows.append(py::cast(std::vector<double>(r.begin(), r.end())));
    }
    return rows;
}

py::dict grids_to_dict(const optrisk::SurfaceGrids& g) {
    py::dict d;
    d["value"] = grid_to_list(g.value);
    d["delta"] = grid_to_list(g.delta);
    d["gamma"] = grid_to_list(g.gamma);
    d["vega"] = grid_to_list(g.vega);
    d["theta"] = grid_to_list(g.theta);
    d["rho"] = grid_to_list(g.rho);
    return d;
}

}  // namespace

PYBIND11_MODULE(optrisk, m) {
    m.doc() = "Python bindings for the optrisk European option pricing and risk engine";

    py::register_exception<ConvergenceError>(m, "ConvergenceError", PyExc_RuntimeError);

    py::class_<optrisk::CalendarDate>(m, "CalendarDate")
        .def(py::init(&date_from_string), py::arg("iso"))
        .def_static("from_ymd", [](int y, unsigned mo, unsigned d) {
            auto r = optrisk::CalendarDate::from_ymd(y, mo, d);
            if (!r.has_value()) {
                throw py::value_error(r.error());
            }
            return *r;
        }, py::arg("year"), py::arg("month"), py::arg("day"))
        .def("add_days", &optrisk::CalendarDate::add_days, py::arg("days"))
        .def("__str__", &optrisk::CalendarDate::to_string)
        .def("__repr__", [](const optrisk::CalendarDate& d) {
            return "<CalendarDate " + d.to_string() + ">";
        })
        .def("__eq__", [](const optrisk::CalendarDate& a, const optrisk::CalendarDate& b) {
            return a == b;
        })
        .def("__lt__", [](const optrisk::CalendarDate& a, const optrisk::CalendarDate& b) {
            return a < b;
        });
    py::implicitly_convertible<py::str, optrisk::CalendarDate>();

    py::enum_<optrisk::OptionType>(m, "OptionType")
        .value("CALL", optrisk::OptionType::CALL)
        .value("PUT", optrisk::OptionType::PUT);

    py::enum_<optrisk::ExerciseStyle>(m, "ExerciseStyle")
        .value("EUROPEAN", optrisk::ExerciseStyle::EUROPEAN)
        .value("AMERICAN", optrisk::ExerciseStyle::AMERICAN);

    py::class_<optrisk::OptionContract>(m, "OptionContract")
        .def(py::init([](std::string symbol, optrisk::OptionType type, double strike,
                         optrisk::CalendarDate expiry, optrisk::ExerciseStyle style,
                         double quantity) {
            optrisk::OptionContract c{
                .symbol = std::move(symbol),
                .type = type,
                .style = style,
                .strike = strike,
                .expiry = expiry,
                .quantity = quantity,
            };
            auto ok = optrisk::validate_contract(c);
            if (!ok.has_value()) {
                throw_value_error(ok.error());
            }
            return c;
        }), py::arg("symbol"), py::arg("type"), py::arg("strike"), py::arg("expiry"),
            py::arg("style") = optrisk::ExerciseStyle::EUROPEAN, py::arg("quantity") = 1.0)
        .def_readonly("symbol", &optrisk::OptionContract::symbol)
        .def_readonly("type", &optrisk::OptionContract::type)
        .def_readonly("style", &optrisk::OptionContract::style)
        .def_readonly("strike", &optrisk::OptionContract::strike)
        .def_readonly("expiry", &optrisk::OptionContract::expiry)
        .def_readonly("quantity", &optrisk::OptionContract::quantity);

    py::class_<optrisk::MarketSnapshot>(m, "MarketSnapshot")
        .def(py::init([](double spot, double rate, double volatility, double dividend_yield,
                         std::string timestamp) {
            optrisk::MarketSnapshot s{
                .spot = spot,
                .rate = rate,
                .dividend_yield = dividend_yield,
                .volatility = volatility,
                .timestamp = std::move(timestamp),
            };
            auto ok = optrisk::validate_market(s);
            if (!ok.has_value()) {
                throw_value_error(ok.error());
            }
            return s;
        }), py::arg("spot"), py::arg("rate"), py::arg("volatility"),
            py::arg("dividend_yield") = 0.0, py::arg("timestamp") = "")
        .def_readonly("spot", &optrisk::MarketSnapshot::spot)
        .def_readonly("rate", &optrisk::MarketSnapshot::rate)
        .def_readonly("dividend_yield", &optrisk::MarketSnapshot::dividend_yield)
        .def_readonly("volatility", &optrisk::MarketSnapshot::volatility)
        .def_readonly("timestamp", &optrisk::MarketSnapshot::timestamp)
        .def("with_spot", &optrisk::MarketSnapshot::with_spot, py::arg("spot"))
        .def("with_volatility", &optrisk::MarketSnapshot::with_volatility, py::arg("volatility"));

    py::class_<optrisk::Greeks>(m, "Greeks")
        .def(py::init<>())
        .def_readonly("delta", &optrisk::Greeks::delta)
        .def_readonly("gamma", &optrisk::Greeks::gamma)
        .def_readonly("vega", &optrisk::Greeks::vega)
        .def_readonly("theta", &optrisk::Greeks::theta)
        .def_readonly("rho", &optrisk::Greeks::rho)
        .def_readonly("d1", &optrisk::Greeks::d1)
        .def_readonly("d2", &optrisk::Greeks::d2)
        .def("__repr__", [](const optrisk::Greeks& g) {
            return "<Greeks delta=" + std::to_string(g.delta) +
                   " gamma=" + std::to_string(g.gamma) +
                   " vega=" + std::to_string(g.vega) +
                   " theta=" + std::to_string(g.theta) +
                   " rho=" + std::to_string(g.rho) + ">";
        });

    py::class_<optrisk::Position>(m, "Position")
        .def(py::init([](optrisk::OptionContract contract, double quantity) {
            return optrisk::Position{.contract = std::move(contract), .quantity = quantity};
        }), py::arg("contract"), py::arg("quantity") = 1.0)
        .def_readonly("contract", &optrisk::Position::contract)
        .def_readonly("quantity", &optrisk::Position::quantity);

    // Single-contract valuation
    m.def("price", [](const optrisk::OptionContract& c, const optrisk::MarketSnapshot& mk,
                      const optrisk::CalendarDate& d) {
        return optrisk::price(c, mk, d);
    }, py::arg("contract"), py::arg("market"), py::arg("valuation_date"));

    m.def("greeks", [](const optrisk::OptionContract& c, const optrisk::MarketSnapshot& mk,
                       const optrisk::CalendarDate& d) {
        return optrisk::greeks(c, mk, d);
    }, py::arg("contract"), py::arg("market"), py::arg("valuation_date"));

    py::enum_<optrisk::IVErrorCode>(m, "IVErrorCode")
        .value("NonPositiveMarketPrice", optrisk::IVErrorCode::NonPositiveMarketPrice)
        .value("ExpiredOption", optrisk::IVErrorCode::ExpiredOption)
        .value("InvalidInput", optrisk::IVErrorCode::InvalidInput)
        .value("MaxIterationsExceeded", optrisk::IVErrorCode::MaxIterationsExceeded);

    py::class_<optrisk::IVConfig>(m, "IVConfig")
        .def(py::init<>())
        .def_readwrite("initial_guess", &optrisk::IVConfig::initial_guess)
        .def_readwrite("tolerance", &optrisk::IVConfig::tolerance)
        .def_readwrite("max_iter", &optrisk::IVConfig::max_iter)
        .def_readwrite("bisection_low", &optrisk::IVConfig::bisection_low)
        .def_readwrite("bisection_high", &optrisk::IVConfig::bisection_high)
        .def_readwrite("bisection_max_iter", &optrisk::IVConfig::bisection_max_iter);

    // Returns the implied vol. Rejected input raises ValueError, a solve that
    // does not converge raises ConvergenceError; both carry the IVError text.
    m.def("implied_vol", [](double market_price, const optrisk::OptionContract& c,
                            const optrisk::MarketSnapshot& mk, const optrisk::CalendarDate& d,
                            const optrisk::IVConfig& config) {
        auto r = optrisk::implied_vol(market_price, c, mk, d, config);
        if (!r.has_value()) {
            if (optrisk::is_convergence_failure(r.error().code)) {
                std::ostringstream oss;
                oss << r.error();
                throw ConvergenceError(oss.str());
            }
            throw_value_error(r.error());
        }
        return r->implied_vol;
    }, py::arg("market_price"), py::arg("contract"), py::arg("market"),
       py::arg("valuation_date"), py::arg("config") = optrisk::IVConfig{});

    // Portfolio aggregation
    m.def("portfolio_price", [](const std::vector<optrisk::Position>& p,
                                const optrisk::MarketSnapshot& mk, const optrisk::CalendarDate& d) {
        return optrisk::portfolio_price(p, mk, d);
    }, py::arg("positions"), py::arg("market"), py::arg("valuation_date"));

    m.def("portfolio_greeks", [](const std::vector<optrisk::Position>& p,
                                 const optrisk::MarketSnapshot& mk, const optrisk::CalendarDate& d) {
        return optrisk::portfolio_greeks(p, mk, d);
    }, py::arg("positions"), py::arg("market"), py::arg("valuation_date"));

    m.def("delta_hedge_shares", [](const std::vector<optrisk::Position>& p,
                                   const optrisk::MarketSnapshot& mk,
                                   const optrisk::CalendarDate& d) {
        return optrisk::delta_hedge_shares(p, mk, d);
    }, py::arg("positions"), py::arg("market"), py::arg("valuation_date"));

    // Deterministic sweeps, one dict per point
    auto point_dict = [](double x, double value, const optrisk::Greeks& g) {
        py::dict d;
        d["x"] = x;
        d["value"] = value;
        d["greeks"] = g;
        return d;
    };

    m.def("spot_scenario", [point_dict](const std::vector<optrisk::Position>& p,
                                        const optrisk::MarketSnapshot& mk,
                                        const optrisk::CalendarDate& d,
                                        const std::vector<double>& spots) {
        py::list out;
        for (const auto& pt : unwrap(optrisk::spot_scenario(p, mk, d, spots))) {
            out.append(point_dict(pt.swept_value, pt.value, pt.greeks));
        }
        return out;
    }, py::arg("positions"), py::arg("market"), py::arg("valuation_date"), py::arg("spots"));

    m.def("vol_scenario", [point_dict](const std::vector<optrisk::Position>& p,
                                       const optrisk::MarketSnapshot& mk,
                                       const optrisk::CalendarDate& d,
                                       const std::vector<double>& vols) {
        py::list out;
        for (const auto& pt : unwrap(optrisk::vol_scenario(p, mk, d, vols))) {
            out.append(point_dict(pt.swept_value, pt.value, pt.greeks));
        }
        return out;
    }, py::arg("positions"), py::arg("market"), py::arg("valuation_date"), py::arg("vols"));

    m.def("time_scenario", [](const std::vector<optrisk::Position>& p,
                              const optrisk::MarketSnapshot& mk,
                              const optrisk::CalendarDate& d,
                              const std::vector<int>& days) {
        py::list out;
        for (const auto& pt : unwrap(optrisk::time_scenario(p, mk, d, days))) {
            py::dict row;
            row["days_forward"] = pt.days_forward;
            row["date"] = pt.date.to_string();
            row["value"] = pt.value;
            row["greeks"] = pt.greeks;
            out.append(row);
        }
        return out;
    }, py::arg("positions"), py::arg("market"), py::arg("valuation_date"),
       py::arg("days_forward"));

    m.def("crash_scenario", [](const std::vector<optrisk::Position>& p,
                               const optrisk::MarketSnapshot& mk,
                               const optrisk::CalendarDate& d,
                               const std::vector<double>& crashes) {
        py::list out;
        for (const auto& pt : unwrap(optrisk::crash_scenario(p, mk, d, crashes))) {
            py::dict row;
            row["crash_pct"] = pt.crash_pct;
            row["spot"] = pt.spot;
            row["value"] = pt.value;
            row["greeks"] = pt.greeks;
            out.append(row);
        }
        return out;
    }, py::arg("positions"), py::arg("market"), py::arg("valuation_date"), py::arg("crashes"));

    m.def("spot_vol_surface", [](const std::vector<optrisk::Position>& p,
                                 const optrisk::MarketSnapshot& mk,
                                 const optrisk::CalendarDate& d,
                                 const std::vector<double>& spots,
                                 const std::vector<double>& vols) {
        auto s = unwrap(optrisk::spot_vol_surface(p, mk, d, spots, vols));
        py::dict out = grids_to_dict(s.grids);
        out["spots"] = s.spots;
        out["vols"] = s.vols;
        return out;
    }, py::arg("positions"), py::arg("market"), py::arg("valuation_date"),
       py::arg("spots"), py::arg("vols"));

    m.def("spot_time_surface", [](const std::vector<optrisk::Position>& p,
                                  const optrisk::MarketSnapshot& mk,
                                  const optrisk::CalendarDate& d,
                                  const std::vector<double>& spots,
                                  const std::vector<int>& days) {
        auto s = unwrap(optrisk::spot_time_surface(p, mk, d, spots, days));
        py::dict out = grids_to_dict(s.grids);
        out["spots"] = s.spots;
        out["days_forward"] = s.days_forward;
        return out;
    }, py::arg("positions"), py::arg("market"), py::arg("valuation_date"),
       py::arg("spots"), py::arg("days_forward"));

    m.def("make_spot_grid", [](double center, double pct_range, int n, double min_spot) {
        return unwrap(optrisk::make_spot_grid(center, pct_range, n, min_spot));
    }, py::arg("spot_center"), py::arg("pct_range") = 0.5, py::arg("n") = 101,
       py::arg("min_spot") = optrisk::kMinPayoffSpot);

    m.def("payoff_scenario", [](const std::vector<optrisk::Position>& p,
                                const optrisk::MarketSnapshot& mk,
                                const optrisk::CalendarDate& today,
                                const optrisk::CalendarDate& expiry_date,
                                std::vector<double> spots,
                                bool include_value_today, bool include_greeks_today) {
        optrisk::PayoffConfig config{
            .expiry_date = expiry_date,
            .spots = std::move(spots),
            .include_value_today = include_value_today,
            .include_greeks_today = include_greeks_today,
        };
        auto r = unwrap(optrisk::payoff_scenario(p, mk, today, config));

        py::dict out;
        out["spots"] = r.spots;
        out["payoff_at_expiry"] = r.payoff_at_expiry;
        if (r.value_today) {
            out["value_today"] = *r.value_today;
        }
        if (r.greeks_today) {
            py::dict g;
            g["delta"] = r.greeks_today->delta;
            g["gamma"] = r.greeks_today->gamma;
            g["vega"] = r.greeks_today->vega;
            g["theta"] = r.greeks_today->theta;
            g["rho"] = r.greeks_today->rho;
            out["greeks_today"] = g;
        }
        py::dict assumptions;
        assumptions["rate"] = r.metadata.rate;
        assumptions["dividend_yield"] = r.metadata.dividend_yield;
        assumptions["volatility"] = r.metadata.volatility;
        assumptions["vol_model"] = r.metadata.vol_model;
        py::dict metadata;
        metadata["today"] = r.metadata.today.to_string();
        metadata["expiry_date"] = r.metadata.expiry_date.to_string();
        metadata["assumptions"] = assumptions;
        out["metadata"] = metadata;
        return out;
    }, py::arg("positions"), py::arg("market"), py::arg("today"), py::arg("expiry_date"),
       py::arg("spots"), py::arg("include_value_today") = true,
       py::arg("include_greeks_today") = false);

    m.def("monte_carlo_scenario", [](const std::vector<optrisk::Position>& p,
                                     const optrisk::MarketSnapshot& mk,
                                     const optrisk::CalendarDate& today,
                                     int horizon_days, int n_sims,
                                     std::optional<double> vol, std::optional<double> drift,
                                     std::optional<std::uint64_t> seed, bool return_samples) {
        optrisk::MonteCarloConfig config{
            .horizon_days = horizon_days,
            .n_sims = n_sims,
            .vol = vol,
            .drift = drift,
            .seed = seed,
            .return_samples = return_samples,
        };
        auto r = unwrap(optrisk::monte_carlo_scenario(p, mk, today, config));

        py::dict assumptions;
        assumptions["model"] = r.assumptions.model;
        assumptions["spot"] = r.assumptions.spot;
        assumptions["volatility"] = r.assumptions.volatility;
        assumptions["drift"] = r.assumptions.drift;
        assumptions["horizon_days"] = r.assumptions.horizon_days;
        assumptions["n_simulations"] = r.assumptions.n_simulations;
        assumptions["risk_free_rate"] = r.assumptions.risk_free_rate;
        assumptions["dividend_yield"] = r.assumptions.dividend_yield;

        py::dict summary;
        summary["mean"] = r.summary.mean;
        summary["std"] = r.summary.std;

        const auto& q = r.percentiles;
        py::dict percentiles;
        percentiles["p01"] = q.p01;
        percentiles["p05"] = q.p05;
        percentiles["p10"] = q.p10;
        percentiles["p25"] = q.p25;
        percentiles["p50"] = q.p50;
        percentiles["p75"] = q.p75;
        percentiles["p90"] = q.p90;
        percentiles["p95"] = q.p95;
        percentiles["p99"] = q.p99;

        py::dict tail;
        tail["var_95"] = r.tail_risk.var_95;
        tail["var_99"] = r.tail_risk.var_99;
        tail["cvar_95"] = r.tail_risk.cvar_95;
        tail["cvar_99"] = r.tail_risk.cvar_99;

        py::dict out;
        out["assumptions"] = assumptions;
        out["summary"] = summary;
        out["percentiles"] = percentiles;
        out["tail_risk"] = tail;
        if (r.samples) {
            out["samples"] = *r.samples;
        }
        return out;
    }, py::arg("positions"), py::arg("market"), py::arg("today"), py::arg("horizon_days"),
       py::arg("n_sims") = 10000, py::arg("vol") = py::none(), py::arg("drift") = py::none(),
       py::arg("seed") = py::none(), py::arg("return_samples") = false);
}
