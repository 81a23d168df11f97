// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include <pybind11/embed.h>
#include <pybind11/stl.h>
#include <memory>
#include <vector>

namespace py = pybind11;

namespace {

class PythonBindingsTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        if (!interpreter_) {
            interpreter_ = std::make_unique<py::scoped_interpreter>();
            py::module_::import("sys").attr("path").attr("insert")(0, OPTRISK_PYTHON_MODULE_DIR);
        }
    }

    py::module_ module() const { return py::module_::import("optrisk"); }

    py::object call_contract(double strike) const {
        auto m = module();
        return m.attr("OptionContract")("AAPL", m.attr("OptionType").attr("CALL"), strike,
                                        "2026-06-19");
    }

    py::object market() const {
        return module().attr("MarketSnapshot")(100.0, 0.03, 0.25);
    }

    static inline std::unique_ptr<py::scoped_interpreter> interpreter_;
};

TEST_F(PythonBindingsTest, PriceAndImpliedVolRoundTrip) {
    auto m = module();
    auto c = call_contract(100.0);
    const double p = m.attr("price")(c, market(), "2026-01-22").cast<double>();
    EXPECT_GT(p, 0.0);

    const double iv = m.attr("implied_vol")(p, c, market(), "2026-01-22").cast<double>();
    EXPECT_NEAR(iv, 0.25, 1e-4);
}

TEST_F(PythonBindingsTest, UnattainablePriceRaisesConvergenceError) {
    auto m = module();
    try {
        m.attr("implied_vol")(150.0, call_contract(100.0), market(), "2026-01-22");
        FAIL() << "expected ConvergenceError";
    } catch (py::error_already_set& e) {
        EXPECT_TRUE(e.matches(m.attr("ConvergenceError")));
        EXPECT_TRUE(e.matches(PyExc_RuntimeError));
        EXPECT_FALSE(e.matches(PyExc_ValueError));
    }
}

TEST_F(PythonBindingsTest, ExpiredContractRaisesValueError) {
    auto m = module();
    try {
        m.attr("implied_vol")(5.0, call_contract(100.0), market(), "2026-06-19");
        FAIL() << "expected ValueError";
    } catch (py::error_already_set& e) {
        EXPECT_TRUE(e.matches(PyExc_ValueError));
        EXPECT_FALSE(e.matches(m.attr("ConvergenceError")));
    }
}

TEST_F(PythonBindingsTest, InvalidMarketRaisesValueError) {
    auto m = module();
    try {
        m.attr("MarketSnapshot")(-5.0, 0.03, 0.25);
        FAIL() << "expected ValueError";
    } catch (py::error_already_set& e) {
        EXPECT_TRUE(e.matches(PyExc_ValueError));
    }
}

TEST_F(PythonBindingsTest, SpotGridMatchesLibrary) {
    auto grid = module().attr("make_spot_grid")(185.0, 0.5, 11).cast<std::vector<double>>();
    ASSERT_EQ(grid.size(), 11u);
    EXPECT_NEAR(grid.front(), 92.5, 1e-9);
    EXPECT_NEAR(grid.back(), 277.5, 1e-9);
}

}  // namespace
