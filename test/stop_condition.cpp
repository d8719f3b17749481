#include "../include/Odin.h"
#include "support/check.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <string>

namespace {
    using Odin::PhasePoint;
    using Odin::Time;

    PhasePoint decay(Time, const PhasePoint& z) { return -z; }

    PhasePoint drift(Time, const PhasePoint& z) { return Odin::ones_like(z); }

    torch::Tensor scalar(double value) { return torch::tensor({value}, torch::kFloat64); }
}

int main()
{
    OdinTest::Suite suite{"stop_condition"};

    suite.run("exponential decay relaxes at ln(1 / relax_tol)", [&] {
        const auto stop = Odin::Stop::Relaxation(decay, {.max_time = 1.0, .relax_tol = 1e-3});
        const Odin::Solver::DynamicalODESolver solver(Odin::Solver::RungeKutta({.initial_step = 1e-2}));
        const auto result = solver(decay, stop)(0.0, PhasePoint(scalar(1.0)));

        suite.expect(result.relaxed, "relaxed before the step budget ran out");
        suite.expect_near(result.relax_time(), std::log(1000.0), 0.02, "relaxation time");
        suite.expect(std::abs(result.phase_point.tensor().item<double>()) < 1e-3, "state below tolerance at the stopping time");
    });

    suite.run("adaptive stepping relaxes as well", [&] {
        const auto stop = Odin::Stop::Relaxation(decay, {.max_time = 1.0, .relax_tol = 1e-3});
        const Odin::Solver::DynamicalODESolver solver(Odin::Solver::DormandPrince({.max_step = 0.05}));
        const auto result = solver(decay, stop)(0.0, PhasePoint(scalar(1.0)));
        suite.expect(result.relaxed, "relaxed");
        suite.expect_near(result.relax_time(), std::log(1000.0), 0.06, "relaxation time");
    });

    suite.run("a step longer than max_time times out", [&] {
        const auto stop = Odin::Stop::Relaxation(decay, {.max_time = 0.01, .relax_tol = 1e-3});
        const Odin::Solver::DynamicalODESolver solver(Odin::Solver::RungeKutta({.initial_step = 0.1}));
        const auto result = solver(decay, stop)(0.0, PhasePoint(scalar(1.0)));

        suite.expect(!result.relaxed, "not relaxed");
        suite.expect(result.relax_time() == -1.0, "relax_time reports -1");
        suite.expect_near(result.time, 0.1, 1e-12, "stopped after the first step");
    });

    suite.run("a step exactly max_time wide does not time out", [&] {
        const auto stop = Odin::Stop::Relaxation(decay, {.max_time = 0.01, .relax_tol = 1e-3});
        const auto x = PhasePoint(scalar(1.0));
        suite.expect(stop(0.0, x, 0.01, x) == Odin::Solver::StopReason::Continue, "equal width continues");
        suite.expect(stop(0.0, x, 0.02, x) == Odin::Solver::StopReason::TimedOut, "wider step times out");
    });

    suite.run("a non-finite field never counts as relaxed", [&] {
        const Odin::PhaseVectorField poisoned = [](Time, const PhasePoint& z) -> PhasePoint {
            return torch::full_like(z.tensor(), std::numeric_limits<double>::quiet_NaN());
        };
        const auto stop = Odin::Stop::Relaxation(poisoned, {.max_time = 1.0, .relax_tol = 1e-3});
        const auto x = PhasePoint(scalar(1.0));
        suite.expect_throws<Odin::SolverDivergenceError>([&] { (void)stop(0.0, x, 0.01, x); }, "direct evaluation");

        auto descriptor = Odin::Solver::RungeKutta({.initial_step = 1e-2});
        descriptor.check_finite = false;
        const Odin::Solver::DynamicalODESolver solver(descriptor);
        suite.expect_throws<Odin::SolverDivergenceError>([&] { (void)solver(poisoned, stop)(0.0, x); },
                                                         "dynamical integration without finiteness checks");
    });

    suite.run("timeout is checked before relaxation", [&] {
        const auto stop = Odin::Stop::Relaxation(decay, {.max_time = 0.5, .relax_tol = 10.0});
        const auto x = PhasePoint(scalar(1.0));
        suite.expect(stop(0.0, x, 1.0, x) == Odin::Solver::StopReason::TimedOut, "relaxed state over a long step");
        suite.expect(stop(0.0, x, 0.25, x) == Odin::Solver::StopReason::Relaxed, "relaxed state over a short step");

        const auto strict = Odin::Stop::Relaxation(decay, {.max_time = 0.5, .relax_tol = 1e-3});
        suite.expect(strict(0.0, x, 0.25, x) == Odin::Solver::StopReason::Continue, "moving state over a short step");
    });

    suite.run("one instance serves independent integrations", [&] {
        const auto stop = Odin::Stop::Relaxation(decay, {.max_time = 1.0, .relax_tol = 1e-3});
        const Odin::Solver::DynamicalODESolver solver(Odin::Solver::RungeKutta({.initial_step = 1e-2}));
        auto forward = solver(decay, stop);

        const auto first = forward(0.0, PhasePoint(scalar(1.0)));
        const auto second = forward(0.0, PhasePoint(scalar(2.0)));
        const auto again = forward(0.0, PhasePoint(scalar(1.0)));

        suite.expect_near(first.relax_time(), std::log(1000.0), 0.02, "first integration");
        suite.expect_near(second.relax_time(), std::log(2000.0), 0.02, "second integration");
        suite.expect(first.relax_time() == again.relax_time(), "repeating an integration repeats its outcome");
    });

    suite.run("dynamical solver gives up after max_steps", [&] {
        std::ostringstream log;
        auto descriptor = Odin::Solver::Euler({.initial_step = 1e-2, .max_steps = 50});
        descriptor.monitor = Odin::Monitor{.stream = &log, .colored = false};
        const auto stop = Odin::Stop::Relaxation(drift, {.max_time = 1.0, .relax_tol = 1e-3});
        const auto result = Odin::Solver::DynamicalODESolver(descriptor).integrate(drift, stop, 0.0, PhasePoint(scalar(0.0)));

        suite.expect(!result.relaxed, "not relaxed");
        suite.expect_near(result.time, 0.5, 1e-9, "stopped after 50 steps");
        suite.expect_near(result.phase_point.tensor().item<double>(), 0.5, 1e-9, "state carried to the last boundary");
        suite.expect(log.str().find("without relaxing") != std::string::npos, "warning logged");
    });

    suite.run("invalid stop conditions", [&] {
        suite.expect_throws<std::invalid_argument>([] { (void)Odin::Stop::Relaxation(decay, {.max_time = 0.0}); },
                                                   "non-positive max_time");
        suite.expect_throws<std::invalid_argument>([] { (void)Odin::Stop::Relaxation(decay, {.relax_tol = -1.0}); },
                                                   "negative relax_tol");
        suite.expect_throws<std::invalid_argument>([] { (void)Odin::Stop::Relaxation(Odin::PhaseVectorField{}); },
                                                   "missing field");
        suite.expect_throws<std::invalid_argument>([] {
            (void)Odin::Solver::DynamicalODESolver()(decay, Odin::Solver::StopPredicate{});
        }, "dynamical solver without a stop condition");
    });

    return suite.finish();
}
