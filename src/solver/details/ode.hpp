#ifndef ODIN_SOLVER_DETAILS_ODE_HPP
#define ODIN_SOLVER_DETAILS_ODE_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace Odin::Solver::Details {

    inline PhasePoint evaluate(const PhaseVectorField& field, Time time, const PhasePoint& state, Statistics& statistics) {
        ++statistics.evaluations;
        return field(time, state);
    }

    inline PhasePoint fixed_step(const Descriptor& descriptor,
                                 const PhaseVectorField& field,
                                 Time time,
                                 const PhasePoint& state,
                                 double step,
                                 Statistics& statistics) {
        switch (descriptor.method) {
            case MethodFamily::Euler: {
                return state + step * evaluate(field, time, state, statistics);
            }
            case MethodFamily::Midpoint: {
                auto k1 = evaluate(field, time, state, statistics);
                auto k2 = evaluate(field, time + 0.5 * step, state + (0.5 * step) * k1, statistics);
                return state + step * k2;
            }
            case MethodFamily::RungeKutta: {
                auto k1 = evaluate(field, time, state, statistics);
                auto k2 = evaluate(field, time + 0.5 * step, state + (0.5 * step) * k1, statistics);
                auto k3 = evaluate(field, time + 0.5 * step, state + (0.5 * step) * k2, statistics);
                auto k4 = evaluate(field, time + step, state + step * k3, statistics);
                return state + (step / 6.0) * (k1 + 2.0 * k2 + 2.0 * k3 + k4);
            }
            case MethodFamily::BDF: {
                // Implicit Euler, resolved by fixed-point refinement of an explicit predictor.
                auto current = state + step * evaluate(field, time, state, statistics);
                for (std::int64_t iteration = 0; iteration < descriptor.step_control.fixed_point_iterations; ++iteration) {
                    current = state + step * evaluate(field, time + step, current, statistics);
                }
                return current;
            }
            case MethodFamily::DormandPrince:
                throw std::invalid_argument("Dormand-Prince has no fixed-grid step; use the adaptive integrator.");
        }
        throw std::invalid_argument("Unknown ODE method family.");
    }

    struct EmbeddedStep {
        PhasePoint state;
        PhasePoint error;
    };

    // Dormand-Prince 5(4): fifth-order solution plus the embedded fourth-order error estimate.
    inline EmbeddedStep dormand_prince_step(const PhaseVectorField& field,
                                            Time time,
                                            const PhasePoint& state,
                                            double step,
                                            Statistics& statistics) {
        const double h = step;
        auto k1 = evaluate(field, time, state, statistics);
        auto k2 = evaluate(field, time + h / 5.0, state + h * ((1.0 / 5.0) * k1), statistics);
        auto k3 = evaluate(field, time + 3.0 * h / 10.0,
                           state + h * ((3.0 / 40.0) * k1 + (9.0 / 40.0) * k2), statistics);
        auto k4 = evaluate(field, time + 4.0 * h / 5.0,
                           state + h * ((44.0 / 45.0) * k1 - (56.0 / 15.0) * k2 + (32.0 / 9.0) * k3), statistics);
        auto k5 = evaluate(field, time + 8.0 * h / 9.0,
                           state + h * ((19372.0 / 6561.0) * k1 - (25360.0 / 2187.0) * k2
                                        + (64448.0 / 6561.0) * k3 - (212.0 / 729.0) * k4), statistics);
        auto k6 = evaluate(field, time + h,
                           state + h * ((9017.0 / 3168.0) * k1 - (355.0 / 33.0) * k2 + (46732.0 / 5247.0) * k3
                                        + (49.0 / 176.0) * k4 - (5103.0 / 18656.0) * k5), statistics);
        auto next = state + h * ((35.0 / 384.0) * k1 + (500.0 / 1113.0) * k3 + (125.0 / 192.0) * k4
                                 - (2187.0 / 6784.0) * k5 + (11.0 / 84.0) * k6);
        auto k7 = evaluate(field, time + h, next, statistics);
        auto error = h * ((71.0 / 57600.0) * k1 - (71.0 / 16695.0) * k3 + (71.0 / 1920.0) * k4
                          - (17253.0 / 339200.0) * k5 + (22.0 / 525.0) * k6 - (1.0 / 40.0) * k7);
        return EmbeddedStep{std::move(next), std::move(error)};
    }

    // RMS of the error scaled by atol + rtol * max(|previous|, |next|), taken over every entry.
    inline double error_norm(const PhasePoint& error,
                             const PhasePoint& previous,
                             const PhasePoint& next,
                             const StepControl& control) {
        const auto errors = error.leaves();
        const auto before = previous.leaves();
        const auto after = next.leaves();

        double sum = 0.0;
        std::int64_t count = 0;
        for (std::size_t i = 0; i < errors.size(); ++i) {
            if (errors[i].numel() == 0) {
                continue;
            }
            auto scale = control.atol + control.rtol * torch::max(before[i].abs(), after[i].abs());
            sum += (errors[i] / scale).pow(2).sum().item<double>();
            count += errors[i].numel();
        }
        return count == 0 ? 0.0 : std::sqrt(sum / static_cast<double>(count));
    }

    inline double next_step_size(double step, double norm, const StepControl& control) {
        if (!std::isfinite(norm)) {
            return step * 0.2;
        }
        if (norm == 0.0) {
            return step * 10.0;
        }
        const double factor = control.safety_factor * std::pow(norm, -0.2);
        return step * std::clamp(factor, 0.2, 10.0);
    }

    inline void require_finite(const Descriptor& descriptor, const PhasePoint& state, Time time) {
        if (descriptor.check_finite && !all_finite(state)) {
            throw SolverDivergenceError(to_string(descriptor.method) + " step produced a non-finite phase point.", time);
        }
    }

    inline PhasePoint integrate_fixed(const Descriptor& descriptor,
                                      const PhaseVectorField& field,
                                      Time start_time,
                                      Time end_time,
                                      const PhasePoint& initial,
                                      Statistics& statistics) {
        if (!field) {
            throw std::invalid_argument("ODE solver requested without a phase vector field.");
        }
        statistics.final_time = start_time;
        const double span = end_time - start_time;
        if (span == 0.0) {
            return initial;
        }

        const auto& control = descriptor.step_control;
        std::int64_t count = 0;
        if (control.steps) {
            if (*control.steps <= 0) {
                throw std::invalid_argument("Fixed-grid step count must be positive.");
            }
            count = *control.steps;
        } else {
            const double ratio = std::abs(span) / control.effective_step();
            count = std::max<std::int64_t>(1, static_cast<std::int64_t>(std::ceil(ratio * (1.0 - 1e-12))));
        }

        const double step = span / static_cast<double>(count);
        auto state = initial;
        for (std::int64_t i = 0; i < count; ++i) {
            const Time time = start_time + static_cast<double>(i) * step;
            state = fixed_step(descriptor, field, time, state, step, statistics);
            ++statistics.accepted_steps;
            require_finite(descriptor, state, time + step);
        }
        statistics.final_time = end_time;
        return state;
    }

    inline PhasePoint integrate_adaptive(const Descriptor& descriptor,
                                         const PhaseVectorField& field,
                                         Time start_time,
                                         Time end_time,
                                         const PhasePoint& initial,
                                         Statistics& statistics) {
        if (!field) {
            throw std::invalid_argument("ODE solver requested without a phase vector field.");
        }
        statistics.final_time = start_time;
        if (end_time == start_time) {
            return initial;
        }

        const auto& control = descriptor.step_control;
        const double direction = end_time > start_time ? 1.0 : -1.0;
        // Remainders below this are folded into the current step instead of taken on their own.
        const double snap = 1e-12 * std::abs(end_time - start_time);
        double magnitude = control.effective_step();
        Time time = start_time;
        auto state = initial;

        while (direction * (end_time - time) > 0.0) {
            if (statistics.accepted_steps + statistics.rejected_steps >= control.max_steps) {
                throw SolverDivergenceError("Dormand-Prince exhausted its budget of "
                                            + std::to_string(control.max_steps) + " steps.", time);
            }

            const double remaining = std::abs(end_time - time);
            double step = std::min(magnitude, remaining);
            if (control.max_step) {
                step = std::min(step, *control.max_step);
            }
            if (remaining - step <= snap) {
                step = remaining;
            }

            auto attempt = dormand_prince_step(field, time, state, direction * step, statistics);
            const double norm = error_norm(attempt.error, state, attempt.state, control);
            if (std::isfinite(norm) && norm <= 1.0) {
                time = step >= remaining ? end_time : time + direction * step;
                state = std::move(attempt.state);
                ++statistics.accepted_steps;
                require_finite(descriptor, state, time);
            } else {
                ++statistics.rejected_steps;
            }

            if (time == end_time) {
                break;
            }
            magnitude = next_step_size(step, norm, control);
            if (magnitude < control.min_step) {
                throw SolverDivergenceError("Dormand-Prince step size underflow.", time);
            }
        }
        statistics.final_time = end_time;
        return state;
    }

}

#endif // ODIN_SOLVER_DETAILS_ODE_HPP
