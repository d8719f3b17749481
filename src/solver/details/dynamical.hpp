#ifndef ODIN_SOLVER_DETAILS_DYNAMICAL_HPP
#define ODIN_SOLVER_DETAILS_DYNAMICAL_HPP

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace Odin::Solver::Details {

    // Steps forward in time until `stop` fires at a step boundary. Gives up after
    // step_control.max_steps boundaries and reports the last one as not relaxed.
    inline DynamicalResult integrate_until(const Descriptor& descriptor,
                                           const PhaseVectorField& field,
                                           const StopPredicate& stop,
                                           Time start_time,
                                           const PhasePoint& initial,
                                           Statistics& statistics) {
        if (!field) {
            throw std::invalid_argument("Dynamical ODE solver requested without a phase vector field.");
        }
        if (!stop) {
            throw std::invalid_argument("Dynamical ODE solver requested without a stop condition.");
        }

        const auto& control = descriptor.step_control;
        double magnitude = control.effective_step();
        Time time = start_time;
        auto state = initial;

        while (statistics.accepted_steps + statistics.rejected_steps < control.max_steps) {
            double step = magnitude;
            PhasePoint candidate;
            if (descriptor.is_adaptive()) {
                if (control.max_step) {
                    step = std::min(step, *control.max_step);
                }
                auto attempt = dormand_prince_step(field, time, state, step, statistics);
                const double norm = error_norm(attempt.error, state, attempt.state, control);
                magnitude = next_step_size(step, norm, control);
                if (!(std::isfinite(norm) && norm <= 1.0)) {
                    ++statistics.rejected_steps;
                    if (magnitude < control.min_step) {
                        throw SolverDivergenceError("Dormand-Prince step size underflow.", time);
                    }
                    continue;
                }
                candidate = std::move(attempt.state);
            } else {
                candidate = fixed_step(descriptor, field, time, state, step, statistics);
            }

            ++statistics.accepted_steps;
            const Time next_time = time + step;
            require_finite(descriptor, candidate, next_time);

            const auto reason = stop(time, state, next_time, candidate);
            time = next_time;
            state = std::move(candidate);
            if (reason != StopReason::Continue) {
                statistics.final_time = time;
                return DynamicalResult{time, std::move(state), reason == StopReason::Relaxed};
            }
        }

        statistics.final_time = time;
        return DynamicalResult{time, std::move(state), false};
    }

}

#endif // ODIN_SOLVER_DETAILS_DYNAMICAL_HPP
