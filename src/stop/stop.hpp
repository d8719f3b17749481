#ifndef ODIN_STOP_HPP
#define ODIN_STOP_HPP

#include <cmath>
#include <stdexcept>
#include <utility>

#include <torch/torch.h>

#include "../solver/solver.hpp"

namespace Odin::Stop {

    struct RelaxationOptions {
        // Largest admissible distance between two consecutive step boundaries. Compared
        // against the solver's step width, so a step equal to max_time never times out.
        double max_time{1.0};
        // The system counts as relaxed once max |field(t, x)| drops below this value.
        double relax_tol{1e-3};
    };

    // Halts a dynamical integration on relaxation or when a step spans more than max_time.
    // Holds no per-integration state, so one instance may serve any number of integrations;
    // the outcome is reported through Solver::DynamicalResult.
    class StopCondition {
    public:
        StopCondition(PhaseVectorField field, RelaxationOptions options)
            : field_(std::move(field)), options_(options)
        {
            if (!field_) {
                throw std::invalid_argument("Stop condition requires a phase vector field.");
            }
            if (!(options_.max_time > 0.0)) {
                throw std::invalid_argument("Stop condition max_time must be positive.");
            }
            if (options_.relax_tol < 0.0) {
                throw std::invalid_argument("Stop condition relax_tol must be non-negative.");
            }
        }

        [[nodiscard]] Solver::StopReason operator()(Time previous_time,
                                                    const PhasePoint& /*previous*/,
                                                    Time next_time,
                                                    const PhasePoint& next) const
        {
            if (next_time - previous_time > options_.max_time) {
                return Solver::StopReason::TimedOut;
            }

            torch::NoGradGuard no_grad;
            const double speed = max_abs(field_(next_time, next));
            if (!std::isfinite(speed)) {
                throw SolverDivergenceError("Stop condition evaluated a non-finite phase vector field.", next_time);
            }
            if (speed < options_.relax_tol) {
                return Solver::StopReason::Relaxed;
            }
            return Solver::StopReason::Continue;
        }

        [[nodiscard]] const RelaxationOptions& options() const noexcept { return options_; }

    private:
        PhaseVectorField field_;
        RelaxationOptions options_{};
    };

    [[nodiscard]] inline StopCondition Relaxation(PhaseVectorField field, const RelaxationOptions& options = {}) {
        return StopCondition(std::move(field), options);
    }

}

#endif // ODIN_STOP_HPP
