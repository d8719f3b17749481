#ifndef ODIN_SOLVER_HPP
#define ODIN_SOLVER_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../common/errors.hpp"
#include "../common/monitor.hpp"
#include "../common/phase_point.hpp"

namespace Odin {
    using PhaseVectorField = std::function<PhasePoint(Time, const PhasePoint&)>;
}

namespace Odin::Solver {

    enum class MethodFamily {
        Euler,
        Midpoint,
        RungeKutta,
        BDF,
        DormandPrince,
    };

    [[nodiscard]] inline std::string to_string(MethodFamily method) {
        switch (method) {
            case MethodFamily::Euler: return "Euler";
            case MethodFamily::Midpoint: return "Midpoint";
            case MethodFamily::RungeKutta: return "RungeKutta";
            case MethodFamily::BDF: return "BDF";
            case MethodFamily::DormandPrince: return "DormandPrince";
        }
        return "UnknownMethodFamily";
    }

    struct StepControl {
        double initial_step{1e-2};
        std::optional<double> max_step{};
        // Fixed-grid methods: number of equal sub-intervals per integration. Overrides initial_step.
        std::optional<std::int64_t> steps{};
        double safety_factor{0.9};
        double rtol{1e-6};
        double atol{1e-8};
        double min_step{1e-12};
        std::int64_t max_steps{100000};
        std::int64_t fixed_point_iterations{3};

        [[nodiscard]] double effective_step() const {
            double step = initial_step;
            if (max_step) {
                step = std::min(step, *max_step);
            }
            if (!(step > 0.0)) {
                throw std::invalid_argument("Step size must be positive.");
            }
            return step;
        }
    };

    struct Descriptor {
        MethodFamily method{MethodFamily::RungeKutta};
        StepControl step_control{};
        // Raise SolverDivergenceError as soon as a step leaves the finite range.
        bool check_finite{true};
        Monitor monitor{};

        [[nodiscard]] bool is_adaptive() const noexcept {
            return method == MethodFamily::DormandPrince;
        }
    };

    struct Statistics {
        std::int64_t accepted_steps{0};
        std::int64_t rejected_steps{0};
        std::int64_t evaluations{0};
        Time final_time{0.0};
    };

    enum class StopReason { Continue, Relaxed, TimedOut };

    // Outcome of an integration whose end time is decided on the fly.
    struct DynamicalResult {
        Time time{0.0};
        PhasePoint phase_point{};
        bool relaxed{false};

        // Stopping time on relaxation, -1 when the horizon was exhausted first.
        [[nodiscard]] Time relax_time() const noexcept { return relaxed ? time : -1.0; }
    };

    // Evaluated at every accepted step boundary with the previous and the next boundary.
    using StopPredicate = std::function<StopReason(Time, const PhasePoint&, Time, const PhasePoint&)>;

    using Forward = std::function<PhasePoint(Time, Time, const PhasePoint&)>;
    using DynamicalForward = std::function<DynamicalResult(Time, const PhasePoint&)>;

    class ODESolver {
    public:
        ODESolver() = default;
        explicit ODESolver(Descriptor descriptor) : descriptor_(std::move(descriptor)) {}

        // Pushes a phase point along `field` from the first to the second time argument.
        // Either direction is allowed; equal times return the input unchanged.
        [[nodiscard]] Forward operator()(PhaseVectorField field) const;

        [[nodiscard]] inline PhasePoint integrate(const PhaseVectorField& field,
                                                  Time start_time,
                                                  Time end_time,
                                                  const PhasePoint& initial) const;

        [[nodiscard]] const Descriptor& descriptor() const noexcept { return descriptor_; }

    private:
        Descriptor descriptor_{};
    };

    class DynamicalODESolver {
    public:
        DynamicalODESolver() = default;
        explicit DynamicalODESolver(Descriptor descriptor) : descriptor_(std::move(descriptor)) {}

        [[nodiscard]] DynamicalForward operator()(PhaseVectorField field, StopPredicate stop) const;

        [[nodiscard]] inline DynamicalResult integrate(const PhaseVectorField& field,
                                                       const StopPredicate& stop,
                                                       Time start_time,
                                                       const PhasePoint& initial) const;

        [[nodiscard]] const Descriptor& descriptor() const noexcept { return descriptor_; }

    private:
        Descriptor descriptor_{};
    };

    [[nodiscard]] inline Descriptor Euler(const StepControl& step_control = {}) {
        return Descriptor{.method = MethodFamily::Euler, .step_control = step_control};
    }

    [[nodiscard]] inline Descriptor Midpoint(const StepControl& step_control = {}) {
        return Descriptor{.method = MethodFamily::Midpoint, .step_control = step_control};
    }

    [[nodiscard]] inline Descriptor RungeKutta(const StepControl& step_control = {}) {
        return Descriptor{.method = MethodFamily::RungeKutta, .step_control = step_control};
    }

    [[nodiscard]] inline Descriptor BDF(const StepControl& step_control = {}) {
        return Descriptor{.method = MethodFamily::BDF, .step_control = step_control};
    }

    [[nodiscard]] inline Descriptor DormandPrince(const StepControl& step_control = {}) {
        return Descriptor{.method = MethodFamily::DormandPrince, .step_control = step_control};
    }

}

#include "details/ode.hpp"
#include "details/dynamical.hpp"

namespace Odin::Solver {
    inline Forward ODESolver::operator()(PhaseVectorField field) const {
        if (!field) {
            throw std::invalid_argument("ODE solver requested without a phase vector field.");
        }
        return [solver = *this, field = std::move(field)](Time start_time, Time end_time, const PhasePoint& initial) {
            return solver.integrate(field, start_time, end_time, initial);
        };
    }

    inline PhasePoint ODESolver::integrate(const PhaseVectorField& field,
                                           Time start_time,
                                           Time end_time,
                                           const PhasePoint& initial) const {
        Statistics statistics{};
        PhasePoint result;
        try {
            result = descriptor_.is_adaptive()
                ? Details::integrate_adaptive(descriptor_, field, start_time, end_time, initial, statistics)
                : Details::integrate_fixed(descriptor_, field, start_time, end_time, initial, statistics);
        } catch (const SolverDivergenceError& error) {
            descriptor_.monitor.error("solver", to_string(descriptor_.method), " ", start_time, " -> ", end_time,
                                      " diverged at t = ", error.time(), " after ", statistics.accepted_steps,
                                      " accepted steps");
            throw;
        }
        descriptor_.monitor.info("solver", to_string(descriptor_.method), " ", start_time, " -> ", end_time,
                                 ": ", statistics.accepted_steps, " accepted, ", statistics.rejected_steps,
                                 " rejected, ", statistics.evaluations, " evaluations");
        return result;
    }

    inline DynamicalForward DynamicalODESolver::operator()(PhaseVectorField field, StopPredicate stop) const {
        if (!field) {
            throw std::invalid_argument("Dynamical ODE solver requested without a phase vector field.");
        }
        if (!stop) {
            throw std::invalid_argument("Dynamical ODE solver requested without a stop condition.");
        }
        return [solver = *this, field = std::move(field), stop = std::move(stop)](Time start_time, const PhasePoint& initial) {
            return solver.integrate(field, stop, start_time, initial);
        };
    }

    inline DynamicalResult DynamicalODESolver::integrate(const PhaseVectorField& field,
                                                         const StopPredicate& stop,
                                                         Time start_time,
                                                         const PhasePoint& initial) const {
        Statistics statistics{};
        DynamicalResult result;
        try {
            result = Details::integrate_until(descriptor_, field, stop, start_time, initial, statistics);
        } catch (const SolverDivergenceError& error) {
            descriptor_.monitor.error("solver", to_string(descriptor_.method), " dynamical from t = ", start_time,
                                      " diverged at t = ", error.time());
            throw;
        }
        if (!result.relaxed) {
            descriptor_.monitor.warn("solver", "dynamical integration from t = ", start_time,
                                     " stopped at t = ", result.time, " without relaxing");
        }
        descriptor_.monitor.info("solver", to_string(descriptor_.method), " dynamical ", start_time, " -> ",
                                 result.time, ": ", statistics.accepted_steps, " accepted, ",
                                 statistics.rejected_steps, " rejected");
        return result;
    }
}

#endif // ODIN_SOLVER_HPP
