#ifndef ODIN_ADJOINT_DETAILS_REVERSE_HPP
#define ODIN_ADJOINT_DETAILS_REVERSE_HPP

#include <functional>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "augmented.hpp"

namespace Odin::Adjoint::Details {

    struct ReverseResult {
        // z(t0), recovered by integrating the state backwards alongside the adjoint.
        PhasePoint initial_state;
        // dL/dz(t0)
        PhasePoint initial_loss_gradient;
        // dL/dtheta_i, in the order of the parameter list.
        std::vector<torch::Tensor> parameter_gradients;
    };

    // (start_time, end_time, z(t1), dL/dz(t1)) -> ReverseResult
    using Backward = std::function<ReverseResult(Time, Time, const PhasePoint&, const PhasePoint&)>;

    // Adjoint sensitivity method (Chen et al. 2018, algorithm 1): a single backward solve of
    // the augmented system [z, a, dL/dtheta] from t1 down to t0.
    [[nodiscard]] inline Backward reverse_mode_derivative(const Solver::ODESolver& solver,
                                                          PhaseVectorField field,
                                                          std::vector<torch::Tensor> parameters)
    {
        auto forward = solver(make_augmented_dynamics(std::move(field), parameters));

        return [forward = std::move(forward), parameters = std::move(parameters)](Time start_time,
                                                                                  Time end_time,
                                                                                  const PhasePoint& final_state,
                                                                                  const PhasePoint& final_loss_gradient) {
            require_structure(final_loss_gradient, structure_of(final_state), "Final loss gradient");

            torch::NoGradGuard no_grad;
            std::vector<torch::Tensor> accumulators;
            accumulators.reserve(parameters.size());
            for (const auto& parameter : parameters) {
                accumulators.push_back(torch::zeros_like(parameter));
            }

            auto final_point = pack(detach(final_state), detach(final_loss_gradient), accumulators);
            auto initial_point = forward(end_time, start_time, final_point);
            auto view = unpack(initial_point, parameters.size());

            return ReverseResult{std::move(view.state), std::move(view.adjoint), std::move(view.gradients)};
        };
    }

}

#endif // ODIN_ADJOINT_DETAILS_REVERSE_HPP
