#ifndef ODIN_LAYER_DETAILS_ODE_BLOCK_HPP
#define ODIN_LAYER_DETAILS_ODE_BLOCK_HPP

#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../adjoint/adjoint.hpp"
#include "../../solver/solver.hpp"

namespace Odin::Layer::Details {

    struct ODEBlockOptions {
        Time start_time{0.0};
        Time end_time{1.0};
        Solver::Descriptor solver{Solver::RungeKutta()};
        // Call the field as field(t, z) with t as a 0-d tensor instead of field(z).
        bool time_input{false};
    };

    // Continuous-depth layer: maps x to the solution at end_time of dz/dt = field(z),
    // z(start_time) = x. Gradients reach x and the field parameters through the adjoint method.
    class ODEBlockImpl : public torch::nn::Module {
    public:
        ODEBlockImpl(torch::nn::AnyModule field, ODEBlockOptions options = {})
            : field_(std::move(field)), options_(std::move(options))
        {
            if (field_.is_empty()) {
                throw std::invalid_argument("ODE block requires a field module.");
            }
            register_module("field", field_.ptr());
        }

        torch::Tensor forward(const torch::Tensor& input)
        {
            return integrate_to(options_.end_time, input);
        }

        // Node function with a fixed start time; the end time is the caller's.
        torch::Tensor integrate_to(Time end_time, const torch::Tensor& input)
        {
            auto node = Adjoint::get_node_function(Solver::ODESolver(options_.solver), make_field(), parameters());
            return node(options_.start_time, end_time, PhasePoint(input)).tensor();
        }

        [[nodiscard]] const ODEBlockOptions& options() const noexcept { return options_; }

    private:
        PhaseVectorField make_field()
        {
            return [this](Time time, const PhasePoint& state) -> PhasePoint {
                const auto& z = state.tensor();
                if (options_.time_input) {
                    return field_.forward<torch::Tensor>(torch::scalar_tensor(time, z.options()), z);
                }
                return field_.forward<torch::Tensor>(z);
            };
        }

        torch::nn::AnyModule field_;
        ODEBlockOptions options_;
    };

    TORCH_MODULE(ODEBlock);

}

#endif // ODIN_LAYER_DETAILS_ODE_BLOCK_HPP
