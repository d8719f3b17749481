#ifndef ODIN_ADJOINT_DETAILS_AUGMENTED_HPP
#define ODIN_ADJOINT_DETAILS_AUGMENTED_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../common/phase_point.hpp"
#include "../../solver/solver.hpp"

namespace Odin::Adjoint::Details {

    // [state, adjoint, gradient_1, ..., gradient_k]
    struct AugmentedView {
        PhasePoint state;
        PhasePoint adjoint;
        std::vector<torch::Tensor> gradients;
    };

    [[nodiscard]] inline PhasePoint pack(PhasePoint state, PhasePoint adjoint, const std::vector<torch::Tensor>& gradients)
    {
        std::vector<PhasePoint> components;
        components.reserve(2 + gradients.size());
        components.push_back(std::move(state));
        components.push_back(std::move(adjoint));
        for (const auto& gradient : gradients) {
            components.emplace_back(gradient);
        }
        return PhasePoint::list(std::move(components));
    }

    [[nodiscard]] inline AugmentedView unpack(const PhasePoint& augmented, std::size_t parameter_count)
    {
        if (augmented.is_leaf() || augmented.size() != 2 + parameter_count) {
            throw ShapeMismatchError("Augmented phase point must hold state, adjoint and "
                                     + std::to_string(parameter_count) + " gradient accumulators.");
        }
        const auto& components = augmented.children();
        AugmentedView view{components[0], components[1], {}};
        view.gradients.reserve(parameter_count);
        for (std::size_t i = 0; i < parameter_count; ++i) {
            const auto& accumulator = components[2 + i];
            if (!accumulator.is_leaf()) {
                throw ShapeMismatchError("Gradient accumulator #" + std::to_string(i) + " must be a single tensor.");
            }
            view.gradients.push_back(accumulator.tensor());
        }
        return view;
    }

    // cotangents^T * d(outputs)/d(inputs) for every input. Inputs that do not reach the
    // outputs (or do not require grad at all) receive zeros of their own shape.
    [[nodiscard]] inline std::vector<torch::Tensor> vector_jacobian_product(const std::vector<torch::Tensor>& outputs,
                                                                            const std::vector<torch::Tensor>& inputs,
                                                                            const std::vector<torch::Tensor>& cotangents)
    {
        std::vector<torch::Tensor> products;
        products.reserve(inputs.size());
        for (const auto& input : inputs) {
            products.push_back(torch::zeros_like(input));
        }

        std::vector<torch::Tensor> connected_outputs;
        std::vector<torch::Tensor> connected_cotangents;
        for (std::size_t i = 0; i < outputs.size(); ++i) {
            if (outputs[i].requires_grad()) {
                connected_outputs.push_back(outputs[i]);
                connected_cotangents.push_back(cotangents[i]);
            }
        }

        std::vector<std::size_t> differentiable;
        std::vector<torch::Tensor> watched;
        for (std::size_t i = 0; i < inputs.size(); ++i) {
            if (inputs[i].requires_grad()) {
                differentiable.push_back(i);
                watched.push_back(inputs[i]);
            }
        }

        if (connected_outputs.empty() || watched.empty()) {
            return products;
        }

        auto gradients = torch::autograd::grad(connected_outputs,
                                               watched,
                                               connected_cotangents,
                                               /*retain_graph=*/false,
                                               /*create_graph=*/false,
                                               /*allow_unused=*/true);
        for (std::size_t j = 0; j < differentiable.size(); ++j) {
            if (gradients[j].defined()) {
                products[differentiable[j]] = gradients[j];
            }
        }
        return products;
    }

    // aug_f(t, [z, a, g...]) = [f(t, z), vjp_z(-a), vjp_theta(-a)...]
    // Negating the cotangent lets the ordinary solver run the system backwards in time.
    [[nodiscard]] inline PhaseVectorField make_augmented_dynamics(PhaseVectorField field, std::vector<torch::Tensor> parameters)
    {
        if (!field) {
            throw std::invalid_argument("Augmented dynamics requested without a phase vector field.");
        }

        return [field = std::move(field), parameters = std::move(parameters)](Time time, const PhasePoint& augmented) {
            auto view = unpack(augmented, parameters.size());
            auto [state_leaves, structure] = flatten(view.state);
            require_structure(view.adjoint, structure, "Adjoint");

            torch::AutoGradMode enable_grad(true);

            std::vector<torch::Tensor> watched;
            watched.reserve(state_leaves.size());
            for (const auto& leaf : state_leaves) {
                watched.push_back(leaf.detach().requires_grad_(true));
            }

            auto output = field(time, unflatten(structure, watched));
            auto [output_leaves, output_structure] = flatten(output);
            if (output_structure != structure) {
                throw ShapeMismatchError("Phase vector field returned " + output_structure.describe()
                                         + " for a phase point of structure " + structure.describe() + ".");
            }

            std::vector<torch::Tensor> inputs = watched;
            inputs.insert(inputs.end(), parameters.begin(), parameters.end());

            std::vector<torch::Tensor> cotangents;
            cotangents.reserve(output_leaves.size());
            for (const auto& leaf : view.adjoint.leaves()) {
                cotangents.push_back(leaf.neg());
            }

            auto products = vector_jacobian_product(output_leaves, inputs, cotangents);

            std::vector<torch::Tensor> state_products(products.begin(), products.begin() + static_cast<std::ptrdiff_t>(watched.size()));
            std::vector<torch::Tensor> parameter_products(products.begin() + static_cast<std::ptrdiff_t>(watched.size()), products.end());

            return pack(detach(output), unflatten(structure, std::move(state_products)), parameter_products);
        };
    }

}

#endif // ODIN_ADJOINT_DETAILS_AUGMENTED_HPP
