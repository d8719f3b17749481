#ifndef ODIN_ADJOINT_DETAILS_NODE_FUNCTION_HPP
#define ODIN_ADJOINT_DETAILS_NODE_FUNCTION_HPP

#include <algorithm>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>
#include <torch/csrc/autograd/function.h>
#include <torch/csrc/autograd/functions/utils.h>

#include "reverse.hpp"

namespace Odin::Adjoint::Details {

    // Everything the backward pass needs to rerun the adjoint system of one forward call.
    struct NodeRecord {
        Solver::ODESolver solver;
        PhaseVectorField field;
        std::vector<torch::Tensor> parameters;
        Time start_time{0.0};
        Time end_time{0.0};
    };

    // Backward rule of a node function. Inputs of the node are the flattened x0 leaves
    // followed by the parameters; outputs are the flattened leaves of x1.
    class NodeBackward final : public torch::autograd::Node {
    public:
        NodeBackward(NodeRecord record, Structure input_structure, Structure output_structure, std::vector<torch::Tensor> outputs)
            : record_(std::move(record)),
              input_structure_(std::move(input_structure)),
              output_structure_(std::move(output_structure)),
              outputs_(std::move(outputs)) {}

        torch::autograd::variable_list apply(torch::autograd::variable_list&& grads) override
        {
            if (released_) {
                throw std::runtime_error("Node function backward ran twice over released outputs; "
                                         "pass retain_graph=true to the first backward call.");
            }
            if (grads.size() != outputs_.size()) {
                throw ShapeMismatchError("Node function received " + std::to_string(grads.size())
                                         + " upstream gradients for " + std::to_string(outputs_.size()) + " outputs.");
            }

            std::vector<torch::Tensor> cotangents;
            cotangents.reserve(grads.size());
            for (std::size_t i = 0; i < grads.size(); ++i) {
                cotangents.push_back(grads[i].defined() ? grads[i] : torch::zeros_like(outputs_[i]));
            }

            auto final_state = unflatten(output_structure_, outputs_);
            auto final_loss_gradient = unflatten(output_structure_, std::move(cotangents));

            const auto& monitor = record_.solver.descriptor().monitor;
            monitor.info("adjoint", "backward solve ", record_.end_time, " -> ", record_.start_time,
                         " with ", record_.parameters.size(), " parameter tensors");

            auto backward = reverse_mode_derivative(record_.solver, record_.field, record_.parameters);
            auto result = backward(record_.start_time, record_.end_time, final_state, final_loss_gradient);
            require_structure(result.initial_loss_gradient, input_structure_, "Initial loss gradient");

            auto gradients = result.initial_loss_gradient.leaves();
            gradients.insert(gradients.end(), result.parameter_gradients.begin(), result.parameter_gradients.end());
            return gradients;
        }

        std::string name() const override { return "Odin::Adjoint::NodeBackward"; }

        void release_variables() override
        {
            outputs_.clear();
            outputs_.shrink_to_fit();
            released_ = true;
        }

    private:
        NodeRecord record_;
        Structure input_structure_;
        Structure output_structure_;
        std::vector<torch::Tensor> outputs_;
        bool released_{false};
    };

    // Attaches a NodeBackward to the leaves of `output` when any input or parameter
    // requires grad; otherwise returns `output` untouched.
    [[nodiscard]] inline PhasePoint record_node(NodeRecord record,
                                                const std::vector<torch::Tensor>& input_leaves,
                                                const Structure& input_structure,
                                                const PhasePoint& output)
    {
        const auto requires_grad = [](const torch::Tensor& tensor) { return tensor.defined() && tensor.requires_grad(); };
        const bool differentiable = torch::GradMode::is_enabled()
            && (std::any_of(input_leaves.begin(), input_leaves.end(), requires_grad)
                || std::any_of(record.parameters.begin(), record.parameters.end(), requires_grad));
        if (!differentiable) {
            return output;
        }

        auto [output_leaves, output_structure] = flatten(output);
        std::vector<torch::Tensor> saved;
        saved.reserve(output_leaves.size());
        for (const auto& leaf : output_leaves) {
            if (!leaf.is_floating_point()) {
                throw std::invalid_argument("Node functions require floating point phase points.");
            }
            saved.push_back(leaf.detach());
        }

        auto edges = torch::autograd::collect_next_edges(input_leaves, record.parameters);
        auto node = std::shared_ptr<NodeBackward>(
            new NodeBackward(std::move(record), input_structure, output_structure, std::move(saved)),
            torch::autograd::deleteNode);
        node->set_next_edges(std::move(edges));
        for (const auto& leaf : output_leaves) {
            torch::autograd::set_history(leaf, node);
        }
        return unflatten(output_structure, std::move(output_leaves));
    }

    using NodeFunction = std::function<PhasePoint(Time, Time, const PhasePoint&)>;
    using DynamicalNodeFunction = std::function<Solver::DynamicalResult(Time, const PhasePoint&)>;

    // F(t0, t1, x0) = x0 + integral_{t0}^{t1} f(t, F(t0, t, x0)) dt, differentiable with respect
    // to x0 and `parameters` through the adjoint method rather than through the solver steps.
    [[nodiscard]] inline NodeFunction get_node_function(Solver::ODESolver solver,
                                                        PhaseVectorField field,
                                                        std::vector<torch::Tensor> parameters = {})
    {
        if (!field) {
            throw std::invalid_argument("Node function requested without a phase vector field.");
        }

        return [solver = std::move(solver), field = std::move(field), parameters = std::move(parameters)](
                   Time start_time, Time end_time, const PhasePoint& initial) {
            auto [input_leaves, input_structure] = flatten(initial);

            PhasePoint output;
            {
                torch::NoGradGuard no_grad;
                output = solver.integrate(field, start_time, end_time, detach(initial));
                if (start_time == end_time) {
                    output = output.map([](const torch::Tensor& leaf) { return leaf.clone(); });
                }
            }
            require_structure(output, input_structure, "Node function output");

            return record_node(NodeRecord{solver, field, parameters, start_time, end_time},
                               input_leaves, input_structure, output);
        };
    }

    // Same as get_node_function, except that the end time is wherever `stop` halts the
    // dynamical solver. The backward pass runs `solver` over [t0, stopping time] and treats
    // the stopping time as a constant.
    [[nodiscard]] inline DynamicalNodeFunction get_dynamical_node_function(Solver::DynamicalODESolver dynamical_solver,
                                                                           Solver::ODESolver solver,
                                                                           PhaseVectorField field,
                                                                           Solver::StopPredicate stop,
                                                                           std::vector<torch::Tensor> parameters = {})
    {
        if (!field) {
            throw std::invalid_argument("Dynamical node function requested without a phase vector field.");
        }
        if (!stop) {
            throw std::invalid_argument("Dynamical node function requested without a stop condition.");
        }

        return [dynamical_solver = std::move(dynamical_solver), solver = std::move(solver), field = std::move(field),
                stop = std::move(stop), parameters = std::move(parameters)](Time start_time, const PhasePoint& initial) {
            auto [input_leaves, input_structure] = flatten(initial);

            Solver::DynamicalResult result;
            {
                torch::NoGradGuard no_grad;
                result = dynamical_solver.integrate(field, stop, start_time, detach(initial));
            }
            require_structure(result.phase_point, input_structure, "Dynamical node function output");

            result.phase_point = record_node(NodeRecord{solver, field, parameters, start_time, result.time},
                                             input_leaves, input_structure, result.phase_point);
            return result;
        };
    }

}

#endif // ODIN_ADJOINT_DETAILS_NODE_FUNCTION_HPP
