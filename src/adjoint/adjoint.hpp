#ifndef ODIN_ADJOINT_HPP
#define ODIN_ADJOINT_HPP
// Factory header: re-exports only. Implementations live under details/.

#include "details/augmented.hpp"
#include "details/reverse.hpp"
#include "details/node_function.hpp"

namespace Odin::Adjoint {
    using AugmentedView = Details::AugmentedView;
    using ReverseResult = Details::ReverseResult;
    using Backward = Details::Backward;
    using NodeFunction = Details::NodeFunction;
    using DynamicalNodeFunction = Details::DynamicalNodeFunction;

    using Details::make_augmented_dynamics;
    using Details::vector_jacobian_product;
    using Details::reverse_mode_derivative;
    using Details::get_node_function;
    using Details::get_dynamical_node_function;
}

#endif // ODIN_ADJOINT_HPP
