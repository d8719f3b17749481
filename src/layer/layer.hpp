#ifndef ODIN_LAYER_HPP
#define ODIN_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/ode_block.hpp"

namespace Odin::Layer {
    using ODEBlockOptions = Details::ODEBlockOptions;
    using ODEBlockImpl = Details::ODEBlockImpl;
    using ODEBlock = Details::ODEBlock;
}

#endif // ODIN_LAYER_HPP
