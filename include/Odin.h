#ifndef ODIN_LIBRARY_H
#define ODIN_LIBRARY_H

#include "../src/common/errors.hpp"
#include "../src/common/monitor.hpp"
#include "../src/common/phase_point.hpp"
#include "../src/solver/solver.hpp"
#include "../src/stop/stop.hpp"
#include "../src/adjoint/adjoint.hpp"
#include "../src/layer/layer.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Phase points and their flatten/unflatten pair (common/).
//  - Fixed-grid and adaptive ODE solvers, plus the dynamical solver driven by a
//    stop condition (solver/, stop/).
//  - Adjoint sensitivity core: augmented dynamics, reverse-mode derivative and
//    the node functions that hook it into libtorch autograd (adjoint/).
//  - ODEBlock, the torch::nn::Module wrapper around a node function (layer/).
// Everything is header-only; link against libtorch.

#endif // ODIN_LIBRARY_H
