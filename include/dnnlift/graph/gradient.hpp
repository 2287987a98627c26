#pragma once

#include <vector>

#include "value.hpp"

namespace dnnlift {
namespace graph {

// Reverse accumulation from `output` (seeded with `seed`, which must have a
// type compatible with the output) to every value in `wrt`. Each node
// answers through its operator's grad(); contributions reaching the same
// value are summed with an elementwise add. Returns one gradient per `wrt`
// entry, null when the output does not depend on it.
//
// Dependence flows only through floating tensors and scalars along the
// inputs an operator reports as connected. Throws RuntimeError when a
// non-differentiable node lies on a dependent path.
std::vector<ValuePtr> grad(const ValuePtr &output, const ValuePtr &seed,
                           const std::vector<ValuePtr> &wrt);

} // namespace graph
} // namespace dnnlift
