#pragma once

// Rules that lift generic convolution, pooling and softmax nodes onto the
// accelerated operators and then tidy the result.
//
//   pass          prio  rules
//   gpu_seq          0  NoDnnRaise (global, tag cudnn only)
//   canonicalize    10  constant_folding
//   conv_lift       20  local_conv_dnn
//   conv_lift       30  local_conv_dnn_alternative
//   dnn_lift        40  pool, pool grad, softmax, softmax grad, log softmax
//   dnn_fusion      50  alpha and output merges of the three conv kinds
//   inplace         70  in-place conversion of the three conv kinds
//
// Every dnn rule declines while the gate reports the backend unavailable.

#include "dnnlift/config.hpp"
#include "dnnlift/opt/equilibrium.hpp"
#include "dnnlift/opt/rule_registry.hpp"

namespace dnnlift {
namespace opt {

RuleRegistry make_dnn_registry();

// fast_run, plus cudnn when acceleration was explicitly requested; cudnn
// is excluded when it was explicitly disabled
RuleQuery default_query(const DnnConfig &config);

// make_dnn_registry() + default_query(gate.config()) through an
// EquilibriumRewriter
RewriteStats optimize(graph::FunctionGraph &graph,
                      const backends::AvailabilityGate &gate);

} // namespace opt
} // namespace dnnlift
