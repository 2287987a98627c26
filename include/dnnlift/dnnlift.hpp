#pragma once

// Core
#include "dnnlift/config.hpp"
#include "dnnlift/debug.hpp"
#include "dnnlift/dtype.hpp"
#include "dnnlift/error.hpp"
#include "dnnlift/host_tensor.hpp"
#include "dnnlift/shape.hpp"

// Graph layer
#include "dnnlift/graph/compiled_function.hpp"
#include "dnnlift/graph/exec_context.hpp"
#include "dnnlift/graph/fnv.hpp"
#include "dnnlift/graph/function_graph.hpp"
#include "dnnlift/graph/gradient.hpp"
#include "dnnlift/graph/graph_cache.hpp"
#include "dnnlift/graph/graph_node.hpp"
#include "dnnlift/graph/graph_signature.hpp"
#include "dnnlift/graph/op_traits.hpp"
#include "dnnlift/graph/operator.hpp"
#include "dnnlift/graph/value.hpp"

// Generic operators
#include "dnnlift/ops/nn_ops.hpp"
#include "dnnlift/ops/tensor_ops.hpp"

// Backends
#include "dnnlift/backends/availability_gate.hpp"
#include "dnnlift/backends/backend.hpp"
#include "dnnlift/backends/probes.hpp"
#include "dnnlift/backends/reference_backend.hpp"
#include "dnnlift/backends/versions.hpp"

// Accelerated operators
#include "dnnlift/dnn/conv_ops.hpp"
#include "dnnlift/dnn/descriptors.hpp"
#include "dnnlift/dnn/dnn.hpp"
#include "dnnlift/dnn/dnn_types.hpp"
#include "dnnlift/dnn/pool_ops.hpp"
#include "dnnlift/dnn/softmax_ops.hpp"

// Rewriting
#include "dnnlift/opt/constant_folding.hpp"
#include "dnnlift/opt/dnn_rules.hpp"
#include "dnnlift/opt/equilibrium.hpp"
#include "dnnlift/opt/rewrite_rule.hpp"
#include "dnnlift/opt/rule_registry.hpp"
