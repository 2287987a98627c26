#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace dnnlift {
namespace graph {

enum class OpKind : uint8_t {
    // Generic tensor layer
    Contiguous,
    AllocEmpty,
    ShapeOf,
    ConvOutputShape,
    DimShuffle,
    Flip,
    Add,
    Sub,
    Mul,
    Div,
    Log,
    Exp,
    Conv,
    Pool,
    MaxPoolGrad,
    AveragePoolGrad,
    Softmax,
    SoftmaxGrad,
    GradUndefined,
    // Accelerated
    DnnConvDesc,
    DnnConv,
    DnnConvGradW,
    DnnConvGradI,
    DnnPoolDesc,
    DnnPool,
    DnnPoolGrad,
    DnnSoftmax,
    DnnSoftmaxGrad,
    _Count
};

struct OpTraits {
    bool infers_shape : 1;
    bool differentiable : 1;
    bool declares_aliasing : 1;
    bool selects_algorithm : 1;
    bool constant_foldable : 1;
    bool accelerated : 1;
    bool is_elementwise : 1;
};

// clang-format off
inline constexpr OpTraits OP_TRAITS[] = {
    /*Contiguous*/      {1,1,0,0,1,0,0},
    /*AllocEmpty*/      {1,0,0,0,0,0,0},
    /*ShapeOf*/         {1,0,0,0,1,0,0},
    /*ConvOutputShape*/ {1,0,0,0,1,0,0},
    /*DimShuffle*/      {1,1,0,0,1,0,0},
    /*Flip*/            {1,1,0,0,1,0,0},
    /*Add*/             {1,1,0,0,1,0,1},
    /*Sub*/             {1,1,0,0,1,0,1},
    /*Mul*/             {1,1,0,0,1,0,1},
    /*Div*/             {1,1,0,0,1,0,1},
    /*Log*/             {1,1,0,0,1,0,1},
    /*Exp*/             {1,1,0,0,1,0,1},
    /*Conv*/            {1,0,0,0,1,0,0},
    /*Pool*/            {1,1,0,0,1,0,0},
    /*MaxPoolGrad*/     {1,0,0,0,1,0,0},
    /*AveragePoolGrad*/ {1,0,0,0,1,0,0},
    /*Softmax*/         {1,1,0,0,1,0,0},
    /*SoftmaxGrad*/     {1,0,0,0,1,0,0},
    /*GradUndefined*/   {1,0,0,0,0,0,0},
    /*DnnConvDesc*/     {1,0,0,0,0,1,0},
    /*DnnConv*/         {1,1,1,1,0,1,0},
    /*DnnConvGradW*/    {1,1,1,1,0,1,0},
    /*DnnConvGradI*/    {1,1,1,1,0,1,0},
    /*DnnPoolDesc*/     {1,0,0,0,0,1,0},
    /*DnnPool*/         {1,1,0,0,0,1,0},
    /*DnnPoolGrad*/     {1,0,0,0,0,1,0},
    /*DnnSoftmax*/      {1,1,0,0,0,1,0},
    /*DnnSoftmaxGrad*/  {1,0,0,0,0,1,0},
};
// clang-format on

static_assert(sizeof(OP_TRAITS) / sizeof(OP_TRAITS[0]) ==
                  static_cast<size_t>(OpKind::_Count),
              "OP_TRAITS table must have one entry per OpKind");

inline constexpr const OpTraits &op_traits(OpKind op) {
    return OP_TRAITS[static_cast<size_t>(op)];
}

inline constexpr bool infers_shape(OpKind op) {
    return op_traits(op).infers_shape;
}

inline constexpr bool is_differentiable(OpKind op) {
    return op_traits(op).differentiable;
}

inline constexpr bool declares_aliasing(OpKind op) {
    return op_traits(op).declares_aliasing;
}

inline constexpr bool selects_algorithm(OpKind op) {
    return op_traits(op).selects_algorithm;
}

inline constexpr bool is_constant_foldable(OpKind op) {
    return op_traits(op).constant_foldable;
}

inline constexpr bool is_accelerated(OpKind op) {
    return op_traits(op).accelerated;
}

inline constexpr bool is_elementwise(OpKind op) {
    return op_traits(op).is_elementwise;
}

// Accelerated convolution kinds sharing the (primary, secondary, output,
// descriptor, alpha, beta) input layout
inline constexpr bool is_dnn_conv(OpKind op) {
    return op == OpKind::DnnConv || op == OpKind::DnnConvGradW ||
           op == OpKind::DnnConvGradI;
}

std::string op_kind_name(OpKind op);

} // namespace graph
} // namespace dnnlift
