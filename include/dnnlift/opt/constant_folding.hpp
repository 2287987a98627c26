#pragma once

#include "rewrite_rule.hpp"

namespace dnnlift {
namespace opt {

// Replaces a node whose inputs are all constants by constants holding its
// evaluated outputs. Only kinds the capability table marks constant
// foldable qualify, so descriptor builders and buffer allocations are
// never folded.
LocalRulePtr constant_folding_rule();

} // namespace opt
} // namespace dnnlift
