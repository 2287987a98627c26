#include "dnnlift/opt/constant_folding.hpp"
#include "dnnlift/error.hpp"
#include "dnnlift/graph/exec_context.hpp"

namespace dnnlift {
namespace opt {

namespace {

std::optional<std::vector<ValuePtr>> fold(const graph::Node &node,
                                          const RewriteContext &) {
    if (!graph::is_constant_foldable(node.kind()))
        return std::nullopt;
    std::vector<graph::Datum> args;
    for (const auto &in : node.inputs()) {
        if (!in->is_constant())
            return std::nullopt;
        args.push_back(in->constant_value());
    }

    // Foldable kinds run on the host and never touch a backend
    graph::ExecContext ctx;
    auto results = node.op().perform(node, args, ctx);
    if (results.size() != node.num_outputs()) {
        throw RuntimeError::internal(node.op().name() + " produced " +
                                     std::to_string(results.size()) +
                                     " outputs while folding");
    }

    std::vector<ValuePtr> folded;
    for (size_t i = 0; i < results.size(); ++i) {
        auto type = node.output(i)->type();
        // Payload tensors may carry sharper dims than the static type
        if (type.is_tensor()) {
            if (const auto *t = std::get_if<HostTensorPtr>(&results[i]))
                type = graph::ValueType::tensor(type.dtype, (*t)->shape);
        } else if (type.is_shape()) {
            if (const auto *s = std::get_if<Shape>(&results[i]))
                type = graph::ValueType::shape_vector(s->size(), *s);
        }
        folded.push_back(graph::make_constant(type, results[i]));
    }
    return folded;
}

} // namespace

LocalRulePtr constant_folding_rule() {
    return make_local_rule("constant_folding", {}, fold);
}

} // namespace opt
} // namespace dnnlift
