#include "dnnlift/debug.hpp"
#include "dnnlift/error.hpp"
#include "dnnlift/graph/compiled_function.hpp"

namespace dnnlift {
namespace graph {

namespace {

void check_input(const ValueType &type, const Datum &d, size_t index) {
    std::string what = "function input " + std::to_string(index);
    switch (type.kind) {
    case ValueKind::Tensor: {
        const auto &t = datum_tensor(d, what);
        if (t->ndim() != type.rank())
            throw ShapeError::rank_mismatch(what, type.rank(), t->ndim());
        if (!ShapeUtils::compatible(type.dims, t->shape))
            throw ShapeError::mismatch(type.dims, t->shape);
        break;
    }
    case ValueKind::Scalar:
        datum_scalar(d, what);
        break;
    case ValueKind::ShapeVector:
        if (datum_shape(d, what).size() != type.shape_length()) {
            throw ShapeError(what + " must be a shape vector of length " +
                             std::to_string(type.shape_length()));
        }
        break;
    case ValueKind::Opaque:
        datum_descriptor(d, what);
        break;
    }
}

Datum private_copy(const Datum &d) {
    if (const auto *t = std::get_if<HostTensorPtr>(&d)) {
        if (*t)
            return std::make_shared<HostTensor>(**t);
    }
    return d;
}

} // namespace

std::vector<Datum> GraphExecutor::execute(CompiledFunction &plan,
                                          const std::vector<Datum> &inputs) {
    if (inputs.size() != plan.input_slots.size()) {
        throw TypeError::arity("compiled function", plan.input_slots.size(),
                               inputs.size());
    }

    std::vector<Datum> buffers = plan.constants;

    for (size_t i = 0; i < inputs.size(); ++i) {
        int slot = plan.input_slots[i];
        check_input(plan.slots[slot].type, inputs[i], i);
        buffers[slot] = inputs[i];
    }

    for (size_t s = 0; s < plan.steps.size(); ++s) {
        const auto &step = plan.steps[s];
        const Node &node = *step.node;

        std::vector<Datum> args;
        args.reserve(step.input_slots.size());
        for (int slot : step.input_slots)
            args.push_back(buffers[slot]);

        // In-place writes only land on buffers nobody else will read
        for (const auto &[out_index, destroyed] : node.op().destroy_map()) {
            for (size_t pos : destroyed) {
                int slot = step.input_slots.at(pos);
                const auto &info = plan.slots[slot];
                bool shared = info.is_input || info.is_constant ||
                              info.last_use > static_cast<int>(s);
                for (size_t other = 0; other < step.input_slots.size();
                     ++other) {
                    shared = shared ||
                             (other != pos && step.input_slots[other] == slot);
                }
                if (shared)
                    args[pos] = private_copy(args[pos]);
            }
        }

        std::vector<Datum> results;
        {
            trace::ScopedTrace trace("execute", node.op().name());
            results = node.op().perform(node, args, *plan.context);
        }
        if (results.size() != step.output_slots.size()) {
            throw RuntimeError::internal(
                node.op().name() + " produced " +
                std::to_string(results.size()) + " outputs, expected " +
                std::to_string(step.output_slots.size()));
        }
        for (size_t i = 0; i < results.size(); ++i)
            buffers[step.output_slots[i]] = std::move(results[i]);

        for (int slot : step.release_after)
            buffers[slot] = std::monostate{};
    }

    std::vector<Datum> outputs;
    outputs.reserve(plan.output_slots.size());
    for (int slot : plan.output_slots)
        outputs.push_back(buffers[slot]);
    return outputs;
}

} // namespace graph
} // namespace dnnlift
