#include "dnnlift_test_utils.hpp"

using namespace dnnlift;
using namespace dnnlift::testing;
using graph::OpKind;
using opt::RuleQuery;
using opt::RuleRegistry;

namespace {

opt::LocalRulePtr never(const std::string &name) {
    return opt::make_local_rule(
        name, {}, [](const graph::Node &, const opt::RewriteContext &) {
            return std::optional<std::vector<graph::ValuePtr>>();
        });
}

std::vector<std::string> names(const std::vector<const opt::RuleEntry *> &es) {
    std::vector<std::string> out;
    for (const auto *e : es)
        out.push_back(e->name);
    return out;
}

} // namespace

// ============================================================================
// Registry
// ============================================================================

TEST(RuleRegistry, SelectOrdersByPriorityThenRegistration) {
    RuleRegistry registry;
    registry.register_local("late", 50, {"fast_run"}, never("c"));
    registry.register_local("early", 10, {"fast_run"}, never("a"));
    registry.register_local("early", 10, {"fast_run"}, never("b"));
    registry.register_global(
        "first", 0, {"fast_run"},
        opt::make_global_pass("g", [](opt::RewriteContext &) { return false; }));

    EXPECT_EQ(names(registry.select(RuleQuery{{"fast_run"}, {}})),
              std::vector<std::string>({"g", "a", "b", "c"}));
    EXPECT_EQ(registry.size(), 4u);
    ASSERT_NE(registry.find("b"), nullptr);
    EXPECT_EQ(registry.find("b")->pass, "early");
    EXPECT_EQ(registry.find("zzz"), nullptr);
}

TEST(RuleRegistry, QueriesMatchTagsAndNames) {
    RuleRegistry registry;
    registry.register_local("p", 1, {"fast_run", "cudnn"}, never("a"));
    registry.register_local("p", 2, {"fast_run"}, never("b"));
    registry.register_local("p", 3, {"experimental"}, never("c"));

    EXPECT_EQ(names(registry.select(RuleQuery{{"fast_run"}, {"cudnn"}})),
              std::vector<std::string>({"b"}));
    EXPECT_EQ(names(registry.select(RuleQuery{{"c"}, {}})),
              std::vector<std::string>({"c"}));
    EXPECT_EQ(names(registry.select(RuleQuery{{"fast_run"}, {"b"}})),
              std::vector<std::string>({"a"}));

    auto q = RuleQuery{}.including("fast_run").excluding("cudnn");
    EXPECT_EQ(names(registry.select(q)), std::vector<std::string>({"b"}));
    EXPECT_TRUE(registry.select(RuleQuery{}).empty());
}

TEST(RuleRegistry, DuplicateNamesRejected) {
    RuleRegistry registry;
    registry.register_local("p", 1, {}, never("a"));
    EXPECT_THROW(registry.register_local("q", 2, {}, never("a")),
                 ConfigurationError);
    EXPECT_THROW(registry.register_global(
                     "q", 2, {},
                     opt::make_global_pass(
                         "a", [](opt::RewriteContext &) { return false; })),
                 ConfigurationError);
}

// ============================================================================
// Equilibrium rewriter
// ============================================================================

class Equilibrium : public ReferenceGateTest {};

TEST_F(Equilibrium, ConstantFoldingReachesFixpoint) {
    auto x = input4({2, 2}, "x");
    auto c = graph::constant_tensor(HostTensor::filled(DType::Float32, {2, 2}, 1.5));
    auto folded = ops::mul(ops::add(c, c), graph::constant_scalar(2.0));
    auto y = ops::add(x, folded);
    graph::FunctionGraph fg({x}, {y});

    RuleRegistry registry;
    registry.register_local("canonicalize", 10, {"fast_run"},
                            opt::constant_folding_rule());
    opt::EquilibriumRewriter rewriter;
    auto stats = rewriter.optimize(fg, *gate, registry, RuleQuery{{"fast_run"}, {}});

    EXPECT_EQ(stats.count("constant_folding"), 2u);
    EXPECT_EQ(fg.count(OpKind::Mul), 0u);
    EXPECT_EQ(fg.count(OpKind::Add), 1u);

    auto out = evaluate(fg, {HostTensor::filled(DType::Float32, {2, 2}, 1.0)})[0];
    ExpectTensorEquals(*out, {7.0, 7.0, 7.0, 7.0});
}

TEST_F(Equilibrium, RulesThatFeedEachOtherHitTheSweepCap) {
    auto x = input4({2, 2}, "x");
    auto y = ops::mul(x, x);
    graph::FunctionGraph fg({x}, {y});

    // Rebuilds the same product forever
    RuleRegistry registry;
    registry.register_local(
        "loop", 1, {"fast_run"},
        opt::make_local_rule(
            "respin", {OpKind::Mul},
            [](const graph::Node &node, const opt::RewriteContext &) {
                return std::optional<std::vector<graph::ValuePtr>>(
                    std::vector<graph::ValuePtr>{
                        ops::mul(node.input(0), node.input(1))});
            }));
    opt::EquilibriumRewriter rewriter(16);
    EXPECT_THROW(rewriter.optimize(fg, *gate, registry, RuleQuery{{"fast_run"}, {}}),
                 RuntimeError);
}

TEST_F(Equilibrium, WrongReplacementArityIsAnInternalError) {
    auto x = input4({2, 2}, "x");
    graph::FunctionGraph fg({x}, {ops::mul(x, x)});

    RuleRegistry registry;
    registry.register_local(
        "bad", 1, {"fast_run"},
        opt::make_local_rule(
            "two_for_one", {OpKind::Mul},
            [](const graph::Node &node, const opt::RewriteContext &) {
                return std::optional<std::vector<graph::ValuePtr>>(
                    std::vector<graph::ValuePtr>{node.input(0), node.input(1)});
            }));
    opt::EquilibriumRewriter rewriter;
    EXPECT_THROW(rewriter.optimize(fg, *gate, registry, RuleQuery{{"fast_run"}, {}}),
                 RuntimeError);
}

TEST_F(Equilibrium, GlobalPassesRunInPriorityOrder) {
    auto x = input4({2, 2}, "x");
    graph::FunctionGraph fg({x}, {ops::mul(x, x)});

    std::vector<std::string> order;
    RuleRegistry registry;
    registry.register_global("b", 20, {"fast_run"},
                             opt::make_global_pass("second",
                                                   [&](opt::RewriteContext &) {
                                                       order.push_back("second");
                                                       return true;
                                                   }));
    registry.register_global("a", 10, {"fast_run"},
                             opt::make_global_pass("first",
                                                   [&](opt::RewriteContext &) {
                                                       order.push_back("first");
                                                       return false;
                                                   }));
    opt::EquilibriumRewriter rewriter;
    auto stats = rewriter.optimize(fg, *gate, registry, RuleQuery{{"fast_run"}, {}});
    EXPECT_EQ(order, std::vector<std::string>({"first", "second"}));
    EXPECT_EQ(stats.count("first"), 0u);
    EXPECT_EQ(stats.count("second"), 1u);
}

TEST_F(Equilibrium, ReplacementsAreTraced) {
    auto img = input4({1, 2, 6, 6});
    auto kern = input4({3, 2, 3, 3});
    graph::FunctionGraph fg({img, kern},
                            {ops::conv(img, kern, ops::ConvParams{})});
    trace::clear();
    trace::enable();
    opt::optimize(fg, *gate);
    trace::disable();
    EXPECT_GE(trace::Tracer::instance().count("rewrite", "diagnostic"), 1u);
    trace::clear();
}
