#include "dnnlift/opt/rule_registry.hpp"
#include "dnnlift/error.hpp"

#include <algorithm>
#include <utility>

namespace dnnlift {
namespace opt {

// ============================================================================
// Rules built from callables
// ============================================================================

bool LocalRule::tracks_kind(graph::OpKind kind) const {
    auto kinds = tracks();
    return kinds.empty() ||
           std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
}

namespace {

class FunctionRule : public LocalRule {
  public:
    FunctionRule(std::string name, std::vector<graph::OpKind> tracks,
                 LocalTransform transform)
        : name_(std::move(name)), tracks_(std::move(tracks)),
          transform_(std::move(transform)) {}

    std::string name() const override { return name_; }
    std::vector<graph::OpKind> tracks() const override { return tracks_; }

    std::optional<std::vector<ValuePtr>>
    transform(const graph::Node &node,
              const RewriteContext &ctx) const override {
        return transform_(node, ctx);
    }

  private:
    std::string name_;
    std::vector<graph::OpKind> tracks_;
    LocalTransform transform_;
};

class FunctionPass : public GlobalPass {
  public:
    FunctionPass(std::string name, GlobalTransform transform)
        : name_(std::move(name)), transform_(std::move(transform)) {}

    std::string name() const override { return name_; }
    bool apply(RewriteContext &ctx) const override { return transform_(ctx); }

  private:
    std::string name_;
    GlobalTransform transform_;
};

bool intersects(const std::set<std::string> &tags, const std::string &name,
                const std::set<std::string> &query) {
    if (query.count(name))
        return true;
    for (const auto &t : tags) {
        if (query.count(t))
            return true;
    }
    return false;
}

} // namespace

LocalRulePtr make_local_rule(std::string name,
                             std::vector<graph::OpKind> tracks,
                             LocalTransform transform) {
    return std::make_shared<const FunctionRule>(
        std::move(name), std::move(tracks), std::move(transform));
}

GlobalPassPtr make_global_pass(std::string name, GlobalTransform transform) {
    return std::make_shared<const FunctionPass>(std::move(name),
                                                std::move(transform));
}

// ============================================================================
// RuleQuery
// ============================================================================

RuleQuery RuleQuery::including(const std::string &tag) const {
    RuleQuery q = *this;
    q.include.insert(tag);
    return q;
}

RuleQuery RuleQuery::excluding(const std::string &tag) const {
    RuleQuery q = *this;
    q.exclude.insert(tag);
    return q;
}

// ============================================================================
// RuleRegistry
// ============================================================================

void RuleRegistry::add(RuleEntry entry) {
    if (find(entry.name)) {
        throw ConfigurationError("rewrite rule '" + entry.name +
                                 "' is already registered");
    }
    entry.order = entries_.size();
    entries_.push_back(std::move(entry));
}

void RuleRegistry::register_local(std::string pass, int priority,
                                  std::set<std::string> tags,
                                  LocalRulePtr rule) {
    if (!rule)
        throw RuntimeError::internal("register_local given a null rule");
    RuleEntry entry;
    entry.name = rule->name();
    entry.pass = std::move(pass);
    entry.priority = priority;
    entry.tags = std::move(tags);
    entry.local = std::move(rule);
    add(std::move(entry));
}

void RuleRegistry::register_global(std::string pass, int priority,
                                   std::set<std::string> tags,
                                   GlobalPassPtr pass_impl) {
    if (!pass_impl)
        throw RuntimeError::internal("register_global given a null pass");
    RuleEntry entry;
    entry.name = pass_impl->name();
    entry.pass = std::move(pass);
    entry.priority = priority;
    entry.tags = std::move(tags);
    entry.global = std::move(pass_impl);
    add(std::move(entry));
}

std::vector<const RuleEntry *>
RuleRegistry::select(const RuleQuery &query) const {
    std::vector<const RuleEntry *> selected;
    for (const auto &entry : entries_) {
        if (intersects(entry.tags, entry.name, query.include) &&
            !intersects(entry.tags, entry.name, query.exclude))
            selected.push_back(&entry);
    }
    std::stable_sort(selected.begin(), selected.end(),
                     [](const RuleEntry *a, const RuleEntry *b) {
                         if (a->priority != b->priority)
                             return a->priority < b->priority;
                         return a->order < b->order;
                     });
    return selected;
}

const RuleEntry *RuleRegistry::find(const std::string &name) const {
    for (const auto &entry : entries_) {
        if (entry.name == name)
            return &entry;
    }
    return nullptr;
}

} // namespace opt
} // namespace dnnlift
