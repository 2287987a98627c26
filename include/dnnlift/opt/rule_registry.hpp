#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include "rewrite_rule.hpp"

namespace dnnlift {
namespace opt {

struct RuleEntry {
    std::string name;
    std::string pass;
    int priority = 0;
    std::set<std::string> tags;
    LocalRulePtr local;   // exactly one of local / global is set
    GlobalPassPtr global;
    size_t order = 0;     // registration order, breaks priority ties

    bool is_global() const { return global != nullptr; }
};

// Tag query. An entry is selected when its name or any of its tags is in
// `include` and neither its name nor any tag is in `exclude`.
struct RuleQuery {
    std::set<std::string> include;
    std::set<std::string> exclude;

    RuleQuery including(const std::string &tag) const;
    RuleQuery excluding(const std::string &tag) const;
};

// Explicit registry value keyed by (pass, priority, tags). Built once and
// handed to the rewriter; nothing registers into it behind its back.
class RuleRegistry {
  public:
    // Throws ConfigurationError when the rule name is already taken
    void register_local(std::string pass, int priority,
                        std::set<std::string> tags, LocalRulePtr rule);
    void register_global(std::string pass, int priority,
                         std::set<std::string> tags, GlobalPassPtr pass_impl);

    // Matching entries ordered by priority, then registration order
    std::vector<const RuleEntry *> select(const RuleQuery &query) const;

    // Null when no entry has this name
    const RuleEntry *find(const std::string &name) const;

    const std::vector<RuleEntry> &entries() const { return entries_; }
    size_t size() const { return entries_.size(); }

  private:
    void add(RuleEntry entry);

    std::vector<RuleEntry> entries_;
};

} // namespace opt
} // namespace dnnlift
