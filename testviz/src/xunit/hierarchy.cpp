#include "xunit/hierarchy.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace testviz::xunit {

void HierarchyBuilder::add(std::vector<std::string> path, TestCase test,
                           const std::vector<std::string>& trait_labels) {
    entries_.push_back(Entry{std::move(path), std::move(test), trait_labels});
}

auto find_or_add_group(TestGroup& parent, const std::string& name) -> TestGroup& {
    auto it = std::find_if(parent.groups.begin(), parent.groups.end(),
                           [&](const TestGroup& group) { return group.name == name; });
    if (it != parent.groups.end()) {
        return *it;
    }

    TestGroup group;
    group.name = name;
    parent.groups.push_back(std::move(group));
    return parent.groups.back();
}

auto HierarchyBuilder::build() const -> std::vector<TestGroup> {
    static const std::vector<std::string> NO_TRAITS = {""};

    std::vector<TestGroup> roots;
    for (const auto& entry : entries_) {
        const auto& labels = entry.trait_labels.empty() ? NO_TRAITS : entry.trait_labels;

        for (const auto& label : labels) {
            auto root = std::find_if(roots.begin(), roots.end(),
                                     [&](const TestGroup& group) { return group.name == label; });
            if (root == roots.end()) {
                roots.push_back(TestGroup{label, {}, {}});
                root = roots.end() - 1;
            }

            // Only node->groups grows below, never the vector holding `node`
            TestGroup* node = &*root;
            for (const auto& name : entry.path) {
                node = &find_or_add_group(*node, name);
            }
            node->tests.push_back(entry.test);
        }
    }

    TESTVIZ_LOG_TRACE("xunit", "Built " << roots.size() << " root group(s) from "
                                        << entries_.size() << " test(s)");
    return roots;
}

} // namespace testviz::xunit
