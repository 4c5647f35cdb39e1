//! # Hierarchy Builder
//!
//! Merges tests with their group paths into one tree per trait label.
//!
//! ## Ordering
//!
//! | What           | Order                                   |
//! |----------------|-----------------------------------------|
//! | Roots          | first time a trait label is seen        |
//! | Child groups   | first time a name is seen in the parent |
//! | Tests          | order of `add()` calls                  |
//!
//! A test with two traits is placed under both roots; a test without
//! traits is placed under the root with the empty label.

#ifndef TESTVIZ_XUNIT_HIERARCHY_HPP
#define TESTVIZ_XUNIT_HIERARCHY_HPP

#include "xunit/test_run.hpp"

#include <string>
#include <vector>

namespace testviz::xunit {

class HierarchyBuilder {
public:
    /// Records `test` under `path` for each of `trait_labels`
    /// (or under the "" root when the list is empty).
    void add(std::vector<std::string> path, TestCase test,
             const std::vector<std::string>& trait_labels);

    /// Builds the roots. Can be called more than once.
    [[nodiscard]] auto build() const -> std::vector<TestGroup>;

    [[nodiscard]] auto size() const -> size_t {
        return entries_.size();
    }

private:
    struct Entry {
        std::vector<std::string> path;
        TestCase test;
        std::vector<std::string> trait_labels;
    };

    std::vector<Entry> entries_;
};

/// Returns the child of `parent` named `name`, appending one if absent.
auto find_or_add_group(TestGroup& parent, const std::string& name) -> TestGroup&;

} // namespace testviz::xunit

#endif // TESTVIZ_XUNIT_HIERARCHY_HPP
