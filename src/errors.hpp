#pragma once

#include <stdexcept>
#include <string>

namespace arbor {

// Filter pattern failed to compile; the flatten pass degrades to "no match"
class FilterError : public std::runtime_error {
public:
    FilterError(const std::string& pattern, const std::string& reason)
        : std::runtime_error("invalid filter '" + pattern + "': " + reason)
        , pattern_(pattern) {}

    [[nodiscard]] const std::string& pattern() const { return pattern_; }

private:
    std::string pattern_;
};

// Hierarchy rejected an add/remove/reorder/sort/edit
class MutationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Index outside the flattened rows. Only the checked accessor throws this;
// the controller clamps after every reflatten so it never escapes.
class SelectionOutOfRange : public std::out_of_range {
public:
    explicit SelectionOutOfRange(int index)
        : std::out_of_range("row index " + std::to_string(index) + " out of range")
        , index_(index) {}

    [[nodiscard]] int index() const { return index_; }

private:
    int index_;
};

} // namespace arbor
