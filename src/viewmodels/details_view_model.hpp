#pragma once

#include <string>
#include <utility>
#include <vector>

namespace arbor {

// Companion panel showing the node most recently published by the
// controller's selection observer
struct DetailsViewModel {
    std::string node_name;  // Empty until something was selected
    std::string path;       // Ancestors' primary field, outermost first
    std::vector<std::pair<std::string, std::string>> fields;
    int child_count = 0;
    int selections_seen = 0;

    void clear() {
        node_name.clear();
        path.clear();
        fields.clear();
        child_count = 0;
    }
};

} // namespace arbor
