#pragma once

#include "tree_view_model.hpp"
#include "details_view_model.hpp"
#include "../notification_log.hpp"
#include <optional>

namespace arbor {

// Root ViewModel containing all child ViewModels
struct AppViewModel {
    TreeViewModel tree;
    DetailsViewModel details;

    // Latest notification still young enough for the status line
    std::optional<Notification> status_message;

    bool show_help = false;
};

} // namespace arbor
