#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cassert>
#include <csignal>
#include <chrono>
#include <thread>

namespace arbor {

// Signal handler for terminal resize
static std::atomic<bool> g_resize_requested{false};

static void handle_resize([[maybe_unused]] int sig) {
    g_resize_requested.store(true);
}

TuiApp::TuiApp(IHierarchy* hierarchy, RowStrategy strategy, AppConfig config)
    : hierarchy_(hierarchy)
    , strategy_(std::move(strategy))
    , config_(std::move(config))
{
    assert(hierarchy_ != nullptr);
}

TuiApp::~TuiApp() {
    cleanup_windows();
}

void TuiApp::run() {
    // Initialize ncurses
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);  // Hide cursor
    nodelay(stdscr, TRUE);  // Non-blocking input
    set_escdelay(25);  // Escape is a command key here

    init_colors();

    signal(SIGWINCH, handle_resize);

    create_windows();

    controller_ = std::make_unique<NavigationController>(
        hierarchy_, strategy_, tree_view_height());

    controller_->set_on_selection_changed([this](IHierarchyNode& node) {
        on_selection_changed(node);
    });
    controller_->set_on_notify([](const Notification& n) {
        if (n.level == NotificationLevel::Error) {
            beep();
        }
    });
    controller_->set_on_status_changed([](Status status) {
        spdlog::debug("status -> {}", to_string(status));
    });
    controller_->set_on_focus_switch([this]() {
        current_focus_ = PanelFocus::Details;
    });

    spdlog::info("tui started with {} top-level nodes", hierarchy_->top_level().size());

    running_ = true;
    render();

    while (running_) {
        bool dirty = false;

        // Handle terminal resize
        if (g_resize_requested.exchange(false)) {
            endwin();
            refresh();
            resize_windows();
            events_.push_resize(tree_view_height());
            dirty = true;
        }

        // Handle input
        int ch = getch();
        if (ch != ERR) {
            handle_input(ch);
            dirty = true;
        }

        if (events_.drain(*controller_) > 0 || dirty) {
            render();
        }

        // Small sleep to reduce CPU usage
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    cleanup_windows();
    endwin();
    spdlog::info("tui stopped");
}

int TuiApp::tree_view_height() const {
    return std::max(tree_win_height_ - config_.chrome_rows, 0);
}

void TuiApp::create_windows() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    int tree_height = std::max(3, max_y - kStatusBarHeight);
    int tree_width = std::max(kMinTreeWidth, static_cast<int>(max_x * kTreePanelRatio));
    if (tree_width > max_x) tree_width = max_x;
    int details_width = max_x - tree_width;

    tree_win_height_ = tree_height;
    tree_win_ = newwin(tree_height, tree_width, 0, 0);
    if (details_width > 0) {
        details_win_ = newwin(tree_height, details_width, 0, tree_width);
    }
    status_win_ = newwin(kStatusBarHeight, max_x, tree_height, 0);

    keypad(tree_win_, TRUE);
    if (details_win_) keypad(details_win_, TRUE);
    keypad(status_win_, TRUE);
}

void TuiApp::resize_windows() {
    cleanup_windows();
    create_windows();
}

void TuiApp::cleanup_windows() {
    if (tree_win_) {
        delwin(tree_win_);
        tree_win_ = nullptr;
    }
    if (details_win_) {
        delwin(details_win_);
        details_win_ = nullptr;
    }
    if (status_win_) {
        delwin(status_win_);
        status_win_ = nullptr;
    }
}

void TuiApp::on_selection_changed(IHierarchyNode& node) {
    auto& details = view_model_.details;
    details.node_name = node.name();
    details.selections_seen++;
    spdlog::debug("selected {}", node.name());
}

void TuiApp::refresh_details() {
    auto& details = view_model_.details;
    if (details.node_name.empty() || !controller_) return;

    // The node may have been dropped since it was published
    IHierarchyNode* node = controller_->find_node(details.node_name);
    if (!node) {
        details.clear();
        return;
    }

    details.fields.clear();
    for (const auto& f : node->fields()) {
        details.fields.emplace_back(f, node->get_field(f));
    }
    details.child_count = static_cast<int>(node->children().size());

    std::vector<std::string> ancestors;
    for (auto* p = node->parent(); p; p = p->parent()) {
        ancestors.push_back(p->get_field(controller_->strategy().primary_field));
    }
    std::reverse(ancestors.begin(), ancestors.end());
    details.path.clear();
    for (const auto& a : ancestors) {
        if (!details.path.empty()) details.path += " > ";
        details.path += a;
    }
}

void TuiApp::render() {
    if (!controller_) return;

    view_model_.tree = controller_->snapshot();
    refresh_details();

    const auto recent = controller_->notifications().recent();
    view_model_.status_message = recent.empty() ? std::nullopt
                                                : std::optional<Notification>(recent.back());

    werase(tree_win_);
    if (details_win_) werase(details_win_);
    werase(status_win_);

    render_tree_panel();
    render_details_panel();
    render_status_bar();

    wnoutrefresh(tree_win_);
    if (details_win_) wnoutrefresh(details_win_);
    wnoutrefresh(status_win_);

    // Overlays draw on top of the panels
    if (view_model_.tree.sort_menu.visible) {
        render_sort_menu();
    }
    if (view_model_.show_help) {
        render_help_overlay();
    }

    doupdate();
}

void TuiApp::draw_box_title(WINDOW* win, const std::string& title, bool focused) {
    const int border = focused ? COLOR_PAIR_BORDER_FOCUS : COLOR_PAIR_BORDER;
    wattron(win, COLOR_PAIR(border) | (focused ? A_BOLD : A_NORMAL));
    box(win, 0, 0);
    wattroff(win, COLOR_PAIR(border) | (focused ? A_BOLD : A_NORMAL));

    if (!title.empty()) {
        wattron(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
        mvwprintw(win, 0, 2, " %s ", title.c_str());
        wattroff(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    }
}

} // namespace arbor
