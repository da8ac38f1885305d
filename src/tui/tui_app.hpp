#pragma once

#include "../app_config.hpp"
#include "../event_queue.hpp"
#include "../interfaces/i_hierarchy.hpp"
#include "../navigation_controller.hpp"
#include "../viewmodels/app_view_model.hpp"
#include <atomic>
#include <memory>
#include <regex>
#include <string>
#include <ncurses.h>

namespace arbor {

// Focus states for keyboard navigation between panels
enum class PanelFocus {
    Tree,
    Details
};

class TuiApp {
public:
    // Non-owning: hierarchy must be non-null and outlive the TuiApp.
    TuiApp(IHierarchy* hierarchy, RowStrategy strategy, AppConfig config);
    ~TuiApp();

    void run();

    // Curses key code -> controller key name; empty for codes with no name
    [[nodiscard]] static std::string translate_key(int ch);

private:
    // Rendering
    void render();
    void render_tree_panel();
    void render_empty_placeholder(int max_y, int max_x);
    void render_details_panel();
    void render_status_bar();
    void render_sort_menu();
    void render_help_overlay();

    // Row strategy: text for one row. highlight is null when no usable
    // filter pattern is active.
    void draw_row(const RowView& row, int y, int width, const std::regex* highlight);
    int draw_highlighted(WINDOW* win, int y, int x, const std::string& text, int width,
                         int base_attr, const std::regex* highlight);

    // Input handling
    void handle_input(int ch);
    void handle_details_input(const std::string& key);

    // Observers
    void on_selection_changed(IHierarchyNode& node);
    void refresh_details();

    // Window management
    void create_windows();
    void resize_windows();
    void cleanup_windows();
    [[nodiscard]] int tree_view_height() const;

    void draw_box_title(WINDOW* win, const std::string& title, bool focused);

    IHierarchy* hierarchy_ = nullptr;
    RowStrategy strategy_;
    AppConfig config_;

    std::unique_ptr<NavigationController> controller_;
    EventQueue events_;

    // ViewModel (holds all UI state the renderer reads)
    AppViewModel view_model_;

    // ncurses windows
    WINDOW* tree_win_ = nullptr;
    WINDOW* details_win_ = nullptr;
    WINDOW* status_win_ = nullptr;

    // UI state
    PanelFocus current_focus_ = PanelFocus::Tree;
    std::atomic<bool> running_{false};
    int tree_win_height_ = 0;

    // Layout constants
    static constexpr int kStatusBarHeight = 1;
    static constexpr int kMinTreeWidth = 30;
    static constexpr double kTreePanelRatio = 0.6;
};

} // namespace arbor
