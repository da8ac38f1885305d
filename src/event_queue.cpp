#include "event_queue.hpp"
#include "navigation_controller.hpp"

namespace arbor {

namespace {

struct EventDispatcher {
    NavigationController& controller;

    void operator()(const KeyEvent& event) const { controller.handle_key(event.key); }
    void operator()(const ResizeEvent& event) const { controller.resize(event.view_height); }
};

} // namespace

void EventQueue::push(Event event) {
    events_.push(std::move(event));
}

size_t EventQueue::drain(NavigationController& controller) {
    size_t processed = 0;
    while (!events_.empty()) {
        Event event = std::move(events_.front());
        events_.pop();
        std::visit(EventDispatcher{controller}, event);
        processed++;
    }
    return processed;
}

} // namespace arbor
