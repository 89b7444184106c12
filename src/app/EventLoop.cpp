#include "app/EventLoop.hpp"
#include "ui/KeyDecoder.hpp"
#include <glib-unix.h>
#include <csignal>

namespace NewsDeck {

EventLoop::EventLoop(AppState& state, Controller& controller, EventChannel& channel, TerminalInput& input,
                     TerminalView& view, guint tickMillis)
    : state_(state), controller_(controller), channel_(channel), input_(input), view_(view),
      tickMillis_(tickMillis), context_(g_main_context_default()), loop_(g_main_loop_new(context_, FALSE)) {}

EventLoop::~EventLoop() {
    for (guint id : sources_) g_source_remove(id);
    channel_.detach();
    g_main_loop_unref(loop_);
}

void EventLoop::run() {
    sources_.push_back(g_unix_fd_add(input_.fd(), static_cast<GIOCondition>(G_IO_IN | G_IO_HUP | G_IO_ERR),
                                     onInput, this));
    sources_.push_back(g_timeout_add(tickMillis_, onTick, this));
    sources_.push_back(g_unix_signal_add(SIGINT, onSignal, this));
    sources_.push_back(g_unix_signal_add(SIGTERM, onSignal, this));
    channel_.attach(context_, [this](AppEvent& event) {
        controller_.handleEvent(event, g_get_monotonic_time());
        afterDispatch();
    });

    if (state_.lastRefreshAll == 0) state_.lastRefreshAll = g_get_monotonic_time();
    g_message("Event loop started");
    afterDispatch();
    if (!state_.quit) g_main_loop_run(loop_);
    g_message("Event loop stopped");
}

void EventLoop::quit() {
    state_.quit = true;
    g_main_loop_quit(loop_);
}

void EventLoop::afterDispatch() {
    if (state_.quit) {
        g_main_loop_quit(loop_);
        return;
    }
    if (!state_.needsRedraw) return;
    view_.render(state_);
    controller_.setPageSize(view_.pageSize());
    state_.needsRedraw = false;
}

gboolean EventLoop::onInput(gint /*fd*/, GIOCondition condition, gpointer userData) {
    auto* self = static_cast<EventLoop*>(userData);
    if (condition & (G_IO_HUP | G_IO_ERR)) {
        g_warning("Terminal input closed");
        self->quit();
        return G_SOURCE_CONTINUE;
    }
    self->drainInput();
    self->afterDispatch();
    return G_SOURCE_CONTINUE;
}

void EventLoop::drainInput() {
    while (std::optional<KeyEvent> key = input_.poll()) {
        Command command = decodeKey(*key, state_.mode);
        if (command.kind == CommandKind::None) {
            g_debug("Ignoring unbound key %d", key->raw);
            continue;
        }
        controller_.handleCommand(command, g_get_monotonic_time());
        if (state_.quit) break;
    }
}

gboolean EventLoop::onTick(gpointer userData) {
    auto* self = static_cast<EventLoop*>(userData);
    // A resize raises SIGWINCH rather than making the tty readable, so the
    // pending KEY_RESIZE is only seen by polling.
    self->drainInput();
    self->controller_.handleTick(g_get_monotonic_time());
    self->afterDispatch();
    return G_SOURCE_CONTINUE;
}

gboolean EventLoop::onSignal(gpointer userData) {
    auto* self = static_cast<EventLoop*>(userData);
    g_message("Termination signal received");
    self->quit();
    return G_SOURCE_CONTINUE;
}

}
