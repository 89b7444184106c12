#pragma once
#include "app/AppState.hpp"
#include "app/Controller.hpp"
#include "app/EventChannel.hpp"
#include "ui/TerminalInput.hpp"
#include "ui/TerminalView.hpp"
#include <glib.h>
#include <vector>

namespace NewsDeck {

// Single-threaded reactor over a GMainContext: terminal input, the event
// channel, a periodic tick and SIGINT/SIGTERM. Renders after every dispatch
// that changed something.
class EventLoop {
public:
    EventLoop(AppState& state, Controller& controller, EventChannel& channel, TerminalInput& input,
              TerminalView& view, guint tickMillis = 250);
    ~EventLoop();
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Returns once a quit command or signal has been handled.
    void run();
    void quit();

private:
    static gboolean onInput(gint fd, GIOCondition condition, gpointer userData);
    static gboolean onTick(gpointer userData);
    static gboolean onSignal(gpointer userData);

    void drainInput();
    void afterDispatch();

    AppState& state_;
    Controller& controller_;
    EventChannel& channel_;
    TerminalInput& input_;
    TerminalView& view_;
    guint tickMillis_;
    GMainContext* context_;
    GMainLoop* loop_;
    std::vector<guint> sources_;
};

}
