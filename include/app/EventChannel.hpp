#pragma once
#include "app/AppEvent.hpp"
#include <glib.h>
#include <atomic>
#include <functional>
#include <optional>

namespace NewsDeck {

// Multi-producer, single-consumer FIFO from worker threads to the main loop.
// Producers hold it through a shared_ptr so a late task can still send
// (and be refused) after the loop has gone away.
class EventChannel {
public:
    using Handler = std::function<void(AppEvent&)>;

    EventChannel();
    ~EventChannel();
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    // False once the channel is closed; the event is dropped.
    bool send(AppEvent event);

    std::optional<AppEvent> tryReceive();
    // Blocks up to timeoutMicros; used where no main loop is running.
    std::optional<AppEvent> receive(guint64 timeoutMicros);

    // Delivers one event per main loop dispatch to handler.
    void attach(GMainContext* context, Handler handler);
    void detach();

    void close();
    bool isClosed() const { return closed_.load(); }
    size_t pending() const;

private:
    struct ChannelSource {
        GSource source;
        EventChannel* channel;
    };

    static gboolean prepare(GSource* source, gint* timeout);
    static gboolean check(GSource* source);
    static gboolean dispatch(GSource* source, GSourceFunc callback, gpointer userData);
    static void freeEvent(gpointer data);

    GAsyncQueue* queue_;
    std::atomic<bool> closed_;
    std::atomic<GMainContext*> context_;
    GSource* source_;
    Handler handler_;
};

}
