#include "app/EventChannel.hpp"

namespace NewsDeck {

EventChannel::EventChannel()
    : queue_(g_async_queue_new_full(freeEvent)), closed_(false), context_(nullptr), source_(nullptr) {}

EventChannel::~EventChannel() {
    detach();
    GMainContext* context = context_.exchange(nullptr);
    if (context) g_main_context_unref(context);
    g_async_queue_unref(queue_);
}

void EventChannel::freeEvent(gpointer data) {
    delete static_cast<AppEvent*>(data);
}

bool EventChannel::send(AppEvent event) {
    if (closed_.load()) return false;
    g_async_queue_push(queue_, new AppEvent(std::move(event)));
    GMainContext* context = context_.load();
    if (context) g_main_context_wakeup(context);
    return true;
}

std::optional<AppEvent> EventChannel::tryReceive() {
    auto* event = static_cast<AppEvent*>(g_async_queue_try_pop(queue_));
    if (!event) return std::nullopt;
    AppEvent result = std::move(*event);
    delete event;
    return result;
}

std::optional<AppEvent> EventChannel::receive(guint64 timeoutMicros) {
    auto* event = static_cast<AppEvent*>(g_async_queue_timeout_pop(queue_, timeoutMicros));
    if (!event) return std::nullopt;
    AppEvent result = std::move(*event);
    delete event;
    return result;
}

size_t EventChannel::pending() const {
    gint length = g_async_queue_length(queue_);
    return length > 0 ? static_cast<size_t>(length) : 0;
}

gboolean EventChannel::prepare(GSource* source, gint* timeout) {
    *timeout = -1;
    return reinterpret_cast<ChannelSource*>(source)->channel->pending() > 0;
}

gboolean EventChannel::check(GSource* source) {
    return reinterpret_cast<ChannelSource*>(source)->channel->pending() > 0;
}

gboolean EventChannel::dispatch(GSource* source, GSourceFunc /*callback*/, gpointer /*userData*/) {
    EventChannel* self = reinterpret_cast<ChannelSource*>(source)->channel;
    std::optional<AppEvent> event = self->tryReceive();
    if (event && self->handler_) self->handler_(*event);
    return G_SOURCE_CONTINUE;
}

void EventChannel::attach(GMainContext* context, Handler handler) {
    static GSourceFuncs funcs = {prepare, check, dispatch, nullptr, nullptr, nullptr};

    detach();
    handler_ = std::move(handler);
    GMainContext* previous = context_.exchange(g_main_context_ref(context));
    if (previous) g_main_context_unref(previous);

    source_ = g_source_new(&funcs, sizeof(ChannelSource));
    reinterpret_cast<ChannelSource*>(source_)->channel = this;
    g_source_set_name(source_, "newsdeck-events");
    g_source_attach(source_, context);
}

void EventChannel::detach() {
    if (!source_) return;
    g_source_destroy(source_);
    g_source_unref(source_);
    source_ = nullptr;
    handler_ = nullptr;
}

void EventChannel::close() {
    closed_.store(true);
}

}
