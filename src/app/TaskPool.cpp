#include "app/TaskPool.hpp"
#include <exception>
#include <stdexcept>

namespace NewsDeck {

TaskPool::TaskPool(std::shared_ptr<EventChannel> channel, int maxConcurrent)
    : channel_(std::move(channel)), counters_(std::make_shared<Counters>()), maxConcurrent_(maxConcurrent),
      pool_(nullptr) {
    GError* error = nullptr;
    pool_ = g_thread_pool_new_full(runJob, nullptr, dropJob, maxConcurrent_, FALSE, &error);
    if (!pool_) {
        std::string message = error ? error->message : "unknown error";
        g_clear_error(&error);
        throw std::runtime_error("cannot create worker pool: " + message);
    }
}

TaskPool::~TaskPool() {
    shutdown(false);
}

void TaskPool::spawn(TaskSpec spec) {
    if (!pool_) {
        g_warning("Task %s spawned after shutdown", spec.tag.c_str());
        return;
    }
    auto* job = new Job{std::move(spec), channel_, counters_};
    GError* error = nullptr;
    if (!g_thread_pool_push(pool_, job, &error)) {
        // The job stays queued; GLib only reports that no new thread could start.
        g_warning("Worker thread for %s not started: %s", job->spec.tag.c_str(),
                  error ? error->message : "unknown error");
        g_clear_error(&error);
    }
}

void TaskPool::shutdown(bool wait) {
    if (!pool_) return;
    g_thread_pool_free(pool_, wait ? FALSE : TRUE, wait ? TRUE : FALSE);
    pool_ = nullptr;
}

void TaskPool::dropJob(gpointer data) {
    delete static_cast<Job*>(data);
}

void TaskPool::runJob(gpointer data, gpointer /*userData*/) {
    std::unique_ptr<Job> job(static_cast<Job*>(data));
    Counters& counters = *job->counters;
    int now = ++counters.running;
    int peak = counters.peak.load();
    while (now > peak && !counters.peak.compare_exchange_weak(peak, now)) {}

    TaskError crash;
    bool crashed = false;
    AppEvent event = Tick{};
    try {
        event = job->spec.work();
    } catch (const std::exception& e) {
        crashed = true;
        crash = {ErrorKind::Crashed, e.what(), 0};
    } catch (...) {
        crashed = true;
        crash = {ErrorKind::Crashed, "unknown exception", 0};
    }
    if (crashed) {
        g_warning("Task %s crashed: %s", job->spec.tag.c_str(), crash.message.c_str());
        event = job->spec.recover(crash);
    }

    --counters.running;
    if (!job->channel->send(std::move(event))) {
        g_debug("Dropping result of %s: channel closed", job->spec.tag.c_str());
    }
    if (job->spec.afterSend) job->spec.afterSend();
}

}
