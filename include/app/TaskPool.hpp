#pragma once
#include "app/AppEvent.hpp"
#include "app/EventChannel.hpp"
#include <glib.h>
#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace NewsDeck {

// One unit of background work. work() produces the outcome event; if it
// throws, recover() turns the failure into the event instead. afterSend runs
// on the worker once the event has been handed to the channel.
struct TaskSpec {
    std::string tag;
    std::function<AppEvent()> work;
    std::function<AppEvent(const TaskError&)> recover;
    std::function<void()> afterSend;
};

// Fixed number of worker slots over a GThreadPool; excess tasks wait FIFO.
class TaskPool {
public:
    TaskPool(std::shared_ptr<EventChannel> channel, int maxConcurrent);
    ~TaskPool();
    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    void spawn(TaskSpec spec);

    // With wait, queued tasks still run and all are joined; without it,
    // queued tasks are dropped and running ones are left to finish alone.
    void shutdown(bool wait);

    int maxConcurrent() const { return maxConcurrent_; }
    int running() const { return counters_->running.load(); }
    int peakRunning() const { return counters_->peak.load(); }

private:
    struct Counters {
        std::atomic<int> running{0};
        std::atomic<int> peak{0};
    };
    struct Job {
        TaskSpec spec;
        std::shared_ptr<EventChannel> channel;
        std::shared_ptr<Counters> counters;
    };

    static void runJob(gpointer data, gpointer userData);
    static void dropJob(gpointer data);

    std::shared_ptr<EventChannel> channel_;
    std::shared_ptr<Counters> counters_;
    int maxConcurrent_;
    GThreadPool* pool_;
};

}
