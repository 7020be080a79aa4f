#pragma once

#include "mavtrack.hpp"
#include "mavtrack_utils.hpp"
#include "publisher.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace mavtrack {

enum class SinkEvent : uint8_t {
    Connected,
    ConnectFailed,
    Delivered,
    Skipped,
    Failed,
    Stopped,
};

const char* to_str(SinkEvent event);

// Worker -> manager report. Counters are cumulative, so a status lost to a
// full status channel loses nothing but its event.
struct PublishStatus {
    size_t sink_index = 0;
    SinkEvent event = SinkEvent::Stopped;
    PublisherState state = PublisherState::Disconnected;
    Error error = Error::Unknown;
    size_t retry = 0;
    PublisherCounters counters;
};

struct SinkStats {
    std::string name;
    SinkKind kind = SinkKind::Amqp;
    PublisherState state = PublisherState::Disconnected;
    PublisherCounters counters;
    size_t dropped_inbox_full = 0;
    size_t retry = 0;
    size_t status_events = 0;
};

struct SinkManagerConfig {
    size_t inbox_capacity = 64;
    size_t status_capacity = 256;
    BackoffPolicy reconnect;
    std::chrono::milliseconds publish_timeout{2000};
    std::chrono::milliseconds idle_poll{5};
    std::chrono::milliseconds shutdown_grace{2000};
};

// Fans each TrackingUpdate out to one worker per publisher. The fan-out only
// ever try_pushes into bounded inboxes, so a stuck broker costs its own sink
// some updates and never delays the others or the pipeline.
struct SinkManagerBlock : public BlockBase {
    Channel<TrackingUpdate> in;

    // Throws std::logic_error without publishers: startup validation must
    // have rejected such a configuration already.
    SinkManagerBlock(const char* name,
                     std::vector<std::unique_ptr<Publisher>> publishers,
                     const SinkManagerConfig& config = SinkManagerConfig{},
                     size_t in_capacity = 256);
    ~SinkManagerBlock();

    // Spawns the workers; each connects eagerly
    void start();

    // Returns the number of sinks the update was queued for
    size_t publish(const TrackingUpdate& update);

    Result<Empty, Error> procedure();

    // Folds pending worker reports into the per-sink stats
    size_t drain_status();

    // Stops every worker and closes its connection. Workers still blocked in
    // a broker call after `grace` are abandoned together with their update.
    void shutdown(std::chrono::milliseconds grace);
    void shutdown() { shutdown(_config.shutdown_grace); }

    size_t sink_count() const { return _workers.size(); }
    bool has_sink(SinkKind kind) const;
    bool started() const { return _started; }
    SinkStats stats(size_t index) const;
    std::vector<SinkStats> all_stats() const;

private:
    struct Worker {
        Worker(size_t index, std::unique_ptr<Publisher> publisher, const SinkManagerConfig& config);

        void run();
        void report(SinkEvent event, Error error = Error::Unknown);
        bool wait_done(std::chrono::steady_clock::time_point deadline);

        size_t index;
        std::unique_ptr<Publisher> publisher;
        Channel<TrackingUpdate> inbox;
        Channel<PublishStatus> status;
        ShutdownSignal stop;
        Backoff backoff;
        std::chrono::milliseconds idle_poll;

        std::mutex done_mutex;
        std::condition_variable done_cv;
        bool done = false;
    };

    SinkManagerConfig _config;
    std::vector<std::shared_ptr<Worker>> _workers;
    std::vector<std::thread> _threads;
    bool _started = false;
    bool _stopped = false;

    mutable std::mutex _stats_mutex;
    std::vector<SinkStats> _stats;
};

} // namespace mavtrack
