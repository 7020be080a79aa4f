#include "sink_manager.hpp"
#include "task_policies/mavtrack_desktop_tpolicy.hpp"
#include "zf_log.h"
#include <algorithm>
#include <stdexcept>

namespace mavtrack {

const char* to_str(SinkEvent event) {
    switch (event) {
        case SinkEvent::Connected: return "connected";
        case SinkEvent::ConnectFailed: return "connect-failed";
        case SinkEvent::Delivered: return "delivered";
        case SinkEvent::Skipped: return "skipped";
        case SinkEvent::Failed: return "failed";
        case SinkEvent::Stopped: return "stopped";
        default: return "invalid";
    }
}

SinkManagerBlock::Worker::Worker(size_t index_, std::unique_ptr<Publisher> publisher_, const SinkManagerConfig& config)
    : index(index_),
      publisher(std::move(publisher_)),
      inbox(config.inbox_capacity),
      status(config.status_capacity),
      backoff(config.reconnect),
      idle_poll(config.idle_poll) {}

void SinkManagerBlock::Worker::report(SinkEvent event, Error error) {
    PublishStatus s;
    s.sink_index = index;
    s.event = event;
    s.state = publisher->state();
    s.error = error;
    s.retry = backoff.attempts();
    s.counters = publisher->counters();
    status.try_push(s);
}

void SinkManagerBlock::Worker::run() {
    using Clock = std::chrono::steady_clock;
    auto next_attempt = Clock::now();

    while (!stop.requested()) {
        if (!publisher->connected() && Clock::now() >= next_attempt) {
            auto connected = publisher->connect();
            if (connected.is_ok()) {
                if (backoff.attempts() > 0) {
                    ZF_LOGW("%s: reconnected to %s after %zu retries",
                            publisher->name().c_str(), publisher->endpoint().c_str(), backoff.attempts());
                }
                backoff.reset();
                report(SinkEvent::Connected);
            } else {
                auto delay = backoff.next_delay();
                next_attempt = Clock::now() + delay;
                ZF_LOGW("%s: connection to %s failed (%s), retry %zu in %lld ms",
                        publisher->name().c_str(), publisher->endpoint().c_str(),
                        to_str(connected.unwrap_err()), backoff.attempts(),
                        static_cast<long long>(delay.count()));
                report(SinkEvent::ConnectFailed, connected.unwrap_err());
            }
            continue;
        }

        TrackingUpdate update;
        if (inbox.try_pop(update)) {
            switch (publisher->publish(update)) {
                case PublishOutcome::Delivered:
                    report(SinkEvent::Delivered);
                    break;
                case PublishOutcome::SkippedNotConnected:
                    report(SinkEvent::Skipped);
                    break;
                case PublishOutcome::Failed:
                    next_attempt = Clock::now() + backoff.next_delay();
                    report(SinkEvent::Failed, Error::BrokerUnavailable);
                    break;
            }
            continue;
        }

        auto wait = idle_poll;
        if (!publisher->connected()) {
            auto until_attempt = std::chrono::duration_cast<std::chrono::milliseconds>(next_attempt - Clock::now());
            wait = std::max(std::chrono::milliseconds(1), std::min(wait, until_attempt));
        }
        stop.wait_for(wait);
    }

    publisher->close();
    report(SinkEvent::Stopped);

    {
        std::lock_guard<std::mutex> lock(done_mutex);
        done = true;
    }
    done_cv.notify_all();
}

bool SinkManagerBlock::Worker::wait_done(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(done_mutex);
    return done_cv.wait_until(lock, deadline, [this] { return done; });
}

SinkManagerBlock::SinkManagerBlock(const char* name,
                                   std::vector<std::unique_ptr<Publisher>> publishers,
                                   const SinkManagerConfig& config,
                                   size_t in_capacity)
    : BlockBase(name),
      in(in_capacity),
      _config(config) {
    if (publishers.empty()) {
        throw std::logic_error("SinkManagerBlock needs at least one publisher");
    }

    for (auto& publisher : publishers) {
        if (!publisher) {
            throw std::invalid_argument("SinkManagerBlock: null publisher");
        }
        publisher->set_timeout(_config.publish_timeout);

        SinkStats s;
        s.name = publisher->name();
        s.kind = publisher->kind();
        _stats.push_back(s);

        _workers.push_back(std::make_shared<Worker>(_workers.size(), std::move(publisher), _config));
    }
}

SinkManagerBlock::~SinkManagerBlock() {
    shutdown();
}

void SinkManagerBlock::start() {
    if (_started) {
        return;
    }
    if (_stopped) {
        throw std::logic_error("SinkManagerBlock cannot be restarted after shutdown");
    }
    for (auto& worker : _workers) {
        ZF_LOGI("Starting %s connection to %s",
                to_str(worker->publisher->kind()), worker->publisher->endpoint().c_str());
        std::shared_ptr<Worker> owned = worker;
        _threads.push_back(DesktopTaskPolicy::create_task([owned]() { owned->run(); }));
    }
    _started = true;
}

size_t SinkManagerBlock::publish(const TrackingUpdate& update) {
    size_t queued = 0;
    for (auto& worker : _workers) {
        if (worker->inbox.try_push(update)) {
            queued++;
            continue;
        }
        std::lock_guard<std::mutex> lock(_stats_mutex);
        size_t dropped = ++_stats[worker->index].dropped_inbox_full;
        // Log the first drop and then every 100th
        if (dropped == 1 || dropped % 100 == 0) {
            ZF_LOGW("%s: inbox full, dropped update for '%s' (%zu dropped)",
                    worker->publisher->name().c_str(), update.uav_id.c_str(), dropped);
        }
    }
    return queued;
}

size_t SinkManagerBlock::drain_status() {
    size_t drained = 0;
    PublishStatus s;
    for (auto& worker : _workers) {
        while (worker->status.try_pop(s)) {
            std::lock_guard<std::mutex> lock(_stats_mutex);
            SinkStats& stats = _stats[s.sink_index];
            stats.state = s.state;
            stats.counters = s.counters;
            stats.retry = s.retry;
            stats.status_events++;
            drained++;
        }
    }
    return drained;
}

Result<Empty, Error> SinkManagerBlock::procedure() {
    drain_status();

    size_t available = in.size();
    if (available == 0) {
        return Error::NoData;
    }

    TrackingUpdate update;
    for (size_t i = 0; i < available && in.try_pop(update); ++i) {
        publish(update);
    }
    return Empty{};
}

void SinkManagerBlock::shutdown(std::chrono::milliseconds grace) {
    if (!_started) {
        return;
    }

    for (auto& worker : _workers) {
        worker->stop.request();
    }

    const auto deadline = std::chrono::steady_clock::now() + grace;
    for (size_t i = 0; i < _workers.size(); ++i) {
        if (_workers[i]->wait_done(deadline)) {
            DesktopTaskPolicy::join_task(_threads[i]);
        } else {
            ZF_LOGW("%s: still busy after %lld ms grace, abandoning it",
                    _workers[i]->publisher->name().c_str(), static_cast<long long>(grace.count()));
            _threads[i].detach();
        }
    }
    _threads.clear();
    _started = false;
    _stopped = true;
    drain_status();
}

bool SinkManagerBlock::has_sink(SinkKind kind) const {
    return std::any_of(_workers.begin(), _workers.end(), [kind](const std::shared_ptr<Worker>& w) {
        return w->publisher->kind() == kind;
    });
}

SinkStats SinkManagerBlock::stats(size_t index) const {
    std::lock_guard<std::mutex> lock(_stats_mutex);
    if (index >= _stats.size()) {
        throw std::out_of_range("SinkManagerBlock::stats: no sink " + std::to_string(index));
    }
    return _stats[index];
}

std::vector<SinkStats> SinkManagerBlock::all_stats() const {
    std::lock_guard<std::mutex> lock(_stats_mutex);
    return _stats;
}

} // namespace mavtrack
