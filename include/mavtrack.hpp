#pragma once

#include "mavtrack_result.hpp"
#include <dro/spsc-queue.hpp>
#include <array>
#include <algorithm> // for std::min
#include <chrono> // for timing measurements in FlowGraph
#include <tuple> // for storing block runners
#include <type_traits>
#include <utility>
#include <atomic> // for atomic adaptive sleep state
#include <string>
#include <stdexcept>

namespace mavtrack {

    enum class Error {
        // Non-fatal errors (< TERMINATE_FLOWGRAPH)
        Unknown,
        NoData,
        NotEnoughSpace,
        ProcedureError,
        BadData,
        LinkDown,
        BrokerUnavailable,
        Timeout,

        // Fatal errors (>= TERMINATE_FLOWGRAPH)
        TERMINATE_FLOWGRAPH,
        TERM_ProcedureError,
        TERM_IOError,
    };

    // Helper function for error classification
    constexpr bool is_fatal(Error error) {
        return error >= Error::TERMINATE_FLOWGRAPH;
    }

    // Errors that only mean "nothing to do right now"
    constexpr bool is_idle(Error error) {
        return error == Error::NoData || error == Error::NotEnoughSpace;
    }

    inline const char* to_str(Error error) {
        switch (error) {
            case Error::Unknown: return "Unknown error";
            case Error::NoData: return "No data available";
            case Error::NotEnoughSpace: return "Not enough space in output channel";
            case Error::ProcedureError: return "Procedure error";
            case Error::BadData: return "Bad data received";
            case Error::LinkDown: return "Telemetry link down";
            case Error::BrokerUnavailable: return "Broker unavailable";
            case Error::Timeout: return "Operation timed out";
            case Error::TERM_ProcedureError: return "TERM: Procedure error";
            case Error::TERM_IOError: return "TERM: IO error";
            default: return "Unknown error";
        }
    }

    template <typename T>
    struct ChannelBase {
        virtual ~ChannelBase() = default;
        virtual size_t size() const = 0;
        virtual size_t space() const = 0;
        virtual void push(const T&) = 0;
        virtual void pop(T&) = 0;
        virtual bool try_push(const T&) = 0;
        virtual bool try_pop(T&) = 0;
    };

    // Bounded single-producer / single-consumer channel between two blocks
    template <typename T>
    struct Channel : public ChannelBase<T> {
        explicit Channel(size_t capacity)
            : _queue(check_capacity(capacity)), _capacity(capacity) {}

        size_t size() const override { return _queue.size(); }
        size_t space() const override {
            size_t used = _queue.size();
            return used >= _capacity ? 0 : _capacity - used;
        }
        size_t capacity() const { return _capacity; }
        bool empty() const { return _queue.empty(); }

        void push(const T& v) override { _queue.push(v); }
        void pop(T& v) override { _queue.pop(v); }
        bool try_push(const T& v) override { return _queue.try_push(v); }
        bool try_pop(T& v) override { return _queue.try_pop(v); }

    private:
        static size_t check_capacity(size_t capacity) {
            if (capacity == 0) throw std::invalid_argument("Channel size must be greater than zero.");
            return capacity;
        }

        dro::SPSCQueue<T> _queue;
        size_t _capacity;
    };

    struct BlockBase {
        explicit BlockBase(const char* name) : _name(name ? name : "") {}
        explicit BlockBase(std::string name) : _name(std::move(name)) {}
        const char* name() const { return _name.c_str(); }
        BlockBase(const BlockBase&) = delete;
        BlockBase& operator=(const BlockBase&) = delete;
        BlockBase(BlockBase&&) = delete;
        BlockBase& operator=(BlockBase&&) = delete;
    private:
        std::string _name;
    };

    template<typename T>
    struct channel_to_base { using type = T; };
    template<typename T>
    struct channel_to_base<Channel<T>> { using type = ChannelBase<T>; };
    template<typename T>
    using channel_to_base_t = typename channel_to_base<T>::type;

    template<typename Block, typename... Channels>
    struct BlockRunner {
        Block* block;
        std::tuple<Channels*...> outputs;

        template<typename... OutputChannels>
        BlockRunner(Block* blk, OutputChannels*... outs)
            : block(blk), outputs(static_cast<Channels*>(outs)...) {}
    };

    // Deduces channel base types from concrete channel types:
    // BlockRunner(&block, &channel) instead of BlockRunner<Block, ChannelBase<T>>(&block, &channel)
    template<typename Block, typename... Channels>
    BlockRunner(Block*, Channels*...) -> BlockRunner<Block, channel_to_base_t<Channels>...>;

    struct BlockExecutionStats {
        std::string name;
        size_t successful_procedures = 0;
        size_t failed_procedures = 0;
        double total_dead_time_s = 0.0;
        double total_runtime_s = 0.0;
        std::atomic<double> current_adaptive_sleep_us{0.0};
        std::atomic<size_t> consecutive_fails{0};

        double get_avg_execution_time_us() const {
            return successful_procedures > 0 ? (total_runtime_s * 1e6) / successful_procedures : 0.0;
        }

        double get_cpu_utilization_percent() const {
            return total_runtime_s > 0 ? ((total_runtime_s - total_dead_time_s) / total_runtime_s) * 100.0 : 0.0;
        }
    };

    struct FlowGraphConfig {
        // Sleep with exponential backoff while a block keeps reporting NoData/NotEnoughSpace.
        // Telemetry arrives at a few Hz, so idle blocks should not spin.
        bool adaptive_sleep = true;
        double adaptive_sleep_multiplier = 1.5;
        double adaptive_sleep_max_us = 5000.0;
        size_t adaptive_sleep_fail_threshold = 10;

        bool collect_detailed_stats = false;
    };

    // A task policy supplies task_type plus create_task, join_task, yield and sleep_us
    template<typename T, typename = void>
    struct is_task_policy : std::false_type {};

    template<typename T>
    struct is_task_policy<T, std::void_t<
        typename T::task_type,
        decltype(T::create_task(std::declval<void(*)()>())),
        decltype(T::join_task(std::declval<typename T::task_type&>())),
        decltype(T::yield()),
        decltype(T::sleep_us(std::declval<size_t>()))
    >> : std::true_type {};

    template<typename TaskPolicy, typename... BlockRunners>
    class FlowGraph {
    public:
        static constexpr std::size_t _N = sizeof...(BlockRunners);
        static_assert(_N > 0, "FlowGraph must have at least one block");
        static_assert(is_task_policy<TaskPolicy>::value, "FlowGraph needs a task policy");
        using OnErrTerminateCallback = void (*)(void* context);

        FlowGraph(BlockRunners... runners)
            : _runners(std::make_tuple(std::move(runners)...)) {}

        ~FlowGraph() { stop(); }

        FlowGraph(const FlowGraph&) = delete;
        FlowGraph(FlowGraph&&) = delete;
        FlowGraph& operator=(const FlowGraph&) = delete;
        FlowGraph& operator=(FlowGraph&&) = delete;

        void set_on_err_terminate_cb(OnErrTerminateCallback cb, void* context) {
            _on_err_terminate_cb = cb;
            _on_err_terminate_context = context;
        }

        void run(const FlowGraphConfig& config = FlowGraphConfig{}) {
            _config = config;
            _stop_flag.store(false, std::memory_order_release);
            if (_config.collect_detailed_stats) {
                init_stats_impl(std::make_index_sequence<_N>{});
            }
            launch_tasks_impl(std::make_index_sequence<_N>{}, _config);
        }

        void stop() {
            _stop_flag.store(true, std::memory_order_release);
            // Only join tasks that were actually created
            for (size_t i = 0; i < _active_task_count; ++i) {
                TaskPolicy::join_task(_tasks[i]);
            }
            _active_task_count = 0;
        }

        bool is_stopped() const {
            return _stop_flag.load(std::memory_order_acquire);
        }

        const FlowGraphConfig& config() const { return _config; }
        const std::array<BlockExecutionStats, _N>& stats() const { return _stats; }

    private:
        void handle_adaptive_sleep(size_t block_idx, bool procedure_succeeded) {
            if (!_config.adaptive_sleep) return;

            auto& stats = _stats[block_idx];

            if (procedure_succeeded) {
                stats.consecutive_fails.store(0);
                double current_sleep = stats.current_adaptive_sleep_us.load();
                stats.current_adaptive_sleep_us.store(current_sleep * 0.5);
            } else {
                size_t fails = stats.consecutive_fails.fetch_add(1) + 1;

                if (fails > _config.adaptive_sleep_fail_threshold) {
                    double current_sleep = stats.current_adaptive_sleep_us.load();

                    if (current_sleep == 0.0) {
                        static constexpr double INITIAL_SLEEP_US = 1.0;
                        stats.current_adaptive_sleep_us.store(INITIAL_SLEEP_US);
                        TaskPolicy::sleep_us(static_cast<size_t>(INITIAL_SLEEP_US));
                    } else {
                        // Deterministic per-block jitter (10% variation)
                        static constexpr double JITTER_FACTOR = 0.1;
                        double block_jitter = 1.0 + JITTER_FACTOR * (double(block_idx % 10) / 10.0 - 0.5);

                        double new_sleep = std::min(
                            current_sleep * _config.adaptive_sleep_multiplier * block_jitter,
                            _config.adaptive_sleep_max_us
                        );
                        stats.current_adaptive_sleep_us.store(new_sleep);
                        TaskPolicy::sleep_us(static_cast<size_t>(new_sleep));
                    }
                } else {
                    TaskPolicy::yield();
                }
            }
        }

    public:
        // Public because it is called from the lambdas handed to TaskPolicy::create_task();
        // compilers disagree on lambda access to private members.
        template<std::size_t I>
        void run_block_at_index(const FlowGraphConfig& config) {
            static_assert(I < _N, "Block index out of bounds");
            auto& runner = std::get<I>(_runners);
            auto& stats = _stats[I];

            std::chrono::steady_clock::time_point t_start, t_last;
            size_t successful = 0, failed = 0;
            double total_dead_time_s = 0.0;

            if (config.collect_detailed_stats) {
                t_start = t_last = std::chrono::steady_clock::now();
            }

            while (!_stop_flag.load(std::memory_order_acquire)) {
                std::chrono::duration<double> dt{};
                if (config.collect_detailed_stats) {
                    auto t_now = std::chrono::steady_clock::now();
                    dt = t_now - t_last;
                    t_last = t_now;
                }

                Result<Empty, Error> result = std::apply([&](auto*... outs) {
                    return runner.block->procedure(outs...);
                }, runner.outputs);

                if (result.is_err()) {
                    failed++;
                    auto err = result.unwrap_err();

                    if (is_fatal(err)) {
                        _stop_flag.store(true, std::memory_order_release);
                        if (_on_err_terminate_cb) {
                            _on_err_terminate_cb(_on_err_terminate_context);
                        }
                        break;
                    }

                    if (is_idle(err)) {
                        total_dead_time_s += dt.count();
                        handle_adaptive_sleep(I, false);
                    } else {
                        TaskPolicy::yield();
                    }
                } else {
                    successful++;
                    handle_adaptive_sleep(I, true);
                }
            }

            if (config.collect_detailed_stats) {
                std::chrono::duration<double> total_runtime_s = std::chrono::steady_clock::now() - t_start;
                stats.successful_procedures = successful;
                stats.failed_procedures = failed;
                stats.total_dead_time_s = total_dead_time_s;
                stats.total_runtime_s = total_runtime_s.count();
            }
        }

    private:
        template<std::size_t... Is>
        void launch_tasks_impl(std::index_sequence<Is...>, const FlowGraphConfig& config) {
            ((_tasks[Is] = TaskPolicy::create_task([this, config]() {
                run_block_at_index<Is>(config);
            })), ...);
            _active_task_count = _N;
        }

        template<std::size_t... Is>
        void init_stats_impl(std::index_sequence<Is...>) {
            ((_stats[Is].name = std::get<Is>(_runners).block->name()), ...);
        }

        std::tuple<BlockRunners...> _runners;
        std::array<typename TaskPolicy::task_type, _N> _tasks;
        std::atomic<bool> _stop_flag{false};
        FlowGraphConfig _config;
        std::array<BlockExecutionStats, _N> _stats;
        OnErrTerminateCallback _on_err_terminate_cb = nullptr;
        void* _on_err_terminate_context = nullptr;
        size_t _active_task_count{0};
    };

} // namespace mavtrack
