#pragma once
// PathJobs.hpp - worker pool and cancellation for off-thread searches.
//
// Requires: taskflow (header-only), #include <taskflow/taskflow.hpp>

#include <taskflow/taskflow.hpp>
#include <taskflow/algorithm/for_each.hpp>

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>

namespace gridnav::pf {

// Cooperative cancellation token (shared across threads).
// A token with a parent also reports cancelled once the parent is, so a race can
// be stopped both by its caller and by whichever side finishes first.
class CancelToken {
public:
    CancelToken() = default;
    explicit CancelToken(std::shared_ptr<const CancelToken> parent) : _parent(std::move(parent)) {}

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void Cancel() noexcept { _cancelled.store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool IsCancelled() const noexcept {
        if (_cancelled.load(std::memory_order_relaxed)) return true;
        return _parent && _parent->IsCancelled();
    }

private:
    std::atomic<bool> _cancelled{false};
    std::shared_ptr<const CancelToken> _parent;
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

inline CancelTokenPtr MakeCancelToken(std::shared_ptr<const CancelToken> parent = nullptr) {
    return parent ? std::make_shared<CancelToken>(std::move(parent)) : std::make_shared<CancelToken>();
}

// ------------------------------
// SearchExecutor
// ------------------------------

// Owns the Taskflow worker pool searches and grid generation run on.
class SearchExecutor {
public:
    struct Config {
        // Number of worker threads in the Taskflow executor.
        // If 0, we auto-pick max(1, hw_concurrency-2).
        unsigned workerThreads{0};
    };

    SearchExecutor() : SearchExecutor(Config{}) {}
    explicit SearchExecutor(Config cfg)
    : _executor(ResolveWorkerCount(cfg.workerThreads)) {}

    SearchExecutor(const SearchExecutor&) = delete;
    SearchExecutor& operator=(const SearchExecutor&) = delete;

    ~SearchExecutor() { Shutdown(); }

    // Launch a callable on the pool. Returns std::future<R>.
    // Throws std::runtime_error once Shutdown() has been called.
    template <typename F>
    auto Submit(F&& fn) {
        if (_stopping.load(std::memory_order_acquire))
            throw std::runtime_error("SearchExecutor: stopping");
        return _executor.async(std::forward<F>(fn));
    }

    // Blocking index loop over [first, last). Call from the owning thread, never from a task.
    template <typename Index, typename F>
    std::enable_if_t<std::is_integral_v<Index>, void>
    ParallelForIndex(Index first, Index last, Index step, F&& fn) {
        if (_stopping.load(std::memory_order_acquire))
            throw std::runtime_error("SearchExecutor: stopping");
        tf::Taskflow taskflow;
        taskflow.for_each_index(first, last, step, std::forward<F>(fn));
        _executor.run(std::move(taskflow)).wait();
    }

    // Refuse new work and wait for what is already queued.
    void Shutdown() {
        if (_stopping.exchange(true, std::memory_order_acq_rel)) return;
        _executor.wait_for_all();
    }

    [[nodiscard]] bool IsStopping() const noexcept { return _stopping.load(std::memory_order_acquire); }

    [[nodiscard]] unsigned WorkerCount() const noexcept {
        return static_cast<unsigned>(_executor.num_workers());
    }

private:
    static unsigned ResolveWorkerCount(unsigned requested) {
        if (requested > 0) return requested;
        // Default: leave 2 cores for the main/simulation threads; always >= 1.
        const unsigned hw = std::thread::hardware_concurrency();
        return hw > 2 ? (hw - 2) : 1u;
    }

    tf::Executor _executor;
    std::atomic<bool> _stopping{false};
};

} // namespace gridnav::pf
