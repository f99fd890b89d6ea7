#include <horde/core/job_system.hpp>
#include <horde/core/log.hpp>
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace horde::core {

namespace {

thread_local bool t_is_worker = false;

struct Pool {
    std::mutex mutex;
    std::condition_variable_any wake;
    std::condition_variable idle;
    std::deque<std::function<void()>> jobs;
    std::vector<std::jthread> workers;
    int in_flight = 0;     // Queued plus running
};

Pool g_pool;

void run_worker(std::stop_token stop) {
    t_is_worker = true;

    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock lock(g_pool.mutex);
            // Returns false only once stop was requested and the queue is dry
            if (!g_pool.wake.wait(lock, stop, [] { return !g_pool.jobs.empty(); })) {
                return;
            }
            job = std::move(g_pool.jobs.front());
            g_pool.jobs.pop_front();
        }

        job();

        std::lock_guard lock(g_pool.mutex);
        if (--g_pool.in_flight == 0) {
            g_pool.idle.notify_all();
        }
    }
}

} // anonymous namespace

void JobSystem::init(int num_threads) {
    if (is_running()) return;

    if (num_threads <= 0) {
        num_threads = static_cast<int>(std::thread::hardware_concurrency()) - 1;
    }
    num_threads = std::max(num_threads, 1);

    std::lock_guard lock(g_pool.mutex);
    g_pool.workers.reserve(static_cast<size_t>(num_threads));
    for (int i = 0; i < num_threads; ++i) {
        g_pool.workers.emplace_back(run_worker);
    }

    log(LogLevel::Debug, "[JobSystem] Started " + std::to_string(num_threads) + " workers");
}

void JobSystem::shutdown() {
    if (!is_running()) return;

    wait_all();

    std::vector<std::jthread> workers;
    {
        std::lock_guard lock(g_pool.mutex);
        workers.swap(g_pool.workers);
    }
    // jthread requests stop and joins on destruction
    workers.clear();

    log(LogLevel::Debug, "[JobSystem] Stopped");
}

void JobSystem::submit(std::function<void()> job) {
    {
        std::lock_guard lock(g_pool.mutex);
        if (!g_pool.workers.empty()) {
            g_pool.jobs.push_back(std::move(job));
            ++g_pool.in_flight;
            g_pool.wake.notify_one();
            return;
        }
    }
    job();
}

void JobSystem::wait_all() {
    std::unique_lock lock(g_pool.mutex);
    g_pool.idle.wait(lock, [] { return g_pool.in_flight == 0; });
}

int JobSystem::thread_count() {
    std::lock_guard lock(g_pool.mutex);
    return static_cast<int>(g_pool.workers.size());
}

bool JobSystem::is_running() {
    return thread_count() > 0;
}

bool JobSystem::is_worker_thread() {
    return t_is_worker;
}

} // namespace horde::core
