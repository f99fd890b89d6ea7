#pragma once

#include <functional>
#include <future>
#include <memory>
#include <type_traits>

namespace horde::core {

// Process-wide worker pool. The Director loads its clip catalog here;
// ticks always stay on the calling thread.
struct JobSystem {
    // 0 picks hardware_concurrency - 1 (at least one worker)
    static void init(int num_threads = 0);

    // Drains queued jobs, then joins the workers
    static void shutdown();

    // Without a running pool the job executes immediately on the caller
    static void submit(std::function<void()> job);

    template<typename F, typename R = std::invoke_result_t<F>>
    static std::future<R> submit_with_result(F&& func) {
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(func));
        std::future<R> result = task->get_future();
        submit([task]() { (*task)(); });
        return result;
    }

    // Blocks until every submitted job has finished
    static void wait_all();

    static int thread_count();
    static bool is_running();
    static bool is_worker_thread();
};

} // namespace horde::core
