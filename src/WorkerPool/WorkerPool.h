#ifndef _WORKER_POOL_H_
#define _WORKER_POOL_H_

#include <cstdint>
#include <string>
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <atomic>

/*  Fixed size pool of worker threads consuming a FIFO task queue.
    Exceptions thrown by a task are delivered through its future. 
    The destructor drains the queue before joining. */
class WorkerPool 
{
public:
    static constexpr uint32_t MAX_THREADS = 256;

    // 0 selects the hardware concurrency, more than MAX_THREADS throws MISC
    WorkerPool(const uint32_t num_threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    std::future<void> submit(std::function<void()> task);

    uint32_t size() const { return static_cast<uint32_t>(thread_pool_.size()); };

    static uint32_t resolve_thread_count(const uint32_t requested);

    // "auto" is 0, otherwise a whole number from 1 to MAX_THREADS
    static uint32_t parse_thread_count(const std::string& value);

private:
    std::vector<std::thread> thread_pool_;
    std::queue<std::packaged_task<void()>> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stop_flag_{false};

    void thread_worker();
    void stop_and_join();
};

#endif // _WORKER_POOL_H_
