#include <algorithm>
#include <cctype>
#include <system_error>

#include "GDT.h"
#include "WorkerPool/WorkerPool.h"

WorkerPool::WorkerPool(const uint32_t num_threads) 
{
    if (num_threads > MAX_THREADS) 
    {
        throw GDTException(ErrCode::MISC, HERE(), "At most " + std::to_string(MAX_THREADS) + " worker threads are supported, " + 
                                                  std::to_string(num_threads) + " requested");
    }

    uint32_t thread_count = resolve_thread_count(num_threads);

    try 
    {
        for (uint32_t i = 0; i < thread_count; ++i) 
        {
            thread_pool_.emplace_back(&WorkerPool::thread_worker, this);
        }
    } 
    catch (const std::exception& e) 
    {
        // The destructor won't run for a half built pool
        stop_and_join();
        throw GDTException(ErrCode::MISC, HERE(), "Failed to start worker thread " + std::to_string(thread_pool_.size() + 1) + 
                                                  " of " + std::to_string(thread_count) + ": " + e.what());
    }

    GDTLog(Debug) << "Worker pool started with " << thread_count << " threads" << GDTLog::Endl;
}

WorkerPool::~WorkerPool() 
{
    stop_and_join();
}

void WorkerPool::stop_and_join() 
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_flag_ = true;
    }

    cv_.notify_all();

    for (std::thread& thread : thread_pool_) 
    {
        if (thread.joinable()) 
        {
            thread.join();
        }
    }
}

uint32_t WorkerPool::resolve_thread_count(const uint32_t requested) 
{
    if (requested > 0) 
    {
        return requested;
    }

    uint32_t hardware_threads = std::min(std::thread::hardware_concurrency(), MAX_THREADS);
    return (hardware_threads > 0) ? hardware_threads : GDT::DEFAULT_THREADS;
}

uint32_t WorkerPool::parse_thread_count(const std::string& value) 
{
    if (value == "auto") 
    {
        return 0;
    }

    if (value.empty() || value.size() > 3 || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) 
    {
        throw GDTException(ErrCode::MISC, HERE(), "Invalid thread count: " + value);
    }

    uint32_t thread_count = static_cast<uint32_t>(std::stoul(value));
    if (thread_count < 1 || thread_count > MAX_THREADS) 
    {
        throw GDTException(ErrCode::MISC, HERE(), "Thread count must be auto or between 1 and " + std::to_string(MAX_THREADS) + ": " + value);
    }

    return thread_count;
}

std::future<void> WorkerPool::submit(std::function<void()> task) 
{
    std::packaged_task<void()> packaged(std::move(task));
    std::future<void> future = packaged.get_future();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_flag_) 
        {
            throw GDTException(ErrCode::MISC, HERE(), "Task submitted to a stopped worker pool");
        }
        task_queue_.push(std::move(packaged));
    }

    cv_.notify_one();
    return future;
}

void WorkerPool::thread_worker() 
{
    while (true) 
    {
        std::packaged_task<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            cv_.wait(lock, [this] { return stop_flag_ || !task_queue_.empty(); });

            if (stop_flag_ && task_queue_.empty()) 
            {
                return;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        task();
    }
}
