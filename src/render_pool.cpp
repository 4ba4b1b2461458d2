// ============================================================================
//  File: src/render_pool.cpp — Pool borné de workers de rendu
//  Project: E-Ink Gallery Renderer v1
// ============================================================================

#include "render_pool.hpp"
#include "gallery_log.hpp"

#include <algorithm>

namespace EinkGallery
{

RenderPool::RenderPool(unsigned workers, size_t capacity)
    : capacity_(std::max<size_t>(1, capacity))
{
    if(workers==0) workers = std::max(1u, std::thread::hardware_concurrency());
    worker_count_ = workers;
    threads_.reserve(workers);
    for(unsigned i=0; i<workers; ++i) threads_.emplace_back(&RenderPool::worker_loop, this);
    log_debug("render pool: " + std::to_string(workers) + " workers, queue " + std::to_string(capacity_));
}

RenderPool::~RenderPool()
{
    shutdown();
}

size_t RenderPool::pending() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.size();
}

bool RenderPool::enqueue(std::function<void()> job)
{
    std::unique_lock<std::mutex> lk(mu_);
    not_full_.wait(lk, [this]
    {
        return stopping_ || queue_.size()<capacity_;
    });
    if(stopping_)
    {
        log_warn("render pool is shutting down, job rejected");
        return false;
    }
    queue_.push_back(std::move(job));
    lk.unlock();
    not_empty_.notify_one();
    return true;
}

void RenderPool::worker_loop()
{
    for(;;)
    {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lk(mu_);
            not_empty_.wait(lk, [this]
            {
                return stopping_ || !queue_.empty();
            });
            // arrêt seulement une fois la file vidée
            if(queue_.empty()) return;
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        not_full_.notify_one();
        // packaged_task: une exception du job est stockée dans le future
        job();
    }
}

void RenderPool::shutdown()
{
    // un seul appelant récupère les threads; les suivants n’ont rien à joindre
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopping_ = true;
        workers.swap(threads_);
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    for(std::thread& t: workers)
    {
        if(t.joinable()) t.join();
    }
}

} // namespace EinkGallery
