// ============================================================================
//  File: include/render_pool.hpp — Pool borné de workers de rendu (DOC+)
//  Project: E-Ink Gallery Renderer v1
//
//  • N threads consomment une file FIFO de capacité fixe.
//  • submit() bloque tant que la file est pleine (contre-pression).
//  • shutdown() : plus d’admission, la file est vidée, puis join. Idempotent,
//    appelable depuis plusieurs threads.
//  • submit() après shutdown() : future invalide (valid()==false).
//
//  Exemple:
//    RenderPool pool(4, 16);
//    auto f = pool.submit([&]{ return render_decoded(img, prof, opt, frame, &err); });
//    bool ok = f.get();
// ============================================================================

#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace EinkGallery
{

class RenderPool
{
public:
    // workers==0 → hardware_concurrency (au moins 1). capacity==0 → 1.
    RenderPool(unsigned workers, size_t capacity);
    ~RenderPool();

    RenderPool(const RenderPool&) = delete;
    RenderPool& operator=(const RenderPool&) = delete;

    template<class F>
    std::future<typename std::invoke_result<F>::type> submit(F&& fn)
    {
        using R = typename std::invoke_result<F>::type;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> fut = task->get_future();
        std::function<void()> job = [task]()
        {
            (*task)();
        };
        if(!enqueue(std::move(job))) return std::future<R>();
        return fut;
    }

    void   shutdown();
    size_t worker_count() const
    {
        return worker_count_;
    }
    size_t capacity() const
    {
        return capacity_;
    }
    size_t pending() const;

private:
    bool enqueue(std::function<void()> job);
    void worker_loop();

    size_t                              capacity_;
    size_t                              worker_count_;
    mutable std::mutex                  mu_;
    std::condition_variable             not_empty_;
    std::condition_variable             not_full_;
    std::deque<std::function<void()>>   queue_;
    std::vector<std::thread>            threads_;
    bool                                stopping_ = false;
};

} // namespace EinkGallery
