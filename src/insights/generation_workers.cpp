#include "insights/generation_workers.h"

#include <stdexcept>
#include <utility>

#include "obs/logging.h"

namespace datalens {

GenerationWorkers::~GenerationWorkers() {
    Drain();
}

auto GenerationWorkers::CleanupFinishedThreads() -> void {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

auto GenerationWorkers::Submit(std::function<std::string()> call) -> std::future<std::string> {
    std::lock_guard<std::mutex> lk(mutex_);
    if (stopping_) {
        throw std::runtime_error("Generation workers are draining");
    }
    CleanupFinishedThreads();

    auto task = std::make_shared<std::packaged_task<std::string()>>(std::move(call));
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::future<std::string> result = task->get_future();
    workers_.push_back(Worker{std::thread([task, done]() {
                                  (*task)();
                                  done->store(true);
                              }),
                              done});
    return result;
}

auto GenerationWorkers::Drain() -> void {
    std::vector<Worker> to_join;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stopping_ = true;
        to_join = std::move(workers_);
        workers_.clear();
    }
    if (to_join.empty()) return;

    obs::LogEvent(obs::LogLevel::Info, "generation_workers_drain", "insight_agent",
                  {{"workers", to_join.size()}});
    for (auto& w : to_join) {
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }
}

auto GenerationWorkers::ActiveCount() -> size_t {
    std::lock_guard<std::mutex> lk(mutex_);
    CleanupFinishedThreads();
    return workers_.size();
}

} // namespace datalens
