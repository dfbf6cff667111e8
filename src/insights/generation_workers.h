#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace datalens {

// Owns the threads that run text-generation calls. A caller may stop waiting
// on a call; the thread stays tracked here until Drain() joins it.
class GenerationWorkers {
public:
    GenerationWorkers() = default;
    ~GenerationWorkers();

    GenerationWorkers(const GenerationWorkers&) = delete;
    GenerationWorkers& operator=(const GenerationWorkers&) = delete;

    // Runs `call` on a new tracked thread. Exceptions from `call` surface
    // through the future. Throws std::runtime_error once draining started.
    auto Submit(std::function<std::string()> call) -> std::future<std::string>;

    // Refuses new calls and blocks until every worker has returned.
    auto Drain() -> void;

    auto ActiveCount() -> size_t;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Caller holds mutex_.
    auto CleanupFinishedThreads() -> void;

    std::mutex mutex_;
    std::vector<Worker> workers_;
    bool stopping_ = false;
};

} // namespace datalens
