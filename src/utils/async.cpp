#include "voice_orchestrator/utils/async.hpp"

#include <exception>
#include <thread>

#include "voice_orchestrator/logging.hpp"


namespace voice_orchestrator::utils {

void run_async(std::function<void()> task) {
    std::thread worker([task = std::move(task)]() mutable {
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error(
                "Background task failed",
                {kv("error", ex.what())});
        }
    });
    worker.detach();
}

AsyncRunner default_async_runner() {
    return [](std::function<void()> task) { run_async(std::move(task)); };
}

}
