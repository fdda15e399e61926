#pragma once

#include <functional>

namespace voice_orchestrator {
namespace utils {

// Executes a unit of background work. Production code hands work to a
// detached thread; tests substitute a runner that executes inline.
using AsyncRunner = std::function<void(std::function<void()>)>;

void run_async(std::function<void()> task);
AsyncRunner default_async_runner();

}
}
