#include "xLoad/engine_counters.h"
#include <cstdlib>
#include <iostream>

namespace xload {

void EngineCountCeilingPolicy::onEngineOpened(const EngineCounters& counters,
                                              const Logger& logger) {
    int64_t opened = counters.opened();
    int64_t closed = counters.closed();
    if (opened - closed <= ceiling_) {
        return;
    }

    std::string message = "forcing failure due to engine count ceiling: " +
                          std::to_string(opened) + " - " + std::to_string(closed) +
                          " > " + std::to_string(ceiling_);
    logger.error(message);
    std::cerr << "[EngineCountGuard] FATAL: " << message << std::endl;
    std::abort();
}

std::shared_ptr<IEngineCountPolicy> makeEngineCountPolicy(int64_t max_unbalanced_engines) {
    if (max_unbalanced_engines <= 0) {
        return std::make_shared<NoopEngineCountPolicy>();
    }
    return std::make_shared<EngineCountCeilingPolicy>(max_unbalanced_engines);
}

}  // namespace xload
