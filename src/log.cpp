#include "log.hpp"

#include <string>

namespace svcreg::internal {

std::shared_ptr<spdlog::logger> logger() {
    static const auto instance = [] {
        const std::string name = "svcreg";
        auto log = spdlog::get(name);
        if (!log) {
            const auto& sinks = spdlog::default_logger()->sinks();
            log = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
            spdlog::initialize_logger(log);
        }
        return log;
    }();
    return instance;
}

} // namespace svcreg::internal
