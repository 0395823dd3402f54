#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <rex/log.h>

namespace rex {

void init_log(spdlog::level::level_enum console_log_level) {
    // the fetchers log from worker threads, so use a thread safe sink
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    if (console_log_level >= spdlog::level::level_enum::info) {
        console_sink->set_pattern("[%^%l%$] %v");
    } else {
        console_sink->set_pattern(
            "[%Y-%m-%d %H:%M:%S.%e] [%n] [thread %t] [%^%l%$] %v");
    }
    spdlog::set_default_logger(
        std::make_shared<spdlog::logger>("rex", console_sink));
    spdlog::set_level(console_log_level);
}

} // namespace rex
