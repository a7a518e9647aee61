#include "SpdlogInit.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

static std::shared_ptr<spdlog::logger> main_logger;

void LogStream_SpdlogInit(bool verbose) {
    const auto level = verbose ? spdlog::level::debug : spdlog::level::info;
    if (main_logger) {
        main_logger->set_level(level);
        return;
    }

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);

    main_logger = std::make_shared<spdlog::logger>("logstream", console_sink);
    main_logger->set_level(level);

    spdlog::set_default_logger(main_logger);
    spdlog::set_pattern("[%L] %v");
}

void LogStream_SpdlogDeInit() {
    if (!main_logger) {
        return;
    }
    spdlog::drop_all();
    main_logger.reset();
}
