#include "core/logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>
#include <memory>
#include <vector>

namespace core {

void setup_logging(const LogConfig& cfg){
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!cfg.file.empty()){
        try {
            std::filesystem::path p(cfg.file);
            if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file, false));
        } catch (const std::exception& e) {
            // console logging still works without the file
            spdlog::warn("log file {} unavailable: {}", cfg.file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(cfg.name, sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S - %n - %l - %v");
    logger->set_level(spdlog::level::from_str(cfg.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

} // namespace core
