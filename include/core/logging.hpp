#pragma once
#include <string>

namespace core {

struct LogConfig {
    std::string file;            // empty -> console only
    std::string level{"info"};   // trace/debug/info/warn/error/critical/off
    std::string name{"coincast"};
};

// Installs the default spdlog logger (console + optional file sink).
// Call once from main(); library code logs through spdlog::info/warn/...
void setup_logging(const LogConfig& cfg);

} // namespace core
