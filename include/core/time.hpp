#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace core {

std::int64_t now_ms();

// "YYYY-MM-DD" or "YYYY-MM-DD HH:MM:SS" (UTC) -> epoch ms
std::optional<std::int64_t> parse_utc(const std::string& s);

// epoch ms -> "YYYY-MM-DD HH:MM:SS" (UTC)
std::string format_utc(std::int64_t ms);

// epoch ms -> "YYYY-MM-DD" (UTC)
std::string format_date(std::int64_t ms);

} // namespace core
