#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace rlk::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Without init() lines only go to stdout and the ring buffer.
void init(const std::string& app_name, const std::filesystem::path& logs_dir);
void shutdown();
void install_crash_handlers();

void set_level(Level level);
bool parse_level(std::string_view text, Level& out);

// Attached to every JSON-line record until cleared.
void set_context(const std::string& key, const std::string& value);
void clear_context();

void debug(std::string_view msg);
void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

std::vector<std::string> recent(size_t max_entries = 200);

} // namespace rlk::log
