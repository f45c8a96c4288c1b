#include "rlk/log.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

namespace rlk::log {

namespace {
std::mutex g_log_mutex;
std::ofstream g_log_file;
std::ofstream g_jsonl_file;
std::deque<std::string> g_ring;
constexpr size_t kRingMax = 200;
std::string g_app_name = "rlk";
Level g_level = Level::Info;
std::map<std::string, std::string> g_context;

std::tm local_now() {
  const auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&tt, &tm);
  return tm;
}

std::string format_now(const char* fmt) {
  const std::tm tm = local_now();
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

const char* level_name(Level level) {
  switch (level) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
  }
  return "INFO";
}

void log_line(Level level, std::string_view msg) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (level < g_level) return;
  const char* name = level_name(level);
  const std::string line = "[" + format_now("%Y-%m-%d %H:%M:%S") + "][" + name + "] " + std::string(msg);
  std::cout << line << "\n";
  if (g_log_file.is_open()) {
    g_log_file << line << "\n";
    g_log_file.flush();
  }
  if (g_jsonl_file.is_open()) {
    nlohmann::json rec;
    rec["ts"] = format_now("%Y-%m-%dT%H:%M:%S%z");
    rec["level"] = name;
    rec["name"] = g_app_name;
    rec["message"] = std::string(msg);
    for (const auto& kv : g_context) {
      rec[kv.first] = kv.second;
    }
    g_jsonl_file << rec.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace) << "\n";
    g_jsonl_file.flush();
  }
  g_ring.push_back(line);
  if (g_ring.size() > kRingMax) {
    g_ring.pop_front();
  }
}
} // namespace

void init(const std::string& app_name, const std::filesystem::path& logs_dir) {
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_app_name = app_name;
    std::error_code ec;
    std::filesystem::create_directories(logs_dir, ec);
    const std::string file_name = g_app_name + "_" + format_now("%Y%m%d_%H%M%S") + ".log";
    if (g_log_file.is_open()) g_log_file.close();
    if (g_jsonl_file.is_open()) g_jsonl_file.close();
    g_log_file.open(logs_dir / file_name, std::ios::out | std::ios::app);
    g_jsonl_file.open(logs_dir / (g_app_name + ".jsonl"), std::ios::out | std::ios::app);
  }
  log_line(Level::Info, "log init");
  log_line(Level::Info, std::string("logs: ") + logs_dir.string());
#ifdef RLK_GIT_HASH
  log_line(Level::Info, std::string("git: ") + RLK_GIT_HASH);
#endif
}

void shutdown() {
  log_line(Level::Info, "log shutdown");
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
  if (g_jsonl_file.is_open()) {
    g_jsonl_file.close();
  }
}

void set_level(Level level) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_level = level;
}

bool parse_level(std::string_view text, Level& out) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "debug") out = Level::Debug;
  else if (lowered == "info") out = Level::Info;
  else if (lowered == "warn" || lowered == "warning") out = Level::Warn;
  else if (lowered == "error") out = Level::Error;
  else return false;
  return true;
}

void set_context(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_context[key] = value;
}

void clear_context() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_context.clear();
}

void debug(std::string_view msg) {
  log_line(Level::Debug, msg);
}

void info(std::string_view msg) {
  log_line(Level::Info, msg);
}

void warn(std::string_view msg) {
  log_line(Level::Warn, msg);
}

void error(std::string_view msg) {
  log_line(Level::Error, msg);
}

std::vector<std::string> recent(size_t max_entries) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const size_t count = std::min(max_entries, g_ring.size());
  return std::vector<std::string>(g_ring.end() - static_cast<std::ptrdiff_t>(count), g_ring.end());
}

namespace {
void signal_handler(int sig) {
  log_line(Level::Error, std::string("crash signal: ") + std::to_string(sig));
  std::_Exit(1);
}
} // namespace

void install_crash_handlers() {
  std::signal(SIGSEGV, signal_handler);
  std::signal(SIGABRT, signal_handler);
  std::signal(SIGFPE, signal_handler);
  std::signal(SIGILL, signal_handler);
}

} // namespace rlk::log
