#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace rlk {

enum class Severity {
  Info,
  Warning,
  Error
};

const char* severity_name(Severity severity);
bool parse_severity(std::string_view text, Severity& out);

struct ReportItem {
  std::string category;
  Severity severity = Severity::Info;
  std::string message;
  std::optional<std::string> timeline;
  std::optional<std::string> clip;
  std::optional<std::string> timecode;
  nlohmann::json data = nlohmann::json::object();
};

ReportItem item_info(std::string category, std::string message, std::optional<std::string> clip = std::nullopt,
                     nlohmann::json data = nlohmann::json::object());
ReportItem item_warning(std::string category, std::string message, std::optional<std::string> clip = std::nullopt,
                        nlohmann::json data = nlohmann::json::object());
ReportItem item_error(std::string category, std::string message, std::optional<std::string> clip = std::nullopt,
                      nlohmann::json data = nlohmann::json::object());

struct Report {
  std::string tool_id;
  std::string title;
  std::string created_at;
  std::vector<ReportItem> items;
  nlohmann::json summary = nlohmann::json::object();

  void add(ReportItem item) { items.push_back(std::move(item)); }
  size_t count(Severity severity) const;
  bool has_errors() const { return count(Severity::Error) > 0; }
};

// created_at is stamped with the current UTC time.
Report make_report(std::string tool_id, std::string title);

Report merge_reports(const std::vector<Report>& reports, const std::string& title);

// Structured record form; parse_report reverses it field for field.
nlohmann::json to_json(const ReportItem& item);
nlohmann::json to_json(const Report& report);
bool parse_report(const nlohmann::json& j, Report& out, std::string& error);

// Flat table: category,severity,message,timeline,clip,timecode,data.
// An empty report renders as an empty string.
std::string render_csv(const Report& report);
std::string render_html(const Report& report);

enum class ReportFormat {
  Json,
  Csv,
  Html
};

bool parse_report_format(std::string_view text, ReportFormat& out);
std::string render_report(const Report& report, ReportFormat format);

// Writes <tool_id>_<YYYYmmdd_HHMMSS>.<ext> for each format into out_dir and
// returns the paths written.
std::vector<std::filesystem::path> save_report(const Report& report,
                                               const std::filesystem::path& out_dir,
                                               const std::vector<ReportFormat>& formats);

} // namespace rlk
