#include "rlk/report.h"

#include "rlk/log.h"
#include "rlk/time_util.h"
#include "rlk_data/serialization.h"

#include <sstream>
#include <system_error>

namespace rlk {

namespace {
ReportItem make_item(Severity severity, std::string category, std::string message,
                     std::optional<std::string> clip, nlohmann::json data) {
  ReportItem item;
  item.category = std::move(category);
  item.severity = severity;
  item.message = std::move(message);
  item.clip = std::move(clip);
  item.data = data.is_null() ? nlohmann::json::object() : std::move(data);
  return item;
}

nlohmann::json optional_json(const std::optional<std::string>& value) {
  if (value.has_value()) return *value;
  return nullptr;
}

bool read_optional(const nlohmann::json& j, const char* key, std::optional<std::string>& out) {
  if (!j.contains(key) || j[key].is_null()) {
    out.reset();
    return true;
  }
  if (!j[key].is_string()) return false;
  out = j[key].get<std::string>();
  return true;
}

std::string csv_field(std::string_view value) {
  const bool quote = value.find_first_of(",\"\r\n") != std::string_view::npos;
  if (!quote) return std::string(value);
  std::string out = "\"";
  for (char c : value) {
    if (c == '"') out += "\"\"";
    else out.push_back(c);
  }
  out += "\"";
  return out;
}

std::string html_escape(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&#39;"; break;
      default: out.push_back(c); break;
    }
  }
  return out;
}

std::string summary_value(const nlohmann::json& v) {
  if (v.is_string()) return v.get<std::string>();
  return v.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

const char* extension(ReportFormat format) {
  switch (format) {
    case ReportFormat::Json: return ".json";
    case ReportFormat::Csv: return ".csv";
    case ReportFormat::Html: return ".html";
  }
  return ".txt";
}
} // namespace

const char* severity_name(Severity severity) {
  switch (severity) {
    case Severity::Info: return "info";
    case Severity::Warning: return "warning";
    case Severity::Error: return "error";
  }
  return "info";
}

bool parse_severity(std::string_view text, Severity& out) {
  if (text == "info") out = Severity::Info;
  else if (text == "warning") out = Severity::Warning;
  else if (text == "error") out = Severity::Error;
  else return false;
  return true;
}

ReportItem item_info(std::string category, std::string message, std::optional<std::string> clip,
                     nlohmann::json data) {
  return make_item(Severity::Info, std::move(category), std::move(message), std::move(clip), std::move(data));
}

ReportItem item_warning(std::string category, std::string message, std::optional<std::string> clip,
                        nlohmann::json data) {
  return make_item(Severity::Warning, std::move(category), std::move(message), std::move(clip), std::move(data));
}

ReportItem item_error(std::string category, std::string message, std::optional<std::string> clip,
                      nlohmann::json data) {
  return make_item(Severity::Error, std::move(category), std::move(message), std::move(clip), std::move(data));
}

size_t Report::count(Severity severity) const {
  size_t n = 0;
  for (const auto& item : items) {
    if (item.severity == severity) ++n;
  }
  return n;
}

Report make_report(std::string tool_id, std::string title) {
  Report report;
  report.tool_id = std::move(tool_id);
  report.title = std::move(title);
  report.created_at = now_iso_utc();
  return report;
}

Report merge_reports(const std::vector<Report>& reports, const std::string& title) {
  Report merged = make_report("aggregate", title);
  for (const auto& report : reports) {
    merged.items.insert(merged.items.end(), report.items.begin(), report.items.end());
  }
  merged.summary = {{"reports", reports.size()}};
  return merged;
}

nlohmann::json to_json(const ReportItem& item) {
  nlohmann::json j;
  j["category"] = item.category;
  j["severity"] = severity_name(item.severity);
  j["message"] = item.message;
  j["timeline"] = optional_json(item.timeline);
  j["clip"] = optional_json(item.clip);
  j["timecode"] = optional_json(item.timecode);
  j["data"] = item.data;
  return j;
}

nlohmann::json to_json(const Report& report) {
  nlohmann::json j;
  j["tool_id"] = report.tool_id;
  j["title"] = report.title;
  j["created_at"] = report.created_at;
  j["summary"] = report.summary;
  j["items"] = nlohmann::json::array();
  for (const auto& item : report.items) {
    j["items"].push_back(to_json(item));
  }
  return j;
}

bool parse_report(const nlohmann::json& j, Report& out, std::string& error) {
  if (!j.is_object()) {
    error = "report must be an object";
    return false;
  }
  Report report;
  report.tool_id = j.value("tool_id", "");
  report.title = j.value("title", "");
  report.created_at = j.value("created_at", "");
  if (j.contains("summary")) {
    if (!j["summary"].is_object()) {
      error = "summary: expected object";
      return false;
    }
    report.summary = j["summary"];
  }
  if (!j.contains("items") || !j["items"].is_array()) {
    error = "items: expected array";
    return false;
  }
  const auto& items = j["items"];
  for (size_t i = 0; i < items.size(); ++i) {
    const auto& entry = items[i];
    const std::string base = "items[" + std::to_string(i) + "]";
    if (!entry.is_object()) {
      error = base + ": expected object";
      return false;
    }
    ReportItem item;
    item.category = entry.value("category", "");
    item.message = entry.value("message", "");
    if (!parse_severity(entry.value("severity", ""), item.severity)) {
      error = base + ".severity: expected info, warning or error";
      return false;
    }
    if (!read_optional(entry, "timeline", item.timeline) || !read_optional(entry, "clip", item.clip) ||
        !read_optional(entry, "timecode", item.timecode)) {
      error = base + ": tag fields must be strings or null";
      return false;
    }
    if (entry.contains("data") && entry["data"].is_object()) {
      item.data = entry["data"];
    }
    report.items.push_back(std::move(item));
  }
  out = std::move(report);
  return true;
}

std::string render_csv(const Report& report) {
  if (report.items.empty()) return {};
  std::ostringstream oss;
  oss << "category,severity,message,timeline,clip,timecode,data\r\n";
  for (const auto& item : report.items) {
    oss << csv_field(item.category) << ','
        << csv_field(severity_name(item.severity)) << ','
        << csv_field(item.message) << ','
        << csv_field(item.timeline.value_or("")) << ','
        << csv_field(item.clip.value_or("")) << ','
        << csv_field(item.timecode.value_or("")) << ','
        << csv_field(item.data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)) << "\r\n";
  }
  return oss.str();
}

std::string render_html(const Report& report) {
  std::ostringstream oss;
  oss << "<html><head><meta charset='utf-8'>\n"
      << "<title>" << html_escape(report.title) << "</title>\n"
      << "</head><body>\n"
      << "<h1>" << html_escape(report.title) << "</h1>\n"
      << "<p>Generated: " << html_escape(report.created_at) << "</p>\n";
  if (!report.summary.empty()) {
    oss << "<h2>Summary</h2>\n<table border='1' cellspacing='0' cellpadding='4'>\n";
    for (auto it = report.summary.begin(); it != report.summary.end(); ++it) {
      oss << "<tr><th>" << html_escape(it.key()) << "</th><td>" << html_escape(summary_value(it.value()))
          << "</td></tr>\n";
    }
    oss << "</table>\n";
  }
  oss << "<h2>Items</h2>\n<table border='1' cellspacing='0' cellpadding='4'>\n"
      << "<tr><th>Severity</th><th>Category</th><th>Message</th><th>Timeline</th><th>Clip</th>"
      << "<th>Timecode</th></tr>\n";
  for (const auto& item : report.items) {
    oss << "<tr class='" << severity_name(item.severity) << "'>"
        << "<td>" << severity_name(item.severity) << "</td>"
        << "<td>" << html_escape(item.category) << "</td>"
        << "<td>" << html_escape(item.message) << "</td>"
        << "<td>" << html_escape(item.timeline.value_or("")) << "</td>"
        << "<td>" << html_escape(item.clip.value_or("")) << "</td>"
        << "<td>" << html_escape(item.timecode.value_or("")) << "</td>"
        << "</tr>\n";
  }
  oss << "</table>\n</body></html>\n";
  return oss.str();
}

bool parse_report_format(std::string_view text, ReportFormat& out) {
  if (text == "json") out = ReportFormat::Json;
  else if (text == "csv") out = ReportFormat::Csv;
  else if (text == "html") out = ReportFormat::Html;
  else return false;
  return true;
}

std::string render_report(const Report& report, ReportFormat format) {
  switch (format) {
    case ReportFormat::Json:
      // File names are raw bytes; invalid UTF-8 is replaced rather than thrown.
      return to_json(report).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    case ReportFormat::Csv: return render_csv(report);
    case ReportFormat::Html: return render_html(report);
  }
  return {};
}

std::vector<std::filesystem::path> save_report(const Report& report,
                                               const std::filesystem::path& out_dir,
                                               const std::vector<ReportFormat>& formats) {
  std::vector<std::filesystem::path> written;
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    log::error("cannot create report dir " + out_dir.string() + ": " + ec.message());
    return written;
  }
  const std::string base = (report.tool_id.empty() ? std::string("report") : report.tool_id) + "_" + now_stamp();
  for (const auto format : formats) {
    const auto path = out_dir / (base + extension(format));
    if (data::write_text_file(path, render_report(report, format))) {
      written.push_back(path);
    } else {
      log::error("report export failed: " + path.string());
    }
  }
  return written;
}

} // namespace rlk
