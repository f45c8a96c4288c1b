#include "rlk/asset.h"
#include "rlk/config.h"
#include "rlk/log.h"
#include "rlk/mapping_pack.h"
#include "rlk/name_index.h"
#include "rlk/presets.h"
#include "rlk/relink.h"
#include "rlk/report.h"
#include "rlk/resolver.h"
#include "rlk/similarity.h"
#include "rlk/text.h"
#include "rlk/transaction.h"
#include "rlk_data/serialization.h"
#include "rlkctl/cli_api.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

int failures = 0;

void check(bool cond, const std::string& what) {
  if (!cond) {
    std::cerr << "FAIL: " << what << "\n";
    ++failures;
  }
}

fs::path make_temp_root() {
  std::random_device rd;
  const fs::path root = fs::temp_directory_path() / ("rlk_tests_" + std::to_string(rd()));
  fs::create_directories(root);
  return root;
}

bool touch(const fs::path& path) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  if (!out) return false;
  out << "x";
  return true;
}

bool write_text(const fs::path& path, const std::string& contents) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  if (!out) return false;
  out << contents;
  return true;
}

rlk::Rule make_rule(const std::string& source, rlk::Strategy strategy, const std::string& target) {
  rlk::Rule rule;
  rule.source = source;
  rule.strategy = strategy;
  rule.target = target;
  return rule;
}

size_t count_items(const rlk::Report& report, const std::string& category, rlk::Severity severity) {
  size_t n = 0;
  for (const auto& item : report.items) {
    if (item.category == category && item.severity == severity) ++n;
  }
  return n;
}

class RecordingSink final : public rlk::RelinkSink {
 public:
  bool fail = false;
  std::vector<std::pair<std::string, std::string>> calls;

  bool relink(const rlk::AssetDescriptor& asset, const std::string& target, std::string& error) override {
    calls.emplace_back(asset.name, target);
    if (fail) {
      error = "host refused";
      return false;
    }
    return true;
  }
};

} // namespace

int main() {
  const fs::path root = make_temp_root();
  rlk::log::init("rlk_tests", root / "logs");

  // Test: normalizer.
  {
    check(rlk::text::normalize("My-File_01.MOV") == rlk::text::normalize("myfile01mov"),
          "normalize ignores case and punctuation");
    check(rlk::text::normalize("").empty(), "normalize of empty input");
    check(rlk::text::normalize("  --__ ").empty(), "normalize of separators only");
    const auto tokens = rlk::text::tokenize("Clip_Final v2.MOV");
    check(tokens == std::vector<std::string>({"clip", "final", "v2", "mov"}), "tokenize splits on separators");
    check(rlk::text::tokenize("").empty(), "tokenize of empty input");
  }

  // Test: edit distance and similarity properties.
  {
    const std::vector<std::string> samples = {"", "a", "abc", "kitten", "sitting", "clipfinal", "clipfinall",
                                              "flaw", "lawn", "interview_take3"};
    for (const auto& a : samples) {
      check(rlk::similarity::similarity_ratio(a, a) == 1.0, "ratio(a,a) == 1 for '" + a + "'");
      for (const auto& b : samples) {
        const double ab = rlk::similarity::similarity_ratio(a, b);
        const double ba = rlk::similarity::similarity_ratio(b, a);
        check(ab == ba, "ratio symmetric for '" + a + "','" + b + "'");
        const size_t d = rlk::similarity::levenshtein(a, b);
        const size_t gap = a.size() > b.size() ? a.size() - b.size() : b.size() - a.size();
        check(d >= gap, "distance bounded by length gap for '" + a + "','" + b + "'");
      }
    }
    check(rlk::similarity::levenshtein("kitten", "sitting") == 3, "kitten/sitting distance");
    check(rlk::similarity::levenshtein("", "abc") == 3, "empty/abc distance");
    check(rlk::similarity::similarity_ratio("", "") == 1.0, "two empty strings are identical");
    check(std::fabs(rlk::similarity::similarity_ratio("clipfinall", "clipfinal") - 0.9) < 1e-9,
          "clipfinall/clipfinal ratio");
  }

  // Test: best match keeps the first of equal scores.
  {
    const auto none = rlk::similarity::best_match("x", {});
    check(!none.has_value(), "best_match of no candidates");
    const auto best = rlk::similarity::best_match("abcd", {"abcx", "abxd", "zzzz"});
    check(best && best->candidate == "abcx", "best_match tie goes to first candidate");
    check(best && best->method == "levenshtein", "best_match method label");
    const auto exact = rlk::similarity::best_match("Interview-Take3", {"b-roll", "interview take 3"});
    check(exact && exact->candidate == "interview take 3" && exact->score == 1.0, "best_match normalizes both sides");
  }

  // Test: mapping pack validation reports field-level errors.
  {
    const json bad = json::parse(R"({
      "rules": [
        {"source": "a.mov", "strategy": "fuzzy", "target": "b.mov"},
        {"strategy": "exact", "target": 3},
        {"source": "([", "strategy": "regex", "target": "c.mov"},
        {"source": "d", "target": "e", "similarity_threshold": 1.5, "expected_resolution": "wide"}
      ],
      "root_folders": "media",
      "similarity_threshold": 0
    })");
    std::vector<rlk::FieldError> errors;
    check(!rlk::validate_mapping_pack_detailed(bad, errors, rlk::LoadOptions{}), "bad pack rejected");
    auto has = [&errors](const std::string& keypath) {
      for (const auto& e : errors) {
        if (e.keypath == keypath) return true;
      }
      return false;
    };
    check(has("rules[0].strategy"), "unknown strategy reported");
    check(has("rules[1].source"), "missing source reported");
    check(has("rules[1].target"), "non-string target reported");
    check(has("rules[2].source"), "bad regex reported in strict mode");
    check(has("rules[3].similarity_threshold"), "rule threshold range reported");
    check(has("rules[3].expected_resolution"), "resolution format reported");
    check(has("root_folders"), "root_folders type reported");
    check(has("similarity_threshold"), "pack threshold range reported");

    bool threw = false;
    try {
      rlk::parse_mapping_pack(json::parse(R"({"root_folders": []})"));
    } catch (const rlk::ValidationError& e) {
      threw = true;
      check(!e.errors().empty() && e.errors().front().keypath == "rules", "missing rules reported");
    }
    check(threw, "parse_mapping_pack throws ValidationError");

    rlk::LoadOptions lenient;
    lenient.strict_patterns = false;
    const auto pack = rlk::parse_mapping_pack(
        json::parse(R"({"rules": [{"source": "([", "strategy": "regex", "target": "c.mov"}]})"), lenient);
    check(pack.rules.size() == 1 && pack.rules[0].strategy == rlk::Strategy::Regex, "lenient mode keeps bad regex");
    check(pack.similarity_threshold == 0.9 && pack.aspect_tolerance == 0.05, "pack defaults");
  }

  // Test: YAML mapping pack with relative roots.
  {
    const fs::path dir = root / "yaml_pack";
    write_text(dir / "pack.yaml",
               "name: promo\n"
               "similarity_threshold: 0.8\n"
               "root_folders:\n"
               "  - media\n"
               "rules:\n"
               "  - source: \"Logo_v1\"\n"
               "    target: /lib/logo_v2.mov\n"
               "    expected_resolution: 1920x1080\n"
               "    expected_aspect: 1.78\n"
               "  - source: \"1080\"\n"
               "    strategy: token\n"
               "    target: \"/lib/hd.mov\"\n");
    try {
      const auto pack = rlk::load_mapping_pack(dir / "pack.yaml");
      check(pack.name == "promo", "yaml name");
      check(pack.rules.size() == 2, "yaml rule count");
      check(pack.rules[0].strategy == rlk::Strategy::Exact, "strategy defaults to exact");
      check(pack.rules[0].expected_resolution.value_or("") == "1920x1080", "yaml expected_resolution");
      check(pack.rules[0].expected_aspect && std::fabs(*pack.rules[0].expected_aspect - 1.78) < 1e-9,
            "yaml expected_aspect");
      check(pack.rules[1].source == "1080", "quoted yaml scalar stays a string");
      check(std::fabs(pack.similarity_threshold - 0.8) < 1e-9, "yaml threshold");
      check(pack.root_folders.size() == 1 && pack.root_folders[0] == dir / "media", "relative root resolved");
    } catch (const rlk::ValidationError& e) {
      std::cerr << e.what() << "\n";
      check(false, "yaml pack should load");
    }
  }

  // Test: earlier rule wins over a later matching rule.
  {
    rlk::MappingPack pack;
    pack.rules.push_back(make_rule("a.mov", rlk::Strategy::Exact, "b.mov"));
    pack.rules.push_back(make_rule("a.mov", rlk::Strategy::Similarity, "z.mov"));
    const rlk::NameIndex index;
    const auto res = rlk::resolve("a.mov", pack, index);
    check(res.target.value_or("") == "b.mov", "exact rule wins");
    check(res.rule_index.value_or(99) == 0 && res.method == rlk::MatchMethod::Rule, "matched rule reported");

    rlk::MappingPack reversed;
    reversed.rules.push_back(make_rule("a.mov", rlk::Strategy::Similarity, "z.mov"));
    reversed.rules.push_back(make_rule("a.mov", rlk::Strategy::Exact, "b.mov"));
    check(rlk::resolve("a.mov", reversed, index).target.value_or("") == "z.mov", "declaration order decides");
  }

  // Test: strategy semantics.
  {
    rlk::MappingPack pack;
    pack.rules.push_back(make_rule("^INT_.*_v[0-9]+\\.mov$", rlk::Strategy::Regex, "regex.mov"));
    pack.rules.push_back(make_rule("broll city", rlk::Strategy::Token, "token.mov"));
    auto sim = make_rule("sunset_wide", rlk::Strategy::Similarity, "sim.mov");
    sim.similarity_threshold = 0.8;
    pack.rules.push_back(sim);
    pack.rules.push_back(make_rule("", rlk::Strategy::Exact, "never.mov"));
    const rlk::NameIndex index;

    check(rlk::resolve("int_host_v12.MOV", pack, index).target.value_or("") == "regex.mov",
          "regex matches the raw name case-insensitively");
    check(!rlk::resolve("int host v12 mov", pack, index).resolved(), "regex does not see normalized name");
    check(rlk::resolve("City_BROLL_042.mov", pack, index).target.value_or("") == "token.mov",
          "token subset in any order");
    check(!rlk::resolve("broll_042.mov", pack, index).resolved(), "partial token set does not match");
    check(rlk::resolve("sunset-wyde", pack, index).target.value_or("") == "sim.mov",
          "similarity override threshold");
    check(!rlk::resolve("", pack, index).resolved(), "empty exact source never matches");
  }

  // Test: index fallback and fuzzy fallback.
  {
    const fs::path media = root / "media_a";
    touch(media / "clip_final.mov");
    touch(media / "nested" / "interview.wav");
    rlk::MappingPack pack;
    pack.root_folders = {media, root / "does_not_exist"};
    const auto index = rlk::build_index(pack.root_folders);
    check(index.size() == 2, "index holds every regular file");
    check(index.find("clipfinalmov") != nullptr, "index key is normalized filename");

    const auto direct = rlk::resolve("Clip_Final.mov", pack, index);
    check(direct.method == rlk::MatchMethod::Index, "index fallback method");
    check(direct.target && fs::path(*direct.target) == fs::absolute(media / "clip_final.mov"),
          "index fallback returns absolute path");

    const auto fuzzy = rlk::resolve("clipfinall.mov", pack, index);
    check(fuzzy.method == rlk::MatchMethod::Fuzzy && fuzzy.target.has_value(), "fuzzy fallback at 0.9");
    check(fuzzy.score >= 0.9 && fuzzy.candidate == "clipfinalmov", "fuzzy score and candidate");

    pack.similarity_threshold = fuzzy.score + 0.01;
    check(!rlk::resolve("clipfinall.mov", pack, index).resolved(), "threshold above ratio yields no target");
  }

  // Test: duplicate normalized names keep the last file and record a collision.
  {
    const fs::path media = root / "media_dup";
    touch(media / "one" / "Shot-01.mov");
    touch(media / "two" / "shot_01.mov");
    const auto index = rlk::build_index({media});
    check(index.size() == 1, "duplicate keys collapse");
    check(index.collisions().size() == 1, "collision recorded");
    if (!index.collisions().empty()) {
      check(*index.find("shot01mov") == index.collisions().front().kept, "last write wins");
    }
  }

  // Test: a broken regex degrades to one warning and the run continues.
  {
    const fs::path media = root / "media_b";
    touch(media / "keep_me.mov");
    rlk::MappingPack pack;
    pack.rules.push_back(make_rule("([", rlk::Strategy::Regex, "broken.mov"));
    pack.rules.push_back(make_rule("alpha", rlk::Strategy::Exact, "/lib/alpha_v2.mov"));
    pack.root_folders = {media};
    const std::vector<rlk::AssetDescriptor> assets = {{"alpha", std::nullopt, {}, std::nullopt},
                                                       {"keep-me.mov", std::nullopt, {}, std::nullopt},
                                                       {"missing.mov", std::nullopt, {}, std::nullopt}};
    rlk::ToolConfig cfg;
    cfg.dry_run = true;
    RecordingSink sink;
    const auto outcome = rlk::run_relink(cfg, pack, assets, sink);
    check(count_items(outcome.report, "rule", rlk::Severity::Warning) == 1, "exactly one broken-rule warning");
    bool names_rule = false;
    for (const auto& item : outcome.report.items) {
      if (item.category == "rule" && item.message.find("rules[0]") != std::string::npos) names_rule = true;
    }
    check(names_rule, "warning names the broken rule");
    check(outcome.report.summary.value("matched", 0) == 2, "other assets still resolve");
    check(outcome.report.summary.value("unmatched", 0) == 1, "unmatched counted");
    check(count_items(outcome.report, "match", rlk::Severity::Warning) == 1, "unmatched asset is a warning");
    check(!outcome.report.has_errors(), "no error items");
  }

  // Test: non UTF-8 file names survive every JSON export.
  {
    const fs::path media = root / "media_latin1";
    touch(media / std::string("caf\xe9.mov"));
    rlk::MappingPack pack;
    pack.root_folders = {media};
    const std::vector<rlk::AssetDescriptor> assets = {{"caf.mov", std::nullopt, {}, std::nullopt}};
    rlk::ToolConfig cfg;
    cfg.dry_run = true;
    RecordingSink sink;
    const auto outcome = rlk::run_relink(cfg, pack, assets, sink);
    check(outcome.report.summary.value("matched", 0) == 1, "latin-1 file name resolved through the index");

    bool exported = true;
    std::string rendered;
    std::string csv;
    try {
      rendered = rlk::render_report(outcome.report, rlk::ReportFormat::Json);
      csv = rlk::render_report(outcome.report, rlk::ReportFormat::Csv);
    } catch (const std::exception& e) {
      exported = false;
      std::cerr << "export threw: " << e.what() << "\n";
    }
    check(exported && !rendered.empty() && !csv.empty(), "report with non UTF-8 path renders");
    check(!json::parse(rendered, nullptr, false).is_discarded(), "rendered report is valid json");
    check(rlk::data::save_json_file(root / "latin1.tx.json", rlk::to_json(outcome.transaction)),
          "transaction with non UTF-8 target saves");
    check(rlk::save_report(outcome.report, root / "latin1_reports", {rlk::ReportFormat::Json}).size() == 1,
          "report with non UTF-8 path saves");
  }

  // Test: dry run records actions without touching the sink.
  {
    rlk::MappingPack pack;
    auto rule = make_rule("logo", rlk::Strategy::Token, "/lib/logo_v2.mov");
    rule.expected_resolution = "1920x1080";
    rule.expected_aspect = 16.0 / 9.0;
    pack.rules.push_back(rule);
    rlk::AssetDescriptor asset;
    asset.name = "Logo_v1.mov";
    asset.resolution = "1440x1080";
    asset.metadata["Zoom X"] = "1.2";
    asset.current_path = "/old/Logo_v1.mov";

    rlk::ToolConfig cfg;
    cfg.dry_run = true;
    RecordingSink sink;
    const auto dry = rlk::run_relink(cfg, pack, {asset}, sink);
    check(sink.calls.empty(), "dry run does not call the sink");
    check(dry.transaction.dry_run() && dry.transaction.actions().size() == 1, "dry run still records the action");
    check(dry.transaction.actions().front().dry_run, "recorded action marked dry_run");
    check(dry.transaction.closed(), "transaction closed after run");
    check(count_items(dry.report, "swap", rlk::Severity::Info) == 1, "dry run info item");
    check(count_items(dry.report, "appearance", rlk::Severity::Warning) == 1, "transform warning");
    check(count_items(dry.report, "resolution", rlk::Severity::Warning) == 1, "resolution mismatch warning");
    check(count_items(dry.report, "aspect", rlk::Severity::Warning) == 1, "aspect mismatch warning");
    check(dry.report.summary.value("mismatched", 0) == 1, "mismatched counted once per asset");

    cfg.dry_run = false;
    const auto applied = rlk::run_relink(cfg, pack, {asset}, sink);
    check(sink.calls.size() == 1 && sink.calls.front().second == "/lib/logo_v2.mov", "apply calls the sink");
    check(applied.transaction.rollback().size() == 1 &&
              applied.transaction.rollback().front().target == "/old/Logo_v1.mov",
          "rollback entry points back to the previous path");
    check(applied.report.summary.value("applied", 0) == 1, "applied counted");

    sink.fail = true;
    const auto failed = rlk::run_relink(cfg, pack, {asset}, sink);
    check(count_items(failed.report, "swap", rlk::Severity::Error) == 1, "sink failure is an error item");
    check(failed.transaction.actions().empty(), "failed relink not recorded");
  }

  // Test: closed transactions reject further records.
  {
    rlk::Transaction tx("unit", true);
    check(tx.record({"relink", "a", "b", true, json::object()}), "record while open");
    tx.close();
    check(!tx.record({"relink", "c", "d", true, json::object()}), "record after close rejected");
    check(tx.actions().size() == 1, "closed transaction unchanged");
    const json j = rlk::to_json(tx);
    check(j["actions"].size() == 1 && j["transaction_id"].get<std::string>().size() == 36, "transaction json");
    check(rlk::make_transaction_id() != rlk::make_transaction_id(), "transaction ids unique");
  }

  // Test: report round trip and flat/rendered exports.
  {
    rlk::Report report = rlk::make_report("relink_resolver", "Relink <Resolver>");
    report.add(rlk::item_info("swap", "Relinked a -> b", std::string("a"), {{"score", 1.0}}));
    auto warn = rlk::item_warning("resolution", "Clip \"x\", odd size", std::string("x"));
    warn.timeline = "Edit_v3";
    warn.timecode = "01:00:00:00";
    report.add(warn);
    report.add(rlk::item_error("config", "missing input"));
    report.summary = {{"items_scanned", 3}, {"matched", 1}};

    rlk::Report back;
    std::string error;
    const json exported = json::parse(rlk::render_report(report, rlk::ReportFormat::Json));
    check(rlk::parse_report(exported, back, error), "report parses back: " + error);
    check(back.summary == report.summary, "summary round trip");
    check(back.items.size() == report.items.size(), "item count round trip");
    for (size_t i = 0; i < back.items.size() && i < report.items.size(); ++i) {
      const auto& a = report.items[i];
      const auto& b = back.items[i];
      check(a.category == b.category && a.severity == b.severity && a.message == b.message &&
                a.timeline == b.timeline && a.clip == b.clip && a.timecode == b.timecode && a.data == b.data,
            "item " + std::to_string(i) + " round trip");
    }
    check(back.tool_id == report.tool_id && back.created_at == report.created_at, "header round trip");

    const std::string csv = rlk::render_csv(report);
    check(csv.rfind("category,severity,message,timeline,clip,timecode,data\r\n", 0) == 0, "csv header");
    check(csv.find("\"Clip \"\"x\"\", odd size\"") != std::string::npos, "csv quoting");
    check(rlk::render_csv(rlk::make_report("t", "t")).empty(), "empty report renders empty csv");

    const std::string html = rlk::render_html(report);
    check(html.find("Relink &lt;Resolver&gt;") != std::string::npos, "html escapes title");
    check(html.find("<td>warning</td>") != std::string::npos, "html renders severity");

    const auto written = rlk::save_report(report, root / "reports",
                                          {rlk::ReportFormat::Json, rlk::ReportFormat::Csv, rlk::ReportFormat::Html});
    check(written.size() == 3, "three exports written");
    for (const auto& p : written) check(fs::exists(p), "export exists: " + p.string());

    const auto merged = rlk::merge_reports({report, report}, "All");
    check(merged.items.size() == 6 && merged.summary.value("reports", 0) == 2, "merge_reports");
  }

  // Test: configuration failures produce a single fatal item.
  {
    rlk::ToolConfig cfg;
    RecordingSink sink;
    const auto missing = rlk::run_relink_from_files(cfg, root / "nope.json", root / "assets.json", sink);
    check(missing.report.items.size() == 1 && missing.report.items.front().severity == rlk::Severity::Error &&
              missing.report.items.front().category == "config",
          "missing pack is one fatal error");

    write_text(root / "bad_pack.json", R"({"rules": [{"source": 1}]})");
    const auto bad = rlk::run_relink_from_files(cfg, root / "bad_pack.json", root / "assets.json", sink);
    check(bad.report.items.size() == 1 && bad.report.has_errors(), "invalid pack is one fatal error");
    check(bad.transaction.actions().empty(), "no resolution after config error");

    write_text(root / "bad_keys.yaml", "rules: []\n? [a, b]\n: c\n");
    json doc;
    std::string load_error;
    check(!rlk::data::load_document(root / "bad_keys.yaml", doc, load_error) && !load_error.empty(),
          "yaml with a sequence key is a load error");
    const auto yaml_bad = rlk::run_relink_from_files(cfg, root / "bad_keys.yaml", root / "assets.json", sink);
    check(yaml_bad.report.items.size() == 1 && yaml_bad.report.items.front().category == "config" &&
              yaml_bad.report.has_errors(),
          "unconvertible yaml pack is one fatal config error");
  }

  // Test: file based run with manifest sink and multi-project orchestration.
  {
    const fs::path dir = root / "projects";
    touch(dir / "media" / "Hero_Shot.mov");
    write_text(dir / "pack.json",
               R"({"rules": [{"source": "temp_logo", "strategy": "exact", "target": "/lib/logo.mov"}],
                  "root_folders": ["media"]})");
    write_text(dir / "a.json",
               R"({"assets": [{"name": "temp-logo"}, "hero shot.mov",
                              {"File Name": "unknown.mov", "Resolution": "1920x1080"}]})");
    write_text(dir / "b.yaml", "assets:\n  - name: TEMP_LOGO\n    transforms: [Pan]\n");

    std::vector<rlk::AssetDescriptor> parsed;
    std::string error;
    check(rlk::load_asset_manifest(dir / "a.json", parsed, error), "manifest loads: " + error);
    check(parsed.size() == 3 && parsed[2].name == "unknown.mov" && parsed[2].resolution.value_or("") == "1920x1080",
          "clip property entry parsed");

    rlk::ToolConfig cfg;
    cfg.dry_run = false;
    auto sink = ManifestSink::open(dir / "a.json", dir / "a.relinked.json", error);
    check(sink != nullptr, "manifest sink opens");
    if (sink) {
      const auto outcome = rlk::run_relink_from_files(cfg, dir / "pack.json", dir / "a.json", *sink);
      check(outcome.report.summary.value("matched", 0) == 2, "file run matches rule and index");
      check(sink->relinked() == 2 && sink->flush(), "manifest sink applies relinks");
      json written;
      check(rlk::data::load_json_file(dir / "a.relinked.json", written), "relinked manifest written");
      check(written["assets"][0].value("current_path", "") == "/lib/logo.mov", "relinked path stored");
    }

    std::vector<std::shared_ptr<RecordingSink>> sinks;
    const rlk::SinkFactory factory = [&sinks](const fs::path&) {
      auto s = std::make_shared<RecordingSink>();
      sinks.push_back(s);
      return std::shared_ptr<rlk::RelinkSink>(s);
    };
    cfg.dry_run = true;
    const auto multi = rlk::run_relink_projects(cfg, dir / "pack.json",
                                                {dir / "a.json", dir / "b.yaml", dir / "missing.json"}, factory);
    check(multi.report.summary.value("projects", 0) == 3, "projects counted");
    check(multi.report.summary["orchestration"].size() == 3, "orchestration entries");
    check(multi.report.summary["orchestration"][2].value("status", "") == "failed", "missing manifest failed");
    check(count_items(multi.report, "project", rlk::Severity::Error) == 1, "missing manifest error item");
    check(count_items(multi.report, "appearance", rlk::Severity::Warning) == 1, "yaml transforms flagged");
    check(multi.transaction.actions().size() == 3, "one transaction across projects");

    RecordingSink idle_sink;
    const auto no_manifest = rlk::run_relink_from_files(cfg, dir / "pack.json", dir / "absent.json", idle_sink);
    check(no_manifest.report.items.size() == 1 && no_manifest.report.items.front().category == "input" &&
              no_manifest.report.has_errors(),
          "missing manifest is one fatal input error");

    touch(dir / "media_dup" / "hero-shot.mov");
    write_text(dir / "lenient_pack.json",
               R"({"rules": [{"source": "([", "strategy": "regex", "target": "/lib/x.mov"},
                             {"source": "temp_logo", "target": "/lib/logo.mov"}],
                  "root_folders": ["media", "media_dup"]})");
    rlk::LoadOptions lenient;
    lenient.strict_patterns = false;
    const auto shared = rlk::run_relink_projects(cfg, dir / "lenient_pack.json", {dir / "a.json", dir / "b.yaml"},
                                                 factory, lenient);
    check(count_items(shared.report, "rule", rlk::Severity::Warning) == 1, "broken rule reported once per run");
    check(shared.report.summary.value("broken_rules", 0) == 1, "broken rule counted once per run");
    check(count_items(shared.report, "index", rlk::Severity::Warning) == 1 &&
              shared.report.summary.value("index_collisions", 0) == 1,
          "index collision reported once per run");
    check(shared.report.summary.value("index_size", 0) == 1, "index size counted once per run");
    check(shared.report.summary.value("matched", 0) == 3, "both manifests resolve against the shared index");
  }

  // Test: presets and tool config.
  {
    rlk::ToolConfig cfg;
    cfg.presets_dir = root / "presets";
    const json options = {{"pack", "p.json"}, {"assets", {"a.json"}}};
    rlk::save_preset(cfg, "relink_resolver", "nightly", options);
    write_text(cfg.presets_dir / "relink_resolver" / "notes.txt", "not a preset");
    fs::create_directories(cfg.presets_dir / "relink_resolver" / "archive.json");
    check(rlk::list_presets(cfg, "no_such_tool").empty(), "missing preset dir lists nothing");
    check(rlk::list_presets(cfg, "relink_resolver") == std::vector<std::string>({"nightly"}), "preset listed");
    check(rlk::load_preset(cfg, "relink_resolver", "nightly") == options, "preset options round trip");
    ResolveOptions opts;
    std::string error;
    check(resolve_options_from_json(options, opts, error) && opts.assets_paths.size() == 1, "preset to options");

    rlk::save_preset(cfg, "other_tool", "nightly", options);
    fs::copy_file(cfg.presets_dir / "other_tool" / "nightly.json", cfg.presets_dir / "relink_resolver" / "x.json");
    bool threw = false;
    try {
      rlk::load_preset(cfg, "relink_resolver", "x");
    } catch (const rlk::PresetError&) {
      threw = true;
    }
    check(threw, "preset tool mismatch rejected");

    write_text(root / "tool.yaml", "tool:\n  dry_run: false\n  log_level: debug\n  report_formats: [json, csv]\n");
    const auto loaded = rlk::load_tool_config(root / "tool.yaml", cfg);
    check(!loaded.dry_run && loaded.log_level == "debug", "yaml tool config");
    check(loaded.report_formats == std::vector<std::string>({"json", "csv"}), "report formats from config");
    check(loaded.presets_dir == cfg.presets_dir, "unset fields keep base values");
  }

  rlk::log::shutdown();
  std::error_code ec;
  fs::remove_all(root, ec);

  if (failures == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << failures << " failure(s)\n";
  return 1;
}
