#include "json_formatter.hpp"

#include <string>

using namespace wordguard;

namespace {

std::string dump_single_line(const nlohmann::json &j) {
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

nlohmann::json JsonFormatter::match_to_json_object(const Match &match) {
  nlohmann::json j;

  // === Pattern ===
  j["word"] = match.word;
  j["severity"] = static_cast<int>(match.severity);
  j["severity_name"] = severity_to_string(match.severity);
  if (!match.category.empty())
    j["category"] = match.category;

  // === Location in the original text (code points) ===
  j["position"] = match.position;
  j["length"] = match.length;

  // === Provenance ===
  j["source"] = match_source_to_string(match.source);
  j["searched_text"] = searched_text_to_string(match.searched_text);
  j["searched_position"] = match.searched_position;
  j["searched_length"] = match.searched_length;

  if (match.confidence)
    j["confidence"] = *match.confidence;

  j["evasion_techniques"] = nlohmann::json::array();
  for (auto technique : match.evasion_techniques)
    j["evasion_techniques"].push_back(evasion_technique_to_string(technique));
  return j;
}

nlohmann::json
JsonFormatter::detection_result_to_json_object(const DetectionResult &result) {
  nlohmann::json j;
  j["has_match"] = result.has_match;
  j["text"] = result.original_text;
  j["matches"] = nlohmann::json::array();
  for (const auto &match : result.matches)
    j["matches"].push_back(match_to_json_object(match));
  if (result.cleaned_text)
    j["cleaned_text"] = *result.cleaned_text;
  return j;
}

nlohmann::json
JsonFormatter::batch_result_to_json_object(const BatchDetectionResult &batch) {
  nlohmann::json j;
  j["total_matches"] = batch.total_matches;
  j["processing_time_ms"] = batch.processing_time_ms;
  j["results"] = nlohmann::json::array();
  for (const auto &result : batch.results)
    j["results"].push_back(detection_result_to_json_object(result));
  return j;
}

nlohmann::json JsonFormatter::stats_to_json_object(const FilterStats &stats) {
  nlohmann::json j;
  j["total_words"] = stats.total_words;
  j["custom_words"] = stats.custom_words;
  j["base_words"] = stats.base_words;
  j["whitelist_count"] = stats.whitelist_count;

  nlohmann::json by_language = nlohmann::json::object();
  for (const auto &[language, count] : stats.by_language) {
    std::string key = language_to_string(language);
    by_language[key.empty() ? "unspecified" : key] = count;
  }
  j["by_language"] = by_language;

  nlohmann::json by_severity = nlohmann::json::object();
  for (const auto &[severity, count] : stats.by_severity)
    by_severity[std::to_string(static_cast<int>(severity))] = count;
  j["by_severity"] = by_severity;

  j["by_category"] = stats.by_category;
  return j;
}

std::string JsonFormatter::format_detection_result_to_json(
    const DetectionResult &result) {
  return dump_single_line(detection_result_to_json_object(result));
}

std::string
JsonFormatter::format_batch_result_to_json(const BatchDetectionResult &batch) {
  return dump_single_line(batch_result_to_json_object(batch));
}

std::string JsonFormatter::format_stats_to_json(const FilterStats &stats) {
  return dump_single_line(stats_to_json_object(stats));
}
