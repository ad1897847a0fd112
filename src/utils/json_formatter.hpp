#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "core/types.hpp"
#include "nlohmann/json.hpp"

#include <string>

namespace JsonFormatter {

nlohmann::json match_to_json_object(const wordguard::Match &match);
nlohmann::json
detection_result_to_json_object(const wordguard::DetectionResult &result);
nlohmann::json
batch_result_to_json_object(const wordguard::BatchDetectionResult &batch);
nlohmann::json stats_to_json_object(const wordguard::FilterStats &stats);

// Single line, UTF-8 passed through unescaped
std::string format_detection_result_to_json(
    const wordguard::DetectionResult &result);
std::string
format_batch_result_to_json(const wordguard::BatchDetectionResult &batch);
std::string format_stats_to_json(const wordguard::FilterStats &stats);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
