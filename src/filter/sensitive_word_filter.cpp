#include "sensitive_word_filter.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "io/word_list_codec.hpp"
#include "matching/match_reconciler.hpp"
#include "text/evasion_detector.hpp"
#include "utils/unicode.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <chrono>
#include <unordered_set>
#include <utility>

namespace wordguard {

namespace {

std::u32string word_key(std::string_view word) {
  return Utils::to_lower(Utils::to_utf32(Utils::trim_copy(word)));
}

void throw_if_invalid(const Config::FilterConfig &config) {
  std::vector<std::string> errors;
  if (Config::validate_filter_config(config, errors))
    return;
  std::string message = "Invalid filter configuration: " +
                        Utils::join_strings(errors, "; ");
  throw InvalidConfigError(message);
}

// Adds `pattern` or replaces the entry with the same case-insensitive word
void upsert(std::vector<Pattern> &words, const Pattern &pattern) {
  std::u32string key = word_key(pattern.word);
  auto it = std::find_if(words.begin(), words.end(), [&](const Pattern &p) {
    return word_key(p.word) == key;
  });
  if (it != words.end())
    *it = pattern;
  else
    words.push_back(pattern);
}

} // namespace

SensitiveWordFilter::SensitiveWordFilter(Config::FilterConfig config,
                                         std::vector<Pattern> base_words,
                                         std::vector<WhitelistEntry> whitelist)
    : config_(std::move(config)), base_words_(std::move(base_words)) {
  throw_if_invalid(config_);
  for (const auto &pattern : base_words_)
    validate_pattern(pattern);
  whitelist_.add_many(whitelist);
  rebuild();
}

void SensitiveWordFilter::validate_pattern(const Pattern &pattern) {
  if (Utils::trim_copy(pattern.word).empty())
    throw InvalidPatternError("Pattern words must not be empty");
  int severity = static_cast<int>(pattern.severity);
  if (severity < 1 || severity > 4)
    throw InvalidPatternError("Severity of '" + pattern.word +
                              "' must be between 1 and 4, got " +
                              std::to_string(severity));
  switch (pattern.language) {
  case Language::UNSPECIFIED:
  case Language::ENGLISH:
  case Language::ARABIC:
    break;
  default:
    throw InvalidPatternError("Unsupported language for '" + pattern.word +
                              "'");
  }
}

void SensitiveWordFilter::add_word(const Pattern &pattern) {
  validate_pattern(pattern);
  upsert(custom_words_, pattern);
  rebuild();
}

void SensitiveWordFilter::add_words(const std::vector<Pattern> &patterns) {
  for (const auto &pattern : patterns)
    validate_pattern(pattern);
  for (const auto &pattern : patterns)
    upsert(custom_words_, pattern);
  rebuild();
}

bool SensitiveWordFilter::remove_word(std::string_view word) {
  std::u32string key = word_key(word);
  auto before = custom_words_.size();
  custom_words_.erase(std::remove_if(custom_words_.begin(),
                                     custom_words_.end(),
                                     [&](const Pattern &p) {
                                       return word_key(p.word) == key;
                                     }),
                      custom_words_.end());
  if (custom_words_.size() == before)
    return false;
  rebuild();
  return true;
}

void SensitiveWordFilter::clear_custom_words() {
  custom_words_.clear();
  rebuild();
}

void SensitiveWordFilter::set_config(const Config::FilterConfig &config) {
  throw_if_invalid(config);
  Config::FilterConfig previous = config_;
  config_ = config;
  try {
    rebuild();
  } catch (...) {
    config_ = std::move(previous);
    throw;
  }
}

void SensitiveWordFilter::add_to_whitelist(const std::string &word) {
  whitelist_.add(word);
}

void SensitiveWordFilter::add_to_whitelist(const WhitelistEntry &entry) {
  whitelist_.add(entry);
}

void SensitiveWordFilter::add_many_to_whitelist(
    const std::vector<WhitelistEntry> &entries) {
  whitelist_.add_many(entries);
}

bool SensitiveWordFilter::remove_from_whitelist(std::string_view word) {
  return whitelist_.remove(word);
}

void SensitiveWordFilter::import_whitelist(
    const std::vector<WhitelistEntry> &entries, bool replace) {
  Whitelist updated = replace ? Whitelist{} : whitelist_;
  for (const auto &entry : entries) {
    if (replace || !updated.contains(entry.word))
      updated.add(entry);
  }
  whitelist_ = std::move(updated);
}

NormalizerOptions SensitiveWordFilter::automaton_options() const {
  if (!config_.normalize)
    return NormalizerOptions::lowercase_only();
  if (config_.strictness == DetectionStrictness::LOW)
    return NormalizerOptions::canonical();
  return NormalizerOptions::standard();
}

FuzzyMatchOptions SensitiveWordFilter::fuzzy_options() const {
  FuzzyMatchOptions options;
  options.strictness = config_.strictness;
  options.max_edit_distance = config_.max_edit_distance;
  options.detect_symbol_replacement = config_.detect_symbol_replacement;
  options.detect_space_insertion = config_.detect_space_insertion;
  options.detect_repeated_letters = config_.detect_repeated_letters;
  options.detect_language_mixing = config_.detect_language_mixing;
  return options;
}

bool SensitiveWordFilter::is_active(const Pattern &pattern) const {
  if (pattern.severity < config_.min_severity ||
      pattern.severity > config_.max_severity)
    return false;
  if (pattern.language != Language::UNSPECIFIED &&
      std::find(config_.languages.begin(), config_.languages.end(),
                pattern.language) == config_.languages.end())
    return false;
  if (!config_.categories.empty() &&
      std::find(config_.categories.begin(), config_.categories.end(),
                pattern.category) == config_.categories.end())
    return false;
  return true;
}

void SensitiveWordFilter::rebuild() {
  std::vector<Pattern> active;
  for (const auto &pattern : base_words_) {
    if (is_active(pattern))
      active.push_back(pattern);
  }
  active.insert(active.end(), custom_words_.begin(), custom_words_.end());

  bool paranoid = config_.strictness == DetectionStrictness::PARANOID;
  NormalizerOptions options = automaton_options();
  auto automaton = std::make_unique<PatternAutomaton>();
  std::unique_ptr<PatternAutomaton> strict;
  if (paranoid)
    strict = std::make_unique<PatternAutomaton>();

  for (const auto &pattern : active) {
    std::u32string word = Utils::to_utf32(pattern.word);
    NormalizedText normalized = normalizer_.normalize(word, options);
    if (normalized.text.empty()) {
      LOG(LogLevel::WARN, LogComponent::FILTER,
          "Skipping pattern '" << pattern.word
                               << "': nothing left after normalization");
      continue;
    }
    automaton->insert(normalized.text, pattern);

    if (strict) {
      NormalizedText folded = normalizer_.normalize_strict(word);
      if (!folded.text.empty())
        strict->insert(folded.text, pattern);
    }
  }

  automaton->build_failure_links();
  if (strict)
    strict->build_failure_links();

  active_patterns_ = std::move(active);
  automaton_ = std::move(automaton);
  strict_automaton_ = std::move(strict);

  LOG(LogLevel::INFO, LogComponent::FILTER,
      "Rebuilt automaton with " << automaton_->pattern_count()
                                << " patterns at "
                                << strictness_to_string(config_.strictness)
                                << " strictness");
}

std::vector<Match> SensitiveWordFilter::search_automaton(
    const PatternAutomaton &automaton, const NormalizedText &normalized,
    std::u32string_view original, bool partial_match, SearchedText searched,
    MatchSource source) const {
  std::vector<Match> matches = automaton.search(normalized.text, partial_match);
  for (auto &match : matches) {
    SourceSpan span =
        normalized.source_span(match.searched_position, match.searched_length);
    match.position = span.begin;
    match.length = span.length();
    match.source = source;
    match.searched_text = searched;
    match.evasion_techniques = detect_evasion_techniques(
        original.substr(span.begin, span.length()), normalizer_.tables());
  }
  return matches;
}

DetectionResult SensitiveWordFilter::detect(const std::string &text) const {
  return detect_impl(text, false);
}

bool SensitiveWordFilter::has_match(const std::string &text) const {
  return detect_impl(text, false).has_match;
}

std::string SensitiveWordFilter::clean(const std::string &text) const {
  DetectionResult result = detect_impl(text, true);
  return result.cleaned_text.value_or(text);
}

DetectionResult SensitiveWordFilter::detect_impl(const std::string &text,
                                                 bool force_replacement) const {
  std::u32string original = Utils::to_utf32(text);
  MatchSets sets;

  NormalizedText normalized = normalizer_.normalize(original, automaton_options());
  sets.automaton =
      search_automaton(*automaton_, normalized, original, config_.partial_match,
                       SearchedText::NORMALIZED, MatchSource::AUTOMATON);

  if (config_.enable_fuzzy_matching) {
    FuzzyMatcher fuzzy(normalizer_, fuzzy_options());
    sets.fuzzy = fuzzy.find_all(original, active_patterns_);
  }

  if (strict_automaton_) {
    NormalizedText strict = normalizer_.normalize_strict(original);
    sets.strict_automaton = search_automaton(
        *strict_automaton_, strict, original, true,
        SearchedText::STRICT_NORMALIZED, MatchSource::STRICT_AUTOMATON);
  }

  MatchReconciler reconciler(whitelist_, context_filter_);
  DetectionResult result;
  result.original_text = text;
  result.matches =
      reconciler.reconcile(original, std::move(sets), config_.context_aware);
  result.has_match = !result.matches.empty();

  if ((config_.replace_matches || force_replacement) && result.has_match) {
    std::u32string replacement = Utils::to_utf32(config_.replacement_char);
    result.cleaned_text = Utils::to_utf8(MatchReconciler::apply_replacement(
        original, result.matches, replacement));
  }

  LOG(LogLevel::DEBUG, LogComponent::FILTER,
      "Detected " << result.matches.size() << " matches in "
                  << original.size() << " code points");
  return result;
}

BatchDetectionResult
SensitiveWordFilter::detect_batch(const std::vector<std::string> &texts) const {
  auto start = std::chrono::steady_clock::now();
  BatchDetectionResult batch;
  batch.results.reserve(texts.size());
  for (const auto &text : texts) {
    batch.results.push_back(detect(text));
    batch.total_matches += batch.results.back().matches.size();
  }
  batch.processing_time_ms =
      std::chrono::duration<double, std::milli>(
          std::chrono::steady_clock::now() - start)
          .count();
  return batch;
}

bool SensitiveWordFilter::has_match_in_any(
    const std::vector<std::string> &texts) const {
  return std::any_of(texts.begin(), texts.end(),
                     [this](const std::string &text) {
                       return has_match(text);
                     });
}

std::vector<std::string>
SensitiveWordFilter::clean_batch(const std::vector<std::string> &texts) const {
  std::vector<std::string> cleaned;
  cleaned.reserve(texts.size());
  for (const auto &text : texts)
    cleaned.push_back(clean(text));
  return cleaned;
}

FilterStats SensitiveWordFilter::stats() const {
  FilterStats stats;
  stats.base_words = base_words_.size();
  stats.custom_words = custom_words_.size();
  stats.total_words = stats.base_words + stats.custom_words;
  stats.whitelist_count = whitelist_.size();

  auto count = [&stats](const Pattern &pattern) {
    ++stats.by_language[pattern.language];
    ++stats.by_severity[pattern.severity];
    if (!pattern.category.empty())
      ++stats.by_category[pattern.category];
  };
  std::for_each(base_words_.begin(), base_words_.end(), count);
  std::for_each(custom_words_.begin(), custom_words_.end(), count);
  return stats;
}

WordListExport SensitiveWordFilter::export_custom_words() const {
  WordListExport list;
  list.exported_at = current_timestamp_iso8601();
  list.words = custom_words_;
  return list;
}

void SensitiveWordFilter::import_words(const WordListExport &list,
                                       bool replace) {
  if (list.version.empty())
    throw WordListFormatError("Word list has no version");
  for (const auto &pattern : list.words) {
    try {
      validate_pattern(pattern);
    } catch (const InvalidPatternError &e) {
      throw WordListFormatError(std::string("Invalid word in import: ") +
                                e.what());
    }
  }

  if (replace) {
    custom_words_.clear();
    for (const auto &pattern : list.words)
      upsert(custom_words_, pattern);
  } else {
    std::unordered_set<std::u32string> existing;
    for (const auto &pattern : custom_words_)
      existing.insert(word_key(pattern.word));
    for (const auto &pattern : list.words) {
      if (existing.insert(word_key(pattern.word)).second)
        custom_words_.push_back(pattern);
    }
  }

  LOG(LogLevel::INFO, LogComponent::WORDLIST,
      "Imported " << list.words.size() << " words (version " << list.version
                  << ")" << (replace ? ", replacing custom words" : ""));
  rebuild();
}

std::string SensitiveWordFilter::export_to_json() const {
  return serialize_word_list(export_custom_words());
}

void SensitiveWordFilter::import_from_json(const std::string &json_text,
                                           bool replace) {
  import_words(parse_word_list(json_text), replace);
}

} // namespace wordguard
