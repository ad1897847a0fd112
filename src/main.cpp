#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "filter/sensitive_word_filter.hpp"
#include "io/word_list_codec.hpp"
#include "utils/json_formatter.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

enum class OutputMode { LINES, BATCH, STATS };

void print_usage(const char *program) {
  std::cerr << "Usage: " << program << " [--batch | --stats] [config.ini]\n"
            << "Reads text from stdin, one item per line, and prints one JSON\n"
            << "detection result per line.\n"
            << "  --batch  read all of stdin, then print a single batch result\n"
            << "  --stats  print word list statistics and exit\n";
}

} // namespace

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false); // Potentially faster I/O
  std::cin.tie(nullptr);                 // Untie cin from cout

  OutputMode mode = OutputMode::LINES;
  std::string config_file_to_load = "config.ini";
  bool have_config_arg = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--batch" && mode == OutputMode::LINES) {
      mode = OutputMode::BATCH;
    } else if (arg == "--stats" && mode == OutputMode::LINES) {
      mode = OutputMode::STATS;
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (!have_config_arg && !arg.empty() && arg[0] != '-') {
      config_file_to_load = arg;
      have_config_arg = true;
    } else {
      print_usage(argv[0]);
      return 2;
    }
  }

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  config_manager.load_configuration(config_file_to_load);

  auto current_config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(current_config->logging);

  LOG(LogLevel::DEBUG, LogComponent::CORE, "wordguard starting up...");

  std::vector<wordguard::Pattern> base_words;
  std::vector<wordguard::WhitelistEntry> whitelist;
  try {
    if (!current_config->word_list_path.empty())
      base_words =
          wordguard::load_word_database_file(current_config->word_list_path);
    if (!current_config->whitelist_path.empty())
      whitelist = wordguard::load_whitelist_file(current_config->whitelist_path);
  } catch (const wordguard::WordListFormatError &e) {
    LOG(LogLevel::FATAL, LogComponent::WORDLIST,
        "Failed to load word lists: " << e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  if (base_words.empty())
    LOG(LogLevel::WARN, LogComponent::CORE,
        "No base words loaded; set word_list_path in " << config_file_to_load);

  try {
    wordguard::SensitiveWordFilter filter(current_config->filter,
                                          std::move(base_words),
                                          std::move(whitelist));

    if (mode == OutputMode::STATS) {
      std::cout << JsonFormatter::format_stats_to_json(filter.stats())
                << std::endl;
      return 0;
    }

    std::string line;
    if (mode == OutputMode::BATCH) {
      std::vector<std::string> texts;
      while (std::getline(std::cin, line))
        texts.push_back(line);
      wordguard::BatchDetectionResult batch = filter.detect_batch(texts);
      std::cout << JsonFormatter::format_batch_result_to_json(batch)
                << std::endl;
      LOG(LogLevel::DEBUG, LogComponent::CORE,
          "Batch of " << texts.size() << " lines, " << batch.total_matches
                      << " matches in " << batch.processing_time_ms << " ms.");
      return 0;
    }

    size_t processed = 0;
    size_t flagged = 0;
    while (std::getline(std::cin, line)) {
      wordguard::DetectionResult result = filter.detect(line);
      ++processed;
      if (result.has_match)
        ++flagged;
      std::cout << JsonFormatter::format_detection_result_to_json(result)
                << '\n';
    }
    std::cout.flush();

    LOG(LogLevel::DEBUG, LogComponent::CORE,
        "Processed " << processed << " lines, " << flagged << " flagged.");
  } catch (const wordguard::WordguardError &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE, "Fatal error: " << e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
