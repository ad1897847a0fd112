#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace wordguard {

class WordguardError : public std::runtime_error {
public:
  explicit WordguardError(const std::string &msg) : std::runtime_error(msg) {}
};

// Empty word, severity outside 1..4 or an unsupported language tag
class InvalidPatternError : public WordguardError {
public:
  explicit InvalidPatternError(const std::string &msg) : WordguardError(msg) {}
};

// Malformed word list or whitelist payload
class WordListFormatError : public WordguardError {
public:
  explicit WordListFormatError(const std::string &msg) : WordguardError(msg) {}
};

class InvalidConfigError : public WordguardError {
public:
  explicit InvalidConfigError(const std::string &msg) : WordguardError(msg) {}
};

// Search attempted on an automaton whose failure links are missing or stale
class AutomatonStateError : public WordguardError {
public:
  explicit AutomatonStateError(const std::string &msg) : WordguardError(msg) {}
};

} // namespace wordguard

#endif // ERRORS_HPP
