#pragma once

#include "screening/detector.h"

#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace promptgate {

struct InjectionRule {
  std::string label;
  std::regex pattern;
};

// Override/jailbreak phrasings matched case-insensitively.
std::vector<InjectionRule> DefaultInjectionRules();

// Layered prompt-injection detector.
//
// Tier 1 is deterministic and runs first: the rule corpus, then exact
// (case-insensitive) containment of a known jailbreak phrase, then a
// near-match of a known phrase whose word-set similarity reaches the
// configured threshold. The first hit returns immediately.
//
// Tier 2 asks a completion client to classify the text, and only runs when
// Tier 1 found nothing and a client is supplied. The text is fenced in
// <input> tags inside a fixed instruction.
//
// Both tiers fail closed: a fault is reported as a detection. Text longer
// than `max_input_chars` is a Tier 1 fault and never reaches the classifier.
class InjectionScreen : public InjectionDetector {
 public:
  explicit InjectionScreen(std::vector<std::string> known_phrases,
                           double similarity_threshold = 0.85,
                           std::vector<InjectionRule> rules = DefaultInjectionRules(),
                           std::size_t max_input_chars = kMaxScreenableChars);

  InjectionResult IsJailbreakAttempt(const std::string& text,
                                     CompletionClient* classifier,
                                     const CancellationToken* cancel) const override;

  // Tier 1 alone: {detected, confidence}. Throws on internal faults; the
  // caller converts them.
  std::pair<bool, double> DetectViaPatternMatching(const std::string& text) const;

  // Tier 2 alone: {detected, reason}. RequestCancelled propagates; any other
  // failure is a detection.
  std::pair<bool, std::string> DetectViaClassifier(const std::string& text,
                                                   CompletionClient& classifier,
                                                   const CancellationToken* cancel) const;

  static std::string BuildClassificationPrompt(const std::string& text);

  // True iff the trimmed, upper-cased response begins with "YES".
  static bool IsPositiveClassification(const std::string& response);

  // Jaccard similarity of the word sets of `a` and `b` (lower-cased,
  // alphanumeric runs).
  static double WordSetSimilarity(const std::vector<std::string>& a,
                                  const std::vector<std::string>& b);

  std::size_t PhraseCount() const { return phrases_.size(); }

 private:
  struct PatternMatch {
    bool detected{false};
    double score{0.0};
    bool near_match{false};
  };

  PatternMatch MatchPatterns(const std::string& text) const;

  struct KnownPhrase {
    std::string lowered;
    std::vector<std::string> words;
  };

  double NearMatch(const std::vector<std::string>& words) const;

  std::vector<InjectionRule> rules_;
  std::vector<KnownPhrase> phrases_;
  double similarity_threshold_;
  std::size_t max_input_chars_;
};

}  // namespace promptgate
