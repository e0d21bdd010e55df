#pragma once

#include "matching/matcher_factory.h"
#include "policy/pattern_store.h"
#include "server/metrics/metrics.h"
#include "server/policy/crisis_responder.h"
#include "server/policy/response_augmentor.h"
#include "server/policy/zone_classifier.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zoneguard {

struct EngineConfig;

// GuardrailEngine is the surface the request pipeline talks to. It owns the
// classifier, crisis responder, augmentor and metrics for one process and is
// constructed once by the composition root, then shared by reference.
//
// Classify/RespondToCrisis/EthicalPreamble/Disclaimer are safe to call from
// any number of threads, including while Reload() publishes a new set.
class GuardrailEngine {
public:
  GuardrailEngine(std::shared_ptr<const CompiledPatternSet> patterns,
                  MatcherOptions matcher_options,
                  std::string default_locale = CrisisResponder::kInternational,
                  AugmentTexts texts = AugmentTexts::Defaults());

  GuardrailEngine(const GuardrailEngine &) = delete;
  GuardrailEngine &operator=(const GuardrailEngine &) = delete;

  // Loads the pattern set named by `config` (builtin corpus when
  // patterns_file is empty) and compiles it. Returns nullptr with *error set
  // on any configuration error.
  static std::unique_ptr<GuardrailEngine> Create(const EngineConfig &config,
                                                 std::string *error);

  // `context` is only used for log correlation ("request_id").
  ZoneClassification Classify(const std::string &text,
                              const RequestContext &context = {}) const;
  std::vector<PatternHit> Scan(const std::string &text) const;

  // Meant for zone B turns.
  CrisisResponse RespondToCrisis(const RequestContext &context = {}) const;

  // Unknown flags yield empty text and a warning.
  std::string EthicalPreamble(const std::optional<std::string> &flag) const;
  std::string Disclaimer(const std::optional<std::string> &flag,
                         const std::string &input_text) const;

  // Compiles `patterns` with the engine's matcher options and publishes the
  // result. On failure the active set is left untouched.
  bool Reload(const std::vector<Pattern> &patterns, std::string *error,
              const std::string &source = "reload");

  std::shared_ptr<const CompiledPatternSet> Patterns() const {
    return classifier_.Snapshot();
  }
  const ResponseAugmentor &Augmentor() const { return augmentor_; }
  const CrisisResponder &Crisis() const { return crisis_; }
  GuardrailMetrics &Metrics() { return metrics_; }
  const GuardrailMetrics &Metrics() const { return metrics_; }

private:
  mutable GuardrailMetrics metrics_;
  MatcherOptions matcher_options_;
  ZoneClassifier classifier_;
  CrisisResponder crisis_;
  ResponseAugmentor augmentor_;
};

} // namespace zoneguard
