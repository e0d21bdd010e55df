#include "server/policy/guardrail_engine.h"

#include "policy/builtin_patterns.h"
#include "policy/pattern_file.h"
#include "server/config/engine_config.h"
#include "server/logging/logger.h"

#include <utility>

namespace zoneguard {

namespace {

std::string RequestTag(const RequestContext &context) {
  auto it = context.find("request_id");
  if (it == context.end() || it->second.empty()) {
    return {};
  }
  return "request_id=" + it->second + " ";
}

} // namespace

GuardrailEngine::GuardrailEngine(
    std::shared_ptr<const CompiledPatternSet> patterns,
    MatcherOptions matcher_options, std::string default_locale,
    AugmentTexts texts)
    : matcher_options_(std::move(matcher_options)),
      classifier_(std::move(patterns), &metrics_),
      crisis_(std::move(default_locale)), augmentor_(std::move(texts)) {}

std::unique_ptr<GuardrailEngine>
GuardrailEngine::Create(const EngineConfig &config, std::string *error) {
  std::vector<Pattern> file_patterns;
  const std::vector<Pattern> *patterns = &BuiltinPatterns();
  std::string source = "builtin";
  if (!config.patterns_file.empty()) {
    if (!LoadPatternFile(config.patterns_file, &file_patterns, error)) {
      return nullptr;
    }
    patterns = &file_patterns;
    source = config.patterns_file;
  }
  auto compiled =
      PatternStore::Compile(*patterns, config.matcher, error, source);
  if (!compiled) {
    return nullptr;
  }
  return std::make_unique<GuardrailEngine>(std::move(compiled), config.matcher,
                                           config.default_locale, config.texts);
}

ZoneClassification GuardrailEngine::Classify(const std::string &text,
                                             const RequestContext &context) const {
  auto result = classifier_.Classify(text);
  if (result.zone == Zone::kA || result.zone == Zone::kB) {
    log::Info("guardrail",
              std::string("Zone ") + ZoneName(result.zone) + " classification",
              RequestTag(context) + "tag=" + result.reason);
  }
  return result;
}

std::vector<PatternHit> GuardrailEngine::Scan(const std::string &text) const {
  return classifier_.Scan(text);
}

CrisisResponse
GuardrailEngine::RespondToCrisis(const RequestContext &context) const {
  auto response = crisis_.Respond(context);
  log::Info("guardrail", "Crisis resources served",
            RequestTag(context) + "locale=" + response.locale);
  return response;
}

std::string
GuardrailEngine::EthicalPreamble(const std::optional<std::string> &flag) const {
  auto augmentation = augmentor_.PreambleFor(flag);
  if (augmentation.status == AugmentStatus::kUnknownFlag) {
    metrics_.RecordUnknownFlag();
    log::Warn("guardrail", "Unknown ethical flag, no preamble applied",
              "flag=" + *flag);
  }
  return augmentation.text;
}

std::string GuardrailEngine::Disclaimer(const std::optional<std::string> &flag,
                                        const std::string &input_text) const {
  auto augmentation = augmentor_.DisclaimerFor(flag, input_text);
  if (augmentation.status == AugmentStatus::kUnknownFlag) {
    metrics_.RecordUnknownFlag();
    log::Warn("guardrail",
              "Unknown professional category, using keyword fallback",
              "flag=" + *flag);
  }
  return augmentation.text;
}

bool GuardrailEngine::Reload(const std::vector<Pattern> &patterns,
                             std::string *error, const std::string &source) {
  std::string local_error;
  std::string *err = error ? error : &local_error;
  auto compiled = PatternStore::Compile(patterns, matcher_options_, err, source);
  if (!compiled) {
    metrics_.RecordReload(false);
    log::Error("guardrail", "Pattern reload rejected, keeping active set",
               "error=" + *err);
    return false;
  }
  classifier_.Reload(std::move(compiled));
  metrics_.RecordReload(true);
  return true;
}

} // namespace zoneguard
