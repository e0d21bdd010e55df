#include "matching/matcher_factory.h"
#include "policy/pattern_store.h"
#include "server/config/engine_config.h"
#include "server/logging/logger.h"
#include "server/policy/guardrail_engine.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace zoneguard;

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitConfig = 2;

struct CliOptions {
  std::string config_path;
  std::string matcher;
  std::string patterns_file;
  std::string text;
  bool has_text{false};
  std::string locale;
  std::string country;
  std::string request_id;
};

void PrintUsage() {
  std::cout
      << "Usage:\n"
      << "  zoneguard classify [--text T] [--locale L] [--country C] "
         "[--request-id ID]\n"
      << "      Classify T (or each stdin line) and print one JSON object per "
         "input\n"
      << "      with the action the pipeline should take.\n"
      << "  zoneguard scan [--text T]\n"
      << "      Print every pattern hit across all zones as JSON.\n"
      << "  zoneguard validate [--patterns FILE]\n"
      << "      Compile the pattern set and print per-zone counts. Exit 2 on "
         "configuration error.\n"
      << "  zoneguard metrics\n"
      << "      Classify stdin lines, then print Prometheus metrics.\n"
      << "Global options:\n"
      << "  --config PATH      YAML config (default config/zoneguard.yaml, or "
         "ZONEGUARD_CONFIG)\n"
      << "  --matcher NAME     auto | automaton | linear\n"
      << "  --patterns FILE    YAML pattern file replacing the builtin corpus\n"
      << "  --request-id ID    Request id attached to log lines\n";
}

std::string DefaultConfigPath() {
  if (const char *env = std::getenv("ZONEGUARD_CONFIG")) {
    return env;
  }
  return "config/zoneguard.yaml";
}

// Collects --text or, when absent, every stdin line.
std::vector<std::string> Inputs(const CliOptions &opts) {
  std::vector<std::string> inputs;
  if (opts.has_text) {
    inputs.push_back(opts.text);
    return inputs;
  }
  std::string line;
  while (std::getline(std::cin, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    inputs.push_back(line);
  }
  return inputs;
}

RequestContext ContextFor(const CliOptions &opts, const std::string &text) {
  RequestContext context;
  context["text"] = text;
  if (!opts.locale.empty()) {
    context["locale"] = opts.locale;
  }
  if (!opts.country.empty()) {
    context["country"] = opts.country;
  }
  if (!opts.request_id.empty()) {
    context["request_id"] = opts.request_id;
  }
  return context;
}

json Decide(const GuardrailEngine &engine, const std::string &text,
            const RequestContext &context) {
  auto classification = engine.Classify(text, context);
  json out = ToJson(classification);
  switch (classification.zone) {
  case Zone::kA:
    out["action"] = "block";
    break;
  case Zone::kB:
    out["action"] = "crisis";
    out["crisis"] = ToJson(engine.RespondToCrisis(context));
    break;
  case Zone::kC:
    out["action"] = "preamble";
    out["preamble"] = engine.EthicalPreamble(classification.ethical_flag);
    break;
  case Zone::kD:
    out["action"] = "disclaimer";
    out["disclaimer"] = engine.Disclaimer(classification.ethical_flag, text);
    break;
  case Zone::kE:
    out["action"] = "pass";
    break;
  }
  return out;
}

int CmdClassify(const GuardrailEngine &engine, const CliOptions &opts) {
  for (const auto &text : Inputs(opts)) {
    std::cout << Decide(engine, text, ContextFor(opts, text))
                     .dump(-1, ' ', false, json::error_handler_t::replace)
              << "\n";
  }
  return 0;
}

int CmdScan(const GuardrailEngine &engine, const CliOptions &opts) {
  for (const auto &text : Inputs(opts)) {
    json hits = json::array();
    for (const auto &hit : engine.Scan(text)) {
      hits.push_back(ToJson(hit));
    }
    std::cout << json{{"hits", hits}}.dump(-1, ' ', false,
                                          json::error_handler_t::replace)
              << "\n";
  }
  return 0;
}

int CmdValidate(const GuardrailEngine &engine) {
  auto set = engine.Patterns();
  json out;
  out["source"] = set->Source();
  out["version"] = set->Version();
  out["matcher"] = set->Matcher().Name();
  out["degraded"] = set->Degraded();
  if (set->Degraded()) {
    out["fallback_reason"] = set->FallbackReason();
  }
  json zones = json::object();
  for (int z = 0; z < kPatternZoneCount; ++z) {
    const auto zone = static_cast<Zone>(z);
    zones[ZoneName(zone)] = {{"literals", set->LiteralCount(zone)},
                             {"regexes", set->RegexCount(zone)}};
  }
  out["zones"] = zones;
  std::cout << out.dump(2) << "\n";
  return 0;
}

int CmdMetrics(const GuardrailEngine &engine, const CliOptions &opts) {
  for (const auto &text : Inputs(opts)) {
    engine.Classify(text, ContextFor(opts, text));
  }
  std::cout << engine.Metrics().RenderPrometheus();
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    PrintUsage();
    return kExitUsage;
  }
  std::string command = argv[1];
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage();
    return 0;
  }

  CliOptions opts;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      opts.config_path = argv[++i];
    } else if (arg == "--matcher" && i + 1 < argc) {
      opts.matcher = argv[++i];
    } else if (arg == "--patterns" && i + 1 < argc) {
      opts.patterns_file = argv[++i];
    } else if (arg == "--text" && i + 1 < argc) {
      opts.text = argv[++i];
      opts.has_text = true;
    } else if (arg == "--locale" && i + 1 < argc) {
      opts.locale = argv[++i];
    } else if (arg == "--country" && i + 1 < argc) {
      opts.country = argv[++i];
    } else if (arg == "--request-id" && i + 1 < argc) {
      opts.request_id = argv[++i];
    } else {
      std::cerr << "Unknown or incomplete option: " << arg << "\n";
      PrintUsage();
      return kExitUsage;
    }
  }
  if (command != "classify" && command != "scan" && command != "validate" &&
      command != "metrics") {
    std::cerr << "Unknown command: " << command << "\n";
    PrintUsage();
    return kExitUsage;
  }

  EngineConfig config;
  std::string error;
  const std::string config_path =
      opts.config_path.empty() ? DefaultConfigPath() : opts.config_path;
  if (!LoadEngineConfig(config_path, &config, &error) ||
      !ApplyEnvOverrides(&config, &error)) {
    log::Error("cli", "Invalid configuration", "error=" + error);
    return kExitConfig;
  }
  if (!opts.matcher.empty()) {
    auto strategy = ParseMatcherStrategy(opts.matcher);
    if (!strategy) {
      log::Error("cli", "Unknown matcher strategy", "matcher=" + opts.matcher);
      return kExitConfig;
    }
    config.matcher.strategy = *strategy;
  }
  if (!opts.patterns_file.empty()) {
    config.patterns_file = opts.patterns_file;
  }
  ApplyLogging(config);

  auto engine = GuardrailEngine::Create(config, &error);
  if (!engine) {
    log::Error("cli", "Pattern set rejected", "error=" + error);
    return kExitConfig;
  }

  if (command == "classify") {
    return CmdClassify(*engine, opts);
  }
  if (command == "scan") {
    return CmdScan(*engine, opts);
  }
  if (command == "validate") {
    return CmdValidate(*engine);
  }
  return CmdMetrics(*engine, opts);
}
