#pragma once

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace zoneguard {

// Caller-supplied request context. Recognised keys: "country" (two-letter
// code), "locale" (e.g. "en-GB", "hi_IN.UTF-8"), "text" (the user turn, used
// for script heuristics), "request_id" (log correlation).
using RequestContext = std::unordered_map<std::string, std::string>;

struct CrisisResource {
  std::string name;
  std::string contact;
  std::string note;
};

struct CrisisResponse {
  std::string locale;
  std::vector<CrisisResource> resources;
  std::string message;
};

nlohmann::json ToJson(const CrisisResponse &response);

// CrisisResponder maps request context to localized crisis resources for zone
// B turns. It never fails: undetermined or unsupported locales resolve to the
// configured default, and unknown defaults resolve to the international set.
class CrisisResponder {
public:
  static constexpr const char *kInternational = "INTL";

  explicit CrisisResponder(std::string default_locale = kInternational);

  CrisisResponse Respond(const RequestContext &context = {}) const;

  // Resolution order: context["country"], region of context["locale"],
  // language of context["locale"], script of context["text"], default.
  std::string DetectLocale(const RequestContext &context) const;

  const std::string &DefaultLocale() const { return default_locale_; }

  static bool SupportsLocale(const std::string &locale);
  static const std::vector<CrisisResource> &ResourcesFor(const std::string &locale);
  static std::string RenderMessage(const std::vector<CrisisResource> &resources);

private:
  std::string default_locale_;
};

} // namespace zoneguard
