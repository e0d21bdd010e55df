#include "server/policy/crisis_responder.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace zoneguard {

namespace {

using ResourceTable =
    std::unordered_map<std::string, std::vector<CrisisResource>>;

const ResourceTable &Resources() {
  static const ResourceTable kTable = {
      {"US",
       {{"National Suicide Prevention Lifeline", "988", "Call or text"},
        {"Crisis Text Line", "Text HOME to 741741", "Free 24/7"},
        {"SAMHSA National Helpline", "1-800-662-4357",
         "Free, confidential, 24/7"}}},
      {"UK",
       {{"Samaritans", "116 123", "Free, 24/7"},
        {"SHOUT", "Text SHOUT to 85258", "Free, 24/7"},
        {"Mind Infoline", "0300 123 3393", "Mon-Fri 9am-6pm"}}},
      {"AU",
       {{"Lifeline Australia", "13 11 14", "24/7"},
        {"Beyond Blue", "1300 22 4636", "24/7"},
        {"Kids Helpline", "1800 55 1800", "24/7, for young people"}}},
      {"IN",
       {{"iCall", "9152987821", "Mon-Sat 8am-10pm"},
        {"Vandrevala Foundation", "1860-2662-345", "24/7"},
        {"NIMHANS", "080-46110007", "24/7"}}},
      {"AE",
       {{"Dubai Community Health Center", "800-HOPE (4673)", "24/7"},
        {"Befrienders Worldwide UAE", "+971 4 457 3700", "Emotional support"},
        {"National Program for Happiness & Wellbeing", "800-4673",
         "Support line"}}},
      {"INTL",
       {{"International Association for Suicide Prevention",
         "https://www.iasp.info/resources/Crisis_Centres/",
         "Find local resources"},
        {"Befrienders Worldwide", "https://www.befrienders.org/",
         "Global directory"}}},
  };
  return kTable;
}

std::string Upper(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

std::string Lookup(const RequestContext &context, const std::string &key) {
  auto it = context.find(key);
  return it == context.end() ? std::string() : it->second;
}

// Maps a two-letter country or region code onto a resource table key.
std::string NormalizeCountry(const std::string &code) {
  std::string upper = Upper(code);
  if (upper == "GB") {
    return "UK";
  }
  return upper;
}

// "en-GB", "en_GB.UTF-8", "hi" -> {language, region}
std::pair<std::string, std::string> SplitLocale(const std::string &locale) {
  std::string base = locale.substr(0, locale.find_first_of(".@"));
  auto sep = base.find_first_of("-_");
  if (sep == std::string::npos) {
    return {base, ""};
  }
  return {base.substr(0, sep), base.substr(sep + 1)};
}

std::string LocaleForLanguage(const std::string &language) {
  std::string lowered = language;
  std::transform(
      lowered.begin(), lowered.end(), lowered.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "hi") {
    return "IN";
  }
  if (lowered == "ar") {
    return "AE";
  }
  return "";
}

// Counts code points in the Devanagari (U+0900-U+097F) and Arabic
// (U+0600-U+06FF) blocks. Malformed UTF-8 is skipped byte by byte.
std::string LocaleForScript(const std::string &text) {
  std::size_t devanagari = 0;
  std::size_t arabic = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    auto b0 = static_cast<unsigned char>(text[i]);
    if (b0 < 0x80) {
      ++i;
      continue;
    }
    std::size_t len = 0;
    uint32_t cp = 0;
    if ((b0 & 0xE0) == 0xC0) {
      len = 2;
      cp = b0 & 0x1F;
    } else if ((b0 & 0xF0) == 0xE0) {
      len = 3;
      cp = b0 & 0x0F;
    } else if ((b0 & 0xF8) == 0xF0) {
      len = 4;
      cp = b0 & 0x07;
    } else {
      ++i;
      continue;
    }
    if (i + len > text.size()) {
      break;
    }
    bool valid = true;
    for (std::size_t k = 1; k < len; ++k) {
      auto b = static_cast<unsigned char>(text[i + k]);
      if ((b & 0xC0) != 0x80) {
        valid = false;
        break;
      }
      cp = (cp << 6) | (b & 0x3F);
    }
    if (!valid) {
      ++i;
      continue;
    }
    if (cp >= 0x0900 && cp <= 0x097F) {
      ++devanagari;
    } else if (cp >= 0x0600 && cp <= 0x06FF) {
      ++arabic;
    }
    i += len;
  }
  if (devanagari == 0 && arabic == 0) {
    return "";
  }
  return devanagari >= arabic ? "IN" : "AE";
}

} // namespace

json ToJson(const CrisisResponse &response) {
  json j;
  j["locale"] = response.locale;
  j["resources"] = json::array();
  for (const auto &r : response.resources) {
    j["resources"].push_back(
        {{"name", r.name}, {"contact", r.contact}, {"note", r.note}});
  }
  j["message"] = response.message;
  return j;
}

CrisisResponder::CrisisResponder(std::string default_locale)
    : default_locale_(NormalizeCountry(default_locale)) {
  if (!SupportsLocale(default_locale_)) {
    log::Warn("crisis", "Unsupported default crisis locale '" +
                            default_locale_ + "', using " + kInternational);
    default_locale_ = kInternational;
  }
}

bool CrisisResponder::SupportsLocale(const std::string &locale) {
  return Resources().count(locale) > 0;
}

const std::vector<CrisisResource> &
CrisisResponder::ResourcesFor(const std::string &locale) {
  const auto &table = Resources();
  auto it = table.find(NormalizeCountry(locale));
  if (it == table.end()) {
    return table.at(kInternational);
  }
  return it->second;
}

std::string CrisisResponder::DetectLocale(const RequestContext &context) const {
  auto country = NormalizeCountry(Lookup(context, "country"));
  if (SupportsLocale(country)) {
    return country;
  }
  auto locale = Lookup(context, "locale");
  if (!locale.empty()) {
    auto [language, region] = SplitLocale(locale);
    auto from_region = NormalizeCountry(region);
    if (SupportsLocale(from_region)) {
      return from_region;
    }
    auto from_language = LocaleForLanguage(language);
    if (!from_language.empty()) {
      return from_language;
    }
  }
  auto from_script = LocaleForScript(Lookup(context, "text"));
  if (!from_script.empty()) {
    return from_script;
  }
  return default_locale_;
}

std::string
CrisisResponder::RenderMessage(const std::vector<CrisisResource> &resources) {
  std::ostringstream out;
  out << "I hear that you're going through something really difficult right "
         "now.\n\n";
  out << "Your safety matters, and there are people who specialize in "
         "providing support during moments like this.\n\n";
  out << "**Please reach out to one of these resources:**\n\n";
  for (const auto &r : resources) {
    out << "• **" << r.name << "**: " << r.contact;
    if (!r.note.empty()) {
      out << " (" << r.note << ")";
    }
    out << "\n";
  }
  out << "\nThese services are confidential and staffed by trained "
         "professionals.\n\n";
  out << "I'm here to support your growth and transformation, and right now "
         "the most supportive thing I can do is encourage you to connect with "
         "someone who can provide the immediate care you deserve.\n\n";
  out << "Would you like to talk about what's been happening once you've had "
         "a chance to reach out to one of these resources?";
  return out.str();
}

CrisisResponse CrisisResponder::Respond(const RequestContext &context) const {
  CrisisResponse response;
  response.locale = DetectLocale(context);
  response.resources = ResourcesFor(response.locale);
  response.message = RenderMessage(response.resources);
  return response;
}

} // namespace zoneguard
