#pragma once

#include "policy/flags.h"

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace zoneguard {

enum class AugmentStatus {
  kApplied,     // text selected by an explicit, recognised flag
  kInferred,    // disclaimer selected by keyword fallback over the input
  kNoFlag,      // preamble requested without a flag
  kNoMatch,     // no flag and no category keyword in the input
  kUnknownFlag, // flag given but not recognised; disclaimer falls back to
                // keyword inference and `text` holds that result, if any
};

const char *AugmentStatusName(AugmentStatus status);

struct Augmentation {
  std::string text;
  AugmentStatus status{AugmentStatus::kNoFlag};
};

// Preamble and disclaimer texts indexed by enum value. Every flag always has
// an entry; an empty entry means "deliberately nothing".
struct AugmentTexts {
  std::array<std::string, kEthicalFlagCount> preambles;
  std::array<std::string, kProfessionalCategoryCount> disclaimers;

  static AugmentTexts Defaults();
  std::string &Preamble(EthicalFlag flag) {
    return preambles[static_cast<std::size_t>(flag)];
  }
  std::string &Disclaimer(ProfessionalCategory category) {
    return disclaimers[static_cast<std::size_t>(category)];
  }
};

const char *DefaultPreamble(EthicalFlag flag);
const char *DefaultDisclaimer(ProfessionalCategory category);

// ResponseAugmentor produces the text placed around model output: a preamble
// prepended for zone C and a disclaimer appended for zone D. Never throws;
// missing or unknown flags degrade to empty text.
class ResponseAugmentor {
public:
  ResponseAugmentor();
  explicit ResponseAugmentor(AugmentTexts texts);

  std::string Preamble(std::optional<EthicalFlag> flag) const;

  // An explicit category always wins. Without one, the input is scanned for
  // category keywords in the fixed order medical, legal, financial,
  // mental_health, and only the first matching category's disclaimer is
  // returned.
  std::string Disclaimer(std::optional<ProfessionalCategory> category,
                         const std::string &input_text) const;

  // String-keyed variants for callers holding a classification's flag.
  Augmentation PreambleFor(const std::optional<std::string> &flag) const;
  Augmentation DisclaimerFor(const std::optional<std::string> &flag,
                             const std::string &input_text) const;

  static std::optional<ProfessionalCategory>
  InferCategory(const std::string &input_text);

  const AugmentTexts &Texts() const { return texts_; }

private:
  AugmentTexts texts_;
};

} // namespace zoneguard
