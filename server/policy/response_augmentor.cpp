#include "server/policy/response_augmentor.h"

#include "matching/text_normalize.h"

#include <utility>
#include <vector>

namespace zoneguard {

namespace {

struct CategoryKeywords {
  ProfessionalCategory category;
  std::vector<std::string> keywords;
};

// Evaluation order is significant: the first category with a hit wins.
const std::vector<CategoryKeywords> &FallbackKeywords() {
  static const std::vector<CategoryKeywords> kKeywords = {
      {ProfessionalCategory::kMedical,
       {"medical", "health", "diagnose", "medication", "symptom", "doctor",
        "prescription"}},
      {ProfessionalCategory::kLegal,
       {"legal", "lawsuit", "sue", "contract", "court", "attorney", "lawyer"}},
      {ProfessionalCategory::kFinancial,
       {"invest", "financial", "stock", "crypto", "portfolio", "retirement",
        "trading"}},
      {ProfessionalCategory::kMentalHealth,
       {"bipolar", "schizophren", "disorder", "therapy", "therapist",
        "psychiatr", "mental health"}},
  };
  return kKeywords;
}

} // namespace

const char *AugmentStatusName(AugmentStatus status) {
  switch (status) {
  case AugmentStatus::kApplied:
    return "applied";
  case AugmentStatus::kInferred:
    return "inferred";
  case AugmentStatus::kNoFlag:
    return "no_flag";
  case AugmentStatus::kNoMatch:
    return "no_match";
  case AugmentStatus::kUnknownFlag:
    return "unknown_flag";
  }
  return "no_flag";
}

const char *DefaultPreamble(EthicalFlag flag) {
  switch (flag) {
  case EthicalFlag::kManipulation:
    return "The desire to influence others often points to something "
           "important about your own needs that aren't being met. Let's "
           "explore what's underneath this — what are you really seeking? "
           "Control often emerges when we feel powerless in some area of our "
           "lives.\n\n";
  case EthicalFlag::kDependency:
    return "I'm glad our conversations have been helpful, and I want to be "
           "direct with you about something important. True transformation "
           "comes from developing your own inner guidance, not from relying "
           "on any external source — including me.\n\n"
           "What I can offer is a mirror and framework for understanding. But "
           "the wisdom you're seeking? It's already within you. Let me help "
           "you access that rather than becoming another voice you depend "
           "on.\n\n";
  case EthicalFlag::kSpiritualBypassing:
    return "I notice there's a spiritual framework being used here, and I "
           "want to gently explore something. Sometimes spiritual concepts "
           "can become a way to avoid rather than integrate difficult "
           "emotions.\n\n"
           "True transcendence doesn't mean emotions disappear — it means "
           "we can be present with them without being controlled by them. "
           "Let's look at what might be underneath this experience.\n\n";
  case EthicalFlag::kMentalHealth:
    return "What you're describing sounds like it involves patterns that "
           "would benefit from professional support. Transformation work is "
           "powerful, but it's designed to complement — not replace "
           "— appropriate mental health care.\n\n"
           "I'd encourage you to explore these experiences with a qualified "
           "therapist or counselor who can provide the specialized support "
           "this deserves.\n\n";
  }
  return "";
}

const char *DefaultDisclaimer(ProfessionalCategory category) {
  switch (category) {
  case ProfessionalCategory::kMedical:
    return "\n\n---\n**Note:** This is not medical advice and should not "
           "replace consultation with qualified healthcare providers. Please "
           "discuss any health-related decisions with your doctor or medical "
           "professional.";
  case ProfessionalCategory::kLegal:
    return "\n\n---\n**Note:** This is not legal advice. For matters "
           "involving legal rights, obligations, or proceedings, please "
           "consult with a qualified attorney who can review your specific "
           "situation.";
  case ProfessionalCategory::kFinancial:
    return "\n\n---\n**Note:** This is not financial or investment advice. "
           "Please consult with a qualified financial advisor before making "
           "any investment decisions. Past performance does not guarantee "
           "future results.";
  case ProfessionalCategory::kMentalHealth:
    return "\n\n---\n**Note:** This transformation work is designed to "
           "complement, not replace, professional mental health care. If "
           "you're experiencing significant distress, please reach out to a "
           "qualified mental health professional.";
  }
  return "";
}

AugmentTexts AugmentTexts::Defaults() {
  AugmentTexts texts;
  for (int i = 0; i < kEthicalFlagCount; ++i) {
    texts.preambles[i] = DefaultPreamble(static_cast<EthicalFlag>(i));
  }
  for (int i = 0; i < kProfessionalCategoryCount; ++i) {
    texts.disclaimers[i] =
        DefaultDisclaimer(static_cast<ProfessionalCategory>(i));
  }
  return texts;
}

ResponseAugmentor::ResponseAugmentor() : texts_(AugmentTexts::Defaults()) {}

ResponseAugmentor::ResponseAugmentor(AugmentTexts texts)
    : texts_(std::move(texts)) {}

std::string ResponseAugmentor::Preamble(std::optional<EthicalFlag> flag) const {
  if (!flag) {
    return "";
  }
  return texts_.preambles[static_cast<std::size_t>(*flag)];
}

std::optional<ProfessionalCategory>
ResponseAugmentor::InferCategory(const std::string &input_text) {
  const std::string text = FoldCase(input_text);
  for (const auto &entry : FallbackKeywords()) {
    for (const auto &keyword : entry.keywords) {
      if (text.find(keyword) != std::string::npos) {
        return entry.category;
      }
    }
  }
  return std::nullopt;
}

std::string
ResponseAugmentor::Disclaimer(std::optional<ProfessionalCategory> category,
                              const std::string &input_text) const {
  if (!category) {
    category = InferCategory(input_text);
  }
  if (!category) {
    return "";
  }
  return texts_.disclaimers[static_cast<std::size_t>(*category)];
}

Augmentation
ResponseAugmentor::PreambleFor(const std::optional<std::string> &flag) const {
  Augmentation out;
  if (!flag || flag->empty()) {
    out.status = AugmentStatus::kNoFlag;
    return out;
  }
  auto parsed = ParseEthicalFlag(*flag);
  if (!parsed) {
    out.status = AugmentStatus::kUnknownFlag;
    return out;
  }
  out.text = Preamble(parsed);
  out.status = AugmentStatus::kApplied;
  return out;
}

Augmentation
ResponseAugmentor::DisclaimerFor(const std::optional<std::string> &flag,
                                 const std::string &input_text) const {
  Augmentation out;
  bool unknown = false;
  if (flag && !flag->empty()) {
    if (auto parsed = ParseProfessionalCategory(*flag)) {
      out.text = Disclaimer(parsed, input_text);
      out.status = AugmentStatus::kApplied;
      return out;
    }
    unknown = true;
  }
  auto inferred = InferCategory(input_text);
  if (inferred) {
    out.text = Disclaimer(inferred, input_text);
  }
  if (unknown) {
    out.status = AugmentStatus::kUnknownFlag;
  } else {
    out.status = inferred ? AugmentStatus::kInferred : AugmentStatus::kNoMatch;
  }
  return out;
}

} // namespace zoneguard
