#include "policy/flags.h"

namespace zoneguard {

const char *EthicalFlagName(EthicalFlag flag) {
  switch (flag) {
  case EthicalFlag::kManipulation:
    return "manipulation";
  case EthicalFlag::kDependency:
    return "dependency";
  case EthicalFlag::kSpiritualBypassing:
    return "spiritual_bypassing";
  case EthicalFlag::kMentalHealth:
    return "mental_health";
  }
  return "";
}

std::optional<EthicalFlag> ParseEthicalFlag(const std::string &name) {
  for (int i = 0; i < kEthicalFlagCount; ++i) {
    auto flag = static_cast<EthicalFlag>(i);
    if (name == EthicalFlagName(flag)) {
      return flag;
    }
  }
  return std::nullopt;
}

const char *ProfessionalCategoryName(ProfessionalCategory category) {
  switch (category) {
  case ProfessionalCategory::kMedical:
    return "medical";
  case ProfessionalCategory::kLegal:
    return "legal";
  case ProfessionalCategory::kFinancial:
    return "financial";
  case ProfessionalCategory::kMentalHealth:
    return "mental_health";
  }
  return "";
}

std::optional<ProfessionalCategory>
ParseProfessionalCategory(const std::string &name) {
  for (int i = 0; i < kProfessionalCategoryCount; ++i) {
    auto category = static_cast<ProfessionalCategory>(i);
    if (name == ProfessionalCategoryName(category)) {
      return category;
    }
  }
  return std::nullopt;
}

} // namespace zoneguard
