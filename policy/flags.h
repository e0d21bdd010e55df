#pragma once

#include <optional>
#include <string>

namespace zoneguard {

// Semantic categories carried by Zone C patterns; select the ethical preamble.
enum class EthicalFlag {
  kManipulation = 0,
  kDependency = 1,
  kSpiritualBypassing = 2,
  kMentalHealth = 3,
};

// Semantic categories carried by Zone D patterns; select the disclaimer.
enum class ProfessionalCategory {
  kMedical = 0,
  kLegal = 1,
  kFinancial = 2,
  kMentalHealth = 3,
};

constexpr int kEthicalFlagCount = 4;
constexpr int kProfessionalCategoryCount = 4;

const char *EthicalFlagName(EthicalFlag flag);
std::optional<EthicalFlag> ParseEthicalFlag(const std::string &name);

const char *ProfessionalCategoryName(ProfessionalCategory category);
std::optional<ProfessionalCategory>
ParseProfessionalCategory(const std::string &name);

} // namespace zoneguard
