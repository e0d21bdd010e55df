#include <catch2/catch.hpp>

#include "server/policy/response_augmentor.h"

#include <string>

using namespace zoneguard;

TEST_CASE("Preamble returns the configured text for each flag",
          "[augmentor]") {
  ResponseAugmentor augmentor;
  for (int i = 0; i < kEthicalFlagCount; ++i) {
    const auto flag = static_cast<EthicalFlag>(i);
    INFO(EthicalFlagName(flag));
    REQUIRE(augmentor.Preamble(flag) == DefaultPreamble(flag));
    REQUIRE_FALSE(augmentor.Preamble(flag).empty());
  }
  REQUIRE(augmentor.Preamble(std::nullopt).empty());
}

TEST_CASE("Manipulation preamble text is exact", "[augmentor]") {
  ResponseAugmentor augmentor;
  const std::string expected =
      "The desire to influence others often points to something important "
      "about your own needs that aren't being met. Let's explore what's "
      "underneath this — what are you really seeking? Control often emerges "
      "when we feel powerless in some area of our lives.\n\n";
  REQUIRE(augmentor.PreambleFor(std::string("manipulation")).text == expected);
}

TEST_CASE("PreambleFor distinguishes missing and unknown flags",
          "[augmentor]") {
  ResponseAugmentor augmentor;
  auto none = augmentor.PreambleFor(std::nullopt);
  REQUIRE(none.status == AugmentStatus::kNoFlag);
  REQUIRE(none.text.empty());

  auto empty = augmentor.PreambleFor(std::string());
  REQUIRE(empty.status == AugmentStatus::kNoFlag);

  auto unknown = augmentor.PreambleFor(std::string("gaslighting"));
  REQUIRE(unknown.status == AugmentStatus::kUnknownFlag);
  REQUIRE(unknown.text.empty());

  auto applied = augmentor.PreambleFor(std::string("dependency"));
  REQUIRE(applied.status == AugmentStatus::kApplied);
  REQUIRE(applied.text.find("inner guidance") != std::string::npos);
}

TEST_CASE("Explicit disclaimer category wins over keywords", "[augmentor]") {
  ResponseAugmentor augmentor;
  auto text = augmentor.Disclaimer(ProfessionalCategory::kFinancial,
                                   "my doctor told me to sue");
  REQUIRE(text == DefaultDisclaimer(ProfessionalCategory::kFinancial));
}

TEST_CASE("Disclaimer keyword fallback follows fixed order", "[augmentor]") {
  ResponseAugmentor augmentor;
  // Legal keyword first in the text, medical still wins.
  REQUIRE(augmentor.Disclaimer(std::nullopt,
                               "my lawyer thinks my Doctor was negligent") ==
          DefaultDisclaimer(ProfessionalCategory::kMedical));
  REQUIRE(augmentor.Disclaimer(std::nullopt, "a contract question") ==
          DefaultDisclaimer(ProfessionalCategory::kLegal));
  REQUIRE(augmentor.Disclaimer(std::nullopt, "my retirement portfolio") ==
          DefaultDisclaimer(ProfessionalCategory::kFinancial));
  REQUIRE(augmentor.Disclaimer(std::nullopt, "finding a therapist") ==
          DefaultDisclaimer(ProfessionalCategory::kMentalHealth));
  REQUIRE(augmentor.Disclaimer(std::nullopt, "banana bread").empty());
}

TEST_CASE("Disclaimer texts begin with a separator", "[augmentor]") {
  for (int i = 0; i < kProfessionalCategoryCount; ++i) {
    const std::string text =
        DefaultDisclaimer(static_cast<ProfessionalCategory>(i));
    REQUIRE(text.rfind("\n\n---\n**Note:** ", 0) == 0);
  }
}

TEST_CASE("DisclaimerFor reports how the text was chosen", "[augmentor]") {
  ResponseAugmentor augmentor;
  auto applied = augmentor.DisclaimerFor(std::string("legal"), "anything");
  REQUIRE(applied.status == AugmentStatus::kApplied);
  REQUIRE(applied.text == DefaultDisclaimer(ProfessionalCategory::kLegal));

  auto inferred = augmentor.DisclaimerFor(std::nullopt, "which stock to buy");
  REQUIRE(inferred.status == AugmentStatus::kInferred);
  REQUIRE(inferred.text == DefaultDisclaimer(ProfessionalCategory::kFinancial));

  auto nothing = augmentor.DisclaimerFor(std::nullopt, "banana bread");
  REQUIRE(nothing.status == AugmentStatus::kNoMatch);
  REQUIRE(nothing.text.empty());

  auto unknown = augmentor.DisclaimerFor(std::string("astrology"),
                                         "my symptom list");
  REQUIRE(unknown.status == AugmentStatus::kUnknownFlag);
  REQUIRE(unknown.text == DefaultDisclaimer(ProfessionalCategory::kMedical));
}

TEST_CASE("Augment texts can be overridden per flag", "[augmentor]") {
  auto texts = AugmentTexts::Defaults();
  texts.Preamble(EthicalFlag::kManipulation) = "custom preamble\n\n";
  texts.Disclaimer(ProfessionalCategory::kMedical) = "";
  ResponseAugmentor augmentor(texts);
  REQUIRE(augmentor.Preamble(EthicalFlag::kManipulation) ==
          "custom preamble\n\n");
  REQUIRE(augmentor.Preamble(EthicalFlag::kDependency) ==
          DefaultPreamble(EthicalFlag::kDependency));
  // An empty entry means deliberately nothing.
  REQUIRE(augmentor.Disclaimer(ProfessionalCategory::kMedical, "").empty());
}

TEST_CASE("InferCategory is case-insensitive", "[augmentor]") {
  REQUIRE(ResponseAugmentor::InferCategory("PRESCRIPTION refill") ==
          ProfessionalCategory::kMedical);
  REQUIRE(ResponseAugmentor::InferCategory("BIPOLAR episodes") ==
          ProfessionalCategory::kMentalHealth);
  REQUIRE_FALSE(ResponseAugmentor::InferCategory("").has_value());
}
