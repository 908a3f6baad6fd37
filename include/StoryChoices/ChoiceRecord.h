#pragma once

#include "StoryChoices/MasteryTier.h"
#include "StoryChoices/RiskTier.h"

#include <cstdint>
#include <optional>
#include <string>

namespace StoryChoices
{
	struct QuestLink
	{
		std::string questTitle{};
		std::string objectiveId{};
		std::string objectiveDescription{};
	};

	// Output of the field extractor. Anything the grammar did not match stays empty.
	struct ExtractedChoiceFields
	{
		std::string content{};
		std::string skillSource{};  // stripped text before normalisation; keeps line breaks
		std::optional<std::string> category{};
		std::optional<std::string> timeEstimate{};
		std::optional<std::int32_t> successRate{};
		std::optional<RiskTier> riskTier{};
		std::optional<std::string> riskDescription{};
		std::optional<std::string> rewardText{};
		bool isNSFW{ false };
		std::optional<QuestLink> questLink{};
	};

	// Extracted fields with success rate, risk tier and reward guaranteed.
	struct InferredChoiceFields
	{
		std::string content{};
		std::string skillSource{};
		std::optional<std::string> category{};
		std::optional<std::string> timeEstimate{};
		std::int32_t successRate{ 0 };
		RiskTier riskTier{ RiskTier::kMedium };
		std::optional<std::string> riskDescription{};
		std::string rewardText{};
		bool isNSFW{ false };
		std::optional<QuestLink> questLink{};

		bool successRateInferred{ false };
		bool riskTierInferred{ false };
		bool rewardInferred{ false };
	};

	struct ChoiceRecord
	{
		std::string content{};
		std::optional<std::string> timeEstimate{};
		std::int32_t successRate{ 0 };
		std::int32_t originalSuccessRate{ 0 };
		RiskTier riskTier{ RiskTier::kMedium };
		RiskTier originalRiskTier{ RiskTier::kMedium };
		std::optional<std::string> riskDescription{};
		std::string rewardText{};
		bool isNSFW{ false };
		std::optional<std::string> category{};
		std::optional<QuestLink> questLink{};
		std::string supportIndicator{};
		std::string supportTooltip{};
		bool isSkillBoosted{ false };
		std::optional<std::string> skillName{};
		std::optional<MasteryTier> masteryTier{};
	};
}
