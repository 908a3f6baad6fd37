#include "StoryChoices/ChoiceRecordJson.h"

#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace StoryChoices
{
	namespace
	{
		[[nodiscard]] nlohmann::json OptionalString(const std::optional<std::string>& a_value)
		{
			return a_value ? nlohmann::json(*a_value) : nlohmann::json(nullptr);
		}
	}

	nlohmann::json ToJson(const ChoiceRecord& a_record)
	{
		nlohmann::json questLink = nullptr;
		if (a_record.questLink) {
			questLink = {
				{ "questTitle", a_record.questLink->questTitle },
				{ "objectiveId", a_record.questLink->objectiveId },
				{ "objectiveDescription", a_record.questLink->objectiveDescription },
			};
		}

		nlohmann::json mastery = nullptr;
		if (a_record.masteryTier) {
			mastery = std::string(MasteryTierLabel(*a_record.masteryTier));
		}

		return {
			{ "content", a_record.content },
			{ "timeEstimate", OptionalString(a_record.timeEstimate) },
			{ "successRate", a_record.successRate },
			{ "originalSuccessRate", a_record.originalSuccessRate },
			{ "riskTier", std::string(RiskTierLabel(a_record.riskTier)) },
			{ "originalRiskTier", std::string(RiskTierLabel(a_record.originalRiskTier)) },
			{ "riskDescription", OptionalString(a_record.riskDescription) },
			{ "rewardText", a_record.rewardText },
			{ "isNSFW", a_record.isNSFW },
			{ "category", OptionalString(a_record.category) },
			{ "questLink", std::move(questLink) },
			{ "supportIndicator", a_record.supportIndicator },
			{ "supportTooltip", a_record.supportTooltip },
			{ "isSkillBoosted", a_record.isSkillBoosted },
			{ "skillName", OptionalString(a_record.skillName) },
			{ "masteryTier", std::move(mastery) },
		};
	}
}
