#include "StoryChoices/ChoiceFieldInference.h"

#include "StoryChoices/Utf8Text.h"

#include <initializer_list>
#include <string>
#include <utility>

namespace StoryChoices
{
	namespace
	{
		[[nodiscard]] bool ContainsAny(std::string_view a_folded, std::initializer_list<std::string_view> a_words)
		{
			for (const auto word : a_words) {
				if (Utf8::ContainsFolded(a_folded, word)) {
					return true;
				}
			}
			return false;
		}
	}

	std::int32_t InferSuccessRate(std::string_view a_content)
	{
		const auto folded = Utf8::FoldCase(a_content);
		if (ContainsAny(folded, { "dễ dàng", "đơn giản" })) {
			return kEasySuccessRate;
		}
		if (ContainsAny(folded, { "khó khăn", "nguy hiểm" })) {
			return kHardSuccessRate;
		}
		return kDefaultSuccessRate;
	}

	RiskTier InferRiskTier(std::string_view a_content)
	{
		const auto folded = Utf8::FoldCase(a_content);
		// "không nguy hiểm" must win over the bare "nguy hiểm".
		if (ContainsAny(folded, { "an toàn", "không nguy hiểm" })) {
			return RiskTier::kLow;
		}
		if (ContainsAny(folded, { "nguy hiểm", "rủi ro cao" })) {
			return RiskTier::kHigh;
		}
		return RiskTier::kMedium;
	}

	InferredChoiceFields InferChoiceFields(ExtractedChoiceFields a_fields)
	{
		InferredChoiceFields out{};
		out.successRateInferred = !a_fields.successRate.has_value();
		out.riskTierInferred = !a_fields.riskTier.has_value();
		out.rewardInferred = !a_fields.rewardText.has_value();

		out.successRate = a_fields.successRate ? *a_fields.successRate : InferSuccessRate(a_fields.content);
		out.riskTier = a_fields.riskTier ? *a_fields.riskTier : InferRiskTier(a_fields.content);
		out.rewardText = a_fields.rewardText ? std::move(*a_fields.rewardText) : std::string(kDefaultRewardText);

		out.content = std::move(a_fields.content);
		out.skillSource = std::move(a_fields.skillSource);
		out.category = std::move(a_fields.category);
		out.timeEstimate = std::move(a_fields.timeEstimate);
		out.riskDescription = std::move(a_fields.riskDescription);
		out.isNSFW = a_fields.isNSFW;
		out.questLink = std::move(a_fields.questLink);
		return out;
	}
}
