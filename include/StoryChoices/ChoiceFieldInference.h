#pragma once

#include "StoryChoices/ChoiceRecord.h"

#include <cstdint>
#include <string_view>

namespace StoryChoices
{
	inline constexpr std::int32_t kEasySuccessRate = 85;
	inline constexpr std::int32_t kHardSuccessRate = 45;
	inline constexpr std::int32_t kDefaultSuccessRate = 70;
	inline constexpr std::string_view kDefaultRewardText = "Tiến triển trong câu chuyện và mở ra cơ hội mới.";

	// Keyword heuristics over the normalised content. Matching ignores case.
	[[nodiscard]] std::int32_t InferSuccessRate(std::string_view a_content);
	[[nodiscard]] RiskTier InferRiskTier(std::string_view a_content);

	// Fills success rate, risk tier and reward when the generator left them out.
	[[nodiscard]] InferredChoiceFields InferChoiceFields(ExtractedChoiceFields a_fields);
}
