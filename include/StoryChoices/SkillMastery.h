#pragma once

#include "StoryChoices/MasteryTier.h"
#include "StoryChoices/RiskTier.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace StoryChoices
{
	namespace SkillGrammar
	{
		inline constexpr std::string_view kUseVerbs[] = { "sử dụng", "dùng", "thi triển" };
		inline constexpr std::string_view kPurposeWord = "để";
		inline constexpr std::string_view kWithWord = "với";
		inline constexpr std::string_view kSkillSuffixes[] = { "Chú", "Thuật", "Pháp", "Công", "Kỹ", "Nhãn" };

		// Names this short are treated as noise and the next pattern is tried.
		inline constexpr std::size_t kMinSkillNameCodePoints = 3;
	}

	// Patterns, highest priority first:
	//   1. "sử dụng|dùng|thi triển <name>" followed by '(', ',' or '-'
	//   2. "<name> để "
	//   3. "với <name>"
	//   4. a capitalised phrase ending in Chú, Thuật, Pháp, Công, Kỹ or Nhãn
	// Names never contain '(', ',', '-', '.' or a line break.
	[[nodiscard]] std::optional<std::string> ExtractSkillNameFromChoice(std::string_view a_content);

	struct SkillMasteryOutcome
	{
		std::int32_t successRate{ 0 };
		RiskTier riskTier{ RiskTier::kMedium };
		bool boosted{ false };
	};

	// Novice or no tier leaves the inputs untouched.
	[[nodiscard]] SkillMasteryOutcome ApplySkillMastery(
		std::int32_t a_successRate,
		RiskTier a_riskTier,
		std::optional<MasteryTier> a_mastery) noexcept;

	// Label-based variants. Unknown labels log a warning and apply nothing.
	[[nodiscard]] std::int32_t AdjustSuccessRate(std::int32_t a_baseRate, std::string_view a_masteryLabel);
	[[nodiscard]] RiskTier AdjustRiskTier(RiskTier a_baseRisk, std::string_view a_masteryLabel);
	[[nodiscard]] MasteryAdjustmentResult ApplyMasteryAdjustments(
		std::int32_t a_baseRate,
		RiskTier a_baseRisk,
		std::string_view a_masteryLabel);

	// Loose readers for hand-written choice text ("40% thành công", "(60% cơ hội)", "≥50%", "40%").
	[[nodiscard]] std::optional<std::int32_t> ParseSuccessRateFromChoice(std::string_view a_choiceText);

	// First risk label in the text. A label in the wrong case does not count.
	[[nodiscard]] std::optional<RiskTier> ParseRiskTierFromChoice(std::string_view a_choiceText);

	// Rewrites the first "N%" and the first risk label with mastery-adjusted values.
	// Returns the text unchanged when either value is missing or the tier changes nothing.
	[[nodiscard]] std::string GenerateAdjustedChoiceText(std::string_view a_choiceText, MasteryTier a_mastery);
}
