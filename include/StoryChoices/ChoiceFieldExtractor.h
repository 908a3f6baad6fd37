#pragma once

#include "StoryChoices/ChoiceRecord.h"
#include "StoryChoices/QuestLog.h"

#include <string>
#include <string_view>

namespace StoryChoices
{
	// Choice grammar emitted by the story generator:
	//   ✦Category✦ <action> (NSFW) (<time>) Tỷ lệ thành công: N% Rủi ro: <tier>, <description>
	//   Phần thưởng: <reward> Mục tiêu nhiệm vụ "<quest title>"
	namespace ChoiceGrammar
	{
		inline constexpr std::string_view kCategoryDelimiter = "✦";
		inline constexpr std::string_view kNsfwMarker = "(nsfw)";
		inline constexpr std::string_view kSuccessRatePrefixes[] = { "tỷ lệ thành công:", "tỉ lệ thành công:" };
		inline constexpr std::string_view kRiskPrefix = "rủi ro:";
		inline constexpr std::string_view kRewardPrefix = "phần thưởng:";
		inline constexpr std::string_view kQuestReferencePrefix = "mục tiêu nhiệm vụ \"";
		inline constexpr std::string_view kTimeUnits[] = { "phút", "giờ", "tiếng", "ngày", "tuần", "tháng", "năm" };
	}

	// Converts the literal two-character escape "\n" that some generators emit into a line break.
	[[nodiscard]] std::string UnescapeLineBreaks(std::string_view a_raw);

	// Maps free-form risk text ("rất cao", "Trung binh", ...) onto a tier. Specific words
	// are checked before the words they contain.
	[[nodiscard]] std::optional<RiskTier> ClassifyRiskText(std::string_view a_riskText);

	// Strips every recognised field from a_raw in grammar order and normalises what is left.
	// Quest references only survive when a_quests has an active quest with an open objective.
	[[nodiscard]] ExtractedChoiceFields ExtractChoiceFields(std::string_view a_raw, const QuestLog& a_quests);
}
