#pragma once

#include "StoryChoices/RiskTier.h"
#include "StoryChoices/SkillRegistry.h"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace StoryChoices
{
	enum class SkillKind : std::uint8_t
	{
		kCombat = 0,
		kMystical,
		kInvestigation,
	};

	struct SkillChoiceTemplate
	{
		std::string_view categoryTag;
		std::string_view action;
		std::int32_t baseSuccessRate;
		RiskTier baseRisk;
		std::string_view timeEstimate;
	};

	inline constexpr std::array<std::array<SkillChoiceTemplate, 2>, 3> kSkillChoiceTemplates{ {
		{ {
			{ "[Chiến Đấu]", "tấn công mạnh mẽ", 60, RiskTier::kHigh, "5 phút" },
			{ "[Chiến Đấu]", "thực hiện đòn kỹ thuật", 40, RiskTier::kCritical, "3 phút" },
		} },
		{ {
			{ "[Hành Động]", "thi triển để khám phá bí ẩn", 50, RiskTier::kMedium, "10 phút" },
			{ "[Hành Động]", "sử dụng để hỗ trợ bản thân", 70, RiskTier::kLow, "5 phút" },
		} },
		{ {
			{ "[Thăm Dò]", "quan sát kỹ lưỡng môi trường xung quanh", 80, RiskTier::kLow, "15 phút" },
			{ "[Thăm Dò]", "tìm hiểu thông tin ẩn giấu", 45, RiskTier::kMedium, "20 phút" },
		} },
	} };

	// Keyword test on name and description; mystical when nothing matches.
	[[nodiscard]] SkillKind ClassifySkill(std::string_view a_name, std::string_view a_description);

	struct SkillMasteryStatus
	{
		std::string name{};
		std::string mastery{};
		std::string description{};
	};

	// One row per learned skill, falling back to the learned name, "Sơ Cấp" and a stock
	// description when the registry has no entity for it.
	[[nodiscard]] std::vector<SkillMasteryStatus> GetSkillMasteryStatus(const SkillRegistry& a_skills);

	// Prompt block listing every learned skill with a recorded mastery, two worked examples
	// per skill and the adjustment rules. Empty when no such skill exists.
	[[nodiscard]] std::string BuildSkillChoiceHints(const SkillRegistry& a_skills);
}
