#include "StoryChoices/SkillChoiceHints.h"

#include "StoryChoices/SkillMastery.h"
#include "StoryChoices/Utf8Text.h"

#include <utility>

#include <spdlog/spdlog.h>

namespace StoryChoices
{
	namespace
	{
		constexpr std::string_view kDefaultSkillDescription = "Kỹ năng đặc biệt";
		constexpr std::string_view kMissingSkillDescription = "Không có mô tả";

		constexpr std::string_view kHintsHeader =
			"\n**✨ KỸ NĂNG VÀ MASTERY ADJUSTMENTS ✨**\n"
			"Khi tạo lựa chọn sử dụng kỹ năng, áp dụng CHÍNH XÁC các điều chỉnh sau:\n\n";

		constexpr std::string_view kHintsRules =
			"**QUY TẮC ĐIỀU CHỈNH MASTERY (PHẢI TUÂN THỦ):**\n"
			"• Sơ Cấp: Không thay đổi\n"
			"• Trung Cấp: +5% success rate\n"
			"• Cao Cấp: +10% success rate, giảm 1 risk tier\n"
			"• Đại Thành: +15% success rate, giảm 1 risk tier\n"
			"• Viên Mãn: +20% success rate, giảm 2 risk tier\n"
			"• Risk tiers: Cực Cao → Cao → Trung Bình → Thấp\n\n";
	}

	SkillKind ClassifySkill(std::string_view a_name, std::string_view a_description)
	{
		const auto name = Utf8::FoldCase(a_name);
		const auto description = Utf8::FoldCase(a_description);
		const auto nameHas = [&](std::string_view a_word) { return name.find(a_word) != std::string::npos; };
		const auto descriptionHas = [&](std::string_view a_word) { return description.find(a_word) != std::string::npos; };

		if (nameHas("đánh") || nameHas("chiến") || descriptionHas("tấn công") || descriptionHas("chiến đấu")) {
			return SkillKind::kCombat;
		}
		if (nameHas("nhãn") || nameHas("thuật") || descriptionHas("thần thức") || descriptionHas("linh")) {
			return SkillKind::kMystical;
		}
		if (nameHas("quan sát") || descriptionHas("nhìn") || descriptionHas("khám phá")) {
			return SkillKind::kInvestigation;
		}
		return SkillKind::kMystical;
	}

	std::vector<SkillMasteryStatus> GetSkillMasteryStatus(const SkillRegistry& a_skills)
	{
		std::vector<SkillMasteryStatus> out;
		out.reserve(a_skills.LearnedSkills().size());
		for (const auto& learned : a_skills.LearnedSkills()) {
			const auto* entity = a_skills.FindSkillEntity(learned);

			SkillMasteryStatus status{};
			status.name = entity ? entity->name : learned;
			status.mastery = entity && entity->mastery ? *entity->mastery : std::string(MasteryTierLabel(MasteryTier::kNovice));
			status.description = entity && !entity->description.empty() ? entity->description : std::string(kMissingSkillDescription);
			out.push_back(std::move(status));
		}
		return out;
	}

	std::string BuildSkillChoiceHints(const SkillRegistry& a_skills)
	{
		std::string body;
		std::size_t skillCount = 0;

		for (const auto& learned : a_skills.LearnedSkills()) {
			const auto* entity = a_skills.FindSkillEntity(learned);
			if (!entity || !entity->mastery || entity->mastery->empty()) {
				continue;
			}

			const auto& mastery = *entity->mastery;
			const std::string_view description = entity->description.empty() ? kDefaultSkillDescription : std::string_view(entity->description);
			const auto kind = ClassifySkill(entity->name, description);

			body.append("**").append(entity->name).append(" (").append(mastery).append(")**:\n");
			for (const auto& example : kSkillChoiceTemplates[static_cast<std::size_t>(kind)]) {
				const auto adjusted = ApplyMasteryAdjustments(example.baseSuccessRate, example.baseRisk, mastery);
				body.append("  • ").append(example.categoryTag);
				body.append(" Sử dụng ").append(entity->name);
				body.append(" để ").append(example.action);
				body.append(" (").append(std::to_string(adjusted.successRate)).append("% thành công, ");
				body.append(RiskTierLabel(adjusted.riskTier)).append(" risk, ");
				body.append(example.timeEstimate).append(")\n");
			}
			body += '\n';
			++skillCount;
		}

		if (skillCount == 0) {
			return {};
		}

		spdlog::debug("StoryChoices: built skill choice hints for {} skill(s).", skillCount);

		std::string out(kHintsHeader);
		out += body;
		out += kHintsRules;
		return out;
	}
}
