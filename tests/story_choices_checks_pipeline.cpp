#include "story_choices_checks_common.h"

#include "StoryChoices/CategorySupport.h"
#include "StoryChoices/ChoiceFieldInference.h"
#include "StoryChoices/ChoicePipeline.h"
#include "StoryChoices/ChoiceRecordJson.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace StoryChoicesChecks
{
	using namespace StoryChoices;

	bool CheckCategorySupport()
	{
		const auto supported = ApplyCategorySupport(
			40, RiskTier::kHigh, std::string_view("Chiến đấu"), ChoiceCategory::kExploration);
		if (!supported.applied || supported.successRate != 55 || supported.riskTier != RiskTier::kMedium) {
			std::cerr << "support: expected +15% and one tier down for Thăm dò -> Chiến đấu\n";
			return false;
		}
		if (supported.indicator != kSupportIndicator ||
			supported.tooltip != "Được hỗ trợ bởi Thăm dò: Thông tin khám phá giúp chiến đấu hiệu quả hơn") {
			std::cerr << "support: unexpected indicator or tooltip '" << supported.tooltip << "'\n";
			return false;
		}

		const auto saturated = ApplyCategorySupport(
			95, RiskTier::kLow, std::string_view("Chiến đấu"), ChoiceCategory::kAction);
		if (saturated.successRate != 100 || saturated.riskTier != RiskTier::kLow) {
			std::cerr << "support: expected rate capped at 100 and Low to stay Low\n";
			return false;
		}

		// Case-variant label is not a known category.
		const auto wrongCase = ApplyCategorySupport(
			40, RiskTier::kHigh, std::string_view("Chiến Đấu"), ChoiceCategory::kExploration);
		if (wrongCase.applied || wrongCase.successRate != 40 || wrongCase.riskTier != RiskTier::kHigh ||
			!wrongCase.indicator.empty() || !wrongCase.tooltip.empty()) {
			std::cerr << "support: expected no support for a case-variant label\n";
			return false;
		}

		const auto noPrevious = ApplyCategorySupport(40, RiskTier::kHigh, std::string_view("Chiến đấu"), std::nullopt);
		const auto noCategory = ApplyCategorySupport(40, RiskTier::kHigh, std::nullopt, ChoiceCategory::kExploration);
		const auto unsupportedPair = ApplyCategorySupport(
			40, RiskTier::kHigh, std::string_view("Thăm dò"), ChoiceCategory::kCombat);
		if (noPrevious.applied || noCategory.applied || unsupportedPair.applied) {
			std::cerr << "support: expected no support without a compatible pair\n";
			return false;
		}

		// Custom table without an explanation falls back to the generic sentence.
		auto table = kDefaultCategorySupport;
		table[static_cast<std::size_t>(ChoiceCategory::kSocial)].supportedByMask = CategoryBit(ChoiceCategory::kCombat);
		table[static_cast<std::size_t>(ChoiceCategory::kSocial)].successRateBonus = 5;
		const CategorySupportRules rules(table, {});
		const auto custom = ApplyCategorySupport(
			50, RiskTier::kCritical, std::string_view("Xã hội"), ChoiceCategory::kCombat, rules);
		if (!custom.applied || custom.successRate != 55 || custom.riskTier != RiskTier::kHigh ||
			custom.tooltip != "Được hỗ trợ bởi Chiến đấu: Chiến đấu hỗ trợ Xã hội") {
			std::cerr << "support: expected custom rules with fallback explanation\n";
			return false;
		}

		// A zero bonus means no support at all, even with a risk reduction configured.
		table[static_cast<std::size_t>(ChoiceCategory::kSocial)].successRateBonus = 0;
		const CategorySupportRules zeroBonus(table, {});
		const auto none = ApplyCategorySupport(
			50, RiskTier::kCritical, std::string_view("Xã hội"), ChoiceCategory::kCombat, zeroBonus);
		if (none.applied || none.riskTier != RiskTier::kCritical) {
			std::cerr << "support: expected zero bonus to leave the choice unchanged\n";
			return false;
		}

		if (ParseCategoryFromChoice("✦ Thăm dò ✦ Nhìn quanh") != ChoiceCategory::kExploration ||
			ParseCategoryFromChoice("✦Thăm Dò✦ Nhìn quanh") ||
			ParseCategoryFromChoice("Nhìn quanh ✦Thăm dò✦")) {
			std::cerr << "support: unexpected category tag parsing\n";
			return false;
		}

		return true;
	}

	bool CheckChoiceSessionSlot()
	{
		ChoiceSession session;
		if (session.GetLastSelectedCategory()) {
			std::cerr << "session: expected empty slot on a new session\n";
			return false;
		}

		session.SelectChoice("✦Thăm dò✦ Quan sát kẻ địch");
		if (session.GetLastSelectedCategory() != ChoiceCategory::kExploration) {
			std::cerr << "session: expected slot to hold Thăm dò after selection\n";
			return false;
		}

		const QuestLog quests{};
		const auto record = session.Annotate("✦Chiến đấu✦ Xông lên Tỷ lệ thành công: 60% Rủi ro: Cao", quests, nullptr);
		if (record.successRate != 75 || record.riskTier != RiskTier::kMedium || record.supportIndicator != kSupportIndicator) {
			std::cerr << "session: expected remembered category to support the next choice\n";
			return false;
		}

		session.SelectChoice("Một lựa chọn không có nhãn");
		if (session.GetLastSelectedCategory()) {
			std::cerr << "session: expected untagged choice to clear the slot\n";
			return false;
		}

		session.SetLastSelectedCategory(ChoiceCategory::kAction);
		session.SubmitCustomAction();
		if (session.GetLastSelectedCategory()) {
			std::cerr << "session: expected custom action to clear the slot\n";
			return false;
		}

		session.SetLastSelectedCategory(ChoiceCategory::kSocial);
		session.ResetCategorySupport();
		if (session.GetLastSelectedCategory()) {
			std::cerr << "session: expected reset to clear the slot\n";
			return false;
		}

		// Every choice in a batch is judged against the same previous category.
		session.SetLastSelectedCategory(ChoiceCategory::kExploration);
		const std::vector<std::string> batch{
			"✦Chiến đấu✦ Đánh úp Tỷ lệ thành công: 50% Rủi ro: Cao",
			"✦Xã hội✦ Thuyết phục lính gác Tỷ lệ thành công: 50% Rủi ro: Thấp",
			"✦Tua nhanh✦ Nghỉ ngơi",
		};
		const auto records = session.AnnotateAll(batch, quests, nullptr);
		if (records.size() != 3 ||
			records[0].successRate != 65 || records[1].successRate != 65 ||
			records[2].successRate != kDefaultSuccessRate ||
			!records[2].supportIndicator.empty()) {
			std::cerr << "session: unexpected batch annotation\n";
			return false;
		}
		if (session.GetLastSelectedCategory() != ChoiceCategory::kExploration) {
			std::cerr << "session: annotating must not change the slot\n";
			return false;
		}

		return true;
	}

	bool CheckPipelineStacking()
	{
		const auto quests = MakeQuestLog();
		const auto skills = MakeSkillRegistry();

		const auto record = AnnotateChoice(
			"✦Chiến đấu✦ Sử dụng Huyết Đế Chú (chiêu mạnh nhất) để tấn công Tỷ lệ thành công: 40% Rủi ro: Cao",
			quests,
			&skills,
			ChoiceCategory::kExploration);

		if (record.originalSuccessRate != 40 || record.originalRiskTier != RiskTier::kHigh) {
			std::cerr << "pipeline: expected originals to hold the generator values\n";
			return false;
		}
		if (record.successRate != 65 || record.riskTier != RiskTier::kLow) {
			std::cerr << "pipeline: expected support and mastery to stack (got " << record.successRate << "%)\n";
			return false;
		}
		if (!record.isSkillBoosted || record.masteryTier != MasteryTier::kAdvanced ||
			record.skillName != std::optional<std::string>("Huyết Đế Chú")) {
			std::cerr << "pipeline: expected Huyết Đế Chú boost at Cao Cấp\n";
			return false;
		}
		if (record.supportIndicator != kSupportIndicator || record.category != std::optional<std::string>("Chiến đấu")) {
			std::cerr << "pipeline: expected support indicator and category\n";
			return false;
		}
		if (record.content != "Sử dụng Huyết Đế Chú (chiêu mạnh nhất) để tấn công") {
			std::cerr << "pipeline: unexpected content '" << record.content << "'\n";
			return false;
		}

		// Without player state no skill lookup happens.
		const auto noSkills = AnnotateChoice(
			"Sử dụng Huyết Đế Chú, tấn công Tỷ lệ thành công: 40% Rủi ro: Cao",
			quests,
			nullptr,
			std::nullopt);
		if (noSkills.isSkillBoosted || noSkills.skillName || noSkills.successRate != 40) {
			std::cerr << "pipeline: expected no boost without a skill registry\n";
			return false;
		}

		// Novice mastery names the skill but applies nothing.
		const auto novice = AnnotateChoice(
			"Dùng Thiên Nhãn, dò xét Tỷ lệ thành công: 40% Rủi ro: Cao",
			quests,
			&skills,
			std::nullopt);
		if (novice.isSkillBoosted || novice.masteryTier || novice.skillName != std::optional<std::string>("Thiên Nhãn") ||
			novice.successRate != 40 || novice.riskTier != RiskTier::kHigh) {
			std::cerr << "pipeline: expected novice skill to leave the choice unchanged\n";
			return false;
		}

		// Entity exists but was never learned.
		const auto unlearned = AnnotateChoice(
			"Thi triển Vạn Kiếm Quy Tông, quét sạch Tỷ lệ thành công: 40% Rủi ro: Cao",
			quests,
			&skills,
			std::nullopt);
		if (unlearned.isSkillBoosted || unlearned.successRate != 40) {
			std::cerr << "pipeline: expected unlearned skill to apply nothing\n";
			return false;
		}

		// Names are read per line: the line before the skill must not leak into it.
		const auto multiLine = AnnotateChoice(
			"Lùi lại một bước\\nHuyết Đế Chú để phá trận\\nTỷ lệ thành công: 40%\\nRủi ro: Cao",
			quests,
			&skills,
			std::nullopt);
		if (multiLine.skillName != std::optional<std::string>("Huyết Đế Chú") || !multiLine.isSkillBoosted ||
			multiLine.successRate != 50 || multiLine.riskTier != RiskTier::kMedium ||
			multiLine.content != "Lùi lại một bước Huyết Đế Chú để phá trận") {
			std::cerr << "pipeline: expected multi-line choice to boost the skill on its own line (got '"
					  << (multiLine.skillName ? *multiLine.skillName : std::string("<none>")) << "')\n";
			return false;
		}

		// Inferred values feed the modifiers like extracted ones.
		const auto inferred = AnnotateChoice("Băng qua khe núi nguy hiểm", quests, &skills, std::nullopt);
		if (inferred.successRate != 45 || inferred.riskTier != RiskTier::kHigh || inferred.rewardText.empty()) {
			std::cerr << "pipeline: expected inferred defaults\n";
			return false;
		}

		return true;
	}

	bool CheckChoiceRecordJson()
	{
		const auto quests = MakeQuestLog();
		const auto skills = MakeSkillRegistry();
		const auto record = AnnotateChoice(
			"✦Chiến đấu✦ Sử dụng Huyết Đế Chú (chiêu mạnh nhất) để tấn công Tỷ lệ thành công: 40% Rủi ro: Cao\\n"
			"Mục tiêu nhiệm vụ \"Tìm Bí Kíp\"",
			quests,
			&skills,
			ChoiceCategory::kExploration);

		const auto json = ToJson(record);
		if (!json.is_object() ||
			json.value("successRate", -1) != 65 ||
			json.value("originalSuccessRate", -1) != 40 ||
			json.value("riskTier", std::string()) != "Thấp" ||
			json.value("originalRiskTier", std::string()) != "Cao" ||
			json.value("masteryTier", std::string()) != "Cao Cấp" ||
			json.value("isSkillBoosted", false) != true) {
			std::cerr << "json: unexpected scalar fields " << json.dump() << "\n";
			return false;
		}

		const auto questIt = json.find("questLink");
		if (questIt == json.end() || !questIt->is_object() || questIt->value("objectiveId", std::string()) != "obj-2") {
			std::cerr << "json: expected quest link object\n";
			return false;
		}

		if (!json.at("timeEstimate").is_null() || !json.at("riskDescription").is_null()) {
			std::cerr << "json: expected absent optionals as null\n";
			return false;
		}

		return true;
	}
}
