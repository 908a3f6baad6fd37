#include "story_choices_checks_common.h"

#include "StoryChoices/ChoiceFieldExtractor.h"
#include "StoryChoices/ChoiceFieldInference.h"

#include <optional>
#include <string>

namespace StoryChoicesChecks
{
	using namespace StoryChoices;

	bool CheckExtractorScenario()
	{
		const QuestLog quests{};
		const auto fields = ExtractChoiceFields(
			"✦Chiến Đấu✦ Tấn công kẻ địch (5 phút) Tỷ lệ thành công: 40% Rủi ro: Cao",
			quests);

		if (fields.category != std::optional<std::string>("Chiến Đấu")) {
			std::cerr << "extractor: expected category 'Chiến Đấu'\n";
			return false;
		}
		if (fields.timeEstimate != std::optional<std::string>("5 phút")) {
			std::cerr << "extractor: expected time estimate '5 phút'\n";
			return false;
		}
		if (fields.successRate != 40) {
			std::cerr << "extractor: expected success rate 40\n";
			return false;
		}
		if (fields.riskTier != RiskTier::kHigh) {
			std::cerr << "extractor: expected High risk\n";
			return false;
		}
		if (fields.content != "Tấn công kẻ địch") {
			std::cerr << "extractor: unexpected residual content '" << fields.content << "'\n";
			return false;
		}
		if (fields.isNSFW || fields.rewardText || fields.riskDescription || fields.questLink) {
			std::cerr << "extractor: expected unmatched fields to stay absent\n";
			return false;
		}

		// Same input, same output.
		const auto again = ExtractChoiceFields(
			"✦Chiến Đấu✦ Tấn công kẻ địch (5 phút) Tỷ lệ thành công: 40% Rủi ro: Cao",
			quests);
		if (again.content != fields.content || again.successRate != fields.successRate || again.riskTier != fields.riskTier) {
			std::cerr << "extractor: expected deterministic output\n";
			return false;
		}

		return true;
	}

	bool CheckExtractorFieldVariants()
	{
		const auto quests = MakeQuestLog();

		// Escaped line breaks, NSFW marker, clamped rate, risk description, reward and quest link.
		const auto fields = ExtractChoiceFields(
			"1. Lẻn vào kho (NSFW) (khoảng 2 giờ)\\nTỉ lệ thành công: 150%\\n"
			"Rủi ro: Rất cao, lính gác tuần tra dày đặc\\nPhần thưởng: Bí kíp cổ\\n"
			"Mục tiêu nhiệm vụ \"Tìm Bí Kíp\"",
			quests);

		if (!fields.isNSFW) {
			std::cerr << "extractor: expected NSFW marker\n";
			return false;
		}
		if (fields.timeEstimate != std::optional<std::string>("khoảng 2 giờ")) {
			std::cerr << "extractor: expected time estimate 'khoảng 2 giờ'\n";
			return false;
		}
		if (fields.successRate != 100) {
			std::cerr << "extractor: expected success rate clamped to 100\n";
			return false;
		}
		if (fields.riskTier != RiskTier::kHigh ||
			fields.riskDescription != std::optional<std::string>("lính gác tuần tra dày đặc")) {
			std::cerr << "extractor: expected High risk with description\n";
			return false;
		}
		if (fields.rewardText != std::optional<std::string>("Bí kíp cổ")) {
			std::cerr << "extractor: expected reward 'Bí kíp cổ'\n";
			return false;
		}
		if (!fields.questLink || fields.questLink->objectiveId != "obj-2") {
			std::cerr << "extractor: expected quest link to first incomplete objective\n";
			return false;
		}
		if (fields.content != "Lẻn vào kho") {
			std::cerr << "extractor: unexpected residual content '" << fields.content << "'\n";
			return false;
		}

		// Skill text keeps its line breaks; content flattens them.
		const auto multiLine = ExtractChoiceFields(
			"Lùi lại một bước\\nHuyết Đế Chú để phá trận\\nTỷ lệ thành công: 40%", quests);
		if (multiLine.skillSource != "Lùi lại một bước\nHuyết Đế Chú để phá trận" ||
			multiLine.content != "Lùi lại một bước Huyết Đế Chú để phá trận") {
			std::cerr << "extractor: expected skill source to keep line breaks\n";
			return false;
		}

		// Parentheses without a time unit stay in the content.
		const auto noTime = ExtractChoiceFields("Mở rương (cẩn thận) (3 ngày)", quests);
		if (noTime.timeEstimate != std::optional<std::string>("3 ngày") || noTime.content != "Mở rương (cẩn thận)") {
			std::cerr << "extractor: expected only the time group to be stripped\n";
			return false;
		}

		// Unrecognised tier text: span stripped, tier absent.
		const auto unknownRisk = ExtractChoiceFields("Đi dạo quanh chợ Rủi ro: không rõ", quests);
		if (unknownRisk.riskTier || unknownRisk.content != "Đi dạo quanh chợ") {
			std::cerr << "extractor: expected unknown risk text to leave tier absent\n";
			return false;
		}

		// Keywords match regardless of case.
		const auto upper = ExtractChoiceFields("Phá cửa TỶ LỆ THÀNH CÔNG: 35% RỦI RO: CỰC CAO", quests);
		if (upper.successRate != 35 || upper.riskTier != RiskTier::kCritical || upper.content != "Phá cửa") {
			std::cerr << "extractor: expected upper-case keywords to match\n";
			return false;
		}

		// Plain text passes through normalised.
		const auto plain = ExtractChoiceFields("  2.   Nghỉ ngơi\n\n tại   quán trọ  ", quests);
		if (plain.content != "Nghỉ ngơi tại quán trọ" || plain.category || plain.successRate || plain.riskTier) {
			std::cerr << "extractor: expected plain text to be normalised only\n";
			return false;
		}

		return true;
	}

	bool CheckExtractorQuestLinks()
	{
		const auto quests = MakeQuestLog();

		const auto inactive = ExtractChoiceFields("Báo cáo với hội Mục tiêu nhiệm vụ \"Diệt Yêu Thú\"", quests);
		if (inactive.questLink || inactive.content != "Báo cáo với hội") {
			std::cerr << "quest: expected completed quest reference to be dropped and stripped\n";
			return false;
		}

		const auto allDone = ExtractChoiceFields("Lên đường Mục tiêu nhiệm vụ \"Hộ Tống Thương Đoàn\"", quests);
		if (allDone.questLink || allDone.content != "Lên đường") {
			std::cerr << "quest: expected quest without open objectives to be dropped\n";
			return false;
		}

		const auto unknown = ExtractChoiceFields("Lên đường Mục tiêu nhiệm vụ \"Không Tồn Tại\"", quests);
		if (unknown.questLink || unknown.content != "Lên đường") {
			std::cerr << "quest: expected unknown quest reference to be dropped\n";
			return false;
		}

		const auto linked = ExtractChoiceFields("Vào thư viện Mục tiêu nhiệm vụ \"Tìm Bí Kíp\"", quests);
		if (!linked.questLink ||
			linked.questLink->questTitle != "Tìm Bí Kíp" ||
			linked.questLink->objectiveDescription != "Vào thư viện cấm") {
			std::cerr << "quest: expected active quest to resolve\n";
			return false;
		}

		return true;
	}

	bool CheckRiskTextClassification()
	{
		struct Case
		{
			const char* text;
			std::optional<RiskTier> expected;
		};

		const Case cases[] = {
			{ "Thấp", RiskTier::kLow },
			{ "rất thấp", RiskTier::kLow },
			{ "Trung Bình", RiskTier::kMedium },
			{ "trung binh", RiskTier::kMedium },
			{ "Cực Cao", RiskTier::kCritical },
			{ "cuc cao", RiskTier::kCritical },
			{ " CAO ", RiskTier::kHigh },
			{ "không rõ", std::nullopt },
			{ "", std::nullopt },
		};

		for (const auto& c : cases) {
			if (ClassifyRiskText(c.text) != c.expected) {
				std::cerr << "risk: unexpected tier for '" << c.text << "'\n";
				return false;
			}
		}
		return true;
	}

	bool CheckFieldInference()
	{
		if (InferSuccessRate("Một việc DỄ DÀNG") != kEasySuccessRate ||
			InferSuccessRate("Giải câu đố đơn giản") != kEasySuccessRate ||
			InferSuccessRate("Con đường nguy hiểm") != kHardSuccessRate ||
			InferSuccessRate("Leo núi khó khăn") != kHardSuccessRate ||
			InferSuccessRate("Đi dạo") != kDefaultSuccessRate) {
			std::cerr << "inference: unexpected success rate heuristic\n";
			return false;
		}

		if (InferRiskTier("Khu vực an toàn") != RiskTier::kLow ||
			InferRiskTier("Lối đi không nguy hiểm") != RiskTier::kLow ||
			InferRiskTier("Hang động nguy hiểm") != RiskTier::kHigh ||
			InferRiskTier("Kế hoạch rủi ro cao") != RiskTier::kHigh ||
			InferRiskTier("Đi dạo") != RiskTier::kMedium) {
			std::cerr << "inference: unexpected risk heuristic\n";
			return false;
		}

		ExtractedChoiceFields missing{};
		missing.content = "Băng qua khe núi nguy hiểm";
		const auto inferred = InferChoiceFields(missing);
		if (inferred.successRate != kHardSuccessRate || inferred.riskTier != RiskTier::kHigh ||
			inferred.rewardText != kDefaultRewardText ||
			!inferred.successRateInferred || !inferred.riskTierInferred || !inferred.rewardInferred) {
			std::cerr << "inference: expected all three fields to be inferred\n";
			return false;
		}

		ExtractedChoiceFields explicitFields{};
		explicitFields.content = "Băng qua khe núi nguy hiểm";
		explicitFields.successRate = 90;
		explicitFields.riskTier = RiskTier::kLow;
		explicitFields.rewardText = "Thảo dược";
		const auto kept = InferChoiceFields(explicitFields);
		if (kept.successRate != 90 || kept.riskTier != RiskTier::kLow || kept.rewardText != "Thảo dược" ||
			kept.successRateInferred || kept.riskTierInferred || kept.rewardInferred) {
			std::cerr << "inference: expected explicit fields to be kept\n";
			return false;
		}

		return true;
	}
}
