#include "StoryChoices/ChoicePipeline.h"

#include "StoryChoices/ChoiceFieldExtractor.h"
#include "StoryChoices/ChoiceFieldInference.h"
#include "StoryChoices/SkillMastery.h"

#include <utility>

#include <spdlog/spdlog.h>

namespace StoryChoices
{
	namespace
	{
		[[nodiscard]] std::string_view DescribeCategory(const std::optional<ChoiceCategory>& a_category) noexcept
		{
			return a_category ? ChoiceCategoryLabel(*a_category) : std::string_view("none");
		}
	}

	ChoiceRecord AnnotateChoice(
		std::string_view a_rawChoice,
		const QuestLog& a_quests,
		const SkillRegistry* a_skills,
		std::optional<ChoiceCategory> a_lastSelected,
		const CategorySupportRules& a_rules)
	{
		auto fields = InferChoiceFields(ExtractChoiceFields(a_rawChoice, a_quests));

		ChoiceRecord record{};
		record.originalSuccessRate = fields.successRate;
		record.originalRiskTier = fields.riskTier;

		std::optional<std::string_view> category;
		if (fields.category) {
			category = *fields.category;
		}
		auto support = ApplyCategorySupport(fields.successRate, fields.riskTier, category, a_lastSelected, a_rules);

		record.successRate = support.successRate;
		record.riskTier = support.riskTier;
		record.supportIndicator = std::move(support.indicator);
		record.supportTooltip = std::move(support.tooltip);

		if (a_skills) {
			record.skillName = ExtractSkillNameFromChoice(fields.skillSource);
			if (record.skillName) {
				const auto mastery = a_skills->FindLearnedSkillMastery(*record.skillName);
				const auto boost = ApplySkillMastery(record.successRate, record.riskTier, mastery);
				if (boost.boosted) {
					spdlog::debug(
						"StoryChoices: skill {} ({}) boosted choice {}% -> {}%, {} -> {}.",
						*record.skillName,
						MasteryTierLabel(*mastery),
						record.successRate,
						boost.successRate,
						RiskTierLabel(record.riskTier),
						RiskTierLabel(boost.riskTier));
					record.successRate = boost.successRate;
					record.riskTier = boost.riskTier;
					record.isSkillBoosted = true;
					record.masteryTier = mastery;
				}
			}
		}

		record.content = std::move(fields.content);
		record.timeEstimate = std::move(fields.timeEstimate);
		record.riskDescription = std::move(fields.riskDescription);
		record.rewardText = std::move(fields.rewardText);
		record.isNSFW = fields.isNSFW;
		record.category = std::move(fields.category);
		record.questLink = std::move(fields.questLink);
		return record;
	}

	ChoiceSession::ChoiceSession(CategorySupportRules a_rules) :
		_rules(std::move(a_rules))
	{}

	void ChoiceSession::SetLastSelectedCategory(std::optional<ChoiceCategory> a_category)
	{
		{
			std::scoped_lock lk{ _lock };
			_lastSelectedCategory = a_category;
		}
		spdlog::debug("StoryChoices: last selected category set to {}.", DescribeCategory(a_category));
	}

	std::optional<ChoiceCategory> ChoiceSession::GetLastSelectedCategory() const
	{
		std::scoped_lock lk{ _lock };
		return _lastSelectedCategory;
	}

	void ChoiceSession::SelectChoice(std::string_view a_rawChoice)
	{
		SetLastSelectedCategory(ParseCategoryFromChoice(a_rawChoice));
	}

	void ChoiceSession::SubmitCustomAction()
	{
		SetLastSelectedCategory(std::nullopt);
	}

	void ChoiceSession::ResetCategorySupport()
	{
		{
			std::scoped_lock lk{ _lock };
			_lastSelectedCategory.reset();
		}
		spdlog::info("StoryChoices: category support reset.");
	}

	ChoiceRecord ChoiceSession::Annotate(
		std::string_view a_rawChoice,
		const QuestLog& a_quests,
		const SkillRegistry* a_skills) const
	{
		return AnnotateChoice(a_rawChoice, a_quests, a_skills, GetLastSelectedCategory(), _rules);
	}

	std::vector<ChoiceRecord> ChoiceSession::AnnotateAll(
		const std::vector<std::string>& a_rawChoices,
		const QuestLog& a_quests,
		const SkillRegistry* a_skills) const
	{
		const auto lastSelected = GetLastSelectedCategory();

		std::vector<ChoiceRecord> out;
		out.reserve(a_rawChoices.size());
		for (const auto& raw : a_rawChoices) {
			out.push_back(AnnotateChoice(raw, a_quests, a_skills, lastSelected, _rules));
		}
		return out;
	}
}
