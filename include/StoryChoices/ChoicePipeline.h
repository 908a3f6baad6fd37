#pragma once

#include "StoryChoices/CategorySupport.h"
#include "StoryChoices/ChoiceRecord.h"
#include "StoryChoices/QuestLog.h"
#include "StoryChoices/SkillRegistry.h"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace StoryChoices
{
	// extract -> infer -> category support -> skill mastery. Mastery stacks on top of the
	// support-adjusted values. a_skills may be null when no player state is available.
	[[nodiscard]] ChoiceRecord AnnotateChoice(
		std::string_view a_rawChoice,
		const QuestLog& a_quests,
		const SkillRegistry* a_skills,
		std::optional<ChoiceCategory> a_lastSelected,
		const CategorySupportRules& a_rules = CategorySupportRules::Defaults());

	// Per-session state for category support: the category of the last selected choice.
	class ChoiceSession
	{
	public:
		ChoiceSession() = default;
		explicit ChoiceSession(CategorySupportRules a_rules);

		ChoiceSession(const ChoiceSession&) = delete;
		ChoiceSession& operator=(const ChoiceSession&) = delete;

		void SetLastSelectedCategory(std::optional<ChoiceCategory> a_category);
		[[nodiscard]] std::optional<ChoiceCategory> GetLastSelectedCategory() const;

		// Remembers the category tag of the chosen raw choice, or clears it when the tag is
		// missing or unknown.
		void SelectChoice(std::string_view a_rawChoice);

		// Free-text actions carry no category and break the support chain.
		void SubmitCustomAction();
		void ResetCategorySupport();

		[[nodiscard]] ChoiceRecord Annotate(
			std::string_view a_rawChoice,
			const QuestLog& a_quests,
			const SkillRegistry* a_skills) const;

		// Every choice of one batch sees the same previous category.
		[[nodiscard]] std::vector<ChoiceRecord> AnnotateAll(
			const std::vector<std::string>& a_rawChoices,
			const QuestLog& a_quests,
			const SkillRegistry* a_skills) const;

		[[nodiscard]] const CategorySupportRules& Rules() const noexcept { return _rules; }

	private:
		CategorySupportRules _rules{};
		mutable std::mutex _lock;
		std::optional<ChoiceCategory> _lastSelectedCategory{};
	};
}
