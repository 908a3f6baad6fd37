#include "StoryChoices/CategorySupport.h"

using StoryChoices::ChoiceCategory;

namespace
{
	constexpr bool Supports(ChoiceCategory a_current, ChoiceCategory a_previous)
	{
		return StoryChoices::IsSupportedBy(StoryChoices::kDefaultCategorySupport, a_current, a_previous);
	}
}

static_assert(Supports(ChoiceCategory::kCombat, ChoiceCategory::kExploration));
static_assert(Supports(ChoiceCategory::kCombat, ChoiceCategory::kSocial));
static_assert(Supports(ChoiceCategory::kCombat, ChoiceCategory::kAction));
static_assert(!Supports(ChoiceCategory::kCombat, ChoiceCategory::kCombat));

static_assert(Supports(ChoiceCategory::kAction, ChoiceCategory::kExploration));
static_assert(Supports(ChoiceCategory::kAction, ChoiceCategory::kSocial));
static_assert(!Supports(ChoiceCategory::kAction, ChoiceCategory::kCombat));

static_assert(Supports(ChoiceCategory::kTransition, ChoiceCategory::kAction));
static_assert(Supports(ChoiceCategory::kTransition, ChoiceCategory::kExploration));
static_assert(!Supports(ChoiceCategory::kTransition, ChoiceCategory::kSocial));

static_assert(Supports(ChoiceCategory::kSocial, ChoiceCategory::kExploration));
static_assert(!Supports(ChoiceCategory::kSocial, ChoiceCategory::kAction));

// Exploration and fast-forward are never supported.
static_assert([] {
	for (std::size_t i = 0; i < StoryChoices::kChoiceCategoryCount; ++i) {
		const auto previous = static_cast<ChoiceCategory>(i);
		if (Supports(ChoiceCategory::kExploration, previous) || Supports(ChoiceCategory::kFastForward, previous)) {
			return false;
		}
	}
	return true;
}());

static_assert([] {
	for (const auto& entry : StoryChoices::kDefaultCategorySupport) {
		if (entry.successRateBonus != 15 || entry.riskReduction != 1) {
			return false;
		}
	}
	return true;
}());

static_assert(StoryChoices::ParseChoiceCategoryLabel("Chiến đấu") == ChoiceCategory::kCombat);
static_assert(StoryChoices::ParseChoiceCategoryLabel("Tua nhanh") == ChoiceCategory::kFastForward);
static_assert(!StoryChoices::ParseChoiceCategoryLabel("Chiến Đấu").has_value());
static_assert(StoryChoices::ChoiceCategoryLabel(ChoiceCategory::kExploration) == "Thăm dò");

// Every explanation pair is one the table supports.
static_assert([] {
	for (const auto& explanation : StoryChoices::kDefaultSupportExplanations) {
		if (!Supports(explanation.current, explanation.previous)) {
			return false;
		}
	}
	return true;
}());
