#pragma once

#include <string_view>

namespace StoryChoices::StateContract
{
	// Settings file.
	inline constexpr std::string_view kFieldLogLevel = "logLevel";
	inline constexpr std::string_view kFieldLogFile = "logFile";
	inline constexpr std::string_view kFieldRetry = "retry";
	inline constexpr std::string_view kFieldPreRetryDelayMs = "preRetryDelayMs";
	inline constexpr std::string_view kFieldCategorySupport = "categorySupport";
	inline constexpr std::string_view kFieldCategorySupportExplanations = "categorySupportExplanations";
	inline constexpr std::string_view kFieldSupportCategory = "category";
	inline constexpr std::string_view kFieldSupportSupportedBy = "supportedBy";
	inline constexpr std::string_view kFieldSupportSuccessRateBonus = "successRateBonus";
	inline constexpr std::string_view kFieldSupportRiskReduction = "riskReduction";
	inline constexpr std::string_view kExplanationPairSeparator = "->";

	// Game-state file.
	inline constexpr std::string_view kFieldQuests = "quests";
	inline constexpr std::string_view kFieldQuestTitle = "title";
	inline constexpr std::string_view kFieldQuestStatus = "status";
	inline constexpr std::string_view kFieldQuestObjectives = "objectives";
	inline constexpr std::string_view kFieldObjectiveId = "id";
	inline constexpr std::string_view kFieldObjectiveDescription = "description";
	inline constexpr std::string_view kFieldObjectiveCompleted = "completed";
	inline constexpr std::string_view kFieldLearnedSkills = "learnedSkills";
	inline constexpr std::string_view kFieldEntities = "entities";
	inline constexpr std::string_view kFieldEntityName = "name";
	inline constexpr std::string_view kFieldEntityType = "type";
	inline constexpr std::string_view kFieldEntityDescription = "description";
	inline constexpr std::string_view kFieldEntityMastery = "mastery";
}
