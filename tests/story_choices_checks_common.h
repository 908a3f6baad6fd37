#pragma once

#include "StoryChoices/QuestLog.h"
#include "StoryChoices/SkillRegistry.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace StoryChoicesChecks
{
	bool CheckExtractorScenario();
	bool CheckExtractorFieldVariants();
	bool CheckExtractorQuestLinks();
	bool CheckRiskTextClassification();
	bool CheckFieldInference();

	bool CheckCategorySupport();
	bool CheckChoiceSessionSlot();
	bool CheckPipelineStacking();
	bool CheckChoiceRecordJson();

	bool CheckSkillNameExtraction();
	bool CheckSkillRegistryLookup();
	bool CheckSkillMasteryModifier();
	bool CheckLooseChoiceParsing();
	bool CheckSkillChoiceHints();

	bool CheckRetryClassification();
	bool CheckRetryWithoutLastAction();
	bool CheckRetrySingleFlight();
	bool CheckRetryDispatchFailure();
	bool CheckHandleErrorWithRetry();
	bool CheckRetryStatusAndDebugInfo();

	bool CheckSettingsParsing();
	bool CheckSettingsFileLoading();
	bool CheckGameStateLoading();

	// Shared fixtures.
	inline StoryChoices::QuestLog MakeQuestLog()
	{
		using namespace StoryChoices;

		std::vector<Quest> quests;
		quests.push_back(Quest{
			.title = "Tìm Bí Kíp",
			.status = QuestStatus::kActive,
			.objectives = {
				{ .id = "obj-1", .description = "Hỏi trưởng lão", .completed = true },
				{ .id = "obj-2", .description = "Vào thư viện cấm", .completed = false },
			} });
		quests.push_back(Quest{
			.title = "Diệt Yêu Thú",
			.status = QuestStatus::kCompleted,
			.objectives = {
				{ .id = "obj-1", .description = "Hạ yêu thú", .completed = false },
			} });
		quests.push_back(Quest{
			.title = "Hộ Tống Thương Đoàn",
			.status = QuestStatus::kActive,
			.objectives = {
				{ .id = "obj-1", .description = "Đến cổng thành", .completed = true },
			} });
		return QuestLog(std::move(quests));
	}

	inline StoryChoices::SkillRegistry MakeSkillRegistry()
	{
		using namespace StoryChoices;

		std::vector<std::string> learned{ "Huyết Đế Chú", "Kiếm Pháp", "Thiên Nhãn", "Hỏa Cầu Thuật" };
		std::vector<KnownEntity> entities{
			{ .name = "Huyết Đế Chú (Cấm thuật)", .type = "skill", .description = "Tấn công bằng huyết khí", .mastery = "Cao Cấp" },
			{ .name = "Kiếm Pháp", .type = "item", .description = "", .mastery = "Đại Thành" },
			{ .name = "Thiên Nhãn", .type = "skill", .description = "Nhìn thấu ảo ảnh", .mastery = "Sơ Cấp" },
			{ .name = "Hỏa Cầu Thuật", .type = "skill", .description = "", .mastery = "Tiểu Thành" },
			{ .name = "Vạn Kiếm Quy Tông", .type = "skill", .description = "", .mastery = "Viên Mãn" },
		};
		return SkillRegistry(std::move(learned), std::move(entities));
	}

	// Fresh directory under the system temp dir; removed by the caller.
	inline std::filesystem::path MakeScratchDirectory(const std::string& a_name)
	{
		auto dir = std::filesystem::temp_directory_path() / ("story_choices_checks_" + a_name);
		std::error_code ec;
		std::filesystem::remove_all(dir, ec);
		std::filesystem::create_directories(dir, ec);
		return dir;
	}
}
