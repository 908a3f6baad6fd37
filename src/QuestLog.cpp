#include "StoryChoices/QuestLog.h"

#include <utility>

namespace StoryChoices
{
	std::optional<QuestStatus> ParseQuestStatus(std::string_view a_status) noexcept
	{
		if (a_status == "active") {
			return QuestStatus::kActive;
		}
		if (a_status == "completed") {
			return QuestStatus::kCompleted;
		}
		if (a_status == "failed") {
			return QuestStatus::kFailed;
		}
		return std::nullopt;
	}

	QuestLog::QuestLog(std::vector<Quest> a_quests) :
		_quests(std::move(a_quests))
	{}

	const Quest* QuestLog::FindActiveQuestByTitle(std::string_view a_title) const noexcept
	{
		for (const auto& quest : _quests) {
			if (quest.status == QuestStatus::kActive && quest.title == a_title) {
				return &quest;
			}
		}
		return nullptr;
	}

	const QuestObjective* QuestLog::FirstIncompleteObjective(const Quest& a_quest) noexcept
	{
		for (const auto& objective : a_quest.objectives) {
			if (!objective.completed) {
				return &objective;
			}
		}
		return nullptr;
	}
}
