#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace StoryChoices
{
	enum class QuestStatus : std::uint8_t
	{
		kActive = 0,
		kCompleted,
		kFailed,
	};

	[[nodiscard]] std::optional<QuestStatus> ParseQuestStatus(std::string_view a_status) noexcept;

	struct QuestObjective
	{
		std::string id{};
		std::string description{};
		bool completed{ false };
	};

	struct Quest
	{
		std::string title{};
		QuestStatus status{ QuestStatus::kActive };
		std::vector<QuestObjective> objectives{};
	};

	// Read-only view of the player's quests, consulted to resolve quest references in choices.
	class QuestLog
	{
	public:
		QuestLog() = default;
		explicit QuestLog(std::vector<Quest> a_quests);

		// Exact title match restricted to active quests. Returns nullptr when nothing matches.
		[[nodiscard]] const Quest* FindActiveQuestByTitle(std::string_view a_title) const noexcept;

		[[nodiscard]] static const QuestObjective* FirstIncompleteObjective(const Quest& a_quest) noexcept;

		[[nodiscard]] const std::vector<Quest>& Quests() const noexcept { return _quests; }

	private:
		std::vector<Quest> _quests;
	};
}
