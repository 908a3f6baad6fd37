#pragma once

#include "StoryChoices/QuestLog.h"
#include "StoryChoices/SkillRegistry.h"

#include <filesystem>

#include <nlohmann/json_fwd.hpp>

namespace StoryChoices
{
	struct GameStateSnapshot
	{
		QuestLog quests{};
		SkillRegistry skills{};
	};

	// Malformed quests and entities are skipped with a warning; the rest of the snapshot loads.
	[[nodiscard]] bool ParseGameStateSnapshot(const nlohmann::json& a_root, GameStateSnapshot& a_outSnapshot);
	[[nodiscard]] bool LoadGameStateSnapshot(const std::filesystem::path& a_path, GameStateSnapshot& a_outSnapshot);
}
