#include "StoryChoices/GameStateSnapshot.h"

#include "JsonFile.h"
#include "StoryChoices/StateContract.h"

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace StoryChoices
{
	namespace
	{
		[[nodiscard]] bool ParseObjective(const nlohmann::json& a_entry, std::size_t a_index, QuestObjective& a_outObjective)
		{
			if (!a_entry.is_object()) {
				return false;
			}
			if (!JsonFile::TryReadRequiredString(a_entry, StateContract::kFieldObjectiveDescription, a_outObjective.description)) {
				return false;
			}

			if (!JsonFile::TryReadRequiredString(a_entry, StateContract::kFieldObjectiveId, a_outObjective.id)) {
				a_outObjective.id = std::to_string(a_index);
			}

			const auto completedIt = a_entry.find(std::string(StateContract::kFieldObjectiveCompleted));
			a_outObjective.completed = completedIt != a_entry.end() && completedIt->is_boolean() && completedIt->get<bool>();
			return true;
		}

		[[nodiscard]] bool ParseQuest(const nlohmann::json& a_entry, Quest& a_outQuest)
		{
			if (!a_entry.is_object()) {
				return false;
			}
			if (!JsonFile::TryReadRequiredString(a_entry, StateContract::kFieldQuestTitle, a_outQuest.title)) {
				return false;
			}

			std::string status;
			if (!JsonFile::TryReadRequiredString(a_entry, StateContract::kFieldQuestStatus, status)) {
				return false;
			}
			const auto parsedStatus = ParseQuestStatus(status);
			if (!parsedStatus) {
				return false;
			}
			a_outQuest.status = *parsedStatus;

			a_outQuest.objectives.clear();
			const auto objectivesIt = a_entry.find(std::string(StateContract::kFieldQuestObjectives));
			if (objectivesIt == a_entry.end()) {
				return true;
			}
			if (!objectivesIt->is_array()) {
				return false;
			}

			a_outQuest.objectives.reserve(objectivesIt->size());
			for (std::size_t i = 0; i < objectivesIt->size(); ++i) {
				QuestObjective objective{};
				if (!ParseObjective((*objectivesIt)[i], i, objective)) {
					return false;
				}
				a_outQuest.objectives.push_back(std::move(objective));
			}
			return true;
		}

		[[nodiscard]] bool ParseEntity(const nlohmann::json& a_entry, KnownEntity& a_outEntity)
		{
			if (!a_entry.is_object()) {
				return false;
			}
			if (!JsonFile::TryReadRequiredString(a_entry, StateContract::kFieldEntityName, a_outEntity.name) ||
			    !JsonFile::TryReadRequiredString(a_entry, StateContract::kFieldEntityType, a_outEntity.type)) {
				return false;
			}

			(void)JsonFile::TryReadString(a_entry, StateContract::kFieldEntityDescription, a_outEntity.description);

			std::string mastery;
			if (JsonFile::TryReadRequiredString(a_entry, StateContract::kFieldEntityMastery, mastery)) {
				a_outEntity.mastery = std::move(mastery);
			}
			return true;
		}
	}

	bool ParseGameStateSnapshot(const nlohmann::json& a_root, GameStateSnapshot& a_outSnapshot)
	{
		a_outSnapshot = {};
		if (!a_root.is_object()) {
			spdlog::warn("StoryChoices: game state root is not an object.");
			return false;
		}

		std::vector<Quest> quests;
		if (const auto it = a_root.find(std::string(StateContract::kFieldQuests)); it != a_root.end() && it->is_array()) {
			quests.reserve(it->size());
			for (const auto& entry : *it) {
				Quest quest{};
				if (!ParseQuest(entry, quest)) {
					spdlog::warn("StoryChoices: skipped malformed quest entry in game state.");
					continue;
				}
				quests.push_back(std::move(quest));
			}
		}

		std::vector<std::string> learnedSkills;
		if (const auto it = a_root.find(std::string(StateContract::kFieldLearnedSkills)); it != a_root.end() && it->is_array()) {
			for (const auto& entry : *it) {
				if (!entry.is_string() || entry.get_ref<const std::string&>().empty()) {
					spdlog::warn("StoryChoices: skipped malformed learned skill entry in game state.");
					continue;
				}
				learnedSkills.push_back(entry.get<std::string>());
			}
		}

		std::vector<KnownEntity> entities;
		if (const auto it = a_root.find(std::string(StateContract::kFieldEntities)); it != a_root.end() && it->is_array()) {
			entities.reserve(it->size());
			for (const auto& entry : *it) {
				KnownEntity entity{};
				if (!ParseEntity(entry, entity)) {
					spdlog::warn("StoryChoices: skipped malformed entity entry in game state.");
					continue;
				}
				entities.push_back(std::move(entity));
			}
		}

		a_outSnapshot.quests = QuestLog(std::move(quests));
		a_outSnapshot.skills = SkillRegistry(std::move(learnedSkills), std::move(entities));
		return true;
	}

	bool LoadGameStateSnapshot(const std::filesystem::path& a_path, GameStateSnapshot& a_outSnapshot)
	{
		a_outSnapshot = {};

		nlohmann::json root = nlohmann::json::object();
		const auto status = JsonFile::Load(a_path, "game state", root);
		if (status == JsonFile::LoadStatus::kMissing) {
			spdlog::warn("StoryChoices: game state file missing at {}.", a_path.string());
			return false;
		}
		if (status != JsonFile::LoadStatus::kLoaded) {
			return false;
		}

		if (!ParseGameStateSnapshot(root, a_outSnapshot)) {
			return false;
		}

		spdlog::info(
			"StoryChoices: loaded game state from {} (quests={}, learnedSkills={}, entities={}).",
			a_path.string(),
			a_outSnapshot.quests.Quests().size(),
			a_outSnapshot.skills.LearnedSkills().size(),
			a_outSnapshot.skills.Entities().size());
		return true;
	}
}
