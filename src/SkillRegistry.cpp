#include "StoryChoices/SkillRegistry.h"

#include "StoryChoices/Utf8Text.h"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace StoryChoices
{
	SkillRegistry::SkillRegistry(std::vector<std::string> a_learnedSkills, std::vector<KnownEntity> a_entities) :
		_learnedSkills(std::move(a_learnedSkills)),
		_entities(std::move(a_entities))
	{}

	bool SkillRegistry::IsLearned(std::string_view a_skillName) const noexcept
	{
		return std::any_of(_learnedSkills.begin(), _learnedSkills.end(), [&](const std::string& a_learned) {
			return a_learned == a_skillName;
		});
	}

	const KnownEntity* SkillRegistry::FindSkillEntity(std::string_view a_nameFragment) const
	{
		if (a_nameFragment.empty()) {
			return nullptr;
		}

		const auto needle = Utf8::FoldCase(a_nameFragment);
		for (const auto& entity : _entities) {
			if (entity.type != kEntityTypeSkill) {
				continue;
			}
			if (Utf8::FoldCase(entity.name).find(needle) != std::string::npos) {
				return &entity;
			}
		}
		return nullptr;
	}

	std::optional<MasteryTier> SkillRegistry::FindLearnedSkillMastery(std::string_view a_skillName) const
	{
		if (!IsLearned(a_skillName)) {
			return std::nullopt;
		}

		const auto* entity = FindSkillEntity(a_skillName);
		if (!entity || !entity->mastery) {
			return std::nullopt;
		}

		const auto tier = ParseMasteryTierLabel(Utf8::Trim(*entity->mastery));
		if (!tier) {
			spdlog::warn(
				"StoryChoices: skill '{}' carries unknown mastery label '{}'.",
				entity->name,
				*entity->mastery);
		}
		return tier;
	}
}
