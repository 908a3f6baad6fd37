#pragma once

#include "StoryChoices/MasteryTier.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace StoryChoices
{
	inline constexpr std::string_view kEntityTypeSkill = "skill";

	struct KnownEntity
	{
		std::string name{};
		std::string type{};
		std::string description{};
		std::optional<std::string> mastery{};
	};

	// Read-only view of the player's learned skills and the known-entity registry.
	class SkillRegistry
	{
	public:
		SkillRegistry() = default;
		SkillRegistry(std::vector<std::string> a_learnedSkills, std::vector<KnownEntity> a_entities);

		[[nodiscard]] bool IsLearned(std::string_view a_skillName) const noexcept;

		// First skill entity whose name contains a_nameFragment, ignoring case.
		[[nodiscard]] const KnownEntity* FindSkillEntity(std::string_view a_nameFragment) const;

		// Mastery of a learned skill. Empty when the skill is not learned, has no registry
		// entry, or carries no recognised mastery label.
		[[nodiscard]] std::optional<MasteryTier> FindLearnedSkillMastery(std::string_view a_skillName) const;

		[[nodiscard]] const std::vector<std::string>& LearnedSkills() const noexcept { return _learnedSkills; }
		[[nodiscard]] const std::vector<KnownEntity>& Entities() const noexcept { return _entities; }

	private:
		std::vector<std::string> _learnedSkills;
		std::vector<KnownEntity> _entities;
	};
}
