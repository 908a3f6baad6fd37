#pragma once

#include "StoryChoices/ChoiceRecord.h"

#include <nlohmann/json_fwd.hpp>

namespace StoryChoices
{
	// Absent optionals are written as null; tiers use their Vietnamese labels.
	[[nodiscard]] nlohmann::json ToJson(const ChoiceRecord& a_record);
}
