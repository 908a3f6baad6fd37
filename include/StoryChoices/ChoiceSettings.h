#pragma once

#include "StoryChoices/CategorySupport.h"
#include "StoryChoices/RetryCoordinator.h"

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace StoryChoices
{
	struct ChoiceSettings
	{
		std::string logLevel{ "info" };
		std::string logFile{};
		std::chrono::milliseconds preRetryDelay{ kDefaultPreRetryDelay };
		CategorySupportRules categorySupport{};
	};

	// Unknown or malformed entries are skipped with a warning and keep their defaults.
	// Returns false only when a_root is not an object.
	[[nodiscard]] bool ParseChoiceSettings(const nlohmann::json& a_root, ChoiceSettings& a_outSettings);

	// A missing file is not an error: a_outSettings keeps its defaults and true is returned.
	[[nodiscard]] bool LoadChoiceSettings(const std::filesystem::path& a_path, ChoiceSettings& a_outSettings);
}
