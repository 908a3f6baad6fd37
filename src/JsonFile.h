#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace StoryChoices::JsonFile
{
	enum class LoadStatus : std::uint8_t
	{
		kLoaded = 0,
		kMissing,
		kIoError,
		kParseError,
	};

	// a_what names the file in log messages ("settings", "game state").
	[[nodiscard]] LoadStatus Load(const std::filesystem::path& a_path, std::string_view a_what, nlohmann::json& a_outRoot);

	[[nodiscard]] bool TryReadString(const nlohmann::json& a_object, std::string_view a_key, std::string& a_outValue);
	[[nodiscard]] bool TryReadRequiredString(const nlohmann::json& a_object, std::string_view a_key, std::string& a_outValue);
}
