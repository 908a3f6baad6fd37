#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include <spdlog/common.h>

namespace StoryChoices::Logging
{
	inline constexpr std::string_view kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

	struct Options
	{
		std::filesystem::path filePath{};  // empty: log to stderr
		spdlog::level::level_enum level{ spdlog::level::info };
	};

	// "trace", "debug", "info", "warn", "error", "critical", "off". Case-sensitive.
	[[nodiscard]] std::optional<spdlog::level::level_enum> ParseLevel(std::string_view a_level) noexcept;

	// Installs the default logger. Returns false and keeps the previous logger when the file
	// sink cannot be created.
	bool Setup(const Options& a_options);
}
