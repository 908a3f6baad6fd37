#include "StoryChoices/Logging.h"

#include <array>
#include <memory>
#include <system_error>
#include <utility>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace StoryChoices::Logging
{
	namespace
	{
		struct LevelName
		{
			std::string_view name;
			spdlog::level::level_enum level;
		};

		constexpr std::array<LevelName, 7> kLevelNames{ {
			{ "trace", spdlog::level::trace },
			{ "debug", spdlog::level::debug },
			{ "info", spdlog::level::info },
			{ "warn", spdlog::level::warn },
			{ "error", spdlog::level::err },
			{ "critical", spdlog::level::critical },
			{ "off", spdlog::level::off },
		} };
	}

	std::optional<spdlog::level::level_enum> ParseLevel(std::string_view a_level) noexcept
	{
		for (const auto& entry : kLevelNames) {
			if (entry.name == a_level) {
				return entry.level;
			}
		}
		return std::nullopt;
	}

	bool Setup(const Options& a_options)
	{
		spdlog::sink_ptr sink;
		if (a_options.filePath.empty()) {
			sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
		} else {
			std::error_code ec;
			if (const auto parent = a_options.filePath.parent_path(); !parent.empty()) {
				std::filesystem::create_directories(parent, ec);
			}
			if (ec) {
				spdlog::warn("StoryChoices: cannot create log directory for {} ({}).", a_options.filePath.string(), ec.message());
				return false;
			}

			try {
				sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(a_options.filePath.string(), true);
			} catch (const spdlog::spdlog_ex& e) {
				spdlog::warn("StoryChoices: cannot open log file {} ({}).", a_options.filePath.string(), e.what());
				return false;
			}
		}

		auto logger = std::make_shared<spdlog::logger>("", std::move(sink));
		spdlog::set_default_logger(std::move(logger));
		spdlog::set_pattern(std::string(kLogPattern));
		spdlog::set_level(a_options.level);
		spdlog::flush_on(spdlog::level::info);
		return true;
	}
}
