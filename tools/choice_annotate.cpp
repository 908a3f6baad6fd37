#include "StoryChoices/CategorySupport.h"
#include "StoryChoices/ChoicePipeline.h"
#include "StoryChoices/ChoiceRecordJson.h"
#include "StoryChoices/ChoiceSettings.h"
#include "StoryChoices/GameStateSnapshot.h"
#include "StoryChoices/Logging.h"
#include "StoryChoices/SkillChoiceHints.h"
#include "StoryChoices/Utf8Text.h"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace
{
	constexpr int kExitOk = 0;
	constexpr int kExitFailure = 1;
	constexpr int kExitUsage = 2;

	struct CommandLine
	{
		std::filesystem::path statePath{};
		std::filesystem::path settingsPath{};
		std::filesystem::path logPath{};
		std::optional<std::string> previousCategory{};
		bool printHints{ false };
	};

	void PrintUsage(std::ostream& a_out)
	{
		a_out << "usage: choice_annotate --state <file> [--settings <file>] [--previous <category>] [--log <file>] [--hints] < choices.txt\n"
				 "  Reads one raw choice per line and prints the annotated records as a JSON array.\n"
				 "  --hints prints the skill mastery prompt block for the player's learned skills instead.\n";
	}

	[[nodiscard]] bool ParseCommandLine(int a_argc, char** a_argv, CommandLine& a_out)
	{
		for (int i = 1; i < a_argc; ++i) {
			const std::string_view arg = a_argv[i];
			if (arg == "--hints") {
				a_out.printHints = true;
				continue;
			}
			if (arg == "--help" || arg == "-h") {
				return false;
			}

			if (i + 1 >= a_argc) {
				std::cerr << "choice_annotate: missing value for " << arg << "\n";
				return false;
			}
			const std::string_view value = a_argv[++i];

			if (arg == "--state") {
				a_out.statePath = value;
			} else if (arg == "--settings") {
				a_out.settingsPath = value;
			} else if (arg == "--log") {
				a_out.logPath = value;
			} else if (arg == "--previous") {
				a_out.previousCategory = std::string(value);
			} else {
				std::cerr << "choice_annotate: unknown option " << arg << "\n";
				return false;
			}
		}

		if (a_out.statePath.empty()) {
			std::cerr << "choice_annotate: --state is required\n";
			return false;
		}
		return true;
	}

	[[nodiscard]] std::vector<std::string> ReadChoices(std::istream& a_in)
	{
		std::vector<std::string> choices;
		std::string line;
		while (std::getline(a_in, line)) {
			if (!StoryChoices::Utf8::Trim(line).empty()) {
				choices.push_back(line);
			}
		}
		return choices;
	}
}

int main(int argc, char** argv)
{
	CommandLine options{};
	if (!ParseCommandLine(argc, argv, options)) {
		PrintUsage(std::cerr);
		return kExitUsage;
	}

	StoryChoices::ChoiceSettings settings{};
	if (!options.settingsPath.empty() && !StoryChoices::LoadChoiceSettings(options.settingsPath, settings)) {
		std::cerr << "choice_annotate: invalid settings file " << options.settingsPath.string() << "\n";
		return kExitFailure;
	}

	StoryChoices::Logging::Options logOptions{};
	logOptions.filePath = options.logPath.empty() ? std::filesystem::path(settings.logFile) : options.logPath;
	if (const auto level = StoryChoices::Logging::ParseLevel(settings.logLevel); level) {
		logOptions.level = *level;
	} else {
		std::cerr << "choice_annotate: unknown log level '" << settings.logLevel << "', using info\n";
	}
	if (!StoryChoices::Logging::Setup(logOptions)) {
		std::cerr << "choice_annotate: logging setup failed, continuing with the default logger\n";
	}

	StoryChoices::GameStateSnapshot state{};
	if (!StoryChoices::LoadGameStateSnapshot(options.statePath, state)) {
		std::cerr << "choice_annotate: cannot load game state " << options.statePath.string() << "\n";
		return kExitFailure;
	}

	if (options.printHints) {
		std::cout << StoryChoices::BuildSkillChoiceHints(state.skills);
		return kExitOk;
	}

	StoryChoices::ChoiceSession session(settings.categorySupport);
	if (options.previousCategory) {
		const auto previous = StoryChoices::ParseChoiceCategoryLabel(*options.previousCategory);
		if (!previous) {
			std::cerr << "choice_annotate: unknown category '" << *options.previousCategory << "'\n";
			return kExitUsage;
		}
		session.SetLastSelectedCategory(previous);
	}

	const auto records = session.AnnotateAll(ReadChoices(std::cin), state.quests, &state.skills);

	nlohmann::json out = nlohmann::json::array();
	for (const auto& record : records) {
		out.push_back(StoryChoices::ToJson(record));
	}
	std::cout << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";

	spdlog::info("StoryChoices: annotated {} choice(s).", records.size());
	return kExitOk;
}
