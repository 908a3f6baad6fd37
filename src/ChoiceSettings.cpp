#include "StoryChoices/ChoiceSettings.h"

#include "JsonFile.h"
#include "StoryChoices/StateContract.h"

#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace StoryChoices
{
	namespace
	{
		[[nodiscard]] std::optional<std::int64_t> TryReadNonNegativeInteger(const nlohmann::json& a_object, std::string_view a_key)
		{
			const auto it = a_object.find(std::string(a_key));
			if (it == a_object.end()) {
				return std::nullopt;
			}
			if (it->is_number_unsigned()) {
				const auto value = it->get<std::uint64_t>();
				if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
					return std::nullopt;
				}
				return static_cast<std::int64_t>(value);
			}
			if (it->is_number_integer()) {
				const auto value = it->get<std::int64_t>();
				if (value < 0) {
					return std::nullopt;
				}
				return value;
			}
			return std::nullopt;
		}

		[[nodiscard]] std::optional<ChoiceCategory> ReadCategory(const nlohmann::json& a_value)
		{
			if (!a_value.is_string()) {
				return std::nullopt;
			}
			return ParseChoiceCategoryLabel(a_value.get_ref<const std::string&>());
		}

		[[nodiscard]] bool ParseSupportEntry(
			const nlohmann::json& a_entry,
			ChoiceCategory& a_outCategory,
			CategorySupportEntry& a_outEntry)
		{
			if (!a_entry.is_object()) {
				return false;
			}

			const auto categoryIt = a_entry.find(std::string(StateContract::kFieldSupportCategory));
			if (categoryIt == a_entry.end()) {
				return false;
			}
			const auto category = ReadCategory(*categoryIt);
			if (!category) {
				return false;
			}

			const auto supportedByIt = a_entry.find(std::string(StateContract::kFieldSupportSupportedBy));
			if (supportedByIt == a_entry.end() || !supportedByIt->is_array()) {
				return false;
			}

			CategorySupportEntry entry{};
			for (const auto& previous : *supportedByIt) {
				const auto previousCategory = ReadCategory(previous);
				if (!previousCategory) {
					return false;
				}
				entry.supportedByMask = static_cast<std::uint8_t>(entry.supportedByMask | CategoryBit(*previousCategory));
			}

			const auto bonus = TryReadNonNegativeInteger(a_entry, StateContract::kFieldSupportSuccessRateBonus);
			const auto reduction = TryReadNonNegativeInteger(a_entry, StateContract::kFieldSupportRiskReduction);
			if (!bonus || !reduction || *bonus > kMaxSuccessRate || *reduction >= static_cast<std::int64_t>(kRiskTierCount)) {
				return false;
			}
			entry.successRateBonus = static_cast<std::int32_t>(*bonus);
			entry.riskReduction = static_cast<std::uint32_t>(*reduction);

			a_outCategory = *category;
			a_outEntry = entry;
			return true;
		}

		// "Thăm dò->Chiến đấu"
		[[nodiscard]] std::optional<CategorySupportRules::ExplanationKey> ParseExplanationKey(std::string_view a_key)
		{
			const auto separator = a_key.find(StateContract::kExplanationPairSeparator);
			if (separator == std::string_view::npos) {
				return std::nullopt;
			}

			const auto previous = ParseChoiceCategoryLabel(a_key.substr(0, separator));
			const auto current = ParseChoiceCategoryLabel(a_key.substr(separator + StateContract::kExplanationPairSeparator.size()));
			if (!previous || !current) {
				return std::nullopt;
			}
			return CategorySupportRules::ExplanationKey{ *previous, *current };
		}

		[[nodiscard]] CategorySupportRules ParseCategorySupportRules(const nlohmann::json& a_root)
		{
			const auto& defaults = CategorySupportRules::Defaults();
			auto table = defaults.Table();
			auto explanations = defaults.Explanations();

			if (const auto it = a_root.find(std::string(StateContract::kFieldCategorySupport)); it != a_root.end()) {
				if (!it->is_array()) {
					spdlog::warn("StoryChoices: settings '{}' is not an array, using built-in rules.", StateContract::kFieldCategorySupport);
				} else {
					for (const auto& entry : *it) {
						ChoiceCategory category{};
						CategorySupportEntry row{};
						if (!ParseSupportEntry(entry, category, row)) {
							spdlog::warn("StoryChoices: skipped invalid '{}' entry in settings.", StateContract::kFieldCategorySupport);
							continue;
						}
						table[static_cast<std::size_t>(category)] = row;
					}
				}
			}

			if (const auto it = a_root.find(std::string(StateContract::kFieldCategorySupportExplanations)); it != a_root.end()) {
				if (!it->is_object()) {
					spdlog::warn("StoryChoices: settings '{}' is not an object.", StateContract::kFieldCategorySupportExplanations);
				} else {
					for (auto entryIt = it->begin(); entryIt != it->end(); ++entryIt) {
						const auto& key = entryIt.key();
						const auto& value = entryIt.value();
						const auto pair = ParseExplanationKey(key);
						if (!pair || !value.is_string() || value.get_ref<const std::string&>().empty()) {
							spdlog::warn("StoryChoices: skipped invalid support explanation '{}' in settings.", key);
							continue;
						}
						explanations[*pair] = value.get<std::string>();
					}
				}
			}

			return CategorySupportRules(table, std::move(explanations));
		}
	}

	bool ParseChoiceSettings(const nlohmann::json& a_root, ChoiceSettings& a_outSettings)
	{
		a_outSettings = {};
		if (!a_root.is_object()) {
			spdlog::warn("StoryChoices: settings root is not an object.");
			return false;
		}

		if (std::string logLevel; JsonFile::TryReadRequiredString(a_root, StateContract::kFieldLogLevel, logLevel)) {
			a_outSettings.logLevel = std::move(logLevel);
		}
		(void)JsonFile::TryReadString(a_root, StateContract::kFieldLogFile, a_outSettings.logFile);

		if (const auto retryIt = a_root.find(std::string(StateContract::kFieldRetry)); retryIt != a_root.end() && retryIt->is_object()) {
			if (retryIt->contains(std::string(StateContract::kFieldPreRetryDelayMs))) {
				const auto delay = TryReadNonNegativeInteger(*retryIt, StateContract::kFieldPreRetryDelayMs);
				if (delay) {
					a_outSettings.preRetryDelay = std::chrono::milliseconds(*delay);
				} else {
					spdlog::warn(
						"StoryChoices: settings '{}' must be a non-negative integer, keeping {} ms.",
						StateContract::kFieldPreRetryDelayMs,
						a_outSettings.preRetryDelay.count());
				}
			}
		}

		a_outSettings.categorySupport = ParseCategorySupportRules(a_root);
		return true;
	}

	bool LoadChoiceSettings(const std::filesystem::path& a_path, ChoiceSettings& a_outSettings)
	{
		a_outSettings = {};

		nlohmann::json root = nlohmann::json::object();
		const auto status = JsonFile::Load(a_path, "settings", root);
		if (status == JsonFile::LoadStatus::kMissing) {
			spdlog::info("StoryChoices: no settings file at {}, using defaults.", a_path.string());
			return true;
		}
		if (status != JsonFile::LoadStatus::kLoaded) {
			return false;
		}

		if (!ParseChoiceSettings(root, a_outSettings)) {
			a_outSettings = {};
			return false;
		}

		spdlog::info("StoryChoices: loaded settings from {}.", a_path.string());
		return true;
	}
}
