#include "JsonFile.h"

#include <fstream>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace StoryChoices::JsonFile
{
	LoadStatus Load(const std::filesystem::path& a_path, std::string_view a_what, nlohmann::json& a_outRoot)
	{
		std::error_code ec;
		const bool exists = std::filesystem::exists(a_path, ec);
		if (ec) {
			spdlog::warn(
				"StoryChoices: failed to inspect {} file {} ({})",
				a_what,
				a_path.string(),
				ec.message());
			return LoadStatus::kIoError;
		}
		if (!exists) {
			return LoadStatus::kMissing;
		}

		std::ifstream in(a_path, std::ios::binary);
		if (!in.is_open()) {
			spdlog::warn("StoryChoices: failed to open {} file {}", a_what, a_path.string());
			return LoadStatus::kIoError;
		}

		try {
			in >> a_outRoot;
		} catch (const nlohmann::json::exception& e) {
			spdlog::warn("StoryChoices: failed to parse {} file {} ({})", a_what, a_path.string(), e.what());
			return LoadStatus::kParseError;
		}

		if (!in.good() && !in.eof()) {
			spdlog::warn("StoryChoices: failed while reading {} file {}", a_what, a_path.string());
			return LoadStatus::kIoError;
		}

		return LoadStatus::kLoaded;
	}

	bool TryReadString(const nlohmann::json& a_object, std::string_view a_key, std::string& a_outValue)
	{
		const auto it = a_object.find(std::string(a_key));
		if (it == a_object.end() || !it->is_string()) {
			return false;
		}

		a_outValue = it->get<std::string>();
		return true;
	}

	bool TryReadRequiredString(const nlohmann::json& a_object, std::string_view a_key, std::string& a_outValue)
	{
		return TryReadString(a_object, a_key, a_outValue) && !a_outValue.empty();
	}
}
