#include "StoryChoices/ChoiceFieldExtractor.h"

#include "StoryChoices/Utf8Text.h"

#include <charconv>
#include <cstdint>
#include <system_error>

#include <spdlog/spdlog.h>

namespace StoryChoices
{
	namespace
	{
		struct RiskFields
		{
			std::optional<RiskTier> tier{};
			std::optional<std::string> description{};
		};

		void EraseAndTrim(std::string& a_text, std::size_t a_pos, std::size_t a_len)
		{
			a_text.erase(a_pos, a_len);
			a_text = std::string(Utf8::Trim(a_text));
		}

		[[nodiscard]] std::size_t SkipSpaces(std::string_view a_text, std::size_t a_pos) noexcept
		{
			while (a_pos < a_text.size() && Utf8::IsAsciiSpace(a_text[a_pos])) {
				++a_pos;
			}
			return a_pos;
		}

		[[nodiscard]] std::size_t FindLineEnd(std::string_view a_text, std::size_t a_pos) noexcept
		{
			const auto pos = a_text.find('\n', a_pos);
			return pos == std::string_view::npos ? a_text.size() : pos;
		}

		std::optional<std::string> TakeCategory(std::string& a_text)
		{
			const auto delimiter = ChoiceGrammar::kCategoryDelimiter;
			if (!std::string_view(a_text).starts_with(delimiter)) {
				return std::nullopt;
			}

			const auto nameBegin = delimiter.size();
			const auto close = a_text.find(delimiter, nameBegin);
			if (close == std::string::npos || close == nameBegin) {
				return std::nullopt;
			}

			std::string name(Utf8::Trim(std::string_view(a_text).substr(nameBegin, close - nameBegin)));
			EraseAndTrim(a_text, 0, SkipSpaces(a_text, close + delimiter.size()));
			if (name.empty()) {
				return std::nullopt;
			}
			return name;
		}

		bool TakeNsfwMarker(std::string& a_text)
		{
			const auto folded = Utf8::FoldCase(a_text);
			const auto pos = folded.find(ChoiceGrammar::kNsfwMarker);
			if (pos == std::string::npos) {
				return false;
			}

			EraseAndTrim(a_text, pos, ChoiceGrammar::kNsfwMarker.size());
			return true;
		}

		[[nodiscard]] bool ContainsTimeUnit(std::string_view a_foldedText) noexcept
		{
			for (const auto unit : ChoiceGrammar::kTimeUnits) {
				if (a_foldedText.find(unit) != std::string_view::npos) {
					return true;
				}
			}
			return false;
		}

		// First parenthesised group (no nested ')') that names a time unit.
		std::optional<std::string> TakeTimeEstimate(std::string& a_text)
		{
			const auto folded = Utf8::FoldCase(a_text);
			for (auto open = folded.find('('); open != std::string::npos; open = folded.find('(', open + 1)) {
				const auto close = folded.find(')', open + 1);
				if (close == std::string::npos) {
					return std::nullopt;
				}

				const auto inner = std::string_view(folded).substr(open + 1, close - open - 1);
				if (!ContainsTimeUnit(inner)) {
					continue;
				}

				std::string time = a_text.substr(open + 1, close - open - 1);
				EraseAndTrim(a_text, open, close - open + 1);
				return time;
			}
			return std::nullopt;
		}

		std::optional<std::int32_t> TakeSuccessRate(std::string& a_text)
		{
			const auto folded = Utf8::FoldCase(a_text);

			std::size_t from = 0;
			while (true) {
				std::size_t prefixPos = std::string::npos;
				std::size_t prefixLen = 0;
				for (const auto prefix : ChoiceGrammar::kSuccessRatePrefixes) {
					const auto pos = folded.find(prefix, from);
					if (pos < prefixPos) {
						prefixPos = pos;
						prefixLen = prefix.size();
					}
				}
				if (prefixPos == std::string::npos) {
					return std::nullopt;
				}

				const auto digitsBegin = SkipSpaces(folded, prefixPos + prefixLen);
				auto cursor = digitsBegin;
				while (cursor < folded.size() && Utf8::IsAsciiDigit(folded[cursor])) {
					++cursor;
				}

				if (cursor > digitsBegin && cursor < folded.size() && folded[cursor] == '%') {
					std::int64_t value = 0;
					const auto result = std::from_chars(folded.data() + digitsBegin, folded.data() + cursor, value);
					if (result.ec == std::errc::result_out_of_range) {
						value = kMaxSuccessRate;
					}

					EraseAndTrim(a_text, prefixPos, cursor + 1 - prefixPos);
					return ClampSuccessRate(value);
				}

				from = prefixPos + 1;
			}
		}

		// "Rủi ro: <tier>[, <description>]" where the tier runs to the first comma or line break
		// and the description runs to the end of its line.
		std::optional<RiskFields> TakeRisk(std::string& a_text)
		{
			const auto folded = Utf8::FoldCase(a_text);
			const auto prefixPos = folded.find(ChoiceGrammar::kRiskPrefix);
			if (prefixPos == std::string::npos) {
				return std::nullopt;
			}

			const auto tierBegin = SkipSpaces(a_text, prefixPos + ChoiceGrammar::kRiskPrefix.size());
			auto tierEnd = tierBegin;
			while (tierEnd < a_text.size() && a_text[tierEnd] != ',' && a_text[tierEnd] != '\n') {
				++tierEnd;
			}

			RiskFields out{};
			out.tier = ClassifyRiskText(std::string_view(a_text).substr(tierBegin, tierEnd - tierBegin));

			auto matchEnd = tierEnd;
			if (tierEnd < a_text.size() && a_text[tierEnd] == ',') {
				const auto descriptionBegin = SkipSpaces(a_text, tierEnd + 1);
				const auto descriptionEnd = FindLineEnd(a_text, descriptionBegin);
				const auto description = Utf8::Trim(
					std::string_view(a_text).substr(descriptionBegin, descriptionEnd - descriptionBegin));
				if (!description.empty()) {
					out.description = std::string(description);
				}
				matchEnd = descriptionEnd;
			}

			EraseAndTrim(a_text, prefixPos, matchEnd - prefixPos);
			return out;
		}

		std::optional<std::string> TakeReward(std::string& a_text)
		{
			const auto folded = Utf8::FoldCase(a_text);
			const auto prefixPos = folded.find(ChoiceGrammar::kRewardPrefix);
			if (prefixPos == std::string::npos) {
				return std::nullopt;
			}

			const auto valueBegin = SkipSpaces(a_text, prefixPos + ChoiceGrammar::kRewardPrefix.size());
			const auto valueEnd = FindLineEnd(a_text, valueBegin);
			std::string reward(Utf8::Trim(std::string_view(a_text).substr(valueBegin, valueEnd - valueBegin)));

			EraseAndTrim(a_text, prefixPos, valueEnd - prefixPos);
			if (reward.empty()) {
				return std::nullopt;
			}
			return reward;
		}

		std::optional<std::string> TakeQuestReference(std::string& a_text)
		{
			const auto folded = Utf8::FoldCase(a_text);
			const auto prefix = ChoiceGrammar::kQuestReferencePrefix;

			for (auto pos = folded.find(prefix); pos != std::string::npos; pos = folded.find(prefix, pos + 1)) {
				const auto titleBegin = pos + prefix.size();
				const auto close = a_text.find('"', titleBegin);
				if (close == std::string::npos) {
					return std::nullopt;
				}
				if (close == titleBegin) {
					continue;
				}

				std::string title = a_text.substr(titleBegin, close - titleBegin);
				EraseAndTrim(a_text, pos, close + 1 - pos);
				return title;
			}
			return std::nullopt;
		}

		std::optional<QuestLink> ResolveQuestLink(const std::string& a_title, const QuestLog& a_quests)
		{
			const auto* quest = a_quests.FindActiveQuestByTitle(a_title);
			if (!quest) {
				spdlog::debug("StoryChoices: quest reference \"{}\" has no active quest.", a_title);
				return std::nullopt;
			}

			const auto* objective = QuestLog::FirstIncompleteObjective(*quest);
			if (!objective) {
				spdlog::debug("StoryChoices: quest \"{}\" has no open objective to link.", a_title);
				return std::nullopt;
			}

			return QuestLink{
				.questTitle = a_title,
				.objectiveId = objective->id,
				.objectiveDescription = objective->description
			};
		}

		// Drops a leading "1. " ordinal and flattens whitespace.
		std::string NormalizeContent(std::string_view a_text)
		{
			a_text = Utf8::Trim(a_text);
			std::size_t cursor = 0;
			while (cursor < a_text.size() && Utf8::IsAsciiDigit(a_text[cursor])) {
				++cursor;
			}
			if (cursor > 0 && cursor < a_text.size() && a_text[cursor] == '.') {
				a_text.remove_prefix(SkipSpaces(a_text, cursor + 1));
			}

			return Utf8::CollapseWhitespace(a_text);
		}
	}

	std::string UnescapeLineBreaks(std::string_view a_raw)
	{
		std::string out;
		out.reserve(a_raw.size());
		for (std::size_t i = 0; i < a_raw.size(); ++i) {
			if (a_raw[i] == '\\' && i + 1 < a_raw.size() && a_raw[i + 1] == 'n') {
				out.push_back('\n');
				++i;
				continue;
			}
			out.push_back(a_raw[i]);
		}
		return out;
	}

	std::optional<RiskTier> ClassifyRiskText(std::string_view a_riskText)
	{
		const auto folded = Utf8::FoldCase(Utf8::Trim(a_riskText));
		const auto contains = [&](std::string_view a_word) {
			return folded.find(a_word) != std::string::npos;
		};

		if (contains("thấp")) {
			return RiskTier::kLow;
		}
		if (contains("trung bình") || contains("trung binh")) {
			return RiskTier::kMedium;
		}
		if (contains("cực cao") || contains("cuc cao")) {
			return RiskTier::kCritical;
		}
		if (contains("cao")) {
			return RiskTier::kHigh;
		}
		return std::nullopt;
	}

	ExtractedChoiceFields ExtractChoiceFields(std::string_view a_raw, const QuestLog& a_quests)
	{
		ExtractedChoiceFields out{};
		std::string working = UnescapeLineBreaks(a_raw);

		out.category = TakeCategory(working);
		out.isNSFW = TakeNsfwMarker(working);
		out.timeEstimate = TakeTimeEstimate(working);
		out.successRate = TakeSuccessRate(working);
		if (auto risk = TakeRisk(working); risk) {
			out.riskTier = risk->tier;
			out.riskDescription = std::move(risk->description);
		}
		out.rewardText = TakeReward(working);
		if (const auto title = TakeQuestReference(working); title) {
			out.questLink = ResolveQuestLink(*title, a_quests);
		}

		out.skillSource = std::string(Utf8::Trim(working));
		// Trimmed before the ordinal check, so " 2. text" loses its "2." as well.
		out.content = NormalizeContent(working);
		return out;
	}
}
