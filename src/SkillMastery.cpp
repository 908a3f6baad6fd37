#include "StoryChoices/SkillMastery.h"

#include "StoryChoices/Utf8Text.h"

#include <array>
#include <charconv>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace StoryChoices
{
	namespace
	{
		struct KeywordHit
		{
			std::size_t pos{ std::string_view::npos };
			std::size_t len{ 0 };
		};

		struct DigitRun
		{
			std::size_t begin{ 0 };
			std::size_t end{ 0 };
		};

		[[nodiscard]] constexpr bool IsNameBreak(char a_c) noexcept
		{
			return a_c == '(' || a_c == ',' || a_c == '-' || a_c == '.' || a_c == '\n';
		}

		[[nodiscard]] constexpr bool IsPhraseCodePoint(char32_t a_cp) noexcept
		{
			return (a_cp >= U'a' && a_cp <= U'z') || (a_cp >= U'A' && a_cp <= U'Z') ||
			       (a_cp < 0x80 && Utf8::IsAsciiSpace(static_cast<char>(a_cp))) ||
			       (a_cp >= 0x00C0 && a_cp <= 0x1EF9);
		}

		[[nodiscard]] std::size_t SkipSpaces(std::string_view a_text, std::size_t a_pos) noexcept
		{
			while (a_pos < a_text.size() && Utf8::IsAsciiSpace(a_text[a_pos])) {
				++a_pos;
			}
			return a_pos;
		}

		template <std::size_t N>
		[[nodiscard]] KeywordHit FindEarliest(
			std::string_view a_folded,
			const std::string_view (&a_keywords)[N],
			std::size_t a_from) noexcept
		{
			KeywordHit hit{};
			for (const auto keyword : a_keywords) {
				const auto pos = a_folded.find(keyword, a_from);
				if (pos < hit.pos) {
					hit = { pos, keyword.size() };
				}
			}
			return hit;
		}

		// Name run after "<keyword>\s+". nullopt when nothing can match at this keyword.
		// An empty run still matches when at least two blanks precede it, yielding a blank name.
		[[nodiscard]] std::optional<std::pair<std::size_t, std::size_t>> ReadNameAfterKeyword(
			std::string_view a_text,
			std::size_t a_keywordEnd) noexcept
		{
			const auto nameBegin = SkipSpaces(a_text, a_keywordEnd);
			if (nameBegin == a_keywordEnd) {
				return std::nullopt;
			}

			auto nameEnd = nameBegin;
			while (nameEnd < a_text.size() && !IsNameBreak(a_text[nameEnd])) {
				++nameEnd;
			}
			if (nameEnd == nameBegin) {
				if (nameBegin - a_keywordEnd >= 2 && a_text[nameBegin - 1] != '\n') {
					return std::pair{ nameBegin - 1, nameBegin };
				}
				return std::nullopt;
			}
			return std::pair{ nameBegin, nameEnd };
		}

		std::optional<std::string> MatchUseVerbPhrase(std::string_view a_text, std::string_view a_folded)
		{
			for (auto hit = FindEarliest(a_folded, SkillGrammar::kUseVerbs, 0);
				 hit.pos != std::string_view::npos;
				 hit = FindEarliest(a_folded, SkillGrammar::kUseVerbs, hit.pos + 1)) {
				const auto name = ReadNameAfterKeyword(a_text, hit.pos + hit.len);
				if (!name || name->second >= a_text.size()) {
					continue;
				}

				const char terminator = a_text[name->second];
				if (terminator != '(' && terminator != ',' && terminator != '-') {
					continue;
				}
				return std::string(Utf8::Trim(a_text.substr(name->first, name->second - name->first)));
			}
			return std::nullopt;
		}

		// "<name> để ": the name is the longest run ending before a blank-delimited "để".
		std::optional<std::string> MatchPurposeClause(std::string_view a_text, std::string_view a_folded)
		{
			const auto word = SkillGrammar::kPurposeWord;

			std::size_t segmentBegin = 0;
			while (segmentBegin < a_text.size()) {
				if (IsNameBreak(a_text[segmentBegin])) {
					++segmentBegin;
					continue;
				}

				auto segmentEnd = segmentBegin;
				while (segmentEnd < a_text.size() && !IsNameBreak(a_text[segmentEnd])) {
					++segmentEnd;
				}

				std::optional<std::size_t> nameEnd;
				for (auto pos = a_folded.find(word, segmentBegin + 1); pos != std::string_view::npos; pos = a_folded.find(word, pos + 1)) {
					auto groupEnd = pos;
					while (groupEnd > segmentBegin + 1 && Utf8::IsAsciiSpace(a_text[groupEnd - 1])) {
						--groupEnd;
					}
					if (groupEnd == pos || groupEnd > segmentEnd) {
						continue;
					}

					const auto after = pos + word.size();
					if (after >= a_text.size() || !Utf8::IsAsciiSpace(a_text[after])) {
						continue;
					}
					nameEnd = groupEnd;
				}

				if (nameEnd) {
					return std::string(Utf8::Trim(a_text.substr(segmentBegin, *nameEnd - segmentBegin)));
				}
				segmentBegin = segmentEnd;
			}
			return std::nullopt;
		}

		std::optional<std::string> MatchWithPhrase(std::string_view a_text, std::string_view a_folded)
		{
			const auto word = SkillGrammar::kWithWord;
			for (auto pos = a_folded.find(word); pos != std::string_view::npos; pos = a_folded.find(word, pos + 1)) {
				const auto name = ReadNameAfterKeyword(a_text, pos + word.size());
				if (!name) {
					continue;
				}
				return std::string(Utf8::Trim(a_text.substr(name->first, name->second - name->first)));
			}
			return std::nullopt;
		}

		[[nodiscard]] std::optional<std::size_t> MatchSuffixedTail(std::string_view a_text, std::size_t a_pos)
		{
			while (a_pos < a_text.size()) {
				const auto rest = a_text.substr(a_pos);
				for (const auto suffix : SkillGrammar::kSkillSuffixes) {
					if (rest.starts_with(suffix)) {
						return a_pos + suffix.size();
					}
				}

				if (!IsPhraseCodePoint(Utf8::Decode(a_text, a_pos))) {
					return std::nullopt;
				}
			}
			return std::nullopt;
		}

		// Case-sensitive, shortest phrase from the leftmost capital that reaches a suffix.
		std::optional<std::string> MatchCapitalisedSkillPhrase(std::string_view a_text)
		{
			std::size_t start = 0;
			while (start < a_text.size()) {
				auto cursor = start;
				const auto cp = Utf8::Decode(a_text, cursor);
				if (Utf8::IsVietnameseCapital(cp)) {
					if (const auto end = MatchSuffixedTail(a_text, cursor); end) {
						return std::string(Utf8::Trim(a_text.substr(start, *end - start)));
					}
				}
				start = cursor;
			}
			return std::nullopt;
		}

		[[nodiscard]] bool IsConfidentName(const std::optional<std::string>& a_name) noexcept
		{
			return a_name && Utf8::CountCodePoints(*a_name) >= SkillGrammar::kMinSkillNameCodePoints;
		}

		[[nodiscard]] std::optional<DigitRun> NextDigitRunBeforePercent(std::string_view a_text, std::size_t a_from) noexcept
		{
			std::size_t pos = a_from;
			while (pos < a_text.size()) {
				if (!Utf8::IsAsciiDigit(a_text[pos])) {
					++pos;
					continue;
				}

				const auto begin = pos;
				while (pos < a_text.size() && Utf8::IsAsciiDigit(a_text[pos])) {
					++pos;
				}
				if (pos < a_text.size() && a_text[pos] == '%') {
					return DigitRun{ begin, pos };
				}
			}
			return std::nullopt;
		}

		[[nodiscard]] std::optional<std::int32_t> ReadPercentValue(std::string_view a_text, const DigitRun& a_run) noexcept
		{
			std::int32_t value = 0;
			const auto result = std::from_chars(a_text.data() + a_run.begin, a_text.data() + a_run.end, value);
			if (result.ec != std::errc{} || value < kMinSuccessRate || value > kMaxSuccessRate) {
				return std::nullopt;
			}
			return value;
		}

		// "N% thành công" / "N% success"
		std::optional<std::int32_t> MatchRateWithOutcomeWord(std::string_view a_text, std::string_view a_folded)
		{
			for (auto run = NextDigitRunBeforePercent(a_text, 0); run; run = NextDigitRunBeforePercent(a_text, run->end + 1)) {
				const auto tail = a_folded.substr(SkipSpaces(a_folded, run->end + 1));
				if (tail.starts_with("thành công") || tail.starts_with("success")) {
					return ReadPercentValue(a_text, *run);
				}
			}
			return std::nullopt;
		}

		// "(N%...)"
		std::optional<std::int32_t> MatchParenthesisedRate(std::string_view a_text)
		{
			for (auto open = a_text.find('('); open != std::string_view::npos; open = a_text.find('(', open + 1)) {
				auto cursor = open + 1;
				while (cursor < a_text.size() && Utf8::IsAsciiDigit(a_text[cursor])) {
					++cursor;
				}
				if (cursor == open + 1 || cursor >= a_text.size() || a_text[cursor] != '%') {
					continue;
				}
				if (a_text.find(')', cursor + 1) == std::string_view::npos) {
					continue;
				}
				return ReadPercentValue(a_text, DigitRun{ open + 1, cursor });
			}
			return std::nullopt;
		}

		// "≥N%"
		std::optional<std::int32_t> MatchLowerBoundRate(std::string_view a_text)
		{
			constexpr std::string_view marker = "≥";
			for (auto pos = a_text.find(marker); pos != std::string_view::npos; pos = a_text.find(marker, pos + 1)) {
				const auto begin = pos + marker.size();
				auto cursor = begin;
				while (cursor < a_text.size() && Utf8::IsAsciiDigit(a_text[cursor])) {
					++cursor;
				}
				if (cursor > begin && cursor < a_text.size() && a_text[cursor] == '%') {
					return ReadPercentValue(a_text, DigitRun{ begin, cursor });
				}
			}
			return std::nullopt;
		}

		struct RiskLabelHit
		{
			std::size_t pos{ std::string_view::npos };
			std::size_t len{ 0 };
			std::optional<RiskTier> tier{};
		};

		// Leftmost label, matched ignoring case. The tier is only set when the text uses the
		// label's exact spelling.
		[[nodiscard]] RiskLabelHit FindFirstRiskLabel(std::string_view a_text)
		{
			constexpr std::array kSearchOrder{ RiskTier::kCritical, RiskTier::kHigh, RiskTier::kMedium, RiskTier::kLow };

			const auto folded = Utf8::FoldCase(a_text);
			RiskLabelHit hit{};
			for (const auto tier : kSearchOrder) {
				const auto label = RiskTierLabel(tier);
				const auto pos = folded.find(Utf8::FoldCase(label));
				if (pos < hit.pos) {
					hit.pos = pos;
					hit.len = label.size();
					hit.tier.reset();
					if (a_text.substr(pos, label.size()) == label) {
						hit.tier = tier;
					}
				}
			}
			return hit;
		}

		[[nodiscard]] std::optional<MasteryTier> ParseMasteryLabelOrWarn(std::string_view a_masteryLabel)
		{
			const auto tier = ParseMasteryTierLabel(a_masteryLabel);
			if (!tier) {
				spdlog::warn("StoryChoices: unknown mastery label \"{}\", no adjustment applied.", a_masteryLabel);
			}
			return tier;
		}
	}

	std::optional<std::string> ExtractSkillNameFromChoice(std::string_view a_content)
	{
		const auto folded = Utf8::FoldCase(a_content);

		if (auto name = MatchUseVerbPhrase(a_content, folded); IsConfidentName(name)) {
			return name;
		}
		if (auto name = MatchPurposeClause(a_content, folded); IsConfidentName(name)) {
			return name;
		}
		if (auto name = MatchWithPhrase(a_content, folded); IsConfidentName(name)) {
			return name;
		}
		if (auto name = MatchCapitalisedSkillPhrase(a_content); IsConfidentName(name)) {
			return name;
		}
		return std::nullopt;
	}

	SkillMasteryOutcome ApplySkillMastery(
		std::int32_t a_successRate,
		RiskTier a_riskTier,
		std::optional<MasteryTier> a_mastery) noexcept
	{
		if (!a_mastery || *a_mastery == MasteryTier::kNovice) {
			return { .successRate = a_successRate, .riskTier = a_riskTier, .boosted = false };
		}

		return {
			.successRate = AdjustSuccessRate(a_successRate, *a_mastery),
			.riskTier = AdjustRiskTier(a_riskTier, *a_mastery),
			.boosted = true
		};
	}

	std::int32_t AdjustSuccessRate(std::int32_t a_baseRate, std::string_view a_masteryLabel)
	{
		const auto tier = ParseMasteryLabelOrWarn(a_masteryLabel);
		return tier ? AdjustSuccessRate(a_baseRate, *tier) : a_baseRate;
	}

	RiskTier AdjustRiskTier(RiskTier a_baseRisk, std::string_view a_masteryLabel)
	{
		const auto tier = ParseMasteryLabelOrWarn(a_masteryLabel);
		return tier ? AdjustRiskTier(a_baseRisk, *tier) : a_baseRisk;
	}

	MasteryAdjustmentResult ApplyMasteryAdjustments(
		std::int32_t a_baseRate,
		RiskTier a_baseRisk,
		std::string_view a_masteryLabel)
	{
		const auto tier = ParseMasteryLabelOrWarn(a_masteryLabel);
		if (!tier) {
			return { .successRate = a_baseRate, .riskTier = a_baseRisk, .adjustmentApplied = false };
		}
		return ApplyMasteryAdjustments(a_baseRate, a_baseRisk, *tier);
	}

	std::optional<std::int32_t> ParseSuccessRateFromChoice(std::string_view a_choiceText)
	{
		const auto folded = Utf8::FoldCase(a_choiceText);

		if (const auto rate = MatchRateWithOutcomeWord(a_choiceText, folded); rate) {
			return rate;
		}
		if (const auto rate = MatchParenthesisedRate(a_choiceText); rate) {
			return rate;
		}
		if (const auto rate = MatchLowerBoundRate(a_choiceText); rate) {
			return rate;
		}
		if (const auto run = NextDigitRunBeforePercent(a_choiceText, 0); run) {
			return ReadPercentValue(a_choiceText, *run);
		}
		return std::nullopt;
	}

	std::optional<RiskTier> ParseRiskTierFromChoice(std::string_view a_choiceText)
	{
		return FindFirstRiskLabel(a_choiceText).tier;
	}

	std::string GenerateAdjustedChoiceText(std::string_view a_choiceText, MasteryTier a_mastery)
	{
		const auto baseRate = ParseSuccessRateFromChoice(a_choiceText);
		const auto baseRisk = ParseRiskTierFromChoice(a_choiceText);
		if (!baseRate || !baseRisk) {
			spdlog::debug("StoryChoices: choice text has no success rate or risk label to adjust.");
			return std::string(a_choiceText);
		}

		const auto adjusted = ApplyMasteryAdjustments(*baseRate, *baseRisk, a_mastery);
		if (!adjusted.adjustmentApplied) {
			return std::string(a_choiceText);
		}

		std::string out(a_choiceText);
		if (const auto run = NextDigitRunBeforePercent(out, 0); run) {
			out.replace(run->begin, run->end - run->begin, std::to_string(adjusted.successRate));
		}

		const auto riskHit = FindFirstRiskLabel(out);
		if (riskHit.pos != std::string_view::npos) {
			out.replace(riskHit.pos, riskHit.len, RiskTierLabel(adjusted.riskTier));
		}
		return out;
	}
}
