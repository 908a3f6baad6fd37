#include "StoryChoices/CategorySupport.h"

#include "StoryChoices/ChoiceFieldExtractor.h"
#include "StoryChoices/Utf8Text.h"

#include <spdlog/spdlog.h>

namespace StoryChoices
{
	namespace
	{
		[[nodiscard]] CategorySupportRules::ExplanationMap BuildDefaultExplanations()
		{
			CategorySupportRules::ExplanationMap out;
			for (const auto& explanation : kDefaultSupportExplanations) {
				out.emplace(
					CategorySupportRules::ExplanationKey{ explanation.previous, explanation.current },
					std::string(explanation.text));
			}
			return out;
		}
	}

	CategorySupportRules::CategorySupportRules() :
		_table(kDefaultCategorySupport),
		_explanations(BuildDefaultExplanations())
	{}

	CategorySupportRules::CategorySupportRules(const CategorySupportTable& a_table, ExplanationMap a_explanations) :
		_table(a_table),
		_explanations(std::move(a_explanations))
	{}

	const CategorySupportRules& CategorySupportRules::Defaults()
	{
		static const CategorySupportRules defaults{};
		return defaults;
	}

	const CategorySupportEntry& CategorySupportRules::Entry(ChoiceCategory a_current) const noexcept
	{
		return _table[static_cast<std::size_t>(a_current)];
	}

	bool CategorySupportRules::IsSupportedBy(ChoiceCategory a_current, ChoiceCategory a_previous) const noexcept
	{
		return StoryChoices::IsSupportedBy(_table, a_current, a_previous);
	}

	std::string CategorySupportRules::Explain(ChoiceCategory a_previous, ChoiceCategory a_current) const
	{
		if (const auto it = _explanations.find(ExplanationKey{ a_previous, a_current }); it != _explanations.end()) {
			return it->second;
		}

		std::string fallback(ChoiceCategoryLabel(a_previous));
		fallback.append(" hỗ trợ ");
		fallback.append(ChoiceCategoryLabel(a_current));
		return fallback;
	}

	std::optional<ChoiceCategory> ParseCategoryFromChoice(std::string_view a_rawChoice)
	{
		const auto delimiter = ChoiceGrammar::kCategoryDelimiter;
		if (!a_rawChoice.starts_with(delimiter)) {
			return std::nullopt;
		}

		const auto nameBegin = delimiter.size();
		const auto close = a_rawChoice.find(delimiter, nameBegin);
		if (close == std::string_view::npos || close == nameBegin) {
			return std::nullopt;
		}

		return ParseChoiceCategoryLabel(Utf8::Trim(a_rawChoice.substr(nameBegin, close - nameBegin)));
	}

	CategorySupportOutcome ApplyCategorySupport(
		std::int32_t a_successRate,
		RiskTier a_riskTier,
		std::optional<std::string_view> a_category,
		std::optional<ChoiceCategory> a_lastSelected,
		const CategorySupportRules& a_rules)
	{
		CategorySupportOutcome out{
			.successRate = a_successRate,
			.riskTier = a_riskTier
		};
		if (!a_category || !a_lastSelected) {
			return out;
		}

		const auto current = ParseChoiceCategoryLabel(*a_category);
		if (!current || !a_rules.IsSupportedBy(*current, *a_lastSelected)) {
			return out;
		}

		const auto& entry = a_rules.Entry(*current);
		if (entry.successRateBonus <= 0) {
			return out;
		}

		out.successRate = AddSuccessRateBonus(a_successRate, entry.successRateBonus);
		out.riskTier = ReduceRiskTier(a_riskTier, entry.riskReduction);
		out.applied = true;
		out.indicator = std::string(kSupportIndicator);
		out.tooltip = "Được hỗ trợ bởi ";
		out.tooltip.append(ChoiceCategoryLabel(*a_lastSelected));
		out.tooltip.append(": ");
		out.tooltip.append(a_rules.Explain(*a_lastSelected, *current));

		spdlog::debug(
			"StoryChoices: category support {} -> {} (+{}%, -{} risk tier).",
			ChoiceCategoryLabel(*a_lastSelected),
			ChoiceCategoryLabel(*current),
			entry.successRateBonus,
			entry.riskReduction);
		return out;
	}
}
