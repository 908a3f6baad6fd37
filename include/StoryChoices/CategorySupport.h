#pragma once

#include "StoryChoices/RiskTier.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace StoryChoices
{
	enum class ChoiceCategory : std::uint8_t
	{
		kAction = 0,
		kSocial,
		kExploration,
		kCombat,
		kTransition,
		kFastForward,
	};

	inline constexpr std::size_t kChoiceCategoryCount = 6;

	inline constexpr std::array<std::string_view, kChoiceCategoryCount> kChoiceCategoryLabels{
		"Hành động",
		"Xã hội",
		"Thăm dò",
		"Chiến đấu",
		"Chuyển cảnh",
		"Tua nhanh"
	};

	inline constexpr std::string_view kSupportIndicator = "🔗";

	[[nodiscard]] constexpr std::string_view ChoiceCategoryLabel(ChoiceCategory a_category) noexcept
	{
		const auto index = static_cast<std::size_t>(a_category);
		return index < kChoiceCategoryLabels.size() ? kChoiceCategoryLabels[index] : std::string_view{};
	}

	// Labels match exactly; "Chiến Đấu" is not "Chiến đấu".
	[[nodiscard]] constexpr std::optional<ChoiceCategory> ParseChoiceCategoryLabel(std::string_view a_label) noexcept
	{
		for (std::size_t i = 0; i < kChoiceCategoryLabels.size(); ++i) {
			if (kChoiceCategoryLabels[i] == a_label) {
				return static_cast<ChoiceCategory>(i);
			}
		}
		return std::nullopt;
	}

	[[nodiscard]] constexpr std::uint8_t CategoryBit(ChoiceCategory a_category) noexcept
	{
		return static_cast<std::uint8_t>(1u << static_cast<std::uint8_t>(a_category));
	}

	struct CategorySupportEntry
	{
		std::uint8_t supportedByMask{ 0 };
		std::int32_t successRateBonus{ 0 };
		std::uint32_t riskReduction{ 0 };
	};

	using CategorySupportTable = std::array<CategorySupportEntry, kChoiceCategoryCount>;

	inline constexpr std::int32_t kDefaultSupportSuccessRateBonus = 15;
	inline constexpr std::uint32_t kDefaultSupportRiskReduction = 1;

	// Indexed by the category being supported.
	inline constexpr CategorySupportTable kDefaultCategorySupport{ {
		// Hành động
		{ .supportedByMask = static_cast<std::uint8_t>(CategoryBit(ChoiceCategory::kExploration) | CategoryBit(ChoiceCategory::kSocial)),
			.successRateBonus = kDefaultSupportSuccessRateBonus,
			.riskReduction = kDefaultSupportRiskReduction },
		// Xã hội
		{ .supportedByMask = CategoryBit(ChoiceCategory::kExploration),
			.successRateBonus = kDefaultSupportSuccessRateBonus,
			.riskReduction = kDefaultSupportRiskReduction },
		// Thăm dò
		{ .supportedByMask = 0,
			.successRateBonus = kDefaultSupportSuccessRateBonus,
			.riskReduction = kDefaultSupportRiskReduction },
		// Chiến đấu
		{ .supportedByMask = static_cast<std::uint8_t>(
			  CategoryBit(ChoiceCategory::kExploration) | CategoryBit(ChoiceCategory::kSocial) | CategoryBit(ChoiceCategory::kAction)),
			.successRateBonus = kDefaultSupportSuccessRateBonus,
			.riskReduction = kDefaultSupportRiskReduction },
		// Chuyển cảnh
		{ .supportedByMask = static_cast<std::uint8_t>(CategoryBit(ChoiceCategory::kAction) | CategoryBit(ChoiceCategory::kExploration)),
			.successRateBonus = kDefaultSupportSuccessRateBonus,
			.riskReduction = kDefaultSupportRiskReduction },
		// Tua nhanh
		{ .supportedByMask = 0,
			.successRateBonus = kDefaultSupportSuccessRateBonus,
			.riskReduction = kDefaultSupportRiskReduction },
	} };

	[[nodiscard]] constexpr bool IsSupportedBy(
		const CategorySupportTable& a_table,
		ChoiceCategory a_current,
		ChoiceCategory a_previous) noexcept
	{
		const auto index = static_cast<std::size_t>(a_current);
		return index < a_table.size() && (a_table[index].supportedByMask & CategoryBit(a_previous)) != 0;
	}

	struct SupportExplanation
	{
		ChoiceCategory previous;
		ChoiceCategory current;
		std::string_view text;
	};

	inline constexpr std::array<SupportExplanation, 8> kDefaultSupportExplanations{ {
		{ ChoiceCategory::kExploration, ChoiceCategory::kCombat, "Thông tin khám phá giúp chiến đấu hiệu quả hơn" },
		{ ChoiceCategory::kSocial, ChoiceCategory::kCombat, "Giao tiếp có thể làm phân tâm đối thủ" },
		{ ChoiceCategory::kAction, ChoiceCategory::kCombat, "Chuẩn bị hành động tạo lợi thế chiến thuật" },
		{ ChoiceCategory::kExploration, ChoiceCategory::kAction, "Hiểu biết tình huống giúp hành động chính xác" },
		{ ChoiceCategory::kSocial, ChoiceCategory::kAction, "Thuyết phục có thể tạo cơ hội hành động" },
		{ ChoiceCategory::kAction, ChoiceCategory::kTransition, "Hành động tạo điều kiện di chuyển" },
		{ ChoiceCategory::kExploration, ChoiceCategory::kTransition, "Khám phá giúp tìm đường đi tốt hơn" },
		{ ChoiceCategory::kExploration, ChoiceCategory::kSocial, "Hiểu biết giúp giao tiếp thuyết phục hơn" },
	} };

	// Immutable compatibility rules. Built-in table unless settings replace it.
	class CategorySupportRules
	{
	public:
		using ExplanationKey = std::pair<ChoiceCategory, ChoiceCategory>;  // previous, current
		using ExplanationMap = std::map<ExplanationKey, std::string>;

		CategorySupportRules();
		CategorySupportRules(const CategorySupportTable& a_table, ExplanationMap a_explanations);

		[[nodiscard]] static const CategorySupportRules& Defaults();

		[[nodiscard]] const CategorySupportEntry& Entry(ChoiceCategory a_current) const noexcept;
		[[nodiscard]] bool IsSupportedBy(ChoiceCategory a_current, ChoiceCategory a_previous) const noexcept;

		// Falls back to "<previous> hỗ trợ <current>" when no explanation is configured.
		[[nodiscard]] std::string Explain(ChoiceCategory a_previous, ChoiceCategory a_current) const;

		[[nodiscard]] const CategorySupportTable& Table() const noexcept { return _table; }
		[[nodiscard]] const ExplanationMap& Explanations() const noexcept { return _explanations; }

	private:
		CategorySupportTable _table;
		ExplanationMap _explanations;
	};

	// Category named by the leading ✦Category✦ tag of a raw choice, if it is a known one.
	[[nodiscard]] std::optional<ChoiceCategory> ParseCategoryFromChoice(std::string_view a_rawChoice);

	struct CategorySupportOutcome
	{
		std::int32_t successRate{ 0 };
		RiskTier riskTier{ RiskTier::kMedium };
		bool applied{ false };
		std::string indicator{};
		std::string tooltip{};
	};

	// a_category is the extracted category text. Unknown labels, a missing previous category or
	// an unsupported pair leave the inputs unchanged.
	[[nodiscard]] CategorySupportOutcome ApplyCategorySupport(
		std::int32_t a_successRate,
		RiskTier a_riskTier,
		std::optional<std::string_view> a_category,
		std::optional<ChoiceCategory> a_lastSelected,
		const CategorySupportRules& a_rules = CategorySupportRules::Defaults());
}
