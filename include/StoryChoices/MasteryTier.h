#pragma once

#include "StoryChoices/RiskTier.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace StoryChoices
{
	enum class MasteryTier : std::uint8_t
	{
		kNovice = 0,
		kIntermediate,
		kAdvanced,
		kGreatAccomplishment,
		kPerfection,
	};

	inline constexpr std::size_t kMasteryTierCount = 5;

	struct MasteryAdjustment
	{
		std::int32_t successRateBonus{ 0 };
		std::uint32_t riskReduction{ 0 };

		[[nodiscard]] constexpr bool operator==(const MasteryAdjustment& a_rhs) const noexcept = default;
	};

	// Single source of truth for mastery bonuses, indexed by MasteryTier.
	inline constexpr std::array<MasteryAdjustment, kMasteryTierCount> kMasteryAdjustments{ {
		{ .successRateBonus = 0, .riskReduction = 0 },
		{ .successRateBonus = 5, .riskReduction = 0 },
		{ .successRateBonus = 10, .riskReduction = 1 },
		{ .successRateBonus = 15, .riskReduction = 1 },
		{ .successRateBonus = 20, .riskReduction = 2 },
	} };

	inline constexpr std::array<std::string_view, kMasteryTierCount> kMasteryTierLabels{
		"Sơ Cấp",
		"Trung Cấp",
		"Cao Cấp",
		"Đại Thành",
		"Viên Mãn"
	};

	[[nodiscard]] constexpr std::string_view MasteryTierLabel(MasteryTier a_tier) noexcept
	{
		const auto index = static_cast<std::size_t>(a_tier);
		return index < kMasteryTierLabels.size() ? kMasteryTierLabels[index] : std::string_view{};
	}

	[[nodiscard]] constexpr std::optional<MasteryTier> ParseMasteryTierLabel(std::string_view a_label) noexcept
	{
		for (std::size_t i = 0; i < kMasteryTierLabels.size(); ++i) {
			if (kMasteryTierLabels[i] == a_label) {
				return static_cast<MasteryTier>(i);
			}
		}
		return std::nullopt;
	}

	[[nodiscard]] constexpr MasteryAdjustment GetMasteryAdjustment(MasteryTier a_tier) noexcept
	{
		const auto index = static_cast<std::size_t>(a_tier);
		return index < kMasteryAdjustments.size() ? kMasteryAdjustments[index] : MasteryAdjustment{};
	}

	[[nodiscard]] constexpr std::int32_t AdjustSuccessRate(std::int32_t a_baseRate, MasteryTier a_tier) noexcept
	{
		return AddSuccessRateBonus(a_baseRate, GetMasteryAdjustment(a_tier).successRateBonus);
	}

	[[nodiscard]] constexpr RiskTier AdjustRiskTier(RiskTier a_baseRisk, MasteryTier a_tier) noexcept
	{
		return ReduceRiskTier(a_baseRisk, GetMasteryAdjustment(a_tier).riskReduction);
	}

	struct MasteryAdjustmentResult
	{
		std::int32_t successRate{ 0 };
		RiskTier riskTier{ RiskTier::kMedium };
		bool adjustmentApplied{ false };
	};

	[[nodiscard]] constexpr MasteryAdjustmentResult ApplyMasteryAdjustments(
		std::int32_t a_baseRate,
		RiskTier a_baseRisk,
		MasteryTier a_tier) noexcept
	{
		const auto rate = AdjustSuccessRate(a_baseRate, a_tier);
		const auto risk = AdjustRiskTier(a_baseRisk, a_tier);
		return MasteryAdjustmentResult{
			.successRate = rate,
			.riskTier = risk,
			.adjustmentApplied = rate != a_baseRate || risk != a_baseRisk
		};
	}
}
