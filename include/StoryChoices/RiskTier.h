#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace StoryChoices
{
	enum class RiskTier : std::uint8_t
	{
		kLow = 0,
		kMedium,
		kHigh,
		kCritical,
	};

	inline constexpr std::size_t kRiskTierCount = 4;

	inline constexpr std::array<std::string_view, kRiskTierCount> kRiskTierLabels{
		"Thấp",
		"Trung Bình",
		"Cao",
		"Cực Cao"
	};

	inline constexpr std::int32_t kMinSuccessRate = 0;
	inline constexpr std::int32_t kMaxSuccessRate = 100;

	[[nodiscard]] constexpr std::string_view RiskTierLabel(RiskTier a_tier) noexcept
	{
		const auto index = static_cast<std::size_t>(a_tier);
		return index < kRiskTierLabels.size() ? kRiskTierLabels[index] : std::string_view{};
	}

	// Exact label match ("Cao", "Cực Cao", ...).
	[[nodiscard]] constexpr std::optional<RiskTier> ParseRiskTierLabel(std::string_view a_label) noexcept
	{
		for (std::size_t i = 0; i < kRiskTierLabels.size(); ++i) {
			if (kRiskTierLabels[i] == a_label) {
				return static_cast<RiskTier>(i);
			}
		}
		return std::nullopt;
	}

	// Moves the tier down by a_reduction steps. Never goes below kLow.
	[[nodiscard]] constexpr RiskTier ReduceRiskTier(RiskTier a_tier, std::uint32_t a_reduction) noexcept
	{
		const auto index = static_cast<std::uint32_t>(a_tier);
		return a_reduction >= index ? RiskTier::kLow : static_cast<RiskTier>(index - a_reduction);
	}

	[[nodiscard]] constexpr std::int32_t ClampSuccessRate(std::int64_t a_rate) noexcept
	{
		return static_cast<std::int32_t>(std::clamp<std::int64_t>(a_rate, kMinSuccessRate, kMaxSuccessRate));
	}

	// Shared saturation rule for every success-rate bonus.
	[[nodiscard]] constexpr std::int32_t AddSuccessRateBonus(std::int32_t a_rate, std::int32_t a_bonus) noexcept
	{
		return ClampSuccessRate(static_cast<std::int64_t>(a_rate) + a_bonus);
	}
}
