#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string_view>

namespace StoryChoices
{
	enum class RetryReason : std::uint8_t
	{
		kNetwork = 0,
		kOverload,
		kQuota,
		kValidation,
		kUnknown,
	};

	struct RetryClassification
	{
		bool retryable{ false };
		RetryReason reason{ RetryReason::kUnknown };

		[[nodiscard]] constexpr bool operator==(const RetryClassification& a_rhs) const noexcept = default;
	};

	// Matched against the lower-cased message.
	namespace RetryTaxonomy
	{
		inline constexpr std::string_view kNetworkMarkers[] = { "network", "fetch", "timeout", "timed out" };
		inline constexpr std::string_view kOverloadMarkers[] = { "overload", "unavailable", "503", "ai không thể xử lý yêu cầu" };
		inline constexpr std::string_view kQuotaMarkers[] = {
			"quota", "exceeded", "rate limit", "too many requests", "resource_exhausted", "429"
		};
		inline constexpr std::string_view kValidationMarkers[] = { "invalid", "validation", "bad request", "400" };

		inline constexpr int kStatusTooManyRequests = 429;
	}

	[[nodiscard]] constexpr std::string_view RetryReasonLabel(RetryReason a_reason) noexcept
	{
		switch (a_reason) {
		case RetryReason::kNetwork:
			return "network";
		case RetryReason::kOverload:
			return "overload";
		case RetryReason::kQuota:
			return "quota";
		case RetryReason::kValidation:
			return "validation";
		case RetryReason::kUnknown:
			break;
		}
		return "unknown";
	}

	// Network, overload and quota failures are retryable. Validation failures and anything
	// unrecognised are not.
	[[nodiscard]] RetryClassification ClassifyDispatchError(std::string_view a_message, std::optional<int> a_status = std::nullopt);

	// Reads message and status from a DispatchError, the message from any std::exception,
	// and classifies other payloads as unknown.
	[[nodiscard]] RetryClassification ClassifyDispatchError(const std::exception_ptr& a_error);
}
