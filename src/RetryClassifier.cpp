#include "StoryChoices/RetryClassifier.h"

#include "StoryChoices/DispatchError.h"
#include "StoryChoices/Utf8Text.h"

#include <string>

namespace StoryChoices
{
	namespace
	{
		template <std::size_t N>
		[[nodiscard]] bool ContainsAny(std::string_view a_folded, const std::string_view (&a_markers)[N]) noexcept
		{
			for (const auto marker : a_markers) {
				if (a_folded.find(marker) != std::string_view::npos) {
					return true;
				}
			}
			return false;
		}

		[[nodiscard]] constexpr bool IsStatusInRange(const std::optional<int>& a_status, int a_min, int a_max) noexcept
		{
			return a_status && *a_status >= a_min && *a_status <= a_max;
		}
	}

	RetryClassification ClassifyDispatchError(std::string_view a_message, std::optional<int> a_status)
	{
		const auto message = Utf8::FoldCase(a_message);

		if (ContainsAny(message, RetryTaxonomy::kNetworkMarkers)) {
			return { .retryable = true, .reason = RetryReason::kNetwork };
		}
		if (ContainsAny(message, RetryTaxonomy::kOverloadMarkers)) {
			return { .retryable = true, .reason = RetryReason::kOverload };
		}
		if (ContainsAny(message, RetryTaxonomy::kQuotaMarkers) ||
			IsStatusInRange(a_status, RetryTaxonomy::kStatusTooManyRequests, RetryTaxonomy::kStatusTooManyRequests)) {
			return { .retryable = true, .reason = RetryReason::kQuota };
		}
		if (IsStatusInRange(a_status, 500, 599)) {
			return { .retryable = true, .reason = RetryReason::kOverload };
		}
		if (ContainsAny(message, RetryTaxonomy::kValidationMarkers) || IsStatusInRange(a_status, 400, 499)) {
			return { .retryable = false, .reason = RetryReason::kValidation };
		}
		return { .retryable = false, .reason = RetryReason::kUnknown };
	}

	RetryClassification ClassifyDispatchError(const std::exception_ptr& a_error)
	{
		if (!a_error) {
			return {};
		}

		try {
			std::rethrow_exception(a_error);
		} catch (const DispatchError& e) {
			return ClassifyDispatchError(e.what(), e.Status());
		} catch (const std::exception& e) {
			return ClassifyDispatchError(e.what());
		} catch (...) {
			return {};
		}
	}
}
