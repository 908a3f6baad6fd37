#pragma once

#include "StoryChoices/RetryClassifier.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace StoryChoices
{
	// Sends an action to the story generator. Returns false (or throws) on failure.
	using DispatchFn = std::function<bool(std::string_view a_action, std::string_view a_correlationId)>;

	inline constexpr std::chrono::milliseconds kDefaultPreRetryDelay{ 1000 };
	inline constexpr std::size_t kDebugActionPreviewCodePoints = 100;
	inline constexpr std::string_view kRetryCorrelationPrefix = "retry_";

	struct LastAction
	{
		std::string text{};
		nlohmann::json snapshot{};
		std::chrono::system_clock::time_point recordedAt{};
	};

	struct RetryStatus
	{
		bool hasLastAction{ false };
		bool retryInProgress{ false };
		std::optional<std::chrono::milliseconds> lastActionAge{};
	};

	// Remembers the last submitted action and replays it at most once at a time.
	class RetryCoordinator
	{
	public:
		RetryCoordinator() = default;
		explicit RetryCoordinator(std::chrono::milliseconds a_preRetryDelay);

		RetryCoordinator(const RetryCoordinator&) = delete;
		RetryCoordinator& operator=(const RetryCoordinator&) = delete;

		void RecordLastAction(std::string a_text, nlohmann::json a_snapshot = nullptr);
		void ClearLastAction();
		[[nodiscard]] std::optional<LastAction> GetLastAction() const;

		// Single-flight: returns false without dispatching when nothing is recorded or another
		// retry is running. A throwing dispatch counts as failure.
		[[nodiscard]] bool ExecuteRetry(const DispatchFn& a_dispatch);

		// Retries once when a_error is retryable. Returns normally only after a successful
		// retry; every other path rethrows a_error.
		void HandleErrorWithRetry(
			const std::exception_ptr& a_error,
			const DispatchFn& a_dispatch,
			std::optional<std::string> a_failedAction = std::nullopt);

		[[nodiscard]] bool IsRetryInProgress() const noexcept { return _retryInFlight.load(); }
		[[nodiscard]] RetryStatus GetStatus() const;
		[[nodiscard]] nlohmann::json GetDebugInfo() const;

		[[nodiscard]] std::chrono::milliseconds PreRetryDelay() const noexcept { return _preRetryDelay; }

		// "retry_<epoch ms>_<random hex>"
		[[nodiscard]] static std::string MakeCorrelationId();

	private:
		std::chrono::milliseconds _preRetryDelay{ kDefaultPreRetryDelay };
		mutable std::mutex _lock;
		std::optional<LastAction> _lastAction{};
		std::atomic_bool _retryInFlight{ false };
	};
}
