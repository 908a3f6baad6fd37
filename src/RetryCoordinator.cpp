#include "StoryChoices/RetryCoordinator.h"

#include "StoryChoices/Utf8Text.h"

#include <array>
#include <cstdio>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace StoryChoices
{
	namespace
	{
		constexpr std::size_t kLogActionPreviewCodePoints = 50;

		class RetryFlagRelease
		{
		public:
			explicit RetryFlagRelease(std::atomic_bool& a_flag) noexcept :
				_flag(a_flag)
			{}

			RetryFlagRelease(const RetryFlagRelease&) = delete;
			RetryFlagRelease& operator=(const RetryFlagRelease&) = delete;

			~RetryFlagRelease() { _flag.store(false); }

		private:
			std::atomic_bool& _flag;
		};

		[[nodiscard]] std::chrono::milliseconds AgeOf(const LastAction& a_action)
		{
			return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now() - a_action.recordedAt);
		}

		// UTC, millisecond precision: 2024-05-01T12:30:00.250Z
		[[nodiscard]] std::string FormatIsoTimestamp(std::chrono::system_clock::time_point a_time)
		{
			using namespace std::chrono;

			const auto ms = time_point_cast<milliseconds>(a_time);
			const auto day = floor<days>(ms);
			const year_month_day ymd{ day };
			const hh_mm_ss hms{ ms - day };

			std::array<char, 32> buffer{};
			const int written = std::snprintf(
				buffer.data(),
				buffer.size(),
				"%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
				static_cast<int>(ymd.year()),
				static_cast<unsigned>(ymd.month()),
				static_cast<unsigned>(ymd.day()),
				static_cast<int>(hms.hours().count()),
				static_cast<int>(hms.minutes().count()),
				static_cast<int>(hms.seconds().count()),
				static_cast<int>(hms.subseconds().count()));
			if (written <= 0) {
				return {};
			}
			return std::string(buffer.data(), static_cast<std::size_t>(written));
		}
	}

	RetryCoordinator::RetryCoordinator(std::chrono::milliseconds a_preRetryDelay) :
		_preRetryDelay(a_preRetryDelay < std::chrono::milliseconds::zero() ? std::chrono::milliseconds::zero() : a_preRetryDelay)
	{}

	void RetryCoordinator::RecordLastAction(std::string a_text, nlohmann::json a_snapshot)
	{
		const auto preview = Utf8::TruncateCodePoints(a_text, kLogActionPreviewCodePoints);
		spdlog::info(
			"StoryChoices: recorded last action \"{}{}\".",
			preview,
			preview.size() < a_text.size() ? "..." : "");

		std::scoped_lock lk{ _lock };
		_lastAction = LastAction{
			.text = std::move(a_text),
			.snapshot = std::move(a_snapshot),
			.recordedAt = std::chrono::system_clock::now()
		};
	}

	void RetryCoordinator::ClearLastAction()
	{
		{
			std::scoped_lock lk{ _lock };
			_lastAction.reset();
		}
		spdlog::debug("StoryChoices: cleared last action.");
	}

	std::optional<LastAction> RetryCoordinator::GetLastAction() const
	{
		std::scoped_lock lk{ _lock };
		return _lastAction;
	}

	bool RetryCoordinator::ExecuteRetry(const DispatchFn& a_dispatch)
	{
		if (!a_dispatch) {
			spdlog::warn("StoryChoices: cannot retry without a dispatcher.");
			return false;
		}

		std::string action;
		{
			std::scoped_lock lk{ _lock };
			if (!_lastAction) {
				spdlog::warn("StoryChoices: cannot retry, no last action recorded.");
				return false;
			}
			action = _lastAction->text;
		}

		bool expected = false;
		if (!_retryInFlight.compare_exchange_strong(expected, true)) {
			spdlog::warn("StoryChoices: cannot retry, a retry is already in progress.");
			return false;
		}
		const RetryFlagRelease release{ _retryInFlight };

		if (_preRetryDelay > std::chrono::milliseconds::zero()) {
			std::this_thread::sleep_for(_preRetryDelay);
		}

		const auto correlationId = MakeCorrelationId();
		spdlog::info("StoryChoices: retrying last action ({}).", correlationId);

		bool succeeded = false;
		try {
			succeeded = a_dispatch(action, correlationId);
		} catch (const std::exception& e) {
			spdlog::error("StoryChoices: retry {} failed: {}", correlationId, e.what());
			return false;
		} catch (...) {
			spdlog::error("StoryChoices: retry {} failed with a non-standard exception.", correlationId);
			return false;
		}

		if (!succeeded) {
			spdlog::error("StoryChoices: retry {} was rejected by the dispatcher.", correlationId);
			return false;
		}

		spdlog::info("StoryChoices: retry {} succeeded.", correlationId);
		return true;
	}

	void RetryCoordinator::HandleErrorWithRetry(
		const std::exception_ptr& a_error,
		const DispatchFn& a_dispatch,
		std::optional<std::string> a_failedAction)
	{
		if (!a_error) {
			throw std::invalid_argument("HandleErrorWithRetry requires an exception");
		}

		if (a_failedAction) {
			RecordLastAction(std::move(*a_failedAction));
		}

		const auto classification = ClassifyDispatchError(a_error);
		if (!classification.retryable) {
			spdlog::info(
				"StoryChoices: dispatch error is not retryable ({}).",
				RetryReasonLabel(classification.reason));
			std::rethrow_exception(a_error);
		}

		spdlog::info("StoryChoices: dispatch error is retryable ({}).", RetryReasonLabel(classification.reason));
		if (ExecuteRetry(a_dispatch)) {
			ClearLastAction();
			return;
		}

		std::rethrow_exception(a_error);
	}

	RetryStatus RetryCoordinator::GetStatus() const
	{
		RetryStatus status{};
		status.retryInProgress = _retryInFlight.load();

		std::scoped_lock lk{ _lock };
		if (_lastAction) {
			status.hasLastAction = true;
			status.lastActionAge = AgeOf(*_lastAction);
		}
		return status;
	}

	nlohmann::json RetryCoordinator::GetDebugInfo() const
	{
		nlohmann::json info = nlohmann::json::object();
		info["retryInProgress"] = _retryInFlight.load();

		std::scoped_lock lk{ _lock };
		if (!_lastAction) {
			info["lastAction"] = nullptr;
			return info;
		}

		info["lastAction"] = {
			{ "text", std::string(Utf8::TruncateCodePoints(_lastAction->text, kDebugActionPreviewCodePoints)) },
			{ "timestamp", FormatIsoTimestamp(_lastAction->recordedAt) },
			{ "ageMs", AgeOf(*_lastAction).count() },
		};
		return info;
	}

	std::string RetryCoordinator::MakeCorrelationId()
	{
		thread_local std::mt19937_64 rng{ std::random_device{}() };

		const auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::system_clock::now().time_since_epoch())
		                         .count();

		std::array<char, 20> suffix{};
		const int written = std::snprintf(
			suffix.data(),
			suffix.size(),
			"%08llx",
			static_cast<unsigned long long>(rng() & 0xFFFFFFFFull));

		std::string id(kRetryCorrelationPrefix);
		id.append(std::to_string(epochMs));
		id.push_back('_');
		if (written > 0) {
			id.append(suffix.data(), static_cast<std::size_t>(written));
		}
		return id;
	}
}
