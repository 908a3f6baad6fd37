#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace StoryChoices
{
	// Failure raised by an action dispatcher. a_status carries an HTTP-like code when the
	// upstream generator reported one.
	class DispatchError : public std::runtime_error
	{
	public:
		explicit DispatchError(const std::string& a_message, std::optional<int> a_status = std::nullopt) :
			std::runtime_error(a_message),
			_status(a_status)
		{}

		[[nodiscard]] std::optional<int> Status() const noexcept { return _status; }

	private:
		std::optional<int> _status;
	};
}
