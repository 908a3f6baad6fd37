#include "StoryChoices/Utf8Text.h"

namespace StoryChoices::Utf8
{
	namespace
	{
		constexpr char32_t kReplacement = 0xFFFD;

		[[nodiscard]] constexpr bool IsContinuation(unsigned char a_byte) noexcept
		{
			return (a_byte & 0xC0u) == 0x80u;
		}

		[[nodiscard]] constexpr std::size_t EncodedLength(char32_t a_cp) noexcept
		{
			if (a_cp < 0x80) {
				return 1;
			}
			if (a_cp < 0x800) {
				return 2;
			}
			if (a_cp < 0x10000) {
				return 3;
			}
			return 4;
		}
	}

	char32_t Decode(std::string_view a_text, std::size_t& a_pos) noexcept
	{
		const auto lead = static_cast<unsigned char>(a_text[a_pos]);
		if (lead < 0x80u) {
			++a_pos;
			return lead;
		}

		std::size_t extra = 0;
		char32_t cp = 0;
		if ((lead & 0xE0u) == 0xC0u) {
			extra = 1;
			cp = lead & 0x1Fu;
		} else if ((lead & 0xF0u) == 0xE0u) {
			extra = 2;
			cp = lead & 0x0Fu;
		} else if ((lead & 0xF8u) == 0xF0u) {
			extra = 3;
			cp = lead & 0x07u;
		} else {
			++a_pos;
			return kReplacement;
		}

		if (a_pos + extra >= a_text.size()) {
			++a_pos;
			return kReplacement;
		}
		for (std::size_t i = 1; i <= extra; ++i) {
			const auto byte = static_cast<unsigned char>(a_text[a_pos + i]);
			if (!IsContinuation(byte)) {
				++a_pos;
				return kReplacement;
			}
			cp = (cp << 6) | (byte & 0x3Fu);
		}

		a_pos += extra + 1;
		return cp;
	}

	void Append(std::string& a_out, char32_t a_cp)
	{
		if (a_cp < 0x80) {
			a_out.push_back(static_cast<char>(a_cp));
		} else if (a_cp < 0x800) {
			a_out.push_back(static_cast<char>(0xC0 | (a_cp >> 6)));
			a_out.push_back(static_cast<char>(0x80 | (a_cp & 0x3F)));
		} else if (a_cp < 0x10000) {
			a_out.push_back(static_cast<char>(0xE0 | (a_cp >> 12)));
			a_out.push_back(static_cast<char>(0x80 | ((a_cp >> 6) & 0x3F)));
			a_out.push_back(static_cast<char>(0x80 | (a_cp & 0x3F)));
		} else {
			a_out.push_back(static_cast<char>(0xF0 | (a_cp >> 18)));
			a_out.push_back(static_cast<char>(0x80 | ((a_cp >> 12) & 0x3F)));
			a_out.push_back(static_cast<char>(0x80 | ((a_cp >> 6) & 0x3F)));
			a_out.push_back(static_cast<char>(0x80 | (a_cp & 0x3F)));
		}
	}

	std::string FoldCase(std::string_view a_text)
	{
		std::string out;
		out.reserve(a_text.size());

		std::size_t pos = 0;
		while (pos < a_text.size()) {
			const std::size_t start = pos;
			const char32_t cp = Decode(a_text, pos);
			const char32_t folded = FoldCodePoint(cp);
			if (cp == kReplacement || folded == cp || EncodedLength(folded) != pos - start) {
				out.append(a_text.substr(start, pos - start));
				continue;
			}
			Append(out, folded);
		}
		return out;
	}

	std::size_t CountCodePoints(std::string_view a_text) noexcept
	{
		std::size_t count = 0;
		std::size_t pos = 0;
		while (pos < a_text.size()) {
			(void)Decode(a_text, pos);
			++count;
		}
		return count;
	}

	std::string_view TruncateCodePoints(std::string_view a_text, std::size_t a_maxCodePoints) noexcept
	{
		std::size_t pos = 0;
		std::size_t count = 0;
		while (pos < a_text.size() && count < a_maxCodePoints) {
			(void)Decode(a_text, pos);
			++count;
		}
		return a_text.substr(0, pos);
	}

	std::string CollapseWhitespace(std::string_view a_text)
	{
		const auto trimmed = Trim(a_text);

		std::string out;
		out.reserve(trimmed.size());
		bool pendingSpace = false;
		for (const char c : trimmed) {
			if (IsAsciiSpace(c)) {
				pendingSpace = true;
				continue;
			}
			if (pendingSpace) {
				out.push_back(' ');
				pendingSpace = false;
			}
			out.push_back(c);
		}
		return out;
	}

	bool ContainsFolded(std::string_view a_foldedHaystack, std::string_view a_needle)
	{
		if (a_needle.empty()) {
			return true;
		}
		return a_foldedHaystack.find(FoldCase(a_needle)) != std::string_view::npos;
	}
}
