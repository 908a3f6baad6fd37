#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace StoryChoices::Utf8
{
	// Case folding covers ASCII and the Latin ranges used by Vietnamese.
	// Every pair folded here encodes to the same number of bytes, so byte offsets
	// found in a folded copy are valid in the original text.
	[[nodiscard]] constexpr char32_t FoldCodePoint(char32_t a_cp) noexcept
	{
		if (a_cp >= U'A' && a_cp <= U'Z') {
			return a_cp + 0x20;
		}
		if (a_cp >= 0x00C0 && a_cp <= 0x00DE && a_cp != 0x00D7) {
			return a_cp + 0x20;
		}
		if (((a_cp >= 0x0100 && a_cp <= 0x0137) || (a_cp >= 0x014A && a_cp <= 0x0177)) && (a_cp % 2) == 0) {
			return a_cp + 1;
		}
		if (a_cp == 0x01A0 || a_cp == 0x01AF) {
			return a_cp + 1;
		}
		if (a_cp >= 0x1EA0 && a_cp <= 0x1EF9 && (a_cp % 2) == 0) {
			return a_cp + 1;
		}
		return a_cp;
	}

	// Capital letters accepted as the first letter of a proper noun (skill names, titles).
	[[nodiscard]] constexpr bool IsVietnameseCapital(char32_t a_cp) noexcept
	{
		if (a_cp >= U'A' && a_cp <= U'Z') {
			return true;
		}
		switch (a_cp) {
		case 0x00C0:  // À
		case 0x00C1:  // Á
		case 0x00C2:  // Â
		case 0x00C3:  // Ã
		case 0x00C8:  // È
		case 0x00C9:  // É
		case 0x00CA:  // Ê
		case 0x00CC:  // Ì
		case 0x00CD:  // Í
		case 0x00D2:  // Ò
		case 0x00D3:  // Ó
		case 0x00D4:  // Ô
		case 0x00D5:  // Õ
		case 0x00D9:  // Ù
		case 0x00DA:  // Ú
		case 0x00DD:  // Ý
		case 0x0102:  // Ă
		case 0x0110:  // Đ
		case 0x0128:  // Ĩ
		case 0x0168:  // Ũ
		case 0x01A0:  // Ơ
		case 0x01AF:  // Ư
			return true;
		default:
			break;
		}
		// Ạ..Ỹ: capitals sit on even code points.
		return a_cp >= 0x1EA0 && a_cp <= 0x1EF8 && (a_cp % 2) == 0;
	}

	[[nodiscard]] constexpr bool IsAsciiSpace(char a_c) noexcept
	{
		return a_c == ' ' || a_c == '\t' || a_c == '\n' || a_c == '\r' || a_c == '\v' || a_c == '\f';
	}

	[[nodiscard]] constexpr bool IsAsciiDigit(char a_c) noexcept
	{
		return a_c >= '0' && a_c <= '9';
	}

	[[nodiscard]] constexpr std::string_view Trim(std::string_view a_text) noexcept
	{
		while (!a_text.empty() && IsAsciiSpace(a_text.front())) {
			a_text.remove_prefix(1);
		}
		while (!a_text.empty() && IsAsciiSpace(a_text.back())) {
			a_text.remove_suffix(1);
		}
		return a_text;
	}

	// Decodes the code point at a_pos and advances a_pos past it.
	// Malformed sequences decode as U+FFFD and consume a single byte.
	[[nodiscard]] char32_t Decode(std::string_view a_text, std::size_t& a_pos) noexcept;

	void Append(std::string& a_out, char32_t a_cp);

	[[nodiscard]] std::string FoldCase(std::string_view a_text);
	[[nodiscard]] std::size_t CountCodePoints(std::string_view a_text) noexcept;

	// Keeps at most a_maxCodePoints code points, never splitting a sequence.
	[[nodiscard]] std::string_view TruncateCodePoints(std::string_view a_text, std::size_t a_maxCodePoints) noexcept;

	// Every run of ASCII whitespace (line breaks included) becomes one space; result is trimmed.
	[[nodiscard]] std::string CollapseWhitespace(std::string_view a_text);

	// Case-insensitive containment. a_foldedHaystack must already be folded.
	[[nodiscard]] bool ContainsFolded(std::string_view a_foldedHaystack, std::string_view a_needle);
}
