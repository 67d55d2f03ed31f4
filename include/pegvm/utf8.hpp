// pegvm - Runtime interpreter for PE grammars in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

// Based on the Flexible and Economical UTF-8 Decoder by Bjoern Hoehrmann
// Copyright (c) 2008-2010 Bjoern Hoehrmann <bjoern@hoehrmann.de>
// See LICENSE.md file or http://bjoern.hoehrmann.de/utf-8/decoder/dfa/
// for more details.

#ifndef PEGVM_INCLUDE_PEGVM_UTF8_HPP
#define PEGVM_INCLUDE_PEGVM_UTF8_HPP

#include <pegvm/detail.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

namespace pegvm::utf8 {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

namespace detail {

enum class decode_state : unsigned char { accept = 0, reject = 12 };

inline constexpr std::array<unsigned char, 256> dfa_class_table
{
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
	 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1,
	 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9,
	 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7,
	 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7,
	 8, 8, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2,
	 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2,
	10, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 4, 3, 3,
	11, 6, 6, 6, 5, 8, 8, 8, 8, 8, 8, 8, 8, 8, 8, 8
};

inline constexpr std::array<unsigned char, 108> dfa_transition_table
{
	0,12,24,36,60,96,84,12,12,12,48,72,12,12,12,12,
	12,12,12,12,12,12,12,12,12, 0,12,12,12,12,12, 0,
	12, 0,12,12,12,24,12,12,12,12,12,24,12,24,12,12,
	12,12,12,12,12,12,12,24,12,12,12,12,12,24,12,12,
	12,12,12,12,12,24,12,12,12,12,12,12,12,12,12,36,
	12,36,12,12,12,36,12,12,12,12,12,36,12,36,12,12,
	12,36,12,12,12,12,12,12,12,12,12,12
};

inline constexpr char32_t utf32_replacement = U'\U0000fffd';

[[nodiscard]] constexpr decode_state decode_rune_octet(char32_t& rune, char octet, decode_state state) noexcept
{
	auto const symbol = static_cast<std::uint_least32_t>(static_cast<unsigned char>(octet));
	auto const dfa_class = static_cast<std::uint_least32_t>(dfa_class_table[symbol]); // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
	rune = (state == decode_state::accept) ? (symbol & (0xffU >> dfa_class)) : ((symbol & 0x3fU) | (rune << 6U));
	return static_cast<decode_state>(dfa_transition_table[static_cast<std::size_t>(state) + dfa_class]); // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
}

[[nodiscard]] constexpr std::uint_least32_t non_ascii_rune_length(char32_t rune) noexcept
{
	if (rune < 0x00000800U)
		return 2;
	if (rune < 0x00010000U)
		return 3;
	return 4;
}

} // namespace detail

[[nodiscard]] constexpr bool is_scalar(std::uint_least32_t value) noexcept
{
	return (value < 0x00110000U) && ((value & 0xfffff800U) != 0x0000d800U);
}

struct is_lead_or_ascii_fn
{
	[[nodiscard]] constexpr bool operator()(char octet) const noexcept
	{
		return (static_cast<unsigned char>(octet) & 0xc0U) != 0x80U;
	}
};

inline constexpr is_lead_or_ascii_fn is_lead_or_ascii{};

// Invalid sequences decode as U+FFFD and resynchronize on the next lead octet.
template <class InputIt, class = pegvm::detail::enable_if_char_input_iterator_t<InputIt>>
[[nodiscard]] constexpr std::pair<InputIt, char32_t> decode_rune(InputIt first, InputIt last)
{
	char32_t rune = U'\0';
	detail::decode_state state = detail::decode_state::accept;
	while (first != last) {
		if (state = utf8::detail::decode_rune_octet(rune, *first++, state); state == detail::decode_state::accept)
			return std::make_pair(first, rune);
		if (state == detail::decode_state::reject)
			break;
	}
	return std::make_pair(std::find_if(first, last, pegvm::utf8::is_lead_or_ascii), detail::utf32_replacement);
}

template <class InputIt, class = pegvm::detail::enable_if_char_input_iterator_t<InputIt>>
[[nodiscard]] constexpr InputIt next_rune(InputIt first, InputIt last)
{
	return pegvm::utf8::decode_rune(first, last).first;
}

template <class InputIt, class = pegvm::detail::enable_if_char_input_iterator_t<InputIt>>
[[nodiscard]] constexpr std::size_t count_runes(InputIt first, InputIt last)
{
	std::size_t count = 0;
	for (; first != last; ++count)
		first = pegvm::utf8::next_rune(first, last);
	return count;
}

template <class OutputIt>
inline std::pair<OutputIt, bool> encode_rune(OutputIt dst, char32_t rune)
{
	if (rune < 0x80) {
		*dst++ = static_cast<char>(rune);
	} else {
		if (!is_scalar(rune)) {
			*dst++ = static_cast<char>(0xefU);
			*dst++ = static_cast<char>(0xbfU);
			*dst++ = static_cast<char>(0xbdU);
			return {dst, false};
		}
		std::uint_least32_t const n = detail::non_ascii_rune_length(rune);
		for (std::uint_least32_t i = 0, c = ((0xf0U << (4 - n)) & 0xf0U); i < n; ++i, c = 0x80U)
			*dst++ = static_cast<char>(((rune >> (6 * (n - i - 1))) & 0x3fU) | c);
	}
	return {dst, true};
}

// Simple one-to-one folding of capital letters in the ASCII, Latin-1,
// Greek and Cyrillic blocks. Multi-rune foldings are not handled.
[[nodiscard]] constexpr char32_t casefold(char32_t rune) noexcept
{
	if (rune < 0x80U)
		return ((rune >= U'A') && (rune <= U'Z')) ? (rune + 0x20U) : rune;
	if ((rune >= 0xc0U) && (rune <= 0xdeU) && (rune != 0xd7U))
		return rune + 0x20U;
	if ((rune >= 0x391U) && (rune <= 0x3abU) && (rune != 0x3a2U))
		return rune + 0x20U;
	if ((rune >= 0x400U) && (rune <= 0x40fU))
		return rune + 0x50U;
	if ((rune >= 0x410U) && (rune <= 0x42fU))
		return rune + 0x20U;
	return rune;
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

[[nodiscard]] inline std::string encode_rune(char32_t rune)
{
	std::string result;
	encode_rune(std::back_inserter(result), rune);
	return result;
}

// Returns the number of subject octets matched by str under case folding,
// or npos when the subject does not start with str.
[[nodiscard]] inline std::size_t casefold_prefix(std::string_view subject, std::string_view str)
{
	auto scurr = subject.cbegin();
	auto const slast = subject.cend();
	auto tcurr = str.cbegin();
	auto const tlast = str.cend();
	while (tcurr != tlast) {
		if (scurr == slast)
			return std::string_view::npos;
		auto const [snext, srune] = utf8::decode_rune(scurr, slast);
		auto const [tnext, trune] = utf8::decode_rune(tcurr, tlast);
		if (utf8::casefold(srune) != utf8::casefold(trune))
			return std::string_view::npos;
		scurr = snext;
		tcurr = tnext;
	}
	return static_cast<std::size_t>(scurr - subject.cbegin());
}

// Returns the length of the line ending at the start of subject: CR, LF or CRLF.
[[nodiscard]] constexpr std::size_t match_eol(std::string_view subject) noexcept
{
	if (subject.empty())
		return 0;
	if (subject.front() == '\n')
		return 1;
	if (subject.front() == '\r')
		return ((subject.size() > 1) && (subject[1] == '\n')) ? 2 : 1;
	return 0;
}

} // namespace pegvm::utf8

#endif
