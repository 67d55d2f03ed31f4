// pegvm - Runtime interpreter for PE grammars in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_ESCAPE_HPP
#define PEGVM_INCLUDE_PEGVM_ESCAPE_HPP

#include <pegvm/utf8.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pegvm {

// Decodes the escape syntax of a grammar string literal into UTF-8 text.
// Recognizes \" \\ \r \n \t \0 \' \xHH and \u{H..H} (2 to 6 hex digits).
// Returns std::nullopt for any other escape or a malformed one.
[[nodiscard]] inline std::optional<std::string> unescape(std::string_view raw)
{
	std::string result;
	result.reserve(raw.size());
	for (std::size_t i = 0, n = raw.size(); i < n; ) {
		char const c = raw[i++];
		if (c != '\\') {
			result.push_back(c);
			continue;
		}
		if (i == n)
			return std::nullopt;
		switch (char const e = raw[i++]; e) {
			case '"': result.push_back('"'); break;
			case '\\': result.push_back('\\'); break;
			case 'r': result.push_back('\r'); break;
			case 'n': result.push_back('\n'); break;
			case 't': result.push_back('\t'); break;
			case '0': result.push_back('\0'); break;
			case '\'': result.push_back('\''); break;
			case 'x': {
				if ((n - i) < 2 || !detail::is_hex_digit(raw[i]) || !detail::is_hex_digit(raw[i + 1]))
					return std::nullopt;
				auto const value = static_cast<char32_t>((detail::hex_digit_value(raw[i]) << 4U) | detail::hex_digit_value(raw[i + 1]));
				i += 2;
				utf8::encode_rune(std::back_inserter(result), value);
			} break;
			case 'u': {
				if ((i == n) || (raw[i] != '{'))
					return std::nullopt;
				auto const close = raw.find('}', ++i);
				if (close == std::string_view::npos)
					return std::nullopt;
				auto const digits = raw.substr(i, close - i);
				if ((digits.size() < 2) || (digits.size() > 6))
					return std::nullopt;
				std::uint_least32_t value = 0;
				for (char const d : digits) {
					if (!detail::is_hex_digit(d))
						return std::nullopt;
					value = (value << 4U) | detail::hex_digit_value(d);
				}
				if (!utf8::is_scalar(value))
					return std::nullopt;
				utf8::encode_rune(std::back_inserter(result), static_cast<char32_t>(value));
				i = close + 1;
			} break;
			default:
				return std::nullopt;
		}
	}
	return result;
}

// Decodes a character literal, which must denote exactly one code point.
[[nodiscard]] inline std::optional<char32_t> unescape_char(std::string_view raw)
{
	auto const text = unescape(raw);
	if (!text.has_value() || text->empty())
		return std::nullopt;
	auto const [next, rune] = utf8::decode_rune(text->cbegin(), text->cend());
	if (next != text->cend())
		return std::nullopt;
	return rune;
}

} // namespace pegvm

#endif
