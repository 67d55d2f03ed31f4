// pegvm - Runtime interpreter for PE grammars in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_IOSTREAM_HPP
#define PEGVM_INCLUDE_PEGVM_IOSTREAM_HPP

#include <pegvm/pegvm.hpp>

#include <cstdio>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#ifndef PEGVM_NO_ISATTY
#ifdef _MSC_VER
#ifndef PEGVM_HAS_ISATTY_MSVC
#define PEGVM_HAS_ISATTY_MSVC
#endif
#else
#ifndef PEGVM_HAS_ISATTY_POSIX
#ifdef __has_include
#if __has_include(<unistd.h>)
#define PEGVM_HAS_ISATTY_POSIX
#endif
#endif
#endif
#endif
#endif // PEGVM_NO_ISATTY

#if defined PEGVM_HAS_ISATTY_MSVC
#include <io.h>
#elif defined PEGVM_HAS_ISATTY_POSIX
#include <unistd.h>
#endif

namespace pegvm {

[[nodiscard]] inline bool stdin_isatty() noexcept
{
#if defined PEGVM_HAS_ISATTY_MSVC
	return _isatty(_fileno(stdin)) != 0;
#elif defined PEGVM_HAS_ISATTY_POSIX
	return isatty(fileno(stdin)) != 0;
#else
	return false;
#endif
}

// Reads characters into output until end of stream, or through the first
// delim when interactive is set. Sets failbit when nothing was read.
template <class CharT, class Traits, class OutputIt>
std::basic_istream<CharT, Traits>& read_source(std::basic_istream<CharT, Traits>& input, OutputIt output, CharT delim, bool interactive)
{
	typename std::basic_istream<CharT, Traits>::sentry sentry{input, true};
	if (!sentry)
		return input;
	std::streamsize count = 0;
	for (typename std::basic_istream<CharT, Traits>::int_type ch = input.rdbuf()->sgetc(); ; ch = input.rdbuf()->snextc()) {
		if (Traits::eq_int_type(ch, Traits::eof())) {
			input.setstate(std::ios_base::eofbit);
			break;
		}
		*output = Traits::to_char_type(ch);
		++output;
		++count;
		if (interactive && Traits::eq_int_type(ch, Traits::to_int_type(delim))) {
			input.rdbuf()->sbumpc();
			break;
		}
	}
	if (count == 0)
		input.setstate(std::ios_base::failbit);
	return input;
}

// Reads the whole stream. The caller owns the text and must keep it alive
// for as long as it holds pairs produced from it.
[[nodiscard]] inline std::string read_source(std::istream& input)
{
	std::string text;
	(void)read_source(input, std::back_inserter(text), input.widen('\n'), false);
	if (input.bad())
		throw std::ios_base::failure{"error reading input stream"};
	return text;
}

// Reads one line, keeping its line ending. Returns false at end of stream.
inline bool read_line(std::istream& input, std::string& line)
{
	line.clear();
	return static_cast<bool>(read_source(input, std::back_inserter(line), input.widen('\n'), true));
}

inline std::ostream& operator<<(std::ostream& os, span const& s)
{
	return os << s.as_str();
}

inline std::ostream& operator<<(std::ostream& os, pairs const& ps);

inline std::ostream& operator<<(std::ostream& os, pair const& p)
{
	os << p.rule() << '@' << p.start() << ".." << p.end();
	if (pairs const children = p.inner(); !children.empty())
		os << ' ' << children;
	return os;
}

inline std::ostream& operator<<(std::ostream& os, pairs const& ps)
{
	os << '[';
	char const* separator = "";
	for (pair const& p : ps) {
		os << separator << p;
		separator = ", ";
	}
	return os << ']';
}

namespace detail {

inline void print_rule_list(std::ostream& os, std::vector<std::string> const& names)
{
	for (std::size_t i = 0, n = names.size(); i < n; ++i) {
		if (i > 0)
			os << ((n > 2) ? ", " : " ");
		if ((i > 0) && (i + 1 == n))
			os << "or ";
		os << names[i];
	}
}

enum class expr_precedence : int { choice, sequence, unary };

[[nodiscard]] inline expr_precedence precedence_of(expr const& e)
{
	return e.visit([](auto const& x) {
		using T = std::decay_t<decltype(x)>;
		if constexpr (std::is_same_v<T, choice_expr>)
			return expr_precedence::choice;
		else if constexpr (std::is_same_v<T, sequence_expr>)
			return expr_precedence::sequence;
		else
			return expr_precedence::unary;
	});
}

inline void print_expr(std::ostream& os, expr const& e);

inline void print_operand(std::ostream& os, expr const& e, expr_precedence required)
{
	if (precedence_of(e) < required) {
		os << '(';
		print_expr(os, e);
		os << ')';
	} else {
		print_expr(os, e);
	}
}

inline void print_literal(std::ostream& os, std::string const& raw)
{
	os << '"' << raw << '"';
}

inline void print_expr(std::ostream& os, expr const& e)
{
	e.visit([&os](auto const& x) {
		using T = std::decay_t<decltype(x)>;
		if constexpr (std::is_same_v<T, literal_expr>) {
			print_literal(os, x.raw);
		} else if constexpr (std::is_same_v<T, literal_insensitive_expr>) {
			os << '^';
			print_literal(os, x.raw);
		} else if constexpr (std::is_same_v<T, char_range_expr>) {
			os << '\'' << x.raw_low << "'..'" << x.raw_high << '\'';
		} else if constexpr (std::is_same_v<T, rule_ref_expr>) {
			os << x.name;
		} else if constexpr (std::is_same_v<T, positive_lookahead_expr>) {
			os << '&';
			print_operand(os, x.e, expr_precedence::unary);
		} else if constexpr (std::is_same_v<T, negative_lookahead_expr>) {
			os << '!';
			print_operand(os, x.e, expr_precedence::unary);
		} else if constexpr (std::is_same_v<T, sequence_expr>) {
			print_operand(os, x.lhs, expr_precedence::sequence);
			os << " ~ ";
			print_operand(os, x.rhs, expr_precedence::sequence);
		} else if constexpr (std::is_same_v<T, choice_expr>) {
			print_operand(os, x.lhs, expr_precedence::choice);
			os << " | ";
			print_operand(os, x.rhs, expr_precedence::choice);
		} else if constexpr (std::is_same_v<T, optional_expr>) {
			print_operand(os, x.e, expr_precedence::unary);
			os << '?';
		} else if constexpr (std::is_same_v<T, repeat_expr>) {
			print_operand(os, x.e, expr_precedence::unary);
			os << '*';
		} else if constexpr (std::is_same_v<T, repeat_once_expr>) {
			print_operand(os, x.e, expr_precedence::unary);
			os << '+';
		} else if constexpr (std::is_same_v<T, repeat_exact_expr>) {
			print_operand(os, x.e, expr_precedence::unary);
			os << '{' << x.count << '}';
		} else if constexpr (std::is_same_v<T, repeat_min_expr>) {
			print_operand(os, x.e, expr_precedence::unary);
			os << '{' << x.min << ", }";
		} else if constexpr (std::is_same_v<T, repeat_max_expr>) {
			print_operand(os, x.e, expr_precedence::unary);
			os << "{, " << x.max << '}';
		} else if constexpr (std::is_same_v<T, repeat_min_max_expr>) {
			print_operand(os, x.e, expr_precedence::unary);
			os << '{' << x.min << ", " << x.max << '}';
		} else if constexpr (std::is_same_v<T, capture_expr>) {
			os << "push(";
			print_expr(os, x.e);
			os << ')';
		} else if constexpr (std::is_same_v<T, scan_to_any_expr>) {
			os << "(!(";
			for (std::size_t i = 0; i < x.raw.size(); ++i) {
				if (i > 0)
					os << " | ";
				print_literal(os, x.raw[i]);
			}
			os << ") ~ any)*";
		} else {
			static_assert(pegvm::detail::always_false_v<T>, "unhandled expression type");
		}
	});
}

[[nodiscard]] constexpr std::string_view rule_kind_prefix(rule_kind kind) noexcept
{
	switch (kind) {
		case rule_kind::normal: return "{";
		case rule_kind::silent: return "_{";
		case rule_kind::atomic: return "@{";
		case rule_kind::compound_atomic: return "${";
		case rule_kind::non_atomic: return "!{";
	}
	return "{";
}

} // namespace detail

inline std::ostream& operator<<(std::ostream& os, expr const& e)
{
	detail::print_expr(os, e);
	return os;
}

inline std::ostream& operator<<(std::ostream& os, rule const& r)
{
	return os << r.name << " = " << detail::rule_kind_prefix(r.kind) << ' ' << r.body << " }";
}

inline std::ostream& operator<<(std::ostream& os, parse_failure const& f)
{
	os << f.location.line << ':' << f.location.column << ": ";
	if (f.positives.empty() && f.negatives.empty())
		return os << "unknown parsing error";
	if (!f.positives.empty()) {
		os << "expected ";
		detail::print_rule_list(os, f.positives);
	}
	if (!f.negatives.empty()) {
		os << (f.positives.empty() ? "unexpected " : ", unexpected ");
		detail::print_rule_list(os, f.negatives);
	}
	return os;
}

} // namespace pegvm

#endif
