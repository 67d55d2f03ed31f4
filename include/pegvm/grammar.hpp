// pegvm - Runtime interpreter for PE grammars in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_GRAMMAR_HPP
#define PEGVM_INCLUDE_PEGVM_GRAMMAR_HPP

#include <pegvm/error.hpp>
#include <pegvm/escape.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace pegvm {

struct expr_node;
class expr;
class grammar;
struct rule;

enum class rule_kind : std::uint_least8_t { normal, silent, atomic, compound_atomic, non_atomic };

inline constexpr std::string_view whitespace_rule_name{"whitespace"};
inline constexpr std::string_view comment_rule_name{"comment"};
inline constexpr std::array<std::string_view, 5> reserved_rule_names{"any", "eoi", "soi", "peek", "pop"};

[[nodiscard]] constexpr bool is_reserved_rule_name(std::string_view name) noexcept
{
	for (auto const& reserved : reserved_rule_names)
		if (reserved == name)
			return true;
	return false;
}

// Handle to an immutable, shareable expression tree node.
class expr
{
	std::shared_ptr<expr_node const> node_;

public:
	explicit expr(std::shared_ptr<expr_node const> n) noexcept : node_{std::move(n)} {}
	expr(char const* raw); // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
	expr(std::string_view raw); // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
	[[nodiscard]] expr_node const& node() const noexcept { return *node_; }
	template <class Visitor> decltype(auto) visit(Visitor&& v) const;
};

struct literal_expr { std::string raw; std::string text; };
struct literal_insensitive_expr { std::string raw; std::string text; };
struct char_range_expr { std::string raw_low; std::string raw_high; char32_t low; char32_t high; };
struct rule_ref_expr { std::string name; };
struct positive_lookahead_expr { expr e; };
struct negative_lookahead_expr { expr e; };
struct sequence_expr { expr lhs; expr rhs; };
struct choice_expr { expr lhs; expr rhs; };
struct optional_expr { expr e; };
struct repeat_expr { expr e; };
struct repeat_once_expr { expr e; };
struct repeat_exact_expr { expr e; std::uint_least32_t count; };
struct repeat_min_expr { expr e; std::uint_least32_t min; };
struct repeat_max_expr { expr e; std::uint_least32_t max; };
struct repeat_min_max_expr { expr e; std::uint_least32_t min; std::uint_least32_t max; };
struct capture_expr { expr e; };
struct scan_to_any_expr { std::vector<std::string> raw; std::vector<std::string> texts; };

struct expr_node
{
	using variant_type = std::variant<
		literal_expr, literal_insensitive_expr, char_range_expr, rule_ref_expr,
		positive_lookahead_expr, negative_lookahead_expr, sequence_expr, choice_expr,
		optional_expr, repeat_expr, repeat_once_expr, repeat_exact_expr, repeat_min_expr,
		repeat_max_expr, repeat_min_max_expr, capture_expr, scan_to_any_expr>;

	variant_type value;

	template <class T, class = std::enable_if_t<std::is_constructible_v<variant_type, T&&>>>
	explicit expr_node(T&& t) : value{std::forward<T>(t)} {}
};

template <class T>
[[nodiscard]] inline expr make_expr(T&& t)
{
	return expr{std::make_shared<expr_node const>(std::forward<T>(t))};
}

template <class Visitor>
inline decltype(auto) expr::visit(Visitor&& v) const
{
	return std::visit(std::forward<Visitor>(v), node_->value);
}

[[nodiscard]] inline std::string decode_literal(std::string_view raw)
{
	auto text = unescape(raw);
	if (!text.has_value())
		throw bad_string_literal{};
	return std::move(*text);
}

[[nodiscard]] inline char32_t decode_char_literal(std::string_view raw)
{
	auto const rune = unescape_char(raw);
	if (!rune.has_value())
		throw bad_character_literal{};
	return *rune;
}

inline expr::expr(std::string_view raw)
	: node_{std::make_shared<expr_node const>(literal_expr{std::string{raw}, decode_literal(raw)})}
{}

inline expr::expr(char const* raw)
	: expr{std::string_view{raw}}
{}

struct rule
{
	std::string name;
	rule_kind kind{rule_kind::normal};
	expr body;
};

// Immutable rule table, shared read-only by every parse.
class grammar
{
	std::vector<rule> rules_;
	std::map<std::string, std::size_t, std::less<>> index_;
	bool has_whitespace_{false};
	bool has_comment_{false};

public:
	explicit grammar(std::vector<rule> rules)
		: rules_{std::move(rules)}
	{
		for (std::size_t i = 0, n = rules_.size(); i < n; ++i) {
			std::string const& name = rules_[i].name;
			if (name.empty())
				throw bad_grammar{"rule name is empty"};
			if (is_reserved_rule_name(name))
				throw reserved_rule_error{name};
			if (!index_.emplace(name, i).second)
				throw duplicate_rule_error{name};
		}
		has_whitespace_ = contains(whitespace_rule_name);
		has_comment_ = contains(comment_rule_name);
	}

	grammar(std::initializer_list<rule> rules) : grammar{std::vector<rule>{rules}} {}

	[[nodiscard]] rule const* find(std::string_view name) const noexcept
	{
		auto const it = index_.find(name);
		return (it != index_.end()) ? &rules_[it->second] : nullptr;
	}

	[[nodiscard]] bool contains(std::string_view name) const noexcept { return index_.find(name) != index_.end(); }
	[[nodiscard]] bool has_whitespace() const noexcept { return has_whitespace_; }
	[[nodiscard]] bool has_comment() const noexcept { return has_comment_; }
	[[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }
	[[nodiscard]] bool empty() const noexcept { return rules_.empty(); }
	[[nodiscard]] auto begin() const noexcept { return rules_.cbegin(); }
	[[nodiscard]] auto end() const noexcept { return rules_.cend(); }
};

namespace language {

[[nodiscard]] inline expr str(std::string_view raw) { return make_expr(literal_expr{std::string{raw}, decode_literal(raw)}); }
[[nodiscard]] inline expr istr(std::string_view raw) { return make_expr(literal_insensitive_expr{std::string{raw}, decode_literal(raw)}); }
[[nodiscard]] inline expr ref(std::string_view name) { return make_expr(rule_ref_expr{std::string{name}}); }
[[nodiscard]] inline expr any() { return ref("any"); }
[[nodiscard]] inline expr eoi() { return ref("eoi"); }
[[nodiscard]] inline expr soi() { return ref("soi"); }
[[nodiscard]] inline expr peek() { return ref("peek"); }
[[nodiscard]] inline expr pop() { return ref("pop"); }

[[nodiscard]] inline expr range(std::string_view raw_low, std::string_view raw_high)
{
	char32_t const low = decode_char_literal(raw_low);
	char32_t const high = decode_char_literal(raw_high);
	if (high < low)
		throw bad_character_range{};
	return make_expr(char_range_expr{std::string{raw_low}, std::string{raw_high}, low, high});
}

[[nodiscard]] inline expr skip_to(std::initializer_list<std::string_view> raw_literals)
{
	if (raw_literals.size() == 0)
		throw bad_grammar{"skip_to requires at least one literal"};
	scan_to_any_expr e;
	for (auto const raw : raw_literals) {
		e.raw.emplace_back(raw);
		e.texts.push_back(decode_literal(raw));
	}
	return make_expr(std::move(e));
}

[[nodiscard]] inline expr push(expr e) { return make_expr(capture_expr{std::move(e)}); }
[[nodiscard]] inline expr opt(expr e) { return make_expr(optional_expr{std::move(e)}); }
[[nodiscard]] inline expr rep(expr e) { return make_expr(repeat_expr{std::move(e)}); }
[[nodiscard]] inline expr rep1(expr e) { return make_expr(repeat_once_expr{std::move(e)}); }
[[nodiscard]] inline expr rep_exact(expr e, std::uint_least32_t n) { return make_expr(repeat_exact_expr{std::move(e), n}); }
[[nodiscard]] inline expr rep_min(expr e, std::uint_least32_t min) { return make_expr(repeat_min_expr{std::move(e), min}); }
[[nodiscard]] inline expr rep_max(expr e, std::uint_least32_t max) { return make_expr(repeat_max_expr{std::move(e), max}); }

[[nodiscard]] inline expr rep_min_max(expr e, std::uint_least32_t min, std::uint_least32_t max)
{
	if (max < min)
		throw bad_repetition{};
	return make_expr(repeat_min_max_expr{std::move(e), min, max});
}

[[nodiscard]] inline expr seq(expr lhs, expr rhs) { return make_expr(sequence_expr{std::move(lhs), std::move(rhs)}); }
[[nodiscard]] inline expr choice(expr lhs, expr rhs) { return make_expr(choice_expr{std::move(lhs), std::move(rhs)}); }

template <class... Rest, class = std::enable_if_t<(sizeof...(Rest) > 0)>>
[[nodiscard]] inline expr seq(expr first, expr second, Rest&&... rest)
{
	return seq(std::move(first), seq(std::move(second), expr{std::forward<Rest>(rest)}...));
}

template <class... Rest, class = std::enable_if_t<(sizeof...(Rest) > 0)>>
[[nodiscard]] inline expr choice(expr first, expr second, Rest&&... rest)
{
	return choice(std::move(first), choice(std::move(second), expr{std::forward<Rest>(rest)}...));
}

[[nodiscard]] inline expr operator>(expr const& lhs, expr const& rhs) { return seq(lhs, rhs); }
[[nodiscard]] inline expr operator|(expr const& lhs, expr const& rhs) { return choice(lhs, rhs); }
[[nodiscard]] inline expr operator~(expr const& e) { return opt(e); }
[[nodiscard]] inline expr operator*(expr const& e) { return rep(e); }
[[nodiscard]] inline expr operator+(expr const& e) { return rep1(e); }
[[nodiscard]] inline expr operator&(expr const& e) { return make_expr(positive_lookahead_expr{e}); }
[[nodiscard]] inline expr operator!(expr const& e) { return make_expr(negative_lookahead_expr{e}); }

[[nodiscard]] inline rule normal(std::string_view name, expr body) { return rule{std::string{name}, rule_kind::normal, std::move(body)}; }
[[nodiscard]] inline rule silent(std::string_view name, expr body) { return rule{std::string{name}, rule_kind::silent, std::move(body)}; }
[[nodiscard]] inline rule atomic(std::string_view name, expr body) { return rule{std::string{name}, rule_kind::atomic, std::move(body)}; }
[[nodiscard]] inline rule compound_atomic(std::string_view name, expr body) { return rule{std::string{name}, rule_kind::compound_atomic, std::move(body)}; }
[[nodiscard]] inline rule non_atomic(std::string_view name, expr body) { return rule{std::string{name}, rule_kind::non_atomic, std::move(body)}; }

} // namespace language

} // namespace pegvm

#endif
