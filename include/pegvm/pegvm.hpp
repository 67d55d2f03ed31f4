// pegvm - Runtime interpreter for PE grammars in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_PEGVM_HPP
#define PEGVM_INCLUDE_PEGVM_PEGVM_HPP

#include <pegvm/error.hpp>
#include <pegvm/grammar.hpp>
#include <pegvm/pairs.hpp>
#include <pegvm/state.hpp>

#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace pegvm {

struct parse_options
{
	std::uint_least32_t tab_width{8};
	std::uint_least32_t tab_alignment{8};
	std::size_t call_depth_limit{0}; // zero means unlimited
};

// Raw data of a failed parse. Message text is left to the caller.
struct parse_failure
{
	position pos;
	syntax_position location;
	std::vector<std::string> positives;
	std::vector<std::string> negatives;
};

class parse_result
{
	std::variant<pairs, parse_failure> value_;

public:
	explicit parse_result(pairs p) : value_{std::in_place_index<0>, std::move(p)} {}
	explicit parse_result(parse_failure f) : value_{std::in_place_index<1>, std::move(f)} {}
	[[nodiscard]] explicit operator bool() const noexcept { return value_.index() == 0; }
	[[nodiscard]] bool succeeded() const noexcept { return value_.index() == 0; }
	[[nodiscard]] pairs const& tokens() const { return std::get<0>(value_); }
	[[nodiscard]] parse_failure const& failure() const { return std::get<1>(value_); }
};

class parser
{
	pegvm::grammar const* grammar_;
	parse_options options_;

	[[nodiscard]] match_result parse_rule(std::string_view name, position const& pos, parser_state& state) const
	{
		return state.note(state.call([&] { return dispatch(name, pos, state); }));
	}

	[[nodiscard]] match_result dispatch(std::string_view name, position const& pos, parser_state& state) const
	{
		if (name == "any")
			return pos.skip(1);
		if (name == "eoi")
			return state.rule("eoi", pos, [](position const& p) { return p.at_end(); });
		if (name == "soi")
			return pos.at_start();
		if ((name == "peek") || (name == "pop")) {
			if (state.stack().empty())
				throw empty_stack_error{name};
			match_result const result = pos.match_string(state.stack().top().as_str());
			if (result && (name == "pop"))
				(void)state.stack().pop();
			return result;
		}

		rule const* const r = grammar_->find(name);
		if (r == nullptr)
			throw undefined_rule_error{name};
		auto const body = [this, r, &state](position const& p) { return parse_expr(r->body, p, state); };
		auto const atomic_body = [&state, &body](atomicity mode) {
			return [&state, &body, mode](position const& p) { return state.atomic(mode, [&body, &p] { return body(p); }); };
		};

		if ((r->name == whitespace_rule_name) || (r->name == comment_rule_name)) {
			if ((r->kind == rule_kind::normal) || (r->kind == rule_kind::atomic))
				return state.rule(r->name, pos, atomic_body(atomicity::atomic));
			return atomic_body(atomicity::atomic)(pos);
		}

		switch (r->kind) {
			case rule_kind::normal:
				return state.rule(r->name, pos, body);
			case rule_kind::silent:
				return body(pos);
			case rule_kind::atomic:
				return state.rule(r->name, pos, atomic_body(atomicity::atomic));
			case rule_kind::compound_atomic:
				return state.atomic(atomicity::compound_atomic, [&] { return state.rule(r->name, pos, body); });
			case rule_kind::non_atomic:
				return state.atomic(atomicity::non_atomic, [&] { return state.rule(r->name, pos, body); });
		}
		throw bad_grammar{"invalid rule kind for " + r->name};
	}

	[[nodiscard]] match_result parse_expr(expr const& e, position const& pos, parser_state& state) const
	{
		return state.note(e.visit([&](auto const& x) -> match_result {
			using T = std::decay_t<decltype(x)>;
			if constexpr (std::is_same_v<T, literal_expr>) {
				return pos.match_string(x.text);
			} else if constexpr (std::is_same_v<T, literal_insensitive_expr>) {
				return pos.match_insensitive(x.text);
			} else if constexpr (std::is_same_v<T, char_range_expr>) {
				return pos.match_range(x.low, x.high);
			} else if constexpr (std::is_same_v<T, rule_ref_expr>) {
				return parse_rule(x.name, pos, state);
			} else if constexpr (std::is_same_v<T, positive_lookahead_expr> || std::is_same_v<T, negative_lookahead_expr>) {
				constexpr bool is_positive = std::is_same_v<T, positive_lookahead_expr>;
				return state.lookahead(is_positive, [&] {
					return pos.lookahead(is_positive, [&](position const& p) { return parse_expr(x.e, p, state); });
				});
			} else if constexpr (std::is_same_v<T, sequence_expr>) {
				return state.sequence([&] {
					return pos.sequence([&](position const& p) {
						return parse_expr(x.lhs, p, state)
							.and_then([&](position const& q) { return skip(q, state); })
							.and_then([&](position const& q) { return parse_expr(x.rhs, q, state); });
					});
				});
			} else if constexpr (std::is_same_v<T, choice_expr>) {
				if (match_result const result = parse_expr(x.lhs, pos, state); result)
					return result;
				return parse_expr(x.rhs, pos, state);
			} else if constexpr (std::is_same_v<T, optional_expr>) {
				return pos.optional([&](position const& p) { return parse_expr(x.e, p, state); });
			} else if constexpr (std::is_same_v<T, repeat_expr>) {
				return repeat(x.e, std::nullopt, std::nullopt, pos, state);
			} else if constexpr (std::is_same_v<T, repeat_once_expr>) {
				return repeat(x.e, 1U, std::nullopt, pos, state);
			} else if constexpr (std::is_same_v<T, repeat_exact_expr>) {
				return repeat(x.e, x.count, x.count, pos, state);
			} else if constexpr (std::is_same_v<T, repeat_min_expr>) {
				return repeat(x.e, x.min, std::nullopt, pos, state);
			} else if constexpr (std::is_same_v<T, repeat_max_expr>) {
				return repeat(x.e, std::nullopt, x.max, pos, state);
			} else if constexpr (std::is_same_v<T, repeat_min_max_expr>) {
				return repeat(x.e, x.min, x.max, pos, state);
			} else if constexpr (std::is_same_v<T, capture_expr>) {
				match_result const result = parse_expr(x.e, pos, state);
				if (result)
					state.stack().push(pos.span_to(result.pos()));
				return result;
			} else if constexpr (std::is_same_v<T, scan_to_any_expr>) {
				match_result closest = pos.skip_until(x.texts.front());
				for (auto it = std::next(x.texts.begin()); it != x.texts.end(); ++it)
					if (match_result const result = pos.skip_until(*it); result && (!closest || (result.pos() < closest.pos())))
						closest = result;
				return closest;
			} else {
				static_assert(detail::always_false_v<T>, "unhandled expression type");
			}
		}));
	}

	[[nodiscard]] match_result repeat(expr const& e, std::optional<std::uint_least32_t> min, std::optional<std::uint_least32_t> max, position const& pos, parser_state& state) const
	{
		if (max.has_value() && (*max == 0))
			return match_result::success(pos);
		return state.sequence([&] {
			return pos.sequence([&](position const& start) {
				match_result result = match_result::success(start);
				std::uint_least32_t times = 0;
				if (min.value_or(0) > 0) {
					result = parse_expr(e, start, state);
					for (times = 1; result && (times < *min); ++times)
						result = skip(result.pos(), state).and_then([&](position const& p) { return parse_expr(e, p, state); });
					if (!result)
						return result;
				} else {
					result = parse_expr(e, start, state);
					if (!result)
						return match_result::success(start);
					times = 1;
				}
				for (;;) {
					if (max.has_value() && (times >= *max))
						return result;
					position const last = result.pos();
					match_result const current = state.sequence([&] {
						return last.sequence([&](position const& p) {
							return skip(p, state).and_then([&](position const& q) { return parse_expr(e, q, state); });
						});
					});
					if (!current)
						return result;
					++times;
					result = current;
					if (current.pos() <= last)
						return result;
				}
			});
		});
	}

	[[nodiscard]] match_result skip(position const& pos, parser_state& state) const
	{
		if (state.current_atomicity() != atomicity::non_atomic)
			return match_result::success(pos);
		auto const whitespace = [this, &state](position const& p) { return parse_rule(whitespace_rule_name, p, state); };
		auto const comment = [this, &state](position const& p) { return parse_rule(comment_rule_name, p, state); };
		bool const has_whitespace = grammar_->has_whitespace();
		bool const has_comment = grammar_->has_comment();
		if (has_whitespace && has_comment) {
			return state.sequence([&] {
				return pos.sequence([&](position const& p) {
					return p.repeat(whitespace).and_then([&](position const& q) {
						return q.repeat([&](position const& r) {
							return state.sequence([&] {
								return r.sequence([&](position const& s) {
									return comment(s).and_then([&](position const& t) { return t.repeat(whitespace); });
								});
							});
						});
					});
				});
			});
		}
		if (has_whitespace)
			return pos.repeat(whitespace);
		if (has_comment)
			return pos.repeat(comment);
		return match_result::success(pos);
	}

public:
	explicit parser(pegvm::grammar const& g, parse_options opt = {}) noexcept : grammar_{&g}, options_{opt} {}
	[[nodiscard]] pegvm::grammar const& grammar() const noexcept { return *grammar_; }
	[[nodiscard]] parse_options const& options() const noexcept { return options_; }

	// The returned pairs refer to input and to this parser's grammar.
	[[nodiscard]] parse_result parse(std::string_view start_rule, std::string_view input) const
	{
		parser_state state{options_.call_depth_limit};
		position const origin{input, 0};
		if (match_result const result = parse_rule(start_rule, origin, state); result)
			return parse_result{pairs{std::make_shared<token_queue const>(state.release_queue()), input}};
		position const furthest{input, state.furthest_failure()};
		parse_failure failure{furthest, furthest.location(options_.tab_width, options_.tab_alignment), {}, {}};
		if (state.attempt_pos() == furthest.index()) {
			failure.positives.assign(state.pos_attempts().begin(), state.pos_attempts().end());
			failure.negatives.assign(state.neg_attempts().begin(), state.neg_attempts().end());
		}
		return parse_result{std::move(failure)};
	}
};

[[nodiscard]] inline parse_result parse(grammar const& grmr, std::string_view start_rule, std::string_view input, parse_options opt = {})
{
	return parser{grmr, opt}.parse(start_rule, input);
}

} // namespace pegvm

#endif
