// pegvm - Runtime interpreter for PE grammars in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_STATE_HPP
#define PEGVM_INCLUDE_PEGVM_STATE_HPP

#include <pegvm/detail.hpp>
#include <pegvm/error.hpp>
#include <pegvm/utf8.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pegvm {

class match_result;
class span;

struct syntax_position
{
	std::size_t line{1};
	std::size_t column{1};
	[[nodiscard]] constexpr bool operator==(syntax_position const& other) const noexcept { return line == other.line && column == other.column; }
	[[nodiscard]] constexpr bool operator!=(syntax_position const& other) const noexcept { return !(*this == other); }
	[[nodiscard]] constexpr bool operator<(syntax_position const& other) const noexcept { return line < other.line || (line == other.line && column < other.column); }
};

// Immutable cursor into the whole input.
class position
{
	std::string_view input_;
	std::size_t index_{0};

public:
	constexpr position() noexcept = default;
	constexpr position(std::string_view input, std::size_t index) noexcept : input_{input}, index_{index} {}
	[[nodiscard]] constexpr std::string_view input() const noexcept { return input_; }
	[[nodiscard]] constexpr std::size_t index() const noexcept { return index_; }
	[[nodiscard]] constexpr std::string_view remaining() const noexcept { return input_.substr(index_); }
	[[nodiscard]] constexpr bool operator==(position const& other) const noexcept { return index_ == other.index_; }
	[[nodiscard]] constexpr bool operator!=(position const& other) const noexcept { return index_ != other.index_; }
	[[nodiscard]] constexpr bool operator<(position const& other) const noexcept { return index_ < other.index_; }
	[[nodiscard]] constexpr bool operator<=(position const& other) const noexcept { return index_ <= other.index_; }
	[[nodiscard]] constexpr bool operator>(position const& other) const noexcept { return index_ > other.index_; }
	[[nodiscard]] constexpr bool operator>=(position const& other) const noexcept { return index_ >= other.index_; }
	[[nodiscard]] span span_to(position const& end) const noexcept;
	[[nodiscard]] syntax_position location(std::uint_least32_t tab_width = 8, std::uint_least32_t tab_alignment = 8) const;

	[[nodiscard]] match_result match_string(std::string_view str) const noexcept;
	[[nodiscard]] match_result match_insensitive(std::string_view str) const;
	[[nodiscard]] match_result match_range(char32_t low, char32_t high) const noexcept;
	[[nodiscard]] match_result skip(std::size_t runes) const noexcept;
	[[nodiscard]] match_result skip_until(std::string_view str) const noexcept;
	[[nodiscard]] match_result at_start() const noexcept;
	[[nodiscard]] match_result at_end() const noexcept;
	template <class Fn> [[nodiscard]] match_result optional(Fn&& fn) const;
	template <class Fn> [[nodiscard]] match_result repeat(Fn&& fn) const;
	template <class Fn> [[nodiscard]] match_result sequence(Fn&& fn) const;
	template <class Fn> [[nodiscard]] match_result lookahead(bool is_positive, Fn&& fn) const;
};

class span
{
	std::string_view input_;
	std::size_t start_{0};
	std::size_t end_{0};

public:
	constexpr span() noexcept = default;
	constexpr span(std::string_view input, std::size_t start, std::size_t end) noexcept : input_{input}, start_{start}, end_{end} {}
	[[nodiscard]] constexpr std::size_t start() const noexcept { return start_; }
	[[nodiscard]] constexpr std::size_t end() const noexcept { return end_; }
	[[nodiscard]] constexpr position start_pos() const noexcept { return position{input_, start_}; }
	[[nodiscard]] constexpr position end_pos() const noexcept { return position{input_, end_}; }
	[[nodiscard]] constexpr std::string_view as_str() const noexcept { return input_.substr(start_, end_ - start_); }
	[[nodiscard]] constexpr std::size_t size() const noexcept { return end_ - start_; }
	[[nodiscard]] constexpr bool empty() const noexcept { return start_ == end_; }
	[[nodiscard]] constexpr bool operator==(span const& other) const noexcept { return start_ == other.start_ && end_ == other.end_ && input_.data() == other.input_.data(); }
	[[nodiscard]] constexpr bool operator!=(span const& other) const noexcept { return !(*this == other); }
};

// Outcome of a match attempt. Failure is the ordinary backtracking signal,
// not an error; it carries the position the attempt was made from.
class match_result
{
	position pos_;
	bool success_{false};

	constexpr match_result(position p, bool s) noexcept : pos_{p}, success_{s} {}

public:
	[[nodiscard]] static constexpr match_result success(position p) noexcept { return match_result{p, true}; }
	[[nodiscard]] static constexpr match_result failure(position p) noexcept { return match_result{p, false}; }
	[[nodiscard]] constexpr explicit operator bool() const noexcept { return success_; }
	[[nodiscard]] constexpr bool succeeded() const noexcept { return success_; }
	[[nodiscard]] constexpr bool failed() const noexcept { return !success_; }
	[[nodiscard]] constexpr position const& pos() const noexcept { return pos_; }

	template <class Fn>
	[[nodiscard]] match_result and_then(Fn&& fn) const
	{
		return success_ ? std::forward<Fn>(fn)(pos_) : *this;
	}
};

inline span position::span_to(position const& end) const noexcept
{
	return span{input_, index_, end.index_};
}

inline syntax_position position::location(std::uint_least32_t tab_width, std::uint_least32_t tab_alignment) const
{
	syntax_position result;
	std::string_view const consumed = input_.substr(0, index_);
	std::size_t line_start = 0;
	for (std::size_t i = 0; i < consumed.size(); ) {
		if (std::size_t const eol = utf8::match_eol(consumed.substr(i)); eol != 0) {
			i += eol;
			line_start = i;
			++result.line;
		} else {
			++i;
		}
	}
	auto curr = consumed.cbegin() + static_cast<std::ptrdiff_t>(line_start);
	auto const last = consumed.cend();
	while (curr != last) {
		auto const [next, rune] = utf8::decode_rune(curr, last);
		if ((rune != U'\t') || (tab_width == 0)) {
			++result.column;
		} else {
			std::size_t const oldcolumn = result.column;
			std::size_t const newcolumn = oldcolumn + tab_width;
			std::size_t const alignedcolumn = (tab_alignment != 0) ? (newcolumn - ((newcolumn - 1) % tab_alignment)) : newcolumn;
			result.column = (std::max)((std::min)(newcolumn, alignedcolumn), oldcolumn + 1);
		}
		curr = next;
	}
	return result;
}

inline match_result position::match_string(std::string_view str) const noexcept
{
	if (remaining().substr(0, str.size()) == str)
		return match_result::success(position{input_, index_ + str.size()});
	return match_result::failure(*this);
}

inline match_result position::match_insensitive(std::string_view str) const
{
	if (std::size_t const n = utf8::casefold_prefix(remaining(), str); n != std::string_view::npos)
		return match_result::success(position{input_, index_ + n});
	return match_result::failure(*this);
}

inline match_result position::match_range(char32_t low, char32_t high) const noexcept
{
	std::string_view const rest = remaining();
	if (rest.empty())
		return match_result::failure(*this);
	auto const [next, rune] = utf8::decode_rune(rest.cbegin(), rest.cend());
	if ((rune < low) || (high < rune))
		return match_result::failure(*this);
	return match_result::success(position{input_, index_ + static_cast<std::size_t>(next - rest.cbegin())});
}

inline match_result position::skip(std::size_t runes) const noexcept
{
	std::string_view const rest = remaining();
	auto curr = rest.cbegin();
	for (; runes > 0; --runes) {
		if (curr == rest.cend())
			return match_result::failure(*this);
		curr = utf8::next_rune(curr, rest.cend());
	}
	return match_result::success(position{input_, index_ + static_cast<std::size_t>(curr - rest.cbegin())});
}

inline match_result position::skip_until(std::string_view str) const noexcept
{
	if (std::size_t const found = input_.find(str, index_); found != std::string_view::npos)
		return match_result::success(position{input_, found});
	return match_result::failure(*this);
}

inline match_result position::at_start() const noexcept
{
	return (index_ == 0) ? match_result::success(*this) : match_result::failure(*this);
}

inline match_result position::at_end() const noexcept
{
	return (index_ == input_.size()) ? match_result::success(*this) : match_result::failure(*this);
}

template <class Fn>
inline match_result position::optional(Fn&& fn) const
{
	if (match_result const result = std::forward<Fn>(fn)(*this); result)
		return result;
	return match_result::success(*this);
}

// Stops at the first failing or non-advancing iteration.
template <class Fn>
inline match_result position::repeat(Fn&& fn) const
{
	position current{*this};
	for (;;) {
		match_result const result = fn(current);
		if (!result || (result.pos() <= current))
			break;
		current = result.pos();
	}
	return match_result::success(current);
}

template <class Fn>
inline match_result position::sequence(Fn&& fn) const
{
	if (match_result const result = std::forward<Fn>(fn)(*this); result)
		return result;
	return match_result::failure(*this);
}

template <class Fn>
inline match_result position::lookahead(bool is_positive, Fn&& fn) const
{
	match_result const result = std::forward<Fn>(fn)(*this);
	return (result.succeeded() == is_positive) ? match_result::success(*this) : match_result::failure(*this);
}

// Per-parse stack of captured spans. Every push and pop is journaled so a
// snapshot can be restored after a failed scope, undoing both.
class capture_stack
{
	struct change
	{
		span value;
		bool pushed;
	};

	std::vector<span> items_;
	std::vector<change> journal_;

public:
	using snapshot = std::size_t;

	[[nodiscard]] bool empty() const noexcept { return items_.empty(); }
	[[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
	[[nodiscard]] span const& top() const noexcept { return items_.back(); }
	[[nodiscard]] std::vector<span> const& items() const noexcept { return items_; }
	[[nodiscard]] snapshot take_snapshot() const noexcept { return journal_.size(); }

	void push(span s)
	{
		items_.push_back(s);
		journal_.push_back(change{s, true});
	}

	span pop()
	{
		span const s = detail::pop_back(items_);
		journal_.push_back(change{s, false});
		return s;
	}

	void restore(snapshot s)
	{
		while (journal_.size() > s) {
			change const c = detail::pop_back(journal_);
			if (c.pushed)
				items_.pop_back();
			else
				items_.push_back(c.value);
		}
	}
};

enum class atomicity : std::uint_least8_t { atomic, compound_atomic, non_atomic };
enum class lookahead_mode : std::uint_least8_t { none, positive, negative };
enum class token_type : std::uint_least8_t { start, end };

// Start tokens refer to their end token through pair_index and vice versa.
struct queued_token
{
	token_type type;
	std::string_view rule;
	std::size_t pair_index;
	std::size_t input_index;
};

using token_queue = std::vector<queued_token>;

// Mutable per-parse context: atomicity, lookahead, token queue, capture
// stack, call depth and the bookkeeping for the furthest failure.
class parser_state
{
	token_queue queue_;
	capture_stack stack_;
	std::vector<std::string_view> pos_attempts_;
	std::vector<std::string_view> neg_attempts_;
	std::size_t attempt_pos_{0};
	std::size_t furthest_failure_{0};
	std::size_t call_depth_{0};
	std::size_t call_depth_limit_{0};
	atomicity atomicity_{atomicity::non_atomic};
	lookahead_mode lookahead_{lookahead_mode::none};

	[[nodiscard]] std::size_t attempts_at(std::size_t pos) const noexcept
	{
		return (pos == attempt_pos_) ? (pos_attempts_.size() + neg_attempts_.size()) : 0;
	}

	void track(std::string_view rule, std::size_t pos, std::size_t pos_attempts_index, std::size_t neg_attempts_index, std::size_t prev_attempts)
	{
		if (atomicity_ == atomicity::atomic)
			return;
		// a single attempt made by a nested rule is more specific than this rule
		if (std::size_t const curr_attempts = attempts_at(pos); (curr_attempts > prev_attempts) && ((curr_attempts - prev_attempts) == 1))
			return;
		if (pos == attempt_pos_) {
			pos_attempts_.resize((std::min)(pos_attempts_.size(), pos_attempts_index));
			neg_attempts_.resize((std::min)(neg_attempts_.size(), neg_attempts_index));
		}
		if (pos > attempt_pos_) {
			pos_attempts_.clear();
			neg_attempts_.clear();
			attempt_pos_ = pos;
		}
		if (pos == attempt_pos_)
			(lookahead_ != lookahead_mode::negative ? pos_attempts_ : neg_attempts_).push_back(rule);
	}

public:
	explicit parser_state(std::size_t call_depth_limit = 0) noexcept : call_depth_limit_{call_depth_limit} {}

	[[nodiscard]] atomicity current_atomicity() const noexcept { return atomicity_; }
	[[nodiscard]] lookahead_mode current_lookahead() const noexcept { return lookahead_; }
	[[nodiscard]] capture_stack& stack() noexcept { return stack_; }
	[[nodiscard]] capture_stack const& stack() const noexcept { return stack_; }
	[[nodiscard]] token_queue const& queue() const noexcept { return queue_; }
	[[nodiscard]] token_queue release_queue() noexcept { return std::move(queue_); }
	[[nodiscard]] std::size_t call_depth() const noexcept { return call_depth_; }
	[[nodiscard]] std::size_t furthest_failure() const noexcept { return furthest_failure_; }
	[[nodiscard]] std::size_t attempt_pos() const noexcept { return attempt_pos_; }
	[[nodiscard]] std::vector<std::string_view> const& pos_attempts() const noexcept { return pos_attempts_; }
	[[nodiscard]] std::vector<std::string_view> const& neg_attempts() const noexcept { return neg_attempts_; }

	match_result const& note(match_result const& result) noexcept
	{
		if (result.failed())
			furthest_failure_ = (std::max)(furthest_failure_, result.pos().index());
		return result;
	}

	template <class Fn>
	[[nodiscard]] match_result call(Fn&& fn)
	{
		if ((call_depth_limit_ != 0) && (call_depth_ >= call_depth_limit_))
			throw call_depth_error{};
		++call_depth_;
		detail::scope_exit const leave{[this] { --call_depth_; }};
		return std::forward<Fn>(fn)();
	}

	template <class Fn>
	[[nodiscard]] match_result atomic(atomicity mode, Fn&& fn)
	{
		if (atomicity_ == mode)
			return std::forward<Fn>(fn)();
		atomicity const initial = std::exchange(atomicity_, mode);
		detail::scope_exit const restore{[this, initial] { atomicity_ = initial; }};
		return std::forward<Fn>(fn)();
	}

	template <class Fn>
	[[nodiscard]] match_result rule(std::string_view name, position const& pos, Fn&& fn)
	{
		std::size_t const actual_pos = pos.index();
		std::size_t const index = queue_.size();
		std::size_t pos_attempts_index = 0;
		std::size_t neg_attempts_index = 0;
		if (actual_pos == attempt_pos_) {
			pos_attempts_index = pos_attempts_.size();
			neg_attempts_index = neg_attempts_.size();
		}
		bool const emit = (lookahead_ == lookahead_mode::none) && (atomicity_ != atomicity::atomic);
		if (emit)
			queue_.push_back(queued_token{token_type::start, name, 0, actual_pos});
		std::size_t const attempts = attempts_at(actual_pos);
		match_result const result = std::forward<Fn>(fn)(pos);
		if (result) {
			if (lookahead_ == lookahead_mode::negative)
				track(name, actual_pos, pos_attempts_index, neg_attempts_index, attempts);
			if (emit) {
				queue_[index].pair_index = queue_.size();
				queue_.push_back(queued_token{token_type::end, name, index, result.pos().index()});
			}
		} else {
			if (lookahead_ != lookahead_mode::negative)
				track(name, actual_pos, pos_attempts_index, neg_attempts_index, attempts);
			if (emit)
				queue_.erase(queue_.begin() + static_cast<std::ptrdiff_t>(index), queue_.end());
		}
		return result;
	}

	template <class Fn>
	[[nodiscard]] match_result sequence(Fn&& fn)
	{
		std::size_t const index = queue_.size();
		capture_stack::snapshot const snapshot = stack_.take_snapshot();
		match_result const result = std::forward<Fn>(fn)();
		if (!result) {
			queue_.erase(queue_.begin() + static_cast<std::ptrdiff_t>(index), queue_.end());
			stack_.restore(snapshot);
		}
		return result;
	}

	// Tokens are never emitted under lookahead, and capture stack changes
	// made during the attempt are always discarded.
	template <class Fn>
	[[nodiscard]] match_result lookahead(bool is_positive, Fn&& fn)
	{
		lookahead_mode const initial = lookahead_;
		if (initial == lookahead_mode::negative)
			lookahead_ = is_positive ? lookahead_mode::negative : lookahead_mode::positive;
		else
			lookahead_ = is_positive ? lookahead_mode::positive : lookahead_mode::negative;
		capture_stack::snapshot const snapshot = stack_.take_snapshot();
		match_result const result = std::forward<Fn>(fn)();
		lookahead_ = initial;
		stack_.restore(snapshot);
		return result;
	}
};

} // namespace pegvm

#endif
