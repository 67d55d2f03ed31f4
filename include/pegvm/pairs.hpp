// pegvm - Runtime interpreter for PE grammars in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_PAIRS_HPP
#define PEGVM_INCLUDE_PEGVM_PAIRS_HPP

#include <pegvm/state.hpp>

#include <iterator>
#include <memory>
#include <string_view>
#include <vector>

namespace pegvm {

class pairs;

// A matched rule: its name, its input span and the pairs nested inside it.
// Refers to the input and to the grammar's rule names without owning them.
class pair
{
	std::shared_ptr<token_queue const> queue_;
	std::string_view input_;
	std::size_t start_{0};

	[[nodiscard]] queued_token const& start_token() const noexcept { return (*queue_)[start_]; }
	[[nodiscard]] queued_token const& end_token() const noexcept { return (*queue_)[start_token().pair_index]; }

public:
	pair(std::shared_ptr<token_queue const> q, std::string_view input, std::size_t start) noexcept : queue_{std::move(q)}, input_{input}, start_{start} {}
	[[nodiscard]] std::string_view rule() const noexcept { return start_token().rule; }
	[[nodiscard]] std::size_t start() const noexcept { return start_token().input_index; }
	[[nodiscard]] std::size_t end() const noexcept { return end_token().input_index; }
	[[nodiscard]] span as_span() const noexcept { return span{input_, start(), end()}; }
	[[nodiscard]] std::string_view as_str() const noexcept { return as_span().as_str(); }
	[[nodiscard]] pairs inner() const;
	[[nodiscard]] bool operator==(pair const& other) const noexcept { return queue_ == other.queue_ && start_ == other.start_; }
	[[nodiscard]] bool operator!=(pair const& other) const noexcept { return !(*this == other); }
};

// Lazily produced, restartable sequence of sibling pairs over a token queue.
class pairs
{
	std::shared_ptr<token_queue const> queue_;
	std::string_view input_;
	std::size_t start_{0};
	std::size_t end_{0};

public:
	class iterator
	{
		std::shared_ptr<token_queue const> queue_;
		std::string_view input_;
		std::size_t index_{0};

	public:
		using iterator_category = std::forward_iterator_tag;
		using value_type = pair;
		using difference_type = std::ptrdiff_t;
		using pointer = void;
		using reference = pair;

		iterator() noexcept = default;
		iterator(std::shared_ptr<token_queue const> q, std::string_view input, std::size_t index) noexcept : queue_{std::move(q)}, input_{input}, index_{index} {}
		[[nodiscard]] pair operator*() const { return pair{queue_, input_, index_}; }
		iterator& operator++() noexcept { index_ = (*queue_)[index_].pair_index + 1; return *this; }
		iterator operator++(int) noexcept { iterator i{*this}; ++*this; return i; }
		[[nodiscard]] friend bool operator==(iterator const& x, iterator const& y) noexcept { return x.index_ == y.index_; }
		[[nodiscard]] friend bool operator!=(iterator const& x, iterator const& y) noexcept { return x.index_ != y.index_; }
	};

	pairs() = default;
	pairs(std::shared_ptr<token_queue const> q, std::string_view input, std::size_t start, std::size_t end) noexcept : queue_{std::move(q)}, input_{input}, start_{start}, end_{end} {}

	pairs(std::shared_ptr<token_queue const> q, std::string_view input)
		: queue_{std::move(q)}, input_{input}, start_{0}, end_{queue_ ? queue_->size() : 0}
	{}

	[[nodiscard]] iterator begin() const noexcept { return iterator{queue_, input_, start_}; }
	[[nodiscard]] iterator end() const noexcept { return iterator{queue_, input_, end_}; }
	[[nodiscard]] bool empty() const noexcept { return start_ == end_; }
	[[nodiscard]] std::size_t size() const noexcept { return static_cast<std::size_t>(std::distance(begin(), end())); }
	[[nodiscard]] std::string_view input() const noexcept { return input_; }

	// Every pair at any depth, in document order.
	[[nodiscard]] std::vector<pair> flatten() const
	{
		std::vector<pair> result;
		for (std::size_t i = start_; i < end_; ++i)
			if ((*queue_)[i].type == token_type::start)
				result.emplace_back(queue_, input_, i);
		return result;
	}
};

inline pairs pair::inner() const
{
	return pairs{queue_, input_, start_ + 1, start_token().pair_index};
}

} // namespace pegvm

#endif
