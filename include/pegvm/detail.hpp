// pegvm - Runtime interpreter for PE grammars in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_DETAIL_HPP
#define PEGVM_INCLUDE_PEGVM_DETAIL_HPP

#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace pegvm::detail {

template <class It>
inline constexpr bool is_char_input_iterator_v =
	!std::is_integral_v<It> &&
	std::is_base_of_v<std::input_iterator_tag, typename std::iterator_traits<It>::iterator_category> &&
	std::is_same_v<char, std::remove_cv_t<typename std::iterator_traits<It>::value_type>>;

template <class It, class T = void> using enable_if_char_input_iterator_t = std::enable_if_t<is_char_input_iterator_v<It>, T>;

template <class T> inline constexpr bool always_false_v = false;

template <class EF>
class scope_exit
{
	static_assert(std::is_invocable_v<EF>);

	EF destructor_;
	bool released_{false};

public:
	template <class Fn, class = std::enable_if_t<std::is_constructible_v<EF, Fn&&>>>
	constexpr explicit scope_exit(Fn&& fn) noexcept(std::is_nothrow_constructible_v<EF, Fn&&>)
		: destructor_{std::forward<Fn>(fn)}
	{}

	~scope_exit()
	{
		if (!released_)
			destructor_();
	}

	void release() noexcept
	{
		released_ = true;
	}

	scope_exit(scope_exit const&) = delete;
	scope_exit(scope_exit&&) = delete;
	scope_exit& operator=(scope_exit const&) = delete;
	scope_exit& operator=(scope_exit&&) = delete;
};

template <class Fn, class = std::enable_if_t<std::is_invocable_v<Fn>>>
scope_exit(Fn) -> scope_exit<std::decay_t<Fn>>;

template <class Sequence>
[[nodiscard]] constexpr auto pop_back(Sequence& s) -> typename Sequence::value_type
{
	typename Sequence::value_type result{std::move(s.back())}; // NOLINT(misc-const-correctness)
	s.pop_back();
	return result;
}

[[nodiscard]] constexpr bool is_hex_digit(char c) noexcept
{
	return ((c >= '0') && (c <= '9')) || ((c >= 'a') && (c <= 'f')) || ((c >= 'A') && (c <= 'F'));
}

[[nodiscard]] constexpr unsigned int hex_digit_value(char c) noexcept
{
	if ((c >= '0') && (c <= '9'))
		return static_cast<unsigned int>(c - '0');
	if ((c >= 'a') && (c <= 'f'))
		return static_cast<unsigned int>(c - 'a') + 10U;
	return static_cast<unsigned int>(c - 'A') + 10U;
}

} // namespace pegvm::detail

#endif
