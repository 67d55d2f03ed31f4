// pegvm - Runtime interpreter for PE grammars in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <pegvm/pegvm.hpp>
#include <pegvm/iostream.hpp>
#include <sstream>

#undef NDEBUG
#include <cassert>

template <class T>
std::string to_string(T const& value)
{
	std::ostringstream out;
	out << value;
	return out.str();
}

void test_parenthesized_sequence()
{
	using namespace pegvm::language;
	pegvm::grammar const G{
		normal("start", seq("(", rep(ref("inner")), ")")),
		silent("inner", seq(!str(")"), any()))
	};
	auto const result = pegvm::parse(G, "start", "(abc)");
	assert(result);
	assert(to_string(result.tokens()) == "[start@0..5]");

	// without the guard, the repetition also consumes the closing parenthesis
	pegvm::grammar const H{
		normal("start", seq("(", rep(ref("inner")), ")")),
		silent("inner", any())
	};
	assert(!pegvm::parse(H, "start", "(abc)"));
}

void test_nested_pairs()
{
	using namespace pegvm::language;
	pegvm::grammar const G{
		silent("whitespace", " "),
		normal("sum", seq(ref("num"), rep(seq("+", ref("num"))))),
		atomic("num", rep1(range("0", "9")))
	};
	auto const result = pegvm::parse(G, "sum", "1 + 23");
	assert(result);
	pegvm::pairs const& tokens = result.tokens();
	assert(to_string(tokens) == "[sum@0..6 [num@0..1, num@4..6]]");
	assert(tokens.size() == 1);
	assert(!tokens.empty());
	assert(tokens.input() == "1 + 23");

	pegvm::pair const sum = *tokens.begin();
	assert(sum.rule() == "sum");
	assert(sum.start() == 0 && sum.end() == 6);
	assert(sum.as_str() == "1 + 23");

	pegvm::pairs const nums = sum.inner();
	assert(nums.size() == 2);
	auto it = nums.begin();
	assert((*it).as_str() == "1");
	++it;
	assert((*it).as_str() == "23");
	assert((*it).as_span().start_pos().location() == (pegvm::syntax_position{1, 5}));
	assert((*it).inner().empty());
	++it;
	assert(it == nums.end());
}

void test_pairs_are_restartable()
{
	using namespace pegvm::language;
	pegvm::grammar const G{
		silent("start", rep(ref("item"))),
		normal("item", choice(ref("word"), ref("digit"))),
		normal("word", rep1(range("a", "z"))),
		normal("digit", range("0", "9"))
	};
	auto const result = pegvm::parse(G, "start", "ab1c");
	assert(result);
	pegvm::pairs const tokens = result.tokens();
	std::vector<std::string> first;
	for (auto const& p : tokens)
		first.emplace_back(p.as_str());
	std::vector<std::string> second;
	for (auto const& p : tokens)
		second.emplace_back(p.as_str());
	assert(first == second);
	assert((first == std::vector<std::string>{"ab", "1", "c"}));

	pegvm::pairs const copy = tokens;
	assert(to_string(copy) == to_string(tokens));
	assert(*copy.begin() == *tokens.begin());
}

void test_flatten()
{
	using namespace pegvm::language;
	pegvm::grammar const G{
		normal("list", seq("[", ref("item"), rep(seq(",", ref("item"))), "]")),
		normal("item", choice(ref("list"), ref("atom"))),
		atomic("atom", rep1(range("a", "z")))
	};
	auto const result = pegvm::parse(G, "list", "[a,[b]]");
	assert(result);
	std::vector<std::string> rules;
	for (auto const& p : result.tokens().flatten())
		rules.emplace_back(p.rule());
	assert((rules == std::vector<std::string>{"list", "item", "atom", "item", "list", "item", "atom"}));
	assert(to_string(result.tokens()) == "[list@0..7 [item@1..2 [atom@1..2], item@3..6 [list@3..6 [item@4..5 [atom@4..5]]]]]");
}

void test_pairs_outlive_parser()
{
	using namespace pegvm::language;
	pegvm::grammar const G{normal("start", rep1(ref("ch"))), normal("ch", any())};
	std::string const input{"xyz"};
	pegvm::pairs chars;
	{
		pegvm::parser const p{G};
		auto const result = p.parse("start", input);
		assert(result);
		chars = (*result.tokens().begin()).inner();
	}
	assert(chars.size() == 3);
	assert(to_string(chars) == "[ch@0..1, ch@1..2, ch@2..3]");
}

int main()
try {
	test_parenthesized_sequence();
	test_nested_pairs();
	test_pairs_are_restartable();
	test_flatten();
	test_pairs_outlive_parser();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "Unknown Error\n";
	return 1;
}
