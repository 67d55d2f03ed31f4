// pegvm - Runtime interpreter for PE grammars in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <pegvm/pegvm.hpp>
#include <pegvm/iostream.hpp>
#include <sstream>

#undef NDEBUG
#include <cassert>

std::string tokens_of(pegvm::grammar const& g, std::string_view input)
{
	auto const result = pegvm::parse(g, "start", input);
	if (!result)
		return "fail";
	std::ostringstream out;
	out << result.tokens();
	return out.str();
}

void test_positive_lookahead()
{
	using namespace pegvm::language;
	pegvm::grammar const G{normal("start", seq(&str("a"), any()))};
	assert(tokens_of(G, "ab") == "[start@0..1]");
	assert(tokens_of(G, "ba") == "fail");
}

void test_negative_lookahead()
{
	using namespace pegvm::language;
	pegvm::grammar const G{normal("start", seq(!str("a"), any()))};
	assert(tokens_of(G, "b") == "[start@0..1]");
	assert(tokens_of(G, "a") == "fail");
	pegvm::grammar const H{normal("start", seq(!!str("a"), any()))};
	assert(tokens_of(H, "a") == "[start@0..1]");
	assert(tokens_of(H, "b") == "fail");
}

void test_lookahead_suppresses_tokens()
{
	using namespace pegvm::language;
	pegvm::grammar const G{
		normal("start", seq(&ref("inner"), ref("letter"))),
		normal("inner", ref("letter")),
		normal("letter", range("a", "z"))
	};
	assert(tokens_of(G, "q") == "[start@0..1 [letter@0..1]]");
	pegvm::grammar const H{
		normal("start", seq(!ref("digit"), ref("letter"))),
		normal("digit", range("0", "9")),
		normal("letter", range("a", "z"))
	};
	assert(tokens_of(H, "q") == "[start@0..1 [letter@0..1]]");
	assert(tokens_of(H, "7") == "fail");
}

void test_lookahead_after_separator()
{
	using namespace pegvm::language;
	pegvm::grammar const G{
		silent("whitespace", " "),
		normal("start", seq("a", &str("b"), "b"))
	};
	assert(tokens_of(G, "a b") == "[start@0..3]");
}

void test_ordered_choice()
{
	using namespace pegvm::language;
	pegvm::grammar const G{normal("start", seq(choice("a", "ab"), eoi()))};
	assert(tokens_of(G, "a") == "[start@0..1 [eoi@1..1]]");
	assert(tokens_of(G, "ab") == "fail");
	pegvm::grammar const H{normal("start", seq(choice("ab", "a"), eoi()))};
	assert(tokens_of(H, "ab") == "[start@0..2 [eoi@2..2]]");
	assert(tokens_of(H, "a") == "[start@0..1 [eoi@1..1]]");
}

void test_failed_choice_leaves_no_tokens()
{
	using namespace pegvm::language;
	pegvm::grammar const G{
		normal("start", choice(seq(ref("x"), "z"), ref("y"))),
		normal("x", "a"),
		normal("y", "ab")
	};
	assert(tokens_of(G, "ab") == "[start@0..2 [y@0..2]]");
	assert(tokens_of(G, "az") == "[start@0..2 [x@0..1]]");
	pegvm::grammar const H{
		normal("start", choice(ref("x") > "z", ref("x") | ref("y"))),
		normal("x", "a"),
		normal("y", "b")
	};
	assert(tokens_of(H, "ab") == "[start@0..1 [x@0..1]]");
	assert(tokens_of(H, "b") == "[start@0..1 [y@0..1]]");
}

void test_optional()
{
	using namespace pegvm::language;
	pegvm::grammar const G{normal("start", seq("a", ~str("b"), "c"))};
	assert(tokens_of(G, "abc") == "[start@0..3]");
	assert(tokens_of(G, "ac") == "[start@0..2]");
	assert(tokens_of(G, "abbc") == "fail");
	pegvm::grammar const H{normal("start", opt(ref("start2"))), normal("start2", "x")};
	assert(tokens_of(H, "y") == "[start@0..0]");
}

int main()
try {
	test_positive_lookahead();
	test_negative_lookahead();
	test_lookahead_suppresses_tokens();
	test_lookahead_after_separator();
	test_ordered_choice();
	test_failed_choice_leaves_no_tokens();
	test_optional();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "Unknown Error\n";
	return 1;
}
