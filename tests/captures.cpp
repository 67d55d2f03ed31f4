// pegvm - Runtime interpreter for PE grammars in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <pegvm/pegvm.hpp>
#include <iostream>

#undef NDEBUG
#include <cassert>

void test_push_and_peek()
{
	using namespace pegvm::language;
	pegvm::grammar const G{normal("start", seq(push("ab"), peek(), eoi()))};
	assert(pegvm::parse(G, "start", "abab"));
	assert(!pegvm::parse(G, "start", "abba"));
	assert(!pegvm::parse(G, "start", "ab"));
}

void test_peek_does_not_pop()
{
	using namespace pegvm::language;
	pegvm::grammar const G{normal("start", seq(push("ab"), peek(), peek(), pop(), eoi()))};
	assert(pegvm::parse(G, "start", "abababab"));
	assert(!pegvm::parse(G, "start", "ababab"));
}

void test_pop_then_peek_on_empty_stack()
{
	using namespace pegvm::language;
	pegvm::grammar const G{normal("start", seq(push("ab"), pop(), peek()))};
	bool thrown = false;
	try {
		(void)pegvm::parse(G, "start", "ababab");
	} catch (pegvm::empty_stack_error const& e) {
		thrown = true;
		assert(std::string_view{e.what()} == "peek was called on empty stack");
	}
	assert(thrown);

	pegvm::grammar const H{normal("start", pop())};
	thrown = false;
	try {
		(void)pegvm::parse(H, "start", "x");
	} catch (pegvm::empty_stack_error const& e) {
		thrown = true;
		assert(std::string_view{e.what()} == "pop was called on empty stack");
	}
	assert(thrown);
}

void test_failed_pop_keeps_entry()
{
	using namespace pegvm::language;
	pegvm::grammar const G{normal("start", seq(push("a"), choice(seq(pop(), "x"), "b"), pop(), eoi()))};
	assert(pegvm::parse(G, "start", "aba"));
	pegvm::grammar const H{normal("start", seq(push("a"), choice(seq(pop(), "x"), "ab"), pop(), eoi()))};
	assert(pegvm::parse(H, "start", "aaba"));
}

void test_nested_delimiters()
{
	using namespace pegvm::language;
	pegvm::grammar const G{
		silent("start", seq(ref("raw"), eoi())),
		atomic("raw", seq("r", push(rep("#")), "\"", ref("body"), "\"", pop())),
		silent("body", rep(seq(!seq("\"", peek()), any())))
	};
	assert(pegvm::parse(G, "start", "r##\"a\"#b\"##"));
	assert(pegvm::parse(G, "start", "r\"abc\""));
	assert(!pegvm::parse(G, "start", "r##\"a\"#"));
}

void test_capture_with_multibyte_text()
{
	using namespace pegvm::language;
	pegvm::grammar const G{normal("start", seq(push(rep1(range("\\u{3b1}", "\\u{3c9}"))), "-", pop(), eoi()))};
	assert(pegvm::parse(G, "start", "\xce\xbb\xce\xbc-\xce\xbb\xce\xbc"));
	assert(!pegvm::parse(G, "start", "\xce\xbb\xce\xbc-\xce\xbb"));
}

void test_lookahead_discards_captures()
{
	using namespace pegvm::language;
	pegvm::grammar const G{normal("start", seq(push("z"), &push("a"), "a", peek()))};
	assert(pegvm::parse(G, "start", "zaz"));
	assert(!pegvm::parse(G, "start", "zaa"));
}

int main()
try {
	test_push_and_peek();
	test_peek_does_not_pop();
	test_pop_then_peek_on_empty_stack();
	test_failed_pop_keeps_entry();
	test_nested_delimiters();
	test_capture_with_multibyte_text();
	test_lookahead_discards_captures();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "Unknown Error\n";
	return 1;
}
