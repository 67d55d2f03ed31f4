// pegvm - Runtime interpreter for PE grammars in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <pegvm/pegvm.hpp>
#include <pegvm/iostream.hpp>
#include <sstream>

#undef NDEBUG
#include <cassert>

// Matches the whole input against a single expression
bool match_all(pegvm::expr const& e, std::string_view input)
{
	using namespace pegvm::language;
	pegvm::grammar const G{silent("start", seq(e, eoi()))};
	return pegvm::parse(G, "start", input).succeeded();
}

void test_literal()
{
	using namespace pegvm::language;
	assert(match_all(str("abc"), "abc"));
	assert(!match_all(str("abc"), "abd"));
	assert(!match_all(str("abc"), "ab"));
	assert(!match_all(str("abc"), "abcd"));
	assert(match_all(str(""), ""));
	assert(match_all("a\\tb", "a\tb"));
	assert(match_all(str("\\u{e9}t\\u{e9}"), "\xc3\xa9t\xc3\xa9"));
	assert(!match_all(str("abc"), "ABC"));
}

void test_literal_insensitive()
{
	using namespace pegvm::language;
	assert(match_all(istr("hello"), "HeLLo"));
	assert(match_all(istr("HELLO"), "hello"));
	assert(!match_all(istr("hello"), "help!"));
	assert(match_all(istr("\\u{e9}t\\u{e9}"), "\xc3\x89T\xc3\x89"));
	assert(match_all(istr("\xce\xbb"), "\xce\x9b"));
}

void test_char_range()
{
	using namespace pegvm::language;
	assert(match_all(range("a", "z"), "q"));
	assert(match_all(range("a", "z"), "a"));
	assert(match_all(range("a", "z"), "z"));
	assert(!match_all(range("a", "z"), "Q"));
	assert(!match_all(range("a", "z"), ""));
	assert(match_all(range("\\u{3b1}", "\\u{3c9}"), "\xce\xbb"));
	assert(!match_all(range("\\u{3b1}", "\\u{3c9}"), "a"));
	assert(match_all(range("0", "9"), "7"));
}

void test_any()
{
	using namespace pegvm::language;
	assert(match_all(any(), "x"));
	assert(match_all(any(), "\xc3\xa9"));
	assert(match_all(any(), "\xf0\x9f\x98\x80"));
	assert(!match_all(any(), ""));
	assert(!match_all(any(), "xy"));
	assert(match_all(seq(any(), any()), "xy"));
}

void test_input_boundaries()
{
	using namespace pegvm::language;
	assert(match_all(seq(soi(), "a"), "a"));
	assert(!match_all(seq("a", soi()), "a"));
	assert(match_all(eoi(), ""));
	pegvm::grammar const G{normal("start", seq("a", eoi()))};
	auto const result = pegvm::parse(G, "start", "a");
	assert(result);
	std::ostringstream out;
	out << result.tokens();
	assert(out.str() == "[start@0..1 [eoi@1..1]]");
	assert(!pegvm::parse(G, "start", "ab"));
}

void test_scan_to_any()
{
	using namespace pegvm::language;
	pegvm::grammar const G{
		silent("start", seq(skip_to({"b", "c"}), ref("tail"))),
		normal("tail", seq(any(), rep(any())))
	};
	auto const result = pegvm::parse(G, "start", "aaacbb");
	assert(result);
	auto const tail = *result.tokens().begin();
	assert(tail.rule() == "tail");
	assert(tail.start() == 3);
	assert(tail.as_str() == "cbb");
	assert(!pegvm::parse(G, "start", "aaaa"));
	assert(match_all(seq(skip_to({"\\n"}), "\\n"), "abc\n"));
	assert(match_all(seq(skip_to({"x"}), "x"), "x"));
}

int main()
try {
	test_literal();
	test_literal_insensitive();
	test_char_range();
	test_any();
	test_input_boundaries();
	test_scan_to_any();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "Unknown Error\n";
	return 1;
}
