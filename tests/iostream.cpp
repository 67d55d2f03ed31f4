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

void test_print_expressions()
{
	using namespace pegvm::language;
	assert(to_string(str("a\\n")) == "\"a\\n\"");
	assert(to_string(istr("ab")) == "^\"ab\"");
	assert(to_string(range("a", "z")) == "'a'..'z'");
	assert(to_string(ref("value")) == "value");
	assert(to_string(seq("a", choice(ref("b"), ref("c")))) == "\"a\" ~ (b | c)");
	assert(to_string(choice(seq(ref("a"), ref("b")), ref("c"))) == "a ~ b | c");
	assert(to_string(*seq("a", ref("b"))) == "(\"a\" ~ b)*");
	assert(to_string(+ref("x")) == "x+");
	assert(to_string(~ref("x")) == "x?");
	assert(to_string(&ref("x")) == "&x");
	assert(to_string(!ref("x")) == "!x");
	assert(to_string(!*ref("x")) == "!x*");
	assert(to_string(rep_exact(ref("x"), 3)) == "x{3}");
	assert(to_string(rep_min(ref("x"), 2)) == "x{2, }");
	assert(to_string(rep_max(ref("x"), 4)) == "x{, 4}");
	assert(to_string(rep_min_max(ref("x"), 2, 4)) == "x{2, 4}");
	assert(to_string(push(seq(ref("a"), ref("b")))) == "push(a ~ b)");
	assert(to_string(skip_to({"a", "b"})) == "(!(\"a\" | \"b\") ~ any)*");
	assert(to_string(seq(soi(), peek(), pop(), eoi())) == "soi ~ peek ~ pop ~ eoi");
}

void test_print_rules()
{
	using namespace pegvm::language;
	assert(to_string(normal("a", "x")) == "a = { \"x\" }");
	assert(to_string(silent("a", "x")) == "a = _{ \"x\" }");
	assert(to_string(atomic("a", "x")) == "a = @{ \"x\" }");
	assert(to_string(compound_atomic("a", "x")) == "a = ${ \"x\" }");
	assert(to_string(non_atomic("a", "x")) == "a = !{ \"x\" }");
}

void test_print_pairs()
{
	using namespace pegvm::language;
	pegvm::grammar const G{
		silent("whitespace", " "),
		normal("sum", seq(ref("num"), rep(seq("+", ref("num"))))),
		atomic("num", rep1(range("0", "9")))
	};
	auto const result = pegvm::parse(G, "sum", "12 + 3");
	assert(result);
	assert(to_string(result.tokens()) == "[sum@0..6 [num@0..2, num@5..6]]");
	pegvm::pair const sum = *result.tokens().begin();
	assert(to_string(sum) == "sum@0..6 [num@0..2, num@5..6]");
	assert(to_string(sum.as_span()) == "12 + 3");
	assert(to_string(sum.inner()) == "[num@0..2, num@5..6]");
	assert(to_string(*sum.inner().begin()) == "num@0..2");
}

void test_print_failure()
{
	pegvm::parse_failure failure;
	failure.location = {3, 7};
	assert(to_string(failure) == "3:7: unknown parsing error");
	failure.positives = {"a", "b"};
	assert(to_string(failure) == "3:7: expected a or b");
	failure.negatives = {"c"};
	assert(to_string(failure) == "3:7: expected a or b, unexpected c");
	failure.positives.clear();
	failure.negatives = {"c", "d", "e"};
	assert(to_string(failure) == "3:7: unexpected c, d, or e");
}

void test_read_source()
{
	std::istringstream input{"first\nsecond\n"};
	assert(pegvm::read_source(input) == "first\nsecond\n");
	assert(input.eof());

	std::istringstream lines{"one\ntwo"};
	std::string line;
	assert(pegvm::read_line(lines, line));
	assert(line == "one\n");
	assert(pegvm::read_line(lines, line));
	assert(line == "two");
	assert(!pegvm::read_line(lines, line));
	assert(line.empty());
}

void test_parse_stream()
{
	using namespace pegvm::language;
	pegvm::grammar const G{normal("start", seq(rep1(range("a", "z")), "\\n", eoi()))};
	std::istringstream input{"hello\n"};
	std::string const text = pegvm::read_source(input);
	auto const result = pegvm::parse(G, "start", text);
	assert(result);
	assert(to_string(result.tokens()) == "[start@0..6 [eoi@6..6]]");
}

int main()
try {
	test_print_expressions();
	test_print_rules();
	test_print_pairs();
	test_print_failure();
	test_read_source();
	test_parse_stream();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "Unknown Error\n";
	return 1;
}
