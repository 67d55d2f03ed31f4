// pegvm - Runtime interpreter for PE grammars in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <pegvm/pegvm.hpp>
#include <pegvm/iostream.hpp>

#include <array>
#include <cstdlib>
#include <string>

namespace samples::calc {

using namespace pegvm::language;

pegvm::grammar const Grammar{
	silent("whitespace", choice(" ", "\\t")),
	silent("statement", seq(soi(), choice(ref("quit"), ref("assignment"), ref("expr")), opt(ref("eol")), eoi())),
	normal("quit", choice(istr("exit"), istr("quit"))),
	normal("assignment", seq(ref("ident"), "=", ref("expr"))),
	normal("expr", seq(ref("term"), rep(seq(ref("add_op"), ref("term"))))),
	normal("term", seq(ref("factor"), rep(seq(ref("mul_op"), ref("factor"))))),
	silent("factor", choice(ref("number"), seq(ref("ident"), !str("=")), seq("(", ref("expr"), ")"))),
	normal("add_op", choice("+", "-")),
	normal("mul_op", choice("*", "/")),
	atomic("number", seq(rep1(range("0", "9")), opt(seq(".", rep1(range("0", "9")))))),
	atomic("ident", choice(range("a", "z"), range("A", "Z"))),
	silent("eol", choice("\\n", "\\r\\n", "\\r"))
};

class evaluator
{
	std::array<double, 26> variables_{};

	[[nodiscard]] static std::size_t index_of(pegvm::pair const& ident)
	{
		return static_cast<std::size_t>(pegvm::utf8::casefold(static_cast<char32_t>(ident.as_str().front())) - U'a');
	}

	[[nodiscard]] double factor(pegvm::pair const& p) const
	{
		if (p.rule() == "number")
			return std::stod(std::string{p.as_str()});
		if (p.rule() == "ident")
			return variables_[index_of(p)];
		return expr(p);
	}

	[[nodiscard]] double term(pegvm::pair const& p) const
	{
		auto it = p.inner().begin();
		auto const last = p.inner().end();
		double result = factor(*it++);
		while (it != last) {
			bool const multiply = (*it++).as_str() == "*";
			double const rhs = factor(*it++);
			result = multiply ? (result * rhs) : (result / rhs);
		}
		return result;
	}

public:
	[[nodiscard]] double expr(pegvm::pair const& p) const
	{
		auto it = p.inner().begin();
		auto const last = p.inner().end();
		double result = term(*it++);
		while (it != last) {
			bool const add = (*it++).as_str() == "+";
			double const rhs = term(*it++);
			result = add ? (result + rhs) : (result - rhs);
		}
		return result;
	}

	double assign(pegvm::pair const& p)
	{
		auto it = p.inner().begin();
		std::size_t const index = index_of(*it++);
		return variables_[index] = expr(*it);
	}
};

} // namespace samples::calc

// Command line options
struct options
{
	bool print_grammar{false};
	bool print_tokens{false};
};

// Prints usage information
void print_usage()
{
	std::cout << "Usage: calc [options]\n"
	          << "Options:\n"
	          << "  -g, --grammar     Print the grammar and exit\n"
	          << "  -t, --tokens      Print the tokens of each statement\n"
	          << "  -h, --help        Show this help\n"
	          << "Reads one statement per line from stdin.\n";
}

// Parses command line arguments
options parse_args(int argc, char* argv[])
{
	options opts;
	for (int i = 1; i < argc; ++i) {
		std::string_view const arg{argv[i]};
		if (arg == "-h" || arg == "--help") {
			print_usage();
			std::exit(EXIT_SUCCESS);
		} else if (arg == "-g" || arg == "--grammar") {
			opts.print_grammar = true;
		} else if (arg == "-t" || arg == "--tokens") {
			opts.print_tokens = true;
		} else {
			throw std::runtime_error("Unknown option: " + std::string{arg});
		}
	}
	return opts;
}

int main(int argc, char* argv[])
try {
	auto const opts = parse_args(argc, argv);
	if (opts.print_grammar) {
		for (auto const& r : samples::calc::Grammar)
			std::cout << r << "\n";
		return 0;
	}
	bool const interactive = pegvm::stdin_isatty();
	pegvm::parser const parser{samples::calc::Grammar};
	samples::calc::evaluator calc;
	std::string line;
	for (;;) {
		if (interactive)
			std::cout << "> " << std::flush;
		if (!pegvm::read_line(std::cin, line))
			break;
		if (line.find_first_not_of(" \t\r\n") == std::string::npos)
			continue;
		auto const result = parser.parse("statement", line);
		if (!result) {
			std::cerr << "SYNTAX ERROR: " << result.failure() << "\n";
			continue;
		}
		if (opts.print_tokens)
			std::cout << result.tokens() << "\n";
		pegvm::pair const statement = *result.tokens().begin();
		if (statement.rule() == "quit")
			break;
		if (statement.rule() == "assignment")
			std::cout << calc.assign(statement) << "\n";
		else
			std::cout << calc.expr(statement) << "\n";
	}
	return 0;
} catch (std::exception const& e) {
	std::cerr << "ERROR: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "UNKNOWN ERROR\n";
	return 1;
}
