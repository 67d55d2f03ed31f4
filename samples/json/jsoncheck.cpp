// pegvm - Runtime interpreter for PE grammars in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <pegvm/pegvm.hpp>
#include <pegvm/iostream.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <string>

// Grammar for JSON Data Interchange Standard (RFC7159)
[[nodiscard]] pegvm::grammar make_json_grammar()
{
	using namespace pegvm::language;
	auto const digit = range("0", "9");
	auto const hex = choice(digit, range("a", "f"), range("A", "F"));
	return pegvm::grammar{
		silent("whitespace", choice(" ", "\\t", "\\r", "\\n")),
		silent("json", seq(soi(), ref("value"), eoi())),
		silent("value", choice(ref("object"), ref("array"), ref("string"), ref("number"), ref("boolean"), ref("null"))),
		normal("object", choice(seq("{", "}"), seq("{", ref("member"), rep(seq(",", ref("member"))), "}"))),
		normal("member", seq(ref("string"), ":", ref("value"))),
		normal("array", choice(seq("[", "]"), seq("[", ref("value"), rep(seq(",", ref("value"))), "]"))),
		normal("boolean", choice("true", "false")),
		normal("null", "null"),
		compound_atomic("string", seq("\\\"", ref("text"), "\\\"")),
		atomic("text", rep(ref("char"))),
		silent("char", choice(
			seq(!choice("\\\"", "\\\\"), range("\\u{20}", "\\u{10FFFF}")),
			seq("\\\\", choice("\\\"", "\\\\", "/", "b", "f", "n", "r", "t")),
			seq("\\\\u", rep_exact(hex, 4)))),
		atomic("number", seq(
			opt("-"),
			choice("0", seq(range("1", "9"), rep(digit))),
			opt(seq(".", rep1(digit))),
			opt(seq(istr("e"), opt(choice("+", "-")), rep1(digit)))))
	};
}

// Command line options
struct options
{
	std::string filename{"-"};
	bool quiet{false};
	bool tokens{false};
	pegvm::parse_options parse;
};

// Prints verbose output
struct verbose_cout
{
	options const& opts;

	template <typename T>
	friend verbose_cout&& operator<<(verbose_cout&& os, T&& v)
	{
		if (!os.opts.quiet)
			std::cout << std::forward<T>(v);
		return static_cast<verbose_cout&&>(os);
	}
};

// Prints usage information
void print_usage()
{
	std::cout << "Usage: jsoncheck [options] [file|-]\n"
	          << "Options:\n"
	          << "  -q, --quiet          Only set exit code\n"
	          << "  -t, --tokens         Print the matched tokens\n"
	          << "  -w, --tab-width N    Columns per tab in error locations (default 8)\n"
	          << "  -h, --help           Show this help\n"
	          << "If no file is specified, reads from stdin.\n";
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
		} else if (arg == "-q" || arg == "--quiet") {
			opts.quiet = true;
		} else if (arg == "-t" || arg == "--tokens") {
			opts.tokens = true;
		} else if (arg == "-w" || arg == "--tab-width") {
			if (++i == argc)
				throw std::runtime_error("Missing value for option: " + std::string{arg});
			auto const width = static_cast<std::uint_least32_t>(std::stoul(argv[i]));
			opts.parse.tab_width = width;
			opts.parse.tab_alignment = width;
		} else if ((arg.size() > 1) && (arg.front() == '-')) {
			throw std::runtime_error("Unknown option: " + std::string{arg});
		} else {
			opts.filename = arg;
		}
	}
	return opts;
}

int main(int argc, char* argv[])
try {
	auto const opts = parse_args(argc, argv);
	std::string const text = [&] {
		if (opts.filename == "-")
			return pegvm::read_source(std::cin);
		std::ifstream input_file;
		input_file.open(opts.filename);
		if (!input_file.is_open())
			throw std::runtime_error("Failed to open file: " + opts.filename);
		return pegvm::read_source(input_file);
	}();
	pegvm::grammar const grammar = make_json_grammar();
	auto const result = pegvm::parse(grammar, "json", text, opts.parse);
	if (!result) {
		verbose_cout{opts} << "Invalid JSON\n" << opts.filename << ':' << result.failure() << "\n";
		return 1;
	}
	if (opts.tokens)
		verbose_cout{opts} << result.tokens() << "\n";
	verbose_cout{opts} << "Valid JSON\n";
	return 0;
} catch (std::exception const& e) {
	std::cerr << "ERROR: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "UNKNOWN ERROR\n";
	return 1;
}
