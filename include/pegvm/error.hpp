// pegvm - Runtime interpreter for PE grammars in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PEGVM_INCLUDE_PEGVM_ERROR_HPP
#define PEGVM_INCLUDE_PEGVM_ERROR_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace pegvm {

class pegvm_error : public std::runtime_error { using std::runtime_error::runtime_error; };
class call_depth_error : public pegvm_error { public: call_depth_error() : pegvm_error{"rule call depth exceeds configured limit"} {} };
class undefined_rule_error : public pegvm_error { public: explicit undefined_rule_error(std::string_view name) : pegvm_error{"undefined rule " + std::string{name}} {} };
class empty_stack_error : public pegvm_error { public: explicit empty_stack_error(std::string_view op) : pegvm_error{std::string{op} + " was called on empty stack"} {} };
class bad_grammar : public pegvm_error { public: explicit bad_grammar(std::string const& s = "invalid or empty grammar") : pegvm_error{s} {} };
class duplicate_rule_error : public bad_grammar { public: explicit duplicate_rule_error(std::string_view name) : bad_grammar{"duplicate rule " + std::string{name}} {} };
class reserved_rule_error : public bad_grammar { public: explicit reserved_rule_error(std::string_view name) : bad_grammar{"rule name " + std::string{name} + " is reserved"} {} };
class bad_string_literal : public pegvm_error { public: explicit bad_string_literal(std::string const& s = "incorrect string literal") : pegvm_error{s} {} };
class bad_character_literal : public bad_string_literal { public: bad_character_literal() : bad_string_literal{"incorrect char literal"} {} };
class bad_character_range : public bad_string_literal { public: bad_character_range() : bad_string_literal{"character range is reversed"} {} };
class bad_repetition : public pegvm_error { public: bad_repetition() : pegvm_error{"repetition minimum exceeds maximum"} {} };

} // namespace pegvm

#endif
