#ifndef QSTORE_PARSE_HELPER_H
#define QSTORE_PARSE_HELPER_H


#include <istream>
#include <optional>
#include <variant>
#include "qstore_types.h"


namespace qstore
{


/*
* A named wildcard in a command, e.g. `?x`. The name is only
* for readability: distinct variables are not joined.
*/
struct Variable
{
	std::string name;

	inline bool operator == (const Variable& other) const { return name == other.name; }
	inline bool operator != (const Variable& other) const { return name != other.name; }
};


typedef std::variant<Variable, Term> PatternTerm;


/*
* Skips all current whitespace in the stream `in`,
* and outputs the first non-whitespace character
* to `out_c` if it exists (and returns true), or
* returns false if EOF happened earlier. In either
* case, `out_c` has the possibility of being modified.
*/
bool next_nonws_char(char& out_c, std::istream& in);


/*
* Try to parse `<iri>` from the given input stream.
* Consumes whitespace beforehand but not afterwards.
* Returns std::nullopt on bad syntax.
*/
std::optional<IRI> parse_iri(std::istream& in);


/*
* Try to parse a term: either `<iri>`, or a literal `"value"`
* optionally followed by `@lang` or `^^<datatype>`. Inside a
* literal, `\"`, `\\`, `\n`, `\r` and `\t` are unescaped.
* Consumes whitespace beforehand but not afterwards.
* Returns std::nullopt on bad syntax.
*/
std::optional<Term> parse_term(std::istream& in);


/*
* As `parse_term`, but also accepts a `?name` variable.
*/
std::optional<PatternTerm> parse_pattern_term(std::istream& in);


}  // namespace qstore


#endif  // QSTORE_PARSE_HELPER_H
