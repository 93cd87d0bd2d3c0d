#include <sstream>
#include "qstore_command.h"
#include "qstore_parse_helper.h"
#include "qstore_errors.h"


namespace qstore
{


namespace
{


const char* const POSITION_NAMES[] = { "context", "subject", "predicate", "object" };


/*
* Reads the four terms of a pattern. The first three must be IRIs
* or variables; the object may be any term or a variable.
* Returns the error message on failure.
*/
std::variant<std::string, Pattern> read_pattern(std::istream& in)
{
	Pattern pat;
	std::optional<IRI>* const iri_positions[] = { &pat.ctx, &pat.sub, &pat.pred };

	for (size_t i = 0; i < 4; ++i)
	{
		auto maybe_term = parse_pattern_term(in);
		if (!maybe_term)
			return std::string("Bad ") + POSITION_NAMES[i] + '.';

		if (std::holds_alternative<Variable>(*maybe_term))
			continue;

		Term& t = std::get<Term>(*maybe_term);
		if (i == 3)
		{
			pat.obj = std::move(t);
		}
		else if (std::holds_alternative<IRI>(t))
		{
			*iri_positions[i] = std::move(std::get<IRI>(t));
		}
		else
		{
			return std::string("The ") + POSITION_NAMES[i] + " must be an IRI, not a literal.";
		}
	}

	return pat;
}


/*
* As `read_pattern`, but every position must be bound.
*/
std::variant<std::string, Quadruple> read_quadruple(std::istream& in)
{
	auto result = read_pattern(in);
	if (auto* err = std::get_if<std::string>(&result))
		return *err;

	try
	{
		return to_quadruple(std::get<Pattern>(result));
	}
	catch (const InvalidArgument& e)
	{
		return std::string(e.what());
	}
}


}  // namespace


AnyCommand parse_command(std::istream& in)
{
	if (!in)
		return EmptyCommand();

	std::string first_word;
	in >> first_word;

	if (first_word.empty())
		return EmptyCommand();

	if (first_word == "QUIT")
		return QuitCommand();
	if (first_word == "CLEAR")
		return ClearCommand();
	if (first_word == "SIZE")
		return SizeCommand();
	if (first_word == "OPTIMIZE")
		return OptimizeCommand();

	if (first_word == "LOAD")
	{
		LoadCommand lc;
		in >> lc.filename;
		if (lc.filename.empty())
			return BadCommand("Missing filename after LOAD.");

		// an optional context, on the same line
		while (in.peek() == ' ' || in.peek() == '\t')
			in.get();
		if (in.peek() == '<')
		{
			lc.context = parse_iri(in);
			if (!lc.context)
				return BadCommand("Bad context after LOAD filename.");
		}
		return lc;
	}

	if (first_word == "ADD" || first_word == "REMOVE" || first_word == "CONTAINS")
	{
		auto result = read_quadruple(in);
		if (auto* err = std::get_if<std::string>(&result))
			return BadCommand(first_word + ": " + *err);

		Quadruple& q = std::get<Quadruple>(result);
		if (first_word == "ADD")
			return AddCommand{ std::move(q) };
		else if (first_word == "REMOVE")
			return RemoveCommand{ std::move(q) };
		else
			return ContainsCommand{ std::move(q) };
	}

	if (first_word == "SELECT" || first_word == "COUNT" || first_word == "DELETE")
	{
		auto result = read_pattern(in);
		if (auto* err = std::get_if<std::string>(&result))
			return BadCommand(first_word + ": " + *err);

		Pattern& pat = std::get<Pattern>(result);
		if (first_word == "SELECT")
			return SelectCommand{ std::move(pat) };
		else if (first_word == "COUNT")
			return CountCommand{ std::move(pat) };

		if (pat.empty())
			return BadCommand("DELETE needs at least one bound term. Use CLEAR to delete everything.");
		return DeleteCommand{ std::move(pat) };
	}

	return BadCommand("Invalid command: " + first_word
		+ ", must be ADD/REMOVE/CONTAINS/SELECT/COUNT/DELETE/LOAD/CLEAR/SIZE/OPTIMIZE/QUIT.");
}


}  // namespace qstore
