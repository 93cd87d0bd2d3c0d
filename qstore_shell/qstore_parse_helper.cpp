#include <cctype>
#include <string>
#include "qstore_parse_helper.h"


namespace qstore
{


namespace
{


/*
* Reads up to and including `end_char`, into `out`.
* Returns false if the stream ended first.
*/
bool read_until(std::istream& in, char end_char, std::string& out)
{
	out.clear();
	int c;
	while ((c = in.get()) != std::char_traits<char>::eof())
	{
		if (c == end_char)
			return true;
		out.push_back(static_cast<char>(c));
	}
	return false;
}


// the body of a literal, after its opening quote
bool read_literal_body(std::istream& in, std::string& out)
{
	out.clear();
	int c;
	while ((c = in.get()) != std::char_traits<char>::eof())
	{
		if (c == '"')
			return true;

		if (c == '\\')
		{
			c = in.get();
			switch (c)
			{
			case 'n': out.push_back('\n'); break;
			case 'r': out.push_back('\r'); break;
			case 't': out.push_back('\t'); break;
			case '"': out.push_back('"'); break;
			case '\\': out.push_back('\\'); break;
			default:
				return false;  // unknown escape, or EOF
			}
		}
		else
			out.push_back(static_cast<char>(c));
	}
	return false;
}


}  // namespace


bool next_nonws_char(char& out_c, std::istream& in)
{
	int c;
	while (std::isspace(c = in.get()));
	out_c = static_cast<char>(c);
	return (c != std::char_traits<char>::eof());
}


std::optional<IRI> parse_iri(std::istream& in)
{
	char start_char;
	if (!next_nonws_char(start_char, in) || start_char != '<')
		return std::nullopt;

	IRI r;
	if (!read_until(in, '>', r.val))
		return std::nullopt;

	return r;
}


std::optional<Term> parse_term(std::istream& in)
{
	char start_char;
	if (!next_nonws_char(start_char, in))
		return std::nullopt;

	if (start_char == '<')
	{
		in.unget();
		return parse_iri(in);
	}

	if (start_char != '"')
		return std::nullopt;

	Literal l;
	if (!read_literal_body(in, l.val))
		return std::nullopt;

	// optional suffix, which must follow the quote immediately
	if (in.peek() == '@')
	{
		in.get();
		std::string tag;
		while (std::isalnum(in.peek()) || in.peek() == '-')
			tag.push_back(static_cast<char>(in.get()));
		if (tag.empty())
			return std::nullopt;
		l.lang = std::move(tag);
	}
	else if (in.peek() == '^')
	{
		in.get();
		if (in.get() != '^')
			return std::nullopt;
		auto dt = parse_iri(in);
		if (!dt)
			return std::nullopt;
		l.datatype = std::move(dt->val);
	}

	return l;
}


std::optional<PatternTerm> parse_pattern_term(std::istream& in)
{
	// this loop is similar to `next_nonws_char`, except
	// that it doesn't read the last char
	while (std::isspace(in.peek()))
		in.get();

	if (in.peek() == std::char_traits<char>::eof())
		return std::nullopt;

	if (in.peek() == '?')
	{
		std::string var_name;
		in >> var_name;
		return PatternTerm(Variable{ var_name });
	}

	auto maybe_term = parse_term(in);
	if (!maybe_term)
		return std::nullopt;
	return PatternTerm(std::move(*maybe_term));
}


}  // namespace qstore
