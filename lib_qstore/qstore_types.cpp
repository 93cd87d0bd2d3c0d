#include "qstore_types.h"
#include "qstore_errors.h"


namespace qstore
{


namespace
{


// the characters which delimit the parts of a literal's string form
bool is_special(char c)
{
	return c == '\\' || c == '@' || c == '^';
}


void append_escaped(std::string& out, const std::string& str)
{
	for (const char c : str)
	{
		if (is_special(c))
			out += '\\';
		out += c;
	}
}


/*
* Reads an escaped part of `str` from `pos` up to the first
* unescaped special character (or the end), leaving `pos` there.
*/
std::string read_escaped(const std::string& str, size_t& pos)
{
	std::string out;
	while (pos < str.size() && str[pos] != '@' && str[pos] != '^')
	{
		if (str[pos] == '\\')
		{
			++pos;
			if (pos == str.size() || !is_special(str[pos]))
				throw InvalidArgument("malformed escape in literal '" + str + "'");
		}
		out += str[pos++];
	}
	return out;
}


}  // namespace


std::string string_form(const IRI& r)
{
	return r.val;
}


std::string string_form(const Literal& l)
{
	std::string str;
	append_escaped(str, l.val);
	if (l.lang)
	{
		str += '@';
		append_escaped(str, *l.lang);
	}
	if (l.datatype)
		str += "^^" + *l.datatype;
	return str;
}


std::string string_form(const Term& t)
{
	return std::visit([](const auto& x) { return string_form(x); }, t);
}


ObjectFlavor flavor_of(const Term& t)
{
	return std::holds_alternative<IRI>(t) ? ObjectFlavor::RESOURCE : ObjectFlavor::LITERAL;
}


ObjectFlavor flavor_from_int(std::int64_t value)
{
	switch (value)
	{
	case static_cast<std::int64_t>(ObjectFlavor::RESOURCE):
		return ObjectFlavor::RESOURCE;
	case static_cast<std::int64_t>(ObjectFlavor::LITERAL):
		return ObjectFlavor::LITERAL;
	default:
		throw AmbiguousObjectFlavor("unknown stored flavor value " + std::to_string(value));
	}
}


Literal parse_literal(const std::string& str)
{
	Literal l;
	size_t pos = 0;

	l.val = read_escaped(str, pos);

	if (pos < str.size() && str[pos] == '@')
	{
		++pos;
		l.lang = read_escaped(str, pos);
	}

	if (pos < str.size())
	{
		// only a datatype can follow
		if (str.compare(pos, 2, "^^") != 0)
			throw InvalidArgument("malformed literal '" + str + "'");
		l.datatype = str.substr(pos + 2);
	}

	return l;
}


Term term_from_string(ObjectFlavor flavor, const std::string& str)
{
	switch (flavor)
	{
	case ObjectFlavor::RESOURCE:
		return IRI{ str };
	case ObjectFlavor::LITERAL:
		return parse_literal(str);
	}
	throw AmbiguousObjectFlavor("cannot rebuild object '" + str + "'");
}


}  // namespace qstore
