#ifndef QSTORE_TYPES_H
#define QSTORE_TYPES_H


#include <string>
#include <variant>
#include <optional>
#include <cstdint>


namespace qstore
{


struct IRI
{
	std::string val;

	inline bool operator == (const IRI& other) const { return val == other.val; }
	inline bool operator != (const IRI& other) const { return val != other.val; }
	inline bool operator < (const IRI& other) const { return val < other.val; }
};


/*
* A literal value with an optional language tag and an optional
* datatype (the datatype is the identifier of an IRI, stored
* without angle brackets).
* Literals compare by all three fields, exactly.
*/
struct Literal
{
	std::string val;
	std::optional<std::string> lang;
	std::optional<std::string> datatype;

	inline bool operator == (const Literal& other) const
	{
		return val == other.val && lang == other.lang && datatype == other.datatype;
	}
	inline bool operator != (const Literal& other) const { return !(*this == other); }
	inline bool operator < (const Literal& other) const
	{
		if (val != other.val)
			return val < other.val;
		if (lang != other.lang)
			return lang < other.lang;
		return datatype < other.datatype;
	}
};


/*
* A term is either a resource (IRI) or a literal. Which one
* is given by the variant index, never by inspecting the text.
*/
typedef std::variant<IRI, Literal> Term;


/*
* Discriminant stored alongside every object. The integer
* values are written to persistent stores and must not change.
*/
enum class ObjectFlavor
{
	RESOURCE = 1,
	LITERAL = 2
};


typedef std::int64_t QuadrupleId;
typedef std::int64_t TermKey;


/*
* The string form of a term, used for hashing and for storage:
* an IRI is its identifier, a literal is its value followed by
* `@lang` and/or `^^datatype` when present. Backslash, `@` and `^`
* are escaped with a backslash in the value and the language, so
* distinct literals always have distinct string forms.
* Note that an IRI and a literal may share a string form.
*/
std::string string_form(const IRI& r);
std::string string_form(const Literal& l);
std::string string_form(const Term& t);


ObjectFlavor flavor_of(const Term& t);


/*
* Convert a stored flavor value back into the enum.
* Throws `AmbiguousObjectFlavor` for anything other than the
* two known values.
*/
ObjectFlavor flavor_from_int(std::int64_t value);


/*
* Rebuild a literal from its string form; the exact inverse of
* `string_form(const Literal&)`.
* Throws `InvalidArgument` if `str` is not such a string form.
*/
Literal parse_literal(const std::string& str);


/*
* Rebuild a term from its string form, given the flavor which
* was stored alongside it.
*/
Term term_from_string(ObjectFlavor flavor, const std::string& str);


// works on IRIs, Literals or Terms, via calling or via std::visit
struct QStoreToStringVisitor
{
	std::string operator()(const Literal& l)
	{
		std::string str = '"' + l.val + '"';
		if (l.lang)
			str += '@' + *l.lang;
		if (l.datatype)
			str += "^^<" + *l.datatype + '>';
		return str;
	}
	std::string operator()(const IRI& r)
	{
		return '<' + r.val + '>';
	}
	std::string operator()(const Term& t)
	{
		return std::visit(*this, t);
	}
};


}  // namespace qstore


/*
* implementation of standard hash functions of the above structs,
* so they can be used as keys of hash maps etc
*/
namespace std
{


template <>
struct hash<qstore::IRI>
{
	std::size_t operator()(const qstore::IRI& k) const
	{
		return std::hash<std::string>()(k.val);
	}
};


template <>
struct hash<qstore::Literal>
{
	std::size_t operator()(const qstore::Literal& k) const
	{
		return (std::hash<std::string>()(k.val) * 37
			+ std::hash<std::optional<std::string>>()(k.lang)) * 37
			+ std::hash<std::optional<std::string>>()(k.datatype);
	}
};


}  // namespace std


#endif  // QSTORE_TYPES_H
