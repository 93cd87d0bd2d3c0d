#ifndef QSTORE_PLANNER_H
#define QSTORE_PLANNER_H


#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "qstore_query_case.h"


namespace qstore
{


enum class Column
{
	CONTEXT, SUBJECT, PREDICATE, OBJECT, FLAVOR
};


/*
* `column = value`, where `value` is a term key, or the integer
* value of an `ObjectFlavor` for the FLAVOR column.
*/
struct EqualityPredicate
{
	Column column;
	std::int64_t value;

	inline bool operator == (const EqualityPredicate& other) const
	{
		return column == other.column && value == other.value;
	}
	inline bool operator != (const EqualityPredicate& other) const { return !(*this == other); }
};


/*
* The stored index from which an executor should start a lookup.
* Executors are free to ignore it (an SQL engine makes its own
* choice); the result must not depend on it.
*/
enum class IndexType
{
	NONE,  // scan every row
	CONTEXT,
	SUBJECT,
	PREDICATE,
	OBJECT,  // (object, flavor)
	SUBJECT_PREDICATE,
	SUBJECT_OBJECT,  // (subject, object, flavor)
	PREDICATE_OBJECT  // (predicate, object, flavor)
};


/*
* The compiled form of a pattern. The conjunction holds one
* predicate per bound position, plus a FLAVOR predicate whenever
* the object is bound. It is a pure AND: its order carries no
* meaning.
*/
struct LookupDescriptor
{
	std::string label;
	IndexType index;
	std::vector<EqualityPredicate> conjunction;

	// the value the conjunction requires of `col`, if any
	std::optional<std::int64_t> value_of(Column col) const;
};


/*
* Map a pattern shape to its lookup. Every case of `QueryCase`
* has its own arm, so adding a case without planning it is a
* compile error.
*/
LookupDescriptor plan(const QueryCase& qc);


/*
* Shorthand for `plan(classify(pat))`.
*/
LookupDescriptor compile(const Pattern& pat);


/*
* Throws `AmbiguousObjectFlavor` if `lookup` constrains the object
* column without also constraining the flavor column.
* Executors call this before running a lookup they were handed.
*/
void check_lookup(const LookupDescriptor& lookup);


std::string index_type_str(IndexType type);
std::string column_str(Column col);


}  // namespace qstore


#endif  // QSTORE_PLANNER_H
