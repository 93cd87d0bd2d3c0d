#ifndef QSTORE_PATTERN_H
#define QSTORE_PATTERN_H


#include <optional>
#include "qstore_types.h"
#include "qstore_quadruple.h"


namespace qstore
{


/*
* A partially bound quadruple. Unbound positions are wildcards.
* The object is a `Term`, so it is bound either as a resource or
* as a literal, never as both.
*/
struct Pattern
{
	std::optional<IRI> ctx, sub, pred;
	std::optional<Term> obj;

	// the pattern binding every position of `q`
	static Pattern matching(const Quadruple& q);

	// pre: `obj` is bound
	ObjectFlavor flavor() const;

	bool empty() const { return !ctx && !sub && !pred && !obj; }

	inline bool operator == (const Pattern& other) const
	{
		return ctx == other.ctx && sub == other.sub
			&& pred == other.pred && obj == other.obj;
	}
	inline bool operator != (const Pattern& other) const { return !(*this == other); }
};


/*
* These functions return true iff every bound position of the
* left argument equals the corresponding value on the right.
* Terms of different kinds are never equal.
*/
template<typename T>
bool pattern_matches(const std::optional<T>& t, const T& r)
{
	return !t || *t == r;
}
bool pattern_matches(const Pattern& pat, const Quadruple& q);


/*
* Turn a pattern into a quadruple, if it binds every position.
* Throws `InvalidArgument` naming the first unbound position
* otherwise.
*/
Quadruple to_quadruple(const Pattern& pat);


}  // namespace qstore


#endif  // QSTORE_PATTERN_H
