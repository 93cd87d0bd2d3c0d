#include "qstore_pattern.h"
#include "qstore_errors.h"
#include "qstore_assert.h"


namespace qstore
{


Pattern Pattern::matching(const Quadruple& q)
{
	return Pattern{ q.context(), q.subject(), q.predicate(), q.object() };
}


ObjectFlavor Pattern::flavor() const
{
	QSTORE_CHECK_PRECOND(obj.has_value());
	return flavor_of(*obj);
}


bool pattern_matches(const Pattern& pat, const Quadruple& q)
{
	return pattern_matches(pat.ctx, q.context()) &&
		pattern_matches(pat.sub, q.subject()) &&
		pattern_matches(pat.pred, q.predicate()) &&
		pattern_matches(pat.obj, q.object());
}


Quadruple to_quadruple(const Pattern& pat)
{
	if (!pat.ctx)
		throw InvalidArgument("context is not bound");
	if (!pat.sub)
		throw InvalidArgument("subject is not bound");
	if (!pat.pred)
		throw InvalidArgument("predicate is not bound");
	if (!pat.obj)
		throw InvalidArgument("object is not bound");

	return Quadruple(*pat.ctx, *pat.sub, *pat.pred, *pat.obj);
}


}  // namespace qstore
