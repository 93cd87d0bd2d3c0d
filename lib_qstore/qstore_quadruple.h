#ifndef QSTORE_QUADRUPLE_H
#define QSTORE_QUADRUPLE_H


#include "qstore_types.h"


namespace qstore
{


/*
* The context given to triples merged without one.
*/
static const char* const DEFAULT_CONTEXT = "urn:qstore:default-context";


/*
* A fully bound (context, subject, predicate, object) tuple.
* Immutable: the id and flavor are derived once, on construction.
* Throws `InvalidArgument` if the context, subject or predicate
* identifier is empty.
*/
class Quadruple
{
public:
	Quadruple(IRI ctx, IRI sub, IRI pred, Term obj);

	const IRI& context() const { return m_ctx; }
	const IRI& subject() const { return m_sub; }
	const IRI& predicate() const { return m_pred; }
	const Term& object() const { return m_obj; }
	ObjectFlavor flavor() const { return m_flavor; }
	QuadrupleId id() const { return m_id; }

	inline bool operator == (const Quadruple& other) const
	{
		return m_ctx == other.m_ctx && m_sub == other.m_sub
			&& m_pred == other.m_pred && m_obj == other.m_obj;
	}
	inline bool operator != (const Quadruple& other) const { return !(*this == other); }

private:
	IRI m_ctx, m_sub, m_pred;
	Term m_obj;
	ObjectFlavor m_flavor;
	QuadrupleId m_id;
};


/*
* Human-readable form, e.g. `<ctx> <s> <p> "o"@en`.
*/
std::string to_display_string(const Quadruple& q);


}  // namespace qstore


#endif  // QSTORE_QUADRUPLE_H
