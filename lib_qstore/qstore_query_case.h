#ifndef QSTORE_QUERY_CASE_H
#define QSTORE_QUERY_CASE_H


#include <string>
#include <variant>
#include "qstore_types.h"
#include "qstore_pattern.h"


namespace qstore
{


/*
* The key of a bound object. The flavor always travels with the
* key, because term keys are computed from string forms alone and
* a resource and a literal may share one.
*/
struct ObjectKey
{
	TermKey key;
	ObjectFlavor flavor;

	inline bool operator == (const ObjectKey& other) const
	{
		return key == other.key && flavor == other.flavor;
	}
	inline bool operator != (const ObjectKey& other) const { return !(*this == other); }
};


/*
* One struct per shape of pattern, named by the positions it
* binds (C = context, S = subject, P = predicate, O = object).
* Each holds exactly the keys of its bound positions.
*/
namespace cases
{


struct AnyQuadruple {};
struct ByC { TermKey ctx; };
struct ByS { TermKey sub; };
struct ByP { TermKey pred; };
struct ByO { ObjectKey obj; };
struct ByCS { TermKey ctx, sub; };
struct ByCP { TermKey ctx, pred; };
struct ByCO { TermKey ctx; ObjectKey obj; };
struct BySP { TermKey sub, pred; };
struct BySO { TermKey sub; ObjectKey obj; };
struct ByPO { TermKey pred; ObjectKey obj; };
struct ByCSP { TermKey ctx, sub, pred; };
struct ByCSO { TermKey ctx, sub; ObjectKey obj; };
struct ByCPO { TermKey ctx, pred; ObjectKey obj; };
struct BySPO { TermKey sub, pred; ObjectKey obj; };
struct ByCSPO { TermKey ctx, sub, pred; ObjectKey obj; };


}  // namespace cases


typedef std::variant<
	cases::AnyQuadruple,
	cases::ByC, cases::ByS, cases::ByP, cases::ByO,
	cases::ByCS, cases::ByCP, cases::ByCO,
	cases::BySP, cases::BySO, cases::ByPO,
	cases::ByCSP, cases::ByCSO, cases::ByCPO, cases::BySPO,
	cases::ByCSPO
> QueryCase;


/*
* Encode the bound terms of `pat` into keys and pick its case.
*/
QueryCase classify(const Pattern& pat);


/*
* The case's flag letters in the fixed order C, S, P, then O for
* a resource object or L for a literal object. `AnyQuadruple`
* gives the empty string.
*/
std::string case_label(const QueryCase& qc);


}  // namespace qstore


#endif  // QSTORE_QUERY_CASE_H
