#ifndef QSTORE_TEST_HELPERS_H
#define QSTORE_TEST_HELPERS_H


#include <vector>
#include <string>
#include "qstore_quadruple.h"
#include "qstore_quadruple_set.h"
#include "qstore_pattern.h"
#include "qstore_executor.h"


namespace qstore
{
namespace test
{


/*
* Every combination of two contexts, two subjects, two predicates
* and three objects, where two of the objects are a resource and
* a literal with the same text.
*/
inline std::vector<Quadruple> sample_quadruples()
{
    const IRI ctxs[] = { IRI{ "ex:c1" }, IRI{ "ex:c2" } };
    const IRI subs[] = { IRI{ "ex:s1" }, IRI{ "ex:s2" } };
    const IRI preds[] = { IRI{ "ex:p1" }, IRI{ "ex:p2" } };
    const Term objs[] = { IRI{ "ex:o1" }, Literal{ "ex:o1" }, Literal{ "two", std::string("en") } };

    std::vector<Quadruple> result;
    for (const auto& c : ctxs)
        for (const auto& s : subs)
            for (const auto& p : preds)
                for (const auto& o : objs)
                    result.emplace_back(c, s, p, o);
    return result;
}


/*
* Every non-empty pattern shape, in both object flavors where the
* object is bound, with values drawn from `q`.
*/
inline std::vector<Pattern> patterns_around(const Quadruple& q)
{
    std::vector<Pattern> result;
    for (int mask = 1; mask < 16; ++mask)
    {
        Pattern pat;
        if (mask & 1)
            pat.ctx = q.context();
        if (mask & 2)
            pat.sub = q.subject();
        if (mask & 4)
            pat.pred = q.predicate();
        if (mask & 8)
        {
            pat.obj = q.object();
            result.push_back(pat);

            // the same text, as the other kind
            const std::string text = string_form(q.object());
            if (std::holds_alternative<IRI>(q.object()))
                pat.obj = Term(Literal{ text });
            else
                pat.obj = Term(IRI{ text });
        }
        result.push_back(pat);
    }
    return result;
}


// the quadruples of `all` matching `pat`, by brute force
inline QuadrupleSet brute_force_select(const std::vector<Quadruple>& all, const Pattern& pat)
{
    QuadrupleSet result;
    for (const auto& q : all)
    {
        if (pattern_matches(pat, q))
            result.add(q);
    }
    return result;
}


// same elements, regardless of order
inline bool same_quadruples(const QuadrupleSet& a, const QuadrupleSet& b)
{
    if (a.size() != b.size())
        return false;
    for (const auto& q : a)
    {
        if (!b.contains(q))
            return false;
    }
    return true;
}


}  // namespace test
}  // namespace qstore


#endif  // QSTORE_TEST_HELPERS_H
