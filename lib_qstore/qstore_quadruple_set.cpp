#include "qstore_quadruple_set.h"


namespace qstore
{


bool QuadrupleSet::add(const Quadruple& q)
{
	if (!m_ids.insert(q.id()).second)
		return false;

	m_quads.push_back(q);
	return true;
}


bool QuadrupleSet::contains(const Quadruple& q) const
{
	return m_ids.count(q.id()) == 1;
}


QuadrupleSet QuadrupleSet::select(const Pattern& pat) const
{
	QuadrupleSet result;
	for (const auto& q : m_quads)
	{
		if (pattern_matches(pat, q))
			result.add(q);
	}
	return result;
}


}  // namespace qstore
