#ifndef QSTORE_QUADRUPLE_SET_H
#define QSTORE_QUADRUPLE_SET_H


#include <set>
#include <vector>
#include <optional>
#include <unordered_set>
#include "qstore_types.h"
#include "qstore_quadruple.h"
#include "qstore_pattern.h"


namespace qstore
{


/*
* A collection of distinct quadruples, in the order they were
* first added. Two quadruples are the same iff their ids are.
*/
class QuadrupleSet
{
public:
	typedef std::vector<Quadruple>::const_iterator const_iterator;

	// returns false (and does nothing) if `q` is already present
	bool add(const Quadruple& q);

	bool contains(const Quadruple& q) const;
	size_t size() const { return m_quads.size(); }
	bool empty() const { return m_quads.empty(); }

	const_iterator begin() const { return m_quads.begin(); }
	const_iterator end() const { return m_quads.end(); }

	/*
	* The quadruples of this set which match `pat`, in the same
	* relative order.
	*/
	QuadrupleSet select(const Pattern& pat) const;

private:
	std::vector<Quadruple> m_quads;
	std::unordered_set<QuadrupleId> m_ids;
};


struct Triple
{
	IRI sub, pred;
	Term obj;

	inline bool operator == (const Triple& other) const
	{
		return sub == other.sub && pred == other.pred && obj == other.obj;
	}
	inline bool operator != (const Triple& other) const { return !(*this == other); }
	inline bool operator < (const Triple& other) const
	{
		if (sub != other.sub)
			return sub < other.sub;
		if (pred != other.pred)
			return pred < other.pred;
		return obj < other.obj;
	}
};


/*
* A set of triples, optionally named by a context. This is the
* unit of `merge`.
*/
class Graph
{
public:
	Graph() = default;
	explicit Graph(IRI context) : m_context(std::move(context)) { }

	const std::optional<IRI>& context() const { return m_context; }

	// returns false if `t` is already present
	bool add(Triple t) { return m_triples.insert(std::move(t)).second; }

	size_t size() const { return m_triples.size(); }
	bool empty() const { return m_triples.empty(); }

	std::set<Triple>::const_iterator begin() const { return m_triples.begin(); }
	std::set<Triple>::const_iterator end() const { return m_triples.end(); }

private:
	std::optional<IRI> m_context;
	std::set<Triple> m_triples;
};


}  // namespace qstore


#endif  // QSTORE_QUADRUPLE_SET_H
