#ifndef QSTORE_MEMORY_INDEX_HELPER_H
#define QSTORE_MEMORY_INDEX_HELPER_H


#include <utility>
#include <unordered_map>
#include <unordered_set>
#include "qstore_types.h"
#include "qstore_executor.h"
#include "qstore_query_case.h"


/*
* The in-memory executor stores its rows in a hash table keyed by
* quadruple id, and keeps secondary indices from keys to the set
* of ids holding them. Unlike a table of offsets, id sets survive
* deletion of arbitrary rows without renumbering.
*
* Indices mirror the ones the SQL backends create:
* - one per single term (context, subject, predicate), keyed by
*   the term key;
* - one on the object, keyed by (key, flavor), so that a resource
*   and a literal with equal string forms land in different
*   buckets;
* - one on (subject, predicate), and one each on (subject, object)
*   and (predicate, object), the latter two again including the
*   flavor.
*
* Invariant: every row is present in every index under its own
* keys, and no index holds an id which is not a row. Buckets are
* erased as soon as they become empty.
*/


namespace qstore
{
namespace mem_idx_helper
{


typedef std::unordered_set<QuadrupleId> IdSet;
typedef std::unordered_map<QuadrupleId, StoredQuadruple> Table;

typedef std::pair<TermKey, TermKey> KeyPair;
typedef std::pair<TermKey, ObjectKey> KeyObjectPair;


struct ObjectKeyHash
{
	std::size_t operator()(const ObjectKey& k) const
	{
		return std::hash<TermKey>()(k.key) * 3 + static_cast<std::size_t>(k.flavor);
	}
};


struct KeyPairHash
{
	std::size_t operator()(const KeyPair& p) const
	{
		return std::hash<TermKey>()(p.first)
			+ 37 * std::hash<TermKey>()(p.second);
	}
};


struct KeyObjectPairHash
{
	std::size_t operator()(const KeyObjectPair& p) const
	{
		return std::hash<TermKey>()(p.first)
			+ 37 * ObjectKeyHash()(p.second);
	}
};


typedef std::unordered_map<TermKey, IdSet> SingleIndex;
typedef std::unordered_map<ObjectKey, IdSet, ObjectKeyHash> ObjectIndex;
typedef std::unordered_map<KeyPair, IdSet, KeyPairHash> PairIndex;
typedef std::unordered_map<KeyObjectPair, IdSet, KeyObjectPairHash> ObjectPairIndex;


inline ObjectKey object_key(const StoredQuadruple& q)
{
	return ObjectKey{ q.obj_key, q.flavor };
}


template<typename IndexT, typename KeyT>
void index_insert(IndexT& idx, const KeyT& key, QuadrupleId id)
{
	idx[key].insert(id);
}


/*
* Tolerates `id` (or the whole bucket) being absent, so that it
* can undo a partially applied insertion.
*/
template<typename IndexT, typename KeyT>
void index_erase(IndexT& idx, const KeyT& key, QuadrupleId id)
{
	auto iter = idx.find(key);
	if (iter == idx.end())
		return;

	iter->second.erase(id);
	if (iter->second.empty())
		idx.erase(iter);
}


/*
* Returns the bucket under `key`, or nullptr if there is none
* (in which case no row holds `key`).
*/
template<typename IndexT, typename KeyT>
const IdSet* index_find(const IndexT& idx, const KeyT& key)
{
	auto iter = idx.find(key);
	return (iter == idx.end()) ? nullptr : &iter->second;
}


template<typename IndexT, typename KeyT>
bool index_contains(const IndexT& idx, const KeyT& key, QuadrupleId id)
{
	const IdSet* bucket = index_find(idx, key);
	return bucket != nullptr && bucket->count(id) == 1;
}


}  // namespace mem_idx_helper
}  // namespace qstore


#endif  // QSTORE_MEMORY_INDEX_HELPER_H
