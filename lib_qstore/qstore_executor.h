#ifndef QSTORE_EXECUTOR_H
#define QSTORE_EXECUTOR_H


#include <memory>
#include <string>
#include <vector>
#include "qstore_types.h"
#include "qstore_quadruple.h"
#include "qstore_planner.h"
#include "qstore_iterator.h"


namespace qstore
{


/*
* A quadruple as handed to an executor for storage: its id, its
* flavor, one key per position (for the indices) and the four
* string forms (for reading it back).
*/
struct StoredQuadruple
{
	QuadrupleId id;
	ObjectFlavor flavor;
	TermKey ctx_key, sub_key, pred_key, obj_key;
	std::string ctx, sub, pred, obj;

	static StoredQuadruple from(const Quadruple& q);

	// the key this row holds for `col`
	std::int64_t value_of(Column col) const;
};


/*
* A quadruple as an executor returns it. The object's kind is
* only known from `flavor`.
*/
struct QuadrupleRow
{
	ObjectFlavor flavor;
	std::string ctx, sub, pred, obj;
};


typedef IIterator<QuadrupleRow> IRowIterator;


/*
* True iff `row` satisfies every predicate of `lookup`.
*/
bool row_matches(const StoredQuadruple& row, const LookupDescriptor& lookup);


/*
* The storage engine behind a quadruple store. The core only
* talks to storage through this interface, and only in terms of
* ids, keys and compiled lookups.
*
* Every call is one atomic unit of work: it either completes, or
* throws `ExecutorFailure` having restored the state which held
* before the call. Lookups which match on the object always
* match on the flavor too (see `check_lookup`).
*
* Implementations need not be thread safe.
*/
class IExecutor
{
public:
	virtual ~IExecutor() = default;

	// returns true iff no row with `q.id` existed, and `q` was stored
	virtual bool insert_if_absent(const StoredQuadruple& q) = 0;

	/*
	* Insert every quadruple whose id is not yet stored, in a
	* single transaction. Returns the number newly stored.
	*/
	virtual size_t insert_batch_if_absent(const std::vector<StoredQuadruple>& qs) = 0;

	// the following return the number of rows deleted
	virtual size_t delete_by_id(QuadrupleId id) = 0;
	virtual size_t delete_by_predicates(const LookupDescriptor& lookup) = 0;
	virtual size_t delete_all() = 0;

	virtual bool exists_by_id(QuadrupleId id) = 0;

	/*
	* Stream the rows matching `lookup`. The returned iterator
	* is independent of later mutations of this executor.
	*/
	virtual std::unique_ptr<IRowIterator> select_by_predicates(const LookupDescriptor& lookup) = 0;

	virtual size_t count() = 0;

	// backend-specific compaction, may do nothing
	virtual void optimize() = 0;
};


/*
* Wraps one unit of work of an executor `TxT`, which must
* provide `begin_transaction()`, `commit_transaction()` and
* `rollback_transaction()`. The latter must not throw.
* Construction begins the transaction; unless `commit` is
* reached, destruction rolls it back, whichever way the scope
* is left.
*/
template<typename TxT>
class TransactionScope
{
public:
	explicit TransactionScope(TxT& tx) :
		m_tx(tx), m_done(false)
	{
		m_tx.begin_transaction();
	}

	TransactionScope(const TransactionScope&) = delete;
	TransactionScope& operator=(const TransactionScope&) = delete;

	~TransactionScope()
	{
		if (!m_done)
			m_tx.rollback_transaction();
	}

	void commit()
	{
		m_tx.commit_transaction();
		m_done = true;
	}

private:
	TxT& m_tx;
	bool m_done;
};


}  // namespace qstore


#endif  // QSTORE_EXECUTOR_H
