#ifndef QSTORE_MEMORY_EXECUTOR_H
#define QSTORE_MEMORY_EXECUTOR_H


#include <limits>
#include <optional>
#include <vector>
#include "qstore_executor.h"
#include "qstore_memory_index_helper.h"


namespace qstore
{


struct MemoryExecutorOptions
{
	/*
	* Inserting beyond this many quadruples fails with an
	* `ExecutorFailure` (and rolls the whole call back).
	*/
	size_t max_quadruples = std::numeric_limits<size_t>::max();
};


/*
* Holds an entire quadruple set in memory, with indices.
*/
class MemoryExecutor :
	public IExecutor
{
private:
	// iterator over a snapshot of the candidate rows of a lookup
	class RowIterator :
		public IRowIterator
	{
	public:
		RowIterator(std::vector<StoredQuadruple> candidates, LookupDescriptor lookup);

		void start() override;
		QuadrupleRow current() const override;
		void next() override;
		bool valid() const override;

	private:
		void inc_till_match();

	private:
		const std::vector<StoredQuadruple> m_candidates;
		const LookupDescriptor m_lookup;

		// invariant: if valid(), m_candidates[m_cur_idx] satisfies m_lookup
		size_t m_cur_idx;
	};

	struct UndoEntry
	{
		bool inserted;  // true: undo by erasing `row`; false: undo by restoring it
		StoredQuadruple row;
	};

public:
	explicit MemoryExecutor(MemoryExecutorOptions options = MemoryExecutorOptions());

	bool insert_if_absent(const StoredQuadruple& q) override;
	size_t insert_batch_if_absent(const std::vector<StoredQuadruple>& qs) override;
	size_t delete_by_id(QuadrupleId id) override;
	size_t delete_by_predicates(const LookupDescriptor& lookup) override;
	size_t delete_all() override;
	bool exists_by_id(QuadrupleId id) override;
	std::unique_ptr<IRowIterator> select_by_predicates(const LookupDescriptor& lookup) override;
	size_t count() override;
	void optimize() override;

	/*
	* Checks that the indices agree with the rows. Does nothing
	* unless invariant checks are enabled.
	*/
	void check_integrity() const;

private:
	friend class TransactionScope<MemoryExecutor>;
	void begin_transaction();
	void commit_transaction();
	void rollback_transaction();

	// both log to the undo log when a transaction is open
	void insert_row(const StoredQuadruple& q);
	void erase_row(QuadrupleId id);

	// index maintenance only, no logging, no capacity check
	void link(const StoredQuadruple& q);
	void unlink(const StoredQuadruple& q);

	/*
	* Picks the rows a lookup has to look at, starting from the
	* index the descriptor names. Falls back to every row when
	* the descriptor lacks the values that index needs.
	*/
	std::vector<StoredQuadruple> candidates(const LookupDescriptor& lookup) const;
	std::optional<const mem_idx_helper::IdSet*> index_bucket(const LookupDescriptor& lookup) const;

private:
	const MemoryExecutorOptions m_options;
	mem_idx_helper::Table m_rows;
	mem_idx_helper::SingleIndex m_ctx_index, m_sub_index, m_pred_index;
	mem_idx_helper::ObjectIndex m_obj_index;
	mem_idx_helper::PairIndex m_sp_index;
	mem_idx_helper::ObjectPairIndex m_so_index, m_po_index;

	// present iff a transaction is open
	std::optional<std::vector<UndoEntry>> m_undo_log;
};


}  // namespace qstore


#endif  // QSTORE_MEMORY_EXECUTOR_H
