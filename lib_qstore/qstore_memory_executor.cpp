#include "qstore_memory_executor.h"
#include "qstore_errors.h"
#include "qstore_assert.h"


namespace qstore
{


using namespace mem_idx_helper;


MemoryExecutor::MemoryExecutor(MemoryExecutorOptions options) :
	m_options(options)
{ }


bool MemoryExecutor::insert_if_absent(const StoredQuadruple& q)
{
	TransactionScope<MemoryExecutor> tx(*this);

	// don't insert duplicates!
	if (m_rows.find(q.id) != m_rows.end())
	{
		tx.commit();
		return false;
	}

	insert_row(q);
	tx.commit();
	return true;
}


size_t MemoryExecutor::insert_batch_if_absent(const std::vector<StoredQuadruple>& qs)
{
	TransactionScope<MemoryExecutor> tx(*this);

	size_t add_count = 0;
	for (const auto& q : qs)
	{
		if (m_rows.find(q.id) != m_rows.end())
			continue;

		// if this throws, every row added so far is rolled back
		insert_row(q);
		++add_count;
	}

	tx.commit();
	return add_count;
}


size_t MemoryExecutor::delete_by_id(QuadrupleId id)
{
	if (m_rows.find(id) == m_rows.end())
		return 0;

	TransactionScope<MemoryExecutor> tx(*this);
	erase_row(id);
	tx.commit();
	return 1;
}


size_t MemoryExecutor::delete_by_predicates(const LookupDescriptor& lookup)
{
	check_lookup(lookup);

	// collect first: erasing invalidates the index buckets
	std::vector<QuadrupleId> doomed;
	for (const auto& row : candidates(lookup))
	{
		if (row_matches(row, lookup))
			doomed.push_back(row.id);
	}

	TransactionScope<MemoryExecutor> tx(*this);
	for (const auto id : doomed)
		erase_row(id);
	tx.commit();

	return doomed.size();
}


size_t MemoryExecutor::delete_all()
{
	const size_t deleted = m_rows.size();

	m_rows.clear();
	m_ctx_index.clear();
	m_sub_index.clear();
	m_pred_index.clear();
	m_obj_index.clear();
	m_sp_index.clear();
	m_so_index.clear();
	m_po_index.clear();

	return deleted;
}


bool MemoryExecutor::exists_by_id(QuadrupleId id)
{
	return m_rows.find(id) != m_rows.end();
}


std::unique_ptr<IRowIterator> MemoryExecutor::select_by_predicates(const LookupDescriptor& lookup)
{
	check_lookup(lookup);
	return std::make_unique<RowIterator>(candidates(lookup), lookup);
}


size_t MemoryExecutor::count()
{
	return m_rows.size();
}


void MemoryExecutor::optimize()
{
	m_rows.rehash(0);
	check_integrity();
}


void MemoryExecutor::begin_transaction()
{
	// transactions do not nest
	QSTORE_CHECK_PRECOND(!m_undo_log.has_value());
	m_undo_log.emplace();
}


void MemoryExecutor::commit_transaction()
{
	QSTORE_CHECK_PRECOND(m_undo_log.has_value());
	m_undo_log.reset();
}


void MemoryExecutor::rollback_transaction()
{
	QSTORE_CHECK_PRECOND(m_undo_log.has_value());

	// take the log out first, so that the replay below is not logged
	std::vector<UndoEntry> log = std::move(*m_undo_log);
	m_undo_log.reset();

	for (auto iter = log.rbegin(); iter != log.rend(); ++iter)
	{
		if (iter->inserted)
		{
			// tolerant of the row being only partially linked
			m_rows.erase(iter->row.id);
			unlink(iter->row);
		}
		else
		{
			m_rows.emplace(iter->row.id, iter->row);
			link(iter->row);
		}
	}

	check_integrity();
}


void MemoryExecutor::insert_row(const StoredQuadruple& q)
{
	QSTORE_CHECK_PRECOND(m_rows.find(q.id) == m_rows.end());

	if (m_rows.size() >= m_options.max_quadruples)
		throw ExecutorFailure("in-memory store is full ("
			+ std::to_string(m_options.max_quadruples) + " quadruples)");

	// log before touching anything, so a partial insert can be undone
	if (m_undo_log)
		m_undo_log->push_back(UndoEntry{ true, q });

	m_rows.emplace(q.id, q);
	link(q);
}


void MemoryExecutor::erase_row(QuadrupleId id)
{
	auto iter = m_rows.find(id);
	QSTORE_CHECK_PRECOND(iter != m_rows.end());

	if (m_undo_log)
		m_undo_log->push_back(UndoEntry{ false, iter->second });

	unlink(iter->second);
	m_rows.erase(iter);
}


void MemoryExecutor::link(const StoredQuadruple& q)
{
	index_insert(m_ctx_index, q.ctx_key, q.id);
	index_insert(m_sub_index, q.sub_key, q.id);
	index_insert(m_pred_index, q.pred_key, q.id);
	index_insert(m_obj_index, object_key(q), q.id);
	index_insert(m_sp_index, std::make_pair(q.sub_key, q.pred_key), q.id);
	index_insert(m_so_index, std::make_pair(q.sub_key, object_key(q)), q.id);
	index_insert(m_po_index, std::make_pair(q.pred_key, object_key(q)), q.id);
}


void MemoryExecutor::unlink(const StoredQuadruple& q)
{
	index_erase(m_ctx_index, q.ctx_key, q.id);
	index_erase(m_sub_index, q.sub_key, q.id);
	index_erase(m_pred_index, q.pred_key, q.id);
	index_erase(m_obj_index, object_key(q), q.id);
	index_erase(m_sp_index, std::make_pair(q.sub_key, q.pred_key), q.id);
	index_erase(m_so_index, std::make_pair(q.sub_key, object_key(q)), q.id);
	index_erase(m_po_index, std::make_pair(q.pred_key, object_key(q)), q.id);
}


std::optional<const IdSet*> MemoryExecutor::index_bucket(const LookupDescriptor& lookup) const
{
	const auto c = lookup.value_of(Column::CONTEXT);
	const auto s = lookup.value_of(Column::SUBJECT);
	const auto p = lookup.value_of(Column::PREDICATE);
	const auto o = lookup.value_of(Column::OBJECT);
	const auto f = lookup.value_of(Column::FLAVOR);

	std::optional<ObjectKey> ok;
	if (o && f)
		ok = ObjectKey{ *o, flavor_from_int(*f) };

	switch (lookup.index)
	{
	case IndexType::NONE:
		break;
	case IndexType::CONTEXT:
		if (c)
			return index_find(m_ctx_index, *c);
		break;
	case IndexType::SUBJECT:
		if (s)
			return index_find(m_sub_index, *s);
		break;
	case IndexType::PREDICATE:
		if (p)
			return index_find(m_pred_index, *p);
		break;
	case IndexType::OBJECT:
		if (ok)
			return index_find(m_obj_index, *ok);
		break;
	case IndexType::SUBJECT_PREDICATE:
		if (s && p)
			return index_find(m_sp_index, std::make_pair(*s, *p));
		break;
	case IndexType::SUBJECT_OBJECT:
		if (s && ok)
			return index_find(m_so_index, std::make_pair(*s, *ok));
		break;
	case IndexType::PREDICATE_OBJECT:
		if (p && ok)
			return index_find(m_po_index, std::make_pair(*p, *ok));
		break;
	}

	// no usable index: scan everything
	return std::nullopt;
}


std::vector<StoredQuadruple> MemoryExecutor::candidates(const LookupDescriptor& lookup) const
{
	std::vector<StoredQuadruple> result;

	const auto bucket = index_bucket(lookup);
	if (!bucket)
	{
		result.reserve(m_rows.size());
		for (const auto& [id, row] : m_rows)
			result.push_back(row);
	}
	else if (*bucket != nullptr)
	{
		result.reserve((*bucket)->size());
		for (const auto id : **bucket)
		{
			auto iter = m_rows.find(id);
			QSTORE_CHECK_INVARIANT(iter != m_rows.end());
			result.push_back(iter->second);
		}
	}
	// else the index has no entry, so nothing can match

	return result;
}


void MemoryExecutor::check_integrity() const
{
#ifdef QSTORE_CHECKING_INVARIANTS
	const auto count_index = [](const auto& idx)
	{
		size_t n = 0;
		for (const auto& [key, ids] : idx)
		{
			QSTORE_CHECK_INVARIANT(!ids.empty());
			n += ids.size();
		}
		return n;
	};

	for (const auto& [id, row] : m_rows)
	{
		QSTORE_CHECK_INVARIANT(id == row.id);
		QSTORE_CHECK_INVARIANT(index_contains(m_ctx_index, row.ctx_key, id));
		QSTORE_CHECK_INVARIANT(index_contains(m_sub_index, row.sub_key, id));
		QSTORE_CHECK_INVARIANT(index_contains(m_pred_index, row.pred_key, id));
		QSTORE_CHECK_INVARIANT(index_contains(m_obj_index, object_key(row), id));
		QSTORE_CHECK_INVARIANT(index_contains(m_sp_index, std::make_pair(row.sub_key, row.pred_key), id));
		QSTORE_CHECK_INVARIANT(index_contains(m_so_index, std::make_pair(row.sub_key, object_key(row)), id));
		QSTORE_CHECK_INVARIANT(index_contains(m_po_index, std::make_pair(row.pred_key, object_key(row)), id));
	}

	// every index holds exactly one entry per row, hence no strays
	QSTORE_CHECK_INVARIANT(count_index(m_ctx_index) == m_rows.size());
	QSTORE_CHECK_INVARIANT(count_index(m_sub_index) == m_rows.size());
	QSTORE_CHECK_INVARIANT(count_index(m_pred_index) == m_rows.size());
	QSTORE_CHECK_INVARIANT(count_index(m_obj_index) == m_rows.size());
	QSTORE_CHECK_INVARIANT(count_index(m_sp_index) == m_rows.size());
	QSTORE_CHECK_INVARIANT(count_index(m_so_index) == m_rows.size());
	QSTORE_CHECK_INVARIANT(count_index(m_po_index) == m_rows.size());
#endif
}


MemoryExecutor::RowIterator::RowIterator(
	std::vector<StoredQuadruple> candidates, LookupDescriptor lookup) :
	m_candidates(std::move(candidates)),
	m_lookup(std::move(lookup)),
	m_cur_idx(m_candidates.size())
{ }


void MemoryExecutor::RowIterator::start()
{
	m_cur_idx = 0;
	inc_till_match();
}


QuadrupleRow MemoryExecutor::RowIterator::current() const
{
	QSTORE_CHECK_PRECOND(valid());
	const StoredQuadruple& row = m_candidates[m_cur_idx];
	QSTORE_CHECK_INVARIANT(row_matches(row, m_lookup));
	return QuadrupleRow{ row.flavor, row.ctx, row.sub, row.pred, row.obj };
}


void MemoryExecutor::RowIterator::next()
{
	QSTORE_CHECK_PRECOND(valid());
	++m_cur_idx;
	inc_till_match();
}


bool MemoryExecutor::RowIterator::valid() const
{
	return m_cur_idx < m_candidates.size();
}


void MemoryExecutor::RowIterator::inc_till_match()
{
	// the index only narrows down on some of the predicates
	while (valid() && !row_matches(m_candidates[m_cur_idx], m_lookup))
		++m_cur_idx;
}


}  // namespace qstore
