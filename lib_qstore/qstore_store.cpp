#include <exception>
#include "qstore_store.h"
#include "qstore_planner.h"
#include "qstore_errors.h"
#include "qstore_assert.h"


namespace qstore
{


namespace
{


/*
* Run `fn` against an executor, passing our own errors through
* and wrapping anything else.
*/
template<typename FnT>
auto call_executor(const char* what, FnT fn) -> decltype(fn())
{
	try
	{
		return fn();
	}
	catch (const QStoreError&)
	{
		throw;
	}
	catch (const std::exception& e)
	{
		std::throw_with_nested(ExecutorFailure(std::string(what) + ": " + e.what()));
	}
}


/*
* Rebuild a quadruple from a stored row. The object's kind comes
* from the stored flavor only. A row which cannot be rebuilt means
* the storage is corrupt, and is reported as an executor failure.
*/
Quadruple rebuild(const QuadrupleRow& row)
{
	try
	{
		return Quadruple(IRI{ row.ctx }, IRI{ row.sub }, IRI{ row.pred },
			term_from_string(row.flavor, row.obj));
	}
	catch (const QStoreError& e)
	{
		std::throw_with_nested(ExecutorFailure(
			std::string("corrupt stored row: ") + e.what()));
	}
}


// removal through a named shape: `ok` is false when a term is missing
size_t remove_if_bound(IExecutor& exec, bool ok, const Pattern& pat)
{
	if (!ok)
		return 0;

	QSTORE_CHECK_PRECOND(!pat.empty());
	return remove_matching(exec, pat);
}


}  // namespace


bool add(IExecutor& exec, const std::optional<Quadruple>& q)
{
	if (!q)
		return false;

	const auto row = StoredQuadruple::from(*q);
	return call_executor("add", [&exec, &row]()
		{
			return exec.insert_if_absent(row);
		});
}


size_t remove(IExecutor& exec, const std::optional<Quadruple>& q)
{
	if (!q)
		return 0;

	const QuadrupleId id = q->id();
	return call_executor("remove", [&exec, id]()
		{
			return exec.delete_by_id(id);
		});
}


size_t remove_matching(IExecutor& exec, const Pattern& pat)
{
	if (pat.empty())
		return 0;

	const auto lookup = compile(pat);
	QSTORE_CHECK_INVARIANT(!lookup.conjunction.empty());

	return call_executor("remove by pattern", [&exec, &lookup]()
		{
			return exec.delete_by_predicates(lookup);
		});
}


size_t remove_by_context(IExecutor& exec, const std::optional<IRI>& ctx)
{
	return remove_if_bound(exec, ctx.has_value(),
		Pattern{ ctx, std::nullopt, std::nullopt, std::nullopt });
}


size_t remove_by_subject(IExecutor& exec, const std::optional<IRI>& sub)
{
	return remove_if_bound(exec, sub.has_value(),
		Pattern{ std::nullopt, sub, std::nullopt, std::nullopt });
}


size_t remove_by_predicate(IExecutor& exec, const std::optional<IRI>& pred)
{
	return remove_if_bound(exec, pred.has_value(),
		Pattern{ std::nullopt, std::nullopt, pred, std::nullopt });
}


size_t remove_by_object(IExecutor& exec, const std::optional<Term>& obj)
{
	return remove_if_bound(exec, obj.has_value(),
		Pattern{ std::nullopt, std::nullopt, std::nullopt, obj });
}


size_t remove_by_context_subject(IExecutor& exec,
	const std::optional<IRI>& ctx, const std::optional<IRI>& sub)
{
	return remove_if_bound(exec, ctx && sub,
		Pattern{ ctx, sub, std::nullopt, std::nullopt });
}


size_t remove_by_context_predicate(IExecutor& exec,
	const std::optional<IRI>& ctx, const std::optional<IRI>& pred)
{
	return remove_if_bound(exec, ctx && pred,
		Pattern{ ctx, std::nullopt, pred, std::nullopt });
}


size_t remove_by_context_object(IExecutor& exec,
	const std::optional<IRI>& ctx, const std::optional<Term>& obj)
{
	return remove_if_bound(exec, ctx && obj,
		Pattern{ ctx, std::nullopt, std::nullopt, obj });
}


size_t remove_by_subject_predicate(IExecutor& exec,
	const std::optional<IRI>& sub, const std::optional<IRI>& pred)
{
	return remove_if_bound(exec, sub && pred,
		Pattern{ std::nullopt, sub, pred, std::nullopt });
}


size_t remove_by_subject_object(IExecutor& exec,
	const std::optional<IRI>& sub, const std::optional<Term>& obj)
{
	return remove_if_bound(exec, sub && obj,
		Pattern{ std::nullopt, sub, std::nullopt, obj });
}


size_t remove_by_predicate_object(IExecutor& exec,
	const std::optional<IRI>& pred, const std::optional<Term>& obj)
{
	return remove_if_bound(exec, pred && obj,
		Pattern{ std::nullopt, std::nullopt, pred, obj });
}


size_t remove_by_context_subject_predicate(IExecutor& exec,
	const std::optional<IRI>& ctx, const std::optional<IRI>& sub,
	const std::optional<IRI>& pred)
{
	return remove_if_bound(exec, ctx && sub && pred,
		Pattern{ ctx, sub, pred, std::nullopt });
}


size_t remove_by_context_subject_object(IExecutor& exec,
	const std::optional<IRI>& ctx, const std::optional<IRI>& sub,
	const std::optional<Term>& obj)
{
	return remove_if_bound(exec, ctx && sub && obj,
		Pattern{ ctx, sub, std::nullopt, obj });
}


size_t remove_by_context_predicate_object(IExecutor& exec,
	const std::optional<IRI>& ctx, const std::optional<IRI>& pred,
	const std::optional<Term>& obj)
{
	return remove_if_bound(exec, ctx && pred && obj,
		Pattern{ ctx, std::nullopt, pred, obj });
}


size_t remove_by_subject_predicate_object(IExecutor& exec,
	const std::optional<IRI>& sub, const std::optional<IRI>& pred,
	const std::optional<Term>& obj)
{
	return remove_if_bound(exec, sub && pred && obj,
		Pattern{ std::nullopt, sub, pred, obj });
}


size_t remove_by_context_subject_predicate_object(IExecutor& exec,
	const std::optional<IRI>& ctx, const std::optional<IRI>& sub,
	const std::optional<IRI>& pred, const std::optional<Term>& obj)
{
	return remove_if_bound(exec, ctx && sub && pred && obj,
		Pattern{ ctx, sub, pred, obj });
}


size_t clear(IExecutor& exec)
{
	return call_executor("clear", [&exec]()
		{
			return exec.delete_all();
		});
}


size_t merge(IExecutor& exec, const Graph* graph,
	const std::optional<IRI>& context_override)
{
	if (graph == nullptr)
		return 0;

	const IRI ctx = graph->context() ? *graph->context()
		: (context_override ? *context_override : IRI{ DEFAULT_CONTEXT });

	// build every row before touching the executor
	std::vector<StoredQuadruple> rows;
	rows.reserve(graph->size());
	for (const auto& t : *graph)
		rows.push_back(StoredQuadruple::from(Quadruple(ctx, t.sub, t.pred, t.obj)));

	if (rows.empty())
		return 0;

	return call_executor("merge", [&exec, &rows]()
		{
			return exec.insert_batch_if_absent(rows);
		});
}


QuadrupleSet select(IExecutor& exec, const Pattern& pat)
{
	const auto lookup = compile(pat);

	return call_executor("select", [&exec, &lookup]()
		{
			QuadrupleSet result;

			auto iter = exec.select_by_predicates(lookup);
			iter->start();
			while (iter->valid())
			{
				result.add(rebuild(iter->current()));
				iter->next();
			}

			return result;
		});
}


bool contains(IExecutor& exec, const std::optional<Quadruple>& q)
{
	if (!q)
		return false;

	const QuadrupleId id = q->id();
	return call_executor("contains", [&exec, id]()
		{
			return exec.exists_by_id(id);
		});
}


size_t count(IExecutor& exec)
{
	return call_executor("count", [&exec]()
		{
			return exec.count();
		});
}


void optimize(IExecutor& exec)
{
	call_executor("optimize", [&exec]()
		{
			exec.optimize();
		});
}


}  // namespace qstore
