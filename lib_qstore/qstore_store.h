#ifndef QSTORE_STORE_H
#define QSTORE_STORE_H


#include <optional>
#include "qstore_types.h"
#include "qstore_quadruple.h"
#include "qstore_quadruple_set.h"
#include "qstore_pattern.h"
#include "qstore_executor.h"


/*
* The operations on a quadruple store. None of them hold any state
* of their own: the store *is* the executor they are given, and
* each function is a single call to it (hence a single atomic
* unit of work).
*
* Errors: anything an executor throws which is not already a
* `QStoreError` is rethrown as an `ExecutorFailure` with the
* original exception nested inside it.
*/


namespace qstore
{


/*
* Store `q` unless a quadruple with the same id is present.
* Returns true iff it was newly stored. A missing quadruple
* does nothing and returns false.
*/
bool add(IExecutor& exec, const std::optional<Quadruple>& q);


/*
* Returns the number of quadruples deleted (0 or 1). A missing
* quadruple does nothing.
*/
size_t remove(IExecutor& exec, const std::optional<Quadruple>& q);


/*
* Delete every quadruple matching `pat`, returning how many were
* deleted. An empty pattern is not enough to delete anything, and
* deletes nothing: use `clear` to empty the store.
*/
size_t remove_matching(IExecutor& exec, const Pattern& pat);


/*
* One removal per non-empty pattern shape. If any of the terms a
* removal is named after is missing, it deletes nothing.
*/
size_t remove_by_context(IExecutor& exec, const std::optional<IRI>& ctx);
size_t remove_by_subject(IExecutor& exec, const std::optional<IRI>& sub);
size_t remove_by_predicate(IExecutor& exec, const std::optional<IRI>& pred);
size_t remove_by_object(IExecutor& exec, const std::optional<Term>& obj);
size_t remove_by_context_subject(IExecutor& exec,
	const std::optional<IRI>& ctx, const std::optional<IRI>& sub);
size_t remove_by_context_predicate(IExecutor& exec,
	const std::optional<IRI>& ctx, const std::optional<IRI>& pred);
size_t remove_by_context_object(IExecutor& exec,
	const std::optional<IRI>& ctx, const std::optional<Term>& obj);
size_t remove_by_subject_predicate(IExecutor& exec,
	const std::optional<IRI>& sub, const std::optional<IRI>& pred);
size_t remove_by_subject_object(IExecutor& exec,
	const std::optional<IRI>& sub, const std::optional<Term>& obj);
size_t remove_by_predicate_object(IExecutor& exec,
	const std::optional<IRI>& pred, const std::optional<Term>& obj);
size_t remove_by_context_subject_predicate(IExecutor& exec,
	const std::optional<IRI>& ctx, const std::optional<IRI>& sub,
	const std::optional<IRI>& pred);
size_t remove_by_context_subject_object(IExecutor& exec,
	const std::optional<IRI>& ctx, const std::optional<IRI>& sub,
	const std::optional<Term>& obj);
size_t remove_by_context_predicate_object(IExecutor& exec,
	const std::optional<IRI>& ctx, const std::optional<IRI>& pred,
	const std::optional<Term>& obj);
size_t remove_by_subject_predicate_object(IExecutor& exec,
	const std::optional<IRI>& sub, const std::optional<IRI>& pred,
	const std::optional<Term>& obj);
size_t remove_by_context_subject_predicate_object(IExecutor& exec,
	const std::optional<IRI>& ctx, const std::optional<IRI>& sub,
	const std::optional<IRI>& pred, const std::optional<Term>& obj);


// delete everything, returning how many quadruples were deleted
size_t clear(IExecutor& exec);


/*
* Add every triple of `graph`, in one transaction, as quadruples
* whose context is the graph's own context if it has one, else
* `context_override` if given, else `DEFAULT_CONTEXT`.
* Triples already stored are skipped. Returns the number newly
* stored. A null graph does nothing.
* If any triple cannot form a quadruple, nothing is stored and
* `InvalidArgument` is thrown.
*/
size_t merge(IExecutor& exec, const Graph* graph,
	const std::optional<IRI>& context_override = std::nullopt);


/*
* Every stored quadruple matching `pat`. The empty pattern
* matches everything.
*/
QuadrupleSet select(IExecutor& exec, const Pattern& pat);


/*
* Lookup by id. A missing quadruple is never contained.
*/
bool contains(IExecutor& exec, const std::optional<Quadruple>& q);


size_t count(IExecutor& exec);
void optimize(IExecutor& exec);


}  // namespace qstore


#endif  // QSTORE_STORE_H
