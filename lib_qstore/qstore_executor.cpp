#include "qstore_executor.h"
#include "qstore_hash.h"
#include "qstore_assert.h"


namespace qstore
{


StoredQuadruple StoredQuadruple::from(const Quadruple& q)
{
	return StoredQuadruple{
		q.id(), q.flavor(),
		term_key(q.context()), term_key(q.subject()),
		term_key(q.predicate()), term_key(q.object()),
		string_form(q.context()), string_form(q.subject()),
		string_form(q.predicate()), string_form(q.object())
	};
}


std::int64_t StoredQuadruple::value_of(Column col) const
{
	switch (col)
	{
	case Column::CONTEXT:
		return ctx_key;
	case Column::SUBJECT:
		return sub_key;
	case Column::PREDICATE:
		return pred_key;
	case Column::OBJECT:
		return obj_key;
	case Column::FLAVOR:
		return static_cast<std::int64_t>(flavor);
	}
	QSTORE_CHECK_PRECOND(false);
	return 0;
}


bool row_matches(const StoredQuadruple& row, const LookupDescriptor& lookup)
{
	for (const auto& p : lookup.conjunction)
	{
		if (row.value_of(p.column) != p.value)
			return false;
	}
	return true;
}


}  // namespace qstore
