#include "qstore_planner.h"
#include "qstore_errors.h"
#include "qstore_assert.h"


namespace qstore
{


using namespace cases;


namespace
{


EqualityPredicate eq(Column col, std::int64_t value)
{
	return EqualityPredicate{ col, value };
}


/*
* The object's key and its flavor always go together.
*/
void append_object(std::vector<EqualityPredicate>& conj, const ObjectKey& o)
{
	conj.push_back(eq(Column::OBJECT, o.key));
	conj.push_back(eq(Column::FLAVOR, static_cast<std::int64_t>(o.flavor)));
}


/*
* Index choice follows how selective each access path is expected
* to be: the (subject, object) pair first, then (predicate, object)
* and (subject, predicate), then object, subject, predicate and
* finally context alone.
*/
struct PlannerVisitor
{
	LookupDescriptor operator()(const AnyQuadruple&)
	{
		return { "", IndexType::NONE, {} };
	}

	LookupDescriptor operator()(const ByC& x)
	{
		return { "", IndexType::CONTEXT, { eq(Column::CONTEXT, x.ctx) } };
	}

	LookupDescriptor operator()(const ByS& x)
	{
		return { "", IndexType::SUBJECT, { eq(Column::SUBJECT, x.sub) } };
	}

	LookupDescriptor operator()(const ByP& x)
	{
		return { "", IndexType::PREDICATE, { eq(Column::PREDICATE, x.pred) } };
	}

	LookupDescriptor operator()(const ByO& x)
	{
		LookupDescriptor d{ "", IndexType::OBJECT, {} };
		append_object(d.conjunction, x.obj);
		return d;
	}

	LookupDescriptor operator()(const ByCS& x)
	{
		return { "", IndexType::SUBJECT,
			{ eq(Column::CONTEXT, x.ctx), eq(Column::SUBJECT, x.sub) } };
	}

	LookupDescriptor operator()(const ByCP& x)
	{
		return { "", IndexType::PREDICATE,
			{ eq(Column::CONTEXT, x.ctx), eq(Column::PREDICATE, x.pred) } };
	}

	LookupDescriptor operator()(const ByCO& x)
	{
		LookupDescriptor d{ "", IndexType::OBJECT, { eq(Column::CONTEXT, x.ctx) } };
		append_object(d.conjunction, x.obj);
		return d;
	}

	LookupDescriptor operator()(const BySP& x)
	{
		return { "", IndexType::SUBJECT_PREDICATE,
			{ eq(Column::SUBJECT, x.sub), eq(Column::PREDICATE, x.pred) } };
	}

	LookupDescriptor operator()(const BySO& x)
	{
		LookupDescriptor d{ "", IndexType::SUBJECT_OBJECT, { eq(Column::SUBJECT, x.sub) } };
		append_object(d.conjunction, x.obj);
		return d;
	}

	LookupDescriptor operator()(const ByPO& x)
	{
		LookupDescriptor d{ "", IndexType::PREDICATE_OBJECT, { eq(Column::PREDICATE, x.pred) } };
		append_object(d.conjunction, x.obj);
		return d;
	}

	LookupDescriptor operator()(const ByCSP& x)
	{
		return { "", IndexType::SUBJECT_PREDICATE,
			{ eq(Column::CONTEXT, x.ctx), eq(Column::SUBJECT, x.sub),
			eq(Column::PREDICATE, x.pred) } };
	}

	LookupDescriptor operator()(const ByCSO& x)
	{
		LookupDescriptor d{ "", IndexType::SUBJECT_OBJECT,
			{ eq(Column::CONTEXT, x.ctx), eq(Column::SUBJECT, x.sub) } };
		append_object(d.conjunction, x.obj);
		return d;
	}

	LookupDescriptor operator()(const ByCPO& x)
	{
		LookupDescriptor d{ "", IndexType::PREDICATE_OBJECT,
			{ eq(Column::CONTEXT, x.ctx), eq(Column::PREDICATE, x.pred) } };
		append_object(d.conjunction, x.obj);
		return d;
	}

	LookupDescriptor operator()(const BySPO& x)
	{
		LookupDescriptor d{ "", IndexType::SUBJECT_OBJECT,
			{ eq(Column::SUBJECT, x.sub), eq(Column::PREDICATE, x.pred) } };
		append_object(d.conjunction, x.obj);
		return d;
	}

	LookupDescriptor operator()(const ByCSPO& x)
	{
		LookupDescriptor d{ "", IndexType::SUBJECT_OBJECT,
			{ eq(Column::CONTEXT, x.ctx), eq(Column::SUBJECT, x.sub),
			eq(Column::PREDICATE, x.pred) } };
		append_object(d.conjunction, x.obj);
		return d;
	}
};


}  // namespace


std::optional<std::int64_t> LookupDescriptor::value_of(Column col) const
{
	for (const auto& p : conjunction)
	{
		if (p.column == col)
			return p.value;
	}
	return std::nullopt;
}


LookupDescriptor plan(const QueryCase& qc)
{
	LookupDescriptor d = std::visit(PlannerVisitor(), qc);
	d.label = case_label(qc);

	// if this fails, `PlannerVisitor` is faulty
	QSTORE_CHECK_POSTCOND(d.conjunction.size()
		== d.label.size() + (d.value_of(Column::OBJECT) ? 1 : 0));

	return d;
}


LookupDescriptor compile(const Pattern& pat)
{
	return plan(classify(pat));
}


void check_lookup(const LookupDescriptor& lookup)
{
	if (!lookup.value_of(Column::OBJECT))
		return;

	const auto flavor = lookup.value_of(Column::FLAVOR);
	if (!flavor)
		throw AmbiguousObjectFlavor("lookup '" + lookup.label
			+ "' matches on the object without matching on its flavor");

	// also rejects a flavor value which is neither kind
	flavor_from_int(*flavor);
}


std::string index_type_str(IndexType type)
{
	switch (type)
	{
	case IndexType::NONE:
		return "NONE";
	case IndexType::CONTEXT:
		return "CONTEXT";
	case IndexType::SUBJECT:
		return "SUBJECT";
	case IndexType::PREDICATE:
		return "PREDICATE";
	case IndexType::OBJECT:
		return "OBJECT";
	case IndexType::SUBJECT_PREDICATE:
		return "SUBJECT_PREDICATE";
	case IndexType::SUBJECT_OBJECT:
		return "SUBJECT_OBJECT";
	case IndexType::PREDICATE_OBJECT:
		return "PREDICATE_OBJECT";
	}
	QSTORE_CHECK_PRECOND(false);
	return "";
}


std::string column_str(Column col)
{
	switch (col)
	{
	case Column::CONTEXT:
		return "CONTEXT";
	case Column::SUBJECT:
		return "SUBJECT";
	case Column::PREDICATE:
		return "PREDICATE";
	case Column::OBJECT:
		return "OBJECT";
	case Column::FLAVOR:
		return "FLAVOR";
	}
	QSTORE_CHECK_PRECOND(false);
	return "";
}


}  // namespace qstore
