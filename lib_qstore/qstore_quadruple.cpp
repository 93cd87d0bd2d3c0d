#include "qstore_quadruple.h"
#include "qstore_hash.h"
#include "qstore_errors.h"


namespace qstore
{


Quadruple::Quadruple(IRI ctx, IRI sub, IRI pred, Term obj) :
	m_ctx(std::move(ctx)), m_sub(std::move(sub)),
	m_pred(std::move(pred)), m_obj(std::move(obj))
{
	if (m_ctx.val.empty())
		throw InvalidArgument("quadruple has no context");
	if (m_sub.val.empty())
		throw InvalidArgument("quadruple has no subject");
	if (m_pred.val.empty())
		throw InvalidArgument("quadruple has no predicate");
	if (std::holds_alternative<IRI>(m_obj) && std::get<IRI>(m_obj).val.empty())
		throw InvalidArgument("quadruple has no object");

	m_flavor = flavor_of(m_obj);
	m_id = compute_id(m_ctx, m_sub, m_pred, m_obj);
}


std::string to_display_string(const Quadruple& q)
{
	QStoreToStringVisitor v;
	return v(q.context()) + ' ' + v(q.subject()) + ' '
		+ v(q.predicate()) + ' ' + v(q.object());
}


}  // namespace qstore
