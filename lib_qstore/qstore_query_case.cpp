#include "qstore_query_case.h"
#include "qstore_hash.h"


namespace qstore
{


using namespace cases;


QueryCase classify(const Pattern& pat)
{
	// only the bound positions are encoded; the rest stay unused
	const TermKey c = pat.ctx ? term_key(*pat.ctx) : 0;
	const TermKey s = pat.sub ? term_key(*pat.sub) : 0;
	const TermKey p = pat.pred ? term_key(*pat.pred) : 0;
	const ObjectKey o = pat.obj
		? ObjectKey{ term_key(*pat.obj), flavor_of(*pat.obj) }
		: ObjectKey{ 0, ObjectFlavor::RESOURCE };

	if (!pat.ctx)  // if context unbound
	{
		if (!pat.sub)  // if subject unbound
		{
			if (!pat.pred)  // if predicate unbound
			{
				if (!pat.obj)
					return AnyQuadruple{};
				else
					return ByO{ o };
			}
			else  // if predicate bound
			{
				if (!pat.obj)
					return ByP{ p };
				else
					return ByPO{ p, o };
			}
		}
		else  // if subject bound
		{
			if (!pat.pred)
			{
				if (!pat.obj)
					return ByS{ s };
				else
					return BySO{ s, o };
			}
			else
			{
				if (!pat.obj)
					return BySP{ s, p };
				else
					return BySPO{ s, p, o };
			}
		}
	}
	else  // if context bound
	{
		if (!pat.sub)
		{
			if (!pat.pred)
			{
				if (!pat.obj)
					return ByC{ c };
				else
					return ByCO{ c, o };
			}
			else
			{
				if (!pat.obj)
					return ByCP{ c, p };
				else
					return ByCPO{ c, p, o };
			}
		}
		else
		{
			if (!pat.pred)
			{
				if (!pat.obj)
					return ByCS{ c, s };
				else
					return ByCSO{ c, s, o };
			}
			else
			{
				if (!pat.obj)
					return ByCSP{ c, s, p };
				else
					return ByCSPO{ c, s, p, o };
			}
		}
	}
}


std::string case_label(const QueryCase& qc)
{
	struct LabelVisitor
	{
		static std::string letter(const ObjectKey& o)
		{
			return (o.flavor == ObjectFlavor::RESOURCE) ? "O" : "L";
		}

		std::string operator()(const AnyQuadruple&) { return ""; }
		std::string operator()(const ByC&) { return "C"; }
		std::string operator()(const ByS&) { return "S"; }
		std::string operator()(const ByP&) { return "P"; }
		std::string operator()(const ByO& x) { return letter(x.obj); }
		std::string operator()(const ByCS&) { return "CS"; }
		std::string operator()(const ByCP&) { return "CP"; }
		std::string operator()(const ByCO& x) { return "C" + letter(x.obj); }
		std::string operator()(const BySP&) { return "SP"; }
		std::string operator()(const BySO& x) { return "S" + letter(x.obj); }
		std::string operator()(const ByPO& x) { return "P" + letter(x.obj); }
		std::string operator()(const ByCSP&) { return "CSP"; }
		std::string operator()(const ByCSO& x) { return "CS" + letter(x.obj); }
		std::string operator()(const ByCPO& x) { return "CP" + letter(x.obj); }
		std::string operator()(const BySPO& x) { return "SP" + letter(x.obj); }
		std::string operator()(const ByCSPO& x) { return "CSP" + letter(x.obj); }
	};
	return std::visit(LabelVisitor(), qc);
}


}  // namespace qstore
