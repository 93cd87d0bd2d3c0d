#include "qstore_hash.h"


namespace qstore
{


std::uint64_t fnv1a_64(const std::string& str, std::uint64_t basis)
{
	std::uint64_t h = basis;
	for (const char c : str)
	{
		h ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
		h *= FNV_PRIME;
	}
	return h;
}


QuadrupleId compute_id(const IRI& ctx, const IRI& sub, const IRI& pred, const Term& obj)
{
	const std::string joined = string_form(ctx) + ' ' + string_form(sub)
		+ ' ' + string_form(pred) + ' ' + string_form(obj);

	const std::uint64_t basis = (flavor_of(obj) == ObjectFlavor::RESOURCE)
		? FNV_OFFSET_BASIS : LITERAL_ID_BASIS;

	return static_cast<QuadrupleId>(fnv1a_64(joined, basis));
}


TermKey term_key(const IRI& r)
{
	return static_cast<TermKey>(fnv1a_64(string_form(r), TERM_KEY_BASIS));
}


TermKey term_key(const Term& t)
{
	return static_cast<TermKey>(fnv1a_64(string_form(t), TERM_KEY_BASIS));
}


}  // namespace qstore
