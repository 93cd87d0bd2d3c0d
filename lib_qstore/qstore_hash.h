#ifndef QSTORE_HASH_H
#define QSTORE_HASH_H


#include <string>
#include <cstdint>
#include "qstore_types.h"


namespace qstore
{


/*
* 64-bit FNV-1a over the bytes of `str`, starting from `basis`.
* Unlike `std::hash`, the result is fixed across platforms,
* processes and library versions, so it can be persisted.
*/
std::uint64_t fnv1a_64(const std::string& str, std::uint64_t basis);


static const std::uint64_t FNV_OFFSET_BASIS = 14695981039346656037ull;
static const std::uint64_t FNV_PRIME = 1099511628211ull;

// alternative starting states, see `compute_id` and `term_key`
static const std::uint64_t LITERAL_ID_BASIS = FNV_OFFSET_BASIS ^ 0x9e3779b97f4a7c15ull;
static const std::uint64_t TERM_KEY_BASIS = FNV_OFFSET_BASIS ^ 0xc2b2ae3d27d4eb4full;


/*
* The identity of a quadruple: the string forms of context,
* subject, predicate and object, in that order, joined by single
* spaces, then hashed. The separator and the order are part of
* the persisted format.
* A literal object hashes from a different starting state than
* a resource object, so that a resource and a literal with the
* same string form never share an id.
*/
QuadrupleId compute_id(const IRI& ctx, const IRI& sub, const IRI& pred, const Term& obj);


/*
* Per-position key of a single term, hashed from its string form
* only (so the object's flavor has to be matched separately).
*/
TermKey term_key(const IRI& r);
TermKey term_key(const Term& t);


}  // namespace qstore


#endif  // QSTORE_HASH_H
