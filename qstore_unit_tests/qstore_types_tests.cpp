#include <vector>
#include <boost/test/unit_test.hpp>
#include "qstore_types.h"
#include "qstore_quadruple.h"
#include "qstore_pattern.h"
#include "qstore_errors.h"


using namespace qstore;


BOOST_AUTO_TEST_SUITE(TermTests);


BOOST_AUTO_TEST_CASE(TestStringForms)
{
    BOOST_CHECK_EQUAL(string_form(IRI{ "ex:a" }), "ex:a");
    BOOST_CHECK_EQUAL(string_form(Literal{ "hello" }), "hello");
    BOOST_CHECK_EQUAL(string_form(Literal{ "hello", std::string("en") }), "hello@en");
    BOOST_CHECK_EQUAL(string_form(Literal{ "5", std::nullopt, std::string("xsd:int") }), "5^^xsd:int");

    // a resource and a literal can share a string form
    BOOST_CHECK_EQUAL(string_form(Term(IRI{ "x" })), string_form(Term(Literal{ "x" })));
}


BOOST_AUTO_TEST_CASE(TestLiteralEqualityIsExact)
{
    BOOST_CHECK(Literal{ "a" } == Literal{ "a" });
    BOOST_CHECK(Literal{ "a" } != Literal{ "A" });
    BOOST_CHECK(Literal{ "a" } != (Literal{ "a", std::string("en") }));
    BOOST_CHECK((Literal{ "a", std::string("en") }) != (Literal{ "a", std::string("fr") }));
    BOOST_CHECK(Term(IRI{ "a" }) != Term(Literal{ "a" }));
}


BOOST_AUTO_TEST_CASE(TestFlavors)
{
    BOOST_CHECK(flavor_of(IRI{ "x" }) == ObjectFlavor::RESOURCE);
    BOOST_CHECK(flavor_of(Literal{ "x" }) == ObjectFlavor::LITERAL);
    BOOST_CHECK(flavor_from_int(1) == ObjectFlavor::RESOURCE);
    BOOST_CHECK(flavor_from_int(2) == ObjectFlavor::LITERAL);
    BOOST_CHECK_THROW(flavor_from_int(0), AmbiguousObjectFlavor);
    BOOST_CHECK_THROW(flavor_from_int(3), AmbiguousObjectFlavor);
}


BOOST_AUTO_TEST_CASE(TestParseLiteral)
{
    BOOST_CHECK(parse_literal("hello") == Literal{ "hello" });
    BOOST_CHECK(parse_literal("hello@en-GB") == (Literal{ "hello", std::string("en-GB") }));
    BOOST_CHECK(parse_literal("5^^http://www.w3.org/2001/XMLSchema#int")
        == (Literal{ "5", std::nullopt, std::string("http://www.w3.org/2001/XMLSchema#int") }));

    BOOST_CHECK(parse_literal("me\\@example.com") == Literal{ "me@example.com" });
    BOOST_CHECK(parse_literal("a@") == (Literal{ "a", std::string("") }));
    BOOST_CHECK(parse_literal("x^^") == (Literal{ "x", std::nullopt, std::string("") }));

    BOOST_CHECK_THROW(parse_literal("a^b"), InvalidArgument);
    BOOST_CHECK_THROW(parse_literal("a\\"), InvalidArgument);
    BOOST_CHECK_THROW(parse_literal("a\\n"), InvalidArgument);
}


BOOST_AUTO_TEST_CASE(TestLiteralStringFormIsInjective)
{
    const std::vector<Literal> literals = {
        Literal{ "x@en" },
        Literal{ "x", std::string("en") },
        Literal{ "x@en", std::string("fr") },
        Literal{ "5^^foo" },
        Literal{ "5", std::nullopt, std::string("foo") },
        Literal{ "a\\" },
        Literal{ "a\\", std::string("en") },
        Literal{ "^", std::string("@"), std::string("^^x@y") },
        Literal{ "" },
        Literal{ "", std::string("") }
    };

    for (size_t i = 0; i < literals.size(); ++i)
    {
        const std::string str = string_form(literals[i]);
        BOOST_CHECK(parse_literal(str) == literals[i]);
        for (size_t j = i + 1; j < literals.size(); ++j)
            BOOST_CHECK_NE(str, string_form(literals[j]));
    }

    BOOST_CHECK_EQUAL(string_form(Literal{ "x@en" }), "x\\@en");
    BOOST_CHECK_EQUAL(string_form(Literal{ "5^^foo" }), "5\\^\\^foo");
}


BOOST_AUTO_TEST_CASE(TestTermFromString)
{
    BOOST_CHECK(term_from_string(ObjectFlavor::RESOURCE, "x@en") == Term(IRI{ "x@en" }));
    BOOST_CHECK(term_from_string(ObjectFlavor::LITERAL, "x@en")
        == Term(Literal{ "x", std::string("en") }));
}


BOOST_AUTO_TEST_CASE(TestQuadrupleRequiresTerms)
{
    BOOST_CHECK_THROW(Quadruple(IRI{ "" }, IRI{ "s" }, IRI{ "p" }, IRI{ "o" }), InvalidArgument);
    BOOST_CHECK_THROW(Quadruple(IRI{ "c" }, IRI{ "" }, IRI{ "p" }, IRI{ "o" }), InvalidArgument);
    BOOST_CHECK_THROW(Quadruple(IRI{ "c" }, IRI{ "s" }, IRI{ "" }, IRI{ "o" }), InvalidArgument);
    BOOST_CHECK_THROW(Quadruple(IRI{ "c" }, IRI{ "s" }, IRI{ "p" }, IRI{ "" }), InvalidArgument);

    // an empty literal is a legitimate value
    BOOST_CHECK_NO_THROW(Quadruple(IRI{ "c" }, IRI{ "s" }, IRI{ "p" }, Literal{ "" }));
}


BOOST_AUTO_TEST_CASE(TestDisplayString)
{
    const Quadruple q(IRI{ "c" }, IRI{ "s" }, IRI{ "p" }, Literal{ "o", std::string("en") });
    BOOST_CHECK_EQUAL(to_display_string(q), "<c> <s> <p> \"o\"@en");
}


BOOST_AUTO_TEST_CASE(TestPatternMatches)
{
    const Quadruple q(IRI{ "c" }, IRI{ "s" }, IRI{ "p" }, IRI{ "o" });

    BOOST_CHECK(pattern_matches(Pattern(), q));
    BOOST_CHECK(pattern_matches(Pattern::matching(q), q));
    BOOST_CHECK(pattern_matches(Pattern{ IRI{ "c" }, std::nullopt, std::nullopt, std::nullopt }, q));
    BOOST_CHECK(!pattern_matches(Pattern{ IRI{ "d" }, std::nullopt, std::nullopt, std::nullopt }, q));

    // same text, other kind
    BOOST_CHECK(!pattern_matches(Pattern{ std::nullopt, std::nullopt, std::nullopt, Term(Literal{ "o" }) }, q));
}


BOOST_AUTO_TEST_CASE(TestToQuadruple)
{
    Pattern pat{ IRI{ "c" }, IRI{ "s" }, IRI{ "p" }, std::nullopt };
    BOOST_CHECK_THROW(to_quadruple(pat), InvalidArgument);

    pat.obj = Term(Literal{ "o" });
    const Quadruple q = to_quadruple(pat);
    BOOST_CHECK(q.flavor() == ObjectFlavor::LITERAL);
    BOOST_CHECK(Pattern::matching(q) == pat);
}


BOOST_AUTO_TEST_SUITE_END();  // TermTests
