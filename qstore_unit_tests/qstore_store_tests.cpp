#include <stdexcept>
#include <functional>
#include <utility>
#include <vector>
#include <memory>
#include <boost/test/unit_test.hpp>
#include "qstore_store.h"
#include "qstore_memory_executor.h"
#include "qstore_errors.h"
#include "qstore_test_helpers.h"


using namespace qstore;


namespace
{


const IRI CTX{ "ex:ctx" }, SUB{ "ex:subj" }, PRED{ "ex:pred" };


/*
* An in-memory executor whose storage fails in a foreign way.
*/
class FailingExecutor :
    public MemoryExecutor
{
public:
    bool insert_if_absent(const StoredQuadruple&) override
    {
        throw std::runtime_error("disk on fire");
    }

    size_t delete_all() override
    {
        throw ExecutorFailure("already wrapped", 42);
    }
};


/*
* Iterates over a fixed list of rows.
*/
class FixedRowIterator :
    public IRowIterator
{
public:
    explicit FixedRowIterator(std::vector<QuadrupleRow> rows) :
        m_rows(std::move(rows)), m_idx(m_rows.size())
    { }

    void start() override { m_idx = 0; }
    QuadrupleRow current() const override { return m_rows[m_idx]; }
    void next() override { ++m_idx; }
    bool valid() const override { return m_idx < m_rows.size(); }

private:
    const std::vector<QuadrupleRow> m_rows;
    size_t m_idx;
};


/*
* An in-memory executor whose select hands back a fixed set of
* rows, whatever was stored.
*/
class FixedRowsExecutor :
    public MemoryExecutor
{
public:
    explicit FixedRowsExecutor(std::vector<QuadrupleRow> rows) :
        m_rows(std::move(rows))
    { }

    std::unique_ptr<IRowIterator> select_by_predicates(const LookupDescriptor&) override
    {
        return std::make_unique<FixedRowIterator>(m_rows);
    }

private:
    const std::vector<QuadrupleRow> m_rows;
};


}  // namespace


BOOST_AUTO_TEST_SUITE(StoreTests);


BOOST_AUTO_TEST_CASE(TestIdempotentAdd)
{
    MemoryExecutor exec;
    const Quadruple q(CTX, SUB, PRED, Literal{ "hello" });

    BOOST_CHECK(add(exec, q));
    BOOST_CHECK(!add(exec, q));
    BOOST_CHECK_EQUAL(count(exec), 1);
    BOOST_CHECK_EQUAL(select(exec, Pattern()).size(), 1);
}


BOOST_AUTO_TEST_CASE(TestNullSafety)
{
    MemoryExecutor exec;
    const Quadruple q(CTX, SUB, PRED, IRI{ "ex:o" });
    BOOST_REQUIRE(add(exec, q));

    BOOST_CHECK(!add(exec, std::nullopt));
    BOOST_CHECK_EQUAL(remove(exec, std::nullopt), 0);
    BOOST_CHECK(!contains(exec, std::nullopt));
    BOOST_CHECK_EQUAL(merge(exec, nullptr), 0);
    BOOST_CHECK_EQUAL(merge(exec, nullptr, IRI{ "ex:other" }), 0);

    BOOST_CHECK_EQUAL(remove_by_context(exec, std::nullopt), 0);
    BOOST_CHECK_EQUAL(remove_by_object(exec, std::nullopt), 0);
    BOOST_CHECK_EQUAL(remove_by_context_subject(exec, std::nullopt, SUB), 0);
    BOOST_CHECK_EQUAL(remove_by_context_subject(exec, CTX, std::nullopt), 0);
    BOOST_CHECK_EQUAL(remove_by_subject_predicate_object(exec, SUB, PRED, std::nullopt), 0);
    BOOST_CHECK_EQUAL(remove_by_context_subject_predicate_object(exec,
        CTX, SUB, std::nullopt, Term(IRI{ "ex:o" })), 0);
    BOOST_CHECK_EQUAL(remove_matching(exec, Pattern()), 0);

    BOOST_CHECK_EQUAL(count(exec), 1);
    BOOST_CHECK(contains(exec, q));
}


BOOST_AUTO_TEST_CASE(TestFlavorSeparation)
{
    MemoryExecutor exec;
    const Quadruple r(CTX, SUB, PRED, IRI{ "x" });
    const Quadruple l(CTX, SUB, PRED, Literal{ "x" });

    BOOST_CHECK(add(exec, r));
    BOOST_CHECK(add(exec, l));
    BOOST_CHECK_EQUAL(count(exec), 2);

    const auto by_res = select(exec, Pattern{ std::nullopt, SUB, PRED, Term(IRI{ "x" }) });
    BOOST_REQUIRE_EQUAL(by_res.size(), 1);
    BOOST_CHECK(*by_res.begin() == r);

    const auto by_lit = select(exec, Pattern{ std::nullopt, SUB, PRED, Term(Literal{ "x" }) });
    BOOST_REQUIRE_EQUAL(by_lit.size(), 1);
    BOOST_CHECK(*by_lit.begin() == l);

    // removing one leaves the other
    BOOST_CHECK_EQUAL(remove_by_object(exec, Term(Literal{ "x" })), 1);
    BOOST_CHECK(contains(exec, r));
    BOOST_CHECK(!contains(exec, l));
}


BOOST_AUTO_TEST_CASE(TestRoundTrip)
{
    MemoryExecutor exec;
    const Quadruple q(CTX, SUB, PRED, Literal{ "5", std::nullopt,
        std::string("http://www.w3.org/2001/XMLSchema#int") });

    BOOST_REQUIRE(add(exec, q));
    const auto found = select(exec, Pattern::matching(q));
    BOOST_REQUIRE_EQUAL(found.size(), 1);
    BOOST_CHECK(*found.begin() == q);
    BOOST_CHECK(found.contains(q));

    BOOST_CHECK_EQUAL(remove(exec, q), 1);
    BOOST_CHECK(select(exec, Pattern::matching(q)).empty());
    BOOST_CHECK_EQUAL(remove(exec, q), 0);
}


BOOST_AUTO_TEST_CASE(TestLiteralsWithDelimitersStayDistinct)
{
    MemoryExecutor exec;
    const Quadruple plain(CTX, SUB, PRED, Literal{ "x@en" });
    const Quadruple tagged(CTX, SUB, PRED, Literal{ "x", std::string("en") });
    const Quadruple typed_text(CTX, SUB, PRED, Literal{ "5^^foo" });
    const Quadruple typed(CTX, SUB, PRED, Literal{ "5", std::nullopt, std::string("foo") });

    BOOST_CHECK_NE(plain.id(), tagged.id());
    BOOST_CHECK_NE(typed_text.id(), typed.id());

    BOOST_CHECK(add(exec, plain));
    BOOST_CHECK(add(exec, tagged));
    BOOST_CHECK(add(exec, typed_text));
    BOOST_CHECK(add(exec, typed));
    BOOST_CHECK_EQUAL(count(exec), 4);

    for (const Quadruple& q : { plain, tagged, typed_text, typed })
    {
        const auto found = select(exec, Pattern::matching(q));
        BOOST_REQUIRE_EQUAL(found.size(), 1);
        BOOST_CHECK(*found.begin() == q);
    }

    BOOST_CHECK_EQUAL(remove(exec, plain), 1);
    BOOST_CHECK(contains(exec, tagged));
    BOOST_CHECK_EQUAL(count(exec), 3);
}


BOOST_AUTO_TEST_CASE(TestPatternCompleteness)
{
    MemoryExecutor exec;
    const auto all = test::sample_quadruples();
    for (const auto& q : all)
        BOOST_REQUIRE(add(exec, q));

    for (const auto& q : all)
    {
        for (const auto& pat : test::patterns_around(q))
        {
            const auto expected = test::brute_force_select(all, pat);
            const auto actual = select(exec, pat);
            BOOST_CHECK(test::same_quadruples(expected, actual));
        }
    }

    exec.check_integrity();
}


BOOST_AUTO_TEST_CASE(TestRemoveMatchingIsComplete)
{
    const auto all = test::sample_quadruples();

    for (const auto& pat : test::patterns_around(all.back()))
    {
        MemoryExecutor exec;
        for (const auto& q : all)
            BOOST_REQUIRE(add(exec, q));

        const auto expected = test::brute_force_select(all, pat);
        BOOST_CHECK_EQUAL(remove_matching(exec, pat), expected.size());
        BOOST_CHECK_EQUAL(count(exec), all.size() - expected.size());
        BOOST_CHECK(select(exec, pat).empty());
        exec.check_integrity();
    }
}


BOOST_AUTO_TEST_CASE(TestNamedRemovals)
{
    const auto all = test::sample_quadruples();
    const IRI c{ "ex:c1" }, s{ "ex:s1" }, p{ "ex:p1" };
    const Term o = Literal{ "ex:o1" };

    // each removal, and the number of sample quadruples it should hit
    const std::vector<std::pair<std::function<size_t(IExecutor&)>, size_t>> removals = {
        { [&](IExecutor& e) { return remove_by_context(e, c); }, 12 },
        { [&](IExecutor& e) { return remove_by_subject(e, s); }, 12 },
        { [&](IExecutor& e) { return remove_by_predicate(e, p); }, 12 },
        { [&](IExecutor& e) { return remove_by_object(e, o); }, 8 },
        { [&](IExecutor& e) { return remove_by_context_subject(e, c, s); }, 6 },
        { [&](IExecutor& e) { return remove_by_context_predicate(e, c, p); }, 6 },
        { [&](IExecutor& e) { return remove_by_context_object(e, c, o); }, 4 },
        { [&](IExecutor& e) { return remove_by_subject_predicate(e, s, p); }, 6 },
        { [&](IExecutor& e) { return remove_by_subject_object(e, s, o); }, 4 },
        { [&](IExecutor& e) { return remove_by_predicate_object(e, p, o); }, 4 },
        { [&](IExecutor& e) { return remove_by_context_subject_predicate(e, c, s, p); }, 3 },
        { [&](IExecutor& e) { return remove_by_context_subject_object(e, c, s, o); }, 2 },
        { [&](IExecutor& e) { return remove_by_context_predicate_object(e, c, p, o); }, 2 },
        { [&](IExecutor& e) { return remove_by_subject_predicate_object(e, s, p, o); }, 2 },
        { [&](IExecutor& e) { return remove_by_context_subject_predicate_object(e, c, s, p, o); }, 1 },
    };

    for (const auto& [removal, hits] : removals)
    {
        MemoryExecutor exec;
        for (const auto& q : all)
            BOOST_REQUIRE(add(exec, q));

        BOOST_CHECK_EQUAL(removal(exec), hits);
        BOOST_CHECK_EQUAL(count(exec), all.size() - hits);
    }
}


BOOST_AUTO_TEST_CASE(TestClearVersusEmptyPattern)
{
    MemoryExecutor exec;
    const auto all = test::sample_quadruples();
    for (const auto& q : all)
        BOOST_REQUIRE(add(exec, q));

    BOOST_CHECK_EQUAL(remove_matching(exec, Pattern()), 0);
    BOOST_CHECK_EQUAL(count(exec), all.size());

    BOOST_CHECK_EQUAL(clear(exec), all.size());
    BOOST_CHECK_EQUAL(count(exec), 0);
    BOOST_CHECK(select(exec, Pattern()).empty());
}


BOOST_AUTO_TEST_CASE(TestContextScenario)
{
    MemoryExecutor exec;
    const Quadruple q(CTX, SUB, PRED, Literal{ "hello" });
    BOOST_REQUIRE(add(exec, q));

    const auto in_ctx = select(exec, Pattern{ CTX, std::nullopt, std::nullopt, std::nullopt });
    BOOST_CHECK_EQUAL(in_ctx.size(), 1);
    BOOST_CHECK(in_ctx.contains(q));

    BOOST_CHECK(select(exec, Pattern{ IRI{ "ex:ctx2" }, std::nullopt, std::nullopt, std::nullopt }).empty());

    BOOST_CHECK_EQUAL(remove_by_context_subject(exec, CTX, SUB), 1);
    BOOST_CHECK(select(exec, Pattern()).empty());
}


BOOST_AUTO_TEST_CASE(TestResourceScenario)
{
    MemoryExecutor exec;
    const IRI ctx1{ "ex:ctx1" }, s{ "ex:s" }, p{ "ex:p" };
    BOOST_REQUIRE(add(exec, Quadruple(ctx1, s, p, IRI{ "x" })));
    BOOST_REQUIRE(add(exec, Quadruple(ctx1, s, p, Literal{ "x" })));

    const auto result = select(exec, Pattern{ std::nullopt, s, p, Term(IRI{ "x" }) });
    BOOST_REQUIRE_EQUAL(result.size(), 1);
    BOOST_CHECK(result.begin()->flavor() == ObjectFlavor::RESOURCE);
}


BOOST_AUTO_TEST_CASE(TestMergeContexts)
{
    MemoryExecutor exec;

    Graph unnamed;
    unnamed.add(Triple{ SUB, PRED, Literal{ "a" } });
    unnamed.add(Triple{ SUB, PRED, Literal{ "b" } });

    BOOST_CHECK_EQUAL(merge(exec, &unnamed), 2);
    BOOST_CHECK_EQUAL(select(exec, Pattern{ IRI{ DEFAULT_CONTEXT },
        std::nullopt, std::nullopt, std::nullopt }).size(), 2);

    // merging again adds nothing
    BOOST_CHECK_EQUAL(merge(exec, &unnamed), 0);

    BOOST_CHECK_EQUAL(merge(exec, &unnamed, IRI{ "ex:override" }), 2);
    BOOST_CHECK_EQUAL(select(exec, Pattern{ IRI{ "ex:override" },
        std::nullopt, std::nullopt, std::nullopt }).size(), 2);

    // a graph's own context wins over the override
    Graph named(IRI{ "ex:named" });
    named.add(Triple{ SUB, PRED, IRI{ "ex:o" } });
    BOOST_CHECK_EQUAL(merge(exec, &named, IRI{ "ex:override" }), 1);
    BOOST_CHECK(contains(exec, Quadruple(IRI{ "ex:named" }, SUB, PRED, IRI{ "ex:o" })));

    BOOST_CHECK_EQUAL(count(exec), 5);
}


BOOST_AUTO_TEST_CASE(TestMergeIsAtomic)
{
    MemoryExecutorOptions options;
    options.max_quadruples = 3;
    MemoryExecutor exec(options);

    BOOST_REQUIRE(add(exec, Quadruple(CTX, SUB, PRED, Literal{ "a" })));

    Graph g(CTX);
    g.add(Triple{ SUB, PRED, Literal{ "a" } });  // already present
    g.add(Triple{ SUB, PRED, Literal{ "b" } });
    g.add(Triple{ SUB, PRED, Literal{ "c" } });
    g.add(Triple{ SUB, PRED, Literal{ "d" } });

    BOOST_CHECK_THROW(merge(exec, &g), ExecutorFailure);
    BOOST_CHECK_EQUAL(count(exec), 1);
    BOOST_CHECK(!contains(exec, Quadruple(CTX, SUB, PRED, Literal{ "b" })));
    exec.check_integrity();

    // a triple which cannot form a quadruple stops the merge up front
    Graph bad(CTX);
    bad.add(Triple{ SUB, PRED, Literal{ "e" } });
    bad.add(Triple{ IRI{ "" }, PRED, Literal{ "f" } });
    BOOST_CHECK_THROW(merge(exec, &bad), InvalidArgument);
    BOOST_CHECK_EQUAL(count(exec), 1);
}


BOOST_AUTO_TEST_CASE(TestFailuresAreWrapped)
{
    FailingExecutor exec;
    const Quadruple q(CTX, SUB, PRED, IRI{ "ex:o" });

    try
    {
        add(exec, q);
        BOOST_FAIL("expected an ExecutorFailure");
    }
    catch (const ExecutorFailure& e)
    {
        BOOST_CHECK(!e.code());
        try
        {
            std::rethrow_if_nested(e);
            BOOST_FAIL("expected a nested exception");
        }
        catch (const std::runtime_error& nested)
        {
            BOOST_CHECK_EQUAL(std::string(nested.what()), "disk on fire");
        }
    }

    // our own errors pass through untouched
    try
    {
        clear(exec);
        BOOST_FAIL("expected an ExecutorFailure");
    }
    catch (const ExecutorFailure& e)
    {
        BOOST_REQUIRE(e.code());
        BOOST_CHECK_EQUAL(*e.code(), 42);
    }
}


BOOST_AUTO_TEST_CASE(TestCorruptRowsAreExecutorFailures)
{
    // no context, which no quadruple can have
    FixedRowsExecutor exec({ QuadrupleRow{ ObjectFlavor::RESOURCE, "", "ex:s", "ex:p", "ex:o" } });

    try
    {
        select(exec, Pattern());
        BOOST_FAIL("expected an ExecutorFailure");
    }
    catch (const ExecutorFailure& e)
    {
        BOOST_CHECK(std::string(e.what()).find("corrupt stored row") != std::string::npos);
        try
        {
            std::rethrow_if_nested(e);
            BOOST_FAIL("expected a nested exception");
        }
        catch (const InvalidArgument& nested)
        {
            BOOST_CHECK(std::string(nested.what()).find("Invalid argument") == 0);
        }
    }

    // an undecodable literal is storage corruption too
    FixedRowsExecutor bad_literal({ QuadrupleRow{ ObjectFlavor::LITERAL, "ex:c", "ex:s", "ex:p", "a^b" } });
    BOOST_CHECK_THROW(select(bad_literal, Pattern()), ExecutorFailure);

    // well-formed rows still come through
    FixedRowsExecutor good({ QuadrupleRow{ ObjectFlavor::LITERAL, "ex:c", "ex:s", "ex:p", "x\\@en" } });
    const auto found = select(good, Pattern());
    BOOST_REQUIRE_EQUAL(found.size(), 1);
    BOOST_CHECK(found.begin()->object() == Term(Literal{ "x@en" }));
}


BOOST_AUTO_TEST_SUITE_END();  // StoreTests
