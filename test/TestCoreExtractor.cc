/*****************************************************************************[TestCoreExtractor.cc]
MiniSat -- Copyright (c) 2003-2006, Niklas Een, Niklas Sorensson
           Copyright (c) 2007-2010, Niklas Sorensson

MapleSAT_Refactor, based on MapleSAT -- Copyright (c) 2022, Jonathan Chung, Vijay Ganesh, Sam Buss

Permission is hereby granted, free of charge, to any person obtaining a copy of this software and
associated documentation files (the "Software"), to deal in the Software without restriction,
including without limitation the rights to use, copy, modify, merge, publish, distribute,
sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all copies or
substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT
NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM,
DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT
OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
**************************************************************************************************/

#include <catch2/catch.hpp>
#include <test/Util.h>
#include <core/Solver.h>
#include <core/SolverTypes.h>

namespace TraceSat {

static ResolutionRecord mkRecord(CRef start, const std::vector<ResolutionStep>& steps) {
    ResolutionRecord rec;
    rec.start = start;
    rec.steps = steps;
    return rec;
}

SCENARIO("Recording derivations", "[ResolutionTracer]") {
    GIVEN("An empty tracer") {
        Solver s;
        ResolutionTracer& rt = s.resolutionTracer;

        THEN("no clause has a derivation") {
            REQUIRE(rt.size() == 0);
            REQUIRE(rt.lookup(0) == nullptr);
            REQUIRE(rt.lookup(CRef_Undef) == nullptr);
        }

        WHEN("a derivation is recorded") {
            rt.record(4, mkRecord(2, {{1, 1}, {0, 0}}));

            THEN("it can be looked up") {
                const ResolutionRecord* rec = rt.lookup(4);
                REQUIRE(rec != nullptr);
                REQUIRE(rec->start == 2);
                REQUIRE(rec->steps.size() == 2);
                REQUIRE(rec->steps[1].antecedent == 0);
                REQUIRE(rt.size() == 1);
                REQUIRE(rt.lookup(3) == nullptr);
            }

            THEN("recording it a second time throws") {
                REQUIRE_THROWS_AS(rt.record(4, mkRecord(1, {})), InvariantViolation);
                REQUIRE(rt.size() == 1);
            }
        }

        THEN("recording a derivation for an undefined clause throws") {
            REQUIRE_THROWS_AS(rt.record(CRef_Undef, mkRecord(0, {})), InvariantViolation);
        }
    }
}

SCENARIO("Extracting an unsatisfiable core", "[CoreExtractor]") {
    GIVEN("A refutation that uses three of four input clauses") {
        Solver s;
        vec<Lit> ps;
        loadFormula(s, 2, {{1}, {-1, 2}, {-2}, {1, 2}});

        ps.clear();
        const CRef empty = s.clauseDatabase.addLearntClause(ps);
        s.resolutionTracer.record(empty, mkRecord(2, {{1, 1}, {0, 0}}));

        THEN("the core contains exactly the clauses used") {
            REQUIRE(s.coreExtractor.extractCore(empty) == std::vector<CRef>({0, 1, 2}));
        }
    }

    GIVEN("A refutation through an intermediate learnt clause") {
        Solver s;
        vec<Lit> ps;
        loadFormula(s, 2, {{-2}, {-1, 2}, {1}});

        // {-1, 2} resolved with {1} on x1 gives {2}
        setLitVec(ps, {2});
        const CRef mid = s.clauseDatabase.addLearntClause(ps);
        s.resolutionTracer.record(mid, mkRecord(1, {{0, 2}}));

        // {-2} resolved with {2} on x2 gives the empty clause
        ps.clear();
        const CRef empty = s.clauseDatabase.addLearntClause(ps);
        s.resolutionTracer.record(empty, mkRecord(0, {{1, mid}}));

        THEN("the core is collected through the intermediate clause and sorted") {
            REQUIRE(s.coreExtractor.extractCore(empty) == std::vector<CRef>({0, 1, 2}));
        }

        THEN("the core of the intermediate clause omits the clause it does not use") {
            REQUIRE(s.coreExtractor.extractCore(mid) == std::vector<CRef>({1, 2}));
        }

        THEN("the derivations replay to the stored clauses") {
            vec<Lit> replayed, expect;

            replayDerivation(s, *s.resolutionTracer.lookup(mid), replayed);
            setLitVec(expect, {2});
            REQUIRE_THAT(replayed, vecEqual(expect));

            replayDerivation(s, *s.resolutionTracer.lookup(empty), replayed);
            REQUIRE(replayed.size() == 0);
        }
    }

    GIVEN("A refutation that reaches some input clauses along several paths") {
        Solver s;
        vec<Lit> ps;
        loadFormula(s, 2, {{1, 2}, {1, -2}, {-1, 2}, {-1, -2}});

        setLitVec(ps, {1});
        const CRef a = s.clauseDatabase.addLearntClause(ps);
        s.resolutionTracer.record(a, mkRecord(0, {{1, 1}}));

        setLitVec(ps, {-1});
        const CRef b = s.clauseDatabase.addLearntClause(ps);
        s.resolutionTracer.record(b, mkRecord(2, {{1, 3}}));

        setLitVec(ps, {2});
        const CRef c = s.clauseDatabase.addLearntClause(ps);
        s.resolutionTracer.record(c, mkRecord(2, {{0, a}}));

        ps.clear();
        const CRef empty = s.clauseDatabase.addLearntClause(ps);
        s.resolutionTracer.record(empty, mkRecord(c, {{1, 1}, {0, b}}));

        THEN("each input clause appears once") {
            REQUIRE(s.coreExtractor.extractCore(empty) == std::vector<CRef>({0, 1, 2, 3}));
        }

        THEN("every derivation replays to its clause") {
            vec<Lit> replayed, expect;
            const CRef     learnts[] = { a, b, c };
            const int      units  [] = { 1, -1, 2 };

            for (int i = 0; i < 3; i++) {
                replayDerivation(s, *s.resolutionTracer.lookup(learnts[i]), replayed);
                setLitVec(expect, {units[i]});
                REQUIRE_THAT(replayed, vecEqual(expect));
            }

            replayDerivation(s, *s.resolutionTracer.lookup(empty), replayed);
            REQUIRE(replayed.size() == 0);
        }
    }

    GIVEN("An input clause as the root") {
        Solver s;
        loadFormula(s, 1, {{1}, {}});

        THEN("the core is the clause itself") {
            REQUIRE(s.coreExtractor.extractCore(1) == std::vector<CRef>({1}));
        }
    }

    GIVEN("A learnt clause without a derivation") {
        Solver s;
        vec<Lit> ps;
        loadFormula(s, 1, {{1}});
        ps.clear();
        const CRef orphan = s.clauseDatabase.addLearntClause(ps);

        THEN("extraction throws") {
            REQUIRE_THROWS_AS(s.coreExtractor.extractCore(orphan), InvariantViolation);
        }
    }

    GIVEN("A derivation that refers to an unknown clause") {
        Solver s;
        vec<Lit> ps;
        loadFormula(s, 1, {{1}});
        ps.clear();
        const CRef empty = s.clauseDatabase.addLearntClause(ps);
        s.resolutionTracer.record(empty, mkRecord(0, {{0, 42}}));

        THEN("extraction throws") {
            REQUIRE_THROWS_AS(s.coreExtractor.extractCore(empty), InvariantViolation);
            REQUIRE_THROWS_AS(s.coreExtractor.extractCore(CRef_Undef), InvariantViolation);
        }
    }
}

}
