/****************************************************************************[TestClauseDatabase.cc]
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

#include <sstream>

#include <catch2/catch.hpp>
#include <test/Util.h>
#include <core/Solver.h>
#include <core/SolverTypes.h>

namespace TraceSat {

SCENARIO("Storing clauses", "[ClauseDatabase]") {
    GIVEN("An empty clause database") {
        Solver s;
        ClauseDatabase& cd = s.clauseDatabase;
        vec<Lit> ps, actual, expect;
        for (int i = 0; i < 3; i++) s.newVar();

        WHEN("an input clause with a repeated literal is added") {
            setLitVec(ps, {1, -2, 1});
            const CRef cr = cd.addInputClause(ps);

            THEN("the duplicate is dropped and the clause is an original clause") {
                REQUIRE(cr == 0);
                setLitVec(expect, {1, -2});
                clause2Vec(actual, cd[cr]);
                REQUIRE_THAT(actual, vecEqual(expect));
                REQUIRE(cd[cr].kind() == ClauseKind::ORIGINAL);
                REQUIRE(cd.nClauses() == 1);
                REQUIRE(cd.nLearnts() == 0);
                REQUIRE(cd.clauses_literals == 2);
            }
        }

        WHEN("a tautology is added") {
            setLitVec(ps, {2, -2});
            const CRef cr = cd.addInputClause(ps);

            THEN("it is stored as given") {
                REQUIRE(cd[cr].size() == 2);
            }
        }

        WHEN("input and learnt clauses are interleaved") {
            setLitVec(ps, {1, 2});
            const CRef c0 = cd.addInputClause(ps);
            setLitVec(ps, {-1});
            const CRef c1 = cd.addLearntClause(ps);
            ps.clear();
            const CRef c2 = cd.addLearntClause(ps);

            THEN("references are handed out in creation order") {
                REQUIRE(c0 == 0);
                REQUIRE(c1 == 1);
                REQUIRE(c2 == 2);
                REQUIRE(cd.size() == 3);
                REQUIRE(cd.originals().size() == 1);
                REQUIRE(cd.originals()[0] == c0);
                REQUIRE(cd.learnt().size() == 2);
                REQUIRE(cd.learnt()[0] == c1);
                REQUIRE(cd.learnt()[1] == c2);
                REQUIRE(cd[c1].learnt());
                REQUIRE(cd[c2].empty());
                REQUIRE(cd.learnts_literals == 1);
            }
        }

        WHEN("clauses sharing literals are added one after another") {
            setLitVec(ps, {1, 2});
            const CRef c0 = cd.addInputClause(ps);
            setLitVec(ps, {2, 1, 2, 3});
            const CRef c1 = cd.addInputClause(ps);
            ps.clear();
            const CRef c2 = cd.addInputClause(ps);
            setLitVec(ps, {-3, 1});
            const CRef c3 = cd.addInputClause(ps);

            THEN("duplicates are only removed within a clause") {
                setLitVec(expect, {1, 2});
                clause2Vec(actual, cd[c0]);
                REQUIRE_THAT(actual, vecEqual(expect));

                setLitVec(expect, {2, 1, 3});
                clause2Vec(actual, cd[c1]);
                REQUIRE_THAT(actual, vecEqual(expect));

                REQUIRE(cd[c2].empty());

                setLitVec(expect, {-3, 1});
                clause2Vec(actual, cd[c3]);
                REQUIRE_THAT(actual, vecEqual(expect));
                REQUIRE(cd.clauses_literals == 7);
            }
        }

        THEN("looking up an unknown reference throws") {
            REQUIRE_THROWS_AS(cd[0], InvariantViolation);
            REQUIRE_THROWS_AS(cd[CRef_Undef], InvariantViolation);
        }
    }
}

SCENARIO("Writing clauses in DIMACS format", "[ClauseDatabase]") {
    GIVEN("A database with three input clauses") {
        Solver s;
        loadFormula(s, 3, {{1, -2}, {3}, {-1, 2, -3}});
        std::ostringstream out;

        WHEN("a subset of the clauses is written") {
            s.clauseDatabase.toDimacs(out, std::vector<CRef>({0, 2}), s.nVars());

            THEN("the header counts only the written clauses") {
                REQUIRE(out.str() == "p cnf 3 2\n1 -2 0\n-1 2 -3 0\n");
            }
        }

        WHEN("no clause is written") {
            s.clauseDatabase.toDimacs(out, std::vector<CRef>(), s.nVars());

            THEN("only the header is produced") {
                REQUIRE(out.str() == "p cnf 3 0\n");
            }
        }
    }
}

}
