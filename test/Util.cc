/******************************************************************************************[Util.cc]
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

#include <cstdlib>

#include <sstream>

#include <minisat/mtl/Sort.h>

#include "test/Util.h"

namespace TraceSat {

void setLitVec(vec<Lit>& v, const std::initializer_list<int>& elements) {
    v.clear();
    for (const auto element : elements) v.push(fromDimacs(element));
}

void setLitVec(vec<Lit>& v, const std::vector<int>& elements) {
    v.clear();
    for (const auto element : elements) v.push(fromDimacs(element));
}

void clause2Vec(vec<Lit>& v, const Clause& c) {
    v.clear();
    for (int i = 0; i < c.size(); i++) v.push(c[i]);
}

std::vector<int> clause2Ints(const Clause& c) {
    std::vector<int> out;
    for (int i = 0; i < c.size(); i++) out.push_back(toDimacs(c[i]));
    return out;
}

void loadFormula(Solver& s, int nVars, const Cnf& cnf) {
    vec<Lit> ps;
    for (int i = 0; i < nVars; i++) s.newVar();
    for (const auto& clause : cnf) {
        setLitVec(ps, clause);
        s.addClause(ps);
    }
}

static bool satisfiedBy(const std::vector<int>& clause, unsigned long mask) {
    for (const auto lit : clause) {
        const bool val = (mask >> (std::abs(lit) - 1)) & 1;
        if (val == (lit > 0)) return true;
    }
    return false;
}

bool modelSatisfies(const Cnf& cnf, const vec<lbool>& model) {
    for (const auto& clause : cnf) {
        bool sat = false;
        for (const auto lit : clause) {
            const lbool val = model[std::abs(lit) - 1];
            if (val == l_Undef) continue;
            if ((val == l_True) == (lit > 0)) { sat = true; break; }
        }
        if (!sat) return false;
    }
    return true;
}

bool bruteForceSat(int nVars, const Cnf& cnf) {
    for (unsigned long mask = 0; mask < (1ul << nVars); mask++) {
        bool all = true;
        for (const auto& clause : cnf)
            if (!satisfiedBy(clause, mask)) { all = false; break; }
        if (all) return true;
    }
    return false;
}

bool bruteForceImplies(int nVars, const Cnf& premises, const std::vector<int>& conclusion) {
    for (unsigned long mask = 0; mask < (1ul << nVars); mask++) {
        bool all = true;
        for (const auto& clause : premises)
            if (!satisfiedBy(clause, mask)) { all = false; break; }
        if (all && !satisfiedBy(conclusion, mask)) return false;
    }
    return true;
}

static bool contains(const vec<Lit>& v, Lit p) {
    for (int i = 0; i < v.size(); i++)
        if (v[i] == p) return true;
    return false;
}

void replayDerivation(const Solver& s, const ResolutionRecord& rec, vec<Lit>& out) {
    clause2Vec(out, s.clauseDatabase[rec.start]);

    for (const auto& step : rec.steps) {
        const Clause antecedent = s.clauseDatabase[step.antecedent];
        vec<Lit> next;
        bool inWork = false, inAntecedent = false;

        for (int i = 0; i < out.size(); i++) {
            if (var(out[i]) == step.pivot) inWork = true;
            else next.push(out[i]);
        }
        for (const auto p : antecedent) {
            if (var(p) == step.pivot) inAntecedent = true;
            else if (!contains(next, p)) next.push(p);
        }
        REQUIRE(inWork);
        REQUIRE(inAntecedent);
        next.moveTo(out);
    }
}

std::string trailProblem(const Solver& s) {
    const AssignmentTrail& trail = s.assignmentTrail;
    std::ostringstream ss;

    for (int i = 0; i < trail.nAssigns(); i++) {
        const Lit p = trail[i];
        const Var v = var(p);
        if (trail.value(p) != l_True) { ss << "trail literal " << p << " is not true"; break; }
        if (trail.position(v) != i)   { ss << "wrong position for " << p; break; }
        if (i > 0 && trail.level(var(trail[i - 1])) > trail.level(v)) { ss << "levels decrease at " << p; break; }

        const CRef reason = trail.reason(v);
        if (reason == CRef_Undef) {
            // Decisions open a level
            if (trail.level(v) == 0 || trail.indexOfDecisionLevel(trail.level(v)) != i) {
                ss << "decision " << p << " does not open its level";
                break;
            }
            continue;
        }

        const Clause& c = s.clauseDatabase[reason];
        if (c.find(p) < 0) { ss << "reason of " << p << " does not contain it"; break; }
        for (const auto q : c) {
            if (q == p) continue;
            if (trail.value(q) != l_False || trail.position(var(q)) > i) {
                ss << "reason of " << p << " was not unit when it fired";
                break;
            }
        }
    }

    return ss.str();
}

Cnf randomFormula(unsigned seed, int nVars, int nClauses, int maxWidth) {
    // Small linear congruential generator so that formulas are identical on every platform
    unsigned long state = seed * 2654435761ul + 1;
    auto next = [&state](int bound) {
        state = (state * 6364136223846793005ull + 1442695040888963407ull) & 0xffffffffffffull;
        return static_cast<int>((state >> 16) % static_cast<unsigned long>(bound));
    };

    Cnf cnf;
    for (int i = 0; i < nClauses; i++) {
        std::vector<int> clause;
        const int width = 1 + next(maxWidth);
        for (int j = 0; j < width; j++) {
            const int v = 1 + next(nVars);
            clause.push_back(next(2) ? v : -v);
        }
        cnf.push_back(clause);
    }
    return cnf;
}

/////////////////////////////
// Vector equality matcher //
/////////////////////////////

VecEqual vecEqual(const vec<Lit>& expect) { return VecEqual(expect); }

bool VecEqual::match(const vec<Lit>& actual) const {
    if (actual.size() != m_expect.size()) return false;
    for (int i = 0; i < actual.size(); i++)
        if (actual[i] != m_expect[i])
            return false;
    return true;
}

std::string VecEqual::describe() const {
    std::ostringstream ss;
    ss << "is equal to " << m_expect;
    return ss.str();
}

///////////////////////////////////////
// Vector unordered equality matcher //
///////////////////////////////////////

VecEqualUnordered vecEqualUnordered(const vec<Lit>& expect) { return VecEqualUnordered(expect); }

bool VecEqualUnordered::match(const vec<Lit>& actual) const {
    if (actual.size() != m_expect.size()) return false;
    vec<Lit> a, e;
    actual.copyTo(a);
    m_expect.copyTo(e);
    Minisat::sort(a);
    Minisat::sort(e);
    for (int i = 0; i < a.size(); i++)
        if (a[i] != e[i])
            return false;
    return true;
}

std::string VecEqualUnordered::describe() const {
    std::ostringstream ss;
    ss << "is equal to a permutation of " << m_expect;
    return ss.str();
}

}
