/*******************************************************************************************[Util.h]
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

#ifndef TraceSat_TestUtil_h
#define TraceSat_TestUtil_h

#include <initializer_list>
#include <ostream>
#include <string>
#include <vector>

#include <catch2/catch.hpp>
#include <minisat/mtl/Vec.h>

#include "core/Solver.h"
#include "core/SolverTypes.h"

namespace TraceSat {

// A formula in signed DIMACS notation
typedef std::vector< std::vector<int> > Cnf;

// Utility methods
void setLitVec(vec<Lit>& v, const std::initializer_list<int>& elements);
void setLitVec(vec<Lit>& v, const std::vector<int>& elements);
void clause2Vec(vec<Lit>& v, const Clause& c);
std::vector<int> clause2Ints(const Clause& c);

/// @brief Create @code{nVars} variables and add every clause of @code{cnf} to a fresh solver
void loadFormula(Solver& s, int nVars, const Cnf& cnf);

/// @brief Check whether a model (indexed by Var) satisfies every clause of @code{cnf}
bool modelSatisfies(const Cnf& cnf, const vec<lbool>& model);

/// @brief Decide satisfiability by enumerating all assignments (small formulas only)
bool bruteForceSat(int nVars, const Cnf& cnf);

/// @brief Check whether every assignment satisfying @code{premises} satisfies @code{conclusion}
bool bruteForceImplies(int nVars, const Cnf& premises, const std::vector<int>& conclusion);

/**
 * @brief Replay a derivation: resolve the start clause with every antecedent in order.
 *
 * @param out the resolvent; fails the current test case if a pivot is missing
 */
void replayDerivation(const Solver& s, const ResolutionRecord& rec, vec<Lit>& out);

/// @brief Check trail positions, levels and reasons; returns an empty string if consistent
std::string trailProblem(const Solver& s);

/// @brief Deterministic random 3-CNF-like formula for property tests
Cnf randomFormula(unsigned seed, int nVars, int nClauses, int maxWidth);

inline std::ostream& operator<<(std::ostream& out, const vec<Lit>& v) {
    out << "{";
    for (int i = 0; i < v.size(); i++)
        out << (i == 0 ? " " : ", ") << v[i];
    return out << " }";
}

// Matchers
class VecEqual;
class VecEqualUnordered;

// Vector equality matcher and builder function
VecEqual vecEqual(const vec<Lit>& expect);
class VecEqual : public Catch::MatcherBase< vec<Lit> > {
public:
    VecEqual(const vec<Lit>& expect) : m_expect(expect) {}
    virtual bool match(const vec<Lit>& actual) const override;
    virtual std::string describe() const override;
private:
    const vec<Lit>& m_expect;
};

// Vector unordered equality matcher and builder function
VecEqualUnordered vecEqualUnordered(const vec<Lit>& expect);
class VecEqualUnordered : public Catch::MatcherBase< vec<Lit> > {
public:
    VecEqualUnordered(const vec<Lit>& expect) : m_expect(expect) {}
    virtual bool match(const vec<Lit>& actual) const override;
    virtual std::string describe() const override;
private:
    const vec<Lit>& m_expect;
};

}

#endif
