/******************************************************************************[ConflictAnalyzer.cc]
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

#include "core/ConflictAnalyzer.h"
#include "core/Solver.h"

using namespace TraceSat;

///////////////////////////////////////////////////////////////////////////////////////////////////
// CONSTRUCTORS

ConflictAnalyzer::ConflictAnalyzer(Solver& s)
    /////////////
    // Statistics

    : max_literals(0)
    , tot_literals(0)
    , resolutions(0)

    ////////////////////
    // Solver references

    , assignmentTrail(s.assignmentTrail)
    , clauseDatabase(s.clauseDatabase)
{}

///////////////////////////////////////////////////////////////////////////////////////////////////
// PUBLIC API

void ConflictAnalyzer::analyze(CRef confl, vec<Lit>& out_learnt, int& out_btlevel, ResolutionRecord& out_record) {
    // Generate conflict clause:
    out_learnt.clear();
    out_record.start = confl;
    out_record.steps.clear();
    getUIPClause(confl, out_learnt, out_record);

    // Update stats
    max_literals += out_learnt.size();
    for (int i = 0; i < out_learnt.size(); i++)
        if (assignmentTrail.level(var(out_learnt[i])) > 0)
            tot_literals++;

    // Find backtrack level:
    sortSecondLevel(out_learnt);
    out_btlevel = (out_learnt.size() <= 1) ? 0 : assignmentTrail.level(var(out_learnt[1]));

    // Clear 'seen[]'
    for (int j = 0; j < out_learnt.size(); j++)
        seen[var(out_learnt[j])] = 0;
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// HELPER FUNCTIONS

int ConflictAnalyzer::mergeClause(const Clause& c, Var pivot, vec<Lit>& learntClause) {
    const int dl = assignmentTrail.decisionLevel();
    int added = 0;

    for (int j = 0; j < c.size(); j++) {
        const Lit q = c[j];
        const Var x = var(q);
        if (x == pivot || seen[x]) continue;

        // Every literal of the implication structure must be false
        if (assignmentTrail.value(q) != l_False) {
            std::ostringstream ss;
            ss << "literal " << q << " in the conflict graph is not false";
            throw InvariantViolation(ss.str());
        }

        seen[x] = 1;
        if (assignmentTrail.level(x) == dl)
            added++;
        else
            learntClause.push(q);
    }

    return added;
}

void ConflictAnalyzer::getUIPClause(CRef confl, vec<Lit>& learntClause, ResolutionRecord& record) {
    // Initialize local data structures
    const int dl     = assignmentTrail.decisionLevel();
    const int bottom = assignmentTrail.indexOfDecisionLevel(dl);
    const int target = (dl == 0) ? 0 : 1;
    int index        = assignmentTrail.nAssigns() - 1;

    if (dl > 0) learntClause.push(lit_Undef); // (leave room for the asserting literal)

    int pathC = mergeClause(clauseDatabase[confl], var_Undef, learntClause);
    if (dl > 0 && pathC == 0)
        throw InvariantViolation("conflict clause has no literal at the current decision level");

    // Resolve away current-level literals, most recent first
    while (pathC > target) {
        while (index >= bottom && !seen[var(assignmentTrail[index])]) index--;
        if (index < bottom)
            throw InvariantViolation("working clause literal missing from the current decision level");

        const Lit  p      = assignmentTrail[index--];
        const Var  v      = var(p);
        const CRef reason = assignmentTrail.reason(v);
        if (reason == CRef_Undef) {
            std::ostringstream ss;
            ss << "variable " << (v + 1) << " at level " << dl << " has no reason clause";
            throw InvariantViolation(ss.str());
        }

        const Clause& c = clauseDatabase[reason];
        if (c.find(p) < 0) {
            std::ostringstream ss;
            ss << "reason clause " << reason << " does not contain implied literal " << p;
            throw InvariantViolation(ss.str());
        }

        // Mark variable as unseen: it is resolved away
        seen[v] = 0;
        pathC--;

        ResolutionStep step = { v, reason };
        record.steps.push_back(step);
        resolutions++;

        pathC += mergeClause(c, v, learntClause);
    }

    if (dl == 0) return;

    // The only current-level literal left is the UIP
    while (index >= bottom && !seen[var(assignmentTrail[index])]) index--;
    if (index < bottom)
        throw InvariantViolation("no UIP found at the current decision level");
    learntClause[0] = ~assignmentTrail[index];

    // Note: at this point, seen[v] is true iff v is in the learnt clause
}

void ConflictAnalyzer::sortSecondLevel(vec<Lit>& learntClause) const {
    // Nothing to do for unit clauses
    if (learntClause.size() <= 1) return;

    // Find the first literal assigned at the next-highest level:
    int max_i = 1;
    for (int i = 2; i < learntClause.size(); i++) {
        if (assignmentTrail.level(var(learntClause[i])) > assignmentTrail.level(var(learntClause[max_i])))
            max_i = i;
    }

    // Swap-in this literal at index 1:
    const Lit p           = learntClause[max_i];
    learntClause[max_i]   = learntClause[1];
    learntClause[1]       = p;
}
