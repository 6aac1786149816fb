/****************************************************************************************[Solver.cc]
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

#include <stdio.h>
#include <sstream>

#include <minisat/utils/Options.h>

#include "core/Solver.h"

using namespace TraceSat;
using Minisat::IntOption;
using Minisat::IntRange;

//=================================================================================================
// Options:


static const char* _cat = "CORE";

static IntOption opt_progress_interval(_cat, "progress", "Number of conflicts between two progress lines (verbosity 1)", 100, IntRange(1, INT32_MAX));

const char* TraceSat::toString(SolverState s) {
    switch (s) {
        case SolverState::SEARCHING: return "SEARCHING";
        case SolverState::CONFLICT:  return "CONFLICT";
        case SolverState::SAT:       return "SAT";
        case SolverState::UNSAT:     return "UNSAT";
    }
    return "?";
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// CONSTRUCTORS

Solver::Solver()
    // Results
    : finalClause(CRef_Undef)

    // Parameters
    , verbosity(0)
    , progress_interval(opt_progress_interval)

    // Statistics
    , conflicts(0)
    , steps(0)
    , backjumps(0)

    // Member variables
    , status(SolverState::SEARCHING)
    , conflictClause(CRef_Undef)
    , started(false)
    , conflict_budget(-1)

    // Solver components
    , clauseDatabase           (*this)
    , assignmentTrail          (*this)
    , unitPropagator           (*this)
    , branchingHeuristicManager(*this)
    , resolutionTracer         (*this)
    , conflictAnalyzer         (*this)
    , coreExtractor            (*this)
{}

Solver::~Solver() {}

///////////////////////////////////////////////////////////////////////////////////////////////////
// PROBLEM SPECIFICATION

Var Solver::newVar() {
    if (started)
        throw InvariantViolation("variables must be added before search starts");

    const Var v = variableDatabase.newVar();
    assignmentTrail .newVar(v);
    conflictAnalyzer.newVar(v);
    return v;
}

CRef Solver::addClause(const vec<Lit>& ps) {
    if (started)
        throw InvariantViolation("clauses must be added before search starts");

    for (int i = 0; i < ps.size(); i++) {
        if (var(ps[i]) < 0 || var(ps[i]) >= nVars()) {
            std::ostringstream ss;
            ss << "clause literal " << ps[i] << " refers to an unknown variable (" << nVars() << " declared)";
            throw InvariantViolation(ss.str());
        }
    }

    return clauseDatabase.addInputClause(ps);
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// HELPER FUNCTIONS

template<class C>
void Solver::printClause(const C& c) const {
    for (int i = 0; i < c.size(); i++)
        printf("%d ", toDimacs(c[i]));
    printf("0\n");
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// SEARCH

SolverState Solver::step() {
    if (!started && verbosity >= 1) {
        printf("c ============================[ Search Statistics ]==============================\n");
        printf("c | Conflicts |     ORIGINAL     |          LEARNT          |  Trail  | Decisions |\n");
        printf("c |           |    Vars  Clauses |  Clauses  Lit/Cl  Records|  Level  |           |\n");
        printf("c ===============================================================================\n");
    }
    started = true;

    switch (status) {
        case SolverState::SEARCHING: handleSearching(); break;
        case SolverState::CONFLICT:  handleConflict();  break;
        default: return status; // Terminal
    }

    steps++;
    if (verbosity >= 1 && (status == SolverState::SAT || status == SolverState::UNSAT))
        printf("c ===============================================================================\n");

    return status;
}

lbool Solver::solve() {
    while (status != SolverState::SAT && status != SolverState::UNSAT) {
        // Pending conflicts are always analyzed; the budget only stops further search
        if (status == SolverState::SEARCHING && !withinBudget()) return l_Undef;
        step();
    }

    return status == SolverState::SAT ? l_True : l_False;
}

void Solver::handleSearching() {
    const CRef confl = unitPropagator.propagate();

    if (confl != CRef_Undef) {
        // CONFLICT
        conflicts++;
        conflictClause = confl;
        status = SolverState::CONFLICT;

        if (verbosity >= 2) {
            printf("c conflict at level %d: ", assignmentTrail.decisionLevel());
            printClause(clauseDatabase[confl]);
        }
        return;
    }

    // NO CONFLICT
    const Lit next = branchingHeuristicManager.pickBranchLit();

    if (next == lit_Undef) {
        // Model found:
        checkModel();
        model.clear();
        for (Var v = 0; v < nVars(); v++) model.push(variableDatabase.value(v));
        status = SolverState::SAT;
        return;
    }

    // Increase decision level and assign 'next'
    assignmentTrail.newDecisionLevel();
    assignmentTrail.assign(next);

    if (verbosity >= 2)
        printf("c decide %d at level %d\n", toDimacs(next), assignmentTrail.decisionLevel());
}

void Solver::handleConflict() {
    int backtrack_level;

    // Generate a learnt clause from the conflict graph
    conflictAnalyzer.analyze(conflictClause, learnt_clause, backtrack_level, learnt_record);

    // Register the learnt clause and its derivation
    const CRef cr = clauseDatabase.addLearntClause(learnt_clause);
    resolutionTracer.record(cr, learnt_record);
    if (proofLogger.enabled())
        proofLogger.addClause(learnt_clause);
    conflictClause = CRef_Undef;

    if (verbosity >= 2) {
        printf("c learnt %d (%d resolutions): ", (int)cr, (int)learnt_record.steps.size());
        printClause(learnt_clause);
    } else if (verbosity >= 1 && conflicts % progress_interval == 0)
        printProgress();

    if (learnt_clause.size() == 0) {
        // Empty clause derived: the formula is unsatisfiable
        finalClause = cr;
        core = coreExtractor.extractCore(cr);
        if (proofLogger.enabled())
            proofLogger.flush();
        status = SolverState::UNSAT;
        return;
    }

    // Backjump
    if (verbosity >= 2)
        printf("c backjump from level %d to level %d\n", assignmentTrail.decisionLevel(), backtrack_level);
    assignmentTrail.cancelUntil(backtrack_level);
    backjumps++;

    // The learnt clause is asserting after backjumping: its UIP literal is implied
    assignmentTrail.assign(learnt_clause[0], cr);
    unitPropagator.propagations++;
    status = SolverState::SEARCHING;
}

void Solver::checkModel() const {
    const vec<CRef>& cs = clauseDatabase.originals();
    for (int i = 0; i < cs.size(); i++) {
        if (!variableDatabase.satisfied(clauseDatabase[cs[i]])) {
            std::ostringstream ss;
            ss << "complete assignment leaves input clause " << cs[i] << " unsatisfied";
            throw InvariantViolation(ss.str());
        }
    }
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// OUTPUT

void Solver::printProgress() const {
    printf("c | %9d | %7d %8d | %8d %7.1f %7d | %7d | %9d |\n",
        (int)conflicts,
        nVars(),
        nClauses(),
        nLearnts(),
        nLearnts() == 0 ? 0.0 : (double)clauseDatabase.learnts_literals / nLearnts(),
        resolutionTracer.size(),
        assignmentTrail.decisionLevel(),
        (int)branchingHeuristicManager.decisions);
}

void Solver::printStats(double cpu_time) const {
    printf("c conflicts             : %-12llu   (%.0f /sec)\n", (unsigned long long)conflicts, cpu_time > 0 ? conflicts / cpu_time : 0.0);
    printf("c decisions             : %-12llu   (%.0f /sec)\n", (unsigned long long)branchingHeuristicManager.decisions, cpu_time > 0 ? branchingHeuristicManager.decisions / cpu_time : 0.0);
    printf("c propagations          : %-12llu   (%.0f /sec)\n", (unsigned long long)unitPropagator.propagations, cpu_time > 0 ? unitPropagator.propagations / cpu_time : 0.0);
    printf("c propagation rounds    : %-12llu\n", (unsigned long long)unitPropagator.rounds);
    printf("c backjumps             : %-12llu\n", (unsigned long long)backjumps);
    printf("c resolution steps      : %-12llu\n", (unsigned long long)conflictAnalyzer.resolutions);
    printf("c learnt clauses        : %-12d   (%llu literals)\n", nLearnts(), (unsigned long long)clauseDatabase.learnts_literals);
    printf("c conflict literals     : %-12llu   (%4.2f %% at level 0)\n",
        (unsigned long long)conflictAnalyzer.tot_literals,
        conflictAnalyzer.max_literals == 0 ? 0.0 : (conflictAnalyzer.max_literals - conflictAnalyzer.tot_literals) * 100 / (double)conflictAnalyzer.max_literals);
    printf("c CPU time              : %g s\n", cpu_time);
}
