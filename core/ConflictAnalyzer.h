/*******************************************************************************[ConflictAnalyzer.h]
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

#ifndef TraceSat_ConflictAnalyzer_h
#define TraceSat_ConflictAnalyzer_h

#include "core/SolverTypes.h"
#include "core/AssignmentTrail.h"
#include "core/ClauseDatabase.h"

namespace TraceSat {
    // Forward declarations
    class Solver;

    class ConflictAnalyzer {
    protected:
        /////////////////////////
        // TEMPORARY VARIABLES //
        /////////////////////////
        // these variables are allocated here to avoid repeated allocation costs

        // Marks whether a variable occurs in the working clause
        vec<char> seen;

    public:
        ////////////////
        // STATISTICS //
        ////////////////

        uint64_t max_literals;   // Sum of learnt clause sizes
        uint64_t tot_literals;   // Sum of learnt clause sizes, level-0 literals excluded
        uint64_t resolutions;    // Total number of resolution steps

    protected:
        ///////////////////////
        // SOLVER REFERENCES //
        ///////////////////////

        AssignmentTrail& assignmentTrail;
        ClauseDatabase& clauseDatabase;

        //////////////////////
        // HELPER FUNCTIONS //
        //////////////////////

        /**
         * @brief Add the literals of a clause to the working clause, except the literal on the
         * pivot variable.
         *
         * @param c the clause to merge into the working clause
         * @param pivot the variable resolved upon, var_Undef for the conflict clause itself
         * @param learntClause the working clause literals from earlier decision levels
         * @return the number of newly added literals from the current decision level
         */
        int mergeClause(const Clause& c, Var pivot, vec<Lit>& learntClause);

        /**
         * @brief Learn a clause by resolving the conflict clause with the reasons of the most
         * recently assigned current-level literals until a single one (the UIP) remains. At
         * decision level 0 resolution continues until no literal is left.
         *
         * @param confl the conflict clause
         * @param learntClause the output learnt clause. Assumed to be empty initially.
         * @param record the output derivation of @code{learntClause}.
         */
        void getUIPClause(CRef confl, vec<Lit>& learntClause, ResolutionRecord& record);

        /**
         * @brief Move the literal with the highest decision level among the non-UIP literals to
         * index 1.
         *
         * @param learntClause the learnt clause to modify; the UIP literal must be at index 0.
         */
        void sortSecondLevel(vec<Lit>& learntClause) const;

    public:
        //////////////////
        // CONSTRUCTORS //
        //////////////////

        /**
         * @brief Construct a new ConflictAnalyzer object
         *
         * @param s Reference to main solver object
         */
        ConflictAnalyzer(Solver& s);
        ~ConflictAnalyzer() = default;

        ////////////////
        // PUBLIC API //
        ////////////////

        /**
         * @brief Set up internal data structures for a new variable
         *
         * @param v the variable to register
         */
        void newVar(Var v);

        /**
         * @brief Analyze a conflict and derive a learnt clause.
         *
         * @param confl the falsified clause
         * @param out_learnt the learnt clause. The UIP literal is at index 0 and a literal of the
         * backjump level at index 1. Empty if the conflict occurred at decision level 0.
         * @param out_btlevel the decision level to backjump to
         * @param out_record the resolution steps that derive @code{out_learnt} from @code{confl}
         * @throws InvariantViolation if the implication structure is inconsistent
         */
        void analyze(CRef confl, vec<Lit>& out_learnt, int& out_btlevel, ResolutionRecord& out_record);
    };

    inline void ConflictAnalyzer::newVar(Var v) {
        seen.growTo(v + 1, 0);
    }
}

#endif
