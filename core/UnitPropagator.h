/*********************************************************************************[UnitPropagator.h]
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

#ifndef TraceSat_UnitPropagator_h
#define TraceSat_UnitPropagator_h

#include "core/SolverTypes.h"
#include "core/VariableDatabase.h"
#include "core/AssignmentTrail.h"

namespace TraceSat {
    // Forward declarations
    class Solver;
    class ClauseDatabase;

    /**
     * @brief This class handles literal propagation.
     *
     * @details There are no watchers or occurrence lists: every round of propagation is a linear
     * scan over the whole clause database, input clauses first and learnt clauses after them in
     * creation order. Rounds repeat until a round makes no new assignment (fixed point) or a
     * falsified clause is found.
     */
    class UnitPropagator {
    public:
        /// @brief The state of a clause under the current (partial) assignment
        enum class ClauseStatus : int {
            SATISFIED  = 0, // Some literal is true
            UNRESOLVED = 1, // No literal is true, at least two are unassigned
            UNIT       = 2, // No literal is true, exactly one is unassigned
            FALSIFIED  = 3, // Every literal is false
        };

    private:
        //////////////////////
        // HELPER FUNCTIONS //
        //////////////////////

        /**
         * @brief Perform one full scan of the clause database
         *
         * @param progress set to true if the scan assigned at least one variable
         * @return The conflicting clause if a conflict arises, otherwise CRef_Undef.
         */
        CRef propagateRound(bool& progress);

    public:
        ////////////////
        // STATISTICS //
        ////////////////

        uint64_t propagations; // Total number of assignments made by @code{propagate}
        uint64_t rounds;       // Total number of full database scans

    protected:
        ///////////////////////
        // SOLVER REFERENCES //
        ///////////////////////

        VariableDatabase& variableDatabase;
        AssignmentTrail& assignmentTrail;
        ClauseDatabase& clauseDatabase;

    public:
        /**
         * @brief Construct a new UnitPropagator object
         *
         * @param s Reference to main solver object
         */
        UnitPropagator(Solver& s);
        ~UnitPropagator() = default;

        /**
         * @brief Classify a clause under the current assignment.
         *
         * @param c the clause to classify
         * @param unit set to the only unassigned literal if the clause is unit, lit_Undef otherwise
         * @return the status of the clause
         */
        ClauseStatus status(const Clause& c, Lit& unit) const;

        /**
         * @brief Propagate unit clauses until a fixed point or a conflict. Implied literals are
         * assigned at the current decision level with the unit clause as their reason.
         *
         * @return The conflicting clause if a conflict arises, otherwise CRef_Undef.
         */
        CRef propagate();
    };
}

#endif
