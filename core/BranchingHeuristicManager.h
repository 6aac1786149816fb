/**********************************************************************[BranchingHeuristicManager.h]
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

#ifndef TraceSat_BranchingHeuristicManager_h
#define TraceSat_BranchingHeuristicManager_h

#include "core/SolverTypes.h"
#include "core/VariableDatabase.h"

namespace TraceSat {
    // Forward declarations
    class Solver;

    /**
     * @brief This class picks decision literals.
     *
     * @details Variables are scanned in ascending order and the first unassigned one is chosen.
     * Decisions always set the variable to false. There is no activity, no phase saving and no
     * randomization, so runs are fully deterministic.
     */
    class BranchingHeuristicManager {
    public:
        ////////////////
        // STATISTICS //
        ////////////////

        uint64_t decisions;

    protected:
        ///////////////////////
        // SOLVER REFERENCES //
        ///////////////////////

        VariableDatabase& variableDatabase;

    public:
        //////////////////
        // CONSTRUCTORS //
        //////////////////

        BranchingHeuristicManager(Solver& s);
        ~BranchingHeuristicManager() = default;

        ////////////////
        // PUBLIC API //
        ////////////////

        /**
         * @brief Select the next unassigned variable to branch on
         *
         * @return the lowest-numbered unassigned variable, var_Undef if every variable is assigned
         */
        Var pickBranchVar(void) const;

        /**
         * @brief Select the next decision literal
         *
         * @return the negative literal of @code{pickBranchVar()}, lit_Undef if every variable is
         * assigned
         */
        Lit pickBranchLit(void);
    };

    inline Var BranchingHeuristicManager::pickBranchVar() const {
        if (variableDatabase.allAssigned()) return var_Undef;

        for (Var v = 0; v < variableDatabase.nVars(); v++)
            if (variableDatabase.value(v) == l_Undef) return v;
        return var_Undef;
    }

    inline Lit BranchingHeuristicManager::pickBranchLit() {
        const Var next = pickBranchVar();
        if (next == var_Undef) return lit_Undef;

        decisions++;
        return mkLit(next, true);
    }
}

#endif
