/*******************************************************************************[VariableDatabase.h]
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

#ifndef TraceSat_VariableDatabase_h
#define TraceSat_VariableDatabase_h

#include "core/SolverTypes.h"

namespace TraceSat {
    /**
     * @brief Current truth value of every variable. Only the assignment trail writes to it; every
     * other component reads through @code{value}.
     *
     */
    class VariableDatabase {
        vec<lbool> assigns;   // Indexed by Var
        int        nAssigned; // Number of variables whose value is not l_Undef

    public:
        VariableDatabase() : nAssigned(0) {}

        // Number of declared variables
        int   nVars       (void)  const { return assigns.size(); }

        // Number of variables with a value
        int   nAssigns    (void)  const { return nAssigned; }
        bool  allAssigned (void)  const { return nAssigned == nVars(); }

        lbool value       (Var x) const { return assigns[x]; }
        lbool value       (Lit p) const { return assigns[var(p)] ^ sign(p); }

        /// @brief Declare one more variable, initially unassigned. Variables are numbered from 0.
        Var   newVar      (void);

        /**
         * @brief Overwrite the value of a variable
         *
         * @param x the variable
         * @param val the new value; l_Undef unassigns the variable
         */
        void  setVar      (Var x, lbool val);

        // Clause status under the current values
        bool  satisfied   (const Clause& c) const;
        bool  falsified   (const Clause& c) const;
    };

    inline Var VariableDatabase::newVar() {
        assigns.push(l_Undef);
        return nVars() - 1;
    }

    inline void VariableDatabase::setVar(Var x, lbool val) {
        const bool was = assigns[x] != l_Undef;
        const bool now = val != l_Undef;
        nAssigned += static_cast<int>(now) - static_cast<int>(was);
        assigns[x] = val;
    }

    inline bool VariableDatabase::satisfied(const Clause& c) const {
        for (const Lit p : c)
            if (value(p) == l_True) return true;
        return false;
    }

    inline bool VariableDatabase::falsified(const Clause& c) const {
        for (const Lit p : c)
            if (value(p) != l_False) return false;
        return true;
    }
}

#endif
