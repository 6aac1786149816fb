/********************************************************************************[AssignmentTrail.h]
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

#ifndef TraceSat_AssignmentTrail_h
#define TraceSat_AssignmentTrail_h

#include "core/SolverTypes.h"
#include "core/VariableDatabase.h"

namespace TraceSat {
    class Solver;

    /**
     * @brief The chronological record of a search: every assignment in the order it was made,
     * split into decision levels, with the antecedent clause that forced each implied literal.
     *
     * @details The antecedent references form the implication structure that conflict analysis
     * walks; no explicit graph is stored.
     */
    class AssignmentTrail {
    protected:
        // Per-variable bookkeeping, valid while the variable is assigned
        struct VarData {
            CRef reason; // Antecedent clause, CRef_Undef for decisions and unassigned variables
            int level;   // Decision level of the assignment
            int pos;     // Index into 'trail', -1 while unassigned
        };

        static inline VarData mkVarData(CRef cr, int l, int p) { VarData d = {cr, l, p}; return d; }

        vec<Lit>     trail;     // Literals made true, oldest first
        vec<int>     trail_lim; // trail_lim[l - 1] is the trail index where level l starts
        vec<VarData> vardata;   // Indexed by Var

    public:
        //////////////////
        // CONSTRUCTORS //
        //////////////////

        AssignmentTrail(Solver& s);
        ~AssignmentTrail() = default;

        ////////////////
        // PUBLIC API //
        ////////////////

        // Grow the per-variable tables to cover 'v'
        void newVar(Var v);

        // Open decision level decisionLevel() + 1
        void newDecisionLevel(void);

        /**
         * @brief Make @code{p} true at the current decision level.
         *
         * @param p the literal to make true
         * @param from the antecedent clause of @code{p}; CRef_Undef marks a decision
         * @throws InvariantViolation if the variable is unknown or already has a value
         */
        void assign(Lit p, CRef from = CRef_Undef);

        /**
         * @brief Backjump. Every assignment made above @code{level} is undone, most recent
         * first, and the variables lose their reason and level. A no-op if the trail is already
         * at or below @code{level}.
         */
        void cancelUntil(int level);

        int decisionLevel(void) const;

        lbool value(Var x) const;
        lbool value(Lit p) const;

        // The following three are only meaningful for assigned variables
        CRef reason  (Var x) const;
        int  level   (Var x) const;
        int  position(Var x) const;

        int nAssigns    (void) const;  // Length of the trail
        int nRootAssigns(void) const;  // Assignments at level 0
        int nVars       (void) const;

        Lit operator[](int i) const;

        // First trail index of decision level 'l'
        int indexOfDecisionLevel(int l) const;

    private:
        VariableDatabase& variableDatabase;
    };

    inline void AssignmentTrail::newVar(Var v) {
        vardata.growTo(v + 1, mkVarData(CRef_Undef, 0, -1));
        trail  .capacity(v + 1);
    }

    inline void  AssignmentTrail::newDecisionLevel(void)        { trail_lim.push(nAssigns()); }

    inline int   AssignmentTrail::decisionLevel   ()      const { return trail_lim.size(); }
    inline lbool AssignmentTrail::value           (Var x) const { return variableDatabase.value(x); }
    inline lbool AssignmentTrail::value           (Lit p) const { return variableDatabase.value(p); }
    inline CRef  AssignmentTrail::reason          (Var x) const { return vardata[x].reason; }
    inline int   AssignmentTrail::level           (Var x) const { return vardata[x].level; }
    inline int   AssignmentTrail::position        (Var x) const { return vardata[x].pos; }

    inline int AssignmentTrail::nAssigns    () const { return trail.size(); }
    inline int AssignmentTrail::nRootAssigns() const { return trail_lim.size() == 0 ? nAssigns() : trail_lim[0]; }
    inline int AssignmentTrail::nVars       () const { return variableDatabase.nVars(); }

    inline Lit AssignmentTrail::operator[](int i) const { return trail[i]; }
    inline int AssignmentTrail::indexOfDecisionLevel(int l) const { return l > 0 ? trail_lim[l - 1] : 0; }
}

#endif
