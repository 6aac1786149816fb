/********************************************************************************[UnitPropagator.cc]
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

#include "core/UnitPropagator.h"
#include "core/Solver.h"

using namespace TraceSat;

///////////////////////////////////////////////////////////////////////////////////////////////////
// CONSTRUCTORS

UnitPropagator::UnitPropagator(Solver& s)
    // Statistics
    : propagations(0)
    , rounds(0)

    // Solver references
    , variableDatabase(s.variableDatabase)
    , assignmentTrail(s.assignmentTrail)
    , clauseDatabase(s.clauseDatabase)
{}

///////////////////////////////////////////////////////////////////////////////////////////////////
// PUBLIC API

UnitPropagator::ClauseStatus UnitPropagator::status(const Clause& c, Lit& unit) const {
    int nUndef = 0;
    unit = lit_Undef;

    for (int i = 0; i < c.size(); i++) {
        const lbool val = variableDatabase.value(c[i]);
        if (val == l_True) {
            unit = lit_Undef;
            return ClauseStatus::SATISFIED;
        } else if (val == l_Undef) {
            nUndef++;
            unit = c[i];
        }
    }

    if (nUndef == 0) return ClauseStatus::FALSIFIED;
    if (nUndef == 1) return ClauseStatus::UNIT;

    unit = lit_Undef;
    return ClauseStatus::UNRESOLVED;
}

CRef UnitPropagator::propagate() {
    bool progress = true;
    while (progress) {
        progress = false;
        const CRef confl = propagateRound(progress);
        if (confl != CRef_Undef) return confl;
    }
    return CRef_Undef;
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// HELPER FUNCTIONS

CRef UnitPropagator::propagateRound(bool& progress) {
    rounds++;

    for (CRef cr = 0; cr < static_cast<CRef>(clauseDatabase.size()); cr++) {
        const Clause& c = clauseDatabase[cr];
        Lit unit;

        switch (status(c, unit)) {
            case ClauseStatus::FALSIFIED:
                // All literals falsified!
                return cr;

            case ClauseStatus::UNIT:
                assignmentTrail.assign(unit, cr);
                propagations++;
                progress = true;
                break;

            default:
                break;
        }
    }

    return CRef_Undef;
}
