/*******************************************************************************[AssignmentTrail.cc]
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

#include "core/AssignmentTrail.h"
#include "core/Solver.h"

using namespace TraceSat;

///////////////////////////////////////////////////////////////////////////////////////////////////
// CONSTRUCTORS

AssignmentTrail::AssignmentTrail(Solver& s)
    : variableDatabase(s.variableDatabase)
{}

///////////////////////////////////////////////////////////////////////////////////////////////////
// STATE MODIFICATION

void AssignmentTrail::assign(Lit p, CRef from) {
    const Var v = var(p);
    if (v < 0 || v >= variableDatabase.nVars()) {
        std::ostringstream ss;
        ss << "assignment to unknown variable " << p;
        throw InvariantViolation(ss.str());
    }
    if (variableDatabase.value(v) != l_Undef) {
        std::ostringstream ss;
        ss << "variable " << (v + 1) << " is already assigned at level " << level(v);
        throw InvariantViolation(ss.str());
    }

    variableDatabase.setVar(v, lbool(!sign(p)));
    vardata[v] = mkVarData(from, decisionLevel(), nAssigns());
    trail.push_(p);
}

void AssignmentTrail::cancelUntil(int level) {
    // Do nothing if the trail is already set at the correct level
    if (decisionLevel() <= level) return;

    // Clear the values of the variables, most recent first
    for (int c = nAssigns() - 1; c >= trail_lim[level]; c--) {
        const Var x = var(trail[c]);
        variableDatabase.setVar(x, l_Undef);
        vardata[x] = mkVarData(CRef_Undef, 0, -1);
    }

    // Decrease the size of the trail
    trail.shrink(trail.size() - trail_lim[level]);
    trail_lim.shrink(trail_lim.size() - level);
}
