/********************************************************************************[ClauseDatabase.cc]
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

#include "core/ClauseDatabase.h"
#include "core/Solver.h"

using namespace TraceSat;

///////////////////////////////////////////////////////////////////////////////////////////////////
// CONSTRUCTORS

ClauseDatabase::ClauseDatabase(Solver&)
    // Statistics
    : clauses_literals(0)
    , learnts_literals(0)
{}

///////////////////////////////////////////////////////////////////////////////////////////////////
// ACCESSORS

Clause ClauseDatabase::operator[](CRef cr) const {
    if (cr >= static_cast<CRef>(ca.size())) {
        std::ostringstream ss;
        ss << "unknown clause reference " << cr << " (database holds " << ca.size() << " clauses)";
        throw InvariantViolation(ss.str());
    }
    const ClauseHeader& h = ca[cr];
    const Lit* base = arena.size() > 0 ? &arena[0] : nullptr;
    return Clause(base == nullptr ? nullptr : base + h.start, h.size, h.kind);
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// STATE MODIFICATION

CRef ClauseDatabase::addClause(const vec<Lit>& ps, ClauseKind kind) {
    ClauseHeader h;
    h.start = static_cast<uint32_t>(arena.size());
    h.size  = 0;
    h.kind  = kind;

    // Remove duplicate literals, keeping the first occurrence
    for (int i = 0; i < ps.size(); i++) {
        bool dup = false;
        for (int j = h.start; j < arena.size() && !dup; j++)
            dup = arena[j] == ps[i];
        if (!dup) { arena.push(ps[i]); h.size++; }
    }

    const CRef cr = static_cast<CRef>(ca.size());
    ca.push(h);

    // Update stats
    if (kind == ClauseKind::LEARNED) {
        learnts.push(cr);
        learnts_literals += h.size;
    } else {
        clauses.push(cr);
        clauses_literals += h.size;
    }

    return cr;
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// OUTPUT

void ClauseDatabase::toDimacs(std::ostream& out, const Clause& c) const {
    for (int i = 0; i < c.size(); i++)
        out << TraceSat::toDimacs(c[i]) << " ";
    out << "0\n";
}

void ClauseDatabase::toDimacs(std::ostream& out, const std::vector<CRef>& crs, int nVars) const {
    out << "p cnf " << nVars << " " << crs.size() << "\n";
    for (size_t i = 0; i < crs.size(); i++)
        toDimacs(out, (*this)[crs[i]]);
}
