/******************************************************************************[ResolutionTracer.cc]
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

#include "core/ResolutionTracer.h"
#include "core/Solver.h"

using namespace TraceSat;

ResolutionTracer::ResolutionTracer(Solver&)
    : nRecords(0)
{}

void ResolutionTracer::record(CRef learnt, const ResolutionRecord& rec) {
    if (learnt == CRef_Undef)
        throw InvariantViolation("cannot record a derivation for an undefined clause");

    if (learnt >= records.size()) {
        records .resize(learnt + 1);
        recorded.growTo(learnt + 1, 0);
    }

    if (recorded[learnt]) {
        std::ostringstream ss;
        ss << "clause " << learnt << " already has a derivation";
        throw InvariantViolation(ss.str());
    }

    records[learnt]  = rec;
    recorded[learnt] = 1;
    nRecords++;
}
