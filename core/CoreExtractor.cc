/*********************************************************************************[CoreExtractor.cc]
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

#include <algorithm>

#include "core/CoreExtractor.h"
#include "core/Solver.h"

using namespace TraceSat;

CoreExtractor::CoreExtractor(Solver& s)
    : clauseDatabase(s.clauseDatabase)
    , resolutionTracer(s.resolutionTracer)
{}

std::vector<CRef> CoreExtractor::extractCore(CRef final) const {
    std::vector<CRef> core;
    vec<char>         visited(clauseDatabase.size(), 0);
    vec<CRef>         workStack;
    workStack.push(final);

    while (workStack.size() > 0) {
        const CRef cr = workStack.last(); workStack.pop();

        // Throws on an unknown reference before 'visited' is touched
        const Clause& c = clauseDatabase[cr];
        if (visited[cr]) continue;
        visited[cr] = 1;

        const ResolutionRecord* rec = resolutionTracer.lookup(cr);
        if (rec == nullptr) {
            // Leaf: input clauses form the core
            if (c.learnt())
                throw InvariantViolation("learnt clause without a recorded derivation");
            core.push_back(cr);
            continue;
        }

        // Push antecedents in reverse so that they are visited in derivation order
        for (int i = static_cast<int>(rec->steps.size()) - 1; i >= 0; i--)
            workStack.push(rec->steps[i].antecedent);
        workStack.push(rec->start);
    }

    std::sort(core.begin(), core.end());
    return core;
}
