/**********************************************************************************[CoreExtractor.h]
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

#ifndef TraceSat_CoreExtractor_h
#define TraceSat_CoreExtractor_h

#include <vector>

#include "core/SolverTypes.h"
#include "core/ClauseDatabase.h"
#include "core/ResolutionTracer.h"

namespace TraceSat {
    // Forward declarations
    class Solver;

    /**
     * @brief This class extracts an unsatisfiable core from the resolution proof of a run.
     *
     */
    class CoreExtractor {
    protected:
        ///////////////////////
        // SOLVER REFERENCES //
        ///////////////////////

        ClauseDatabase& clauseDatabase;
        ResolutionTracer& resolutionTracer;

    public:
        CoreExtractor(Solver& s);
        ~CoreExtractor() = default;

        /**
         * @brief Collect the input clauses that a derived clause depends on.
         *
         * @details Depth-first traversal of the proof DAG rooted at @code{final}. Clauses without
         * a derivation are leaves; every clause is visited at most once.
         *
         * @param final the root of the traversal, usually the derived empty clause
         * @return the input clauses reached, sorted by CRef
         */
        std::vector<CRef> extractCore(CRef final) const;
    };
}

#endif
