/*******************************************************************************[ResolutionTracer.h]
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

#ifndef TraceSat_ResolutionTracer_h
#define TraceSat_ResolutionTracer_h

#include <vector>

#include "core/SolverTypes.h"

namespace TraceSat {
    // Forward declarations
    class Solver;

    /**
     * @brief This class records how every learnt clause was derived. Together with the clause
     * database it forms the resolution proof of a run; input clauses have no record and are the
     * leaves of the proof.
     *
     */
    class ResolutionTracer {
    protected:
        ///////////////////////////////////////////////////////////////////////////////////////////
        // MEMBER VARIABLES

        /// @brief Derivations indexed by CRef. Input clauses map to an empty slot.
        std::vector<ResolutionRecord> records;

        /// @brief Whether @code{records[cr]} holds a derivation
        vec<char> recorded;

        /// @brief Number of derivations recorded
        int nRecords;

    public:
        ///////////////////////////////////////////////////////////////////////////////////////////
        // CONSTRUCTORS

        ResolutionTracer(Solver& s);
        ~ResolutionTracer() = default;

    public:
        ///////////////////////////////////////////////////////////////////////////////////////////
        // PUBLIC API

        /**
         * @brief Record the derivation of a learnt clause
         *
         * @param learnt the learnt clause
         * @param rec the resolution steps that derived it
         * @throws InvariantViolation if @code{learnt} already has a derivation
         */
        void record(CRef learnt, const ResolutionRecord& rec);

        /**
         * @brief Look up the derivation of a clause
         *
         * @param cr the clause
         * @return the derivation, or nullptr if the clause has none (it is a leaf)
         */
        const ResolutionRecord* lookup(CRef cr) const;

        int size(void) const;
    };

    inline const ResolutionRecord* ResolutionTracer::lookup(CRef cr) const {
        if (cr >= static_cast<CRef>(recorded.size()) || !recorded[cr]) return nullptr;
        return &records[cr];
    }

    inline int ResolutionTracer::size() const { return nRecords; }
}

#endif
