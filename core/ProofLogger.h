/************************************************************************************[ProofLogger.h]
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

#ifndef TraceSat_ProofLogger_h
#define TraceSat_ProofLogger_h

#include <ostream>

#include "core/SolverTypes.h"

namespace TraceSat {
    /**
     * @brief Writes learnt clauses as an ASCII DRUP proof. Clauses are never deleted, so the
     * proof consists of addition lines only.
     *
     */
    class ProofLogger {
    public:
        ///////////////////////////////////////////////////////////////////////////////////////////
        // PUBLIC API

        /// @brief Output stream for the DRUP proof; nullptr disables logging
        std::ostream* drup_out = nullptr;

        /// @brief Number of clauses written
        uint64_t lines = 0;

    public:
        ///////////////////////////////////////////////////////////////////////////////////////////
        // PROOF LOGGING

        bool enabled(void) const;

        template<class V>
        void addClause(const V& c);

        void flush(void);
    };

    ///////////////////////////////////////////////////////////////////////////////////////////////
    // IMPLEMENTATION OF INLINE FUNCTIONS

    inline bool ProofLogger::enabled(void) const {
        return drup_out != nullptr;
    }

    template <class V>
    inline void ProofLogger::addClause(const V& c) {
        // Do nothing if there is no output stream
        if (!enabled()) return;

        for (int i = 0; i < c.size(); i++)
            *drup_out << toDimacs(c[i]) << " ";
        *drup_out << "0\n";
        lines++;
    }

    inline void ProofLogger::flush(void) {
        if (enabled())
            drup_out->flush();
    }
}

#endif
