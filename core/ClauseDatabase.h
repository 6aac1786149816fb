/*********************************************************************************[ClauseDatabase.h]
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

#ifndef TraceSat_ClauseDatabase_h
#define TraceSat_ClauseDatabase_h

#include <ostream>
#include <vector>

#include "core/SolverTypes.h"

namespace TraceSat {
    // Forward declarations
    class Solver;

    /**
     * @brief This class owns every clause of a solve, input and learnt alike. Clauses are handed
     * out in creation order and are never removed, so a CRef stays valid for the whole run.
     *
     */
    class ClauseDatabase {
    protected:
        ///////////////////////////////////////////////////////////////////////////////////////////
        // MEMBER VARIABLES

        /// @brief Location of a clause in the literal arena.
        struct ClauseHeader {
            uint32_t   start;
            int        size;
            ClauseKind kind;
        };

        /// @brief Literals of every clause, stored back to back in creation order.
        vec<Lit> arena;

        /// @brief Clause headers, indexed by CRef.
        vec<ClauseHeader> ca;

        /// @brief List of input problem clauses.
        vec<CRef> clauses;

        /// @brief List of learnt clauses.
        vec<CRef> learnts;

    public:
        ///////////////////////////////////////////////////////////////////////////////////////////
        // STATISTICS

        /// @brief The current total number of literals in original (input) clauses
        uint64_t clauses_literals;

        /// @brief The current total number of literals in learnt clauses
        uint64_t learnts_literals;

    public:
        ///////////////////////////////////////////////////////////////////////////////////////////
        // CONSTRUCTORS

        /**
         * @brief Construct a new ClauseDatabase object
         *
         * @param s Reference to main solver object
         */
        ClauseDatabase(Solver& s);
        ~ClauseDatabase() = default;

    public:
        ///////////////////////////////////////////////////////////////////////////////////////////
        // ACCESSORS

        /**
         * @brief Get the current number of original (input) clauses.
         *
         * @return The current number of original (input) clauses.
         */
        int nClauses(void) const;

        /**
         * @brief Get the current number of learnt clauses.
         *
         * @return The current number of learnt clauses.
         */
        int nLearnts(void) const;

        /// @brief Total number of clauses; every CRef below this value is valid.
        int size(void) const;

        /**
         * @brief Look up a clause
         *
         * @param cr the reference of the clause
         * @return a view of the clause, valid until the next clause is added
         * @throws InvariantViolation if @code{cr} was never handed out by this database
         */
        Clause operator[](CRef cr) const;

        const vec<CRef>& originals(void) const;
        const vec<CRef>& learnt   (void) const;

    public:
        ///////////////////////////////////////////////////////////////////////////////////////////
        // STATE MODIFICATION

        /**
         * @brief Add a clause to the database. Duplicate literals are dropped, the order of the
         * remaining literals is kept. An empty clause is legal.
         *
         * @param ps the list of literals to add as a clause
         * @param kind whether the clause comes from the input or from conflict analysis
         * @return The CRef of the new clause
         */
        CRef addClause(const vec<Lit>& ps, ClauseKind kind);

        CRef addInputClause(const vec<Lit>& ps);
        CRef addLearntClause(const vec<Lit>& ps);

    public:
        ///////////////////////////////////////////////////////////////////////////////////////////
        // OUTPUT

        /**
         * @brief Write a set of clauses in DIMACS-format.
         *
         * @param out the stream to write to
         * @param crs the clauses to write
         * @param nVars the number of variables declared in the header
         */
        void toDimacs(std::ostream& out, const std::vector<CRef>& crs, int nVars) const;

        void toDimacs(std::ostream& out, const Clause& c) const;
    };

    ///////////////////////////////////////////////////////////////////////////////////////////////
    // IMPLEMENTATION OF INLINE METHODS

    //////////////
    // ACCESSORS

    inline int ClauseDatabase::nClauses() const { return clauses.size(); }
    inline int ClauseDatabase::nLearnts() const { return learnts.size(); }
    inline int ClauseDatabase::size    () const { return ca.size(); }

    inline const vec<CRef>& ClauseDatabase::originals() const { return clauses; }
    inline const vec<CRef>& ClauseDatabase::learnt   () const { return learnts; }

    ///////////////////////
    // STATE MODIFICATION

    inline CRef ClauseDatabase::addInputClause (const vec<Lit>& ps) { return addClause(ps, ClauseKind::ORIGINAL); }
    inline CRef ClauseDatabase::addLearntClause(const vec<Lit>& ps) { return addClause(ps, ClauseKind::LEARNED); }
}

#endif
