/*****************************************************************************************[Solver.h]
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

#ifndef TraceSat_Solver_h
#define TraceSat_Solver_h

#include <vector>

#include "core/SolverTypes.h"
#include "core/VariableDatabase.h"
#include "core/ClauseDatabase.h"
#include "core/AssignmentTrail.h"
#include "core/UnitPropagator.h"
#include "core/BranchingHeuristicManager.h"
#include "core/ResolutionTracer.h"
#include "core/ConflictAnalyzer.h"
#include "core/CoreExtractor.h"
#include "core/ProofLogger.h"

namespace TraceSat {

//=================================================================================================
// Solver -- the main class:

class Solver {
public:

    // Constructor/Destructor:
    //
    Solver();
    virtual ~Solver();

    // Problem specification:
    //
    Var  newVar   ();                           // Add a new variable.

    /**
     * @brief Add a new input clause. The clause is stored as given (apart from duplicate
     * literals), so that the core refers to the input clauses themselves.
     *
     * @param ps the literals of the new clause
     * @return the CRef of the new clause
     * @throws InvariantViolation if search has already started or a literal refers to an
     * unknown variable
     */
    CRef addClause(const vec<Lit>& ps);

    // Solving:
    //
    SolverState step ();                        // Perform one transition of the search state machine.
    lbool       solve();                        // Step until SAT, UNSAT or the budget is exhausted.

    // Read state:
    //
    SolverState state      ()      const;
    lbool       modelValue (Var x) const; // The value of a variable in the model. The last call to solve must have been satisfiable.
    lbool       modelValue (Lit p) const; // The value of a literal in the model. The last call to solve must have been satisfiable.
    int         nVars      ()      const;
    int         nClauses   ()      const;
    int         nLearnts   ()      const;
    int         nFreeVars  ()      const;

    // Resource contraints:
    //
    void    setConfBudget(int64_t x);
    void    budgetOff();
    bool    withinBudget() const;

    // Extra results: (read-only member variables)
    //
    vec<lbool>         model;       // If problem is satisfiable, this vector contains the model.
    std::vector<CRef>  core;        // If problem is unsatisfiable, the input clauses of the UNSAT core.
    CRef               finalClause; // If problem is unsatisfiable, the derived empty clause.

    // Mode of operation:
    //
    int       verbosity;
    int       progress_interval;  // Conflicts between two progress lines at verbosity 1.

    // Statistics: (read-only member variables)
    //
    uint64_t conflicts, steps, backjumps;

    void printStats(double cpu_time) const;

protected:

    // Solver state:
    //
    SolverState         status;           // Current state of the search state machine.
    CRef                conflictClause;   // Falsified clause found by the last propagation (CONFLICT only).
    bool                started;          // Whether 'step()' has been called.

    // Temporaries (to reduce allocation overhead):
    //
    vec<Lit>            learnt_clause;
    ResolutionRecord    learnt_record;

    // Resource contraints:
    //
    int64_t             conflict_budget;  // -1 means no budget.

    // Main internal methods:
    //
    void     handleSearching  ();
    void     handleConflict   ();
    void     checkModel       () const;
    template<class C>
    void     printClause      (const C& c) const;
    void     printProgress    () const;

public:
    VariableDatabase          variableDatabase;
    ClauseDatabase            clauseDatabase;
    AssignmentTrail           assignmentTrail;
    UnitPropagator            unitPropagator;
    BranchingHeuristicManager branchingHeuristicManager;
    ResolutionTracer          resolutionTracer;
    ConflictAnalyzer          conflictAnalyzer;
    CoreExtractor             coreExtractor;
    ProofLogger               proofLogger;
};


//=================================================================================================
// Implementation of inline methods:

inline SolverState Solver::state      ()      const   { return status; }
inline lbool       Solver::modelValue (Var x) const   { return model[x]; }
inline lbool       Solver::modelValue (Lit p) const   { return model[var(p)] ^ sign(p); }
inline int         Solver::nVars      ()      const   { return variableDatabase.nVars(); }
inline int         Solver::nClauses   ()      const   { return clauseDatabase.nClauses(); }
inline int         Solver::nLearnts   ()      const   { return clauseDatabase.nLearnts(); }
inline int         Solver::nFreeVars  ()      const   { return nVars() - assignmentTrail.nRootAssigns(); }
inline void        Solver::setConfBudget(int64_t x){ conflict_budget = static_cast<int64_t>(conflicts) + x; }
inline void        Solver::budgetOff(){ conflict_budget = -1; }
inline bool        Solver::withinBudget() const {
    return conflict_budget < 0 || conflicts < static_cast<uint64_t>(conflict_budget);
}

//=================================================================================================
}

#endif
