/************************************************************************************[SolverTypes.h]
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

#ifndef TraceSat_SolverTypes_h
#define TraceSat_SolverTypes_h

#include <stdint.h>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <minisat/mtl/Vec.h>

namespace TraceSat {

using Minisat::vec;

//=================================================================================================
// Variables, literals, lifted booleans, clauses:


// NOTE! Variables are just integers. They are chosen from 0..N-1 so that they can be used as array
// indices. DIMACS numbering (1..N) is only used at the input/output boundary.

typedef int Var;
#define var_Undef (-1)


struct Lit {
    int     x;

    // Use this as a constructor:
    friend Lit mkLit(Var var, bool sign);

    bool operator == (Lit p) const { return x == p.x; }
    bool operator != (Lit p) const { return x != p.x; }
    bool operator <  (Lit p) const { return x < p.x;  } // '<' makes p, ~p adjacent in the ordering.
};

inline  Lit  mkLit     (Var var, bool sign = false) { Lit p; p.x = var + var + (int)sign; return p; }
inline  Lit  operator ~(Lit p)              { Lit q; q.x = p.x ^ 1; return q; }
inline  bool sign      (Lit p)              { return p.x & 1; }
inline  int  var       (Lit p)              { return p.x >> 1; }

// Conversion to and from the signed DIMACS representation:
inline  int  toDimacs  (Lit p)              { return sign(p) ? -(var(p) + 1) : var(p) + 1; }
inline  Lit  fromDimacs(int lit)            { return lit > 0 ? mkLit(lit - 1) : mkLit(-lit - 1, true); }

const Lit lit_Undef = { -2 };  // }- Useful special constants.
const Lit lit_Error = { -1 };  // }

inline std::ostream& operator<<(std::ostream& out, const Lit& p) {
    return out << toDimacs(p);
}


//=================================================================================================
// Lifted booleans:

class lbool {
    uint8_t value;

public:
    explicit lbool(uint8_t v) : value(v) { }

    lbool()       : value(2) { }
    explicit lbool(bool x) : value(!x) { }

    bool  operator == (lbool b) const { return value == b.value; }
    bool  operator != (lbool b) const { return value != b.value; }

    // Flip the truth value if 'b' holds; undefined stays undefined.
    lbool operator ^  (bool  b) const { return value == 2 ? *this : lbool((uint8_t)(value ^ (uint8_t)b)); }

    friend int   toInt  (lbool l);
};

#define l_True  (lbool((uint8_t)0))
#define l_False (lbool((uint8_t)1))
#define l_Undef (lbool((uint8_t)2))

inline int   toInt  (lbool l) { return l.value; }


//=================================================================================================
// Clause -- an immutable list of literals, tagged with its origin:

enum class ClauseKind : int {
    ORIGINAL = 0, // Present in the input formula
    LEARNED  = 1, // Derived by conflict analysis
};

// Clause identifiers are indices into the clause database, handed out in creation order.
typedef uint32_t CRef;
const CRef CRef_Undef = UINT32_MAX;

// A view of a clause stored in the clause database's literal arena. Views are invalidated when
// a clause is added to the database.
class Clause {
    const Lit*  lits;
    int         sz;
    ClauseKind  kind_;

public:
    Clause(const Lit* ps, int n, ClauseKind k) : lits(ps), sz(n), kind_(k) {}

    int         size   ()      const { return sz; }
    bool        empty  ()      const { return sz == 0; }
    bool        learnt ()      const { return kind_ == ClauseKind::LEARNED; }
    ClauseKind  kind   ()      const { return kind_; }
    Lit         operator [] (int i) const { return lits[i]; }

    const Lit*  begin  ()      const { return lits; }
    const Lit*  end    ()      const { return lits + sz; }

    void        copyTo (vec<Lit>& out) const { out.clear(); for (int i = 0; i < sz; i++) out.push(lits[i]); }

    // Position of 'p' in the clause, or -1 if it does not occur.
    int         find   (Lit p) const;
};

inline int Clause::find(Lit p) const {
    for (int i = 0; i < sz; i++)
        if (lits[i] == p) return i;
    return -1;
}


//=================================================================================================
// Proof objects:

/**
 * @brief A single resolution step: the working clause is resolved with @code{antecedent} on the
 * variable @code{pivot}.
 */
struct ResolutionStep {
    Var  pivot;
    CRef antecedent;
};

/**
 * @brief The derivation of a learnt clause: start from the conflict clause and resolve with each
 * step's antecedent in order.
 */
struct ResolutionRecord {
    CRef                        start = CRef_Undef;
    std::vector<ResolutionStep> steps;
};


//=================================================================================================
// Solver states:

enum class SolverState : int {
    SEARCHING = 0,
    CONFLICT  = 1,
    SAT       = 2,
    UNSAT     = 3,
};

const char* toString(SolverState s);


//=================================================================================================
// Errors:

/**
 * @brief Thrown when an internal precondition of the solver is violated (double assignment,
 * unknown clause reference, missing reason, ...). This always indicates a bug in the caller or in
 * the solver itself and is never recovered from.
 */
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

}

#endif
