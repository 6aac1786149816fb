/*****************************************************************************************[Dimacs.h]
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

#ifndef TraceSat_Dimacs_h
#define TraceSat_Dimacs_h

#include <stdio.h>

#include <istream>
#include <stdexcept>
#include <string>

#include "core/Solver.h"

namespace TraceSat {

//=================================================================================================
// DIMACS Parser:

/**
 * @brief Thrown for malformed DIMACS input.
 */
class ParseError : public std::runtime_error {
    int line_;
public:
    ParseError(int line, const std::string& what);

    /// @brief The 1-based input line at which the error was detected
    int line() const { return line_; }
};

/**
 * @brief Read a CNF formula in DIMACS format into a solver.
 *
 * @details Comment lines start with 'c'. The 'p cnf <vars> <clauses>' header must precede the
 * first clause; all variables are created when it is read. Clauses are sequences of non-zero
 * integers terminated by 0 and may span several lines. A line starting with '%' ends the input.
 *
 * @param in the stream to read from
 * @param S the solver to load; it must not have any variables yet
 * @param strict if true, the number of clauses must match the header
 * @return the number of clauses read
 * @throws ParseError on malformed input
 */
int parse_DIMACS(std::istream& in, Solver& S, bool strict = false);

//=================================================================================================
// Result output:

// Print the model as signed DIMACS literals after 'prefix', wrapping long lines, ending with 0.
void printModel(FILE* out, const char* prefix, const Solver& S);

/**
 * @brief Write the result file: "SAT" followed by the model, "UNSAT", or "INDET" when the search
 * stopped on its budget.
 *
 * @param res the open result file; it is left open
 * @param ret the value returned by @code{Solver::solve}
 * @param S the solver the result belongs to
 */
void writeResult(FILE* res, lbool ret, const Solver& S);

//=================================================================================================
}

#endif
