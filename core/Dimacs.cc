/****************************************************************************************[Dimacs.cc]
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

#include <errno.h>
#include <limits.h>
#include <stdlib.h>

#include <sstream>

#include "core/Dimacs.h"

using namespace TraceSat;

static std::string withLine(int line, const std::string& what) {
    std::ostringstream ss;
    ss << "PARSE ERROR! line " << line << ": " << what;
    return ss.str();
}

ParseError::ParseError(int line, const std::string& what)
    : std::runtime_error(withLine(line, what))
    , line_(line)
{}

static void readHeader(const std::string& rest, int lineNo, int& vars, int& clauses) {
    std::istringstream hs(rest);
    std::string fmt, extra;

    if (!(hs >> fmt) || fmt != "cnf")
        throw ParseError(lineNo, "expected 'p cnf <variables> <clauses>'");
    if (!(hs >> vars >> clauses) || vars < 0 || clauses < 0)
        throw ParseError(lineNo, "invalid variable or clause count in header");
    if (hs >> extra)
        throw ParseError(lineNo, "unexpected '" + extra + "' after header");
}

static int parseLiteral(const std::string& tok, int lineNo, int vars) {
    char* end;
    errno = 0;
    const long val = strtol(tok.c_str(), &end, 10);

    if (*end != '\0' || end == tok.c_str() || errno == ERANGE || val > INT_MAX || val < -INT_MAX)
        throw ParseError(lineNo, "unexpected token '" + tok + "'");

    if (labs(val) > vars) {
        std::ostringstream ss;
        ss << "literal " << val << " exceeds the declared number of variables (" << vars << ")";
        throw ParseError(lineNo, ss.str());
    }

    return static_cast<int>(val);
}

int TraceSat::parse_DIMACS(std::istream& in, Solver& S, bool strict) {
    if (S.nVars() != 0)
        throw InvariantViolation("DIMACS input must be loaded into an empty solver");

    int vars = -1, clauses = -1, cnt = 0, lineNo = 0;
    vec<Lit> lits;
    bool open = false;
    std::string line;

    while (std::getline(in, line)) {
        lineNo++;
        const size_t p = line.find_first_not_of(" \t\r");
        if (p == std::string::npos || line[p] == 'c') continue;
        if (line[p] == '%') break;

        if (line[p] == 'p') {
            if (vars >= 0) throw ParseError(lineNo, "duplicate header");
            readHeader(line.substr(p + 1), lineNo, vars, clauses);
            for (int i = 0; i < vars; i++) S.newVar();
            continue;
        }

        if (vars < 0)
            throw ParseError(lineNo, "clause before 'p cnf' header");

        std::istringstream ls(line.substr(p));
        std::string tok;
        while (ls >> tok) {
            const int lit = parseLiteral(tok, lineNo, vars);
            if (lit == 0) {
                S.addClause(lits);
                lits.clear();
                open = false;
                cnt++;
            } else {
                lits.push(fromDimacs(lit));
                open = true;
            }
        }
    }

    if (in.bad())
        throw ParseError(lineNo, "read error");
    if (vars < 0)
        throw ParseError(lineNo, "missing 'p cnf' header");
    if (open)
        throw ParseError(lineNo, "last clause is not terminated by 0");
    if (strict && cnt != clauses) {
        std::ostringstream ss;
        ss << "DIMACS header mismatch: " << clauses << " clauses declared, " << cnt << " read";
        throw ParseError(lineNo, ss.str());
    }

    return cnt;
}

void TraceSat::printModel(FILE* out, const char* prefix, const Solver& S) {
    int col = fprintf(out, "%s", prefix);
    for (Var v = 0; v < S.nVars(); v++) {
        if (col > 72) {
            fprintf(out, "\n");
            col = fprintf(out, "%s", prefix);
        }
        col += fprintf(out, " %s%d", S.modelValue(v) == l_True ? "" : "-", v + 1);
    }
    fprintf(out, " 0\n");
}

void TraceSat::writeResult(FILE* res, lbool ret, const Solver& S) {
    if (ret == l_True) {
        fprintf(res, "SAT\n");
        printModel(res, "", S);
    } else if (ret == l_False)
        fprintf(res, "UNSAT\n");
    else
        fprintf(res, "INDET\n");
}
