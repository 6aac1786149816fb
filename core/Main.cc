/******************************************************************************************[Main.cc]
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
#include <stdio.h>
#include <string.h>

#include <fstream>
#include <iostream>

#include <minisat/utils/System.h>
#include <minisat/utils/Options.h>

#include "core/Dimacs.h"
#include "core/Solver.h"

using namespace TraceSat;
using namespace Minisat;

//=================================================================================================


static void printCore(std::ostream& out, const Solver& S) {
    out << "c input clause numbers:";
    for (size_t i = 0; i < S.core.size(); i++)
        out << " " << (S.core[i] + 1);
    out << "\n";
    S.clauseDatabase.toDimacs(out, S.core, S.nVars());
}


//=================================================================================================
// Main:


int main(int argc, char** argv)
{
    try {
        setUsageHelp("USAGE: %s [options] <input-file> <result-output-file>\n\n  where input is in plain DIMACS.\n");

        // Extra options:
        //
        IntOption    verb   ("MAIN", "verb",   "Verbosity level (0=silent, 1=some, 2=trace every step).", 1, IntRange(0, 2));
        BoolOption   strictp("MAIN", "strict", "Validate DIMACS header during parsing.", false);
        Int64Option  budget ("MAIN", "conf-budget", "Stop after this many conflicts (-1 = no limit).", -1, Int64Range(-1, INT64_MAX));
        StringOption drup   ("MAIN", "drup-file", "Write the learnt clauses as an ASCII DRUP proof to this file.");
        StringOption corep  ("MAIN", "core-file", "Write the UNSAT core in DIMACS format to this file.");

        parseOptions(argc, argv, true);

        Solver S;
        double initial_time = cpuTime();

        S.verbosity = verb;

        if (argc == 1)
            printf("c Reading from standard input... Use '--help' for help.\n");

        std::ifstream file;
        if (argc > 1) {
            file.open(argv[1]);
            if (!file) {
                fprintf(stderr, "ERROR! Could not open file: %s (%s)\n", argv[1], strerror(errno));
                return 1;
            }
        }
        std::istream& in = argc > 1 ? static_cast<std::istream&>(file) : std::cin;

        if (S.verbosity > 0) {
            printf("c ============================[ Problem Statistics ]=============================\n");
            printf("c |                                                                             |\n");
        }

        parse_DIMACS(in, S, strictp);

        if (S.verbosity > 0) {
            printf("c |  Number of variables:  %12d                                         |\n", S.nVars());
            printf("c |  Number of clauses:    %12d                                         |\n", S.nClauses());
            double parsed_time = cpuTime();
            printf("c |  Parse time:           %12.2f s                                       |\n", parsed_time - initial_time);
            printf("c |                                                                             |\n");
        }

        std::ofstream drup_out;
        if (drup) {
            drup_out.open((const char*)drup);
            if (!drup_out) {
                fprintf(stderr, "ERROR! Could not open proof file: %s\n", (const char*)drup);
                return 1;
            }
            S.proofLogger.drup_out = &drup_out;
        }

        if (budget >= 0)
            S.setConfBudget(budget);

        lbool ret = S.solve();
        if (S.proofLogger.enabled()) {
            S.proofLogger.flush();
            if (S.verbosity > 0)
                printf("c DRUP proof            : %llu clauses\n", (unsigned long long)S.proofLogger.lines);
        }

        if (S.verbosity > 0) {
            S.printStats(cpuTime() - initial_time);
            printf("c Memory used           : %.2f MB\n", memUsedPeak());
        }

        if (ret == l_True) {
            printf("s SATISFIABLE\n");
            printModel(stdout, "v", S);
        } else if (ret == l_False) {
            printf("s UNSATISFIABLE\n");
            printf("c core %d clauses\n", (int)S.core.size());
            fflush(stdout);
            printCore(std::cout, S);
            std::cout.flush();
        } else {
            printf("s UNKNOWN\n");
        }

        if (argc >= 3) {
            FILE* res = fopen(argv[2], "wb");
            if (res == NULL) {
                fprintf(stderr, "ERROR! Could not open result file: %s\n", argv[2]);
                return 1;
            }
            writeResult(res, ret, S);
            fclose(res);
        }

        if (ret == l_False && corep) {
            std::ofstream core_out((const char*)corep);
            if (!core_out) {
                fprintf(stderr, "ERROR! Could not open core file: %s\n", (const char*)corep);
                return 1;
            }
            S.clauseDatabase.toDimacs(core_out, S.core, S.nVars());
        }

        return (ret == l_True ? 10 : ret == l_False ? 20 : 0);

    } catch (const ParseError& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    } catch (const InvariantViolation& e) {
        fflush(stdout);
        printf("c INTERNAL ERROR: %s\n", e.what());
        printf("s UNKNOWN\n");
        return 2;
    }
}
