// ExampleOptions.hpp ---
//
// Filename: ExampleOptions.hpp
// Author: Abhishek Udupa
// Created: Mon Feb 19 02:27:39 2014 (-0400)
//
//
// Copyright (c) 2013, Abhishek Udupa, University of Pennsylvania
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
// 1. Redistributions of source code must retain the above copyright
//    notice, this list of conditions and the following disclaimer.
// 2. Redistributions in binary form must reproduce the above copyright
//    notice, this list of conditions and the following disclaimer in the
//    documentation and/or other materials provided with the distribution.
// 3. All advertising materials mentioning features or use of this software
//    must display the following acknowledgement:
//    This product includes software developed by The University of Pennsylvania
// 4. Neither the name of the University of Pennsylvania nor the
//    names of its contributors may be used to endorse or promote products
//    derived from this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDER ''AS IS'' AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
// WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER BE LIABLE FOR ANY
// DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
// (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
// LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
// ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
// SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
//
//

// Code:

#if !defined SMTG_TEST_EXAMPLES_EXAMPLE_OPTIONS_HPP_
#define SMTG_TEST_EXAMPLES_EXAMPLE_OPTIONS_HPP_

#include <string>
#include <iostream>
#include <boost/program_options.hpp>

using namespace std;

#include "../../src/lib/SMTGLib.hpp"
#include "../../src/smtlib/SMTConfig.hpp"
#include "../../src/utils/LogManager.hpp"

namespace po = boost::program_options;
using SMTG::LogFileCompressionTechniqueT;

struct ExampleOptionsT {
    string SolverName;
    bool PrintScript;
    bool Solve;
    string LogFileName;
    vector<string> LogOptions;
    LogFileCompressionTechniqueT LogCompressionTechnique;
};

static inline void ParseOptions(int Argc, char* ArgV[], ExampleOptionsT& Options)
{
    po::options_description Desc("Usage and Allowed Options");
    auto&& LogOptionsDesc = SMTG::Logging::LogManager::GetLogOptions();
    vector<string> LogOptions;
    string LogFileName;
    string LogCompressionTechnique;
    string SolverName;

    Desc.add_options()
        ("help", "Produce this help message")
        ("solver", po::value<string>(&SolverName)->default_value("z3"),
         "Solver to generate the script for; one of: z3, cvc5, yices, boolector, mathsat")
        ("print-script,p", "Print the generated script")
        ("no-solve,n", "Only generate the script, do not run it through Z3")
        ("log-file", po::value<string>(&LogFileName)->default_value(""),
         "Name of file to write logging info into, defaults to stdout")
        ("log-compression", po::value<string>(&LogCompressionTechnique)->default_value("none"),
         "Compression option for log file; one of: none, gzip, bzip2")
        ("log-opts", po::value<vector<string>>(&LogOptions)->multitoken(),
         ((string)"Logging Options to enable\n" + LogOptionsDesc).c_str());

    po::variables_map vm;

    po::store(po::command_line_parser(Argc, ArgV).options(Desc).run(), vm);
    po::notify(vm);

    if (vm.count("help") > 0) {
        cout << Desc << endl;
        exit(1);
    }

    try {
        SMTG::SMTLib::GetSolverCapabilities(SolverName);
    } catch (const SMTG::SMTGError& Ex) {
        cout << Ex.what() << endl << Desc << endl;
        exit(1);
    }
    Options.SolverName = SolverName;

    if (LogCompressionTechnique == "none") {
        Options.LogCompressionTechnique = LogFileCompressionTechniqueT::COMPRESS_NONE;
    } else if (LogCompressionTechnique == "gzip") {
        Options.LogCompressionTechnique = LogFileCompressionTechniqueT::COMPRESS_GZIP;
    } else if (LogCompressionTechnique == "bzip2") {
        Options.LogCompressionTechnique = LogFileCompressionTechniqueT::COMPRESS_BZIP2;
    } else {
        cout << Desc << endl;
        exit(1);
    }

    Options.PrintScript = (vm.count("print-script") > 0);
    Options.Solve = (vm.count("no-solve") == 0);
    Options.LogFileName = LogFileName;
    Options.LogOptions = LogOptions;
}

static inline SMTG::SMTGLibOptionsT OptsToLibOpts(const ExampleOptionsT& Opts)
{
    SMTG::SMTGLibOptionsT Retval;
    Retval.LogFileName = Opts.LogFileName;
    Retval.LogCompressionTechnique = Opts.LogCompressionTechnique;
    Retval.LoggingOptions.insert(Opts.LogOptions.begin(), Opts.LogOptions.end());
    return Retval;
}

static inline void PrintScript(const vector<string>& Lines)
{
    for (auto const& Line : Lines) {
        cout << Line << endl;
    }
}

#endif /* SMTG_TEST_EXAMPLES_EXAMPLE_OPTIONS_HPP_ */

//
// ExampleOptions.hpp ends here
