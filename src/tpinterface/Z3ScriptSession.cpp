// Z3ScriptSession.cpp ---
//
// Filename: Z3ScriptSession.cpp
// Author: Abhishek Udupa
// Created: Mon Jul 10 18:25:27 2015 (-0400)
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

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "Z3ScriptSession.hpp"
#include "../utils/LogManager.hpp"

namespace SMTG {
    namespace TP {

        string TPResultToString(TPResult Result)
        {
            switch (Result) {
            case TPResult::SATISFIABLE:
                return "sat";
            case TPResult::UNSATISFIABLE:
                return "unsat";
            default:
                return "unknown";
            }
        }

        string ResponseToString(Z3_string Response, const string& Commands)
        {
            if (Response == nullptr) {
                throw SMTGError((string)"Z3 returned no response to the script:\n" + Commands);
            }
            return Response;
        }

        Z3ScriptSession::Z3ScriptSession()
            : Ctx(new Z3CtxWrapper()), NumCommandsSent(0),
              LastSolveResult(TPResult::UNKNOWN)
        {
            // Nothing here
        }

        Z3ScriptSession::Z3ScriptSession(const Z3ParamMapT& Params)
            : Ctx(new Z3CtxWrapper(Params)), NumCommandsSent(0),
              LastSolveResult(TPResult::UNKNOWN)
        {
            SMTG_LOG_FULL("Z3Session.Commands",
                          Out_ << "Opened a Z3 " << Z3CtxWrapper::GetVersionString()
                               << " session with " << Params.size()
                               << " parameter(s)" << endl;);
        }

        Z3ScriptSession::~Z3ScriptSession()
        {
            // Nothing here
        }

        string Z3ScriptSession::Eval(const string& Commands)
        {
            SMTG_LOG_FULL("Z3Session.Commands",
                          Out_ << "Sending to Z3:" << endl << Commands << endl;);

            auto RawOutput = Z3_eval_smtlib2_string(*Ctx, Commands.c_str());
            auto&& Error = Ctx->GetLastError();
            if (Error != "") {
                throw SMTGError((string)"Z3 rejected the script: " + Error);
            }
            auto&& Output = ResponseToString(RawOutput, Commands);
            if (boost::algorithm::contains(Output, "(error")) {
                throw SMTGError((string)"Z3 rejected the script:\n" + Output);
            }

            SMTG_LOG_FULL("Z3Session.Commands",
                          Out_ << "Z3 responded:" << endl << Output << endl;);
            return Output;
        }

        string Z3ScriptSession::Send(const vector<string>& Lines)
        {
            NumCommandsSent += Lines.size();
            return Eval(boost::algorithm::join(Lines, "\n"));
        }

        TPResult Z3ScriptSession::CheckSat()
        {
            auto&& Output = boost::algorithm::trim_copy(Eval("(check-sat)"));
            ++NumCommandsSent;
            if (Output == "sat") {
                LastSolveResult = TPResult::SATISFIABLE;
            } else if (Output == "unsat") {
                LastSolveResult = TPResult::UNSATISFIABLE;
            } else if (Output == "unknown") {
                LastSolveResult = TPResult::UNKNOWN;
            } else {
                throw SMTGError((string)"Unexpected response from Z3 to (check-sat): " +
                                Output);
            }
            return LastSolveResult;
        }

        string Z3ScriptSession::GetModel()
        {
            if (LastSolveResult != TPResult::SATISFIABLE) {
                throw SMTGError((string)"Z3ScriptSession::GetModel() called, but " +
                                "the last call to CheckSat() was not satisfiable");
            }
            ++NumCommandsSent;
            return Eval("(get-model)");
        }

        TPResult Z3ScriptSession::GetLastSolveResult() const
        {
            return LastSolveResult;
        }

        u32 Z3ScriptSession::GetNumCommandsSent() const
        {
            return NumCommandsSent;
        }

        void Z3ScriptSession::Reset()
        {
            Ctx = new Z3CtxWrapper(Ctx->GetParams());
            NumCommandsSent = 0;
            LastSolveResult = TPResult::UNKNOWN;
        }

    } /* end namespace TP */
} /* end namespace SMTG */

//
// Z3ScriptSession.cpp ends here
