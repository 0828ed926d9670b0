// Z3ScriptSession.hpp ---
//
// Filename: Z3ScriptSession.hpp
// Author: Abhishek Udupa
// Created: Sun May 11 19:06:52 2014 (-0400)
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

// A live Z3 session fed with script lines through the
// SMT-LIB2 front end of Z3

#if !defined SMTG_TPINTERFACE_Z3_SCRIPT_SESSION_HPP_
#define SMTG_TPINTERFACE_Z3_SCRIPT_SESSION_HPP_

#include "../common/SMTGFwdDecls.hpp"
#include "../containers/SmartPtr.hpp"

#include "Z3Objects.hpp"

namespace SMTG {
    namespace TP {

        enum class TPResult {
            SATISFIABLE, UNSATISFIABLE, UNKNOWN
        };

        extern string TPResultToString(TPResult Result);
        // Throws SMTGError on a null response
        extern string ResponseToString(Z3_string Response, const string& Commands);

        class Z3ScriptSession : public RefCountable
        {
        private:
            Z3Ctx Ctx;
            u32 NumCommandsSent;
            TPResult LastSolveResult;

            string Eval(const string& Commands);

        public:
            Z3ScriptSession();
            // The parameters are reapplied on every Reset()
            Z3ScriptSession(const Z3ParamMapT& Params);
            virtual ~Z3ScriptSession();

            // Sends the lines as one script, and returns what Z3
            // printed in response. Throws SMTGError if Z3 reports
            // an error.
            string Send(const vector<string>& Lines);
            TPResult CheckSat();
            // Only valid after a satisfiable CheckSat()
            string GetModel();
            TPResult GetLastSolveResult() const;
            u32 GetNumCommandsSent() const;

            // Discards everything sent so far
            void Reset();
        };

    } /* end namespace TP */
} /* end namespace SMTG */

#endif /* SMTG_TPINTERFACE_Z3_SCRIPT_SESSION_HPP_ */

//
// Z3ScriptSession.hpp ends here
