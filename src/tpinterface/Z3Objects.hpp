// Z3Objects.hpp ---
//
// Filename: Z3Objects.hpp
// Author: Abhishek Udupa
// Created: Wed Nov 21 08:33:04 2015 (-0400)
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

#if !defined SMTG_TPINTERFACE_Z3_OBJECTS_HPP_
#define SMTG_TPINTERFACE_Z3_OBJECTS_HPP_

#include <z3.h>
#include <map>

#include "../common/SMTGFwdDecls.hpp"
#include "../containers/SmartPtr.hpp"

namespace SMTG {
    namespace TP {

        // Context level parameters, such as "timeout" or "model",
        // applied when the context is created
        typedef map<string, string> Z3ParamMapT;

        // A ref counted Z3 context that reports errors by polling
        // rather than through an error handler
        class Z3CtxWrapper : public RefCountable
        {
        private:
            Z3_context Ctx;
            Z3ParamMapT Params;

        public:
            Z3CtxWrapper();
            Z3CtxWrapper(const Z3ParamMapT& Params);
            virtual ~Z3CtxWrapper();

            operator Z3_context () const;
            const Z3ParamMapT& GetParams() const;

            // The last error reported on this context, or the
            // empty string if the last call succeeded
            string GetLastError() const;

            static string GetVersionString();
        };

    } /* end namespace TP */
} /* end namespace SMTG */

#endif /* SMTG_TPINTERFACE_Z3_OBJECTS_HPP_ */

//
// Z3Objects.hpp ends here
