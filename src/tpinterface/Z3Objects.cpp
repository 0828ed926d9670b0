// Z3Objects.cpp ---
//
// Filename: Z3Objects.cpp
// Author: Abhishek Udupa
// Created: Sun Mar 23 22:32:42 2014 (-0400)
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

#include "Z3Objects.hpp"

namespace SMTG {
    namespace TP {

        static inline Z3_context MkContext(const Z3ParamMapT& Params)
        {
            auto Cfg = Z3_mk_config();
            Z3_set_param_value(Cfg, "model", "true");
            for (auto const& NameValue : Params) {
                Z3_set_param_value(Cfg, NameValue.first.c_str(), NameValue.second.c_str());
            }
            auto Retval = Z3_mk_context_rc(Cfg);
            Z3_del_config(Cfg);
            if (Retval == nullptr) {
                throw SMTGError((string)"Could not create a Z3 context");
            }
            Z3_set_error_handler(Retval, nullptr);
            return Retval;
        }

        Z3CtxWrapper::Z3CtxWrapper()
            : Ctx(MkContext(Z3ParamMapT()))
        {
            // Nothing here
        }

        Z3CtxWrapper::Z3CtxWrapper(const Z3ParamMapT& Params)
            : Ctx(MkContext(Params)), Params(Params)
        {
            // Nothing here
        }

        Z3CtxWrapper::~Z3CtxWrapper()
        {
            Z3_del_context(Ctx);
        }

        Z3CtxWrapper::operator Z3_context () const
        {
            return Ctx;
        }

        const Z3ParamMapT& Z3CtxWrapper::GetParams() const
        {
            return Params;
        }

        string Z3CtxWrapper::GetLastError() const
        {
            auto Code = Z3_get_error_code(Ctx);
            if (Code == Z3_OK) {
                return "";
            }
            return Z3_get_error_msg(Ctx, Code);
        }

        string Z3CtxWrapper::GetVersionString()
        {
            unsigned Major, Minor, Build, Revision;
            Z3_get_version(&Major, &Minor, &Build, &Revision);
            return to_string(Major) + "." + to_string(Minor) + "." + to_string(Build);
        }

    } /* end namespace TP */
} /* end namespace SMTG */

//
// Z3Objects.cpp ends here
