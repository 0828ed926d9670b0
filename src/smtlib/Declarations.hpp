// Declarations.hpp ---
//
// Filename: Declarations.hpp
// Author: Abhishek Udupa
// Created: Thu Aug 15 01:56:09 2015 (-0400)
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

// Emitters for the declarations of sorts, datatypes,
// constants, inputs, uninterpreted symbols and axioms

#if !defined SMTG_SMTLIB_DECLARATIONS_HPP_
#define SMTG_SMTLIB_DECLARATIONS_HPP_

#include "../common/SMTGFwdDecls.hpp"
#include "../kinds/Kinds.hpp"
#include "../program/Snapshot.hpp"
#include "SMTConfig.hpp"

namespace SMTG {
    namespace SMTLib {

        using Kinds::KindRef;

        // Opaque sorts, and enumerations along with their
        // S_constrIndex function. Nothing for RoundingMode.
        extern vector<string> DeclSort(const KindRef& Kind);
        extern vector<string> DeclTuple(u32 Arity);
        extern vector<string> DeclSum();
        extern vector<string> DeclMaybe();
        extern vector<string> DeclRationals();

        // (args) result, for a signature whose last kind is the result
        extern string CvtType(const vector<KindRef>& Signature);

        extern vector<string> DefineFun(const SolverCapabilities& Caps,
                                        const Program::SV& Var,
                                        const string& Definition,
                                        const string& Comment = "");
        extern vector<string> DeclConst(const SMTConfig& Config,
                                        const Program::SV& Var,
                                        const Program::CV& Value);

        // Constraints that values of the kind named Name must
        // satisfy: characters are strings of length one, and rationals
        // have positive denominators
        extern vector<string> WellFormednessConstraints(const string& Name,
                                                        const KindRef& Kind);
        extern vector<string> DeclareName(const string& Name,
                                          const vector<KindRef>& Signature,
                                          const string& Comment = "");
        extern vector<string> DeclareFun(const Program::SV& Var,
                                         const vector<KindRef>& Signature,
                                         const string& Comment = "");

        extern vector<string> DeclUI(const Program::UninterpretedSymbol& Symbol);
        extern vector<string> DeclAx(const Program::Axiom& TheAxiom);
        // Recursive reversal of strings or sequences of the given kind
        extern vector<string> DeclSBVFunc(const KindRef& ReversedKind, const string& Name);

    } /* end namespace SMTLib */
} /* end namespace SMTG */

#endif /* SMTG_SMTLIB_DECLARATIONS_HPP_ */

//
// Declarations.hpp ends here
