// SMTGFwdDecls.hpp ---
//
// Filename: SMTGFwdDecls.hpp
// Author: Abhishek Udupa
// Created: Thu May  2 06:54:13 2014 (-0400)
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

// Forward declarations of classes and types

#if !defined SMTG_COMMON_SMTGFWDDECLS_HPP_
#define SMTG_COMMON_SMTGFWDDECLS_HPP_

#include "SMTGTypes.hpp"

#include <map>
#include <set>
#include <vector>

namespace SMTG {

    // SmartPtrs and such
    class RefCountable;
    template <typename T> class SmartPtr;
    template <typename T> class CSmartPtr;

    // The kind (sort) model
    namespace Kinds {
        class KindBase;
        class BoolKind;
        class BoundedKind;
        class UnboundedKind;
        class RealKind;
        class UserSortKind;
        class FloatKind;
        class DoubleKind;
        class FPKind;
        class CharKind;
        class StringKind;
        class ListKind;
        class SetKind;
        class TupleKind;
        class MaybeKind;
        class RationalKind;
        class EitherKind;

        class KindPtrCompare;

        typedef CSmartPtr<KindBase> KindRef;
        typedef set<KindRef, KindPtrCompare> KindSetT;
    } /* end namespace Kinds */

    // The symbolic program handed to us
    namespace Program {
        class SV;
        class CV;
        class RegExp;
        class Operator;
        class OpNode;

        struct TableInfo;
        struct ArrayContext;
        struct ArrayInfo;
        struct UninterpretedSymbol;
        struct Axiom;
        struct QuantifiedInput;
        struct NamedInput;
        struct Constraint;
        struct ProblemSnapshot;
        struct IncrementalSnapshot;

        typedef pair<SV, OpNode> Assignment;
    } /* end namespace Program */

    // SMT-LIB2 script generation
    namespace SMTLib {
        class Logic;
        class SMTOption;
        struct SolverCapabilities;
        struct SMTConfig;
        struct ProblemFeatures;
        class LogicSelector;
        class ExprTranslator;
        class AssertionAssembler;

        typedef map<Program::SV, vector<Program::SV>> SkolemMapT;
        typedef map<i32, string> TableMapT;
        typedef map<Kinds::KindRef, string, Kinds::KindPtrCompare> FunctionMapT;
    } /* end namespace SMTLib */

    // Interfaces to theorem provers
    namespace TP {
        class Z3CtxWrapper;
        class Z3ScriptSession;

        typedef SmartPtr<Z3CtxWrapper> Z3Ctx;
        typedef SmartPtr<Z3ScriptSession> Z3ScriptSessionRef;
    } /* end namespace TP */

    enum class LogFileCompressionTechniqueT {
        COMPRESS_NONE, COMPRESS_GZIP, COMPRESS_BZIP2
    };

} /* end namespace SMTG */

#endif /* SMTG_COMMON_SMTGFWDDECLS_HPP_ */

//
// SMTGFwdDecls.hpp ends here
