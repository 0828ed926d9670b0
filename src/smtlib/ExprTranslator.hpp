// ExprTranslator.hpp ---
//
// Filename: ExprTranslator.hpp
// Author: Abhishek Udupa
// Created: Sat Oct 25 22:11:48 2014 (-0400)
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

// Translation of operation nodes into SMT-LIB2 terms

#if !defined SMTG_SMTLIB_EXPR_TRANSLATOR_HPP_
#define SMTG_SMTLIB_EXPR_TRANSLATOR_HPP_

#include "../common/SMTGFwdDecls.hpp"
#include "../kinds/Kinds.hpp"
#include "../program/Snapshot.hpp"
#include "SMTConfig.hpp"

namespace SMTG {
    namespace SMTLib {

        using Kinds::KindRef;

        // A symbolic value as a term: true and false are inlined, and
        // skolemized inputs are applied to the universals they depend on
        extern string CvtSV(const SkolemMapT& SkolemMap, const Program::SV& Var);

        // Conversions between kinds, bit-vectors to and from integers
        // included; anything touching a float or a double goes through
        // HandleFPCast with roundNearestTiesToEven
        extern string HandleKindCast(bool HasInt2bv, const KindRef& FromKind,
                                     const KindRef& ToKind, const string& Arg);
        extern string HandleFPCast(const KindRef& FromKind, const KindRef& ToKind,
                                   const string& RoundingMode, const string& Arg);
        // Native pseudo-Boolean syntax
        extern string HandlePB(Program::PBOpKind Op, const vector<i64>& Coefficients,
                               i64 Bound, const vector<string>& Args);
        // Pseudo-Boolean constraints as linear integer arithmetic
        extern string ReducePB(Program::PBOpKind Op, const vector<i64>& Coefficients,
                               i64 Bound, const vector<string>& Args);

        class ExprTranslator
        {
        private:
            const SMTConfig& Config;
            const SkolemMapT& SkolemMap;
            const TableMapT& TableMap;
            const FunctionMapT& FunctionMap;

            // Classification of the operands of the node
            // being translated
            struct ArgClasses
            {
                bool BVOp;
                bool IntOp;
                bool RatOp;
                bool RealOp;
                bool FPOp;
                bool BoolOp;
                bool CharOp;
                bool StringOp;
                bool ListOp;
                bool HasSign;

                ArgClasses(const vector<Program::SV>& Args);
            };

            string SSV(const Program::SV& Var) const;
            vector<string> SSVs(const vector<Program::SV>& Vars) const;
            string GetTableName(i32 TableId) const;
            string DTConstructor(const string& Field, const vector<Program::SV>& Args,
                                 const KindRef& ResultKind) const;
            string DTAccessor(const string& Field, const vector<KindRef>& Params,
                              const KindRef& ResultKind) const;

            string TranslateLkUp(const Program::OpNode& Node) const;
            string TranslateAbs(const ArgClasses& Classes, const vector<Program::SV>& Args,
                                const vector<string>& Strs) const;
            string TranslateNotEqual(const ArgClasses& Classes, const vector<string>& Strs) const;
            string TranslateSetOp(const Program::OpNode& Node) const;

            // The generic operators (arithmetic, equality and comparisons)
            // for each class of operands. Return false if the class has
            // no encoding for the operator.
            bool TranslateIntOp(const ArgClasses& Classes, const Program::OpNode& Node,
                                const vector<string>& Strs, string& Retval) const;
            bool TranslateBoolComparison(Program::OpKind Code, const vector<string>& Strs,
                                         string& Retval) const;
            bool TranslateBVOp(const ArgClasses& Classes, const Program::OpNode& Node,
                               const vector<string>& Strs, string& Retval) const;
            bool TranslateRealOrFPOp(const ArgClasses& Classes, const Program::OpNode& Node,
                                     const vector<string>& Strs, string& Retval) const;
            bool TranslateRationalOp(Program::OpKind Code, const vector<string>& Strs,
                                     string& Retval) const;
            bool TranslateOrderedOp(Program::OpKind Code, const string& LessThan,
                                    const string& LessEq, const vector<string>& Strs,
                                    string& Retval) const;
            bool TranslateUninterpretedOp(const Program::OpNode& Node,
                                          const vector<string>& Strs, string& Retval) const;

            // Shared by the integer, real and floating point classes
            bool TranslateSharedOp(const ArgClasses& Classes, const Program::OpNode& Node,
                                   const vector<string>& Strs, string& Retval) const;
            string TranslateGeneric(const Program::OpNode& Node) const;

        public:
            ExprTranslator(const SMTConfig& Config, const SkolemMapT& SkolemMap,
                           const TableMapT& TableMap, const FunctionMapT& FunctionMap);
            ~ExprTranslator();

            string Translate(const Program::OpNode& Node) const;
            // The top level definition of an assignment
            vector<string> DeclDef(const Program::Assignment& Asgn) const;
            // The let binding of an assignment inside the universal binder
            string MkLet(const Program::Assignment& Asgn) const;
        };

    } /* end namespace SMTLib */
} /* end namespace SMTG */

#endif /* SMTG_SMTLIB_EXPR_TRANSLATOR_HPP_ */

//
// ExprTranslator.hpp ends here
