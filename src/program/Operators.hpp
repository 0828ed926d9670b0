// Operators.hpp ---
//
// Filename: Operators.hpp
// Author: Abhishek Udupa
// Created: Fri Jan 14 05:10:26 2014 (-0400)
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

// Operators, regular expressions and operation nodes
// of the symbolic program

#if !defined SMTG_PROGRAM_OPERATORS_HPP_
#define SMTG_PROGRAM_OPERATORS_HPP_

#include "../common/SMTGFwdDecls.hpp"
#include "Values.hpp"

namespace SMTG {
    namespace Program {

        enum class OpKind {
            Ite, Plus, Times, Minus, UNeg, Abs, Quot, Rem,
            Equal, NotEqual, LessThan, GreaterThan, LessEq, GreaterEq,
            And, Or, XOr, Not, Shl, Shr, Rol, Ror, Extract, Join,
            LkUp, ArrEq, ArrRead, KindCast, Uninterpreted, Label,
            IEEEFP, NonLinear, OverflowOp, PseudoBoolean,
            StrOp, RegExOp, SeqOp, SetOp,
            TupleConstructor, TupleAccess,
            EitherConstructor, EitherIs, EitherAccess,
            RationalConstructor,
            MaybeConstructor, MaybeIs, MaybeAccess
        };

        enum class FPOpKind {
            Abs, Neg, Add, Sub, Mul, Div, FMA, Sqrt, Rem, RoundToIntegral,
            Min, Max, Cast, Reinterp, IsNormal, IsSubnormal, IsZero,
            IsInfinite, IsNaN, IsNegative, IsPositive, ObjEqual
        };

        enum class NROpKind {
            Sin, Cos, Tan, ASin, ACos, ATan, Sqrt, Sinh, Cosh, Tanh, Exp, Log, Pow
        };

        enum class OvOpKind {
            SMulNoOverflow, SMulNoUnderflow, UMulNoOverflow
        };

        enum class PBOpKind {
            AtMost, AtLeast, Exactly, Le, Ge, Eq
        };

        enum class StrOpKind {
            Concat, Len, At, Substr, IndexOf, Contains, PrefixOf, SuffixOf,
            Replace, ToInt, FromInt, ToCode, FromCode, LessThan, LessEq,
            Unit, InRe
        };

        enum class RegExOpKind {
            Eq, NEq
        };

        enum class SeqOpKind {
            Concat, Len, Unit, Nth, Extract, IndexOf, Contains, PrefixOf,
            SuffixOf, Replace, Reverse
        };

        enum class SetOpKind {
            Equal, Member, Insert, Delete, Intersect, Union, Subset,
            Difference, Complement, HasSize
        };

        enum class RegExpTag {
            Literal, All, AllChar, None, Range, Conc, KStar, KPlus, Opt,
            Comp, Diff, Loop, Power, Union, Inter
        };

        class RegExp : public Stringifiable
        {
        private:
            RegExpTag Tag;
            string Literal;
            u32 RangeLow;
            u32 RangeHigh;
            u32 LoopLow;
            u32 LoopHigh;
            vector<RegExp> Children;

            RegExp(RegExpTag Tag);

        public:
            RegExp();
            virtual ~RegExp();

            RegExpTag GetTag() const;
            const vector<RegExp>& GetChildren() const;

            virtual string ToString(u32 Verbosity = 0) const override;
            string ToSMTLib() const;

            static RegExp MkLiteral(const string& Value);
            static RegExp MkAll();
            static RegExp MkAllChar();
            static RegExp MkNone();
            static RegExp MkRange(u32 Low, u32 High);
            static RegExp MkConc(const vector<RegExp>& Parts);
            static RegExp MkKStar(const RegExp& Inner);
            static RegExp MkKPlus(const RegExp& Inner);
            static RegExp MkOpt(const RegExp& Inner);
            static RegExp MkComp(const RegExp& Inner);
            static RegExp MkDiff(const RegExp& Left, const RegExp& Right);
            static RegExp MkLoop(u32 Low, u32 High, const RegExp& Inner);
            static RegExp MkPower(u32 Count, const RegExp& Inner);
            static RegExp MkUnion(const vector<RegExp>& Parts);
            static RegExp MkInter(const RegExp& Left, const RegExp& Right);
        };

        // An operator along with the data it carries,
        // e.g., the bounds of an extraction or the table
        // consulted by a lookup.
        class Operator : public Stringifiable
        {
        private:
            OpKind Code;
            // the operation within a family of operators
            u32 SubCode;
            // extract bounds, rotation amounts, tuple positions
            u32 Param1;
            u32 Param2;
            // table and array identifiers
            i32 Entity1;
            i32 Entity2;
            u64 TableLength;
            // cast source and target, lookup index and result, sum
            // sides, optional payload and the kind being reversed
            KindRef Kind1;
            KindRef Kind2;
            // lookup index and default, cast rounding mode
            SV Operand1;
            SV Operand2;
            // uninterpreted function names and labels
            string Name;
            vector<i64> Coefficients;
            i64 Bound;
            vector<RegExp> RegExps;
            // right sums and present optionals
            bool Flag;

            Operator(OpKind Code);

        public:
            Operator();
            virtual ~Operator();

            OpKind GetCode() const;

            FPOpKind GetFPOp() const;
            NROpKind GetNROp() const;
            OvOpKind GetOvOp() const;
            PBOpKind GetPBOp() const;
            StrOpKind GetStrOp() const;
            RegExOpKind GetRegExOp() const;
            SeqOpKind GetSeqOp() const;
            SetOpKind GetSetOp() const;

            u32 GetExtractHigh() const;
            u32 GetExtractLow() const;
            u32 GetRotateAmount() const;
            u32 GetTupleArity() const;
            u32 GetTuplePosition() const;

            i32 GetTableId() const;
            u64 GetTableLength() const;
            const KindRef& GetIndexKind() const;
            const KindRef& GetResultKind() const;
            const SV& GetLookupIndex() const;
            const SV& GetLookupDefault() const;

            i32 GetArrayId() const;
            i32 GetOtherArrayId() const;

            const KindRef& GetFromKind() const;
            const KindRef& GetToKind() const;
            const SV& GetRoundingModeSV() const;

            const KindRef& GetLeftKind() const;
            const KindRef& GetRightKind() const;
            const KindRef& GetElemKind() const;
            const KindRef& GetReversedKind() const;

            const string& GetName() const;
            const vector<i64>& GetCoefficients() const;
            i64 GetBound() const;
            const vector<RegExp>& GetRegExps() const;
            bool GetFlag() const;

            // The SMT-LIB2 function symbol for the operators
            // of the floating point, non-linear, overflow, string
            // and sequence families
            string GetSMTName() const;

            virtual string ToString(u32 Verbosity = 0) const override;

            static Operator MkSimple(OpKind Code);
            static Operator MkExtract(u32 High, u32 Low);
            static Operator MkRol(u32 Amount);
            static Operator MkRor(u32 Amount);
            static Operator MkLkUp(i32 TableId, const KindRef& IndexKind,
                                   const KindRef& ResultKind, u64 TableLength,
                                   const SV& Index, const SV& Default);
            static Operator MkArrEq(i32 ArrayId, i32 OtherArrayId);
            static Operator MkArrRead(i32 ArrayId);
            static Operator MkKindCast(const KindRef& FromKind, const KindRef& ToKind);
            static Operator MkUninterpreted(const string& Name);
            static Operator MkLabel(const string& Label);
            static Operator MkFPOp(FPOpKind Op);
            static Operator MkFPCast(const KindRef& FromKind, const KindRef& ToKind,
                                     const SV& RoundingMode);
            static Operator MkFPReinterp(const KindRef& FromKind, const KindRef& ToKind);
            static Operator MkNROp(NROpKind Op);
            static Operator MkOverflowOp(OvOpKind Op);
            static Operator MkPBOp(PBOpKind Op, const vector<i64>& Coefficients, i64 Bound);
            static Operator MkStrOp(StrOpKind Op);
            static Operator MkStrInRe(const RegExp& Re);
            static Operator MkRegExOp(RegExOpKind Op, const RegExp& Left, const RegExp& Right);
            static Operator MkSeqOp(SeqOpKind Op);
            static Operator MkSeqReverse(const KindRef& Kind);
            static Operator MkSetOp(SetOpKind Op);
            static Operator MkTupleConstructor(u32 Arity);
            static Operator MkTupleAccess(u32 Position, u32 Arity);
            static Operator MkEitherConstructor(const KindRef& LeftKind,
                                                const KindRef& RightKind, bool IsRight);
            static Operator MkEitherIs(const KindRef& LeftKind,
                                       const KindRef& RightKind, bool IsRight);
            static Operator MkEitherAccess(bool IsRight);
            static Operator MkRationalConstructor();
            static Operator MkMaybeConstructor(const KindRef& ElemKind, bool IsJust);
            static Operator MkMaybeIs(const KindRef& ElemKind, bool IsJust);
            static Operator MkMaybeAccess();
        };

        // An application of an operator to its operands
        class OpNode : public Stringifiable
        {
        private:
            Operator Op;
            vector<SV> Args;

        public:
            OpNode();
            OpNode(const Operator& Op, const vector<SV>& Args);
            virtual ~OpNode();

            const Operator& GetOp() const;
            const vector<SV>& GetArgs() const;

            virtual string ToString(u32 Verbosity = 0) const override;
        };

    } /* end namespace Program */
} /* end namespace SMTG */

#endif /* SMTG_PROGRAM_OPERATORS_HPP_ */

//
// Operators.hpp ends here
