// Declarations.cpp ---
//
// Filename: Declarations.cpp
// Author: Abhishek Udupa
// Created: Sat Jun 25 05:53:40 2014 (-0400)
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

#include "Declarations.hpp"

namespace SMTG {
    namespace SMTLib {

        using namespace Kinds;
        using namespace Program;

        vector<string> DeclSort(const KindRef& Kind)
        {
            auto UKind = Kind->As<UserSortKind>();
            if (UKind == nullptr) {
                throw InternalError((string)"DeclSort called on a non-sort kind: " +
                                    Kind->ToString() + "\nAt: " + __FILE__ + ":" +
                                    to_string(__LINE__));
            }
            // RoundingMode is built in
            if (UKind->IsRoundingMode()) {
                return vector<string>();
            }

            auto const& Name = UKind->GetName();
            if (!UKind->IsEnumerated()) {
                return { "(declare-sort " + Name + " 0)  ; N.B. Uninterpreted sort." };
            }

            auto const& Constructors = UKind->GetConstructors();
            vector<string> Wrapped;
            for (auto const& Constructor : Constructors) {
                Wrapped.push_back("(" + Constructor + ")");
            }

            string Body;
            if (Constructors.size() > 0) {
                Body = to_string(Constructors.size() - 1);
                for (i64 i = (i64)Constructors.size() - 2; i >= 0; --i) {
                    Body = "(ite (= x " + Constructors[i] + ") " + to_string(i) + " " + Body + ")";
                }
            }

            return {
                "(declare-datatypes ((" + Name + " 0)) ((" +
                    boost::algorithm::join(Wrapped, " ") + ")))",
                "(define-fun " + Name + "_constrIndex ((x " + Name + ")) Int",
                "   " + Body,
                ")"
            };
        }

        vector<string> DeclTuple(u32 Arity)
        {
            if (Arity == 0) {
                return { "(declare-datatypes ((SBVTuple0 0)) (((mkSBVTuple0))))" };
            }
            if (Arity == 1) {
                throw InternalError((string)"DeclTuple: Unexpected one-tuple" +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }

            auto N = to_string(Arity);
            string L1 = "(declare-datatypes ((SBVTuple" + N + " " + N + ")) (";
            string L2 = string(L1.length(), ' ') + "((mkSBVTuple" + N + " ";
            string Tab(L2.length(), ' ');

            vector<string> Params;
            for (u32 i = 1; i <= Arity; ++i) {
                Params.push_back("T" + to_string(i));
            }

            vector<string> Retval = { L1 + "(par (" + boost::algorithm::join(Params, " ") + ")" };
            for (u32 i = 1; i <= Arity; ++i) {
                Retval.push_back((i == 1 ? L2 : Tab) + "(proj_" + to_string(i) + "_SBVTuple" +
                                 N + " " + Params[i - 1] + ")" + (i == Arity ? ")))))" : ""));
            }
            return Retval;
        }

        vector<string> DeclSum()
        {
            return {
                "(declare-datatypes ((SBVEither 2)) ((par (T1 T2)",
                "                                    ((left_SBVEither  (get_left_SBVEither  T1))",
                "                                     (right_SBVEither (get_right_SBVEither T2))))))"
            };
        }

        vector<string> DeclMaybe()
        {
            return {
                "(declare-datatypes ((SBVMaybe 1)) ((par (T)",
                "                                    ((nothing_SBVMaybe)",
                "                                     (just_SBVMaybe (get_just_SBVMaybe T))))))"
            };
        }

        // Rationals are not kept in reduced form, so equality and
        // the comparisons cross multiply
        vector<string> DeclRationals()
        {
            return {
                "(declare-datatype SBVRational ((SBV.Rational (sbv.rat.numerator Int) (sbv.rat.denominator Int))))",
                "",
                "(define-fun sbv.rat.eq ((x SBVRational) (y SBVRational)) Bool",
                "   (= (* (sbv.rat.numerator   x) (sbv.rat.denominator y))",
                "      (* (sbv.rat.denominator x) (sbv.rat.numerator   y)))",
                ")",
                "",
                "(define-fun sbv.rat.notEq ((x SBVRational) (y SBVRational)) Bool",
                "   (not (sbv.rat.eq x y))",
                ")",
                "",
                "(define-fun sbv.rat.lt ((x SBVRational) (y SBVRational)) Bool",
                "   (<  (* (sbv.rat.numerator   x) (sbv.rat.denominator y))",
                "       (* (sbv.rat.denominator x) (sbv.rat.numerator   y)))",
                ")",
                "",
                "(define-fun sbv.rat.leq ((x SBVRational) (y SBVRational)) Bool",
                "   (<= (* (sbv.rat.numerator   x) (sbv.rat.denominator y))",
                "       (* (sbv.rat.denominator x) (sbv.rat.numerator   y)))",
                ")",
                "",
                "(define-fun sbv.rat.plus ((x SBVRational) (y SBVRational)) SBVRational",
                "   (SBV.Rational (+ (* (sbv.rat.numerator   x) (sbv.rat.denominator y))",
                "                    (* (sbv.rat.denominator x) (sbv.rat.numerator   y)))",
                "                 (* (sbv.rat.denominator x) (sbv.rat.denominator y)))",
                ")",
                "",
                "(define-fun sbv.rat.minus ((x SBVRational) (y SBVRational)) SBVRational",
                "   (SBV.Rational (- (* (sbv.rat.numerator   x) (sbv.rat.denominator y))",
                "                    (* (sbv.rat.denominator x) (sbv.rat.numerator   y)))",
                "                 (* (sbv.rat.denominator x) (sbv.rat.denominator y)))",
                ")",
                "",
                "(define-fun sbv.rat.times ((x SBVRational) (y SBVRational)) SBVRational",
                "   (SBV.Rational (* (sbv.rat.numerator   x) (sbv.rat.numerator y))",
                "                 (* (sbv.rat.denominator x) (sbv.rat.denominator y)))",
                ")",
                "",
                "(define-fun sbv.rat.uneg ((x SBVRational)) SBVRational",
                "   (SBV.Rational (* (- 1) (sbv.rat.numerator x)) (sbv.rat.denominator x))",
                ")",
                "",
                "(define-fun sbv.rat.abs ((x SBVRational)) SBVRational",
                "   (SBV.Rational (abs (sbv.rat.numerator x)) (sbv.rat.denominator x))",
                ")"
            };
        }

        string CvtType(const vector<KindRef>& Signature)
        {
            if (Signature.size() == 0) {
                throw InternalError((string)"CvtType received an empty signature" +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
            vector<string> ArgTypes;
            for (u32 i = 0; i + 1 < Signature.size(); ++i) {
                ArgTypes.push_back(Signature[i]->ToSMTType());
            }
            return "(" + boost::algorithm::join(ArgTypes, " ") + ") " +
                Signature.back()->ToSMTType();
        }

        vector<string> DefineFun(const SolverCapabilities& Caps, const SV& Var,
                                 const string& Definition, const string& Comment)
        {
            auto&& VarName = Var.ToString();
            auto&& VarT = VarName + " () " + Var.GetKind()->ToSMTType();
            string Cmnt = (Comment == "" ? "" : " ; " + Comment);

            if (Caps.SupportsDefineFun) {
                return { "(define-fun " + VarT + " " + Definition + ")" + Cmnt };
            }
            return {
                "(declare-fun " + VarT + ")" + Cmnt,
                "(assert (= " + VarName + " " + Definition + "))"
            };
        }

        vector<string> DeclConst(const SMTConfig& Config, const SV& Var, const CV& Value)
        {
            // true and false are always inlined
            if (Var.IsTrue() || Var.IsFalse()) {
                return vector<string>();
            }
            return DefineFun(Config.Capabilities, Var, Value.ToSMTLib(Config.RoundingMode));
        }

        typedef function<vector<string>(const KindRef&, const string&)> ConstraintGenT;

        static inline string MkAnd(const vector<string>& Constraints)
        {
            if (Constraints.size() == 0) {
                return "true";
            } else if (Constraints.size() == 1) {
                return Constraints[0];
            }
            return "(and " + boost::algorithm::join(Constraints, " ") + ")";
        }

        static vector<string> WalkKind(u32 Depth, const string& Name,
                                       const ConstraintGenT& Gen, const KindRef& Kind)
        {
            switch (Kind->GetTag()) {
            case KindTag::List: {
                auto const& ElemKind = Kind->SAs<ListKind>()->GetElemKind();
                if (!ContainsCharOrRational(ElemKind)) {
                    return vector<string>();
                }
                auto&& IdxName = "seq" + to_string(Depth);
                auto&& Inner = WalkKind(Depth + 1, "(seq.nth " + Name + " " + IdxName + ")",
                                        Gen, ElemKind);
                return {
                    "(forall ((" + IdxName + " " + MkUnboundedKind()->ToSMTType() + ")) " +
                    "(=> (and (>= " + IdxName + " 0) (< " + IdxName + " (seq.len " + Name +
                    "))) " + MkAnd(Inner) + "))"
                };
            }
            case KindTag::Set: {
                auto const& ElemKind = Kind->SAs<SetKind>()->GetElemKind();
                if (!ContainsCharOrRational(ElemKind)) {
                    return vector<string>();
                }
                auto&& ElemName = "set" + to_string(Depth);
                ConstraintGenT MemberGen = [&] (const KindRef& SubKind,
                                                const string& SetName) -> vector<string>
                    {
                        vector<string> Retval;
                        for (auto const& Cstr : Gen(SubKind, ElemName)) {
                            Retval.push_back("(=> (select " + SetName + " " + ElemName +
                                             ") " + Cstr + ")");
                        }
                        return Retval;
                    };
                auto&& Inner = WalkKind(Depth + 1, Name, MemberGen, ElemKind);
                return {
                    "(forall ((" + ElemName + " " + ElemKind->ToSMTType() + ")) " +
                    MkAnd(Inner) + ")"
                };
            }
            case KindTag::Tuple: {
                auto const& ElemKinds = Kind->SAs<TupleKind>()->GetElemKinds();
                auto&& TupleName = "SBVTuple" + to_string(ElemKinds.size());
                vector<string> Retval;
                for (u32 i = 0; i < ElemKinds.size(); ++i) {
                    auto&& Projection = "(proj_" + to_string(i + 1) + "_" + TupleName +
                        " " + Name + ")";
                    auto&& Inner = WalkKind(Depth + 1, Projection, Gen, ElemKinds[i]);
                    Retval.insert(Retval.end(), Inner.begin(), Inner.end());
                }
                return Retval;
            }
            case KindTag::Maybe: {
                auto const& ElemKind = Kind->SAs<MaybeKind>()->GetElemKind();
                auto&& Inner = WalkKind(Depth + 1, "(get_just_SBVMaybe " + Name + ")",
                                        Gen, ElemKind);
                vector<string> Retval;
                for (auto const& Cstr : Inner) {
                    Retval.push_back("(=> ((_ is (just_SBVMaybe (" + ElemKind->ToSMTType() +
                                     ") " + Kind->ToSMTType() + ")) " + Name + ") " +
                                     Cstr + ")");
                }
                return Retval;
            }
            case KindTag::Either: {
                auto EKind = Kind->SAs<EitherKind>();
                vector<string> Retval;
                auto&& LeftInner = WalkKind(Depth + 1, "(get_left_SBVEither " + Name + ")",
                                            Gen, EKind->GetLeftKind());
                for (auto const& Cstr : LeftInner) {
                    Retval.push_back("(=> ((_ is (left_SBVEither (" +
                                     EKind->GetLeftKind()->ToSMTType() + ") " +
                                     Kind->ToSMTType() + ")) " + Name + ") " + Cstr + ")");
                }
                auto&& RightInner = WalkKind(Depth + 1, "(get_right_SBVEither " + Name + ")",
                                             Gen, EKind->GetRightKind());
                for (auto const& Cstr : RightInner) {
                    Retval.push_back("(=> ((_ is (right_SBVEither (" +
                                     EKind->GetRightKind()->ToSMTType() + ") " +
                                     Kind->ToSMTType() + ")) " + Name + ") " + Cstr + ")");
                }
                return Retval;
            }
            default:
                return Gen(Kind, Name);
            }
        }

        vector<string> WellFormednessConstraints(const string& Name, const KindRef& Kind)
        {
            ConstraintGenT Gen = [] (const KindRef& SubKind, const string& SubName) -> vector<string>
                {
                    if (IsChar(SubKind)) {
                        return { "(= 1 (str.len " + SubName + "))" };
                    } else if (IsRational(SubKind)) {
                        return { "(< 0 (sbv.rat.denominator " + SubName + "))" };
                    }
                    return vector<string>();
                };
            return WalkKind(0, Name, Gen, Kind);
        }

        vector<string> DeclareName(const string& Name, const vector<KindRef>& Signature,
                                   const string& Comment)
        {
            if (Signature.size() == 0) {
                throw InternalError((string)"Unexpected empty signature for: " + Name +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }

            vector<string> Retval = {
                "(declare-fun " + Name + " " + CvtType(Signature) + ")" +
                (Comment == "" ? "" : " ; " + Comment)
            };

            auto const& ResultKind = Signature.back();
            if (!ContainsCharOrRational(ResultKind)) {
                return Retval;
            }

            auto NumArgs = Signature.size() - 1;
            if (NumArgs == 0) {
                auto&& Constraints = WellFormednessConstraints(Name, ResultKind);
                if (Constraints.size() == 1) {
                    Retval.push_back("(assert " + Constraints[0] + ")");
                } else if (Constraints.size() > 1) {
                    Retval.push_back("(assert (and " + Constraints[0]);
                    for (u32 i = 1; i < Constraints.size(); ++i) {
                        Retval.push_back(string(13, ' ') + Constraints[i]);
                    }
                    Retval.push_back("        ))");
                }
                return Retval;
            }

            vector<string> ArgNames;
            vector<string> TypedArgs;
            for (u32 i = 0; i < NumArgs; ++i) {
                auto&& ArgName = "a" + to_string(i + 1);
                ArgNames.push_back(ArgName);
                TypedArgs.push_back("(" + ArgName + " " + Signature[i]->ToSMTType() + ")");
            }

            auto&& Constraints = WellFormednessConstraints("result", ResultKind);
            Retval.push_back("(assert (forall (" + boost::algorithm::join(TypedArgs, " ") + ")");
            Retval.push_back(string(16, ' ') + "(let ((result (" + Name + " " +
                             boost::algorithm::join(ArgNames, " ") + ")))");
            if (Constraints.size() == 0) {
                Retval.push_back(string(21, ' ') + "true");
            } else if (Constraints.size() == 1) {
                Retval.push_back(string(21, ' ') + Constraints[0]);
            } else {
                Retval.push_back(string(21, ' ') + "(and " + Constraints[0]);
                for (u32 i = 1; i < Constraints.size(); ++i) {
                    Retval.push_back(string(26, ' ') + Constraints[i]);
                }
                Retval.push_back(string(21, ' ') + ")");
            }
            Retval.push_back(string(16, ' ') + ")))");
            return Retval;
        }

        vector<string> DeclareFun(const SV& Var, const vector<KindRef>& Signature,
                                  const string& Comment)
        {
            return DeclareName(Var.ToString(), Signature, Comment);
        }

        vector<string> DeclUI(const UninterpretedSymbol& Symbol)
        {
            return DeclareName(Symbol.Name, Symbol.Signature);
        }

        vector<string> DeclAx(const Axiom& TheAxiom)
        {
            vector<string> Retval = {
                (string)";; -- user given " + (TheAxiom.IsDefinition ? "definition" : "axiom") +
                ": " + TheAxiom.Name
            };
            Retval.insert(Retval.end(), TheAxiom.Lines.begin(), TheAxiom.Lines.end());
            return Retval;
        }

        vector<string> DeclSBVFunc(const KindRef& ReversedKind, const string& Name)
        {
            if (IsString(ReversedKind)) {
                return {
                    "(define-fun-rec " + Name + " ((str String)) String",
                    "                (ite (= str \"\")",
                    "                     \"\"",
                    "                     (str.++ (" + Name +
                    " (str.substr str 1 (- (str.len str) 1)))",
                    "                             (str.substr str 0 1))))"
                };
            }
            if (IsList(ReversedKind)) {
                auto&& T = ReversedKind->ToSMTType();
                return {
                    "(define-fun-rec " + Name + " ((lst " + T + ")) " + T,
                    "                (ite (= lst (as seq.empty " + T + "))",
                    "                     (as seq.empty " + T + ")",
                    "                     (seq.++ (" + Name +
                    " (seq.extract lst 1 (- (seq.len lst) 1))) (seq.unit (seq.nth lst 0)))))"
                };
            }
            throw InternalError((string)"DeclSBVFunc: Unexpected helper function: " +
                                "reverse of " + ReversedKind->ToString() + " named " + Name +
                                "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
        }

    } /* end namespace SMTLib */
} /* end namespace SMTG */

//
// Declarations.cpp ends here
