// ExprTranslator.cpp ---
//
// Filename: ExprTranslator.cpp
// Author: Abhishek Udupa
// Created: Sun Mar  4 10:01:22 2015 (-0400)
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

#include <algorithm>
#include <boost/algorithm/string/join.hpp>

#include "ExprTranslator.hpp"
#include "Declarations.hpp"

namespace SMTG {
    namespace SMTLib {

        using namespace Kinds;
        using namespace Program;
        using boost::algorithm::join;

        static inline string PowerOfTwoString(u32 Exponent)
        {
            BigInt Retval = 1;
            Retval <<= Exponent;
            return Retval.str();
        }

        static inline string UnexpectedArgs(const string& Where, const vector<string>& Strs)
        {
            return (string)"Unexpected arguments to " + Where + ": [" + join(Strs, ", ") + "]";
        }

        static inline string Lift1(const string& Op, const vector<string>& Strs)
        {
            if (Strs.size() != 1) {
                throw InternalError(UnexpectedArgs(Op, Strs));
            }
            return "(" + Op + " " + Strs[0] + ")";
        }

        static inline string Lift2(const string& Op, const vector<string>& Strs)
        {
            if (Strs.size() != 2) {
                throw InternalError(UnexpectedArgs(Op, Strs));
            }
            return "(" + Op + " " + Strs[0] + " " + Strs[1] + ")";
        }

        static inline string LiftN(const string& Op, const vector<string>& Strs)
        {
            return "(" + Op + " " + join(Strs, " ") + ")";
        }

        static inline vector<string> Swap(const vector<string>& Strs)
        {
            if (Strs.size() != 2) {
                throw InternalError(UnexpectedArgs("a swapped comparison", Strs));
            }
            return { Strs[1], Strs[0] };
        }

        string CvtSV(const SkolemMapT& SkolemMap, const SV& Var)
        {
            auto it = SkolemMap.find(Var);
            if (it != SkolemMap.end()) {
                string Retval = "(" + Var.ToString();
                for (auto const& Dep : it->second) {
                    Retval += " " + Dep.ToString();
                }
                return Retval + ")";
            }
            return Var.ToString();
        }

        // Floats and doubles are just arbitrary floats of fixed sizes
        static inline KindRef SimplifyFloating(const KindRef& Kind)
        {
            if (IsFloat(Kind)) {
                return MkFPKind(8, 24);
            } else if (IsDouble(Kind)) {
                return MkFPKind(11, 53);
            }
            return Kind;
        }

        string HandleFPCast(const KindRef& FromKindIn, const KindRef& ToKindIn,
                            const string& RoundingMode, const string& Arg)
        {
            auto FromKind = SimplifyFloating(FromKindIn);
            auto ToKind = SimplifyFloating(ToKindIn);

            if (FromKind->Equals(*ToKind)) {
                return Arg;
            }

            auto AddRM = [&] (const string& Op) -> string
                {
                    return Op + " " + RoundingMode + " " + Arg;
                };

            string Cast;
            if (IsFP(ToKind)) {
                auto FPTo = ToKind->SAs<FPKind>();
                auto&& Size = to_string(FPTo->GetExponentBits()) + " " +
                    to_string(FPTo->GetSignificandBits());

                if (IsUnbounded(FromKind)) {
                    // through the reals
                    Cast = "(_ to_fp " + Size + ") " + RoundingMode + " (to_real " + Arg + ")";
                } else if (IsBounded(FromKind) &&
                           !FromKind->SAs<BoundedKind>()->IsSigned()) {
                    Cast = AddRM("(_ to_fp_unsigned " + Size + ")");
                } else if (IsBounded(FromKind) || IsReal(FromKind) || IsFP(FromKind)) {
                    Cast = AddRM("(_ to_fp " + Size + ")");
                }
            } else if (IsFP(FromKind)) {
                if (IsUnbounded(ToKind)) {
                    Cast = "to_int (fp.to_real " + Arg + ")";
                } else if (IsBounded(ToKind)) {
                    auto BVTo = ToKind->SAs<BoundedKind>();
                    Cast = AddRM((string)"(_ " + (BVTo->IsSigned() ? "fp.to_sbv " : "fp.to_ubv ") +
                                 to_string(BVTo->GetWidth()) + ")");
                } else if (IsReal(ToKind)) {
                    Cast = "fp.to_real " + Arg;
                }
            }

            if (Cast == "") {
                throw InternalError((string)"Unexpected FPCast from: " + FromKindIn->ToString() +
                                    " to " + ToKindIn->ToString() + "\nAt: " + __FILE__ + ":" +
                                    to_string(__LINE__));
            }
            return "(" + Cast + ")";
        }

        // Two's complement of a bit-vector to an integer
        static inline string BVToInt(bool Signed, u32 Width, const string& Arg)
        {
            if (!Signed) {
                return "(bv2nat " + Arg + ")";
            }
            if (Width == 1) {
                return "(ite (= " + Arg + " #b0) 0 (- 1))";
            }
            auto&& Top = to_string(Width - 1);
            auto&& MSB = "((_ extract " + Top + " " + Top + ") " + Arg + ")";
            auto&& Rest = "((_ extract " + to_string(Width - 2) + " 0) " + Arg + ")";
            auto&& IfPos = "(bv2nat " + Rest + ")";
            auto&& IfNeg = "(- " + IfPos + " " + PowerOfTwoString(Width - 1) + ")";
            return "(ite (= " + MSB + " #b0) " + IfPos + " " + IfNeg + ")";
        }

        // Integer to a bit-vector of the given width. Without int2bv,
        // the value is reduced modulo 2^n and assembled bit by bit,
        // which works for signed and unsigned targets alike.
        static inline string IntToBV(bool HasInt2bv, u32 Width, const string& Arg)
        {
            if (HasInt2bv) {
                return "((_ int2bv " + to_string(Width) + ") " + Arg + ")";
            }

            auto&& Reduced = "(__a (mod " + Arg + " " + PowerOfTwoString(Width) + "))";
            vector<string> Defs;
            for (u32 i = 0; i < Width; ++i) {
                if (i == 0) {
                    Defs.push_back("(__a0 (ite (= (mod __a 2) 0) #b0 #b1))");
                } else {
                    Defs.push_back("(__a" + to_string(i) + " (ite (= (mod (div __a " +
                                   PowerOfTwoString(i) + ") 2) 0) #b0 #b1))");
                }
            }
            string Body = "__a0";
            for (u32 i = 1; i < Width; ++i) {
                Body = "(concat __a" + to_string(i) + " " + Body + ")";
            }
            return "(let (" + Reduced + ") (let (" + join(Defs, " ") + ") " + Body + "))";
        }

        string HandleKindCast(bool HasInt2bv, const KindRef& FromKind,
                              const KindRef& ToKind, const string& Arg)
        {
            if (FromKind->Equals(*ToKind)) {
                return Arg;
            }

            if (IsBounded(FromKind)) {
                auto BVFrom = FromKind->SAs<BoundedKind>();
                auto M = BVFrom->GetWidth();
                if (IsBounded(ToKind)) {
                    auto N = ToKind->SAs<BoundedKind>()->GetWidth();
                    if (N > M) {
                        return (string)"((_ " + (BVFrom->IsSigned() ? "sign_extend " : "zero_extend ") +
                            to_string(N - M) + ") " + Arg + ")";
                    } else if (N == M) {
                        return Arg;
                    }
                    return "((_ extract " + to_string(N - 1) + " 0) " + Arg + ")";
                }
                if (IsUnbounded(ToKind)) {
                    return BVToInt(BVFrom->IsSigned(), M, Arg);
                }
            } else if (IsUnbounded(FromKind)) {
                if (IsReal(ToKind)) {
                    return "(to_real " + Arg + ")";
                }
                if (IsBounded(ToKind)) {
                    return IntToBV(HasInt2bv, ToKind->SAs<BoundedKind>()->GetWidth(), Arg);
                }
            } else if (IsReal(FromKind)) {
                if (IsUnbounded(ToKind)) {
                    return "(to_int " + Arg + ")";
                }
            }

            if (IsFloat(FromKind) || IsDouble(FromKind) ||
                IsFloat(ToKind) || IsDouble(ToKind)) {
                return HandleFPCast(FromKind, ToKind,
                                    RoundingModeToSMT(RoundingModeT::RoundNearestTiesToEven),
                                    Arg);
            }
            throw InternalError((string)"Unexpected cast from: " + FromKind->ToString() +
                                " to " + ToKind->ToString() + "\nAt: " + __FILE__ + ":" +
                                to_string(__LINE__));
        }

        string HandlePB(PBOpKind Op, const vector<i64>& Coefficients, i64 Bound,
                        const vector<string>& Args)
        {
            vector<string> Params = { to_string(Bound) };
            string Name;
            switch (Op) {
            case PBOpKind::AtMost:
                Name = "at-most";
                break;
            case PBOpKind::AtLeast:
                Name = "at-least";
                break;
            case PBOpKind::Exactly:
                Name = "pbeq";
                Params.insert(Params.end(), Args.size(), "1");
                break;
            case PBOpKind::Eq:
            case PBOpKind::Le:
            case PBOpKind::Ge:
                Name = (Op == PBOpKind::Eq ? "pbeq" : (Op == PBOpKind::Le ? "pble" : "pbge"));
                for (auto Coeff : Coefficients) {
                    Params.push_back(to_string(Coeff));
                }
                break;
            }
            return "((_ " + Name + " " + join(Params, " ") + ") " + join(Args, " ") + ")";
        }

        string ReducePB(PBOpKind Op, const vector<i64>& Coefficients, i64 Bound,
                        const vector<string>& Args)
        {
            bool Weighted = (Op == PBOpKind::Le || Op == PBOpKind::Ge || Op == PBOpKind::Eq);
            vector<string> Terms;
            for (u32 i = 0; i < Args.size(); ++i) {
                if (Weighted && i >= Coefficients.size()) {
                    break;
                }
                Terms.push_back("(ite " + Args[i] + " " +
                                (Weighted ? to_string(Coefficients[i]) : (string)"1") + " 0)");
            }
            auto&& Sum = "(+ " + join(Terms, " ") + ")";

            string Cmp;
            switch (Op) {
            case PBOpKind::AtMost:
            case PBOpKind::Le:
                Cmp = "(<= ";
                break;
            case PBOpKind::AtLeast:
            case PBOpKind::Ge:
                Cmp = "(>= ";
                break;
            case PBOpKind::Exactly:
            case PBOpKind::Eq:
                Cmp = "(=  ";
                break;
            }
            return Cmp + Sum + " " + to_string(Bound) + ")";
        }

        ExprTranslator::ArgClasses::ArgClasses(const vector<SV>& Args)
            : BVOp(true), IntOp(false), RatOp(false), RealOp(false), FPOp(false),
              BoolOp(true), CharOp(false), StringOp(false), ListOp(false), HasSign(false)
        {
            for (auto const& Arg : Args) {
                auto const& Kind = Arg.GetKind();
                BVOp = BVOp && IsBounded(Kind);
                BoolOp = BoolOp && IsBoolean(Kind);
                IntOp = IntOp || IsUnbounded(Kind);
                RatOp = RatOp || IsRational(Kind);
                RealOp = RealOp || IsReal(Kind);
                FPOp = FPOp || IsAnyFloating(Kind);
                CharOp = CharOp || IsChar(Kind);
                StringOp = StringOp || IsString(Kind);
                ListOp = ListOp || IsList(Kind);
                HasSign = HasSign || Arg.HasSign();
            }
        }

        ExprTranslator::ExprTranslator(const SMTConfig& Config, const SkolemMapT& SkolemMap,
                                       const TableMapT& TableMap,
                                       const FunctionMapT& FunctionMap)
            : Config(Config), SkolemMap(SkolemMap), TableMap(TableMap),
              FunctionMap(FunctionMap)
        {
            // Nothing here
        }

        ExprTranslator::~ExprTranslator()
        {
            // Nothing here
        }

        string ExprTranslator::SSV(const SV& Var) const
        {
            return CvtSV(SkolemMap, Var);
        }

        vector<string> ExprTranslator::SSVs(const vector<SV>& Vars) const
        {
            vector<string> Retval;
            for (auto const& Var : Vars) {
                Retval.push_back(SSV(Var));
            }
            return Retval;
        }

        // Constant tables are not necessarily in the map
        string ExprTranslator::GetTableName(i32 TableId) const
        {
            auto it = TableMap.find(TableId);
            if (it != TableMap.end()) {
                return it->second;
            }
            return "table" + to_string(TableId);
        }

        // Constructors are ascribed their result sort
        string ExprTranslator::DTConstructor(const string& Field, const vector<SV>& Args,
                                             const KindRef& ResultKind) const
        {
            auto&& Ascribed = "(as " + Field + " " + ResultKind->ToSMTType() + ")";
            if (Args.size() == 0) {
                return Ascribed;
            }
            return "(" + Ascribed + " " + join(SSVs(Args), " ") + ")";
        }

        string ExprTranslator::DTAccessor(const string& Field, const vector<KindRef>& Params,
                                          const KindRef& ResultKind) const
        {
            if (Config.Capabilities.SupportsDirectAccessors) {
                return "(_ is " + Field + ")";
            }
            vector<string> ParamTypes;
            for (auto const& Param : Params) {
                ParamTypes.push_back(Param->ToSMTType());
            }
            return "(_ is (" + Field + " (" + join(ParamTypes, " ") + ") " +
                ResultKind->ToSMTType() + "))";
        }

        string ExprTranslator::TranslateLkUp(const OpNode& Node) const
        {
            auto const& Op = Node.GetOp();
            auto const& IndexKind = Op.GetIndexKind();
            auto const& Index = Op.GetLookupIndex();
            auto Length = Op.GetTableLength();

            auto Unexpected = [&] () -> InternalError
                {
                    return InternalError((string)"Unexpected " + IndexKind->ToString() +
                                         " valued index in table lookup: " + Node.ToString() +
                                         "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
                };

            bool NeedsCheck;
            switch (IndexKind->GetTag()) {
            case KindTag::Bool:
                NeedsCheck = (Length < 2);
                break;
            case KindTag::Bounded: {
                BigInt Domain = 1;
                Domain <<= IndexKind->SAs<BoundedKind>()->GetWidth();
                NeedsCheck = (Domain > BigInt(Length));
                break;
            }
            case KindTag::Unbounded:
                NeedsCheck = true;
                break;
            default:
                throw Unexpected();
            }

            auto&& LkUp = "(" + GetTableName(Op.GetTableId()) + " " + SSV(Index) + ")";
            if (!NeedsCheck) {
                return LkUp;
            }

            string Less, LessEq;
            switch (IndexKind->GetTag()) {
            case KindTag::Bounded:
                Less = Index.HasSign() ? "bvslt" : "bvult";
                LessEq = Index.HasSign() ? "bvsle" : "bvule";
                break;
            case KindTag::Unbounded:
            case KindTag::Real:
                Less = "<";
                LessEq = "<=";
                break;
            default:
                throw Unexpected();
            }

            auto const& IdxKind = Index.GetKind();
            auto&& LessThanZero = "(" + Less + " " + SSV(Index) + " " +
                CV::MkConst(IdxKind, 0).ToSMTLib(Config.RoundingMode) + ")";
            auto&& OutOfRange = "(" + LessEq + " " +
                CV::MkConst(IdxKind, BigInt(Length)).ToSMTLib(Config.RoundingMode) + " " +
                SSV(Index) + ")";
            auto&& Cond = Index.HasSign() ? "(or " + LessThanZero + " " + OutOfRange + ") " :
                OutOfRange + " ";

            return "(ite " + Cond + SSV(Op.GetLookupDefault()) + " " + LkUp + ")";
        }

        string ExprTranslator::TranslateAbs(const ArgClasses& Classes, const vector<SV>& Args,
                                            const vector<string>& Strs) const
        {
            if (Classes.FPOp) {
                return Lift1("fp.abs", Strs);
            } else if (Classes.IntOp) {
                return Lift1("abs", Strs);
            }

            if (Args.size() != 1) {
                throw InternalError(UnexpectedArgs("abs", Strs));
            }
            if (Classes.BVOp && !Classes.HasSign) {
                return Strs[0];
            }

            auto const& X = Strs[0];
            auto&& Zero = CV::MkConst(Args[0].GetKind(), 0).ToSMTLib(Config.RoundingMode);
            string Cmp = Classes.BVOp ? "bvslt" : "<";
            string Neg = Classes.BVOp ? "bvneg" : "-";
            return "(ite (" + Cmp + " " + X + " " + Zero + ") (" + Neg + " " + X + ") " + X + ")";
        }

        // No distinct on floats: signed zeros and NaNs do not
        // agree with it
        string ExprTranslator::TranslateNotEqual(const ArgClasses& Classes,
                                                 const vector<string>& Strs) const
        {
            if (!Classes.FPOp && Config.Capabilities.SupportsDistinct) {
                return LiftN("distinct", Strs);
            }

            string Eq = Classes.FPOp ? "fp.eq" : "=";
            if (Strs.size() == 2) {
                return "(not " + Lift2(Eq, Strs) + ")";
            }
            vector<string> Pairs;
            for (u32 i = 0; i < Strs.size(); ++i) {
                for (u32 j = i + 1; j < Strs.size(); ++j) {
                    Pairs.push_back("(not " + Lift2(Eq, { Strs[i], Strs[j] }) + ")");
                }
            }
            return "(and " + join(Pairs, " ") + ")";
        }

        string ExprTranslator::TranslateSetOp(const OpNode& Node) const
        {
            auto&& Strs = SSVs(Node.GetArgs());
            auto Op = Node.GetOp().GetSetOp();

            switch (Op) {
            case SetOpKind::Equal:
                return LiftN("=", Strs);
            case SetOpKind::Member:
            case SetOpKind::Insert:
            case SetOpKind::Delete: {
                if (Strs.size() != 2) {
                    throw InternalError(UnexpectedArgs(Node.GetOp().ToString(), Strs));
                }
                // elements come first, then the set
                if (Op == SetOpKind::Member) {
                    return "(select " + Strs[1] + " " + Strs[0] + ")";
                }
                return "(store " + Strs[1] + " " + Strs[0] +
                    (Op == SetOpKind::Insert ? " true)" : " false)");
            }
            case SetOpKind::Intersect:
                return LiftN("intersection", Strs);
            case SetOpKind::Union:
                return LiftN("union", Strs);
            case SetOpKind::Subset:
                return LiftN("subset", Strs);
            case SetOpKind::Difference:
                return LiftN("setminus", Strs);
            case SetOpKind::Complement:
                return LiftN("complement", Strs);
            case SetOpKind::HasSize:
                return LiftN("set-has-size", Strs);
            }
            throw InternalError((string)"Unhandled set operator: " + Node.ToString() +
                                "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
        }

        bool ExprTranslator::TranslateSharedOp(const ArgClasses& Classes, const OpNode& Node,
                                               const vector<string>& Strs,
                                               string& Retval) const
        {
            auto FP = Classes.FPOp;
            auto&& RM = RoundingModeToSMT(Config.RoundingMode);

            // floating point arithmetic takes the rounding mode
            auto Lift2WM = [&] (const string& Op, const string& FPOp) -> string
                {
                    return FP ? Lift2(FPOp + " " + RM, Strs) : Lift2(Op, Strs);
                };

            switch (Node.GetOp().GetCode()) {
            case OpKind::Plus:
                Retval = Lift2WM("+", "fp.add");
                return true;
            case OpKind::Minus:
                Retval = Lift2WM("-", "fp.sub");
                return true;
            case OpKind::Times:
                Retval = Lift2WM("*", "fp.mul");
                return true;
            case OpKind::UNeg:
                Retval = Lift1(FP ? "fp.neg" : "-", Strs);
                return true;
            case OpKind::Abs:
                Retval = TranslateAbs(Classes, Node.GetArgs(), Strs);
                return true;
            case OpKind::Equal:
                Retval = Lift2(FP ? "fp.eq" : "=", Strs);
                return true;
            case OpKind::NotEqual:
                Retval = TranslateNotEqual(Classes, Strs);
                return true;
            case OpKind::LessThan:
                Retval = Lift2(FP ? "fp.lt" : "<", Strs);
                return true;
            case OpKind::GreaterThan:
                Retval = Lift2(FP ? "fp.gt" : ">", Strs);
                return true;
            case OpKind::LessEq:
                Retval = Lift2(FP ? "fp.leq" : "<=", Strs);
                return true;
            case OpKind::GreaterEq:
                Retval = Lift2(FP ? "fp.geq" : ">=", Strs);
                return true;
            default:
                return false;
            }
        }

        bool ExprTranslator::TranslateIntOp(const ArgClasses& Classes, const OpNode& Node,
                                            const vector<string>& Strs, string& Retval) const
        {
            switch (Node.GetOp().GetCode()) {
            case OpKind::Quot:
                Retval = Lift2("div", Strs);
                return true;
            case OpKind::Rem:
                Retval = Lift2("mod", Strs);
                return true;
            default:
                return TranslateSharedOp(Classes, Node, Strs, Retval);
            }
        }

        // Bool has no order in SMT-LIB2; false < true
        bool ExprTranslator::TranslateBoolComparison(OpKind Code, const vector<string>& Strs,
                                                     string& Retval) const
        {
            auto BLt = [] (const vector<string>& XY) -> string
                {
                    if (XY.size() != 2) {
                        throw InternalError(UnexpectedArgs("a Boolean comparison", XY));
                    }
                    return "(and (not " + XY[0] + ") " + XY[1] + ")";
                };
            auto BLq = [] (const vector<string>& XY) -> string
                {
                    if (XY.size() != 2) {
                        throw InternalError(UnexpectedArgs("a Boolean comparison", XY));
                    }
                    return "(or (not " + XY[0] + ") " + XY[1] + ")";
                };

            switch (Code) {
            case OpKind::LessThan:
                Retval = BLt(Strs);
                return true;
            case OpKind::GreaterThan:
                Retval = BLt(Swap(Strs));
                return true;
            case OpKind::LessEq:
                Retval = BLq(Strs);
                return true;
            case OpKind::GreaterEq:
                Retval = BLq(Swap(Strs));
                return true;
            default:
                return false;
            }
        }

        bool ExprTranslator::TranslateBVOp(const ArgClasses& Classes, const OpNode& Node,
                                           const vector<string>& Strs, string& Retval) const
        {
            auto Sgn = Classes.HasSign;
            switch (Node.GetOp().GetCode()) {
            case OpKind::Plus:
                Retval = Lift2("bvadd", Strs);
                return true;
            case OpKind::Minus:
                Retval = Lift2("bvsub", Strs);
                return true;
            case OpKind::Times:
                Retval = Lift2("bvmul", Strs);
                return true;
            case OpKind::UNeg:
                Retval = Lift1(Classes.BoolOp ? "not" : "bvneg", Strs);
                return true;
            case OpKind::Abs:
                Retval = TranslateAbs(Classes, Node.GetArgs(), Strs);
                return true;
            case OpKind::Quot:
                Retval = Lift2(Sgn ? "bvsdiv" : "bvudiv", Strs);
                return true;
            case OpKind::Rem:
                Retval = Lift2(Sgn ? "bvsrem" : "bvurem", Strs);
                return true;
            case OpKind::Equal:
                Retval = Lift2("=", Strs);
                return true;
            case OpKind::NotEqual:
                Retval = LiftN("distinct", Strs);
                return true;
            case OpKind::LessThan:
                Retval = Lift2(Sgn ? "bvslt" : "bvult", Strs);
                return true;
            case OpKind::GreaterThan:
                Retval = Lift2(Sgn ? "bvsgt" : "bvugt", Strs);
                return true;
            case OpKind::LessEq:
                Retval = Lift2(Sgn ? "bvsle" : "bvule", Strs);
                return true;
            case OpKind::GreaterEq:
                Retval = Lift2(Sgn ? "bvsge" : "bvuge", Strs);
                return true;
            default:
                return false;
            }
        }

        bool ExprTranslator::TranslateRealOrFPOp(const ArgClasses& Classes, const OpNode& Node,
                                                 const vector<string>& Strs,
                                                 string& Retval) const
        {
            if (Node.GetOp().GetCode() == OpKind::Quot) {
                Retval = Classes.FPOp ?
                    Lift2("fp.div " + RoundingModeToSMT(Config.RoundingMode), Strs) :
                    Lift2("/", Strs);
                return true;
            }
            return TranslateSharedOp(Classes, Node, Strs, Retval);
        }

        // Rationals are not kept reduced, everything goes
        // through the sbv.rat helpers
        bool ExprTranslator::TranslateRationalOp(OpKind Code, const vector<string>& Strs,
                                                 string& Retval) const
        {
            switch (Code) {
            case OpKind::Plus:
                Retval = Lift2("sbv.rat.plus", Strs);
                return true;
            case OpKind::Minus:
                Retval = Lift2("sbv.rat.minus", Strs);
                return true;
            case OpKind::Times:
                Retval = Lift2("sbv.rat.times", Strs);
                return true;
            case OpKind::UNeg:
                Retval = Lift1("sbv.rat.uneg", Strs);
                return true;
            case OpKind::Abs:
                Retval = Lift1("sbv.rat.abs", Strs);
                return true;
            case OpKind::Equal:
                Retval = Lift2("sbv.rat.eq", Strs);
                return true;
            case OpKind::NotEqual:
                Retval = Lift2("sbv.rat.notEq", Strs);
                return true;
            case OpKind::LessThan:
                Retval = Lift2("sbv.rat.lt", Strs);
                return true;
            case OpKind::GreaterThan:
                Retval = Lift2("sbv.rat.lt", Swap(Strs));
                return true;
            case OpKind::LessEq:
                Retval = Lift2("sbv.rat.leq", Strs);
                return true;
            case OpKind::GreaterEq:
                Retval = Lift2("sbv.rat.leq", Swap(Strs));
                return true;
            default:
                return false;
            }
        }

        // Strings and sequences: equality, and the lexicographic
        // orders with the operands swapped for > and >=
        bool ExprTranslator::TranslateOrderedOp(OpKind Code, const string& LessThan,
                                                const string& LessEq,
                                                const vector<string>& Strs,
                                                string& Retval) const
        {
            switch (Code) {
            case OpKind::Equal:
                Retval = Lift2("=", Strs);
                return true;
            case OpKind::NotEqual:
                Retval = LiftN("distinct", Strs);
                return true;
            case OpKind::LessThan:
                Retval = Lift2(LessThan, Strs);
                return true;
            case OpKind::GreaterThan:
                Retval = Lift2(LessThan, Swap(Strs));
                return true;
            case OpKind::LessEq:
                Retval = Lift2(LessEq, Strs);
                return true;
            case OpKind::GreaterEq:
                Retval = Lift2(LessEq, Swap(Strs));
                return true;
            default:
                return false;
            }
        }

        // Equality works on every kind; enumerations are
        // also ordered by constructor position
        bool ExprTranslator::TranslateUninterpretedOp(const OpNode& Node,
                                                      const vector<string>& Strs,
                                                      string& Retval) const
        {
            auto Code = Node.GetOp().GetCode();
            if (Code == OpKind::Equal) {
                Retval = Lift2("=", Strs);
                return true;
            } else if (Code == OpKind::NotEqual) {
                Retval = LiftN("distinct", Strs);
                return true;
            }

            string Op;
            switch (Code) {
            case OpKind::LessThan:
                Op = "<";
                break;
            case OpKind::GreaterThan:
                Op = ">";
                break;
            case OpKind::LessEq:
                Op = "<=";
                break;
            case OpKind::GreaterEq:
                Op = ">=";
                break;
            default:
                return false;
            }

            auto const& Args = Node.GetArgs();
            if (Strs.size() != 2) {
                throw InternalError(UnexpectedArgs(Node.ToString(), Strs));
            }
            auto UKind = Args[0].GetKind()->As<UserSortKind>();
            if (UKind == nullptr || !UKind->IsEnumerated()) {
                return false;
            }
            auto&& IdxFun = UKind->GetName() + "_constrIndex";
            Retval = "(" + Op + " (" + IdxFun + " " + Strs[0] + ") (" + IdxFun + " " +
                Strs[1] + "))";
            return true;
        }

        string ExprTranslator::TranslateGeneric(const OpNode& Node) const
        {
            auto const& Args = Node.GetArgs();
            auto const Code = Node.GetOp().GetCode();
            ArgClasses Classes(Args);
            auto&& Strs = SSVs(Args);
            string Retval;

            if (Classes.IntOp && TranslateIntOp(Classes, Node, Strs, Retval)) {
                return Retval;
            }
            if (Classes.BoolOp && TranslateBoolComparison(Code, Strs, Retval)) {
                return Retval;
            }
            if (Classes.BVOp && TranslateBVOp(Classes, Node, Strs, Retval)) {
                return Retval;
            }
            if (Classes.RealOp && TranslateRealOrFPOp(Classes, Node, Strs, Retval)) {
                return Retval;
            }
            if (Classes.RatOp && TranslateRationalOp(Code, Strs, Retval)) {
                return Retval;
            }
            if (Classes.FPOp && TranslateRealOrFPOp(Classes, Node, Strs, Retval)) {
                return Retval;
            }
            if ((Classes.CharOp || Classes.StringOp) &&
                TranslateOrderedOp(Code, "str.<", "str.<=", Strs, Retval)) {
                return Retval;
            }
            if (Classes.ListOp && TranslateOrderedOp(Code, "seq.<", "seq.<=", Strs, Retval)) {
                return Retval;
            }
            if (TranslateUninterpretedOp(Node, Strs, Retval)) {
                return Retval;
            }

            if (Args.size() > 0 && IsUserSort(Args[0].GetKind())) {
                vector<string> ArgKinds;
                for (auto const& Arg : Args) {
                    auto&& KindName = Arg.GetKind()->ToString();
                    if (find(ArgKinds.begin(), ArgKinds.end(), KindName) == ArgKinds.end()) {
                        ArgKinds.push_back(KindName);
                    }
                }
                throw SMTGError((string)"\n" +
                                "*** Cannot translate operator        : " +
                                Node.GetOp().ToString() + "\n" +
                                "*** When applied to arguments of kind: " +
                                join(ArgKinds, ", ") + "\n" +
                                "*** Found as part of the expression  : " +
                                Node.ToString() + "\n" +
                                "***\n" +
                                "*** Note that uninterpreted kinds only support equality.\n" +
                                "*** If you believe this is in error, please report!\n");
            }
            throw InternalError((string)"Impossible happened; can't translate: " +
                                Node.ToString(1) + "\nAt: " + __FILE__ + ":" +
                                to_string(__LINE__));
        }

        string ExprTranslator::Translate(const OpNode& Node) const
        {
            auto const& Op = Node.GetOp();
            auto const& Args = Node.GetArgs();
            ArgClasses Classes(Args);

            auto Bad = [&] () -> InternalError
                {
                    return InternalError((string)"Unsupported operation on " +
                                         (Classes.IntOp ? "unbounded integers: " :
                                          "real values: ") + Node.ToString(1) +
                                         "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
                };
            auto OnlyArg = [&] () -> string
                {
                    if (Args.size() != 1) {
                        throw InternalError(UnexpectedArgs(Op.ToString(), SSVs(Args)));
                    }
                    return SSV(Args[0]);
                };

            switch (Op.GetCode()) {
            case OpKind::Ite:
                if (Args.size() != 3) {
                    throw InternalError(UnexpectedArgs("ite", SSVs(Args)));
                }
                return "(ite " + SSV(Args[0]) + " " + SSV(Args[1]) + " " + SSV(Args[2]) + ")";

            case OpKind::LkUp:
                return TranslateLkUp(Node);

            case OpKind::KindCast:
                return HandleKindCast(Config.Capabilities.SupportsInt2bv, Op.GetFromKind(),
                                      Op.GetToKind(), OnlyArg());

            case OpKind::ArrEq:
                return "(= array_" + to_string(Op.GetArrayId()) + " array_" +
                    to_string(Op.GetOtherArrayId()) + ")";

            case OpKind::ArrRead:
                return "(select array_" + to_string(Op.GetArrayId()) + " " + OnlyArg() + ")";

            case OpKind::Uninterpreted:
                if (Args.size() == 0) {
                    return Op.GetName();
                }
                return "(" + Op.GetName() + " " + join(SSVs(Args), " ") + ")";

            case OpKind::Extract:
                if (!Classes.BVOp) {
                    throw Bad();
                }
                return "((_ extract " + to_string(Op.GetExtractHigh()) + " " +
                    to_string(Op.GetExtractLow()) + ") " + OnlyArg() + ")";

            case OpKind::Rol:
            case OpKind::Ror:
                if (!Classes.BVOp) {
                    throw Bad();
                }
                return (string)"((_ " + (Op.GetCode() == OpKind::Rol ? "rotate_left " :
                                         "rotate_right ") +
                    to_string(Op.GetRotateAmount()) + ") " + OnlyArg() + ")";

            case OpKind::Shl:
            case OpKind::Shr: {
                if (!Classes.BVOp) {
                    throw Bad();
                }
                if (Args.size() != 2) {
                    throw InternalError(UnexpectedArgs(Op.ToString(), SSVs(Args)));
                }
                string Name = "bvshl";
                if (Op.GetCode() == OpKind::Shr) {
                    Name = Args[0].HasSign() ? "bvashr" : "bvlshr";
                }
                return "(" + Name + " " + SSV(Args[0]) + " " + SSV(Args[1]) + ")";
            }

            case OpKind::And:
            case OpKind::Or:
            case OpKind::XOr:
            case OpKind::Not:
            case OpKind::Join: {
                if (!Classes.BVOp && !Classes.BoolOp) {
                    throw Bad();
                }
                auto&& Strs = SSVs(Args);
                switch (Op.GetCode()) {
                case OpKind::And:
                    return Lift2(Classes.BoolOp ? "and" : "bvand", Strs);
                case OpKind::Or:
                    return Lift2(Classes.BoolOp ? "or" : "bvor", Strs);
                case OpKind::XOr:
                    return Lift2(Classes.BoolOp ? "xor" : "bvxor", Strs);
                case OpKind::Not:
                    return Lift1(Classes.BoolOp ? "not" : "bvnot", Strs);
                default:
                    return Lift2("concat", Strs);
                }
            }

            case OpKind::Label:
                return OnlyArg();

            case OpKind::IEEEFP:
                if (Op.GetFPOp() == FPOpKind::Cast) {
                    return HandleFPCast(Op.GetFromKind(), Op.GetToKind(),
                                        SSV(Op.GetRoundingModeSV()), join(SSVs(Args), " "));
                }
                return LiftN(Op.GetSMTName(), SSVs(Args));

            case OpKind::NonLinear:
                return LiftN(Op.GetSMTName(), SSVs(Args));

            case OpKind::PseudoBoolean:
                if (Config.Capabilities.SupportsPseudoBooleans) {
                    return HandlePB(Op.GetPBOp(), Op.GetCoefficients(), Op.GetBound(), SSVs(Args));
                }
                return ReducePB(Op.GetPBOp(), Op.GetCoefficients(), Op.GetBound(), SSVs(Args));

            // the solver reports the absence of overflow
            case OpKind::OverflowOp:
                return "(not " + LiftN(Op.GetSMTName(), SSVs(Args)) + ")";

            case OpKind::StrOp:
                if (Op.GetStrOp() == StrOpKind::InRe) {
                    return "(str.in_re " + join(SSVs(Args), " ") + " " +
                        Op.GetRegExps()[0].ToSMTLib() + ")";
                }
                // characters are strings of length one
                if (Op.GetStrOp() == StrOpKind::Unit && Args.size() == 1) {
                    return SSV(Args[0]);
                }
                return LiftN(Op.GetSMTName(), SSVs(Args));

            case OpKind::RegExOp: {
                auto const& REs = Op.GetRegExps();
                return (string)"(" + (Op.GetRegExOp() == RegExOpKind::Eq ? "=" : "distinct") +
                    " " + REs[0].ToSMTLib() + " " + REs[1].ToSMTLib() + ")";
            }

            case OpKind::SeqOp: {
                if (Op.GetSeqOp() != SeqOpKind::Reverse) {
                    return LiftN(Op.GetSMTName(), SSVs(Args));
                }
                auto it = FunctionMap.find(Op.GetReversedKind());
                if (it == FunctionMap.end()) {
                    throw InternalError((string)"Impossible happened; can't translate: " +
                                        Node.ToString(1) + "\nNo helper function was " +
                                        "declared for the reversal\nAt: " + __FILE__ + ":" +
                                        to_string(__LINE__));
                }
                return LiftN(it->second, SSVs(Args));
            }

            case OpKind::SetOp:
                return TranslateSetOp(Node);

            case OpKind::TupleConstructor: {
                if (Op.GetTupleArity() == 0 && Args.size() == 0) {
                    return "mkSBVTuple0";
                }
                vector<KindRef> ElemKinds;
                for (auto const& Arg : Args) {
                    ElemKinds.push_back(Arg.GetKind());
                }
                return "((as mkSBVTuple" + to_string(Op.GetTupleArity()) + " " +
                    MkTupleKind(ElemKinds)->ToSMTType() + ") " + join(SSVs(Args), " ") + ")";
            }

            case OpKind::TupleAccess:
                return "(proj_" + to_string(Op.GetTuplePosition()) + "_SBVTuple" +
                    to_string(Op.GetTupleArity()) + " " + OnlyArg() + ")";

            case OpKind::EitherConstructor: {
                auto&& EKind = MkEitherKind(Op.GetLeftKind(), Op.GetRightKind());
                OnlyArg();
                return DTConstructor(Op.GetFlag() ? "right_SBVEither" : "left_SBVEither",
                                     Args, EKind);
            }

            case OpKind::EitherIs: {
                auto&& EKind = MkEitherKind(Op.GetLeftKind(), Op.GetRightKind());
                auto&& Arg = OnlyArg();
                if (Op.GetFlag()) {
                    return "(" + DTAccessor("right_SBVEither", { Op.GetRightKind() }, EKind) +
                        " " + Arg + ")";
                }
                return "(" + DTAccessor("left_SBVEither", { Op.GetLeftKind() }, EKind) +
                    " " + Arg + ")";
            }

            case OpKind::EitherAccess:
                return (string)"(" + (Op.GetFlag() ? "get_right_SBVEither " :
                                      "get_left_SBVEither ") + OnlyArg() + ")";

            case OpKind::RationalConstructor:
                if (Args.size() != 2) {
                    throw InternalError(UnexpectedArgs("SBV.Rational", SSVs(Args)));
                }
                return "(SBV.Rational " + SSV(Args[0]) + " " + SSV(Args[1]) + ")";

            case OpKind::MaybeConstructor: {
                auto&& MKind = MkMaybeKind(Op.GetElemKind());
                if (Op.GetFlag()) {
                    OnlyArg();
                    return DTConstructor("just_SBVMaybe", Args, MKind);
                }
                return DTConstructor("nothing_SBVMaybe", vector<SV>(), MKind);
            }

            case OpKind::MaybeIs: {
                auto&& MKind = MkMaybeKind(Op.GetElemKind());
                auto&& Arg = OnlyArg();
                if (Op.GetFlag()) {
                    return "(" + DTAccessor("just_SBVMaybe", { Op.GetElemKind() }, MKind) +
                        " " + Arg + ")";
                }
                return "(" + DTAccessor("nothing_SBVMaybe", vector<KindRef>(), MKind) +
                    " " + Arg + ")";
            }

            case OpKind::MaybeAccess:
                return "(get_just_SBVMaybe " + OnlyArg() + ")";

            default:
                return TranslateGeneric(Node);
            }
        }

        vector<string> ExprTranslator::DeclDef(const Assignment& Asgn) const
        {
            auto const& Node = Asgn.second;
            if (Node.GetOp().GetCode() == OpKind::Label && Node.GetArgs().size() == 1) {
                return DefineFun(Config.Capabilities, Asgn.first, SSV(Node.GetArgs()[0]),
                                 Node.GetOp().GetName());
            }
            return DefineFun(Config.Capabilities, Asgn.first, Translate(Node));
        }

        string ExprTranslator::MkLet(const Assignment& Asgn) const
        {
            auto const& Node = Asgn.second;
            auto&& Prefix = "(let ((" + Asgn.first.ToString() + " ";
            if (Node.GetOp().GetCode() == OpKind::Label && Node.GetArgs().size() == 1) {
                return Prefix + SSV(Node.GetArgs()[0]) + ")) ; " + Node.GetOp().GetName();
            }
            return Prefix + Translate(Node) + "))";
        }

    } /* end namespace SMTLib */
} /* end namespace SMTG */

//
// ExprTranslator.cpp ends here
