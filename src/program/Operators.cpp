// Operators.cpp ---
//
// Filename: Operators.cpp
// Author: Abhishek Udupa
// Created: Sat Jun  6 01:20:41 2014 (-0400)
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

#include "Operators.hpp"

namespace SMTG {
    namespace Program {

        using namespace Kinds;

        RegExp::RegExp(RegExpTag Tag)
            : Tag(Tag), RangeLow(0), RangeHigh(0), LoopLow(0), LoopHigh(0)
        {
            // Nothing here
        }

        RegExp::RegExp()
            : RegExp(RegExpTag::None)
        {
            // Nothing here
        }

        RegExp::~RegExp()
        {
            // Nothing here
        }

        RegExpTag RegExp::GetTag() const
        {
            return Tag;
        }

        const vector<RegExp>& RegExp::GetChildren() const
        {
            return Children;
        }

        string RegExp::ToString(u32 Verbosity) const
        {
            return ToSMTLib();
        }

        static inline string JoinRegExps(const vector<RegExp>& Parts)
        {
            vector<string> Strings;
            for (auto const& Part : Parts) {
                Strings.push_back(Part.ToSMTLib());
            }
            return boost::algorithm::join(Strings, " ");
        }

        string RegExp::ToSMTLib() const
        {
            switch (Tag) {
            case RegExpTag::Literal:
                return "(str.to_re " + QuoteSMTString(Literal) + ")";
            case RegExpTag::All:
                return "re.all";
            case RegExpTag::AllChar:
                return "re.allchar";
            case RegExpTag::None:
                return "re.nostr";
            case RegExpTag::Range: {
                auto Mode = RoundingModeT::RoundNearestTiesToEven;
                return "(re.range " + CV::MkChar(RangeLow).ToSMTLib(Mode) + " " +
                    CV::MkChar(RangeHigh).ToSMTLib(Mode) + ")";
            }
            case RegExpTag::Conc:
                if (Children.size() == 0) {
                    return "(str.to_re \"\")";
                }
                if (Children.size() == 1) {
                    return Children[0].ToSMTLib();
                }
                return "(re.++ " + JoinRegExps(Children) + ")";
            case RegExpTag::KStar:
                return "(re.* " + Children[0].ToSMTLib() + ")";
            case RegExpTag::KPlus:
                return "(re.+ " + Children[0].ToSMTLib() + ")";
            case RegExpTag::Opt:
                return "(re.opt " + Children[0].ToSMTLib() + ")";
            case RegExpTag::Comp:
                return "(re.comp " + Children[0].ToSMTLib() + ")";
            case RegExpTag::Diff:
                return "(re.diff " + JoinRegExps(Children) + ")";
            case RegExpTag::Loop:
                return "((_ re.loop " + to_string(LoopLow) + " " + to_string(LoopHigh) + ") " +
                    Children[0].ToSMTLib() + ")";
            case RegExpTag::Power:
                return "((_ re.^ " + to_string(LoopLow) + ") " + Children[0].ToSMTLib() + ")";
            case RegExpTag::Union:
                if (Children.size() == 0) {
                    return "re.nostr";
                }
                if (Children.size() == 1) {
                    return Children[0].ToSMTLib();
                }
                return "(re.union " + JoinRegExps(Children) + ")";
            case RegExpTag::Inter:
                return "(re.inter " + JoinRegExps(Children) + ")";
            }
            throw InternalError((string)"Unhandled regular expression tag" +
                                "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
        }

        RegExp RegExp::MkLiteral(const string& Value)
        {
            RegExp Retval(RegExpTag::Literal);
            Retval.Literal = Value;
            return Retval;
        }

        RegExp RegExp::MkAll()
        {
            return RegExp(RegExpTag::All);
        }

        RegExp RegExp::MkAllChar()
        {
            return RegExp(RegExpTag::AllChar);
        }

        RegExp RegExp::MkNone()
        {
            return RegExp(RegExpTag::None);
        }

        RegExp RegExp::MkRange(u32 Low, u32 High)
        {
            RegExp Retval(RegExpTag::Range);
            Retval.RangeLow = Low;
            Retval.RangeHigh = High;
            return Retval;
        }

        RegExp RegExp::MkConc(const vector<RegExp>& Parts)
        {
            RegExp Retval(RegExpTag::Conc);
            Retval.Children = Parts;
            return Retval;
        }

        RegExp RegExp::MkKStar(const RegExp& Inner)
        {
            RegExp Retval(RegExpTag::KStar);
            Retval.Children.push_back(Inner);
            return Retval;
        }

        RegExp RegExp::MkKPlus(const RegExp& Inner)
        {
            RegExp Retval(RegExpTag::KPlus);
            Retval.Children.push_back(Inner);
            return Retval;
        }

        RegExp RegExp::MkOpt(const RegExp& Inner)
        {
            RegExp Retval(RegExpTag::Opt);
            Retval.Children.push_back(Inner);
            return Retval;
        }

        RegExp RegExp::MkComp(const RegExp& Inner)
        {
            RegExp Retval(RegExpTag::Comp);
            Retval.Children.push_back(Inner);
            return Retval;
        }

        RegExp RegExp::MkDiff(const RegExp& Left, const RegExp& Right)
        {
            RegExp Retval(RegExpTag::Diff);
            Retval.Children.push_back(Left);
            Retval.Children.push_back(Right);
            return Retval;
        }

        RegExp RegExp::MkLoop(u32 Low, u32 High, const RegExp& Inner)
        {
            RegExp Retval(RegExpTag::Loop);
            Retval.LoopLow = Low;
            Retval.LoopHigh = High;
            Retval.Children.push_back(Inner);
            return Retval;
        }

        RegExp RegExp::MkPower(u32 Count, const RegExp& Inner)
        {
            RegExp Retval(RegExpTag::Power);
            Retval.LoopLow = Count;
            Retval.Children.push_back(Inner);
            return Retval;
        }

        RegExp RegExp::MkUnion(const vector<RegExp>& Parts)
        {
            RegExp Retval(RegExpTag::Union);
            Retval.Children = Parts;
            return Retval;
        }

        RegExp RegExp::MkInter(const RegExp& Left, const RegExp& Right)
        {
            RegExp Retval(RegExpTag::Inter);
            Retval.Children.push_back(Left);
            Retval.Children.push_back(Right);
            return Retval;
        }

        Operator::Operator(OpKind Code)
            : Code(Code), SubCode(0), Param1(0), Param2(0), Entity1(-1), Entity2(-1),
              TableLength(0), Bound(0), Flag(false)
        {
            // Nothing here
        }

        Operator::Operator()
            : Operator(OpKind::Ite)
        {
            // Nothing here
        }

        Operator::~Operator()
        {
            // Nothing here
        }

        OpKind Operator::GetCode() const
        {
            return Code;
        }

        FPOpKind Operator::GetFPOp() const
        {
            return (FPOpKind)SubCode;
        }

        NROpKind Operator::GetNROp() const
        {
            return (NROpKind)SubCode;
        }

        OvOpKind Operator::GetOvOp() const
        {
            return (OvOpKind)SubCode;
        }

        PBOpKind Operator::GetPBOp() const
        {
            return (PBOpKind)SubCode;
        }

        StrOpKind Operator::GetStrOp() const
        {
            return (StrOpKind)SubCode;
        }

        RegExOpKind Operator::GetRegExOp() const
        {
            return (RegExOpKind)SubCode;
        }

        SeqOpKind Operator::GetSeqOp() const
        {
            return (SeqOpKind)SubCode;
        }

        SetOpKind Operator::GetSetOp() const
        {
            return (SetOpKind)SubCode;
        }

        u32 Operator::GetExtractHigh() const
        {
            return Param1;
        }

        u32 Operator::GetExtractLow() const
        {
            return Param2;
        }

        u32 Operator::GetRotateAmount() const
        {
            return Param1;
        }

        u32 Operator::GetTupleArity() const
        {
            return Param2;
        }

        u32 Operator::GetTuplePosition() const
        {
            return Param1;
        }

        i32 Operator::GetTableId() const
        {
            return Entity1;
        }

        u64 Operator::GetTableLength() const
        {
            return TableLength;
        }

        const KindRef& Operator::GetIndexKind() const
        {
            return Kind1;
        }

        const KindRef& Operator::GetResultKind() const
        {
            return Kind2;
        }

        const SV& Operator::GetLookupIndex() const
        {
            return Operand1;
        }

        const SV& Operator::GetLookupDefault() const
        {
            return Operand2;
        }

        i32 Operator::GetArrayId() const
        {
            return Entity1;
        }

        i32 Operator::GetOtherArrayId() const
        {
            return Entity2;
        }

        const KindRef& Operator::GetFromKind() const
        {
            return Kind1;
        }

        const KindRef& Operator::GetToKind() const
        {
            return Kind2;
        }

        const SV& Operator::GetRoundingModeSV() const
        {
            return Operand1;
        }

        const KindRef& Operator::GetLeftKind() const
        {
            return Kind1;
        }

        const KindRef& Operator::GetRightKind() const
        {
            return Kind2;
        }

        const KindRef& Operator::GetElemKind() const
        {
            return Kind1;
        }

        const KindRef& Operator::GetReversedKind() const
        {
            return Kind1;
        }

        const string& Operator::GetName() const
        {
            return Name;
        }

        const vector<i64>& Operator::GetCoefficients() const
        {
            return Coefficients;
        }

        i64 Operator::GetBound() const
        {
            return Bound;
        }

        const vector<RegExp>& Operator::GetRegExps() const
        {
            return RegExps;
        }

        bool Operator::GetFlag() const
        {
            return Flag;
        }

        static inline string FloatingSize(const KindRef& Kind)
        {
            if (IsFloat(Kind)) {
                return "8 24";
            } else if (IsDouble(Kind)) {
                return "11 53";
            } else if (IsFP(Kind)) {
                auto FKind = Kind->SAs<FPKind>();
                return to_string(FKind->GetExponentBits()) + " " +
                    to_string(FKind->GetSignificandBits());
            }
            throw InternalError((string)"Expected a floating point kind, got: " +
                                Kind->ToString() + "\nAt: " + __FILE__ + ":" +
                                to_string(__LINE__));
        }

        string Operator::GetSMTName() const
        {
            static const vector<string> FPNames = {
                "fp.abs", "fp.neg", "fp.add", "fp.sub", "fp.mul", "fp.div", "fp.fma",
                "fp.sqrt", "fp.rem", "fp.roundToIntegral", "fp.min", "fp.max",
                "", "", "fp.isNormal", "fp.isSubnormal", "fp.isZero", "fp.isInfinite",
                "fp.isNaN", "fp.isNegative", "fp.isPositive", "="
            };
            static const vector<string> NRNames = {
                "sin", "cos", "tan", "asin", "acos", "atan", "sqrt",
                "sinh", "cosh", "tanh", "exp", "log", "pow"
            };
            static const vector<string> OvNames = {
                "bvsmul_noovfl", "bvsmul_noudfl", "bvumul_noovfl"
            };
            static const vector<string> StrNames = {
                "str.++", "str.len", "str.at", "str.substr", "str.indexof", "str.contains",
                "str.prefixof", "str.suffixof", "str.replace", "str.to_int", "str.from_int",
                "str.to_code", "str.from_code", "str.<", "str.<=", "str.unit", "str.in_re"
            };
            static const vector<string> SeqNames = {
                "seq.++", "seq.len", "seq.unit", "seq.nth", "seq.extract", "seq.indexof",
                "seq.contains", "seq.prefixof", "seq.suffixof", "seq.replace", "seq.reverse"
            };

            switch (Code) {
            case OpKind::IEEEFP:
                if (GetFPOp() == FPOpKind::Reinterp) {
                    return "(_ to_fp " + FloatingSize(Kind2) + ")";
                }
                if (GetFPOp() == FPOpKind::Cast) {
                    break;
                }
                return FPNames[SubCode];
            case OpKind::NonLinear:
                return NRNames[SubCode];
            case OpKind::OverflowOp:
                return OvNames[SubCode];
            case OpKind::StrOp:
                return StrNames[SubCode];
            case OpKind::SeqOp:
                return SeqNames[SubCode];
            default:
                break;
            }
            throw InternalError((string)"Operator " + ToString() + " has no SMT-LIB2 " +
                                "function symbol of its own\nAt: " + __FILE__ + ":" +
                                to_string(__LINE__));
        }

        string Operator::ToString(u32 Verbosity) const
        {
            static const vector<string> CodeNames = {
                "Ite", "Plus", "Times", "Minus", "UNeg", "Abs", "Quot", "Rem",
                "Equal", "NotEqual", "LessThan", "GreaterThan", "LessEq", "GreaterEq",
                "And", "Or", "XOr", "Not", "Shl", "Shr", "Rol", "Ror", "Extract", "Join",
                "LkUp", "ArrEq", "ArrRead", "KindCast", "Uninterpreted", "Label",
                "IEEEFP", "NonLinear", "OverflowOp", "PseudoBoolean",
                "StrOp", "RegExOp", "SeqOp", "SetOp",
                "TupleConstructor", "TupleAccess",
                "EitherConstructor", "EitherIs", "EitherAccess",
                "RationalConstructor",
                "MaybeConstructor", "MaybeIs", "MaybeAccess"
            };

            ostringstream sstr;
            sstr << CodeNames[(u32)Code];
            switch (Code) {
            case OpKind::Extract:
                sstr << " " << Param1 << " " << Param2;
                break;
            case OpKind::Rol:
            case OpKind::Ror:
                sstr << " " << Param1;
                break;
            case OpKind::LkUp:
                sstr << " table" << Entity1 << " " << Operand1 << " " << Operand2;
                break;
            case OpKind::ArrEq:
                sstr << " array_" << Entity1 << " array_" << Entity2;
                break;
            case OpKind::ArrRead:
                sstr << " array_" << Entity1;
                break;
            case OpKind::KindCast:
                sstr << " " << Kind1->ToString() << " -> " << Kind2->ToString();
                break;
            case OpKind::Uninterpreted:
            case OpKind::Label:
                sstr << " " << Name;
                break;
            case OpKind::IEEEFP:
                if (GetFPOp() == FPOpKind::Cast) {
                    sstr << " fp.cast " << Kind1->ToString() << " -> " << Kind2->ToString();
                } else {
                    sstr << " " << GetSMTName();
                }
                break;
            case OpKind::NonLinear:
            case OpKind::OverflowOp:
            case OpKind::StrOp:
            case OpKind::SeqOp:
                sstr << " " << GetSMTName();
                break;
            case OpKind::RegExOp:
                sstr << (GetRegExOp() == RegExOpKind::Eq ? " = " : " distinct ")
                     << RegExps[0] << " " << RegExps[1];
                break;
            case OpKind::TupleConstructor:
                sstr << " " << Param2;
                break;
            case OpKind::TupleAccess:
                sstr << " " << Param1 << " " << Param2;
                break;
            default:
                break;
            }
            return sstr.str();
        }

        Operator Operator::MkSimple(OpKind Code)
        {
            return Operator(Code);
        }

        Operator Operator::MkExtract(u32 High, u32 Low)
        {
            if (High < Low) {
                throw SMTGError((string)"Invalid bounds for bit extraction: " +
                                to_string(High) + " < " + to_string(Low));
            }
            Operator Retval(OpKind::Extract);
            Retval.Param1 = High;
            Retval.Param2 = Low;
            return Retval;
        }

        Operator Operator::MkRol(u32 Amount)
        {
            Operator Retval(OpKind::Rol);
            Retval.Param1 = Amount;
            return Retval;
        }

        Operator Operator::MkRor(u32 Amount)
        {
            Operator Retval(OpKind::Ror);
            Retval.Param1 = Amount;
            return Retval;
        }

        Operator Operator::MkLkUp(i32 TableId, const KindRef& IndexKind,
                                  const KindRef& ResultKind, u64 TableLength,
                                  const SV& Index, const SV& Default)
        {
            Operator Retval(OpKind::LkUp);
            Retval.Entity1 = TableId;
            Retval.Kind1 = IndexKind;
            Retval.Kind2 = ResultKind;
            Retval.TableLength = TableLength;
            Retval.Operand1 = Index;
            Retval.Operand2 = Default;
            return Retval;
        }

        Operator Operator::MkArrEq(i32 ArrayId, i32 OtherArrayId)
        {
            Operator Retval(OpKind::ArrEq);
            Retval.Entity1 = ArrayId;
            Retval.Entity2 = OtherArrayId;
            return Retval;
        }

        Operator Operator::MkArrRead(i32 ArrayId)
        {
            Operator Retval(OpKind::ArrRead);
            Retval.Entity1 = ArrayId;
            return Retval;
        }

        Operator Operator::MkKindCast(const KindRef& FromKind, const KindRef& ToKind)
        {
            Operator Retval(OpKind::KindCast);
            Retval.Kind1 = FromKind;
            Retval.Kind2 = ToKind;
            return Retval;
        }

        Operator Operator::MkUninterpreted(const string& Name)
        {
            Operator Retval(OpKind::Uninterpreted);
            Retval.Name = Name;
            return Retval;
        }

        Operator Operator::MkLabel(const string& Label)
        {
            Operator Retval(OpKind::Label);
            Retval.Name = Label;
            return Retval;
        }

        Operator Operator::MkFPOp(FPOpKind Op)
        {
            if (Op == FPOpKind::Cast || Op == FPOpKind::Reinterp) {
                throw InternalError((string)"Floating point casts carry their kinds, use " +
                                    "MkFPCast or MkFPReinterp\nAt: " + __FILE__ + ":" +
                                    to_string(__LINE__));
            }
            Operator Retval(OpKind::IEEEFP);
            Retval.SubCode = (u32)Op;
            return Retval;
        }

        Operator Operator::MkFPCast(const KindRef& FromKind, const KindRef& ToKind,
                                    const SV& RoundingMode)
        {
            Operator Retval(OpKind::IEEEFP);
            Retval.SubCode = (u32)FPOpKind::Cast;
            Retval.Kind1 = FromKind;
            Retval.Kind2 = ToKind;
            Retval.Operand1 = RoundingMode;
            return Retval;
        }

        Operator Operator::MkFPReinterp(const KindRef& FromKind, const KindRef& ToKind)
        {
            Operator Retval(OpKind::IEEEFP);
            Retval.SubCode = (u32)FPOpKind::Reinterp;
            Retval.Kind1 = FromKind;
            Retval.Kind2 = ToKind;
            return Retval;
        }

        Operator Operator::MkNROp(NROpKind Op)
        {
            Operator Retval(OpKind::NonLinear);
            Retval.SubCode = (u32)Op;
            return Retval;
        }

        Operator Operator::MkOverflowOp(OvOpKind Op)
        {
            Operator Retval(OpKind::OverflowOp);
            Retval.SubCode = (u32)Op;
            return Retval;
        }

        Operator Operator::MkPBOp(PBOpKind Op, const vector<i64>& Coefficients, i64 Bound)
        {
            Operator Retval(OpKind::PseudoBoolean);
            Retval.SubCode = (u32)Op;
            Retval.Coefficients = Coefficients;
            Retval.Bound = Bound;
            return Retval;
        }

        Operator Operator::MkStrOp(StrOpKind Op)
        {
            if (Op == StrOpKind::InRe) {
                throw InternalError((string)"Regular expression membership carries " +
                                    "its expression, use MkStrInRe\nAt: " + __FILE__ + ":" +
                                    to_string(__LINE__));
            }
            Operator Retval(OpKind::StrOp);
            Retval.SubCode = (u32)Op;
            return Retval;
        }

        Operator Operator::MkStrInRe(const RegExp& Re)
        {
            Operator Retval(OpKind::StrOp);
            Retval.SubCode = (u32)StrOpKind::InRe;
            Retval.RegExps.push_back(Re);
            return Retval;
        }

        Operator Operator::MkRegExOp(RegExOpKind Op, const RegExp& Left, const RegExp& Right)
        {
            Operator Retval(OpKind::RegExOp);
            Retval.SubCode = (u32)Op;
            Retval.RegExps.push_back(Left);
            Retval.RegExps.push_back(Right);
            return Retval;
        }

        Operator Operator::MkSeqOp(SeqOpKind Op)
        {
            if (Op == SeqOpKind::Reverse) {
                throw InternalError((string)"Reversal carries the kind being reversed, " +
                                    "use MkSeqReverse\nAt: " + __FILE__ + ":" +
                                    to_string(__LINE__));
            }
            Operator Retval(OpKind::SeqOp);
            Retval.SubCode = (u32)Op;
            return Retval;
        }

        Operator Operator::MkSeqReverse(const KindRef& Kind)
        {
            if (!IsString(Kind) && !IsList(Kind)) {
                throw SMTGError((string)"Only strings and lists can be reversed, got: " +
                                Kind->ToString());
            }
            Operator Retval(OpKind::SeqOp);
            Retval.SubCode = (u32)SeqOpKind::Reverse;
            Retval.Kind1 = Kind;
            return Retval;
        }

        Operator Operator::MkSetOp(SetOpKind Op)
        {
            Operator Retval(OpKind::SetOp);
            Retval.SubCode = (u32)Op;
            return Retval;
        }

        Operator Operator::MkTupleConstructor(u32 Arity)
        {
            Operator Retval(OpKind::TupleConstructor);
            Retval.Param2 = Arity;
            return Retval;
        }

        Operator Operator::MkTupleAccess(u32 Position, u32 Arity)
        {
            if (Position < 1 || Position > Arity) {
                throw SMTGError((string)"Invalid projection " + to_string(Position) +
                                " from a tuple of arity " + to_string(Arity));
            }
            Operator Retval(OpKind::TupleAccess);
            Retval.Param1 = Position;
            Retval.Param2 = Arity;
            return Retval;
        }

        Operator Operator::MkEitherConstructor(const KindRef& LeftKind,
                                               const KindRef& RightKind, bool IsRight)
        {
            Operator Retval(OpKind::EitherConstructor);
            Retval.Kind1 = LeftKind;
            Retval.Kind2 = RightKind;
            Retval.Flag = IsRight;
            return Retval;
        }

        Operator Operator::MkEitherIs(const KindRef& LeftKind,
                                      const KindRef& RightKind, bool IsRight)
        {
            Operator Retval(OpKind::EitherIs);
            Retval.Kind1 = LeftKind;
            Retval.Kind2 = RightKind;
            Retval.Flag = IsRight;
            return Retval;
        }

        Operator Operator::MkEitherAccess(bool IsRight)
        {
            Operator Retval(OpKind::EitherAccess);
            Retval.Flag = IsRight;
            return Retval;
        }

        Operator Operator::MkRationalConstructor()
        {
            return Operator(OpKind::RationalConstructor);
        }

        Operator Operator::MkMaybeConstructor(const KindRef& ElemKind, bool IsJust)
        {
            Operator Retval(OpKind::MaybeConstructor);
            Retval.Kind1 = ElemKind;
            Retval.Flag = IsJust;
            return Retval;
        }

        Operator Operator::MkMaybeIs(const KindRef& ElemKind, bool IsJust)
        {
            Operator Retval(OpKind::MaybeIs);
            Retval.Kind1 = ElemKind;
            Retval.Flag = IsJust;
            return Retval;
        }

        Operator Operator::MkMaybeAccess()
        {
            return Operator(OpKind::MaybeAccess);
        }

        OpNode::OpNode()
            : Op(), Args()
        {
            // Nothing here
        }

        OpNode::OpNode(const Operator& Op, const vector<SV>& Args)
            : Op(Op), Args(Args)
        {
            // Nothing here
        }

        OpNode::~OpNode()
        {
            // Nothing here
        }

        const Operator& OpNode::GetOp() const
        {
            return Op;
        }

        const vector<SV>& OpNode::GetArgs() const
        {
            return Args;
        }

        string OpNode::ToString(u32 Verbosity) const
        {
            ostringstream sstr;
            sstr << "(" << Op.ToString(Verbosity);
            for (auto const& Arg : Args) {
                sstr << " " << Arg.ToString(Verbosity);
            }
            sstr << ")";
            return sstr.str();
        }

    } /* end namespace Program */
} /* end namespace SMTG */

//
// Operators.cpp ends here
