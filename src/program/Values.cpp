// Values.cpp ---
//
// Filename: Values.cpp
// Author: Abhishek Udupa
// Created: Mon Feb 25 18:47:10 2015 (-0400)
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

#include "Values.hpp"

#include <cmath>
#include <boost/algorithm/string/join.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/locale/encoding_utf.hpp>

namespace SMTG {
    namespace Program {

        using namespace Kinds;

        string RoundingModeToSMT(RoundingModeT Mode)
        {
            switch (Mode) {
            case RoundingModeT::RoundNearestTiesToEven:
                return "roundNearestTiesToEven";
            case RoundingModeT::RoundNearestTiesToAway:
                return "roundNearestTiesToAway";
            case RoundingModeT::RoundTowardPositive:
                return "roundTowardPositive";
            case RoundingModeT::RoundTowardNegative:
                return "roundTowardNegative";
            case RoundingModeT::RoundTowardZero:
                return "roundTowardZero";
            }
            throw InternalError((string)"Unhandled rounding mode.\nAt: " +
                                __FILE__ + ":" + to_string(__LINE__));
        }

        string RoundingModeToString(RoundingModeT Mode)
        {
            auto&& Retval = RoundingModeToSMT(Mode);
            Retval[0] = toupper(Retval[0]);
            return Retval;
        }

        SV::SV()
            : Kind(), NodeId(-2)
        {
            // Nothing here
        }

        SV::SV(const KindRef& Kind, i64 NodeId)
            : Kind(Kind), NodeId(NodeId)
        {
            // Nothing here
        }

        SV::SV(const SV& Other)
            : Kind(Other.Kind), NodeId(Other.NodeId)
        {
            // Nothing here
        }

        SV::~SV()
        {
            // Nothing here
        }

        SV& SV::operator = (const SV& Other)
        {
            if (&Other == this) {
                return *this;
            }
            Kind = Other.Kind;
            NodeId = Other.NodeId;
            return *this;
        }

        const KindRef& SV::GetKind() const
        {
            return Kind;
        }

        i64 SV::GetNodeId() const
        {
            return NodeId;
        }

        bool SV::HasSign() const
        {
            return Kind->HasSign();
        }

        bool SV::IsTrue() const
        {
            return (NodeId == -1);
        }

        bool SV::IsFalse() const
        {
            return (NodeId == -2);
        }

        bool SV::operator == (const SV& Other) const
        {
            return (NodeId == Other.NodeId);
        }

        bool SV::operator != (const SV& Other) const
        {
            return (NodeId != Other.NodeId);
        }

        bool SV::operator < (const SV& Other) const
        {
            return (NodeId < Other.NodeId);
        }

        string SV::ToString(u32 Verbosity) const
        {
            string Retval;
            if (IsTrue()) {
                Retval = "true";
            } else if (IsFalse()) {
                Retval = "false";
            } else {
                Retval = "s" + to_string(NodeId);
            }
            if (Verbosity > 0) {
                Retval += " :: " + Kind->ToString();
            }
            return Retval;
        }

        SV SV::True()
        {
            return SV(MkBoolKind(), -1);
        }

        SV SV::False()
        {
            return SV(MkBoolKind(), -2);
        }

        static inline BigInt PowerOfTwo(u32 Exponent)
        {
            BigInt Retval = 1;
            Retval <<= Exponent;
            return Retval;
        }

        static inline string BigIntToString(const BigInt& Value)
        {
            return boost::lexical_cast<string>(Value);
        }

        static inline string PadLeft(const string& Digits, u32 Width)
        {
            if (Digits.length() >= Width) {
                return Digits;
            }
            return string(Width - Digits.length(), '0') + Digits;
        }

        static inline string ToBinaryDigits(const BigInt& Value)
        {
            if (Value == 0) {
                return "0";
            }
            string Retval;
            BigInt Rest = Value;
            while (Rest > 0) {
                Retval.push_back(bit_test(Rest, 0) ? '1' : '0');
                Rest >>= 1;
            }
            return string(Retval.rbegin(), Retval.rend());
        }

        static inline string ToHexDigits(const BigInt& Value)
        {
            static const char* HexChars = "0123456789abcdef";
            if (Value == 0) {
                return "0";
            }
            string Retval;
            BigInt Rest = Value;
            while (Rest > 0) {
                BigInt Digit = Rest & 15;
                Retval.push_back(HexChars[Digit.convert_to<u32>()]);
                Rest >>= 4;
            }
            return string(Retval.rbegin(), Retval.rend());
        }

        // Hex literals when the width permits, binary otherwise
        static inline string SMTLibBitVector(u32 Width, const BigInt& Value)
        {
            if (Width == 1) {
                return "#b" + BigIntToString(Value);
            }
            if (Width % 4 == 0) {
                return "#x" + PadLeft(ToHexDigits(Value), Width / 4);
            }
            return "#b" + PadLeft(ToBinaryDigits(Value), Width);
        }

        static inline string ShowNegativeNumber(const BigInt& Value)
        {
            if (Value < 0) {
                BigInt Abs = -Value;
                return "(- " + BigIntToString(Abs) + ")";
            }
            return BigIntToString(Value);
        }

        static inline string SMTLibRational(const BigInt& Numerator, const BigInt& Denominator)
        {
            if (Numerator < 0) {
                BigInt Abs = -Numerator;
                return "(- (/ " + BigIntToString(Abs) + ".0 " + BigIntToString(Denominator) + ".0))";
            }
            return "(/ " + BigIntToString(Numerator) + ".0 " + BigIntToString(Denominator) + ".0)";
        }

        // The exact rational value of a finite double
        static inline void DoubleToRational(double Value, BigInt& Numerator, BigInt& Denominator)
        {
            int Exponent;
            double Mantissa = frexp(Value, &Exponent);
            // Mantissa * 2^53 is an exact integer
            BigInt IntMantissa = (i64)ldexp(Mantissa, 53);
            i32 Shift = Exponent - 53;
            if (Shift >= 0) {
                Numerator = IntMantissa * PowerOfTwo(Shift);
                Denominator = 1;
            } else {
                Numerator = IntMantissa;
                Denominator = PowerOfTwo(-Shift);
                BigInt AbsNum = (Numerator < 0 ? BigInt(-Numerator) : Numerator);
                auto Common = boost::multiprecision::gcd(AbsNum, Denominator);
                if (Common > 1) {
                    Numerator /= Common;
                    Denominator /= Common;
                }
            }
        }

        static inline string SMTLibFloating(double Value, u32 EB, u32 SB, RoundingModeT Mode)
        {
            auto Size = to_string(EB) + " " + to_string(SB);
            if (std::isnan(Value)) {
                return "(_ NaN " + Size + ")";
            }
            if (std::isinf(Value)) {
                return (Value < 0 ? "(_ -oo " : "(_ +oo ") + Size + ")";
            }
            if (Value == 0) {
                return (std::signbit(Value) ? "(_ -zero " : "(_ +zero ") + Size + ")";
            }
            BigInt Numerator, Denominator;
            DoubleToRational(Value, Numerator, Denominator);
            return "((_ to_fp " + Size + ") " + RoundingModeToSMT(Mode) + " " +
                SMTLibRational(Numerator, Denominator) + ")";
        }

        static inline u32string DecodeUTF8(const string& Value)
        {
            try {
                return boost::locale::conv::utf_to_utf<char32_t>(Value, boost::locale::conv::stop);
            } catch (const boost::locale::conv::conversion_error&) {
                throw SMTGError((string)"String is not valid UTF-8: " + Value);
            }
        }

        string QuoteSMTString(const string& Value)
        {
            ostringstream sstr;
            sstr << "\"";
            for (auto CodePoint : DecodeUTF8(Value)) {
                if (CodePoint == '"') {
                    sstr << "\"\"";
                } else if (CodePoint >= 0x20 && CodePoint < 0x7f && CodePoint != '\\') {
                    sstr << (char)CodePoint;
                } else {
                    sstr << "\\u{" << hex << (u32)CodePoint << dec << "}";
                }
            }
            sstr << "\"";
            return sstr.str();
        }

        CV::CV(const KindRef& Kind, CVTag Tag)
            : Kind(Kind), Tag(Tag), IntVal(0), DenVal(1), FloatingVal(0.0),
              FPSign(false), Flag(false)
        {
            // Nothing here
        }

        CV::CV()
            : CV(MkBoolKind(), CVTag::Integer)
        {
            // Nothing here
        }

        CV::~CV()
        {
            // Nothing here
        }

        const KindRef& CV::GetKind() const
        {
            return Kind;
        }

        CVTag CV::GetTag() const
        {
            return Tag;
        }

        const BigInt& CV::GetIntVal() const
        {
            return IntVal;
        }

        const BigInt& CV::GetDenVal() const
        {
            return DenVal;
        }

        double CV::GetFloatingVal() const
        {
            return FloatingVal;
        }

        const string& CV::GetStrVal() const
        {
            return StrVal;
        }

        const vector<CV>& CV::GetElements() const
        {
            return Elements;
        }

        bool CV::GetFlag() const
        {
            return Flag;
        }

        string CV::ToString(u32 Verbosity) const
        {
            auto&& Retval = ToSMTLib(RoundingModeT::RoundNearestTiesToEven);
            if (Verbosity > 0) {
                Retval += " :: " + Kind->ToString();
            }
            return Retval;
        }

        string CV::ToSMTLib(RoundingModeT Mode) const
        {
            switch (Tag) {
            case CVTag::Integer: {
                if (IsBoolean(Kind)) {
                    return (IntVal == 0 ? "false" : "true");
                }
                if (IsUnbounded(Kind)) {
                    return ShowNegativeNumber(IntVal);
                }
                auto BVKind = Kind->SAs<BoundedKind>();
                auto Width = BVKind->GetWidth();
                if (!BVKind->IsSigned()) {
                    return SMTLibBitVector(Width, IntVal);
                }
                // the minimum signed value cannot be written as a negation
                if (IntVal == -PowerOfTwo(Width - 1)) {
                    return "#b1" + string(Width - 1, '0');
                }
                if (IntVal < 0) {
                    BigInt Abs = -IntVal;
                    return "(bvneg " + SMTLibBitVector(Width, Abs) + ")";
                }
                return SMTLibBitVector(Width, IntVal);
            }
            case CVTag::AlgReal:
                if (IntVal == 0) {
                    return "0.0";
                }
                return SMTLibRational(IntVal, DenVal);
            case CVTag::Float:
                return SMTLibFloating(FloatingVal, 8, 24, Mode);
            case CVTag::Double:
                return SMTLibFloating(FloatingVal, 11, 53, Mode);
            case CVTag::FP:
                return "(fp #b" + string(FPSign ? "1" : "0") + " #b" + FPExponent +
                    " #b" + FPSignificand + ")";
            case CVTag::Rational:
                return "(SBV.Rational " + ShowNegativeNumber(IntVal) + " " +
                    ShowNegativeNumber(DenVal) + ")";
            case CVTag::Char:
            case CVTag::String:
                return QuoteSMTString(StrVal);
            case CVTag::UserSort: {
                auto UKind = Kind->SAs<UserSortKind>();
                if (UKind->IsRoundingMode()) {
                    vector<RoundingModeT> Modes = { RoundingModeT::RoundNearestTiesToEven,
                                                    RoundingModeT::RoundNearestTiesToAway,
                                                    RoundingModeT::RoundTowardPositive,
                                                    RoundingModeT::RoundTowardNegative,
                                                    RoundingModeT::RoundTowardZero };
                    for (auto Mode : Modes) {
                        if (RoundingModeToString(Mode) == StrVal) {
                            return RoundingModeToSMT(Mode);
                        }
                    }
                }
                return StrVal;
            }
            case CVTag::List: {
                if (Elements.size() == 0) {
                    return "(as seq.empty " + Kind->ToSMTType() + ")";
                }
                vector<string> Units;
                for (auto const& Elem : Elements) {
                    Units.push_back("(seq.unit " + Elem.ToSMTLib(Mode) + ")");
                }
                if (Units.size() == 1) {
                    return Units[0];
                }
                return "(seq.++ " + boost::algorithm::join(Units, " ") + ")";
            }
            case CVTag::Set: {
                // Complemented sets list the members that are absent
                string Member = (Flag ? "false" : "true");
                string Retval = "((as const " + Kind->ToSMTType() + ") " +
                    (Flag ? "true" : "false") + ")";
                for (auto it = Elements.rbegin(); it != Elements.rend(); ++it) {
                    Retval = "(store " + Retval + " " + it->ToSMTLib(Mode) + " " + Member + ")";
                }
                return Retval;
            }
            case CVTag::Tuple: {
                if (Elements.size() == 0) {
                    return "mkSBVTuple0";
                }
                string Retval = "((as mkSBVTuple" + to_string(Elements.size()) + " " +
                    Kind->ToSMTType() + ")";
                for (auto const& Elem : Elements) {
                    Retval += " " + Elem.ToSMTLib(Mode);
                }
                return Retval + ")";
            }
            case CVTag::Maybe:
                if (!Flag) {
                    return "(as nothing_SBVMaybe " + Kind->ToSMTType() + ")";
                }
                return "((as just_SBVMaybe " + Kind->ToSMTType() + ") " +
                    Elements[0].ToSMTLib(Mode) + ")";
            case CVTag::Either:
                return (string)"((as " + (Flag ? "right_SBVEither " : "left_SBVEither ") +
                    Kind->ToSMTType() + ") " + Elements[0].ToSMTLib(Mode) + ")";
            }
            throw InternalError((string)"Unhandled concrete value of kind " + Kind->ToString() +
                                "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
        }

        CV CV::MkBool(bool Value)
        {
            CV Retval(MkBoolKind(), CVTag::Integer);
            Retval.IntVal = (Value ? 1 : 0);
            return Retval;
        }

        CV CV::MkInteger(const KindRef& Kind, const BigInt& Value)
        {
            if (IsBoolean(Kind)) {
                return MkBool(Value != 0);
            }
            CV Retval(Kind, CVTag::Integer);
            if (IsUnbounded(Kind)) {
                Retval.IntVal = Value;
                return Retval;
            }
            if (!IsBounded(Kind)) {
                throw SMTGError((string)"Cannot create an integer value of kind " +
                                Kind->ToString());
            }
            auto BVKind = Kind->SAs<BoundedKind>();
            auto Modulus = PowerOfTwo(BVKind->GetWidth());
            BigInt Wrapped = Value % Modulus;
            if (Wrapped < 0) {
                Wrapped += Modulus;
            }
            if (BVKind->IsSigned() && Wrapped >= PowerOfTwo(BVKind->GetWidth() - 1)) {
                Wrapped -= Modulus;
            }
            Retval.IntVal = Wrapped;
            return Retval;
        }

        CV CV::MkReal(const BigInt& Numerator, const BigInt& Denominator)
        {
            if (Denominator == 0) {
                throw SMTGError("Real values cannot have a zero denominator");
            }
            CV Retval(MkRealKind(), CVTag::AlgReal);
            BigInt Num = Numerator;
            BigInt Den = Denominator;
            if (Den < 0) {
                Num = -Num;
                Den = -Den;
            }
            BigInt AbsNum = (Num < 0 ? BigInt(-Num) : Num);
            if (AbsNum != 0) {
                auto Common = boost::multiprecision::gcd(AbsNum, Den);
                Num /= Common;
                Den /= Common;
            } else {
                Den = 1;
            }
            Retval.IntVal = Num;
            Retval.DenVal = Den;
            return Retval;
        }

        CV CV::MkFloat(float Value)
        {
            CV Retval(MkFloatKind(), CVTag::Float);
            Retval.FloatingVal = (double)Value;
            return Retval;
        }

        CV CV::MkDouble(double Value)
        {
            CV Retval(MkDoubleKind(), CVTag::Double);
            Retval.FloatingVal = Value;
            return Retval;
        }

        CV CV::MkFP(u32 ExponentBits, u32 SignificandBits, bool Sign,
                    const string& ExponentBitString,
                    const string& SignificandBitString)
        {
            if (ExponentBitString.length() != ExponentBits ||
                SignificandBitString.length() + 1 != SignificandBits ||
                ExponentBitString.find_first_not_of("01") != string::npos ||
                SignificandBitString.find_first_not_of("01") != string::npos) {
                throw SMTGError((string)"Malformed bit strings for a floating point value " +
                                "with " + to_string(ExponentBits) + " exponent bits and " +
                                to_string(SignificandBits) + " significand bits");
            }
            CV Retval(MkFPKind(ExponentBits, SignificandBits), CVTag::FP);
            Retval.FPSign = Sign;
            Retval.FPExponent = ExponentBitString;
            Retval.FPSignificand = SignificandBitString;
            return Retval;
        }

        // Rationals are deliberately kept unreduced
        CV CV::MkRational(const BigInt& Numerator, const BigInt& Denominator)
        {
            if (Denominator == 0) {
                throw SMTGError("Rational values cannot have a zero denominator");
            }
            CV Retval(MkRationalKind(), CVTag::Rational);
            Retval.IntVal = Numerator;
            Retval.DenVal = Denominator;
            return Retval;
        }

        CV CV::MkChar(u32 CodePoint)
        {
            if (CodePoint > 0x10ffff || (CodePoint >= 0xd800 && CodePoint <= 0xdfff)) {
                throw SMTGError((string)"Not a Unicode code point: " + to_string(CodePoint));
            }
            CV Retval(MkCharKind(), CVTag::Char);
            Retval.StrVal = boost::locale::conv::utf_to_utf<char>(u32string(1, (char32_t)CodePoint));
            return Retval;
        }

        CV CV::MkString(const string& Value)
        {
            CV Retval(MkStringKind(), CVTag::String);
            Retval.StrVal = Value;
            return Retval;
        }

        CV CV::MkUserSort(const KindRef& Kind, const string& Constructor)
        {
            if (!IsUserSort(Kind)) {
                throw SMTGError((string)"Expected a user sort, got " + Kind->ToString());
            }
            auto UKind = Kind->SAs<UserSortKind>();
            if (UKind->IsEnumerated()) {
                auto const& Constructors = UKind->GetConstructors();
                if (find(Constructors.begin(), Constructors.end(), Constructor) ==
                    Constructors.end()) {
                    throw SMTGError((string)"\"" + Constructor + "\" is not a constructor " +
                                    "of the sort " + UKind->GetName());
                }
            }
            CV Retval(Kind, CVTag::UserSort);
            Retval.StrVal = Constructor;
            return Retval;
        }

        CV CV::MkList(const KindRef& ElemKind, const vector<CV>& Elements)
        {
            CV Retval(MkListKind(ElemKind), CVTag::List);
            Retval.Elements = Elements;
            return Retval;
        }

        CV CV::MkSet(const KindRef& ElemKind, const vector<CV>& Members, bool Complemented)
        {
            CV Retval(MkSetKind(ElemKind), CVTag::Set);
            Retval.Elements = Members;
            Retval.Flag = Complemented;
            return Retval;
        }

        CV CV::MkTuple(const vector<CV>& Elements)
        {
            vector<KindRef> ElemKinds;
            for (auto const& Elem : Elements) {
                ElemKinds.push_back(Elem.GetKind());
            }
            CV Retval(MkTupleKind(ElemKinds), CVTag::Tuple);
            Retval.Elements = Elements;
            return Retval;
        }

        CV CV::MkNothing(const KindRef& ElemKind)
        {
            return CV(MkMaybeKind(ElemKind), CVTag::Maybe);
        }

        CV CV::MkJust(const CV& Value)
        {
            CV Retval(MkMaybeKind(Value.GetKind()), CVTag::Maybe);
            Retval.Elements.push_back(Value);
            Retval.Flag = true;
            return Retval;
        }

        CV CV::MkLeft(const CV& Value, const KindRef& RightKind)
        {
            CV Retval(MkEitherKind(Value.GetKind(), RightKind), CVTag::Either);
            Retval.Elements.push_back(Value);
            return Retval;
        }

        CV CV::MkRight(const KindRef& LeftKind, const CV& Value)
        {
            CV Retval(MkEitherKind(LeftKind, Value.GetKind()), CVTag::Either);
            Retval.Elements.push_back(Value);
            Retval.Flag = true;
            return Retval;
        }

        CV CV::MkConst(const KindRef& Kind, const BigInt& Value)
        {
            switch (Kind->GetTag()) {
            case KindTag::Bool:
            case KindTag::Bounded:
            case KindTag::Unbounded:
                return MkInteger(Kind, Value);
            case KindTag::Real:
                return MkReal(Value);
            case KindTag::Rational:
                return MkRational(Value, 1);
            case KindTag::Float:
                return MkFloat(Value.convert_to<float>());
            case KindTag::Double:
                return MkDouble(Value.convert_to<double>());
            default:
                throw InternalError((string)"Cannot create a numeric constant of kind " +
                                    Kind->ToString() + "\nAt: " + __FILE__ + ":" +
                                    to_string(__LINE__));
            }
        }

    } /* end namespace Program */
} /* end namespace SMTG */

//
// Values.cpp ends here
