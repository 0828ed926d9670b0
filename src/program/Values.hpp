// Values.hpp ---
//
// Filename: Values.hpp
// Author: Abhishek Udupa
// Created: Fri Oct  1 22:01:06 2015 (-0400)
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

// Symbolic value references and concrete values

#if !defined SMTG_PROGRAM_VALUES_HPP_
#define SMTG_PROGRAM_VALUES_HPP_

#include "../common/SMTGFwdDecls.hpp"
#include "../kinds/Kinds.hpp"

#include <boost/multiprecision/cpp_int.hpp>

namespace SMTG {
    namespace Program {

        using Kinds::KindRef;
        typedef boost::multiprecision::cpp_int BigInt;

        enum class RoundingModeT {
            RoundNearestTiesToEven, RoundNearestTiesToAway,
            RoundTowardPositive, RoundTowardNegative, RoundTowardZero
        };

        // SMT-LIB2 name of a rounding mode, e.g., roundNearestTiesToEven
        extern string RoundingModeToSMT(RoundingModeT Mode);
        extern string RoundingModeToString(RoundingModeT Mode);

        // A reference to a node in the operation graph.
        // Node ids are assigned in creation order. The two
        // distinguished nodes -1 and -2 are true and false.
        class SV : public Stringifiable
        {
        private:
            KindRef Kind;
            i64 NodeId;

        public:
            SV();
            SV(const KindRef& Kind, i64 NodeId);
            SV(const SV& Other);
            virtual ~SV();

            SV& operator = (const SV& Other);

            const KindRef& GetKind() const;
            i64 GetNodeId() const;
            bool HasSign() const;

            bool IsTrue() const;
            bool IsFalse() const;

            // Ordering and equality are on node ids alone
            bool operator == (const SV& Other) const;
            bool operator != (const SV& Other) const;
            bool operator < (const SV& Other) const;

            virtual string ToString(u32 Verbosity = 0) const override;

            static SV True();
            static SV False();
        };

        enum class CVTag {
            Integer, AlgReal, Float, Double, FP, Rational, Char, String,
            UserSort, List, Set, Tuple, Maybe, Either
        };

        // A concrete value of some kind
        class CV : public Stringifiable
        {
        private:
            KindRef Kind;
            CVTag Tag;
            // booleans, bit-vectors and unbounded integers; the
            // numerator for reals and rationals
            BigInt IntVal;
            // the denominator for reals and rationals
            BigInt DenVal;
            double FloatingVal;
            // sign, exponent and significand bit strings
            // for arbitrary precision floats
            bool FPSign;
            string FPExponent;
            string FPSignificand;
            // characters, strings and user sort constructors
            string StrVal;
            // elements of lists, sets and tuples, and the payload
            // of optional and sum values
            vector<CV> Elements;
            // complemented sets, present optionals and right sums
            bool Flag;

            CV(const KindRef& Kind, CVTag Tag);

        public:
            CV();
            virtual ~CV();

            const KindRef& GetKind() const;
            CVTag GetTag() const;
            const BigInt& GetIntVal() const;
            const BigInt& GetDenVal() const;
            double GetFloatingVal() const;
            const string& GetStrVal() const;
            const vector<CV>& GetElements() const;
            bool GetFlag() const;

            virtual string ToString(u32 Verbosity = 0) const override;
            // Rendering as an SMT-LIB2 literal
            string ToSMTLib(RoundingModeT Mode) const;

            static CV MkBool(bool Value);
            // Bit-vector values are wrapped into the range of the kind
            static CV MkInteger(const KindRef& Kind, const BigInt& Value);
            static CV MkReal(const BigInt& Numerator, const BigInt& Denominator = 1);
            static CV MkFloat(float Value);
            static CV MkDouble(double Value);
            static CV MkFP(u32 ExponentBits, u32 SignificandBits, bool Sign,
                           const string& ExponentBitString,
                           const string& SignificandBitString);
            static CV MkRational(const BigInt& Numerator, const BigInt& Denominator);
            // Characters are Unicode code points; strings are UTF-8
            static CV MkChar(u32 CodePoint);
            static CV MkString(const string& Value);
            static CV MkUserSort(const KindRef& Kind, const string& Constructor);
            static CV MkList(const KindRef& ElemKind, const vector<CV>& Elements);
            static CV MkSet(const KindRef& ElemKind, const vector<CV>& Members,
                            bool Complemented = false);
            static CV MkTuple(const vector<CV>& Elements);
            static CV MkNothing(const KindRef& ElemKind);
            static CV MkJust(const CV& Value);
            static CV MkLeft(const CV& Value, const KindRef& RightKind);
            static CV MkRight(const KindRef& LeftKind, const CV& Value);

            // A constant of a numeric kind, used for table
            // indices and comparisons against zero
            static CV MkConst(const KindRef& Kind, const BigInt& Value);
        };

        // Quoting of UTF-8 strings as SMT-LIB2 string literals, with
        // anything outside printable ASCII escaped per code point
        extern string QuoteSMTString(const string& Value);

    } /* end namespace Program */
} /* end namespace SMTG */

#endif /* SMTG_PROGRAM_VALUES_HPP_ */

//
// Values.hpp ends here
