// Kinds.hpp ---
//
// Filename: Kinds.hpp
// Author: Abhishek Udupa
// Created: Thu Jan 18 13:41:46 2015 (-0400)
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

// The kinds (sorts) of symbolic values

#if !defined SMTG_KINDS_KINDS_HPP_
#define SMTG_KINDS_KINDS_HPP_

#include "../common/SMTGFwdDecls.hpp"
#include "../containers/SmartPtr.hpp"

#include <set>
#include <vector>

namespace SMTG {
    namespace Kinds {

        // The order of the tags determines the order of kinds
        enum class KindTag {
            Bool, Bounded, Unbounded, Real, UserSort, Float, Double,
            FP, Char, String, List, Set, Tuple, Maybe, Rational, Either
        };

        class KindBase : public RefCountable, public Stringifiable
        {
        private:
            KindTag Tag;
            mutable bool HashValid;

        protected:
            mutable u64 HashCode;

            virtual void ComputeHashValue() const = 0;
            // Only called with kinds carrying the same tag
            virtual i32 CompareSameTag(const KindBase& Other) const = 0;

        public:
            KindBase(KindTag Tag);
            virtual ~KindBase();

            KindTag GetTag() const;

            virtual string ToString(u32 Verbosity = 0) const override = 0;
            // The sort used for values of this kind in SMT-LIB2
            virtual string ToSMTType() const = 0;
            // Immediate subcomponents, in order
            virtual vector<KindRef> GetChildren() const;
            virtual bool HasSign() const;

            i32 Compare(const KindBase& Other) const;
            u64 Hash() const;
            bool Equals(const KindBase& Other) const;
            bool LT(const KindBase& Other) const;

            template <typename T>
            inline const T* As() const
            {
                return dynamic_cast<const T*>(this);
            }

            template <typename T>
            inline const T* SAs() const
            {
                return static_cast<const T*>(this);
            }

            template <typename T>
            inline bool Is() const
            {
                return (dynamic_cast<const T*>(this) != nullptr);
            }
        };

        class BoolKind : public KindBase
        {
        protected:
            virtual void ComputeHashValue() const override;
            virtual i32 CompareSameTag(const KindBase& Other) const override;

        public:
            BoolKind();
            virtual ~BoolKind();

            virtual string ToString(u32 Verbosity = 0) const override;
            virtual string ToSMTType() const override;
        };

        // Machine integers, i.e., bit-vectors
        class BoundedKind : public KindBase
        {
        private:
            bool Signed;
            u32 Width;

        protected:
            virtual void ComputeHashValue() const override;
            virtual i32 CompareSameTag(const KindBase& Other) const override;

        public:
            BoundedKind(bool Signed, u32 Width);
            virtual ~BoundedKind();

            bool IsSigned() const;
            u32 GetWidth() const;

            virtual string ToString(u32 Verbosity = 0) const override;
            virtual string ToSMTType() const override;
            virtual bool HasSign() const override;
        };

        class UnboundedKind : public KindBase
        {
        protected:
            virtual void ComputeHashValue() const override;
            virtual i32 CompareSameTag(const KindBase& Other) const override;

        public:
            UnboundedKind();
            virtual ~UnboundedKind();

            virtual string ToString(u32 Verbosity = 0) const override;
            virtual string ToSMTType() const override;
            virtual bool HasSign() const override;
        };

        class RealKind : public KindBase
        {
        protected:
            virtual void ComputeHashValue() const override;
            virtual i32 CompareSameTag(const KindBase& Other) const override;

        public:
            RealKind();
            virtual ~RealKind();

            virtual string ToString(u32 Verbosity = 0) const override;
            virtual string ToSMTType() const override;
            virtual bool HasSign() const override;
        };

        // An uninterpreted sort, or an enumeration when
        // it is given a list of constructors
        class UserSortKind : public KindBase
        {
        private:
            string Name;
            bool Enumerated;
            vector<string> Constructors;

        protected:
            virtual void ComputeHashValue() const override;
            virtual i32 CompareSameTag(const KindBase& Other) const override;

        public:
            UserSortKind(const string& Name);
            UserSortKind(const string& Name, const vector<string>& Constructors);
            virtual ~UserSortKind();

            const string& GetName() const;
            bool IsEnumerated() const;
            const vector<string>& GetConstructors() const;
            bool IsRoundingMode() const;

            virtual string ToString(u32 Verbosity = 0) const override;
            virtual string ToSMTType() const override;
        };

        class FloatKind : public KindBase
        {
        protected:
            virtual void ComputeHashValue() const override;
            virtual i32 CompareSameTag(const KindBase& Other) const override;

        public:
            FloatKind();
            virtual ~FloatKind();

            virtual string ToString(u32 Verbosity = 0) const override;
            virtual string ToSMTType() const override;
            virtual bool HasSign() const override;
        };

        class DoubleKind : public KindBase
        {
        protected:
            virtual void ComputeHashValue() const override;
            virtual i32 CompareSameTag(const KindBase& Other) const override;

        public:
            DoubleKind();
            virtual ~DoubleKind();

            virtual string ToString(u32 Verbosity = 0) const override;
            virtual string ToSMTType() const override;
            virtual bool HasSign() const override;
        };

        // Arbitrary precision floats, with exponent and
        // significand widths (the latter includes the hidden bit)
        class FPKind : public KindBase
        {
        private:
            u32 ExponentBits;
            u32 SignificandBits;

        protected:
            virtual void ComputeHashValue() const override;
            virtual i32 CompareSameTag(const KindBase& Other) const override;

        public:
            FPKind(u32 ExponentBits, u32 SignificandBits);
            virtual ~FPKind();

            u32 GetExponentBits() const;
            u32 GetSignificandBits() const;

            virtual string ToString(u32 Verbosity = 0) const override;
            virtual string ToSMTType() const override;
            virtual bool HasSign() const override;
        };

        class CharKind : public KindBase
        {
        protected:
            virtual void ComputeHashValue() const override;
            virtual i32 CompareSameTag(const KindBase& Other) const override;

        public:
            CharKind();
            virtual ~CharKind();

            virtual string ToString(u32 Verbosity = 0) const override;
            virtual string ToSMTType() const override;
        };

        class StringKind : public KindBase
        {
        protected:
            virtual void ComputeHashValue() const override;
            virtual i32 CompareSameTag(const KindBase& Other) const override;

        public:
            StringKind();
            virtual ~StringKind();

            virtual string ToString(u32 Verbosity = 0) const override;
            virtual string ToSMTType() const override;
        };

        // Base for the kinds with exactly one subcomponent
        class ContainerKind : public KindBase
        {
        protected:
            KindRef ElemKind;

            virtual i32 CompareSameTag(const KindBase& Other) const override;

        public:
            ContainerKind(KindTag Tag, const KindRef& ElemKind);
            virtual ~ContainerKind();

            const KindRef& GetElemKind() const;
            virtual vector<KindRef> GetChildren() const override;
        };

        class ListKind : public ContainerKind
        {
        protected:
            virtual void ComputeHashValue() const override;

        public:
            ListKind(const KindRef& ElemKind);
            virtual ~ListKind();

            virtual string ToString(u32 Verbosity = 0) const override;
            virtual string ToSMTType() const override;
        };

        class SetKind : public ContainerKind
        {
        protected:
            virtual void ComputeHashValue() const override;

        public:
            SetKind(const KindRef& ElemKind);
            virtual ~SetKind();

            virtual string ToString(u32 Verbosity = 0) const override;
            virtual string ToSMTType() const override;
        };

        class MaybeKind : public ContainerKind
        {
        protected:
            virtual void ComputeHashValue() const override;

        public:
            MaybeKind(const KindRef& ElemKind);
            virtual ~MaybeKind();

            virtual string ToString(u32 Verbosity = 0) const override;
            virtual string ToSMTType() const override;
        };

        class TupleKind : public KindBase
        {
        private:
            vector<KindRef> ElemKinds;

        protected:
            virtual void ComputeHashValue() const override;
            virtual i32 CompareSameTag(const KindBase& Other) const override;

        public:
            TupleKind(const vector<KindRef>& ElemKinds);
            virtual ~TupleKind();

            const vector<KindRef>& GetElemKinds() const;
            u32 GetArity() const;

            virtual string ToString(u32 Verbosity = 0) const override;
            virtual string ToSMTType() const override;
            virtual vector<KindRef> GetChildren() const override;
        };

        class RationalKind : public KindBase
        {
        protected:
            virtual void ComputeHashValue() const override;
            virtual i32 CompareSameTag(const KindBase& Other) const override;

        public:
            RationalKind();
            virtual ~RationalKind();

            virtual string ToString(u32 Verbosity = 0) const override;
            virtual string ToSMTType() const override;
            virtual bool HasSign() const override;
        };

        class EitherKind : public KindBase
        {
        private:
            KindRef LeftKind;
            KindRef RightKind;

        protected:
            virtual void ComputeHashValue() const override;
            virtual i32 CompareSameTag(const KindBase& Other) const override;

        public:
            EitherKind(const KindRef& LeftKind, const KindRef& RightKind);
            virtual ~EitherKind();

            const KindRef& GetLeftKind() const;
            const KindRef& GetRightKind() const;

            virtual string ToString(u32 Verbosity = 0) const override;
            virtual string ToSMTType() const override;
            virtual vector<KindRef> GetChildren() const override;
        };

        class KindPtrHasher
        {
        public:
            inline u64 operator () (const KindRef& Kind) const
            {
                return Kind->Hash();
            }
        };

        class KindPtrEquals
        {
        public:
            inline bool operator () (const KindRef& Kind1, const KindRef& Kind2) const
            {
                return Kind1->Equals(*Kind2);
            }
        };

        class KindPtrCompare
        {
        public:
            inline bool operator () (const KindRef& Kind1, const KindRef& Kind2) const
            {
                return Kind1->LT(*Kind2);
            }
        };

        // Constructors
        extern KindRef MkBoolKind();
        extern KindRef MkBoundedKind(bool Signed, u32 Width);
        extern KindRef MkUnboundedKind();
        extern KindRef MkRealKind();
        extern KindRef MkUserSortKind(const string& Name);
        extern KindRef MkEnumKind(const string& Name, const vector<string>& Constructors);
        extern KindRef MkRoundingModeKind();
        extern KindRef MkFloatKind();
        extern KindRef MkDoubleKind();
        extern KindRef MkFPKind(u32 ExponentBits, u32 SignificandBits);
        extern KindRef MkCharKind();
        extern KindRef MkStringKind();
        extern KindRef MkListKind(const KindRef& ElemKind);
        extern KindRef MkSetKind(const KindRef& ElemKind);
        extern KindRef MkTupleKind(const vector<KindRef>& ElemKinds);
        extern KindRef MkMaybeKind(const KindRef& ElemKind);
        extern KindRef MkRationalKind();
        extern KindRef MkEitherKind(const KindRef& LeftKind, const KindRef& RightKind);

        // Predicates
        extern bool IsBoolean(const KindRef& Kind);
        extern bool IsBounded(const KindRef& Kind);
        extern bool IsUnbounded(const KindRef& Kind);
        extern bool IsReal(const KindRef& Kind);
        extern bool IsUserSort(const KindRef& Kind);
        extern bool IsFloat(const KindRef& Kind);
        extern bool IsDouble(const KindRef& Kind);
        extern bool IsFP(const KindRef& Kind);
        extern bool IsAnyFloating(const KindRef& Kind);
        extern bool IsChar(const KindRef& Kind);
        extern bool IsString(const KindRef& Kind);
        extern bool IsList(const KindRef& Kind);
        extern bool IsSet(const KindRef& Kind);
        extern bool IsTuple(const KindRef& Kind);
        extern bool IsMaybe(const KindRef& Kind);
        extern bool IsRational(const KindRef& Kind);
        extern bool IsEither(const KindRef& Kind);

        // The kind and all of its subcomponents, recursively
        extern vector<KindRef> GetUniverse(const KindRef& Kind);
        // Closes a set of kinds under subcomponents
        extern KindSetT CloseKindSet(const KindSetT& Kinds);
        // Does a kind matching the predicate occur anywhere in the kind?
        extern bool KindOccurs(const KindRef& Kind,
                               const function<bool(const KindRef&)>& Pred);
        extern bool ContainsCharOrRational(const KindRef& Kind);
        // Lists, sets, tuples, optionals and sums need to be flattened
        // when models are printed
        extern bool NeedsFlattening(const KindRef& Kind);

    } /* end namespace Kinds */
} /* end namespace SMTG */

#endif /* SMTG_KINDS_KINDS_HPP_ */

//
// Kinds.hpp ends here
