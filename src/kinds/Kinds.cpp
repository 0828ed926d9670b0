// Kinds.cpp ---
//
// Filename: Kinds.cpp
// Author: Abhishek Udupa
// Created: Mon Oct 10 17:29:51 2014 (-0400)
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

#include "Kinds.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/functional/hash.hpp>

namespace SMTG {
    namespace Kinds {

        static inline i32 CompareValues(u64 Value1, u64 Value2)
        {
            if (Value1 < Value2) {
                return -1;
            } else if (Value1 > Value2) {
                return 1;
            } else {
                return 0;
            }
        }

        static inline i32 CompareKindVecs(const vector<KindRef>& Vec1,
                                          const vector<KindRef>& Vec2)
        {
            if (Vec1.size() != Vec2.size()) {
                return CompareValues(Vec1.size(), Vec2.size());
            }
            for (u32 i = 0; i < Vec1.size(); ++i) {
                auto Res = Vec1[i]->Compare(*Vec2[i]);
                if (Res != 0) {
                    return Res;
                }
            }
            return 0;
        }

        KindBase::KindBase(KindTag Tag)
            : Tag(Tag), HashValid(false), HashCode(0)
        {
            // Nothing here
        }

        KindBase::~KindBase()
        {
            // Nothing here
        }

        KindTag KindBase::GetTag() const
        {
            return Tag;
        }

        vector<KindRef> KindBase::GetChildren() const
        {
            return vector<KindRef>();
        }

        bool KindBase::HasSign() const
        {
            return false;
        }

        i32 KindBase::Compare(const KindBase& Other) const
        {
            auto MyTag = (u32)Tag;
            auto OtherTag = (u32)Other.Tag;
            if (MyTag != OtherTag) {
                return CompareValues(MyTag, OtherTag);
            }
            return CompareSameTag(Other);
        }

        u64 KindBase::Hash() const
        {
            if (!HashValid) {
                ComputeHashValue();
                HashValid = true;
            }
            return HashCode;
        }

        bool KindBase::Equals(const KindBase& Other) const
        {
            return (Compare(Other) == 0);
        }

        bool KindBase::LT(const KindBase& Other) const
        {
            return (Compare(Other) < 0);
        }

        BoolKind::BoolKind()
            : KindBase(KindTag::Bool)
        {
            // Nothing here
        }

        BoolKind::~BoolKind()
        {
            // Nothing here
        }

        void BoolKind::ComputeHashValue() const
        {
            HashCode = 0;
            boost::hash_combine(HashCode, "BoolKind");
        }

        i32 BoolKind::CompareSameTag(const KindBase& Other) const
        {
            return 0;
        }

        string BoolKind::ToString(u32 Verbosity) const
        {
            return "Bool";
        }

        string BoolKind::ToSMTType() const
        {
            return "Bool";
        }

        BoundedKind::BoundedKind(bool Signed, u32 Width)
            : KindBase(KindTag::Bounded), Signed(Signed), Width(Width)
        {
            if (Width == 0) {
                throw SMTGError("Bit-vector kinds must have a non-zero width");
            }
        }

        BoundedKind::~BoundedKind()
        {
            // Nothing here
        }

        bool BoundedKind::IsSigned() const
        {
            return Signed;
        }

        u32 BoundedKind::GetWidth() const
        {
            return Width;
        }

        void BoundedKind::ComputeHashValue() const
        {
            HashCode = 0;
            boost::hash_combine(HashCode, "BoundedKind");
            boost::hash_combine(HashCode, Signed);
            boost::hash_combine(HashCode, Width);
        }

        i32 BoundedKind::CompareSameTag(const KindBase& Other) const
        {
            auto OtherAsBounded = Other.SAs<BoundedKind>();
            if (Signed != OtherAsBounded->Signed) {
                return (Signed ? 1 : -1);
            }
            return CompareValues(Width, OtherAsBounded->Width);
        }

        string BoundedKind::ToString(u32 Verbosity) const
        {
            return (Signed ? (string)"Int" : (string)"Word") + to_string(Width);
        }

        string BoundedKind::ToSMTType() const
        {
            return (string)"(_ BitVec " + to_string(Width) + ")";
        }

        bool BoundedKind::HasSign() const
        {
            return Signed;
        }

        UnboundedKind::UnboundedKind()
            : KindBase(KindTag::Unbounded)
        {
            // Nothing here
        }

        UnboundedKind::~UnboundedKind()
        {
            // Nothing here
        }

        void UnboundedKind::ComputeHashValue() const
        {
            HashCode = 0;
            boost::hash_combine(HashCode, "UnboundedKind");
        }

        i32 UnboundedKind::CompareSameTag(const KindBase& Other) const
        {
            return 0;
        }

        string UnboundedKind::ToString(u32 Verbosity) const
        {
            return "Integer";
        }

        string UnboundedKind::ToSMTType() const
        {
            return "Int";
        }

        bool UnboundedKind::HasSign() const
        {
            return true;
        }

        RealKind::RealKind()
            : KindBase(KindTag::Real)
        {
            // Nothing here
        }

        RealKind::~RealKind()
        {
            // Nothing here
        }

        void RealKind::ComputeHashValue() const
        {
            HashCode = 0;
            boost::hash_combine(HashCode, "RealKind");
        }

        i32 RealKind::CompareSameTag(const KindBase& Other) const
        {
            return 0;
        }

        string RealKind::ToString(u32 Verbosity) const
        {
            return "Real";
        }

        string RealKind::ToSMTType() const
        {
            return "Real";
        }

        bool RealKind::HasSign() const
        {
            return true;
        }

        UserSortKind::UserSortKind(const string& Name)
            : KindBase(KindTag::UserSort), Name(Name), Enumerated(false)
        {
            // Nothing here
        }

        UserSortKind::UserSortKind(const string& Name, const vector<string>& Constructors)
            : KindBase(KindTag::UserSort), Name(Name), Enumerated(true),
              Constructors(Constructors)
        {
            // Nothing here
        }

        UserSortKind::~UserSortKind()
        {
            // Nothing here
        }

        const string& UserSortKind::GetName() const
        {
            return Name;
        }

        bool UserSortKind::IsEnumerated() const
        {
            return Enumerated;
        }

        const vector<string>& UserSortKind::GetConstructors() const
        {
            return Constructors;
        }

        bool UserSortKind::IsRoundingMode() const
        {
            return (Name == "RoundingMode");
        }

        void UserSortKind::ComputeHashValue() const
        {
            HashCode = 0;
            boost::hash_combine(HashCode, "UserSortKind");
            boost::hash_combine(HashCode, Name);
            boost::hash_combine(HashCode, Enumerated);
            for (auto const& Constructor : Constructors) {
                boost::hash_combine(HashCode, Constructor);
            }
        }

        i32 UserSortKind::CompareSameTag(const KindBase& Other) const
        {
            auto OtherAsUserSort = Other.SAs<UserSortKind>();
            if (Name != OtherAsUserSort->Name) {
                return (Name < OtherAsUserSort->Name ? -1 : 1);
            }
            if (Enumerated != OtherAsUserSort->Enumerated) {
                return (Enumerated ? 1 : -1);
            }
            if (Constructors != OtherAsUserSort->Constructors) {
                return (Constructors < OtherAsUserSort->Constructors ? -1 : 1);
            }
            return 0;
        }

        string UserSortKind::ToString(u32 Verbosity) const
        {
            if (Verbosity > 0 && Enumerated) {
                return Name + " {" + boost::algorithm::join(Constructors, ", ") + "}";
            }
            return Name;
        }

        string UserSortKind::ToSMTType() const
        {
            return Name;
        }

        FloatKind::FloatKind()
            : KindBase(KindTag::Float)
        {
            // Nothing here
        }

        FloatKind::~FloatKind()
        {
            // Nothing here
        }

        void FloatKind::ComputeHashValue() const
        {
            HashCode = 0;
            boost::hash_combine(HashCode, "FloatKind");
        }

        i32 FloatKind::CompareSameTag(const KindBase& Other) const
        {
            return 0;
        }

        string FloatKind::ToString(u32 Verbosity) const
        {
            return "Float";
        }

        string FloatKind::ToSMTType() const
        {
            return "(_ FloatingPoint 8 24)";
        }

        bool FloatKind::HasSign() const
        {
            return true;
        }

        DoubleKind::DoubleKind()
            : KindBase(KindTag::Double)
        {
            // Nothing here
        }

        DoubleKind::~DoubleKind()
        {
            // Nothing here
        }

        void DoubleKind::ComputeHashValue() const
        {
            HashCode = 0;
            boost::hash_combine(HashCode, "DoubleKind");
        }

        i32 DoubleKind::CompareSameTag(const KindBase& Other) const
        {
            return 0;
        }

        string DoubleKind::ToString(u32 Verbosity) const
        {
            return "Double";
        }

        string DoubleKind::ToSMTType() const
        {
            return "(_ FloatingPoint 11 53)";
        }

        bool DoubleKind::HasSign() const
        {
            return true;
        }

        FPKind::FPKind(u32 ExponentBits, u32 SignificandBits)
            : KindBase(KindTag::FP), ExponentBits(ExponentBits),
              SignificandBits(SignificandBits)
        {
            if (ExponentBits < 2 || SignificandBits < 2) {
                throw SMTGError((string)"Invalid floating point kind: exponent and " +
                                "significand widths must both be at least 2, got " +
                                to_string(ExponentBits) + " and " + to_string(SignificandBits));
            }
        }

        FPKind::~FPKind()
        {
            // Nothing here
        }

        u32 FPKind::GetExponentBits() const
        {
            return ExponentBits;
        }

        u32 FPKind::GetSignificandBits() const
        {
            return SignificandBits;
        }

        void FPKind::ComputeHashValue() const
        {
            HashCode = 0;
            boost::hash_combine(HashCode, "FPKind");
            boost::hash_combine(HashCode, ExponentBits);
            boost::hash_combine(HashCode, SignificandBits);
        }

        i32 FPKind::CompareSameTag(const KindBase& Other) const
        {
            auto OtherAsFP = Other.SAs<FPKind>();
            if (ExponentBits != OtherAsFP->ExponentBits) {
                return CompareValues(ExponentBits, OtherAsFP->ExponentBits);
            }
            return CompareValues(SignificandBits, OtherAsFP->SignificandBits);
        }

        string FPKind::ToString(u32 Verbosity) const
        {
            return (string)"FloatingPoint " + to_string(ExponentBits) + " " +
                to_string(SignificandBits);
        }

        string FPKind::ToSMTType() const
        {
            return (string)"(_ FloatingPoint " + to_string(ExponentBits) + " " +
                to_string(SignificandBits) + ")";
        }

        bool FPKind::HasSign() const
        {
            return true;
        }

        CharKind::CharKind()
            : KindBase(KindTag::Char)
        {
            // Nothing here
        }

        CharKind::~CharKind()
        {
            // Nothing here
        }

        void CharKind::ComputeHashValue() const
        {
            HashCode = 0;
            boost::hash_combine(HashCode, "CharKind");
        }

        i32 CharKind::CompareSameTag(const KindBase& Other) const
        {
            return 0;
        }

        string CharKind::ToString(u32 Verbosity) const
        {
            return "Char";
        }

        // characters are strings of length one
        string CharKind::ToSMTType() const
        {
            return "String";
        }

        StringKind::StringKind()
            : KindBase(KindTag::String)
        {
            // Nothing here
        }

        StringKind::~StringKind()
        {
            // Nothing here
        }

        void StringKind::ComputeHashValue() const
        {
            HashCode = 0;
            boost::hash_combine(HashCode, "StringKind");
        }

        i32 StringKind::CompareSameTag(const KindBase& Other) const
        {
            return 0;
        }

        string StringKind::ToString(u32 Verbosity) const
        {
            return "String";
        }

        string StringKind::ToSMTType() const
        {
            return "String";
        }

        ContainerKind::ContainerKind(KindTag Tag, const KindRef& ElemKind)
            : KindBase(Tag), ElemKind(ElemKind)
        {
            // Nothing here
        }

        ContainerKind::~ContainerKind()
        {
            // Nothing here
        }

        const KindRef& ContainerKind::GetElemKind() const
        {
            return ElemKind;
        }

        vector<KindRef> ContainerKind::GetChildren() const
        {
            return vector<KindRef>(1, ElemKind);
        }

        i32 ContainerKind::CompareSameTag(const KindBase& Other) const
        {
            auto OtherAsContainer = Other.SAs<ContainerKind>();
            return ElemKind->Compare(*(OtherAsContainer->ElemKind));
        }

        ListKind::ListKind(const KindRef& ElemKind)
            : ContainerKind(KindTag::List, ElemKind)
        {
            // Nothing here
        }

        ListKind::~ListKind()
        {
            // Nothing here
        }

        void ListKind::ComputeHashValue() const
        {
            HashCode = 0;
            boost::hash_combine(HashCode, "ListKind");
            boost::hash_combine(HashCode, ElemKind->Hash());
        }

        string ListKind::ToString(u32 Verbosity) const
        {
            return "[" + ElemKind->ToString(Verbosity) + "]";
        }

        string ListKind::ToSMTType() const
        {
            return "(Seq " + ElemKind->ToSMTType() + ")";
        }

        SetKind::SetKind(const KindRef& ElemKind)
            : ContainerKind(KindTag::Set, ElemKind)
        {
            // Nothing here
        }

        SetKind::~SetKind()
        {
            // Nothing here
        }

        void SetKind::ComputeHashValue() const
        {
            HashCode = 0;
            boost::hash_combine(HashCode, "SetKind");
            boost::hash_combine(HashCode, ElemKind->Hash());
        }

        string SetKind::ToString(u32 Verbosity) const
        {
            return "{" + ElemKind->ToString(Verbosity) + "}";
        }

        string SetKind::ToSMTType() const
        {
            return "(Array " + ElemKind->ToSMTType() + " Bool)";
        }

        MaybeKind::MaybeKind(const KindRef& ElemKind)
            : ContainerKind(KindTag::Maybe, ElemKind)
        {
            // Nothing here
        }

        MaybeKind::~MaybeKind()
        {
            // Nothing here
        }

        void MaybeKind::ComputeHashValue() const
        {
            HashCode = 0;
            boost::hash_combine(HashCode, "MaybeKind");
            boost::hash_combine(HashCode, ElemKind->Hash());
        }

        string MaybeKind::ToString(u32 Verbosity) const
        {
            return "Maybe (" + ElemKind->ToString(Verbosity) + ")";
        }

        string MaybeKind::ToSMTType() const
        {
            return "(SBVMaybe " + ElemKind->ToSMTType() + ")";
        }

        TupleKind::TupleKind(const vector<KindRef>& ElemKinds)
            : KindBase(KindTag::Tuple), ElemKinds(ElemKinds)
        {
            // Nothing here
        }

        TupleKind::~TupleKind()
        {
            // Nothing here
        }

        const vector<KindRef>& TupleKind::GetElemKinds() const
        {
            return ElemKinds;
        }

        u32 TupleKind::GetArity() const
        {
            return ElemKinds.size();
        }

        vector<KindRef> TupleKind::GetChildren() const
        {
            return ElemKinds;
        }

        void TupleKind::ComputeHashValue() const
        {
            HashCode = 0;
            boost::hash_combine(HashCode, "TupleKind");
            for (auto const& Elem : ElemKinds) {
                boost::hash_combine(HashCode, Elem->Hash());
            }
        }

        i32 TupleKind::CompareSameTag(const KindBase& Other) const
        {
            return CompareKindVecs(ElemKinds, Other.SAs<TupleKind>()->ElemKinds);
        }

        string TupleKind::ToString(u32 Verbosity) const
        {
            vector<string> ElemStrings;
            for (auto const& Elem : ElemKinds) {
                ElemStrings.push_back(Elem->ToString(Verbosity));
            }
            return "(" + boost::algorithm::join(ElemStrings, ", ") + ")";
        }

        string TupleKind::ToSMTType() const
        {
            if (ElemKinds.size() == 0) {
                return "SBVTuple0";
            }
            string Retval = "(SBVTuple" + to_string(ElemKinds.size());
            for (auto const& Elem : ElemKinds) {
                Retval += " " + Elem->ToSMTType();
            }
            return Retval + ")";
        }

        RationalKind::RationalKind()
            : KindBase(KindTag::Rational)
        {
            // Nothing here
        }

        RationalKind::~RationalKind()
        {
            // Nothing here
        }

        void RationalKind::ComputeHashValue() const
        {
            HashCode = 0;
            boost::hash_combine(HashCode, "RationalKind");
        }

        i32 RationalKind::CompareSameTag(const KindBase& Other) const
        {
            return 0;
        }

        string RationalKind::ToString(u32 Verbosity) const
        {
            return "Rational";
        }

        string RationalKind::ToSMTType() const
        {
            return "SBVRational";
        }

        bool RationalKind::HasSign() const
        {
            return true;
        }

        EitherKind::EitherKind(const KindRef& LeftKind, const KindRef& RightKind)
            : KindBase(KindTag::Either), LeftKind(LeftKind), RightKind(RightKind)
        {
            // Nothing here
        }

        EitherKind::~EitherKind()
        {
            // Nothing here
        }

        const KindRef& EitherKind::GetLeftKind() const
        {
            return LeftKind;
        }

        const KindRef& EitherKind::GetRightKind() const
        {
            return RightKind;
        }

        vector<KindRef> EitherKind::GetChildren() const
        {
            vector<KindRef> Retval = { LeftKind, RightKind };
            return Retval;
        }

        void EitherKind::ComputeHashValue() const
        {
            HashCode = 0;
            boost::hash_combine(HashCode, "EitherKind");
            boost::hash_combine(HashCode, LeftKind->Hash());
            boost::hash_combine(HashCode, RightKind->Hash());
        }

        i32 EitherKind::CompareSameTag(const KindBase& Other) const
        {
            auto OtherAsEither = Other.SAs<EitherKind>();
            auto Res = LeftKind->Compare(*(OtherAsEither->LeftKind));
            if (Res != 0) {
                return Res;
            }
            return RightKind->Compare(*(OtherAsEither->RightKind));
        }

        string EitherKind::ToString(u32 Verbosity) const
        {
            return "Either (" + LeftKind->ToString(Verbosity) + ") (" +
                RightKind->ToString(Verbosity) + ")";
        }

        string EitherKind::ToSMTType() const
        {
            return "(SBVEither " + LeftKind->ToSMTType() + " " + RightKind->ToSMTType() + ")";
        }

        KindRef MkBoolKind()
        {
            return new BoolKind();
        }

        KindRef MkBoundedKind(bool Signed, u32 Width)
        {
            return new BoundedKind(Signed, Width);
        }

        KindRef MkUnboundedKind()
        {
            return new UnboundedKind();
        }

        KindRef MkRealKind()
        {
            return new RealKind();
        }

        KindRef MkUserSortKind(const string& Name)
        {
            return new UserSortKind(Name);
        }

        KindRef MkEnumKind(const string& Name, const vector<string>& Constructors)
        {
            return new UserSortKind(Name, Constructors);
        }

        KindRef MkRoundingModeKind()
        {
            vector<string> Modes = { "RoundNearestTiesToEven", "RoundNearestTiesToAway",
                                     "RoundTowardPositive", "RoundTowardNegative",
                                     "RoundTowardZero" };
            return new UserSortKind("RoundingMode", Modes);
        }

        KindRef MkFloatKind()
        {
            return new FloatKind();
        }

        KindRef MkDoubleKind()
        {
            return new DoubleKind();
        }

        KindRef MkFPKind(u32 ExponentBits, u32 SignificandBits)
        {
            return new FPKind(ExponentBits, SignificandBits);
        }

        KindRef MkCharKind()
        {
            return new CharKind();
        }

        KindRef MkStringKind()
        {
            return new StringKind();
        }

        KindRef MkListKind(const KindRef& ElemKind)
        {
            return new ListKind(ElemKind);
        }

        KindRef MkSetKind(const KindRef& ElemKind)
        {
            return new SetKind(ElemKind);
        }

        KindRef MkTupleKind(const vector<KindRef>& ElemKinds)
        {
            return new TupleKind(ElemKinds);
        }

        KindRef MkMaybeKind(const KindRef& ElemKind)
        {
            return new MaybeKind(ElemKind);
        }

        KindRef MkRationalKind()
        {
            return new RationalKind();
        }

        KindRef MkEitherKind(const KindRef& LeftKind, const KindRef& RightKind)
        {
            return new EitherKind(LeftKind, RightKind);
        }

        bool IsBoolean(const KindRef& Kind)
        {
            return (Kind->GetTag() == KindTag::Bool);
        }

        bool IsBounded(const KindRef& Kind)
        {
            return (Kind->GetTag() == KindTag::Bounded);
        }

        bool IsUnbounded(const KindRef& Kind)
        {
            return (Kind->GetTag() == KindTag::Unbounded);
        }

        bool IsReal(const KindRef& Kind)
        {
            return (Kind->GetTag() == KindTag::Real);
        }

        bool IsUserSort(const KindRef& Kind)
        {
            return (Kind->GetTag() == KindTag::UserSort);
        }

        bool IsFloat(const KindRef& Kind)
        {
            return (Kind->GetTag() == KindTag::Float);
        }

        bool IsDouble(const KindRef& Kind)
        {
            return (Kind->GetTag() == KindTag::Double);
        }

        bool IsFP(const KindRef& Kind)
        {
            return (Kind->GetTag() == KindTag::FP);
        }

        bool IsAnyFloating(const KindRef& Kind)
        {
            return (IsFloat(Kind) || IsDouble(Kind) || IsFP(Kind));
        }

        bool IsChar(const KindRef& Kind)
        {
            return (Kind->GetTag() == KindTag::Char);
        }

        bool IsString(const KindRef& Kind)
        {
            return (Kind->GetTag() == KindTag::String);
        }

        bool IsList(const KindRef& Kind)
        {
            return (Kind->GetTag() == KindTag::List);
        }

        bool IsSet(const KindRef& Kind)
        {
            return (Kind->GetTag() == KindTag::Set);
        }

        bool IsTuple(const KindRef& Kind)
        {
            return (Kind->GetTag() == KindTag::Tuple);
        }

        bool IsMaybe(const KindRef& Kind)
        {
            return (Kind->GetTag() == KindTag::Maybe);
        }

        bool IsRational(const KindRef& Kind)
        {
            return (Kind->GetTag() == KindTag::Rational);
        }

        bool IsEither(const KindRef& Kind)
        {
            return (Kind->GetTag() == KindTag::Either);
        }

        static inline void GatherUniverse(const KindRef& Kind, vector<KindRef>& Universe)
        {
            Universe.push_back(Kind);
            for (auto const& Child : Kind->GetChildren()) {
                GatherUniverse(Child, Universe);
            }
        }

        vector<KindRef> GetUniverse(const KindRef& Kind)
        {
            vector<KindRef> Retval;
            GatherUniverse(Kind, Retval);
            return Retval;
        }

        KindSetT CloseKindSet(const KindSetT& Kinds)
        {
            KindSetT Retval;
            for (auto const& Kind : Kinds) {
                auto&& Universe = GetUniverse(Kind);
                Retval.insert(Universe.begin(), Universe.end());
            }
            return Retval;
        }

        bool KindOccurs(const KindRef& Kind, const function<bool(const KindRef&)>& Pred)
        {
            if (Pred(Kind)) {
                return true;
            }
            for (auto const& Child : Kind->GetChildren()) {
                if (KindOccurs(Child, Pred)) {
                    return true;
                }
            }
            return false;
        }

        bool ContainsCharOrRational(const KindRef& Kind)
        {
            return KindOccurs(Kind, [] (const KindRef& K) -> bool
                              {
                                  return (IsChar(K) || IsRational(K));
                              });
        }

        bool NeedsFlattening(const KindRef& Kind)
        {
            return KindOccurs(Kind, [] (const KindRef& K) -> bool
                              {
                                  return (IsList(K) || IsSet(K) || IsTuple(K) ||
                                          IsMaybe(K) || IsEither(K));
                              });
        }

    } /* end namespace Kinds */
} /* end namespace SMTG */

//
// Kinds.cpp ends here
