// FeatureDetector.cpp ---
//
// Filename: FeatureDetector.cpp
// Author: Abhishek Udupa
// Created: Wed Jan 24 04:02:01 2014 (-0400)
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

#include "FeatureDetector.hpp"
#include "../utils/LogManager.hpp"

namespace SMTG {
    namespace SMTLib {

        using namespace Kinds;
        using namespace Program;

        ProblemFeatures::ProblemFeatures()
            : HasInteger(false), HasReal(false), HasFP(false), HasString(false),
              HasRegExp(false), HasChar(false), HasRounding(false), HasBVs(false),
              HasNonBVArrays(false), HasArrayInits(false), HasOverflows(false),
              HasList(false), HasSets(false), HasTuples(false), HasEither(false),
              HasMaybe(false), HasRational(false), NeedsFlattening(false)
        {
            // Nothing here
        }

        ProblemFeatures::~ProblemFeatures()
        {
            // Nothing here
        }

        string ProblemFeatures::ToString(u32 Verbosity) const
        {
            vector<pair<string, bool>> Flags = {
                { "unbounded", HasInteger }, { "reals", HasReal }, { "floats", HasFP },
                { "strings", HasString }, { "regexps", HasRegExp }, { "chars", HasChar },
                { "rounding", HasRounding }, { "bitvectors", HasBVs },
                { "non-bv-arrays", HasNonBVArrays }, { "array-inits", HasArrayInits },
                { "overflows", HasOverflows }, { "lists", HasList }, { "sets", HasSets },
                { "tuples", HasTuples }, { "either", HasEither }, { "maybe", HasMaybe },
                { "rationals", HasRational }, { "flattening", NeedsFlattening }
            };

            vector<string> Present;
            for (auto const& Flag : Flags) {
                if (Flag.second) {
                    Present.push_back(Flag.first);
                }
            }
            ostringstream sstr;
            sstr << "Features: {" << boost::algorithm::join(Present, ", ") << "}";
            if (TrueUserSorts.size() > 0) {
                sstr << ", user sorts: {" << boost::algorithm::join(TrueUserSorts, ", ") << "}";
            }
            if (TupleArities.size() > 0) {
                vector<string> Arities;
                for (auto Arity : TupleArities) {
                    Arities.push_back(to_string(Arity));
                }
                sstr << ", tuple arities: {" << boost::algorithm::join(Arities, ", ") << "}";
            }
            if (Verbosity > 0 && ReversedKinds.size() > 0) {
                sstr << ", reversals of:";
                for (auto const& Kind : ReversedKinds) {
                    sstr << " " << Kind->ToString();
                }
            }
            return sstr.str();
        }

        ProblemFeatures DetectKindFeatures(const KindSetT& Kinds)
        {
            ProblemFeatures Retval;
            set<u32> Arities;

            for (auto const& Kind : Kinds) {
                switch (Kind->GetTag()) {
                case KindTag::Unbounded:
                    Retval.HasInteger = true;
                    break;
                case KindTag::Real:
                    Retval.HasReal = true;
                    break;
                case KindTag::Float:
                case KindTag::Double:
                case KindTag::FP:
                    Retval.HasFP = true;
                    break;
                case KindTag::String:
                    Retval.HasString = true;
                    break;
                case KindTag::Char:
                    Retval.HasChar = true;
                    break;
                case KindTag::Bounded:
                    Retval.HasBVs = true;
                    break;
                case KindTag::UserSort: {
                    auto UKind = Kind->SAs<UserSortKind>();
                    Retval.UserSorts.push_back(Kind);
                    if (UKind->IsRoundingMode()) {
                        Retval.HasRounding = true;
                    } else {
                        Retval.TrueUserSorts.push_back(UKind->GetName());
                    }
                    break;
                }
                case KindTag::List:
                    Retval.HasList = true;
                    break;
                case KindTag::Set:
                    Retval.HasSets = true;
                    break;
                case KindTag::Tuple:
                    Arities.insert(Kind->SAs<TupleKind>()->GetArity());
                    break;
                case KindTag::Maybe:
                    Retval.HasMaybe = true;
                    break;
                case KindTag::Either:
                    Retval.HasEither = true;
                    break;
                case KindTag::Rational:
                    Retval.HasRational = true;
                    break;
                case KindTag::Bool:
                    break;
                }
                if (Kinds::NeedsFlattening(Kind)) {
                    Retval.NeedsFlattening = true;
                }
            }

            Retval.TupleArities.insert(Retval.TupleArities.end(), Arities.begin(), Arities.end());
            Retval.HasTuples = (Retval.TupleArities.size() > 0);
            return Retval;
        }

        ProblemFeatures DetectFeatures(const KindSetT& Kinds,
                                       const vector<Assignment>& Assignments,
                                       const vector<ArrayInfo>& Arrays)
        {
            auto&& Retval = DetectKindFeatures(Kinds);

            for (auto const& Array : Arrays) {
                if (!IsBounded(Array.DomainKind) || !IsBounded(Array.RangeKind)) {
                    Retval.HasNonBVArrays = true;
                }
                if (Array.Context.Kind == ArrayContextKind::Free &&
                    Array.Context.HasInitializer) {
                    Retval.HasArrayInits = true;
                }
            }

            for (auto const& Asgn : Assignments) {
                auto const& Op = Asgn.second.GetOp();
                switch (Op.GetCode()) {
                case OpKind::OverflowOp:
                    Retval.HasOverflows = true;
                    break;
                case OpKind::RegExOp:
                    Retval.HasRegExp = true;
                    break;
                case OpKind::StrOp:
                    if (Op.GetStrOp() == StrOpKind::InRe) {
                        Retval.HasRegExp = true;
                    }
                    break;
                case OpKind::SeqOp:
                    if (Op.GetSeqOp() == SeqOpKind::Reverse) {
                        auto const& Kind = Op.GetReversedKind();
                        auto it = find_if(Retval.ReversedKinds.begin(),
                                          Retval.ReversedKinds.end(),
                                          [&] (const KindRef& Other) -> bool
                                          {
                                              return Other->Equals(*Kind);
                                          });
                        if (it == Retval.ReversedKinds.end()) {
                            Retval.ReversedKinds.push_back(Kind);
                        }
                    }
                    break;
                default:
                    break;
                }
            }

            SMTG_LOG_FULL("Compiler.Features", Out_ << Retval.ToString(1) << endl;);
            return Retval;
        }

        ProblemFeatures DetectFeatures(const ProblemSnapshot& Snapshot)
        {
            return DetectFeatures(CloseKindSet(Snapshot.Kinds), Snapshot.Assignments,
                                  Snapshot.Arrays);
        }

    } /* end namespace SMTLib */
} /* end namespace SMTG */

//
// FeatureDetector.cpp ends here
