// LogicTests.cpp ---
//
// Filename: LogicTests.cpp
// Author: Abhishek Udupa
// Created: Sun May  1 11:35:32 2014 (-0400)
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

#include "../../src/smtlib/FeatureDetector.hpp"
#include "../../src/smtlib/LogicSelector.hpp"
#include "../common/TestUtils.hpp"

using namespace SMTG;
using namespace Kinds;
using namespace Program;
using namespace SMTLib;
using namespace Test;

static inline string SelectLogic(const KindSetT& Kinds, const SMTConfig& Config,
                                 QueryContextT Context = QueryContextT::Internal,
                                 bool HasForalls = false, bool HasAxioms = false,
                                 bool HasArrays = false, bool HasUIsOrTables = false)
{
    auto&& Features = DetectKindFeatures(CloseKindSet(Kinds));
    LogicSelector Selector(Features, Config, Context, HasForalls, HasAxioms,
                           HasArrays, HasUIsOrTables);
    auto&& Lines = Selector.GetLogicLines();
    if (Lines.size() != 1) {
        Fail("Expected exactly one logic line");
    }
    return Lines[0];
}

static inline void RunFeatureTests()
{
    cout << "Running feature detection tests" << endl;

    KindSetT Kinds = { MkMaybeKind(MkTupleKind({ MkBoundedKind(false, 8), MkCharKind() })),
                       MkRoundingModeKind(), MkEnumKind("Color", { "Red", "Green" }) };
    auto&& Features = DetectKindFeatures(CloseKindSet(Kinds));
    CheckTrue(Features.HasMaybe && Features.HasTuples && Features.HasChar && Features.HasBVs,
              "nested kinds are detected");
    CheckTrue(Features.HasRounding, "the rounding mode sort is detected");
    CheckTrue(Features.TrueUserSorts.size() == 1 && Features.TrueUserSorts[0] == "Color",
              "the rounding mode is not a true user sort");
    CheckTrue(Features.UserSorts.size() == 2, "every user sort is declared in order");
    CheckTrue(Features.TupleArities.size() == 1 && Features.TupleArities[0] == 2,
              "tuple arities are collected");
    CheckTrue(Features.NeedsFlattening, "optionals need flattening");
    CheckTrue(!Features.HasInteger && !Features.HasReal && !Features.HasRational,
              "absent theories are not reported");

    auto Str = MkStringKind();
    vector<Assignment> Assignments = {
        make_pair(SV(MkBoolKind(), 1),
                  OpNode(Operator::MkStrInRe(RegExp::MkKStar(RegExp::MkLiteral("ab"))),
                         { SV(Str, 0) }))
    };
    auto&& WithRegExps = DetectFeatures(KindSetT({ Str, MkBoolKind() }), Assignments,
                                        vector<ArrayInfo>());
    CheckTrue(WithRegExps.HasRegExp, "regular expression membership is detected");

    vector<ArrayInfo> Arrays = {
        ArrayInfo(0, "arr", MkUnboundedKind(), MkBoundedKind(false, 8),
                  ArrayContext::MkFree(SV(MkBoundedKind(false, 8), 2)))
    };
    auto&& WithArrays = DetectFeatures(KindSetT({ MkBoundedKind(false, 8) }),
                                       vector<Assignment>(), Arrays);
    CheckTrue(WithArrays.HasNonBVArrays, "integer indexed arrays are not bit-vector arrays");
    CheckTrue(WithArrays.HasArrayInits, "array initializers are detected");
}

static inline void RunLogicTests()
{
    cout << "Running logic selection tests" << endl;

    SMTConfig Z3Config;
    KindSetT BVKinds = { MkBoolKind(), MkBoundedKind(true, 16) };

    CheckEqual(SelectLogic(BVKinds, Z3Config), "(set-logic QF_BV)",
               "quantifier free bit-vectors");
    CheckEqual(SelectLogic(BVKinds, Z3Config, QueryContextT::Internal, false, false, true, true),
               "(set-logic QF_AUFBV)", "arrays and tables");
    CheckEqual(SelectLogic(BVKinds, Z3Config, QueryContextT::Internal, true, false, false, true),
               "(set-logic UFBV)", "quantified bit-vectors with uninterpreted functions");
    CheckEqual(SelectLogic(BVKinds, Z3Config, QueryContextT::Internal, false, true),
               "(set-logic BV)", "axioms drop the quantifier free prefix");
    CheckEqual(SelectLogic(BVKinds, Z3Config, QueryContextT::External),
               "(set-logic ALL) ; external query, using all logics.", "external queries");

    auto WithRationals = BVKinds;
    WithRationals.insert(MkRationalKind());
    CheckEqual(SelectLogic(WithRationals, Z3Config),
               "(set-logic ALL) ; has rational values, using catch-all.",
               "rationals require the catch-all logic");

    auto WithIntegers = WithRationals;
    WithIntegers.insert(MkUnboundedKind());
    CheckEqual(SelectLogic(WithIntegers, Z3Config),
               "(set-logic ALL) ; has unbounded values, using catch-all.",
               "unbounded integers take precedence as a reason");

    CheckEqual(SelectLogic(KindSetT({ MkStringKind() }), Z3Config),
               "(set-logic ALL) ; has strings, using catch-all.", "strings");

    CheckEqual(SelectLogic(KindSetT({ MkFloatKind() }), Z3Config), "(set-logic QF_FP)",
               "floats alone");
    CheckEqual(SelectLogic(KindSetT({ MkDoubleKind(), MkBoundedKind(false, 32) }), Z3Config),
               "(set-logic QF_FPBV)", "floats and bit-vectors");
    CheckEqual(SelectLogic(KindSetT({ MkFloatKind() }), Z3Config, QueryContextT::Internal, true),
               "(set-logic ALL)", "quantified floats");

    SMTConfig NoBVConfig((SolverCapabilities()));
    CheckEqual(SelectLogic(KindSetT({ MkBoolKind() }), NoBVConfig), "(set-logic ALL)",
               "falls back to the catch-all logic without bit-vector support");

    SMTConfig UserConfig;
    UserConfig.SolverSetOptions.push_back(SMTOption::MkSetLogic(Logic("QF_LIA")));
    CheckEqual(SelectLogic(WithRationals, UserConfig), "(set-logic QF_LIA) ; NB. User specified.",
               "a user given logic is taken verbatim");

    SMTConfig NoneConfig;
    NoneConfig.SolverSetOptions.push_back(SMTOption::MkSetLogic(Logic::None()));
    CheckEqual(SelectLogic(BVKinds, NoneConfig),
               "; NB. Not setting the logic per user request of Logic_NONE",
               "no logic at all on request");

    SMTConfig TwoLogics;
    TwoLogics.SolverSetOptions.push_back(SMTOption::MkSetLogic(Logic("QF_BV")));
    TwoLogics.SolverSetOptions.push_back(SMTOption::MkSetLogic(Logic("QF_LIA")));
    ExpectThrows<SMTGError>([&] () { SelectLogic(BVKinds, TwoLogics); },
                            "Only one setOption call to 'setLogic' is allowed, found: 2",
                            "more than one logic is rejected");

    SMTConfig BoolectorConfig(GetSolverCapabilities("boolector"));
    KindSetT Unsupported = { MkTupleKind({ MkBoolKind(), MkBoolKind() }),
                             MkSetKind(MkBoundedKind(false, 8)) };
    ExpectThrows<SMTGError>([&] () { SelectLogic(Unsupported, BoolectorConfig); },
                            "requires support for data types",
                            "unsupported data types are reported");
    ExpectThrows<SMTGError>([&] () { SelectLogic(Unsupported, BoolectorConfig); },
                            "requires support for set operations",
                            "every unsupported feature is reported");
    ExpectThrows<SMTGError>([&] () { GetSolverCapabilities("nosuchsolver"); },
                            "Unknown solver", "unknown solvers are rejected");
}

int main()
{
    RunFeatureTests();
    RunLogicTests();
    cout << "All logic selection tests passed" << endl;
    return 0;
}

//
// LogicTests.cpp ends here
