// IncrementalTests.cpp ---
//
// Filename: IncrementalTests.cpp
// Author: Abhishek Udupa
// Created: Thu Apr 17 00:52:13 2015 (-0400)
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

#include "../../src/smtlib/ScriptCompiler.hpp"
#include "../common/TestUtils.hpp"

using namespace SMTG;
using namespace Kinds;
using namespace Program;
using namespace SMTLib;
using namespace Test;

static inline void RunNewKindTests()
{
    cout << "Running incremental tests with new kinds" << endl;

    SMTConfig Config;
    auto Word8 = MkBoundedKind(false, 8);
    auto Colors = MkEnumKind("Color", { "Red", "Green" });
    SV Ten(Word8, 1), C(Colors, 5), Red(Colors, 6), Eq(MkBoolKind(), 7);

    IncrementalSnapshot Delta;
    Delta.NewKinds = { Colors };
    Delta.NewInputs = { NamedInput(C, "c") };
    Delta.NewConstants = { { Red, CV::MkUserSort(Colors, "Red") } };
    Delta.AllConstants = { { Ten, CV::MkInteger(Word8, 10) },
                           { Red, CV::MkUserSort(Colors, "Red") } };
    Delta.Tables = { TableInfo(2, MkBoolKind(), Word8, { Ten, Ten }) };
    Delta.Assignments = {
        make_pair(Eq, OpNode(Operator::MkSimple(OpKind::Equal), { C, Red }))
    };
    Delta.Constraints = { Constraint(false, AttributeListT(), Eq),
                          Constraint(true, { { ":id", "g" } }, Eq, true) };

    CheckLines(CompileIncremental(Delta, Config),
               { "(declare-datatypes ((Color 0)) (((Red) (Green))))",
                 "(define-fun Color_constrIndex ((x Color)) Int",
                 "   (ite (= x Red) 0 1)",
                 ")",
                 "(define-fun s6 () Color Red)",
                 "(declare-fun s5 () Color)",
                 "(declare-fun table2 (Bool) (_ BitVec 8))",
                 "(define-fun s7 () Bool (= s5 s6))",
                 "(define-fun table2_initializer_0 () Bool (= (table2 false) s1))",
                 "(define-fun table2_initializer_1 () Bool (= (table2 true) s1))",
                 "(define-fun table2_initializer () Bool (and table2_initializer_0 "
                 "table2_initializer_1))",
                 "(assert table2_initializer)",
                 "(assert s7)",
                 "(assert-soft (! (not s7) :id |g|))" },
               "a delta with a new enumeration");

    IncrementalSnapshot Pairs;
    Pairs.NewKinds = { MkMaybeKind(MkTupleKind({ Word8, Word8 })) };
    auto&& Lines = CompileIncremental(Pairs, Config);
    CheckEqual(Lines[0], "(set-option :pp.max_depth 4294967295)",
               "new datatypes switch to flattened models first");
    CheckTrue(CountContaining(Lines, "(declare-datatypes ((SBVMaybe 1))") == 1,
              "the new optional is declared");
    CheckTrue(CountContaining(Lines, "(declare-datatypes ((SBVTuple2 2))") == 1,
              "tuples nested in a new kind are declared");

    IncrementalSnapshot Nested;
    Nested.NewKinds = { MkListKind(MkEitherKind(MkTupleKind({ Word8, Word8, Word8 }),
                                                MkRationalKind())) };
    auto&& NestedLines = CompileIncremental(Nested, Config);
    CheckTrue(CountContaining(NestedLines, "(declare-datatypes ((SBVTuple3 3))") == 1,
              "tuples are found at any depth");
    CheckTrue(CountContaining(NestedLines, "(declare-datatypes ((SBVEither 2))") == 1,
              "sums inside lists are declared");
    CheckTrue(CountContaining(NestedLines, "(declare-datatype SBVRational") == 1,
              "rationals inside sums are declared");
    CheckTrue(CountContaining(Lines, "Color") == 0, "earlier sorts are not redeclared");
}

static inline void RunDeltaTests()
{
    cout << "Running incremental tests without new kinds" << endl;

    SMTConfig Config;
    auto Word8 = MkBoundedKind(false, 8);
    SV X(Word8, 0), Ten(Word8, 1), Y(Word8, 8), Sum(Word8, 9), Le(MkBoolKind(), 10);

    IncrementalSnapshot Delta;
    Delta.NewInputs = { NamedInput(Y, "y") };
    Delta.AllConstants = { { Ten, CV::MkInteger(Word8, 10) } };
    Delta.Arrays = { ArrayInfo(3, "mem", Word8, Word8, ArrayContext::MkMutate(2, Y, Ten)) };
    Delta.Uninterpreteds = { UninterpretedSymbol("f", { Word8, Word8 }) };
    Delta.Assignments = {
        make_pair(Sum, OpNode(Operator::MkSimple(OpKind::Plus), { X, Y })),
        make_pair(Le, OpNode(Operator::MkSimple(OpKind::LessEq), { Sum, Ten }))
    };
    Delta.Constraints = { Constraint(false, { { ":named", "bound" } }, Le) };

    CheckLines(CompileIncremental(Delta, Config),
               { "(declare-fun s8 () (_ BitVec 8))",
                 "(declare-fun array_3 () (Array (_ BitVec 8) (_ BitVec 8)))",
                 "(declare-fun f ((_ BitVec 8)) (_ BitVec 8))",
                 "(define-fun s9 () (_ BitVec 8) (bvadd s0 s8))",
                 "(define-fun s10 () Bool (bvule s9 s1))",
                 "(define-fun array_3_initializer_0 () Bool (= array_3 (store array_2 s8 s1)))",
                 "(define-fun array_3_initializer () Bool array_3_initializer_0)",
                 "(assert array_3_initializer)",
                 "(assert (! s10 :named |bound|))" },
               "a delta with new definitions only");

    CheckTrue(CompileIncremental(IncrementalSnapshot(), Config).size() == 0,
              "an empty delta needs no lines");
}

int main()
{
    RunNewKindTests();
    RunDeltaTests();
    cout << "All incremental tests passed" << endl;
    return 0;
}

//
// IncrementalTests.cpp ends here
