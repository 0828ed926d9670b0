// KindTests.cpp ---
//
// Filename: KindTests.cpp
// Author: Abhishek Udupa
// Created: Sun Oct 15 07:40:45 2015 (-0400)
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

#include "../../src/kinds/Kinds.hpp"
#include "../../src/program/Values.hpp"
#include "../common/TestUtils.hpp"

using namespace SMTG;
using namespace Kinds;
using namespace Program;
using namespace Test;

static inline void RunKindTests()
{
    cout << "Running tests on kinds" << endl;

    auto Word8 = MkBoundedKind(false, 8);
    auto Int8 = MkBoundedKind(true, 8);
    CheckEqual(Word8->ToSMTType(), "(_ BitVec 8)", "bit-vector sort");
    CheckEqual(Word8->ToString(), "Word8", "kinds print without a verbosity");
    CheckEqual(Int8->ToString(), Int8->ToString(0), "the default verbosity is zero");
    CheckTrue(!Word8->Equals(*Int8), "signedness distinguishes bit-vector kinds");
    CheckTrue(Word8->Equals(*MkBoundedKind(false, 8)), "kinds compare structurally");
    {
        auto Shared = Word8;
        CheckTrue(Word8->GetNumRefs_() == 2, "copies of a kind share the object");
    }
    CheckTrue(Word8->GetNumRefs_() == 1, "released copies drop their reference");
    CheckEqual(MkFloatKind()->ToSMTType(), "(_ FloatingPoint 8 24)", "float sort");
    CheckEqual(MkCharKind()->ToSMTType(), "String", "characters are strings");
    CheckEqual(MkListKind(Int8)->ToSMTType(), "(Seq (_ BitVec 8))", "list sort");
    CheckEqual(MkSetKind(MkUnboundedKind())->ToSMTType(), "(Array Int Bool)", "set sort");
    CheckEqual(MkTupleKind({ Word8, MkBoolKind() })->ToSMTType(),
               "(SBVTuple2 (_ BitVec 8) Bool)", "tuple sort");
    CheckEqual(MkTupleKind(vector<KindRef>())->ToSMTType(), "SBVTuple0", "unit sort");
    CheckEqual(MkEitherKind(MkBoolKind(), MkStringKind())->ToSMTType(),
               "(SBVEither Bool String)", "sum sort");

    auto Nested = MkMaybeKind(MkListKind(MkTupleKind({ MkCharKind(), Word8 })));
    CheckTrue(ContainsCharOrRational(Nested), "characters are found at any depth");
    CheckTrue(!ContainsCharOrRational(MkListKind(Word8)), "no characters in a list of words");
    CheckTrue(NeedsFlattening(Nested), "optionals need flattened models");
    CheckTrue(!NeedsFlattening(Word8), "bit-vectors need no flattening");

    KindSetT Roots = { Nested };
    auto&& Closed = CloseKindSet(Roots);
    CheckTrue(Closed.find(MkCharKind()) != Closed.end(), "closure reaches the characters");
    CheckTrue(Closed.find(Word8) != Closed.end(), "closure reaches the tuple fields");
    CheckTrue(Closed.find(MkTupleKind({ MkCharKind(), Word8 })) != Closed.end(),
              "closure keeps the intermediate kinds");

    ExpectThrows<SMTGError>([] () { MkBoundedKind(true, 0); }, "non-zero width",
                            "zero width bit-vectors are rejected");

    auto Colors = MkEnumKind("Color", { "Red", "Green", "Blue" });
    auto UKind = Colors->As<UserSortKind>();
    CheckTrue(UKind != nullptr && UKind->IsEnumerated(), "enumerations are user sorts");
    CheckTrue(MkRoundingModeKind()->As<UserSortKind>()->IsRoundingMode(),
              "rounding modes are recognized");
}

static inline void RunValueTests()
{
    cout << "Running tests on values" << endl;
    auto RM = RoundingModeT::RoundNearestTiesToEven;

    CheckEqual(SV::True().ToString(), "true", "true is inlined");
    CheckEqual(SV::False().ToString(), "false", "false is inlined");
    CheckEqual(SV(MkBoolKind(), 7).ToString(), "s7", "nodes are named by id");
    CheckTrue(SV(MkBoolKind(), 3) < SV(MkBoolKind(), 4), "nodes are ordered by id");

    auto Word8 = MkBoundedKind(false, 8);
    auto Int8 = MkBoundedKind(true, 8);
    CheckEqual(CV::MkInteger(Word8, 10).ToSMTLib(RM), "#x0a", "words in hexadecimal");
    CheckEqual(CV::MkInteger(MkBoundedKind(false, 3), 5).ToSMTLib(RM), "#b101",
               "odd widths in binary");
    CheckEqual(CV::MkInteger(Int8, -3).ToSMTLib(RM), "(bvneg #x03)",
               "negative bit-vectors are negated");
    CheckEqual(CV::MkInteger(Int8, -128).ToSMTLib(RM), "#b10000000",
               "the minimum signed value is written out");
    CheckEqual(CV::MkInteger(Word8, 256 + 7).ToSMTLib(RM), "#x07",
               "bit-vector values wrap around");
    CheckEqual(CV::MkInteger(MkUnboundedKind(), -42).ToSMTLib(RM), "(- 42)",
               "negative integers");
    CheckEqual(CV::MkBool(true).ToSMTLib(RM), "true", "Boolean literal");
    CheckEqual(CV::MkReal(3, 4).ToSMTLib(RM), "(/ 3.0 4.0)", "real literal");
    CheckEqual(CV::MkRational(-1, 2).ToSMTLib(RM), "(SBV.Rational (- 1) 2)",
               "rational literal");
    CheckEqual(CV::MkString("a\"b").ToSMTLib(RM), "\"a\"\"b\"", "quotes are doubled");
    CheckEqual(CV::MkString("caf\xc3\xa9").ToSMTLib(RM), "\"caf\\u{e9}\"",
               "multibyte characters are escaped whole");
    CheckEqual(CV::MkString("a\\b\n").ToSMTLib(RM), "\"a\\u{5c}b\\u{a}\"",
               "backslashes and controls are escaped");
    CheckEqual(CV::MkChar(0x1f600).ToSMTLib(RM), "\"\\u{1f600}\"",
               "characters are code points");
    CheckEqual(CV::MkChar('x').ToSMTLib(RM), "\"x\"", "printable characters");
    ExpectThrows<SMTGError>([&] () { CV::MkString("\xff").ToSMTLib(RM); },
                            "not valid UTF-8", "malformed strings are rejected");
    ExpectThrows<SMTGError>([] () { CV::MkChar(0x110000); }, "Not a Unicode code point",
                            "code points past the Unicode range");
    CheckEqual(CV::MkList(Word8, vector<CV>()).ToSMTLib(RM),
               "(as seq.empty (Seq (_ BitVec 8)))", "empty list");
    CheckEqual(CV::MkConst(MkRealKind(), 0).ToSMTLib(RM), "0.0", "real zero");
}

int main()
{
    RunKindTests();
    RunValueTests();
    cout << "All kind and value tests passed" << endl;
    return 0;
}

//
// KindTests.cpp ends here
