// DeclTests.cpp ---
//
// Filename: DeclTests.cpp
// Author: Abhishek Udupa
// Created: Mon Jan 17 00:07:25 2014 (-0400)
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

#include "../../src/smtlib/Declarations.hpp"
#include "../common/TestUtils.hpp"

using namespace SMTG;
using namespace Kinds;
using namespace Program;
using namespace SMTLib;
using namespace Test;

static inline void RunDatatypeTests()
{
    cout << "Running sort and datatype declaration tests" << endl;

    CheckLines(DeclSort(MkUserSortKind("Q")), { "(declare-sort Q 0)  ; N.B. Uninterpreted sort." },
               "opaque sorts");
    CheckLines(DeclSort(MkEnumKind("Color", { "Red", "Green", "Blue" })),
               { "(declare-datatypes ((Color 0)) (((Red) (Green) (Blue))))",
                 "(define-fun Color_constrIndex ((x Color)) Int",
                 "   (ite (= x Red) 0 (ite (= x Green) 1 2))",
                 ")" },
               "enumerations with their constructor index");
    CheckTrue(DeclSort(MkRoundingModeKind()).size() == 0, "rounding modes are built in");

    CheckLines(DeclTuple(0), { "(declare-datatypes ((SBVTuple0 0)) (((mkSBVTuple0))))" },
               "the unit tuple");
    string L1 = "(declare-datatypes ((SBVTuple2 2)) (";
    string L2 = string(L1.size(), ' ') + "((mkSBVTuple2 ";
    CheckLines(DeclTuple(2),
               { L1 + "(par (T1 T2)",
                 L2 + "(proj_1_SBVTuple2 T1)",
                 string(L2.size(), ' ') + "(proj_2_SBVTuple2 T2))))))" },
               "pairs");
    CheckTrue(DeclTuple(5).size() == 6, "one line per projection");
    ExpectThrows<InternalError>([] () { DeclTuple(1); }, "Unexpected one-tuple",
                                "one-tuples are an internal error");

    auto&& Rationals = DeclRationals();
    CheckEqual(Rationals[0], "(declare-datatype SBVRational ((SBV.Rational "
               "(sbv.rat.numerator Int) (sbv.rat.denominator Int))))", "the rational datatype");
    CheckTrue(CountContaining(Rationals, "(define-fun sbv.rat.") == 9,
              "every rational helper is defined");
    CheckTrue(DeclSum().size() == 3 && DeclMaybe().size() == 3, "sums and optionals");
}

static inline void RunFunctionTests()
{
    cout << "Running constant and function declaration tests" << endl;

    SMTConfig Config;
    auto Word8 = MkBoundedKind(false, 8);
    SV S3(Word8, 3);

    CheckLines(DefineFun(Config.Capabilities, S3, "#x01"),
               { "(define-fun s3 () (_ BitVec 8) #x01)" }, "definitions");
    CheckLines(DefineFun(Config.Capabilities, S3, "#x01", "label"),
               { "(define-fun s3 () (_ BitVec 8) #x01) ; label" }, "labelled definitions");

    SolverCapabilities NoDefineFun;
    NoDefineFun.SupportsDefineFun = false;
    CheckLines(DefineFun(NoDefineFun, S3, "#x01"),
               { "(declare-fun s3 () (_ BitVec 8))", "(assert (= s3 #x01))" },
               "definitions without define-fun");

    CheckTrue(DeclConst(Config, SV::True(), CV::MkBool(true)).size() == 0,
              "true is never declared");
    CheckTrue(DeclConst(Config, SV::False(), CV::MkBool(false)).size() == 0,
              "false is never declared");
    CheckLines(DeclConst(Config, S3, CV::MkInteger(Word8, 255)),
               { "(define-fun s3 () (_ BitVec 8) #xff)" }, "constants");

    CheckEqual(CvtType({ MkUnboundedKind(), MkBoolKind(), Word8 }), "(Int Bool) (_ BitVec 8)",
               "function types");
    CheckLines(DeclUI(UninterpretedSymbol("f", { MkUnboundedKind(), MkBoolKind() })),
               { "(declare-fun f (Int) Bool)" }, "uninterpreted functions");
    CheckLines(DeclareFun(SV(MkBoolKind(), 0), { MkBoolKind() }, "tracks x"),
               { "(declare-fun s0 () Bool) ; tracks x" }, "commented declarations");

    CheckLines(DeclAx(Axiom(false, "ax1", { "(assert (forall ((x Int)) (> (f x) 0)))" })),
               { ";; -- user given axiom: ax1", "(assert (forall ((x Int)) (> (f x) 0)))" },
               "axioms");
    CheckEqual(DeclAx(Axiom(true, "g", { "(define-fun g () Int 3)" }))[0],
               ";; -- user given definition: g", "definitions given by the user");

    CheckEqual(DeclSBVFunc(MkStringKind(), "sbv.reverse_0")[0],
               "(define-fun-rec sbv.reverse_0 ((str String)) String", "string reversal");
    CheckEqual(DeclSBVFunc(MkListKind(Word8), "sbv.reverse_1")[0],
               "(define-fun-rec sbv.reverse_1 ((lst (Seq (_ BitVec 8)))) (Seq (_ BitVec 8))",
               "sequence reversal");
    ExpectThrows<InternalError>([] () { DeclSBVFunc(MkUnboundedKind(), "sbv.reverse_2"); },
                                "Unexpected helper function", "only strings and lists reverse");
}

static inline void RunWellFormednessTests()
{
    cout << "Running well-formedness constraint tests" << endl;

    CheckLines(DeclareFun(SV(MkCharKind(), 5), { MkCharKind() }),
               { "(declare-fun s5 () String)", "(assert (= 1 (str.len s5)))" },
               "characters are strings of length one");

    CheckLines(DeclareFun(SV(MkCharKind(), 5), { MkBoundedKind(false, 8), MkCharKind() }),
               { "(declare-fun s5 ((_ BitVec 8)) String)",
                 "(assert (forall ((a1 (_ BitVec 8)))",
                 "                (let ((result (s5 a1)))",
                 "                     (= 1 (str.len result))",
                 "                )))" },
               "skolemized characters");

    CheckLines(DeclareFun(SV(MkTupleKind({ MkCharKind(), MkRationalKind() }), 6),
                          { MkTupleKind({ MkCharKind(), MkRationalKind() }) }),
               { "(declare-fun s6 () (SBVTuple2 String SBVRational))",
                 "(assert (and (= 1 (str.len (proj_1_SBVTuple2 s6)))",
                 "             (< 0 (sbv.rat.denominator (proj_2_SBVTuple2 s6)))",
                 "        ))" },
               "tuples distribute the constraints");

    CheckLines(WellFormednessConstraints("s7", MkListKind(MkCharKind())),
               { "(forall ((seq0 Int)) (=> (and (>= seq0 0) (< seq0 (seq.len s7))) "
                 "(= 1 (str.len (seq.nth s7 seq0)))))" },
               "lists quantify over their indices");

    CheckLines(WellFormednessConstraints("s8", MkMaybeKind(MkRationalKind())),
               { "(=> ((_ is (just_SBVMaybe (SBVRational) (SBVMaybe SBVRational))) s8) "
                 "(< 0 (sbv.rat.denominator (get_just_SBVMaybe s8))))" },
               "optionals guard the constraint");

    CheckLines(WellFormednessConstraints("s10", MkSetKind(MkCharKind())),
               { "(forall ((set0 String)) (=> (select s10 set0) (= 1 (str.len set0))))" },
               "sets constrain their members");

    CheckLines(WellFormednessConstraints("s11", MkEitherKind(MkCharKind(), MkRationalKind())),
               { "(=> ((_ is (left_SBVEither (String) (SBVEither String SBVRational))) s11) "
                 "(= 1 (str.len (get_left_SBVEither s11))))",
                 "(=> ((_ is (right_SBVEither (SBVRational) (SBVEither String SBVRational))) "
                 "s11) (< 0 (sbv.rat.denominator (get_right_SBVEither s11))))" },
               "sums guard each side");
    CheckLines(WellFormednessConstraints("s12", MkEitherKind(MkBoundedKind(false, 8),
                                                             MkCharKind())),
               { "(=> ((_ is (right_SBVEither (String) (SBVEither (_ BitVec 8) String))) s12) "
                 "(= 1 (str.len (get_right_SBVEither s12))))" },
               "unconstrained sides are skipped");

    CheckTrue(WellFormednessConstraints("s9", MkListKind(MkBoundedKind(true, 4))).size() == 0,
              "nothing to check without characters or rationals");
    CheckLines(DeclareFun(SV(MkListKind(MkUnboundedKind()), 9),
                          { MkListKind(MkUnboundedKind()) }),
               { "(declare-fun s9 () (Seq Int))" }, "plain declarations");
}

int main()
{
    RunDatatypeTests();
    RunFunctionTests();
    RunWellFormednessTests();
    cout << "All declaration tests passed" << endl;
    return 0;
}

//
// DeclTests.cpp ends here
