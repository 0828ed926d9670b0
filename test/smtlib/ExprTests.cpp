// ExprTests.cpp ---
//
// Filename: ExprTests.cpp
// Author: Abhishek Udupa
// Created: Tue Apr  1 15:42:30 2015 (-0400)
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

#include "../../src/smtlib/ExprTranslator.hpp"
#include "../common/TestUtils.hpp"

using namespace SMTG;
using namespace Kinds;
using namespace Program;
using namespace SMTLib;
using namespace Test;

static const SkolemMapT EmptySkolems;
static const TableMapT EmptyTables;
static const FunctionMapT EmptyFunctions;

static inline string TranslateWith(const SMTConfig& Config, const Operator& Op,
                                   const vector<SV>& Args)
{
    ExprTranslator Translator(Config, EmptySkolems, EmptyTables, EmptyFunctions);
    return Translator.Translate(OpNode(Op, Args));
}

static inline string Translate(OpKind Code, const vector<SV>& Args)
{
    SMTConfig Config;
    return TranslateWith(Config, Operator::MkSimple(Code), Args);
}

static inline void RunArithmeticTests()
{
    cout << "Running arithmetic and comparison tests" << endl;

    CheckEqual(Operator::MkSimple(OpKind::Plus).ToString(), "Plus",
               "operators print without a verbosity");

    auto Int8 = MkBoundedKind(true, 8);
    auto Word8 = MkBoundedKind(false, 8);
    SV X(Int8, 0), Y(Int8, 1);
    SV U(Word8, 0), V(Word8, 1);

    CheckEqual(Translate(OpKind::LessThan, { X, Y }), "(bvslt s0 s1)", "signed comparison");
    CheckEqual(Translate(OpKind::LessThan, { U, V }), "(bvult s0 s1)", "unsigned comparison");
    CheckEqual(Translate(OpKind::Quot, { X, Y }), "(bvsdiv s0 s1)", "signed division");
    CheckEqual(Translate(OpKind::Rem, { U, V }), "(bvurem s0 s1)", "unsigned remainder");
    CheckEqual(Translate(OpKind::Plus, { U, V }), "(bvadd s0 s1)", "bit-vector addition");
    CheckEqual(Translate(OpKind::NotEqual, { U, V }), "(distinct s0 s1)", "bit-vector disequality");
    CheckEqual(Translate(OpKind::Shr, { X, Y }), "(bvashr s0 s1)", "arithmetic shift");
    CheckEqual(Translate(OpKind::Shr, { U, V }), "(bvlshr s0 s1)", "logical shift");
    CheckEqual(Translate(OpKind::Abs, { X }), "(ite (bvslt s0 #x00) (bvneg s0) s0)",
               "absolute value of a signed bit-vector");
    CheckEqual(Translate(OpKind::Abs, { U }), "s0", "absolute value of a word");

    SMTConfig Config;
    CheckEqual(TranslateWith(Config, Operator::MkExtract(3, 0), { U }), "((_ extract 3 0) s0)",
               "bit extraction");
    CheckEqual(TranslateWith(Config, Operator::MkRol(2), { U }), "((_ rotate_left 2) s0)",
               "rotation");

    SV I(MkUnboundedKind(), 0), J(MkUnboundedKind(), 1);
    CheckEqual(Translate(OpKind::Quot, { I, J }), "(div s0 s1)", "integer division");
    CheckEqual(Translate(OpKind::Rem, { I, J }), "(mod s0 s1)", "integer remainder");
    CheckEqual(Translate(OpKind::Abs, { I }), "(abs s0)", "integer absolute value");

    SV R(MkRealKind(), 0), S(MkRealKind(), 1);
    CheckEqual(Translate(OpKind::Quot, { R, S }), "(/ s0 s1)", "real division");

    SV F(MkFloatKind(), 0), G(MkFloatKind(), 1);
    CheckEqual(Translate(OpKind::Plus, { F, G }), "(fp.add roundNearestTiesToEven s0 s1)",
               "floating point arithmetic takes the rounding mode");
    CheckEqual(Translate(OpKind::NotEqual, { F, G }), "(not (fp.eq s0 s1))",
               "no distinct on floats");
    CheckEqual(Translate(OpKind::Quot, { F, G }), "(fp.div roundNearestTiesToEven s0 s1)",
               "floating point division");
    CheckEqual(TranslateWith(Config, Operator::MkFPOp(FPOpKind::Sqrt), { SV(MkRoundingModeKind(), 2), F }),
               "(fp.sqrt s2 s0)", "explicit floating point operators");

    SV P(MkRationalKind(), 0), Q(MkRationalKind(), 1);
    CheckEqual(Translate(OpKind::GreaterThan, { P, Q }), "(sbv.rat.lt s1 s0)",
               "rational comparisons swap their operands");
    CheckEqual(Translate(OpKind::Plus, { P, Q }), "(sbv.rat.plus s0 s1)", "rational addition");

    SV A(MkBoolKind(), 0), B(MkBoolKind(), 1), C(MkBoolKind(), 2);
    CheckEqual(Translate(OpKind::LessThan, { A, B }), "(and (not s0) s1)", "false is below true");
    CheckEqual(Translate(OpKind::GreaterEq, { A, B }), "(or (not s1) s0)",
               "Boolean comparisons swap their operands");
    CheckEqual(Translate(OpKind::Ite, { A, B, C }), "(ite s0 s1 s2)", "if-then-else");
    CheckEqual(Translate(OpKind::XOr, { A, B }), "(xor s0 s1)", "Boolean exclusive or");
    CheckEqual(Translate(OpKind::Equal, { A, B }), "(= s0 s1)", "Boolean equality");

    SMTConfig NoDistinct((SolverCapabilities()));
    NoDistinct.Capabilities.SupportsDistinct = false;
    SV W(MkUnboundedKind(), 2);
    CheckEqual(TranslateWith(NoDistinct, Operator::MkSimple(OpKind::NotEqual), { I, J, W }),
               "(and (not (= s0 s1)) (not (= s0 s2)) (not (= s1 s2)))",
               "pairwise disequalities without distinct");

    SV T(MkStringKind(), 0), T2(MkStringKind(), 1);
    CheckEqual(Translate(OpKind::GreaterEq, { T, T2 }), "(str.<= s1 s0)",
               "strings are ordered lexicographically");
}

static inline void RunUserSortTests()
{
    cout << "Running user sort tests" << endl;

    auto Colors = MkEnumKind("Color", { "Red", "Green" });
    CheckEqual(Translate(OpKind::LessThan, { SV(Colors, 0), SV(Colors, 1) }),
               "(< (Color_constrIndex s0) (Color_constrIndex s1))",
               "enumerations are ordered by constructor position");

    auto Opaque = MkUserSortKind("Q");
    CheckEqual(Translate(OpKind::Equal, { SV(Opaque, 0), SV(Opaque, 1) }), "(= s0 s1)",
               "opaque sorts have equality");
    ExpectThrows<SMTGError>([&] () { Translate(OpKind::LessThan, { SV(Opaque, 0), SV(Opaque, 1) }); },
                            "uninterpreted kinds only support equality",
                            "opaque sorts have no order");
}

static inline void RunSpecialOpTests()
{
    cout << "Running tests on special operators" << endl;

    SMTConfig Config;
    auto Word8 = MkBoundedKind(false, 8);
    auto Int8 = MkBoundedKind(true, 8);
    SV Idx(Word8, 1), Dflt(Word8, 2);

    CheckEqual(TranslateWith(Config, Operator::MkLkUp(0, Word8, Word8, 3, Idx, Dflt), { Idx }),
               "(ite (bvule #x03 s1) s2 (table0 s1))", "lookups past the end are checked");
    CheckEqual(TranslateWith(Config, Operator::MkLkUp(0, Word8, Word8, 256, Idx, Dflt), { Idx }),
               "(table0 s1)", "lookups covering the index domain need no check");
    SV SIdx(Int8, 1);
    CheckEqual(TranslateWith(Config, Operator::MkLkUp(4, Int8, Word8, 3, SIdx, Dflt), { SIdx }),
               "(ite (or (bvslt s1 #x00) (bvsle #x03 s1)) s2 (table4 s1))",
               "signed lookups also check for negative indices");

    TableMapT Tables = { { 0, "table0 s7" } };
    ExprTranslator WithTables(Config, EmptySkolems, Tables, EmptyFunctions);
    CheckEqual(WithTables.Translate(OpNode(Operator::MkLkUp(0, Word8, Word8, 256, Idx, Dflt),
                                           { Idx })),
               "(table0 s7 s1)", "skolemized tables take the universals");

    CheckEqual(TranslateWith(Config, Operator::MkOverflowOp(OvOpKind::SMulNoOverflow),
                             { SV(Int8, 0), SV(Int8, 1) }),
               "(not (bvsmul_noovfl s0 s1))", "overflow checks are negated");

    SV A(MkBoolKind(), 0), B(MkBoolKind(), 1), C(MkBoolKind(), 2);
    CheckEqual(TranslateWith(Config, Operator::MkPBOp(PBOpKind::AtMost, vector<i64>(), 2),
                             { A, B, C }),
               "((_ at-most 2) s0 s1 s2)", "native pseudo-Booleans");
    CheckEqual(HandlePB(PBOpKind::Le, { 1, 2 }, 3, { "s0", "s1" }), "((_ pble 3 1 2) s0 s1)",
               "weighted pseudo-Booleans");
    CheckEqual(HandlePB(PBOpKind::Exactly, vector<i64>(), 1, { "s0", "s1" }),
               "((_ pbeq 1 1 1) s0 s1)", "exact pseudo-Booleans");

    SMTConfig NoPB((GetSolverCapabilities("boolector")));
    CheckEqual(TranslateWith(NoPB, Operator::MkPBOp(PBOpKind::Exactly, vector<i64>(), 1), { A, B }),
               "(=  (+ (ite s0 1 0) (ite s1 1 0)) 1)",
               "pseudo-Booleans as arithmetic");
    CheckEqual(ReducePB(PBOpKind::Ge, { 3, 4 }, 5, { "s0", "s1" }),
               "(>= (+ (ite s0 3 0) (ite s1 4 0)) 5)", "weighted reduction");

    auto Str = MkStringKind();
    CheckEqual(TranslateWith(Config, Operator::MkStrInRe(RegExp::MkKStar(RegExp::MkLiteral("ab"))),
                             { SV(Str, 0) }),
               "(str.in_re s0 (re.* (str.to_re \"ab\")))", "regular expression membership");
    CheckEqual(RegExp::MkRange('a', 0xe9).ToSMTLib(), "(re.range \"a\" \"\\u{e9}\")",
               "ranges are bounded by code points");
    CheckEqual(RegExp::MkLiteral("\xc3\xa9t\xc3\xa9").ToSMTLib(),
               "(str.to_re \"\\u{e9}t\\u{e9}\")", "multibyte literals");
    CheckEqual(TranslateWith(Config, Operator::MkStrOp(StrOpKind::Len), { SV(Str, 0) }),
               "(str.len s0)", "string length");

    auto Set8 = MkSetKind(Word8);
    CheckEqual(TranslateWith(Config, Operator::MkSetOp(SetOpKind::Member),
                             { SV(Word8, 0), SV(Set8, 1) }),
               "(select s1 s0)", "set membership");
    CheckEqual(TranslateWith(Config, Operator::MkSetOp(SetOpKind::Insert),
                             { SV(Word8, 0), SV(Set8, 1) }),
               "(store s1 s0 true)", "set insertion");

    CheckEqual(TranslateWith(Config, Operator::MkTupleConstructor(2),
                             { SV(Word8, 0), SV(MkBoolKind(), 1) }),
               "((as mkSBVTuple2 (SBVTuple2 (_ BitVec 8) Bool)) s0 s1)", "tuple construction");
    CheckEqual(TranslateWith(Config, Operator::MkTupleAccess(2, 2),
                             { SV(MkTupleKind({ Word8, MkBoolKind() }), 3) }),
               "(proj_2_SBVTuple2 s3)", "tuple projection");
    CheckEqual(TranslateWith(Config, Operator::MkMaybeConstructor(Word8, false), vector<SV>()),
               "(as nothing_SBVMaybe (SBVMaybe (_ BitVec 8)))", "empty optionals");
    CheckEqual(TranslateWith(Config, Operator::MkMaybeIs(Word8, true),
                             { SV(MkMaybeKind(Word8), 4) }),
               "((_ is (just_SBVMaybe ((_ BitVec 8)) (SBVMaybe (_ BitVec 8)))) s4)",
               "optional testers");

    FunctionMapT Functions;
    Functions[Str] = "sbv.reverse_0";
    ExprTranslator WithFunctions(Config, EmptySkolems, EmptyTables, Functions);
    CheckEqual(WithFunctions.Translate(OpNode(Operator::MkSeqReverse(Str), { SV(Str, 0) })),
               "(sbv.reverse_0 s0)", "reversal goes through its helper function");
    ExpectThrows<InternalError>([&] () { TranslateWith(Config, Operator::MkSeqReverse(Str),
                                                       { SV(Str, 0) }); },
                                "No helper function", "reversal needs its helper");
}

static inline void RunCastTests()
{
    cout << "Running cast tests" << endl;

    auto Word8 = MkBoundedKind(false, 8);
    auto Int8 = MkBoundedKind(true, 8);
    auto Int = MkUnboundedKind();

    CheckEqual(HandleKindCast(true, Word8, MkBoundedKind(false, 16), "s0"),
               "((_ zero_extend 8) s0)", "widening a word");
    CheckEqual(HandleKindCast(true, Int8, MkBoundedKind(true, 16), "s0"),
               "((_ sign_extend 8) s0)", "widening a signed bit-vector");
    CheckEqual(HandleKindCast(true, MkBoundedKind(false, 16), Word8, "s0"),
               "((_ extract 7 0) s0)", "narrowing");
    CheckEqual(HandleKindCast(true, Word8, Int, "s0"), "(bv2nat s0)", "words to integers");
    CheckEqual(HandleKindCast(true, Int8, Int, "s0"),
               "(ite (= ((_ extract 7 7) s0) #b0) (bv2nat ((_ extract 6 0) s0)) "
               "(- (bv2nat ((_ extract 6 0) s0)) 128))",
               "two's complement to integers");
    CheckEqual(HandleKindCast(true, Int, Word8, "s0"), "((_ int2bv 8) s0)",
               "integers to bit-vectors");
    CheckEqual(HandleKindCast(false, Int, MkBoundedKind(false, 2), "s0"),
               "(let ((__a (mod s0 4))) (let ((__a0 (ite (= (mod __a 2) 0) #b0 #b1)) "
               "(__a1 (ite (= (mod (div __a 2) 2) 0) #b0 #b1))) (concat __a1 __a0)))",
               "integers to bit-vectors without int2bv");
    CheckEqual(HandleKindCast(true, Int, MkRealKind(), "s0"), "(to_real s0)",
               "integers to reals");
    CheckEqual(HandleKindCast(true, MkFloatKind(), MkDoubleKind(), "s0"),
               "((_ to_fp 11 53) roundNearestTiesToEven s0)", "floats to doubles");
    CheckEqual(HandleKindCast(true, MkDoubleKind(), Int, "s0"), "(to_int (fp.to_real s0))",
               "doubles to integers");
    CheckEqual(HandleFPCast(Word8, MkFloatKind(), "roundTowardZero", "s0"),
               "((_ to_fp_unsigned 8 24) roundTowardZero s0)", "words to floats");
    CheckEqual(HandleFPCast(MkFloatKind(), Int8, "roundTowardZero", "s0"),
               "((_ fp.to_sbv 8) roundTowardZero s0)", "floats to signed bit-vectors");
    CheckEqual(HandleKindCast(true, Word8, Word8, "s0"), "s0", "identity casts vanish");
}

static inline void RunDefinitionTests()
{
    cout << "Running definition tests" << endl;

    SMTConfig Config;
    auto Int8 = MkBoundedKind(true, 8);
    SV X(Int8, 0), Y(Int8, 1), Sk(Int8, 5);

    SkolemMapT Skolems = { { Sk, { X, Y } } };
    CheckEqual(CvtSV(Skolems, Sk), "(s5 s0 s1)", "skolemized inputs are applied");
    CheckEqual(CvtSV(Skolems, X), "s0", "other values are named");

    ExprTranslator Translator(Config, Skolems, EmptyTables, EmptyFunctions);
    auto Lt = make_pair(SV(MkBoolKind(), 3),
                        OpNode(Operator::MkSimple(OpKind::LessThan), { X, Sk }));
    CheckLines(Translator.DeclDef(Lt), { "(define-fun s3 () Bool (bvslt s0 (s5 s0 s1)))" },
               "definitions of assignments");
    CheckEqual(Translator.MkLet(Lt), "(let ((s3 (bvslt s0 (s5 s0 s1))))",
               "let bindings of assignments");

    auto Labelled = make_pair(SV(MkBoolKind(), 4),
                              OpNode(Operator::MkLabel("check"), { SV(MkBoolKind(), 3) }));
    CheckLines(Translator.DeclDef(Labelled), { "(define-fun s4 () Bool s3) ; check" },
               "labels become comments");
    CheckEqual(Translator.MkLet(Labelled), "(let ((s4 s3)) ; check", "labelled let bindings");
}

int main()
{
    RunArithmeticTests();
    RunUserSortTests();
    RunSpecialOpTests();
    RunCastTests();
    RunDefinitionTests();
    cout << "All expression translation tests passed" << endl;
    return 0;
}

//
// ExprTests.cpp ends here
