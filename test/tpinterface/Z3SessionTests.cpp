// Z3SessionTests.cpp ---
//
// Filename: Z3SessionTests.cpp
// Author: Abhishek Udupa
// Created: Thu May 16 06:23:15 2014 (-0400)
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
#include "../../src/tpinterface/Z3ScriptSession.hpp"
#include "../../src/utils/LogManager.hpp"
#include "../common/TestUtils.hpp"

using namespace SMTG;
using namespace Kinds;
using namespace Program;
using namespace SMTLib;
using namespace TP;
using namespace Test;

// x :: SInt8 with x < Bound and x > Lower
static inline ProblemSnapshot MkRange(i64 Lower, i64 Bound)
{
    auto Int8 = MkBoundedKind(true, 8);
    SV X(Int8, 0), Lo(Int8, 1), Hi(Int8, 2), Gt(MkBoolKind(), 3), Lt(MkBoolKind(), 4);

    ProblemSnapshot Snapshot;
    Snapshot.Kinds = { MkBoolKind(), Int8 };
    Snapshot.Inputs = { NamedInput(X, "x") };
    Snapshot.QuantifiedInputs = { QuantifiedInput(false, X) };
    Snapshot.Constants = { { Lo, CV::MkInteger(Int8, Lower) },
                           { Hi, CV::MkInteger(Int8, Bound) } };
    Snapshot.Assignments = {
        make_pair(Gt, OpNode(Operator::MkSimple(OpKind::GreaterThan), { X, Lo })),
        make_pair(Lt, OpNode(Operator::MkSimple(OpKind::LessThan), { X, Hi }))
    };
    Snapshot.Constraints = { Constraint(false, AttributeListT(), Gt) };
    Snapshot.Goal = Lt;
    return Snapshot;
}

static inline void RunBatchTests()
{
    cout << "Running batch session tests" << endl;

    SMTConfig Config;
    Z3ScriptSessionRef Session(new Z3ScriptSession());

    Session->Send(CompileScript(MkRange(-5, 10), Config));
    CheckTrue(Session->CheckSat() == TPResult::SATISFIABLE, "a satisfiable range");
    auto&& Model = Session->GetModel();
    CheckTrue(boost::algorithm::contains(Model, "s0"), "the model assigns the input");

    Session->Reset();
    CheckTrue(Session->GetNumCommandsSent() == 0, "a reset session starts over");
    ExpectThrows<SMTGError>([&] () { Session->GetModel(); }, "not satisfiable",
                            "no model without a satisfiable check");

    Session->Send(CompileScript(MkRange(20, 10), Config));
    CheckTrue(Session->CheckSat() == TPResult::UNSATISFIABLE, "an empty range");
    CheckEqual(TPResultToString(Session->GetLastSolveResult()), "unsat",
               "the last result is remembered");

    Session->Reset();
    ExpectThrows<SMTGError>([&] () { Session->Send({ "(assert (bvult undeclared #x00))" }); },
                            "Z3 rejected the script", "malformed scripts are reported");
    ExpectThrows<SMTGError>([] () { ResponseToString(nullptr, "(check-sat)"); },
                            "no response to the script:\n(check-sat)",
                            "missing responses are reported");
    CheckEqual(ResponseToString("sat\n", "(check-sat)"), "sat\n", "responses are copied");
}

static inline void RunQuantifiedTests()
{
    cout << "Running quantified session tests" << endl;

    // forall x. exists y. x <= y is valid over words
    auto Word8 = MkBoundedKind(false, 8);
    SV X(Word8, 0), Y(Word8, 1), Le(MkBoolKind(), 2);
    ProblemSnapshot Snapshot;
    Snapshot.Kinds = { MkBoolKind(), Word8 };
    Snapshot.Inputs = { NamedInput(X, "x"), NamedInput(Y, "y") };
    Snapshot.QuantifiedInputs = { QuantifiedInput(true, X), QuantifiedInput(false, Y, { X }) };
    Snapshot.Assignments = {
        make_pair(Le, OpNode(Operator::MkSimple(OpKind::LessEq), { X, Y }))
    };
    Snapshot.Goal = Le;

    Z3ScriptSessionRef Session(new Z3ScriptSession());
    Session->Send(CompileScript(Snapshot, SMTConfig()));
    CheckTrue(Session->CheckSat() == TPResult::SATISFIABLE,
              "skolemized existentials are satisfiable");
}

static inline void RunIncrementalTests()
{
    cout << "Running incremental session tests" << endl;

    SMTConfig Config;
    auto Int8 = MkBoundedKind(true, 8);
    Z3ScriptSessionRef Session(new Z3ScriptSession());
    Session->Send(CompileScript(MkRange(-5, 10), Config));
    CheckTrue(Session->CheckSat() == TPResult::SATISFIABLE, "the initial problem");

    // now also x == 42
    SV X(Int8, 0), Big(Int8, 5), Eq(MkBoolKind(), 6);
    IncrementalSnapshot Delta;
    Delta.NewConstants = { { Big, CV::MkInteger(Int8, 42) } };
    Delta.AllConstants = Delta.NewConstants;
    Delta.Assignments = {
        make_pair(Eq, OpNode(Operator::MkSimple(OpKind::Equal), { X, Big }))
    };
    Delta.Constraints = { Constraint(false, AttributeListT(), Eq) };

    auto Before = Session->GetNumCommandsSent();
    auto&& Lines = CompileIncremental(Delta, Config);
    Session->Send(Lines);
    CheckTrue(Session->GetNumCommandsSent() == Before + Lines.size(),
              "every line of the delta is sent");
    CheckTrue(Session->CheckSat() == TPResult::UNSATISFIABLE,
              "the delta constrains the open session");
}

static inline void RunParamTests()
{
    cout << "Running session parameter tests" << endl;

    Z3ParamMapT Params = { { "timeout", "60000" } };
    Z3ScriptSessionRef Session(new Z3ScriptSession(Params));
    Session->Send(CompileScript(MkRange(-5, 10), SMTConfig()));
    CheckTrue(Session->CheckSat() == TPResult::SATISFIABLE,
              "a session with a timeout solves the range");

    Session->Reset();
    Session->Send(CompileScript(MkRange(20, 10), SMTConfig()));
    CheckTrue(Session->CheckSat() == TPResult::UNSATISFIABLE,
              "parameters survive a reset");
    CheckTrue(Z3CtxWrapper(Params).GetParams().at("timeout") == "60000",
              "contexts remember their parameters");
    CheckTrue(Z3CtxWrapper::GetVersionString().find('.') != string::npos,
              "the Z3 version is dotted");
}

int main()
{
    Logging::LogManager::Initialize();
    RunBatchTests();
    RunQuantifiedTests();
    RunIncrementalTests();
    RunParamTests();
    Logging::LogManager::Finalize();
    cout << "All Z3 session tests passed" << endl;
    return 0;
}

//
// Z3SessionTests.cpp ends here
