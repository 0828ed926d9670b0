// CaseSplit.cpp ---
//
// Filename: CaseSplit.cpp
// Author: Abhishek Udupa
// Created: Tue Oct 18 09:05:35 2015 (-0400)
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

// Case splits over an open Z3 session: each case is pushed
// as an incremental delta, checked and popped. When no case
// holds, the negation of all cases is checked for coverage.

#include "../../src/smtlib/ScriptCompiler.hpp"
#include "../../src/tpinterface/Z3ScriptSession.hpp"

#include "ExampleOptions.hpp"

using namespace SMTG;
using namespace Kinds;
using namespace Program;
using namespace SMTLib;
using namespace TP;

struct CaseT {
    string Name;
    vector<Assignment> Definitions;
    SV Condition;
};

static inline SV Define(vector<Assignment>& Definitions, i32& NextId,
                        const KindRef& Kind, const Operator& Op, const vector<SV>& Args)
{
    SV Retval(Kind, NextId++);
    Definitions.push_back(make_pair(Retval, OpNode(Op, Args)));
    return Retval;
}

static inline bool TryCase(const Z3ScriptSessionRef& Session, const SMTConfig& Config,
                           const ExampleOptionsT& Options, const string& Name,
                           const IncrementalSnapshot& Delta)
{
    auto&& Lines = CompileIncremental(Delta, Config);
    SMTG_LOG_MIN_SHORT(Out_ << "Trying case " << Name << " with "
                            << Lines.size() << " lines" << endl;);
    if (Options.PrintScript) {
        cout << "; case " << Name << endl;
        PrintScript(Lines);
    }
    Session->Send({ "(push 1)" });
    Session->Send(Lines);
    auto Result = Session->CheckSat();
    cout << "Case " << Name << ": " << TPResultToString(Result) << endl;
    if (Result == TPResult::SATISFIABLE) {
        cout << Session->GetModel() << endl;
    }
    Session->Send({ "(pop 1)" });
    return (Result == TPResult::SATISFIABLE);
}

// Returns the name of the first satisfiable case, or the empty
// string if neither a case nor the coverage check is satisfiable
static inline string CaseSplit(const Z3ScriptSessionRef& Session, const SMTConfig& Config,
                               const ExampleOptionsT& Options,
                               const ConstantListT& Constants,
                               const vector<CaseT>& Cases, i32 NextId)
{
    for (auto const& Case : Cases) {
        IncrementalSnapshot Delta;
        Delta.AllConstants = Constants;
        Delta.Assignments = Case.Definitions;
        Delta.Constraints = { Constraint(false, AttributeListT(), Case.Condition) };
        if (TryCase(Session, Config, Options, Case.Name, Delta)) {
            return Case.Name;
        }
    }

    IncrementalSnapshot Coverage;
    Coverage.AllConstants = Constants;
    SV Any = SV::False();
    for (auto const& Case : Cases) {
        Coverage.Assignments.insert(Coverage.Assignments.end(),
                                    Case.Definitions.begin(), Case.Definitions.end());
        if (Any.IsFalse()) {
            Any = Case.Condition;
        } else {
            Any = Define(Coverage.Assignments, NextId, MkBoolKind(),
                         Operator::MkSimple(OpKind::Or), { Any, Case.Condition });
        }
    }
    Coverage.Constraints = { Constraint(false, AttributeListT(), Any, true) };
    if (TryCase(Session, Config, Options, "Coverage", Coverage)) {
        return "Coverage";
    }
    return "";
}

static inline void RunScript(const Z3ScriptSessionRef& Session,
                             const ExampleOptionsT& Options,
                             const vector<string>& Script)
{
    if (Options.PrintScript) {
        PrintScript(Script);
    }
    Session->Send(Script);
}

// x == x + 1 over single precision floats
static inline void FloatCaseSplit(const SMTConfig& Config, const ExampleOptionsT& Options)
{
    auto FloatKind = MkFloatKind();
    auto BoolKind = MkBoolKind();
    SV X(FloatKind, 0), One(FloatKind, 1), Succ(FloatKind, 2), Fixed(BoolKind, 3);

    ProblemSnapshot Snapshot;
    Snapshot.Comments = { "x == x + 1 over floats" };
    Snapshot.Kinds = { BoolKind, FloatKind };
    Snapshot.Inputs = { NamedInput(X, "x") };
    Snapshot.QuantifiedInputs = { QuantifiedInput(false, X) };
    Snapshot.Constants = { { One, CV::MkFloat(1.0f) } };
    Snapshot.Assignments = {
        make_pair(Succ, OpNode(Operator::MkSimple(OpKind::Plus), { X, One })),
        make_pair(Fixed, OpNode(Operator::MkSimple(OpKind::Equal), { X, Succ }))
    };
    Snapshot.Constraints = { Constraint(false, AttributeListT(), Fixed) };
    Snapshot.Goal = SV::True();

    auto&& Script = CompileScript(Snapshot, Config);
    if (!Options.Solve) {
        if (Options.PrintScript) {
            PrintScript(Script);
        }
        return;
    }

    Z3ScriptSessionRef Session(new Z3ScriptSession());
    RunScript(Session, Options, Script);

    i32 NextId = 4;
    vector<CaseT> Cases(5);
    auto FPTest = [&] (vector<Assignment>& Defs, FPOpKind Op) -> SV
        {
            return Define(Defs, NextId, BoolKind, Operator::MkFPOp(Op), { X });
        };
    auto Both = [&] (vector<Assignment>& Defs, const SV& A, const SV& B) -> SV
        {
            return Define(Defs, NextId, BoolKind, Operator::MkSimple(OpKind::And), { A, B });
        };

    Cases[0].Name = "fpIsNegativeZero";
    Cases[0].Condition = Both(Cases[0].Definitions,
                              FPTest(Cases[0].Definitions, FPOpKind::IsZero),
                              FPTest(Cases[0].Definitions, FPOpKind::IsNegative));
    Cases[1].Name = "fpIsPositiveZero";
    Cases[1].Condition = Both(Cases[1].Definitions,
                              FPTest(Cases[1].Definitions, FPOpKind::IsZero),
                              FPTest(Cases[1].Definitions, FPOpKind::IsPositive));
    Cases[2].Name = "fpIsNormal";
    Cases[2].Condition = FPTest(Cases[2].Definitions, FPOpKind::IsNormal);
    Cases[3].Name = "fpIsSubnormal";
    Cases[3].Condition = FPTest(Cases[3].Definitions, FPOpKind::IsSubnormal);

    // neither NaN nor infinite
    Cases[4].Name = "fpIsPoint";
    auto&& NaN = FPTest(Cases[4].Definitions, FPOpKind::IsNaN);
    auto&& Inf = FPTest(Cases[4].Definitions, FPOpKind::IsInfinite);
    auto&& Special = Define(Cases[4].Definitions, NextId, BoolKind,
                            Operator::MkSimple(OpKind::Or), { NaN, Inf });
    Cases[4].Condition = Define(Cases[4].Definitions, NextId, BoolKind,
                                Operator::MkSimple(OpKind::Not), { Special });

    auto&& Found = CaseSplit(Session, Config, Options, Snapshot.Constants, Cases, NextId);
    if (Found == "") {
        throw SMTGError("Cannot find a float x such that x == x + 1");
    }
    cout << "Float case split: " << Found << endl;
}

// x >= 10 over mathematical integers
static inline void IntegerCaseSplit(const SMTConfig& Config, const ExampleOptionsT& Options)
{
    auto IntKind = MkUnboundedKind();
    auto BoolKind = MkBoolKind();
    SV X(IntKind, 0), Ten(IntKind, 1), Zero(IntKind, 2), Eight(IntKind, 3), Big(BoolKind, 4);

    ProblemSnapshot Snapshot;
    Snapshot.Comments = { "x >= 10 over integers" };
    Snapshot.Kinds = { BoolKind, IntKind };
    Snapshot.Inputs = { NamedInput(X, "x") };
    Snapshot.QuantifiedInputs = { QuantifiedInput(false, X) };
    Snapshot.Constants = { { Ten, CV::MkInteger(IntKind, 10) },
                           { Zero, CV::MkInteger(IntKind, 0) },
                           { Eight, CV::MkInteger(IntKind, 8) } };
    Snapshot.Assignments = {
        make_pair(Big, OpNode(Operator::MkSimple(OpKind::GreaterEq), { X, Ten }))
    };
    Snapshot.Constraints = { Constraint(false, AttributeListT(), Big) };
    Snapshot.Goal = SV::True();

    auto&& Script = CompileScript(Snapshot, Config);
    if (!Options.Solve) {
        if (Options.PrintScript) {
            PrintScript(Script);
        }
        return;
    }

    Z3ScriptSessionRef Session(new Z3ScriptSession());
    RunScript(Session, Options, Script);

    i32 NextId = 5;
    vector<CaseT> Cases(2);
    Cases[0].Name = "negative";
    Cases[0].Condition = Define(Cases[0].Definitions, NextId, BoolKind,
                                Operator::MkSimple(OpKind::LessThan), { X, Zero });
    Cases[1].Name = "less than 8";
    Cases[1].Condition = Define(Cases[1].Definitions, NextId, BoolKind,
                                Operator::MkSimple(OpKind::LessThan), { X, Eight });

    auto&& Found = CaseSplit(Session, Config, Options, Snapshot.Constants, Cases, NextId);
    if (Found == "") {
        throw SMTGError("Cannot find an integer x such that x >= 10");
    }
    cout << "Integer case split: " << Found << endl;
}

int main(int argc, char* argv[])
{
    ExampleOptionsT Options;
    ParseOptions(argc, argv, Options);
    SMTGLib::Initialize(OptsToLibOpts(Options));

    SMTConfig Config(GetSolverCapabilities(Options.SolverName));
    FloatCaseSplit(Config, Options);
    IntegerCaseSplit(Config, Options);

    SMTGLib::Finalize();
    return 0;
}

//
// CaseSplit.cpp ends here
