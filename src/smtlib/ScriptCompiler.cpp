// ScriptCompiler.cpp ---
//
// Filename: ScriptCompiler.cpp
// Author: Abhishek Udupa
// Created: Fri Mar 28 10:18:57 2015 (-0400)
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

#include "ScriptCompiler.hpp"
#include "FeatureDetector.hpp"
#include "LogicSelector.hpp"
#include "Declarations.hpp"
#include "ExprTranslator.hpp"
#include "EntityPartition.hpp"
#include "AssertionAssembler.hpp"
#include "../utils/LogManager.hpp"

namespace SMTG {
    namespace SMTLib {

        using namespace Kinds;
        using namespace Program;

        static inline void Append(vector<string>& Lines, const vector<string>& More)
        {
            Lines.insert(Lines.end(), More.begin(), More.end());
        }

        ScriptCompiler::ScriptCompiler(const SMTConfig& Config)
            : Config(Config)
        {
            // Nothing here
        }

        ScriptCompiler::~ScriptCompiler()
        {
            // Nothing here
        }

        vector<string> ScriptCompiler::GetUserSettings() const
        {
            auto const& Options = Config.SolverSetOptions;
            vector<string> Retval;
            for (u32 i = 0; i < Options.size(); ++i) {
                auto const& Option = Options[i];
                if (Option.IsLogic()) {
                    continue;
                }
                if (Option.IsDiagnosticOutput()) {
                    auto it = find_if(Options.begin() + i + 1, Options.end(),
                                      [] (const SMTOption& Later) -> bool
                                      {
                                          return Later.IsDiagnosticOutput();
                                      });
                    if (it != Options.end()) {
                        continue;
                    }
                }
                Retval.push_back(Option.ToSMTLib());
            }
            return Retval;
        }

        vector<string> ScriptCompiler::GetFlattenSettings(const KindSetT& Kinds) const
        {
            for (auto const& Kind : Kinds) {
                if (NeedsFlattening(Kind)) {
                    return Config.Capabilities.FlattenedModelSettings;
                }
            }
            return vector<string>();
        }

        vector<string> ScriptCompiler::Compile(const ProblemSnapshot& Snapshot) const
        {
            Snapshot.CheckWellFormed();

            auto&& Kinds = CloseKindSet(Snapshot.Kinds);
            auto&& Features = DetectFeatures(Snapshot);
            LogicSelector Selector(Features, Config, Snapshot);
            // the logic is chosen before anything is emitted, so
            // that configuration errors produce no output
            auto&& LogicLines = Selector.GetLogicLines();

            auto&& Foralls = Snapshot.GetForalls();
            string ForallArgs;
            for (auto const& Forall : Foralls) {
                ForallArgs += " " + Forall.ToString();
            }

            SkolemMapT SkolemMap;
            for (auto const& Input : Snapshot.QuantifiedInputs) {
                if (!Input.IsUniversal && Input.Dependencies.size() > 0) {
                    SkolemMap[Input.Var] = Input.Dependencies;
                }
            }

            vector<TableData> ConstTables;
            vector<TableData> SkolemTables;
            for (auto const& Table : Snapshot.Tables) {
                auto&& Data = GenTableData(Config, SkolemMap, ForallArgs,
                                           Snapshot.Constants, Table);
                if (Data.IsConstant) {
                    ConstTables.push_back(Data);
                } else {
                    SkolemTables.push_back(Data);
                }
            }

            TableMapT TableMap;
            for (auto const& Data : ConstTables) {
                TableMap[Data.Table.TableId] = "table" + to_string(Data.Table.TableId);
            }
            for (auto const& Data : SkolemTables) {
                TableMap[Data.Table.TableId] = "table" + to_string(Data.Table.TableId) +
                    ForallArgs;
            }

            FunctionMapT FunctionMap;
            for (u32 i = 0; i < Features.ReversedKinds.size(); ++i) {
                FunctionMap[Features.ReversedKinds[i]] = "sbv.reverse_" + to_string(i);
            }

            vector<string> DelayedEqualities;
            for (auto const& Data : SkolemTables) {
                Append(DelayedEqualities, Data.Equalities);
            }

            vector<ArrayDecl> ArrayDecls;
            for (auto const& Array : Snapshot.Arrays) {
                ArrayDecls.push_back(DeclArray(Config, Foralls.size() > 0,
                                               Snapshot.Constants, SkolemMap, Array));
            }

            // assignments created before the first universal can be
            // defined at the top level
            auto PostBegin = Snapshot.Assignments.end();
            if (Foralls.size() > 0) {
                auto FirstForall = min_element(Foralls.begin(), Foralls.end())->GetNodeId();
                PostBegin = find_if(Snapshot.Assignments.begin(), Snapshot.Assignments.end(),
                                    [&] (const Assignment& Asgn) -> bool
                                    {
                                        return Asgn.first.GetNodeId() >= FirstForall;
                                    });
            }
            vector<Assignment> PreAssigns(Snapshot.Assignments.begin(), PostBegin);
            vector<Assignment> PostAssigns(PostBegin, Snapshot.Assignments.end());

            ExprTranslator Translator(Config, SkolemMap, TableMap, FunctionMap);
            AssertionAssembler Assembler(SkolemMap, Foralls, PostAssigns.size(),
                                         DelayedEqualities.size() > 0);
            // assembled before emission, for the same reason as the logic
            auto&& FinalAssert = Assembler.Assemble(Snapshot.Constraints, Snapshot.Goal,
                                                    Snapshot.IsSat);

            map<i64, string> UserNames;
            for (auto const& Input : Snapshot.Inputs) {
                UserNames[Input.Var.GetNodeId()] = Input.UserName;
            }

            vector<string> Retval;
            for (auto const& Comment : Snapshot.Comments) {
                Retval.push_back("; " + Comment);
            }
            Append(Retval, GetUserSettings());
            Retval.push_back("(set-option :produce-models true)");
            Append(Retval, GetFlattenSettings(Kinds));
            Append(Retval, LogicLines);

            Retval.push_back("; --- uninterpreted sorts ---");
            for (auto const& Sort : Features.UserSorts) {
                Append(Retval, DeclSort(Sort));
            }
            Retval.push_back("; --- tuples ---");
            for (auto Arity : Features.TupleArities) {
                Append(Retval, DeclTuple(Arity));
            }
            Retval.push_back("; --- sums ---");
            if (Features.HasEither) {
                Append(Retval, DeclSum());
            }
            if (Features.HasMaybe) {
                Append(Retval, DeclMaybe());
            }
            if (Features.HasRational) {
                Append(Retval, DeclRationals());
            }

            Retval.push_back("; --- literal constants ---");
            for (auto const& Const : Snapshot.Constants) {
                Append(Retval, DeclConst(Config, Const.first, Const.second));
            }

            Retval.push_back("; --- skolem constants ---");
            for (auto const& Input : Snapshot.QuantifiedInputs) {
                if (Input.IsUniversal) {
                    continue;
                }
                vector<KindRef> Signature;
                for (auto const& Dep : Input.Dependencies) {
                    Signature.push_back(Dep.GetKind());
                }
                Signature.push_back(Input.Var.GetKind());

                string Comment;
                auto it = UserNames.find(Input.Var.GetNodeId());
                if (it != UserNames.end() && it->second != Input.Var.ToString()) {
                    Comment = "tracks user variable \"" + it->second + "\"";
                }
                Append(Retval, DeclareFun(Input.Var, Signature, Comment));
            }

            if (Snapshot.TrackerVars.size() > 0) {
                Retval.push_back("; --- optimization tracker variables ---");
            }
            for (auto const& Tracker : Snapshot.TrackerVars) {
                Append(Retval, DeclareFun(Tracker.Var, { Tracker.Var.GetKind() },
                                          "tracks " + Tracker.UserName));
            }

            Retval.push_back("; --- constant tables ---");
            for (auto const& Data : ConstTables) {
                Append(Retval, ConstTable(Data));
            }
            Retval.push_back("; --- skolemized tables ---");
            for (auto const& Data : SkolemTables) {
                Retval.push_back(SkolemTable(Foralls, Data.Table));
            }

            Retval.push_back("; --- arrays ---");
            for (auto const& Decl : ArrayDecls) {
                Append(Retval, Decl.Constants);
            }

            Retval.push_back("; --- uninterpreted constants ---");
            for (auto const& Symbol : Snapshot.Uninterpreteds) {
                Append(Retval, DeclUI(Symbol));
            }

            if (FunctionMap.size() > 0) {
                Retval.push_back("; --- SBV Function definitions");
            }
            for (auto const& KindName : FunctionMap) {
                Append(Retval, DeclSBVFunc(KindName.first, KindName.second));
            }

            Retval.push_back("; --- user given axioms ---");
            for (auto const& TheAxiom : Snapshot.Axioms) {
                Append(Retval, DeclAx(TheAxiom));
            }

            Retval.push_back("; --- preQuantifier assignments ---");
            for (auto const& Asgn : PreAssigns) {
                Append(Retval, Translator.DeclDef(Asgn));
            }
            Retval.push_back("; --- arrayDelayeds ---");
            for (auto const& Decl : ArrayDecls) {
                Append(Retval, Decl.Delayeds);
            }
            Retval.push_back("; --- arraySetups ---");
            for (auto const& Decl : ArrayDecls) {
                Append(Retval, Decl.Setups);
            }

            Retval.push_back("; --- formula ---");
            const string LetShift(12, ' ');
            if (Foralls.size() > 0) {
                vector<string> Binders;
                for (auto const& Forall : Foralls) {
                    Binders.push_back("(" + Forall.ToString() + " " +
                                      Forall.GetKind()->ToSMTType() + ")");
                }
                Retval.push_back("(assert (forall (" +
                                 boost::algorithm::join(Binders, "\n" + string(17, ' ')) + ")");
            }

            Retval.push_back("; --- postQuantifier assignments ---");
            for (auto const& Asgn : PostAssigns) {
                Retval.push_back(LetShift + Translator.MkLet(Asgn));
            }

            Retval.push_back("; --- delayedEqualities ---");
            for (u32 i = 0; i < DelayedEqualities.size(); ++i) {
                if (Foralls.size() == 0) {
                    Retval.push_back("(assert " + DelayedEqualities[i] + ")");
                } else if (i == 0) {
                    Retval.push_back(LetShift + "(and " + DelayedEqualities[i]);
                } else {
                    Retval.push_back(LetShift + string(5, ' ') + DelayedEqualities[i]);
                }
            }

            Retval.push_back("; -- finalAssert ---");
            Append(Retval, FinalAssert);

            SMTG_LOG_FULL("Compiler.Script",
                          Out_ << "Script for problem with " << Snapshot.Assignments.size()
                               << " assignments (" << PreAssigns.size() << " before the "
                               << "universals):" << endl;
                          for (auto const& Line : Retval) {
                              Out_ << Line << endl;
                          });
            return Retval;
        }

        vector<string> ScriptCompiler::CompileIncremental(const IncrementalSnapshot& Delta) const
        {
            auto&& NewKinds = CloseKindSet(Delta.NewKinds);
            auto&& Features = DetectFeatures(NewKinds, Delta.Assignments, Delta.Arrays);

            // no quantifiers in a session, and no new helper functions
            SkolemMapT SkolemMap;
            FunctionMapT FunctionMap;

            vector<TableData> Tables;
            TableMapT TableMap;
            for (auto const& Table : Delta.Tables) {
                Tables.push_back(GenTableData(Config, SkolemMap, "", Delta.AllConstants, Table));
                TableMap[Table.TableId] = "table" + to_string(Table.TableId);
            }

            vector<ArrayDecl> ArrayDecls;
            for (auto const& Array : Delta.Arrays) {
                ArrayDecls.push_back(DeclArray(Config, false, Delta.AllConstants,
                                               SkolemMap, Array));
            }

            ExprTranslator Translator(Config, SkolemMap, TableMap, FunctionMap);

            vector<string> Retval = GetFlattenSettings(NewKinds);
            for (auto const& Sort : Features.UserSorts) {
                Append(Retval, DeclSort(Sort));
            }
            for (auto Arity : Features.TupleArities) {
                Append(Retval, DeclTuple(Arity));
            }
            if (Features.HasEither) {
                Append(Retval, DeclSum());
            }
            if (Features.HasMaybe) {
                Append(Retval, DeclMaybe());
            }
            if (Features.HasRational) {
                Append(Retval, DeclRationals());
            }

            for (auto const& Const : Delta.NewConstants) {
                Append(Retval, DeclConst(Config, Const.first, Const.second));
            }
            for (auto const& Input : Delta.NewInputs) {
                Append(Retval, DeclareFun(Input.Var, { Input.Var.GetKind() }));
            }
            for (auto const& Decl : ArrayDecls) {
                Append(Retval, Decl.Constants);
            }
            for (auto const& Symbol : Delta.Uninterpreteds) {
                Append(Retval, DeclUI(Symbol));
            }
            for (auto const& Data : Tables) {
                Retval.push_back(ConstTableDecl(Data.Table));
            }

            for (auto const& Asgn : Delta.Assignments) {
                Append(Retval, Translator.DeclDef(Asgn));
            }

            for (auto const& Decl : ArrayDecls) {
                Append(Retval, Decl.Delayeds);
            }
            for (auto const& Data : Tables) {
                Append(Retval, ConstTableInits(Data));
            }
            for (auto const& Decl : ArrayDecls) {
                Append(Retval, Decl.Setups);
            }

            for (auto const& Cstr : Delta.Constraints) {
                string Literal = CvtSV(SkolemMap, Cstr.Literal);
                if (Cstr.Negated) {
                    Literal = "(not " + Literal + ")";
                }
                Retval.push_back((string)"(assert" + (Cstr.IsSoft ? "-soft " : " ") +
                                 AddAnnotations(Cstr.Attributes, Literal) + ")");
            }

            SMTG_LOG_FULL("Compiler.Incremental",
                          Out_ << "Delta with " << Delta.NewKinds.size() << " new kinds and "
                               << Delta.Assignments.size() << " assignments:" << endl;
                          for (auto const& Line : Retval) {
                              Out_ << Line << endl;
                          });
            return Retval;
        }

        vector<string> CompileScript(const ProblemSnapshot& Snapshot, const SMTConfig& Config)
        {
            ScriptCompiler Compiler(Config);
            return Compiler.Compile(Snapshot);
        }

        vector<string> CompileIncremental(const IncrementalSnapshot& Delta, const SMTConfig& Config)
        {
            ScriptCompiler Compiler(Config);
            return Compiler.CompileIncremental(Delta);
        }

    } /* end namespace SMTLib */
} /* end namespace SMTG */

//
// ScriptCompiler.cpp ends here
