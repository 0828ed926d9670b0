// LogicSelector.cpp ---
//
// Filename: LogicSelector.cpp
// Author: Abhishek Udupa
// Created: Sun Nov  9 01:58:10 2015 (-0400)
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

#include <tuple>
#include <boost/algorithm/string/join.hpp>

#include "LogicSelector.hpp"
#include "../utils/LogManager.hpp"

namespace SMTG {
    namespace SMTLib {

        using namespace Program;

        LogicSelector::LogicSelector(const ProblemFeatures& Features, const SMTConfig& Config,
                                     QueryContextT Context, bool HasForalls,
                                     bool HasAxioms, bool HasArrays, bool HasUIsOrTables)
            : Features(Features), Config(Config), Context(Context),
              HasForalls(HasForalls), HasAxioms(HasAxioms), HasArrays(HasArrays),
              HasUIsOrTables(HasUIsOrTables)
        {
            // Nothing here
        }

        LogicSelector::LogicSelector(const ProblemFeatures& Features, const SMTConfig& Config,
                                     const ProblemSnapshot& Snapshot)
            : LogicSelector(Features, Config, Snapshot.Context,
                            Snapshot.GetForalls().size() > 0,
                            Snapshot.Axioms.size() > 0,
                            Snapshot.Arrays.size() > 0,
                            Snapshot.Uninterpreteds.size() > 0 || Snapshot.Tables.size() > 0)
        {
            // Nothing here
        }

        LogicSelector::~LogicSelector()
        {
            // Nothing here
        }

        vector<string> LogicSelector::GetUnmetRequirements() const
        {
            auto const& Caps = Config.Capabilities;
            vector<tuple<string, bool, bool>> Checks = {
                make_tuple("data types", Caps.SupportsDataTypes,
                           Features.HasTuples || Features.HasEither || Features.HasMaybe),
                make_tuple("set operations", Caps.SupportsSets, Features.HasSets),
                make_tuple("bit vectors", Caps.SupportsBitVectors, Features.HasBVs)
            };

            vector<string> Retval;
            for (auto const& Check : Checks) {
                if (get<2>(Check) && !get<1>(Check)) {
                    Retval.push_back("***     Given problem requires support for " + get<0>(Check));
                    Retval.push_back("***     But the chosen solver (" + Caps.Name +
                                     ") doesn't support this feature.");
                }
            }
            return Retval;
        }

        string LogicSelector::GetCatchAllReason() const
        {
            vector<pair<bool, string>> Reasons = {
                { Features.HasInteger, "has unbounded values" },
                { Features.HasRational, "has rational values" },
                { Features.HasReal, "has algebraic reals" },
                { Features.TrueUserSorts.size() > 0, "has user-defined sorts" },
                { Features.HasNonBVArrays, "has non-bitvector arrays" },
                { Features.HasTuples, "has tuples" },
                { Features.HasEither, "has either type" },
                { Features.HasMaybe, "has maybe type" },
                { Features.HasSets, "has sets" },
                { Features.HasList, "has lists" },
                { Features.HasChar, "has chars" },
                { Features.HasString, "has strings" },
                { Features.HasRegExp, "has regular expressions" },
                { Features.HasArrayInits, "has array initializers" },
                { Features.HasOverflows, "has overflow checks" }
            };

            for (auto const& Reason : Reasons) {
                if (Reason.first) {
                    return Reason.second;
                }
            }
            return "";
        }

        vector<string> LogicSelector::GetLogicLines() const
        {
            vector<Logic> UserLogics;
            for (auto const& Option : Config.SolverSetOptions) {
                if (Option.IsLogic()) {
                    UserLogics.push_back(Option.GetLogic());
                }
            }

            if (UserLogics.size() > 1) {
                vector<string> Names;
                for (auto const& UserLogic : UserLogics) {
                    Names.push_back(UserLogic.ToString());
                }
                throw SMTGError((string)"\n*** Only one setOption call to 'setLogic' is " +
                                "allowed, found: " + to_string(UserLogics.size()) + "\n***  " +
                                boost::algorithm::join(Names, " ") + "\n");
            }

            vector<string> Retval;
            string Reason;

            if (UserLogics.size() == 1) {
                if (UserLogics[0].IsNone()) {
                    Retval.push_back("; NB. Not setting the logic per user request of Logic_NONE");
                } else {
                    Retval.push_back("(set-logic " + UserLogics[0].GetName() +
                                     ") ; NB. User specified.");
                }
                Reason = "user specified";
            } else {
                auto&& Unmet = GetUnmetRequirements();
                if (Unmet.size() > 0) {
                    vector<string> Lines = {
                        "",
                        "*** SMTG is unable to choose a proper solver configuration:",
                        "***"
                    };
                    Lines.insert(Lines.end(), Unmet.begin(), Unmet.end());
                    Lines.push_back("***");
                    Lines.push_back((string)"*** Please report this as a feature request, " +
                                    "either for SMTG or the backend solver.");
                    throw SMTGError(boost::algorithm::join(Lines, "\n") + "\n");
                }

                auto&& CatchAllReason = GetCatchAllReason();
                if (CatchAllReason != "") {
                    Retval.push_back("(set-logic ALL) ; " + CatchAllReason + ", using catch-all.");
                    Reason = CatchAllReason;
                } else if (Features.HasFP || Features.HasRounding) {
                    if (HasForalls) {
                        Retval.push_back("(set-logic ALL)");
                    } else if (Features.HasBVs) {
                        Retval.push_back("(set-logic QF_FPBV)");
                    } else {
                        Retval.push_back("(set-logic QF_FP)");
                    }
                    Reason = "has floating point values";
                } else if (Context == QueryContextT::External) {
                    Retval.push_back("(set-logic ALL) ; external query, using all logics.");
                    Reason = "external query";
                } else if (Config.Capabilities.SupportsBitVectors) {
                    string Name = (HasForalls || HasAxioms) ? "" : "QF_";
                    if (HasArrays) {
                        Name += "A";
                    }
                    if (HasUIsOrTables) {
                        Name += "UF";
                    }
                    Name += "BV";
                    Retval.push_back("(set-logic " + Name + ")");
                    Reason = "bit-vector problem";
                } else {
                    Retval.push_back("(set-logic ALL)");
                    Reason = "solver does not support bit vectors";
                }
            }

            SMTG_LOG_FULL("Compiler.Logic",
                          Out_ << "Chosen: " << Retval[0] << endl
                               << "Reason: " << Reason << endl;);
            return Retval;
        }

    } /* end namespace SMTLib */
} /* end namespace SMTG */

//
// LogicSelector.cpp ends here
