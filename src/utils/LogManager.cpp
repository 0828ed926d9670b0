// LogManager.cpp ---
//
// Filename: LogManager.cpp
// Author: Abhishek Udupa
// Created: Wed Jul  7 14:52:29 2014 (-0400)
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

#include <stdlib.h>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/join.hpp>

#include "LogManager.hpp"

namespace SMTG {
    namespace Logging {

        const map<string, string> LogManager::LogOptionDescriptions =
            {
                {
                    "Compiler.Features",
                    (string)"Print the feature flags detected on the kinds and " +
                    "operations of each problem."
                },
                {
                    "Compiler.Logic",
                    "Print the logic chosen for each problem, along with the reason."
                },
                {
                    "Compiler.Partition",
                    (string)"Print the classification of tables and arrays into ones " +
                    "that are resolved from constants and ones that are deferred."
                },
                {
                    "Compiler.Script",
                    "Print every script generated by the batch compiler."
                },
                {
                    "Compiler.Incremental",
                    "Print every delta generated by the incremental compiler."
                },
                {
                    "Z3Session.Commands",
                    (string)"Print the commands sent to the in-process Z3 session " +
                    "along with the responses received."
                },
                {
                    "SMTG.Minimal",
                    (string)"Bare minimal trace output from the example drivers, " +
                    "serving only to indicate progress. Disabling this will cause NOTHING " +
                    "to ever be printed on the trace stream by the SMTG libraries. This " +
                    "is option is always enabled, unless disabled by SMTG.None below. " +
                    "Further, this option is enabled, even if the SMTG libraries have been " +
                    "built without -DSMTG_ENABLE_TRACING_ set."
                },
                {
                    "SMTG.None",
                    (string)"Turns off ALL tracing options (including SMTG.Minimal)."
                },
                {
                    "SMTG.All",
                    (string)"Turns ON ALL tracing options."
                }
            };

        unordered_set<string>& LogManager::EnabledLogOptions()
        {
            static unordered_set<string> EnabledLogOptions_;
            return EnabledLogOptions_;
        }

        ostream*& LogManager::LogStream()
        {
            static ostream* LogStream_ = nullptr;
            return LogStream_;
        }

        bool& LogManager::NoLoggingEnabled()
        {
            static bool NoLoggingEnabled_ = false;
            return NoLoggingEnabled_;
        }

        LogManager::LogManager()
        {
            // Nothing here
        }

        // The extension of the compressed file is appended
        // unless it is already present
        static inline ostream* OpenLogFile(const string& FileName,
                                           LogFileCompressionTechniqueT Technique)
        {
            auto Retval = new boost::iostreams::filtering_ostream();
            auto ActualName = FileName;
            auto OpenFlags = ios_base::out | ios_base::binary;

            switch (Technique) {
            case LogFileCompressionTechniqueT::COMPRESS_BZIP2:
                Retval->push(boost::iostreams::bzip2_compressor(9));
                if (!boost::algorithm::ends_with(ActualName, ".bz2")) {
                    ActualName += ".bz2";
                }
                break;
            case LogFileCompressionTechniqueT::COMPRESS_GZIP:
                Retval->push(boost::iostreams::gzip_compressor(9));
                if (!boost::algorithm::ends_with(ActualName, ".gz")) {
                    ActualName += ".gz";
                }
                break;
            default:
                OpenFlags = ios_base::out;
                break;
            }

            Retval->push(boost::iostreams::file_sink(ActualName, OpenFlags));
            return Retval;
        }

        void LogManager::Initialize(const string& LogStreamName,
                                    LogFileCompressionTechniqueT LogCompressionTechnique)
        {
            Finalize();

            if (LogStreamName == "") {
                LogStream() = &std::cout;
            } else {
                LogStream() = OpenLogFile(LogStreamName, LogCompressionTechnique);
            }
        }

        void LogManager::Finalize()
        {
            if (LogStream() != nullptr && LogStream() != &cout) {
                // popping the chain flushes the compressors and closes the sink
                auto FileStream = dynamic_cast<boost::iostreams::filtering_ostream*>(LogStream());
                FileStream->reset();
                delete FileStream;
            } else if (LogStream() != nullptr) {
                LogStream()->flush();
            }
            LogStream() = nullptr;
            EnabledLogOptions().clear();
            NoLoggingEnabled() = false;
        }

        ostream& LogManager::GetLogStream()
        {
            if (LogStream() == nullptr) {
                return cout;
            }
            return *(LogStream());
        }

        // Options are named <Component>.<Detail>
        static inline string GetComponent(const string& OptionName)
        {
            return OptionName.substr(0, OptionName.find('.'));
        }

        vector<string> LogManager::ResolveOptionName(const string& OptionName)
        {
            vector<string> Retval;
            if (LogOptionDescriptions.find(OptionName) != LogOptionDescriptions.end()) {
                Retval.push_back(OptionName);
                return Retval;
            }
            // a bare component name stands for all of its options
            if (OptionName.find('.') == string::npos && OptionName != "SMTG") {
                for (auto const& OptionDesc : LogOptionDescriptions) {
                    if (GetComponent(OptionDesc.first) == OptionName) {
                        Retval.push_back(OptionDesc.first);
                    }
                }
            }
            if (Retval.size() == 0) {
                vector<string> Known;
                for (auto const& OptionDesc : LogOptionDescriptions) {
                    Known.push_back(OptionDesc.first);
                }
                throw SMTGError((string)"Log option \"" + OptionName + "\" is not " +
                                "a recognized log option or component. Known options: " +
                                boost::algorithm::join(Known, ", "));
            }
            return Retval;
        }

        void LogManager::EnableLogOption(const string& OptionName)
        {
            auto&& Resolved = ResolveOptionName(OptionName);

            if (OptionName == "SMTG.All") {
                NoLoggingEnabled() = false;
                for (auto const& OptionDesc : LogOptionDescriptions) {
                    if (OptionDesc.first != "SMTG.None") {
                        EnabledLogOptions().insert(OptionDesc.first);
                    }
                }
            } else if (OptionName == "SMTG.None") {
                NoLoggingEnabled() = true;
                EnabledLogOptions().clear();
            } else {
                NoLoggingEnabled() = false;
                EnabledLogOptions().insert(Resolved.begin(), Resolved.end());
            }
        }

        void LogManager::EnableLogOptions(const vector<string>& OptionNames)
        {
            EnableLogOptions(OptionNames.begin(), OptionNames.end());
        }

        void LogManager::DisableLogOption(const string& OptionName)
        {
            for (auto const& Resolved : ResolveOptionName(OptionName)) {
                EnabledLogOptions().erase(Resolved);
            }
        }

        const unordered_set<string>& LogManager::GetEnabledLogOptions()
        {
            return EnabledLogOptions();
        }

        bool LogManager::IsOptionEnabled(const string& OptionName)
        {
            return (!NoLoggingEnabled() && (EnabledLogOptions().find(OptionName) !=
                                            EnabledLogOptions().end()));
        }

        bool LogManager::IsLoggingDisabled()
        {
            return NoLoggingEnabled();
        }

        string LogManager::GetLogOptions()
        {
            ostringstream sstr;
            sstr << "Available logging options (a component name, such as "
                 << "\"Compiler\", enables all of its options):" << endl;
            string Component;
            for (auto const& Option : LogOptionDescriptions) {
                if (GetComponent(Option.first) != Component) {
                    Component = GetComponent(Option.first);
                    sstr << "[" << Component << "]" << endl;
                }
                sstr << "  " << left << setw(22) << setfill(' ') << Option.first
                     << ": " << Option.second << endl;
            }
            return sstr.str();
        }

    } /* end namespace Logging */
} /* end namespace SMTG */

//
// LogManager.cpp ends here
