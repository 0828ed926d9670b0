// SMTGLib.cpp ---
//
// Filename: SMTGLib.cpp
// Author: Abhishek Udupa
// Created: Sun Dec  3 11:02:33 2014 (-0400)
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

#include "../utils/LogManager.hpp"

#include "SMTGLib.hpp"

namespace SMTG {

    SMTGLibOptionsT::SMTGLibOptionsT()
        : LogFileName(""),
          LogCompressionTechnique(LogFileCompressionTechniqueT::COMPRESS_NONE),
          LoggingOptions()
    {
        // Nothing here
    }

    SMTGLibOptionsT::~SMTGLibOptionsT()
    {
        // Nothing here
    }

    SMTGLibOptionsT::SMTGLibOptionsT(const SMTGLibOptionsT& Other)
        : LogFileName(Other.LogFileName),
          LogCompressionTechnique(Other.LogCompressionTechnique),
          LoggingOptions(Other.LoggingOptions)
    {
        // Nothing here
    }

    SMTGLibOptionsT& SMTGLibOptionsT::operator = (const SMTGLibOptionsT& Other)
    {
        if (&Other == this) {
            return *this;
        }
        LogFileName = Other.LogFileName;
        LogCompressionTechnique = Other.LogCompressionTechnique;
        LoggingOptions = Other.LoggingOptions;
        return *this;
    }

    SMTGLibOptionsT& SMTGLib::SMTGLibOptions()
    {
        static SMTGLibOptionsT SMTGLibOptions_;
        return SMTGLibOptions_;
    }

    SMTGLib::SMTGLib()
    {
        // Nothing here
    }

    void SMTGLib::Initialize()
    {
        SMTGLibOptions() = SMTGLibOptionsT();
        Logging::LogManager::Initialize();
    }

    void SMTGLib::Initialize(const SMTGLibOptionsT& LibOptions)
    {
        SMTGLibOptions() = LibOptions;
        Logging::LogManager::Initialize(SMTGLibOptions().LogFileName,
                                        SMTGLibOptions().LogCompressionTechnique);
        Logging::LogManager::EnableLogOptions(SMTGLibOptions().LoggingOptions.begin(),
                                              SMTGLibOptions().LoggingOptions.end());
    }

    void SMTGLib::Finalize()
    {
        Logging::LogManager::Finalize();
    }

    const SMTGLibOptionsT& SMTGLib::GetOptions()
    {
        return SMTGLibOptions();
    }

    // The library initializer
    __attribute__((constructor)) void SMTGLibInitialize_()
    {
        SMTGLib::Initialize();
    }

    __attribute__((destructor)) void SMTGLibFinalize_()
    {
        SMTGLib::Finalize();
    }

} /* end namespace SMTG */

//
// SMTGLib.cpp ends here
