// =====================================================================================================================
// Copyright 2024 Medusa Slockbower
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// 	http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
// =====================================================================================================================

#include "imnode_wire_log.h"

#include <cstdio>

namespace ImNodeWire::Log
{
    namespace
    {
        bool          s_LoggingSuspended    = false;
        bool          s_DebugLoggingEnabled = false;
        ImWireLogSink s_Sink                = nullptr;
        void*         s_SinkUserData        = nullptr;

        void PrintToStderr(ImWireLogLevel level, std::string_view message)
        {
            fmt::print(stderr, "[{:<5}] [imnode-wire] {}\n", GetLevelName(level), message);
        }
    }

    namespace impl
    {
        bool IsLoggingSuspended()
        {
            return s_LoggingSuspended;
        }

        bool IsDebugLoggingEnabled()
        {
            return s_DebugLoggingEnabled;
        }

        void Write(ImWireLogLevel level, std::string message)
        {
            if(s_Sink) s_Sink(level, message, s_SinkUserData);
            else       PrintToStderr(level, message);
        }
    }

    void SuspendLogging()
    {
        s_LoggingSuspended = true;
    }

    void ResumeLogging()
    {
        s_LoggingSuspended = false;
    }

    void EnableDebugLogging(bool enabled)
    {
        s_DebugLoggingEnabled = enabled;
    }

    void SetLogSink(ImWireLogSink sink, void* user_data)
    {
        s_Sink         = sink;
        s_SinkUserData = sink ? user_data : nullptr;
    }

    const char* GetLevelName(ImWireLogLevel level)
    {
        switch(level)
        {
            case ImWireLogLevel_Debug: return "DEBUG";
            case ImWireLogLevel_Info:  return "INFO";
            case ImWireLogLevel_Warn:  return "WARN";
            case ImWireLogLevel_Error: return "ERROR";
            default:                   return "?";
        }
    }
}
