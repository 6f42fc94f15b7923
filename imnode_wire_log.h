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

#ifndef IMNODE_WIRE_LOG_H
#define IMNODE_WIRE_LOG_H

#include "imnode_wire.h"

#include <fmt/core.h>
#include <fmt/format.h>

#include <string>
#include <string_view>

// =====================================================================================================================
// Type & Forward Definitions
// =====================================================================================================================

using ImWireLogLevel = int;
using ImWireLogSink  = void(*)(ImWireLogLevel level, std::string_view message, void* user_data);

enum ImWireLogLevel_
{
    ImWireLogLevel_Debug = 0
,   ImWireLogLevel_Info
,   ImWireLogLevel_Warn
,   ImWireLogLevel_Error
};

// =====================================================================================================================
// Functionality
// =====================================================================================================================

namespace ImNodeWire::Log
{
    namespace impl
    {
        [[nodiscard]] bool IsLoggingSuspended();
        [[nodiscard]] bool IsDebugLoggingEnabled();

        void Write(ImWireLogLevel level, std::string message);

        template<typename... Args>
        void Print(ImWireLogLevel level, fmt::format_string<Args...> fmt, Args&&... args)
        {
            if(IsLoggingSuspended()) return;
            Write(level, fmt::format(fmt, std::forward<Args>(args)...));
        }
    }

    void SuspendLogging();
    void ResumeLogging();
    void EnableDebugLogging(bool enabled = true);

    /**
     * \brief Redirect log output, a null sink restores printing to stderr
     */
    void SetLogSink(ImWireLogSink sink, void* user_data = nullptr);

    const char* GetLevelName(ImWireLogLevel level);

    template<typename... Args>
    void Debug(fmt::format_string<Args...> fmt, Args&&... args)
    {
        if(!impl::IsDebugLoggingEnabled()) return;
        impl::Print(ImWireLogLevel_Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void Info(fmt::format_string<Args...> fmt, Args&&... args)
    {
        impl::Print(ImWireLogLevel_Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void Warn(fmt::format_string<Args...> fmt, Args&&... args)
    {
        impl::Print(ImWireLogLevel_Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void Error(fmt::format_string<Args...> fmt, Args&&... args)
    {
        impl::Print(ImWireLogLevel_Error, fmt, std::forward<Args>(args)...);
    }
}

// =====================================================================================================================
// Formatters
// =====================================================================================================================

namespace fmt
{
    template<typename Tag>
    struct formatter<ImSlotKey<Tag>>
    {
        constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

        template<typename FormatContext>
        auto format(const ImSlotKey<Tag>& key, FormatContext& ctx) const
        {
            if(key.IsNull()) return fmt::format_to(ctx.out(), "null");
            return fmt::format_to(ctx.out(), "{}v{}", key.Index, key.Generation);
        }
    };

    template<>
    struct formatter<ImPortId>
    {
        constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

        template<typename FormatContext>
        auto format(const ImPortId& port, FormatContext& ctx) const
        {
            return fmt::format_to(ctx.out(), "{}:{}", port.IsOutput() ? "out" : "in", port.Key);
        }
    };

    template<>
    struct formatter<ImConnectionId>
    {
        constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

        template<typename FormatContext>
        auto format(const ImConnectionId& id, FormatContext& ctx) const
        {
            return fmt::format_to(ctx.out(), "[node {} {} hook {}]", id.Node, id.Port, id.Hook);
        }
    };
}

#endif //IMNODE_WIRE_LOG_H
