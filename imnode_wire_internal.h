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

#ifndef IMNODE_WIRE_INTERNAL_H
#define IMNODE_WIRE_INTERNAL_H

#include "imnode_wire.h"
#include "imnode_wire_log.h"

#include <imgui_internal.h>

// =====================================================================================================================
// Internal Functionality
// =====================================================================================================================

namespace ImNodeWire
{
// Lookup --------------------------------------------------------------------------------------------------------------

    const ImWirePort* FindPortData(const ImWireGraph& graph, ImNodeId node, ImPortId port);

    /**
     * \brief Hook a new connection on the port would bind to, null if the port can't take one
     */
    ImHookId FindAvailableHook(const ImWireGraph& graph, ImNodeId node, ImPortId port);

// Connections ---------------------------------------------------------------------------------------------------------

    /**
     * \brief Check the hook at endpoint is bound to remote
     */
    bool IsBoundTo(const ImWireGraph& graph, const ImConnectionId& endpoint, const ImConnectionId& remote);
}

#endif //IMNODE_WIRE_INTERNAL_H
