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

#ifndef IMNODE_WIRE_JSON_H
#define IMNODE_WIRE_JSON_H

#include "imnode_wire.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

// =====================================================================================================================
// Configuration
// =====================================================================================================================

#define IMNODE_WIRE_JSON_VERSION 1

#ifndef IMNODE_WIRE_JSON_MAX_KEY_INDEX
#define IMNODE_WIRE_JSON_MAX_KEY_INDEX (1 << 20) // Largest slot index a loaded document may use
#endif

// =====================================================================================================================
// Functionality
// =====================================================================================================================

namespace ImNodeWire
{
// Persistence ---------------------------------------------------------------------------------------------------------

    /**
     * \brief Serialize the structure of a graph. Node, port and hook keys are written as is so connection ids stay
     *        valid after loading. User data pointers are not saved.
     */
    nlohmann::json SaveGraph(const ImWireGraph& graph);

    /**
     * \brief Replace the contents of graph with a serialized one
     * \return False if the document is malformed or its connections aren't symmetric, graph is left empty
     */
    bool LoadGraph(const nlohmann::json& input, ImWireGraph& graph);

    std::string SaveGraphToString(const ImWireGraph& graph, int indent = -1);
    bool        LoadGraphFromString(std::string_view data, ImWireGraph& graph);
}

#endif //IMNODE_WIRE_JSON_H
