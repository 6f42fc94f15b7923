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

#include "imnode_wire_json.h"
#include "imnode_wire_internal.h"

#include <vector>

namespace Log = ImNodeWire::Log;

using json = nlohmann::json;

// =====================================================================================================================
// Internal Functionality
// =====================================================================================================================

namespace
{
// Keys ----------------------------------------------------------------------------------------------------------------

    template<typename Tag>
    json KeyToJson(ImSlotKey<Tag> key)
    {
        return { { "index", key.Index }, { "generation", key.Generation } };
    }

    template<typename Key>
    Key KeyFromJson(const json& input)
    {
        return Key(input.at("index").get<ImU32>(), input.at("generation").get<ImU32>());
    }

    template<typename Tag>
    bool IsKeyInRange(ImSlotKey<Tag> key)
    {
        return !key.IsNull() && key.Index <= static_cast<ImU32>(IMNODE_WIRE_JSON_MAX_KEY_INDEX);
    }

    json ConnectionToJson(const ImConnectionId& id)
    {
        json output;
        output["node"]   = KeyToJson(id.Node);
        output["output"] = id.Port.IsOutput();
        output["port"]   = KeyToJson(id.Port.Key);
        output["hook"]   = KeyToJson(id.Hook);
        return output;
    }

    ImConnectionId ConnectionFromJson(const json& input)
    {
        ImConnectionId id;
        id.Node = KeyFromJson<ImNodeId>(input.at("node"));
        id.Port = ImPortId(input.at("output").get<bool>(), KeyFromJson<ImPortKey>(input.at("port")));
        id.Hook = KeyFromJson<ImHookId>(input.at("hook"));
        return id;
    }


// Saving --------------------------------------------------------------------------------------------------------------

    json SavePorts(const ImWireNode& node, ImPinDirection direction)
    {
        json output = json::array();

        for(ImPortKey key : node.GetPortOrder(direction))
        {
            const ImWirePort& port = *node.GetPort(ImPortId(direction, key));

            json entry;
            entry["id"]              = KeyToJson(key);
            entry["name"]            = port.Name;
            entry["type"]            = port.Type;
            entry["max_connections"] = port.MaxConnections;
            entry["side"]            = port.Side;
            entry["kind"]            = port.Kind;
            entry["shown_inline"]    = port.ShownInline;
            entry["user_id"]         = port.UserID.Int;
            entry["hooks"]           = json::array();

            port.ForEachHook([&entry](ImHookId hook, const ImConnectionId* remote)
            {
                json hook_entry;
                hook_entry["id"]     = KeyToJson(hook);
                hook_entry["remote"] = remote ? ConnectionToJson(*remote) : json(nullptr);
                entry["hooks"].push_back(std::move(hook_entry));
            });

            output.push_back(std::move(entry));
        }

        return output;
    }
}

// =====================================================================================================================
// Loading
// =====================================================================================================================

/**
 * \brief Rebuilds a graph from a document with the keys it was saved with. Parsing finishes before anything is
 *        allocated, so a malformed document never leaves a partial graph behind.
 */
struct ImWireGraphLoader
{
    struct HookRecord
    {
        ImHookId                   Id;
        ImOptional<ImConnectionId> Remote;
    };

    struct PortRecord
    {
        ImPortKey               Id;
        std::string             Name;
        ImWireDataType          Type;
        int                     MaxConnections;
        ImWirePortSide          Side;
        ImWirePortKind          Kind;
        bool                    ShownInline;
        int                     UserInt;
        std::vector<HookRecord> Hooks;
    };

    struct NodeRecord
    {
        ImNodeId                Id;
        std::string             Label;
        int                     UserInt;
        std::vector<PortRecord> Inputs;
        std::vector<PortRecord> Outputs;
    };

    static PortRecord ParsePort(const json& input);
    static NodeRecord ParseNode(const json& input);

    static bool RestorePort(ImWireNode& node, ImPinDirection direction, const PortRecord& record);
    static bool RestoreNodes(ImWireGraph& graph, const std::vector<NodeRecord>& records);

    static bool Load(const json& input, ImWireGraph& graph);
};


// Parsing -------------------------------------------------------------------------------------------------------------

ImWireGraphLoader::PortRecord ImWireGraphLoader::ParsePort(const json& input)
{
    PortRecord record;
    record.Id             = KeyFromJson<ImPortKey>(input.at("id"));
    record.Name           = input.at("name").get<std::string>();
    record.Type           = input.at("type").get<ImWireDataType>();
    record.MaxConnections = input.at("max_connections").get<int>();
    record.Side           = input.at("side").get<ImWirePortSide>();
    record.Kind           = input.at("kind").get<ImWirePortKind>();
    record.ShownInline    = input.value("shown_inline", true);
    record.UserInt        = input.value("user_id", 0);

    for(const json& hook : input.at("hooks"))
    {
        HookRecord& hook_record = record.Hooks.emplace_back();
        hook_record.Id = KeyFromJson<ImHookId>(hook.at("id"));

        const json& remote = hook.at("remote");
        if(!remote.is_null()) hook_record.Remote = ConnectionFromJson(remote);
    }

    return record;
}

ImWireGraphLoader::NodeRecord ImWireGraphLoader::ParseNode(const json& input)
{
    NodeRecord record;
    record.Id      = KeyFromJson<ImNodeId>(input.at("id"));
    record.Label   = input.at("label").get<std::string>();
    record.UserInt = input.value("user_id", 0);

    for(const json& port : input.at("inputs"))  record.Inputs.push_back(ParsePort(port));
    for(const json& port : input.at("outputs")) record.Outputs.push_back(ParsePort(port));

    return record;
}


// Restoring -----------------------------------------------------------------------------------------------------------

bool ImWireGraphLoader::RestorePort(ImWireNode& node, ImPinDirection direction, const PortRecord& record)
{
    if(record.MaxConnections < 0
    || record.Kind < ImWirePortKind_ConnectionOnly || record.Kind > ImWirePortKind_ConnectionOrConstant
    || record.Side < ImWirePortSide_Left           || record.Side > ImWirePortSide_Right)
    {
        Log::Error("Port '{}' of node {} has invalid settings", record.Name, node.ID);
        return false;
    }

    if(!IsKeyInRange(record.Id))
    {
        Log::Error("Port '{}' of node {} has out of range key {}", record.Name, node.ID, record.Id);
        return false;
    }

    const bool output = direction == ImPinDirection_Output;
    auto& ports = output ? node.Outputs     : node.Inputs;
    auto& order = output ? node.OutputOrder : node.InputOrder;

    ImWirePort* Port = IM_NEW(ImWirePort)(record.Name.c_str(), record.Type, record.MaxConnections, record.Side, record.Kind);
    if(!ports.Restore(record.Id, Port))
    {
        IM_DELETE(Port);
        Log::Error("Duplicate port {} on node {}", record.Id, node.ID);
        return false;
    }

    order.push_back(record.Id);
    Port->ShownInline = record.ShownInline;
    Port->UserID.Int  = record.UserInt;

    // Replace the hook created on construction with the saved ones
    Port->Hooks = ImSlotMap<ImWireHook, ImHookId>();

    int empty = 0;
    int bound = 0;
    for(const HookRecord& hook : record.Hooks)
    {
        if(!IsKeyInRange(hook.Id))
        {
            Log::Error("Hook {} on port '{}' of node {} is out of range", hook.Id, record.Name, node.ID);
            return false;
        }

        ImWireHook* Hook = IM_NEW(ImWireHook)();
        Hook->Remote = hook.Remote;

        if(!Port->Hooks.Restore(hook.Id, Hook))
        {
            IM_DELETE(Hook);
            Log::Error("Duplicate hook {} on port '{}' of node {}", hook.Id, record.Name, node.ID);
            return false;
        }

        if(hook.Remote()) ++bound;
        else              ++empty;
    }

    if(empty > 1)
    {
        Log::Error("Port '{}' of node {} has {} empty hooks", record.Name, node.ID, empty);
        return false;
    }

    if(empty > 0 && record.MaxConnections > 0 && bound >= record.MaxConnections)
    {
        Log::Error("Port '{}' of node {} is full but has an empty hook", record.Name, node.ID);
        return false;
    }

    Port->Hooks.RebuildFreeList();
    Port->_RecomputeAvailableHook();
    return true;
}

bool ImWireGraphLoader::RestoreNodes(ImWireGraph& graph, const std::vector<NodeRecord>& records)
{
    for(const NodeRecord& record : records)
    {
        if(!IsKeyInRange(record.Id))
        {
            Log::Error("Node key {} is out of range", record.Id);
            return false;
        }

        ImWireNode* Node = IM_NEW(ImWireNode)(record.Label.c_str());
        if(!graph.Nodes.Restore(record.Id, Node))
        {
            IM_DELETE(Node);
            Log::Error("Duplicate node {}", record.Id);
            return false;
        }

        Node->ID         = record.Id;
        Node->DropSink   = &graph.DroppedConnections;
        Node->UserID.Int = record.UserInt;

        for(const PortRecord& port : record.Inputs)
        {
            if(!RestorePort(*Node, ImPinDirection_Input, port)) return false;
        }

        for(const PortRecord& port : record.Outputs)
        {
            if(!RestorePort(*Node, ImPinDirection_Output, port)) return false;
        }

        Node->Inputs.RebuildFreeList();
        Node->Outputs.RebuildFreeList();
    }

    graph.Nodes.RebuildFreeList();
    return true;
}

bool ImWireGraphLoader::Load(const json& input, ImWireGraph& graph)
{
    graph.Clear();

    std::vector<NodeRecord> records;
    try
    {
        const int version = input.at("version").get<int>();
        if(version != IMNODE_WIRE_JSON_VERSION)
        {
            Log::Error("Unsupported graph version {}", version);
            return false;
        }

        const json& nodes = input.at("nodes");
        if(!nodes.is_array())
        {
            Log::Error("Graph nodes must be an array");
            return false;
        }

        for(const json& node : nodes) records.push_back(ParseNode(node));
    }
    catch(const json::exception& e)
    {
        Log::Error("Failed to read graph: {}", e.what());
        return false;
    }

    if(!RestoreNodes(graph, records) || !graph.ValidateConnections())
    {
        Log::Error("Rejected graph with inconsistent connections");
        graph.Clear();
        return false;
    }

    Log::Info("Loaded graph with {} node(s) and {} connection(s)", graph.NodeCount(), graph.ConnectionCount());
    return true;
}

// =====================================================================================================================
// Public Functionality
// =====================================================================================================================

json ImNodeWire::SaveGraph(const ImWireGraph& graph)
{
    json output;
    output["version"] = IMNODE_WIRE_JSON_VERSION;
    output["nodes"]   = json::array();

    graph.ForEachNode([&output](ImNodeId id, const ImWireNode& node)
    {
        json entry;
        entry["id"]      = KeyToJson(id);
        entry["label"]   = node.Label;
        entry["user_id"] = node.UserID.Int;
        entry["inputs"]  = SavePorts(node, ImPinDirection_Input);
        entry["outputs"] = SavePorts(node, ImPinDirection_Output);

        output["nodes"].push_back(std::move(entry));
    });

    return output;
}

bool ImNodeWire::LoadGraph(const json& input, ImWireGraph& graph)
{
    return ImWireGraphLoader::Load(input, graph);
}

std::string ImNodeWire::SaveGraphToString(const ImWireGraph& graph, int indent)
{
    return SaveGraph(graph).dump(indent);
}

bool ImNodeWire::LoadGraphFromString(std::string_view data, ImWireGraph& graph)
{
    const json input = json::parse(data.begin(), data.end(), nullptr, false);
    if(input.is_discarded())
    {
        Log::Error("Failed to parse graph document");
        graph.Clear();
        return false;
    }

    return LoadGraph(input, graph);
}
