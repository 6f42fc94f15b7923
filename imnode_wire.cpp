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

#include "imnode_wire.h"
#include "imnode_wire_internal.h"

#include <cstring>

namespace Log = ImNodeWire::Log;

// =====================================================================================================================
// Internal Functionality
// =====================================================================================================================


// Lookup --------------------------------------------------------------------------------------------------------------

const ImWirePort* ImNodeWire::FindPortData(const ImWireGraph& graph, ImNodeId node, ImPortId port)
{
    const ImWireNode* Node = graph.GetNode(node);
    return Node ? Node->GetPort(port) : nullptr;
}

ImHookId ImNodeWire::FindAvailableHook(const ImWireGraph& graph, ImNodeId node, ImPortId port)
{
    const ImWireNode* Node = graph.GetNode(node);
    if(Node == nullptr) return ImHookId();

    return Node->AvailableHook(port).ValueOr(ImHookId());
}


// Connections ---------------------------------------------------------------------------------------------------------

bool ImNodeWire::IsBoundTo(const ImWireGraph& graph, const ImConnectionId& endpoint, const ImConnectionId& remote)
{
    const ImWirePort* Port = FindPortData(graph, endpoint.Node, endpoint.Port);
    if(Port == nullptr) return false;

    const ImConnectionId* bound = Port->Remote(endpoint.Hook);
    return bound && *bound == remote;
}

// =====================================================================================================================
// Ports
// =====================================================================================================================

ImWirePort::ImWirePort(const char* name, ImWireDataType type, int max_connections, ImWirePortSide side,
                       ImWirePortKind kind)
    : Name(ImStrdup(name ? name : ""))
    , Type(type)
    , MaxConnections(max_connections)
    , Side(side)
    , Kind(kind)
    , Value(nullptr)
    , ShownInline(true)
{
    _RecomputeAvailableHook();
}

ImWirePort::~ImWirePort()
{
    IM_FREE(Name);
}

int ImWirePort::ConnectionCount() const
{
    int count = 0;
    for(auto [id, hook] : Hooks)
    {
        if(hook.Remote()) ++count;
    }
    return count;
}

const ImConnectionId* ImWirePort::Remote(ImHookId hook) const
{
    const ImWireHook* Hook = Hooks.Get(hook);
    return Hook && Hook->Remote() ? &Hook->Remote.Value : nullptr;
}

ImPortError ImWirePort::Connect(ImHookId hook, const ImConnectionId& remote)
{
    if(IsFull()) return ImPortError_HookOccupied;

    ImWireHook* Hook = Hooks.Get(hook);
    if(Hook == nullptr)  return ImPortError_BadHook;
    if(Hook->Remote())   return ImPortError_HookOccupied;

    Hook->Remote = remote;
    _RecomputeAvailableHook();
    return ImPortError_None;
}

ImPortError ImWirePort::DropConnection(ImHookId hook, ImConnectionId* out_remote)
{
    ImWireHook* Hook = Hooks.Get(hook);
    if(Hook == nullptr) return ImPortError_BadHook;
    if(!Hook->Remote()) return ImPortError_NoConnection;

    if(out_remote) *out_remote = Hook->Remote.Value;

    Hooks.Erase(hook);
    _RecomputeAvailableHook();
    return ImPortError_None;
}

void ImWirePort::DropAllConnections(ImVector<ImHookConnection>* out)
{
    ImVector<ImHookId> bound;
    for(auto [id, hook] : Hooks)
    {
        if(!hook.Remote()) continue;

        bound.push_back(id);
        if(out) out->push_back({ id, hook.Remote.Value });
    }

    for(ImHookId id : bound) Hooks.Erase(id);
    _RecomputeAvailableHook();
}

void ImWirePort::_RecomputeAvailableHook()
{
    Available.Reset();

    // Reuse the empty hook if there is one
    for(auto [id, hook] : Hooks)
    {
        if(hook.Remote()) continue;

        Available = id;
        return;
    }

    if(MaxConnections > 0 && Hooks.Size() >= MaxConnections) return;

    Available = Hooks.Insert();
}

// =====================================================================================================================
// Nodes
// =====================================================================================================================

ImWireNode::ImWireNode(const char* label)
    : Label(ImStrdup(label ? label : ""))
    , UserData(nullptr)
    , DropSink(nullptr)
{

}

ImWireNode::ImWireNode(ImWireNode&& other)
    : Label(other.Label)
    , UserID(other.UserID)
    , UserData(other.UserData)
    , ID(other.ID)
    , Inputs(std::move(other.Inputs))
    , Outputs(std::move(other.Outputs))
    , DropSink(other.DropSink)
{
    InputOrder.swap(other.InputOrder);
    OutputOrder.swap(other.OutputOrder);

    other.Label    = nullptr;
    other.UserData = nullptr;
    other.DropSink = nullptr;
}

ImWireNode& ImWireNode::operator=(ImWireNode&& other)
{
    if(&other == this) return *this;

    IM_FREE(Label);

    ID       = other.ID;
    Label    = other.Label;    other.Label    = nullptr;
    UserID   = other.UserID;
    UserData = other.UserData; other.UserData = nullptr;
    DropSink = other.DropSink; other.DropSink = nullptr;

    Inputs  = std::move(other.Inputs);
    Outputs = std::move(other.Outputs);

    InputOrder.clear();  InputOrder.swap(other.InputOrder);
    OutputOrder.clear(); OutputOrder.swap(other.OutputOrder);

    return *this;
}

ImWireNode::~ImWireNode()
{
    IM_FREE(Label);
}

ImPortId ImWireNode::AddInputPort(const char* name, ImWireDataType type, ImWirePortKind kind, int max_connections)
{
    ImPortKey key = Inputs.Insert(name, type, max_connections, ImWirePortSide_Left, kind);
    InputOrder.push_back(key);
    return ImPortId::Input(key);
}

ImPortId ImWireNode::AddOutputPort(const char* name, ImWireDataType type, int max_connections)
{
    ImPortKey key = Outputs.Insert(name, type, max_connections, ImWirePortSide_Right, ImWirePortKind_ConnectionOnly);
    OutputOrder.push_back(key);
    return ImPortId::Output(key);
}

bool ImWireNode::RemovePort(ImPortId port)
{
    auto& ports = port.IsOutput() ? Outputs : Inputs;
    auto& order = port.IsOutput() ? OutputOrder : InputOrder;

    ImWirePort* Port = ports.Get(port.Key);
    if(Port == nullptr) return false;

    ImVector<ImHookConnection> dropped;
    Port->DropAllConnections(&dropped);
    for(const ImHookConnection& connection : dropped) _QueueDrop(port, connection.Hook, connection.Remote);

    ports.Erase(port.Key);
    order.find_erase(port.Key);
    return true;
}

bool ImWireNode::SetPortValue(ImPortId port, void* value)
{
    ImWirePort* Port = _GetPort(port);
    if(Port == nullptr) return false;

    Port->Value = value;
    return true;
}

bool ImWireNode::SetPortShownInline(ImPortId port, bool shown)
{
    ImWirePort* Port = _GetPort(port);
    if(Port == nullptr) return false;

    Port->ShownInline = shown;
    return true;
}

ImOptional<ImPortId> ImWireNode::FindPort(ImPinDirection direction, const char* name) const
{
    if(name == nullptr) name = "";

    const bool output = direction == ImPinDirection_Output;
    const auto& ports = output ? Outputs     : Inputs;
    const auto& order = output ? OutputOrder : InputOrder;

    for(ImPortKey key : order)
    {
        if(strcmp(ports[key].Name, name) == 0) return ImPortId(direction, key);
    }

    return { };
}

int ImWireNode::PortCount(ImPinDirection direction) const
{
    return direction == ImPinDirection_Output ? Outputs.Size() : Inputs.Size();
}

const ImVector<ImPortKey>& ImWireNode::GetPortOrder(ImPinDirection direction) const
{
    return direction == ImPinDirection_Output ? OutputOrder : InputOrder;
}

ImWirePort* ImWireNode::_GetPort(ImPortId port)
{
    return port.IsOutput() ? Outputs.Get(port.Key) : Inputs.Get(port.Key);
}

const ImWirePort* ImWireNode::GetPort(ImPortId port) const
{
    return port.IsOutput() ? Outputs.Get(port.Key) : Inputs.Get(port.Key);
}

ImOptional<ImWireDataType> ImWireNode::PortDataType(ImPortId port) const
{
    const ImWirePort* Port = GetPort(port);
    if(Port == nullptr) return { };

    return Port->DataType();
}

ImOptional<ImHookId> ImWireNode::AvailableHook(ImPortId port) const
{
    const ImWirePort* Port = GetPort(port);
    if(Port == nullptr || Port->Kind == ImWirePortKind_ConstantOnly) return { };

    return Port->AvailableHook();
}

bool ImWireNode::UsesInlineValue(ImPortId port) const
{
    const ImWirePort* Port = GetPort(port);
    if(Port == nullptr) return false;

    switch(Port->Kind)
    {
        case ImWirePortKind_ConstantOnly:         return true;
        case ImWirePortKind_ConnectionOrConstant: return !Port->IsConnected();
        default:                                  return false;
    }
}

ImNodeError ImWireNode::Connect(ImPortId port, ImHookId hook, const ImConnectionId& remote)
{
    ImWirePort* Port = _GetPort(port);
    if(Port == nullptr)                          return ImNodeError(ImNodeError_BadPort, port);
    if(Port->Kind == ImWirePortKind_ConstantOnly) return ImNodeError(ImNodeError_ConstantOnly, port);

    ImPortError error = Port->Connect(hook, remote);
    if(error != ImPortError_None) return ImNodeError(ImNodeError_PortError, port, error);

    return { };
}

ImNodeError ImWireNode::DropConnection(ImPortId port, ImHookId hook, ImConnectionId* out_remote)
{
    ImWirePort* Port = _GetPort(port);
    if(Port == nullptr) return ImNodeError(ImNodeError_BadPort, port);

    ImConnectionId remote;
    ImPortError error = Port->DropConnection(hook, &remote);
    if(error != ImPortError_None) return ImNodeError(ImNodeError_PortError, port, error);

    _QueueDrop(port, hook, remote);
    if(out_remote) *out_remote = remote;
    return { };
}

void ImWireNode::DropAllConnections(ImVector<ImPortConnection>* out)
{
    ImVector<ImHookConnection> dropped;

    auto drop_side = [&](ImSlotMap<ImWirePort, ImPortKey>& ports, const ImVector<ImPortKey>& order, ImPinDirection dir)
    {
        for(ImPortKey key : order)
        {
            const ImPortId port(dir, key);

            dropped.clear();
            ports[key].DropAllConnections(&dropped);

            for(const ImHookConnection& connection : dropped)
            {
                _QueueDrop(port, connection.Hook, connection.Remote);
                if(out) out->push_back({ port, connection.Hook, connection.Remote });
            }
        }
    };

    drop_side(Inputs,  InputOrder,  ImPinDirection_Input);
    drop_side(Outputs, OutputOrder, ImPinDirection_Output);
}

void ImWireNode::_QueueDrop(ImPortId port, ImHookId hook, const ImConnectionId& remote)
{
    // Nodes outside of a graph have nobody to repair
    if(DropSink == nullptr) return;

    DropSink->push_back({ ImConnectionId{ ID, port, hook }, remote });
}

// =====================================================================================================================
// Graph
// =====================================================================================================================

ImWireSettings::ImWireSettings()
    : AllowSelfLoops(false)
    , LogConnections(false)
    , TypeCompatibility(nullptr)
    , TypeName(nullptr)
{

}


// Nodes ---------------------------------------------------------------------------------------------------------------

ImNodeId ImWireGraph::AddNode(const char* label)
{
    ImNodeId    id   = Nodes.Insert(label);
    ImWireNode& Node = Nodes[id];

    Node.ID       = id;
    Node.DropSink = &DroppedConnections;

    Log::Debug("Added node {} '{}'", id, Node.Label);
    return id;
}

bool ImWireGraph::RemoveNode(ImNodeId id, ImVector<ImSeveredConnection>* out_severed, ImWireNode* out_node)
{
    ImWireNode* Node = Nodes.Get(id);
    if(Node == nullptr) return false;

    ImVector<ImPortConnection> dropped;
    Node->DropAllConnections(&dropped);

    if(out_severed)
    {
        for(const ImPortConnection& connection : dropped)
        {
            out_severed->push_back({ ImConnectionId{ id, connection.Port, connection.Hook }, connection.Remote });
        }
    }

    Node->DropSink = nullptr;
    if(out_node) Nodes.Extract(id, out_node);
    else         Nodes.Erase(id);

    // Remote sides still point at the removed node until repaired
    ProcessDroppedConnections();

    Log::Debug("Removed node {}, severed {} connection(s)", id, dropped.Size);
    return true;
}

void ImWireGraph::Clear()
{
    Nodes.Clear();
    DroppedConnections.clear();
}


// Connections ---------------------------------------------------------------------------------------------------------

ImConnectError ImWireGraph::_ValidateConnection(const ImConnectionId& output, const ImConnectionId& input) const
{
    const ImWireNode* OutNode = Nodes.Get(output.Node);
    if(OutNode == nullptr) return ImConnectError(ImConnectError_BadOutputNode, output.Node);

    const ImWirePort* OutPort = OutNode->GetPort(output.Port);
    if(OutPort == nullptr)
        return ImConnectError(ImConnectError_OutputNodeError, output.Node, ImNodeError(ImNodeError_BadPort, output.Port));

    const ImWireNode* InNode = Nodes.Get(input.Node);
    if(InNode == nullptr) return ImConnectError(ImConnectError_BadInputNode, input.Node);

    const ImWirePort* InPort = InNode->GetPort(input.Port);
    if(InPort == nullptr)
        return ImConnectError(ImConnectError_InputNodeError, input.Node, ImNodeError(ImNodeError_BadPort, input.Port));

    if(!output.Port.IsOutput()) return ImConnectError(ImConnectError_WrongDirection, output.Node);
    if(!input.Port.IsInput())   return ImConnectError(ImConnectError_WrongDirection, input.Node);

    if(output.Node == input.Node && !Settings.AllowSelfLoops) return ImConnectError(ImConnectError_SelfLoop, input.Node);

    if(!AreTypesCompatible(OutPort->Type, InPort->Type)) return ImConnectError(ImConnectError_IncompatibleTypes, input.Node);

    for(auto [hook_id, hook] : OutPort->Hooks)
    {
        if(!hook.Remote()) continue;
        if(hook.Remote->Node == input.Node && hook.Remote->Port == input.Port)
            return ImConnectError(ImConnectError_AlreadyConnected, output.Node);
    }

    return { };
}

ImConnectError ImWireGraph::AddConnection(const ImConnectionId& output, const ImConnectionId& input)
{
    ImConnectError error = _ValidateConnection(output, input);

    if(error.Ok())
    {
        ImWireNode& OutNode = Nodes[output.Node];
        ImWireNode& InNode  = Nodes[input.Node];

        // Bind the output side first, the input side is only attempted once it holds
        ImNodeError node_error = OutNode.Connect(output.Port, output.Hook, input);
        if(!node_error.Ok())
        {
            error = ImConnectError(ImConnectError_OutputNodeError, output.Node, node_error);
        }
        else
        {
            node_error = InNode.Connect(input.Port, input.Hook, output);
            if(!node_error.Ok())
            {
                error = ImConnectError(ImConnectError_InputNodeError, input.Node, node_error);

                const ImNodeError rollback = OutNode.DropConnection(output.Port, output.Hook);
                IM_ASSERT(rollback.Ok()); IM_UNUSED(rollback);
            }
        }
    }

    ProcessDroppedConnections();

    if(!error.Ok())
    {
        Log::Debug("Rejected connection {} -> {}: {}", output, input, ImNodeWire::GetConnectErrorName(error.Kind));
    }
    else if(Settings.LogConnections)
    {
        Log::Debug("Connected {} -> {}", output, input);
    }

    return error;
}

ImConnectError ImWireGraph::ConnectPorts(ImNodeId output_node, ImPortId output_port, ImNodeId input_node, ImPortId input_port)
{
    const ImConnectionId output{ output_node, output_port, ImNodeWire::FindAvailableHook(*this, output_node, output_port) };
    const ImConnectionId input { input_node,  input_port,  ImNodeWire::FindAvailableHook(*this, input_node,  input_port)  };

    return AddConnection(output, input);
}

ImDropError ImWireGraph::DropConnection(const ImConnectionId& id, ImConnectionId* out_remote)
{
    ImWireNode* Node = Nodes.Get(id.Node);
    if(Node == nullptr) return ImDropError(ImDropError_BadNode, id.Node);

    ImConnectionId remote;
    ImNodeError error = Node->DropConnection(id.Port, id.Hook, &remote);

    ProcessDroppedConnections();

    if(!error.Ok()) return ImDropError(ImDropError_NodeError, id.Node, error);

    if(Settings.LogConnections) Log::Debug("Dropped {} -> {}", id, remote);
    if(out_remote) *out_remote = remote;
    return { };
}

void ImWireGraph::ProcessDroppedConnections()
{
    if(DroppedConnections.empty()) return;

    // Repairing pushes onto the shared list, drain it first
    ImVector<ImDroppedConnection> dropped;
    dropped.swap(DroppedConnections);

    for(const ImDroppedConnection& entry : dropped)
    {
        // Already gone, or the remote hook has been rebound since
        if(!ImNodeWire::IsBoundTo(*this, entry.Remote, entry.Origin)) continue;

        const ImNodeError error = Nodes[entry.Remote.Node].DropConnection(entry.Remote.Port, entry.Remote.Hook);
        IM_ASSERT(error.Ok()); IM_UNUSED(error);

        if(Settings.LogConnections) Log::Debug("Repaired {} after {} dropped", entry.Remote, entry.Origin);
    }

    // Complementary drops only report the sides just repaired
    DroppedConnections.clear();
}

int ImWireGraph::ConnectionCount() const
{
    int count = 0;
    ForEachConnection([&count](const ImConnectionId&, const ImConnectionId&) { ++count; });
    return count;
}

bool ImWireGraph::IsConnected(const ImConnectionId& a, const ImConnectionId& b) const
{
    return ImNodeWire::IsBoundTo(*this, a, b) && ImNodeWire::IsBoundTo(*this, b, a);
}

void ImWireGraph::GetConnections(ImNodeId node, ImPortId port, ImVector<ImConnectionId>* out) const
{
    IM_ASSERT(out);
    out->clear();

    const ImWirePort* Port = ImNodeWire::FindPortData(*this, node, port);
    if(Port == nullptr) return;

    Port->ForEachHook([out](ImHookId, const ImConnectionId* remote)
    {
        if(remote) out->push_back(*remote);
    });
}

bool ImWireGraph::ValidateConnections() const
{
    bool valid = true;

    auto validate_side = [&](ImNodeId node_id, const ImSlotMap<ImWirePort, ImPortKey>& ports, ImPinDirection dir)
    {
        for(auto [port_key, port_data] : ports)
        {
            const ImPortId    port_id(dir, port_key);
            const ImWirePort& port = port_data;

            port.ForEachHook([&](ImHookId hook_id, const ImConnectionId* remote)
            {
                if(remote == nullptr) return;

                const ImConnectionId local{ node_id, port_id, hook_id };
                if(remote->Port.Direction == dir)
                {
                    Log::Error("Connection {} is bound to {} on the same side", local, *remote);
                    valid = false;
                    return;
                }

                if(!ImNodeWire::IsBoundTo(*this, *remote, local))
                {
                    Log::Error("Connection {} is bound to {} which doesn't point back", local, *remote);
                    valid = false;
                    return;
                }

                // Both sides agree, check the pair once from its output
                if(dir != ImPinDirection_Output) return;

                if(remote->Node == node_id && !Settings.AllowSelfLoops)
                {
                    Log::Error("Connection {} -> {} loops back to its own node", local, *remote);
                    valid = false;
                }

                const ImWirePort* input = ImNodeWire::FindPortData(*this, remote->Node, remote->Port);
                if(!AreTypesCompatible(port.Type, input->Type))
                {
                    Log::Error("Connection {} -> {} joins incompatible types {} and {}",
                               local, *remote, port.Type, input->Type);
                    valid = false;
                }
            });

            const int connections = port.ConnectionCount();
            if(port.MaxConnections > 0 && connections > port.MaxConnections)
            {
                Log::Error("Port {} of node {} holds {} connections, limit is {}",
                           port_id, node_id, connections, port.MaxConnections);
                valid = false;
            }

            if(port.IsFull() && port.AvailableHook()())
            {
                Log::Error("Port {} of node {} is full but still offers a hook", port_id, node_id);
                valid = false;
            }

            if(port.Kind == ImWirePortKind_ConstantOnly && connections > 0)
            {
                Log::Error("Constant only port {} of node {} holds {} connections", port_id, node_id, connections);
                valid = false;
            }
        }
    };

    for(auto [node_id, node] : Nodes)
    {
        validate_side(node_id, node.Inputs,  ImPinDirection_Input);
        validate_side(node_id, node.Outputs, ImPinDirection_Output);
    }

    return valid;
}


// Types ---------------------------------------------------------------------------------------------------------------

bool ImWireGraph::AreTypesCompatible(ImWireDataType output, ImWireDataType input) const
{
    if(Settings.TypeCompatibility) return Settings.TypeCompatibility(output, input);
    return output == input;
}

const char* ImWireGraph::GetTypeName(ImWireDataType type, char* buf, int buf_size) const
{
    if(Settings.TypeName) return Settings.TypeName(type);

    IM_ASSERT(buf != nullptr && buf_size > 0);
    ImFormatString(buf, static_cast<size_t>(buf_size), "type#%d", type);
    return buf;
}

// =====================================================================================================================
// Public Functionality
// =====================================================================================================================


// Errors --------------------------------------------------------------------------------------------------------------

const char* ImNodeWire::GetPortErrorName(ImPortError error)
{
    switch(error)
    {
        case ImPortError_None:         return "None";
        case ImPortError_BadHook:      return "BadHook";
        case ImPortError_HookOccupied: return "HookOccupied";
        case ImPortError_NoConnection: return "NoConnection";
        default:                       return "Unknown";
    }
}

const char* ImNodeWire::GetNodeErrorName(ImNodeErrorKind kind)
{
    switch(kind)
    {
        case ImNodeError_None:         return "None";
        case ImNodeError_BadPort:      return "BadPort";
        case ImNodeError_ConstantOnly: return "ConstantOnly";
        case ImNodeError_PortError:    return "PortError";
        default:                       return "Unknown";
    }
}

const char* ImNodeWire::GetConnectErrorName(ImConnectErrorKind kind)
{
    switch(kind)
    {
        case ImConnectError_None:              return "None";
        case ImConnectError_BadOutputNode:     return "BadOutputNode";
        case ImConnectError_BadInputNode:      return "BadInputNode";
        case ImConnectError_OutputNodeError:   return "OutputNodeError";
        case ImConnectError_InputNodeError:    return "InputNodeError";
        case ImConnectError_WrongDirection:    return "WrongDirection";
        case ImConnectError_SelfLoop:          return "SelfLoop";
        case ImConnectError_IncompatibleTypes: return "IncompatibleTypes";
        case ImConnectError_AlreadyConnected:  return "AlreadyConnected";
        default:                               return "Unknown";
    }
}

const char* ImNodeWire::GetDropErrorName(ImDropErrorKind kind)
{
    switch(kind)
    {
        case ImDropError_None:      return "None";
        case ImDropError_BadNode:   return "BadNode";
        case ImDropError_NodeError: return "NodeError";
        default:                    return "Unknown";
    }
}

const char* ImNodeWire::GetDragRejectName(ImWireDragReject reject)
{
    switch(reject)
    {
        case ImWireDragReject_None:              return "None";
        case ImWireDragReject_NotDragging:       return "NotDragging";
        case ImWireDragReject_OriginLost:        return "OriginLost";
        case ImWireDragReject_BadTarget:         return "BadTarget";
        case ImWireDragReject_SameDirection:     return "SameDirection";
        case ImWireDragReject_SelfLoop:          return "SelfLoop";
        case ImWireDragReject_IncompatibleTypes: return "IncompatibleTypes";
        case ImWireDragReject_NoAvailableHook:   return "NoAvailableHook";
        case ImWireDragReject_ConnectFailed:     return "ConnectFailed";
        default:                                 return "Unknown";
    }
}
