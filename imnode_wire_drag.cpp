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

namespace Log = ImNodeWire::Log;

// =====================================================================================================================
// Connection Drag
// =====================================================================================================================

ImWireDragState::ImWireDragState()
    : Phase(ImWireDragPhase_Idle)
{

}

bool ImWireDragState::Begin(ImWireGraph& graph, const ImConnectionId& endpoint)
{
    Cancel();

    const ImWirePort* Port = ImNodeWire::FindPortData(graph, endpoint.Node, endpoint.Port);
    if(Port == nullptr || Port->Kind == ImWirePortKind_ConstantOnly) return false;

    if(const ImConnectionId* remote = Port->Remote(endpoint.Hook))
    {
        // Grabbing a bound hook moves the connection, keep dragging from its other end
        const ImConnectionId other = *remote;

        ImDropError error = graph.DropConnection(endpoint);
        if(!error.Ok())
        {
            Log::Warn("Couldn't detach {} to start a move: {}", endpoint, ImNodeWire::GetDropErrorName(error.Kind));
            return false;
        }

        OriginNode = other.Node;
        OriginPort = other.Port;
        Detached   = endpoint;
    }
    else
    {
        if(!(Port->AvailableHook() == endpoint.Hook)) return false;

        OriginNode = endpoint.Node;
        OriginPort = endpoint.Port;
    }

    Phase = ImWireDragPhase_Dragging;
    return true;
}

ImWireDragReject ImWireDragState::CanDropOn(const ImWireGraph& graph, ImNodeId node, ImPortId port) const
{
    if(!IsDragging()) return ImWireDragReject_NotDragging;

    const ImWirePort* Origin = ImNodeWire::FindPortData(graph, OriginNode, OriginPort);
    if(Origin == nullptr) return ImWireDragReject_OriginLost;

    const ImWirePort* Target = ImNodeWire::FindPortData(graph, node, port);
    if(Target == nullptr) return ImWireDragReject_BadTarget;

    if(port.Direction == OriginPort.Direction)                    return ImWireDragReject_SameDirection;
    if(node == OriginNode && !graph.Settings.AllowSelfLoops)      return ImWireDragReject_SelfLoop;

    const ImWirePort& Output = OriginPort.IsOutput() ? *Origin : *Target;
    const ImWirePort& Input  = OriginPort.IsOutput() ? *Target : *Origin;
    if(!graph.AreTypesCompatible(Output.Type, Input.Type)) return ImWireDragReject_IncompatibleTypes;

    if(ImNodeWire::FindAvailableHook(graph, node, port).IsNull()) return ImWireDragReject_NoAvailableHook;

    return ImWireDragReject_None;
}

ImWireDragReject ImWireDragState::Release(ImWireGraph& graph, ImNodeId node, ImPortId port, ImConnectError* out_error)
{
    ImWireDragReject reject = CanDropOn(graph, node, port);

    if(reject == ImWireDragReject_None)
    {
        ImConnectError error = OriginPort.IsOutput()
                             ? graph.ConnectPorts(OriginNode, OriginPort, node, port)
                             : graph.ConnectPorts(node, port, OriginNode, OriginPort);

        if(out_error) *out_error = error;
        if(!error.Ok()) reject = ImWireDragReject_ConnectFailed;
    }

    if(reject != ImWireDragReject_None)
    {
        Log::Debug("Dropped drag from {} {} onto {} {}: {}",
                   OriginNode, OriginPort, node, port, ImNodeWire::GetDragRejectName(reject));
    }

    Cancel();
    return reject;
}

void ImWireDragState::Cancel()
{
    Phase      = ImWireDragPhase_Idle;
    OriginNode = ImNodeId();
    OriginPort = ImPortId();
    Detached.Reset();
}
