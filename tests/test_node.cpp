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

#include <catch2/catch.hpp>

#include "test_helpers.h"

#include <cstring>

namespace
{
    template<typename Port>
    constexpr bool PortConnectIsPublic = requires(Port& port) { port.Connect(ImHookId(), ImConnectionId()); };

    template<typename Port>
    constexpr bool PortDropIsPublic = requires(Port& port) { port.DropConnection(ImHookId()); };

    template<typename Node>
    constexpr bool NodeMutablePortIsPublic = requires(Node& node) { node._GetPort(ImPortId()); };

    template<typename Graph>
    constexpr bool GraphNodesArePublic = requires(Graph& graph) { graph.Nodes; };
}

// Only nodes bind and drop hooks, and only the graph reaches into its nodes
static_assert(!PortConnectIsPublic<ImWirePort>);
static_assert(!PortDropIsPublic<ImWirePort>);
static_assert(!NodeMutablePortIsPublic<ImWireNode>);
static_assert(!GraphNodesArePublic<ImWireGraph>);

// =====================================================================================================================
// Node
// =====================================================================================================================

TEST_CASE("Node ports are addressed by id and name", "[node]")
{
    ImWireNode node("Add");

    const ImPortId a   = node.AddInputPort("a", TestType_Scalar);
    const ImPortId b   = node.AddInputPort("b", TestType_Vector, ImWirePortKind_ConnectionOrConstant);
    const ImPortId out = node.AddOutputPort("sum", TestType_Scalar);

    REQUIRE(a.IsInput());
    REQUIRE(out.IsOutput());
    REQUIRE(strcmp(node.Label, "Add") == 0);
    REQUIRE(node.PortCount(ImPinDirection_Input) == 2);
    REQUIRE(node.PortCount(ImPinDirection_Output) == 1);

    SECTION("ports default to their side's connection limit")
    {
        REQUIRE(node.GetPort(a)->MaxConnections == IMNODE_WIRE_INPUT_MAX_CONNECTIONS);
        REQUIRE(node.GetPort(out)->MaxConnections == IMNODE_WIRE_OUTPUT_MAX_CONNECTIONS);
        REQUIRE(node.GetPort(a)->Side == ImWirePortSide_Left);
        REQUIRE(node.GetPort(out)->Side == ImWirePortSide_Right);
    }

    SECTION("lookup by name")
    {
        REQUIRE(node.FindPort(ImPinDirection_Input, "b") == b);
        REQUIRE(node.FindPort(ImPinDirection_Output, "sum") == out);
        REQUIRE_FALSE(node.FindPort(ImPinDirection_Output, "a")());
        REQUIRE_FALSE(node.FindPort(ImPinDirection_Input, "missing")());
    }

    SECTION("a null name matches only an unnamed port")
    {
        REQUIRE_FALSE(node.FindPort(ImPinDirection_Input, nullptr)());

        const ImPortId unnamed = node.AddInputPort(nullptr, TestType_Scalar);
        REQUIRE(strcmp(node.GetPort(unnamed)->Name, "") == 0);
        REQUIRE(node.FindPort(ImPinDirection_Input, nullptr) == unnamed);
        REQUIRE(node.FindPort(ImPinDirection_Input, "") == unnamed);
    }

    SECTION("queries return nothing for unknown ports")
    {
        const ImPortId stale = ImPortId::Input(ImPortKey(12, 1));

        REQUIRE(node.PortDataType(b) == TestType_Vector);
        REQUIRE_FALSE(node.PortDataType(stale)());
        REQUIRE_FALSE(node.AvailableHook(stale)());
        REQUIRE(node.GetPort(stale) == nullptr);
    }

    SECTION("the same key means different ports on each side")
    {
        const ImPortId mirrored(ImPinDirection_Output, a.Key);
        REQUIRE(node.GetPort(mirrored) == node.GetPort(out));
        REQUIRE(node.GetPort(mirrored) != node.GetPort(a));
    }

    SECTION("dropping on unknown ports or empty hooks fails")
    {
        ImNodeError error = node.DropConnection(ImPortId::Output(ImPortKey(5, 1)), ImHookId(0, 1));
        REQUIRE(error.Kind == ImNodeError_BadPort);
        REQUIRE(error.Port == ImPortId::Output(ImPortKey(5, 1)));

        error = node.DropConnection(a, node.AvailableHook(a).Value);
        REQUIRE(error.Kind == ImNodeError_PortError);
        REQUIRE(error.PortError == ImPortError_NoConnection);
        REQUIRE(error.Port == a);
    }

    SECTION("removing a port keeps the declaration order of the rest")
    {
        const ImPortId c = node.AddInputPort("c", TestType_Scalar);

        REQUIRE(node.RemovePort(b));
        REQUIRE_FALSE(node.RemovePort(b));
        REQUIRE(node.PortCount(ImPinDirection_Input) == 2);
        const ImVector<ImPortKey>& order = node.GetPortOrder(ImPinDirection_Input);
        REQUIRE(order.Size == 2);
        REQUIRE(order[0] == a.Key);
        REQUIRE(order[1] == c.Key);
        REQUIRE_FALSE(node.FindPort(ImPinDirection_Input, "b")());
    }
}

TEST_CASE("Constant only ports never expose a hook", "[node]")
{
    ImWireNode node;
    const ImPortId value = node.AddInputPort("value", TestType_Scalar, ImWirePortKind_ConstantOnly);

    REQUIRE(node.GetPort(value) != nullptr);
    REQUIRE(node.GetPort(value)->AvailableHook()());
    REQUIRE_FALSE(node.AvailableHook(value)());
    REQUIRE(node.PortDataType(value) == TestType_Scalar);
}

TEST_CASE("Inline values feed the node until a connection takes over", "[node]")
{
    ScalarGraph g;

    float    scale = 2.0f;
    float    bias  = 0.5f;
    ImPortId constant, either;

    const bool found = g.Graph.NodeMut(g.B, [&](ImWireNode& node)
    {
        constant = node.AddInputPort("scale", TestType_Scalar, ImWirePortKind_ConstantOnly);
        either   = node.AddInputPort("bias", TestType_Scalar, ImWirePortKind_ConnectionOrConstant);

        REQUIRE(node.SetPortValue(constant, &scale));
        REQUIRE(node.SetPortValue(either, &bias));
        REQUIRE(node.SetPortShownInline(either, false));
        REQUIRE_FALSE(node.SetPortValue(ImPortId::Input(ImPortKey(40, 1)), &scale));
    });
    REQUIRE(found);

    const ImWireNode& B = *g.Graph.GetNode(g.B);

    REQUIRE(B.GetPort(constant)->Value == &scale);
    REQUIRE(B.GetPort(constant)->ShownInline);
    REQUIRE(B.GetPort(either)->Value == &bias);
    REQUIRE_FALSE(B.GetPort(either)->ShownInline);

    REQUIRE(B.UsesInlineValue(constant));
    REQUIRE(B.UsesInlineValue(either));
    REQUIRE_FALSE(B.UsesInlineValue(g.BIn));
    REQUIRE_FALSE(B.UsesInlineValue(ImPortId::Input(ImPortKey(40, 1))));

    SECTION("a connection overrides the inline value")
    {
        REQUIRE(g.Graph.ConnectPorts(g.A, g.AOut, g.B, either).Ok());
        REQUIRE_FALSE(B.UsesInlineValue(either));
        REQUIRE(B.GetPort(either)->Value == &bias);

        REQUIRE(g.Graph.DropConnection({ g.B, either, BoundHook(g.Graph, g.B, either) }).Ok());
        REQUIRE(B.UsesInlineValue(either));
    }
}

TEST_CASE("Nodes know whether a graph owns them", "[node]")
{
    ImWireNode loose("Loose");
    REQUIRE_FALSE(loose.IsInGraph());
    REQUIRE(loose.GetID().IsNull());

    ImWireGraph graph;
    const ImNodeId id = graph.AddNode("Owned");
    REQUIRE(graph.GetNode(id)->IsInGraph());
    REQUIRE(graph.GetNode(id)->GetID() == id);
}

TEST_CASE("Node moves keep ports and label", "[node]")
{
    ImWireNode node("Source");
    const ImPortId out = node.AddOutputPort("out", TestType_Scalar);

    ImWireNode moved(std::move(node));
    REQUIRE(strcmp(moved.Label, "Source") == 0);
    REQUIRE(moved.GetPort(out) != nullptr);
    REQUIRE(moved.GetPortOrder(ImPinDirection_Output).Size == 1);
    REQUIRE(node.Label == nullptr);
    REQUIRE(node.PortCount(ImPinDirection_Output) == 0);

    ImWireNode assigned("Other");
    assigned = std::move(moved);
    REQUIRE(strcmp(assigned.Label, "Source") == 0);
    REQUIRE(assigned.FindPort(ImPinDirection_Output, "out") == out);
}

TEST_CASE("Removing a connected port repairs its remotes", "[node][graph]")
{
    ScalarGraph g;

    REQUIRE(g.Graph.ConnectPorts(g.A, g.AOut, g.B, g.BIn).Ok());
    REQUIRE(g.Graph.ConnectPorts(g.B, g.BOut, g.C, g.CIn).Ok());
    REQUIRE(g.Graph.ConnectionCount() == 2);

    const bool found = g.Graph.NodeMut(g.B, [&](ImWireNode& node)
    {
        REQUIRE(node.RemovePort(g.BIn));
    });

    REQUIRE(found);
    REQUIRE(g.Graph.ConnectionCount() == 1);
    REQUIRE(HooksBoundToNode(g.Graph, g.A, g.B) == 0);
    REQUIRE(g.Graph.GetNode(g.A)->GetPort(g.AOut)->ConnectionCount() == 0);
    REQUIRE(g.Graph.GetNode(g.B)->GetPort(g.BIn) == nullptr);
    REQUIRE(g.Graph.ValidateConnections());
}
