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

namespace
{
    /**
     * \brief Sink node with a single input of the given limit, fed by sources added on demand
     */
    struct FanIn
    {
        struct Source
        {
            ImNodeId Node;
            ImPortId Out;
        };

        ImWireGraph Graph;
        ImNodeId    Sink;
        ImPortId    In;

        explicit FanIn(int max_connections)
        {
            Sink = Graph.AddNode("Sink", [&](ImWireNode& node)
            {
                In = node.AddInputPort("in", TestType_Scalar, ImWirePortKind_ConnectionOnly, max_connections);
            });
        }

        const ImWirePort& Port() const { return *Graph.GetNode(Sink)->GetPort(In); }

        Source AddSource()
        {
            Source source;
            source.Node = Graph.AddNode("Source", [&source](ImWireNode& node)
            {
                source.Out = node.AddOutputPort("out", TestType_Scalar);
            });
            return source;
        }

        ImConnectionId Output(const Source& source) const { return Endpoint(Graph, source.Node, source.Out); }
        ImConnectionId Input(ImHookId hook)         const { return { Sink, In, hook }; }
    };
}

// =====================================================================================================================
// Port
// =====================================================================================================================

TEST_CASE("Bounded port tracks its available hook", "[port]")
{
    FanIn             f(2);
    const ImWirePort& port = f.Port();

    REQUIRE(port.DataType() == TestType_Scalar);
    REQUIRE(port.HookCount() == 1);
    REQUIRE(port.AvailableHook()());
    REQUIRE_FALSE(port.IsConnected());

    const ImHookId       first   = port.AvailableHook().Value;
    const FanIn::Source  source0 = f.AddSource();
    const ImConnectionId output0 = f.Output(source0);
    REQUIRE(f.Graph.AddConnection(output0, f.Input(first)).Ok());

    REQUIRE(port.ConnectionCount() == 1);
    REQUIRE(port.AvailableHook()());
    REQUIRE(port.AvailableHook().Value != first);
    REQUIRE(*port.Remote(first) == output0);
    REQUIRE(port.Remote(port.AvailableHook().Value) == nullptr);

    SECTION("reaching the limit leaves no available hook")
    {
        const ImHookId       second  = port.AvailableHook().Value;
        const ImConnectionId output1 = f.Output(f.AddSource());
        REQUIRE(f.Graph.AddConnection(output1, f.Input(second)).Ok());

        REQUIRE(port.IsFull());
        REQUIRE_FALSE(port.AvailableHook()());
        REQUIRE(port.HookCount() == 2);

        const FanIn::Source extra = f.AddSource();

        ImConnectError error = f.Graph.AddConnection(f.Output(extra), f.Input(second));
        REQUIRE(error.NodeError.PortError == ImPortError_HookOccupied);

        error = f.Graph.AddConnection(f.Output(extra), f.Input(ImHookId(9, 1)));
        REQUIRE(error.NodeError.PortError == ImPortError_HookOccupied);

        REQUIRE(port.ConnectionCount() == 2);
        REQUIRE(*port.Remote(second) == output1);

        SECTION("dropping a connection frees a slot")
        {
            ImConnectionId remote;
            REQUIRE(f.Graph.DropConnection(f.Input(first), &remote).Ok());
            REQUIRE(remote == output0);

            REQUIRE_FALSE(port.IsFull());
            REQUIRE(port.AvailableHook()());
            REQUIRE(port.HookCount() == 2);

            // The dropped hook is gone for good
            REQUIRE(port.Remote(first) == nullptr);
            REQUIRE(f.Graph.DropConnection(f.Input(first)).NodeError.PortError == ImPortError_BadHook);
            REQUIRE_FALSE(port.AvailableHook() == first);
        }
    }

    SECTION("a bound hook can't be connected again")
    {
        const ImConnectError error = f.Graph.AddConnection(f.Output(f.AddSource()), f.Input(first));
        REQUIRE(error.NodeError.PortError == ImPortError_HookOccupied);
        REQUIRE(*port.Remote(first) == output0);
    }

    SECTION("unknown hooks are rejected")
    {
        const ImConnectError error = f.Graph.AddConnection(f.Output(f.AddSource()), f.Input(ImHookId(42, 1)));
        REQUIRE(error.NodeError.PortError == ImPortError_BadHook);
        REQUIRE(f.Graph.DropConnection(f.Input(ImHookId(42, 1))).NodeError.PortError == ImPortError_BadHook);
    }

    SECTION("dropping the empty hook reports no connection")
    {
        const ImHookId empty = port.AvailableHook().Value;
        REQUIRE(f.Graph.DropConnection(f.Input(empty)).NodeError.PortError == ImPortError_NoConnection);
        REQUIRE(port.AvailableHook() == empty);
    }

    SECTION("dropping everything returns every binding")
    {
        const FanIn::Source source1 = f.AddSource();
        const ImConnectionId output1 = f.Output(source1);
        REQUIRE(f.Graph.AddConnection(output1, f.Input(port.AvailableHook().Value)).Ok());

        ImVector<ImPortConnection> dropped;
        REQUIRE(f.Graph.NodeMut(f.Sink, [&](ImWireNode& node) { node.DropAllConnections(&dropped); }));

        REQUIRE(dropped.Size == 2);
        REQUIRE(dropped[0].Hook == first);
        REQUIRE(dropped[0].Remote == output0);
        REQUIRE(dropped[1].Remote == output1);

        REQUIRE(port.ConnectionCount() == 0);
        REQUIRE(port.HookCount() == 1);
        REQUIRE(port.AvailableHook()());

        REQUIRE(f.Graph.GetNode(source0.Node)->GetPort(source0.Out)->ConnectionCount() == 0);
        REQUIRE(f.Graph.GetNode(source1.Node)->GetPort(source1.Out)->ConnectionCount() == 0);
        REQUIRE(f.Graph.ValidateConnections());
    }
}

TEST_CASE("Unbounded port always has an available hook", "[port]")
{
    ImWireGraph graph;

    ImPortId out;
    const ImNodeId source = graph.AddNode("Source", [&](ImWireNode& node) { out = node.AddOutputPort("out", TestType_Vector); });
    const ImWirePort& port = *graph.GetNode(source)->GetPort(out);

    for(int i = 0; i < 8; ++i)
    {
        ImPortId in;
        const ImNodeId sink = graph.AddNode("Sink", [&](ImWireNode& node) { in = node.AddInputPort("in", TestType_Vector); });

        REQUIRE(port.AvailableHook()());
        REQUIRE(graph.ConnectPorts(source, out, sink, in).Ok());
    }

    REQUIRE(port.ConnectionCount() == 8);
    REQUIRE(port.HookCount() == 9);
    REQUIRE_FALSE(port.IsFull());

    int empty = 0;
    int bound = 0;
    port.ForEachHook([&](ImHookId hook, const ImConnectionId* remote)
    {
        if(remote) ++bound;
        else
        {
            ++empty;
            REQUIRE(port.AvailableHook() == hook);
        }
    });

    REQUIRE(empty == 1);
    REQUIRE(bound == 8);
}

TEST_CASE("Available hook is a pure read", "[port]")
{
    FanIn f(1);

    const ImOptional<ImHookId> first  = f.Port().AvailableHook();
    const ImOptional<ImHookId> second = f.Port().AvailableHook();

    REQUIRE(first == second);
    REQUIRE(f.Port().HookCount() == 1);
}
