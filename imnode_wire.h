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

#ifndef IMNODE_WIRE_H
#define IMNODE_WIRE_H

#include <imgui.h>

#include <climits>
#include <compare>
#include <type_traits>
#include <utility>

// =====================================================================================================================
// Configuration
// =====================================================================================================================

#ifndef IMNODE_WIRE_INPUT_MAX_CONNECTIONS
#define IMNODE_WIRE_INPUT_MAX_CONNECTIONS 1 // Default hook limit of input ports, 0 is unbounded
#endif

#ifndef IMNODE_WIRE_OUTPUT_MAX_CONNECTIONS
#define IMNODE_WIRE_OUTPUT_MAX_CONNECTIONS 0
#endif

// =====================================================================================================================
// Type & Forward Definitions
// =====================================================================================================================


// Data Structures -----------------------------------------------------------------------------------------------------

struct ImUserID;
struct ImWireHook;
struct ImWirePort;
struct ImWireNode;
struct ImWireGraph;
struct ImWireGraphLoader;
struct ImWireSettings;
struct ImWireDragState;

template<typename T> struct ImOptional;
template<typename Tag> struct ImSlotKey;
template<typename T, typename Key> struct ImSlotMap;


// Typedefs ------------------------------------------------------------------------------------------------------------

// Identifiers
struct ImNodeTag;
struct ImPortTag;
struct ImHookTag;

using ImNodeId  = ImSlotKey<ImNodeTag>;
using ImPortKey = ImSlotKey<ImPortTag>;
using ImHookId  = ImSlotKey<ImHookTag>;

// Port Types
using ImWireDataType = int;
using ImWirePortKind = int;
using ImWirePortSide = int;
using ImPinDirection = bool;

// Errors
using ImPortError        = int;
using ImNodeErrorKind    = int;
using ImConnectErrorKind = int;
using ImDropErrorKind    = int;

// Gestures
using ImWireDragPhase  = int;
using ImWireDragReject = int;

// Callbacks
using ImWireTypeCompatibility = bool(*)(ImWireDataType output, ImWireDataType input);
using ImWireTypeName          = const char*(*)(ImWireDataType type);

// =====================================================================================================================
// Enums
// =====================================================================================================================

enum ImPinDirection_
{
	ImPinDirection_Input  = false
,   ImPinDirection_Output = true
};

enum ImWirePortKind_
{
    ImWirePortKind_ConnectionOnly = 0     // Value only comes from an incoming connection
,   ImWirePortKind_ConstantOnly           // Inline value only, never accepts a connection
,   ImWirePortKind_ConnectionOrConstant   // Connection takes precedence over the inline value
};

enum ImWirePortSide_
{
    ImWirePortSide_Left = 0
,   ImWirePortSide_Right
};

enum ImPortError_
{
    ImPortError_None = 0
,   ImPortError_BadHook
,   ImPortError_HookOccupied
,   ImPortError_NoConnection
};

enum ImNodeError_
{
    ImNodeError_None = 0
,   ImNodeError_BadPort
,   ImNodeError_ConstantOnly
,   ImNodeError_PortError
};

enum ImConnectError_
{
    ImConnectError_None = 0
,   ImConnectError_BadOutputNode
,   ImConnectError_BadInputNode
,   ImConnectError_OutputNodeError
,   ImConnectError_InputNodeError
,   ImConnectError_WrongDirection
,   ImConnectError_SelfLoop
,   ImConnectError_IncompatibleTypes
,   ImConnectError_AlreadyConnected
};

enum ImDropError_
{
    ImDropError_None = 0
,   ImDropError_BadNode
,   ImDropError_NodeError
};

enum ImWireDragPhase_
{
    ImWireDragPhase_Idle = 0
,   ImWireDragPhase_Dragging
};

enum ImWireDragReject_
{
    ImWireDragReject_None = 0
,   ImWireDragReject_NotDragging
,   ImWireDragReject_OriginLost
,   ImWireDragReject_BadTarget
,   ImWireDragReject_SameDirection
,   ImWireDragReject_SelfLoop
,   ImWireDragReject_IncompatibleTypes
,   ImWireDragReject_NoAvailableHook
,   ImWireDragReject_ConnectFailed
};

// =====================================================================================================================
// Data Structures
// =====================================================================================================================

/**
 * \brief Optional value, similar to std::optional
 * \tparam T Value Type
 */
template<typename T>
struct ImOptional
{
    using value_type      = T;
    using reference       = T&;
    using const_reference = const T&;

    T    Value;
    bool Set;

    ImOptional() : Value(), Set(false) { }
    ImOptional(const T& value) : Value(value), Set(true) { }
    ImOptional(const ImOptional&) = default;
    ImOptional(ImOptional&&)      = default;
    ~ImOptional()                 = default;

    ImOptional& operator=(const ImOptional& other) = default;
    ImOptional& operator=(ImOptional&& other)      = default;

    ImOptional& operator=(const T& value) { Value = value; Set = true; return *this; }

    bool operator==(const ImOptional& o) const { return Set == o.Set && (!Set || Value == o.Value); }
    bool operator==(const T& o)          const { return Set && Value == o; }

          T* operator->()       { IM_ASSERT(Set); return &Value; }
    const T* operator->() const { IM_ASSERT(Set); return &Value; }

    bool operator()() const { return Set; }

    const T& ValueOr(const T& fallback) const { return Set ? Value : fallback; }

    void Reset() { Set = false; Value = T(); }
};

/**
 * \brief Generation checked key into an ImSlotMap
 * \tparam Tag Distinguishes key spaces so node, port and hook keys can't be mixed up
 */
template<typename Tag>
struct ImSlotKey
{
    static constexpr ImU32 NullIndex = 0xFFFFFFFF;

    ImU32 Index;
    ImU32 Generation;

    ImSlotKey() : Index(NullIndex), Generation(0) { }
    ImSlotKey(ImU32 idx, ImU32 gen) : Index(idx), Generation(gen) { }

    [[nodiscard]] bool IsNull() const { return Index == NullIndex; }

    bool operator==(const ImSlotKey&) const = default;
    auto operator<=>(const ImSlotKey&) const = default;
};

template<typename Key, typename V>
struct ImSlotEntry
{
    Key Id;
    V&  Value;
};

/**
 * \brief Arena of heap allocated values addressed by generational keys. Erasing a value bumps the generation of its
 *        slot so any key still referring to it is rejected instead of aliasing whatever reuses the slot.
 * \tparam T Value Type
 * \tparam Key ImSlotKey instantiation used to address values
 */
template<typename T, typename Key>
struct ImSlotMap
{
    template<typename MapT, typename ValueT> class basic_iterator;

    using key_type       = Key;
    using value_type     = T;
    using iterator       = basic_iterator<ImSlotMap, T>;
    using const_iterator = basic_iterator<const ImSlotMap, const T>;

    ImVector<T*>    Data;
    ImVector<ImU32> Generations;
    ImVector<ImU32> Freed;
    int             Count;

    ImSlotMap() : Count(0) { }
    ImSlotMap(const ImSlotMap&) = delete;
    ImSlotMap(ImSlotMap&& other) : Count(0) { Swap(other); }
    ~ImSlotMap();

    ImSlotMap& operator=(const ImSlotMap&) = delete;
    ImSlotMap& operator=(ImSlotMap&& other) { if(this != &other) { Clear(); Swap(other); } return *this; }

    [[nodiscard]] int  Size()  const { return Count; }
    [[nodiscard]] bool Empty() const { return Count == 0; }

    template<typename... Args>
    Key  Insert(Args&&... args);
    bool Erase(Key key);
    bool Extract(Key key, T* out);
    void Clear();
    void Swap(ImSlotMap& other);

    // Deserialization, RebuildFreeList must follow the last Restore before inserting again. Keys beyond MaxIndex are
    // refused.
    static constexpr ImU32 MaxIndex = INT_MAX - 1;

    bool Restore(Key key, T* value);
    void RebuildFreeList();

    [[nodiscard]] bool Contains(Key key) const;

    T*       Get(Key key)       { return Contains(key) ? Data[static_cast<int>(key.Index)] : nullptr; }
    const T* Get(Key key) const { return Contains(key) ? Data[static_cast<int>(key.Index)] : nullptr; }

    T&       operator[](Key key)       { IM_ASSERT(Contains(key)); return *Data[static_cast<int>(key.Index)]; }
    const T& operator[](Key key) const { IM_ASSERT(Contains(key)); return *Data[static_cast<int>(key.Index)]; }

    Key KeyAt(int idx) const { return Key(static_cast<ImU32>(idx), Generations[idx]); }

    template<typename MapT, typename ValueT>
    class basic_iterator
    {
    public:
        basic_iterator(MapT* map, int idx) : map_(map), idx_(idx) { _Skip(); }

        basic_iterator& operator++() { ++idx_; _Skip(); return *this; }

        bool operator==(const basic_iterator& o) const { return idx_ == o.idx_; }
        bool operator!=(const basic_iterator& o) const { return idx_ != o.idx_; }

        ImSlotEntry<Key, ValueT> operator*() const { return { map_->KeyAt(idx_), *map_->Data[idx_] }; }

    private:
        void _Skip() { while(idx_ < map_->Data.Size && map_->Data[idx_] == nullptr) ++idx_; }

        MapT* map_;
        int   idx_;
    };

    iterator       begin()       { return iterator(this, 0); }
    iterator       end()         { return iterator(this, Data.Size); }
    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end()   const { return const_iterator(this, Data.Size); }
};

struct ImUserID
{
    const char* String;
    int         Int;

    ImUserID() : String(nullptr), Int(0) { }
};

struct ImPortId
{
    ImPinDirection Direction;
    ImPortKey      Key;

    ImPortId() : Direction(ImPinDirection_Input) { }
    ImPortId(ImPinDirection direction, ImPortKey key) : Direction(direction), Key(key) { }

    static ImPortId Input(ImPortKey key)  { return { ImPinDirection_Input,  key }; }
    static ImPortId Output(ImPortKey key) { return { ImPinDirection_Output, key }; }

    [[nodiscard]] bool IsInput()  const { return Direction == ImPinDirection_Input; }
    [[nodiscard]] bool IsOutput() const { return Direction == ImPinDirection_Output; }

    bool operator==(const ImPortId&) const = default;
};

/**
 * \brief One endpoint of a live connection, seen from the node that owns it
 */
struct ImConnectionId
{
    ImNodeId Node;
    ImPortId Port;
    ImHookId Hook;

    bool operator==(const ImConnectionId&) const = default;
};

struct ImHookConnection
{
    ImHookId       Hook;
    ImConnectionId Remote;
};

struct ImPortConnection
{
    ImPortId       Port;
    ImHookId       Hook;
    ImConnectionId Remote;
};

struct ImSeveredConnection
{
    ImConnectionId NodeSide;
    ImConnectionId RemoteSide;
};

struct ImDroppedConnection
{
    ImConnectionId Origin;
    ImConnectionId Remote;
};


// Errors --------------------------------------------------------------------------------------------------------------

struct ImNodeError
{
    ImNodeErrorKind Kind;
    ImPortId        Port;
    ImPortError     PortError;

    ImNodeError() : Kind(ImNodeError_None), PortError(ImPortError_None) { }
    ImNodeError(ImNodeErrorKind kind, ImPortId port, ImPortError port_error = ImPortError_None)
        : Kind(kind), Port(port), PortError(port_error) { }

    [[nodiscard]] bool Ok() const { return Kind == ImNodeError_None; }
};

struct ImConnectError
{
    ImConnectErrorKind Kind;
    ImNodeId           Node;
    ImNodeError        NodeError;

    ImConnectError() : Kind(ImConnectError_None) { }
    ImConnectError(ImConnectErrorKind kind, ImNodeId node, ImNodeError node_error = ImNodeError())
        : Kind(kind), Node(node), NodeError(node_error) { }

    [[nodiscard]] bool Ok() const { return Kind == ImConnectError_None; }
};

struct ImDropError
{
    ImDropErrorKind Kind;
    ImNodeId        Node;
    ImNodeError     NodeError;

    ImDropError() : Kind(ImDropError_None) { }
    ImDropError(ImDropErrorKind kind, ImNodeId node, ImNodeError node_error = ImNodeError())
        : Kind(kind), Node(node), NodeError(node_error) { }

    [[nodiscard]] bool Ok() const { return Kind == ImDropError_None; }
};


// Ports & Nodes -------------------------------------------------------------------------------------------------------

/**
 * \brief Connection slot of a port, empty while it is waiting for the next connection
 */
struct ImWireHook
{
    ImOptional<ImConnectionId> Remote;
};

/**
 * \brief Addressable connection point of a node. Exactly one empty hook is kept available while the port is below its
 *        connection limit. Only the owning node binds or drops hooks.
 */
struct ImWirePort
{
    char*          Name;
    ImWireDataType Type;
    int            MaxConnections; // 0 is unbounded
    ImWirePortSide Side;
    ImWirePortKind Kind;
    ImUserID       UserID;
    void*          Value;          // Inline constant, not owned
    bool           ShownInline;

    ImWirePort(const char* name, ImWireDataType type, int max_connections, ImWirePortSide side,
               ImWirePortKind kind = ImWirePortKind_ConnectionOnly);
    ImWirePort(const ImWirePort&) = delete;
    ~ImWirePort();

    ImWirePort& operator=(const ImWirePort&) = delete;

    [[nodiscard]] ImWireDataType       DataType()      const { return Type; }
    [[nodiscard]] ImOptional<ImHookId> AvailableHook() const { return Available; }

    [[nodiscard]] int  ConnectionCount() const;
    [[nodiscard]] bool IsConnected()     const { return ConnectionCount() > 0; }
    [[nodiscard]] bool IsFull()          const { return MaxConnections > 0 && ConnectionCount() >= MaxConnections; }

    [[nodiscard]] int  HookCount()       const { return Hooks.Size(); }

    const ImConnectionId* Remote(ImHookId hook) const;

    /**
     * \brief Visit every hook of the port
     * \param fn Called with (ImHookId, const ImConnectionId*), the remote is null for the available hook
     */
    template<typename F>
    void ForEachHook(F&& fn) const
    {
        for(auto [id, hook] : Hooks) fn(id, hook.Remote() ? &hook.Remote.Value : nullptr);
    }

private:
    friend struct ImWireNode;
    friend struct ImWireGraph;
    friend struct ImWireGraphLoader;

    ImSlotMap<ImWireHook, ImHookId> Hooks;
    ImOptional<ImHookId>            Available;

    ImPortError Connect(ImHookId hook, const ImConnectionId& remote);
    ImPortError DropConnection(ImHookId hook, ImConnectionId* out_remote = nullptr);
    void        DropAllConnections(ImVector<ImHookConnection>* out = nullptr);

    void _RecomputeAvailableHook();
};

/**
 * \brief Node of the graph, the sole owner and mutator of its ports. Every connection it drops is queued for the graph
 *        to repair the other side.
 */
struct ImWireNode
{
    char*    Label;
    ImUserID UserID;
    void*    UserData;

    ImWireNode(const char* label = "");
    ImWireNode(const ImWireNode&) = delete;
    ImWireNode(ImWireNode&& other);
    ~ImWireNode();

    ImWireNode& operator=(const ImWireNode&) = delete;
    ImWireNode& operator=(ImWireNode&& other);

    ImPortId AddInputPort(const char* name, ImWireDataType type, ImWirePortKind kind = ImWirePortKind_ConnectionOnly,
                          int max_connections = IMNODE_WIRE_INPUT_MAX_CONNECTIONS);
    ImPortId AddOutputPort(const char* name, ImWireDataType type, int max_connections = IMNODE_WIRE_OUTPUT_MAX_CONNECTIONS);
    bool     RemovePort(ImPortId port);

    bool SetPortValue(ImPortId port, void* value);
    bool SetPortShownInline(ImPortId port, bool shown);

    [[nodiscard]] ImNodeId GetID()     const { return ID; }
    [[nodiscard]] bool     IsInGraph() const { return DropSink != nullptr; }

    [[nodiscard]] ImOptional<ImPortId>       FindPort(ImPinDirection direction, const char* name) const;
    [[nodiscard]] int                        PortCount(ImPinDirection direction) const;
    [[nodiscard]] const ImVector<ImPortKey>& GetPortOrder(ImPinDirection direction) const;

    const ImWirePort* GetPort(ImPortId port) const;

    [[nodiscard]] ImOptional<ImWireDataType> PortDataType(ImPortId port)  const;
    [[nodiscard]] ImOptional<ImHookId>       AvailableHook(ImPortId port) const;

    /**
     * \brief Whether the inline value of the port feeds the node, a connection overrides it on
     *        ConnectionOrConstant ports
     */
    [[nodiscard]] bool UsesInlineValue(ImPortId port) const;

    ImNodeError DropConnection(ImPortId port, ImHookId hook, ImConnectionId* out_remote = nullptr);
    void        DropAllConnections(ImVector<ImPortConnection>* out = nullptr);

private:
    friend struct ImWireGraph;
    friend struct ImWireGraphLoader;

    ImNodeId                         ID;
    ImSlotMap<ImWirePort, ImPortKey> Inputs;
    ImSlotMap<ImWirePort, ImPortKey> Outputs;
    ImVector<ImPortKey>              InputOrder, OutputOrder;
    ImVector<ImDroppedConnection>*   DropSink;

    ImWirePort* _GetPort(ImPortId port);

    ImNodeError Connect(ImPortId port, ImHookId hook, const ImConnectionId& remote);
    void        _QueueDrop(ImPortId port, ImHookId hook, const ImConnectionId& remote);
};


// Graph ---------------------------------------------------------------------------------------------------------------

struct ImWireSettings
{
    bool                    AllowSelfLoops;
    bool                    LogConnections;
    ImWireTypeCompatibility TypeCompatibility; // Null compares types for equality
    ImWireTypeName          TypeName;

    ImWireSettings();
};

/**
 * \brief Arena owning every node. Connections live inside the ports of both endpoints, the graph only orchestrates
 *        operations spanning two nodes and repairs the far side of every dropped connection.
 */
struct ImWireGraph
{
    ImWireSettings Settings;

    ImWireGraph() = default;
    ImWireGraph(const ImWireGraph&) = delete;
    ~ImWireGraph() = default;

    ImWireGraph& operator=(const ImWireGraph&) = delete;

// Nodes ---------------------------------------------------------------------------------------------------------------

    ImNodeId AddNode(const char* label);

    /**
     * \brief Add a node and fill in its ports
     * \param label Title of the node
     * \param build Called with the new node before any connection can reference it
     * \return Id of the new node
     */
    template<typename F>
    ImNodeId AddNode(const char* label, F&& build)
    {
        ImNodeId id = AddNode(label);
        build(Nodes[id]);
        return id;
    }

    [[nodiscard]] const ImWireNode* GetNode(ImNodeId id) const { return Nodes.Get(id); }
    [[nodiscard]] bool              ContainsNode(ImNodeId id) const { return Nodes.Contains(id); }
    [[nodiscard]] int               NodeCount() const { return Nodes.Size(); }

    /**
     * \brief Run fn against a node, then repair every connection it dropped
     * \return False, or an empty optional for non void fn, if the node doesn't exist
     */
    template<typename F>
    auto NodeMut(ImNodeId id, F&& fn)
    {
        using R = decltype(fn(std::declval<ImWireNode&>()));

        ImWireNode* node = Nodes.Get(id);
        if constexpr (std::is_void_v<R>)
        {
            if(node == nullptr) return false;
            fn(*node);
            ProcessDroppedConnections();
            return true;
        }
        else
        {
            if(node == nullptr) return ImOptional<R>();
            ImOptional<R> result(fn(*node));
            ProcessDroppedConnections();
            return result;
        }
    }

    bool RemoveNode(ImNodeId id, ImVector<ImSeveredConnection>* out_severed = nullptr, ImWireNode* out_node = nullptr);

    template<typename F>
    void ForEachNode(F&& fn) const
    {
        for(auto [id, node] : Nodes) fn(id, node);
    }

    void Clear();

// Connections ---------------------------------------------------------------------------------------------------------

    ImConnectError AddConnection(const ImConnectionId& output, const ImConnectionId& input);
    ImConnectError ConnectPorts(ImNodeId output_node, ImPortId output_port, ImNodeId input_node, ImPortId input_port);
    ImDropError    DropConnection(const ImConnectionId& id, ImConnectionId* out_remote = nullptr);

    void ProcessDroppedConnections();

    [[nodiscard]] int PendingDropCount() const { return DroppedConnections.Size; }

    [[nodiscard]] int  ConnectionCount() const;
    [[nodiscard]] bool IsConnected(const ImConnectionId& a, const ImConnectionId& b) const;
    void               GetConnections(ImNodeId node, ImPortId port, ImVector<ImConnectionId>* out) const;
    [[nodiscard]] bool ValidateConnections() const;

    /**
     * \brief Visit every connection once, from its output side
     * \param fn Called with (const ImConnectionId& output, const ImConnectionId& input)
     */
    template<typename F>
    void ForEachConnection(F&& fn) const
    {
        for(auto [node_id, node] : Nodes)
        {
            for(auto [port_key, port] : node.Outputs)
            {
                for(auto [hook_id, hook] : port.Hooks)
                {
                    if(!hook.Remote()) continue;
                    fn(ImConnectionId{ node_id, ImPortId::Output(port_key), hook_id }, hook.Remote.Value);
                }
            }
        }
    }

// Types ---------------------------------------------------------------------------------------------------------------

    [[nodiscard]] bool        AreTypesCompatible(ImWireDataType output, ImWireDataType input) const;

    /**
     * \brief Display name of a type
     * \param buf Receives the numeric fallback when no TypeName callback is set
     * \return The callback's name, or buf
     */
    const char* GetTypeName(ImWireDataType type, char* buf, int buf_size) const;

private:
    friend struct ImWireGraphLoader;

    ImSlotMap<ImWireNode, ImNodeId> Nodes;
    ImVector<ImDroppedConnection>   DroppedConnections;

    ImConnectError _ValidateConnection(const ImConnectionId& output, const ImConnectionId& input) const;
};


// Gestures ------------------------------------------------------------------------------------------------------------

/**
 * \brief In progress drag-to-connect gesture. Dragging from a bound hook detaches the connection and keeps dragging
 *        from its other end.
 */
struct ImWireDragState
{
    ImWireDragPhase            Phase;
    ImNodeId                   OriginNode;
    ImPortId                   OriginPort;
    ImOptional<ImConnectionId> Detached;

    ImWireDragState();

    [[nodiscard]] bool IsDragging() const { return Phase == ImWireDragPhase_Dragging; }

    bool             Begin(ImWireGraph& graph, const ImConnectionId& endpoint);
    ImWireDragReject CanDropOn(const ImWireGraph& graph, ImNodeId node, ImPortId port) const;
    ImWireDragReject Release(ImWireGraph& graph, ImNodeId node, ImPortId port, ImConnectError* out_error = nullptr);
    void             Cancel();
};

// =====================================================================================================================
// Functionality
// =====================================================================================================================

namespace ImNodeWire
{
// Errors --------------------------------------------------------------------------------------------------------------

    const char* GetPortErrorName(ImPortError error);
    const char* GetNodeErrorName(ImNodeErrorKind kind);
    const char* GetConnectErrorName(ImConnectErrorKind kind);
    const char* GetDropErrorName(ImDropErrorKind kind);
    const char* GetDragRejectName(ImWireDragReject reject);
}

// =====================================================================================================================
// Template Implementations
// =====================================================================================================================


// ImSlotMap -----------------------------------------------------------------------------------------------------------

template<typename T, typename Key>
ImSlotMap<T, Key>::~ImSlotMap()
{
    for(T* value : Data) IM_DELETE(value);
}

template<typename T, typename Key>
template<typename... Args>
Key ImSlotMap<T, Key>::Insert(Args&&... args)
{
    int idx;
    if(Freed.empty())
    {
        idx = Data.Size;
        Data.push_back(nullptr);
        Generations.push_back(1);
    }
    else
    {
        idx = static_cast<int>(Freed.back()); Freed.pop_back();
    }

    Data[idx] = IM_NEW(T)(std::forward<Args>(args)...);
    ++Count;
    return KeyAt(idx);
}

template<typename T, typename Key>
bool ImSlotMap<T, Key>::Erase(Key key)
{
    if(!Contains(key)) return false;

    const int idx = static_cast<int>(key.Index);
    IM_DELETE(Data[idx]);
    Data[idx] = nullptr;
    ++Generations[idx];
    Freed.push_back(key.Index);
    --Count;
    return true;
}

template<typename T, typename Key>
bool ImSlotMap<T, Key>::Extract(Key key, T* out)
{
    if(!Contains(key)) return false;
    if(out) *out = std::move(*Data[static_cast<int>(key.Index)]);
    return Erase(key);
}

template<typename T, typename Key>
void ImSlotMap<T, Key>::Clear()
{
    // Slots stay allocated with bumped generations, keys handed out before the clear remain stale
    Freed.clear();
    for(int i = Data.Size - 1; i >= 0; --i)
    {
        if(Data[i])
        {
            IM_DELETE(Data[i]);
            Data[i] = nullptr;
            ++Generations[i];
        }
        Freed.push_back(static_cast<ImU32>(i));
    }
    Count = 0;
}

template<typename T, typename Key>
void ImSlotMap<T, Key>::Swap(ImSlotMap& other)
{
    Data.swap(other.Data);
    Generations.swap(other.Generations);
    Freed.swap(other.Freed);
    std::swap(Count, other.Count);
}

template<typename T, typename Key>
bool ImSlotMap<T, Key>::Restore(Key key, T* value)
{
    if(key.IsNull() || key.Index > MaxIndex || value == nullptr) return false;

    const int idx = static_cast<int>(key.Index);
    if(Data.Size <= idx)
    {
        Data.resize(idx + 1, nullptr);
        Generations.resize(idx + 1, 1);
    }

    if(Data[idx] != nullptr) return false;

    Data[idx] = value;
    Generations[idx] = key.Generation;
    ++Count;
    return true;
}

template<typename T, typename Key>
void ImSlotMap<T, Key>::RebuildFreeList()
{
    Freed.clear();
    for(int i = Data.Size - 1; i >= 0; --i)
    {
        if(Data[i] == nullptr) Freed.push_back(static_cast<ImU32>(i));
    }
}

template<typename T, typename Key>
bool ImSlotMap<T, Key>::Contains(Key key) const
{
    if(key.IsNull() || key.Index >= static_cast<ImU32>(Data.Size)) return false;

    const int idx = static_cast<int>(key.Index);
    return Data[idx] != nullptr && Generations[idx] == key.Generation;
}

#endif //IMNODE_WIRE_H
