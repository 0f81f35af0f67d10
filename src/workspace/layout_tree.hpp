#pragma once

#include <termdeck/types.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace termdeck
{

class JsonValue;

// ─── LayoutNode ──────────────────────────────────────────────────────────────
// A leaf or internal node in the grid split tree.
// Leaf nodes hold a panel id; internal nodes hold two children + a ratio.

class LayoutNode
{
   public:
    using NodeId = uint32_t;

    explicit LayoutNode(PanelId panel_id);
    ~LayoutNode() = default;

    LayoutNode(const LayoutNode&)            = delete;
    LayoutNode& operator=(const LayoutNode&) = delete;

    // ── Tree structure ──────────────────────────────────────────────────

    // Split this leaf into two children. The current panel moves to the first
    // child, `new_panel` becomes the second. Returns the new leaf, or nullptr
    // if this node is already split.
    LayoutNode* split(SplitDirection direction, PanelId new_panel, float ratio = 0.5f);

    // Collapse this internal node, keeping one child's content in place.
    bool unsplit(bool keep_first);

    // ── Queries ─────────────────────────────────────────────────────────

    bool is_leaf() const { return !first_ && !second_; }
    bool is_split() const { return first_ && second_; }

    NodeId         id() const { return id_; }
    const PanelId& panel_id() const { return panel_id_; }

    SplitDirection split_direction() const { return split_direction_; }
    float          split_ratio() const { return split_ratio_; }
    void           set_split_ratio(float ratio);

    LayoutNode* first() const { return first_.get(); }
    LayoutNode* second() const { return second_.get(); }
    LayoutNode* parent() const { return parent_; }

    // ── Traversal ───────────────────────────────────────────────────────

    void collect_leaves(std::vector<const LayoutNode*>& out) const;
    void collect_panels(std::vector<PanelId>& out) const;

    LayoutNode*       find_panel(const PanelId& panel_id);
    const LayoutNode* find_panel(const PanelId& panel_id) const;
    LayoutNode*       find_by_id(NodeId id);

    size_t count_leaves() const;

    // ── Serialization ───────────────────────────────────────────────────

    JsonValue                          to_json() const;
    static std::unique_ptr<LayoutNode> from_json(const JsonValue& json);

    // ── Constants ────────────────────────────────────────────────────────

    static constexpr float SPLITTER_WIDTH = 6.0f;
    static constexpr float MIN_PANE_SIZE  = 150.0f;
    static constexpr float MIN_RATIO      = 0.1f;
    static constexpr float MAX_RATIO      = 0.9f;

   private:
    friend class LayoutTree;

    NodeId  id_;
    PanelId panel_id_;

    SplitDirection split_direction_ = SplitDirection::Horizontal;
    float          split_ratio_     = 0.5f;

    LayoutNode*                 parent_ = nullptr;
    std::unique_ptr<LayoutNode> first_;
    std::unique_ptr<LayoutNode> second_;

    static NodeId next_id();
};

// ─── Computed layout ─────────────────────────────────────────────────────────

struct PaneRect
{
    PanelId panel_id;
    Rect    bounds;
};

struct SplitterRect
{
    LayoutNode::NodeId node_id = 0;
    SplitDirection     direction = SplitDirection::Horizontal;
    Rect               bounds;
    Rect               container;   // bounds of the split node itself
    float              ratio = 0.5f;   // effective (floored) ratio
};

struct TreeLayout
{
    std::vector<PaneRect>     panes;       // leaf order
    std::vector<SplitterRect> splitters;   // pre-order
};

// ─── LayoutTree ──────────────────────────────────────────────────────────────
// Owns the root of the grid split tree. Empty when the grid has no panels.

class LayoutTree
{
   public:
    LayoutTree() = default;

    LayoutTree(const LayoutTree&)            = delete;
    LayoutTree& operator=(const LayoutTree&) = delete;
    LayoutTree(LayoutTree&&)                 = default;
    LayoutTree& operator=(LayoutTree&&)      = default;

    bool   empty() const { return !root_; }
    size_t size() const { return root_ ? root_->count_leaves() : 0; }
    void   clear() { root_.reset(); }

    const LayoutNode* root() const { return root_.get(); }

    // Split the leaf holding `target`. False if `target` is absent or
    // `new_panel` is already in the tree.
    bool split(const PanelId& target,
               SplitDirection direction,
               const PanelId& new_panel,
               float          ratio = 0.5f);

    // Add `panel` beside the whole current tree, sized as one more equal
    // share. Becomes the root when the tree is empty.
    bool append(const PanelId& panel, SplitDirection direction);

    // Remove the leaf holding `panel`; its sibling takes the parent's place.
    bool remove(const PanelId& panel);

    bool                 contains(const PanelId& panel) const;
    std::vector<PanelId> panel_order() const;

    // Split ratio of the node with the given id (clamped to MIN/MAX_RATIO).
    bool set_ratio(LayoutNode::NodeId node_id, float ratio);
    std::optional<float> ratio(LayoutNode::NodeId node_id) const;

    // Pure: computes pane and splitter rects without touching the tree.
    TreeLayout compute(const Rect& bounds) const;

    // Ratio range honoring MIN_PANE_SIZE on both sides of a split whose
    // extent along the drag axis is `extent`.
    static void ratio_bounds(float extent, float& min_ratio, float& max_ratio);

    JsonValue to_json() const;
    bool      from_json(const JsonValue& json);

   private:
    std::unique_ptr<LayoutNode> root_;

    LayoutNode* find_node(LayoutNode::NodeId node_id) const;
};

}   // namespace termdeck
