#include "layout_tree.hpp"

#include "core/json.hpp"

#include <algorithm>
#include <atomic>
#include <unordered_set>

namespace termdeck
{

// ─── LayoutNode ──────────────────────────────────────────────────────────────

static std::atomic<LayoutNode::NodeId> s_next_node_id{1};

LayoutNode::NodeId LayoutNode::next_id()
{
    return s_next_node_id.fetch_add(1, std::memory_order_relaxed);
}

LayoutNode::LayoutNode(PanelId panel_id) : id_(next_id()), panel_id_(std::move(panel_id)) {}

LayoutNode* LayoutNode::split(SplitDirection direction, PanelId new_panel, float ratio)
{
    if (is_split())
        return nullptr;

    auto first_child  = std::make_unique<LayoutNode>(std::move(panel_id_));
    auto second_child = std::make_unique<LayoutNode>(std::move(new_panel));

    first_child->parent_  = this;
    second_child->parent_ = this;

    split_direction_ = direction;
    split_ratio_     = std::clamp(ratio, MIN_RATIO, MAX_RATIO);
    panel_id_.clear();

    first_  = std::move(first_child);
    second_ = std::move(second_child);
    return second_.get();
}

bool LayoutNode::unsplit(bool keep_first)
{
    if (is_leaf())
        return false;

    std::unique_ptr<LayoutNode> kept = keep_first ? std::move(first_) : std::move(second_);
    first_.reset();
    second_.reset();

    if (kept->is_leaf())
    {
        panel_id_ = std::move(kept->panel_id_);
        return true;
    }

    // Kept child is internal: adopt its children.
    split_direction_ = kept->split_direction_;
    split_ratio_     = kept->split_ratio_;
    first_           = std::move(kept->first_);
    second_          = std::move(kept->second_);
    first_->parent_  = this;
    second_->parent_ = this;
    return true;
}

void LayoutNode::set_split_ratio(float ratio)
{
    split_ratio_ = std::clamp(ratio, MIN_RATIO, MAX_RATIO);
}

void LayoutNode::collect_leaves(std::vector<const LayoutNode*>& out) const
{
    if (is_leaf())
    {
        out.push_back(this);
        return;
    }
    first_->collect_leaves(out);
    second_->collect_leaves(out);
}

void LayoutNode::collect_panels(std::vector<PanelId>& out) const
{
    if (is_leaf())
    {
        out.push_back(panel_id_);
        return;
    }
    first_->collect_panels(out);
    second_->collect_panels(out);
}

LayoutNode* LayoutNode::find_panel(const PanelId& panel_id)
{
    if (is_leaf())
        return panel_id_ == panel_id ? this : nullptr;
    if (auto* found = first_->find_panel(panel_id))
        return found;
    return second_->find_panel(panel_id);
}

const LayoutNode* LayoutNode::find_panel(const PanelId& panel_id) const
{
    return const_cast<LayoutNode*>(this)->find_panel(panel_id);
}

LayoutNode* LayoutNode::find_by_id(NodeId target_id)
{
    if (id_ == target_id)
        return this;
    if (is_leaf())
        return nullptr;
    if (auto* found = first_->find_by_id(target_id))
        return found;
    return second_->find_by_id(target_id);
}

size_t LayoutNode::count_leaves() const
{
    if (is_leaf())
        return 1;
    return first_->count_leaves() + second_->count_leaves();
}

JsonValue LayoutNode::to_json() const
{
    JsonValue obj = JsonValue::object();
    if (is_leaf())
    {
        obj.set("panel", panel_id_);
        return obj;
    }
    obj.set("direction", std::string(to_string(split_direction_)));
    obj.set("ratio", split_ratio_);
    obj.set("first", first_->to_json());
    obj.set("second", second_->to_json());
    return obj;
}

std::unique_ptr<LayoutNode> LayoutNode::from_json(const JsonValue& json)
{
    if (!json.is_object())
        return nullptr;

    if (const JsonValue* panel = json.find("panel"))
    {
        if (!panel->is_string() || panel->as_string().empty())
            return nullptr;
        return std::make_unique<LayoutNode>(panel->as_string());
    }

    const JsonValue* first_json  = json.find("first");
    const JsonValue* second_json = json.find("second");
    if (!first_json || !second_json)
        return nullptr;

    auto first_child  = from_json(*first_json);
    auto second_child = from_json(*second_json);
    if (!first_child || !second_child)
        return nullptr;

    auto node              = std::make_unique<LayoutNode>(PanelId{});
    node->split_direction_ = split_direction_from_string(json.string_or("direction", "horizontal"));
    node->set_split_ratio(static_cast<float>(json.number_or("ratio", 0.5)));

    first_child->parent_  = node.get();
    second_child->parent_ = node.get();
    node->first_          = std::move(first_child);
    node->second_         = std::move(second_child);
    return node;
}

// ─── LayoutTree ──────────────────────────────────────────────────────────────

bool LayoutTree::split(const PanelId& target,
                       SplitDirection direction,
                       const PanelId& new_panel,
                       float          ratio)
{
    if (!root_ || new_panel.empty() || root_->find_panel(new_panel))
        return false;

    LayoutNode* leaf = root_->find_panel(target);
    if (!leaf)
        return false;
    return leaf->split(direction, new_panel, ratio) != nullptr;
}

bool LayoutTree::append(const PanelId& panel, SplitDirection direction)
{
    if (panel.empty())
        return false;
    if (!root_)
    {
        root_ = std::make_unique<LayoutNode>(panel);
        return true;
    }
    if (root_->find_panel(panel))
        return false;

    const float existing = static_cast<float>(root_->count_leaves());

    auto new_root              = std::make_unique<LayoutNode>(PanelId{});
    auto leaf                  = std::make_unique<LayoutNode>(panel);
    root_->parent_             = new_root.get();
    leaf->parent_              = new_root.get();
    new_root->split_direction_ = direction;
    new_root->set_split_ratio(existing / (existing + 1.0f));
    new_root->first_  = std::move(root_);
    new_root->second_ = std::move(leaf);
    root_             = std::move(new_root);
    return true;
}

bool LayoutTree::remove(const PanelId& panel)
{
    if (!root_)
        return false;

    LayoutNode* leaf = root_->find_panel(panel);
    if (!leaf)
        return false;

    LayoutNode* parent = leaf->parent();
    if (!parent)
    {
        root_.reset();
        return true;
    }
    return parent->unsplit(parent->second() == leaf);
}

bool LayoutTree::contains(const PanelId& panel) const
{
    return root_ && root_->find_panel(panel) != nullptr;
}

std::vector<PanelId> LayoutTree::panel_order() const
{
    std::vector<PanelId> out;
    if (root_)
        root_->collect_panels(out);
    return out;
}

LayoutNode* LayoutTree::find_node(LayoutNode::NodeId node_id) const
{
    return root_ ? root_->find_by_id(node_id) : nullptr;
}

bool LayoutTree::set_ratio(LayoutNode::NodeId node_id, float ratio)
{
    LayoutNode* node = find_node(node_id);
    if (!node || !node->is_split())
        return false;
    node->set_split_ratio(ratio);
    return true;
}

std::optional<float> LayoutTree::ratio(LayoutNode::NodeId node_id) const
{
    LayoutNode* node = find_node(node_id);
    if (!node || !node->is_split())
        return std::nullopt;
    return node->split_ratio();
}

void LayoutTree::ratio_bounds(float extent, float& min_ratio, float& max_ratio)
{
    min_ratio = LayoutNode::MIN_RATIO;
    max_ratio = LayoutNode::MAX_RATIO;

    // Only enforce the pixel floor when both sides can actually get it.
    const float side = LayoutNode::MIN_PANE_SIZE + LayoutNode::SPLITTER_WIDTH * 0.5f;
    if (extent >= 2.0f * side)
    {
        min_ratio = std::max(min_ratio, side / extent);
        max_ratio = std::min(max_ratio, 1.0f - side / extent);
    }
}

namespace
{

void layout_node(const LayoutNode& node, const Rect& bounds, TreeLayout& out)
{
    if (node.is_leaf())
    {
        out.panes.push_back(PaneRect{node.panel_id(), bounds});
        return;
    }

    const bool  horizontal = node.split_direction() == SplitDirection::Horizontal;
    const float extent     = horizontal ? bounds.w : bounds.h;

    float lo, hi;
    LayoutTree::ratio_bounds(extent, lo, hi);
    const float ratio = std::clamp(node.split_ratio(), lo, hi);

    const float half_splitter = LayoutNode::SPLITTER_WIDTH * 0.5f;
    const float origin        = horizontal ? bounds.x : bounds.y;
    const float split_at      = origin + extent * ratio;
    const float first_size    = std::max(split_at - origin - half_splitter, 0.0f);
    const float second_start  = split_at + half_splitter;
    const float second_size   = std::max(origin + extent - second_start, 0.0f);

    SplitterRect splitter;
    splitter.node_id   = node.id();
    splitter.direction = node.split_direction();
    splitter.container = bounds;
    splitter.ratio     = ratio;

    Rect first_bounds, second_bounds;
    if (horizontal)
    {
        first_bounds    = Rect{bounds.x, bounds.y, first_size, bounds.h};
        second_bounds   = Rect{second_start, bounds.y, second_size, bounds.h};
        splitter.bounds = Rect{split_at - half_splitter, bounds.y, LayoutNode::SPLITTER_WIDTH, bounds.h};
    }
    else
    {
        first_bounds    = Rect{bounds.x, bounds.y, bounds.w, first_size};
        second_bounds   = Rect{bounds.x, second_start, bounds.w, second_size};
        splitter.bounds = Rect{bounds.x, split_at - half_splitter, bounds.w, LayoutNode::SPLITTER_WIDTH};
    }

    out.splitters.push_back(splitter);
    layout_node(*node.first(), first_bounds, out);
    layout_node(*node.second(), second_bounds, out);
}

}   // namespace

TreeLayout LayoutTree::compute(const Rect& bounds) const
{
    TreeLayout out;
    if (root_)
        layout_node(*root_, bounds, out);
    return out;
}

JsonValue LayoutTree::to_json() const
{
    return root_ ? root_->to_json() : JsonValue(nullptr);
}

bool LayoutTree::from_json(const JsonValue& json)
{
    if (json.is_null())
    {
        root_.reset();
        return true;
    }

    auto root = LayoutNode::from_json(json);
    if (!root)
        return false;

    std::vector<PanelId> panels;
    root->collect_panels(panels);
    std::unordered_set<PanelId> seen;
    for (const auto& id : panels)
    {
        if (!seen.insert(id).second)
            return false;   // same panel in two leaves
    }

    root_ = std::move(root);
    return true;
}

}   // namespace termdeck
