// Copyright 2024 Huawei Cloud Computing Technology Co., Ltd.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef INCLUDED_SRC_TARGETSEAL_COLLECTIONS_NESTED_SET_HPP
#define INCLUDED_SRC_TARGETSEAL_COLLECTIONS_NESTED_SET_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_set>
#include <utility>  // std::move
#include <variant>
#include <vector>

#include "gsl/gsl"
#include "src/targetseal/multithreading/atomic_value.hpp"

namespace TargetSeal {

/// \brief Traversal order of a nested set.
enum class Order : std::uint8_t {
    kStable,   ///< insertion order, direct items and children interleaved
    kCompile,  ///< children before direct items (postorder)
    kNaive     ///< direct items before children (preorder)
};

/// \brief Stable order is compatible with any order, all others only with
/// themselves.
[[nodiscard]] constexpr auto IsCompatible(Order lhs, Order rhs) noexcept
    -> bool {
    return lhs == rhs or lhs == Order::kStable or rhs == Order::kStable;
}

template <class T>
class NestedSetBuilder;

/// \brief Immutable, structurally shared set of items. A set holds direct
/// items and references to other (sealed) sets. Unions never copy or
/// traverse their operands; flattening is deferred until ToList() is called
/// and then memoized.
///
/// Flattening deduplicates by value. If an item is reachable via several
/// paths, only its first occurrence in traversal order is kept. For
/// Order::kStable the traversal is a depth-first walk over the entries in the
/// order they were added to the builder. Nested sets already visited during
/// a traversal are not entered again.
template <class T>
class NestedSet {
    friend class NestedSetBuilder<T>;

    struct Node;
    using NodePtr = std::shared_ptr<Node const>;
    using entry_t = std::variant<T, NodePtr>;

    struct Node {
        Order order;
        std::vector<entry_t> entries;
        AtomicValue<std::vector<T>> flat{};

        Node(Order o, std::vector<entry_t> e) noexcept
            : order{o}, entries{std::move(e)} {}
    };

  public:
    NestedSet() : NestedSet{Order::kStable} {}
    explicit NestedSet(Order order) : node_{EmptyNode(order)} {}

    /// \brief Create a set holding the given items directly.
    [[nodiscard]] static auto Leaf(std::vector<T> const& items,
                                   Order order = Order::kStable)
        -> NestedSet {
        return NestedSetBuilder<T>{order}.AddAll(items).Build();
    }

    /// \brief Union of two sets, sharing both operands.
    [[nodiscard]] static auto Union(NestedSet const& lhs, NestedSet const& rhs)
        -> NestedSet {
        return NestedSetBuilder<T>{lhs.GetOrder()}
            .AddTransitive(lhs)
            .AddTransitive(rhs)
            .Build();
    }

    [[nodiscard]] auto GetOrder() const noexcept -> Order {
        return node_->order;
    }

    /// \brief Whether the set has no items. Sets with children are never
    /// empty, as empty sets are not added as children.
    [[nodiscard]] auto IsEmpty() const noexcept -> bool {
        return node_->entries.empty();
    }

    /// \brief Whether both sets share the same node.
    [[nodiscard]] auto IsSameAs(NestedSet const& other) const noexcept
        -> bool {
        return node_ == other.node_;
    }

    /// \brief Deduplicated items in traversal order. Computed on first call;
    /// subsequent calls return the same sequence.
    [[nodiscard]] auto ToList() const& -> std::vector<T> const& {
        auto const* node = node_.get();
        return node_->flat.SetOnceAndGet([node]() { return Flatten(*node); });
    }

    [[nodiscard]] auto ToList() && -> std::vector<T> {
        return static_cast<NestedSet const&>(*this).ToList();
    }

    [[nodiscard]] auto Size() const -> std::size_t { return ToList().size(); }

    [[nodiscard]] auto begin() const& { return ToList().begin(); }
    [[nodiscard]] auto end() const& { return ToList().end(); }

  private:
    NodePtr node_;

    explicit NestedSet(NodePtr node) noexcept : node_{std::move(node)} {}

    [[nodiscard]] static auto EmptyNode(Order order) -> NodePtr const& {
        static auto const kEmpty = std::array<NodePtr, 3>{
            std::make_shared<Node const>(Order::kStable,
                                         std::vector<entry_t>{}),
            std::make_shared<Node const>(Order::kCompile,
                                         std::vector<entry_t>{}),
            std::make_shared<Node const>(Order::kNaive,
                                         std::vector<entry_t>{})};
        return kEmpty.at(static_cast<std::size_t>(order));
    }

    struct FlattenState {
        Order order;
        std::unordered_set<Node const*> visited;
        std::unordered_set<T> seen;
        std::vector<T> result;

        void AddItem(T const& item) {
            if (seen.insert(item).second) {
                result.push_back(item);
            }
        }
    };

    [[nodiscard]] static auto Flatten(Node const& root) -> std::vector<T> {
        FlattenState state{.order = root.order};
        Collect(root, &state);
        return std::move(state.result);
    }

    static void Collect(Node const& node,
                        gsl::not_null<FlattenState*> const& state) {
        if (not state->visited.insert(&node).second) {
            return;
        }
        auto visit_items = [&node, &state]() {
            for (auto const& entry : node.entries) {
                if (auto const* item = std::get_if<T>(&entry)) {
                    state->AddItem(*item);
                }
            }
        };
        auto visit_children = [&node, &state]() {
            for (auto const& entry : node.entries) {
                if (auto const* child = std::get_if<NodePtr>(&entry)) {
                    Collect(**child, state);
                }
            }
        };
        switch (state->order) {
            case Order::kStable:
                for (auto const& entry : node.entries) {
                    if (auto const* item = std::get_if<T>(&entry)) {
                        state->AddItem(*item);
                    }
                    else {
                        Collect(*std::get<NodePtr>(entry), state);
                    }
                }
                break;
            case Order::kCompile:
                visit_children();
                visit_items();
                break;
            case Order::kNaive:
                visit_items();
                visit_children();
                break;
        }
    }
};

/// \brief Accumulates items and nested sets for a new NestedSet. Adding the
/// same nested set twice (by identity) or an empty set has no effect.
template <class T>
class NestedSetBuilder {
    using set_t = NestedSet<T>;
    using entry_t = typename set_t::entry_t;
    using node_t = typename set_t::Node;

  public:
    explicit NestedSetBuilder(Order order = Order::kStable) noexcept
        : order_{order} {}

    [[nodiscard]] auto GetOrder() const noexcept -> Order { return order_; }

    [[nodiscard]] auto IsEmpty() const noexcept -> bool {
        return entries_.empty();
    }

    auto Add(T item) -> NestedSetBuilder& {
        entries_.emplace_back(std::in_place_index<0>, std::move(item));
        return *this;
    }

    auto AddAll(std::vector<T> const& items) -> NestedSetBuilder& {
        entries_.reserve(entries_.size() + items.size());
        for (auto const& item : items) {
            entries_.emplace_back(std::in_place_index<0>, item);
        }
        return *this;
    }

    /// \brief Add all items of another set without traversing it.
    /// \pre The order of the set is compatible with the order of the builder.
    auto AddTransitive(set_t const& set) -> NestedSetBuilder& {
        Expects(IsCompatible(order_, set.GetOrder()));
        if (not set.IsEmpty() and children_.insert(set.node_.get()).second) {
            entries_.emplace_back(std::in_place_index<1>, set.node_);
        }
        return *this;
    }

    [[nodiscard]] auto Build() const -> set_t {
        if (entries_.empty()) {
            return set_t{order_};
        }
        if (entries_.size() == 1 and entries_.front().index() == 1) {
            auto const& child = std::get<1>(entries_.front());
            if (child->order == order_) {
                return set_t{child};
            }
        }
        return set_t{std::make_shared<node_t const>(order_, entries_)};
    }

  private:
    Order order_;
    std::vector<entry_t> entries_{};
    std::unordered_set<node_t const*> children_{};
};

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_COLLECTIONS_NESTED_SET_HPP
