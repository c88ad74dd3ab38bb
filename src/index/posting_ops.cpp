#include "homeindex/index/posting_ops.hpp"

#include <algorithm>
#include <functional>
#include <queue>
#include <tuple>

namespace homeindex::index {

namespace {

inline void bump(std::size_t* steps, std::size_t n = 1) noexcept {
    if (steps) *steps += n;
}

} // namespace

auto merge_union_two(PostingView a, PostingView b, std::size_t* steps) -> PostingList {
    PostingList out;
    out.reserve(a.size() + b.size());
    std::size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        if (a[i] < b[j]) {
            out.push_back(a[i++]);
        } else if (b[j] < a[i]) {
            out.push_back(b[j++]);
        } else {
            out.push_back(a[i]);
            ++i;
            ++j;
        }
        bump(steps);
    }
    bump(steps, (a.size() - i) + (b.size() - j));
    out.insert(out.end(), a.begin() + static_cast<std::ptrdiff_t>(i), a.end());
    out.insert(out.end(), b.begin() + static_cast<std::ptrdiff_t>(j), b.end());
    return out;
}

auto merge_union_pairwise(std::span<const PostingView> lists, std::size_t* steps) -> PostingList {
    std::vector<PostingView> live;
    live.reserve(lists.size());
    for (const auto& l : lists) {
        if (!l.empty()) live.push_back(l);
    }

    // First round merges neighbouring inputs; later rounds merge neighbouring
    // results, so every id is rescanned once per level of the tree.
    std::vector<PostingList> level;
    level.reserve((live.size() + 1) / 2);
    for (std::size_t i = 0; i < live.size(); i += 2) {
        if (i + 1 < live.size()) {
            level.push_back(merge_union_two(live[i], live[i + 1], steps));
        } else {
            level.emplace_back(live[i].begin(), live[i].end());
            bump(steps, live[i].size());
        }
    }
    while (level.size() > 1) {
        std::vector<PostingList> next;
        next.reserve((level.size() + 1) / 2);
        for (std::size_t i = 0; i < level.size(); i += 2) {
            if (i + 1 < level.size()) {
                next.push_back(merge_union_two(level[i], level[i + 1], steps));
            } else {
                next.push_back(std::move(level[i]));
            }
        }
        level.swap(next);
    }
    return level.empty() ? PostingList{} : std::move(level.front());
}

auto merge_union_heap(std::span<const PostingView> lists, std::size_t* steps) -> PostingList {
    // (head id, list index, position in list)
    using Head = std::tuple<PropertyId, std::size_t, std::size_t>;
    std::priority_queue<Head, std::vector<Head>, std::greater<Head>> heap;

    std::size_t total = 0;
    for (std::size_t li = 0; li < lists.size(); ++li) {
        if (lists[li].empty()) continue;
        heap.emplace(lists[li][0], li, 0);
        total += lists[li].size();
    }

    PostingList out;
    out.reserve(total);
    while (!heap.empty()) {
        auto [id, li, pos] = heap.top();
        heap.pop();
        bump(steps);
        if (out.empty() || out.back() != id) out.push_back(id);
        if (++pos < lists[li].size()) heap.emplace(lists[li][pos], li, pos);
    }
    return out;
}

auto intersect_two(PostingView a, PostingView b, std::size_t* steps) -> PostingList {
    PostingList out;
    out.reserve(std::min(a.size(), b.size()));
    std::size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        bump(steps);
        if (a[i] < b[j]) {
            ++i;
        } else if (b[j] < a[i]) {
            ++j;
        } else {
            out.push_back(a[i]);
            ++i;
            ++j;
        }
    }
    return out;
}

auto intersect_many(std::vector<PostingView> lists, std::size_t* steps) -> PostingList {
    if (lists.empty()) return {};
    std::stable_sort(lists.begin(), lists.end(),
                     [](PostingView x, PostingView y) { return x.size() < y.size(); });
    if (lists.front().empty()) return {};

    PostingList cur(lists.front().begin(), lists.front().end());
    for (std::size_t k = 1; k < lists.size(); ++k) {
        cur = intersect_two(cur, lists[k], steps);
        if (cur.empty()) break;
    }
    return cur;
}

auto is_strictly_ascending(PostingView v) noexcept -> bool {
    return std::adjacent_find(v.begin(), v.end(),
                              [](PropertyId x, PropertyId y) { return x >= y; }) == v.end();
}

} // namespace homeindex::index
