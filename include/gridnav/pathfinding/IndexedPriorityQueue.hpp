#pragma once
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace gridnav::pf {

// Binary min-heap keyed on float priorities, addressed by dense node ids so a
// queued node can have its priority lowered in place.
// Ties pop in first-push order; the search is therefore reproducible.
class IndexedPriorityQueue {
public:
    using Index = int;
    using Key   = float;

    explicit IndexedPriorityQueue(std::size_t capacity = 0) { Reset(capacity); }

    void Reset(std::size_t capacity) {
        _heap.clear();
        _heap.reserve(capacity);
        _slot.assign(capacity, kAbsent);
        _pushes = 0;
    }

    [[nodiscard]] bool Empty() const noexcept { return _heap.empty(); }
    [[nodiscard]] std::size_t Size() const noexcept { return _heap.size(); }

    [[nodiscard]] bool Contains(Index id) const noexcept {
        return id >= 0 && static_cast<std::size_t>(id) < _slot.size() && _slot[id] != kAbsent;
    }

    // Queues `id` with priority `key`, or lowers its priority if it is already
    // queued with a higher one. Returns false when nothing changed.
    bool PushOrDecrease(Index id, Key key) {
        if (static_cast<std::size_t>(id) >= _slot.size()) _slot.resize(static_cast<std::size_t>(id) + 1, kAbsent);

        if (_slot[id] == kAbsent) {
            _heap.push_back(Entry{ id, key, _pushes++ });
            Place(_heap.size() - 1);
            BubbleUp(_heap.size() - 1);
            return true;
        }
        Entry& e = _heap[static_cast<std::size_t>(_slot[id])];
        if (!(key < e.key)) return false;
        e.key = key;
        BubbleUp(static_cast<std::size_t>(_slot[id]));
        return true;
    }

    // Removes and returns the lowest-priority id. Precondition: !empty().
    Index PopMin() {
        const Index top = _heap.front().id;
        _slot[top] = kAbsent;
        _heap.front() = _heap.back();
        _heap.pop_back();
        if (!_heap.empty()) {
            Place(0);
            Sink(0);
        }
        return top;
    }

private:
    struct Entry {
        Index         id;
        Key           key;
        std::uint64_t order;
    };

    static constexpr Index kAbsent = -1;

    static bool Before(const Entry& a, const Entry& b) noexcept {
        return a.key < b.key || (a.key == b.key && a.order < b.order);
    }

    void Place(std::size_t at) noexcept { _slot[_heap[at].id] = static_cast<Index>(at); }

    void SwapEntries(std::size_t a, std::size_t b) noexcept {
        std::swap(_heap[a], _heap[b]);
        Place(a);
        Place(b);
    }

    void BubbleUp(std::size_t at) noexcept {
        while (at > 0) {
            const std::size_t up = (at - 1) / 2;
            if (!Before(_heap[at], _heap[up])) return;
            SwapEntries(at, up);
            at = up;
        }
    }

    void Sink(std::size_t at) noexcept {
        for (;;) {
            std::size_t least = at;
            for (std::size_t child = 2 * at + 1; child <= 2 * at + 2 && child < _heap.size(); ++child)
                if (Before(_heap[child], _heap[least])) least = child;
            if (least == at) return;
            SwapEntries(at, least);
            at = least;
        }
    }

    std::vector<Entry> _heap;
    std::vector<Index> _slot;   // heap position per id, kAbsent when not queued
    std::uint64_t      _pushes = 0;
};

} // namespace gridnav::pf
