#pragma once
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace gridnav {

namespace tags {
    inline constexpr std::string_view kOccupied = "occupied";
    inline constexpr std::string_view kEdge     = "edge";
    inline constexpr std::string_view kStep     = "step";
    inline constexpr std::string_view kDrop     = "drop";
}

// Small tag set attached to a cell.
//
// The three builtin tags live in an atomic bitset: the main thread flips
// `occupied` while searches on worker threads read it, and a search may see a
// value that is one occupancy pass old. Custom tags are plain strings and are
// only written while the grid is being generated or loaded.
class CellTags {
public:
    enum Builtin : std::uint32_t {
        Occupied = 1u << 0,
        Edge     = 1u << 1,
        Step     = 1u << 2,
    };

    CellTags() = default;
    CellTags(const CellTags& o) : _bits(o._bits.load(std::memory_order_relaxed)), _custom(o._custom) {}
    CellTags& operator=(const CellTags& o) {
        _bits.store(o._bits.load(std::memory_order_relaxed), std::memory_order_relaxed);
        _custom = o._custom;
        return *this;
    }

    [[nodiscard]] bool Has(Builtin flag) const noexcept {
        return (_bits.load(std::memory_order_relaxed) & flag) != 0;
    }
    void Set(Builtin flag, bool on) noexcept {
        if (on) _bits.fetch_or(flag, std::memory_order_relaxed);
        else    _bits.fetch_and(~static_cast<std::uint32_t>(flag), std::memory_order_relaxed);
    }

    [[nodiscard]] bool Has(std::string_view tag) const {
        if (const auto b = ToBuiltin(tag)) return Has(static_cast<Builtin>(b));
        return std::find(_custom.begin(), _custom.end(), tag) != _custom.end();
    }

    [[nodiscard]] bool HasAll(std::initializer_list<std::string_view> list) const {
        return std::all_of(list.begin(), list.end(), [&](std::string_view t) { return Has(t); });
    }
    [[nodiscard]] bool HasAll(const std::vector<std::string>& list) const {
        return std::all_of(list.begin(), list.end(), [&](const std::string& t) { return Has(t); });
    }
    [[nodiscard]] bool HasAny(const std::vector<std::string>& list) const {
        return std::any_of(list.begin(), list.end(), [&](const std::string& t) { return Has(t); });
    }

    void Add(std::string_view tag) {
        if (tag.empty()) return;
        if (const auto b = ToBuiltin(tag)) { Set(static_cast<Builtin>(b), true); return; }
        if (std::find(_custom.begin(), _custom.end(), tag) == _custom.end())
            _custom.emplace_back(tag);
    }

    void Remove(std::string_view tag) {
        if (const auto b = ToBuiltin(tag)) { Set(static_cast<Builtin>(b), false); return; }
        _custom.erase(std::remove(_custom.begin(), _custom.end(), tag), _custom.end());
    }

    void Clear() noexcept {
        _bits.store(0, std::memory_order_relaxed);
        _custom.clear();
    }

    // Every tag, builtin ones first.
    [[nodiscard]] std::vector<std::string> All() const {
        std::vector<std::string> out;
        if (Has(Occupied)) out.emplace_back(tags::kOccupied);
        if (Has(Edge))     out.emplace_back(tags::kEdge);
        if (Has(Step))     out.emplace_back(tags::kStep);
        out.insert(out.end(), _custom.begin(), _custom.end());
        return out;
    }

    [[nodiscard]] const std::vector<std::string>& Custom() const noexcept { return _custom; }

private:
    static std::uint32_t ToBuiltin(std::string_view tag) noexcept {
        if (tag == tags::kOccupied) return Occupied;
        if (tag == tags::kEdge)     return Edge;
        if (tag == tags::kStep)     return Step;
        return 0;
    }

    std::atomic<std::uint32_t> _bits{0};
    std::vector<std::string>   _custom;
};

} // namespace gridnav
