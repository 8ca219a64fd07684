#include "gridnav/grid/GridManager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace gridnav {

namespace detail {

struct GridTable {
    struct Entry {
        std::shared_ptr<Grid> grid;
        std::uint64_t generation = 0;
    };

    std::mutex mx;
    std::unordered_map<std::string, Entry> grids;
    std::uint64_t nextGeneration = 0;

    void Release(const std::string& identifier, std::uint64_t generation) {
        std::lock_guard<std::mutex> lk(mx);
        const auto it = grids.find(identifier);
        if (it != grids.end() && it->second.generation == generation) grids.erase(it);
    }
};

} // namespace detail

GridRegistration::GridRegistration(GridRegistration&& o) noexcept
    : _table(std::move(o._table))
    , _identifier(std::move(o._identifier))
    , _generation(o._generation) {}

GridRegistration& GridRegistration::operator=(GridRegistration&& o) {
    if (this != &o) {
        Close();
        _table = std::move(o._table);
        _identifier = std::move(o._identifier);
        _generation = o._generation;
    }
    return *this;
}

void GridRegistration::Close() {
    if (auto table = _table.lock()) table->Release(_identifier, _generation);
    _table.reset();
}

GridManager::GridManager(std::filesystem::path saveDirectory, std::string mapIdentifier)
    : _saveDirectory(std::move(saveDirectory))
    , _mapIdentifier(std::move(mapIdentifier))
    , _table(std::make_shared<detail::GridTable>()) {}

GridManager::~GridManager() = default;

GridRegistration GridManager::Register(std::shared_ptr<Grid> grid) {
    if (!grid) throw std::invalid_argument("GridManager::Register: null grid");
    std::string id = grid->Identifier();

    std::uint64_t generation = 0;
    bool replaced = false;
    {
        std::lock_guard<std::mutex> lk(_table->mx);
        generation = ++_table->nextGeneration;
        auto& entry = _table->grids[id];
        replaced = entry.grid != nullptr;
        entry = detail::GridTable::Entry{ std::move(grid), generation };
    }

    if (replaced) spdlog::info("GridManager: replaced grid '{}'", id);
    else          spdlog::info("GridManager: registered grid '{}'", id);
    return GridRegistration(_table, std::move(id), generation);
}

std::shared_ptr<Grid> GridManager::Get(const std::string& identifier) const {
    std::lock_guard<std::mutex> lk(_table->mx);
    const auto it = _table->grids.find(identifier);
    return it == _table->grids.end() ? nullptr : it->second.grid;
}

bool GridManager::Contains(const std::string& identifier) const {
    std::lock_guard<std::mutex> lk(_table->mx);
    return _table->grids.count(identifier) != 0;
}

std::vector<std::string> GridManager::Identifiers() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lk(_table->mx);
        ids.reserve(_table->grids.size());
        for (const auto& [id, _] : _table->grids) ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t GridManager::Count() const {
    std::lock_guard<std::mutex> lk(_table->mx);
    return _table->grids.size();
}

bool GridManager::Unregister(const std::string& identifier, bool deleteSave) {
    {
        std::lock_guard<std::mutex> lk(_table->mx);
        if (_table->grids.erase(identifier) == 0) return false;
    }
    spdlog::info("GridManager: unregistered grid '{}'", identifier);

    if (deleteSave && !_saveDirectory.empty()) {
        std::error_code ec;
        const auto path = SavePath(identifier);
        if (std::filesystem::remove(path, ec))
            spdlog::info("GridManager: deleted save {}", path.string());
        else if (ec)
            spdlog::warn("GridManager: could not delete {}: {}", path.string(), ec.message());
    }
    return true;
}

std::string GridManager::SaveIdentifier(const std::string& identifier) const {
    return _mapIdentifier + "-" + identifier;
}

std::filesystem::path GridManager::SavePath(const std::string& identifier) const {
    return _saveDirectory / (SaveIdentifier(identifier) + ".json");
}

} // namespace gridnav
