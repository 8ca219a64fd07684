#pragma once
#include "gridnav/grid/Grid.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gridnav {

class GridManager;

namespace detail {
struct GridTable;
}

// Scoped registration. Unregisters its grid when closed or destroyed, unless the
// identifier has been taken over by a newer registration in the meantime or the
// manager is already gone.
class GridRegistration {
public:
    GridRegistration() = default;
    ~GridRegistration() { Close(); }

    GridRegistration(const GridRegistration&) = delete;
    GridRegistration& operator=(const GridRegistration&) = delete;
    GridRegistration(GridRegistration&& o) noexcept;
    GridRegistration& operator=(GridRegistration&& o);

    void Close();
    [[nodiscard]] bool IsOpen() const noexcept { return !_table.expired(); }
    [[nodiscard]] const std::string& Identifier() const noexcept { return _identifier; }

private:
    friend class GridManager;
    GridRegistration(std::weak_ptr<detail::GridTable> table, std::string identifier, std::uint64_t generation)
        : _table(std::move(table)), _identifier(std::move(identifier)), _generation(generation) {}

    std::weak_ptr<detail::GridTable> _table;
    std::string   _identifier;
    std::uint64_t _generation = 0;
};

// Named collection of grids. Owned by whoever runs the simulation and handed to
// the code that needs lookups by identifier. Registrations still open when the
// manager is destroyed turn into no-ops.
class GridManager {
public:
    static constexpr const char* kMainIdentifier = "main";

    // `saveDirectory` may be empty: nothing is ever deleted from disk then.
    explicit GridManager(std::filesystem::path saveDirectory = {}, std::string mapIdentifier = "map");
    ~GridManager();

    GridManager(const GridManager&) = delete;
    GridManager& operator=(const GridManager&) = delete;

    // Registering an identifier already in use replaces (and closes) the old grid.
    // Throws std::invalid_argument on null.
    [[nodiscard]] GridRegistration Register(std::shared_ptr<Grid> grid);

    [[nodiscard]] std::shared_ptr<Grid> Get(const std::string& identifier) const;
    [[nodiscard]] std::shared_ptr<Grid> Main() const { return Get(kMainIdentifier); }
    [[nodiscard]] bool Contains(const std::string& identifier) const;
    [[nodiscard]] std::vector<std::string> Identifiers() const;
    [[nodiscard]] std::size_t Count() const;

    // Returns false if nothing was registered under `identifier`.
    bool Unregister(const std::string& identifier, bool deleteSave = false);

    // "<map>-<grid>", the name a grid is saved under.
    [[nodiscard]] std::string SaveIdentifier(const std::string& identifier) const;
    [[nodiscard]] std::filesystem::path SavePath(const std::string& identifier) const;
    [[nodiscard]] const std::filesystem::path& SaveDirectory() const noexcept { return _saveDirectory; }

private:
    std::filesystem::path _saveDirectory;
    std::string _mapIdentifier;
    std::shared_ptr<detail::GridTable> _table;
};

} // namespace gridnav
