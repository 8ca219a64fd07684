#include "gridnav/core/Config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace gridnav::core {

std::filesystem::path ConfigPath(const std::filesystem::path& dir) {
    return dir / "gridnav.ini";
}

static std::string_view Trimmed(std::string_view sv) noexcept
{
    const auto space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!sv.empty() && space(sv.front())) sv.remove_prefix(1);
    while (!sv.empty() && space(sv.back())) sv.remove_suffix(1);
    return sv;
}

// Drops a trailing "# ...", "; ..." or "// ..." from a value.
static std::string_view WithoutComment(std::string_view sv) noexcept
{
    std::size_t cut = std::min(sv.find('#'), sv.find(';'));
    cut = std::min(cut, sv.find("//"));
    return Trimmed(sv.substr(0, cut));
}

template <typename T>
static bool ParseNumber(std::string_view sv, T& out) noexcept
{
    sv = Trimmed(sv);
    if (!sv.empty() && sv.front() == '+') sv.remove_prefix(1);

    T v{};
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end || sv.empty())
        return false;

    out = v;
    return true;
}

// 1/0, true/false, yes/no, on/off in any case.
static bool ParseBool(std::string_view sv, bool& out) noexcept
{
    sv = Trimmed(sv);
    if (sv.size() > 5) return false;

    char word[6] = {};
    std::transform(sv.begin(), sv.end(), word,
                   [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
    const std::string_view lower(word, sv.size());

    for (std::string_view yes : { "1", "true", "yes", "on" })
        if (lower == yes) { out = true; return true; }
    for (std::string_view no : { "0", "false", "no", "off" })
        if (lower == no) { out = false; return true; }
    return false;
}

// "x, y, z"
static bool ParseVec3(std::string_view sv, Vec3& out) noexcept
{
    float parts[3] = {};
    for (int i = 0; i < 3; ++i)
    {
        const std::size_t comma = sv.find(',');
        const bool last = (i == 2);
        if (last != (comma == std::string_view::npos))
            return false;
        if (!ParseNumber(sv.substr(0, comma), parts[i]))
            return false;
        if (!last) sv.remove_prefix(comma + 1);
    }
    out = Vec3{ parts[0], parts[1], parts[2] };
    return true;
}

template <typename T>
static void Read(std::string_view v, T& field)
{
    T parsed = field;
    bool ok = false;
    if constexpr (std::is_same_v<T, bool>)
        ok = ParseBool(v, parsed);
    else if constexpr (std::is_same_v<T, Vec3>)
        ok = ParseVec3(v, parsed);
    else
        ok = ParseNumber(v, parsed);

    if (ok)
        field = parsed;
    else
        spdlog::warn("Config: ignoring unparsable value '{}'", v);
}

// key=value lines. Blank lines, [sections] and #/; comment lines are skipped.
void ParseConfig(Config& cfg, std::string_view text)
{
    while (!text.empty())
    {
        const std::size_t eol = text.find('\n');
        const std::string_view line = Trimmed(text.substr(0, eol));
        text.remove_prefix(eol == std::string_view::npos ? text.size() : eol + 1);

        if (line.empty() || line.front() == '#' || line.front() == ';' || line.front() == '[') continue;

        const std::size_t eq = line.find('=');
        if (eq == std::string_view::npos) continue;

        const std::string_view k = Trimmed(line.substr(0, eq));
        const std::string_view v = WithoutComment(line.substr(eq + 1));
        if (k.empty()) continue;

        GridSettings& g = cfg.grid;
        pf::PathSettings& p = cfg.path;

        if      (k == "identifier")        { if (!v.empty()) g.identifier = v; }
        else if (k == "position")          Read(v, g.position);
        else if (k == "boundsMins")        Read(v, g.bounds.mins);
        else if (k == "boundsMaxs")        Read(v, g.bounds.maxs);
        else if (k == "yaw")
        {
            float yaw = g.rotation.Yaw();
            Read(v, yaw);
            g.rotation = Rotation::FromYaw(yaw);
        }
        else if (k == "axisAligned")       Read(v, g.axisAligned);
        else if (k == "standableAngle")    Read(v, g.standableAngle);
        else if (k == "stepSize")          Read(v, g.stepSize);
        else if (k == "cellSize")
        {
            float cs = g.cellSize;
            Read(v, cs);
            if (cs > 0.0f) g.cellSize = cs;
            else spdlog::warn("Config: cellSize must be positive, keeping {}", g.cellSize);
        }
        else if (k == "heightClearance")   Read(v, g.heightClearance);
        else if (k == "widthClearance")    Read(v, g.widthClearance);
        else if (k == "maxDropHeight")     Read(v, g.maxDropHeight);
        else if (k == "gridPerfect")       Read(v, g.gridPerfect);
        else if (k == "worldOnly")         Read(v, g.worldOnly);
        else if (k == "cylinderShaped")    Read(v, g.cylinderShaped);
        else if (k == "pathPartial")       Read(v, p.partial);
        else if (k == "pathMaxDistance")   Read(v, p.maxDistance);
        else if (k == "pathConnections")   Read(v, p.connections);
        else if (k == "pathSimplify")      Read(v, p.simplify);
        else if (k == "pathSegmentSize")   Read(v, p.segmentSize);
        else if (k == "pathIterations")    Read(v, p.iterations);
        else if (k == "retraceInterval")   Read(v, cfg.retraceInterval);
        else if (k == "generateJumps")     Read(v, cfg.generateJumps);
        else if (k == "jumpTag")           { if (!v.empty()) cfg.jump.tag = v; }
        else if (k == "jumpHorizontalSpeed")  Read(v, cfg.jump.horizontalSpeed);
        else if (k == "jumpVerticalSpeed")    Read(v, cfg.jump.verticalSpeed);
        else if (k == "jumpGravity")          Read(v, cfg.jump.gravity);
        else if (k == "jumpGenerateFraction") Read(v, cfg.jump.generateFraction);
        else if (k == "jumpSides")            Read(v, cfg.jump.sidesToCheck);
        else if (k == "workerThreads")     Read(v, cfg.workerThreads);
        else spdlog::debug("Config: unknown key '{}'", k);
    }
}

static void Write(std::ostream& os, const char* key, const Vec3& v)
{
    os << key << '=' << v.x << ", " << v.y << ", " << v.z << "\n";
}

std::string FormatConfig(const Config& cfg)
{
    const GridSettings& g = cfg.grid;
    const pf::PathSettings& p = cfg.path;

    std::ostringstream oss;
    oss << "# grid\n";
    oss << "identifier="      << g.identifier << "\n";
    Write(oss, "position",   g.position);
    Write(oss, "boundsMins", g.bounds.mins);
    Write(oss, "boundsMaxs", g.bounds.maxs);
    oss << "yaw="             << g.rotation.Yaw() << "\n";
    oss << "axisAligned="     << (g.axisAligned ? 1 : 0) << "\n";
    oss << "standableAngle="  << g.standableAngle << "\n";
    oss << "stepSize="        << g.stepSize << "\n";
    oss << "cellSize="        << g.cellSize << "\n";
    oss << "heightClearance=" << g.heightClearance << "\n";
    oss << "widthClearance="  << g.widthClearance << "\n";
    oss << "maxDropHeight="   << g.maxDropHeight << "\n";
    oss << "gridPerfect="     << (g.gridPerfect ? 1 : 0) << "\n";
    oss << "worldOnly="       << (g.worldOnly ? 1 : 0) << "\n";
    oss << "cylinderShaped="  << (g.cylinderShaped ? 1 : 0) << "\n";
    oss << "# paths\n";
    oss << "pathPartial="     << (p.partial ? 1 : 0) << "\n";
    oss << "pathMaxDistance=" << p.maxDistance << "\n";
    oss << "pathConnections=" << (p.connections ? 1 : 0) << "\n";
    oss << "pathSimplify="    << (p.simplify ? 1 : 0) << "\n";
    oss << "pathSegmentSize=" << p.segmentSize << "\n";
    oss << "pathIterations="  << p.iterations << "\n";
    oss << "retraceInterval=" << cfg.retraceInterval << "\n";
    oss << "# jumps\n";
    oss << "generateJumps="   << (cfg.generateJumps ? 1 : 0) << "\n";
    oss << "jumpTag="         << cfg.jump.tag << "\n";
    oss << "jumpHorizontalSpeed="  << cfg.jump.horizontalSpeed << "\n";
    oss << "jumpVerticalSpeed="    << cfg.jump.verticalSpeed << "\n";
    oss << "jumpGravity="          << cfg.jump.gravity << "\n";
    oss << "jumpGenerateFraction=" << cfg.jump.generateFraction << "\n";
    oss << "jumpSides="            << cfg.jump.sidesToCheck << "\n";
    oss << "# runtime\n";
    oss << "workerThreads="   << cfg.workerThreads << "\n";
    return oss.str();
}

bool LoadConfig(Config& cfg, const std::filesystem::path& saveDir)
{
    const auto path = ConfigPath(saveDir);

    std::ifstream f(path, std::ios::binary);
    if (!f) return false; // missing config is normal on first run
    std::ostringstream oss;
    oss << f.rdbuf();
    std::string text = oss.str();

    // Files saved by Windows editors may carry a UTF-8 BOM.
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0)
        text.erase(0, 3);

    ParseConfig(cfg, text);
    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& saveDir)
{
    std::error_code ec;
    std::filesystem::create_directories(saveDir, ec);
    if (ec)
    {
        spdlog::error("SaveConfig: create_directories failed for {} ({}: {})",
                      saveDir.string(), ec.value(), ec.message());
        return false;
    }

    const std::string text = FormatConfig(cfg);
    const auto path = ConfigPath(saveDir);

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        spdlog::warn("SaveConfig: could not open {}", path.string());
        return false;
    }
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(f);
}

} // namespace gridnav::core
