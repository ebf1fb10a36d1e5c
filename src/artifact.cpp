#include "artifact.hpp"
#include <array>
#include <ctime>
#include <format>

namespace {

struct ArtifactName {
    std::string stem;
    std::string extension;
};

ArtifactName baseName(ArtifactKind kind, const std::string& siteId, const std::string& timestamp) {
    switch (kind) {
        case ArtifactKind::Archive:
            return {std::format("{}_{}", siteId, timestamp), ".tar.gz"};
        case ArtifactKind::DatabaseDump:
            return {std::format("db_{}_{}", siteId, timestamp), ".sql"};
        case ArtifactKind::ConfigSnapshot:
            return {std::format("nginx_{}_{}", siteId, timestamp), ".txt"};
    }
    return {std::format("{}_{}", siteId, timestamp), ""};
}

bool taken(const fs::path& candidate, ArtifactKind kind) {
    std::error_code ec;
    if (fs::exists(candidate, ec)) {
        return true;
    }
    // A dump ends up as <name>.sql.gz, so that name counts as taken too.
    if (kind == ArtifactKind::DatabaseDump) {
        fs::path compressed = candidate;
        compressed += ".gz";
        return fs::exists(compressed, ec);
    }
    return false;
}

} // namespace

std::string formatTimestamp(std::chrono::system_clock::time_point timePoint) {
    auto timeT = std::chrono::system_clock::to_time_t(timePoint);
    std::tm local{};
    localtime_r(&timeT, &local);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%d-%m-%Y_%H-%M-%S", &local);
    return timeBuf;
}

fs::path artifactPath(const fs::path& destination,
                      ArtifactKind kind,
                      const std::string& siteId,
                      const std::string& timestamp) {
    auto name = baseName(kind, siteId, timestamp);
    fs::path candidate = destination / (name.stem + name.extension);
    for (int suffix = 1; taken(candidate, kind); ++suffix) {
        candidate = destination / std::format("{}-{}{}", name.stem, suffix, name.extension);
    }
    return candidate;
}

std::string humanReadableSize(std::uintmax_t bytes) {
    static constexpr std::array<char, 5> units = {'K', 'M', 'G', 'T', 'P'};
    if (bytes < 1024) {
        return std::format("{}B", bytes);
    }
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    value /= 1024.0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }
    if (value < 10.0) {
        return std::format("{:.1f}{}", value, units[unit]);
    }
    return std::format("{:.0f}{}", value, units[unit]);
}
