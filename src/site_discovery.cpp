#include "site_discovery.hpp"
#include <algorithm>
#include <format>
#include <utility>

SiteDiscovery::iterator::iterator(fs::directory_iterator entries, std::string marker)
    : entries(std::move(entries)), marker(std::move(marker)) {
    settle();
}

void SiteDiscovery::iterator::settle() {
    current.reset();
    std::error_code ec;
    while (entries != fs::directory_iterator()) {
        if (auto site = inspect(*entries, marker)) {
            current = std::move(site);
            return;
        }
        entries.increment(ec);
        if (ec) {
            entries = fs::directory_iterator();
        }
    }
}

SiteDiscovery::iterator& SiteDiscovery::iterator::operator++() {
    std::error_code ec;
    entries.increment(ec);
    if (ec) {
        entries = fs::directory_iterator();
    }
    settle();
    return *this;
}

SiteDiscovery::iterator SiteDiscovery::iterator::operator++(int) {
    iterator previous = *this;
    ++*this;
    return previous;
}

SiteDiscovery::SiteDiscovery(fs::path root, std::string marker)
    : root(std::move(root)), marker(std::move(marker)) {}

SiteDiscovery::iterator SiteDiscovery::begin() const {
    std::error_code ec;
    fs::directory_iterator entries(root, ec);
    if (ec) {
        return end();
    }
    return iterator(std::move(entries), marker);
}

SiteDiscovery::iterator SiteDiscovery::end() const {
    return iterator();
}

std::optional<Site> SiteDiscovery::inspect(const fs::directory_entry& entry, const std::string& marker) {
    std::error_code ec;
    if (!entry.is_directory(ec)) {
        return std::nullopt;
    }
    fs::path configFile = entry.path() / marker;
    if (!fs::is_regular_file(configFile, ec)) {
        return std::nullopt;
    }
    fs::path installPath = fs::absolute(entry.path(), ec);
    if (ec) {
        installPath = entry.path();
    }
    return Site{entry.path().filename().string(), installPath, installPath / marker};
}

std::expected<std::vector<Site>, BackupError> SiteDiscovery::discover() const {
    std::vector<Site> sites;
    for (const auto& site : *this) {
        sites.push_back(site);
    }
    if (sites.empty()) {
        return std::unexpected(BackupError{BackupErrorCode::NoSitesFound,
                                           std::format("No installations found in {}", root.string())});
    }
    std::ranges::sort(sites, {}, &Site::id);
    return sites;
}
