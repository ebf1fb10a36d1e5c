/**
 * @file site_discovery.hpp
 * @brief Finds application installations below a root directory.
 *
 * Every immediate subdirectory holding the configuration marker file is a site; other
 * entries are skipped. Iteration is lazy and can be restarted by calling begin() again.
 */

#ifndef SITE_DISCOVERY_HPP
#define SITE_DISCOVERY_HPP

#include <cstddef>
#include <expected>
#include <iterator>
#include <optional>
#include <string>
#include <vector>
#include "backup_types.hpp"

class SiteDiscovery {
public:
    /**
     * @brief Input iterator over the sites of one directory scan.
     */
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Site;
        using difference_type = std::ptrdiff_t;
        using pointer = const Site*;
        using reference = const Site&;

        iterator() = default;

        reference operator*() const { return *current; }
        pointer operator->() const { return &*current; }
        iterator& operator++();
        iterator operator++(int);

        friend bool operator==(const iterator& a, const iterator& b) { return a.entries == b.entries; }
        friend bool operator!=(const iterator& a, const iterator& b) { return !(a == b); }

    private:
        friend class SiteDiscovery;
        iterator(fs::directory_iterator entries, std::string marker);

        /**
         * @brief Moves forward to the next valid site, or to the end.
         */
        void settle();

        fs::directory_iterator entries;
        std::string marker;
        std::optional<Site> current;
    };

    /**
     * @brief Constructs a discovery over @p root.
     *
     * @param root Root installations directory (e.g. "/var/www/").
     * @param marker Marker file name identifying a site (e.g. "wp-config.php").
     */
    SiteDiscovery(fs::path root, std::string marker);

    /**
     * @brief Starts a fresh scan. A missing or unreadable root yields an empty range.
     */
    iterator begin() const;
    iterator end() const;

    /**
     * @brief Collects all sites, sorted by identifier.
     *
     * @return std::expected<std::vector<Site>, BackupError> The sites, or NoSitesFound
     *         when the scan yields none.
     */
    std::expected<std::vector<Site>, BackupError> discover() const;

    /**
     * @brief Turns a directory entry into a Site when it is a valid installation.
     */
    static std::optional<Site> inspect(const fs::directory_entry& entry, const std::string& marker);

private:
    fs::path root;
    std::string marker;
};

#endif // SITE_DISCOVERY_HPP
