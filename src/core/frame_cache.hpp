/**
 * @file    frame_cache.hpp
 * @brief   Perceptual similarity cache of regenerated region content
 * @license MIT
 *
 * @details
 * Approximate key lookup: a region hits the cache when some stored
 * signature is within `similarity_threshold` Hamming distance of its own.
 * Entries are scanned linearly, which is fine for capacities in the tens to
 * low hundreds. A bucketed / indexed nearest-neighbor structure would be
 * needed beyond that.
 *
 * Eviction is least-frequently-used; ties go to the earliest inserted entry.
 */

#pragma once

#include "core/perceptual_hash.hpp"

#include <opencv2/core.hpp>

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace vwt {

struct CacheConfig {
    std::size_t capacity{100};
    int similarity_threshold{3};   // Max Hamming distance for a hit
};

struct CacheStats {
    std::size_t hits{0};
    std::size_t misses{0};
    std::size_t evictions{0};
};

class PerceptualFrameCache {
public:
    explicit PerceptualFrameCache(const CacheConfig& config = {});

    /**
     * Find regenerated content for a visually similar region
     *
     * Increments the matched entry's access frequency on a hit.
     *
     * @param region  Raw region pixels
     * @return        Stored regenerated pixels, or std::nullopt on a miss
     */
    [[nodiscard]] std::optional<cv::Mat> get(const cv::Mat& region);

    /**
     * Store regenerated content for a region
     *
     * At capacity, evicts the entry with the lowest access frequency first.
     * The new entry starts with frequency 1.
     */
    void put(const cv::Mat& region, const cv::Mat& processed);

    void clear();

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return config_.capacity; }
    [[nodiscard]] const CacheStats& stats() const noexcept { return stats_; }

    // Access frequency of the entry stored under this exact signature
    [[nodiscard]] std::optional<std::size_t> frequency(PerceptualSignature signature) const;

private:
    struct Entry {
        PerceptualSignature signature;
        cv::Mat pixels;
        std::size_t frequency;
    };

    // Index of the nearest entry and its distance, entries_.size() if empty
    [[nodiscard]] std::pair<std::size_t, int> nearest(PerceptualSignature signature) const;

    void evict_least_used();

    CacheConfig config_;
    std::vector<Entry> entries_;   // Insertion order
    CacheStats stats_;
};

}  // namespace vwt
