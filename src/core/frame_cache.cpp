/**
 * @file    frame_cache.cpp
 * @brief   Perceptual similarity cache implementation
 * @license MIT
 */

#include "core/frame_cache.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace vwt {

PerceptualFrameCache::PerceptualFrameCache(const CacheConfig& config)
    : config_(config)
{
    if (config_.capacity == 0) {
        throw std::invalid_argument("Frame cache capacity must be at least 1");
    }
    if (config_.similarity_threshold < 0) {
        throw std::invalid_argument("Frame cache similarity threshold must be >= 0");
    }
    entries_.reserve(config_.capacity);
}

std::pair<std::size_t, int> PerceptualFrameCache::nearest(PerceptualSignature signature) const {
    std::size_t best = entries_.size();
    int min_distance = std::numeric_limits<int>::max();

    for (std::size_t i = 0; i < entries_.size(); ++i) {
        const int distance = hamming_distance(signature, entries_[i].signature);
        if (distance < min_distance) {
            min_distance = distance;
            best = i;
        }
    }
    return {best, min_distance};
}

std::optional<cv::Mat> PerceptualFrameCache::get(const cv::Mat& region) {
    const PerceptualSignature signature = compute_signature(region);
    const auto [index, distance] = nearest(signature);

    if (index < entries_.size() && distance <= config_.similarity_threshold) {
        Entry& entry = entries_[index];
        entry.frequency++;
        stats_.hits++;
        spdlog::debug("Cache hit: distance={} frequency={}", distance, entry.frequency);
        return entry.pixels;
    }

    stats_.misses++;
    return std::nullopt;
}

void PerceptualFrameCache::put(const cv::Mat& region, const cv::Mat& processed) {
    const PerceptualSignature signature = compute_signature(region);

    auto existing = std::find_if(entries_.begin(), entries_.end(),
                                 [signature](const Entry& e) { return e.signature == signature; });
    if (existing != entries_.end()) {
        existing->pixels = processed.clone();
        existing->frequency = 1;
        return;
    }

    if (entries_.size() >= config_.capacity) {
        evict_least_used();
    }

    entries_.push_back(Entry{signature, processed.clone(), 1});
}

void PerceptualFrameCache::evict_least_used() {
    // min_element keeps the first of equal frequencies, i.e. the oldest entry
    auto victim = std::min_element(entries_.begin(), entries_.end(),
                                   [](const Entry& a, const Entry& b) {
                                       return a.frequency < b.frequency;
                                   });
    if (victim == entries_.end()) return;

    spdlog::debug("Cache evict: signature={:016x} frequency={}",
                  victim->signature, victim->frequency);
    entries_.erase(victim);
    stats_.evictions++;
}

void PerceptualFrameCache::clear() {
    entries_.clear();
    stats_ = CacheStats{};
}

std::optional<std::size_t> PerceptualFrameCache::frequency(PerceptualSignature signature) const {
    for (const auto& entry : entries_) {
        if (entry.signature == signature) return entry.frequency;
    }
    return std::nullopt;
}

}  // namespace vwt
