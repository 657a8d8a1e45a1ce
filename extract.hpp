/**
 * Extract Module - dominant colors of an RGBA pixel buffer
 *
 * Plain k-means in RGB space: k centroids sampled from the pixels, a fixed
 * number of assign/recompute rounds, centroids reported in cluster order.
 * Cost is O(ITERATIONS * pixels * k) and nothing here downsamples, so callers
 * shrink large images first (see downsample()).
 */

#ifndef CHROMA_EXTRACT_HPP
#define CHROMA_EXTRACT_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include "convert.hpp"

namespace chroma {
namespace extract {

constexpr int ITERATIONS = 10;
constexpr size_t DEFAULT_COLOR_COUNT = 5;
constexpr int MAX_SAMPLE_SIDE = 100;

struct Point {
    double r, g, b;
};

struct Clustering {
    std::vector<Point> centroids;
    std::vector<size_t> counts;      // pixels per centroid in the last round
    std::vector<size_t> assignment;  // centroid index per pixel, last round
};

// RGBA, 4 bytes per pixel. A trailing partial pixel is dropped.
inline std::vector<Point> to_points(const std::vector<uint8_t>& rgba) {
    std::vector<Point> points;
    points.reserve(rgba.size() / 4);
    for (size_t i = 0; i + 3 < rgba.size(); i += 4) {
        points.push_back({static_cast<double>(rgba[i]),
                          static_cast<double>(rgba[i + 1]),
                          static_cast<double>(rgba[i + 2])});
    }
    return points;
}

inline double distance_sq(const Point& a, const Point& b) {
    double dr = a.r - b.r;
    double dg = a.g - b.g;
    double db = a.b - b.b;
    return dr * dr + dg * dg + db * db;
}

/**
 * Run k-means over the buffer. Initial centroids are drawn uniformly, with
 * replacement, from the pixels using rng; a centroid that attracts no pixels
 * in a round keeps its previous value. No pixels or k == 0 gives an empty
 * result.
 */
inline Clustering cluster(const std::vector<uint8_t>& rgba, size_t k, std::mt19937& rng) {
    Clustering result;
    std::vector<Point> points = to_points(rgba);
    if (points.empty() || k == 0) return result;

    std::uniform_int_distribution<size_t> pick(0, points.size() - 1);
    for (size_t i = 0; i < k; i++) {
        result.centroids.push_back(points[pick(rng)]);
    }

    result.assignment.assign(points.size(), 0);
    for (int iteration = 0; iteration < ITERATIONS; iteration++) {
        std::vector<Point> sums(k, Point{0, 0, 0});
        result.counts.assign(k, 0);

        for (size_t p = 0; p < points.size(); p++) {
            double best = std::numeric_limits<double>::infinity();
            size_t closest = 0;
            for (size_t c = 0; c < k; c++) {
                double d = distance_sq(points[p], result.centroids[c]);
                if (d < best) {
                    best = d;
                    closest = c;
                }
            }
            result.assignment[p] = closest;
            result.counts[closest]++;
            sums[closest].r += points[p].r;
            sums[closest].g += points[p].g;
            sums[closest].b += points[p].b;
        }

        for (size_t c = 0; c < k; c++) {
            size_t n = result.counts[c];
            if (n == 0) continue;
            result.centroids[c] = {sums[c].r / n, sums[c].g / n, sums[c].b / n};
        }
    }

    return result;
}

// Hex per centroid, in cluster index order (not sorted by pixel count).
inline std::vector<std::string> dominant_colors(const std::vector<uint8_t>& rgba, size_t k,
                                                std::mt19937& rng) {
    std::vector<std::string> colors;
    for (const Point& c : cluster(rgba, k, rng).centroids) {
        colors.push_back(rgb_to_hex(c.r, c.g, c.b));
    }
    return colors;
}

inline std::vector<std::string> dominant_colors(const std::vector<uint8_t>& rgba,
                                                size_t k = DEFAULT_COLOR_COUNT,
                                                uint32_t seed = std::mt19937::default_seed) {
    std::mt19937 rng(seed);
    return dominant_colors(rgba, k, rng);
}

/**
 * Nearest-neighbour shrink of a width x height RGBA image so that its longer
 * side is at most max_side. Smaller images are returned as-is. Reports the
 * new dimensions through out_width/out_height.
 */
inline std::vector<uint8_t> downsample(const std::vector<uint8_t>& rgba, int width, int height,
                                       int& out_width, int& out_height,
                                       int max_side = MAX_SAMPLE_SIDE) {
    out_width = width;
    out_height = height;
    if (width <= 0 || height <= 0 || max_side <= 0 ||
        rgba.size() < static_cast<size_t>(width) * height * 4) {
        out_width = out_height = 0;
        return {};
    }
    if (width <= max_side && height <= max_side) return rgba;

    double scale = std::min(static_cast<double>(max_side) / width,
                            static_cast<double>(max_side) / height);
    out_width = std::max(1, std::min(max_side, static_cast<int>(std::lround(width * scale))));
    out_height = std::max(1, std::min(max_side, static_cast<int>(std::lround(height * scale))));

    std::vector<uint8_t> out(static_cast<size_t>(out_width) * out_height * 4);
    for (int y = 0; y < out_height; y++) {
        int sy = std::min(height - 1, static_cast<int>(y / scale));
        for (int x = 0; x < out_width; x++) {
            int sx = std::min(width - 1, static_cast<int>(x / scale));
            size_t src = (static_cast<size_t>(sy) * width + sx) * 4;
            size_t dst = (static_cast<size_t>(y) * out_width + x) * 4;
            for (int i = 0; i < 4; i++) out[dst + i] = rgba[src + i];
        }
    }
    return out;
}

} // namespace extract
} // namespace chroma

#endif // CHROMA_EXTRACT_HPP
