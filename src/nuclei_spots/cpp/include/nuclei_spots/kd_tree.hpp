/**
 * @file kd_tree.hpp
 * @brief Static 2-D k-d tree for nearest-neighbor and radius queries
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef NUCLEI_SPOTS_KD_TREE_HPP
#define NUCLEI_SPOTS_KD_TREE_HPP

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "nuclei_spots/common.hpp"

namespace nuclei_spots {

/**
 * @struct Neighbor
 * @brief Result of a nearest-neighbor query
 */
struct Neighbor {
    size_t index;       ///< Index of the point in the tree's input order
    scalar_t distance;  ///< Euclidean distance to the query
};

/**
 * @class KDTree
 * @brief Immutable k-d tree over a fixed set of 2-D points
 *
 * The tree is built once in the constructor and never updated; rebuild it
 * from scratch when the point set changes. Indices returned by queries refer
 * to the order of the points passed to the constructor.
 */
class KDTree {
public:
    KDTree() = default;

    /**
     * @brief Build the tree
     * @param points Point set (may be empty)
     * @param leaf_size Maximum number of points stored in a leaf
     */
    explicit KDTree(std::vector<Point2D> points, size_t leaf_size = 8);

    size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }
    const std::vector<Point2D>& points() const { return points_; }

    /**
     * @brief Closest point to the query (Euclidean)
     *
     * Among equidistant points the one with the lowest index is returned.
     *
     * @throws std::invalid_argument if the tree is empty
     */
    Neighbor nearest(const Point2D& query) const;

    /**
     * @brief Indices of all points within a distance of the query (inclusive)
     * @return Indices in ascending order
     */
    std::vector<size_t> queryRadius(const Point2D& query, scalar_t radius) const;

    /**
     * @brief All index pairs (i, j), i < j, whose points lie within a distance
     * @return Pairs in lexicographic order
     */
    std::vector<std::pair<size_t, size_t>> queryPairs(scalar_t radius) const;

private:
    struct Node {
        size_t begin;
        size_t end;
        int axis;         // 0 = row, 1 = col
        scalar_t split;
        int32_t left;     // -1 for leaves
        int32_t right;
    };

    int32_t build(size_t begin, size_t end);
    void nearestSearch(int32_t node, const Point2D& query, size_t& best, scalar_t& best_d2) const;
    void radiusSearch(int32_t node, const Point2D& query, scalar_t radius2,
                      std::vector<size_t>& out) const;

    static scalar_t coord(const Point2D& p, int axis) { return axis == 0 ? p.row : p.col; }

    std::vector<Point2D> points_;
    std::vector<size_t> order_;
    std::vector<Node> nodes_;
    size_t leaf_size_ = 8;
    int32_t root_ = -1;
};

} // namespace nuclei_spots

#endif // NUCLEI_SPOTS_KD_TREE_HPP
