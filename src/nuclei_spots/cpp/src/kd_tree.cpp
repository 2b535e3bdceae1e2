/**
 * @file kd_tree.cpp
 * @brief Implementation of the static 2-D k-d tree
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "nuclei_spots/kd_tree.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace nuclei_spots {

KDTree::KDTree(std::vector<Point2D> points, size_t leaf_size)
    : points_(std::move(points)),
      leaf_size_(std::max<size_t>(leaf_size, 1))
{
    for (const Point2D& p : points_) {
        if (!std::isfinite(p.row) || !std::isfinite(p.col)) {
            throw std::invalid_argument("KDTree: point coordinates must be finite");
        }
    }

    order_.resize(points_.size());
    std::iota(order_.begin(), order_.end(), size_t(0));

    if (!points_.empty()) {
        nodes_.reserve(2 * (points_.size() / leaf_size_ + 1));
        root_ = build(0, points_.size());
    }
}

int32_t KDTree::build(size_t begin, size_t end) {
    const int32_t id = static_cast<int32_t>(nodes_.size());
    nodes_.push_back(Node{begin, end, 0, 0.0, -1, -1});

    if (end - begin <= leaf_size_) {
        return id;
    }

    // Split along the axis with the larger spread
    scalar_t min_r = std::numeric_limits<scalar_t>::max();
    scalar_t max_r = std::numeric_limits<scalar_t>::lowest();
    scalar_t min_c = min_r;
    scalar_t max_c = max_r;
    for (size_t i = begin; i < end; ++i) {
        const Point2D& p = points_[order_[i]];
        min_r = std::min(min_r, p.row);
        max_r = std::max(max_r, p.row);
        min_c = std::min(min_c, p.col);
        max_c = std::max(max_c, p.col);
    }
    const int axis = (max_c - min_c) > (max_r - min_r) ? 1 : 0;

    const size_t mid = begin + (end - begin) / 2;
    std::nth_element(order_.begin() + begin, order_.begin() + mid, order_.begin() + end,
                     [this, axis](size_t a, size_t b) {
                         return coord(points_[a], axis) < coord(points_[b], axis);
                     });

    const scalar_t split = coord(points_[order_[mid]], axis);
    const int32_t left = build(begin, mid);
    const int32_t right = build(mid, end);

    Node& node = nodes_[id];
    node.axis = axis;
    node.split = split;
    node.left = left;
    node.right = right;
    return id;
}

Neighbor KDTree::nearest(const Point2D& query) const {
    if (points_.empty()) {
        throw std::invalid_argument("KDTree::nearest: query on an empty index");
    }
    if (!std::isfinite(query.row) || !std::isfinite(query.col)) {
        throw std::invalid_argument("KDTree::nearest: query coordinates must be finite");
    }
    size_t best = std::numeric_limits<size_t>::max();
    scalar_t best_d2 = std::numeric_limits<scalar_t>::infinity();
    nearestSearch(root_, query, best, best_d2);
    return Neighbor{best, std::sqrt(best_d2)};
}

void KDTree::nearestSearch(int32_t node_id, const Point2D& query, size_t& best,
                           scalar_t& best_d2) const
{
    const Node& node = nodes_[node_id];

    if (node.left < 0) {
        for (size_t i = node.begin; i < node.end; ++i) {
            const size_t idx = order_[i];
            const scalar_t d2 = points_[idx].distanceSquared(query);
            if (d2 < best_d2 || (d2 == best_d2 && idx < best)) {
                best_d2 = d2;
                best = idx;
            }
        }
        return;
    }

    const scalar_t diff = coord(query, node.axis) - node.split;
    const int32_t near_child = diff < 0 ? node.left : node.right;
    const int32_t far_child = diff < 0 ? node.right : node.left;

    nearestSearch(near_child, query, best, best_d2);
    // Visit on equality too so ties resolve to the lowest index
    if (diff * diff <= best_d2) {
        nearestSearch(far_child, query, best, best_d2);
    }
}

std::vector<size_t> KDTree::queryRadius(const Point2D& query, scalar_t radius) const {
    std::vector<size_t> out;
    if (points_.empty() || radius < 0) {
        return out;
    }
    radiusSearch(root_, query, radius * radius, out);
    std::sort(out.begin(), out.end());
    return out;
}

void KDTree::radiusSearch(int32_t node_id, const Point2D& query, scalar_t radius2,
                          std::vector<size_t>& out) const
{
    const Node& node = nodes_[node_id];

    if (node.left < 0) {
        for (size_t i = node.begin; i < node.end; ++i) {
            const size_t idx = order_[i];
            if (points_[idx].distanceSquared(query) <= radius2) {
                out.push_back(idx);
            }
        }
        return;
    }

    const scalar_t diff = coord(query, node.axis) - node.split;
    if (diff < 0) {
        radiusSearch(node.left, query, radius2, out);
        if (diff * diff <= radius2) radiusSearch(node.right, query, radius2, out);
    } else {
        radiusSearch(node.right, query, radius2, out);
        if (diff * diff <= radius2) radiusSearch(node.left, query, radius2, out);
    }
}

std::vector<std::pair<size_t, size_t>> KDTree::queryPairs(scalar_t radius) const {
    std::vector<std::pair<size_t, size_t>> pairs;
    for (size_t i = 0; i < points_.size(); ++i) {
        for (size_t j : queryRadius(points_[i], radius)) {
            if (j > i) {
                pairs.emplace_back(i, j);
            }
        }
    }
    std::sort(pairs.begin(), pairs.end());
    return pairs;
}

} // namespace nuclei_spots
