/*
 * union_find.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-18

Description: Disjoint-set forest with path compression

**************************************************/

#ifndef DIFFLINE_ALGORITHM_UNION_FIND_HPP
#define DIFFLINE_ALGORITHM_UNION_FIND_HPP

#include <map>
#include <numeric>
#include <vector>

#include "diffline/error/exception.hpp"
#include "diffline/type/numeric.hpp"

namespace diffline::algorithm {

/**
 * @brief Disjoint sets over the dense index range [0, size).
 */
class UnionFind {
public:
    explicit UnionFind(usize size) : parent_(size), rank_(size, 0) {
        std::iota(parent_.begin(), parent_.end(), usize{0});
    }

    [[nodiscard]] auto size() const noexcept -> usize { return parent_.size(); }

    /**
     * @brief Representative of the set containing element. Compresses the
     * path it walks.
     */
    auto find(usize element) -> usize {
        if (element >= parent_.size()) {
            THROW_INVALID_ARGUMENT("Element {} out of range [0, {})", element,
                                   parent_.size());
        }
        usize root = element;
        while (parent_[root] != root) {
            root = parent_[root];
        }
        while (parent_[element] != root) {
            usize next = parent_[element];
            parent_[element] = root;
            element = next;
        }
        return root;
    }

    /**
     * @brief Merge the sets containing a and b.
     * @return true if they were distinct sets.
     */
    auto unite(usize a, usize b) -> bool {
        usize rootA = find(a);
        usize rootB = find(b);
        if (rootA == rootB) {
            return false;
        }
        if (rank_[rootA] < rank_[rootB]) {
            std::swap(rootA, rootB);
        }
        parent_[rootB] = rootA;
        if (rank_[rootA] == rank_[rootB]) {
            ++rank_[rootA];
        }
        return true;
    }

    [[nodiscard]] auto connected(usize a, usize b) -> bool {
        return find(a) == find(b);
    }

    /**
     * @brief Members of every set, each list ascending, sets ordered by their
     * smallest member.
     */
    [[nodiscard]] auto groups() -> std::vector<std::vector<usize>> {
        std::map<usize, usize> slotOfRoot;
        std::vector<std::vector<usize>> result;
        for (usize i = 0; i < parent_.size(); ++i) {
            const usize root = find(i);
            auto [it, inserted] = slotOfRoot.try_emplace(root, result.size());
            if (inserted) {
                result.emplace_back();
            }
            result[it->second].push_back(i);
        }
        return result;
    }

private:
    std::vector<usize> parent_;
    std::vector<u32> rank_;
};

}  // namespace diffline::algorithm

#endif  // DIFFLINE_ALGORITHM_UNION_FIND_HPP
