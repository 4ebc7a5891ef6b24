/*
 * flood.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "flood.hpp"

#include <array>
#include <stack>
#include <utility>

#include <spdlog/spdlog.h>

namespace diffline::algorithm {

namespace {

constexpr std::array<std::pair<i32, i32>, 4> NEIGHBOURS{
    {{1, 0}, {-1, 0}, {0, 1}, {0, -1}}};

}  // namespace

auto FloodFill::fillDFS(const BinaryMask& mask, std::vector<i32>& labels,
                        i32 startX, i32 startY, i32 label) -> usize {
    if (labels.size() != mask.size()) {
        THROW_INVALID_ARGUMENT("Label array has {} entries, mask has {}",
                               labels.size(), mask.size());
    }
    if (!mask.inBounds(startX, startY)) {
        THROW_INVALID_ARGUMENT("Starting coordinates ({}, {}) out of bounds",
                               startX, startY);
    }
    if (label == 0) {
        THROW_INVALID_ARGUMENT("Label 0 is reserved for background");
    }

    const usize startIdx = mask.index(startX, startY);
    if (!mask.test(startX, startY) || labels[startIdx] != 0) {
        return 0;
    }

    std::stack<std::pair<i32, i32>> toVisitStack;

    toVisitStack.emplace(startX, startY);
    labels[startIdx] = label;
    usize filledCells = 1;

    while (!toVisitStack.empty()) {
        auto [x, y] = toVisitStack.top();
        toVisitStack.pop();

        for (auto [dx, dy] : NEIGHBOURS) {
            const i32 newX = x + dx;
            const i32 newY = y + dy;
            if (!mask.inBounds(newX, newY) || !mask.test(newX, newY)) {
                continue;
            }
            const usize idx = mask.index(newX, newY);
            if (labels[idx] == 0) {
                labels[idx] = label;
                filledCells++;
                toVisitStack.emplace(newX, newY);
            }
        }
    }

    return filledCells;
}

auto FloodFill::labelComponents(const BinaryMask& mask) -> ComponentLabels {
    ComponentLabels result;
    result.width = mask.width();
    result.height = mask.height();
    result.labels.assign(mask.size(), 0);

    for (i32 y = 0; y < mask.height(); ++y) {
        for (i32 x = 0; x < mask.width(); ++x) {
            if (!mask.test(x, y) || result.labels[mask.index(x, y)] != 0) {
                continue;
            }
            const i32 label = result.count + 1;
            const usize filled = fillDFS(mask, result.labels, x, y, label);
            result.sizes.push_back(filled);
            result.count = label;
        }
    }

    spdlog::debug("Labeled {} connected components in {}x{} mask",
                  result.count, mask.width(), mask.height());
    return result;
}

}  // namespace diffline::algorithm
