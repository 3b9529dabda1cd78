// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * ItemSim - Item-item similarity engine
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 */

#include "pair_aggregator.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "exception.hpp"
#include "pair_expander.hpp"

namespace itemsim::similarity {

namespace {

[[noreturn]] void overflow(const char* field) {
    spdlog::error("Aggregation overflow in {}", field);
    throw AggregationOverflowException(std::string("Accumulator overflow in ") +
                                       field);
}

auto checkedTerm(std::int64_t term, const char* field) -> double {
    auto value = static_cast<double>(term);
    if (std::fabs(value) >= PairAggregate::EXACT_LIMIT) {
        overflow(field);
    }
    return value;
}

auto checkedSum(double lhs, double rhs, const char* field) -> double {
    double sum = lhs + rhs;
    if (!std::isfinite(sum) || std::fabs(sum) >= PairAggregate::EXACT_LIMIT) {
        overflow(field);
    }
    return sum;
}

auto checkedCount(SupportCount lhs, SupportCount rhs) -> SupportCount {
    if (lhs > std::numeric_limits<SupportCount>::max() - rhs) {
        overflow("supportCount");
    }
    return lhs + rhs;
}

}  // namespace

void PairAggregate::absorb(const PairContribution& contribution) {
    const auto a = static_cast<std::int64_t>(contribution.valueA);
    const auto b = static_cast<std::int64_t>(contribution.valueB);

    // Compute everything first so a failure leaves the aggregate untouched.
    double product =
        checkedSum(sumProduct, checkedTerm(a * b, "sumProduct"), "sumProduct");
    double sqA = checkedSum(sumSqA, checkedTerm(a * a, "sumSqA"), "sumSqA");
    double sqB = checkedSum(sumSqB, checkedTerm(b * b, "sumSqB"), "sumSqB");
    SupportCount count = checkedCount(supportCount, 1);

    sumProduct = product;
    sumSqA = sqA;
    sumSqB = sqB;
    supportCount = count;
}

void PairAggregate::merge(const PairAggregate& other) {
    double product = checkedSum(sumProduct, other.sumProduct, "sumProduct");
    double sqA = checkedSum(sumSqA, other.sumSqA, "sumSqA");
    double sqB = checkedSum(sumSqB, other.sumSqB, "sumSqB");
    SupportCount count = checkedCount(supportCount, other.supportCount);

    sumProduct = product;
    sumSqA = sqA;
    sumSqB = sqB;
    supportCount = count;
}

auto combine(PairAggregate lhs, const PairAggregate& rhs) -> PairAggregate {
    lhs.merge(rhs);
    return lhs;
}

void PairAggregator::ensureOpen() const {
    if (finalized_) {
        throw std::logic_error("PairAggregator is already finalized");
    }
}

void PairAggregator::accumulate(const PairContribution& contribution) {
    ensureOpen();
    if (contribution.itemA >= contribution.itemB) {
        throw std::invalid_argument(
            "Pair contribution must satisfy itemA < itemB, got (" +
            std::to_string(contribution.itemA) + ", " +
            std::to_string(contribution.itemB) + ")");
    }

    table_[contribution.key()].absorb(contribution);
    ++contributions_;
}

auto PairAggregator::absorbProfile(const UserProfile& profile)
    -> std::uint64_t {
    ensureOpen();
    auto absorbed = PairExpander::expand(
        profile, [this](const PairContribution& contribution) {
            accumulate(contribution);
        });
    ++users_;
    return absorbed;
}

void PairAggregator::merge(PairAggregator&& other) {
    ensureOpen();
    if (other.finalized_) {
        throw std::logic_error("Cannot merge a finalized PairAggregator");
    }

    if (table_.empty()) {
        table_ = std::move(other.table_);
    } else {
        if (table_.size() < other.table_.size()) {
            table_.swap(other.table_);
        }
        for (const auto& [key, aggregate] : other.table_) {
            table_[key].merge(aggregate);
        }
    }
    contributions_ += other.contributions_;
    users_ += other.users_;

    other.table_.clear();
    other.contributions_ = 0;
    other.users_ = 0;
}

auto PairAggregator::finalize() -> PairAggregateTable {
    ensureOpen();
    finalized_ = true;
    spdlog::debug("PairAggregator finalized: {} pairs from {} contributions",
                  table_.size(), contributions_);
    return std::exchange(table_, {});
}

auto PairAggregator::find(const PairKey& key) const -> const PairAggregate* {
    auto it = table_.find(key);
    return it == table_.end() ? nullptr : &it->second;
}

}  // namespace itemsim::similarity
