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

#include "movielens_reader.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "similarity/exception.hpp"
#include "text_fields.hpp"

namespace itemsim::io {

MovieLensRatingSource::MovieLensRatingSource(std::string path,
                                             std::ifstream stream,
                                             const RatingFileFormat& format)
    : path_(std::move(path)), stream_(std::move(stream)), format_(format) {}

auto MovieLensRatingSource::open(const std::string& path,
                                 const RatingFileFormat& format)
    -> std::expected<std::unique_ptr<MovieLensRatingSource>, std::string> {
    std::ifstream stream(path);
    if (!stream) {
        spdlog::error("Failed to open ratings file: {}", path);
        return std::unexpected("Failed to open ratings file: " + path);
    }
    spdlog::info("Reading ratings from {}", path);
    return std::unique_ptr<MovieLensRatingSource>(
        new MovieLensRatingSource(path, std::move(stream), format));
}

auto MovieLensRatingSource::next() -> std::optional<similarity::Rating> {
    std::string line;
    while (std::getline(stream_, line)) {
        ++lineNumber_;
        if (isBlank(line)) {
            continue;
        }

        auto fields = splitFields(line, format_.delimiter);
        auto required = std::max({format_.userColumn, format_.itemColumn,
                                  format_.ratingColumn}) + 1;
        if (fields.size() < required) {
            throw similarity::MalformedInputException(
                path_ + ":" + std::to_string(lineNumber_) + ": expected " +
                std::to_string(required) + " fields, found " +
                std::to_string(fields.size()));
        }

        auto userId = parseInt32(fields[format_.userColumn]);
        auto itemId = parseInt32(fields[format_.itemColumn]);
        auto value = parseInt32(fields[format_.ratingColumn]);
        if (!userId || !itemId || !value) {
            throw similarity::MalformedInputException(
                path_ + ":" + std::to_string(lineNumber_) +
                ": non-numeric rating record '" + line + "'");
        }
        return similarity::Rating{*userId, *itemId, *value};
    }

    if (stream_.bad()) {
        throw similarity::MalformedInputException("I/O error while reading " +
                                                  path_);
    }
    return std::nullopt;
}

}  // namespace itemsim::io
