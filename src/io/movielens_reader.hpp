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

#ifndef ITEMSIM_IO_MOVIELENS_READER_HPP
#define ITEMSIM_IO_MOVIELENS_READER_HPP

#include <cstddef>
#include <expected>
#include <fstream>
#include <memory>
#include <optional>
#include <string>

#include "similarity/rating_source.hpp"

namespace itemsim::io {

/**
 * @brief Layout of a delimited ratings file
 */
struct RatingFileFormat {
    char delimiter = '\t';  ///< Field separator (MovieLens u.data uses TAB)
    std::size_t userColumn = 0;
    std::size_t itemColumn = 1;
    std::size_t ratingColumn = 2;
};

/**
 * @brief Streams ratings out of a MovieLens style ratings file
 *
 * Each non-blank line holds userId, itemId and rating (a trailing timestamp
 * column is ignored). Lines are read on demand, so the whole file is never
 * resident. A line with a missing or non-numeric field raises
 * MalformedInputException naming the file and line.
 */
class MovieLensRatingSource : public similarity::IRatingSource {
public:
    /**
     * @brief Open a ratings file
     *
     * @param path Path to the ratings file
     * @param format Column layout
     * @return Rating source, or error message if the file cannot be opened
     */
    [[nodiscard]] static auto open(const std::string& path,
                                   const RatingFileFormat& format = {})
        -> std::expected<std::unique_ptr<MovieLensRatingSource>, std::string>;

    [[nodiscard]] auto next() -> std::optional<similarity::Rating> override;

    /// Number of the last line read, 1-based
    [[nodiscard]] auto lineNumber() const noexcept -> std::size_t {
        return lineNumber_;
    }

    [[nodiscard]] auto path() const noexcept -> const std::string& {
        return path_;
    }

private:
    MovieLensRatingSource(std::string path, std::ifstream stream,
                          const RatingFileFormat& format);

    std::string path_;
    std::ifstream stream_;
    RatingFileFormat format_;
    std::size_t lineNumber_ = 0;
};

}  // namespace itemsim::io

#endif  // ITEMSIM_IO_MOVIELENS_READER_HPP
