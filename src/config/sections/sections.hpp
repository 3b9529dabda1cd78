/*
 * sections.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Aggregated header for all configuration sections

**************************************************/

#ifndef ITEMSIM_CONFIG_SECTIONS_HPP
#define ITEMSIM_CONFIG_SECTIONS_HPP

#include "data_config.hpp"
#include "logging_config.hpp"
#include "query_config.hpp"
#include "similarity_config.hpp"

#endif  // ITEMSIM_CONFIG_SECTIONS_HPP
