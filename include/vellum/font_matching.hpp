#pragma once

/**
 * @file font_matching.hpp
 * @brief CSS font matching over a set of candidate faces.
 */

#include "vellum/font_source.hpp"
#include <vector>

namespace vellum {

/**
 * @brief Pick the candidate closest to @p query.
 *
 * Narrows by stretch, then style, then weight, following the CSS Fonts
 * matching rules.
 *
 * @param index Receives the index of the chosen candidate.
 * @return NotFound if @p candidates is empty.
 */
SelectionError findBestMatch(const std::vector<Properties>& candidates,
                             const Properties& query, size_t& index);

} // namespace vellum
