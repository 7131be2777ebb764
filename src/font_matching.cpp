#include "vellum/font_matching.hpp"
#include <algorithm>

namespace vellum {

namespace {

// Nearest value in @p values strictly below @p target, if any.
bool nearestBelow(const std::vector<f32>& values, f32 target, f32& out) {
    bool found = false;
    for (f32 v : values) {
        if (v < target && (!found || v > out)) {
            out = v;
            found = true;
        }
    }
    return found;
}

// Nearest value in @p values strictly above @p target, if any.
bool nearestAbove(const std::vector<f32>& values, f32 target, f32& out) {
    bool found = false;
    for (f32 v : values) {
        if (v > target && (!found || v < out)) {
            out = v;
            found = true;
        }
    }
    return found;
}

bool contains(const std::vector<f32>& values, f32 v) {
    return std::find(values.begin(), values.end(), v) != values.end();
}

f32 matchStretch(const std::vector<f32>& stretches, f32 query) {
    f32 out = query;
    if (contains(stretches, query)) return query;
    if (query <= FontStretch::Normal) {
        if (nearestBelow(stretches, query, out)) return out;
        nearestAbove(stretches, query, out);
    } else {
        if (nearestAbove(stretches, query, out)) return out;
        nearestBelow(stretches, query, out);
    }
    return out;
}

f32 matchWeight(const std::vector<f32>& weights, f32 query) {
    f32 out = query;
    if (contains(weights, query)) return query;

    if (query >= FontWeight::Normal && query <= FontWeight::Medium) {
        // Heavier up to 500 first, then lighter, then heavier than 500.
        bool found = false;
        for (f32 w : weights) {
            if (w > query && w <= FontWeight::Medium && (!found || w < out)) {
                out = w;
                found = true;
            }
        }
        if (found) return out;
        if (nearestBelow(weights, query, out)) return out;
        nearestAbove(weights, query, out);
    } else if (query < FontWeight::Normal) {
        if (nearestBelow(weights, query, out)) return out;
        nearestAbove(weights, query, out);
    } else {
        if (nearestAbove(weights, query, out)) return out;
        nearestBelow(weights, query, out);
    }
    return out;
}

} // namespace

SelectionError findBestMatch(const std::vector<Properties>& candidates,
                             const Properties& query, size_t& index) {
    if (candidates.empty()) return SelectionError::NotFound;

    std::vector<size_t> matching(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) matching[i] = i;

    auto collect = [&](f32 Properties::*field) {
        std::vector<f32> values;
        for (size_t i : matching) values.push_back(candidates[i].*field);
        return values;
    };
    auto retain = [&](auto pred) {
        matching.erase(std::remove_if(matching.begin(), matching.end(),
                                      [&](size_t i) { return !pred(candidates[i]); }),
                       matching.end());
    };

    // Stretch.
    f32 stretch = matchStretch(collect(&Properties::stretch), query.stretch);
    retain([&](const Properties& p) { return p.stretch == stretch; });

    // Style.
    FontStyle order[3];
    switch (query.style) {
        case FontStyle::Italic:
            order[0] = FontStyle::Italic; order[1] = FontStyle::Oblique; order[2] = FontStyle::Normal;
            break;
        case FontStyle::Oblique:
            order[0] = FontStyle::Oblique; order[1] = FontStyle::Italic; order[2] = FontStyle::Normal;
            break;
        case FontStyle::Normal:
            order[0] = FontStyle::Normal; order[1] = FontStyle::Oblique; order[2] = FontStyle::Italic;
            break;
    }
    for (FontStyle style : order) {
        bool any = std::any_of(matching.begin(), matching.end(),
                               [&](size_t i) { return candidates[i].style == style; });
        if (any) {
            retain([&](const Properties& p) { return p.style == style; });
            break;
        }
    }

    // Weight.
    f32 weight = matchWeight(collect(&Properties::weight), query.weight);
    retain([&](const Properties& p) { return p.weight == weight; });

    if (matching.empty()) return SelectionError::NotFound;
    index = matching.front();
    return SelectionError::Ok;
}

} // namespace vellum
