#pragma once

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

namespace av {
namespace cli_utils {

// Number of single-character insertions, deletions and substitutions
// needed to turn `a` into `b`.
inline int levenshtein_distance(const std::string& a, const std::string& b) {
    std::vector<int> row(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) row[j] = static_cast<int>(j);

    for (size_t i = 1; i <= a.size(); ++i) {
        int diagonal = row[0];
        row[0] = static_cast<int>(i);
        for (size_t j = 1; j <= b.size(); ++j) {
            int above = row[j];
            if (a[i - 1] == b[j - 1])
                row[j] = diagonal;
            else
                row[j] = 1 + std::min({above, row[j - 1], diagonal});
            diagonal = above;
        }
    }
    return row[b.size()];
}

// Closest candidate within 3 edits (or 40% of the input's length, whichever
// is larger). Empty when nothing is close enough.
inline std::string closest_match(const std::string& input, const std::vector<std::string>& candidates) {
    int best_distance = std::numeric_limits<int>::max();
    std::string best;
    for (const auto& c : candidates) {
        int d = levenshtein_distance(input, c);
        if (d < best_distance) {
            best_distance = d;
            best = c;
        }
    }
    int threshold = std::max(3, static_cast<int>(input.size() * 0.4));
    return best_distance <= threshold ? best : std::string();
}

// "Unknown argument: --dialct\n  Did you mean '--dialect'?"
inline std::string unknown_argument_error(const std::string& arg, const std::vector<std::string>& options) {
    std::string error = "Unknown argument: " + arg;
    std::string suggestion = closest_match(arg, options);
    if (!suggestion.empty()) error += "\n  Did you mean '" + suggestion + "'?";
    return error;
}

// "invalid value 'opnapi' for --dialect (expected jsonschema or openapi)\n  Did you mean 'openapi'?"
inline std::string invalid_choice_error(const std::string& option, const std::string& value,
                                        const std::vector<std::string>& choices) {
    std::string error = "invalid value '" + value + "' for " + option + " (expected ";
    for (size_t i = 0; i < choices.size(); ++i) {
        if (i > 0) error += i + 1 == choices.size() ? " or " : ", ";
        error += choices[i];
    }
    error += ")";
    std::string suggestion = closest_match(value, choices);
    if (!suggestion.empty()) error += "\n  Did you mean '" + suggestion + "'?";
    return error;
}

}  // namespace cli_utils
}  // namespace av
