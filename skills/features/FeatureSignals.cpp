/**
 * @file skills/features/FeatureSignals.cpp
 * @brief Signal extraction helpers.
 */
#include "FeatureSignals.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace SkillRuntime::Features {
namespace {

float clamp_unit(double value) {
    return clean(static_cast<float>(std::clamp(value, -1.0, 1.0)));
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_blank(const std::optional<std::string>& text) {
    return !text || std::all_of(text->begin(), text->end(),
                                [](unsigned char c) { return std::isspace(c) != 0; });
}

// Numbers of the form [-+]?\d*\.?\d+ scanned left to right.
std::vector<double> scan_numbers(const std::string& text) {
    std::vector<double> numbers;
    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t start = i;
        if ((text[i] == '-' || text[i] == '+') && i + 1 < text.size()) {
            ++i;
        }
        std::size_t digits_start = i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        if (i < text.size() && text[i] == '.' && i + 1 < text.size()
            && std::isdigit(static_cast<unsigned char>(text[i + 1]))) {
            ++i;
            while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
                ++i;
            }
        }
        if (i > digits_start) {
            numbers.push_back(std::strtod(text.substr(start, i - start).c_str(), nullptr));
        } else {
            i = start + 1;
        }
    }
    return numbers;
}

} // anonymous namespace

float clean(float value) {
    if (std::isnan(value)) {
        return 0.0f;
    }
    if (std::isinf(value)) {
        return value > 0 ? 1.0f : -1.0f;
    }
    return value;
}

float normalize(std::optional<double> value, double scale) {
    if (!value || scale == 0.0) {
        return 0.0f;
    }
    double scaled = *value / scale;
    if (std::isnan(scaled)) {
        return 0.0f;
    }
    return clamp_unit(scaled);
}

float ratio(std::optional<double> part, std::optional<double> total) {
    if (!part || !total || *total == 0.0) {
        return 0.0f;
    }
    return clamp_unit(*part / *total);
}

float delta(std::optional<double> current, std::optional<double> reference) {
    if (!current || !reference) {
        return 0.0f;
    }
    double divisor = *reference == 0.0 ? 1.0 : std::abs(*reference);
    return clean(static_cast<float>((*current - *reference) / divisor));
}

float normalized_count(std::optional<double> count, double max) {
    if (!count || max <= 0.0) {
        return 0.0f;
    }
    return clean(static_cast<float>(std::clamp(*count / max, 0.0, 1.0)));
}

float normalized_length(const std::optional<std::string>& text, std::size_t max_length) {
    if (!text || text->empty() || max_length == 0) {
        return 0.0f;
    }
    auto bounded = std::min(text->size(), max_length);
    return clean(static_cast<float>(bounded) / static_cast<float>(max_length));
}

std::vector<float> keyword_flags(
    const std::optional<std::string>& text,
    const std::vector<std::string>& keywords
) {
    std::vector<float> flags(keywords.size(), 0.0f);
    if (is_blank(text)) {
        return flags;
    }
    auto source = to_lower(*text);
    for (std::size_t i = 0; i < keywords.size(); ++i) {
        if (source.find(to_lower(keywords[i])) != std::string::npos) {
            flags[i] = 1.0f;
        }
    }
    return flags;
}

std::vector<float> formula_coefficients(const std::optional<std::string>& formula) {
    std::vector<float> coefficients(4, 0.0f);
    if (is_blank(formula)) {
        return coefficients;
    }
    auto numbers = scan_numbers(*formula);
    auto limit = std::min(coefficients.size(), numbers.size());
    for (std::size_t i = 0; i < limit; ++i) {
        coefficients[i] = normalize(numbers[i], 100.0);
    }
    double magnitude = 0.0;
    for (double n : numbers) {
        magnitude += std::abs(n);
    }
    coefficients[3] = normalize(magnitude, 400.0);
    return coefficients;
}

FeatureVector compose_vector(const std::vector<float>& signals, std::size_t dim) {
    if (dim == 0) {
        throw std::invalid_argument("feature dimension must be positive");
    }
    FeatureVector vector(dim, 0.0f);
    for (std::size_t i = 0; i < signals.size(); ++i) {
        float value = clean(signals[i]);
        if (i < dim) {
            vector[i] = value;
        } else {
            auto slot = i % dim;
            vector[slot] = clamp_unit(static_cast<double>(vector[slot]) + value);
        }
    }
    return vector;
}

} // namespace SkillRuntime::Features
