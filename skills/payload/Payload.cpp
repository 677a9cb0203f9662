/**
 * @file skills/payload/Payload.cpp
 * @brief Tolerant payload accessors.
 */
#include "Payload.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace SkillRuntime::Skills {
namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::optional<double> parse_number(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (end == begin || errno == ERANGE) {
        return std::nullopt;
    }
    while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end))) {
        ++end;
    }
    if (*end != '\0') {
        return std::nullopt;
    }
    return value;
}

std::string render_number(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // anonymous namespace

std::optional<double> number_of(const Payload& payload, const std::string& key) {
    auto it = payload.find(key);
    if (it == payload.end()) {
        return std::nullopt;
    }
    return std::visit(overloaded{
        [](double v) -> std::optional<double> { return v; },
        [](bool v) -> std::optional<double> { return v ? 1.0 : 0.0; },
        [](const std::string& v) -> std::optional<double> { return parse_number(v); },
        [](const std::vector<std::string>&) -> std::optional<double> { return std::nullopt; }
    }, it->second);
}

std::optional<std::string> text_of(const Payload& payload, const std::string& key) {
    auto it = payload.find(key);
    if (it == payload.end()) {
        return std::nullopt;
    }
    return std::visit(overloaded{
        [](double v) -> std::optional<std::string> { return render_number(v); },
        [](bool v) -> std::optional<std::string> { return std::string{v ? "true" : "false"}; },
        [](const std::string& v) -> std::optional<std::string> { return v; },
        [](const std::vector<std::string>&) -> std::optional<std::string> { return std::nullopt; }
    }, it->second);
}

std::optional<std::string> joined_text_of(const Payload& payload, const std::vector<std::string>& keys) {
    std::string joined;
    for (const auto& key : keys) {
        auto piece = text_of(payload, key);
        if (!piece || is_blank(*piece)) {
            continue;
        }
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += *piece;
    }
    if (joined.empty()) {
        return std::nullopt;
    }
    return joined;
}

std::optional<double> collection_size_of(const Payload& payload, const std::string& key) {
    auto it = payload.find(key);
    if (it == payload.end()) {
        return std::nullopt;
    }
    if (const auto* list = std::get_if<std::vector<std::string>>(&it->second)) {
        return static_cast<double>(list->size());
    }
    if (const auto* text = std::get_if<std::string>(&it->second)) {
        return static_cast<double>(text->size());
    }
    return std::nullopt;
}

float flag_of(const Payload& payload, const std::string& key) {
    auto it = payload.find(key);
    if (it == payload.end()) {
        return 0.0f;
    }
    return std::visit(overloaded{
        [](double v) { return v != 0.0 ? 1.0f : 0.0f; },
        [](bool v) { return v ? 1.0f : 0.0f; },
        [](const std::string& v) {
            std::string lowered = v;
            std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return lowered == "true" ? 1.0f : 0.0f;
        },
        [](const std::vector<std::string>&) { return 0.0f; }
    }, it->second);
}

Payload payload_from_json(const nlohmann::json& object) {
    if (!object.is_object()) {
        throw std::invalid_argument("payload must be a JSON object");
    }
    Payload payload;
    for (const auto& [key, value] : object.items()) {
        if (value.is_boolean()) {
            payload.emplace(key, value.get<bool>());
        } else if (value.is_number()) {
            payload.emplace(key, value.get<double>());
        } else if (value.is_string()) {
            payload.emplace(key, value.get<std::string>());
        } else if (value.is_array()) {
            std::vector<std::string> items;
            for (const auto& item : value) {
                if (item.is_string()) {
                    items.push_back(item.get<std::string>());
                }
            }
            payload.emplace(key, std::move(items));
        }
    }
    return payload;
}

nlohmann::json payload_to_json(const Payload& payload) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, value] : payload) {
        std::visit([&out, &k = key](const auto& v) { out[k] = v; }, value);
    }
    return out;
}

} // namespace SkillRuntime::Skills
