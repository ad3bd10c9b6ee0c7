#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <boost/json.hpp>

namespace parley {

// Input validation and normalisation shared by the codec, the store and sessions.
class InputValidator {
public:
    static constexpr std::size_t MAX_JSON_DEPTH = 16;

    // Usernames are letters, digits and underscores only.
    static bool is_valid_username(const std::string& name, std::size_t max_length) {
        if (name.empty() || name.size() > max_length) return false;
        return std::all_of(name.begin(), name.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        });
    }

    static bool is_blank(const std::string& str) {
        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isspace(static_cast<unsigned char>(c));
        });
    }

    static bool is_within_size_limit(std::size_t size, std::size_t max_size) {
        return size <= max_size;
    }

    /**
     * Splits every raw tag on whitespace and commas, lower-cases the pieces,
     * drops empty ones and removes duplicates while keeping first-seen order.
     */
    static std::vector<std::string> normalize_tags(const std::vector<std::string>& raw) {
        std::vector<std::string> tags;
        for (const auto& entry : raw) {
            std::string token;
            auto flush = [&tags, &token]() {
                if (!token.empty() && std::find(tags.begin(), tags.end(), token) == tags.end()) {
                    tags.push_back(token);
                }
                token.clear();
            };
            for (char c : entry) {
                if (std::isspace(static_cast<unsigned char>(c)) || c == ',') {
                    flush();
                } else {
                    token += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                }
            }
            flush();
        }
        return tags;
    }

    /**
     * JSON parsing with a recursion depth limit to prevent stack exhaustion.
     * Throws boost::system::system_error on malformed input.
     */
    static boost::json::value safe_parse_json(std::string_view input) {
        boost::json::parse_options opt;
        opt.max_depth = MAX_JSON_DEPTH;
        return boost::json::parse(boost::json::string_view(input.data(), input.size()), {}, opt);
    }
};

}
