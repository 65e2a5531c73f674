#include "mxwsort/config.hpp"
#include "mxwsort/errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace mxwsort {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

int parse_int(std::string_view token, std::string_view whole) {
    token = trim(token);
    int value = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || ptr != token.data() + token.size() || token.empty()) {
        throw ConfigValidationError(
            "Bad well selection '" + std::string(whole) + "': '" + std::string(token) +
            "' is not an integer");
    }
    if (value < 0) {
        throw ConfigValidationError(
            "Bad well selection '" + std::string(whole) + "': negative well index");
    }
    return value;
}

}  // namespace

WellSelection parse_well_selection(std::string_view text) {
    std::string_view s = trim(text);

    std::string lowered(s);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered.empty() || lowered == "auto") {
        return WellSelection::automatic();
    }

    std::vector<int> wells;
    if (auto dash = s.find('-'); dash != std::string_view::npos) {
        int first = parse_int(s.substr(0, dash), text);
        int last = parse_int(s.substr(dash + 1), text);
        if (last < first) {
            throw ConfigValidationError(
                "Bad well selection '" + std::string(text) + "': range end before start");
        }
        for (int w = first; w <= last; ++w) {
            wells.push_back(w);
        }
    } else {
        size_t pos = 0;
        while (pos <= s.size()) {
            size_t comma = s.find(',', pos);
            std::string_view item = s.substr(pos, comma == std::string_view::npos
                                                      ? std::string_view::npos
                                                      : comma - pos);
            if (!trim(item).empty()) {
                wells.push_back(parse_int(item, text));
            }
            if (comma == std::string_view::npos) break;
            pos = comma + 1;
        }
    }

    if (wells.empty()) {
        throw ConfigValidationError("Bad well selection '" + std::string(text) + "': no wells");
    }
    return WellSelection::explicit_list(std::move(wells));
}

std::string to_string(const WellSelection& selection) {
    switch (selection.mode) {
        case WellSelection::Mode::Auto:
            return "auto";
        case WellSelection::Mode::Single:
            return "only " + std::to_string(selection.wells.empty() ? -1 : selection.wells.front());
        case WellSelection::Mode::Explicit:
            break;
    }
    std::ostringstream ss;
    for (size_t i = 0; i < selection.wells.size(); ++i) {
        if (i) ss << ",";
        ss << selection.wells[i];
    }
    return ss.str();
}

}  // namespace mxwsort
