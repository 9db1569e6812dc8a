#include <geohashing/hash/compliance.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace geohashing::hash {

auto parse_compliance(std::string_view text) -> std::optional<Compliance> {
    std::string lowered(text);
    std::ranges::transform(lowered, lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "e" || lowered == "east") {
        return Compliance::Eastern;
    }
    if (lowered == "w" || lowered == "west") {
        return Compliance::Western;
    }
    return std::nullopt;
}

auto to_string(Compliance compliance) -> const char* {
    return compliance == Compliance::Eastern ? "east" : "west";
}

}  // namespace geohashing::hash
