#include <speakml/markup/entities.h>

namespace speakml::markup {
namespace {

struct EntityMapping {
    std::string_view reference;
    char value;
};

constexpr EntityMapping kEntities[] = {
    {"&lt;", '<'},
    {"&gt;", '>'},
    {"&amp;", '&'},
};

} // namespace

std::string decode_entities(std::string_view text) {
    if (text.find('&') == std::string_view::npos) {
        return std::string(text);
    }

    std::string decoded;
    decoded.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] != '&') {
            decoded.push_back(text[pos]);
            ++pos;
            continue;
        }

        bool matched = false;
        for (const auto& entity : kEntities) {
            if (text.compare(pos, entity.reference.size(), entity.reference) == 0) {
                decoded.push_back(entity.value);
                pos += entity.reference.size();
                matched = true;
                break;
            }
        }
        if (!matched) {
            decoded.push_back('&');
            ++pos;
        }
    }
    return decoded;
}

std::string encode_entities(std::string_view text) {
    std::string encoded;
    encoded.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': encoded += "&amp;"; break;
            case '<': encoded += "&lt;"; break;
            case '>': encoded += "&gt;"; break;
            default:  encoded.push_back(c); break;
        }
    }
    return encoded;
}

} // namespace speakml::markup
