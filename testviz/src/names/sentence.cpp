#include "names/sentence.hpp"

namespace testviz::names {

auto to_lower(std::string_view word) -> std::string {
    std::string result(word);
    for (char& c : result) {
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c - 'A' + 'a');
    }
    return result;
}

auto to_sentence(const std::vector<std::string>& words, const NamingOptions& options)
    -> std::string {
    std::string sentence;

    for (size_t i = 0; i < words.size(); ++i) {
        if (i == 0) {
            sentence += words[i];
            continue;
        }

        sentence += ' ';
        if (options.is_no_transform(words[i])) {
            sentence += words[i];
        } else {
            sentence += to_lower(words[i]);
        }
    }

    return sentence;
}

} // namespace testviz::names
