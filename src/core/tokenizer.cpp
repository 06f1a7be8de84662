#include "core/tokenizer.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace guardsh {

std::vector<std::string> Tokenizer::tokenize(std::string_view input) const {
    std::vector<std::string> tokens;
    std::string token;

    bool single_quoted = false;
    bool double_quoted = false;
    bool escaped = false;
    // "" and '' produce an empty argument, so quoting alone marks a token as started.
    bool token_started = false;

    auto flush_token = [&]() {
        if (token_started) {
            tokens.push_back(std::move(token));
            token.clear();
            token_started = false;
        }
    };

    for (const char current : input) {
        if (escaped) {
            if (double_quoted && current != '\\' && current != '"' && current != '$') {
                token.push_back('\\');
            }
            token.push_back(current);
            token_started = true;
            escaped = false;
            continue;
        }

        if (current == '\\' && !single_quoted) {
            escaped = true;
            continue;
        }

        if (current == '\'' && !double_quoted) {
            single_quoted = !single_quoted;
            token_started = true;
            continue;
        }

        if (current == '"' && !single_quoted) {
            double_quoted = !double_quoted;
            token_started = true;
            continue;
        }

        if (!single_quoted && !double_quoted && std::isspace(static_cast<unsigned char>(current))) {
            flush_token();
            continue;
        }

        token.push_back(current);
        token_started = true;
    }

    if (escaped) {
        token.push_back('\\');
        token_started = true;
    }

    flush_token();
    return tokens;
}

} // namespace guardsh
