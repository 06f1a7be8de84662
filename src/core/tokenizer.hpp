#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace guardsh {

// Splits a command line into argv. Quotes and backslash escapes are honoured;
// no other shell syntax is recognised, so '|' or '>' are plain characters.
class Tokenizer {
  public:
    [[nodiscard]] std::vector<std::string> tokenize(std::string_view input) const;
};

} // namespace guardsh
