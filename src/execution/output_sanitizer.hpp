#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace guardsh {

struct SanitizedText {
    std::string text;
    bool truncated{false};
};

class OutputSanitizer {
  public:
    static constexpr std::size_t kDefaultMaxBytes = 10000;
    static constexpr std::string_view kTruncationMarker = "\n... [output truncated]";

    explicit OutputSanitizer(std::size_t max_bytes = kDefaultMaxBytes) noexcept;

    // Trims surrounding whitespace, then cuts to max_bytes() and appends
    // kTruncationMarker. sanitize(sanitize(x).text) == sanitize(x).
    [[nodiscard]] SanitizedText sanitize(std::string_view text) const;

    [[nodiscard]] std::size_t max_bytes() const noexcept { return max_bytes_; }

  private:
    std::size_t max_bytes_;
};

} // namespace guardsh
