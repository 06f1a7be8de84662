#include "execution/output_sanitizer.hpp"

#include <utility>

namespace guardsh {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

[[nodiscard]] std::string_view trim(std::string_view text) noexcept {
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }

    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

} // namespace

OutputSanitizer::OutputSanitizer(std::size_t max_bytes) noexcept : max_bytes_(max_bytes) {}

SanitizedText OutputSanitizer::sanitize(std::string_view text) const {
    const std::string_view trimmed = trim(text);
    if (trimmed.size() <= max_bytes_) {
        return SanitizedText{.text = std::string(trimmed), .truncated = false};
    }

    std::string bounded;
    bounded.reserve(max_bytes_ + kTruncationMarker.size());
    bounded.append(trimmed.substr(0, max_bytes_));
    bounded.append(kTruncationMarker);

    return SanitizedText{.text = std::move(bounded), .truncated = true};
}

} // namespace guardsh
