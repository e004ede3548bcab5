#include "core/masking.hpp"

#include <openssl/sha.h>

#include <format>

namespace promptshield {

static constexpr std::string_view kMaskTag = "_REDACTED";

std::string MaskingEngine::mask_for(PiiCategory category) {
    switch (category) {
        case PiiCategory::SSN:         return "[SSN_REDACTED]";
        case PiiCategory::CREDIT_CARD: return "[CREDIT_CARD_REDACTED]";
        case PiiCategory::EMAIL:       return "[EMAIL_REDACTED]";
        case PiiCategory::PHONE:       return "[PHONE_REDACTED]";
        case PiiCategory::CREDENTIAL:  return "[CREDENTIAL_REDACTED]";
        case PiiCategory::KEYWORD:     return "[KEYWORD_REDACTED]";
    }
    return "[REDACTED]";
}

std::string MaskingEngine::hash_value(std::string_view value) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(value.data()),
           value.size(), hash);

    // First 16 hex chars (8 bytes)
    std::string result;
    result.reserve(16);
    for (int i = 0; i < 8; ++i) {
        result += std::format("{:02x}", hash[i]);
    }
    return result;
}

std::string MaskingEngine::apply(
    std::string_view text,
    const std::vector<PiiFinding>& findings) {

    std::string result;
    result.reserve(text.size());

    size_t cursor = 0;
    for (const auto& f : findings) {
        if (f.offset < cursor || f.offset + f.length > text.size()) continue;
        result.append(text.substr(cursor, f.offset - cursor));
        result.append(f.mask);
        cursor = f.offset + f.length;
    }
    result.append(text.substr(cursor));
    return result;
}

std::vector<std::pair<size_t, size_t>> MaskingEngine::find_masks(std::string_view text) {
    std::vector<std::pair<size_t, size_t>> spans;

    size_t pos = 0;
    while ((pos = text.find('[', pos)) != std::string_view::npos) {
        size_t j = pos + 1;
        while (j < text.size() && ((text[j] >= 'A' && text[j] <= 'Z') || text[j] == '_')) {
            ++j;
        }
        const std::string_view inner = text.substr(pos + 1, j - pos - 1);
        if (j < text.size() && text[j] == ']' &&
            inner.size() > kMaskTag.size() && inner.ends_with(kMaskTag)) {
            spans.emplace_back(pos, j - pos + 1);
            pos = j + 1;
        } else {
            ++pos;
        }
    }
    return spans;
}

} // namespace promptshield
