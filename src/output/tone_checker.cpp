#include "output/tone_checker.hpp"
#include "core/text.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <utility>

namespace promptshield {

namespace {

struct ToneMarkers {
    ToneChecker::Tone tone;
    std::vector<std::string_view> markers;
};

const std::vector<ToneMarkers>& tone_table() {
    static const std::vector<ToneMarkers> table = {
        {ToneChecker::Tone::PROFESSIONAL,
         {"regards", "sincerely", "furthermore", "therefore", "accordingly",
          "we recommend", "please note", "kindly", "in accordance", "pursuant"}},
        {ToneChecker::Tone::CASUAL,
         {"hey", "gonna", "wanna", "lol", "yeah", "btw", "cool", "awesome",
          "kinda", "dude", "stuff"}},
        {ToneChecker::Tone::TECHNICAL,
         {"function", "parameter", "algorithm", "implementation", "configure",
          "latency", "api", "protocol", "runtime", "compile", "throughput"}},
        {ToneChecker::Tone::FRIENDLY,
         {"happy to", "glad", "hope this helps", "feel free", "thanks",
          "great question", "you're welcome", "cheers"}},
    };
    return table;
}

} // anonymous namespace

ToneChecker::ToneChecker(Config config)
    : config_(std::move(config)) {}

std::optional<ToneChecker::Tone> ToneChecker::tone_from_string(std::string_view name) {
    const std::string lower = utils::to_lower(utils::trim(std::string(name)));
    if (lower == "professional") return Tone::PROFESSIONAL;
    if (lower == "casual") return Tone::CASUAL;
    if (lower == "technical") return Tone::TECHNICAL;
    if (lower == "friendly") return Tone::FRIENDLY;
    return std::nullopt;
}

const char* ToneChecker::tone_to_string(Tone tone) {
    switch (tone) {
        case Tone::PROFESSIONAL: return "professional";
        case Tone::CASUAL: return "casual";
        case Tone::TECHNICAL: return "technical";
        case Tone::FRIENDLY: return "friendly";
        default: return "unknown";
    }
}

std::array<size_t, 4> ToneChecker::count_markers(std::string_view body) {
    std::array<size_t, 4> counts{};
    for (const auto& entry : tone_table()) {
        for (const auto marker : entry.markers) {
            size_t pos = 0;
            while ((pos = text::find_keyword(body, marker, pos)) != std::string_view::npos) {
                ++counts[static_cast<size_t>(entry.tone)];
                pos += marker.size();
            }
        }
    }
    return counts;
}

std::vector<ThreatFinding> ToneChecker::detect(const DetectionInput& input) const {
    std::string_view requested = config_.default_tone;
    if (input.request != nullptr && !input.request->desired_tone.empty()) {
        requested = input.request->desired_tone;
    }
    if (requested.empty()) {
        return {};
    }

    const auto desired = tone_from_string(requested);
    if (!desired) {
        utils::log::warn(std::format("Unknown desired tone '{}', tone check skipped", requested));
        return {};
    }

    const auto counts = count_markers(input.decoded);
    const auto dominant_it = std::ranges::max_element(counts);
    const auto dominant = static_cast<Tone>(std::distance(counts.begin(), dominant_it));
    const size_t hits = *dominant_it;

    if (dominant == *desired || hits < config_.min_markers ||
        counts[static_cast<size_t>(*desired)] > 0) {
        return {};
    }

    ThreatFinding finding;
    finding.detector = std::string(name());
    finding.category = ThreatCategory::TONE_VIOLATION;
    finding.confidence = std::min(config_.max_confidence,
        config_.base_confidence + config_.per_marker * static_cast<double>(hits));
    finding.pattern_id = std::format("TONE:{}->{}", tone_to_string(*desired), tone_to_string(dominant));
    return {std::move(finding)};
}

} // namespace promptshield
