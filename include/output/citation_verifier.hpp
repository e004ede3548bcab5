#pragma once

#include "security/threat_detector.hpp"
#include <regex>
#include <vector>

namespace promptshield {

/**
 * @brief Flags fabricated or generic references in model output
 *
 *   SUSPICIOUS_DOMAIN  URL on a placeholder domain (example.com, localhost, ...)
 *   UNSOURCED_URL      URL that appears in none of the supplied source facts
 *   VAGUE_CLAIM        "studies show" and similar with no URL, DOI or arXiv id
 */
class CitationVerifier : public IThreatDetector {
public:
    struct Config {
        std::vector<std::string> suspicious_domains = {
            "example.com", "test.com", "localhost", "dummy.com"};
        std::vector<std::string> vague_phrases = {
            "according to research", "studies show", "experts say", "it has been proven"};
        double suspicious_domain_weight = 0.6;
        double unsourced_url_weight = 0.4;
        double vague_claim_weight = 0.3;
    };

    CitationVerifier() : CitationVerifier(Config{}) {}
    explicit CitationVerifier(Config config);

    [[nodiscard]] std::vector<ThreatFinding> detect(const DetectionInput& input) const override;

    [[nodiscard]] std::string_view name() const override { return "citation_verifier"; }
    [[nodiscard]] std::string_view feature() const override { return "citation"; }

private:
    Config config_;
    std::regex url_regex_;
    std::regex doi_regex_;
    std::regex arxiv_regex_;
};

} // namespace promptshield
