#include "CloudCoverage.hpp"
#include "RandomSource.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

Season parseSeason(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "spring") return Season::Spring;
    if (s == "summer") return Season::Summer;
    if (s == "fall" || s == "autumn") return Season::Fall;
    if (s == "winter") return Season::Winter;

    throw std::invalid_argument(
        "Invalid season: '" + name + "'. Must be one of spring, summer, fall, winter");
}

std::string seasonName(Season season) {
    switch (season) {
    case Season::Spring: return "spring";
    case Season::Summer: return "summer";
    case Season::Fall:   return "fall";
    case Season::Winter: return "winter";
    }
    return "unknown";
}

// [Clear, Partly, Mostly, Overcast]
const std::array<double, CloudCoverage::kLevelCount>&
CloudCoverage::probabilities(Season season) {
    static const std::array<double, kLevelCount> spring{0.10, 0.30, 0.40, 0.20};
    static const std::array<double, kLevelCount> summer{0.05, 0.15, 0.30, 0.50};
    static const std::array<double, kLevelCount> fall  {0.20, 0.40, 0.30, 0.10};
    static const std::array<double, kLevelCount> winter{0.30, 0.40, 0.20, 0.10};

    switch (season) {
    case Season::Spring: return spring;
    case Season::Summer: return summer;
    case Season::Fall:   return fall;
    case Season::Winter: return winter;
    }
    return summer;
}

const std::array<std::array<double, 2>, CloudCoverage::kLevelCount>&
CloudCoverage::coverageRanges() {
    static const std::array<std::array<double, 2>, kLevelCount> ranges{{
        {0.0, 0.2},   // clear
        {0.2, 0.6},   // partly cloudy
        {0.6, 0.8},   // mostly cloudy
        {0.8, 0.9},   // overcast
    }};
    return ranges;
}

CloudCoverage::CloudCoverage(RandomSource& rng, Season season)
    : rng_(rng), season_(season) {}

CloudCoverage::CloudCoverage(RandomSource& rng, const std::string& season)
    : rng_(rng), season_(parseSeason(season)) {}

double CloudCoverage::getDailyCoverage() {
    const auto& p = probabilities(season_);
    const std::vector<double> weights(p.begin(), p.end());

    last_level_ = static_cast<Level>(rng_.weightedIndex(weights));

    const auto& band = coverageRanges()[last_level_];
    return rng_.uniform(band[0], band[1]);
}
