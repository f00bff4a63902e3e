#pragma once
#include <array>
#include <string>

class RandomSource;

enum class Season { Spring, Summer, Fall, Winter };

// Case-insensitive; throws std::invalid_argument on an unknown name.
Season parseSeason(const std::string& name);
std::string seasonName(Season season);

// Daily weather draw: a seasonal categorical pick of the sky level, then a
// uniform coverage fraction inside that level's band.
class CloudCoverage {
public:
    enum Level { Clear = 0, PartlyCloudy, MostlyCloudy, Overcast, kLevelCount };

    CloudCoverage(RandomSource& rng, Season season);
    CloudCoverage(RandomSource& rng, const std::string& season);

    // Coverage fraction in [0, 0.9). Call once per simulated day.
    double getDailyCoverage();

    Level getLastLevel() const { return last_level_; }
    Season getSeason() const { return season_; }

    static const std::array<double, kLevelCount>& probabilities(Season season);
    static const std::array<std::array<double, 2>, kLevelCount>& coverageRanges();

private:
    RandomSource& rng_;
    Season season_;
    Level  last_level_ = Clear;
};
