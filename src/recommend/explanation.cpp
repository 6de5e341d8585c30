// Explanation text generation.

#include "recommend/explanation.h"

#include <cstdio>

#include "core/pitch_utils.h"

namespace tessitura {

namespace {

constexpr double kStrongFavoritePct = 30.0;
constexpr double kModerateFavoritePct = 10.0;
constexpr double kMinimalAvoidPct = 2.0;
constexpr double kSomeAvoidPct = 10.0;

/// @brief Percentage with a trailing '%', e.g. "45%" or "3.5%".
std::string formatPercent(double pct, int decimals) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.*f%%", decimals, pct);
  return buf;
}

}  // namespace

FavoriteOverlapBand classifyFavoriteOverlap(double favorite_overlap) {
  double pct = favorite_overlap * 100.0;
  if (pct >= kStrongFavoritePct) return FavoriteOverlapBand::Strong;
  if (pct >= kModerateFavoritePct) return FavoriteOverlapBand::Moderate;
  return FavoriteOverlapBand::Low;
}

AvoidPresenceBand classifyAvoidPresence(double avoid_penalty) {
  double pct = avoid_penalty * 100.0;
  if (pct <= kMinimalAvoidPct) return AvoidPresenceBand::Minimal;
  if (pct <= kSomeAvoidPct) return AvoidPresenceBand::Some;
  return AvoidPresenceBand::Notable;
}

std::string generateExplanation(const ScoredResult& result,
                                const std::vector<MidiPitch>& favorite_midis,
                                const std::vector<MidiPitch>& avoid_midis) {
  char buf[96];
  std::snprintf(buf, sizeof(buf), "Final score: %.2f (cosine similarity %.2f)",
                result.final_score, result.cosine_similarity);
  std::string text(buf);

  // Note lists are unbounded, so only the numbers go through snprintf.
  if (!favorite_midis.empty()) {
    std::string names = noteNameList(favorite_midis);
    std::string pct = formatPercent(result.favorite_overlap * 100.0, 0);
    text += "  ";
    switch (classifyFavoriteOverlap(result.favorite_overlap)) {
      case FavoriteOverlapBand::Strong:
        text += "Strong overlap with your favorite notes (" + names + "): " + pct +
                " of singing time.";
        break;
      case FavoriteOverlapBand::Moderate:
        text += "Moderate overlap with favorite notes (" + names + "): " + pct +
                " of singing time.";
        break;
      case FavoriteOverlapBand::Low:
        text += "Low overlap with favorite notes (" + names + "): only " + pct +
                " of singing time.";
        break;
    }
  }

  if (!avoid_midis.empty()) {
    std::string names = noteNameList(avoid_midis);
    std::string pct = formatPercent(result.avoid_penalty * 100.0, 1);
    text += "  ";
    switch (classifyAvoidPresence(result.avoid_penalty)) {
      case AvoidPresenceBand::Minimal:
        text += "Minimal presence of avoid notes (" + names + "): " + pct + " of singing time.";
        break;
      case AvoidPresenceBand::Some:
        text += "Some presence of avoid notes (" + names + "): " + pct + " of singing time.";
        break;
      case AvoidPresenceBand::Notable:
        text += "Notable presence of avoid notes (" + names + "): " + pct +
                " of singing time; this lowered the score.";
        break;
    }
  }

  return text;
}

}  // namespace tessitura
