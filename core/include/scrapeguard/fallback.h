#pragma once

#include "scrapeguard/config.h"
#include "scrapeguard/fetch.h"
#include "scrapeguard/value.h"

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace scrapeguard {

struct TierOutcome {
    bool ok{false};
    List records;
    std::string error;
};

using TierProducer = std::function<TierOutcome(const std::string& url)>;

// One extraction strategy of the degradation ladder. Lower rank runs first;
// rank 1 is the generated code itself and never appears in a ladder.
struct FallbackTier {
    int rank{0};
    std::string fidelity;  // "rendered", "minimal", ...
    std::string name;
    TierProducer producer;
};

struct TierAttempt {
    std::string name;
    int rank{0};
    bool ok{false};
    size_t records{0};
    std::string error;
    long long duration_ms{0};
};

struct LadderResult {
    bool ok{false};                    // some tier produced at least one record
    List records;
    std::string tier;                  // name of the producing tier
    std::vector<TierAttempt> attempts; // every tier tried, in order
    bool cancelled{false};
};

// Runs tiers in rank order, each at most once, and stops at the first tier
// that yields records. A failing tier (error, exception or no records) is
// recorded in the result and the ladder moves on. All tiers failing is an
// ordinary result with ok == false.
class FallbackLadder {
public:
    explicit FallbackLadder(std::vector<FallbackTier> tiers);

    LadderResult run(const std::string& url, const std::atomic<bool>* cancel = nullptr) const;

    const std::vector<FallbackTier>& tiers() const { return tiers_; }

private:
    std::vector<FallbackTier> tiers_;
};

// Rank 2: headless browser render, settle delay, then title, phone numbers
// and e-mail addresses from the rendered text. One descriptive record.
FallbackTier rendered_fetch_tier(IFetcher& fetcher, const FetchConfig& cfg);

// Rank 3: plain fetch with a browser User-Agent, title only. One record.
FallbackTier minimal_fetch_tier(IFetcher& fetcher, const FetchConfig& cfg);

FallbackLadder default_ladder(IFetcher& fetcher, const FetchConfig& cfg);

} // namespace scrapeguard
