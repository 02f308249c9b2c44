#include "scrapeguard/fallback.h"
#include "scrapeguard/document.h"
#include "scrapeguard/heuristics.h"

#include <algorithm>
#include <chrono>
#include <exception>

namespace scrapeguard {

namespace {

constexpr int kMinimalTimeoutMs = 10000;
const char* const kNoTitle = "No title found";

long long elapsed_ms(std::chrono::steady_clock::time_point since) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now() - since).count();
}

Value string_list(const std::vector<std::string>& items) {
    List out;
    out.reserve(items.size());
    for (const auto& s : items) out.push_back(Value::string(s));
    return Value::new_list(std::move(out));
}

std::string title_or_default(const Document& doc) {
    std::string t = doc.title();
    return t.empty() ? kNoTitle : t;
}

} // namespace

FallbackLadder::FallbackLadder(std::vector<FallbackTier> tiers) : tiers_(std::move(tiers)) {
    std::stable_sort(tiers_.begin(), tiers_.end(),
                     [](const FallbackTier& a, const FallbackTier& b) { return a.rank < b.rank; });
}

LadderResult FallbackLadder::run(const std::string& url, const std::atomic<bool>* cancel) const {
    LadderResult out;
    for (const auto& tier : tiers_) {
        if (cancel && cancel->load()) {
            out.cancelled = true;
            return out;
        }
        TierAttempt att;
        att.name = tier.name;
        att.rank = tier.rank;
        const auto t0 = std::chrono::steady_clock::now();

        TierOutcome r;
        if (!tier.producer) {
            r.error = "tier has no producer";
        } else {
            try {
                r = tier.producer(url);
            } catch (const std::exception& e) {
                r = TierOutcome{};
                r.error = std::string("tier threw: ") + e.what();
            }
        }
        att.duration_ms = elapsed_ms(t0);
        att.records = r.records.size();
        att.ok = r.ok && !r.records.empty();
        if (!att.ok) att.error = r.error.empty() ? "no records" : r.error;
        out.attempts.push_back(att);

        if (att.ok) {
            out.ok = true;
            out.records = std::move(r.records);
            out.tier = tier.name;
            return out;
        }
    }
    return out;
}

FallbackTier rendered_fetch_tier(IFetcher& fetcher, const FetchConfig& cfg) {
    FallbackTier t;
    t.rank = 2;
    t.fidelity = "rendered";
    t.name = "rendered_fetch";
    t.producer = [&fetcher, cfg](const std::string& url) {
        TierOutcome out;
        FetchRequest req;
        req.url = url;
        req.headers = polite_headers();
        req.timeout_ms = cfg.render_timeout_ms;
        req.settle_ms = settle_jitter_ms(cfg);
        FetchResult fr = fetcher.fetch_rendered(req);
        if (!fr.ok) {
            out.error = fr.error.empty() ? "rendered fetch failed" : fr.error;
            return out;
        }
        auto doc = make_document(url, fr.body);
        const std::string text = doc->text();
        const auto phones = extract_fallback_phones(text);
        const auto emails = extract_emails(text);

        Value rec = Value::new_map();
        rec.set("title", Value::string(title_or_default(*doc)));
        rec.set("url", Value::string(url));
        rec.set("phone_numbers", string_list(phones));
        rec.set("total_phones", Value::number((double)phones.size()));
        rec.set("emails", string_list(emails));
        rec.set("status", Value::string("rendered_fallback"));
        rec.set("fidelity", Value::string("rendered"));
        rec.set("message", Value::string("Rendered the page in a headless browser after the generated code found nothing"));
        out.ok = true;
        out.records.push_back(rec);
        return out;
    };
    return t;
}

FallbackTier minimal_fetch_tier(IFetcher& fetcher, const FetchConfig& cfg) {
    FallbackTier t;
    t.rank = 3;
    t.fidelity = "minimal";
    t.name = "minimal_fetch";
    t.producer = [&fetcher, cfg](const std::string& url) {
        TierOutcome out;
        FetchRequest req;
        req.url = url;
        req.headers = {{"User-Agent", cfg.user_agent}};
        req.timeout_ms = std::min(kMinimalTimeoutMs, cfg.http_timeout_ms > 0 ? cfg.http_timeout_ms : kMinimalTimeoutMs);
        FetchResult fr = fetcher.fetch_static(req);
        if (!fr.ok) {
            out.error = fr.error.empty() ? "fetch failed" : fr.error;
            return out;
        }
        auto doc = make_document(url, fr.body);

        Value rec = Value::new_map();
        rec.set("title", Value::string(title_or_default(*doc)));
        rec.set("url", Value::string(url));
        rec.set("status", Value::string("basic_fallback"));
        rec.set("fidelity", Value::string("minimal"));
        rec.set("message", Value::string("All extraction methods failed, extracted basic page info"));
        out.ok = true;
        out.records.push_back(rec);
        return out;
    };
    return t;
}

FallbackLadder default_ladder(IFetcher& fetcher, const FetchConfig& cfg) {
    return FallbackLadder({rendered_fetch_tier(fetcher, cfg), minimal_fetch_tier(fetcher, cfg)});
}

} // namespace scrapeguard
