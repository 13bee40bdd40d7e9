#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include "ctxwin/BudgetConfig.hpp"
#include "ctxwin/Classifier.hpp"
#include "ctxwin/Scorer.hpp"
#include "TestSupport.hpp"

using namespace ctxwin;
using testsupport::fixed_now;
using testsupport::make_candidate;

static bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

void test_priority_tiers() {
    std::cout << "Testing priority tiers..." << std::endl;

    assert(classify_priority_tier(make_candidate("a", Domain::Personal, "x", 30)) == PriorityTier::Critical);
    assert(classify_priority_tier(make_candidate("b", Domain::Personal, "x", 29)) == PriorityTier::Optional);
    assert(classify_priority_tier(make_candidate("c", Domain::Relationships, "x", 50)) == PriorityTier::Critical);
    assert(classify_priority_tier(make_candidate("d", Domain::Relationships, "x", 49)) == PriorityTier::Relevant);
    assert(classify_priority_tier(make_candidate("e", Domain::Conversation, "x", 70)) == PriorityTier::Critical);
    assert(classify_priority_tier(make_candidate("f", Domain::Conversation, "x", 30)) == PriorityTier::Relevant);
    assert(classify_priority_tier(make_candidate("g", Domain::Conversation, "x", 29)) == PriorityTier::Optional);

    // core personal domains get a lower bar for "relevant"
    assert(classify_priority_tier(make_candidate("h", Domain::Health, "x", 20)) == PriorityTier::Relevant);
    assert(classify_priority_tier(make_candidate("i", Domain::Goals, "x", 20)) == PriorityTier::Relevant);
    assert(classify_priority_tier(make_candidate("j", Domain::Preferences, "x", 20)) == PriorityTier::Relevant);
    assert(classify_priority_tier(make_candidate("k", Domain::Health, "x", 19)) == PriorityTier::Optional);
    assert(classify_priority_tier(make_candidate("l", Domain::Tasks, "x", 25)) == PriorityTier::Optional);

    std::cout << "  PASS" << std::endl;
}

void test_memory_types() {
    std::cout << "Testing memory types..." << std::endl;

    const TimePoint now = fixed_now();

    assert(classify_memory_type(make_candidate("a", Domain::Notes, "Bought milk", 10, 23.0), now) == MemoryType::Recent);
    assert(classify_memory_type(make_candidate("b", Domain::Notes, "I always drink tea", 10, 48.0), now) == MemoryType::Pattern);
    assert(classify_memory_type(make_candidate("c", Domain::Notes, "My daily routine starts at six", 10, 48.0), now) == MemoryType::Pattern);
    assert(classify_memory_type(make_candidate("d", Domain::Notes, "Prefers tea in the morning", 10, 48.0), now) == MemoryType::LongTerm);
    assert(classify_memory_type(make_candidate("e", Domain::Notes, "Visited Rome", 10, 500.0), now) == MemoryType::LongTerm);

    // recency wins over habit language
    assert(classify_memory_type(make_candidate("f", Domain::Notes, "I always drink tea", 10, 10.0), now) == MemoryType::Recent);

    Classification cls = classify(make_candidate("g", Domain::Personal, "I never eat meat", 60, 72.0), now);
    assert(cls.tier == PriorityTier::Critical);
    assert(cls.memory_type == MemoryType::Pattern);

    assert(near(age_hours(make_candidate("h", Domain::Notes, "x", 0, 36.0), now), 36.0));
    assert(age_hours(make_candidate("i", Domain::Notes, "x", 0, -2.0), now) < 0.0);

    std::cout << "  PASS" << std::endl;
}

void test_decay_curves() {
    std::cout << "Testing decay curves..." << std::endl;

    DecayConfig exp_cfg;
    assert(near(decay_factor(0.0, exp_cfg), 1.0));
    assert(near(decay_factor(168.0, exp_cfg), std::sqrt(0.5)));
    assert(near(decay_factor(336.0, exp_cfg), 0.5));
    assert(near(decay_factor(1000.0, exp_cfg), 0.5));
    assert(near(decay_factor(-48.0, exp_cfg), 1.0));

    DecayConfig lin_cfg;
    lin_cfg.curve = DecayCurve::Linear;
    assert(near(decay_factor(84.0, lin_cfg), 0.75));
    assert(near(decay_factor(168.0, lin_cfg), 0.5));
    assert(near(decay_factor(300.0, lin_cfg), 0.5));

    lin_cfg.floor = 0.0;
    assert(near(decay_factor(400.0, lin_cfg), 0.0));

    // monotone non-increasing
    double prev = 2.0;
    for (int h = 0; h <= 2000; h += 25) {
        const double f = decay_factor(static_cast<double>(h), exp_cfg);
        assert(f <= prev);
        assert(f >= exp_cfg.floor && f <= 1.0);
        prev = f;
    }

    std::cout << "  PASS" << std::endl;
}

void test_relevance_scores() {
    std::cout << "Testing relevance scores..." << std::endl;

    const TimePoint now = fixed_now();
    const DecayConfig decay;

    assert(relevance_score(make_candidate("a", Domain::Conversation, "x", 80, 0.0), decay, now) == 80);
    assert(relevance_score(make_candidate("b", Domain::Conversation, "x", 80, 168.0), decay, now) == 57);
    assert(relevance_score(make_candidate("c", Domain::Conversation, "x", 80, 336.0), decay, now) == 40);
    assert(relevance_score(make_candidate("d", Domain::Conversation, "x", 80, 5000.0), decay, now) == 40);

    // domain boosts
    assert(relevance_score(make_candidate("e", Domain::Personal, "x", 50), decay, now) == 75);
    assert(relevance_score(make_candidate("f", Domain::Relationships, "x", 50), decay, now) == 65);
    assert(relevance_score(make_candidate("g", Domain::Health, "x", 40), decay, now) == 48);
    assert(relevance_score(make_candidate("h", Domain::Tasks, "x", 40), decay, now) == 40);

    // half-up rounding: 33 * 1.5 = 49.5
    assert(relevance_score(make_candidate("i", Domain::Personal, "x", 33), decay, now) == 50);

    // clamping
    assert(relevance_score(make_candidate("j", Domain::Personal, "x", 90), decay, now) == 100);
    assert(relevance_score(make_candidate("k", Domain::Conversation, "x", 150), decay, now) == 100);
    assert(relevance_score(make_candidate("l", Domain::Conversation, "x", -5), decay, now) == 0);

    // a timestamp in the future counts as brand new
    assert(relevance_score(make_candidate("m", Domain::Conversation, "x", 80, -48.0), decay, now) == 80);

    std::cout << "  PASS" << std::endl;
}

void test_confidence_scores() {
    std::cout << "Testing confidence scores..." << std::endl;

    assert(confidence_score(make_candidate("a", Domain::Notes, "x", 10, 0.0, "orb_text"), 50) == 55);
    assert(confidence_score(make_candidate("b", Domain::Notes, "x", 80, 0.0, "system"), 50) == 70);
    assert(confidence_score(make_candidate("c", Domain::Notes, "x", 55, 0.0, "orb_voice"), 50) == 50);
    assert(confidence_score(make_candidate("d", Domain::Notes, "x", 0, 0.0, "manual"), 50) == 50);
    assert(confidence_score(make_candidate("e", Domain::Notes, "x", 0, 0.0, "text"), 50) == 55);
    assert(confidence_score(make_candidate("f", Domain::Notes, "x", 0, 0.0, "VOICE"), 50) == 45);

    assert(confidence_score(make_candidate("g", Domain::Notes, "x", 90, 0.0, "system"), 95) == 100);
    assert(confidence_score(make_candidate("h", Domain::Notes, "x", 0, 0.0, "orb_voice"), 0) == 0);

    std::cout << "  PASS" << std::endl;
}

void test_enrich_candidates() {
    std::cout << "Testing candidate enrichment..." << std::endl;

    const BudgetConfig cfg = default_budget_config();
    const std::vector<Candidate> cands = {
        make_candidate("first", Domain::Conversation, "Grüße aus Wien", 40, 2.0),
        make_candidate("second", Domain::Personal, "My name is Lena", 60, 100.0, "system"),
        make_candidate("third", Domain::Tasks, "I usually file reports on Friday", 10, 100.0, "orb_voice"),
    };

    const auto items = enrich_candidates(cands, 50, cfg, fixed_now());
    assert(items.size() == 3);

    assert(items[0].candidate.id == "first");
    assert(items[0].char_count == 14);
    assert(items[0].relevance_score == 40);
    assert(items[0].confidence_score == 55);
    assert(items[0].priority_tier == PriorityTier::Relevant);
    assert(items[0].memory_type == MemoryType::Recent);
    assert(items[0].diversity_score == 1.0);

    assert(items[1].candidate.id == "second");
    assert(items[1].priority_tier == PriorityTier::Critical);
    assert(items[1].memory_type == MemoryType::LongTerm);
    assert(items[1].confidence_score == 65);

    assert(items[2].candidate.id == "third");
    assert(items[2].priority_tier == PriorityTier::Optional);
    assert(items[2].memory_type == MemoryType::Pattern);
    assert(items[2].confidence_score == 45);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== scoring tests ===" << std::endl;

    test_priority_tiers();
    test_memory_types();
    test_decay_curves();
    test_relevance_scores();
    test_confidence_scores();
    test_enrich_candidates();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
