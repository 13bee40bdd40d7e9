#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "ctxwin/Similarity.hpp"
#include "ctxwin/TimeUtil.hpp"
#include "text/TextUtil.hpp"

using namespace ctxwin;

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

void test_word_tokens() {
    std::cout << "Testing word tokens..." << std::endl;

    auto t = textutil::word_tokens("My wife's NAME is Anna!");
    assert((t == std::vector<std::string>{"my", "wife", "s", "name", "is", "anna"}));

    auto de = textutil::word_tokens("Ich heiße Jörg");
    assert(de.size() == 3);
    assert(de[1] == "heiße");
    assert(de[2] == "jörg");

    assert(textutil::word_tokens("  ,.;  ").empty());

    auto upper = textutil::word_tokens("ICH HEIßE JÖRG");
    assert((upper == std::vector<std::string>{"ich", "heiße", "jörg"}));

    std::cout << "  PASS" << std::endl;
}

void test_utf8_lowercase() {
    std::cout << "Testing UTF-8 lowercasing..." << std::endl;

    assert(textutil::to_lower_utf8("ÜBER ÄPFEL ÖFEN") == "über äpfel öfen");
    assert(textutil::to_lower_utf8("CAFÉ À LA CRÈME") == "café à la crème");
    assert(textutil::to_lower_utf8("ŁÓDŹ") == "łódź");
    assert(textutil::to_lower_utf8("ŠKODA ČESKÁ ŘEKA") == "škoda česká řeka");
    assert(textutil::to_lower_utf8("İSTANBUL") == "istanbul");
    assert(textutil::to_lower_utf8("ŸVES") == "ÿves");
    // no lowercase forms to map to
    assert(textutil::to_lower_utf8("STRAßE × 2") == "straße × 2");
    assert(textutil::to_lower_utf8("ΑΒΓ") == "ΑΒΓ");
    // a stray lead byte is copied as is
    assert(textutil::to_lower_utf8(std::string("A\xC3")) == std::string("a\xC3"));

    std::cout << "  PASS" << std::endl;
}

void test_utf8_helpers() {
    std::cout << "Testing UTF-8 helpers..." << std::endl;

    assert(textutil::utf8_length("Müller") == 6);
    assert(textutil::utf8_length("") == 0);
    assert(textutil::utf8_prefix("äöüß", 2) == "äö");

    assert(textutil::utf8_truncate("abcdefghij", 10) == "abcdefghij");
    assert(textutil::utf8_truncate("abcdefghij", 8) == "abcde...");
    assert(textutil::utf8_truncate("äöüäöüäöü", 5) == "äö...");
    assert(textutil::utf8_length(textutil::utf8_truncate("äöüäöüäöü", 5)) == 5);
    // marker does not fit: plain cut
    assert(textutil::utf8_truncate("abcdef", 2) == "ab");

    std::cout << "  PASS" << std::endl;
}

void test_lexical_similarity() {
    std::cout << "Testing lexical similarity..." << std::endl;

    assert(near(lexical_similarity("apple banana cherry", "apple banana cherry"), 1.0));
    assert(near(lexical_similarity("apple banana cherry", "apple banana grape"), 0.5));
    assert(near(lexical_similarity("Apple Pie", "apple pie"), 1.0));
    assert(near(lexical_similarity("apple pie", "orange juice"), 0.0));

    // tokens of two characters or less are ignored
    assert(near(lexical_similarity("I am ok", "we go to"), 1.0));
    assert(near(lexical_similarity("", "apple"), 0.0));
    assert(near(lexical_similarity("apple", ""), 0.0));

    // case folding covers accented letters
    assert(near(lexical_similarity("ÜBER ÄPFEL ÖFEN", "über äpfel öfen"), 1.0));
    assert(near(lexical_similarity("Großes CAFÉ heute", "großes café HEUTE"), 1.0));

    // length is counted in characters, not bytes
    assert(near(lexical_similarity("äb apple", "apple"), 1.0));
    assert(near(lexical_similarity("äbc apple", "apple"), 0.5));

    // punctuation stays attached to the token
    assert(near(lexical_similarity("apple,", "apple"), 0.0));

    // symmetric
    const std::string a = "walked the dog in the park";
    const std::string b = "walked the cat near the park";
    assert(near(lexical_similarity(a, b), lexical_similarity(b, a)));

    std::cout << "  PASS" << std::endl;
}

void test_topic_extraction() {
    std::cout << "Testing topic extraction..." << std::endl;

    assert(extract_topic("My name is Max") == "identity");
    assert(extract_topic("Ich heiße Anna") == "identity");
    assert(extract_topic("ICH HEIßE ANNA") == "identity");
    assert(extract_topic("ICH MÖCHTE EINEN MARATHON LAUFEN") == "goals");
    assert(extract_topic("Mein FIANCÉ kocht gern") == "spouse");
    assert(extract_topic("People call me Bob, I am called Bobby") == "identity");
    // identity outranks spouse
    assert(extract_topic("My wife's name is Anna") == "identity");
    assert(extract_topic("My wife Anna is a nurse") == "spouse");
    assert(extract_topic("Meine Mutter wohnt in Köln") == "parents");
    assert(extract_topic("Our daughter starts school") == "children");
    assert(extract_topic("Met an old friend downtown") == "friends");
    assert(extract_topic("Started a new job at Acme") == "work");
    assert(extract_topic("Doctor appointment on Monday") == "health");
    assert(extract_topic("I want to run a marathon") == "goals");
    assert(extract_topic("I like strong coffee") == "preferences");
    assert(extract_topic("I live in Berlin") == "location");
    assert(extract_topic("The weather was nice") == "general");
    assert(extract_topic("") == "general");

    // whole words only
    assert(extract_topic("Working late again") == "general");
    assert(extract_topic("Rename the folder") == "general");

    KeywordTopicExtractor topics;
    assert(topics.topic_of("I live in Berlin") == "location");

    std::cout << "  PASS" << std::endl;
}

void test_diversity_score() {
    std::cout << "Testing diversity score..." << std::endl;

    LexicalSimilarity sim;
    assert(near(diversity_score({}, sim), 1.0));
    assert(near(diversity_score({"apple banana cherry"}, sim), 1.0));
    assert(near(diversity_score({"apple banana cherry", "apple banana grape"}, sim), 0.5));
    assert(near(diversity_score({"same words here", "same words here", "same words here"}, sim), 0.0));
    assert(near(diversity_score({"apple pie", "orange juice", "green tea"}, sim), 1.0));

    std::cout << "  PASS" << std::endl;
}

void test_iso8601() {
    std::cout << "Testing ISO-8601 parsing..." << std::endl;

    auto t = parse_iso8601("2026-01-15T12:00:00Z");
    assert(t.has_value());
    assert(format_iso8601(*t) == "2026-01-15T12:00:00.000Z");
    assert(format_date(*t) == "2026-01-15");

    auto offset = parse_iso8601("2026-01-15T14:00:00+02:00");
    assert(offset.has_value() && *offset == *t);

    auto compact_offset = parse_iso8601("2026-01-15T07:00:00-0500");
    assert(compact_offset.has_value() && *compact_offset == *t);

    auto spaced = parse_iso8601("2026-01-15 12:00");
    assert(spaced.has_value() && *spaced == *t);

    auto frac = parse_iso8601("2026-01-15T12:00:00.25Z");
    assert(frac.has_value());
    assert(format_iso8601(*frac) == "2026-01-15T12:00:00.250Z");

    auto date_only = parse_iso8601("2024-02-29");
    assert(date_only.has_value());
    assert(format_iso8601(*date_only) == "2024-02-29T00:00:00.000Z");

    auto epoch = parse_iso8601("1970-01-01T00:00:00Z");
    assert(epoch.has_value() && epoch->time_since_epoch().count() == 0);

    assert(!parse_iso8601("2025-02-29").has_value());
    assert(!parse_iso8601("2026-13-01T00:00:00Z").has_value());
    assert(!parse_iso8601("2026-01-15T25:00:00Z").has_value());
    assert(!parse_iso8601("yesterday").has_value());
    assert(!parse_iso8601("2026-01-15T12:00:00Zjunk").has_value());

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== text / similarity tests ===" << std::endl;

    test_word_tokens();
    test_utf8_lowercase();
    test_utf8_helpers();
    test_lexical_similarity();
    test_topic_extraction();
    test_diversity_score();
    test_iso8601();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
