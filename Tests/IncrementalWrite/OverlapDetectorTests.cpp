#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <string>

#include "IncrementalWrite/OverlapDetector.h"

using namespace Inkwell::Core::IO;

namespace {

std::string randomString(std::mt19937& gen, size_t maxLen, const std::string& alphabet) {
    std::uniform_int_distribution<size_t> lenDist(0, maxLen);
    std::uniform_int_distribution<size_t> charDist(0, alphabet.size() - 1);
    std::string s(lenDist(gen), '\0');
    for (auto& c : s) c = alphabet[charDist(gen)];
    return s;
}

// Reference definition: largest k with a[-k:] == b[:k]
size_t referenceOverlap(const std::string& a, const std::string& b) {
    size_t best = 0;
    for (size_t k = 1; k <= std::min(a.size(), b.size()); ++k) {
        if (a.compare(a.size() - k, k, b, 0, k) == 0) best = k;
    }
    return best;
}

} // namespace

TEST(OverlapDetector, KnownCases) {
    EXPECT_EQ(directOverlap("hello world", "world peace"), 5u);
    EXPECT_EQ(hashOverlap("hello world", "world peace"), 5u);

    EXPECT_EQ(directOverlap("test data", "data analysis"), 4u);
    EXPECT_EQ(hashOverlap("test data", "data analysis"), 4u);

    EXPECT_EQ(directOverlap("abc", "c123"), 1u);
    EXPECT_EQ(hashOverlap("abc", "c123"), 1u);

    EXPECT_EQ(directOverlap("end of line ", " start of next"), 1u);
    EXPECT_EQ(hashOverlap("end of line ", " start of next"), 1u);

    EXPECT_EQ(directOverlap("abc", "abc"), 3u);
    EXPECT_EQ(hashOverlap("abc", "abc"), 3u);

    EXPECT_EQ(directOverlap("abc", "xyz"), 0u);
    EXPECT_EQ(hashOverlap("abc", "xyz"), 0u);
}

TEST(OverlapDetector, EmptyInputsGiveZero) {
    EXPECT_EQ(directOverlap("", ""), 0u);
    EXPECT_EQ(directOverlap("abc", ""), 0u);
    EXPECT_EQ(directOverlap("", "abc"), 0u);
    EXPECT_EQ(hashOverlap("", ""), 0u);
    EXPECT_EQ(hashOverlap("abc", ""), 0u);
    EXPECT_EQ(hashOverlap("", "abc"), 0u);
}

TEST(OverlapDetector, ShortOverlapsBelowHashMinimumAreFound) {
    // Overlaps of 1..3 bytes fall under the rolling-hash minimum and are checked directly
    EXPECT_EQ(hashOverlap("xxxxxxxxab", "abyyyyyyyy"), 2u);
    EXPECT_EQ(hashOverlap("xxxxxxxabc", "abcyyyyyyy"), 3u);
    EXPECT_EQ(hashOverlap("xxxxxxxxxa", "ayyyyyyyyy"), 1u);
    EXPECT_EQ(hashOverlap("xxxxxxabcd", "abcdyyyyyy"), 4u);
}

TEST(OverlapDetector, LargeTextWithTrailingMarker) {
    std::string existing(200000, 'a');
    existing += "\n// END_OF_CONTENT\n\n";
    ASSERT_EQ(existing.size() - 200000, 20u);
    std::string incoming = "// END_OF_CONTENT\n\nnext section";

    EXPECT_EQ(directOverlap(existing, incoming), 19u);
    EXPECT_EQ(hashOverlap(existing, incoming), 19u);
}

TEST(OverlapDetector, MultiByteTextComparedAsBytes) {
    const std::string existing = "Привет, мир";    // "мир" is 6 bytes
    const std::string incoming = "мир и дружба";
    EXPECT_EQ(directOverlap(existing, incoming), 6u);
    EXPECT_EQ(hashOverlap(existing, incoming), 6u);
}

TEST(OverlapDetector, CustomHashMinimumAgreesWithDirect) {
    EXPECT_EQ(hashOverlap("hello world", "world peace", 1), 5u);
    EXPECT_EQ(hashOverlap("hello world", "world peace", 16), 5u);
    EXPECT_EQ(hashOverlap("hello world", "world peace", 0), 5u);
}

TEST(OverlapDetector, AgreementBoundednessAndMaximality) {
    std::mt19937 gen(1234567u);
    const std::string alphabets[] = {"ab", "abc", "a", "xy\n "};
    for (const auto& alphabet : alphabets) {
        for (int i = 0; i < 2000; ++i) {
            const auto a = randomString(gen, 24, alphabet);
            const auto b = randomString(gen, 24, alphabet);

            const size_t direct = directOverlap(a, b);
            const size_t hashed = hashOverlap(a, b);
            ASSERT_EQ(direct, hashed) << "a=\"" << a << "\" b=\"" << b << "\"";
            ASSERT_LE(direct, std::min(a.size(), b.size()));
            ASSERT_EQ(direct, referenceOverlap(a, b)) << "a=\"" << a << "\" b=\"" << b << "\"";
        }
    }
}

TEST(OverlapDetector, AgreementOnOverlappingConstructions) {
    // Guaranteed overlaps of every length exercise both the hash and direct paths
    std::mt19937 gen(42u);
    for (int i = 0; i < 500; ++i) {
        const auto head = randomString(gen, 40, "ab");
        const auto shared = randomString(gen, 12, "ab");
        const auto tail = randomString(gen, 40, "ab");
        const std::string a = head + shared;
        const std::string b = shared + tail;

        const size_t k = directOverlap(a, b);
        EXPECT_GE(k, shared.size());
        EXPECT_EQ(k, hashOverlap(a, b));
    }
}

TEST(OverlapDetector, SelectionBySize) {
    const OverlapFunction direct = &directOverlap;
    const OverlapFunction hashed = &hashOverlap;
    EXPECT_EQ(selectOverlapAlgorithm(100, 4096), direct);
    EXPECT_EQ(selectOverlapAlgorithm(4096, 4096), direct);
    const OverlapFunction large = selectOverlapAlgorithm(4097, 4096);
    EXPECT_EQ(large, hashed);
    EXPECT_EQ(large("hello world", "world peace", 4), 5u);
    EXPECT_EQ(direct("hello world", "world peace", 4), 5u);
}
