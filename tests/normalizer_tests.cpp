#include <gtest/gtest.h>

#include <string>

#include "core/normalizer.hpp"

namespace {

const std::string e_acute_composed = "\xC3\xA9";    // U+00E9
const std::string e_acute_decomposed = "e\xCC\x81"; // U+0065 U+0301

TEST(NormalizerTest, NfcComposes) {
    EXPECT_EQ(core::unicode_normalize(e_acute_decomposed, core::UnicodeForm::NFC), e_acute_composed);
    EXPECT_EQ(core::unicode_normalize(e_acute_composed, core::UnicodeForm::NFC), e_acute_composed);
}

TEST(NormalizerTest, NfdDecomposes) {
    EXPECT_EQ(core::unicode_normalize(e_acute_composed, core::UnicodeForm::NFD), e_acute_decomposed);
}

TEST(NormalizerTest, NfkcFoldsCompatibilityCharacters) {
    // U+FB01 LATIN SMALL LIGATURE FI
    EXPECT_EQ(core::unicode_normalize("\xEF\xAC\x81", core::UnicodeForm::NFKC), "fi");
    EXPECT_EQ(core::unicode_normalize("\xEF\xAC\x81", core::UnicodeForm::NFC), "\xEF\xAC\x81");
}

TEST(NormalizerTest, AsciiAndEmptyUnchanged) {
    EXPECT_EQ(core::unicode_normalize("", core::UnicodeForm::NFKD), "");
    EXPECT_EQ(core::unicode_normalize("plain ascii\r\n", core::UnicodeForm::NFKD), "plain ascii\r\n");
}

TEST(NormalizerTest, InvalidUtf8IsLeftAsIs) {
    const std::string bad = "ok\xFF\xFE" + e_acute_decomposed;
    EXPECT_EQ(core::unicode_normalize(bad, core::UnicodeForm::NFC), bad);
}

TEST(NormalizerTest, LineEndings) {
    EXPECT_EQ(core::unify_line_endings("a\r\nb\r\n"), "a\nb\n");
    EXPECT_EQ(core::unify_line_endings("a\rb"), "a\rb");
    EXPECT_EQ(core::unify_line_endings("\r\r\n"), "\r\n");
}

TEST(NormalizerTest, Labels) {
    EXPECT_EQ(core::unicode_label(core::UnicodeForm::NFC), "unicode_nfc");
    EXPECT_EQ(core::unicode_label(core::UnicodeForm::NFKD), "unicode_nfkd");
}

TEST(NormalizerTest, NormalizePairAppliesBothSteps) {
    core::CompareConfig cfg{};
    const auto pair = core::normalize_pair(e_acute_decomposed + "\r\n", e_acute_composed + "\n", cfg);
    EXPECT_EQ(pair.expected, e_acute_composed + "\n");
    EXPECT_EQ(pair.actual, e_acute_composed + "\n");
    ASSERT_EQ(pair.base_normalisations.size(), 1u);
    EXPECT_EQ(pair.base_normalisations[0], "unicode_nfc");
}

} // namespace
