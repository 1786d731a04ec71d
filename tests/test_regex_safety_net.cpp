#include <gtest/gtest.h>
#include "sanitizer/regex_safety_net.h"

using namespace docsan::sanitizer;

class RegexSafetyNetTest : public ::testing::Test {
protected:
    RegexSafetyNet net_;
    ReplacementSetBuilder builder_;

    const Replacement* find(const std::string& original) const {
        for (const auto& e : builder_.entries()) {
            if (e.original == original) return &e;
        }
        return nullptr;
    }
};

TEST_F(RegexSafetyNetTest, AddsMissedEmail) {
    size_t added = net_.apply("Contact: priya.fernando92@finance.lk for details", builder_);
    ASSERT_EQ(added, 1u);

    const Replacement* e = find("priya.fernando92@finance.lk");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->kind, "email");
    EXPECT_EQ(e->replacement, "person_1@example.com");
}

TEST_F(RegexSafetyNetTest, SkipsValuesAlreadyCovered) {
    builder_.add("John.Doe@company.lk", "email", "person_1@example.com");

    // Same mailbox written without dots and in another case
    size_t added = net_.apply("Mail JOHNDOE@company.lk or john.doe@company.lk", builder_);
    EXPECT_EQ(added, 0u);
    EXPECT_EQ(builder_.size(), 1u);
}

TEST_F(RegexSafetyNetTest, ContinuesNumberingFromExistingEntries) {
    builder_.add("a@x.com", "email", "person_1@example.com");
    builder_.add("b@x.com", "email", "person_2@example.com");

    net_.apply("Also c@x.com", builder_);
    const Replacement* e = find("c@x.com");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->replacement, "person_3@example.com");
}

TEST_F(RegexSafetyNetTest, PhoneFormats) {
    std::string text = "Call +94 77 523 4567 or 011-234-5678. Mobile 0771234567.";
    net_.apply(text, builder_);

    const Replacement* intl = find("+94 77 523 4567");
    const Replacement* local = find("011-234-5678");
    const Replacement* compact = find("0771234567");
    ASSERT_NE(intl, nullptr);
    ASSERT_NE(local, nullptr);
    ASSERT_NE(compact, nullptr);
    EXPECT_EQ(intl->replacement, "+00 00 000 0001");
    EXPECT_EQ(local->replacement, "+00 00 000 0002");
    EXPECT_EQ(compact->replacement, "+00 00 000 0003");
}

TEST_F(RegexSafetyNetTest, RejectsShortNumbers) {
    // Years and amounts carry fewer than 7 digits
    size_t added = net_.apply("In 2023 revenue grew by 45 000 to 120-450", builder_);
    EXPECT_EQ(added, 0u);
}

TEST_F(RegexSafetyNetTest, IdNumbers) {
    net_.apply("NIC 851234567V, passport holder", builder_);

    const Replacement* nic = find("851234567V");
    ASSERT_NE(nic, nullptr);
    EXPECT_EQ(nic->kind, "id_number");
    EXPECT_EQ(nic->replacement, "ID_000001");
}

TEST_F(RegexSafetyNetTest, DigitGuardRejectsLongerRuns) {
    // 14 digits: neither the compact phone nor the 12-digit id may fire inside it
    size_t added = net_.apply("Ref 12345678901234 end", builder_);
    EXPECT_EQ(added, 0u);
}

TEST_F(RegexSafetyNetTest, SecondRunAddsNothing) {
    std::string text = "priya@finance.lk, +94 77 523 4567, 851234567V";
    size_t first = net_.apply(text, builder_);
    auto snapshot = builder_.entries();

    size_t second = net_.apply(text, builder_);
    EXPECT_GT(first, 0u);
    EXPECT_EQ(second, 0u);
    EXPECT_EQ(builder_.entries(), snapshot);
}

TEST_F(RegexSafetyNetTest, ScanDoesNotModifyBuilder) {
    auto findings = net_.scan("x@y.org", builder_);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].category, KindCategory::EMAIL);
    EXPECT_EQ(findings[0].pattern_name, "EMAIL");
    EXPECT_EQ(builder_.size(), 0u);
}

TEST_F(RegexSafetyNetTest, DisabledAddsNothing) {
    ASSERT_TRUE(net_.initialize({{"enabled", false}}));
    EXPECT_FALSE(net_.isEnabled());
    EXPECT_EQ(net_.apply("priya@finance.lk", builder_), 0u);
}

TEST_F(RegexSafetyNetTest, CustomPlaceholderFormats) {
    ASSERT_TRUE(net_.initialize({{"email_placeholder", "user{}@redacted.test"},
                                 {"id_placeholder", "{oops"}}));
    EXPECT_EQ(net_.placeholderFor(KindCategory::EMAIL, 4), "user4@redacted.test");
    // Broken format falls back to the default
    EXPECT_EQ(net_.placeholderFor(KindCategory::ID, 7), "ID_000007");
}

TEST_F(RegexSafetyNetTest, ConfiguredPatternsReplaceDefaults) {
    nlohmann::json cfg = {
        {"patterns", {
            {{"name", "EMAIL_ONLY"}, {"kind", "email"},
             {"regex", "[a-z]{1,32}@[a-z]{1,32}\\.[a-z]{2,6}"}},
            {{"name", "BROKEN"}, {"kind", "phone"}, {"regex", "(unclosed"}},
            {{"name", "NO_KIND"}, {"regex", "\\d+"}}
        }}
    };
    ASSERT_TRUE(net_.initialize(cfg));
    EXPECT_EQ(net_.getMetadata()["total_patterns"], 1);

    EXPECT_EQ(net_.apply("a@b.com 0771234567", builder_), 1u);
}

TEST_F(RegexSafetyNetTest, ReloadKeepsPatternsOnFailure) {
    nlohmann::json bad = {{"patterns", {{{"name", "X"}, {"kind", "other"}, {"regex", "x"}}}}};
    EXPECT_FALSE(net_.reload(bad));
    EXPECT_EQ(net_.getMetadata()["total_patterns"], 6);
    EXPECT_FALSE(net_.getLastError().empty());
}

TEST_F(RegexSafetyNetTest, ConfiguredUnboundedRepeatsAreRejected) {
    nlohmann::json cfg = {
        {"patterns", {
            {{"name", "GREEDY"}, {"kind", "phone"}, {"regex", "\\+\\d+"}},
            {{"name", "STAR"}, {"kind", "email"}, {"regex", "[a-z]*@x\\.com"}},
            {{"name", "OPEN_RANGE"}, {"kind", "id"}, {"regex", "\\d{9,}"}},
            {{"name", "BOUNDED"}, {"kind", "id"}, {"regex", "\\d{9}[VX+*]"}}
        }}
    };
    ASSERT_TRUE(net_.initialize(cfg));

    auto meta = net_.getMetadata();
    EXPECT_EQ(meta["total_patterns"], 1);
    EXPECT_EQ(meta["patterns"][0], "BOUNDED");
}

TEST_F(RegexSafetyNetTest, LongUnbrokenTokenIsScannedSafely) {
    // A pasted hash or base64 blob with no separators
    std::string text = "Ref: " + std::string(100000, 'a') + " contact priya@finance.lk";

    EXPECT_EQ(net_.apply(text, builder_), 1u);
    EXPECT_NE(find("priya@finance.lk"), nullptr);

    std::string digits = "Ref: " + std::string(100000, '7');
    EXPECT_EQ(net_.apply(digits, builder_), 0u);
}
