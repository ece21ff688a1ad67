#include <catch2/catch_test_macros.hpp>
#include "sanitizer/value_masker.hpp"

#include <regex>

using namespace eventscrub;

TEST_CASE("ValueMasker: 16-digit card numbers are sensitive", "[value_masker]") {
    CHECK(ValueMasker::looks_like_credit_card("4242424242424242"));
    CHECK(ValueMasker::looks_like_credit_card("4242 4242 4242 4242"));
    CHECK(ValueMasker::looks_like_credit_card("4242-4242-4242-4242"));
}

TEST_CASE("ValueMasker: 15-digit AMEX numbers are sensitive", "[value_masker]") {
    CHECK(ValueMasker::looks_like_credit_card("424242424242424"));
    CHECK(ValueMasker::looks_like_credit_card("3782 822463 10005"));
}

TEST_CASE("ValueMasker: other digit counts are not card-shaped", "[value_masker]") {
    CHECK_FALSE(ValueMasker::looks_like_credit_card("42424242"));
    CHECK_FALSE(ValueMasker::looks_like_credit_card("42424242424242424"));
    CHECK_FALSE(ValueMasker::looks_like_credit_card(""));
    CHECK_FALSE(ValueMasker::looks_like_credit_card("hello world"));
    CHECK_FALSE(ValueMasker::looks_like_credit_card("********"));
}

TEST_CASE("ValueMasker: Luhn checksum", "[value_masker]") {
    CHECK(ValueMasker::luhn_valid("4242424242424242"));
    CHECK(ValueMasker::luhn_valid("378282246310005"));
    CHECK_FALSE(ValueMasker::luhn_valid("4242424242424241"));
    CHECK_FALSE(ValueMasker::luhn_valid(""));
}

TEST_CASE("ValueMasker: Luhn gate rejects card-shaped noise", "[value_masker]") {
    ValueMasker::Config config;
    config.credit_card_luhn_check = true;
    const ValueMasker masker(config);

    CHECK(masker.is_sensitive("4242424242424242"));
    CHECK_FALSE(masker.is_sensitive("4242424242424241"));
}

TEST_CASE("ValueMasker: default config flags cards only", "[value_masker]") {
    const ValueMasker masker;

    CHECK(masker.is_sensitive("4567000012345678"));
    CHECK_FALSE(masker.is_sensitive("123-45-6789"));
    CHECK_FALSE(masker.is_sensitive("bar"));
    CHECK(masker.pattern_count() == 0);
}

TEST_CASE("ValueMasker: extra patterns must match the whole value", "[value_masker]") {
    ValueMasker::Config config;
    config.value_patterns = {R"(\d{3}-\d{2}-\d{4})"};
    const ValueMasker masker(config);

    CHECK(masker.pattern_count() == 1);
    CHECK(masker.is_sensitive("123-45-6789"));
    CHECK_FALSE(masker.is_sensitive("ssn 123-45-6789"));
}

TEST_CASE("ValueMasker: credit card shape can be disabled", "[value_masker]") {
    ValueMasker::Config config;
    config.credit_card_enabled = false;
    const ValueMasker masker(config);

    CHECK_FALSE(masker.is_sensitive("4242424242424242"));
}

TEST_CASE("ValueMasker: invalid pattern throws at construction", "[value_masker]") {
    ValueMasker::Config config;
    config.value_patterns = {"(unclosed"};
    CHECK_THROWS_AS(ValueMasker(config), std::regex_error);
}
