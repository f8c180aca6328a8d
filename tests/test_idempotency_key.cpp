#include <gtest/gtest.h>
#include "idempotency_key.hpp"

#include <cstdint>

using namespace llmgate;
namespace json = boost::json;

TEST(IdempotencyKeyTest, Sha256KnownVector) {
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(IdempotencyKeyTest, NormalizeText) {
    EXPECT_EQ(normalize_text("  Hello   World \n"), "hello world");
    EXPECT_EQ(normalize_text("A\tB\r\nC"), "a b c");
    EXPECT_EQ(normalize_text("   "), "");
    EXPECT_EQ(normalize_text(""), "");
}

TEST(IdempotencyKeyTest, NormalizeTextUnicodeCase) {
    EXPECT_EQ(normalize_text("CAF\u00c9"), "caf\u00e9");
    EXPECT_EQ(normalize_text("\u00c9COLE \u00c0 PARIS"), "\u00e9cole \u00e0 paris");
    EXPECT_EQ(compute_key("CAF\u00c9", "foaf", "v1"), compute_key("caf\u00e9", "foaf", "v1"));
}

TEST(IdempotencyKeyTest, NormalizeTextUnicodeWhitespace) {
    // NBSP, line separator, ideographic space and BOM all count as whitespace.
    EXPECT_EQ(normalize_text("alice\u00a0knows\u00a0bob"), "alice knows bob");
    EXPECT_EQ(normalize_text("\u3000alice\u2028\u2028bob\ufeff"), "alice bob");
    EXPECT_EQ(normalize_text("a\u2003\u202f b"), "a b");
    EXPECT_EQ(compute_key("Alice\u00a0Knows Bob", "foaf", "v1"),
              compute_key("alice knows bob", "foaf", "v1"));
}

TEST(IdempotencyKeyTest, Deterministic) {
    json::object params{{"model", "claude"}, {"temperature", 0.2}};
    std::string a = compute_key("Some text", "foaf", "v1", params);
    std::string b = compute_key("Some text", "foaf", "v1", params);
    EXPECT_EQ(a, b);
    EXPECT_TRUE(is_idempotency_key(a));
}

TEST(IdempotencyKeyTest, TextCaseAndWhitespaceInsensitive) {
    EXPECT_EQ(compute_key("Alice  knows\nBob", "foaf", "v1"),
              compute_key("  alice knows bob ", "foaf", "v1"));
}

TEST(IdempotencyKeyTest, ComponentsChangeKey) {
    std::string base = compute_key("text", "foaf", "v1");
    EXPECT_NE(base, compute_key("text2", "foaf", "v1"));
    EXPECT_NE(base, compute_key("text", "schema", "v1"));
    EXPECT_NE(base, compute_key("text", "foaf", "v2"));
    EXPECT_NE(base, compute_key("text", "foaf", "v1", json::object{{"k", 1}}));
}

TEST(IdempotencyKeyTest, ParamOrderIndependent) {
    ParamList forward = {{"a", json::value(1)}, {"b", json::value("x")}};
    ParamList reverse = {{"b", json::value("x")}, {"a", json::value(1)}};
    EXPECT_EQ(hash_params(forward), hash_params(reverse));
    EXPECT_EQ(hash_params(forward).size(), 16u);
}

TEST(IdempotencyKeyTest, EmptyParamsSentinel) {
    EXPECT_EQ(hash_params(ParamList{}), "0000000000000000");
    EXPECT_EQ(hash_params(json::object{}), EMPTY_PARAMS_DIGEST);
    EXPECT_NE(EMPTY_PARAMS_DIGEST, sha256_hex("").substr(0, 16));

    // Only undefined fields is the same as no fields.
    ParamList undefined_only = {{"a", std::nullopt}};
    EXPECT_EQ(hash_params(undefined_only), EMPTY_PARAMS_DIGEST);
}

TEST(IdempotencyKeyTest, UndefinedDroppedNullKept) {
    ParamList with_undefined = {{"a", json::value(1)}, {"b", std::nullopt}};
    ParamList without = {{"a", json::value(1)}};
    ParamList with_null = {{"a", json::value(1)}, {"b", json::value(nullptr)}};
    EXPECT_EQ(hash_params(with_undefined), hash_params(without));
    EXPECT_NE(hash_params(with_null), hash_params(without));
}

TEST(IdempotencyKeyTest, ParamsCanonicalForm) {
    ParamList params = {{"b", json::value("x")}, {"a", json::value(1)}};
    EXPECT_EQ(hash_params(params), sha256_hex("a:1|b:\"x\"").substr(0, 16));

    ParamList fractional = {{"temperature", json::value(0.7)}, {"top_p", json::value(1.0)}};
    EXPECT_EQ(hash_params(fractional), sha256_hex("temperature:0.7|top_p:1").substr(0, 16));

    ParamList nested = {{"stop", json::parse(R"({"after":[0.25,-2.0,null,true],"k":"v"})")}};
    EXPECT_EQ(hash_params(nested), sha256_hex(R"(stop:{"after":[0.25,-2,null,true],"k":"v"})").substr(0, 16));
}

TEST(IdempotencyKeyTest, CanonicalNumberFormat) {
    EXPECT_EQ(canonical_json(json::value(0.7)), "0.7");
    EXPECT_EQ(canonical_json(json::value(1.0)), "1");
    EXPECT_EQ(canonical_json(json::value(-0.0)), "0");
    EXPECT_EQ(canonical_json(json::value(123.456)), "123.456");
    EXPECT_EQ(canonical_json(json::value(0.000001)), "0.000001");
    EXPECT_EQ(canonical_json(json::value(1e-7)), "1e-7");
    EXPECT_EQ(canonical_json(json::value(1e21)), "1e+21");
    EXPECT_EQ(canonical_json(json::value(1.5e300)), "1.5e+300");
    EXPECT_EQ(canonical_json(json::value(-42)), "-42");
    EXPECT_EQ(canonical_json(json::value(std::uint64_t{18446744073709551615ull})), "18446744073709551615");
}

TEST(IdempotencyKeyTest, KeyLayout) {
    std::string expected = sha256_hex("hello|foaf|v1|" + EMPTY_PARAMS_DIGEST);
    EXPECT_EQ(compute_key(" Hello ", "foaf", "v1"), expected);
}

TEST(IdempotencyKeyTest, OntologyVersionIsContentAddressed) {
    std::string v1 = ontology_version("@prefix foaf: <http://xmlns.com/foaf/0.1/> .");
    std::string v2 = ontology_version("@prefix foaf: <http://xmlns.com/foaf/0.1/> . ");
    EXPECT_NE(v1, v2);
    EXPECT_EQ(v1, sha256_hex("@prefix foaf: <http://xmlns.com/foaf/0.1/> ."));
}

TEST(IdempotencyKeyTest, ShortKeyAndValidation) {
    std::string key = compute_key("text", "foaf", "v1");
    EXPECT_EQ(short_key(key), key.substr(0, 12));
    EXPECT_FALSE(is_idempotency_key(key.substr(1)));
    std::string upper = key;
    upper[0] = 'A';
    upper[1] = 'F';
    EXPECT_FALSE(is_idempotency_key(upper));
}
