#include <gtest/gtest.h>
#include "wikidata_client.hpp"
#include "gate_config.hpp"
#include "uri_codec.hpp"

using namespace llmgate;

TEST(UriCodecTest, EncodeUriComponent) {
    EXPECT_EQ(encode_uri_component("http://example.org/a b"), "http%3A%2F%2Fexample.org%2Fa%20b");
    EXPECT_EQ(encode_uri_component("A-z_0.9!~*'()"), "A-z_0.9!~*'()");
    EXPECT_EQ(encode_uri_component("#?&=+"), "%23%3F%26%3D%2B");
    EXPECT_EQ(encode_uri_component("\xC3\xA9"), "%C3%A9");
    EXPECT_EQ(encode_uri_component(""), "");
}

TEST(WikidataClientTest, BuildTarget) {
    GateConfig config;
    WikidataClient client(config);

    SearchOptions options;
    options.language = "en";
    options.limit = 3;
    EXPECT_EQ(client.build_target("Douglas Adams", options),
              "/w/api.php?action=wbsearchentities&search=Douglas%20Adams&language=en&uselang=en"
              "&type=item&limit=3&format=json");
}

TEST(WikidataClientTest, ScoreHit) {
    EXPECT_EQ(WikidataClient::score_hit("douglas adams", "Douglas  Adams", "alias", 0), 100.0);
    EXPECT_EQ(WikidataClient::score_hit("adams", "Douglas Adams", "label", 0), 85.0);
    EXPECT_EQ(WikidataClient::score_hit("dna", "Douglas Adams", "alias", 1), 70.0);
    EXPECT_EQ(WikidataClient::score_hit("x", "Y", "description", 2), 50.0);
    EXPECT_EQ(WikidataClient::score_hit("x", "Y", "label", 40), 0.0);
}

TEST(WikidataClientTest, ParseResponseRanksAndTruncates) {
    const std::string body = R"({
        "searchinfo": {"search": "Berlin"},
        "search": [
            {"id": "Q64", "label": "Berlin", "description": "capital of Germany", "match": {"type": "label"}},
            {"id": "Q821244", "label": "Berlin", "match": {"type": "label"}},
            {"id": "Q152087", "label": "Berlin, New Hampshire", "match": {"type": "alias"}},
            {"label": "no id"},
            {"id": "Q3", "label": "Other", "match": {"type": "description"}}
        ],
        "success": 1
    })";

    auto candidates = WikidataClient::parse_response(body, "berlin", 3);
    ASSERT_EQ(candidates.size(), 3u);
    EXPECT_EQ(candidates[0].id, "Q64");
    EXPECT_EQ(candidates[0].score, 100.0);
    ASSERT_TRUE(candidates[0].description.has_value());
    EXPECT_EQ(*candidates[0].description, "capital of Germany");
    EXPECT_EQ(candidates[1].id, "Q821244");
    EXPECT_EQ(candidates[1].score, 95.0);
    EXPECT_FALSE(candidates[1].description.has_value());
    EXPECT_EQ(candidates[2].id, "Q152087");
    for (size_t i = 1; i < candidates.size(); ++i) {
        EXPECT_GE(candidates[i - 1].score, candidates[i].score);
    }
}

TEST(WikidataClientTest, ParseResponseEmpty) {
    EXPECT_TRUE(WikidataClient::parse_response(R"({"search": []})", "x", 5).empty());
    EXPECT_TRUE(WikidataClient::parse_response(R"({"success": 1})", "x", 5).empty());
}

TEST(WikidataClientTest, ParseResponseErrors) {
    EXPECT_THROW(WikidataClient::parse_response("<html>", "x", 5), SearchApiError);
    EXPECT_THROW(WikidataClient::parse_response("[1,2]", "x", 5), SearchApiError);
    EXPECT_THROW(WikidataClient::parse_response(
                     R"({"error": {"code": "badvalue", "info": "Unrecognized value"}})", "x", 5),
                 SearchApiError);

    try {
        WikidataClient::parse_response(R"({"error": {"code": "ratelimited"}})", "x", 5);
        FAIL() << "in-band throttling not reported";
    } catch (const SearchRateLimitError& e) {
        EXPECT_GT(e.retry_after_ms(), 0);
    }
}
