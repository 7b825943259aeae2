#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <string>

#include "inf/responses.hpp"

using nlohmann::json;

TEST(ResponsesTest, QueryResponseFields)
{
    const auto j = json::parse(R"({"status":"ok","statuscode":1,"error":"","generalscore":-0.75,
                                   "confirmcode":"C1","classifiers":{"ml":0.5,"industry":-1}})");
    const auto r = j.get<inf::QueryResponse>();
    EXPECT_EQ(r.status, "ok");
    EXPECT_FLOAT_EQ(r.status_code, 1);
    EXPECT_FLOAT_EQ(r.general_score, -0.75f);
    EXPECT_EQ(r.confirm_code, "C1");
    ASSERT_EQ(r.classifiers.size(), 2u);
    EXPECT_FLOAT_EQ(r.classifiers.at("industry"), -1);
}

TEST(ResponsesTest, FieldNamesAreCaseInsensitive)
{
    const auto r = json::parse(R"({"Status":"ok","statusCode":3,"GeneralScore":12})").get<inf::QueryResponse>();
    EXPECT_EQ(r.status, "ok");
    EXPECT_FLOAT_EQ(r.status_code, 3);
    EXPECT_FLOAT_EQ(r.general_score, 12);
}

TEST(ResponsesTest, MissingAndNullFieldsKeepDefaults)
{
    const auto r = json::parse(R"({"status":null,"extra":[1,2,3]})").get<inf::QueryResponse>();
    EXPECT_TRUE(r.status.empty());
    EXPECT_FLOAT_EQ(r.status_code, 0);
    EXPECT_FLOAT_EQ(r.general_score, 0);
    EXPECT_TRUE(r.classifiers.empty());
}

TEST(ResponsesTest, WrongTypesThrow)
{
    EXPECT_THROW(json::parse(R"({"statuscode":"one"})").get<inf::UploadResponse>(), json::type_error);
    EXPECT_THROW(json::parse(R"("just a string")").get<inf::UploadResponse>(), json::type_error);
}

TEST(ResponsesTest, KeyedResult)
{
    const auto res = json::parse(R"({"a":{"status":"ok"},"b":{"status":"fail","error":"bad"}})")
                         .get<inf::UploadResult>();
    ASSERT_EQ(res.size(), 2u);
    EXPECT_EQ(res.at("b").error, "bad");
}

TEST(ResponsesTest, SerializesWireNames)
{
    inf::QueryResponse r;
    r.status = "ok";
    r.status_code = 1;
    r.general_score = 90;
    r.classifiers["ml"] = 1;
    const json j = r;
    EXPECT_EQ(j.at("status"), "ok");
    EXPECT_EQ(j.at("statuscode"), 1);
    EXPECT_EQ(j.at("generalscore"), 90);
    EXPECT_EQ(j.at("confirmcode"), "");
    EXPECT_EQ(j.at("classifiers").at("ml"), 1);

    const json u = inf::UploadResponse{};
    EXPECT_FALSE(u.contains("generalscore"));
    EXPECT_TRUE(u.contains("statuscode"));
}

TEST(ResponsesTest, WholeNumbersSerializeWithoutFraction)
{
    inf::QueryResponse r;
    r.status_code = 1;
    r.general_score = 0.1f;
    r.classifiers["ml"] = -1;
    r.classifiers["human"] = 0.75f;
    const std::string out = json(r).dump();
    EXPECT_NE(out.find("\"statuscode\":1}"), std::string::npos) << out;
    EXPECT_NE(out.find("\"generalscore\":0.1,"), std::string::npos) << out;
    EXPECT_NE(out.find("\"ml\":-1}"), std::string::npos) << out;
    EXPECT_NE(out.find("\"human\":0.75,"), std::string::npos) << out;

    const json u = inf::UploadResponse{};
    EXPECT_EQ(u.dump(), R"({"error":"","status":"","statuscode":0})");
}

TEST(ResponsesTest, NonObjectEntryIsTypeError)
{
    EXPECT_THROW(json::parse("[1,2]").get<inf::QueryResponse>(), json::type_error);
    EXPECT_THROW(json::parse("42").get<inf::QueryResponse>(), json::type_error);
}
