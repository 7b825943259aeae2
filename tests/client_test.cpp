#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include "fake_transport.hpp"
#include "inf/client.hpp"
#include "inf/internal/gzip.hpp"
#include "inf/internal/http_parser.hpp"
#include "query_helpers.hpp"

namespace {

const char* kBase = "https://api.test/apiv2/";

std::unordered_map<std::string, std::string> query_of(const std::string& url)
{
    const std::size_t q = url.find('?');
    if (q == std::string::npos) return {};
    return parse_query(url.substr(q + 1));
}

} // namespace

class ClientTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        transport = std::make_shared<RecordingTransport>();
        inf::Error err;
        client = inf::Client::create({inf::set_key("test-key"),
                                      inf::set_url(kBase),
                                      inf::set_transport(transport),
                                      inf::set_error_log(std::make_shared<inf::StreamLogSink>(errors)),
                                      inf::set_trace_log(std::make_shared<inf::StreamLogSink>(trace))},
                                     err);
        ASSERT_NE(client, nullptr) << err.to_string();
    }

    std::shared_ptr<RecordingTransport> transport;
    std::ostringstream errors;
    std::ostringstream trace;
    std::unique_ptr<inf::Client> client;
};

TEST_F(ClientTest, QuerySingleHash)
{
    transport->reply(200, R"({"abc123":{"status":"ok","statuscode":1,"generalscore":90}})");

    inf::QueryResult res;
    inf::Error err;
    ASSERT_TRUE(client->query("", {"abc123"}, res, err)) << err.to_string();

    ASSERT_EQ(transport->requests.size(), 1u);
    const auto& req = transport->requests[0];
    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.url, std::string(kBase) + "q?c=all&h=abc123");
    EXPECT_EQ(req.header("Accept"), "application/json");
    EXPECT_EQ(req.header("X-IAUTH"), "test-key");
    EXPECT_FALSE(req.has_body);
    EXPECT_FALSE(req.has_header("Content-Length"));
    EXPECT_FALSE(req.has_header("Content-Type"));

    ASSERT_EQ(res.size(), 1u);
    const inf::QueryResponse& r = res.at("abc123");
    EXPECT_FLOAT_EQ(r.general_score, 90);
    EXPECT_EQ(r.status, "ok");
    EXPECT_FLOAT_EQ(r.status_code, 1);
    EXPECT_TRUE(r.confirm_code.empty());
    EXPECT_TRUE(r.classifiers.empty());
}

TEST_F(ClientTest, QueryJoinsHashesAndKeepsClassifiers)
{
    transport->reply(200, R"({
        "d41d8cd98f00b204e9800998ecf8427e": {"status":"ok","statuscode":1,"generalscore":-1,
                                             "classifiers":{"ml":-0.5,"human":1}},
        "da39a3ee5e6b4b0d3255bfef95601890afd80709": {"status":"unknown","statuscode":0,
                                                     "confirmcode":"CONF-9"}
    })");

    inf::QueryResult res;
    inf::Error err;
    ASSERT_TRUE(client->query("ml", {"d41d8cd98f00b204e9800998ecf8427e",
                                     "da39a3ee5e6b4b0d3255bfef95601890afd80709"}, res, err))
        << err.to_string();

    const auto params = query_of(transport->requests.at(0).url);
    EXPECT_EQ(params.at("c"), "ml");
    EXPECT_EQ(params.at("h"), "d41d8cd98f00b204e9800998ecf8427e,da39a3ee5e6b4b0d3255bfef95601890afd80709");

    ASSERT_EQ(res.size(), 2u);
    const auto& known = res.at("d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_FLOAT_EQ(known.general_score, -1);
    EXPECT_FLOAT_EQ(known.classifiers.at("ml"), -0.5f);
    EXPECT_FLOAT_EQ(known.classifiers.at("human"), 1);
    EXPECT_EQ(res.at("da39a3ee5e6b4b0d3255bfef95601890afd80709").confirm_code, "CONF-9");
}

TEST_F(ClientTest, QueryWithoutHashesSendsNothing)
{
    inf::QueryResult res;
    inf::Error err;
    EXPECT_FALSE(client->query("all", {}, res, err));
    EXPECT_EQ(err.id, "missing_arg");
    EXPECT_TRUE(transport->requests.empty());
}

TEST_F(ClientTest, UploadSendsExactGzipBody)
{
    transport->reply(200, R"({"CODE1":{"status":"ok","statuscode":1}})");

    std::istringstream data("hello");
    inf::UploadResult res;
    inf::Error err;
    ASSERT_TRUE(client->upload("CODE1", &data, res, err)) << err.to_string();

    ASSERT_EQ(transport->requests.size(), 1u);
    const auto& req = transport->requests[0];
    EXPECT_EQ(req.method, "PUT");
    EXPECT_EQ(req.url, std::string(kBase) + "u/CODE1");
    EXPECT_EQ(req.header("X-IAUTH"), "test-key");
    EXPECT_EQ(req.header("Content-Type"), "application/xgzip");
    ASSERT_TRUE(req.has_body);
    EXPECT_EQ(req.header("Content-Length"), std::to_string(req.body.size()));

    std::string plain;
    ASSERT_TRUE(inf::internal::gunzip(req.body, plain, err)) << err.to_string();
    EXPECT_EQ(plain, "hello");

    ASSERT_EQ(res.size(), 1u);
    EXPECT_EQ(res.at("CODE1").status, "ok");
}

TEST_F(ClientTest, UploadArgumentsAreRequired)
{
    std::istringstream data("hello");
    inf::UploadResult res;
    inf::Error err;

    EXPECT_FALSE(client->upload("", &data, res, err));
    EXPECT_EQ(err.id, "missing_arg");

    err = {};
    EXPECT_FALSE(client->upload("CODE1", nullptr, res, err));
    EXPECT_EQ(err.id, "missing_arg");

    err = {};
    EXPECT_FALSE(client->upload_file("", "/etc/hostname", res, err));
    EXPECT_EQ(err.id, "missing_arg");

    EXPECT_TRUE(transport->requests.empty());
}

TEST_F(ClientTest, UploadFileOpenFailureIsReturned)
{
    inf::UploadResult res;
    inf::Error err;
    EXPECT_FALSE(client->upload_file("CODE1", ::testing::TempDir() + "/no/such/file.bin", res, err));
    EXPECT_EQ(err.id, "io_error");
    EXPECT_NE(err.details.find("no/such/file.bin"), std::string::npos);
    EXPECT_TRUE(transport->requests.empty());
}

TEST_F(ClientTest, UploadFileSendsFileContents)
{
    const std::string path = ::testing::TempDir() + "/inf_upload_sample.bin";
    std::string content;
    for (int i = 0; i < 5000; ++i) content += static_cast<char>(i % 251);
    {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }
    transport->reply(201, R"({"f1":{"status":"accepted","statuscode":2}})");

    inf::UploadResult res;
    inf::Error err;
    ASSERT_TRUE(client->upload_file("CODE2", path, res, err)) << err.to_string();

    const auto& req = transport->requests.at(0);
    EXPECT_EQ(req.url, std::string(kBase) + "u/CODE2");
    std::string plain;
    ASSERT_TRUE(inf::internal::gunzip(req.body, plain, err));
    EXPECT_EQ(plain, content);
    EXPECT_EQ(res.at("f1").status, "accepted");
}

TEST_F(ClientTest, NonSuccessStatusIsHttpError)
{
    for (int code : {199, 301, 400, 401, 404, 500, 503}) {
        transport->reply(code, R"({"error":"nope"})");
        inf::QueryResult res;
        inf::Error err;
        EXPECT_FALSE(client->query("", {"abc"}, res, err)) << code;
        EXPECT_EQ(err.id, "http_error") << code;
        EXPECT_NE(err.details.find(std::to_string(code)), std::string::npos) << err.details;
    }
}

TEST_F(ClientTest, HttpErrorCarriesReasonAndDumpsResponse)
{
    transport->reply(404, R"({"error":"no such hash"})", "Not Found");
    inf::QueryResult res;
    inf::Error err;
    EXPECT_FALSE(client->query("", {"abc"}, res, err));
    EXPECT_EQ(err.details, "Unexpected status code: 404 (Not Found)");
    EXPECT_NE(errors.str().find("no such hash"), std::string::npos) << errors.str();
    EXPECT_NE(errors.str().find("HTTP/1.1 404"), std::string::npos) << errors.str();
}

TEST_F(ClientTest, StatusRangeBoundaries)
{
    inf::Error err;
    transport->reply(200, "");
    EXPECT_TRUE(client->request("GET", "ping", {}, nullptr, 0, inf::Destination{}, err));
    transport->reply(299, "");
    EXPECT_TRUE(client->request("GET", "ping", {}, nullptr, 0, inf::Destination{}, err));
    transport->reply(300, "");
    EXPECT_FALSE(client->request("GET", "ping", {}, nullptr, 0, inf::Destination{}, err));
    EXPECT_EQ(err.id, "http_error");
}

TEST_F(ClientTest, MalformedJsonIsJsonError)
{
    transport->reply(200, "<html>gateway</html>");
    inf::QueryResult res;
    inf::Error err;
    EXPECT_FALSE(client->query("", {"abc"}, res, err));
    EXPECT_EQ(err.id, "json_error");
    EXPECT_FALSE(err.details.empty());
    EXPECT_NE(errors.str().find("<html>gateway</html>"), std::string::npos);
}

TEST_F(ClientTest, MistypedJsonIsJsonError)
{
    transport->reply(200, R"({"abc":{"status":"ok","generalscore":"high"}})");
    inf::QueryResult res;
    inf::Error err;
    EXPECT_FALSE(client->query("", {"abc"}, res, err));
    EXPECT_EQ(err.id, "json_error");
}

TEST_F(ClientTest, NullBodyDecodesToEmptyResult)
{
    transport->reply(200, "null");
    inf::QueryResult res;
    inf::Error err;
    EXPECT_TRUE(client->query("", {"abc"}, res, err)) << err.to_string();
    EXPECT_TRUE(res.empty());
}

TEST_F(ClientTest, TransportFailureIsReturned)
{
    transport->fail_with("dial api.test:443: Connection refused");
    inf::QueryResult res;
    inf::Error err;
    EXPECT_FALSE(client->query("", {"abc"}, res, err));
    EXPECT_EQ(err.id, "transport_error");
    EXPECT_EQ(err.details, "dial api.test:443: Connection refused");
    EXPECT_NE(errors.str().find("Connection refused"), std::string::npos);
}

TEST_F(ClientTest, RawDestinationCopiesBodyVerbatim)
{
    const std::string body = std::string("not json ") + '\x01' + '\0' + " at all";
    transport->reply(200, body);
    std::ostringstream sink;
    inf::Error err;
    ASSERT_TRUE(client->request("get", "raw", {{"x", "a b"}}, nullptr, 0, inf::Destination::raw(sink), err))
        << err.to_string();
    EXPECT_EQ(sink.str(), body);
    EXPECT_EQ(transport->requests.at(0).method, "GET");
    EXPECT_EQ(transport->requests.at(0).url, std::string(kBase) + "raw?x=a%20b");
}

TEST_F(ClientTest, ExplicitBodyLengthIsSentAsGiven)
{
    transport->reply(204, "");
    const std::string body = "0123456789";
    inf::Error err;
    ASSERT_TRUE(client->request("PUT", "u/X", {}, &body, 10, inf::Destination{}, err));
    const auto& req = transport->requests.at(0);
    EXPECT_EQ(req.header("Content-Length"), "10");
    EXPECT_EQ(req.header("Content-Type"), "application/xgzip");
    EXPECT_EQ(req.body, body);
}

TEST_F(ClientTest, TraceLogsRequestAndResponse)
{
    transport->reply(200, R"({"abc":{"status":"ok","statuscode":1}})");
    inf::QueryResult res;
    inf::Error err;
    ASSERT_TRUE(client->query("", {"abc"}, res, err));

    const std::string t = trace.str();
    EXPECT_NE(t.find("GET /apiv2/q?c=all&h=abc HTTP/1.1"), std::string::npos) << t;
    EXPECT_NE(t.find("Host: api.test"), std::string::npos) << t;
    EXPECT_NE(t.find("X-IAUTH: test-key"), std::string::npos) << t;
    EXPECT_NE(t.find("Start request q?c=all&h=abc"), std::string::npos) << t;
    EXPECT_NE(t.find("End request q?c=all&h=abc"), std::string::npos) << t;
    EXPECT_NE(t.find("HTTP/1.1 200"), std::string::npos) << t;
    EXPECT_NE(t.find(R"("status":"ok")"), std::string::npos) << t;
}

TEST_F(ClientTest, TraceLogsResponseOnFailure)
{
    transport->reply(500, "backend exploded");
    inf::QueryResult res;
    inf::Error err;
    EXPECT_FALSE(client->query("", {"abc"}, res, err));
    EXPECT_NE(trace.str().find("backend exploded"), std::string::npos);
    EXPECT_NE(trace.str().find("End request"), std::string::npos);
}

TEST(ClientNoLogsTest, WorksWithoutSinks)
{
    auto transport = std::make_shared<RecordingTransport>();
    transport->reply(502, "");
    inf::Error err;
    auto cli = inf::Client::create({inf::set_key("k"), inf::set_transport(transport)}, err);
    ASSERT_NE(cli, nullptr);

    inf::QueryResult res;
    EXPECT_FALSE(cli->query("", {"abc"}, res, err));
    EXPECT_EQ(err.id, "http_error");
    EXPECT_EQ(transport->requests.at(0).url, "https://api.cylance.com/apiv2/q?c=all&h=abc");
}
