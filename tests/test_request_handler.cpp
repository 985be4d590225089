#include <gtest/gtest.h>
#include "engine/index_builder.hpp"
#include "engine/request_handler.hpp"
#include "engine/service.hpp"
#include "test_helpers.hpp"

using namespace morgue::engine;
using morgue::test::TempDir;
using json = nlohmann::json;

namespace {

    class ServiceTest : public ::testing::Test {
    protected:
        static constexpr size_t kDim = 16;

        void SetUp() override {
            config = morgue::test::test_config(dir, kDim);
        }

        void build_corpus(size_t files, size_t rows) {
            for (size_t f = 0; f < files; ++f) {
                morgue::test::write_source(config.embeddings_dir, config.chunks_dir, f, rows, kDim);
            }
            IndexBuilder(config).build();
        }

        std::unique_ptr<Service> make_service(morgue::test::FakeEmbedder** embedder_out = nullptr,
                                              bool summarizer_ok = true) {
            auto embedder = std::make_unique<morgue::test::FakeEmbedder>(kDim);
            if (embedder_out) *embedder_out = embedder.get();
            auto summary = summarizer_ok ? Synthesis::success("An LLM answer.") : Synthesis::failure("backend down");
            auto summarizer = std::make_unique<morgue::test::FakeSummarizer>(true, summary);
            return std::make_unique<Service>(config, std::move(embedder), std::move(summarizer));
        }

        TempDir dir;
        Config config;
    };

}

TEST_F(ServiceTest, MissingIndexLeavesServiceNotInitialized) {
    auto service = make_service();
    EXPECT_FALSE(service->initialize());
    EXPECT_FALSE(service->initialized());
    EXPECT_NE(service->error().find("no index"), std::string::npos);
    EXPECT_THROW(service->query({"anything", 5, false}), RetrievalError);

    auto reply = json::parse(handle_request(*service, R"({"method":"query","params":{"query":"x"}})"));
    EXPECT_EQ(reply["status"], "not_initialized");
    EXPECT_TRUE(reply.contains("error"));

    auto status = json::parse(handle_request(*service, R"({"method":"status"})"));
    EXPECT_FALSE(status["result"]["initialized"].get<bool>());
}

TEST_F(ServiceTest, CountMismatchBetweenIndexAndStoreIsRejected) {
    build_corpus(2, 4);
    {
        MetadataStore store;
        ASSERT_TRUE(store.open(config.database_path()));
        ASSERT_TRUE(store.begin());
        ASSERT_TRUE(store.truncate_from(4).has_value());
        ASSERT_TRUE(store.commit());
    }
    auto service = make_service();
    EXPECT_FALSE(service->initialize());
    EXPECT_NE(service->error().find("8 vectors"), std::string::npos);
}

TEST_F(ServiceTest, MissingDatabaseNextToIndexIsRejected) {
    build_corpus(1, 3);
    std::filesystem::remove(config.database_path());
    auto service = make_service();
    EXPECT_FALSE(service->initialize());
    EXPECT_NE(service->error().find("missing"), std::string::npos);
}

TEST_F(ServiceTest, StatusReplyReplacesInvalidUtf8InTheError) {
    config.index_base = (dir / "archive\xff" / "udn").string();
    auto service = make_service();
    EXPECT_FALSE(service->initialize());

    auto status = json::parse(handle_request(*service, R"({"method":"status"})"));
    EXPECT_FALSE(status["result"]["initialized"].get<bool>());
    EXPECT_NE(status["result"]["error"].get<std::string>().find("\xEF\xBF\xBD"), std::string::npos);

    auto query = json::parse(handle_request(*service, R"({"method":"query","params":{"query":"x"}})"));
    EXPECT_EQ(query["status"], "not_initialized");
}

TEST_F(ServiceTest, QueryRoundTripOverHandler) {
    build_corpus(2, 5);
    morgue::test::FakeEmbedder* embedder = nullptr;
    auto service = make_service(&embedder);
    ASSERT_TRUE(service->initialize());
    embedder->vectors["brigham young"] = morgue::test::chunk_vector(0, 4, kDim);

    auto reply = json::parse(handle_request(*service,
        R"({"method":"query","params":{"query":"brigham young","top_k":2}})"));
    ASSERT_TRUE(reply.contains("result")) << reply.dump();
    const auto& result = reply["result"];
    ASSERT_EQ(result["sources"].size(), 2u);
    EXPECT_EQ(result["sources"][0]["article_id"], "art-0-4");
    EXPECT_EQ(result["sources"][0]["relevance"], 100);
    EXPECT_EQ(result["sources"][0]["snippet"], morgue::test::chunk_text(0, 4));
    EXPECT_FALSE(result["synthesized"].get<bool>());
    EXPECT_EQ(result["answer"].get<std::string>().rfind("Found 2 relevant articles", 0), 0u);

    auto synthesized = json::parse(handle_request(*service,
        R"({"method":"query","params":{"query":"brigham young","synthesize":true}})"));
    EXPECT_EQ(synthesized["result"]["answer"], "An LLM answer.");
    EXPECT_EQ(synthesized["result"]["sources"].size(), config.default_top_k);

    auto status = json::parse(handle_request(*service, R"({"method":"status"})"))["result"];
    EXPECT_TRUE(status["initialized"].get<bool>());
    EXPECT_EQ(status["documents"], 10);
    EXPECT_EQ(status["mode"], "exact");
    EXPECT_EQ(status["summarizer"], "fake");
    EXPECT_TRUE(status["summarizer_available"].get<bool>());
}

TEST_F(ServiceTest, SummarizerFailureFallsBackToExtractiveAnswer) {
    build_corpus(1, 5);
    auto service = make_service(nullptr, false);
    ASSERT_TRUE(service->initialize());

    auto response = service->query({"salt lake temple", 3, true});
    EXPECT_FALSE(response.synthesized);
    EXPECT_EQ(response.answer.rfind("Found 3 relevant articles", 0), 0u);
}

TEST_F(ServiceTest, HandlerReportsProtocolErrors) {
    build_corpus(1, 2);
    morgue::test::FakeEmbedder* embedder = nullptr;
    auto service = make_service(&embedder);
    ASSERT_TRUE(service->initialize());

    EXPECT_EQ(json::parse(handle_request(*service, "not json"))["error"], "invalid json");
    EXPECT_EQ(json::parse(handle_request(*service, R"({"method":"fly"})"))["error"], "unknown method");
    EXPECT_EQ(json::parse(handle_request(*service, R"({"method":7})"))["error"], "unknown method");
    EXPECT_EQ(json::parse(handle_request(*service, R"({"method":"ping"})"))["result"], "pong");

    auto empty = json::parse(handle_request(*service, R"({"method":"query","params":{"query":"  "}})"));
    EXPECT_EQ(empty["result"]["answer"], kEmptyQueryAnswer);
    EXPECT_TRUE(empty["result"]["sources"].empty());

    embedder->fail = true;
    auto failed = json::parse(handle_request(*service, R"({"method":"query","params":{"query":"x"}})"));
    EXPECT_EQ(failed["status"], "embedding_unavailable");

    auto bad = json::parse(handle_request(*service, R"({"method":"query","params":{"query":"x","top_k":"five"}})"));
    EXPECT_NE(bad["error"].get<std::string>().find("invalid params"), std::string::npos);
}

TEST(QueryRequestTest, ParsesObjectAndLegacyArrayParams) {
    Config config;
    auto object = parse_query_request(json{{"query", "mormon battalion"}, {"synthesize", true}}, config);
    EXPECT_EQ(object.query, "mormon battalion");
    EXPECT_EQ(object.top_k, config.default_top_k);
    EXPECT_TRUE(object.synthesize);

    auto array = parse_query_request(json::array({"handcart companies"}), config);
    EXPECT_EQ(array.query, "handcart companies");
    EXPECT_FALSE(array.synthesize);
}
