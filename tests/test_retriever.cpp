#include <gtest/gtest.h>
#include "engine/index_builder.hpp"
#include "engine/retriever.hpp"
#include "test_helpers.hpp"

using namespace morgue::engine;
using morgue::test::TempDir;

namespace {

    class RetrieverTest : public ::testing::Test {
    protected:
        static constexpr size_t kDim = 16;

        void SetUp() override {
            config = morgue::test::test_config(dir, kDim);
            for (size_t f = 0; f < 2; ++f) {
                morgue::test::write_source(config.embeddings_dir, config.chunks_dir, f, 5, kDim);
            }
            IndexBuilder(config).build();

            index = load_vector_index(IndexMode::Exact, config.index_path(), kDim, 1);
            ASSERT_TRUE(store.open(config.database_path(), true));
            resolver = create_text_resolver(Deployment::Full, ChunkSource(config.embeddings_dir, config.chunks_dir));
            retriever = std::make_unique<Retriever>(*index, store, embedder, *resolver, config);
        }

        TempDir dir;
        Config config;
        std::unique_ptr<VectorIndex> index;
        MetadataStore store;
        morgue::test::FakeEmbedder embedder{kDim};
        std::unique_ptr<TextResolver> resolver;
        std::unique_ptr<Retriever> retriever;
    };

    // Search always fails, as a corrupted compressed index would
    class FailingIndex : public VectorIndex {
    public:
        explicit FailingIndex(size_t dim) : m_dim(dim) {}
        IndexMode mode() const override { return IndexMode::Compressed; }
        size_t dimension() const override { return m_dim; }
        size_t count() const override { return 1; }
        bool needs_training() const override { return false; }
        void train(const float*, size_t) override {}
        void add(const float*, size_t) override {}
        std::vector<SearchHit> search(const float*, size_t) const override {
            throw IndexError("IVF+PQ search failed: corrupted lists");
        }
        void truncate(size_t) override {}
        void save(const std::filesystem::path&) const override {}

    private:
        size_t m_dim;
    };

    Passage passage(const std::string& paper, const std::string& date) {
        Passage p;
        p.paper = paper;
        p.date = date;
        return p;
    }

}

TEST_F(RetrieverTest, EmptyQueryNeverTouchesTheEmbedder) {
    for (const char* q : {"", "   ", "\t\n"}) {
        auto response = retriever->retrieve(q, 5);
        EXPECT_EQ(response.answer, kEmptyQueryAnswer);
        EXPECT_TRUE(response.sources.empty());
    }
    EXPECT_EQ(embedder.calls, 0);
}

TEST_F(RetrieverTest, ExactMatchJoinsMetadataAndLazyText) {
    embedder.vectors["flood in ogden"] = morgue::test::chunk_vector(1, 2, kDim);

    auto response = retriever->retrieve("flood in ogden", 3);
    ASSERT_EQ(response.sources.size(), 3u);

    const auto& top = response.sources[0];
    EXPECT_EQ(top.id, 7u);
    EXPECT_EQ(top.article_id, "art-1-2");
    EXPECT_EQ(top.title, "Title 1/2");
    EXPECT_EQ(top.date.find('T'), std::string::npos);
    EXPECT_EQ(top.text, morgue::test::chunk_text(1, 2));
    EXPECT_EQ(top.snippet, top.text);
    EXPECT_EQ(top.link, config.source_link_base + "art-1-2");
    EXPECT_EQ(top.relevance, 100);
    EXPECT_GE(top.relevance, response.sources[1].relevance);

    EXPECT_EQ(response.answer.rfind("Found 3 relevant articles from the Utah Digital Newspapers archive.", 0), 0u);
    EXPECT_NE(response.answer.find("See the sources below for detailed excerpts."), std::string::npos);
    EXPECT_FALSE(response.synthesized);
}

TEST_F(RetrieverTest, TopKIsClampedToConfiguredRange) {
    config.max_top_k = 4;
    Retriever capped(*index, store, embedder, *resolver, config);
    EXPECT_EQ(capped.retrieve("anything", 50).sources.size(), 4u);
    EXPECT_EQ(capped.retrieve("anything", 0).sources.size(), 1u);
}

TEST_F(RetrieverTest, EmbedderFailureIsFatalForTheCall) {
    embedder.fail = true;
    EXPECT_THROW(retriever->retrieve("who won the election", 5), RetrievalError);

    embedder.fail = false;
    embedder.vectors["short"] = std::vector<float>(kDim / 2, 1.0f);
    EXPECT_THROW(retriever->retrieve("short", 5), RetrievalError);
}

TEST(RetrieverJoinTest, DropsHitsWithoutMetadataAndHandlesEmptyIndex) {
    TempDir dir;
    auto config = morgue::test::test_config(dir, 8);
    morgue::test::FakeEmbedder embedder(8);
    InlineTextResolver resolver;

    MetadataStore store;
    ASSERT_TRUE(store.open(dir / "meta.db"));

    auto empty = create_exact_index(8);
    Retriever on_empty(*empty, store, embedder, resolver, config);
    auto none = on_empty.retrieve("railroad", 5);
    EXPECT_EQ(none.answer, kNoResultsAnswer);
    EXPECT_TRUE(none.sources.empty());

    auto index = create_exact_index(8);
    std::vector<float> data;
    for (size_t i = 0; i < 3; ++i) {
        auto v = morgue::test::chunk_vector(0, i, 8);
        data.insert(data.end(), v.begin(), v.end());
    }
    normalize_l2(data.data(), 3, 8);
    index->add(data.data(), 3);

    ChunkRecord only;
    only.global_id = 1;
    only.article_title = "nan";
    only.paper = "Salt Lake Herald";
    only.date = "1899-07-24T00:00:00";
    only.text = "Pioneer Day parade";
    ASSERT_TRUE(store.upsert_rows({only}));

    Retriever partial(*index, store, embedder, resolver, config);
    auto response = partial.retrieve("parade", 3);
    ASSERT_EQ(response.sources.size(), 1u);
    EXPECT_EQ(response.sources[0].title, "Untitled Article");
    EXPECT_EQ(response.sources[0].date, "1899-07-24");
    EXPECT_EQ(response.sources[0].snippet, "Pioneer Day parade");
    EXPECT_TRUE(response.sources[0].link.empty());
    EXPECT_EQ(response.answer,
              "Found 1 relevant article from the Utah Digital Newspapers archive. "
              "Sources include: Salt Lake Herald. See the sources below for detailed excerpts.");
}

TEST_F(RetrieverTest, SnippetIsCutAtConfiguredLength) {
    ChunkRecord record;
    record.article_title = "None";
    std::string text(400, 'x');
    auto p = retriever->format_passage(record, text, 0.42f);
    EXPECT_EQ(p.snippet, std::string(300, 'x') + "...");
    EXPECT_EQ(p.text.size(), 400u);
    EXPECT_EQ(p.title, "Untitled Article");
    EXPECT_EQ(p.relevance, 42);
}

TEST_F(RetrieverTest, ExtractiveSummaryListsPapersAndDateRange) {
    std::vector<Passage> passages = {
        passage("Deseret News", "1900-05-05"),
        passage("Box Elder News", "1890-01-01"),
        passage("Ogden Standard", "1895-03-10"),
        passage("Vernal Express", ""),
        passage("Deseret News", "1890-01-01"),
    };
    EXPECT_EQ(retriever->extractive_summary(passages),
              "Found 5 relevant articles from the Utah Digital Newspapers archive. "
              "Sources include: Box Elder News, Deseret News, Ogden Standard and 1 more. "
              "Date range: 1890-01-01 to 1900-05-05. "
              "See the sources below for detailed excerpts.");

    std::vector<Passage> same_day = {passage("", "1901-01-01"), passage("", "1901-01-01")};
    EXPECT_EQ(retriever->extractive_summary(same_day),
              "Found 2 relevant articles from the Utah Digital Newspapers archive. "
              "See the sources below for detailed excerpts.");

    EXPECT_EQ(retriever->extractive_summary({}), kNoResultsAnswer);
}

TEST(RetrieverSearchTest, SearchFailureSurfacesAsIndexError) {
    TempDir dir;
    auto config = morgue::test::test_config(dir, 8);
    morgue::test::FakeEmbedder embedder(8);
    InlineTextResolver resolver;
    MetadataStore store;
    ASSERT_TRUE(store.open(dir / "meta.db"));

    FailingIndex index(8);
    Retriever retriever(index, store, embedder, resolver, config);
    EXPECT_THROW(retriever.retrieve("railroad", 5), IndexError);
}

TEST(TextResolverTest, InlineAndSourceFileResolution) {
    TempDir dir;
    auto config = morgue::test::test_config(dir, 8);
    morgue::test::write_source(config.embeddings_dir, config.chunks_dir, 9, 3, 8);
    ChunkSource source(config.embeddings_dir, config.chunks_dir);

    ChunkRecord record;
    record.source_file = morgue::test::source_name(9);
    record.row_offset = 2;

    auto full = create_text_resolver(Deployment::Full, source);
    EXPECT_EQ(full->resolve(record), morgue::test::chunk_text(9, 2));
    record.row_offset = 0;
    EXPECT_EQ(full->resolve(record), morgue::test::chunk_text(9, 0));
    record.row_offset = 3;
    EXPECT_FALSE(full->resolve(record).has_value());
    record.row_offset = 2;

    auto lite = create_text_resolver(Deployment::Lite, source);
    EXPECT_FALSE(lite->resolve(record).has_value());
    record.text = "inline";
    EXPECT_EQ(lite->resolve(record), std::optional<std::string>("inline"));

    record.text.reset();
    record.source_file = "missing";
    EXPECT_FALSE(full->resolve(record).has_value());
}
