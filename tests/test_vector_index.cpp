#include <gtest/gtest.h>
#include <cmath>
#include "engine/vector_index.hpp"
#include "test_helpers.hpp"

using namespace morgue::engine;
using morgue::test::TempDir;

namespace {

    std::vector<float> corpus(size_t n, size_t dim) {
        std::vector<float> data;
        for (size_t i = 0; i < n; ++i) {
            auto v = morgue::test::chunk_vector(i / 10, i % 10, dim);
            data.insert(data.end(), v.begin(), v.end());
        }
        normalize_l2(data.data(), n, dim);
        return data;
    }

}

TEST(NormalizeTest, ProducesUnitRowsAndLeavesZeroRows) {
    std::vector<float> data = {3, 4, 0, 0, 0, 0};
    normalize_l2(data.data(), 2, 3);
    EXPECT_NEAR(data[0], 0.6f, 1e-6);
    EXPECT_NEAR(data[1], 0.8f, 1e-6);
    EXPECT_EQ(data[3], 0.0f);
}

TEST(RelevanceTest, ClampsAndRounds) {
    EXPECT_EQ(relevance_percent(1.0f), 100);
    EXPECT_EQ(relevance_percent(1.2f), 100);
    EXPECT_EQ(relevance_percent(-0.3f), 0);
    EXPECT_EQ(relevance_percent(0.456f), 46);
}

TEST(ModeSelectionTest, ThresholdIsInclusive) {
    EXPECT_EQ(select_index_mode(1, 200), IndexMode::Exact);
    EXPECT_EQ(select_index_mode(200, 200), IndexMode::Exact);
    EXPECT_EQ(select_index_mode(201, 200), IndexMode::Compressed);
}

TEST(PlanParamsTest, ShrinksForSmallSamples) {
    Config config;
    auto full = plan_compressed_params(384, 500000, config);
    EXPECT_EQ(full.nlist, 4096u);
    EXPECT_EQ(full.pq_subvectors, 48u);
    EXPECT_EQ(full.pq_bits, 8u);
    EXPECT_EQ(full.nprobe, 32u);

    auto small = plan_compressed_params(384, 100, config);
    EXPECT_EQ(small.nlist, 2u);
    EXPECT_EQ(small.pq_bits, 6u);
    EXPECT_EQ(small.nprobe, 2u);

    auto odd = plan_compressed_params(100, 20, config);
    EXPECT_EQ(odd.nlist, 1u);
    EXPECT_EQ(100 % odd.pq_subvectors, 0u);
    EXPECT_LE(odd.pq_subvectors, 48u);
}

TEST(ExactIndexTest, IdenticalVectorScoresOne) {
    const size_t dim = 16;
    auto index = create_exact_index(dim, 4);
    auto data = corpus(50, dim);
    index->add(data.data(), 50);
    ASSERT_EQ(index->count(), 50u);

    // Query with row 17's own (raw) vector, normalized the same way
    auto q = morgue::test::chunk_vector(1, 7, dim);
    normalize_l2(q.data(), 1, dim);

    auto hits = index->search(q.data(), 3);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].id, 17u);
    EXPECT_NEAR(hits[0].similarity, 1.0f, 1e-5);
    EXPECT_EQ(relevance_percent(hits[0].similarity), 100);
    EXPECT_GE(hits[0].similarity, hits[1].similarity);
    EXPECT_GE(hits[1].similarity, hits[2].similarity);
}

TEST(ExactIndexTest, SearchOnEmptyIndexAndOversizedK) {
    auto index = create_exact_index(8);
    std::vector<float> q(8, 1.0f);
    EXPECT_TRUE(index->search(q.data(), 5).empty());

    auto data = corpus(3, 8);
    index->add(data.data(), 3);
    EXPECT_EQ(index->search(q.data(), 10).size(), 3u);
}

TEST(ExactIndexTest, SaveLoadAndTruncate) {
    TempDir dir;
    const size_t dim = 16;
    auto data = corpus(40, dim);
    {
        auto index = create_exact_index(dim, 8);
        index->add(data.data(), 40);
        index->save(dir / "udn.index");
    }
    EXPECT_FALSE(std::filesystem::exists(dir / "udn.index.tmp"));

    auto loaded = load_vector_index(IndexMode::Exact, dir / "udn.index", dim, 1);
    ASSERT_EQ(loaded->count(), 40u);
    auto hits = loaded->search(data.data() + 25 * dim, 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].id, 25u);

    loaded->truncate(20);
    EXPECT_EQ(loaded->count(), 20u);
    hits = loaded->search(data.data() + 25 * dim, 20);
    for (const auto& h : hits) EXPECT_LT(h.id, 20u);

    // Ids continue densely after truncation
    loaded->add(data.data() + 25 * dim, 1);
    hits = loaded->search(data.data() + 25 * dim, 1);
    EXPECT_EQ(hits[0].id, 20u);
}

TEST(ExactIndexTest, LoadRejectsWrongDimensionAndMissingFile) {
    TempDir dir;
    auto index = create_exact_index(8);
    auto data = corpus(4, 8);
    index->add(data.data(), 4);
    index->save(dir / "udn.index");

    EXPECT_THROW(load_vector_index(IndexMode::Exact, dir / "udn.index", 16, 1), IndexError);
    EXPECT_THROW(load_vector_index(IndexMode::Exact, dir / "absent.index", 8, 1), IndexError);
}

TEST(CompressedIndexTest, TrainAddSearchSaveLoad) {
    TempDir dir;
    const size_t dim = 16;
    const size_t n = 600;
    auto data = corpus(n, dim);

    Config config;
    auto params = plan_compressed_params(dim, n, config);
    auto index = create_compressed_index(dim, params);
    EXPECT_TRUE(index->needs_training());
    EXPECT_THROW(index->add(data.data(), 1), IndexError);

    index->train(data.data(), n);
    EXPECT_FALSE(index->needs_training());
    index->add(data.data(), n);
    ASSERT_EQ(index->count(), n);
    index->set_nprobe(params.nlist);

    auto hits = index->search(data.data() + 123 * dim, 5);
    ASSERT_FALSE(hits.empty());
    EXPECT_GT(hits[0].similarity, 0.8f);
    for (size_t i = 1; i < hits.size(); ++i) EXPECT_GE(hits[i - 1].similarity, hits[i].similarity);

    index->save(dir / "udn.index");
    auto loaded = load_vector_index(IndexMode::Compressed, dir / "udn.index", dim, params.nlist);
    EXPECT_EQ(loaded->count(), n);
    EXPECT_EQ(loaded->mode(), IndexMode::Compressed);

    loaded->truncate(100);
    EXPECT_EQ(loaded->count(), 100u);
    for (const auto& h : loaded->search(data.data(), 10)) EXPECT_LT(h.id, 100u);
}

TEST(CompressedIndexTest, EmptyTrainingSampleIsFatal) {
    Config config;
    auto index = create_compressed_index(16, plan_compressed_params(16, 1000, config));
    EXPECT_THROW(index->train(nullptr, 0), IndexError);
}
