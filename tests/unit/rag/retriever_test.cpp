#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "localmind_core/rag/retriever.hpp"
#include "../../common/utilities_test.hpp"

namespace localmind_core {

namespace {

// Maps any text containing a registered key to that key's vector.
class KeyedEmbedder : public EmbeddingPort {
 public:
  explicit KeyedEmbedder(size_t dimension) : dimension_(dimension) {}

  void set(const std::string& key, std::vector<float> head) {
    head.resize(dimension_, 0.0f);
    table_.emplace_back(key, std::move(head));
  }

  std::vector<float> get_embedding(const std::string& text) override {
    for (const auto& [key, vector] : table_) {
      if (text.find(key) != std::string::npos) {
        return vector;
      }
    }
    std::vector<float> fallback(dimension_, 0.0f);
    fallback[dimension_ - 1] = 1.0f;
    return fallback;
  }

  std::vector<std::vector<float>> get_embeddings(const std::vector<std::string>& texts) override {
    std::vector<std::vector<float>> out;
    for (const auto& text : texts) {
      out.push_back(get_embedding(text));
    }
    return out;
  }

 private:
  size_t dimension_;
  std::vector<std::pair<std::string, std::vector<float>>> table_;
};

}  // namespace

class RetrieverTest : public localmind_tests::KnowledgeBaseTestBase {
 protected:
  void SetUp() override {
    KnowledgeBaseTestBase::SetUp();
    keyed_ = std::make_shared<KeyedEmbedder>(kDimension);
    keyed_->set("query", {1.0f, 0.0f});
    keyed_->set("alpha", {0.95f, std::sqrt(1.0f - 0.95f * 0.95f)});
    keyed_->set("bravo", {1.0f, 0.0f});
    keyed_->set("charlie", {0.0f, 0.0f, 1.0f});

    IndexingPipeline pipeline(knowledge_base_, keyed_, extractor_factory_, classifier_);
    // 기술, 학습 and untagged, ingested in id order.
    pipeline.ingest(localmind_tests::TestUtilities::create_test_document("a", "alpha 서버 점검"));
    pipeline.ingest(localmind_tests::TestUtilities::create_test_document("b", "bravo 시험 준비"));
    pipeline.ingest(localmind_tests::TestUtilities::create_test_document("c", "charlie unrelated"));
  }

  Retriever make_retriever(RetrievalOptions options = {}) {
    return Retriever(knowledge_base_, keyed_, classifier_, options);
  }

  std::shared_ptr<KeyedEmbedder> keyed_;
};

TEST_F(RetrieverTest, RanksByScoreAndDropsWeakMatches) {
  auto outcome = make_retriever().retrieve({.query = "plain query"});

  ASSERT_EQ(outcome.chunks.size(), 2u);
  EXPECT_EQ(outcome.chunks[0].chunk.document_id, "b");
  EXPECT_NEAR(outcome.chunks[0].score, 1.0f, 1e-4);
  EXPECT_EQ(outcome.chunks[1].chunk.document_id, "a");
  EXPECT_NEAR(outcome.chunks[1].score, 0.95f, 1e-4);
  EXPECT_TRUE(outcome.query_categories.empty());
}

TEST_F(RetrieverTest, MinScoreOverrideKeepsEverything) {
  auto outcome = make_retriever().retrieve({.query = "plain query", .min_score = -1.0f});
  ASSERT_EQ(outcome.chunks.size(), 3u);
  EXPECT_EQ(outcome.chunks[2].chunk.document_id, "c");
}

TEST_F(RetrieverTest, CategoryMatchReranksWithoutFiltering) {
  auto outcome = make_retriever({.category_boost = 0.1f}).retrieve({.query = "서버 query"});

  EXPECT_EQ(outcome.query_categories, (std::set<std::string>{"기술"}));
  ASSERT_EQ(outcome.chunks.size(), 2u);
  EXPECT_EQ(outcome.chunks[0].chunk.document_id, "a");
  EXPECT_TRUE(outcome.chunks[0].category_match);
  EXPECT_NEAR(outcome.chunks[0].adjusted_score, 1.05f, 1e-4);
  EXPECT_EQ(outcome.chunks[1].chunk.document_id, "b");
  EXPECT_FALSE(outcome.chunks[1].category_match);
}

TEST_F(RetrieverTest, CategoryScopedDropsNonMatchingChunks) {
  auto outcome = make_retriever().retrieve({.query = "서버 query", .category_scoped = true});

  ASSERT_EQ(outcome.chunks.size(), 1u);
  EXPECT_EQ(outcome.chunks[0].chunk.document_id, "a");
}

TEST_F(RetrieverTest, ExplicitCategoriesOverrideClassification) {
  auto outcome =
      make_retriever().retrieve({.query = "서버 query", .categories = {"학습"}, .category_scoped = true});

  EXPECT_EQ(outcome.query_categories, (std::set<std::string>{"학습"}));
  ASSERT_EQ(outcome.chunks.size(), 1u);
  EXPECT_EQ(outcome.chunks[0].chunk.document_id, "b");
}

TEST_F(RetrieverTest, ScopedWithoutAnyCategoryFallsBackToPlainRanking) {
  auto outcome = make_retriever().retrieve({.query = "plain query", .category_scoped = true});
  EXPECT_EQ(outcome.chunks.size(), 2u);
}

TEST_F(RetrieverTest, TopKLimitsResults) {
  auto outcome = make_retriever().retrieve({.query = "plain query", .top_k = 1});
  ASSERT_EQ(outcome.chunks.size(), 1u);
  EXPECT_EQ(outcome.chunks[0].chunk.document_id, "b");
}

TEST_F(RetrieverTest, OversizedTopKIsClampedToMax) {
  auto everything = make_retriever().retrieve(
      {.query = "plain query", .top_k = std::numeric_limits<size_t>::max(), .min_score = -1.0f});
  EXPECT_EQ(everything.chunks.size(), 3u);

  auto capped = make_retriever({.top_k = 1, .max_top_k = 2})
                    .retrieve({.query = "plain query", .top_k = 1000, .min_score = -1.0f});
  ASSERT_EQ(capped.chunks.size(), 2u);
  EXPECT_EQ(capped.chunks[0].chunk.document_id, "b");
}

TEST_F(RetrieverTest, EmptyIndexReturnsNothing) {
  pipeline_->remove_document("a");
  pipeline_->remove_document("b");
  pipeline_->remove_document("c");

  EXPECT_TRUE(make_retriever().retrieve({.query = "plain query"}).chunks.empty());
}

TEST_F(RetrieverTest, RejectsBlankQueryAndWrongDimension) {
  EXPECT_THROW(make_retriever().retrieve({.query = "  "}), InvalidArgumentError);

  Retriever wrong(knowledge_base_, std::make_shared<localmind_tests::HashingEmbedder>(kDimension + 1),
                  classifier_);
  EXPECT_THROW(wrong.retrieve({.query = "plain query"}), EmbeddingUnavailableError);
}

TEST_F(RetrieverTest, RejectsInvalidOptions) {
  EXPECT_THROW(make_retriever({.top_k = 0}), InvalidArgumentError);
  EXPECT_THROW(make_retriever({.candidate_multiplier = 0}), InvalidArgumentError);
  EXPECT_THROW(make_retriever({.top_k = 10, .max_top_k = 5}), InvalidArgumentError);
  EXPECT_THROW(make_retriever({.max_top_k = 50, .candidate_multiplier = std::numeric_limits<size_t>::max()}),
               InvalidArgumentError);
}

}  // namespace localmind_core
