#include "fake_embedding.hpp"
#include "encode.hpp"
#include "vector_store.hpp"
#include <gtest/gtest.h>
#include <kj/debug.h>
#include <atomic>
#include <cmath>
#include <limits>
#include <thread>

using nlohmann::json;

namespace
{

  quasar::DataPoint textPoint(const std::string &id, const std::string &text)
  {
    return quasar::DataPoint("Chunk", json{{"text", text}}, quasar::IndexSpec{{}, {"text"}}, id);
  }

  std::vector<std::string> ids(const std::vector<quasar::ScoredResult> &results)
  {
    std::vector<std::string> out;
    for (const auto &r : results)
      out.push_back(r.id);
    return out;
  }

  size_t rowCount(quasar::Connection &conn, const std::string &table)
  {
    auto row = conn.executeOne("SELECT COUNT(*) FROM " + quasar::quote_identifier(table));
    return row ? static_cast<size_t>(row->integer(0)) : 0;
  }

} // namespace

class VectorStoreTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    kj::_::Debug::setLogLevel(kj::LogSeverity::ERROR);
    engine.set("east", {1, 0});
    engine.set("north", {0, 1});
    engine.set("east again", {1, 0});
    engine.set("north-east", {1, 1});
  }

  FakeEmbedding engine{2};
  quasar::Connection conn{":memory:"};
  quasar::CollectionManager collections{conn};
  quasar::EmbeddingGateway gateway{&engine};
  quasar::VectorStore store{conn, collections, gateway};
};

TEST_F(VectorStoreTest, Step01_CreateCollectionIsIdempotentAndSanitized)
{
  EXPECT_FALSE(store.hasCollection("My Docs"));
  store.createCollection("My Docs");
  store.createCollection("My Docs");
  EXPECT_TRUE(store.hasCollection("My Docs"));
  EXPECT_TRUE(store.hasCollection("my_docs"));
  EXPECT_EQ(store.getCollectionNames(), (std::vector<std::string>{"my_docs"}));
}

TEST_F(VectorStoreTest, Step02_InsertIntoMissingCollectionFails)
{
  try
  {
    store.createDataPoints("nowhere", {textPoint("1", "east")});
    FAIL() << "expected CollectionNotFound";
  }
  catch (const quasar::CollectionNotFound &e)
  {
    EXPECT_EQ(e.collection(), "nowhere");
  }
  EXPECT_THROW(store.retrieve("nowhere", {"1"}), quasar::CollectionNotFound);
  EXPECT_THROW(store.deleteDataPoints("nowhere", {"1"}), quasar::CollectionNotFound);
}

TEST_F(VectorStoreTest, Step03_UpsertReplacesById)
{
  store.createCollection("docs");
  store.createDataPoints("docs", {textPoint("1", "east"), textPoint("2", "north")});
  store.createDataPoints("docs", {textPoint("1", "north")});
  EXPECT_EQ(rowCount(conn, "docs"), 2u);

  auto row = conn.executeOne("SELECT text, payload FROM \"docs\" WHERE id = '1'");
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(row->text(0), "north");
  EXPECT_EQ(json::parse(row->text(1))["text"], "north");

  store.createDataPoints("docs", {});
  EXPECT_EQ(rowCount(conn, "docs"), 2u);
}

TEST_F(VectorStoreTest, Step04_SearchRanksByCosine)
{
  store.createCollection("docs");
  store.createDataPoints("docs", {textPoint("a", "east"), textPoint("b", "north"), textPoint("c", "east again")});

  quasar::SearchParams params;
  params.queryVector = std::vector<float>{1, 0};
  auto results = store.search("docs", params);
  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(ids(results), (std::vector<std::string>{"a", "c", "b"}));
  EXPECT_DOUBLE_EQ(results[0].score, 1.0);
  EXPECT_DOUBLE_EQ(results[1].score, 1.0);
  EXPECT_DOUBLE_EQ(results[2].score, 0.0);
  EXPECT_EQ(results[0].payload["id"], "a");
  EXPECT_FALSE(results[0].vector.has_value());

  params.limit = 1;
  params.withVector = true;
  results = store.search("docs", params);
  ASSERT_EQ(results.size(), 1u);
  ASSERT_TRUE(results[0].vector.has_value());
  EXPECT_EQ(*results[0].vector, (std::vector<float>{1, 0}));
}

TEST_F(VectorStoreTest, Step05_SearchByTextEmbedsQuery)
{
  store.createCollection("docs");
  store.createDataPoints("docs", {textPoint("a", "east"), textPoint("b", "north")});

  quasar::SearchParams params;
  params.queryText = "north";
  auto results = store.search("docs", params);
  ASSERT_FALSE(results.empty());
  EXPECT_EQ(results[0].id, "b");
}

TEST_F(VectorStoreTest, Step06_SearchEdgeCases)
{
  quasar::SearchParams none;
  EXPECT_THROW(store.search("docs", none), quasar::MissingQueryParameter);

  quasar::SearchParams params;
  params.queryVector = std::vector<float>{1, 0};
  EXPECT_TRUE(store.search("missing", params).empty());

  store.createCollection("docs");
  store.createDataPoints("docs", {textPoint("a", "east")});
  params.limit = 0;
  EXPECT_TRUE(store.search("docs", params).empty());

  store.createCollection("empty");
  params.limit = 10;
  EXPECT_TRUE(store.search("empty", params).empty());
}

TEST_F(VectorStoreTest, Step07_EmbeddingFailureWritesNothing)
{
  store.createCollection("docs");
  engine.failOn("bad");
  EXPECT_THROW(store.createDataPoints("docs", {textPoint("1", "east"), textPoint("2", "north"),
                                               textPoint("3", "bad")}),
               quasar::EmbeddingError);
  EXPECT_EQ(rowCount(conn, "docs"), 0u);
}

TEST_F(VectorStoreTest, Step08_BatchSearchAppliesScoreFloor)
{
  store.createCollection("docs");
  store.createDataPoints("docs", {textPoint("a", "east"), textPoint("b", "north"), textPoint("c", "north-east")});

  quasar::BatchSearchParams params;
  params.queryTexts = {"east", "north"};
  int before = engine.calls();
  auto groups = store.batchSearch("docs", params);
  EXPECT_EQ(engine.calls(), before + 1);
  ASSERT_EQ(groups.size(), 2u);
  // c scores ~0.707 against both queries, b and a score 0
  EXPECT_EQ(ids(groups[0]), (std::vector<std::string>{"a", "c"}));
  EXPECT_EQ(ids(groups[1]), (std::vector<std::string>{"b", "c"}));

  // single search has no floor
  quasar::SearchParams single;
  single.queryText = "east";
  EXPECT_EQ(store.search("docs", single).size(), 3u);

  params.limit = 1;
  groups = store.batchSearch("docs", params);
  EXPECT_EQ(ids(groups[0]), (std::vector<std::string>{"a"}));
  EXPECT_EQ(ids(groups[1]), (std::vector<std::string>{"b"}));
}

TEST_F(VectorStoreTest, Step09_BatchSearchDegenerateInputs)
{
  quasar::BatchSearchParams params;
  EXPECT_TRUE(store.batchSearch("docs", params).empty());

  params.queryTexts = {"east", "north", "east again"};
  auto groups = store.batchSearch("missing", params);
  ASSERT_EQ(groups.size(), 3u);
  for (const auto &g : groups)
    EXPECT_TRUE(g.empty());

  store.createCollection("docs");
  store.createDataPoints("docs", {textPoint("a", "east")});
  params.limit = 0;
  groups = store.batchSearch("docs", params);
  ASSERT_EQ(groups.size(), 3u);
  EXPECT_TRUE(groups[0].empty());
}

TEST_F(VectorStoreTest, Step10_RetrieveAndDelete)
{
  store.createCollection("docs");
  store.createDataPoints("docs", {textPoint("a", "east"), textPoint("b", "north"), textPoint("c", "east again")});

  auto got = store.retrieve("docs", {"a", "c", "zzz"});
  ASSERT_EQ(got.size(), 2u);
  for (const auto &r : got)
  {
    EXPECT_EQ(r.score, 0.0);
    EXPECT_FALSE(r.vector.has_value());
    EXPECT_EQ(r.payload["id"].get<std::string>(), r.id);
  }

  EXPECT_EQ(store.deleteDataPoints("docs", {"a", "zzz"}), 1u);
  EXPECT_EQ(store.deleteDataPoints("docs", {}), 0u);
  EXPECT_EQ(rowCount(conn, "docs"), 2u);
  EXPECT_TRUE(store.retrieve("docs", {"a"}).empty());
}

TEST_F(VectorStoreTest, Step11_LargeIdListsAreChunked)
{
  store.createCollection("docs");
  std::vector<quasar::DataPoint> points;
  std::vector<std::string> all;
  for (int i = 0; i < 1203; ++i)
  {
    points.push_back(textPoint("id-" + std::to_string(i), "east"));
    all.push_back("id-" + std::to_string(i));
  }
  store.createDataPoints("docs", points);
  EXPECT_EQ(store.retrieve("docs", all).size(), 1203u);
  EXPECT_EQ(store.deleteDataPoints("docs", all), 1203u);
  EXPECT_EQ(rowCount(conn, "docs"), 0u);
}

TEST_F(VectorStoreTest, Step12_IndexDataPoints)
{
  quasar::DataPoint entity("Entity", json{{"name", "east"}, {"description", "unused"}},
                           quasar::IndexSpec{{}, {"name"}}, "e1");
  store.indexDataPoints("Entity", "name", {entity});
  EXPECT_TRUE(store.hasCollection("Entity_name"));

  auto got = store.retrieve("Entity_name", {"e1"});
  ASSERT_EQ(got.size(), 1u);
  EXPECT_EQ(got[0].payload["type"], "IndexSchema");
  EXPECT_EQ(got[0].payload["text"], "east");
  EXPECT_EQ(got[0].payload["metadata"]["index_fields"], json::array({"text"}));

  quasar::DataPoint plain("Entity", json{{"name", "x"}}, quasar::IndexSpec{{"name"}, {}}, "e2");
  EXPECT_THROW(store.indexDataPoints("Entity", "name", {plain}), quasar::InvalidDataPoint);

  store.createVectorIndex("Doc", "title");
  EXPECT_TRUE(store.hasCollection("doc_title"));
}

TEST_F(VectorStoreTest, Step13_MalformedRowsAreSkipped)
{
  store.createCollection("docs");
  store.createDataPoints("docs", {textPoint("a", "east")});
  conn.execute("INSERT INTO \"docs\" (id, text, vector, payload) VALUES (?, ?, ?, ?)",
               {std::string("short"), std::string("x"), quasar::Blob{"abc"}, std::string("{}")});
  conn.execute("INSERT INTO \"docs\" (id, text, vector, payload) VALUES (?, ?, ?, ?)",
               {std::string("badjson"), std::string("x"), quasar::Blob{quasar::encode_vector({1, 0})},
                std::string("{not json")});
  conn.execute("INSERT INTO \"docs\" (id, text, vector, payload) VALUES (?, ?, ?, ?)",
               {std::string("wide"), std::string("x"), quasar::Blob{quasar::encode_vector({1, 0, 0})},
                std::string("{}")});

  quasar::SearchParams params;
  params.queryVector = std::vector<float>{1, 0};
  EXPECT_EQ(ids(store.search("docs", params)), (std::vector<std::string>{"a"}));
}

TEST_F(VectorStoreTest, Step14_PruneDropsEverything)
{
  store.createCollection("one");
  store.createCollection("two");
  store.prune();
  EXPECT_FALSE(store.hasCollection("one"));
  EXPECT_TRUE(store.getCollectionNames().empty());
}

TEST_F(VectorStoreTest, Step15_EmbedDataPassesThrough)
{
  auto vectors = store.embedData({"east", "north"});
  ASSERT_EQ(vectors.size(), 2u);
  EXPECT_EQ(vectors[1], (std::vector<float>{0, 1}));
  EXPECT_TRUE(store.embedData({}).empty());
}

TEST_F(VectorStoreTest, Step16_NonFiniteQueryVectorIsRejected)
{
  store.createCollection("docs");
  store.createDataPoints("docs", {textPoint("a", "east")});

  quasar::SearchParams params;
  params.queryVector = std::vector<float>{std::numeric_limits<float>::quiet_NaN(), 0};
  EXPECT_THROW(store.search("docs", params), quasar::InvalidQuery);
  params.queryVector = std::vector<float>{std::numeric_limits<float>::infinity(), 0};
  EXPECT_THROW(store.search("docs", params), quasar::InvalidQuery);
  params.queryVector = std::vector<float>{};
  EXPECT_THROW(store.search("docs", params), quasar::InvalidQuery);
}

TEST_F(VectorStoreTest, Step17_StoredNonFiniteVectorDoesNotDisturbRanking)
{
  store.createCollection("docs");
  store.createDataPoints("docs", {textPoint("north", "north")});
  conn.execute("INSERT INTO \"docs\" (id, text, vector, payload) VALUES (?, ?, ?, ?)",
               {std::string("corrupt"), std::string("x"),
                quasar::Blob{quasar::encode_vector({std::numeric_limits<float>::quiet_NaN(), 0})},
                std::string("{}")});
  store.createDataPoints("docs", {textPoint("east", "east")});

  quasar::SearchParams params;
  params.queryVector = std::vector<float>{1, 0};
  EXPECT_EQ(ids(store.search("docs", params)), (std::vector<std::string>{"east", "north"}));
  params.limit = 1;
  EXPECT_EQ(ids(store.search("docs", params)), (std::vector<std::string>{"east"}));
}

TEST_F(VectorStoreTest, Step18_DimensionIsFixedByFirstWrite)
{
  store.createCollection("docs");
  store.createDataPoints("docs", {textPoint("a", "east")});

  FakeEmbedding wide(3);
  quasar::EmbeddingGateway wideGateway(&wide);
  quasar::VectorStore wideStore(conn, collections, wideGateway);
  EXPECT_THROW(wideStore.createDataPoints("docs", {textPoint("b", "north"), textPoint("c", "south")}),
               quasar::InvalidDataPoint);
  EXPECT_EQ(rowCount(conn, "docs"), 1u);

  // same dimension still upserts
  store.createDataPoints("docs", {textPoint("b", "north")});
  EXPECT_EQ(rowCount(conn, "docs"), 2u);

  // dropping the collection forgets its dimension
  collections.drop("docs");
  store.createCollection("docs");
  wideStore.createDataPoints("docs", {textPoint("b", "north")});
  EXPECT_EQ(rowCount(conn, "docs"), 1u);
  EXPECT_EQ(store.getCollectionNames(), (std::vector<std::string>{"docs"}));
}

TEST_F(VectorStoreTest, Step19_UnusableNamesReadAsMissing)
{
  EXPECT_FALSE(store.hasCollection(""));
  EXPECT_FALSE(store.hasCollection("!!!"));

  quasar::SearchParams params;
  params.queryVector = std::vector<float>{1, 0};
  EXPECT_TRUE(store.search("", params).empty());

  quasar::BatchSearchParams batch;
  batch.queryTexts = {"east", "north"};
  auto groups = store.batchSearch("", batch);
  ASSERT_EQ(groups.size(), 2u);
  EXPECT_TRUE(groups[0].empty());
  EXPECT_TRUE(groups[1].empty());

  EXPECT_THROW(store.createCollection(""), quasar::InvalidCollectionName);
}

TEST_F(VectorStoreTest, Step20_SearchRacingPruneSeesEmptyOrFullCollection)
{
  store.createCollection("docs");
  store.createDataPoints("docs", {textPoint("a", "east")});

  std::atomic<bool> failed{false};
  std::atomic<bool> done{false};
  std::thread writer([&]
                     {
    for (int i = 0; i < 200; ++i)
    {
      try
      {
        store.prune();
        store.createCollection("docs");
        store.createDataPoints("docs", {textPoint("a", "east")});
      }
      catch (const quasar::StoreError &)
      {
        failed = true;
      }
    }
    done = true; });

  quasar::SearchParams params;
  params.queryText = "east";
  while (!done)
  {
    try
    {
      auto results = store.search("docs", params);
      EXPECT_LE(results.size(), 1u);
    }
    catch (const quasar::StoreError &)
    {
      failed = true;
    }
  }
  writer.join();
  EXPECT_FALSE(failed);
}

TEST(VectorStoreNoEmbedding, TextOperationsNeedAnEngine)
{
  kj::_::Debug::setLogLevel(kj::LogSeverity::ERROR);
  quasar::Connection conn(":memory:");
  quasar::CollectionManager collections(conn);
  quasar::EmbeddingGateway gateway(nullptr);
  quasar::VectorStore store(conn, collections, gateway);

  store.createCollection("docs");
  EXPECT_THROW(store.createDataPoints("docs", {textPoint("a", "east")}), quasar::EmbeddingUnavailable);
  EXPECT_THROW(store.embedData({"east"}), quasar::EmbeddingUnavailable);

  quasar::SearchParams params;
  params.queryText = "east";
  EXPECT_THROW(store.search("docs", params), quasar::EmbeddingUnavailable);

  // a literal vector query needs no engine
  params.queryText.reset();
  params.queryVector = std::vector<float>{1, 0};
  EXPECT_TRUE(store.search("docs", params).empty());
}

TEST(EmbeddingGateway, RejectsInconsistentEngineOutput)
{
  FakeEmbedding engine(3);
  engine.set("short", {1, 0});
  quasar::EmbeddingGateway gateway(&engine);
  EXPECT_EQ(gateway.dimensions(), 3u);
  EXPECT_THROW(gateway.embed({"short"}), quasar::EmbeddingError);
  EXPECT_EQ(gateway.embed({"anything"}).front().size(), 3u);
}

TEST(EmbeddingGateway, RejectsNonFiniteEngineOutput)
{
  FakeEmbedding engine(2);
  engine.set("nan", {std::numeric_limits<float>::quiet_NaN(), 0});
  engine.set("inf", {0, -std::numeric_limits<float>::infinity()});
  quasar::EmbeddingGateway gateway(&engine);
  EXPECT_THROW(gateway.embed({"east", "nan"}), quasar::EmbeddingError);
  EXPECT_THROW(gateway.embed({"inf"}), quasar::EmbeddingError);
}
