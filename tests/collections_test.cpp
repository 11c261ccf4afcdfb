#include "collections.hpp"
#include "encode.hpp"
#include <gtest/gtest.h>
#include <kj/debug.h>

class CollectionsTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    kj::_::Debug::setLogLevel(kj::LogSeverity::WARNING);
  }

  quasar::Connection conn{":memory:"};
  quasar::CollectionManager collections{conn};
};

TEST(CollectionNames, Sanitize)
{
  EXPECT_EQ(quasar::sanitize_collection_name("Entity_name"), "entity_name");
  EXPECT_EQ(quasar::sanitize_collection_name("my docs.v2"), "my_docs_v2");
  EXPECT_EQ(quasar::sanitize_collection_name("a-b"), "a-b");
  EXPECT_EQ(quasar::sanitize_collection_name("9lives"), "c_9lives");
  EXPECT_EQ(quasar::sanitize_collection_name("_hidden"), "c__hidden");
  EXPECT_EQ(quasar::sanitize_collection_name("x\"; DROP TABLE y"), "x___drop_table_y");
  EXPECT_THROW(quasar::sanitize_collection_name(""), quasar::InvalidCollectionName);
}

TEST(CollectionNames, QuoteIdentifier)
{
  EXPECT_EQ(quasar::quote_identifier("abc"), "\"abc\"");
  EXPECT_EQ(quasar::quote_identifier("a\"b"), "\"a\"\"b\"");
}

TEST_F(CollectionsTest, CreateIsIdempotent)
{
  EXPECT_FALSE(collections.exists("docs"));
  collections.create("docs");
  conn.execute("INSERT INTO \"docs\" (id, text) VALUES ('1', 'kept')");
  collections.create("docs");
  EXPECT_TRUE(collections.exists("docs"));
  EXPECT_EQ(conn.execute("SELECT id FROM \"docs\"").size(), 1u);
}

TEST_F(CollectionsTest, ListIsSortedAndDropRemoves)
{
  collections.create("zeta");
  collections.create("alpha");
  collections.create("mid");
  EXPECT_EQ(collections.list(), (std::vector<std::string>{"alpha", "mid", "zeta"}));

  collections.drop("mid");
  collections.drop("never_created");
  EXPECT_EQ(collections.list(), (std::vector<std::string>{"alpha", "zeta"}));
}

TEST_F(CollectionsTest, DropAllRemovesEveryTable)
{
  collections.create("a");
  collections.create("b");
  conn.execute("CREATE TABLE \"_graph_node\" (id TEXT)");
  EXPECT_EQ(collections.dropAll(), 3u);
  EXPECT_TRUE(collections.list().empty());
  EXPECT_EQ(collections.dropAll(), 0u);
}
