#include "snapshot.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace
{

  std::string uniqueTempPath(const std::string &stem, const std::string &ext = "")
  {
    auto base = std::filesystem::temp_directory_path() / (stem + std::to_string(::getpid()) + "-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    return base.string() + ext;
  }

  void fill(quasar::Store &store)
  {
    quasar::AddNodeParams p{};
    p.id = "b";
    p.labels = {"Person", "Admin"};
    p.properties = {{"name", std::string("Bob \"the\" builder\n")},
                    {"age", int64_t(-41)},
                    {"big", uint64_t(18446744073709551615ull)},
                    {"ratio", 0.1},
                    {"whole", 3.0},
                    {"ok", true},
                    {"none", std::monostate{}}};
    store.addNode(p);
    store.addNode("a", {});
    store.addNode("c", {{"k", std::string("v")}});
    store.addEdge("b", "a", 2.5);
    store.addEdge("a", "b", 1.0);
    store.addEdge("a", "c", -0.125);
  }

} // namespace

TEST(Snapshot, EmptyStore)
{
  quasar::Store store;
  EXPECT_EQ(quasar::snapshot::toJson(store), "{\n  \"nodes\": [],\n  \"edges\": []\n}\n");
}

TEST(Snapshot, OutputIsSortedAndStable)
{
  quasar::Store store;
  fill(store);
  std::string json = quasar::snapshot::toJson(store);

  EXPECT_LT(json.find("\"id\": \"a\""), json.find("\"id\": \"b\""));
  EXPECT_LT(json.find("\"id\": \"b\""), json.find("\"id\": \"c\""));
  EXPECT_LT(json.find("\"from\": \"a\", \"to\": \"b\""), json.find("\"from\": \"a\", \"to\": \"c\""));
  EXPECT_LT(json.find("\"from\": \"a\", \"to\": \"c\""), json.find("\"from\": \"b\""));
  EXPECT_NE(json.find("\"whole\": 3.0"), std::string::npos) << json;
  EXPECT_NE(json.find("\"none\": null"), std::string::npos) << json;
  EXPECT_EQ(json, quasar::snapshot::toJson(store));
}

TEST(Snapshot, RoundTripIsByteIdentical)
{
  quasar::Store store;
  fill(store);
  std::string first = quasar::snapshot::toJson(store);

  quasar::Store loaded;
  quasar::snapshot::fromJson(loaded, first);
  EXPECT_EQ(quasar::snapshot::toJson(loaded), first);

  auto b = loaded.getNode("b");
  EXPECT_EQ(b.labels, (quasar::LabelSet{"Admin", "Person"}));
  EXPECT_EQ(std::get<std::string>(b.properties.at("name")), "Bob \"the\" builder\n");
  EXPECT_EQ(std::get<int64_t>(b.properties.at("age")), -41);
  EXPECT_EQ(std::get<uint64_t>(b.properties.at("big")), 18446744073709551615ull);
  EXPECT_DOUBLE_EQ(std::get<double>(b.properties.at("ratio")), 0.1);
  EXPECT_DOUBLE_EQ(std::get<double>(b.properties.at("whole")), 3.0);
  EXPECT_TRUE(std::get<bool>(b.properties.at("ok")));
  EXPECT_TRUE(std::holds_alternative<std::monostate>(b.properties.at("none")));
  EXPECT_DOUBLE_EQ(loaded.getEdge("a", "c").weight, -0.125);
  EXPECT_EQ(loaded.getInEdges("a").size(), 1u);
}

TEST(Snapshot, HandWrittenDocumentNormalizes)
{
  const char *doc = R"({"edges":[{"from":"y","to":"x","weight":1}],
                        "nodes":[{"id":"y","properties":{"n":7}},{"id":"x","labels":["L"]}]})";
  quasar::Store store;
  quasar::snapshot::fromJson(store, doc);
  EXPECT_EQ(store.nodeCount(), 2u);
  EXPECT_EQ(store.getNode("x").labels, (quasar::LabelSet{"L"}));
  EXPECT_EQ(std::get<int64_t>(store.getNode("y").properties.at("n")), 7);

  std::string once = quasar::snapshot::toJson(store);
  quasar::Store again;
  quasar::snapshot::fromJson(again, once);
  EXPECT_EQ(quasar::snapshot::toJson(again), once);
}

TEST(Snapshot, NullWeightLoadsAsNaN)
{
  quasar::Store store;
  quasar::snapshot::fromJson(store, R"({"nodes":[{"id":"a"},{"id":"b"}],"edges":[{"from":"a","to":"b","weight":null}]})");
  EXPECT_TRUE(std::isnan(store.getEdge("a", "b").weight));
}

TEST(Snapshot, ControlCharactersAndEmbeddedNulSurvive)
{
  quasar::Store store;
  const std::string raw("a\0b\x01" "c\td", 7);
  store.addNode("n", {{"s", raw}});

  std::string json = quasar::snapshot::toJson(store);
  EXPECT_NE(json.find("a\\u0000b\\u0001c\\td"), std::string::npos);

  quasar::Store loaded;
  quasar::snapshot::fromJson(loaded, json);
  auto back = std::get<std::string>(loaded.getNode("n").properties.at("s"));
  EXPECT_EQ(back.size(), 7u);
  EXPECT_EQ(back, raw);

  quasar::Store escaped;
  quasar::snapshot::fromJson(escaped, R"({"nodes":[{"id":"x","properties":{"s":"\u00e9\/"}}]})");
  EXPECT_EQ(std::get<std::string>(escaped.getNode("x").properties.at("s")), "\xc3\xa9/");
  EXPECT_THROW(quasar::snapshot::fromJson(escaped, R"({"nodes":[{"id":"y","properties":{"s":"\u00"}}]})"),
               quasar::snapshot::SnapshotError);
}

TEST(Snapshot, InvalidDocumentsLeaveStoreUntouched)
{
  quasar::Store store;
  fill(store);
  const std::string before = quasar::snapshot::toJson(store);

  EXPECT_THROW(quasar::snapshot::fromJson(store, "{not json"), quasar::snapshot::SnapshotError);
  EXPECT_THROW(quasar::snapshot::fromJson(store, "[]"), quasar::snapshot::SnapshotError);
  EXPECT_THROW(quasar::snapshot::fromJson(store, R"({"nodes":[{"id":1}]})"), quasar::snapshot::SnapshotError);
  EXPECT_THROW(quasar::snapshot::fromJson(store, R"({"nodes":[{"id":"a","properties":{"p":[1]}}]})"),
               quasar::snapshot::SnapshotError);
  EXPECT_THROW(quasar::snapshot::fromJson(store, R"({"nodes":[{"id":"a"}],"edges":[{"from":"a","to":"zz","weight":1}]})"),
               quasar::NotFound);
  EXPECT_THROW(quasar::snapshot::fromJson(store, R"({"nodes":[{"id":"a"},{"id":"a"}]})"), quasar::AlreadyExists);

  EXPECT_EQ(quasar::snapshot::toJson(store), before);
}

TEST(Snapshot, SaveAndLoadFile)
{
  quasar::Store store;
  fill(store);
  std::string path = uniqueTempPath("quasar-snapshot-", ".json");

  auto saved = quasar::snapshot::saveToFile(store, path);
  EXPECT_EQ(saved.nodes, 3u);
  EXPECT_EQ(saved.edges, 3u);
  EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

  quasar::Store loaded;
  auto stats = quasar::snapshot::loadFromFile(loaded, path);
  EXPECT_EQ(stats.nodes, 3u);
  EXPECT_EQ(quasar::snapshot::toJson(loaded), quasar::snapshot::toJson(store));

  std::filesystem::remove(path);
  EXPECT_THROW(quasar::snapshot::loadFromFile(loaded, path), quasar::snapshot::SnapshotError);
  EXPECT_EQ(loaded.nodeCount(), 3u);
}
