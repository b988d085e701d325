#include "cli.hpp"
#include <gtest/gtest.h>
#include <vector>

static Args parse(std::vector<std::string> words) {
  std::vector<char*> argv;
  for (auto& w : words) argv.push_back(&w[0]);
  return parse_cli((int)argv.size(), argv.data());
}

TEST(Cli, IndexMode) {
  auto a = parse({"docqa", "index", "./docs", "--sqlite", "out.sqlite", "--chunk-size", "300"});
  EXPECT_EQ(a.mode, "index");
  EXPECT_EQ(a.root_path, "./docs");
  EXPECT_EQ(a.sqlite_path, "out.sqlite");
  EXPECT_TRUE(a.sqlite_given);
  EXPECT_EQ(resolve_config(a).chunk_size, 300);
}

TEST(Cli, QueryModeOverrides) {
  auto a = parse({"docqa", "query", "what is tf-idf", "--root", "docs", "-k", "3",
                  "--ngram", "1,2", "--stopwords", "none", "--sublinear",
                  "--min-similarity", "0.05", "--json"});
  EXPECT_EQ(a.mode, "query");
  EXPECT_EQ(a.query, "what is tf-idf");
  EXPECT_TRUE(a.json);
  auto cfg = resolve_config(a);
  EXPECT_EQ(cfg.top_k, 3);
  EXPECT_EQ(cfg.ngram_min, 1);
  EXPECT_EQ(cfg.ngram_max, 2);
  EXPECT_TRUE(cfg.stopwords.empty());
  EXPECT_TRUE(cfg.sublinear_tf);
  EXPECT_DOUBLE_EQ(cfg.min_similarity, 0.05);
}

TEST(Cli, InvalidOverridesRaiseConfigError) {
  auto a = parse({"docqa", "index", "docs", "--chunk-size", "10", "--chunk-overlap", "10"});
  EXPECT_THROW(resolve_config(a), ConfigError);
}

TEST(Cli, UnknownFlagExits) {
  EXPECT_EXIT(parse({"docqa", "query", "x", "--bogus"}), ::testing::ExitedWithCode(1), "Unknown flag");
}

TEST(Cli, BuildOptionsDetected) {
  EXPECT_FALSE(has_build_options(parse({"docqa", "query", "x", "--sqlite", "i.sqlite", "-k", "2",
                                        "--min-similarity", "0.1"})));
  EXPECT_TRUE(has_build_options(parse({"docqa", "query", "x", "--sqlite", "i.sqlite", "--ngram", "1,2"})));
  EXPECT_TRUE(has_build_options(parse({"docqa", "query", "x", "--config", "c.json"})));
  EXPECT_TRUE(has_build_options(parse({"docqa", "query", "x", "--sublinear"})));
}
