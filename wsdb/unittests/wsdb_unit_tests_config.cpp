#include <wsdb/config.hpp>

#include <fstream>

#include <boost/filesystem.hpp>
#include <boost/property_tree/ptree.hpp>

#include <gtest/gtest.h>

using namespace wsdb;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!file_.empty()) {
            boost::filesystem::remove(file_);
        }
    }

    std::string writeFile(const std::string& extension, const std::string& content) {
        file_ = (boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("wsdb-%%%%-%%%%" + extension)).string();
        std::ofstream out(file_);
        out << content;
        return file_;
    }

    std::string file_;
};

TEST_F(ConfigTest, DefaultConstructedIsNotGood) {
    Config config;
    EXPECT_FALSE(config.isGood());
}

TEST_F(ConfigTest, EmptyTreeUsesDefaults) {
    const Config config = Config::readFromTree(boost::property_tree::ptree{});
    ASSERT_TRUE(config.isGood());
    EXPECT_EQ(config.getPathToDb(), DEFAULT_PATH_TO_DB);
    EXPECT_EQ(config.getCursorLifetime(), 24 * 60 * 60 * 1000ull);
    EXPECT_EQ(config.getAllowanceDefaultTtl(), 24 * 60 * 60 * 1000ull);
    EXPECT_EQ(config.getAllowanceMaxTtl(), 30 * 24 * 60 * 60 * 1000ull);
    EXPECT_EQ(config.getPageSize(), 50u);
}

TEST_F(ConfigTest, StorageBlock) {
    boost::property_tree::ptree tree;
    tree.put("storage.path", "/var/lib/wsdb");
    tree.put("storage.cache_size", 16 * 1024 * 1024);
    tree.put("storage.cursor_lifetime", 600);
    tree.put("storage.allowance_default_ttl", 3600);
    tree.put("storage.allowance_max_ttl", 7200);
    tree.put("storage.page_size", 20);

    const Config config = Config::readFromTree(tree);
    ASSERT_TRUE(config.isGood());
    EXPECT_EQ(config.getPathToDb(), "/var/lib/wsdb");
    EXPECT_EQ(config.getCacheSize(), 16u * 1024 * 1024);
    EXPECT_EQ(config.getCursorLifetime(), 600u * 1000);
    EXPECT_EQ(config.getAllowanceDefaultTtl(), 3600u * 1000);
    EXPECT_EQ(config.getAllowanceMaxTtl(), 7200u * 1000);
    EXPECT_EQ(config.getPageSize(), 20u);
}

TEST_F(ConfigTest, OutOfRange) {
    boost::property_tree::ptree tree;
    tree.put("storage.page_size", 0);
    EXPECT_FALSE(Config::readFromTree(tree).isGood());

    tree.clear();
    tree.put("storage.allowance_max_ttl", 31 * 24 * 60 * 60);
    EXPECT_FALSE(Config::readFromTree(tree).isGood());

    tree.clear();
    tree.put("storage.cache_size", 1024);
    EXPECT_FALSE(Config::readFromTree(tree).isGood());
}

TEST_F(ConfigTest, DefaultTtlAboveMax) {
    boost::property_tree::ptree tree;
    tree.put("storage.allowance_default_ttl", 7200);
    tree.put("storage.allowance_max_ttl", 3600);
    EXPECT_FALSE(Config::readFromTree(tree).isGood());
}

TEST_F(ConfigTest, MalformedValue) {
    boost::property_tree::ptree tree;
    tree.put("storage.page_size", "many");
    EXPECT_FALSE(Config::readFromTree(tree).isGood());

    tree.clear();
    tree.put("storage.path", "");
    EXPECT_FALSE(Config::readFromTree(tree).isGood());
}

TEST_F(ConfigTest, IniFile) {
    const std::string path = writeFile(".ini",
                                       "[Core]\n"
                                       "Filter=\"%Severity% >= error\"\n"
                                       "\n"
                                       "[storage]\n"
                                       "path=test_db\n"
                                       "page_size=5\n");

    const Config config = Config::readFromFile(path);
    ASSERT_TRUE(config.isGood());
    EXPECT_EQ(config.getPathToDb(), "test_db");
    EXPECT_EQ(config.getPageSize(), 5u);
    EXPECT_TRUE(config.getLoggerSettings().has_section("Core"));
}

TEST_F(ConfigTest, JsonFile) {
    const std::string path = writeFile(".json", R"({ "storage": { "path": "json_db", "cursor_lifetime": "120" } })");

    const Config config = Config::readFromFile(path);
    ASSERT_TRUE(config.isGood());
    EXPECT_EQ(config.getPathToDb(), "json_db");
    EXPECT_EQ(config.getCursorLifetime(), 120u * 1000);
}

TEST_F(ConfigTest, MissingFile) {
    EXPECT_FALSE(Config::readFromFile("/nonexistent/wsdb.ini").isGood());
}

TEST_F(ConfigTest, BrokenFile) {
    const std::string path = writeFile(".ini", "[storage\npath=x\n");
    EXPECT_FALSE(Config::readFromFile(path).isGood());
}
