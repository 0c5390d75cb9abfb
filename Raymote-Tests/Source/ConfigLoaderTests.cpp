#include <gtest/gtest.h>
#include <fstream>
#include "utils/ConfigLoader.hpp"
#include "TestUtils.hpp"

namespace {

std::string writeFile(const TempDir& tmp, const std::string& body) {
    const std::string path = tmp.file("raymote.json");
    std::ofstream(path) << body;
    return path;
}

} // namespace

TEST(ConfigLoader, EmptyObjectKeepsDefaults) {
    TempDir tmp;
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(LoadConfigStrict(cfg, err, writeFile(tmp, "{}"))) << err;

    EXPECT_EQ(cfg.http.host, "0.0.0.0");
    EXPECT_EQ(cfg.http.port, 3000);
    EXPECT_FALSE(cfg.http.cors);
    EXPECT_EQ(cfg.http.maxEventStreams, 8u);
    EXPECT_EQ(cfg.files.portConfig, "./config.json");
    EXPECT_EQ(cfg.files.buttons, "./buttons.json");
    EXPECT_EQ(cfg.files.publicDir, "./public");
    EXPECT_EQ(cfg.keepaliveSeconds, 30u);
}

TEST(ConfigLoader, ReadsEverySection) {
    TempDir tmp;
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(LoadConfigStrict(cfg, err, writeFile(tmp, R"({
        "http":   { "host": "127.0.0.1", "port": 8080, "cors": true, "maxEventStreams": 32 },
        "files":  { "portConfig": "/var/lib/raymote/ports.json", "buttons": "/var/lib/raymote/buttons.json", "public": "/usr/share/raymote" },
        "events": { "keepaliveSeconds": 15 }
    })"))) << err;

    EXPECT_EQ(cfg.http.host, "127.0.0.1");
    EXPECT_EQ(cfg.http.port, 8080);
    EXPECT_TRUE(cfg.http.cors);
    EXPECT_EQ(cfg.http.maxEventStreams, 32u);
    EXPECT_EQ(cfg.files.portConfig, "/var/lib/raymote/ports.json");
    EXPECT_EQ(cfg.files.buttons, "/var/lib/raymote/buttons.json");
    EXPECT_EQ(cfg.files.publicDir, "/usr/share/raymote");
    EXPECT_EQ(cfg.keepaliveSeconds, 15u);
}

TEST(ConfigLoader, RejectsUnknownKeys) {
    TempDir tmp;
    AppConfig cfg;
    std::string err;
    EXPECT_FALSE(LoadConfigStrict(cfg, err, writeFile(tmp, R"({ "serial": {} })")));
    EXPECT_NE(err.find("serial"), std::string::npos);

    EXPECT_FALSE(LoadConfigStrict(cfg, err, writeFile(tmp, R"({ "http": { "baud": 9600 } })")));
    EXPECT_NE(err.find("http.baud"), std::string::npos);
}

TEST(ConfigLoader, RejectsBadValues) {
    TempDir tmp;
    AppConfig cfg;
    std::string err;
    EXPECT_FALSE(LoadConfigStrict(cfg, err, writeFile(tmp, R"({ "http": { "port": "3000" } })")));
    EXPECT_FALSE(LoadConfigStrict(cfg, err, writeFile(tmp, R"({ "http": { "port": 70000 } })")));
    EXPECT_FALSE(LoadConfigStrict(cfg, err, writeFile(tmp, R"({ "http": { "cors": 1 } })")));
    EXPECT_FALSE(LoadConfigStrict(cfg, err, writeFile(tmp, R"({ "http": { "maxEventStreams": 0 } })")));
    EXPECT_FALSE(LoadConfigStrict(cfg, err, writeFile(tmp, R"({ "files": { "buttons": "" } })")));
    EXPECT_FALSE(LoadConfigStrict(cfg, err, writeFile(tmp, R"({ "events": { "keepaliveSeconds": 0 } })")));
    EXPECT_FALSE(LoadConfigStrict(cfg, err, writeFile(tmp, R"([])")));
}

TEST(ConfigLoader, ReportsParseErrorsAndMissingFile) {
    TempDir tmp;
    AppConfig cfg;
    std::string err;
    EXPECT_FALSE(LoadConfigStrict(cfg, err, writeFile(tmp, "{ // commento\n }")));
    EXPECT_NE(err.find("JSON"), std::string::npos);

    EXPECT_FALSE(LoadConfigStrict(cfg, err, tmp.file("nope.json")));
    EXPECT_NE(err.find("nope.json"), std::string::npos);
}
