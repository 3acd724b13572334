#include <gtest/gtest.h>
#include "errors.hpp"
#include "milvus_store.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cctype>
#include <thread>

using json = nlohmann::json;

class MilvusWireTest : public ::testing::Test {
protected:
    StoreConfig cfg;

    void SetUp() override {
        cfg.collection = "docs_tech";
        cfg.dimension = 3;
        cfg.hnsw.m = 8;
        cfg.hnsw.ef_construction = 64;
        cfg.hnsw.ef_search = 64;
    }
};

TEST_F(MilvusWireTest, SchemaDescribesCollection) {
    auto body = milvus_collection_schema(cfg);
    EXPECT_EQ(body["collectionName"], "docs_tech");
    EXPECT_TRUE(body["schema"]["autoId"].get<bool>());

    const auto& fields = body["schema"]["fields"];
    ASSERT_EQ(fields.size(), 9u);
    EXPECT_EQ(fields[0]["fieldName"], "id");
    EXPECT_TRUE(fields[0]["isPrimary"].get<bool>());

    bool saw_vector = false;
    for (const auto& f : fields) {
        if (f["fieldName"] == "embeddings") {
            saw_vector = true;
            EXPECT_EQ(f["dataType"], "FloatVector");
            EXPECT_EQ(f["elementTypeParams"]["dim"], 3);
        }
        if (f["fieldName"] == "content") EXPECT_EQ(f["elementTypeParams"]["max_length"], 65535);
        if (f["fieldName"] == "file_path") EXPECT_EQ(f["elementTypeParams"]["max_length"], 512);
    }
    EXPECT_TRUE(saw_vector);

    const auto& index = body["indexParams"][0];
    EXPECT_EQ(index["metricType"], "L2");
    EXPECT_EQ(index["params"]["index_type"], "HNSW");
    EXPECT_EQ(index["params"]["M"], 8);
    EXPECT_EQ(index["params"]["efConstruction"], 64);
}

TEST_F(MilvusWireTest, InsertBodyCarriesEveryField) {
    Chunk c;
    c.content = "body";
    c.technology = "Milvus";
    c.file_path = "docs/a.md";
    c.file_hash = "abc";
    c.section_title = "Intro";
    c.section_level = 2;
    c.category = "features";
    c.embedding = {0.5f, 0.25f, 0.0f};

    auto body = milvus_insert_body("docs_tech", {c});
    EXPECT_EQ(body["collectionName"], "docs_tech");
    ASSERT_EQ(body["data"].size(), 1u);
    const auto& row = body["data"][0];
    EXPECT_EQ(row["content"], "body");
    EXPECT_EQ(row["technology"], "Milvus");
    EXPECT_EQ(row["file_path"], "docs/a.md");
    EXPECT_EQ(row["file_hash"], "abc");
    EXPECT_EQ(row["section_title"], "Intro");
    EXPECT_EQ(row["section_level"], 2);
    EXPECT_EQ(row["category"], "features");
    ASSERT_EQ(row["embeddings"].size(), 3u);
    EXPECT_FLOAT_EQ(row["embeddings"][1].get<float>(), 0.25f);
    EXPECT_FALSE(row.contains("id"));
}

TEST_F(MilvusWireTest, SearchBodyWithoutFilter) {
    auto body = milvus_search_body(cfg, {1, 0, 0}, {}, 9);
    EXPECT_EQ(body["limit"], 9);
    EXPECT_EQ(body["annsField"], "embeddings");
    EXPECT_EQ(body["searchParams"]["metricType"], "L2");
    EXPECT_EQ(body["searchParams"]["params"]["ef"], 18);
    EXPECT_EQ(body["consistencyLevel"], "Eventually");
    EXPECT_FALSE(body.contains("filter"));
    EXPECT_EQ(body["data"][0].size(), 3u);
}

TEST_F(MilvusWireTest, SearchBodyWithFilter) {
    auto body = milvus_search_body(cfg, {1, 0, 0}, FilterExpr{{"Milvus"}, {"security"}}, 3);
    EXPECT_EQ(body["filter"], R"(technology in ["Milvus"] && category in ["security"])");
    EXPECT_EQ(body["searchParams"]["params"]["ef"], 6);
}

TEST_F(MilvusWireTest, SearchEfNeverBelowLimitAndLimitIsCapped) {
    auto body = milvus_search_body(cfg, {1, 0, 0}, {}, 100);
    EXPECT_EQ(body["searchParams"]["params"]["ef"], 100);

    body = milvus_search_body(cfg, {1, 0, 0}, {}, 100000);
    EXPECT_EQ(body["limit"], 16384);
}

TEST_F(MilvusWireTest, GroupedSearchAsksForGroups) {
    auto body = milvus_search_body(cfg, {1, 0, 0}, {}, 6, 2);
    EXPECT_EQ(body["groupingField"], "technology");
    EXPECT_EQ(body["groupSize"], 2);
    EXPECT_FALSE(body["strictGroupSize"].get<bool>());
    EXPECT_EQ(body["limit"], 3);
    EXPECT_EQ(body["searchParams"]["params"]["ef"], 12);

    auto flat = milvus_search_body(cfg, {1, 0, 0}, {}, 6, 0);
    EXPECT_FALSE(flat.contains("groupingField"));
    EXPECT_EQ(flat["limit"], 6);
}

TEST(MilvusHitsTest, ParsesAndSortsByDistance) {
    auto response = json::parse(R"({
        "code": 0,
        "data": [
            {"id": 2, "distance": 0.8, "content": "far", "technology": "Milvus", "file_path": "b.md",
             "section_title": "B", "section_level": 1, "category": "general"},
            {"id": "1", "distance": 0.1, "content": "near", "technology": "Milvus", "file_path": "a.md",
             "section_title": "A", "section_level": 2, "category": "security"}
        ]
    })");
    auto hits = parse_milvus_hits(response);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].id, 1);
    EXPECT_EQ(hits[0].content, "near");
    EXPECT_EQ(hits[0].section_level, 2);
    EXPECT_EQ(hits[0].category, "security");
    EXPECT_FLOAT_EQ(hits[0].distance, 0.1f);
    EXPECT_EQ(hits[1].file_path, "b.md");
}

TEST(MilvusHitsTest, EmptyOrMissingDataYieldsNoHits) {
    EXPECT_TRUE(parse_milvus_hits(json::parse(R"({"code": 0, "data": []})")).empty());
    EXPECT_TRUE(parse_milvus_hits(json::parse(R"({"code": 0})")).empty());
}

TEST(MilvusHitsTest, MissingDistanceThrows) {
    auto response = json::parse(R"({"data": [{"id": 1, "content": "x"}]})");
    EXPECT_THROW(parse_milvus_hits(response), StorageError);
}

namespace {

// Answers exactly one HTTP request on a loopback port, then stops listening.
class SingleReplyServer {
public:
    explicit SingleReplyServer(std::string reply) : reply_(std::move(reply)) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (fd_ < 0 || ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd_, 1) != 0 ||
            ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            throw std::runtime_error("cannot open loopback listener");
        }
        port_ = ntohs(addr.sin_port);
        worker_ = std::thread([this] { serve(); });
    }

    ~SingleReplyServer() { stop(); }

    void stop() {
        if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
        if (worker_.joinable()) worker_.join();
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

private:
    void serve() {
        int client = ::accept(fd_, nullptr, nullptr);
        if (client < 0) return;
        std::string request;
        char buf[4096];
        std::size_t body_start = std::string::npos, body_len = 0;
        while (body_start == std::string::npos || request.size() < body_start + body_len) {
            ssize_t n = ::recv(client, buf, sizeof(buf), 0);
            if (n <= 0) break;
            request.append(buf, (std::size_t)n);
            if (body_start == std::string::npos) {
                auto end = request.find("\r\n\r\n");
                if (end == std::string::npos) continue;
                body_start = end + 4;
                std::string headers = request.substr(0, end);
                for (auto& c : headers) c = (char)std::tolower((unsigned char)c);
                auto cl = headers.find("content-length:");
                if (cl != std::string::npos) body_len = std::stoul(headers.substr(cl + 15));
            }
        }
        std::string response = "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: " +
                               std::to_string(reply_.size()) + "\r\nConnection: close\r\n\r\n" + reply_;
        ::send(client, response.data(), response.size(), MSG_NOSIGNAL);
        ::close(client);
    }

    std::string reply_;
    int fd_{-1};
    int port_{0};
    std::thread worker_;
};

}

TEST(MilvusIndexStoreTest, UnreachableAtStartupIsConnectionError) {
    StoreConfig cfg;
    cfg.uri = "http://127.0.0.1:1";
    cfg.timeout_ms = 2000;
    EXPECT_THROW(MilvusIndexStore store(cfg), ConnectionError);
}

TEST(MilvusIndexStoreTest, ServerLostAfterStartupIsConnectionError) {
    SingleReplyServer server(R"({"code": 0, "data": []})");
    StoreConfig cfg;
    cfg.uri = server.url();
    cfg.timeout_ms = 2000;
    cfg.dimension = 3;

    MilvusIndexStore store(cfg);
    server.stop();

    EXPECT_THROW(store.delete_by_path({"a.md"}), ConnectionError);
    EXPECT_THROW(store.search({1, 0, 0}, {}, 3, 0), ConnectionError);
    EXPECT_THROW(store.ensure_schema(), ConnectionError);
}
