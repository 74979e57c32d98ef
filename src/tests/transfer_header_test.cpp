#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <string>
#include <vector>
#include "network/transfer_header.hpp"
#include "test_utils.hpp"

using namespace flux::network;
using ::testing::HasSubstr;

class TransferHeaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_logging(boost::log::trivial::warning);

        header.transfer_id = "0b5c3e9a-1f2d-4c6e-8a7b-9d0e1f2a3b4c";
        header.file_name = "report.pdf";
        header.original_size = 10485760;
        header.compressed_size = 10490000;
        header.encrypted = true;
        header.salt = "WlpaWlpaWlpaWlpaWlpaWg==";
        header.transfer_code = "042117";
    }

    static void expect_same(const TransferHeader& a, const TransferHeader& b) {
        EXPECT_EQ(a.transfer_id, b.transfer_id);
        EXPECT_EQ(a.file_name, b.file_name);
        EXPECT_EQ(a.original_size, b.original_size);
        EXPECT_EQ(a.compressed_size, b.compressed_size);
        EXPECT_EQ(a.encrypted, b.encrypted);
        EXPECT_EQ(a.salt, b.salt);
        EXPECT_EQ(a.transfer_code, b.transfer_code);
    }

    TransferHeader header;
};

TEST_F(TransferHeaderTest, SerializesToSingleLine) {
    const auto line = serialize_header(header);

    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), HEADER_DELIMITER);
    EXPECT_EQ(line.find(HEADER_DELIMITER), line.size() - 1);
    EXPECT_THAT(line, HasSubstr("\"file_name\":\"report.pdf\""));
}

TEST_F(TransferHeaderTest, ParseRestoresAllFields) {
    auto line = serialize_header(header);
    line.pop_back();
    expect_same(parse_header(line), header);
}

TEST_F(TransferHeaderTest, LargeSizesSurvive) {
    header.original_size = 0xFFFFFFFFFFFFFFFFull;
    header.compressed_size = 0x100000000ull;
    auto line = serialize_header(header);
    line.pop_back();
    expect_same(parse_header(line), header);
}

TEST_F(TransferHeaderTest, IdenticalAcrossEverySplitPoint) {
    const std::string body = "BODY-BYTES";
    const std::string wire = serialize_header(header) + body;

    for (std::size_t split = 0; split <= wire.size(); ++split) {
        HeaderReader reader;
        reader.feed(wire.data(), split);
        reader.feed(wire.data() + split, wire.size() - split);

        ASSERT_TRUE(reader.complete()) << "Split at " << split;
        expect_same(reader.header(), header);
        EXPECT_EQ(reader.take_remainder(), body) << "Split at " << split;
    }
}

TEST_F(TransferHeaderTest, ByteAtATimeDelivery) {
    const std::string body = "xyz";
    const std::string wire = serialize_header(header) + body;

    HeaderReader reader;
    std::string remainder;
    for (char c : wire) {
        if (reader.complete()) {
            remainder.push_back(c);
        } else {
            reader.feed(&c, 1);
        }
    }

    ASSERT_TRUE(reader.complete());
    expect_same(reader.header(), header);
    EXPECT_TRUE(reader.take_remainder().empty());
    EXPECT_EQ(remainder, body);
}

TEST_F(TransferHeaderTest, RemainderIsHandedOverOnce) {
    const std::string wire = serialize_header(header) + "abc";
    HeaderReader reader;
    ASSERT_TRUE(reader.feed(wire.data(), wire.size()));

    EXPECT_EQ(reader.take_remainder(), "abc");
    EXPECT_EQ(reader.take_remainder(), "");
}

TEST_F(TransferHeaderTest, IncompleteHeaderIsNotParsed) {
    const std::string partial = "{\"transfer_id\":\"abc\"";
    HeaderReader reader;
    EXPECT_FALSE(reader.feed(partial.data(), partial.size()));
    EXPECT_FALSE(reader.complete());
    EXPECT_THROW(reader.header(), ProtocolError);
}

TEST_F(TransferHeaderTest, OversizeHeaderRejected) {
    HeaderReader reader(128);
    const std::string chunk(100, 'a');
    EXPECT_FALSE(reader.feed(chunk.data(), chunk.size()));
    EXPECT_THROW(reader.feed(chunk.data(), chunk.size()), ProtocolError);
}

TEST_F(TransferHeaderTest, MalformedHeadersRejected) {
    EXPECT_THROW(parse_header(""), ProtocolError);
    EXPECT_THROW(parse_header("not json"), ProtocolError);
    EXPECT_THROW(parse_header("{\"file_name\":\"a.txt\"}"), ProtocolError);
    EXPECT_THROW(parse_header("{\"transfer_id\":\"x\",\"file_name\":\"a.txt\","
                              "\"original_size\":\"-5\",\"compressed_size\":\"3\"}"), ProtocolError);
    EXPECT_THROW(parse_header("{\"transfer_id\":\"x\",\"file_name\":\"a.txt\","
                              "\"original_size\":\"99999999999999999999\",\"compressed_size\":\"3\"}"), ProtocolError);
    EXPECT_THROW(parse_header("{\"transfer_id\":\"\",\"file_name\":\"a.txt\","
                              "\"original_size\":\"1\",\"compressed_size\":\"3\"}"), ProtocolError);
}

TEST_F(TransferHeaderTest, EncryptedHeaderRequiresSalt) {
    header.salt.clear();
    auto line = serialize_header(header);
    line.pop_back();
    EXPECT_THROW(parse_header(line), ProtocolError);
}

TEST_F(TransferHeaderTest, UnsafeFileNamesRejected) {
    for (const std::string& name : std::vector<std::string>{"", ".", "..", "../etc/passwd", "dir/file", "dir\\file", "C:evil",
                                   std::string("nul\0byte", 8), std::string(256, 'a')}) {
        EXPECT_FALSE(is_safe_file_name(name)) << "Accepted: " << name;

        header.file_name = name;
        auto line = serialize_header(header);
        line.pop_back();
        EXPECT_THROW(parse_header(line), ProtocolError) << "Parsed: " << name;
    }
}

TEST_F(TransferHeaderTest, PlainFileNamesAccepted) {
    for (const std::string& name : std::vector<std::string>{"report.pdf", "archive.tar.gz", ".hidden", "with space.txt",
                                   std::string(255, 'a')}) {
        EXPECT_TRUE(is_safe_file_name(name)) << "Rejected: " << name;
    }
}

TEST_F(TransferHeaderTest, Utf8FileNameSurvives) {
    header.file_name = "caf\xc3\xa9 \xe6\x97\xa5\xe6\x9c\xac.txt";
    auto line = serialize_header(header);
    ASSERT_EQ(line.find(HEADER_DELIMITER), line.size() - 1);
    line.pop_back();

    const auto parsed = parse_header(line);
    EXPECT_EQ(parsed.file_name, header.file_name);
    EXPECT_TRUE(is_safe_file_name(parsed.file_name));
}

TEST_F(TransferHeaderTest, TransferIdsUsableInFileNames) {
    for (const std::string& id : std::vector<std::string>{"0b5c3e9a-1f2d-4c6e-8a7b-9d0e1f2a3b4c", "scripted-1",
                                 "upper_CASE_9", std::string(MAX_TRANSFER_ID_LENGTH, 'f')}) {
        EXPECT_TRUE(is_valid_transfer_id(id)) << "Rejected: " << id;
    }

    for (const std::string& id : std::vector<std::string>{"", "../../etc/cron.d/x", "a/b", "a\\b", "a.b", "with space",
                                 std::string(MAX_TRANSFER_ID_LENGTH + 1, 'f')}) {
        EXPECT_FALSE(is_valid_transfer_id(id)) << "Accepted: " << id;

        header.transfer_id = id;
        auto line = serialize_header(header);
        line.pop_back();
        EXPECT_THROW(parse_header(line), ProtocolError) << "Parsed: " << id;
    }
}
