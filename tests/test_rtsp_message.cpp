#include "RTSPMessage.hpp"
#include <gtest/gtest.h>

using namespace AirStream::RTSP;

namespace {
std::vector<char> bytes(const std::string &s) { return std::vector<char>(s.begin(), s.end()); }
} // namespace

TEST(RTSPMessage, ConstructsRequestWithCSeqAndBody) {
    auto request = RTSPMessage::request("ANNOUNCE", "rtsp://10.0.0.2/1234");
    request.cseq = 3;
    request.headers["User-Agent"] = "iTunes/7.6.2 (Windows; N;)";
    request.setBody("application/sdp", "v=0\r\n");

    auto raw = request.constructRequest();
    std::string text(raw.begin(), raw.end());

    EXPECT_EQ(text.rfind("ANNOUNCE rtsp://10.0.0.2/1234 RTSP/1.0\r\n", 0), 0u);
    EXPECT_NE(text.find("CSeq: 3\r\n"), std::string::npos);
    EXPECT_NE(text.find("Content-Length: 5\r\n"), std::string::npos);
    EXPECT_NE(text.find("Content-Type: application/sdp\r\n"), std::string::npos);
    EXPECT_EQ(text.substr(text.size() - 9), "\r\n\r\nv=0\r\n");
}

TEST(RTSPMessage, NoContentLengthWithoutBody) {
    auto request = RTSPMessage::request("OPTIONS", "*");
    request.headers["Content-Length"] = "12";
    auto raw = request.constructRequest();
    std::string text(raw.begin(), raw.end());
    EXPECT_EQ(text.find("Content-Length"), std::string::npos);
    EXPECT_EQ(text.substr(text.size() - 4), "\r\n\r\n");
}

TEST(RTSPMessage, ParsesResponseWithMultiWordReason) {
    RTSPMessage response;
    ASSERT_TRUE(response.parseResponse(bytes("RTSP/1.0 453 Not Enough Bandwidth\r\n"
                                             "CSeq: 7\r\n"
                                             "Audio-Jack-Status: connected\r\n"
                                             "\r\n")));
    EXPECT_EQ(response.statusCode, 453);
    EXPECT_EQ(response.reasonPhrase, "Not Enough Bandwidth");
    EXPECT_EQ(response.cseq, 7);
    EXPECT_FALSE(response.isSuccess());
}

TEST(RTSPMessage, HeaderLookupIgnoresCase) {
    RTSPMessage response;
    ASSERT_TRUE(response.parseResponse(bytes("RTSP/1.0 200 OK\r\n"
                                             "Cseq: 2\r\n"
                                             "session: 1A2B3C\r\n"
                                             "Audio-Latency:   11025  \r\n"
                                             "\r\n")));
    EXPECT_TRUE(response.isSuccess());
    EXPECT_EQ(response.cseq, 2);
    EXPECT_EQ(response.header("Session"), "1A2B3C");
    EXPECT_EQ(response.header("AUDIO-LATENCY"), "11025");
    EXPECT_FALSE(response.header("Transport").has_value());
}

TEST(RTSPMessage, ParsesBody) {
    RTSPMessage response;
    ASSERT_TRUE(response.parseResponse(bytes("RTSP/1.0 200 OK\r\n"
                                             "CSeq: 1\r\n"
                                             "Content-Length: 4\r\n"
                                             "\r\n"
                                             "abcd")));
    EXPECT_EQ(response.getExpectedContentLength(), 4u);
    EXPECT_EQ(response.body(), "abcd");
}

TEST(RTSPMessage, RejectsGarbage) {
    RTSPMessage response;
    EXPECT_FALSE(response.parseResponse(bytes("RTSP/1.0 200 OK\r\nCSeq: 1\r\n")));
    EXPECT_FALSE(response.parseResponseHeader("HTTP/1.1 200 OK\r\n\r\n"));
    EXPECT_FALSE(response.parseResponseHeader("RTSP/1.0 abc\r\n\r\n"));
    EXPECT_FALSE(response.parseResponseHeader("RTSP/1.0 200 OK\r\nCSeq: x\r\n\r\n"));
}

TEST(RTSPMessage, RejectsOversizedContentLength) {
    RTSPMessage response;
    EXPECT_FALSE(response.parseResponseHeader("RTSP/1.0 200 OK\r\n"
                                              "CSeq: 1\r\n"
                                              "Content-Length: 18446744073709551615\r\n"
                                              "\r\n"));
    EXPECT_FALSE(response.parseResponseHeader("RTSP/1.0 200 OK\r\n"
                                              "Content-Length: 65537\r\n"
                                              "\r\n"));
    ASSERT_TRUE(response.parseResponseHeader("RTSP/1.0 200 OK\r\n"
                                             "Content-Length: 65536\r\n"
                                             "\r\n"));
    EXPECT_EQ(response.getExpectedContentLength(), RTSPMessage::kMaxContentLength);
}
