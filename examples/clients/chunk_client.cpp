/**
 * Chunked upload client example
 *
 * Uploads a local file to a ChunkVault server as fixed-size chunks sent in
 * random order, then prints the server's view of the upload.
 *
 * Usage: chunk_client <host> <port> <device-id> <file> [chunk-bytes] [bearer-token]
 */

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include <Poco/Exception.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/StreamCopier.h>

#include "chunkvault/transfer/chunk_codec.h"

using Poco::Net::HTTPClientSession;
using Poco::Net::HTTPRequest;
using Poco::Net::HTTPResponse;

namespace {

struct Options {
    std::string host;
    unsigned short port{8080};
    std::string device_id;
    std::string file;
    std::size_t chunk_bytes{256 * 1024};
    std::string token;
};

void Authorize(HTTPRequest& request, const Options& options) {
    if (!options.token.empty()) {
        request.set("Authorization", "Bearer " + options.token);
    } else {
        request.set("X-Device-Id", options.device_id);
    }
}

std::string BaseName(const std::string& path) {
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

int SendChunk(HTTPClientSession& session, const Options& options, const std::string& name,
              std::uint64_t total_size, const std::string& body, std::string* reply) {
    HTTPRequest request(HTTPRequest::HTTP_POST,
                        "/v1/files/" + name + "/chunks?total_size=" + std::to_string(total_size),
                        HTTPRequest::HTTP_1_1);
    request.setContentType("application/octet-stream");
    request.setContentLength(static_cast<std::streamsize>(body.size()));
    Authorize(request, options);
    session.sendRequest(request) << body;

    HTTPResponse response;
    std::istream& in = session.receiveResponse(response);
    std::ostringstream out;
    Poco::StreamCopier::copyStream(in, out);
    *reply = out.str();
    return response.getStatus();
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 5) {
        std::cerr << "usage: " << argv[0]
                  << " <host> <port> <device-id> <file> [chunk-bytes] [bearer-token]" << std::endl;
        return 2;
    }
    Options options;
    options.host = argv[1];
    options.port = static_cast<unsigned short>(std::stoi(argv[2]));
    options.device_id = argv[3];
    options.file = argv[4];
    if (argc > 5) {
        options.chunk_bytes = static_cast<std::size_t>(std::stoul(argv[5]));
    }
    if (argc > 6) {
        options.token = argv[6];
    }
    if (options.chunk_bytes == 0) {
        std::cerr << "chunk size must be positive" << std::endl;
        return 2;
    }

    std::ifstream input(options.file, std::ios::binary);
    if (!input) {
        std::cerr << "cannot open " << options.file << std::endl;
        return 1;
    }
    const std::string content((std::istreambuf_iterator<char>(input)),
                              std::istreambuf_iterator<char>());
    if (content.empty()) {
        std::cerr << "refusing to upload an empty file" << std::endl;
        return 1;
    }
    const std::string name = BaseName(options.file);

    std::vector<std::uint64_t> offsets;
    for (std::uint64_t offset = 0; offset < content.size(); offset += options.chunk_bytes) {
        offsets.push_back(offset);
    }
    std::mt19937 rng(std::random_device{}());
    std::shuffle(offsets.begin(), offsets.end(), rng);

    try {
        HTTPClientSession session(options.host, options.port);
        std::string reply;
        for (const auto offset : offsets) {
            const auto payload = content.substr(offset, options.chunk_bytes);
            const auto body = chunkvault::transfer::EncodeChunk(offset, payload);
            const int status = SendChunk(session, options, name, content.size(), body, &reply);
            if (status != HTTPResponse::HTTP_OK) {
                std::cerr << "chunk at " << offset << " rejected (" << status << "): " << reply
                          << std::endl;
                return 1;
            }
            std::cout << "sent [" << offset << ", " << offset + payload.size() - 1 << "]"
                      << std::endl;
        }

        HTTPRequest request(HTTPRequest::HTTP_GET, "/v1/files/" + name + "/status",
                            HTTPRequest::HTTP_1_1);
        Authorize(request, options);
        session.sendRequest(request);
        HTTPResponse response;
        std::istream& in = session.receiveResponse(response);
        Poco::StreamCopier::copyStream(in, std::cout);
        std::cout << std::endl;
    } catch (const Poco::Exception& ex) {
        std::cerr << "request failed: " << ex.displayText() << std::endl;
        return 1;
    }
    return 0;
}
