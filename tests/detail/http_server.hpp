#pragma once

#include <urlbridge/detail/mem.hpp>
#include <fmt/format.h>
#include <zlib.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <stdexcept>
#include <charconv>
#include <string>
#include <vector>
#include <thread>
#include <atomic>
#include <mutex>

namespace testing_detail {

/**
 * @brief The minimal HTTP/1.1 server on the loopback, for the engine tests
 *
 * Routes:
 *  /get            echo the method and the request headers, one "name: value" per line
 *  /post           echo the request body (any method), X-Method carries the method
 *  /status/<n>     answer with status n
 *  /delay/<ms>     answer after ms milliseconds
 *  /redirect/<n>   302 to /redirect/<n-1>, /redirect/1 goes to /get
 *  /see-other      303 to /get
 *  /temporary      307 to /post
 *  /gzip           gzip encoded "Hello, gzip"
 *  /deflate        zlib encoded "Hello, deflate"
 *  /large          LargeSize bytes of 'a' to 'z'
 *  /cookies        two Set-Cookie headers
 */
class LoopbackServer {
public:
    static constexpr size_t LargeSize = 2 * 1024 * 1024 + 7;

    struct Request {
        std::string method;
        std::string target;
        std::vector<std::pair<std::string, std::string> > headers;
        std::string body;

        auto header(std::string_view name) const -> std::string_view {
            for (auto &[key, value] : headers) {
                if (URLBRIDGE_NAMESPACE::mem::iequals(key, name)) {
                    return value;
                }
            }
            return {};
        }
    };

    LoopbackServer() {
        mFd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (mFd < 0) {
            throw std::runtime_error("socket() failed");
        }
        int on = 1;
        ::setsockopt(mFd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
        ::sockaddr_in addr {};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = ::htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::socklen_t len = sizeof(addr);
        if (::bind(mFd, reinterpret_cast<::sockaddr *>(&addr), sizeof(addr)) != 0 ||
            ::listen(mFd, 64) != 0 ||
            ::getsockname(mFd, reinterpret_cast<::sockaddr *>(&addr), &len) != 0)
        {
            ::close(mFd);
            throw std::runtime_error("Failed to listen on the loopback");
        }
        mPort = ::ntohs(addr.sin_port);
        mThread = std::thread(&LoopbackServer::acceptLoop, this);
    }

    LoopbackServer(const LoopbackServer &) = delete;

    ~LoopbackServer() {
        mStopping = true;
        ::shutdown(mFd, SHUT_RDWR);
        ::close(mFd);
        mThread.join();
        std::lock_guard locker(mMutex);
        for (auto fd : mClients) {
            ::shutdown(fd, SHUT_RDWR);
        }
        for (auto &worker : mWorkers) {
            worker.join();
        }
    }

    auto url(std::string_view path) const -> std::string {
        return fmt::format("http://127.0.0.1:{}{}", mPort, path);
    }

    auto port() const -> uint16_t { return mPort; }

    // The last request the server received
    auto lastRequest() -> Request {
        std::lock_guard locker(mMutex);
        return mLast;
    }

    auto requestCount() const -> size_t { return mCount.load(); }

    static auto largeBody() -> std::string {
        std::string body(LargeSize, '\0');
        for (size_t i = 0; i < body.size(); ++i) {
            body[i] = char('a' + i % 26);
        }
        return body;
    }

    // Encode by zlib, windowBits 31 for gzip, 15 for the zlib format
    static auto compress(std::string_view text, int windowBits) -> std::string {
        ::z_stream stream {};
        if (::deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            throw std::runtime_error("deflateInit2 failed");
        }
        std::string out(::deflateBound(&stream, text.size()), '\0');
        stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(text.data()));
        stream.avail_in = text.size();
        stream.next_out = reinterpret_cast<Bytef *>(out.data());
        stream.avail_out = out.size();
        ::deflate(&stream, Z_FINISH);
        out.resize(stream.total_out);
        ::deflateEnd(&stream);
        return out;
    }
private:
    struct Reply {
        int status = 200;
        std::vector<std::pair<std::string, std::string> > headers;
        std::string body;
    };

    auto acceptLoop() -> void {
        while (!mStopping) {
            auto fd = ::accept(mFd, nullptr, nullptr);
            if (fd < 0) {
                if (mStopping) {
                    return;
                }
                continue;
            }
            std::lock_guard locker(mMutex);
            mClients.push_back(fd);
            mWorkers.emplace_back(&LoopbackServer::serve, this, fd);
        }
    }

    auto serve(int fd) -> void {
        std::string buffer;
        Request request;
        while (!mStopping && readRequest(fd, buffer, request)) {
            {
                std::lock_guard locker(mMutex);
                mLast = request;
            }
            ++mCount;
            auto reply = route(request);
            if (!writeReply(fd, request, reply)) {
                break;
            }
            if (URLBRIDGE_NAMESPACE::mem::iequals(request.header("Connection"), "close")) {
                break;
            }
        }
        ::close(fd);
    }

    static auto fill(int fd, std::string &buffer) -> bool {
        char tmp[16384];
        auto n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) {
            return false;
        }
        buffer.append(tmp, n);
        return true;
    }

    // Take a line ended by CRLF from the buffer, reading more when needed
    static auto takeLine(int fd, std::string &buffer, std::string &line) -> bool {
        size_t pos;
        while ((pos = buffer.find("\r\n")) == std::string::npos) {
            if (!fill(fd, buffer)) {
                return false;
            }
        }
        line = buffer.substr(0, pos);
        buffer.erase(0, pos + 2);
        return true;
    }

    static auto takeBytes(int fd, std::string &buffer, size_t n, std::string &out) -> bool {
        while (buffer.size() < n) {
            if (!fill(fd, buffer)) {
                return false;
            }
        }
        out.append(buffer, 0, n);
        buffer.erase(0, n);
        return true;
    }

    static auto readRequest(int fd, std::string &buffer, Request &request) -> bool {
        using URLBRIDGE_NAMESPACE::mem::trim;
        request = Request {};
        std::string line;
        if (!takeLine(fd, buffer, line)) {
            return false;
        }
        auto first = line.find(' ');
        auto second = line.find(' ', first + 1);
        if (first == std::string::npos || second == std::string::npos) {
            return false;
        }
        request.method = line.substr(0, first);
        request.target = line.substr(first + 1, second - first - 1);
        while (true) {
            if (!takeLine(fd, buffer, line)) {
                return false;
            }
            if (line.empty()) {
                break;
            }
            auto colon = line.find(':');
            if (colon == std::string::npos) {
                return false;
            }
            auto name = trim(std::string_view(line).substr(0, colon));
            auto value = trim(std::string_view(line).substr(colon + 1));
            request.headers.emplace_back(std::string(name), std::string(value));
        }
        if (URLBRIDGE_NAMESPACE::mem::iequals(request.header("Transfer-Encoding"), "chunked")) {
            while (true) {
                if (!takeLine(fd, buffer, line)) {
                    return false;
                }
                size_t size = 0;
                std::from_chars(line.data(), line.data() + line.size(), size, 16);
                if (size == 0) {
                    takeLine(fd, buffer, line); // The trailing CRLF
                    break;
                }
                if (!takeBytes(fd, buffer, size, request.body) || !takeLine(fd, buffer, line)) {
                    return false;
                }
            }
        }
        else if (auto length = request.header("Content-Length"); !length.empty()) {
            size_t size = 0;
            std::from_chars(length.data(), length.data() + length.size(), size);
            if (!takeBytes(fd, buffer, size, request.body)) {
                return false;
            }
        }
        return true;
    }

    static auto numberAfter(std::string_view target, std::string_view prefix) -> int {
        int value = 0;
        auto rest = target.substr(prefix.size());
        std::from_chars(rest.data(), rest.data() + rest.size(), value);
        return value;
    }

    static auto route(const Request &request) -> Reply {
        std::string_view target = request.target;
        Reply reply;
        if (target == "/get") {
            reply.body = request.method + "\n";
            for (auto &[name, value] : request.headers) {
                reply.body += fmt::format("{}: {}\n", name, value);
            }
        }
        else if (target == "/post") {
            reply.body = request.body;
            reply.headers.emplace_back("X-Method", request.method);
        }
        else if (target.starts_with("/status/")) {
            reply.status = numberAfter(target, "/status/");
        }
        else if (target.starts_with("/delay/")) {
            std::this_thread::sleep_for(std::chrono::milliseconds(numberAfter(target, "/delay/")));
            reply.body = "delayed";
        }
        else if (target.starts_with("/redirect/")) {
            auto n = numberAfter(target, "/redirect/");
            reply.status = 302;
            reply.headers.emplace_back("Location", n <= 1 ? std::string("/get") : fmt::format("/redirect/{}", n - 1));
            reply.body = "redirecting";
        }
        else if (target == "/see-other") {
            reply.status = 303;
            reply.headers.emplace_back("Location", "/get");
        }
        else if (target == "/temporary") {
            reply.status = 307;
            reply.headers.emplace_back("Location", "/post");
        }
        else if (target == "/gzip") {
            reply.headers.emplace_back("Content-Encoding", "gzip");
            reply.body = compress("Hello, gzip", 31);
        }
        else if (target == "/deflate") {
            reply.headers.emplace_back("Content-Encoding", "deflate");
            reply.body = compress("Hello, deflate", 15);
        }
        else if (target == "/large") {
            reply.body = largeBody();
        }
        else if (target == "/cookies") {
            reply.headers.emplace_back("Set-Cookie", "a=1");
            reply.headers.emplace_back("Set-Cookie", "b=2");
            reply.body = "cookies";
        }
        else {
            reply.status = 404;
            reply.body = "Not Found";
        }
        return reply;
    }

    static auto reason(int status) -> std::string_view {
        switch (status) {
            case 200: return "OK";
            case 302: return "Found";
            case 303: return "See Other";
            case 307: return "Temporary Redirect";
            case 404: return "Not Found";
            case 500: return "Internal Server Error";
            default: return "Status";
        }
    }

    static auto writeReply(int fd, const Request &request, const Reply &reply) -> bool {
        auto head = fmt::format("HTTP/1.1 {} {}\r\nContent-Length: {}\r\n", reply.status, reason(reply.status), reply.body.size());
        for (auto &[name, value] : reply.headers) {
            head += fmt::format("{}: {}\r\n", name, value);
        }
        head += "\r\n";
        std::string data = std::move(head);
        if (request.method != "HEAD") {
            data += reply.body;
        }
        std::string_view rest = data;
        while (!rest.empty()) {
            auto n = ::send(fd, rest.data(), rest.size(), MSG_NOSIGNAL);
            if (n <= 0) {
                return false;
            }
            rest.remove_prefix(n);
        }
        return true;
    }

    int mFd = -1;
    uint16_t mPort = 0;
    std::atomic<bool> mStopping {false};
    std::atomic<size_t> mCount {0};
    std::thread mThread;
    std::mutex mMutex;
    std::vector<int> mClients;
    std::vector<std::thread> mWorkers;
    Request mLast;
};

} // namespace testing_detail
