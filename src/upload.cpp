#include <urlbridge/upload.hpp>
#include <urlbridge/log.hpp>
#include <algorithm>
#include <cstring>

URLBRIDGE_NS_BEGIN

UploadStreamer::UploadStreamer(Body body, RewindFactory rewindFactory) : 
    mBody(std::move(body)), mLength(mBody.length()), mRewindFactory(std::move(rewindFactory))
{

}

auto UploadStreamer::replayable(Body body) -> std::shared_ptr<UploadStreamer> {
    RewindFactory factory;
    if (auto copy = body.tryClone(); copy) { // 307 / 308 send the body again
        auto snapshot = std::make_shared<const Body>(std::move(*copy));
        factory = [snapshot]() {
            return *snapshot->tryClone();
        };
    }
    return std::make_shared<UploadStreamer>(std::move(body), std::move(factory));
}

UploadStreamer::~UploadStreamer() {
    URLBRIDGE_TRACE("Upload", "Streamer destroyed, {} bytes sent", mBytesSent.load());
}

auto UploadStreamer::length() const -> int64_t {
    std::lock_guard locker(mMutex);
    if (!mLength) {
        return -1;
    }
    return static_cast<int64_t>(*mLength);
}

auto UploadStreamer::read(UploadDataSink &sink, MutableBuffer buffer) -> void {
    if (mCompleted.load()) {
        return;
    }
    Result<Chunk, std::string> chunk = Unexpected(std::string("Invalid body"));
    try {
        std::lock_guard locker(mMutex);
        if (auto bytes = mBody.asBytes(); bytes) {
            chunk = readBytes(*bytes, buffer);
        }
        else if (auto stream = mBody.stream(); stream) {
            chunk = readStream(*stream, buffer);
        }
    }
    catch (const std::exception &e) {
        URLBRIDGE_WARN("Upload", "Exception while reading the body: {}", e.what());
        chunk = Unexpected(std::string(e.what()));
    }
    if (!chunk) {
        sink.onReadError(chunk.error());
        return;
    }
    sink.onReadSucceeded(chunk->bytes, chunk->finalChunk);
}

auto UploadStreamer::readBytes(Buffer bytes, MutableBuffer buffer) -> Result<Chunk, std::string> {
    uint64_t total = bytes.size();
    if (total == 0) {
        return Chunk {0, true}; // Empty body finishes in one step
    }
    auto sent = mBytesSent.load();
    if (sent >= total) {
        return Chunk {0, true};
    }
    if (buffer.empty()) {
        return Unexpected(std::string("Buffer size is zero"));
    }
    auto toCopy = std::min<uint64_t>(total - sent, buffer.size());
    if (toCopy == 0) {
        return Chunk {0, true};
    }
    if (sent >= bytes.size()) {
        return Unexpected(std::string("Read position beyond body length"));
    }
    if (sent + toCopy > bytes.size()) {
        return Unexpected(std::string("Read would exceed body length"));
    }
    ::memcpy(buffer.data(), bytes.data() + sent, toCopy);
    mBytesSent.store(sent + toCopy);
    URLBRIDGE_TRACE("Upload", "Supplied {} bytes, {} of {}", toCopy, sent + toCopy, total);
    return Chunk {static_cast<size_t>(toCopy), false};
}

auto UploadStreamer::readStream(std::istream &stream, MutableBuffer buffer) -> Result<Chunk, std::string> {
    auto sent = mBytesSent.load();
    if (mLength && (*mLength == 0 || sent >= *mLength)) {
        return Chunk {0, true};
    }
    if (buffer.empty()) {
        return Unexpected(std::string("Buffer size is zero"));
    }
    uint64_t toRead = buffer.size();
    if (mLength) {
        toRead = std::min<uint64_t>(*mLength - sent, toRead);
    }
    stream.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(toRead));
    auto n = static_cast<size_t>(stream.gcount());
    if (stream.bad()) {
        return Unexpected(std::string("Failed to read the body stream"));
    }
    if (n == 0) {
        if (mLength) { // Shorter than announced
            return Unexpected(std::string("Read would exceed body length"));
        }
        return Chunk {0, true}; // Unknown length, EOF is the end
    }
    mBytesSent.store(sent + n);
    URLBRIDGE_TRACE("Upload", "Supplied {} bytes from stream, {} in total", n, sent + n);
    return Chunk {n, false};
}

auto UploadStreamer::rewind(UploadDataSink &sink) -> void {
    if (!mRewindFactory) {
        sink.onRewindError("Rewinding is not supported");
        return;
    }
    try {
        auto body = mRewindFactory();
        {
            std::lock_guard locker(mMutex);
            mBody = std::move(body);
            mLength = mBody.length();
        }
        mBytesSent.store(0);
        mCompleted.store(false);
        URLBRIDGE_DEBUG("Upload", "Rewind the body");
        sink.onRewindSucceeded();
    }
    catch (const std::exception &e) {
        URLBRIDGE_WARN("Upload", "Exception while rewinding the body: {}", e.what());
        sink.onRewindError(e.what());
    }
}

auto UploadStreamer::close() -> void {
    mCompleted.store(true);
    std::lock_guard locker(mMutex);
    mBody = Body::empty();
    URLBRIDGE_DEBUG("Upload", "Closed after {} bytes", mBytesSent.load());
}

URLBRIDGE_NS_END
