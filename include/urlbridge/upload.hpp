/**
 * @file upload.hpp
 * @brief Adapt a Body to the pull based UploadDataProvider
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */
#pragma once

#include <urlbridge/engine.hpp>
#include <urlbridge/body.hpp>
#include <functional>
#include <memory>
#include <atomic>
#include <mutex>

URLBRIDGE_NS_BEGIN

/**
 * @brief Streams a Body to the engine chunk by chunk
 * 
 * The streamer owns the body: close() (called by the engine when it is done with the upload)
 * or the destruction of the streamer releases it, the caller never disposes it.
 * A non empty chunk is always reported with final = false, the end of the body is reported
 * by the next read as zero bytes with final = true.
 */
class URLBRIDGE_API UploadStreamer final : public UploadDataProvider {
public:
    using RewindFactory = std::function<Body()>;

    /**
     * @brief Construct a new Upload Streamer object
     * 
     * @param body The body to upload, taken over
     * @param rewindFactory Produce a fresh copy of the body for replaying it (empty to disable rewinding)
     */
    explicit UploadStreamer(Body body, RewindFactory rewindFactory = {});
    UploadStreamer(const UploadStreamer &) = delete;
    ~UploadStreamer();

    /**
     * @brief Make a streamer that can rewind when the body can be replayed
     * 
     * A buffered body is snapshotted once, each rewind uploads a fresh copy of the snapshot.
     * A stream body gets a streamer without rewinding.
     * 
     * @param body The body to upload, taken over
     * @return std::shared_ptr<UploadStreamer> 
     */
    static auto replayable(Body body) -> std::shared_ptr<UploadStreamer>;

    /**
     * @brief Get the total length
     * 
     * @return int64_t (-1 if the body length is unknown)
     */
    auto length() const -> int64_t override;

    /**
     * @brief Copy the next chunk into the buffer and signal the sink
     * 
     * @param sink 
     * @param buffer 
     */
    auto read(UploadDataSink &sink, MutableBuffer buffer) -> void override;

    /**
     * @brief Restart from the beginning with a body from the rewind factory
     * 
     * @param sink 
     */
    auto rewind(UploadDataSink &sink) -> void override;

    /**
     * @brief Release the body, later reads are ignored
     * 
     */
    auto close() -> void override;

    auto bytesSent() const noexcept -> uint64_t {
        return mBytesSent.load();
    }

    auto isCompleted() const noexcept -> bool {
        return mCompleted.load();
    }
private:
    // The outcome of one read, signaled to the sink with the lock released
    struct Chunk {
        size_t bytes;
        bool finalChunk;
    };

    auto readBytes(Buffer bytes, MutableBuffer buffer) -> Result<Chunk, std::string>;
    auto readStream(std::istream &stream, MutableBuffer buffer) -> Result<Chunk, std::string>;

    mutable std::mutex mMutex; //< Protect the body
    Body mBody;
    std::optional<uint64_t> mLength;
    RewindFactory mRewindFactory;
    std::atomic<uint64_t> mBytesSent {0};
    std::atomic<bool> mCompleted {false};
};

URLBRIDGE_NS_END
