/**
 * @file zlib.hpp
 * @brief Streaming inflate for Content-Encoding gzip and deflate
 * @version 0.1
 * @date 2026-03-02
 *
 */
#pragma once

#include <urlbridge/buffer.hpp>
#include <urlbridge/error.hpp>
#include <urlbridge/log.hpp>
#include <vector>
#include <array>
#include <zlib.h>
#include <span>

URLBRIDGE_NS_BEGIN

namespace zlib {

/**
 * @brief Window bits for inflateInit2, they select the framing
 *
 */
enum ZFormat : int {
    DeflateFormat = MAX_WBITS,      //< zlib framing, what "Content-Encoding: deflate" carries
    GzipFormat    = MAX_WBITS + 16, //< gzip framing
    AutoFormat    = MAX_WBITS + 32, //< Whichever of the two the header says
};

/**
 * @brief zlib return codes, as std::error_code values
 *
 */
enum class ZError : int {
    StreamError = Z_STREAM_ERROR,
    DataError   = Z_DATA_ERROR,
    MemError    = Z_MEM_ERROR,
    BufError    = Z_BUF_ERROR,
    NeedDict    = Z_NEED_DICT,
};

class ZCategory final : public std::error_category {
public:
    auto name() const noexcept -> const char * override { return "zlib"; }

    auto message(int ev) const -> std::string override {
        if (ev < Z_VERSION_ERROR || ev > Z_NEED_DICT) { // Outside the table zError indexes
            return "unknown zlib error";
        }
        return ::zError(ev);
    }

    static auto instance() noexcept -> const ZCategory & {
        static constinit ZCategory category;
        return category;
    }
};

URLBRIDGE_DECLARE_ERROR(ZError, ZCategory);

/**
 * @brief Inflates a body that arrives in pieces
 *
 * Each decompressTo() call consumes its whole input and appends what it produced. Input past the
 * end of the stream is dropped. A stream that never reaches its end is not an error here, ask
 * isFinished() once the body is complete.
 */
class Decompressor {
public:
    explicit Decompressor(int wbits) {
        mReady = ::inflateInit2(&mStream, wbits) == Z_OK;
        if (!mReady) {
            URLBRIDGE_ERROR("Zlib", "inflateInit2({}) failed", wbits);
        }
    }

    Decompressor(const Decompressor &) = delete;
    auto operator =(const Decompressor &) -> Decompressor & = delete;

    ~Decompressor() {
        if (mReady) {
            ::inflateEnd(&mStream);
        }
    }

    /**
     * @brief Inflate one compressed chunk
     *
     * @param input
     * @param output Receives the inflated bytes at its end, left as it was on error
     * @return IoResult<size_t> The count of bytes appended
     */
    auto decompressTo(Buffer input, std::vector<std::byte> &output) -> IoResult<size_t> {
        if (!mReady) {
            return Unexpected(make_error_code(ZError::StreamError));
        }
        if (mEnded) {
            return 0;
        }
        auto before = output.size();
        mStream.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(input.data()));
        mStream.avail_in = static_cast<uInt>(input.size());

        std::array<std::byte, 16 * 1024> chunk;
        do {
            mStream.next_out = reinterpret_cast<Bytef *>(chunk.data());
            mStream.avail_out = static_cast<uInt>(chunk.size());

            auto code = ::inflate(&mStream, Z_NO_FLUSH);
            auto produced = chunk.size() - mStream.avail_out;
            output.insert(output.end(), chunk.begin(), chunk.begin() + produced);

            switch (code) {
                case Z_OK:
                    break;
                case Z_STREAM_END:
                    mEnded = true;
                    break;
                case Z_BUF_ERROR: // Nothing to do until more input comes
                    return output.size() - before;
                default:
                    URLBRIDGE_ERROR("Zlib", "inflate failed: {}", mStream.msg ? mStream.msg : ::zError(code));
                    output.resize(before);
                    return Unexpected(make_error_code(static_cast<ZError>(code)));
            }
        }
        while (!mEnded && (mStream.avail_in > 0 || mStream.avail_out == 0)); // A full chunk may leave output pending
        return output.size() - before;
    }

    auto isFinished() const noexcept -> bool { return mEnded; }

    explicit operator bool() const noexcept { return mReady; }
private:
    ::z_stream mStream {};
    bool mReady = false;
    bool mEnded = false;
};

/**
 * @brief Inflate a complete buffer at once
 *
 * @param input
 * @param wbits One of ZFormat
 * @return IoResult<std::vector<std::byte> > BufError when the stream stops before its end
 */
inline auto decompress(Buffer input, int wbits) -> IoResult<std::vector<std::byte> > {
    Decompressor inflater(wbits);
    std::vector<std::byte> output;
    if (auto ret = inflater.decompressTo(input, output); !ret) {
        return Unexpected(ret.error());
    }
    if (!inflater.isFinished()) {
        return Unexpected(make_error_code(ZError::BufError));
    }
    return output;
}

} // namespace zlib

URLBRIDGE_NS_END
