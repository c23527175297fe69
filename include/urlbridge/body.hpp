/**
 * @file body.hpp
 * @brief The payload of a request or a response, buffered bytes or a readable stream
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */
#pragma once

#include <urlbridge/buffer.hpp>
#include <urlbridge/error.hpp>
#include <filesystem>
#include <optional>
#include <variant>
#include <istream>
#include <cstdint>
#include <memory>
#include <vector>

URLBRIDGE_NS_BEGIN

/**
 * @brief The body of a request or response
 * 
 * Either owned bytes (the length is always known) or a stream with an optional known length.
 * A Body is move only, it is exclusively owned by the request using it.
 */
class URLBRIDGE_API Body {
public:
    /**
     * @brief The stream variant, the istream is owned and released with the body
     * 
     */
    struct Stream {
        std::unique_ptr<std::istream> stream;
        std::optional<uint64_t> length;
    };

    /**
     * @brief Construct an empty body
     * 
     */
    Body() = default;
    Body(std::vector<std::byte> bytes) : mData(std::move(bytes)) { }
    Body(std::string_view text) : Body(fromString(text)) { }
    Body(const std::string &text) : Body(fromString(text)) { }
    Body(const char *text) : Body(text ? fromString(text) : empty()) { } //< nullptr is the empty body
    Body(const Body &) = delete;
    Body(Body &&) noexcept = default;
    ~Body() = default;

    /**
     * @brief Create a body holding a copy of the bytes
     * 
     * @param bytes 
     * @return Body 
     */
    static auto fromBytes(std::vector<std::byte> bytes) -> Body;
    static auto fromBytes(Buffer bytes) -> Body;

    /**
     * @brief Create a body from the UTF-8 text
     * 
     * @param text 
     * @return Body 
     */
    static auto fromString(std::string_view text) -> Body;

    /**
     * @brief Create a body reading from the stream, the length is unknown
     * 
     * @param stream The stream to take (must not be null)
     * @return Body 
     */
    static auto fromStream(std::unique_ptr<std::istream> stream) -> Body;

    /**
     * @brief Create a body reading from the stream, with the known length
     * 
     * @param stream The stream to take (must not be null)
     * @param length The total length in bytes
     * @return Body 
     */
    static auto fromStream(std::unique_ptr<std::istream> stream, uint64_t length) -> Body;

    /**
     * @brief Open the file read only, the length is the file size
     * 
     * @param path 
     * @return IoResult<Body> 
     */
    static auto fromFile(const std::filesystem::path &path) -> IoResult<Body>;

    static auto empty() -> Body;

    /**
     * @brief Get the bytes if the body is buffered in memory
     * 
     * @return std::optional<Buffer> (nullopt for the stream variant, it is not buffered)
     */
    auto asBytes() const -> std::optional<Buffer>;

    /**
     * @brief Get the length in bytes if known
     * 
     * @return std::optional<uint64_t> 
     */
    auto length() const -> std::optional<uint64_t>;

    /**
     * @brief Read the whole body into a fresh buffer
     * 
     * For the stream variant, seek to the start first if the stream is seekable, then read to the end.
     * 
     * @return IoResult<std::vector<std::byte> > 
     */
    auto readAll() -> IoResult<std::vector<std::byte> >;

    /**
     * @brief Deep copy the bytes variant
     * 
     * @return std::optional<Body> (nullopt for the stream variant, it can not be replayed)
     */
    auto tryClone() const -> std::optional<Body>;

    /**
     * @brief Get the underlying stream
     * 
     * @return std::istream* (nullptr for the bytes variant)
     */
    auto stream() noexcept -> std::istream *;

    auto isStream() const noexcept -> bool {
        return std::holds_alternative<Stream>(mData);
    }

    auto operator =(const Body &) -> Body & = delete;
    auto operator =(Body &&) noexcept -> Body & = default;
private:
    Body(Stream stream) : mData(std::move(stream)) { }

    std::variant<std::vector<std::byte>, Stream> mData;
};

URLBRIDGE_NS_END
