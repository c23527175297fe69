#include <urlbridge/body.hpp>
#include <urlbridge/log.hpp>
#include <stdexcept>
#include <fstream>
#include <cstring>

URLBRIDGE_NS_BEGIN

auto Body::fromBytes(std::vector<std::byte> bytes) -> Body {
    return Body(std::move(bytes));
}

auto Body::fromBytes(Buffer bytes) -> Body {
    return Body(std::vector<std::byte>(bytes.begin(), bytes.end()));
}

auto Body::fromString(std::string_view text) -> Body {
    return fromBytes(makeBuffer(text));
}

auto Body::fromStream(std::unique_ptr<std::istream> stream) -> Body {
    if (!stream) {
        URLBRIDGE_THROW(std::invalid_argument("Body stream must not be null"));
    }
    return Body(Stream {std::move(stream), std::nullopt});
}

auto Body::fromStream(std::unique_ptr<std::istream> stream, uint64_t length) -> Body {
    if (!stream) {
        URLBRIDGE_THROW(std::invalid_argument("Body stream must not be null"));
    }
    return Body(Stream {std::move(stream), length});
}

auto Body::fromFile(const std::filesystem::path &path) -> IoResult<Body> {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return Unexpected(ec);
    }
    auto file = std::make_unique<std::ifstream>(path, std::ios::in | std::ios::binary);
    if (!file->is_open()) {
        return Unexpected(std::make_error_code(std::errc::permission_denied));
    }
    return fromStream(std::move(file), size);
}

auto Body::empty() -> Body {
    return Body();
}

auto Body::asBytes() const -> std::optional<Buffer> {
    if (auto bytes = std::get_if<std::vector<std::byte> >(&mData); bytes) {
        return Buffer(*bytes);
    }
    return std::nullopt;
}

auto Body::length() const -> std::optional<uint64_t> {
    if (auto bytes = std::get_if<std::vector<std::byte> >(&mData); bytes) {
        return bytes->size();
    }
    return std::get<Stream>(mData).length;
}

auto Body::readAll() -> IoResult<std::vector<std::byte> > {
    if (auto bytes = std::get_if<std::vector<std::byte> >(&mData); bytes) {
        return *bytes;
    }
    auto &stream = *std::get<Stream>(mData).stream;
    stream.clear();
    if (stream.tellg() != std::istream::pos_type(-1)) { // Seekable
        stream.seekg(0, std::ios::beg);
    }
    std::vector<std::byte> ret;
    char buffer[8192];
    while (stream) {
        stream.read(buffer, sizeof(buffer));
        auto n = stream.gcount();
        if (n > 0) {
            auto pos = ret.size();
            ret.resize(pos + n);
            ::memcpy(ret.data() + pos, buffer, n);
        }
    }
    if (stream.bad()) {
        URLBRIDGE_WARN("Body", "Failed to read the body stream");
        return Unexpected(std::make_error_code(std::errc::io_error));
    }
    return ret;
}

auto Body::tryClone() const -> std::optional<Body> {
    if (auto bytes = std::get_if<std::vector<std::byte> >(&mData); bytes) {
        return Body(*bytes);
    }
    return std::nullopt;
}

auto Body::stream() noexcept -> std::istream * {
    if (auto s = std::get_if<Stream>(&mData); s) {
        return s->stream.get();
    }
    return nullptr;
}

URLBRIDGE_NS_END
