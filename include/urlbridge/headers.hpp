/**
 * @file headers.hpp
 * @brief Response and request header containers
 * @version 0.1
 * @date 2026-03-02
 *
 */
#pragma once

#include <urlbridge/detail/mem.hpp>
#include <initializer_list>
#include <string_view>
#include <vector>
#include <string>
#include <span>
#include <map>

URLBRIDGE_NS_BEGIN

/**
 * @brief One header line as it appeared on the wire, lists of them keep their order
 *
 */
struct HttpHeader {
    std::string name;
    std::string value;

    auto operator ==(const HttpHeader &other) const -> bool = default;
};

/**
 * @brief Case-insensitive multimap of headers
 *
 * Repeated names (Set-Cookie, Via) keep every value, in the order they were appended.
 * Iteration is grouped by name, use the HttpHeader list when the wire order matters.
 */
class HttpHeaders {
public:
    enum WellKnownHeader {
        UserAgent,
        Accept,
        AcceptEncoding,
        AcceptLanguage,
        ContentType,
        ContentLength,
        ContentEncoding,
        TransferEncoding,
        Location,
        Host,
    };

    /**
     * @brief A header name, spelled out or one of the WellKnownHeader
     *
     */
    class Key {
    public:
        Key(std::string_view name) noexcept : mName(name) { }
        Key(const std::string &name) noexcept : mName(name) { }
        Key(const char *name) noexcept : mName(name) { }
        Key(WellKnownHeader header) noexcept : mName(stringOf(header)) { }

        auto view() const noexcept -> std::string_view { return mName; }
    private:
        std::string_view mName;
    };

    using Map = std::multimap<std::string, std::string, mem::CaseCompare>;

    HttpHeaders() = default;
    HttpHeaders(std::initializer_list<std::pair<std::string_view, std::string_view> > headers) {
        for (auto &[name, value] : headers) {
            append(name, value);
        }
    }

    static auto fromList(std::span<const HttpHeader> list) -> HttpHeaders {
        HttpHeaders headers;
        for (auto &header : list) {
            headers.append(header.name, header.value);
        }
        return headers;
    }

    auto contains(Key key) const -> bool { return mMap.contains(key.view()); }

    /**
     * @brief The first value appended under this name
     *
     * @return std::string_view, empty when absent
     */
    auto value(Key key) const -> std::string_view {
        auto it = mMap.find(key.view());
        return it == mMap.end() ? std::string_view {} : std::string_view {it->second};
    }

    auto values(Key key) const -> std::vector<std::string_view> {
        auto [first, last] = mMap.equal_range(key.view());
        std::vector<std::string_view> out;
        for (; first != last; ++first) {
            out.emplace_back(first->second);
        }
        return out;
    }

    // multimap::emplace goes to the upper bound of the equal range
    auto append(Key key, std::string_view value) -> void { mMap.emplace(key.view(), value); }

    auto remove(Key key) -> void {
        auto [first, last] = mMap.equal_range(key.view());
        mMap.erase(first, last);
    }

    auto begin() const noexcept { return mMap.begin(); }
    auto end() const noexcept { return mMap.end(); }
    auto empty() const noexcept -> bool { return mMap.empty(); }

    /// Number of values, a repeated name counts once per value
    auto size() const noexcept -> size_t { return mMap.size(); }

    auto operator ==(const HttpHeaders &other) const -> bool = default;

    static constexpr auto stringOf(WellKnownHeader header) noexcept -> std::string_view {
        constexpr std::string_view names[] = {
            "User-Agent", "Accept", "Accept-Encoding", "Accept-Language", "Content-Type",
            "Content-Length", "Content-Encoding", "Transfer-Encoding", "Location", "Host",
        };
        auto idx = static_cast<size_t>(header);
        return idx < std::size(names) ? names[idx] : std::string_view {};
    }
private:
    Map mMap;
};

URLBRIDGE_NS_END

URLBRIDGE_FORMATTER(HttpHeaders::WellKnownHeader) {
    auto format(const auto &header, auto &ctxt) const {
        return format_to(ctxt.out(), "{}", URLBRIDGE_NAMESPACE::HttpHeaders::stringOf(header));
    }
};

URLBRIDGE_FORMATTER(HttpHeader) {
    auto format(const auto &header, auto &ctxt) const {
        return format_to(ctxt.out(), "{}: {}", header.name, header.value);
    }
};

// Serialized the way a request head carries them
URLBRIDGE_FORMATTER(HttpHeaders) {
    auto format(const auto &headers, auto &ctxt) const {
        auto out = ctxt.out();
        for (auto &[name, value] : headers) {
            out = format_to(out, "{}: {}\r\n", name, value);
        }
        return out;
    }
};
