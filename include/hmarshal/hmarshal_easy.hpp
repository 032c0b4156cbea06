#pragma once

#include "hmarshal/value.hpp"

#include <algorithm>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace hmarshal::easy {

// Pack a typed vector into little-endian element bytes.
// The in-memory and on-disk representation is always little-endian.
namespace detail {
inline bool is_little_endian() {
    const std::uint16_t x = 1;
    return *reinterpret_cast<const std::uint8_t*>(&x) == 1;
}

inline void bswap_inplace(std::uint8_t* buf, std::size_t elem_size, std::size_t n_elems) {
    if (!buf || elem_size <= 1 || n_elems == 0) return;
    for (std::size_t i = 0; i < n_elems; ++i) {
        std::uint8_t* p = buf + i * elem_size;
        for (std::size_t a = 0, b = elem_size - 1; a < b; ++a, --b) {
            std::uint8_t t = p[a];
            p[a] = p[b];
            p[b] = t;
        }
    }
}

template <typename T> struct element_kind_of;
template <> struct element_kind_of<bool> { static constexpr ElementKind value = ElementKind::Bool; };
template <> struct element_kind_of<std::uint8_t> { static constexpr ElementKind value = ElementKind::UInt8; };
template <> struct element_kind_of<std::uint16_t> { static constexpr ElementKind value = ElementKind::UInt16; };
template <> struct element_kind_of<std::uint32_t> { static constexpr ElementKind value = ElementKind::UInt32; };
template <> struct element_kind_of<std::uint64_t> { static constexpr ElementKind value = ElementKind::UInt64; };
template <> struct element_kind_of<std::int8_t> { static constexpr ElementKind value = ElementKind::Int8; };
template <> struct element_kind_of<std::int16_t> { static constexpr ElementKind value = ElementKind::Int16; };
template <> struct element_kind_of<std::int32_t> { static constexpr ElementKind value = ElementKind::Int32; };
template <> struct element_kind_of<std::int64_t> { static constexpr ElementKind value = ElementKind::Int64; };
template <> struct element_kind_of<float> { static constexpr ElementKind value = ElementKind::Float32; };
template <> struct element_kind_of<double> { static constexpr ElementKind value = ElementKind::Float64; };
template <> struct element_kind_of<std::complex<float>> { static constexpr ElementKind value = ElementKind::Complex64; };
template <> struct element_kind_of<std::complex<double>> { static constexpr ElementKind value = ElementKind::Complex128; };
} // namespace detail

template <typename T>
inline std::vector<std::uint8_t> pack_le(const std::vector<T>& v) {
    static_assert(std::is_trivially_copyable_v<T>, "pack_le requires trivially copyable types");
    std::vector<std::uint8_t> out(sizeof(T) * v.size());
    if (!out.empty()) {
        std::memcpy(out.data(), v.data(), out.size());
        if (!detail::is_little_endian()) {
            // complex values swap each part, not the pair
            constexpr std::size_t part = std::is_same_v<T, std::complex<float>> ? sizeof(float)
                : std::is_same_v<T, std::complex<double>> ? sizeof(double) : sizeof(T);
            detail::bswap_inplace(out.data(), part, out.size() / part);
        }
    }
    return out;
}

// std::vector<bool> is bit-packed; booleans go through bytes.
inline std::vector<std::uint8_t> pack_le(const std::vector<bool>& v) {
    std::vector<std::uint8_t> out;
    out.reserve(v.size());
    for (bool b : v) out.push_back(b ? 1 : 0);
    return out;
}

template <typename T>
inline std::vector<T> unpack_le(const std::vector<std::uint8_t>& bytes) {
    static_assert(std::is_trivially_copyable_v<T>, "unpack_le requires trivially copyable types");
    std::vector<T> out(bytes.size() / sizeof(T));
    if (!out.empty()) {
        std::vector<std::uint8_t> tmp(bytes.begin(), bytes.begin() + out.size() * sizeof(T));
        if (!detail::is_little_endian()) {
            constexpr std::size_t part = std::is_same_v<T, std::complex<float>> ? sizeof(float)
                : std::is_same_v<T, std::complex<double>> ? sizeof(double) : sizeof(T);
            detail::bswap_inplace(tmp.data(), part, tmp.size() / part);
        }
        std::memcpy(out.data(), tmp.data(), tmp.size());
    }
    return out;
}

template <typename T>
inline NumericArray make_numeric(Shape shape, const std::vector<T>& data_rowmajor) {
    NumericArray a;
    a.kind = detail::element_kind_of<T>::value;
    a.shape = std::move(shape);
    a.data = pack_le(data_rowmajor);
    return a;
}

template <typename T>
inline NumericArray make_scalar(T x) {
    return make_numeric<T>(Shape{}, std::vector<T>{x});
}

// ------------------------------
// Text helpers
// ------------------------------

inline void append_utf8(std::string& out, char32_t codepoint) {
    if (codepoint <= 0x7F) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((codepoint >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((codepoint >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((codepoint >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

inline std::string to_utf8(const std::u32string& s) {
    std::string out;
    out.reserve(s.size());
    for (char32_t c : s) append_utf8(out, c);
    return out;
}

// Malformed sequences decode to U+FFFD.
inline std::u32string from_utf8(const std::string& s) {
    std::u32string out;
    out.reserve(s.size());
    std::size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        std::size_t extra = 0;
        char32_t cp = 0;
        if (c < 0x80) { cp = c; extra = 0; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; }
        else { out.push_back(U'\uFFFD'); ++i; continue; }
        if (i + extra >= s.size()) {
            // truncated sequence: replace the lead byte, decode the rest
            out.push_back(U'\uFFFD');
            ++i;
            continue;
        }
        bool ok = true;
        for (std::size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) { ok = false; break; }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!ok) {
            out.push_back(U'\uFFFD');
            ++i;
            continue;
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

inline Value make_text(const std::string& utf8) {
    return Value::make_text(from_utf8(utf8));
}

inline Value make_bytes(const std::string& raw, bool is_mutable = false) {
    return Value::make_bytes(std::vector<std::uint8_t>(raw.begin(), raw.end()), is_mutable);
}

// Fixed-width text array; every string is NUL padded to the longest one.
inline TextArray make_text_array(Shape shape, const std::vector<std::string>& utf8_rowmajor) {
    TextArray a;
    a.shape = std::move(shape);
    std::vector<std::u32string> decoded;
    decoded.reserve(utf8_rowmajor.size());
    std::size_t width = 1;
    for (const auto& s : utf8_rowmajor) {
        decoded.push_back(from_utf8(s));
        if (decoded.back().size() > width) width = decoded.back().size();
    }
    a.width = width;
    a.data.assign(decoded.size() * width, U'\0');
    for (std::size_t i = 0; i < decoded.size(); ++i) {
        std::copy(decoded[i].begin(), decoded[i].end(), a.data.begin() + static_cast<std::ptrdiff_t>(i * width));
    }
    return a;
}

inline ByteArray make_byte_array(Shape shape, const std::vector<std::string>& raw_rowmajor) {
    ByteArray a;
    a.shape = std::move(shape);
    std::size_t width = 1;
    for (const auto& s : raw_rowmajor) {
        if (s.size() > width) width = s.size();
    }
    a.width = width;
    a.data.assign(raw_rowmajor.size() * width, 0);
    for (std::size_t i = 0; i < raw_rowmajor.size(); ++i) {
        std::copy(raw_rowmajor[i].begin(), raw_rowmajor[i].end(), a.data.begin() + static_cast<std::ptrdiff_t>(i * width));
    }
    return a;
}

} // namespace hmarshal::easy
