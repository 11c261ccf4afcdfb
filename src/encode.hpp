#pragma once
#include "env.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quasar
{

  // vectors: little-endian float32, size = dim*4
  inline void put_le32(std::string &s, uint32_t x)
  {
    for (int i = 0; i < 4; ++i)
      s.push_back(char((x >> (i * 8)) & 0xff));
  }

  inline uint32_t read_le32(const unsigned char *p)
  {
    uint32_t x = 0;
    for (int i = 3; i >= 0; --i)
      x = (x << 8) | p[i];
    return x;
  }

  inline std::string encode_vector(const std::vector<float> &v)
  {
    std::string out;
    out.reserve(v.size() * 4);
    for (float f : v)
    {
      uint32_t bits{};
      std::memcpy(&bits, &f, 4);
      put_le32(out, bits);
    }
    return out;
  }

  inline std::vector<float> decode_vector(std::string_view bytes)
  {
    if (bytes.empty() || (bytes.size() % 4) != 0)
      throw StoreError("vector byte length must be a non-zero multiple of 4");
    std::vector<float> v(bytes.size() / 4);
    const auto *p = reinterpret_cast<const unsigned char *>(bytes.data());
    for (size_t i = 0; i < v.size(); ++i)
    {
      uint32_t bits = read_le32(p + i * 4);
      std::memcpy(&v[i], &bits, 4);
    }
    return v;
  }

  // Maps a caller-supplied collection name onto [a-z][a-z0-9_-]*.
  inline std::string sanitize_collection_name(std::string_view name)
  {
    std::string out;
    out.reserve(name.size() + 2);
    for (char c : name)
    {
      unsigned char uc = static_cast<unsigned char>(c);
      if (std::isalnum(uc) && uc < 0x80)
        out.push_back(static_cast<char>(std::tolower(uc)));
      else if (c == '-' || c == '_')
        out.push_back(c);
      else
        out.push_back('_');
    }
    if (out.empty())
      throw InvalidCollectionName("collection name must not be empty");
    if (!std::isalpha(static_cast<unsigned char>(out[0])))
      out.insert(0, "c_");
    return out;
  }

  inline std::string quote_identifier(std::string_view name)
  {
    std::string out;
    out.reserve(name.size() + 2);
    out.push_back('"');
    for (char c : name)
    {
      if (c == '"')
        out.push_back('"');
      out.push_back(c);
    }
    out.push_back('"');
    return out;
  }

  // "?, ?, ?" for IN lists
  inline std::string placeholders(size_t n)
  {
    std::string out;
    for (size_t i = 0; i < n; ++i)
      out += i ? ", ?" : "?";
    return out;
  }

  // IN lists are split at this many ids; stays below SQLITE_MAX_VARIABLE_NUMBER
  constexpr size_t kIdChunk = 500;

  // Calls fn(params) once per chunk of ids, each chunk already converted to
  // bind parameters.
  template <typename Fn>
  void for_each_id_chunk(const std::vector<std::string> &ids, Fn &&fn)
  {
    for (size_t start = 0; start < ids.size(); start += kIdChunk)
    {
      size_t end = std::min(ids.size(), start + kIdChunk);
      std::vector<Value> params(ids.begin() + start, ids.begin() + end);
      fn(std::move(params));
    }
  }

  inline std::string generate_uuid()
  {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();
    hi = (hi & 0xffffffffffff0fffull) | 0x0000000000004000ull; // version 4
    lo = (lo & 0x3fffffffffffffffull) | 0x8000000000000000ull; // RFC 4122 variant
    static const char *hex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    auto emit = [&](uint64_t x, int nibbles)
    {
      for (int i = nibbles - 1; i >= 0; --i)
        out.push_back(hex[(x >> (i * 4)) & 0xf]);
    };
    emit(hi >> 32, 8);
    out.push_back('-');
    emit((hi >> 16) & 0xffff, 4);
    out.push_back('-');
    emit(hi & 0xffff, 4);
    out.push_back('-');
    emit(lo >> 48, 4);
    out.push_back('-');
    emit(lo & 0xffffffffffffull, 12);
    return out;
  }

} // namespace quasar
