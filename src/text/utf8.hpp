// utf8.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace eventposter { namespace text {

// Decodes the code point starting at `pos`. Invalid sequences (including
// overlong forms, surrogates and values above U+10FFFF) yield U+FFFD and
// consume one byte. byte_len is 0 only when pos is past the end.
uint32_t decodeUtf8(const std::string& s, size_t pos, uint32_t& byte_len);

void appendUtf8(std::string& out, uint32_t cp);

std::vector<uint32_t> toCodepoints(const std::string& s);

// Simple (1:1) upper-case mapping for Latin, Greek and Cyrillic.
// Independent of the process locale. Invalid bytes come out as U+FFFD.
uint32_t toUpper(uint32_t cp);
std::string toUpperUtf8(const std::string& s);

std::string trim(const std::string& s);

// Splits on ASCII whitespace, dropping empty pieces.
std::vector<std::string> splitWords(const std::string& s);

}} // namespace eventposter::text
