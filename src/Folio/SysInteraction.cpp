// =================================================================
// src/Folio/SysInteraction.cpp
// =================================================================
// Implementation for file reading and writing.

#include "Folio/SysInteraction.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Folio {

static const char* const REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

std::string SysInteraction::readFile(const std::string& file_path) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    if (file_stream.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path);
    }
    return buffer.str();
}

std::string SysInteraction::readTextFile(const std::string& file_path) {
    return decodeUtf8Lossy(normalizeNewlines(readFile(file_path)));
}

bool SysInteraction::writeFile(const std::string& file_path, const std::string& content) {
    std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return false;
        }
    }

    std::ofstream file_stream(file_path, std::ios::binary | std::ios::trunc);
    if (!file_stream) {
        return false;
    }
    file_stream << content;
    file_stream.flush();
    return file_stream.good();
}

std::string SysInteraction::decodeUtf8Lossy(const std::string& bytes) {
    std::string decoded;
    decoded.reserve(bytes.size());

    const size_t length = bytes.size();
    size_t i = 0;
    while (i < length) {
        unsigned char lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            decoded += static_cast<char>(lead);
            ++i;
            continue;
        }

        // Continuation count and the allowed range of the first continuation
        // byte (narrowed to reject overlongs, surrogates and > U+10FFFF)
        size_t continuation = 0;
        unsigned char first_low = 0x80;
        unsigned char first_high = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            continuation = 1;
        } else if (lead == 0xE0) {
            continuation = 2;
            first_low = 0xA0;
        } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
            continuation = 2;
        } else if (lead == 0xED) {
            continuation = 2;
            first_high = 0x9F;
        } else if (lead == 0xF0) {
            continuation = 3;
            first_low = 0x90;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            continuation = 3;
        } else if (lead == 0xF4) {
            continuation = 3;
            first_high = 0x8F;
        } else {
            decoded += REPLACEMENT_CHARACTER;
            ++i;
            continue;
        }

        size_t valid = 1;
        while (valid <= continuation && i + valid < length) {
            unsigned char byte = static_cast<unsigned char>(bytes[i + valid]);
            unsigned char low = (valid == 1) ? first_low : 0x80;
            unsigned char high = (valid == 1) ? first_high : 0xBF;
            if (byte < low || byte > high) {
                break;
            }
            ++valid;
        }

        if (valid > continuation) {
            decoded.append(bytes, i, continuation + 1);
            i += continuation + 1;
        } else {
            decoded += REPLACEMENT_CHARACTER;
            i += valid;
        }
    }

    return decoded;
}

std::string SysInteraction::normalizeNewlines(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            normalized += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            normalized += text[i];
        }
    }

    return normalized;
}

} // namespace Folio
