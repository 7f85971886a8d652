// =================================================================
// include/Folio/SysInteraction.hpp
// =================================================================
// Defines the interface for file reading and writing.

#pragma once

#include <string>

namespace Folio {

class SysInteraction {
public:
    /**
     * @brief Reads the raw bytes of a file into a string.
     * @param file_path The path to the file.
     * @return The content of the file. Throws std::runtime_error on failure.
     */
    std::string readFile(const std::string& file_path);

    /**
     * @brief Reads a file as UTF-8 text.
     *
     * Line endings are normalized to '\n' and invalid UTF-8 sequences are
     * replaced with U+FFFD, so any readable file yields valid text.
     * @param file_path The path to the file.
     * @return Decoded content. Throws std::runtime_error if the file cannot be opened.
     */
    std::string readTextFile(const std::string& file_path);

    /**
     * @brief Writes content to a file, overwriting it and creating missing parent directories.
     * @param file_path The path to the file.
     * @param content The content to write.
     * @return True on success, false on failure.
     */
    bool writeFile(const std::string& file_path, const std::string& content);

    /**
     * @brief Replace every invalid UTF-8 sequence with U+FFFD.
     *
     * Each maximal ill-formed subsequence becomes one replacement character.
     */
    static std::string decodeUtf8Lossy(const std::string& bytes);

    /**
     * @brief Convert "\r\n" and lone "\r" to "\n".
     */
    static std::string normalizeNewlines(const std::string& text);
};

} // namespace Folio
