/*
 * FileIO.h - Whole-file reads and all-or-nothing writes
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FILEIO_H
#define FILEIO_H

// No direct includes - all includes should be in lapcut.h

namespace LapCut {
namespace IO {

/**
 * @brief Read an entire file into memory
 * @throws Core::IOException if the file cannot be opened or read
 */
std::vector<uint8_t> readFile(const std::string& path);

/**
 * @brief Read an entire text file into a string
 * @throws Core::IOException if the file cannot be opened or read
 */
std::string readTextFile(const std::string& path);

/**
 * @brief Write a buffer to path, all or nothing
 *
 * The data goes to a temporary file beside the target, which is flushed,
 * closed and then renamed over the target. On any failure the temporary
 * file is removed and the target is left untouched.
 * @throws Core::IOException on failure
 */
void writeFileAtomically(const std::string& path, const std::vector<uint8_t>& data);
void writeFileAtomically(const std::string& path, const std::string& text);

struct FileContents {
    std::string path;
    std::vector<uint8_t> data;
};

/**
 * @brief Write several files so that either all of them replace their
 * targets or none do
 *
 * Every file is staged beside its target first. Targets that already exist
 * are restored if a later rename fails. A target that is a directory is
 * refused before anything is renamed.
 * @throws Core::IOException on failure
 */
void writeFilesTogether(const std::vector<FileContents>& files);

bool fileExists(const std::string& path);

/**
 * @brief Replace (or add) the extension of a path: ("a/b.ld", ".ldx") -> "a/b.ldx"
 */
std::string replaceExtension(const std::string& path, const std::string& extension);

} // namespace IO
} // namespace LapCut

#endif // FILEIO_H
