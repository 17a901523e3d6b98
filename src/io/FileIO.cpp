/*
 * FileIO.cpp - Whole-file reads and all-or-nothing writes
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "lapcut.h"

namespace LapCut {
namespace IO {

using Core::IOException;

namespace {

std::string errnoMessage(const std::string& action, const std::string& path, int error_code) {
    return action + " " + path + ": " + strerror(error_code);
}

std::string pidSuffix() {
    return std::to_string(static_cast<long>(getpid()));
}

// Temporary sibling of the target; removed on scope exit unless committed
class PendingFile {
public:
    explicit PendingFile(const std::string& target)
        : m_target(target), m_temp(target + ".tmp." + pidSuffix()) {}

    ~PendingFile() {
        if (!m_committed) {
            std::remove(m_temp.c_str());
        }
    }

    PendingFile(const PendingFile&) = delete;
    PendingFile& operator=(const PendingFile&) = delete;

    const std::string& target() const { return m_target; }
    bool isCommitted() const { return m_committed; }

    void stage(const uint8_t* data, size_t size) {
        RAIIFileHandle file;
        if (!file.open(m_temp, "wb")) {
            throw IOException(errnoMessage("Cannot create", m_temp, errno));
        }
        if (!file.writeAll(data, size)) {
            throw IOException(errnoMessage("Cannot write", m_temp, errno));
        }
        if (file.close() != 0) {
            throw IOException(errnoMessage("Cannot close", m_temp, errno));
        }
    }

    void commit() {
        if (std::rename(m_temp.c_str(), m_target.c_str()) != 0) {
            throw IOException(errnoMessage("Cannot rename " + m_temp + " to", m_target, errno));
        }
        m_committed = true;
    }

private:
    std::string m_target;
    std::string m_temp;
    bool m_committed = false;
};

/**
 * @brief Staged files that replace their targets together or not at all
 *
 * Existing targets are hard-linked to a backup name before anything is
 * renamed. If the group is destroyed before commitAll() finishes, every
 * target already replaced gets its backup renamed back (or is removed when
 * it did not exist before). Nothing outside the group's own temporaries,
 * backups and targets is touched.
 */
class PendingGroup {
public:
    PendingGroup() = default;
    ~PendingGroup() { rollback(); }

    PendingGroup(const PendingGroup&) = delete;
    PendingGroup& operator=(const PendingGroup&) = delete;

    void add(const std::string& target, const uint8_t* data, size_t size) {
        m_entries.push_back(Entry{std::make_unique<PendingFile>(target), std::string(), false});
        m_entries.back().pending->stage(data, size);
    }

    void commitAll() {
        for (auto& entry : m_entries) {
            keepExisting(entry);
        }
        for (auto& entry : m_entries) {
            entry.pending->commit();
        }
        m_done = true;
        for (const auto& entry : m_entries) {
            if (!entry.backup.empty()) {
                std::remove(entry.backup.c_str());
            }
        }
    }

private:
    struct Entry {
        std::unique_ptr<PendingFile> pending;
        std::string backup;
        bool had_target;
    };

    void keepExisting(Entry& entry) {
        const std::string& target = entry.pending->target();
        struct stat st;
        if (stat(target.c_str(), &st) != 0) {
            return;
        }
        if (S_ISDIR(st.st_mode)) {
            throw IOException(errnoMessage("Cannot replace", target, EISDIR));
        }
        std::string backup = target + ".bak." + pidSuffix();
        std::remove(backup.c_str());
        if (link(target.c_str(), backup.c_str()) != 0) {
            throw IOException(errnoMessage("Cannot keep a copy of", target, errno));
        }
        entry.backup = backup;
        entry.had_target = true;
    }

    void rollback() {
        if (m_done) {
            return;
        }
        for (auto it = m_entries.rbegin(); it != m_entries.rend(); ++it) {
            const std::string& target = it->pending->target();
            bool replaced = it->pending->isCommitted();
            if (replaced && it->had_target) {
                if (std::rename(it->backup.c_str(), target.c_str()) != 0) {
                    Debug::log("io", "Cannot restore ", target, " from ", it->backup, ": ", strerror(errno));
                }
            } else if (replaced) {
                std::remove(target.c_str());
            } else if (it->had_target) {
                std::remove(it->backup.c_str());
            }
        }
    }

    std::vector<Entry> m_entries;
    bool m_done = false;
};

void writeBytesAtomically(const std::string& path, const uint8_t* data, size_t size) {
    PendingFile pending(path);
    pending.stage(data, size);
    pending.commit();
    Debug::log("io", "Wrote ", size, " bytes to ", path);
}

} // namespace

std::vector<uint8_t> readFile(const std::string& path) {
    RAIIFileHandle file;
    if (!file.open(path, "rb")) {
        throw IOException(errnoMessage("Cannot open", path, errno));
    }

    std::vector<uint8_t> data;
    if (!file.readAll(data)) {
        throw IOException(errnoMessage("Cannot read", path, errno));
    }

    Debug::log("io", "Read ", data.size(), " bytes from ", path);
    return data;
}

std::string readTextFile(const std::string& path) {
    std::vector<uint8_t> data = readFile(path);
    return std::string(data.begin(), data.end());
}

void writeFileAtomically(const std::string& path, const std::vector<uint8_t>& data) {
    writeBytesAtomically(path, data.data(), data.size());
}

void writeFileAtomically(const std::string& path, const std::string& text) {
    writeBytesAtomically(path, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

void writeFilesTogether(const std::vector<FileContents>& files) {
    PendingGroup group;
    for (const auto& file : files) {
        group.add(file.path, file.data.data(), file.data.size());
    }
    group.commitAll();
    for (const auto& file : files) {
        Debug::log("io", "Wrote ", file.data.size(), " bytes to ", file.path);
    }
}

bool fileExists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::string replaceExtension(const std::string& path, const std::string& extension) {
    size_t slash = path.find_last_of("/\\");
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash) ||
        dot == (slash == std::string::npos ? 0 : slash + 1)) {
        return path + extension;
    }
    return path.substr(0, dot) + extension;
}

} // namespace IO
} // namespace LapCut
