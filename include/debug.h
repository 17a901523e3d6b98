/*
 * debug.h - Channel-based debug logger
 * This file is part of LapCut.
 * Copyright © 2025-2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef DEBUG_H
#define DEBUG_H

// No direct includes - all includes should be in lapcut.h

/**
 * @brief Channel-based debug logger
 *
 * Every message is tagged with a channel name (see knownChannels()).
 * Only channels enabled through init() are written; the special channel
 * "all" enables everything. Lines look like
 * "14:05:33.123456 [ld]: message" and go to the log file given to init(),
 * or stdout when there is none.
 */
class Debug {
public:
    /**
     * @brief Enable channels and optionally open a log file (appending)
     *
     * May be called more than once; channels accumulate.
     */
    static void init(const std::string& logfile, const std::vector<std::string>& channels);
    static void shutdown();

    static bool isChannelEnabled(const std::string& channel);

    template<typename... Args>
    static inline void log(const std::string& channel, Args&&... args) {
        if (isChannelEnabled(channel)) {
            std::ostringstream ss;
            if constexpr (sizeof...(args) > 0) {
                (ss << ... << args);
            }
            write(channel, ss.str());
        }
    }

    /**
     * @brief Split a comma separated channel list ("ld,ldx" or "all")
     */
    static std::vector<std::string> parseChannelList(const std::string& list);

    // ld, ldx, laps, slice, extract, io
    static const std::vector<std::string>& knownChannels();
    static bool isKnownChannel(const std::string& channel);

private:
    static void write(const std::string& channel, const std::string& message);

    static std::ofstream m_logfile;
    static std::mutex m_mutex;
    static std::unordered_set<std::string> m_enabled_channels;
    static bool m_all_enabled;
};

// Checks the channel before evaluating any of the message arguments
#define DEBUG_LOG_LAZY(channel, ...) \
    do { \
        if (Debug::isChannelEnabled(channel)) { \
            Debug::log(channel, __VA_ARGS__); \
        } \
    } while(0)

#endif // DEBUG_H
