/*
 * debug.cpp - Channel-based debug logger
 * This file is part of LapCut.
 * Copyright © 2025-2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "lapcut.h"

std::ofstream Debug::m_logfile;
std::mutex Debug::m_mutex;
std::unordered_set<std::string> Debug::m_enabled_channels;
bool Debug::m_all_enabled = false;

void Debug::init(const std::string& logfile, const std::vector<std::string>& channels) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!logfile.empty()) {
        if (m_logfile.is_open()) {
            m_logfile.close();
        }
        m_logfile.open(logfile, std::ios::out | std::ios::app);
        if (!m_logfile.is_open()) {
            std::cerr << "Debug: cannot open log file " << logfile << ", logging to stdout" << std::endl;
        }
    }
    for (const auto& channel : channels) {
        if (channel == "all") {
            m_all_enabled = true;
        } else {
            m_enabled_channels.insert(channel);
        }
    }
}

void Debug::shutdown() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logfile.is_open()) {
        m_logfile.close();
    }
    m_all_enabled = false;
    m_enabled_channels.clear();
}

bool Debug::isChannelEnabled(const std::string& channel) {
    return m_all_enabled || (!m_enabled_channels.empty() && m_enabled_channels.count(channel) > 0);
}

const std::vector<std::string>& Debug::knownChannels() {
    static const std::vector<std::string> channels = {"ld", "ldx", "laps", "slice", "extract", "io"};
    return channels;
}

bool Debug::isKnownChannel(const std::string& channel) {
    const auto& known = knownChannels();
    return channel == "all" || std::find(known.begin(), known.end(), channel) != known.end();
}

std::vector<std::string> Debug::parseChannelList(const std::string& list) {
    std::vector<std::string> channels;
    std::istringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t start = item.find_first_not_of(" \t");
        if (start == std::string::npos) {
            continue;
        }
        size_t end = item.find_last_not_of(" \t");
        channels.push_back(item.substr(start, end - start + 1));
    }
    return channels;
}

void Debug::write(const std::string& channel, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;
    std::time_t timer = std::chrono::system_clock::to_time_t(now);
    std::tm bt{};
    localtime_r(&timer, &bt);

    std::ostringstream line;
    line << std::put_time(&bt, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(6) << us.count()
         << " [" << channel << "]: " << message;

    std::lock_guard<std::mutex> lock(m_mutex);
    std::ostream& out = m_logfile.is_open() ? static_cast<std::ostream&>(m_logfile) : std::cout;
    out << line.str() << std::endl;
}
