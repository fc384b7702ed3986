/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include "progressbar.h"
#include "util.h"

#include <cmath>
#include <sstream>

ProgressBar::ProgressBar(bool bUnicode, bool bColor)
:
    // Based on block characters.
    // See https://en.wikipedia.org/wiki/List_of_Unicode_characters#Block_elements
    // u8"\u2591" - you can try using this ("light shade") instead of space, but it looks worse,
    //              since partial bar has no shade behind it.
    m_bar_chars
    {
        " ",        // 0/8
        u8"\u258F", // 1/8
        u8"\u258E", // 2/8
        u8"\u258D", // 3/8
        u8"\u258C", // 4/8
        u8"\u258B", // 5/8
        u8"\u258A", // 6/8
        u8"\u2589", // 7/8
        u8"\u2588"  /* 8/8 */
    },
    m_left_border(u8"\u2595"),  // right 1/8th
    m_right_border(u8"\u258F"), // left  1/8th
    m_simple_left_border("["),
    m_simple_right_border("]"),
    m_simple_empty_fill(" "),
    m_simple_bar_char("="),
    // using vt100 escape sequences for colors... See http://ascii-table.com/ansi-escape-sequences.php
    m_bar_color("\033[1;34m"),
    m_border_color("\033[1;37m"),
    COLOR_RESET("\033[0m"),
    m_use_unicode(bUnicode),
    m_use_color(bColor),
    m_rate(0)
{ }

ProgressBar::~ProgressBar()
{
    //dtor
}

std::string ProgressBar::createBarString(unsigned int length, double fraction)
{
    std::ostringstream ss;
    // validation
    if (!std::isnormal(fraction) || (fraction < 0.0)) fraction = 0.0;
    else if (fraction > 1.0) fraction = 1.0;

    double bar_part                = fraction * length;
    double whole_bar_chars         = std::floor(bar_part);
    unsigned int whole_bar_chars_i = (unsigned int) whole_bar_chars;
    // The bar uses symbols graded with 1/8
    unsigned int partial_bar_char_index = (unsigned int) std::floor((bar_part - whole_bar_chars) * 8.0);

    // left border
    if (m_use_color) ss << m_border_color;
    ss << (m_use_unicode ? m_left_border : m_simple_left_border);

    // whole completed bars
    if (m_use_color) ss << m_bar_color;
    unsigned int i = 0;
    for (; i < whole_bar_chars_i; i++)
    {
        ss << (m_use_unicode ? m_bar_chars[8] : m_simple_bar_char);
    }

    // partial completed bar
    if (i < length) ss << (m_use_unicode ? m_bar_chars[partial_bar_char_index] : m_simple_empty_fill);

    // whole unfinished bars
    if (m_use_color) ss << COLOR_RESET;
    for (i = whole_bar_chars_i + 1; i < length; i++)
    {  // first entry in m_bar_chars is assumed to be the empty bar
        ss << (m_use_unicode ? m_bar_chars[0] : m_simple_empty_fill);
    }

    // right border
    if (m_use_color) ss << m_border_color;
    ss << (m_use_unicode ? m_right_border : m_simple_right_border);
    if (m_use_color) ss << COLOR_RESET;

    return ss.str();
}

void ProgressBar::update(const ProgressSnapshot& snapshot, const std::chrono::steady_clock::time_point& time)
{
    // 10 second average download speed
    m_time_and_size.push_back(std::make_pair(time, snapshot.bytes_completed));
    while (m_time_and_size.size() > 1 && (time - m_time_and_size.front().first) > std::chrono::seconds(10))
        m_time_and_size.pop_front();

    const auto& first = m_time_and_size.front();
    const auto& last = m_time_and_size.back();
    double seconds = std::chrono::duration<double>(last.first - first.first).count();

    // Retried transfers take bytes back so the window can shrink
    if (seconds > 0 && last.second >= first.second)
        m_rate = (last.second - first.second) / seconds;
    else if (last.second < first.second)
        m_rate = 0;
}

std::string ProgressBar::createProgressText(const ProgressSnapshot& snapshot, const int& iTermWidth)
{
    int bar_length     = 26;
    int min_bar_length = 5;

    double fraction = 0.0;
    if (snapshot.bytes_total > 0)
        fraction = static_cast<double>(snapshot.bytes_completed) / static_cast<double>(snapshot.bytes_total);
    else if (snapshot.files_total > 0)
        fraction = static_cast<double>(snapshot.files_completed) / static_cast<double>(snapshot.files_total);

    std::string progress_percentage_text = Util::formattedString("%3.0f%% ", fraction * 100);
    int progress_percentage_text_length = progress_percentage_text.length() + 1;

    uintmax_t bytes_remaining = snapshot.bytes_total > snapshot.bytes_completed ? snapshot.bytes_total - snapshot.bytes_completed : 0;
    std::string etastring = Util::makeEtaString(bytes_remaining, m_rate);

    std::string progress_status_text = Util::formattedString(" %s/%s @ %s ETA: %s | Files: %ju/%ju",
        Util::makeSizeString(snapshot.bytes_completed).c_str(),
        Util::makeSizeString(snapshot.bytes_total).c_str(),
        Util::makeRateString(m_rate).c_str(),
        etastring.c_str(),
        snapshot.files_completed,
        snapshot.files_total
    );
    int status_text_length = progress_status_text.length() + 1;

    if ((status_text_length + progress_percentage_text_length + bar_length) > iTermWidth)
        bar_length -= (status_text_length + progress_percentage_text_length + bar_length) - iTermWidth;

    // Don't draw progressbar if length is less than min_bar_length
    std::string progress_bar_text;
    if (bar_length >= min_bar_length)
        progress_bar_text = createBarString(bar_length, fraction);

    return progress_percentage_text + progress_bar_text + progress_status_text;
}
