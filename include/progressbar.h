/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#ifndef PROGRESSBAR_H
#define PROGRESSBAR_H

#include "progressaggregator.h"

#include <chrono>
#include <deque>
#include <string>
#include <utility>
#include <vector>

class ProgressBar
{
    public:
        ProgressBar(bool bUnicode, bool bColor);
        virtual ~ProgressBar();
        std::string createBarString(unsigned int length, double fraction);
        // Feed a snapshot into the 10 second rate window
        void update(const ProgressSnapshot& snapshot, const std::chrono::steady_clock::time_point& time = std::chrono::steady_clock::now());
        double getRate() const { return m_rate; };
        // One line of batch progress fitted to iTermWidth
        std::string createProgressText(const ProgressSnapshot& snapshot, const int& iTermWidth);
    protected:
    private:
        std::vector<std::string> const m_bar_chars;
        std::string const m_left_border;
        std::string const m_right_border;
        std::string const m_simple_left_border;
        std::string const m_simple_right_border;
        std::string const m_simple_empty_fill;
        std::string const m_simple_bar_char;
        std::string const m_bar_color;
        std::string const m_border_color;
        std::string const COLOR_RESET;
        bool m_use_unicode;
        bool m_use_color;
        std::deque< std::pair<std::chrono::steady_clock::time_point, uintmax_t> > m_time_and_size;
        double m_rate;
};

#endif // PROGRESSBAR_H
